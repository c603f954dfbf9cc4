#include "ResultJson.hpp"

namespace triage {

nlohmann::json toJson(const DocumentSegment &segment) {
  nlohmann::json item;
  item["pages"] = segment.pages;
  item["type"] = segment.type;
  item["image_cover"] = segment.imageCover;
  return item;
}

nlohmann::json toJson(const AnalysisResult &result) {
  nlohmann::json json;
  json["isMultiDocument"] = result.isMultiDocument;
  json["documentCount"] = result.documentCount;
  json["pageCount"] = result.pageCount;
  json["hasTextLayer"] = result.hasTextLayer;
  json["textQuality"] = toString(result.textQuality);
  json["language"] = result.language;

  if (result.documents) {
    json["documents"] = nlohmann::json::array();
    for (const auto &segment : *result.documents) {
      json["documents"].push_back(toJson(segment));
    }
  } else {
    json["documents"] = nullptr;
  }

  if (!result.success) {
    json["error"] = result.errorMessage.empty() ? std::string("Unknown error")
                                                : result.errorMessage;
  }

  return json;
}

} // namespace triage

#include "TriageTypes.hpp"

namespace triage {

std::string toString(TextQuality quality) {
  switch (quality) {
  case TextQuality::Best:
    return "best";
  case TextQuality::Good:
    return "good";
  case TextQuality::Poor:
    return "poor";
  case TextQuality::None:
  default:
    return "none";
  }
}

std::string toString(PageType type) {
  switch (type) {
  case PageType::Document:
    return "document";
  case PageType::FullPage:
    return "full_page";
  case PageType::TopBottomSplit:
    return "top/bottom";
  case PageType::LeftRightSplit:
    return "left/right";
  case PageType::Dropped:
  default:
    return "dropped";
  }
}

} // namespace triage

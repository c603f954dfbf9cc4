#include "DocumentTriage.hpp"
#include "ResultJson.hpp"

#include <iomanip>
#include <iostream>

void printUsage(const char *programName) {
  std::cerr
      << "Usage: " << programName << " <pdf_path> [options]\n"
      << "\nOptions:\n"
      << "  -d, --debug               Print diagnostics to stderr\n"
      << "  -p, --pretty              Indent the JSON output\n"
      << "  -v, --verdicts            Show the verdict of every page\n"
      << "  -s, --sample-pages <n>    Pages sampled for text quality "
         "(default: 3)\n"
      << "  -h, --help                Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " upload.pdf\n"
      << "  " << programName << " upload.pdf -p -v\n";
}

void printVerdicts(const triage::AnalysisResult &result) {
  std::cerr << "\n[Page Verdicts]\n";
  std::cerr << std::setw(6) << "Page" << std::setw(12) << "Text"
            << std::setw(12) << "Cover%"
            << "  Type\n";
  std::cerr << std::string(50, '-') << "\n";

  for (const auto &verdict : result.pageVerdicts) {
    std::cerr << std::setw(6) << verdict.pageNumber << std::setw(12)
              << verdict.textLength << std::setw(12) << std::fixed
              << std::setprecision(2) << verdict.imageCoverPercent << "  "
              << triage::toString(verdict.type) << "\n";
  }

  std::cerr << "\nProcessing time: " << std::fixed << std::setprecision(2)
            << result.processingTimeMs << " ms\n";
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cout << nlohmann::json{{"error", "No PDF path provided"}}.dump()
              << std::endl;
    return 1;
  }

  std::string pdfPath;
  triage::TriageConfig config;
  bool pretty = false;
  bool showVerdicts = false;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-d" || arg == "--debug") {
      config.debug = true;
    } else if (arg == "-p" || arg == "--pretty") {
      pretty = true;
    } else if (arg == "-v" || arg == "--verdicts") {
      showVerdicts = true;
    } else if (arg == "-s" || arg == "--sample-pages") {
      if (i + 1 < argc) {
        try {
          config.samplePageCount = std::stoi(argv[++i]);
        } catch (const std::exception &) {
          std::cerr << "Error: --sample-pages requires a number\n";
          return 1;
        }
      } else {
        std::cerr << "Error: --sample-pages requires an argument\n";
        return 1;
      }
    } else if (arg[0] != '-') {
      pdfPath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (pdfPath.empty()) {
    std::cout << nlohmann::json{{"error", "No PDF path provided"}}.dump()
              << std::endl;
    return 1;
  }

  triage::DocumentTriage analyzer(config);
  triage::AnalysisResult result = analyzer.analyzePDF(pdfPath);

  if (showVerdicts) {
    printVerdicts(result);
  }

  // Failures are reported inside the JSON object, callers always get one
  std::cout << triage::toJson(result).dump(pretty ? 2 : -1) << std::endl;

  return 0;
}

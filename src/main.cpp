#include "TextbookExtractor.hpp"

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <pdf_path>... [options]\n"
      << "\nOptions:\n"
      << "  -o, --output-base <dir>    Image output base, crops go to\n"
      << "                             <dir>/images/<book>/ (default: .)\n"
      << "  -j, --json <file>          Write JSON to a file (default: stdout)\n"
      << "  -s, --subject <text>       Subject label (default: Mathematics)\n"
      << "  -t, --chapter-title <text> Known chapter title (repeatable)\n"
      << "      --no-derive-title      Only accept known chapter titles\n"
      << "  -z, --zoom <factor>        Render magnification (default: 3)\n"
      << "  -a, --min-area <px>        Minimum contour area at 3x zoom\n"
      << "                             (default: 1000)\n"
      << "  -w, --workers <n>          Page workers (default: all cores)\n"
      << "      --previews             Write annotated page previews\n"
      << "      --diagrams             Include the flat diagram list\n"
      << "  -v, --verbose              Print progress to stderr\n"
      << "  -h, --help                 Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " circles.pdf\n"
      << "  " << programName << " circles.pdf -o static -t CIRCLES\n"
      << "  " << programName << " a.pdf b.pdf --zoom 4 -j out.json\n";
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::vector<std::string> pdfPaths;
  std::string jsonPath;
  bool includeDiagrams = false;
  textbook::ExtractorConfig config;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto requireValue = [&](const std::string &option) -> bool {
      if (i + 1 < argc) {
        return true;
      }
      std::cerr << "Error: " << option << " requires an argument\n";
      return false;
    };

    try {
      if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "-o" || arg == "--output-base") {
        if (!requireValue(arg))
          return 1;
        config.imageOutputBase = argv[++i];
      } else if (arg == "-j" || arg == "--json") {
        if (!requireValue(arg))
          return 1;
        jsonPath = argv[++i];
      } else if (arg == "-s" || arg == "--subject") {
        if (!requireValue(arg))
          return 1;
        config.subject = argv[++i];
      } else if (arg == "-t" || arg == "--chapter-title") {
        if (!requireValue(arg))
          return 1;
        config.structure.chapterTitles.push_back(argv[++i]);
      } else if (arg == "--no-derive-title") {
        config.structure.deriveChapterTitle = false;
      } else if (arg == "-z" || arg == "--zoom") {
        if (!requireValue(arg))
          return 1;
        config.diagrams.zoom = std::stod(argv[++i]);
      } else if (arg == "-a" || arg == "--min-area") {
        if (!requireValue(arg))
          return 1;
        config.diagrams.minContourArea = std::stod(argv[++i]);
      } else if (arg == "-w" || arg == "--workers") {
        if (!requireValue(arg))
          return 1;
        config.diagrams.workers = std::stoul(argv[++i]);
      } else if (arg == "--previews") {
        config.diagrams.writePagePreviews = true;
      } else if (arg == "--diagrams") {
        includeDiagrams = true;
      } else if (arg == "-v" || arg == "--verbose") {
        config.verbose = true;
      } else if (arg[0] != '-') {
        pdfPaths.push_back(arg);
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
      }
    } catch (const std::exception &e) {
      std::cerr << "Error: invalid value for " << arg << ": " << e.what()
                << "\n";
      return 1;
    }
  }

  if (pdfPaths.empty()) {
    std::cerr << "Error: No PDF path provided\n";
    printUsage(argv[0]);
    return 1;
  }

  if (config.diagrams.zoom <= 0) {
    std::cerr << "Error: --zoom must be positive\n";
    return 1;
  }

  textbook::TextbookExtractor extractor(config);
  std::vector<textbook::ExtractionResult> results =
      extractor.extractBatch(pdfPaths);

  nlohmann::json output = nlohmann::json::array();
  bool allSucceeded = true;

  for (const auto &result : results) {
    output.push_back(textbook::toResultJson(result, includeDiagrams));
    if (!result.success) {
      allSucceeded = false;
    } else if (config.verbose) {
      std::cerr << "DEBUG: " << result.pdfPath << " done in "
                << result.processingTimeMs << " ms" << std::endl;
    }
  }

  if (jsonPath.empty()) {
    std::cout << output.dump(2) << std::endl;
  } else {
    std::ofstream out(jsonPath);
    if (!out) {
      std::cerr << "Error: cannot open " << jsonPath << " for writing\n";
      return 1;
    }
    out << output.dump(2) << std::endl;
  }

  return allSucceeded ? 0 : 2;
}

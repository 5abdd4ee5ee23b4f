#include "TextbookExtractor.hpp"
#include "DocumentAssembler.hpp"
#include "LineStream.hpp"
#include "PageRasterizer.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace textbook {

namespace {

bool isDiagramCrop(const std::filesystem::path &path) {
  std::string name = path.filename().string();
  return name.rfind("page_", 0) == 0 &&
         name.find("_diagram_") != std::string::npos &&
         path.extension() == ".jpg";
}

// Removes every diagram crop in the book folder without throwing
void removeDiagramCrops(const std::filesystem::path &imageDir,
                        std::error_code &ec) {
  std::filesystem::directory_iterator it(imageDir, ec);
  for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (it->is_regular_file(ec) && isDiagramCrop(it->path())) {
      std::filesystem::remove(it->path(), ec);
    }
  }
}

} // anonymous namespace

TextbookExtractor::TextbookExtractor() : m_config() {}

TextbookExtractor::TextbookExtractor(const ExtractorConfig &config)
    : m_config(config) {}

ExtractionResult TextbookExtractor::extract(const std::string &pdfPath) const {
  ExtractionResult result;
  result.success = false;
  result.pdfPath = pdfPath;
  result.bookName = bookNameFromPath(pdfPath);

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    if (result.bookName.empty()) {
      throw std::invalid_argument("Cannot derive a book name from: " +
                                  pdfPath);
    }

    // Open before touching the output folder so a bad file leaves no trace
    PageRasterizer rasterizer(pdfPath);
    result.pageCount = rasterizer.pageCount();

    if (m_config.verbose) {
      std::cerr << "DEBUG: " << pdfPath << " has " << result.pageCount
                << " pages" << std::endl;
    }

    std::filesystem::path imageDir =
        std::filesystem::path(m_config.imageOutputBase) / "images" /
        result.bookName;
    std::filesystem::create_directories(imageDir);
    std::error_code ec;
    removeDiagramCrops(imageDir, ec);
    if (ec) {
      throw std::runtime_error("Failed to clear " + imageDir.string() + ": " +
                               ec.message());
    }
    result.imageDir = imageDir.string();

    DiagramConfig diagramConfig = m_config.diagrams;
    diagramConfig.verbose = diagramConfig.verbose || m_config.verbose;
    DiagramExtractor diagramExtractor(result.bookName, result.imageDir,
                                      diagramConfig);
    result.diagrams = diagramExtractor.extract(pdfPath);

    LineStream lineStream(rasterizer);
    std::vector<PageText> pages = lineStream.readDocument();

    StructurerConfig structureConfig = m_config.structure;
    structureConfig.verbose = structureConfig.verbose || m_config.verbose;
    DocumentStructurer structurer(structureConfig);
    Chapter chapter = structurer.structure(pages, result.diagrams);

    result.document =
        assemble(result.bookName, m_config.subject, std::move(chapter));
    result.success = true;

    if (m_config.verbose) {
      std::cerr << "DEBUG: " << result.bookName << ": "
                << result.diagrams.size() << " diagrams, "
                << result.document.chapters.front().topics.size()
                << " topics" << std::endl;
    }
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Extraction failed: ") + e.what();
    std::cerr << "Error processing " << pdfPath << ": " << e.what()
              << std::endl;

    // Crops written before the failure have no records to go with
    if (!result.imageDir.empty()) {
      std::error_code ec;
      removeDiagramCrops(result.imageDir, ec);
      if (ec) {
        std::cerr << "Failed to remove partial crops in " << result.imageDir
                  << ": " << ec.message() << std::endl;
      }
    }
    result.document = Document();
    result.diagrams.clear();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

std::vector<ExtractionResult>
TextbookExtractor::extractBatch(const std::vector<std::string> &pdfPaths) const {
  std::vector<ExtractionResult> results;
  results.reserve(pdfPaths.size());
  for (const auto &pdfPath : pdfPaths) {
    results.push_back(extract(pdfPath));
  }
  return results;
}

const ExtractorConfig &TextbookExtractor::getConfig() const {
  return m_config;
}

void TextbookExtractor::setConfig(const ExtractorConfig &config) {
  m_config = config;
}

nlohmann::json toResultJson(const ExtractionResult &result,
                            bool includeDiagrams) {
  if (!result.success) {
    return nlohmann::json{{"file", result.pdfPath},
                          {"error", result.errorMessage}};
  }

  nlohmann::json json = toResponseJson(result.document);
  if (includeDiagrams) {
    json["diagrams"] = nlohmann::json::array();
    for (const auto &diagram : result.diagrams) {
      json["diagrams"].push_back(diagram);
    }
  }
  return json;
}

} // namespace textbook

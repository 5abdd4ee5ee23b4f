#ifndef TEXTBOOK_EXTRACTOR_HPP
#define TEXTBOOK_EXTRACTOR_HPP

#include "DiagramExtractor.hpp"
#include "DocumentModel.hpp"
#include "DocumentStructurer.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace textbook {

/**
 * @brief Configuration options for a full extraction run
 */
struct ExtractorConfig {
  std::string imageOutputBase = "."; ///< Crops go to <base>/images/<book>/
  std::string subject = "Mathematics"; ///< Subject label of the document
  DiagramConfig diagrams;              ///< Diagram detection options
  StructurerConfig structure;          ///< Outline options
  bool verbose = false;                ///< Print DEBUG progress to stderr
};

/**
 * @brief Result of extracting one PDF
 */
struct ExtractionResult {
  bool success = false;         ///< Whether extraction succeeded
  std::string errorMessage;     ///< Error message if failed
  std::string pdfPath;          ///< Input file
  std::string bookName;         ///< Book name derived from the file name
  std::string imageDir;         ///< Directory the crops were written to
  Document document;            ///< Structured tree
  std::vector<Diagram> diagrams; ///< Every diagram, page order
  int pageCount = 0;            ///< Number of pages processed
  double processingTimeMs = 0;  ///< Processing time in milliseconds
};

/**
 * @brief Turns a textbook chapter PDF into an outline with diagram images
 *
 * Example usage:
 * @code
 * textbook::ExtractorConfig config;
 * config.imageOutputBase = "static";
 * textbook::TextbookExtractor extractor(config);
 * auto result = extractor.extract("uploads/circles.pdf");
 * if (result.success) {
 *     std::cout << textbook::toResponseJson(result.document).dump(2);
 * }
 * @endcode
 */
class TextbookExtractor {
public:
  TextbookExtractor();

  explicit TextbookExtractor(const ExtractorConfig &config);

  /**
   * @brief Extract one PDF
   *
   * Never throws. A document that cannot be opened or rendered yields
   * success = false and no tree.
   *
   * @param pdfPath Path to the PDF file
   */
  ExtractionResult extract(const std::string &pdfPath) const;

  /**
   * @brief Extract several PDFs independently, in input order
   *
   * A failing document does not affect the others. Callers must make sure
   * book names are distinct, crops of equally named books share a folder.
   */
  std::vector<ExtractionResult>
  extractBatch(const std::vector<std::string> &pdfPaths) const;

  const ExtractorConfig &getConfig() const;

  void setConfig(const ExtractorConfig &config);

private:
  ExtractorConfig m_config;
};

/**
 * @brief JSON for one result: the response envelope, or
 * {"file", "error"} for a failed document
 * @param includeDiagrams Add the flat "diagrams" list to the envelope
 */
nlohmann::json toResultJson(const ExtractionResult &result,
                            bool includeDiagrams = false);

} // namespace textbook

#endif // TEXTBOOK_EXTRACTOR_HPP

#ifndef DIAGRAM_EXTRACTOR_HPP
#define DIAGRAM_EXTRACTOR_HPP

#include "DocumentModel.hpp"
#include "PageRasterizer.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace textbook {

/**
 * @brief Configuration options for diagram detection
 */
struct DiagramConfig {
  double zoom = 3.0;           ///< Render magnification (72 * zoom DPI)
  int blurKernelSize = 5;      ///< Gaussian blur kernel (odd, square)
  double inkThreshold = 200.0; ///< Luminance cutoff, darker pixels are ink
  double minContourArea = 1000.0; ///< Minimum area in px^2 at referenceZoom
  double referenceZoom = 3.0;  ///< Zoom at which minContourArea is defined
  int jpegQuality = 95;        ///< Quality of the persisted crops (0-100)
  size_t workers = 0;          ///< Page workers, 0 = hardware concurrency
  bool writePagePreviews = false; ///< Also write previews/page_<n>_preview.jpg
  bool verbose = false;        ///< Print DEBUG progress to stderr
};

/**
 * @brief A candidate diagram found on one rendered page
 */
struct DiagramRegion {
  int contourIndex;   ///< 0-indexed position in contour detection order
  double area;        ///< Contour area in rendered pixels
  cv::Rect pixelRect; ///< Bounding rectangle in the rendered raster
  double x;           ///< Left edge in page units
  double y;           ///< Top edge in page units
  double width;       ///< Width in page units
  double height;      ///< Height in page units
};

/**
 * @brief Effective contour area threshold for a zoom factor
 *
 * Contour area grows with the square of the zoom, so the configured
 * threshold is scaled by (zoom / referenceZoom)^2.
 */
double scaledMinContourArea(const DiagramConfig &config, double zoom);

/**
 * @brief Detect diagram regions in a rendered page
 *
 * Grayscale, blur, inverse binary threshold at inkThreshold, then external
 * contours only. Contours below the scaled area threshold are dropped. The
 * surviving bounding rectangles are divided by zoom and clamped to the page
 * rectangle.
 *
 * @param raster Rendered page (1, 3 or 4 channels)
 * @param zoom Magnification the raster was rendered at
 * @param pageSize Original page size in page units
 * @param config Detection thresholds
 * @return Regions in contour detection order
 */
std::vector<DiagramRegion> detectDiagramRegions(const cv::Mat &raster,
                                                double zoom,
                                                const PageSize &pageSize,
                                                const DiagramConfig &config);

/**
 * @brief File name of the k-th diagram crop of a page
 * @param pageNumber 1-indexed page number
 * @param diagramNumber 1-indexed diagram number (contour index + 1)
 */
std::string diagramFileName(int pageNumber, int diagramNumber);

/**
 * @brief Finds vector diagrams on PDF pages and persists their crops
 *
 * Crops are written to outputDir and referenced through the served path
 * /images/<bookName>/<file>. Pages are independent, so a whole document is
 * processed by a pool of workers; results are merged in page order.
 */
class DiagramExtractor {
public:
  /**
   * @param bookName Book name used in the served image path
   * @param outputDir Directory the crops are written to (must exist)
   * @param config Detection configuration
   */
  DiagramExtractor(std::string bookName, std::string outputDir,
                   DiagramConfig config = DiagramConfig());

  /**
   * @brief Detect and persist the diagrams of one page
   * @param rasterizer Open document
   * @param pageNumber 1-indexed page number
   * @return Diagrams in contour detection order
   * @throws RasterizerError if the page cannot be rendered
   * @throws std::runtime_error if a crop cannot be written
   */
  std::vector<Diagram> extractPage(const PageRasterizer &rasterizer,
                                   int pageNumber) const;

  /**
   * @brief Detect and persist the diagrams of every page of a PDF
   *
   * Each worker opens its own PageRasterizer on pdfPath.
   *
   * @param pdfPath Path to the PDF file
   * @return Diagrams ordered by page, then by contour detection order
   * @throws RasterizerError if the document or a page cannot be rendered
   * @throws std::runtime_error if a crop cannot be written
   */
  std::vector<Diagram> extract(const std::string &pdfPath) const;

  /**
   * @brief Detect and persist the diagrams of an already rendered page
   * @param raster Page rendered at getConfig().zoom
   * @param pageSize Original page size in page units
   * @param pageNumber 1-indexed page number
   * @throws std::runtime_error if a crop cannot be written
   */
  std::vector<Diagram> extractFromRaster(const cv::Mat &raster,
                                         const PageSize &pageSize,
                                         int pageNumber) const;

  const DiagramConfig &getConfig() const { return m_config; }

private:
  void writePreview(const cv::Mat &raster,
                    const std::vector<DiagramRegion> &regions,
                    int pageNumber) const;

  std::string m_bookName;
  std::string m_outputDir;
  DiagramConfig m_config;
};

} // namespace textbook

#endif // DIAGRAM_EXTRACTOR_HPP

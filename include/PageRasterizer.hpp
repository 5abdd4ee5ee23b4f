#ifndef PAGE_RASTERIZER_HPP
#define PAGE_RASTERIZER_HPP

#include <opencv2/core.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace poppler {
class document;
class page;
} // namespace poppler

namespace textbook {

/**
 * @brief Raised when a PDF cannot be opened, parsed or rendered
 *
 * Always fatal for the whole document.
 */
class RasterizerError : public std::runtime_error {
public:
  explicit RasterizerError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief Size of a page in original page units (points)
 */
struct PageSize {
  double width = 0;
  double height = 0;
};

/**
 * @brief A word box reported by Poppler, origin at the top-left of the page
 */
struct WordBox {
  std::string text;
  double x = 0;
  double y = 0;
  double width = 0;
  double height = 0;
};

/**
 * @brief Loads a PDF with Poppler and renders its pages for image analysis
 *
 * One instance owns one Poppler document and must not be shared between
 * threads; concurrent workers open their own instance on the same file.
 *
 * Example usage:
 * @code
 * textbook::PageRasterizer rasterizer("circles.pdf");
 * cv::Mat page = rasterizer.render(1, 3.0);
 * @endcode
 */
class PageRasterizer {
public:
  /**
   * @brief Open a PDF file
   * @param pdfPath Path to the PDF file
   * @throws RasterizerError if the file cannot be loaded, is locked, or has
   * no pages
   */
  explicit PageRasterizer(const std::string &pdfPath);

  ~PageRasterizer();

  PageRasterizer(const PageRasterizer &) = delete;
  PageRasterizer &operator=(const PageRasterizer &) = delete;

  PageRasterizer(PageRasterizer &&other) noexcept;
  PageRasterizer &operator=(PageRasterizer &&other) noexcept;

  const std::string &path() const { return m_path; }

  int pageCount() const;

  /**
   * @brief Page size of the crop box, rotation applied
   * @param pageNumber 1-indexed page number
   */
  PageSize pageSize(int pageNumber) const;

  /**
   * @brief Render a page to a BGR raster at 72 * zoom DPI
   * @param pageNumber 1-indexed page number
   * @param zoom Magnification relative to 72 DPI
   * @return 3-channel 8-bit image
   * @throws RasterizerError if rendering fails
   */
  cv::Mat render(int pageNumber, double zoom) const;

  /**
   * @brief Word boxes of a page in Poppler's text order
   * @param pageNumber 1-indexed page number
   */
  std::vector<WordBox> words(int pageNumber) const;

private:
  std::unique_ptr<poppler::page> loadPage(int pageNumber) const;

  std::string m_path;
  std::unique_ptr<poppler::document> m_document;
};

} // namespace textbook

#endif // PAGE_RASTERIZER_HPP

#include "PageRasterizer.hpp"

#include <opencv2/imgproc.hpp>

#include <utility>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

namespace textbook {

PageRasterizer::PageRasterizer(const std::string &pdfPath) : m_path(pdfPath) {
  m_document.reset(poppler::document::load_from_file(pdfPath));

  if (!m_document) {
    throw RasterizerError("Failed to load PDF file: " + pdfPath);
  }

  if (m_document->is_locked()) {
    throw RasterizerError("PDF file is password protected: " + pdfPath);
  }

  if (m_document->pages() < 1) {
    throw RasterizerError("PDF has no pages: " + pdfPath);
  }
}

PageRasterizer::~PageRasterizer() = default;

PageRasterizer::PageRasterizer(PageRasterizer &&other) noexcept
    : m_path(std::move(other.m_path)),
      m_document(std::move(other.m_document)) {}

PageRasterizer &PageRasterizer::operator=(PageRasterizer &&other) noexcept {
  if (this != &other) {
    m_path = std::move(other.m_path);
    m_document = std::move(other.m_document);
  }
  return *this;
}

int PageRasterizer::pageCount() const { return m_document->pages(); }

std::unique_ptr<poppler::page>
PageRasterizer::loadPage(int pageNumber) const {
  if (pageNumber < 1 || pageNumber > pageCount()) {
    throw RasterizerError("Page " + std::to_string(pageNumber) +
                          " is out of range for " + m_path);
  }

  std::unique_ptr<poppler::page> page(m_document->create_page(pageNumber - 1));
  if (!page) {
    throw RasterizerError("Failed to create page " +
                          std::to_string(pageNumber) + " of " + m_path);
  }
  return page;
}

PageSize PageRasterizer::pageSize(int pageNumber) const {
  std::unique_ptr<poppler::page> page = loadPage(pageNumber);
  poppler::rectf box = page->page_rect(poppler::crop_box);

  PageSize size;
  size.width = box.width();
  size.height = box.height();

  // The renderer applies the page rotation, so the raster of a landscape or
  // seascape page has width and height swapped relative to the crop box.
  poppler::page::orientation_enum orientation = page->orientation();
  if (orientation == poppler::page::landscape ||
      orientation == poppler::page::seascape) {
    std::swap(size.width, size.height);
  }
  return size;
}

cv::Mat PageRasterizer::render(int pageNumber, double zoom) const {
  if (zoom <= 0) {
    throw RasterizerError("Zoom must be positive");
  }

  std::unique_ptr<poppler::page> page = loadPage(pageNumber);

  poppler::page_renderer renderer;
  renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
  renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
  renderer.set_image_format(poppler::image::format_argb32);

  const double dpi = 72.0 * zoom;
  poppler::image popplerImage = renderer.render_page(page.get(), dpi, dpi);

  if (!popplerImage.is_valid()) {
    throw RasterizerError("Failed to render page " +
                          std::to_string(pageNumber) + " of " + m_path);
  }

  int width = popplerImage.width();
  int height = popplerImage.height();

  cv::Mat mat;

  switch (popplerImage.format()) {
  case poppler::image::format_argb32: {
    // ARGB32 is stored as BGRA in memory on little-endian hosts
    cv::Mat bgra(height, width, CV_8UC4,
                 const_cast<char *>(popplerImage.const_data()),
                 popplerImage.bytes_per_row());
    cv::cvtColor(bgra, mat, cv::COLOR_BGRA2BGR);
    break;
  }
  case poppler::image::format_rgb24: {
    cv::Mat rgb(height, width, CV_8UC3,
                const_cast<char *>(popplerImage.const_data()),
                popplerImage.bytes_per_row());
    cv::cvtColor(rgb, mat, cv::COLOR_RGB2BGR);
    break;
  }
  case poppler::image::format_bgr24: {
    mat = cv::Mat(height, width, CV_8UC3,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    break;
  }
  case poppler::image::format_gray8: {
    cv::Mat gray(height, width, CV_8UC1,
                 const_cast<char *>(popplerImage.const_data()),
                 popplerImage.bytes_per_row());
    cv::cvtColor(gray, mat, cv::COLOR_GRAY2BGR);
    break;
  }
  default:
    throw RasterizerError("Unsupported image format for page " +
                          std::to_string(pageNumber));
  }

  return mat;
}

std::vector<WordBox> PageRasterizer::words(int pageNumber) const {
  std::unique_ptr<poppler::page> page = loadPage(pageNumber);

  std::vector<WordBox> result;
  std::vector<poppler::text_box> textBoxes = page->text_list();
  result.reserve(textBoxes.size());

  for (auto &textBox : textBoxes) {
    poppler::byte_array textBytes = textBox.text().to_utf8();
    std::string text(textBytes.begin(), textBytes.end());

    if (text.empty()) {
      continue;
    }

    // text_list() boxes are already in top-left origin page coordinates
    poppler::rectf bbox = textBox.bbox();

    WordBox word;
    word.text = std::move(text);
    word.x = bbox.x();
    word.y = bbox.y();
    word.width = bbox.width();
    word.height = bbox.height();
    result.push_back(std::move(word));
  }

  return result;
}

} // namespace textbook

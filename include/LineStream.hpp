#ifndef LINE_STREAM_HPP
#define LINE_STREAM_HPP

#include "PageRasterizer.hpp"

#include <string>
#include <vector>

namespace textbook {

/**
 * @brief Trimmed, non-empty text lines of one page in reading order
 */
struct PageText {
  int pageNumber = 0; ///< 1-indexed page number
  std::vector<std::string> lines;
};

/**
 * @brief Trim ASCII whitespace from both ends
 */
std::string trim(const std::string &text);

/**
 * @brief Group word boxes into text lines
 *
 * Words whose vertical centers lie within half the taller box height of a
 * line's first word join that line. Lines are ordered top to bottom, words
 * within a line left to right, joined by single spaces. Lines that are
 * empty after trimming are dropped.
 *
 * @param words Word boxes in any order, origin top-left
 * @return Lines in reading order
 */
std::vector<std::string> groupWordsIntoLines(const std::vector<WordBox> &words);

/**
 * @brief Produces per-page text lines from a PDF
 */
class LineStream {
public:
  explicit LineStream(const PageRasterizer &rasterizer);

  /**
   * @brief Lines of one page
   * @param pageNumber 1-indexed page number
   * @throws RasterizerError if the page cannot be loaded
   */
  PageText readPage(int pageNumber) const;

  /**
   * @brief Lines of every page, in page order
   */
  std::vector<PageText> readDocument() const;

private:
  const PageRasterizer &m_rasterizer;
};

} // namespace textbook

#endif // LINE_STREAM_HPP

#include "LineStream.hpp"

#include <algorithm>
#include <cmath>

namespace textbook {

std::string trim(const std::string &text) {
  size_t start = text.find_first_not_of(" \t\n\r\f\v");
  if (start == std::string::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(" \t\n\r\f\v");
  return text.substr(start, end - start + 1);
}

std::vector<std::string>
groupWordsIntoLines(const std::vector<WordBox> &words) {
  std::vector<std::string> lines;

  std::vector<size_t> order;
  order.reserve(words.size());
  for (size_t i = 0; i < words.size(); i++) {
    if (!trim(words[i].text).empty()) {
      order.push_back(i);
    }
  }

  auto centerY = [&words](size_t i) {
    return words[i].y + words[i].height / 2.0;
  };

  // Top to bottom, then left to right, so every line is seeded by its
  // uppermost word
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    double ya = centerY(a);
    double yb = centerY(b);
    if (ya != yb) {
      return ya < yb;
    }
    return words[a].x < words[b].x;
  });

  std::vector<bool> used(words.size(), false);

  for (size_t seedPos = 0; seedPos < order.size(); seedPos++) {
    size_t seed = order[seedPos];
    if (used[seed]) {
      continue;
    }
    used[seed] = true;

    std::vector<size_t> lineWords = {seed};
    const double lineCenter = centerY(seed);

    // Find all words that belong to this line
    for (size_t j = seedPos + 1; j < order.size(); j++) {
      size_t candidate = order[j];
      if (used[candidate]) {
        continue;
      }

      double tolerance =
          std::max(2.0, std::max(words[seed].height, words[candidate].height) /
                            2.0);
      double yDiff = std::abs(centerY(candidate) - lineCenter);

      if (yDiff <= tolerance) {
        used[candidate] = true;
        lineWords.push_back(candidate);
      }
    }

    std::stable_sort(lineWords.begin(), lineWords.end(),
                     [&words](size_t a, size_t b) {
                       return words[a].x < words[b].x;
                     });

    std::string lineText;
    for (size_t index : lineWords) {
      if (!lineText.empty()) {
        lineText += " ";
      }
      lineText += trim(words[index].text);
    }

    lineText = trim(lineText);
    if (!lineText.empty()) {
      lines.push_back(lineText);
    }
  }

  return lines;
}

LineStream::LineStream(const PageRasterizer &rasterizer)
    : m_rasterizer(rasterizer) {}

PageText LineStream::readPage(int pageNumber) const {
  PageText page;
  page.pageNumber = pageNumber;
  page.lines = groupWordsIntoLines(m_rasterizer.words(pageNumber));
  return page;
}

std::vector<PageText> LineStream::readDocument() const {
  std::vector<PageText> pages;
  int pageCount = m_rasterizer.pageCount();
  pages.reserve(pageCount);
  for (int pageNumber = 1; pageNumber <= pageCount; pageNumber++) {
    pages.push_back(readPage(pageNumber));
  }
  return pages;
}

} // namespace textbook

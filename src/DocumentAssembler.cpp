#include "DocumentAssembler.hpp"

#include <filesystem>
#include <utility>

namespace textbook {

std::string bookNameFromPath(const std::string &pdfPath) {
  return std::filesystem::path(pdfPath).stem().string();
}

Document assemble(const std::string &book, const std::string &subject,
                  Chapter chapter) {
  Document document;
  document.book = book;
  document.subject = subject;
  document.chapters.push_back(std::move(chapter));
  return document;
}

nlohmann::json toResponseJson(const Document &document) {
  return nlohmann::json{{"response", document}};
}

} // namespace textbook

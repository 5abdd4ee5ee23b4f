#ifndef DOCUMENT_ASSEMBLER_HPP
#define DOCUMENT_ASSEMBLER_HPP

#include "DocumentModel.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace textbook {

/**
 * @brief Book name of a PDF: the file name without directory and extension
 */
std::string bookNameFromPath(const std::string &pdfPath);

/**
 * @brief Wrap the structured chapter into the output document
 */
Document assemble(const std::string &book, const std::string &subject,
                  Chapter chapter);

/**
 * @brief Response envelope {"response": {book, subject, chapters}}
 */
nlohmann::json toResponseJson(const Document &document);

} // namespace textbook

#endif // DOCUMENT_ASSEMBLER_HPP

#ifndef DOCUMENT_MODEL_HPP
#define DOCUMENT_MODEL_HPP

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace textbook {

/**
 * @brief A detected diagram region, in original page units (points)
 *
 * Produced once by the DiagramExtractor. The structurer only copies the
 * image path into the elements that reference it.
 */
struct Diagram {
  int page;              ///< 1-indexed page number
  double x;              ///< Left edge, origin top-left
  double y;              ///< Top edge, origin top-left
  double width;          ///< Width, always > 0
  double height;         ///< Height, always > 0
  std::string imagePath; ///< Served path /images/<book>/page_<n>_diagram_<k>.jpg

  /**
   * @brief Construct a diagram record
   * @throws std::invalid_argument if page < 1, x or y is negative, width or
   * height is not positive, or imagePath is empty
   */
  Diagram(int page, double x, double y, double width, double height,
          std::string imagePath);
};

/**
 * @brief Reference to a diagram image from a structural element
 */
struct ImageRef {
  std::string img;

  explicit ImageRef(std::string img);

  bool operator==(const ImageRef &other) const { return img == other.img; }
};

struct Section {
  std::string sectionName;
  std::string content;
  std::vector<ImageRef> imageUrls;

  Section(std::string sectionName, std::string content);
};

struct Exercise {
  std::string exercise; ///< Heading line, verbatim
  std::string content;  ///< Newline-joined body lines
  std::vector<ImageRef> imageUrls;

  explicit Exercise(std::string heading);
};

struct Topic {
  std::string topicName;
  std::vector<ImageRef> imageUrls;
  std::vector<Section> sections;
  std::vector<Exercise> exercises;

  explicit Topic(std::string topicName);
};

struct Chapter {
  std::string chapterName;
  std::vector<Topic> topics;
  std::vector<Exercise> exercises; ///< Exercises seen before any topic

  explicit Chapter(std::string chapterName);
};

/**
 * @brief Root of the output tree
 */
struct Document {
  std::string book;
  std::string subject;
  std::vector<Chapter> chapters;
};

/**
 * @brief Append an image reference unless the same path is already listed
 * @return true if the reference was added
 */
bool addImageRef(std::vector<ImageRef> &imageUrls, const std::string &path);

void to_json(nlohmann::json &j, const Diagram &diagram);
void to_json(nlohmann::json &j, const ImageRef &ref);
void to_json(nlohmann::json &j, const Section &section);
void to_json(nlohmann::json &j, const Exercise &exercise);
void to_json(nlohmann::json &j, const Topic &topic);
void to_json(nlohmann::json &j, const Chapter &chapter);
void to_json(nlohmann::json &j, const Document &document);

} // namespace textbook

#endif // DOCUMENT_MODEL_HPP

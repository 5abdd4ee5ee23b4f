#include "DocumentModel.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace textbook {

Diagram::Diagram(int page, double x, double y, double width, double height,
                 std::string imagePath)
    : page(page), x(x), y(y), width(width), height(height),
      imagePath(std::move(imagePath)) {
  if (page < 1) {
    throw std::invalid_argument("Diagram page must be 1 or greater, got " +
                                std::to_string(page));
  }
  if (x < 0 || y < 0) {
    throw std::invalid_argument("Diagram origin must not be negative");
  }
  if (width <= 0 || height <= 0) {
    throw std::invalid_argument("Diagram width and height must be positive");
  }
  if (this->imagePath.empty()) {
    throw std::invalid_argument("Diagram image path is empty");
  }
}

ImageRef::ImageRef(std::string img) : img(std::move(img)) {
  if (this->img.empty()) {
    throw std::invalid_argument("Image reference is empty");
  }
}

Section::Section(std::string sectionName, std::string content)
    : sectionName(std::move(sectionName)), content(std::move(content)) {
  if (this->sectionName.empty()) {
    throw std::invalid_argument("Section name is empty");
  }
}

Exercise::Exercise(std::string heading) : exercise(std::move(heading)) {
  if (exercise.empty()) {
    throw std::invalid_argument("Exercise heading is empty");
  }
}

Topic::Topic(std::string topicName) : topicName(std::move(topicName)) {
  if (this->topicName.empty()) {
    throw std::invalid_argument("Topic name is empty");
  }
}

Chapter::Chapter(std::string chapterName)
    : chapterName(std::move(chapterName)) {
  if (this->chapterName.empty()) {
    throw std::invalid_argument("Chapter name is empty");
  }
}

bool addImageRef(std::vector<ImageRef> &imageUrls, const std::string &path) {
  ImageRef ref(path);
  if (std::find(imageUrls.begin(), imageUrls.end(), ref) != imageUrls.end()) {
    return false;
  }
  imageUrls.push_back(std::move(ref));
  return true;
}

void to_json(nlohmann::json &j, const Diagram &diagram) {
  j = nlohmann::json{{"page", diagram.page},
                     {"x", diagram.x},
                     {"y", diagram.y},
                     {"width", diagram.width},
                     {"height", diagram.height},
                     {"imagePath", diagram.imagePath}};
}

void to_json(nlohmann::json &j, const ImageRef &ref) {
  j = nlohmann::json{{"img", ref.img}};
}

// Empty lists serialize as [] rather than null so consumers can iterate
// without checks.
void to_json(nlohmann::json &j, const Section &section) {
  j = nlohmann::json{{"sectionName", section.sectionName},
                     {"content", section.content},
                     {"imageUrls", nlohmann::json::array()}};
  for (const auto &ref : section.imageUrls) {
    j["imageUrls"].push_back(ref);
  }
}

void to_json(nlohmann::json &j, const Exercise &exercise) {
  j = nlohmann::json{{"exercise", exercise.exercise},
                     {"content", exercise.content},
                     {"imageUrls", nlohmann::json::array()}};
  for (const auto &ref : exercise.imageUrls) {
    j["imageUrls"].push_back(ref);
  }
}

void to_json(nlohmann::json &j, const Topic &topic) {
  j = nlohmann::json{{"topicName", topic.topicName},
                     {"imageUrls", nlohmann::json::array()},
                     {"sections", nlohmann::json::array()},
                     {"exercises", nlohmann::json::array()}};
  for (const auto &ref : topic.imageUrls) {
    j["imageUrls"].push_back(ref);
  }
  for (const auto &section : topic.sections) {
    j["sections"].push_back(section);
  }
  for (const auto &exercise : topic.exercises) {
    j["exercises"].push_back(exercise);
  }
}

void to_json(nlohmann::json &j, const Chapter &chapter) {
  j = nlohmann::json{{"chapterName", chapter.chapterName},
                     {"topics", nlohmann::json::array()},
                     {"exercises", nlohmann::json::array()}};
  for (const auto &topic : chapter.topics) {
    j["topics"].push_back(topic);
  }
  for (const auto &exercise : chapter.exercises) {
    j["exercises"].push_back(exercise);
  }
}

void to_json(nlohmann::json &j, const Document &document) {
  j = nlohmann::json{{"book", document.book},
                     {"subject", document.subject},
                     {"chapters", nlohmann::json::array()}};
  for (const auto &chapter : document.chapters) {
    j["chapters"].push_back(chapter);
  }
}

} // namespace textbook

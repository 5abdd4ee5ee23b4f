#include "DocumentStructurer.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>
#include <utility>

namespace textbook {

namespace {

const std::regex &topicHeadingPattern() {
  static const std::regex pattern(R"(^\d+\.\d+\s+(.+)$)");
  return pattern;
}

std::string joinLines(const std::vector<std::string> &lines) {
  std::string joined;
  for (size_t i = 0; i < lines.size(); i++) {
    if (i > 0) {
      joined += "\n";
    }
    joined += lines[i];
  }
  return joined;
}

} // anonymous namespace

std::optional<std::string> matchTopicHeading(const std::string &line) {
  std::smatch match;
  if (std::regex_match(line, match, topicHeadingPattern())) {
    return match[1].str();
  }
  return std::nullopt;
}

bool isExerciseHeading(const std::string &line) {
  // "EXERCISES" shares the prefix
  return line.rfind("EXERCISE", 0) == 0;
}

bool looksLikeChapterTitle(const std::string &line) {
  int letters = 0;
  for (unsigned char c : line) {
    if (std::isupper(c)) {
      letters++;
    } else if (c != ' ' && c != '&' && c != '-' && c != '\'') {
      return false;
    }
  }
  return letters >= 2;
}

DocumentStructurer::DocumentStructurer(StructurerConfig config)
    : m_config(std::move(config)), m_knownTitles(m_config.chapterTitles),
      m_chapter(m_config.defaultChapterName) {}

Chapter DocumentStructurer::structure(const std::vector<PageText> &pages,
                                      const std::vector<Diagram> &diagrams) {
  reset(diagrams);

  for (const auto &page : pages) {
    beginPage(page.pageNumber);
    for (const auto &line : page.lines) {
      processLine(line);
    }
    endPage();
  }

  return finish();
}

void DocumentStructurer::reset(const std::vector<Diagram> &diagrams) {
  m_diagrams = diagrams;
  m_knownTitles = m_config.chapterTitles;
  m_chapter = Chapter(m_config.defaultChapterName);
  m_chapterTitleFound = false;
  m_configuredTitleFound = false;
  m_currentTopic.reset();
  m_currentExercise.reset();
  m_pendingContentLines.clear();
  m_inExerciseBlock = false;
  m_firstPage = 0;
  m_currentPage = 0;
}

void DocumentStructurer::beginPage(int pageNumber) {
  // Lines left over from a page that was never ended still belong to it
  flushPending();

  if (m_firstPage == 0) {
    m_firstPage = pageNumber;
  }
  m_currentPage = pageNumber;
}

LineKind DocumentStructurer::classify(const std::string &line) const {
  if (m_currentPage == m_firstPage) {
    if (std::find(m_knownTitles.begin(), m_knownTitles.end(), line) !=
        m_knownTitles.end()) {
      return LineKind::ChapterTitle;
    }
    if (m_config.deriveChapterTitle && !m_chapterTitleFound &&
        !m_currentTopic && !m_currentExercise && !isExerciseHeading(line) &&
        looksLikeChapterTitle(line)) {
      return LineKind::ChapterTitle;
    }
  }

  if (matchTopicHeading(line)) {
    return LineKind::TopicHeading;
  }

  if (isExerciseHeading(line)) {
    return LineKind::ExerciseHeading;
  }

  return LineKind::Body;
}

LineKind DocumentStructurer::processLine(const std::string &rawLine) {
  std::string line = trim(rawLine);
  if (line.empty()) {
    return LineKind::Body;
  }

  LineKind kind = classify(line);

  switch (kind) {
  case LineKind::ChapterTitle: {
    // A configured title replaces a derived one seen earlier on the page
    bool configured = std::find(m_config.chapterTitles.begin(),
                                m_config.chapterTitles.end(),
                                line) != m_config.chapterTitles.end();
    if (configured ? !m_configuredTitleFound : !m_chapterTitleFound) {
      m_chapter.chapterName = line;
      m_chapterTitleFound = true;
      if (configured) {
        m_configuredTitleFound = true;
      } else if (std::find(m_knownTitles.begin(), m_knownTitles.end(),
                           line) == m_knownTitles.end()) {
        m_knownTitles.push_back(line);
      }
      if (m_config.verbose) {
        std::cerr << "DEBUG: Chapter title \"" << line << "\"" << std::endl;
      }
    }
    break;
  }

  case LineKind::TopicHeading:
    flushPending();
    closeExercise();
    closeTopic();
    openTopic(*matchTopicHeading(line));
    break;

  case LineKind::ExerciseHeading:
    flushPending();
    closeExercise();
    openExercise(line);
    break;

  case LineKind::Body:
    m_pendingContentLines.push_back(line);
    break;
  }

  return kind;
}

void DocumentStructurer::endPage() { flushPending(); }

Chapter DocumentStructurer::finish() {
  flushPending();
  closeExercise();
  closeTopic();

  Chapter chapter = std::move(m_chapter);
  reset(m_diagrams);
  return chapter;
}

void DocumentStructurer::openTopic(const std::string &topicName) {
  m_currentTopic.emplace(topicName);
  if (m_config.verbose) {
    std::cerr << "DEBUG: Page " << m_currentPage << ": topic \"" << topicName
              << "\"" << std::endl;
  }
}

void DocumentStructurer::openExercise(const std::string &heading) {
  m_currentExercise.emplace(heading);
  m_inExerciseBlock = true;
  if (m_config.verbose) {
    std::cerr << "DEBUG: Page " << m_currentPage << ": exercise \"" << heading
              << "\"" << std::endl;
  }
}

void DocumentStructurer::flushPending() {
  if (m_pendingContentLines.empty()) {
    return;
  }

  std::string content = joinLines(m_pendingContentLines);
  m_pendingContentLines.clear();

  if (m_currentExercise) {
    if (!m_currentExercise->content.empty()) {
      m_currentExercise->content += "\n";
    }
    m_currentExercise->content += content;
    attachPageDiagrams(m_currentExercise->imageUrls);
  } else if (m_currentTopic) {
    Section section("Section " +
                        std::to_string(m_currentTopic->sections.size() + 1),
                    content);
    attachPageDiagrams(section.imageUrls);
    m_currentTopic->sections.push_back(std::move(section));
  } else if (m_config.verbose) {
    std::cerr << "DEBUG: Page " << m_currentPage
              << ": dropping content before the first topic" << std::endl;
  }
}

void DocumentStructurer::closeExercise() {
  if (m_currentExercise) {
    if (m_currentTopic) {
      m_currentTopic->exercises.push_back(std::move(*m_currentExercise));
    } else {
      m_chapter.exercises.push_back(std::move(*m_currentExercise));
    }
    m_currentExercise.reset();
  }
  m_inExerciseBlock = false;
}

void DocumentStructurer::closeTopic() {
  if (m_currentTopic) {
    m_chapter.topics.push_back(std::move(*m_currentTopic));
    m_currentTopic.reset();
  }
}

void DocumentStructurer::attachPageDiagrams(
    std::vector<ImageRef> &imageUrls) const {
  for (const auto &diagram : m_diagrams) {
    if (diagram.page == m_currentPage) {
      addImageRef(imageUrls, diagram.imagePath);
    }
  }
}

} // namespace textbook

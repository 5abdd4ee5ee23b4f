#ifndef DOCUMENT_STRUCTURER_HPP
#define DOCUMENT_STRUCTURER_HPP

#include "DocumentModel.hpp"
#include "LineStream.hpp"

#include <optional>
#include <string>
#include <vector>

namespace textbook {

/**
 * @brief Configuration options for the structuring pass
 */
struct StructurerConfig {
  std::vector<std::string> chapterTitles; ///< Known chapter titles
  bool deriveChapterTitle = true; ///< Take the first upper-case line of page 1
  std::string defaultChapterName = "Chapter 1"; ///< Used if no title is seen
  bool verbose = false;                          ///< Print DEBUG to stderr
};

/**
 * @brief How a single line is interpreted by the structurer
 */
enum class LineKind {
  ChapterTitle,    ///< Sets the chapter name, first page only
  TopicHeading,    ///< "<int>.<int> <text>"
  ExerciseHeading, ///< Starts with "EXERCISE"
  Body             ///< Anything else
};

/**
 * @brief Match a topic heading
 * @return The heading text after the number, or nullopt
 */
std::optional<std::string> matchTopicHeading(const std::string &line);

bool isExerciseHeading(const std::string &line);

/**
 * @brief Candidate for a derived chapter title: upper-case letters with
 * spaces, '&', '-' or '\'' and at least two letters
 */
bool looksLikeChapterTitle(const std::string &line);

/**
 * @brief Builds the chapter tree from text lines and detected diagrams
 *
 * A single pass over all pages. Headings open and close topics and
 * exercises; body lines are buffered and flushed into the open exercise or,
 * failing that, as a new section of the open topic. Every diagram on the
 * page being processed at flush time is attached to the flushed element.
 *
 * Example usage:
 * @code
 * textbook::DocumentStructurer structurer;
 * textbook::Chapter chapter = structurer.structure(pages, diagrams);
 * @endcode
 *
 * The incremental interface (beginPage, processLine, endPage, finish) drives
 * the same state machine line by line.
 */
class DocumentStructurer {
public:
  explicit DocumentStructurer(StructurerConfig config = StructurerConfig());

  /**
   * @brief Structure a whole document
   * @param pages Text lines per page, in page order
   * @param diagrams Every diagram of the document
   * @return The single chapter of the document
   */
  Chapter structure(const std::vector<PageText> &pages,
                    const std::vector<Diagram> &diagrams);

  /**
   * @brief Reset all state for a new document
   */
  void reset(const std::vector<Diagram> &diagrams);

  void beginPage(int pageNumber);

  /**
   * @brief Classify and apply one line; blank lines are ignored
   * @return The kind the line was classified as, Body for blank lines
   */
  LineKind processLine(const std::string &line);

  /**
   * @brief Flush buffered lines of the current page
   */
  void endPage();

  /**
   * @brief Close open elements and hand out the chapter
   */
  Chapter finish();

  /**
   * @brief True while an exercise heading has been seen and not yet closed
   * by the next heading or the end of the document
   */
  bool inExerciseBlock() const { return m_inExerciseBlock; }

  const StructurerConfig &getConfig() const { return m_config; }

private:
  LineKind classify(const std::string &line) const;

  void openTopic(const std::string &topicName);
  void openExercise(const std::string &heading);
  void flushPending();
  void closeExercise();
  void closeTopic();
  void attachPageDiagrams(std::vector<ImageRef> &imageUrls) const;

  StructurerConfig m_config;
  std::vector<Diagram> m_diagrams;
  std::vector<std::string> m_knownTitles;

  Chapter m_chapter;
  bool m_chapterTitleFound = false;
  bool m_configuredTitleFound = false;
  std::optional<Topic> m_currentTopic;
  std::optional<Exercise> m_currentExercise;
  std::vector<std::string> m_pendingContentLines;
  bool m_inExerciseBlock = false;
  int m_firstPage = 0;
  int m_currentPage = 0;
};

} // namespace textbook

#endif // DOCUMENT_STRUCTURER_HPP

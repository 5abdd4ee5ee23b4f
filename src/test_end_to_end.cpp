#include "DocumentAssembler.hpp"
#include "TextbookExtractor.hpp"

#include <cairo-pdf.h>
#include <cairo.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <set>
#include <string>
#include <vector>

namespace {

int failures = 0;

void check(bool condition, const std::string &description) {
  std::cout << (condition ? "  PASS: " : "  FAIL: ") << description
            << std::endl;
  if (!condition) {
    failures++;
  }
}

const double kPageWidth = 595.0;
const double kPageHeight = 842.0;

// Figure outline on page 1, in points
const double kFigureX = 100.0;
const double kFigureY = 320.0;
const double kFigureWidth = 240.0;
const double kFigureHeight = 160.0;

void showLine(cairo_t *cr, double y, const std::string &text, double size) {
  cairo_set_font_size(cr, size);
  cairo_move_to(cr, 72.0, y);
  cairo_show_text(cr, text.c_str());
}

/**
 * @brief Write a two page chapter: a title, one topic with body text and an
 * outlined figure, then an exercise on the next page
 */
bool writeSamplePdf(const std::string &path) {
  cairo_surface_t *surface =
      cairo_pdf_surface_create(path.c_str(), kPageWidth, kPageHeight);
  if (cairo_surface_status(surface) != CAIRO_STATUS_SUCCESS) {
    std::cerr << "Failed to create PDF surface" << std::endl;
    cairo_surface_destroy(surface);
    return false;
  }

  cairo_t *cr = cairo_create(surface);
  cairo_select_font_face(cr, "sans-serif", CAIRO_FONT_SLANT_NORMAL,
                         CAIRO_FONT_WEIGHT_NORMAL);
  cairo_set_source_rgb(cr, 0.0, 0.0, 0.0);

  showLine(cr, 90.0, "CIRCLES", 20.0);
  showLine(cr, 150.0, "9.1 Angle Subtended by a Chord at a Point", 14.0);
  showLine(cr, 200.0, "Take a circle with centre O.", 11.0);
  showLine(cr, 230.0, "Draw a chord PQ and join it to the centre.", 11.0);

  cairo_set_line_width(cr, 2.0);
  cairo_rectangle(cr, kFigureX, kFigureY, kFigureWidth, kFigureHeight);
  cairo_stroke(cr);
  cairo_show_page(cr);

  showLine(cr, 90.0, "EXERCISE 9.1", 14.0);
  showLine(cr, 140.0, "1. Recall that two circles are congruent.", 11.0);
  showLine(cr, 170.0, "2. Prove that equal chords subtend equal angles.", 11.0);
  showLine(cr, 200.0, "3. Find the length of the chord.", 11.0);
  cairo_show_page(cr);

  cairo_destroy(cr);
  cairo_surface_finish(surface);
  bool ok = cairo_surface_status(surface) == CAIRO_STATUS_SUCCESS;
  cairo_surface_destroy(surface);
  return ok;
}

size_t countJpegs(const std::filesystem::path &dir) {
  size_t count = 0;
  for (const auto &entry : std::filesystem::directory_iterator(dir)) {
    if (entry.is_regular_file() && entry.path().extension() == ".jpg") {
      count++;
    }
  }
  return count;
}

std::string readBytes(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

std::string cropFileName(const textbook::Diagram &diagram) {
  return std::filesystem::path(diagram.imagePath).filename().string();
}

} // anonymous namespace

int main() {
  std::cout << "=== Test end to end extraction ===" << std::endl << std::endl;

  std::filesystem::path workDir =
      std::filesystem::temp_directory_path() / "textbook_test_end_to_end";
  std::filesystem::remove_all(workDir);
  std::filesystem::create_directories(workDir);

  std::string pdfPath = (workDir / "circles.pdf").string();
  if (!writeSamplePdf(pdfPath)) {
    std::cerr << "Could not write " << pdfPath << std::endl;
    return 1;
  }

  textbook::ExtractorConfig config;
  config.imageOutputBase = workDir.string();
  textbook::TextbookExtractor extractor(config);

  // Leftover crop from an earlier run must not survive
  std::filesystem::path imageDir = workDir / "images" / "circles";
  std::filesystem::create_directories(imageDir);
  std::filesystem::copy_file(pdfPath, imageDir / "page_9_diagram_1.jpg");

  textbook::ExtractionResult result = extractor.extract(pdfPath);
  std::cout << textbook::toResultJson(result, true).dump(2) << std::endl
            << std::endl;

  check(result.success, "extraction succeeds");
  if (!result.success) {
    std::cerr << "Error: " << result.errorMessage << std::endl;
    return 1;
  }

  std::cout << "Document:" << std::endl;
  const textbook::Document &document = result.document;
  check(result.pageCount == 2, "two pages processed");
  check(document.book == "circles", "book from the file name");
  check(document.subject == "Mathematics", "default subject");
  check(document.chapters.size() == 1, "one chapter");
  const textbook::Chapter &chapter = document.chapters.front();
  check(chapter.chapterName == "CIRCLES", "chapter title from page 1");
  check(chapter.exercises.empty(), "no exercise outside a topic");

  check(chapter.topics.size() == 1, "one topic");
  if (chapter.topics.size() == 1) {
    const textbook::Topic &topic = chapter.topics.front();
    check(topic.topicName == "Angle Subtended by a Chord at a Point",
          "topic number stripped");

    check(!topic.sections.empty() && topic.sections[0].sectionName ==
                                         "Section 1",
          "body text in Section 1");
    if (!topic.sections.empty()) {
      const textbook::Section &section = topic.sections[0];
      check(section.content.find("Take a circle with centre O.") !=
                    std::string::npos &&
                section.content.find("Draw a chord PQ") != std::string::npos,
            "section content in reading order");

      // The outlined figure must be among the page 1 crops of the section
      bool figureFound = false;
      for (const auto &diagram : result.diagrams) {
        if (diagram.page != 1 ||
            std::abs(diagram.x - kFigureX) > 3.0 ||
            std::abs(diagram.y - kFigureY) > 3.0 ||
            std::abs(diagram.width - kFigureWidth) > 6.0 ||
            std::abs(diagram.height - kFigureHeight) > 6.0) {
          continue;
        }
        for (const auto &ref : section.imageUrls) {
          if (ref.img == diagram.imagePath) {
            figureFound = true;
          }
        }
      }
      check(figureFound, "figure attached to the section on its page");
    }

    check(topic.exercises.size() == 1, "one exercise");
    if (topic.exercises.size() == 1) {
      const textbook::Exercise &exercise = topic.exercises.front();
      check(exercise.exercise == "EXERCISE 9.1", "exercise heading verbatim");
      check(exercise.content ==
                "1. Recall that two circles are congruent.\n"
                "2. Prove that equal chords subtend equal angles.\n"
                "3. Find the length of the chord.",
            "exercise content joined by newlines");
    }
  }

  std::cout << std::endl << "Diagrams:" << std::endl;
  check(!result.diagrams.empty(), "at least the figure detected");
  check(countJpegs(imageDir) == result.diagrams.size(),
        "one file per diagram, stale crops removed");

  std::set<std::string> paths;
  bool withinPage = true;
  bool resolve = true;
  for (const auto &diagram : result.diagrams) {
    paths.insert(diagram.imagePath);
    if (diagram.x < 0 || diagram.y < 0 ||
        diagram.x + diagram.width > kPageWidth + 1e-6 ||
        diagram.y + diagram.height > kPageHeight + 1e-6) {
      withinPage = false;
    }
    std::string fileName =
        std::filesystem::path(diagram.imagePath).filename().string();
    if (diagram.imagePath != "/images/circles/" + fileName ||
        !std::filesystem::exists(imageDir / fileName)) {
      resolve = false;
    }
  }
  check(paths.size() == result.diagrams.size(), "image paths unique");
  check(withinPage, "every diagram lies within its page");
  check(resolve, "every image path names a written file");

  // Every reference in the tree points at a reported diagram
  bool refsKnown = true;
  auto checkRefs = [&](const std::vector<textbook::ImageRef> &refs) {
    for (const auto &ref : refs) {
      if (paths.count(ref.img) == 0) {
        refsKnown = false;
      }
    }
  };
  for (const auto &topic : chapter.topics) {
    checkRefs(topic.imageUrls);
    for (const auto &section : topic.sections) {
      checkRefs(section.imageUrls);
    }
    for (const auto &exercise : topic.exercises) {
      checkRefs(exercise.imageUrls);
    }
  }
  check(refsKnown, "image references resolve to diagrams");

  std::cout << std::endl << "Second run:" << std::endl;
  std::vector<std::string> firstBytes;
  for (const auto &diagram : result.diagrams) {
    firstBytes.push_back(readBytes(imageDir / cropFileName(diagram)));
  }

  textbook::ExtractionResult again = extractor.extract(pdfPath);
  check(again.success && again.diagrams.size() == result.diagrams.size(),
        "same number of diagrams");
  check(textbook::toResponseJson(again.document) ==
            textbook::toResponseJson(result.document),
        "identical tree");

  bool sameBytes = again.diagrams.size() == firstBytes.size();
  for (size_t i = 0; sameBytes && i < again.diagrams.size(); i++) {
    std::string bytes = readBytes(imageDir / cropFileName(again.diagrams[i]));
    sameBytes = !bytes.empty() && bytes == firstBytes[i];
  }
  check(sameBytes, "crops are byte-identical");

  std::cout << std::endl << "Failed run:" << std::endl;
  if (!again.diagrams.empty()) {
    // A directory where the last crop goes makes that write fail after the
    // other crops of the run were written
    std::filesystem::path blocked =
        imageDir / cropFileName(again.diagrams.back());
    std::filesystem::remove(blocked);
    std::filesystem::create_directory(blocked);

    textbook::ExtractionResult failed = extractor.extract(pdfPath);
    check(!failed.success && !failed.errorMessage.empty(),
          "unwritable crop fails the document");
    check(failed.diagrams.empty() && failed.document.chapters.empty(),
          "no partial result");
    check(countJpegs(imageDir) == 0,
          "crops written before the failure removed");
    std::cout << textbook::toResultJson(failed).dump(2) << std::endl;

    std::filesystem::remove(blocked);
  }

  std::filesystem::remove_all(workDir);

  std::cout << std::endl
            << (failures == 0 ? "All checks passed"
                              : std::to_string(failures) + " check(s) failed")
            << std::endl;
  return failures == 0 ? 0 : 1;
}

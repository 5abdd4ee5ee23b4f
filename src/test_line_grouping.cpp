#include "LineStream.hpp"

#include <iostream>
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

textbook::WordBox word(const std::string &text, double x, double y,
                       double width, double height = 12.0) {
  textbook::WordBox box;
  box.text = text;
  box.x = x;
  box.y = y;
  box.width = width;
  box.height = height;
  return box;
}

void printLines(const std::vector<std::string> &lines) {
  for (size_t i = 0; i < lines.size(); i++) {
    std::cout << "    " << i << ": \"" << lines[i] << "\"" << std::endl;
  }
}

} // anonymous namespace

int main() {
  std::cout << "=== Test line grouping ===" << std::endl << std::endl;

  std::cout << "trim:" << std::endl;
  check(textbook::trim("  9.1 Angle \t\n") == "9.1 Angle", "both ends");
  check(textbook::trim(" \t ").empty(), "whitespace only");
  check(textbook::trim("CIRCLES") == "CIRCLES", "nothing to trim");

  std::cout << std::endl << "Words out of order:" << std::endl;
  {
    // Line 1 (y=50): "CIRCLES"
    // Line 2 (y=80): "9.1 Angle Subtended"
    // Line 3 (y=110): "Take a circle."
    std::vector<textbook::WordBox> words = {
        word("Subtended", 140, 81, 60), word("Take", 50, 110, 30),
        word("CIRCLES", 50, 50, 70, 16), word("9.1", 50, 80, 20),
        word("circle.", 110, 110, 40),   word("Angle", 80, 79, 40),
        word("a", 90, 111, 8)};

    auto lines = textbook::groupWordsIntoLines(words);
    printLines(lines);
    check(lines.size() == 3, "three lines");
    if (lines.size() == 3) {
      check(lines[0] == "CIRCLES", "title first");
      check(lines[1] == "9.1 Angle Subtended",
            "words on a slightly uneven baseline join one line");
      check(lines[2] == "Take a circle.", "words ordered left to right");
    }
  }

  std::cout << std::endl << "Blank words and empty pages:" << std::endl;
  {
    std::vector<textbook::WordBox> words = {word(" ", 10, 10, 5),
                                            word("", 20, 10, 5),
                                            word(" EXERCISE ", 10, 200, 60),
                                            word("9.1", 80, 200, 20)};
    auto lines = textbook::groupWordsIntoLines(words);
    printLines(lines);
    check(lines.size() == 1 && lines[0] == "EXERCISE 9.1",
          "blank words dropped, words trimmed");
    check(textbook::groupWordsIntoLines({}).empty(), "no words, no lines");
  }

  std::cout << std::endl << "Adjacent lines stay apart:" << std::endl;
  {
    std::vector<textbook::WordBox> words = {word("first", 10, 100, 30),
                                            word("second", 10, 114, 40)};
    auto lines = textbook::groupWordsIntoLines(words);
    printLines(lines);
    check(lines.size() == 2, "lines 14 units apart are separate");
  }

  std::cout << std::endl
            << (failures == 0 ? "All checks passed"
                              : std::to_string(failures) + " check(s) failed")
            << std::endl;
  return failures == 0 ? 0 : 1;
}

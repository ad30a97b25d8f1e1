#include <catch2/catch.hpp>
#include "reflow.hpp"
#include "text_width.hpp"
#include <sstream>
#include <string>
#include <vector>

using namespace marker;

// Split text on whitespace the way a reader would count words.
std::vector<std::string> words_of(const std::vector<std::string>& lines) {
    std::vector<std::string> words;
    for (const auto& line : lines) {
        std::istringstream in(line);
        std::string word;
        while (in >> word) {
            words.push_back(word);
        }
    }
    return words;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string joined;
    for (const auto& line : lines) {
        if (!joined.empty()) joined += '\n';
        joined += line;
    }
    return joined;
}

// ============================================================================
// Greedy line filling
// ============================================================================

TEST_CASE("Single letters fill up to the width", "[reflow]") {
    auto lines = reflow("a b c d e f g h i j", 10);
    REQUIRE(lines == std::vector<std::string>{"a b c d e", "f g h i j"});
}

TEST_CASE("Over-wide word keeps its own line", "[reflow]") {
    auto lines = reflow("abcdefghijhij a b c d e", 10);
    REQUIRE(lines == std::vector<std::string>{"abcdefghijhij", "a b c d e"});
}

TEST_CASE("Line that would reach the width is closed", "[reflow]") {
    auto lines = reflow("a b c defg i jk", 10);
    REQUIRE(lines == std::vector<std::string>{"a b c", "defg i jk"});
}

TEST_CASE("Leading whitespace does not shift the first word", "[reflow]") {
    auto lines = reflow("   a b c defg i jk", 10);
    REQUIRE(lines == std::vector<std::string>{"a b c", "defg i jk"});
}

TEST_CASE("Embedded line breaks collapse to word spacing", "[reflow]") {
    auto lines = reflow("one\ntwo\r\n  three\tfour", 80);
    REQUIRE(lines == std::vector<std::string>{"one two three four"});
}

TEST_CASE("Width counts code points, not bytes", "[reflow]") {
    // "héé" is 3 columns wide but 5 bytes.
    auto lines = reflow("héé héé", 8);
    REQUIRE(lines == std::vector<std::string>{"héé héé"});
}

// ============================================================================
// Edge cases
// ============================================================================

TEST_CASE("Empty input gives no lines", "[reflow]") {
    REQUIRE(reflow("", 10).empty());
}

TEST_CASE("Whitespace-only input gives no lines", "[reflow]") {
    REQUIRE(reflow("  \t \n  ", 10).empty());
}

TEST_CASE("Input without whitespace is one line", "[reflow]") {
    auto lines = reflow("supercalifragilistic", 5);
    REQUIRE(lines == std::vector<std::string>{"supercalifragilistic"});
}

TEST_CASE("Width of one puts every word on its own line", "[reflow]") {
    auto lines = reflow("a bb c", 1);
    REQUIRE(lines == std::vector<std::string>{"a", "bb", "c"});
}

// ============================================================================
// Properties
// ============================================================================

TEST_CASE("Lines never exceed the width unless a single word does", "[reflow][property]") {
    const std::vector<std::string> inputs = {
        "The quick brown fox jumps over the lazy dog",
        "Lorem ipsum dolor sit amet, consectetur adipiscing elit, sed do eiusmod tempor",
        "a bb ccc dddd eeeee ffffff ggggggg hhhhhhhh iiiiiiiii jjjjjjjjjj kkkkkkkkkkk",
        "x",
        "  spaced    out     words   ",
    };

    for (const auto& input : inputs) {
        for (size_t width = 1; width <= 40; width++) {
            for (const auto& line : reflow(input, width)) {
                INFO("input: " << input << ", width: " << width << ", line: " << line);
                bool single_word = line.find(' ') == std::string::npos;
                REQUIRE((text_width(line) <= width || single_word));
                REQUIRE(!line.empty());
                REQUIRE(line.front() != ' ');
                REQUIRE(line.back() != ' ');
            }
        }
    }
}

TEST_CASE("Words survive reflow in order", "[reflow][property]") {
    const std::string input = "Pack my box with five dozen liquor jugs, then\nrest a while.";
    std::vector<std::string> expected = words_of({input});

    for (size_t width = 1; width <= 30; width++) {
        INFO("width: " << width);
        REQUIRE(words_of(reflow(input, width)) == expected);
    }
}

TEST_CASE("Reflowing reflowed text gives the same lines", "[reflow][property]") {
    const std::string input =
        "Sphinx of black quartz, judge my vow. How vexingly quick daft zebras jump!";

    for (size_t width = 1; width <= 30; width++) {
        auto first = reflow(input, width);
        INFO("width: " << width);
        REQUIRE(reflow(join_lines(first), width) == first);
    }
}

// ============================================================================
// Hard line breaks
// ============================================================================

TEST_CASE("Hard breaks collapse into word spacing by default", "[reflow][hard-break]") {
    std::vector<SourceLine> lines = {
        {"first line  ", true},
        {"second line\\", true},
        {"third", false},
    };
    auto result = reflow_block(lines, 80, HardBreakPolicy::Collapse);
    REQUIRE(result == std::vector<std::string>{"first line second line third"});
}

TEST_CASE("Preserved hard breaks end the reflowed line", "[reflow][hard-break]") {
    std::vector<SourceLine> lines = {
        {"first line  ", true},
        {"second line", false},
        {"third", false},
    };
    auto result = reflow_block(lines, 80, HardBreakPolicy::Preserve);
    REQUIRE(result == std::vector<std::string>{"first line\\", "second line third"});
}

TEST_CASE("Preserved hard break after a wrapped run", "[reflow][hard-break]") {
    std::vector<SourceLine> lines = {
        {"a b c d e f g h i j\\", true},
        {"k", false},
    };
    auto result = reflow_block(lines, 10, HardBreakPolicy::Preserve);
    REQUIRE(result == std::vector<std::string>{"a b c d e", "f g h i j\\", "k"});
}

TEST_CASE("A break marker on the last line is kept as text", "[reflow][hard-break]") {
    std::vector<SourceLine> lines = {{"ends with\\", true}};
    REQUIRE(reflow_block(lines, 80, HardBreakPolicy::Preserve) ==
            std::vector<std::string>{"ends with\\"});
    REQUIRE(reflow_block(lines, 80, HardBreakPolicy::Collapse) ==
            std::vector<std::string>{"ends with\\"});
}

TEST_CASE("Text width counts UTF-8 code points", "[reflow][width]") {
    REQUIRE(text_width("") == 0);
    REQUIRE(text_width("abc") == 3);
    REQUIRE(text_width("é") == 1);
    REQUIRE(text_width("日本") == 2);
    REQUIRE(text_width("🙂") == 1);
}

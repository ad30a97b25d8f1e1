#pragma once

/**
 * Line reflow (word wrap) for prose blocks.
 *
 * Text is treated as a sequence of whitespace-delimited words. Lines are
 * filled greedily: a word joins the current line only while the line stays
 * shorter than the width. A word longer than the width is never split and
 * occupies a line of its own.
 *
 * Usage:
 *   reflow("a b c d e f g h i j", 10);  // {"a b c d e", "f g h i j"}
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace marker {

/**
 * How hard line breaks inside a paragraph are treated.
 */
enum class HardBreakPolicy {
    Collapse,  // Fold the break into word spacing like a soft break.
    Preserve   // End the line at the break and mark it with a backslash.
};

/**
 * One raw source line of a prose block.
 */
struct SourceLine {
    std::string_view text;
    bool hard_break = false;
};

/**
 * Reflow text to lines narrower than max_width.
 * Embedded newlines are treated as spaces. Empty or whitespace-only input
 * yields no lines.
 */
std::vector<std::string> reflow(std::string_view text, size_t max_width);

/**
 * Reflow the raw lines of a paragraph, applying the hard break policy.
 * The backslash or trailing-space marker of a hard break is removed before
 * reflow; under Preserve the affected line is re-terminated with "\".
 */
std::vector<std::string> reflow_block(const std::vector<SourceLine>& lines,
                                      size_t max_width,
                                      HardBreakPolicy policy);

} // namespace marker

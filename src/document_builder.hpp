#pragma once

/**
 * Builds the renderer's parse tree from Markdown source using cmark.
 *
 * cmark parses CommonMark; pipe tables, which core cmark leaves as
 * paragraphs, are recognised here and turned into Table nodes. Link
 * reference definitions, which cmark consumes, are kept as verbatim blocks
 * so they survive formatting.
 *
 * The returned tree's segments point into source, which must outlive it.
 */

#include "node.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace marker {

/**
 * Parse source into a Document node.
 * Throws std::runtime_error if cmark fails to produce a document.
 */
std::unique_ptr<Node> parse_document(std::string_view source);

namespace syntax {

/**
 * Check if a line is a table row: contains an unescaped '|'.
 */
bool is_table_row(std::string_view line);

/**
 * Check if a line is a table delimiter row (| --- | :---: |).
 */
bool is_table_separator(std::string_view line);

/**
 * Split a table row into trimmed cell segments. Leading and trailing pipes
 * are optional; "\|" does not split.
 */
std::vector<Segment> split_table_cells(Segment row, std::string_view source);

/**
 * Check if text is exactly one link reference definition,
 * e.g. [label]: https://example.com "Title". The destination and the
 * title may each start on a new line.
 */
bool is_link_reference_definition(std::string_view text);

/**
 * Number of lines, starting at lines[first], that form the longest link
 * reference definition there (at most 3), or 0 if none starts there.
 */
size_t link_reference_definition_lines(const std::vector<std::string_view>& lines, size_t first);

/**
 * Content of an ATX heading line: the opening '#' run and the optional
 * closing sequence removed. Lines that are not ATX headings are returned
 * unchanged.
 */
Segment atx_heading_content(Segment line, std::string_view source);

/**
 * Check if a raw line ends in a hard line break (two or more trailing
 * spaces, or a trailing backslash).
 */
bool ends_with_hard_break(std::string_view line);

} // namespace syntax

} // namespace marker

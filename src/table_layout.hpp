#pragma once

/**
 * Column width computation for pipe tables.
 *
 * The layout is computed once when a table is entered and handed down to
 * its rows and cells while they render.
 */

#include <cstddef>
#include <string_view>
#include <vector>

namespace marker {

class Node;

/**
 * Per-column widths of one table.
 */
struct TableLayout {
    std::vector<size_t> column_widths;

    size_t column_count() const { return column_widths.size(); }

    // Width of a column. Throws InvariantViolation for a column the layout
    // does not know about.
    size_t width(size_t column) const;
};

/**
 * Maximum content width per column.
 * rows[r][c] is the content width of cell c in row r. The column count is
 * taken from the first row; a later row with a different cell count throws
 * InvariantViolation.
 */
std::vector<size_t> compute_column_widths(const std::vector<std::vector<size_t>>& rows);

/**
 * Width of a cell's content: the summed width of its raw source segments.
 */
size_t cell_content_width(const Node& cell, std::string_view source);

/**
 * Layout of a Table node, measured from the raw content of every cell of
 * its header and rows.
 */
TableLayout layout_table(const Node& table, std::string_view source);

} // namespace marker

#include "table_layout.hpp"
#include "errors.hpp"
#include "node.hpp"
#include "text_width.hpp"

#include <algorithm>

namespace marker {

size_t TableLayout::width(size_t column) const {
    if (column >= column_widths.size()) {
        throw InvariantViolation("no width computed for table column " +
                                 std::to_string(column) + " (table has " +
                                 std::to_string(column_widths.size()) + " columns)");
    }
    return column_widths[column];
}

std::vector<size_t> compute_column_widths(const std::vector<std::vector<size_t>>& rows) {
    if (rows.empty()) {
        return {};
    }

    std::vector<size_t> widths(rows.front().size(), 0);
    for (size_t r = 0; r < rows.size(); r++) {
        if (rows[r].size() != widths.size()) {
            throw InvariantViolation("table row " + std::to_string(r) + " has " +
                                     std::to_string(rows[r].size()) + " cells, header has " +
                                     std::to_string(widths.size()));
        }
        for (size_t c = 0; c < widths.size(); c++) {
            widths[c] = std::max(widths[c], rows[r][c]);
        }
    }
    return widths;
}

size_t cell_content_width(const Node& cell, std::string_view source) {
    size_t width = 0;
    for (const Segment& segment : cell.lines()) {
        width += text_width(segment.value(source));
    }
    return width;
}

TableLayout layout_table(const Node& table, std::string_view source) {
    if (table.kind() != NodeKind::Table) {
        throw InvariantViolation(std::string("layout_table called on ") + kind_name(table.kind()));
    }

    std::vector<std::vector<size_t>> rows;
    for (const Node* row = table.first_child(); row; row = row->next_sibling()) {
        std::vector<size_t> cells;
        for (const Node* cell = row->first_child(); cell; cell = cell->next_sibling()) {
            cells.push_back(cell_content_width(*cell, source));
        }
        rows.push_back(std::move(cells));
    }

    TableLayout layout;
    layout.column_widths = compute_column_widths(rows);
    return layout;
}

} // namespace marker

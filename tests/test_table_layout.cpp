#include <catch2/catch.hpp>
#include "table_layout.hpp"
#include "errors.hpp"
#include "node.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace marker;

// Builds a Table whose first row is the header. Cell text is appended to
// source and referenced by segment.
std::unique_ptr<Node> build_table(std::string& source,
                                  const std::vector<std::vector<std::string>>& rows) {
    auto table = std::make_unique<Node>(NodeKind::Table);
    for (size_t r = 0; r < rows.size(); r++) {
        Node* row = table->append_child(std::make_unique<Node>(
            r == 0 ? NodeKind::TableHeader : NodeKind::TableRow));
        for (const auto& text : rows[r]) {
            Node* cell = row->append_child(std::make_unique<Node>(NodeKind::TableCell));
            size_t start = source.size();
            source += text;
            cell->add_line({start, source.size(), false});
        }
    }
    return table;
}

// ============================================================================
// Column widths
// ============================================================================

TEST_CASE("Column width is the widest cell in the column", "[table]") {
    auto widths = compute_column_widths({{4, 3}, {10, 1}});
    REQUIRE(widths == std::vector<size_t>{10, 3});
}

TEST_CASE("No rows means no columns", "[table]") {
    REQUIRE(compute_column_widths({}).empty());
}

TEST_CASE("Row with a different cell count is rejected", "[table]") {
    REQUIRE_THROWS_AS(compute_column_widths({{4, 3}, {10}}), InvariantViolation);
    REQUIRE_THROWS_AS(compute_column_widths({{4, 3}, {1, 2, 3}}), InvariantViolation);
}

TEST_CASE("Layout of a Name/Age table", "[table]") {
    std::string source;
    auto table = build_table(source, {{"Name", "Age"}, {"Alexandria", "9"}});

    TableLayout layout = layout_table(*table, source);
    REQUIRE(layout.column_widths == std::vector<size_t>{10, 3});
    REQUIRE(layout.column_count() == 2);
    REQUIRE(layout.width(0) == 10);
    REQUIRE_THROWS_AS(layout.width(2), InvariantViolation);
}

TEST_CASE("Cell width counts code points", "[table]") {
    std::string source;
    auto table = build_table(source, {{"Città"}, {"Roma"}});
    REQUIRE(layout_table(*table, source).column_widths == std::vector<size_t>{5});
}

TEST_CASE("Width of an unknown column is an invariant violation", "[table]") {
    TableLayout layout;
    layout.column_widths = {3, 4};
    REQUIRE(layout.width(1) == 4);
    REQUIRE_THROWS_AS(layout.width(2), InvariantViolation);
}

TEST_CASE("Only Table nodes can be laid out", "[table]") {
    Node paragraph(NodeKind::Paragraph);
    REQUIRE_THROWS_AS(layout_table(paragraph, ""), InvariantViolation);
}

TEST_CASE("Empty cells have zero width", "[table]") {
    std::string source;
    auto table = build_table(source, {{"", "b"}, {"", ""}});
    REQUIRE(layout_table(*table, source).column_widths == std::vector<size_t>{0, 1});
}

#pragma once

#include "code_formatter.hpp"
#include "node.hpp"
#include "reflow.hpp"
#include "table_layout.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace marker {

/**
 * Prefix/suffix pair wrapped around the content of a node kind.
 */
struct Decorator {
    std::string prefix;
    std::string suffix;
};

using Decorators = std::map<NodeKind, Decorator>;

// Emphasis -> "**"/"**", CodeSpan -> "`"/"`", Blockquote -> "> "/"".
Decorators default_decorators();

/**
 * How ordered list items are numbered.
 */
enum class ListNumbering {
    Increment,  // start, start+1, start+2, ...
    Repeat      // Every item repeats the list's start number.
};

/**
 * Renderer configuration. Fixed once the renderer is constructed.
 */
struct RendererConfig {
    int max_width = 80;
    std::vector<FormatterRegistration> formatters;  // Later entries win.
    Decorators decorators = default_decorators();
    ListNumbering list_numbering = ListNumbering::Increment;
    HardBreakPolicy hard_breaks = HardBreakPolicy::Collapse;
};

/**
 * Markdown pretty-printer.
 *
 * Walks a parse tree depth first and writes a canonical Markdown rendering of
 * it: prose is reflowed to max_width, tables are re-aligned, fenced code is
 * passed through a registered code formatter when its language has one, and
 * everything else is normalised to one fixed style.
 *
 * Output goes to a callback in traversal order and is never rewritten. A
 * FormatError from a code formatter aborts the render with the output
 * written so far left in place.
 *
 * Usage:
 *   MarkdownRenderer renderer(config);
 *   renderer.render(*document, source, [](const std::string& s) { std::cout << s; });
 */
class MarkdownRenderer {
public:
    using OutputCallback = std::function<void(const std::string&)>;

    /**
     * Create a renderer. Throws std::invalid_argument if max_width is not
     * positive.
     */
    explicit MarkdownRenderer(RendererConfig config = {});

    /**
     * Render document (whose segments point into source) to output.
     * Throws FormatError when a code formatter fails and InvariantViolation
     * when the tree breaks a renderer precondition.
     */
    void render(Node& document, std::string_view source, OutputCallback output);

    /**
     * Render document and return the output as a string.
     */
    std::string render_to_string(Node& document, std::string_view source);

    /**
     * Per-node callback. render() drives it through walk(); it may also be
     * driven by another walker between begin() and end().
     */
    WalkStatus visit(Node& node, bool entering);

    // Start a render: binds the source buffer and output for visit().
    void begin(std::string_view source, OutputCallback output);

    // Finish a render and drop all per-render state.
    void end();

private:
    const int max_width_;
    const CodeFormatterRegistry formatters_;
    const Decorators decorators_;
    const ListNumbering list_numbering_;
    const HardBreakPolicy hard_breaks_;

    // ========== Per-render state ==========

    std::string_view source_;
    OutputCallback output_;
    bool at_line_start_ = true;
    std::vector<std::string> prefixes_;       // Continuation prefix per open container.
    std::optional<TableLayout> table_;        // Layout of the table being rendered.
    size_t table_column_ = 0;                 // Next cell's column within the current row.
    std::string fence_;                       // Fence of the open fenced code block.

    // ========== Output ==========

    void write(const std::string& text);
    std::string current_prefix() const;
    void begin_line();
    void blank_line();
    void write_block_lines(const std::string& content, const std::string& indent);

    const Decorator& decorator(NodeKind kind) const;

    // ========== Per-kind rendering ==========

    WalkStatus render_prose(Node& node, bool entering);
    WalkStatus render_heading(Node& node, bool entering);
    WalkStatus render_blockquote(Node& node, bool entering);
    WalkStatus render_code_block(Node& node, bool entering);
    WalkStatus render_fenced_code_block(Node& node, bool entering);
    WalkStatus render_html_block(Node& node, bool entering);
    WalkStatus render_list(Node& node, bool entering);
    WalkStatus render_list_item(Node& node, bool entering);
    WalkStatus render_thematic_break(Node& node, bool entering);
    WalkStatus render_table(Node& node, bool entering);
    WalkStatus render_table_row(Node& node, bool entering);
    WalkStatus render_table_cell(Node& node, bool entering);
    WalkStatus render_auto_link(Node& node, bool entering);
    WalkStatus render_code_span(Node& node, bool entering);
    WalkStatus render_emphasis(Node& node, bool entering);
    WalkStatus render_link(Node& node, bool entering);
    WalkStatus render_raw_html(Node& node, bool entering);
    WalkStatus render_text(Node& node, bool entering);

    const TableLayout& current_table(const Node& node) const;
    std::string inline_text(const Node& node) const;
    std::string code_span(const Node& node) const;
};

} // namespace marker

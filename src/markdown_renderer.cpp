#include "markdown_renderer.hpp"
#include "errors.hpp"
#include "text_width.hpp"
#include "verbose.hpp"

#include <algorithm>
#include <stdexcept>

namespace marker {

namespace {
    constexpr size_t CODE_FENCE_LENGTH = 3;
    constexpr const char* THEMATIC_BREAK = "---";
    constexpr const char* CODE_BLOCK_INDENT = "    ";

    // Fold a Text node's line break into a space so inline spans stay on one line.
    std::string text_value(const Node& node) {
        const TextData& text = node.text();
        std::string value = text.value;
        if (!value.empty() && value.back() == '\n') {
            value.pop_back();
            value += ' ';
        } else if (text.soft_break || text.hard_break) {
            value += ' ';
        }
        return value;
    }

    size_t longest_backtick_run(const std::string& text) {
        size_t longest = 0;
        size_t run = 0;
        for (char c : text) {
            run = (c == '`') ? run + 1 : 0;
            longest = std::max(longest, run);
        }
        return longest;
    }

    // Longest backtick run opening a line of code (after up to three spaces).
    size_t longest_leading_backtick_run(const std::string& code) {
        size_t longest = 0;
        size_t pos = 0;
        while (pos < code.length()) {
            size_t i = pos;
            while (i < code.length() && i - pos < 3 && code[i] == ' ') i++;
            size_t run = 0;
            while (i + run < code.length() && code[i + run] == '`') run++;
            longest = std::max(longest, run);
            size_t nl = code.find('\n', pos);
            pos = nl == std::string::npos ? code.length() : nl + 1;
        }
        return longest;
    }

    std::string link_destination(const std::string& destination) {
        if (destination.find_first_of(" \t<>") != std::string::npos) {
            std::string escaped;
            for (char c : destination) {
                if (c == '<' || c == '>') escaped += '\\';
                escaped += c;
            }
            return "<" + escaped + ">";
        }
        return destination;
    }

    // Closing part of an inline link or image: "](destination "title")".
    std::string link_tail(const LinkData& link) {
        std::string tail = "](" + link_destination(link.destination);
        if (!link.title.empty()) {
            tail += " \"";
            for (char c : link.title) {
                if (c == '"') tail += '\\';
                tail += c;
            }
            tail += '"';
        }
        tail += ')';
        return tail;
    }

    std::string rtrim(const std::string& text) {
        size_t end = text.find_last_not_of(' ');
        return end == std::string::npos ? std::string() : text.substr(0, end + 1);
    }

    struct CodeSpanParts {
        std::string prefix;
        std::string content;
        std::string suffix;
    };

    CodeSpanParts code_span_parts(const Node& node, const Decorator& d) {
        CodeSpanParts parts{d.prefix, "", d.suffix};
        for (const Node* child = node.first_child(); child; child = child->next_sibling()) {
            parts.content += text_value(*child);
        }

        // Content holding backticks needs a longer fence than any run inside it.
        const std::string& content = parts.content;
        if (d.prefix == "`" && d.suffix == "`" && !content.empty()) {
            size_t run = longest_backtick_run(content);
            if (run > 0) {
                parts.prefix = parts.suffix = std::string(run + 1, '`');
            }
            bool all_spaces = content.find_first_not_of(' ') == std::string::npos;
            bool edge_backtick = content.front() == '`' || content.back() == '`';
            bool edge_spaces = content.front() == ' ' && content.back() == ' ' && !all_spaces;
            if (edge_backtick || edge_spaces) {
                parts.content = " " + content + " ";
            }
        }
        return parts;
    }
}

Decorators default_decorators() {
    return {
        {NodeKind::Emphasis, {"**", "**"}},
        {NodeKind::CodeSpan, {"`", "`"}},
        {NodeKind::Blockquote, {"> ", ""}},
    };
}

MarkdownRenderer::MarkdownRenderer(RendererConfig config)
    : max_width_(config.max_width)
    , formatters_(config.formatters)
    , decorators_(std::move(config.decorators))
    , list_numbering_(config.list_numbering)
    , hard_breaks_(config.hard_breaks)
{
    if (max_width_ <= 0) {
        throw std::invalid_argument("max width must be positive, got " + std::to_string(max_width_));
    }
}

void MarkdownRenderer::begin(std::string_view source, OutputCallback output) {
    source_ = source;
    output_ = std::move(output);
    at_line_start_ = true;
    prefixes_.clear();
    table_.reset();
    table_column_ = 0;
    fence_.clear();
}

void MarkdownRenderer::end() {
    source_ = {};
    output_ = nullptr;
    prefixes_.clear();
    table_.reset();
}

void MarkdownRenderer::render(Node& document, std::string_view source, OutputCallback output) {
    begin(source, std::move(output));
    try {
        walk(document, [this](Node& node, bool entering) {
            return visit(node, entering);
        });
    } catch (...) {
        end();
        throw;
    }
    end();
}

std::string MarkdownRenderer::render_to_string(Node& document, std::string_view source) {
    std::string result;
    render(document, source, [&result](const std::string& text) { result += text; });
    return result;
}

WalkStatus MarkdownRenderer::visit(Node& node, bool entering) {
    if (!output_) {
        throw InvariantViolation("visit called outside of a render");
    }

    switch (node.kind()) {
        case NodeKind::Document:
            return WalkStatus::Continue;
        case NodeKind::Paragraph:
        case NodeKind::TextBlock:
            return render_prose(node, entering);
        case NodeKind::Heading:
            return render_heading(node, entering);
        case NodeKind::Blockquote:
            return render_blockquote(node, entering);
        case NodeKind::CodeBlock:
            return render_code_block(node, entering);
        case NodeKind::FencedCodeBlock:
            return render_fenced_code_block(node, entering);
        case NodeKind::HTMLBlock:
            return render_html_block(node, entering);
        case NodeKind::List:
            return render_list(node, entering);
        case NodeKind::ListItem:
            return render_list_item(node, entering);
        case NodeKind::ThematicBreak:
            return render_thematic_break(node, entering);
        case NodeKind::Table:
            return render_table(node, entering);
        case NodeKind::TableHeader:
        case NodeKind::TableRow:
            return render_table_row(node, entering);
        case NodeKind::TableCell:
            return render_table_cell(node, entering);
        case NodeKind::AutoLink:
            return render_auto_link(node, entering);
        case NodeKind::CodeSpan:
            return render_code_span(node, entering);
        case NodeKind::Emphasis:
            return render_emphasis(node, entering);
        case NodeKind::Image:
        case NodeKind::Link:
            return render_link(node, entering);
        case NodeKind::RawHTML:
            return render_raw_html(node, entering);
        case NodeKind::Text:
        case NodeKind::String:
            return render_text(node, entering);
    }
    throw InvariantViolation("unhandled node kind " + std::to_string(static_cast<int>(node.kind())));
}

// ========== Output ==========

void MarkdownRenderer::write(const std::string& text) {
    if (text.empty()) {
        return;
    }
    output_(text);
    at_line_start_ = text.back() == '\n';
}

std::string MarkdownRenderer::current_prefix() const {
    std::string prefix;
    for (const auto& p : prefixes_) {
        prefix += p;
    }
    return prefix;
}

void MarkdownRenderer::begin_line() {
    if (at_line_start_) {
        write(current_prefix());
    }
}

void MarkdownRenderer::blank_line() {
    if (!at_line_start_) {
        write("\n");
    }
    write(rtrim(current_prefix()) + "\n");
}

void MarkdownRenderer::write_block_lines(const std::string& content, const std::string& indent) {
    size_t pos = 0;
    while (pos < content.length()) {
        size_t nl = content.find('\n', pos);
        size_t stop = (nl == std::string::npos) ? content.length() : nl;
        std::string line = content.substr(pos, stop - pos);
        if (line.empty()) {
            write(rtrim(current_prefix()) + "\n");
        } else {
            begin_line();
            write(indent + line + "\n");
        }
        pos = stop + 1;
    }
}

const Decorator& MarkdownRenderer::decorator(NodeKind kind) const {
    static const Decorator none;
    auto it = decorators_.find(kind);
    return it == decorators_.end() ? none : it->second;
}

// ========== Blocks ==========

WalkStatus MarkdownRenderer::render_prose(Node& node, bool entering) {
    if (entering) {
        std::vector<SourceLine> lines;
        for (const Segment& segment : node.lines()) {
            lines.push_back({segment.value(source_), segment.hard_break});
        }

        // Nested prose wraps inside its container's prefix.
        size_t prefix_width = text_width(current_prefix());
        size_t width = static_cast<size_t>(max_width_);
        width = prefix_width < width ? width - prefix_width : 1;

        for (const auto& line : reflow_block(lines, width, hard_breaks_)) {
            begin_line();
            write(line + "\n");
        }
    } else {
        // Only top-level blocks are followed by a blank line; containers
        // terminate their own content.
        if (node.parent() && node.parent()->kind() == NodeKind::Document) {
            write("\n");
        }
    }
    return WalkStatus::SkipChildren;
}

WalkStatus MarkdownRenderer::render_heading(Node& node, bool entering) {
    if (!entering) {
        blank_line();
        return WalkStatus::Continue;
    }

    begin_line();
    write(std::string(static_cast<size_t>(node.heading().level), '#') + " ");
    if (node.lines().empty()) {
        return WalkStatus::Continue;
    }

    // Headings keep their source text; a setext heading's lines are joined.
    std::string text;
    for (const Segment& segment : node.lines()) {
        std::string line = std::string(segment.value(source_));
        if (segment.hard_break && !line.empty() && line.back() == '\\') {
            line.pop_back();
        }
        size_t start = line.find_first_not_of(" \t");
        size_t stop = line.find_last_not_of(" \t");
        if (start == std::string::npos) {
            continue;
        }
        if (!text.empty()) text += ' ';
        text += line.substr(start, stop - start + 1);
    }
    write(text);
    return WalkStatus::SkipChildren;
}

WalkStatus MarkdownRenderer::render_blockquote(Node& node, bool entering) {
    const Decorator& d = decorator(node.kind());
    if (entering) {
        begin_line();
        write(d.prefix);
        prefixes_.push_back(d.prefix);
    } else {
        prefixes_.pop_back();
        if (!d.suffix.empty()) {
            begin_line();
            write(d.suffix);
        }
        blank_line();
    }
    return WalkStatus::Continue;
}

WalkStatus MarkdownRenderer::render_code_block(Node& node, bool entering) {
    if (entering) {
        write_block_lines(node.literal().literal, CODE_BLOCK_INDENT);
    } else if (node.parent() && node.parent()->kind() == NodeKind::Document) {
        write("\n");
    }
    return WalkStatus::SkipChildren;
}

WalkStatus MarkdownRenderer::render_fenced_code_block(Node& node, bool entering) {
    const FencedCodeData& fenced = node.fenced_code();
    if (!entering) {
        begin_line();
        write(fence_ + "\n");
        fence_.clear();
        return WalkStatus::Continue;
    }

    // The fence must be longer than any backtick fence inside the code.
    fence_ = std::string(std::max(CODE_FENCE_LENGTH, longest_leading_backtick_run(fenced.code) + 1), '`');
    begin_line();
    write(fence_ + fenced.language + "\n");

    std::string code = fenced.code;
    if (CodeFormatter* formatter = formatters_.lookup(fenced.language)) {
        verbose_log("render", "formatting fenced code block tagged '" + fenced.language + "'");
        code = formatter->format(code);
        if (!code.empty() && code.back() != '\n') {
            code += '\n';
        }
    }

    if (prefixes_.empty()) {
        write(code);
    } else {
        write_block_lines(code, "");
    }
    return WalkStatus::Continue;
}

WalkStatus MarkdownRenderer::render_html_block(Node& node, bool entering) {
    if (entering) {
        write_block_lines(node.literal().literal, "");
    } else if (node.parent() && node.parent()->kind() == NodeKind::Document) {
        // An HTML block only ends at a blank line.
        write("\n");
    }
    return WalkStatus::SkipChildren;
}

WalkStatus MarkdownRenderer::render_list(Node& node, bool entering) {
    if (entering) {
        return WalkStatus::Continue;
    }

    // Separate the list from what follows, except when another list follows
    // directly: the parser splits lists at a change of marker or nesting and
    // those pieces stay visually grouped.
    Node* next = node.next_sibling();
    if (next && next->kind() != NodeKind::List) {
        blank_line();
    }
    return WalkStatus::Continue;
}

WalkStatus MarkdownRenderer::render_list_item(Node& node, bool entering) {
    if (!entering) {
        prefixes_.pop_back();
        if (!at_line_start_) {
            write("\n");
        }
        return WalkStatus::Continue;
    }

    Node* parent = node.parent();
    if (!parent || parent->kind() != NodeKind::List) {
        throw InvariantViolation("ListItem outside of a List");
    }
    const ListData& list = parent->list();

    std::string marker;
    if (list.ordered) {
        int number = list.start;
        if (list_numbering_ == ListNumbering::Increment) {
            for (Node* sibling = node.previous_sibling(); sibling; sibling = sibling->previous_sibling()) {
                number++;
            }
        }
        marker = std::to_string(number) + list.marker + " ";
    } else {
        marker = std::string(1, list.marker) + " ";
    }

    // Leading indentation comes from the enclosing items' prefixes.
    begin_line();
    write(marker);
    prefixes_.push_back(std::string(marker.size(), ' '));
    return WalkStatus::Continue;
}

WalkStatus MarkdownRenderer::render_thematic_break(Node&, bool entering) {
    if (entering) {
        begin_line();
        write(THEMATIC_BREAK);
    } else {
        write("\n");
    }
    return WalkStatus::Continue;
}

// ========== Tables ==========

const TableLayout& MarkdownRenderer::current_table(const Node& node) const {
    if (!table_) {
        throw InvariantViolation(std::string(kind_name(node.kind())) +
                                 " rendered without a computed table layout");
    }
    return *table_;
}

WalkStatus MarkdownRenderer::render_table(Node& node, bool entering) {
    if (entering) {
        table_ = layout_table(node, source_);
        if (is_verbose()) {
            std::string widths;
            for (size_t w : table_->column_widths) {
                if (!widths.empty()) widths += ", ";
                widths += std::to_string(w);
            }
            verbose_log("render", "table column widths: " + widths);
        }
    } else {
        table_.reset();
        blank_line();
    }
    return WalkStatus::Continue;
}

WalkStatus MarkdownRenderer::render_table_row(Node& node, bool entering) {
    const TableLayout& layout = current_table(node);
    if (entering) {
        table_column_ = 0;
        begin_line();
        return WalkStatus::Continue;
    }

    write("|\n");
    if (node.kind() == NodeKind::TableHeader) {
        std::string separator;
        for (size_t w : layout.column_widths) {
            separator += "|" + std::string(w + 2, '-');
        }
        begin_line();
        write(separator + "|\n");
    }
    return WalkStatus::Continue;
}

WalkStatus MarkdownRenderer::render_table_cell(Node& node, bool entering) {
    if (!entering) {
        return WalkStatus::Continue;
    }
    size_t width = current_table(node).width(table_column_);
    table_column_++;

    std::string content;
    for (const Segment& segment : node.lines()) {
        content.append(segment.value(source_));
    }
    size_t content_width = text_width(content);
    size_t padding = width > content_width ? width - content_width : 0;

    write("| " + content + std::string(padding, ' ') + " ");
    return WalkStatus::SkipChildren;
}

// ========== Inlines ==========

std::string MarkdownRenderer::code_span(const Node& node) const {
    CodeSpanParts parts = code_span_parts(node, decorator(NodeKind::CodeSpan));
    return parts.prefix + parts.content + parts.suffix;
}

std::string MarkdownRenderer::inline_text(const Node& node) const {
    std::string result;
    for (const Node* child = node.first_child(); child; child = child->next_sibling()) {
        switch (child->kind()) {
            case NodeKind::Text:
            case NodeKind::String:
                result += text_value(*child);
                break;
            case NodeKind::CodeSpan:
                result += code_span(*child);
                break;
            case NodeKind::Emphasis: {
                const Decorator& d = decorator(NodeKind::Emphasis);
                result += d.prefix + inline_text(*child) + d.suffix;
                break;
            }
            case NodeKind::Link:
                result += "[" + inline_text(*child) + link_tail(child->link());
                break;
            case NodeKind::Image:
                result += "![" + inline_text(*child) + link_tail(child->link());
                break;
            case NodeKind::AutoLink:
                result += "<" + child->link().destination + ">";
                break;
            case NodeKind::RawHTML:
                result += child->literal().literal;
                break;
            default:
                result += inline_text(*child);
                break;
        }
    }
    return result;
}

WalkStatus MarkdownRenderer::render_code_span(Node& node, bool entering) {
    CodeSpanParts parts = code_span_parts(node, decorator(node.kind()));
    if (entering) {
        begin_line();
        write(parts.prefix + parts.content);
        return WalkStatus::SkipChildren;
    }
    write(parts.suffix);
    return WalkStatus::Continue;
}

WalkStatus MarkdownRenderer::render_emphasis(Node& node, bool entering) {
    const Decorator& d = decorator(node.kind());
    if (entering) {
        begin_line();
        write(d.prefix + inline_text(node));
        return WalkStatus::SkipChildren;
    }
    write(d.suffix);
    return WalkStatus::Continue;
}

WalkStatus MarkdownRenderer::render_auto_link(Node& node, bool entering) {
    if (entering) {
        begin_line();
        write("<" + node.link().destination + ">");
    }
    return WalkStatus::SkipChildren;
}

WalkStatus MarkdownRenderer::render_link(Node& node, bool entering) {
    if (entering) {
        begin_line();
        write(node.kind() == NodeKind::Image ? "![" : "[");
    } else {
        write(link_tail(node.link()));
    }
    return WalkStatus::Continue;
}

WalkStatus MarkdownRenderer::render_raw_html(Node& node, bool entering) {
    if (entering) {
        begin_line();
        write(node.literal().literal);
    }
    return WalkStatus::SkipChildren;
}

WalkStatus MarkdownRenderer::render_text(Node& node, bool entering) {
    if (!entering) {
        return WalkStatus::Continue;
    }
    const TextData& text = node.text();
    if (!text.value.empty()) {
        begin_line();
        write(text.value);
    }
    if (node.kind() == NodeKind::Text && (text.hard_break || text.soft_break)) {
        write("\n");
    }
    return WalkStatus::Continue;
}

} // namespace marker

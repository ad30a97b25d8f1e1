#include "document_builder.hpp"
#include "verbose.hpp"

#include <cmark.h>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace marker {

namespace syntax {

namespace {
    bool is_blank(char c) {
        return c == ' ' || c == '\t';
    }

    std::string_view trim(std::string_view text) {
        size_t start = 0;
        while (start < text.length() && is_blank(text[start])) start++;
        size_t end = text.length();
        while (end > start && is_blank(text[end - 1])) end--;
        return text.substr(start, end - start);
    }

    // Split on unescaped pipes without trimming; outer pipes are dropped.
    std::vector<std::string_view> split_cells(std::string_view line) {
        std::vector<std::string_view> cells;
        line = trim(line);
        if (!line.empty() && line.front() == '|') {
            line.remove_prefix(1);
        }
        if (!line.empty() && line.back() == '|' &&
            !(line.length() >= 2 && line[line.length() - 2] == '\\')) {
            line.remove_suffix(1);
        }
        size_t cell_start = 0;
        for (size_t i = 0; i < line.length(); i++) {
            if (line[i] == '\\') {
                i++;
                continue;
            }
            if (line[i] == '|') {
                cells.push_back(line.substr(cell_start, i - cell_start));
                cell_start = i + 1;
            }
        }
        cells.push_back(line.substr(std::min(cell_start, line.length())));
        return cells;
    }

    bool is_delimiter_cell(std::string_view cell) {
        cell = trim(cell);
        if (cell.empty()) {
            return false;
        }
        if (cell.front() == ':') cell.remove_prefix(1);
        if (!cell.empty() && cell.back() == ':') cell.remove_suffix(1);
        return !cell.empty() && cell.find_first_not_of('-') == std::string_view::npos;
    }

    bool is_space(char c) {
        return is_blank(c) || c == '\n' || c == '\r';
    }

    std::string_view trim_space(std::string_view text) {
        size_t start = 0;
        while (start < text.length() && is_space(text[start])) start++;
        size_t end = text.length();
        while (end > start && is_space(text[end - 1])) end--;
        return text.substr(start, end - start);
    }

    // "[" after at most three spaces, not yet followed by a newline.
    bool is_definition_start(std::string_view line) {
        size_t i = 0;
        while (i < line.length() && i < 3 && line[i] == ' ') i++;
        return i < line.length() && line[i] == '[';
    }

    // Length of a link title starting at text[0] ("...", '...' or (...)), or 0.
    size_t title_length(std::string_view text) {
        if (text.empty()) {
            return 0;
        }
        char open = text[0];
        char close = open == '(' ? ')' : open;
        if (open != '"' && open != '\'' && open != '(') {
            return 0;
        }
        for (size_t i = 1; i < text.length(); i++) {
            if (text[i] == '\\') {
                i++;
            } else if (text[i] == close) {
                return i + 1;
            }
        }
        return 0;
    }
}

bool is_table_row(std::string_view line) {
    for (size_t i = 0; i < line.length(); i++) {
        if (line[i] == '\\') {
            i++;
        } else if (line[i] == '|') {
            return true;
        }
    }
    return false;
}

bool is_table_separator(std::string_view line) {
    if (line.find('|') == std::string_view::npos) {
        return false;
    }
    for (std::string_view cell : split_cells(line)) {
        if (!is_delimiter_cell(cell)) {
            return false;
        }
    }
    return true;
}

std::vector<Segment> split_table_cells(Segment row, std::string_view source) {
    std::string_view line = row.value(source);
    std::vector<Segment> cells;
    for (std::string_view cell : split_cells(line)) {
        std::string_view content = trim(cell);
        size_t start = row.start + static_cast<size_t>(content.data() - line.data());
        cells.push_back({start, start + content.length(), false});
    }
    return cells;
}

bool is_link_reference_definition(std::string_view text) {
    size_t i = 0;
    while (i < text.length() && i < 3 && text[i] == ' ') i++;
    if (i >= text.length() || text[i] != '[') {
        return false;
    }

    // Label: non-blank, no unescaped brackets.
    size_t label_start = ++i;
    while (i < text.length() && text[i] != ']') {
        if (text[i] == '[') return false;
        if (text[i] == '\\') i++;
        i++;
    }
    if (i >= text.length() || trim_space(text.substr(label_start, i - label_start)).empty()) {
        return false;
    }
    i++;
    if (i >= text.length() || text[i] != ':') {
        return false;
    }
    i++;
    while (i < text.length() && is_space(text[i])) i++;

    // Destination: <...> or a run of non-space characters.
    if (i >= text.length()) {
        return false;
    }
    if (text[i] == '<') {
        size_t close = text.find('>', i);
        if (close == std::string_view::npos || text.substr(i, close - i).find('\n') != std::string_view::npos) {
            return false;
        }
        i = close + 1;
    } else {
        while (i < text.length() && !is_space(text[i])) i++;
    }

    std::string_view rest = text.substr(i);
    if (trim_space(rest).empty()) {
        return true;
    }
    if (!is_space(rest[0])) {
        return false;
    }
    rest = trim_space(rest);
    size_t title = title_length(rest);
    return title > 0 && trim_space(rest.substr(title)).empty();
}

size_t link_reference_definition_lines(const std::vector<std::string_view>& lines, size_t first) {
    if (first >= lines.size() || !is_definition_start(lines[first])) {
        return 0;
    }
    // Label, destination and title may each start a new line.
    size_t longest = 0;
    std::string text;
    for (size_t count = 1; count <= 3 && first + count <= lines.size(); count++) {
        std::string_view line = lines[first + count - 1];
        if (count > 1 && (trim(line).empty() || is_definition_start(line))) {
            break;
        }
        if (count > 1) text += '\n';
        text += std::string(line);
        if (is_link_reference_definition(text)) {
            longest = count;
        }
    }
    return longest;
}

Segment atx_heading_content(Segment line, std::string_view source) {
    std::string_view text = line.value(source);
    size_t start = 0;
    while (start < text.length() && start < 3 && text[start] == ' ') start++;
    size_t hashes = 0;
    while (start + hashes < text.length() && text[start + hashes] == '#') hashes++;
    if (hashes == 0 || hashes > 6 ||
        (start + hashes < text.length() && !is_blank(text[start + hashes]))) {
        return line;
    }
    start += hashes;
    while (start < text.length() && is_blank(text[start])) start++;

    // Optional closing sequence: spaces, a run of '#', spaces.
    size_t end = text.length();
    while (end > start && is_blank(text[end - 1])) end--;
    size_t closing = end;
    while (closing > start && text[closing - 1] == '#') closing--;
    if (closing == start || (closing < end && is_blank(text[closing - 1]))) {
        end = closing;
        while (end > start && is_blank(text[end - 1])) end--;
    }
    return {line.start + start, line.start + end, false};
}

bool ends_with_hard_break(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (line.length() >= 2 && line[line.length() - 1] == ' ' && line[line.length() - 2] == ' ') {
        return trim(line).length() > 0;
    }
    size_t backslashes = 0;
    while (backslashes < line.length() && line[line.length() - 1 - backslashes] == '\\') {
        backslashes++;
    }
    return backslashes % 2 == 1;
}

} // namespace syntax

namespace {
    struct CmarkNodeDeleter {
        void operator()(cmark_node* node) const { cmark_node_free(node); }
    };

    using CmarkDocument = std::unique_ptr<cmark_node, CmarkNodeDeleter>;

    std::string literal_of(cmark_node* node) {
        const char* literal = cmark_node_get_literal(node);
        return literal ? literal : "";
    }

    /**
     * Byte offsets of the source lines, for turning cmark's 1-based
     * line/column positions into segments.
     */
    class LineIndex {
    public:
        explicit LineIndex(std::string_view source) : source_(source) {
            starts_.push_back(0);
            for (size_t i = 0; i < source.length(); i++) {
                if (source[i] == '\n') {
                    starts_.push_back(i + 1);
                }
            }
        }

        int count() const { return static_cast<int>(starts_.size()); }

        // Line number (1-based) without its terminator.
        Segment line(int number) const {
            if (number < 1 || number > count()) {
                return {source_.length(), source_.length(), false};
            }
            size_t start = starts_[static_cast<size_t>(number - 1)];
            size_t stop = number < count() ? starts_[static_cast<size_t>(number)] - 1 : source_.length();
            if (stop > start && source_[stop - 1] == '\r') {
                stop--;
            }
            return {start, stop, false};
        }

        // Byte offset of a 1-based line/column position, clamped to the line.
        size_t offset(int number, int column) const {
            Segment l = line(number);
            size_t col = column > 0 ? static_cast<size_t>(column - 1) : 0;
            return std::min(l.start + col, l.stop);
        }

    private:
        std::string_view source_;
        std::vector<size_t> starts_;
    };

    class Builder {
    public:
        explicit Builder(std::string_view source)
            : source_(source)
            , lines_(source)
        {
        }

        std::unique_ptr<Node> build(cmark_node* root) {
            auto document = std::make_unique<Node>(NodeKind::Document);
            add_children(root, *document, 0);
            return document;
        }

    private:
        std::string_view source_;
        LineIndex lines_;

        // Line n of a container with its markers removed: the quote markers
        // of the enclosing blockquotes, and the list marker on an item's
        // first line.
        std::string_view container_line(cmark_node* container, int n, int quote_depth) const {
            Segment line = lines_.line(n);
            int quotes = quote_depth;
            while (line.start < line.stop) {
                char c = source_[line.start];
                if (c == ' ' || c == '\t') {
                    line.start++;
                } else if (c == '>' && quotes > 0) {
                    line.start++;
                    quotes--;
                } else {
                    break;
                }
            }
            if (cmark_node_get_type(container) == CMARK_NODE_ITEM && n == cmark_node_get_start_line(container)) {
                size_t pos = std::max(line.start, lines_.offset(n, cmark_node_get_start_column(container)));
                while (pos < line.stop && (source_[pos] == ' ' || source_[pos] == '\t')) pos++;
                while (pos < line.stop && source_[pos] >= '0' && source_[pos] <= '9') pos++;
                if (pos < line.stop && (source_[pos] == '-' || source_[pos] == '+' || source_[pos] == '*' ||
                                        source_[pos] == '.' || source_[pos] == ')')) {
                    pos++;
                }
                line.start = std::min(pos, line.stop);
            }
            return line.value(source_);
        }

        // Re-create the link reference definitions cmark consumed between
        // lines first and last of a container as a verbatim block.
        void add_definitions(cmark_node* container, int first, int last, Node& parent, int quote_depth) {
            std::vector<std::string_view> text;
            for (int n = first; n <= last; n++) {
                text.push_back(container_line(container, n, quote_depth));
            }
            std::string literal;
            for (size_t i = 0; i < text.size();) {
                size_t count = syntax::link_reference_definition_lines(text, i);
                if (count == 0) {
                    i++;
                    continue;
                }
                for (size_t end = i + count; i < end; i++) {
                    literal += std::string(syntax::trim(text[i])) + "\n";
                }
            }
            if (!literal.empty()) {
                verbose_log("parse", "kept link reference definitions from lines " +
                            std::to_string(first) + "-" + std::to_string(last));
                parent.append_child(std::make_unique<Node>(NodeKind::HTMLBlock, LiteralData{literal}));
            }
        }

        // Raw lines of a leaf block with container markers removed.
        std::vector<Segment> block_lines(cmark_node* block, int quote_depth) const {
            std::vector<Segment> result;
            int first = cmark_node_get_start_line(block);
            int last = cmark_node_get_end_line(block);
            for (int n = first; n > 0 && n <= last; n++) {
                Segment line = lines_.line(n);
                if (n == first) {
                    line.start = lines_.offset(n, cmark_node_get_start_column(block));
                } else {
                    int quotes = quote_depth;
                    while (line.start < line.stop) {
                        char c = source_[line.start];
                        if (c == ' ' || c == '\t') {
                            line.start++;
                        } else if (c == '>' && quotes > 0) {
                            line.start++;
                            quotes--;
                        } else {
                            break;
                        }
                    }
                }
                if (n == last && cmark_node_get_end_column(block) > 0) {
                    size_t stop = lines_.offset(n, cmark_node_get_end_column(block)) + 1;
                    if (stop > line.start && stop < line.stop) {
                        line.stop = stop;
                    }
                }
                line.hard_break = n < last && syntax::ends_with_hard_break(line.value(source_));
                result.push_back(line);
            }
            return result;
        }

        void add_block(cmark_node* block, Node& parent, int quote_depth) {
            switch (cmark_node_get_type(block)) {
                case CMARK_NODE_PARAGRAPH:
                    add_paragraph(block, parent, quote_depth);
                    break;

                case CMARK_NODE_HEADING: {
                    Node* heading = parent.append_child(std::make_unique<Node>(
                        NodeKind::Heading, HeadingData{cmark_node_get_heading_level(block)}));
                    std::vector<Segment> lines = block_lines(block, quote_depth);
                    if (lines.size() > 1) {
                        lines.pop_back();  // Setext underline.
                    } else if (!lines.empty()) {
                        lines[0] = syntax::atx_heading_content(lines[0], source_);
                    }
                    for (const Segment& line : lines) {
                        heading->add_line(line);
                    }
                    add_inlines(block, *heading);
                    break;
                }

                case CMARK_NODE_BLOCK_QUOTE: {
                    Node* quote = parent.append_child(std::make_unique<Node>(NodeKind::Blockquote));
                    add_children(block, *quote, quote_depth + 1);
                    break;
                }

                case CMARK_NODE_LIST: {
                    ListData list;
                    list.ordered = cmark_node_get_list_type(block) == CMARK_ORDERED_LIST;
                    list.start = list.ordered ? cmark_node_get_list_start(block) : 1;
                    list.tight = cmark_node_get_list_tight(block) != 0;
                    if (list.ordered) {
                        list.marker = cmark_node_get_list_delim(block) == CMARK_PAREN_DELIM ? ')' : '.';
                    } else {
                        cmark_node* item = cmark_node_first_child(block);
                        list.marker = item ? marker_at(item) : '*';
                    }
                    Node* node = parent.append_child(std::make_unique<Node>(NodeKind::List, list));
                    add_children(block, *node, quote_depth);
                    break;
                }

                case CMARK_NODE_ITEM: {
                    ListItemData item;
                    item.marker = marker_at(block);
                    Node* node = parent.append_child(std::make_unique<Node>(NodeKind::ListItem, item));
                    add_children(block, *node, quote_depth);
                    break;
                }

                case CMARK_NODE_CODE_BLOCK:
                    if (is_fenced(block)) {
                        FencedCodeData fenced;
                        const char* info = cmark_node_get_fence_info(block);
                        fenced.info = info ? info : "";
                        fenced.language = fenced.info.substr(0, fenced.info.find_first_of(" \t"));
                        fenced.code = literal_of(block);
                        parent.append_child(std::make_unique<Node>(NodeKind::FencedCodeBlock, std::move(fenced)));
                    } else {
                        parent.append_child(std::make_unique<Node>(NodeKind::CodeBlock, LiteralData{literal_of(block)}));
                    }
                    break;

                case CMARK_NODE_HTML_BLOCK:
                    parent.append_child(std::make_unique<Node>(NodeKind::HTMLBlock, LiteralData{literal_of(block)}));
                    break;

                case CMARK_NODE_THEMATIC_BREAK:
                    parent.append_child(std::make_unique<Node>(NodeKind::ThematicBreak));
                    break;

                default:
                    // Custom blocks: keep whatever they contain.
                    add_children(block, parent, quote_depth);
                    break;
            }
        }

        // Children of a container block. Lines of the container that no
        // child covers may hold link reference definitions cmark consumed.
        void add_children(cmark_node* block, Node& parent, int quote_depth) {
            bool is_document = cmark_node_get_type(block) == CMARK_NODE_DOCUMENT;
            bool recover = cmark_node_get_type(block) != CMARK_NODE_LIST;
            int covered = is_document ? 0 : cmark_node_get_start_line(block) - 1;
            int last = is_document ? lines_.count() : cmark_node_get_end_line(block);
            for (cmark_node* child = cmark_node_first_child(block); child; child = cmark_node_next(child)) {
                int start = cmark_node_get_start_line(child);
                if (recover && start > covered + 1) {
                    add_definitions(block, covered + 1, start - 1, parent, quote_depth);
                }
                add_block(child, parent, quote_depth);
                covered = std::max(covered, cmark_node_get_end_line(child));
            }
            if (recover && last > covered) {
                add_definitions(block, covered + 1, last, parent, quote_depth);
            }
        }

        void add_paragraph(cmark_node* block, Node& parent, int quote_depth) {
            std::vector<Segment> lines = block_lines(block, quote_depth);

            // cmark strips leading link reference definitions from the
            // paragraph's content but not from its source position.
            std::vector<std::string_view> text;
            for (const Segment& line : lines) {
                text.push_back(line.value(source_));
            }
            size_t definitions = 0;
            while (size_t count = syntax::link_reference_definition_lines(text, definitions)) {
                definitions += count;
            }
            if (definitions > 0) {
                std::string literal;
                for (size_t i = 0; i < definitions; i++) {
                    literal += std::string(syntax::trim(text[i])) + "\n";
                }
                parent.append_child(std::make_unique<Node>(NodeKind::HTMLBlock, LiteralData{literal}));
                lines.erase(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(definitions));
                if (lines.empty()) {
                    return;
                }
            }

            if (std::unique_ptr<Node> table = make_table(lines)) {
                parent.append_child(std::move(table));
                return;
            }

            NodeKind kind = NodeKind::Paragraph;
            if (parent.kind() == NodeKind::ListItem && parent.parent() &&
                parent.parent()->list().tight) {
                kind = NodeKind::TextBlock;
            }
            Node* paragraph = parent.append_child(std::make_unique<Node>(kind));
            for (const Segment& line : lines) {
                paragraph->add_line(line);
            }
            add_inlines(block, *paragraph);
        }

        std::unique_ptr<Node> make_table(const std::vector<Segment>& lines) const {
            if (lines.size() < 2 ||
                !syntax::is_table_row(lines[0].value(source_)) ||
                !syntax::is_table_separator(lines[1].value(source_))) {
                return nullptr;
            }
            std::vector<Segment> header = syntax::split_table_cells(lines[0], source_);
            if (header.size() != syntax::split_table_cells(lines[1], source_).size()) {
                return nullptr;
            }
            for (size_t i = 2; i < lines.size(); i++) {
                if (!syntax::is_table_row(lines[i].value(source_))) {
                    return nullptr;
                }
            }

            auto table = std::make_unique<Node>(NodeKind::Table);
            add_table_row(*table, NodeKind::TableHeader, header, header.size());
            for (size_t i = 2; i < lines.size(); i++) {
                add_table_row(*table, NodeKind::TableRow,
                              syntax::split_table_cells(lines[i], source_), header.size());
            }
            return table;
        }

        void add_table_row(Node& table, NodeKind kind, std::vector<Segment> cells, size_t columns) const {
            // Short rows are padded with empty cells, extra cells dropped.
            size_t pad_at = cells.empty() ? 0 : cells.back().stop;
            cells.resize(columns, Segment{pad_at, pad_at, false});

            Node* row = table.append_child(std::make_unique<Node>(kind));
            for (const Segment& segment : cells) {
                Node* cell = row->append_child(std::make_unique<Node>(NodeKind::TableCell));
                cell->add_line(segment);
                cell->append_child(std::make_unique<Node>(
                    NodeKind::Text, TextData{std::string(segment.value(source_)), false, false}));
            }
        }

        void add_inlines(cmark_node* block, Node& parent) const {
            for (cmark_node* child = cmark_node_first_child(block); child; child = cmark_node_next(child)) {
                add_inline(child, parent);
            }
        }

        void add_inline(cmark_node* inline_node, Node& parent) const {
            switch (cmark_node_get_type(inline_node)) {
                case CMARK_NODE_TEXT:
                    parent.append_child(std::make_unique<Node>(
                        NodeKind::Text, TextData{literal_of(inline_node), false, false}));
                    break;

                case CMARK_NODE_SOFTBREAK:
                    break_text(parent).soft_break = true;
                    break;

                case CMARK_NODE_LINEBREAK:
                    break_text(parent).hard_break = true;
                    break;

                case CMARK_NODE_CODE: {
                    Node* span = parent.append_child(std::make_unique<Node>(NodeKind::CodeSpan));
                    span->append_child(std::make_unique<Node>(
                        NodeKind::Text, TextData{literal_of(inline_node), false, false}));
                    break;
                }

                case CMARK_NODE_HTML_INLINE:
                    parent.append_child(std::make_unique<Node>(
                        NodeKind::RawHTML, LiteralData{literal_of(inline_node)}));
                    break;

                case CMARK_NODE_EMPH:
                case CMARK_NODE_STRONG: {
                    int level = cmark_node_get_type(inline_node) == CMARK_NODE_STRONG ? 2 : 1;
                    Node* emphasis = parent.append_child(std::make_unique<Node>(
                        NodeKind::Emphasis, EmphasisData{level}));
                    add_inlines(inline_node, *emphasis);
                    break;
                }

                case CMARK_NODE_LINK:
                case CMARK_NODE_IMAGE: {
                    LinkData link;
                    const char* url = cmark_node_get_url(inline_node);
                    const char* title = cmark_node_get_title(inline_node);
                    link.destination = url ? url : "";
                    link.title = title ? title : "";

                    bool is_image = cmark_node_get_type(inline_node) == CMARK_NODE_IMAGE;
                    std::string autolink_text;
                    if (!is_image && is_autolink(inline_node, autolink_text)) {
                        parent.append_child(std::make_unique<Node>(
                            NodeKind::AutoLink, LinkData{autolink_text, ""}));
                        break;
                    }
                    Node* node = parent.append_child(std::make_unique<Node>(
                        is_image ? NodeKind::Image : NodeKind::Link, std::move(link)));
                    add_inlines(inline_node, *node);
                    break;
                }

                default:
                    add_inlines(inline_node, parent);
                    break;
            }
        }

        // Text node that carries a line break: the preceding Text sibling,
        // or a new empty one.
        static TextData& break_text(Node& parent) {
            Node* last = parent.last_child();
            if (!last || last->kind() != NodeKind::Text ||
                last->text().soft_break || last->text().hard_break) {
                last = parent.append_child(std::make_unique<Node>(NodeKind::Text, TextData{}));
            }
            return last->text();
        }

        // A link whose only content is its own destination, as written in
        // <https://example.com> or <someone@example.com>.
        static bool is_autolink(cmark_node* link, std::string& text) {
            cmark_node* child = cmark_node_first_child(link);
            if (!child || cmark_node_next(child) || cmark_node_get_type(child) != CMARK_NODE_TEXT) {
                return false;
            }
            const char* url = cmark_node_get_url(link);
            const char* title = cmark_node_get_title(link);
            if (!url || (title && *title)) {
                return false;
            }
            text = literal_of(child);
            std::string destination = url;
            return !text.empty() && (destination == text || destination == "mailto:" + text);
        }

        // First non-blank byte at a block's start position: the list marker.
        char marker_at(cmark_node* item) const {
            size_t pos = lines_.offset(cmark_node_get_start_line(item), cmark_node_get_start_column(item));
            while (pos < source_.length() && (source_[pos] == ' ' || source_[pos] == '\t')) {
                pos++;
            }
            return pos < source_.length() ? source_[pos] : '*';
        }

        bool is_fenced(cmark_node* code_block) const {
            size_t pos = lines_.offset(cmark_node_get_start_line(code_block),
                                       cmark_node_get_start_column(code_block));
            size_t spaces = 0;
            while (pos < source_.length() && source_[pos] == ' ' && spaces < 3) {
                pos++;
                spaces++;
            }
            if (pos >= source_.length() || (source_[pos] != '`' && source_[pos] != '~')) {
                return false;
            }
            char fence = source_[pos];
            size_t count = 0;
            while (pos < source_.length() && source_[pos] == fence) {
                pos++;
                count++;
            }
            return count >= 3;
        }
    };
}

std::unique_ptr<Node> parse_document(std::string_view source) {
    CmarkDocument root(cmark_parse_document(source.data(), source.length(), CMARK_OPT_DEFAULT));
    if (!root) {
        throw std::runtime_error("cmark failed to parse the document");
    }
    verbose_log("parse", "parsed " + std::to_string(source.length()) + " bytes");
    return Builder(source).build(root.get());
}

} // namespace marker

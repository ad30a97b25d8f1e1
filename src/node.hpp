#pragma once

/**
 * Parse tree handed to the renderer.
 *
 * The tree is built once by the document builder and is read-only while it
 * is rendered. Block nodes keep references (segments) into the original
 * source buffer for the raw bytes they span; inline nodes carry their text.
 */

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace marker {

enum class NodeKind {
    Document,
    Paragraph,
    TextBlock,
    Heading,
    Blockquote,
    CodeBlock,
    FencedCodeBlock,
    HTMLBlock,
    List,
    ListItem,
    ThematicBreak,
    Table,
    TableHeader,
    TableRow,
    TableCell,
    AutoLink,
    CodeSpan,
    Emphasis,
    Image,
    Link,
    RawHTML,
    Text,
    String
};

// Returns the kind name, e.g. "FencedCodeBlock".
const char* kind_name(NodeKind kind);

/**
 * Half-open byte range [start, stop) into the source buffer.
 */
struct Segment {
    size_t start = 0;
    size_t stop = 0;
    bool hard_break = false;  // Source line ended in a hard line break.

    size_t length() const { return stop - start; }
    std::string_view value(std::string_view source) const {
        return source.substr(start, stop - start);
    }
};

// ========== Kind-specific data ==========

struct HeadingData {
    int level = 1;  // 1-6
};

struct FencedCodeData {
    std::string language;  // Info string up to the first space, may be empty.
    std::string info;      // Full info string.
    std::string code;      // Raw content, every line newline-terminated.
};

struct LiteralData {
    std::string literal;  // Verbatim content of CodeBlock / HTMLBlock / RawHTML.
};

struct ListData {
    bool ordered = false;
    int start = 1;
    char marker = '*';  // Bullet for unordered lists, '.' or ')' for ordered.
    bool tight = true;
};

struct ListItemData {
    char marker = '*';  // Marker byte as written in the source.
};

struct TextData {
    std::string value;
    bool soft_break = false;
    bool hard_break = false;
};

struct EmphasisData {
    int level = 1;  // 1 = emphasis, 2 = strong emphasis
};

struct LinkData {
    std::string destination;
    std::string title;
};

using NodeData = std::variant<std::monostate, HeadingData, FencedCodeData,
                              LiteralData, ListData, ListItemData, TextData,
                              EmphasisData, LinkData>;

/**
 * A node of the parse tree.
 *
 * Children are owned by their parent. Parent and sibling links are
 * non-owning and maintained by append_child().
 */
class Node {
public:
    explicit Node(NodeKind kind, NodeData data = {});

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    NodeKind kind() const { return kind_; }

    // ========== Navigation ==========

    Node* parent() const { return parent_; }
    Node* first_child() const;
    Node* last_child() const;
    Node* next_sibling() const { return next_sibling_; }
    Node* previous_sibling() const { return previous_sibling_; }
    size_t child_count() const { return children_.size(); }

    // Takes ownership of child and links it as the last child.
    Node* append_child(std::unique_ptr<Node> child);

    // ========== Raw source lines ==========

    const std::vector<Segment>& lines() const { return lines_; }
    void add_line(Segment segment) { lines_.push_back(segment); }

    // ========== Kind-specific data ==========
    // Each accessor throws InvariantViolation when the node does not carry
    // that kind of data.

    const HeadingData& heading() const;
    const FencedCodeData& fenced_code() const;
    const LiteralData& literal() const;
    const ListData& list() const;
    const ListItemData& list_item() const;
    const TextData& text() const;
    TextData& text();
    const EmphasisData& emphasis() const;
    const LinkData& link() const;

private:
    template <typename T>
    const T& data_as(const char* what) const;

    NodeKind kind_;
    NodeData data_;
    std::vector<Segment> lines_;

    std::vector<std::unique_ptr<Node>> children_;
    Node* parent_ = nullptr;
    Node* next_sibling_ = nullptr;
    Node* previous_sibling_ = nullptr;
};

/**
 * Traversal control returned by walk visitors.
 */
enum class WalkStatus {
    Continue,      // Descend into children.
    SkipChildren,  // Do not descend; the exit callback still fires.
    Stop           // Abort the whole traversal.
};

using Visitor = std::function<WalkStatus(Node& node, bool entering)>;

/**
 * Depth-first traversal invoking visitor once on enter and once on exit of
 * every node. Returns Stop if the visitor stopped the walk, otherwise
 * Continue. Exceptions thrown by the visitor propagate.
 */
WalkStatus walk(Node& node, const Visitor& visitor);

} // namespace marker

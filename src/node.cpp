#include "node.hpp"
#include "errors.hpp"

namespace marker {

const char* kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::Document: return "Document";
        case NodeKind::Paragraph: return "Paragraph";
        case NodeKind::TextBlock: return "TextBlock";
        case NodeKind::Heading: return "Heading";
        case NodeKind::Blockquote: return "Blockquote";
        case NodeKind::CodeBlock: return "CodeBlock";
        case NodeKind::FencedCodeBlock: return "FencedCodeBlock";
        case NodeKind::HTMLBlock: return "HTMLBlock";
        case NodeKind::List: return "List";
        case NodeKind::ListItem: return "ListItem";
        case NodeKind::ThematicBreak: return "ThematicBreak";
        case NodeKind::Table: return "Table";
        case NodeKind::TableHeader: return "TableHeader";
        case NodeKind::TableRow: return "TableRow";
        case NodeKind::TableCell: return "TableCell";
        case NodeKind::AutoLink: return "AutoLink";
        case NodeKind::CodeSpan: return "CodeSpan";
        case NodeKind::Emphasis: return "Emphasis";
        case NodeKind::Image: return "Image";
        case NodeKind::Link: return "Link";
        case NodeKind::RawHTML: return "RawHTML";
        case NodeKind::Text: return "Text";
        case NodeKind::String: return "String";
    }
    return "Unknown";
}

Node::Node(NodeKind kind, NodeData data)
    : kind_(kind)
    , data_(std::move(data))
{
}

Node* Node::first_child() const {
    return children_.empty() ? nullptr : children_.front().get();
}

Node* Node::last_child() const {
    return children_.empty() ? nullptr : children_.back().get();
}

Node* Node::append_child(std::unique_ptr<Node> child) {
    if (!child) {
        throw InvariantViolation("append_child called with a null node");
    }
    Node* raw = child.get();
    raw->parent_ = this;
    raw->next_sibling_ = nullptr;
    raw->previous_sibling_ = last_child();
    if (raw->previous_sibling_) {
        raw->previous_sibling_->next_sibling_ = raw;
    }
    children_.push_back(std::move(child));
    return raw;
}

template <typename T>
const T& Node::data_as(const char* what) const {
    const T* data = std::get_if<T>(&data_);
    if (!data) {
        throw InvariantViolation(std::string(kind_name(kind_)) +
                                 " node accessed as " + what);
    }
    return *data;
}

const HeadingData& Node::heading() const {
    return data_as<HeadingData>("Heading");
}

const FencedCodeData& Node::fenced_code() const {
    return data_as<FencedCodeData>("FencedCodeBlock");
}

const LiteralData& Node::literal() const {
    return data_as<LiteralData>("literal block");
}

const ListData& Node::list() const {
    return data_as<ListData>("List");
}

const ListItemData& Node::list_item() const {
    return data_as<ListItemData>("ListItem");
}

const TextData& Node::text() const {
    return data_as<TextData>("Text");
}

TextData& Node::text() {
    return const_cast<TextData&>(data_as<TextData>("Text"));
}

const EmphasisData& Node::emphasis() const {
    return data_as<EmphasisData>("Emphasis");
}

const LinkData& Node::link() const {
    return data_as<LinkData>("Link");
}

WalkStatus walk(Node& node, const Visitor& visitor) {
    WalkStatus status = visitor(node, true);
    if (status == WalkStatus::Stop) {
        return WalkStatus::Stop;
    }
    if (status != WalkStatus::SkipChildren) {
        for (Node* child = node.first_child(); child; child = child->next_sibling()) {
            if (walk(*child, visitor) == WalkStatus::Stop) {
                return WalkStatus::Stop;
            }
        }
    }
    if (visitor(node, false) == WalkStatus::Stop) {
        return WalkStatus::Stop;
    }
    return WalkStatus::Continue;
}

} // namespace marker

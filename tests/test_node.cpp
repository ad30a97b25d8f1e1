#include <catch2/catch.hpp>
#include "node.hpp"
#include "errors.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace marker;

// Records walk events as "+Kind" on enter and "-Kind" on exit.
class EventRecorder {
public:
    std::vector<std::string> events;

    void record(const Node& node, bool entering) {
        events.push_back((entering ? "+" : "-") + std::string(kind_name(node.kind())));
    }
};

std::unique_ptr<Node> sample_tree() {
    auto document = std::make_unique<Node>(NodeKind::Document);
    Node* heading = document->append_child(std::make_unique<Node>(NodeKind::Heading, HeadingData{2}));
    heading->append_child(std::make_unique<Node>(NodeKind::Text, TextData{"Title", false, false}));
    Node* paragraph = document->append_child(std::make_unique<Node>(NodeKind::Paragraph));
    paragraph->append_child(std::make_unique<Node>(NodeKind::Text, TextData{"body", false, false}));
    return document;
}

// ============================================================================
// Tree structure
// ============================================================================

TEST_CASE("append_child links parent and siblings", "[node]") {
    Node list(NodeKind::List, ListData{});
    Node* first = list.append_child(std::make_unique<Node>(NodeKind::ListItem, ListItemData{}));
    Node* second = list.append_child(std::make_unique<Node>(NodeKind::ListItem, ListItemData{}));

    REQUIRE(list.child_count() == 2);
    REQUIRE(list.first_child() == first);
    REQUIRE(list.last_child() == second);
    REQUIRE(first->parent() == &list);
    REQUIRE(first->next_sibling() == second);
    REQUIRE(second->previous_sibling() == first);
    REQUIRE(first->previous_sibling() == nullptr);
    REQUIRE(second->next_sibling() == nullptr);
}

TEST_CASE("Appending a null child is rejected", "[node]") {
    Node document(NodeKind::Document);
    REQUIRE_THROWS_AS(document.append_child(nullptr), InvariantViolation);
}

TEST_CASE("Kind data accessed through the wrong kind throws", "[node]") {
    Node heading(NodeKind::Heading, HeadingData{3});
    REQUIRE(heading.heading().level == 3);
    REQUIRE_THROWS_AS(heading.list(), InvariantViolation);
    REQUIRE_THROWS_AS(heading.text(), InvariantViolation);

    Node bare(NodeKind::Paragraph);
    REQUIRE_THROWS_AS(bare.heading(), InvariantViolation);
}

TEST_CASE("Kind names", "[node]") {
    REQUIRE(std::string(kind_name(NodeKind::FencedCodeBlock)) == "FencedCodeBlock");
    REQUIRE(std::string(kind_name(NodeKind::TableCell)) == "TableCell");
}

// ============================================================================
// Walking
// ============================================================================

TEST_CASE("Walk visits enter and exit depth first", "[node][walk]") {
    auto document = sample_tree();
    EventRecorder recorder;

    WalkStatus status = walk(*document, [&](Node& node, bool entering) {
        recorder.record(node, entering);
        return WalkStatus::Continue;
    });

    REQUIRE(status == WalkStatus::Continue);
    REQUIRE(recorder.events == std::vector<std::string>{
        "+Document", "+Heading", "+Text", "-Text", "-Heading",
        "+Paragraph", "+Text", "-Text", "-Paragraph", "-Document"});
}

TEST_CASE("Skipped children still get the exit event", "[node][walk]") {
    auto document = sample_tree();
    EventRecorder recorder;

    walk(*document, [&](Node& node, bool entering) {
        recorder.record(node, entering);
        return node.kind() == NodeKind::Heading ? WalkStatus::SkipChildren : WalkStatus::Continue;
    });

    REQUIRE(recorder.events == std::vector<std::string>{
        "+Document", "+Heading", "-Heading",
        "+Paragraph", "+Text", "-Text", "-Paragraph", "-Document"});
}

TEST_CASE("Stop ends the walk immediately", "[node][walk]") {
    auto document = sample_tree();
    EventRecorder recorder;

    WalkStatus status = walk(*document, [&](Node& node, bool entering) {
        recorder.record(node, entering);
        return node.kind() == NodeKind::Paragraph ? WalkStatus::Stop : WalkStatus::Continue;
    });

    REQUIRE(status == WalkStatus::Stop);
    REQUIRE(recorder.events.back() == "+Paragraph");
}

TEST_CASE("Exceptions from the visitor propagate", "[node][walk]") {
    auto document = sample_tree();
    REQUIRE_THROWS_AS(walk(*document, [](Node& node, bool) -> WalkStatus {
        if (node.kind() == NodeKind::Text) {
            throw InvariantViolation("boom");
        }
        return WalkStatus::Continue;
    }), InvariantViolation);
}

#include <catch2/catch.hpp>
#include "code_formatter.hpp"
#include "command_formatter.hpp"
#include "errors.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace marker;

// Formatter that tags its output so tests can tell formatters apart.
class TaggingFormatter : public CodeFormatter {
public:
    explicit TaggingFormatter(std::string tag) : tag_(std::move(tag)) {}

    std::string format(const std::string& code) override {
        return tag_ + ":" + code;
    }

private:
    std::string tag_;
};

// ============================================================================
// Registry
// ============================================================================

TEST_CASE("Registered formatter is found by every tag", "[formatter]") {
    CodeFormatterRegistry registry;
    auto go = std::make_shared<TaggingFormatter>("go");
    registry.register_formatter({"go", "golang"}, go);

    REQUIRE(registry.lookup("go") == go.get());
    REQUIRE(registry.lookup("golang") == go.get());
    REQUIRE(registry.size() == 2);
}

TEST_CASE("Unregistered tag has no formatter", "[formatter]") {
    CodeFormatterRegistry registry;
    REQUIRE(registry.lookup("python") == nullptr);
    REQUIRE(registry.lookup("") == nullptr);
}

TEST_CASE("Tags are case sensitive", "[formatter]") {
    CodeFormatterRegistry registry;
    registry.register_formatter({"go"}, std::make_shared<TaggingFormatter>("go"));
    REQUIRE(registry.lookup("Go") == nullptr);
}

TEST_CASE("Later registration wins a colliding tag", "[formatter]") {
    auto first = std::make_shared<TaggingFormatter>("first");
    auto second = std::make_shared<TaggingFormatter>("second");

    CodeFormatterRegistry registry({
        {{"go", "golang"}, first},
        {{"go"}, second},
    });

    REQUIRE(registry.lookup("go") == second.get());
    REQUIRE(registry.lookup("golang") == first.get());
    REQUIRE(registry.lookup("go")->format("x") == "second:x");
}

TEST_CASE("Null formatter cannot be registered", "[formatter]") {
    CodeFormatterRegistry registry;
    REQUIRE_THROWS_AS(registry.register_formatter({"go"}, nullptr), InvariantViolation);
}

// ============================================================================
// External command formatter
// ============================================================================

TEST_CASE("Command output replaces the code", "[formatter][command]") {
    CommandFormatter upper({"tr", "a-z", "A-Z"});
    REQUIRE(upper.format("func main() {}\n") == "FUNC MAIN() {}\n");
}

TEST_CASE("cat passes code through unchanged", "[formatter][command]") {
    CommandFormatter cat({"cat"});
    std::string code = "line one\n\tline two\n\nline four\n";
    REQUIRE(cat.format(code) == code);
}

TEST_CASE("Large input does not deadlock the pipes", "[formatter][command]") {
    CommandFormatter cat({"cat"});
    std::string code;
    for (int i = 0; i < 20000; i++) {
        code += "fmt.Println(\"line " + std::to_string(i) + "\")\n";
    }
    REQUIRE(cat.format(code) == code);
}

TEST_CASE("Non-zero exit is a FormatError with stderr", "[formatter][command]") {
    CommandFormatter failing({"sh", "-c", "cat >/dev/null; echo 'expected declaration' >&2; exit 2"});
    REQUIRE_THROWS_WITH(failing.format("func ("),
                        Catch::Contains("exited with status 2") &&
                        Catch::Contains("expected declaration"));
}

TEST_CASE("Formatter that ignores its input still fails cleanly", "[formatter][command]") {
    CommandFormatter failing({"sh", "-c", "exit 3"});
    REQUIRE_THROWS_AS(failing.format("some code\n"), FormatError);
}

TEST_CASE("Missing program is a FormatError", "[formatter][command]") {
    CommandFormatter missing({"marker-test-no-such-formatter"});
    REQUIRE_THROWS_AS(missing.format("code\n"), FormatError);
}

TEST_CASE("Empty command is a FormatError", "[formatter][command]") {
    CommandFormatter empty(std::vector<std::string>{});
    REQUIRE_THROWS_AS(empty.format("code\n"), FormatError);
}

TEST_CASE("Command is executed without a shell", "[formatter][command]") {
    CommandFormatter echo({"echo", "$HOME"});
    REQUIRE(echo.format("") == "$HOME\n");
}

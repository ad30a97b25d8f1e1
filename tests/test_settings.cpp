#include <catch2/catch.hpp>
#include "settings.hpp"
#include "command_formatter.hpp"
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

using namespace marker;

// Writes content to a fresh temporary file and removes it when done.
class TempFile {
public:
    explicit TempFile(const std::string& content) {
        char name[] = "/tmp/marker-settings-XXXXXX";
        int fd = mkstemp(name);
        REQUIRE(fd >= 0);
        close(fd);
        path_ = name;
        std::ofstream(path_) << content;
    }

    ~TempFile() { std::remove(path_.c_str()); }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("Full settings file", "[settings]") {
    Settings settings = parse_settings(R"({
        "max_width": 72,
        "list_numbering": "repeat",
        "hard_breaks": "preserve",
        "formatters": [
            {"languages": ["go", "golang"], "command": ["gofmt"]},
            {"languages": ["json"], "command": ["jq", "."]}
        ]
    })", "test.json");

    REQUIRE(settings.max_width == 72);
    REQUIRE(settings.list_numbering == ListNumbering::Repeat);
    REQUIRE(settings.hard_breaks == HardBreakPolicy::Preserve);
    REQUIRE(settings.formatters.size() == 2);
    REQUIRE(settings.formatters[0].languages == std::vector<std::string>{"go", "golang"});
    REQUIRE(settings.formatters[1].command == std::vector<std::string>{"jq", "."});
}

TEST_CASE("Empty object leaves everything unset", "[settings]") {
    Settings settings = parse_settings("{}", "test.json");
    REQUIRE_FALSE(settings.max_width.has_value());
    REQUIRE_FALSE(settings.list_numbering.has_value());
    REQUIRE_FALSE(settings.hard_breaks.has_value());
    REQUIRE(settings.formatters.empty());
}

TEST_CASE("Width beyond the int range is rejected, not wrapped", "[settings]") {
    REQUIRE_THROWS_WITH(parse_settings(R"({"max_width": 4294967376})", "wide.json"),
                        Catch::StartsWith("wide.json: max_width must be a positive integer"));
    REQUIRE_THROWS_AS(parse_settings(R"({"max_width": 2147483648})", "x.json"), std::runtime_error);
    REQUIRE(parse_settings(R"({"max_width": 2147483647})", "x.json").max_width == 2147483647);
}

TEST_CASE("Malformed settings are rejected with the file name", "[settings]") {
    REQUIRE_THROWS_WITH(parse_settings("{ not json", "broken.json"), Catch::StartsWith("broken.json: "));
    REQUIRE_THROWS_AS(parse_settings("[]", "x.json"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_settings(R"({"max_width": 0})", "x.json"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_settings(R"({"max_width": "wide"})", "x.json"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_settings(R"({"max_width": -3})", "x.json"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_settings(R"({"list_numbering": "skip"})", "x.json"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_settings(R"({"hard_breaks": 1})", "x.json"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_settings(R"({"formatters": [{"languages": ["go"]}]})", "x.json"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(parse_settings(R"({"formatters": [{"languages": ["go"], "command": []}]})", "x.json"),
                      std::runtime_error);
}

TEST_CASE("Policy names", "[settings]") {
    REQUIRE(parse_list_numbering("increment") == ListNumbering::Increment);
    REQUIRE(parse_hard_breaks("collapse") == HardBreakPolicy::Collapse);
    REQUIRE_THROWS_AS(parse_list_numbering("Increment"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_hard_breaks(""), std::runtime_error);
}

TEST_CASE("Formatter option from the command line", "[settings]") {
    FormatterCommand formatter = parse_formatter_option("go,golang=gofmt -s");
    REQUIRE(formatter.languages == std::vector<std::string>{"go", "golang"});
    REQUIRE(formatter.command == std::vector<std::string>{"gofmt", "-s"});

    REQUIRE_THROWS_AS(parse_formatter_option("gofmt"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_formatter_option("=gofmt"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_formatter_option("go="), std::runtime_error);
}

// ============================================================================
// Loading and applying
// ============================================================================

TEST_CASE("Missing settings file means defaults", "[settings]") {
    REQUIRE_FALSE(load_settings("/nonexistent/marker/.marker.json").has_value());
}

TEST_CASE("Settings file is loaded", "[settings]") {
    TempFile file(R"({"max_width": 100})");
    auto settings = load_settings(file.path());
    REQUIRE(settings.has_value());
    REQUIRE(settings->max_width == 100);
}

TEST_CASE("Broken settings file is an error", "[settings]") {
    TempFile file("max_width = 100");
    REQUIRE_THROWS_AS(load_settings(file.path()), std::runtime_error);
}

TEST_CASE("Applied settings override only what they set", "[settings]") {
    RendererConfig config;
    config.max_width = 80;

    Settings settings;
    settings.hard_breaks = HardBreakPolicy::Preserve;
    apply_settings(settings, config);

    REQUIRE(config.max_width == 80);
    REQUIRE(config.list_numbering == ListNumbering::Increment);
    REQUIRE(config.hard_breaks == HardBreakPolicy::Preserve);
}

TEST_CASE("Later formatter registrations win", "[settings]") {
    RendererConfig config;
    apply_settings(parse_settings(R"({"formatters": [
        {"languages": ["go"], "command": ["gofmt"]}
    ]})", "file"), config);

    Settings overrides;
    overrides.formatters.push_back(parse_formatter_option("go=goimports"));
    apply_settings(overrides, config);

    CodeFormatterRegistry registry(config.formatters);
    auto* formatter = dynamic_cast<CommandFormatter*>(registry.lookup("go"));
    REQUIRE(formatter != nullptr);
    REQUIRE(formatter->command() == std::vector<std::string>{"goimports"});
}

#include "config.hpp"
#include "console.hpp"
#include "document_builder.hpp"
#include "errors.hpp"
#include "markdown_renderer.hpp"
#include "settings.hpp"
#include "verbose.hpp"

#include <CLI/CLI.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>

using namespace marker;

// ========== Input ==========

// Reads the whole document from path, or from stdin for "-".
std::string read_input(const std::string& path) {
    if (path == "-") {
        std::string text((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
        if (std::cin.bad()) {
            throw std::runtime_error("failed to read standard input");
        }
        return text;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// ========== Settings Resolution ==========

// Builds the renderer configuration: defaults, then the settings file, then
// command-line overrides.
RendererConfig resolve_config(
    const std::string& config_path,
    int max_width,
    const std::string& list_numbering,
    const std::string& hard_breaks,
    const std::vector<std::string>& formatter_options
) {
    RendererConfig config;
    config.max_width = DEFAULT_MAX_WIDTH;

    std::string path = config_path.empty() ? SETTINGS_FILE : config_path;
    if (!config_path.empty() && !std::filesystem::exists(config_path)) {
        throw std::runtime_error("settings file " + config_path + " does not exist");
    }
    if (auto settings = load_settings(path)) {
        apply_settings(*settings, config);
    }

    Settings overrides;
    if (max_width > 0) overrides.max_width = max_width;
    if (!list_numbering.empty()) overrides.list_numbering = parse_list_numbering(list_numbering);
    if (!hard_breaks.empty()) overrides.hard_breaks = parse_hard_breaks(hard_breaks);
    for (const auto& option : formatter_options) {
        overrides.formatters.push_back(parse_formatter_option(option));
    }
    apply_settings(overrides, config);

    verbose_log("settings", "max width " + std::to_string(config.max_width) + ", " +
                std::to_string(config.formatters.size()) + " formatter registrations");
    return config;
}

// ========== Main Entry Point ==========

int main(int argc, char* argv[]) {
    CLI::App app{"Markdown pretty-printer: reflows prose, aligns tables and formats fenced code"};
    app.footer("\nExamples:\n"
               "  marker README.md                    Print README.md reformatted\n"
               "  marker -w 72 -o out.md notes.md     Reflow to 72 columns into out.md\n"
               "  marker -f go=gofmt doc.md           Run Go code blocks through gofmt\n"
               "  cat doc.md | marker                 Read from stdin\n");

    std::string input = "-";
    app.add_option("file", input, "Markdown file to format (default: stdin)");

    int max_width = 0;
    app.add_option("-w,--width", max_width, "Maximum line width for reflowed prose (default: 80)")
        ->check(CLI::PositiveNumber);

    std::string config_path;
    app.add_option("-c,--config", config_path, "Settings file (default: ./.marker.json if present)");

    std::string output_path;
    app.add_option("-o,--output", output_path, "Write the result to a file instead of stdout");

    std::vector<std::string> formatter_options;
    app.add_option("-f,--formatter", formatter_options,
                   "Register a code formatter, LANG[,LANG...]=COMMAND (repeatable)");

    std::string list_numbering;
    app.add_option("--list-numbering", list_numbering, "Ordered list numbering")
        ->check(CLI::IsMember(std::vector<std::string>{"increment", "repeat"}));

    std::string hard_breaks;
    app.add_option("--hard-breaks", hard_breaks, "Hard line breaks inside paragraphs")
        ->check(CLI::IsMember(std::vector<std::string>{"collapse", "preserve"}));

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Log settings, parsing and formatter runs to stderr");

    CLI11_PARSE(app, argc, argv);

    set_verbose(verbose);
    Console console;

    std::unique_ptr<MarkdownRenderer> renderer;
    std::string source;
    std::unique_ptr<Node> document;
    try {
        renderer = std::make_unique<MarkdownRenderer>(
            resolve_config(config_path, max_width, list_numbering, hard_breaks, formatter_options));
        source = read_input(input);
        document = parse_document(source);
    } catch (const std::exception& e) {
        console.print_error("Error: " + std::string(e.what()));
        return EXIT_IO_ERROR;
    }

    std::ofstream file;
    if (!output_path.empty()) {
        file.open(output_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            console.print_error("Error: cannot write " + output_path);
            return EXIT_IO_ERROR;
        }
    }
    std::ostream& out = output_path.empty() ? std::cout : file;

    try {
        renderer->render(*document, source, [&out](const std::string& text) {
            out << text;
        });
    } catch (const FormatError& e) {
        out.flush();
        console.print_error("Formatting failed: " + std::string(e.what()));
        console.print_warning("Output is incomplete: it stops at the failing code block.");
        return EXIT_FORMAT_ERROR;
    } catch (const InvariantViolation& e) {
        out.flush();
        console.print_error("Internal error: " + std::string(e.what()));
        return EXIT_INVARIANT;
    }

    out.flush();
    if (!out) {
        console.print_error("Error: failed to write output");
        return EXIT_IO_ERROR;
    }
    return 0;
}

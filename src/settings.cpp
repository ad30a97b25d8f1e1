#include "settings.hpp"
#include "command_formatter.hpp"
#include "verbose.hpp"
#include <nlohmann/json.hpp>
#include <climits>
#include <cstdint>
#include <fstream>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace marker {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
    std::vector<std::string> string_list(const json& value, const std::string& what) {
        if (!value.is_array()) {
            throw std::runtime_error(what + " must be an array of strings");
        }
        std::vector<std::string> result;
        for (const auto& item : value) {
            if (!item.is_string()) {
                throw std::runtime_error(what + " must be an array of strings");
            }
            result.push_back(item.get<std::string>());
        }
        return result;
    }

    std::vector<std::string> split_words(const std::string& text) {
        std::istringstream in(text);
        std::vector<std::string> words;
        std::string word;
        while (in >> word) {
            words.push_back(word);
        }
        return words;
    }
}

ListNumbering parse_list_numbering(const std::string& value) {
    if (value == "increment") return ListNumbering::Increment;
    if (value == "repeat") return ListNumbering::Repeat;
    throw std::runtime_error("invalid list numbering '" + value + "' (expected increment or repeat)");
}

HardBreakPolicy parse_hard_breaks(const std::string& value) {
    if (value == "collapse") return HardBreakPolicy::Collapse;
    if (value == "preserve") return HardBreakPolicy::Preserve;
    throw std::runtime_error("invalid hard break policy '" + value + "' (expected collapse or preserve)");
}

FormatterCommand parse_formatter_option(const std::string& option) {
    size_t eq = option.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw std::runtime_error("invalid formatter '" + option + "' (expected LANG=COMMAND)");
    }

    FormatterCommand formatter;
    std::string languages = option.substr(0, eq);
    size_t start = 0;
    while (start <= languages.length()) {
        size_t comma = languages.find(',', start);
        if (comma == std::string::npos) comma = languages.length();
        if (comma > start) {
            formatter.languages.push_back(languages.substr(start, comma - start));
        }
        start = comma + 1;
    }
    formatter.command = split_words(option.substr(eq + 1));

    if (formatter.languages.empty() || formatter.command.empty()) {
        throw std::runtime_error("invalid formatter '" + option + "' (expected LANG=COMMAND)");
    }
    return formatter;
}

Settings parse_settings(const std::string& text, const std::string& name) {
    Settings settings;
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            throw std::runtime_error("top level must be an object");
        }

        if (j.contains("max_width")) {
            const json& width = j["max_width"];
            bool in_range = width.is_number_unsigned()
                ? width.get<std::uint64_t>() > 0 && width.get<std::uint64_t>() <= static_cast<std::uint64_t>(INT_MAX)
                : width.is_number_integer() && width.get<std::int64_t>() > 0 && width.get<std::int64_t>() <= INT_MAX;
            if (!in_range) {
                throw std::runtime_error("max_width must be a positive integer no larger than " +
                                         std::to_string(INT_MAX));
            }
            settings.max_width = static_cast<int>(width.get<std::int64_t>());
        }

        if (j.contains("list_numbering")) {
            settings.list_numbering = parse_list_numbering(j.value("list_numbering", ""));
        }

        if (j.contains("hard_breaks")) {
            settings.hard_breaks = parse_hard_breaks(j.value("hard_breaks", ""));
        }

        if (j.contains("formatters")) {
            if (!j["formatters"].is_array()) {
                throw std::runtime_error("formatters must be an array");
            }
            for (const auto& entry : j["formatters"]) {
                if (!entry.is_object() || !entry.contains("languages") || !entry.contains("command")) {
                    throw std::runtime_error("each formatter needs languages and command");
                }
                FormatterCommand formatter;
                formatter.languages = string_list(entry["languages"], "formatter languages");
                formatter.command = string_list(entry["command"], "formatter command");
                if (formatter.command.empty()) {
                    throw std::runtime_error("formatter command must not be empty");
                }
                settings.formatters.push_back(std::move(formatter));
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(name + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(name + ": " + e.what());
    }
    return settings;
}

std::optional<Settings> load_settings(const std::string& path) {
    if (!fs::exists(path)) {
        verbose_log("settings", path + " not found, using defaults");
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open settings file " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    Settings settings = parse_settings(buffer.str(), path);
    verbose_log("settings", "loaded " + path + " (" +
                std::to_string(settings.formatters.size()) + " formatters)");
    return settings;
}

void apply_settings(const Settings& settings, RendererConfig& config) {
    if (settings.max_width) config.max_width = *settings.max_width;
    if (settings.list_numbering) config.list_numbering = *settings.list_numbering;
    if (settings.hard_breaks) config.hard_breaks = *settings.hard_breaks;

    for (const auto& formatter : settings.formatters) {
        config.formatters.push_back({
            formatter.languages,
            std::make_shared<CommandFormatter>(formatter.command)
        });
    }
}

} // namespace marker

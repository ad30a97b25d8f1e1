#pragma once

/**
 * Settings for the marker CLI.
 *
 * Handles loading of rendering settings from a local JSON file: reflow width,
 * list numbering, hard break policy and external code formatters.
 */

#include "markdown_renderer.hpp"

#include <optional>
#include <string>
#include <vector>

namespace marker {

/**
 * An external program registered as the code formatter for some languages.
 */
struct FormatterCommand {
    std::vector<std::string> languages;  // Fenced code info tags, e.g. "go".
    std::vector<std::string> command;    // Program and arguments.
};

/**
 * Settings stored in .marker.json. Unset fields keep the renderer defaults.
 */
struct Settings {
    std::optional<int> max_width;
    std::optional<ListNumbering> list_numbering;
    std::optional<HardBreakPolicy> hard_breaks;
    std::vector<FormatterCommand> formatters;  // In file order.
};

// Loads settings from path. Returns empty optional if the file doesn't exist.
// Throws std::runtime_error if it can't be read or is malformed.
std::optional<Settings> load_settings(const std::string& path);

// Parses settings JSON; name is used in error messages.
Settings parse_settings(const std::string& text, const std::string& name);

// "increment" or "repeat". Throws std::runtime_error otherwise.
ListNumbering parse_list_numbering(const std::string& value);

// "collapse" or "preserve". Throws std::runtime_error otherwise.
HardBreakPolicy parse_hard_breaks(const std::string& value);

// Parses a LANG=COMMAND registration; LANG may be a comma-separated list and
// COMMAND is split on whitespace. Throws std::runtime_error if malformed.
FormatterCommand parse_formatter_option(const std::string& option);

// Copies the set fields into config and appends formatter registrations.
void apply_settings(const Settings& settings, RendererConfig& config);

} // namespace marker

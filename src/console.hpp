#pragma once

#include <string>
#include <iostream>

namespace marker {

// ========== ANSI Escape Codes ==========

// ANSI escape codes for terminal colors.
namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* YELLOW = "\033[33m";
}

/**
 * Diagnostic output helper with color support.
 *
 * Writes user-facing messages to a diagnostic stream (stderr by default) so
 * they never mix with the formatted document on stdout. Colors are used only
 * when the stream is stderr attached to a terminal and TERM is not "dumb".
 */
class Console {
public:
    // Creates a Console writing to out and detects color support.
    explicit Console(std::ostream& out = std::cerr);

    // Prints error message in red.
    void print_error(const std::string& text) const;

    // Prints warning message in yellow.
    void print_warning(const std::string& text) const;

private:
    std::ostream& out_;
    bool colors_enabled_;  // True if the stream supports ANSI colors.

    // Detects and enables color support based on terminal capabilities.
    void enable_colors();

    void print_colored(const std::string& text, const char* color) const;
};

} // namespace marker

#pragma once

/**
 * Application configuration constants.
 *
 * Defines the settings file name and rendering defaults for the marker CLI.
 */

namespace marker {

// ========== File Paths ==========

constexpr const char* SETTINGS_FILE = ".marker.json";  // Local settings file.

// ========== Rendering Defaults ==========

constexpr int DEFAULT_MAX_WIDTH = 80;  // Reflow width when nothing else is given.

// ========== Exit Codes ==========

constexpr int EXIT_FORMAT_ERROR = 1;      // A code formatter failed.
constexpr int EXIT_INVARIANT = 2;         // The parse tree broke a renderer precondition.
constexpr int EXIT_IO_ERROR = 3;          // I/O, parse or configuration failure.

} // namespace marker

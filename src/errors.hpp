#pragma once

/**
 * Error types raised while formatting a document.
 *
 * FormatError is a runtime failure of a code formatter and aborts the render.
 * InvariantViolation signals a programming error inside the renderer (a
 * broken traversal precondition, or kind-specific data read through the
 * wrong node kind) and is not meant to be recovered from.
 */

#include <stdexcept>
#include <string>

namespace marker {

class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& message)
        : std::runtime_error(message) {}
};

class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& message)
        : std::logic_error(message) {}
};

} // namespace marker

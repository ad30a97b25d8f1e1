#pragma once

/**
 * Pluggable formatting for the contents of fenced code blocks.
 *
 * A formatter claims one or more language tags. When a fenced block's
 * language tag matches, its contents are replaced with the formatter's
 * output; blocks with no matching formatter are emitted verbatim.
 */

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace marker {

/**
 * Formats source code of one language.
 */
class CodeFormatter {
public:
    virtual ~CodeFormatter() = default;

    /**
     * Return the formatted equivalent of code.
     * Throws FormatError if the code cannot be formatted.
     */
    virtual std::string format(const std::string& code) = 0;
};

/**
 * A formatter together with the language tags it claims.
 */
struct FormatterRegistration {
    std::vector<std::string> languages;
    std::shared_ptr<CodeFormatter> formatter;
};

/**
 * Maps language tags (case-sensitive) to formatters.
 */
class CodeFormatterRegistry {
public:
    CodeFormatterRegistry() = default;

    // Builds the registry by registering each entry in order.
    explicit CodeFormatterRegistry(const std::vector<FormatterRegistration>& registrations);

    // Claims every tag in languages for formatter. A tag claimed earlier is
    // taken over by the later registration.
    void register_formatter(const std::vector<std::string>& languages,
                            std::shared_ptr<CodeFormatter> formatter);

    // Returns the formatter for tag, or nullptr when none is registered.
    CodeFormatter* lookup(const std::string& tag) const;

    size_t size() const { return formatters_.size(); }

private:
    std::unordered_map<std::string, std::shared_ptr<CodeFormatter>> formatters_;
};

} // namespace marker

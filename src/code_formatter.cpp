#include "code_formatter.hpp"
#include "errors.hpp"

namespace marker {

CodeFormatterRegistry::CodeFormatterRegistry(const std::vector<FormatterRegistration>& registrations) {
    for (const auto& registration : registrations) {
        register_formatter(registration.languages, registration.formatter);
    }
}

void CodeFormatterRegistry::register_formatter(const std::vector<std::string>& languages,
                                               std::shared_ptr<CodeFormatter> formatter) {
    if (!formatter) {
        throw InvariantViolation("null code formatter registered");
    }
    for (const auto& language : languages) {
        formatters_[language] = formatter;
    }
}

CodeFormatter* CodeFormatterRegistry::lookup(const std::string& tag) const {
    auto it = formatters_.find(tag);
    if (it == formatters_.end()) {
        return nullptr;
    }
    return it->second.get();
}

} // namespace marker

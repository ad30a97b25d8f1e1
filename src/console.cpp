#include "console.hpp"
#include <cstdlib>
#include <unistd.h>

namespace marker {

Console::Console(std::ostream& out)
    : out_(out)
    , colors_enabled_(false)
{
    enable_colors();
}

void Console::enable_colors() {
    // Only stderr is checked; any other stream gets plain text.
    if (&out_ != &std::cerr || isatty(STDERR_FILENO) == 0) {
        return;
    }
    const char* term = std::getenv("TERM");
    colors_enabled_ = term && std::string(term) != "dumb";
}

void Console::print_colored(const std::string& text, const char* color) const {
    if (colors_enabled_) {
        out_ << color << text << ansi::RESET << std::endl;
    } else {
        out_ << text << std::endl;
    }
}

void Console::print_error(const std::string& text) const {
    print_colored(text, ansi::RED);
}

void Console::print_warning(const std::string& text) const {
    print_colored(text, ansi::YELLOW);
}

} // namespace marker

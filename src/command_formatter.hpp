#pragma once

#include "code_formatter.hpp"

#include <string>
#include <vector>

namespace marker {

/**
 * Code formatter backed by an external program.
 *
 * The code is written to the program's stdin and its stdout is returned.
 * The program is executed directly (no shell), looked up on PATH. A launch
 * failure, a non-zero exit status or death by signal raises FormatError
 * carrying the program's stderr. The call blocks until the program exits;
 * there is no timeout.
 *
 * Usage:
 *   CommandFormatter gofmt({"gofmt"});
 *   std::string formatted = gofmt.format("package main\nfunc  main(){}\n");
 */
class CommandFormatter : public CodeFormatter {
public:
    explicit CommandFormatter(std::vector<std::string> command);

    std::string format(const std::string& code) override;

    const std::vector<std::string>& command() const { return command_; }

private:
    std::vector<std::string> command_;
};

} // namespace marker

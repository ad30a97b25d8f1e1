#include "reflow.hpp"
#include "text_width.hpp"

namespace marker {

namespace {
    bool is_space(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }

    struct Word {
        size_t start;
        size_t stop;
        size_t width;
    };

    // Find the words of text: the runs between whitespace boundaries.
    std::vector<Word> find_words(std::string_view text) {
        std::vector<Word> words;
        size_t i = 0;
        while (i < text.length()) {
            while (i < text.length() && is_space(text[i])) {
                i++;
            }
            if (i >= text.length()) {
                break;
            }
            size_t start = i;
            while (i < text.length() && !is_space(text[i])) {
                i++;
            }
            words.push_back({start, i, text_width(text.substr(start, i - start))});
        }
        return words;
    }

    // Remove the hard break marker at the end of a raw line: a trailing
    // backslash, or the trailing spaces.
    std::string_view strip_break_marker(std::string_view line) {
        size_t end = line.find_last_not_of(" \t\r\n");
        if (end == std::string_view::npos) {
            return {};
        }
        line = line.substr(0, end + 1);
        if (line.back() == '\\') {
            line.remove_suffix(1);
        }
        return line;
    }

    void append_lines(std::vector<std::string>& out, std::vector<std::string> lines) {
        for (auto& line : lines) {
            out.push_back(std::move(line));
        }
    }
}

std::vector<std::string> reflow(std::string_view text, size_t max_width) {
    std::vector<std::string> result;
    std::vector<Word> words = find_words(text);

    size_t first = 0;
    while (first < words.size()) {
        // The line always takes its first word, even when that word alone is
        // wider than max_width.
        size_t last = first;
        size_t line_width = words[first].width;

        while (last + 1 < words.size() &&
               line_width + 1 + words[last + 1].width < max_width) {
            last++;
            line_width += 1 + words[last].width;
        }

        std::string line;
        line.reserve(line_width);
        for (size_t i = first; i <= last; i++) {
            if (i > first) {
                line += ' ';
            }
            line.append(text.substr(words[i].start, words[i].stop - words[i].start));
        }
        result.push_back(std::move(line));
        first = last + 1;
    }

    return result;
}

std::vector<std::string> reflow_block(const std::vector<SourceLine>& lines,
                                      size_t max_width,
                                      HardBreakPolicy policy) {
    std::vector<std::string> result;
    std::string run;

    for (size_t i = 0; i < lines.size(); i++) {
        const SourceLine& line = lines[i];
        // A break on the last line of a block is not a break.
        bool breaks_here = line.hard_break && i + 1 < lines.size();

        if (!run.empty()) {
            run += '\n';
        }
        run.append(breaks_here ? strip_break_marker(line.text) : line.text);

        if (breaks_here && policy == HardBreakPolicy::Preserve) {
            std::vector<std::string> wrapped = reflow(run, max_width);
            if (!wrapped.empty()) {
                wrapped.back() += '\\';
            }
            append_lines(result, std::move(wrapped));
            run.clear();
        }
    }

    append_lines(result, reflow(run, max_width));
    return result;
}

} // namespace marker

#include "text_width.hpp"

namespace marker {

size_t text_width(std::string_view text) {
    size_t width = 0;
    size_t i = 0;

    while (i < text.length()) {
        unsigned char c = static_cast<unsigned char>(text[i]);

        if ((c & 0x80) == 0) {
            // ASCII (1 byte)
            width++;
            i++;
        } else if ((c & 0xE0) == 0xC0) {
            // 2-byte UTF-8
            width++;
            i += 2;
        } else if ((c & 0xF0) == 0xE0) {
            // 3-byte UTF-8
            width++;
            i += 3;
        } else if ((c & 0xF8) == 0xF0) {
            // 4-byte UTF-8
            width++;
            i += 4;
        } else {
            // Invalid or continuation byte, skip
            i++;
        }
    }

    return width;
}

} // namespace marker

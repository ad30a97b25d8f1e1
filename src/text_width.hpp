#pragma once

#include <cstddef>
#include <string_view>

namespace marker {

/**
 * Width of a UTF-8 string in columns.
 * Counts code points, assuming each occupies one column. Stray
 * continuation bytes are not counted.
 */
size_t text_width(std::string_view text);

} // namespace marker

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace loglyzer {

std::string to_lower_copy(std::string_view input);

// Length of the well-formed UTF-8 sequence starting at `pos`, or 0 when the
// bytes there do not form one (overlong, surrogate, truncated, stray byte).
std::size_t utf8_sequence_length(std::string_view input, std::size_t pos);

// Column count for table layout: one per code point, one per invalid byte.
std::size_t display_width(std::string_view input);

}  // namespace loglyzer

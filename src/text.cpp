#include "loglyzer/text.hpp"

#include <cctype>

namespace loglyzer {
namespace {

bool in_range(unsigned char ch, unsigned char lo, unsigned char hi) { return ch >= lo && ch <= hi; }

}  // namespace

std::string to_lower_copy(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (unsigned char ch : input) {
    out.push_back(static_cast<char>(std::tolower(ch)));
  }
  return out;
}

std::size_t utf8_sequence_length(std::string_view input, std::size_t pos) {
  if (pos >= input.size()) {
    return 0;
  }

  const unsigned char lead = static_cast<unsigned char>(input[pos]);
  if (lead < 0x80) {
    return 1;
  }

  std::size_t length = 0;
  unsigned char second_lo = 0x80;
  unsigned char second_hi = 0xBF;
  if (in_range(lead, 0xC2, 0xDF)) {
    length = 2;
  } else if (in_range(lead, 0xE0, 0xEF)) {
    length = 3;
    if (lead == 0xE0) {
      second_lo = 0xA0;
    } else if (lead == 0xED) {
      second_hi = 0x9F;
    }
  } else if (in_range(lead, 0xF0, 0xF4)) {
    length = 4;
    if (lead == 0xF0) {
      second_lo = 0x90;
    } else if (lead == 0xF4) {
      second_hi = 0x8F;
    }
  } else {
    return 0;
  }

  if (pos + length > input.size()) {
    return 0;
  }
  if (!in_range(static_cast<unsigned char>(input[pos + 1]), second_lo, second_hi)) {
    return 0;
  }
  for (std::size_t i = 2; i < length; ++i) {
    if (!in_range(static_cast<unsigned char>(input[pos + i]), 0x80, 0xBF)) {
      return 0;
    }
  }
  return length;
}

std::size_t display_width(std::string_view input) {
  std::size_t width = 0;
  std::size_t pos = 0;
  while (pos < input.size()) {
    const std::size_t length = utf8_sequence_length(input, pos);
    pos += length == 0 ? 1 : length;
    ++width;
  }
  return width;
}

}  // namespace loglyzer

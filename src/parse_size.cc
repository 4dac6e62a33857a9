#include "declutter/parse_size.hh"

#include <array>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <string>

namespace declutter {

namespace utils {

namespace {

constexpr std::string_view unit_dict = "KMGTPE";

bool is_num(const char c) noexcept { return c >= '0' && c <= '9'; }

[[noreturn]] void invalid(const std::string_view size_str) {
  throw std::invalid_argument("invalid size string: " + std::string(size_str));
}

}  // namespace

uint64_t parse_size(const std::string_view size_str) {
  std::size_t i = 0;
  uint64_t size_num = 0;
  for (; i < size_str.size() && is_num(size_str[i]); ++i) {
    const auto digit = (uint64_t)(size_str[i] - '0');
    if (size_num > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
      invalid(size_str);
    }
    size_num = size_num * 10 + digit;
  }
  if (i == 0) {
    invalid(size_str);
  }

  std::size_t scale = 0;
  if (i < size_str.size()) {
    const auto unit = unit_dict.find((char)(size_str[i] & ~0x20));
    if (unit != std::string_view::npos) {
      scale = unit + 1;
      ++i;
    }
  }
  uint64_t base = 1000;
  if (scale != 0 && i < size_str.size() && size_str[i] == 'i') {
    base = 1024;
    ++i;
  }
  bool as_bit = false;
  if (i < size_str.size()) {
    if (size_str[i] == 'b') {
      as_bit = true;
    } else if (size_str[i] != 'B') {
      invalid(size_str);
    }
    ++i;
  }
  if (i != size_str.size()) {
    invalid(size_str);
  }

  for (; scale > 0; --scale) {
    if (size_num > std::numeric_limits<uint64_t>::max() / base) {
      invalid(size_str);
    }
    size_num *= base;
  }
  return as_bit ? size_num / 8 : size_num;
}

std::string human_size(const uint64_t size) {
  static constexpr std::array<const char *, 7> units{"B",   "KiB", "MiB", "GiB",
                                                      "TiB", "PiB", "EiB"};
  auto value = (double)size;
  std::size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < units.size()) {
    value /= 1024.0;
    ++unit;
  }
  std::array<char, 32> buf{};
  std::snprintf(buf.data(), buf.size(), "%.1f%s", value, units[unit]);
  return buf.data();
}

}  // namespace utils

}  // namespace declutter

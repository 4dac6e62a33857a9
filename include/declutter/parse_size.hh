#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace declutter {

namespace utils {

/**
 * @brief parse a size string such as "512", "4K", "1GiB", "100MB", "8Mib"
 *
 * K/M/G/T/P/E scale by 1000, with a trailing 'i' by 1024, a trailing 'b'
 * counts bits
 *
 * @throws std::invalid_argument if not a valid size string
 */
uint64_t parse_size(std::string_view size_str);

/**
 * @brief size rounded to one decimal with a binary unit, e.g. "1.5GiB"
 */
std::string human_size(uint64_t size);

}  // namespace utils

}  // namespace declutter

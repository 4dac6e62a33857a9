#pragma once

#include <bit>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "declutter/config.hh"
#include "declutter/file_entry.hh"
#include "declutter/file_record.hh"

namespace declutter {

inline namespace detail_v1 {

inline constexpr uint32_t hamming_distance(const uint64_t lhs,
                                           const uint64_t rhs) noexcept {
  return (uint32_t)std::popcount(lhs ^ rhs);
}

/**
 * @brief whether the extension names an image format we try to decode
 */
bool is_image_path(const std::filesystem::path &path);

/**
 * @brief byte length of the digest produced by an algorithm
 * @throws std::invalid_argument if algo is unknown
 */
std::size_t digest_size(const std::string &algo);

/**
 * @brief difference hash over a fixed 9x8 grayscale downsample,
 * std::nullopt if the image can not be decoded
 */
std::optional<uint64_t> perceptual_digest(const std::filesystem::path &path);

/**
 * @brief digest one file, read-only
 *
 * unreadable and zero-byte files get the all-zero sentinel digest and an
 * error marker instead of failing
 *
 * @param entry file to digest
 * @param config digest_algo selects the hash
 * @throws std::invalid_argument if config.digest_algo is unknown
 */
file_record_t fingerprint(const file_entry_t &entry, const config_t &config);

/**
 * @brief digest all entries on a thread pool of config.max_thread workers,
 * returns when every file is done
 *
 * @return records in the same order as entries
 */
file_record_vec fingerprint_all(const file_entry_vec &entries,
                                const config_t &config);

}  // namespace detail_v1

}  // namespace declutter

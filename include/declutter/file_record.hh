#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "declutter/file_entry.hh"

namespace declutter {

inline namespace detail_v1 {

using digest_t = std::vector<uint8_t>;

enum class scan_error_t : uint8_t {
  none,
  unreadable,  // open or read failed
  empty        // zero-byte file, nothing to compare
};

enum class action_t : uint8_t { keep, archive, remove };

std::string_view to_string(scan_error_t err) noexcept;
std::string_view to_string(action_t act) noexcept;

/**
 * @brief immutable fingerprint of one file, produced once per scan pass
 */
class file_record_t {
  std::filesystem::path _path;
  uint64_t _size = 0;
  time_point_t _mtime;
  digest_t _digest;
  std::optional<uint64_t> _phash;
  scan_error_t _error = scan_error_t::none;

 public:
  inline file_record_t(const file_entry_t &entry, digest_t digest,
                       std::optional<uint64_t> phash,
                       const scan_error_t error)
      : _path(entry.path()),
        _size(entry.size()),
        _mtime(entry.mtime()),
        _digest(std::move(digest)),
        _phash(phash),
        _error(error) {}

  inline file_record_t(const file_record_t &rhs) = default;
  inline file_record_t(file_record_t &&rhs) = default;
  inline file_record_t &operator=(const file_record_t &rhs) = default;
  inline file_record_t &operator=(file_record_t &&rhs) = default;

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline uint64_t size() const noexcept { return _size; }
  inline time_point_t mtime() const noexcept { return _mtime; }
  inline const digest_t &digest() const noexcept { return _digest; }
  inline const std::optional<uint64_t> &phash() const noexcept {
    return _phash;
  }
  inline scan_error_t error() const noexcept { return _error; }
  inline bool ok() const noexcept { return _error == scan_error_t::none; }
};

using file_record_vec = std::vector<file_record_t>;

}  // namespace detail_v1

}  // namespace declutter

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <utility>
#include <vector>

namespace declutter {

inline namespace detail_v1 {

using time_point_t = std::chrono::system_clock::time_point;

/**
 * @brief one file as reported by the directory walker
 */
class file_entry_t {
  std::filesystem::path _path;
  uint64_t _size = 0;
  time_point_t _mtime;

 public:
  template <typename Tp>
  inline file_entry_t(Tp &&path, const uint64_t size,
                      const time_point_t mtime) noexcept(
      noexcept(std::filesystem::path(std::forward<Tp>(path))))
      : _path(std::forward<Tp>(path)), _size(size), _mtime(mtime) {}

  inline file_entry_t(const file_entry_t &rhs) = default;
  inline file_entry_t(file_entry_t &&rhs) = default;
  inline file_entry_t &operator=(const file_entry_t &rhs) = default;
  inline file_entry_t &operator=(file_entry_t &&rhs) = default;

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline uint64_t size() const noexcept { return _size; }
  inline time_point_t mtime() const noexcept { return _mtime; }
};

using file_entry_vec = std::vector<file_entry_t>;

}  // namespace detail_v1

}  // namespace declutter

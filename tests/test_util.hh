#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include "declutter/config.hh"
#include "declutter/file_entry.hh"
#include "declutter/file_record.hh"

namespace test_util {

namespace fs = std::filesystem;

// fixed reference time so ages do not depend on the clock
inline const declutter::time_point_t ref_now =
    declutter::time_point_t(std::chrono::hours(24 * 365 * 50));

inline declutter::time_point_t days_ago(const double days) {
  return ref_now - std::chrono::duration_cast<std::chrono::system_clock::duration>(
                       std::chrono::duration<double>(days * 86400.0));
}

// scratch directory removed on scope exit
class temp_dir_t {
  fs::path _path;

 public:
  explicit temp_dir_t(const std::string &name) {
    static std::atomic<uint32_t> counter{0};
    _path = fs::temp_directory_path() /
            ("declutter_" + name + "_" + std::to_string(::getpid()) + "_" +
             std::to_string(counter++));
    fs::create_directories(_path);
  }
  ~temp_dir_t() {
    std::error_code ec;
    fs::remove_all(_path, ec);
  }
  temp_dir_t(const temp_dir_t &) = delete;
  temp_dir_t &operator=(const temp_dir_t &) = delete;

  const fs::path &path() const noexcept { return _path; }

  fs::path write(const std::string &name, const std::string &content) const {
    auto file = _path / name;
    fs::create_directories(file.parent_path());
    std::ofstream ofs(file, std::ios::binary | std::ios::trunc);
    ofs << content;
    return file;
  }
};

inline declutter::file_entry_t entry_of(const fs::path &path,
                                        const double age_days) {
  return declutter::file_entry_t(path, fs::file_size(path), days_ago(age_days));
}

inline declutter::config_t quiet_config(std::ostream &log) {
  declutter::config_t config;
  config.now = ref_now;
  config.log_stream = &log;
  config.max_thread = 2;
  return config;
}

inline declutter::file_record_t record_of(const std::string &path,
                                          const uint8_t digest_byte,
                                          const double age_days,
                                          std::optional<uint64_t> phash = {},
                                          uint64_t size = 100) {
  return declutter::file_record_t(
      declutter::file_entry_t(path, size, days_ago(age_days)),
      declutter::digest_t(16, digest_byte), phash,
      declutter::scan_error_t::none);
}

}  // namespace test_util

#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <ostream>
#include <regex>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "declutter/file_entry.hh"

namespace declutter {

inline namespace detail_v1 {

inline bool is_excluded(const std::filesystem::path &path,
                        const std::vector<std::regex> &exclude_regex) {
  for (const auto &regex : exclude_regex) {
    if (std::regex_match(path.native(), regex)) {
      return true;
    }
  }
  return false;
}

/**
 * @brief list directory recursively, skips symlinks and unreadable entries,
 * zero-byte files are listed
 *
 * @param dir directory path
 * @param[out] file_list regular files, no order guarantee
 * @param mtx mutex for protecting file_list
 * @param pool thread pool for recursive calls
 * @param exclude_regex regular expression to exclude files or directories
 * @param log_stream sink for skip warnings
 */
void ls_dir_rec(const std::filesystem::path dir, file_entry_vec &file_list,
                std::mutex &mtx, boost::asio::thread_pool &pool,
                const std::vector<std::regex> &exclude_regex,
                std::ostream &log_stream);

/**
 * @brief list every regular file under search_dir
 *
 * @param search_dir directories to search
 * @param exclude_regex regular expression to exclude files or directories
 * @param max_thread maximum number of threads to use
 * @param log_stream sink for progress and skip warnings
 */
file_entry_vec list_files(const std::vector<std::filesystem::path> &search_dir,
                          const std::vector<std::regex> &exclude_regex,
                          uint32_t max_thread, std::ostream &log_stream);

}  // namespace detail_v1

}  // namespace declutter

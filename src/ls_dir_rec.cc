#include "declutter/ls_dir_rec.hh"

#include <chrono>
#include <functional>
#include <system_error>

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio.hpp>

#include "declutter/log.hh"

namespace declutter {

inline namespace detail_v1 {

namespace {

time_point_t to_sys(const std::filesystem::file_time_type ftime) {
  return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      std::chrono::file_clock::to_sys(ftime));
}

}  // namespace

void ls_dir_rec(const std::filesystem::path dir, file_entry_vec &file_list,
                std::mutex &mtx, boost::asio::thread_pool &pool,
                const std::vector<std::regex> &exclude_regex,
                std::ostream &log_stream) {
  const logger_t logger(log_stream);
  file_entry_vec file_list_tmp;
  try {
    for (const auto &dir_entry : std::filesystem::directory_iterator(dir)) {
      if (is_excluded(dir_entry.path(), exclude_regex)) {
        // exclude, skip
        logger.log("exclude: ", dir_entry.path());

      } else if (dir_entry.is_symlink()) {
        // symlink, skip
        logger.warn("skip symlink: ", dir_entry.path());

      } else if (dir_entry.is_directory()) {
        // directory, recursive call
        boost::asio::post(
            pool, std::bind(ls_dir_rec, dir_entry.path(), std::ref(file_list),
                            std::ref(mtx), std::ref(pool),
                            std::cref(exclude_regex), std::ref(log_stream)));

      } else if (dir_entry.is_regular_file()) {
        // regular file, add to list
        std::error_code ec;
        auto file_size = dir_entry.file_size(ec);
        std::filesystem::file_time_type mtime;
        if (!ec) {
          mtime = dir_entry.last_write_time(ec);
        }
        if (ec) {
          // error reading metadata, skip
          logger.warn("skip file: ", dir_entry.path(), " - ", ec.message());
        } else {
          file_list_tmp.emplace_back(dir_entry.path(), file_size,
                                     to_sys(mtime));
        }

      } else {
        // other file type, skip
        logger.warn("skip unsupport file: ", dir_entry.path());
      }
    }
  } catch (std::filesystem::filesystem_error &e) {
    // error iterate directory, skip
    logger.warn("skip directory: ", dir, " - ", e.code().message());
  }

  // append to global list
  if (!file_list_tmp.empty()) {
    std::lock_guard lk(mtx);
    file_list.insert(file_list.end(),
                     std::make_move_iterator(file_list_tmp.begin()),
                     std::make_move_iterator(file_list_tmp.end()));
  }
}

file_entry_vec list_files(const std::vector<std::filesystem::path> &search_dir,
                          const std::vector<std::regex> &exclude_regex,
                          const uint32_t max_thread, std::ostream &log_stream) {
  const logger_t logger(log_stream);
  timer_t timer;
  file_entry_vec file_list;
  logger.log("list files...");
  {
    boost::asio::thread_pool pool(max_thread == 0 ? 1 : max_thread);
    std::mutex mtx;
    for (const auto &dir : search_dir) {
      if (is_excluded(dir, exclude_regex)) {
        logger.log("exclude: ", dir);
        continue;
      }
      boost::asio::post(
          pool, std::bind(ls_dir_rec, std::filesystem::absolute(dir),
                          std::ref(file_list), std::ref(mtx), std::ref(pool),
                          std::cref(exclude_regex), std::ref(log_stream)));
    }
    pool.join();
  }
  logger.log("elapsed: ", timer.time().count(), "ms");
  logger.log("file count: ", file_list.size());
  return file_list;
}

}  // namespace detail_v1

}  // namespace declutter

#pragma once

#include <chrono>
#include <ostream>
#include <string_view>
#include <version>

#if __cpp_lib_syncbuf >= 201803L

#include <syncstream>

namespace declutter {

inline namespace detail_v1 {

using oss = std::osyncstream;

}  // namespace detail_v1

}  // namespace declutter

#else

#include <mutex>

namespace declutter {

inline namespace detail_v1 {

// line-atomic stream for toolchains without osyncstream
class oss {
  inline static std::mutex _mtx;
  std::ostream &_os;

 public:
  oss() = delete;
  inline explicit oss(std::ostream &os) : _os(os) { _mtx.lock(); }
  inline ~oss() { _mtx.unlock(); }

  oss(const oss &) = delete;
  oss(oss &&) = delete;
  oss &operator=(const oss &) = delete;
  oss &operator=(oss &&) = delete;

  template <typename Tp>
  inline oss &operator<<(const Tp &val) {
    _os << val;
    return *this;
  }
};

}  // namespace detail_v1

}  // namespace declutter

#endif

namespace declutter {

inline namespace detail_v1 {

/**
 * @brief tagged line logger on top of oss, safe to share between threads
 */
class logger_t {
  std::ostream *_os;

  template <typename... Args>
  inline void write(std::string_view tag, const Args &...args) const {
    oss out(*_os);
    out << tag;
    ((out << args), ...);
    out << '\n';
  }

 public:
  inline explicit logger_t(std::ostream &os) noexcept : _os(&os) {}

  template <typename... Args>
  inline void log(const Args &...args) const {
    write("[log] ", args...);
  }
  template <typename... Args>
  inline void warn(const Args &...args) const {
    write("[warn] ", args...);
  }
  template <typename... Args>
  inline void err(const Args &...args) const {
    write("[err] ", args...);
  }
};

class timer_t {
  std::chrono::steady_clock::time_point _prev_time;

 public:
  timer_t() noexcept : _prev_time(std::chrono::steady_clock::now()) {}
  std::chrono::milliseconds time() noexcept {
    auto cur_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        cur_time - _prev_time);
    _prev_time = cur_time;
    return duration;
  }
};

}  // namespace detail_v1

}  // namespace declutter

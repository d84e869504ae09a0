#pragma once

#include <iostream>
#include <version>

namespace undup {

inline namespace detail_v1 {

/**
 * @brief stream log lines are written to, std::cerr unless redirected
 */
std::ostream &log_stream() noexcept;

/**
 * @brief redirect log lines
 *
 * @param os new log stream, must outlive every later log call
 */
void set_log_stream(std::ostream &os) noexcept;

}  // namespace detail_v1

}  // namespace undup

#if __cpp_lib_syncbuf >= 201803L

#include <syncstream>

namespace undup {

inline namespace detail_v1 {

// osyncstream is provided
using oss = std::osyncstream;

}  // namespace detail_v1

}  // namespace undup

#else

#include <mutex>

namespace undup {

inline namespace detail_v1 {

// self-implemented osyncstream
class oss {
 private:
  inline static std::mutex _mtx;
  std::ostream &_os;

 public:
  oss() = delete;
  inline oss(std::ostream &os) : _os(os) { _mtx.lock(); }
  inline ~oss() {
    _os.flush();
    _mtx.unlock();
  }

  oss(const oss &) = delete;
  oss(oss &&) = delete;
  oss &operator=(const oss &) = delete;
  oss &operator=(oss &&) = delete;

  template <typename Tp>
  inline oss &operator<<(const Tp &val) {
    _os << val;
    return *this;
  }
  inline operator std::ostream &() noexcept { return _os; }
};

}  // namespace detail_v1

}  // namespace undup

#endif

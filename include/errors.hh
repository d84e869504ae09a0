#pragma once

#include <stdexcept>
#include <string>

namespace undup {

inline namespace detail_v1 {

// base of every error the index reports
class error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// store unreachable, corrupt, locked past the busy timeout, or a record is
// missing
class storage_error : public error {
  int _code = 0;

 public:
  explicit storage_error(const std::string &what, const int code = 0)
      : error(what), _code(code) {}

  // sqlite result code, 0 when the error did not come from sqlite
  inline int code() const noexcept { return _code; }
};

// content changed between duplicate discovery and merge
class checksum_mismatch : public error {
 public:
  using error::error;
};

// symlinks are tracked, never merged
class symlink_not_mergeable : public error {
 public:
  using error::error;
};

}  // namespace detail_v1

}  // namespace undup

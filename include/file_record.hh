#pragma once

#include <string>
#include <utility>

namespace undup {

inline namespace detail_v1 {

class file_record_t {
  std::string _path;
  std::string _checksum;
  bool _symlink = false;
  bool _linked = false;

 public:
  template <typename Tp, typename Up>
  inline file_record_t(Tp &&path, Up &&checksum, const bool symlink = false,
                       const bool linked = false)
      : _path(std::forward<Tp>(path)),
        _checksum(std::forward<Up>(checksum)),
        _symlink(symlink),
        _linked(linked) {}

  inline file_record_t(const file_record_t &rhs) = default;
  inline file_record_t(file_record_t &&rhs) = default;
  inline file_record_t &operator=(const file_record_t &rhs) = default;
  inline file_record_t &operator=(file_record_t &&rhs) = default;

  bool operator==(const file_record_t &rhs) const = default;

  inline const std::string &path() const noexcept { return _path; }
  inline const std::string &checksum() const noexcept { return _checksum; }
  inline bool symlink() const noexcept { return _symlink; }
  // storage already shared with another path of the same checksum
  inline bool linked() const noexcept { return _linked; }
};

}  // namespace detail_v1

}  // namespace undup

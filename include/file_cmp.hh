#pragma once

#include <xxhash.h>

#include <bit>
#include <compare>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

#include "config.hh"

namespace undup {

inline namespace detail_v1 {

// tools for calculating max_hash

inline constexpr auto log2_ceil(const auto x) noexcept {
  auto next_pow2 = std::bit_ceil(x);
  return std::countr_zero(next_pow2);
}

inline constexpr auto div_ceil(const auto x, const auto y) noexcept {
  return (x + y - 1) / y;
}

// number of doubling hash blocks needed to cover size bytes
inline constexpr uint32_t max_hash_for(const uint64_t size) noexcept {
  return (uint32_t)log2_ceil(div_ceil(size, (uint64_t)hash_blk_sz)) + 1U;
}

class file_cmp_t {
  // using mutable to allow lazy hashing during comparison

  std::filesystem::path _path;
  uint64_t _size;
  mutable std::vector<XXH128_hash_t> _file_hashes;
  mutable uint64_t _remain_sz;
  mutable std::ifstream _file_stream;
  mutable std::vector<char> _buf;
  uint32_t _max_hash;

  /**
   * @brief lazy hash file content
   *
   * @param idx hash block index
   * @throws std::filesystem::filesystem_error on short read
   */
  void lazy_hash(uint32_t idx) const;
  void open_file() const;
  void close_file() const noexcept;

 public:
  file_cmp_t() = delete;
  file_cmp_t(std::filesystem::path path, uint64_t size, uint32_t max_hash);

  file_cmp_t(const file_cmp_t &) = delete;
  file_cmp_t(file_cmp_t &&) = default;
  file_cmp_t &operator=(const file_cmp_t &) = delete;
  file_cmp_t &operator=(file_cmp_t &&) = default;

  std::strong_ordering operator<=>(const file_cmp_t &rhs) const;
  inline bool operator==(const file_cmp_t &rhs) const {
    return (*this <=> rhs) == std::strong_ordering::equal;
  }

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline uint64_t size() const noexcept { return _size; }
};

/**
 * @brief compare the current bytes of two files,
 * hard links of one inode are equal without reading.
 *
 * @return true if both files hold the same content
 * @throws std::filesystem::filesystem_error either file cannot be read
 */
bool same_content(const std::filesystem::path &lhs,
                  const std::filesystem::path &rhs);

}  // namespace detail_v1

}  // namespace undup

#pragma once

#include <filesystem>

namespace undup {

inline namespace detail_v1 {

// makes one path share another path's storage
class linker_t {
 public:
  virtual ~linker_t() = default;

  /**
   * @brief redirect dup's storage to anchor's content
   *
   * @throws checksum_mismatch the two files no longer hold the same bytes
   * @throws std::filesystem::filesystem_error
   */
  virtual void link(const std::filesystem::path &anchor,
                    const std::filesystem::path &dup) = 0;

  // both paths already use the same storage
  virtual bool shares_storage(const std::filesystem::path &lhs,
                              const std::filesystem::path &rhs) const = 0;
};

// hard links dup to anchor after comparing their bytes
class hard_linker_t final : public linker_t {
 public:
  void link(const std::filesystem::path &anchor,
            const std::filesystem::path &dup) override;
  bool shares_storage(const std::filesystem::path &lhs,
                      const std::filesystem::path &rhs) const override;
};

}  // namespace detail_v1

}  // namespace undup

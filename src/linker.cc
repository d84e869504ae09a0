#include "linker.hh"

#include "errors.hh"
#include "file_cmp.hh"
#include "fs_ops.hh"

namespace undup {

inline namespace detail_v1 {

void hard_linker_t::link(const std::filesystem::path &anchor,
                         const std::filesystem::path &dup) {
  if (same_file(anchor, dup)) {
    return;
  }
  // the stored checksums may be stale, trust only the bytes on disk
  if (!same_content(anchor, dup)) {
    throw checksum_mismatch("content of " + dup.string() + " differs from " +
                            anchor.string());
  }
  link_file(anchor, dup);
}

bool hard_linker_t::shares_storage(const std::filesystem::path &lhs,
                                   const std::filesystem::path &rhs) const {
  return same_file(lhs, rhs);
}

}  // namespace detail_v1

}  // namespace undup

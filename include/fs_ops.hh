#pragma once

#include <filesystem>

#include "config.hh"

namespace undup {

inline namespace detail_v1 {

enum class dup_action_t {
  log,          // report duplicate only
  move,         // move duplicate into the holding directory
  move_symlink  // move duplicate, leave an absolute symlink to the anchor
};

/**
 * @brief destination for src inside dstdir, keeping the part of src's path
 * not shared with dstdir, e.g. /usr/local/a.txt into /media/cd gives
 * /media/cd/usr/local/a.txt
 *
 * @throws std::invalid_argument empty argument, or src would map onto itself
 */
std::filesystem::path dst_with_subdirectory(const std::filesystem::path &src,
                                            const std::filesystem::path &dstdir);

/**
 * @brief create the parent directories of path
 *
 * @return the parent directory
 * @throws std::invalid_argument empty path
 */
std::filesystem::path safe_makedirs(const std::filesystem::path &path);

/**
 * @brief remove path if it exists, a symlink itself is removed, not its target
 *
 * @return true if something was removed
 */
bool safe_unlink(const std::filesystem::path &path);

/**
 * @brief two paths name the same inode, false if either is missing
 */
bool same_file(const std::filesystem::path &lhs,
               const std::filesystem::path &rhs) noexcept;

/**
 * @brief move a file, creating dst's parent directories
 *
 * @param rm_empty_dirs remove src's parent directory if it became empty
 */
void move_file(const std::filesystem::path &src,
               const std::filesystem::path &dst, bool rm_empty_dirs = true);

/**
 * @brief replace link with an absolute symlink to target
 *
 * @throws std::invalid_argument target missing or link empty
 */
void UNDUP_EXPORT symlink_file(const std::filesystem::path &target,
                               const std::filesystem::path &link);

/**
 * @brief replace link with a hard link to target, both must be on one
 * filesystem. Link is swapped in with a rename, so it never goes missing.
 *
 * @return false if link already names target's inode
 * @throws std::invalid_argument target missing or link empty
 */
bool UNDUP_EXPORT link_file(const std::filesystem::path &target,
                            const std::filesystem::path &link);

}  // namespace detail_v1

}  // namespace undup

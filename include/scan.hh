#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <regex>
#include <string>
#include <vector>

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio/thread_pool.hpp>

#include "config.hh"

namespace undup {

inline namespace detail_v1 {

struct scan_entry_t {
  std::string path;
  std::string checksum;
  bool symlink = false;
};

struct scan_stats_t {
  std::size_t files = 0;
  std::size_t symlinks = 0;
  std::size_t skipped = 0;
  std::size_t merged = 0;
  std::size_t mismatched = 0;
};

inline bool is_excluded(const std::filesystem::path &path,
                        const std::vector<std::regex> &exclude_regex) {
  for (const auto &regex : exclude_regex) {
    if (std::regex_match(path.native(), regex)) {
      return true;
    }
  }
  return false;
}

inline bool is_excluded(const std::filesystem::path &path,
                        const std::vector<std::regex> &exclude_regex,
                        const std::vector<std::filesystem::path> &exclude_path) {
  for (const auto &excluded : exclude_path) {
    if (path == excluded) {
      return true;
    }
  }
  return is_excluded(path, exclude_regex);
}

// state shared by the jobs of one scan
struct scan_job_t {
  std::vector<scan_entry_t> &entries;
  std::mutex &mtx;
  boost::asio::thread_pool &pool;
  const std::vector<std::regex> &exclude_regex;
  const std::vector<std::filesystem::path> &exclude_path;
  const std::string &digest;
  std::atomic<std::size_t> &skipped;
};

/**
 * @brief list directory recursively, hashing regular files and symlinks to
 * regular files on the pool. Empty files and anything unreadable are skipped.
 *
 * @param dir directory path
 * @param job shared scan state, entries are appended under job.mtx
 */
void ls_dir_rec(const std::filesystem::path dir, const scan_job_t &job);

/**
 * @brief hash every file below root
 *
 * @param root directory to walk
 * @param exclude_regex regular expression to exclude files or directories
 * @param digest digest name for file_checksum
 * @param max_thread maximum number of threads to use
 * @param[out] skipped number of entries that could not be hashed
 * @param exclude_path absolute paths to leave out, matched exactly
 * @return entries sorted by path
 * @throws std::invalid_argument root is not a directory
 */
std::vector<scan_entry_t> scan_tree(
    const std::filesystem::path &root,
    const std::vector<std::regex> &exclude_regex, const std::string &digest,
    uint32_t max_thread, std::size_t &skipped,
    const std::vector<std::filesystem::path> &exclude_path = {});

}  // namespace detail_v1

}  // namespace undup

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "config.hh"
#include "file_record.hh"
#include "fs_ops.hh"
#include "linker.hh"
#include "scan.hh"
#include "schema.hh"
#include "sqlite.hh"

namespace undup {

inline namespace detail_v1 {

/**
 * @brief lazy, restartable sequence of duplicate records,
 * borrows its index's connection and must not outlive it.
 */
class dup_cursor_t {
  stmt_t _stmt;
  bool _done = false;

 public:
  explicit dup_cursor_t(stmt_t stmt) noexcept : _stmt(std::move(stmt)) {}

  /**
   * @brief next record, linked records first, then in insertion order
   *
   * @return nullopt at the end
   * @throws storage_error
   */
  std::optional<file_record_t> next();

  // start over from the first record
  void reset() noexcept;
};

class UNDUP_EXPORT dedup_index_t {
  std::filesystem::path _file;
  db_t _db;
  schema_t _schema;
  std::string _digest;
  std::unique_ptr<linker_t> _linker;

  // storage_error unless the store is at the current schema
  void require_current() const;
  std::optional<file_record_t> load(const std::string &path);
  std::vector<file_record_t> duplicates_of(const std::string &checksum);

 public:
  /**
   * @brief open or create a store
   *
   * @param file sqlite database file
   * @param options digest, busy timeout, create flag
   * @param linker filesystem collaborator for merge, hard links if null
   * @throws storage_error, std::invalid_argument unknown digest
   */
  explicit dedup_index_t(const std::filesystem::path &file,
                         const index_options_t &options = {},
                         std::unique_ptr<linker_t> linker = nullptr);

  dedup_index_t(const dedup_index_t &) = delete;
  dedup_index_t(dedup_index_t &&) = delete;
  dedup_index_t &operator=(const dedup_index_t &) = delete;
  dedup_index_t &operator=(dedup_index_t &&) = delete;

  inline const std::filesystem::path &file() const noexcept { return _file; }
  inline const schema_t &schema() const noexcept { return _schema; }
  inline const std::string &digest() const noexcept { return _digest; }

  /**
   * @brief insert or replace the record for path, the row keeps its place
   * in insertion order
   *
   * @param linked only merge marks records linked
   * @throws storage_error, std::invalid_argument empty path or checksum
   */
  void upsert(const std::string &path, const std::string &checksum,
              bool symlink, bool linked = false);

  std::optional<file_record_t> get(const std::string &path);
  std::size_t size();

  /**
   * @brief delete the record for path
   *
   * @return false if there was none
   */
  bool remove(const std::string &path);

  /**
   * @brief move records of old_path and everything below it to new_path,
   * records already at the destination are replaced
   *
   * @return number of records moved
   */
  std::size_t rename_path(const std::string &old_path,
                          const std::string &new_path);

  /**
   * @brief non-symlink records sharing checksum, empty unless there are at
   * least two of them
   */
  dup_cursor_t find_duplicates(const std::string &checksum);

  // checksums with at least two non-symlink records, sorted
  std::vector<std::string> duplicate_checksums();

  /**
   * @brief make duplicate_path share anchor_path's storage and mark both
   * linked, atomically
   *
   * @throws checksum_mismatch records or file contents differ
   * @throws symlink_not_mergeable either record is a symlink
   * @throws storage_error either record is missing
   */
  void merge(const std::string &anchor_path, const std::string &duplicate_path);

  /**
   * @brief merge every duplicate of checksum into the first one
   *
   * @return number of merges performed
   */
  std::size_t link_duplicates(const std::string &checksum);

  /**
   * @brief hash path, record it and link it to its duplicates
   *
   * @return false if path does not exist
   */
  bool update_checksum(const std::filesystem::path &path);

  /**
   * @brief hash everything below root in one transaction, then link
   * duplicates
   */
  scan_stats_t rescan(const std::filesystem::path &root,
                      const std::vector<std::regex> &exclude_regex = {},
                      uint32_t max_thread = default_threads);

  /**
   * @brief drop records whose path no longer exists
   *
   * @return number of records removed
   */
  std::size_t vacuum();

  /**
   * @brief move every duplicate except the anchor into dupdir
   *
   * @param dupdir holding directory, must be missing or empty
   * @return number of files moved
   * @throws std::invalid_argument dupdir is not empty
   */
  std::size_t relocate_duplicates(const std::filesystem::path &dupdir,
                                  dup_action_t action);

  /**
   * @brief additive schema change, a no-op if the store is already at
   * to_version
   *
   * @param from_version version the caller expects the store to be at
   * @param to_version target version
   * @param strategy native column add or table rebuild
   * @param on_step called before each step, throwing aborts and rolls back
   * @throws storage_error store is at neither version, or a step failed
   */
  void migrate_schema(uint32_t from_version, uint32_t to_version,
                      migration_strategy_t strategy = migration_strategy_t::alter,
                      step_hook_t on_step = nullptr);

  // migrate from the detected version to the current one
  void migrate_schema();
};

}  // namespace detail_v1

}  // namespace undup

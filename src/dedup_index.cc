#include "dedup_index.hh"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include "checksum.hh"
#include "errors.hh"
#include "file_cmp.hh"
#include "oss.hh"

namespace undup {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

// columns: path, chksum, symlink, link
file_record_t to_record(const stmt_t &stmt) {
  return file_record_t(stmt.column_text(0), stmt.column_text(1),
                       stmt.column_int(2) != 0, stmt.column_int(3) != 0);
}

}  // namespace

std::optional<file_record_t> dup_cursor_t::next() {
  if (_done) {
    return std::nullopt;
  }
  if (!_stmt.step()) {
    _done = true;
    return std::nullopt;
  }
  return to_record(_stmt);
}

void dup_cursor_t::reset() noexcept {
  _stmt.reset();
  _done = false;
}

dedup_index_t::dedup_index_t(const fs::path &file,
                             const index_options_t &options,
                             std::unique_ptr<linker_t> linker)
    : _file(file),
      _db(file, options.create_if_missing, options.busy_timeout_ms),
      _linker(linker ? std::move(linker)
                     : std::unique_ptr<linker_t>(
                           std::make_unique<hard_linker_t>())) {
  _schema = detect_schema(_db);
  if (_schema.version == 0U) {
    if (!options.create_if_missing) {
      throw storage_error(file.string() + " is not an undup database");
    }
    if (!is_known_digest(options.digest)) {
      throw std::invalid_argument("invalid hash algorithm: " + options.digest);
    }
    oss(log_stream()) << "[log] create index " << file << " ("
                      << options.digest << ")\n";
    create_schema(_db, options.digest);
    _schema = detect_schema(_db);
  }

  _digest = stored_digest(_db).value_or(options.digest);
  if (!is_known_digest(_digest)) {
    throw std::invalid_argument("invalid hash algorithm: " + _digest);
  }
  if (_schema.version < schema_version) {
    oss(log_stream()) << "[warn] " << file << " uses schema version "
                      << _schema.version << ", migrate it before use\n";
  }
}

void dedup_index_t::require_current() const {
  if (_schema.version != schema_version) {
    throw storage_error(_file.string() +
                        " is laid out according to schema version " +
                        std::to_string(_schema.version) + ", migrate it to " +
                        std::to_string(schema_version) + " first");
  }
}

std::optional<file_record_t> dedup_index_t::load(const std::string &path) {
  stmt_t stmt(_db,
              "SELECT path, chksum, symlink, link FROM files WHERE path = ?1");
  stmt.bind_text(1, path);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return to_record(stmt);
}

std::vector<file_record_t> dedup_index_t::duplicates_of(
    const std::string &checksum) {
  std::vector<file_record_t> group;
  auto cursor = find_duplicates(checksum);
  while (auto rec = cursor.next()) {
    group.emplace_back(std::move(*rec));
  }
  return group;
}

void dedup_index_t::upsert(const std::string &path, const std::string &checksum,
                           const bool symlink, const bool linked) {
  require_current();
  if (path.empty()) {
    throw std::invalid_argument("upsert requires a path");
  }
  if (checksum.empty()) {
    throw std::invalid_argument("upsert requires a checksum for " + path);
  }
  // ON CONFLICT keeps the rowid, REPLACE would move the row to the end
  stmt_t stmt(_db,
              "INSERT INTO files(path, chksum, symlink, link) "
              "VALUES(?1, ?2, ?3, ?4) "
              "ON CONFLICT(path) DO UPDATE SET chksum = excluded.chksum, "
              "symlink = excluded.symlink, link = excluded.link");
  stmt.bind_text(1, path)
      .bind_text(2, checksum)
      .bind_int(3, symlink ? 1 : 0)
      .bind_int(4, linked ? 1 : 0);
  stmt.step();
}

std::optional<file_record_t> dedup_index_t::get(const std::string &path) {
  require_current();
  return load(path);
}

std::size_t dedup_index_t::size() {
  stmt_t stmt(_db, "SELECT count(*) FROM files");
  return stmt.step() ? (std::size_t)stmt.column_int(0) : 0UL;
}

bool dedup_index_t::remove(const std::string &path) {
  require_current();
  stmt_t stmt(_db, "DELETE FROM files WHERE path = ?1");
  stmt.bind_text(1, path);
  stmt.step();
  return _db.changes() > 0;
}

std::size_t dedup_index_t::rename_path(const std::string &old_path,
                                       const std::string &new_path) {
  require_current();
  if (old_path.empty() || new_path.empty()) {
    throw std::invalid_argument("rename requires two paths");
  }
  if (old_path == new_path) {
    return 0UL;
  }

  transaction_t txn(_db);
  {
    stmt_t stmt(_db,
                "DELETE FROM files WHERE path = ?1 "
                "OR substr(path, 1, length(?1) + 1) = ?1 || '/'");
    stmt.bind_text(1, new_path);
    stmt.step();
  }
  std::size_t moved = 0;
  {
    stmt_t stmt(_db,
                "UPDATE files SET path = ?2 || substr(path, length(?1) + 1) "
                "WHERE path = ?1 "
                "OR substr(path, 1, length(?1) + 1) = ?1 || '/'");
    stmt.bind_text(1, old_path).bind_text(2, new_path);
    stmt.step();
    moved = (std::size_t)_db.changes();
  }
  txn.commit();
  return moved;
}

dup_cursor_t dedup_index_t::find_duplicates(const std::string &checksum) {
  require_current();
  stmt_t stmt(_db,
              "SELECT path, chksum, symlink, link FROM files "
              "WHERE chksum = ?1 AND symlink = 0 "
              "AND (SELECT count(*) FROM files "
              "WHERE chksum = ?1 AND symlink = 0) > 1 "
              "ORDER BY link DESC, rowid");
  stmt.bind_text(1, checksum);
  return dup_cursor_t(std::move(stmt));
}

std::vector<std::string> dedup_index_t::duplicate_checksums() {
  require_current();
  stmt_t stmt(_db,
              "SELECT chksum FROM files WHERE symlink = 0 "
              "GROUP BY chksum HAVING count(*) > 1 ORDER BY chksum");
  std::vector<std::string> checksums;
  while (stmt.step()) {
    checksums.emplace_back(stmt.column_text(0));
  }
  return checksums;
}

void dedup_index_t::merge(const std::string &anchor_path,
                          const std::string &duplicate_path) {
  require_current();
  if (anchor_path == duplicate_path) {
    throw std::invalid_argument("cannot merge " + anchor_path + " with itself");
  }

  transaction_t txn(_db);
  const auto anchor = load(anchor_path);
  if (!anchor) {
    throw storage_error("no record for " + anchor_path);
  }
  const auto dup = load(duplicate_path);
  if (!dup) {
    throw storage_error("no record for " + duplicate_path);
  }
  if (anchor->symlink() || dup->symlink()) {
    throw symlink_not_mergeable(
        "cannot merge symlink " +
        (anchor->symlink() ? anchor_path : duplicate_path));
  }
  if (anchor->checksum() != dup->checksum()) {
    throw checksum_mismatch("checksum of " + duplicate_path + " (" +
                            dup->checksum() + ") differs from " + anchor_path +
                            " (" + anchor->checksum() + ")");
  }

  // the filesystem change goes first, a failure leaves both records as is
  _linker->link(anchor_path, duplicate_path);
  {
    stmt_t stmt(_db, "UPDATE files SET link = 1 WHERE path IN (?1, ?2)");
    stmt.bind_text(1, anchor_path).bind_text(2, duplicate_path);
    stmt.step();
  }
  txn.commit();
  oss(log_stream()) << "[log] merged " << duplicate_path << " into "
                    << anchor_path << '\n';
}

std::size_t dedup_index_t::link_duplicates(const std::string &checksum) {
  // merge cannot run while the cursor holds its read
  const auto group = duplicates_of(checksum);
  if (group.size() < 2) {
    return 0UL;
  }
  const auto &anchor = group.front();
  std::size_t merged = 0;
  for (auto it = group.begin() + 1; it != group.end(); ++it) {
    const bool shared = _linker->shares_storage(anchor.path(), it->path());
    if (shared && anchor.linked() && it->linked()) {
      continue;
    }
    // a shared pair only needs its flags restored
    merge(anchor.path(), it->path());
    if (!shared) {
      ++merged;
    }
  }
  return merged;
}

bool dedup_index_t::update_checksum(const fs::path &path) {
  require_current();
  const auto abs_path = fs::absolute(path).lexically_normal();
  std::error_code ec;
  // a broken symlink does not exist either
  if (!fs::exists(abs_path, ec)) {
    oss(log_stream()) << "[err] path " << abs_path
                      << " does not exist; skipping update\n";
    return false;
  }
  const bool symlink = fs::is_symlink(abs_path);
  const auto checksum = file_checksum(abs_path, _digest);
  upsert(abs_path.string(), checksum, symlink);
  if (!symlink) {
    link_duplicates(checksum);
  }
  return true;
}

scan_stats_t dedup_index_t::rescan(const fs::path &root,
                                   const std::vector<std::regex> &exclude_regex,
                                   const uint32_t max_thread) {
  require_current();
  scan_stats_t stats;
  // the store itself may live below root
  const auto db_file = fs::absolute(_file).lexically_normal().string();
  const std::vector<fs::path> own_files{db_file, db_file + "-journal",
                                        db_file + "-wal", db_file + "-shm"};
  const auto entries = scan_tree(root, exclude_regex, _digest, max_thread,
                                 stats.skipped, own_files);

  std::vector<std::string> checksums;
  {
    transaction_t txn(_db);
    for (const auto &entry : entries) {
      upsert(entry.path, entry.checksum, entry.symlink);
      if (entry.symlink) {
        ++stats.symlinks;
      } else {
        ++stats.files;
        checksums.push_back(entry.checksum);
      }
    }
    txn.commit();
  }
  std::sort(checksums.begin(), checksums.end());
  checksums.erase(std::unique(checksums.begin(), checksums.end()),
                  checksums.end());

  for (const auto &checksum : checksums) {
    try {
      stats.merged += link_duplicates(checksum);
    } catch (const checksum_mismatch &e) {
      // changed while scanning, the next rescan picks it up
      ++stats.mismatched;
      oss(log_stream()) << "[warn] skip merge: " << e.what() << '\n';
    } catch (const fs::filesystem_error &e) {
      ++stats.skipped;
      oss(log_stream()) << "[warn] skip merge: " << e.what() << '\n';
    }
  }

  oss(log_stream()) << "[log] files: " << stats.files
                    << ", symlinks: " << stats.symlinks
                    << ", merged: " << stats.merged
                    << ", mismatched: " << stats.mismatched
                    << ", skipped: " << stats.skipped << '\n';
  return stats;
}

std::size_t dedup_index_t::vacuum() {
  require_current();
  std::vector<std::string> missing;
  {
    stmt_t stmt(_db, "SELECT path FROM files ORDER BY rowid");
    while (stmt.step()) {
      auto path = stmt.column_text(0);
      std::error_code ec;
      // only not_found counts, a permission error keeps the record
      if (fs::symlink_status(path, ec).type() == fs::file_type::not_found) {
        missing.emplace_back(std::move(path));
      }
    }
  }
  if (missing.empty()) {
    return 0UL;
  }

  transaction_t txn(_db);
  for (const auto &path : missing) {
    stmt_t stmt(_db, "DELETE FROM files WHERE path = ?1");
    stmt.bind_text(1, path);
    stmt.step();
    oss(log_stream()) << "[log] remove entry for " << path
                      << "; file does not exist\n";
  }
  txn.commit();
  return missing.size();
}

std::size_t dedup_index_t::relocate_duplicates(const fs::path &dupdir,
                                               const dup_action_t action) {
  require_current();
  const auto abs_dupdir = fs::absolute(dupdir).lexically_normal();
  if (fs::exists(abs_dupdir) && !fs::is_empty(abs_dupdir)) {
    throw std::invalid_argument(abs_dupdir.string() +
                                " is not empty; refusing to move files");
  }

  std::size_t moved = 0;
  for (const auto &checksum : duplicate_checksums()) {
    const auto group = duplicates_of(checksum);
    if (group.size() < 2) {
      continue;
    }
    const auto &anchor = group.front();
    for (auto it = group.begin() + 1; it != group.end(); ++it) {
      if (action == dup_action_t::log) {
        oss(log_stream()) << "[log] duplicate: " << it->path() << " of "
                          << anchor.path() << '\n';
        continue;
      }

      // nothing moves unless the anchor still holds the same bytes
      std::error_code ec;
      if (!fs::is_regular_file(anchor.path(), ec)) {
        oss(log_stream()) << "[warn] skip duplicate: " << it->path()
                          << " - anchor " << anchor.path() << " is missing\n";
        continue;
      }
      try {
        if (!same_content(anchor.path(), it->path())) {
          oss(log_stream()) << "[warn] skip duplicate: " << it->path()
                            << " - content differs from " << anchor.path()
                            << '\n';
          continue;
        }
      } catch (const fs::filesystem_error &e) {
        oss(log_stream()) << "[warn] skip duplicate: " << it->path() << " - "
                          << e.what() << '\n';
        continue;
      }

      const auto dst = dst_with_subdirectory(it->path(), abs_dupdir);
      transaction_t txn(_db);
      if (action == dup_action_t::move) {
        remove(it->path());
      } else {
        stmt_t stmt(_db,
                    "UPDATE files SET symlink = 1, link = 0 WHERE path = ?1");
        stmt.bind_text(1, it->path());
        stmt.step();
      }
      move_file(it->path(), dst, action == dup_action_t::move);
      if (action == dup_action_t::move_symlink) {
        try {
          symlink_file(anchor.path(), it->path());
        } catch (const std::exception &) {
          // put the file back so the rolled back record matches the disk
          fs::rename(dst, it->path());
          throw;
        }
      }
      txn.commit();
      ++moved;
    }
  }
  oss(log_stream()) << "[log] moved " << moved << " duplicates to "
                    << abs_dupdir << '\n';
  return moved;
}

void dedup_index_t::migrate_schema(const uint32_t from_version,
                                   const uint32_t to_version,
                                   const migration_strategy_t strategy,
                                   step_hook_t on_step) {
  if (to_version < 1U || to_version > schema_version) {
    throw std::invalid_argument("unknown schema version " +
                                std::to_string(to_version));
  }
  if (_schema.version >= to_version) {
    oss(log_stream()) << "[log] " << _file << " already at schema version "
                      << _schema.version << '\n';
    return;
  }
  if (_schema.version != from_version) {
    throw storage_error(_file.string() + " is at schema version " +
                        std::to_string(_schema.version) + ", not " +
                        std::to_string(from_version));
  }

  migration_ctx_t ctx{_schema, to_version, strategy, std::move(on_step)};
  migrate(_db, ctx);
  _schema = ctx.from;
}

void dedup_index_t::migrate_schema() {
  migrate_schema(_schema.version, schema_version);
}

}  // namespace detail_v1

}  // namespace undup

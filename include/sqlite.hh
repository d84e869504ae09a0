#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace undup {

inline namespace detail_v1 {

/**
 * @brief turn a failed sqlite result into storage_error
 *
 * @param db connection the call was made on, may be null
 * @param rc result code, SQLITE_OK, SQLITE_ROW and SQLITE_DONE pass
 * @param what operation name for the message
 * @throws storage_error, std::bad_alloc on SQLITE_NOMEM
 */
void check_ok(sqlite3 *db, int rc, std::string_view what);

// RAII sqlite connection
class db_t {
  sqlite3 *_db = nullptr;

 public:
  /**
   * @brief open a database file
   *
   * @param file database path
   * @param create create the file if missing
   * @param busy_timeout_ms how long to wait on a locked database
   * @throws storage_error
   */
  db_t(const std::filesystem::path &file, bool create, int busy_timeout_ms);
  ~db_t() noexcept;

  db_t(const db_t &) = delete;
  db_t(db_t &&) = delete;
  db_t &operator=(const db_t &) = delete;
  db_t &operator=(db_t &&) = delete;

  inline sqlite3 *handle() const noexcept { return _db; }

  /**
   * @brief run a sequence of statements, rows are discarded
   *
   * @throws storage_error
   */
  void exec(const char *sql);
  inline void exec(const std::string &sql) { exec(sql.c_str()); }

  // rows changed by the last insert, update or delete
  int changes() const noexcept;
};

// RAII prepared statement
class stmt_t {
  sqlite3_stmt *_stmt = nullptr;
  sqlite3 *_db = nullptr;

 public:
  stmt_t(db_t &db, const char *sql);
  ~stmt_t() noexcept;

  stmt_t(const stmt_t &) = delete;
  stmt_t &operator=(const stmt_t &) = delete;
  stmt_t(stmt_t &&rhs) noexcept;
  stmt_t &operator=(stmt_t &&rhs) noexcept;

  // parameters are 1-based
  stmt_t &bind_text(int idx, std::string_view text);
  stmt_t &bind_int(int idx, int64_t val);

  /**
   * @brief advance one row
   *
   * @return true if a row is available, false when done
   * @throws storage_error
   */
  bool step();

  // rewind to the first row, bindings are kept
  void reset() noexcept;

  // columns are 0-based
  std::string column_text(int col) const;
  int64_t column_int(int col) const noexcept;
};

enum class txn_mode_t { deferred, immediate, exclusive };

// rolls back on destruction unless committed
class transaction_t {
  db_t &_db;
  bool _committed = false;

 public:
  explicit transaction_t(db_t &db, txn_mode_t mode = txn_mode_t::immediate);
  ~transaction_t() noexcept;

  transaction_t(const transaction_t &) = delete;
  transaction_t(transaction_t &&) = delete;
  transaction_t &operator=(const transaction_t &) = delete;
  transaction_t &operator=(transaction_t &&) = delete;

  void commit();
};

}  // namespace detail_v1

}  // namespace undup

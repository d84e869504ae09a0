#include "sqlite.hh"

#include <new>
#include <stdexcept>
#include <utility>

#include "errors.hh"
#include "oss.hh"

namespace undup {

inline namespace detail_v1 {

void check_ok(sqlite3 *db, const int rc, std::string_view what) {
  if (rc == SQLITE_OK || rc == SQLITE_ROW || rc == SQLITE_DONE) {
    return;
  }
  std::string msg(what);
  msg += ": ";
  msg += db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);

  // sqlite is not always helpful, add a hint for the common cases
  switch (rc & 0xff) {
    case SQLITE_NOMEM:
      throw std::bad_alloc();
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_PROTOCOL:
      msg += " (make sure the database and its directory are writeable)";
      break;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      msg += " (not a usable sqlite database)";
      break;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      msg += " (database locked by another writer)";
      break;
    default:
      break;
  }
  throw storage_error(msg, rc);
}

db_t::db_t(const std::filesystem::path &file, const bool create,
           const int busy_timeout_ms) {
  const int flags = SQLITE_OPEN_READWRITE | (create ? SQLITE_OPEN_CREATE : 0);
  const auto rc = sqlite3_open_v2(file.c_str(), &_db, flags, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = "cannot open " + file.string() + ": " +
                      (_db != nullptr ? sqlite3_errmsg(_db) : sqlite3_errstr(rc));
    sqlite3_close(_db);
    _db = nullptr;
    throw storage_error(msg, rc);
  }
  sqlite3_busy_timeout(_db, busy_timeout_ms);
}

db_t::~db_t() noexcept {
  if (_db != nullptr && sqlite3_close(_db) != SQLITE_OK) {
    oss(log_stream()) << "[err] close database: " << sqlite3_errmsg(_db)
                      << '\n';
  }
}

void db_t::exec(const char *sql) {
  while (sql != nullptr && *sql != '\0') {
    sqlite3_stmt *stmt = nullptr;
    const char *tail = nullptr;
    check_ok(_db, sqlite3_prepare_v2(_db, sql, -1, &stmt, &tail), "prepare");
    if (stmt == nullptr) {
      // whitespace or comment only
      sql = tail;
      continue;
    }
    int rc = SQLITE_ROW;
    while (rc == SQLITE_ROW) {
      rc = sqlite3_step(stmt);
    }
    // the error message is complete only after finalize
    sqlite3_finalize(stmt);
    check_ok(_db, rc, "exec");
    sql = tail;
  }
}

int db_t::changes() const noexcept { return sqlite3_changes(_db); }

stmt_t::stmt_t(db_t &db, const char *sql) : _db(db.handle()) {
  check_ok(_db, sqlite3_prepare_v2(_db, sql, -1, &_stmt, nullptr), "prepare");
  if (_stmt == nullptr) {
    throw std::invalid_argument("empty sql statement");
  }
}

stmt_t::~stmt_t() noexcept {
  if (_stmt != nullptr) {
    sqlite3_finalize(_stmt);
  }
}

stmt_t::stmt_t(stmt_t &&rhs) noexcept
    : _stmt(std::exchange(rhs._stmt, nullptr)), _db(rhs._db) {}

stmt_t &stmt_t::operator=(stmt_t &&rhs) noexcept {
  if (this != &rhs) {
    if (_stmt != nullptr) {
      sqlite3_finalize(_stmt);
    }
    _stmt = std::exchange(rhs._stmt, nullptr);
    _db = rhs._db;
  }
  return *this;
}

stmt_t &stmt_t::bind_text(const int idx, std::string_view text) {
  check_ok(_db,
           sqlite3_bind_text(_stmt, idx, text.data(), (int)text.size(),
                             SQLITE_TRANSIENT),
           "bind");
  return *this;
}

stmt_t &stmt_t::bind_int(const int idx, const int64_t val) {
  check_ok(_db, sqlite3_bind_int64(_stmt, idx, val), "bind");
  return *this;
}

bool stmt_t::step() {
  const auto rc = sqlite3_step(_stmt);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  check_ok(_db, rc, "step");
  return false;
}

void stmt_t::reset() noexcept {
  // the return value repeats the last step() error, which step() threw
  static_cast<void>(sqlite3_reset(_stmt));
}

std::string stmt_t::column_text(const int col) const {
  const auto *text = sqlite3_column_text(_stmt, col);
  if (text == nullptr) {
    return {};
  }
  return std::string(reinterpret_cast<const char *>(text),
                     (std::size_t)sqlite3_column_bytes(_stmt, col));
}

int64_t stmt_t::column_int(const int col) const noexcept {
  return sqlite3_column_int64(_stmt, col);
}

transaction_t::transaction_t(db_t &db, const txn_mode_t mode) : _db(db) {
  switch (mode) {
    case txn_mode_t::deferred:
      _db.exec("BEGIN DEFERRED");
      break;
    case txn_mode_t::immediate:
      _db.exec("BEGIN IMMEDIATE");
      break;
    case txn_mode_t::exclusive:
      _db.exec("BEGIN EXCLUSIVE");
      break;
  }
}

transaction_t::~transaction_t() noexcept {
  // sqlite may have rolled back on its own already (e.g. SQLITE_FULL)
  if (_committed || sqlite3_get_autocommit(_db.handle()) != 0) {
    return;
  }
  if (sqlite3_exec(_db.handle(), "ROLLBACK", nullptr, nullptr, nullptr) !=
      SQLITE_OK) {
    oss(log_stream()) << "[err] rollback failed: "
                      << sqlite3_errmsg(_db.handle()) << '\n';
  }
}

void transaction_t::commit() {
  if (_committed) {
    throw std::logic_error("transaction already committed");
  }
  _db.exec("COMMIT");
  _committed = true;
}

}  // namespace detail_v1

}  // namespace undup

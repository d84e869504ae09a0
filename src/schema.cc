#include "schema.hh"

#include <stdexcept>
#include <vector>

#include "errors.hh"
#include "oss.hh"

namespace undup {

inline namespace detail_v1 {

namespace {

constexpr auto create_csum_idx =
    "CREATE INDEX IF NOT EXISTS csum_idx ON files(chksum)";

bool has_object(db_t &db, const char *type, const char *name) {
  stmt_t stmt(db,
              "SELECT count(*) FROM sqlite_master "
              "WHERE type = ?1 AND name = ?2");
  stmt.bind_text(1, type).bind_text(2, name);
  return stmt.step() && stmt.column_int(0) > 0;
}

bool has_column(db_t &db, const char *table, const char *column) {
  stmt_t stmt(db, "SELECT count(*) FROM pragma_table_info(?1) WHERE name = ?2");
  stmt.bind_text(1, table).bind_text(2, column);
  return stmt.step() && stmt.column_int(0) > 0;
}

// column definitions of the files table at a given version
std::string files_columns(const uint32_t version) {
  std::string cols = "path varchar not null primary key, chksum varchar not null";
  if (version >= 2U) {
    cols += ", symlink boolean default 0";
  }
  if (version >= 3U) {
    cols += ", link boolean default 0";
  }
  return cols;
}

std::string column_names(const uint32_t version) {
  std::string names = "path, chksum";
  if (version >= 2U) {
    names += ", symlink";
  }
  if (version >= 3U) {
    names += ", link";
  }
  return names;
}

std::vector<std::string> alter_steps(const schema_t &cur,
                                     const uint32_t target) {
  std::vector<std::string> steps;
  if (target == 2U && !cur.has_symlink) {
    steps.emplace_back("ALTER TABLE files ADD COLUMN symlink boolean default 0");
  }
  if (target == 3U) {
    if (!cur.has_link) {
      steps.emplace_back("ALTER TABLE files ADD COLUMN link boolean default 0");
    }
    if (!cur.has_csum_idx) {
      steps.emplace_back(create_csum_idx);
    }
  }
  return steps;
}

std::vector<std::string> rebuild_steps(const schema_t &cur,
                                       const uint32_t target) {
  const auto cols = files_columns(target);
  const auto names = column_names(target);
  // existing columns are carried over, new ones get their default
  std::string select = "path, chksum";
  if (target >= 2U) {
    select += cur.has_symlink ? ", symlink" : ", 0";
  }
  if (target >= 3U) {
    select += cur.has_link ? ", link" : ", 0";
  }

  std::vector<std::string> steps{
      "CREATE TEMPORARY TABLE files_backup(" + cols + ")",
      "INSERT INTO files_backup SELECT " + select + " FROM files ORDER BY rowid",
      "DROP TABLE files",
      "CREATE TABLE files(" + cols + ")",
      "INSERT INTO files(" + names + ") SELECT " + names +
          " FROM files_backup ORDER BY rowid",
      "DROP TABLE files_backup"};
  // dropping files dropped its index too
  if (target >= 3U || cur.has_csum_idx) {
    steps.emplace_back(create_csum_idx);
  }
  return steps;
}

}  // namespace

schema_t detect_schema(db_t &db) {
  schema_t schema;
  if (!has_object(db, "table", "files")) {
    return schema;
  }
  schema.has_symlink = has_column(db, "files", "symlink");
  schema.has_link = has_column(db, "files", "link");
  schema.has_csum_idx = has_object(db, "index", "csum_idx");

  if (!schema.has_symlink) {
    schema.version = 1U;
  } else if (!schema.has_link || !schema.has_csum_idx) {
    schema.version = 2U;
  } else {
    schema.version = 3U;
  }
  return schema;
}

void create_schema(db_t &db, const std::string &digest) {
  transaction_t txn(db, txn_mode_t::exclusive);
  db.exec("CREATE TABLE IF NOT EXISTS files(" + files_columns(schema_version) +
          ")");
  db.exec(create_csum_idx);
  db.exec("CREATE TABLE IF NOT EXISTS versioning(chksum_type varchar not null)");
  {
    stmt_t stmt(db,
                "INSERT INTO versioning(chksum_type) SELECT ?1 "
                "WHERE NOT EXISTS (SELECT 1 FROM versioning)");
    stmt.bind_text(1, digest);
    stmt.step();
  }
  txn.commit();
}

std::optional<std::string> stored_digest(db_t &db) {
  if (!has_object(db, "table", "versioning")) {
    return std::nullopt;
  }
  stmt_t stmt(db, "SELECT chksum_type FROM versioning LIMIT 1");
  if (!stmt.step()) {
    return std::nullopt;
  }
  return stmt.column_text(0);
}

bool migrate(db_t &db, migration_ctx_t &ctx) {
  if (ctx.to < 1U || ctx.to > schema_version) {
    throw std::invalid_argument("unknown schema version " +
                                std::to_string(ctx.to));
  }
  // an up-to-date store is a no-op, not even a vacuum
  if (ctx.from.version >= ctx.to) {
    oss(log_stream()) << "[log] schema already at version "
                      << ctx.from.version << ", nothing to migrate\n";
    return false;
  }

  {
    // lock before reading, so two migrations cannot both decide to run
    transaction_t txn(db, txn_mode_t::exclusive);
    auto cur = detect_schema(db);
    if (cur.version == 0U) {
      throw storage_error("no files table to migrate");
    }
    if (cur.version >= ctx.to) {
      oss(log_stream()) << "[log] schema already at version " << cur.version
                        << ", nothing to migrate\n";
      ctx.from = cur;
      return false;
    }

    oss(log_stream()) << "[log] migrating schema " << cur.version << " -> "
                      << ctx.to << '\n';
    auto step = 0UL;
    while (cur.version < ctx.to) {
      const auto target = cur.version + 1U;
      const auto steps = ctx.strategy == migration_strategy_t::alter
                             ? alter_steps(cur, target)
                             : rebuild_steps(cur, target);
      for (const auto &sql : steps) {
        if (ctx.on_step) {
          ctx.on_step(step);
        }
        ++step;
        db.exec(sql);
      }
      cur = detect_schema(db);
      if (cur.version != target) {
        throw storage_error("migration to version " + std::to_string(target) +
                            " left the schema at version " +
                            std::to_string(cur.version));
      }
    }
    txn.commit();
    ctx.from = cur;
  }
  oss(log_stream()) << "[log] migrated schema to version " << ctx.from.version
                    << '\n';

  // reclaim the space of the old table, the migration itself is committed
  try {
    db.exec("VACUUM");
  } catch (const storage_error &e) {
    oss(log_stream()) << "[warn] vacuum after migration: " << e.what() << '\n';
  }
  return true;
}

}  // namespace detail_v1

}  // namespace undup

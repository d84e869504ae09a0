#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "config.hh"
#include "sqlite.hh"

namespace undup {

inline namespace detail_v1 {

// version 1: files(path, chksum)
// version 2: + symlink
// version 3: + link, csum_idx
struct schema_t {
  // 0 when the files table is missing
  uint32_t version = 0;
  bool has_symlink = false;
  bool has_link = false;
  bool has_csum_idx = false;

  bool operator==(const schema_t &rhs) const = default;
};

enum class migration_strategy_t {
  alter,   // ALTER TABLE ... ADD COLUMN
  rebuild  // copy out, drop, recreate, copy back
};

using step_hook_t = std::function<void(std::size_t step)>;

struct migration_ctx_t {
  schema_t from;
  uint32_t to = schema_version;
  migration_strategy_t strategy = migration_strategy_t::alter;
  // called before each step, throwing from it aborts the migration
  step_hook_t on_step;
};

/**
 * @brief inspect the files table of an open database
 */
schema_t detect_schema(db_t &db);

/**
 * @brief create the current schema in an empty database
 *
 * @param digest digest name recorded in the versioning table
 */
void create_schema(db_t &db, const std::string &digest);

/**
 * @brief digest name recorded when the store was created
 *
 * @return nullopt for stores older than the versioning table
 */
std::optional<std::string> stored_digest(db_t &db);

/**
 * @brief bring the files table from ctx.from up to ctx.to
 *
 * All steps run in one exclusive transaction, the database is vacuumed after
 * commit. A store already at ctx.to is left untouched.
 *
 * @param[in,out] ctx migration context, ctx.from is updated on success
 * @return true if a migration was performed
 * @throws storage_error, std::invalid_argument for an unknown target
 */
bool migrate(db_t &db, migration_ctx_t &ctx);

}  // namespace detail_v1

}  // namespace undup

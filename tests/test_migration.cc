#include <boost/test/unit_test.hpp>

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "dedup_index.hh"
#include "errors.hh"
#include "schema.hh"
#include "sqlite.hh"
#include "test_util.hh"

namespace {

using namespace undup;
using namespace undup::test;
namespace fs = std::filesystem;

using lines_t = std::vector<std::string>;

void make_v1_store(const fs::path &file) {
  db_t db(file, true, default_busy_timeout_ms);
  db.exec(
      "CREATE TABLE files(path varchar not null primary key, "
      "chksum varchar not null);"
      "INSERT INTO files VALUES('/b', 'h1');"
      "INSERT INTO files VALUES('/a', 'h1');"
      "INSERT INTO files VALUES('/c', 'h2');");
}

void make_v2_store(const fs::path &file) {
  db_t db(file, true, default_busy_timeout_ms);
  db.exec(
      "CREATE TABLE files(path varchar not null primary key, "
      "chksum varchar not null, symlink boolean default 0);"
      "INSERT INTO files VALUES('/b', 'h1', 0);"
      "INSERT INTO files VALUES('/a', 'h1', 0);"
      "INSERT INTO files VALUES('/c', 'h1', 1);");
}

// every schema object and every row, in storage order
lines_t snapshot(const fs::path &file) {
  db_t db(file, false, default_busy_timeout_ms);
  lines_t lines;
  {
    stmt_t stmt(db,
                "SELECT type || ':' || name || ':' || coalesce(sql, '') "
                "FROM sqlite_master ORDER BY type, name");
    while (stmt.step()) {
      lines.push_back(stmt.column_text(0));
    }
  }
  const auto schema = detect_schema(db);
  stmt_t stmt(db, schema.has_symlink
                      ? "SELECT path || '|' || chksum || '|' || symlink "
                        "FROM files ORDER BY rowid"
                      : "SELECT path || '|' || chksum FROM files "
                        "ORDER BY rowid");
  while (stmt.step()) {
    lines.push_back(stmt.column_text(0));
  }
  return lines;
}

lines_t duplicate_paths(dedup_index_t &index, const std::string &checksum) {
  auto cursor = index.find_duplicates(checksum);
  return paths_of(collect(cursor));
}

// steps a migration runs, counted on a throwaway copy
std::size_t count_steps(const fs::path &dir, void (*make)(const fs::path &),
                        const uint32_t from,
                        const migration_strategy_t strategy) {
  const auto file = dir / "count.db";
  make(file);
  std::size_t steps = 0;
  {
    dedup_index_t index(file);
    index.migrate_schema(from, schema_version, strategy,
                         [&steps](std::size_t) { ++steps; });
  }
  fs::remove(file);
  return steps;
}

}  // namespace

BOOST_FIXTURE_TEST_SUITE(migration, index_fixture_t)

BOOST_AUTO_TEST_CASE(old_store_must_be_migrated) {
  make_v1_store(db_file);
  dedup_index_t index(db_file);

  BOOST_TEST(index.schema().version == 1U);
  BOOST_TEST(index.size() == 3U);
  BOOST_CHECK_THROW(index.upsert("/d", "h3", false), storage_error);
  BOOST_CHECK_THROW(index.find_duplicates("h1"), storage_error);
  BOOST_CHECK_THROW(index.merge("/a", "/b"), storage_error);
  BOOST_TEST(log.str().find("migrate it before use") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(v1_to_v3) {
  for (const auto strategy :
       {migration_strategy_t::alter, migration_strategy_t::rebuild}) {
    make_v1_store(db_file);
    {
      dedup_index_t index(db_file);
      index.migrate_schema(1U, 3U, strategy);

      BOOST_TEST(index.schema().version == 3U);
      BOOST_TEST(index.schema().has_link);
      BOOST_TEST(index.schema().has_csum_idx);
      BOOST_TEST(index.size() == 3U);

      const auto rec = index.get("/a");
      BOOST_TEST_REQUIRE(rec.has_value());
      BOOST_TEST(rec->checksum() == "h1");
      BOOST_TEST(!rec->symlink());
      BOOST_TEST(!rec->linked());
      // rows keep their order
      BOOST_TEST(duplicate_paths(index, "h1") == (lines_t{"/b", "/a"}),
                 boost::test_tools::per_element());

      index.upsert("/d", "h2", false);
      BOOST_TEST(duplicate_paths(index, "h2") == (lines_t{"/c", "/d"}),
                 boost::test_tools::per_element());
    }
    fs::remove(db_file);
  }
}

BOOST_AUTO_TEST_CASE(v2_to_v3) {
  for (const auto strategy :
       {migration_strategy_t::alter, migration_strategy_t::rebuild}) {
    make_v2_store(db_file);
    {
      dedup_index_t index(db_file);
      BOOST_TEST(index.schema().version == 2U);
      index.migrate_schema(2U, 3U, strategy);

      BOOST_TEST(index.schema().version == 3U);
      BOOST_TEST(index.get("/c")->symlink());
      BOOST_TEST(!index.get("/c")->linked());
      BOOST_TEST(duplicate_paths(index, "h1") == (lines_t{"/b", "/a"}),
                 boost::test_tools::per_element());
    }
    fs::remove(db_file);
  }
}

BOOST_AUTO_TEST_CASE(one_version_at_a_time) {
  make_v1_store(db_file);
  dedup_index_t index(db_file);

  index.migrate_schema(1U, 2U, migration_strategy_t::rebuild);
  BOOST_TEST(index.schema().version == 2U);
  BOOST_TEST(index.schema().has_symlink);
  BOOST_TEST(!index.schema().has_link);

  index.migrate_schema(2U, 3U);
  BOOST_TEST(index.schema().version == 3U);
  BOOST_TEST(index.get("/b")->checksum() == "h1");
}

BOOST_AUTO_TEST_CASE(migration_is_idempotent) {
  make_v1_store(db_file);
  lines_t once;
  {
    dedup_index_t index(db_file);
    index.migrate_schema(1U, 3U);
    once = snapshot(db_file);

    // the store already is at the target, both calls are no-ops
    index.migrate_schema(1U, 3U);
    index.migrate_schema();
    BOOST_TEST(snapshot(db_file) == once, boost::test_tools::per_element());
  }

  dedup_index_t reopened(db_file);
  BOOST_TEST(reopened.schema().version == 3U);
  reopened.migrate_schema(2U, 3U, migration_strategy_t::rebuild);
  BOOST_TEST(snapshot(db_file) == once, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(current_store_needs_no_migration) {
  dedup_index_t index(db_file);
  index.upsert("/a", "h1", false);
  const auto before = snapshot(db_file);

  index.migrate_schema();
  BOOST_TEST(snapshot(db_file) == before, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(wrong_source_version) {
  make_v1_store(db_file);
  dedup_index_t index(db_file);

  BOOST_CHECK_THROW(index.migrate_schema(2U, 3U), storage_error);
  BOOST_CHECK_THROW(index.migrate_schema(1U, 4U), std::invalid_argument);
  BOOST_CHECK_THROW(index.migrate_schema(1U, 0U), std::invalid_argument);
  BOOST_TEST(index.schema().version == 1U);
}

BOOST_AUTO_TEST_CASE(interrupted_migration_rolls_back) {
  struct legacy_t {
    void (*make)(const fs::path &);
    uint32_t version;
  };
  for (const auto &legacy :
       {legacy_t{make_v1_store, 1U}, legacy_t{make_v2_store, 2U}}) {
    for (const auto strategy :
         {migration_strategy_t::alter, migration_strategy_t::rebuild}) {
      const auto steps =
          count_steps(dir.path(), legacy.make, legacy.version, strategy);
      BOOST_TEST_REQUIRE(steps > 0U);

      for (std::size_t fail_at = 0; fail_at < steps; ++fail_at) {
        legacy.make(db_file);
        const auto before = snapshot(db_file);
        {
          dedup_index_t index(db_file);
          BOOST_CHECK_THROW(
              index.migrate_schema(legacy.version, schema_version, strategy,
                                   [fail_at](std::size_t step) {
                                     if (step == fail_at) {
                                       throw std::runtime_error("interrupted");
                                     }
                                   }),
              std::runtime_error);
          BOOST_TEST(index.schema().version == legacy.version);
          BOOST_TEST(snapshot(db_file) == before,
                     boost::test_tools::per_element());

          // nothing is left locked, a second attempt goes through
          index.migrate_schema(legacy.version, schema_version, strategy);
          BOOST_TEST(index.schema().version == schema_version);
        }
        fs::remove(db_file);
      }
    }
  }
}

BOOST_AUTO_TEST_SUITE_END()

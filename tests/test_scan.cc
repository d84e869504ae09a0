#include <boost/test/unit_test.hpp>

#include <filesystem>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

#include "checksum.hh"
#include "dedup_index.hh"
#include "fs_ops.hh"
#include "scan.hh"
#include "test_util.hh"

namespace {

using namespace undup;
using namespace undup::test;
namespace fs = std::filesystem;

using paths_t = std::vector<std::string>;

// data/ holds two copies of "hello", one other file, an empty file, a
// symlink and an excluded directory
struct tree_fixture_t : index_fixture_t {
  fs::path a, b, c, empty, symlink, excluded;
  std::vector<std::regex> exclude{std::regex(".*/excluded")};

  tree_fixture_t()
      : a(write_file(data_dir() / "a.txt", "hello")),
        b(write_file(data_dir() / "sub" / "b.txt", "hello")),
        c(write_file(data_dir() / "c.txt", "other")),
        empty(write_file(data_dir() / "empty.txt", "")),
        symlink(data_dir() / "link"),
        excluded(write_file(data_dir() / "excluded" / "x.txt", "hello")) {
    fs::create_symlink(a, symlink);
  }

  inline std::string p(const fs::path &path) const { return path.string(); }
};

}  // namespace

BOOST_FIXTURE_TEST_SUITE(scan, tree_fixture_t)

BOOST_AUTO_TEST_CASE(scan_tree_lists_and_hashes) {
  fs::create_symlink(data_dir() / "missing", data_dir() / "dangling");
  std::size_t skipped = 0;
  const auto entries = scan_tree(data_dir(), exclude, "sha1", 2U, skipped);

  std::vector<std::string> paths;
  for (const auto &entry : entries) {
    paths.push_back(entry.path);
  }
  BOOST_TEST(paths == (paths_t{p(a), p(c), p(symlink), p(b)}),
             boost::test_tools::per_element());
  BOOST_TEST(skipped == 1U);
  BOOST_TEST(entries[2].symlink);
  BOOST_TEST(entries[2].checksum == file_checksum(a));
  BOOST_TEST(!entries[0].symlink);

  BOOST_CHECK_THROW(scan_tree(a, exclude, "sha1", 1U, skipped),
                    std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(rescan_records_and_links) {
  dedup_index_t index(db_file);
  const auto stats = index.rescan(data_dir(), exclude, 2U);

  BOOST_TEST(stats.files == 3U);
  BOOST_TEST(stats.symlinks == 1U);
  BOOST_TEST(stats.merged == 1U);
  BOOST_TEST(stats.mismatched == 0U);
  BOOST_TEST(stats.skipped == 0U);
  BOOST_TEST(index.size() == 4U);

  BOOST_TEST(same_file(a, b));
  BOOST_TEST(!index.get(p(empty)).has_value());
  BOOST_TEST(!index.get(p(excluded)).has_value());

  const auto link_rec = index.get(p(symlink));
  BOOST_TEST_REQUIRE(link_rec.has_value());
  BOOST_TEST(link_rec->symlink());
  BOOST_TEST(link_rec->checksum() == file_checksum(a));

  auto cursor = index.find_duplicates(file_checksum(a));
  const auto group = collect(cursor);
  BOOST_TEST(paths_of(group) == (paths_t{p(a), p(b)}),
             boost::test_tools::per_element());
  for (const auto &rec : group) {
    BOOST_TEST(rec.linked());
  }
  BOOST_TEST(index.duplicate_checksums().size() == 1U);

  // nothing changed on disk, a second pass finds the same
  const auto again = index.rescan(data_dir(), exclude, 1U);
  BOOST_TEST(again.files == 3U);
  BOOST_TEST(again.merged == 0U);
  BOOST_TEST(index.size() == 4U);
  BOOST_TEST(index.get(p(b))->linked());
}

BOOST_AUTO_TEST_CASE(rescan_skips_own_store) {
  const auto own = data_dir() / "index.db";
  dedup_index_t index(own);
  const auto stats = index.rescan(data_dir(), exclude);

  BOOST_TEST(stats.files == 3U);
  BOOST_TEST(index.size() == 4U);
  BOOST_TEST(!index.get(p(own)).has_value());
}

BOOST_AUTO_TEST_CASE(rescan_rejects_file_root) {
  dedup_index_t index(db_file);
  BOOST_CHECK_THROW(index.rescan(a), std::invalid_argument);
  BOOST_TEST(index.size() == 0U);
}

BOOST_AUTO_TEST_CASE(update_checksum_links_new_copy) {
  dedup_index_t index(db_file);
  index.rescan(data_dir(), exclude);

  write_file(c, "hello");
  BOOST_TEST(index.update_checksum(c));
  BOOST_TEST(index.get(p(c))->checksum() == file_checksum(a));
  BOOST_TEST(index.get(p(c))->linked());
  BOOST_TEST(same_file(a, c));

  BOOST_TEST(!index.update_checksum(data_dir() / "missing.txt"));
  BOOST_TEST(log.str().find("[err]") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(vacuum_drops_missing_paths) {
  dedup_index_t index(db_file);
  index.rescan(data_dir(), exclude);
  BOOST_TEST(index.vacuum() == 0U);

  fs::remove(b);
  BOOST_TEST(index.vacuum() == 1U);
  BOOST_TEST(!index.get(p(b)).has_value());
  BOOST_TEST(index.get(p(a)).has_value());
  BOOST_TEST(index.size() == 3U);
}

BOOST_AUTO_TEST_CASE(relocate_moves_duplicates) {
  dedup_index_t index(db_file);
  index.rescan(data_dir(), exclude);
  const auto dupdir = dir.path() / "dups";

  BOOST_TEST(index.relocate_duplicates(dupdir, dup_action_t::move) == 1U);
  const auto moved = dst_with_subdirectory(b, dupdir);
  BOOST_TEST(read_file(moved) == "hello");
  BOOST_TEST(!fs::exists(b));
  // the emptied directory goes too
  BOOST_TEST(!fs::exists(data_dir() / "sub"));
  BOOST_TEST(fs::exists(a));
  BOOST_TEST(!index.get(p(b)).has_value());
  BOOST_TEST(index.duplicate_checksums().empty());
}

BOOST_AUTO_TEST_CASE(relocate_leaves_symlinks) {
  dedup_index_t index(db_file);
  index.rescan(data_dir(), exclude);
  const auto dupdir = dir.path() / "dups";

  BOOST_TEST(index.relocate_duplicates(dupdir, dup_action_t::move_symlink) ==
             1U);
  BOOST_TEST(fs::is_symlink(b));
  BOOST_TEST(fs::read_symlink(b) == a);
  BOOST_TEST(read_file(dst_with_subdirectory(b, dupdir)) == "hello");

  const auto rec = index.get(p(b));
  BOOST_TEST_REQUIRE(rec.has_value());
  BOOST_TEST(rec->symlink());
  BOOST_TEST(!rec->linked());
  auto cursor = index.find_duplicates(file_checksum(a));
  BOOST_TEST(collect(cursor).empty());
}

BOOST_AUTO_TEST_CASE(relocate_keeps_duplicate_without_anchor) {
  dedup_index_t index(db_file);
  index.rescan(data_dir(), exclude);
  fs::remove(a);
  const auto dupdir = dir.path() / "dups";

  for (const auto action : {dup_action_t::move_symlink, dup_action_t::move}) {
    BOOST_TEST(index.relocate_duplicates(dupdir, action) == 0U);
    BOOST_TEST(fs::is_regular_file(fs::symlink_status(b)));
    BOOST_TEST(read_file(b) == "hello");
    BOOST_TEST(!fs::exists(dst_with_subdirectory(b, dupdir)));

    const auto rec = index.get(p(b));
    BOOST_TEST_REQUIRE(rec.has_value());
    BOOST_TEST(!rec->symlink());
  }
  BOOST_TEST(log.str().find("is missing") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(relocate_keeps_changed_duplicate) {
  dedup_index_t index(db_file);
  index.upsert(p(a), file_checksum(a), false);
  index.upsert(p(c), file_checksum(a), false);
  const auto dupdir = dir.path() / "dups";

  BOOST_TEST(index.relocate_duplicates(dupdir, dup_action_t::move) == 0U);
  BOOST_TEST(read_file(c) == "other");
  BOOST_TEST(index.get(p(c)).has_value());
  BOOST_TEST(log.str().find("content differs") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(relocate_dry_run) {
  dedup_index_t index(db_file);
  index.rescan(data_dir(), exclude);

  BOOST_TEST(index.relocate_duplicates(dir.path() / "dups", dup_action_t::log) ==
             0U);
  BOOST_TEST(fs::exists(b));
  BOOST_TEST(!fs::exists(dir.path() / "dups"));
  BOOST_TEST(log.str().find("[log] duplicate: " + p(b)) != std::string::npos);
}

BOOST_AUTO_TEST_CASE(relocate_refuses_used_dupdir) {
  dedup_index_t index(db_file);
  index.rescan(data_dir(), exclude);
  const auto dupdir = dir.path() / "dups";
  write_file(dupdir / "keep.txt", "x");

  BOOST_CHECK_THROW(index.relocate_duplicates(dupdir, dup_action_t::move),
                    std::invalid_argument);
  BOOST_TEST(fs::exists(b));
  BOOST_TEST(index.get(p(b)).has_value());
}

BOOST_AUTO_TEST_SUITE_END()

#pragma once

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "dedup_index.hh"
#include "errors.hh"
#include "linker.hh"
#include "oss.hh"

namespace undup::test {

// fresh directory below the system temp dir, removed with its content
class temp_dir_t {
  std::filesystem::path _path;

 public:
  temp_dir_t() {
    auto tmpl = (std::filesystem::temp_directory_path() / "undup-test-XXXXXX")
                    .string();
    if (::mkdtemp(tmpl.data()) == nullptr) {
      throw std::system_error(errno, std::generic_category(), "mkdtemp");
    }
    _path = tmpl;
  }
  ~temp_dir_t() {
    std::error_code ec;
    std::filesystem::remove_all(_path, ec);
  }

  temp_dir_t(const temp_dir_t &) = delete;
  temp_dir_t &operator=(const temp_dir_t &) = delete;

  inline const std::filesystem::path &path() const noexcept { return _path; }
};

inline std::filesystem::path write_file(const std::filesystem::path &path,
                                        const std::string &content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << content;
  return path;
}

inline std::string read_file(const std::filesystem::path &path) {
  std::ifstream ifs(path, std::ios::binary);
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

inline std::vector<file_record_t> collect(dup_cursor_t &cursor) {
  std::vector<file_record_t> records;
  while (auto rec = cursor.next()) {
    records.emplace_back(std::move(*rec));
  }
  return records;
}

inline std::vector<std::string> paths_of(
    const std::vector<file_record_t> &records) {
  std::vector<std::string> paths;
  for (const auto &rec : records) {
    paths.push_back(rec.path());
  }
  return paths;
}

// what a recording_linker_t was asked to do
struct link_calls_t {
  std::vector<std::pair<std::string, std::string>> calls;
  bool fail = false;
};

// records merges instead of touching the filesystem
class recording_linker_t final : public linker_t {
  link_calls_t &_log;

 public:
  explicit recording_linker_t(link_calls_t &log) : _log(log) {}

  void link(const std::filesystem::path &anchor,
            const std::filesystem::path &dup) override {
    if (_log.fail) {
      throw checksum_mismatch("content of " + dup.string() + " changed");
    }
    _log.calls.emplace_back(anchor.string(), dup.string());
  }

  bool shares_storage(const std::filesystem::path &lhs,
                      const std::filesystem::path &rhs) const override {
    for (const auto &[anchor, dup] : _log.calls) {
      if ((anchor == lhs && dup == rhs) || (anchor == rhs && dup == lhs)) {
        return true;
      }
    }
    return false;
  }
};

// temp dir with its own log sink, the index file lives inside it
struct index_fixture_t {
  temp_dir_t dir;
  std::ostringstream log;
  std::filesystem::path db_file;

  index_fixture_t() : db_file(dir.path() / "index.db") { set_log_stream(log); }
  ~index_fixture_t() { set_log_stream(std::cerr); }

  inline std::filesystem::path data_dir() const { return dir.path() / "data"; }
};

}  // namespace undup::test

#include "scan.hh"

#include <algorithm>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "checksum.hh"
#include "oss.hh"

#include <boost/asio.hpp>

namespace undup {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

class timer_t {
  std::chrono::steady_clock::time_point _prev_time;

 public:
  timer_t() noexcept : _prev_time(std::chrono::steady_clock::now()) {}
  std::chrono::milliseconds time() noexcept {
    auto cur_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        cur_time - _prev_time);
    _prev_time = cur_time;
    return duration;
  }
};

void hash_file(const fs::path path, const bool symlink, const scan_job_t &job) {
  try {
    scan_entry_t entry{path.string(), file_checksum(path, job.digest),
                       symlink};
    std::lock_guard lk(job.mtx);
    job.entries.emplace_back(std::move(entry));
  } catch (const std::runtime_error &e) {
    // unreadable or vanished since listing, skip
    ++job.skipped;
    oss(log_stream()) << "[warn] skip file: " << path << " - " << e.what()
                      << '\n';
  }
}

}  // namespace

void ls_dir_rec(const fs::path dir, const scan_job_t &job) {
  try {
    for (const auto &dir_entry : fs::directory_iterator(dir)) {
      if (is_excluded(dir_entry.path(), job.exclude_regex,
                      job.exclude_path)) {
        // exclude, skip
        oss(log_stream()) << "[log] exclude: " << dir_entry.path() << '\n';

      } else if (dir_entry.is_symlink()) {
        // symlink, recorded by its target's content, never followed
        std::error_code ec;
        if (fs::is_regular_file(dir_entry.path(), ec)) {
          boost::asio::post(job.pool,
                            std::bind(hash_file, dir_entry.path(), true, job));
        } else if (fs::exists(dir_entry.path(), ec)) {
          oss(log_stream()) << "[log] skip symlink: " << dir_entry.path()
                            << '\n';
        } else {
          ++job.skipped;
          oss(log_stream()) << "[warn] skip broken symlink: "
                            << dir_entry.path() << '\n';
        }

      } else if (dir_entry.is_directory()) {
        // directory, recursive call
        boost::asio::post(job.pool,
                          std::bind(ls_dir_rec, dir_entry.path(), job));

      } else if (dir_entry.is_regular_file()) {
        // regular file, hash on the pool
        std::error_code ec;
        auto file_size = dir_entry.file_size(ec);
        if (ec) {
          // error read file size, skip
          ++job.skipped;
          oss(log_stream()) << "[warn] skip file: " << dir_entry.path()
                            << " - " << ec.message() << '\n';
        } else if (file_size > 0) {
          boost::asio::post(job.pool,
                            std::bind(hash_file, dir_entry.path(), false, job));
        }

      } else {
        // other file type, skip
        oss(log_stream()) << "[warn] skip unsupport file: " << dir_entry.path()
                          << '\n';
      }
    }
  } catch (const fs::filesystem_error &e) {
    // error iterate directory, skip
    ++job.skipped;
    oss(log_stream()) << "[warn] skip directory: " << dir << " - "
                      << e.code().message() << '\n';
  }
}

std::vector<scan_entry_t> scan_tree(const fs::path &root,
                                    const std::vector<std::regex> &exclude_regex,
                                    const std::string &digest,
                                    const uint32_t max_thread,
                                    std::size_t &skipped,
                                    const std::vector<fs::path> &exclude_path) {
  if (!fs::is_directory(root)) {
    throw std::invalid_argument("invalid target directory: " + root.string());
  }
  const auto abs_root = fs::absolute(root).lexically_normal();

  timer_t timer;
  std::vector<scan_entry_t> entries;
  std::atomic<std::size_t> skipped_cnt{0};
  oss(log_stream()) << "[log] scan " << abs_root << "...\n";
  {
    boost::asio::thread_pool pool(max_thread);
    std::mutex mtx;
    scan_job_t job{entries,      mtx,    pool,       exclude_regex,
                   exclude_path, digest, skipped_cnt};
    boost::asio::post(pool, std::bind(ls_dir_rec, abs_root, job));
    pool.join();
  }
  // jobs finish in any order
  std::sort(entries.begin(), entries.end(),
            [](const auto &lhs, const auto &rhs) { return lhs.path < rhs.path; });
  skipped = skipped_cnt.load();

  oss(log_stream()) << "[log] elapsed: " << timer.time().count() << "ms\n"
                    << "[log] file count: " << entries.size()
                    << ", skipped: " << skipped << '\n';
  return entries;
}

}  // namespace detail_v1

}  // namespace undup

#include "fs_ops.hh"

#include <stdexcept>
#include <string>
#include <system_error>

#include "oss.hh"

namespace undup {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

// absolute, normalized, without a trailing separator
fs::path normal_abs(const fs::path &path) {
  auto abs = fs::absolute(path).lexically_normal();
  if (!abs.has_filename() && abs.has_relative_path()) {
    abs = abs.parent_path();
  }
  return abs;
}

}  // namespace

fs::path dst_with_subdirectory(const fs::path &src, const fs::path &dstdir) {
  if (src.empty()) {
    throw std::invalid_argument("dst_with_subdirectory requires src");
  }
  if (dstdir.empty()) {
    throw std::invalid_argument("dst_with_subdirectory requires dstdir");
  }
  const auto abs_src = normal_abs(src);
  const auto abs_dst = normal_abs(dstdir);

  // skip the leading components both paths share
  auto src_it = abs_src.begin();
  auto dst_it = abs_dst.begin();
  while (src_it != abs_src.end() && dst_it != abs_dst.end() &&
         *src_it == *dst_it) {
    ++src_it;
    ++dst_it;
  }
  fs::path rest;
  for (; src_it != abs_src.end(); ++src_it) {
    rest /= *src_it;
  }

  auto new_dst = abs_dst / rest;
  if (rest.empty() || new_dst == abs_src) {
    throw std::invalid_argument("unable to determine new destination; " +
                                new_dst.string() + " and " + abs_src.string() +
                                " are the same path");
  }
  return new_dst;
}

fs::path safe_makedirs(const fs::path &path) {
  if (path.empty()) {
    throw std::invalid_argument("safe_makedirs requires a path");
  }
  auto parent = path.parent_path();
  if (!parent.empty() && !fs::exists(parent)) {
    fs::create_directories(parent);
  }
  return parent;
}

bool safe_unlink(const fs::path &path) {
  if (path.empty()) {
    return false;
  }
  std::error_code ec;
  const auto status = fs::symlink_status(path, ec);
  if (ec || !fs::exists(status)) {
    return false;
  }
  return fs::remove(path);
}

bool same_file(const fs::path &lhs, const fs::path &rhs) noexcept {
  std::error_code ec;
  const auto same = fs::equivalent(lhs, rhs, ec);
  return !ec && same;
}

void move_file(const fs::path &src, const fs::path &dst,
               const bool rm_empty_dirs) {
  safe_makedirs(dst);
  oss(log_stream()) << "[log] move " << src << " -> " << dst << '\n';
  fs::rename(src, dst);

  if (!rm_empty_dirs) {
    return;
  }
  const auto parent = src.parent_path();
  std::error_code ec;
  if (!parent.empty() && fs::is_empty(parent, ec) && !ec) {
    fs::remove(parent, ec);
  }
  if (ec) {
    oss(log_stream()) << "[warn] keep directory: " << parent << " - "
                      << ec.message() << '\n';
  }
}

void symlink_file(const fs::path &target, const fs::path &link) {
  if (target.empty() || !fs::exists(target)) {
    throw std::invalid_argument("symlink_file requires an existing target");
  }
  if (link.empty()) {
    throw std::invalid_argument("symlink_file requires a link path");
  }
  const auto abs_target = normal_abs(target);
  const auto abs_link = normal_abs(link);
  safe_makedirs(abs_link);
  safe_unlink(abs_link);
  oss(log_stream()) << "[log] symlink " << abs_link << " -> " << abs_target
                    << '\n';
  fs::create_symlink(abs_target, abs_link);
}

bool link_file(const fs::path &target, const fs::path &link) {
  if (target.empty() || !fs::exists(target)) {
    throw std::invalid_argument("link_file requires an existing target");
  }
  if (link.empty()) {
    throw std::invalid_argument("link_file requires a link path");
  }
  if (same_file(target, link)) {
    return false;
  }
  const auto abs_target = normal_abs(target);
  const auto abs_link = normal_abs(link);
  safe_makedirs(abs_link);

  // link beside the destination first, then rename over it
  auto tmp = abs_link;
  tmp.replace_filename("." + abs_link.filename().string() + ".undup-tmp");
  safe_unlink(tmp);
  fs::create_hard_link(abs_target, tmp);
  try {
    fs::rename(tmp, abs_link);
  } catch (const fs::filesystem_error &) {
    std::error_code ec;
    fs::remove(tmp, ec);
    throw;
  }
  oss(log_stream()) << "[log] link " << abs_link << " -> " << abs_target
                    << '\n';
  return true;
}

}  // namespace detail_v1

}  // namespace undup

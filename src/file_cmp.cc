#include "file_cmp.hh"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "config.hh"

namespace undup {

inline namespace detail_v1 {

namespace {

// RAII wrapper for xxhash library.
class hasher_t {
  XXH3_state_t *_state;

 public:
  hasher_t() {
    _state = XXH3_createState();
    if (_state == nullptr) {
      throw std::runtime_error("XXH3_createState failed");
    }
    if (XXH3_128bits_reset_withSeed(_state, hash_seed) == XXH_ERROR) {
      XXH3_freeState(_state);
      throw std::runtime_error("XXH3_128bits_reset_withSeed failed");
    }
  }
  ~hasher_t() noexcept { XXH3_freeState(_state); }

  hasher_t(const hasher_t &rhs) = delete;
  hasher_t(hasher_t &&rhs) = delete;
  hasher_t &operator=(const hasher_t &rhs) = delete;
  hasher_t &operator=(hasher_t &&rhs) = delete;

  void update(const char *data, const uint64_t size) {
    if (XXH3_128bits_update(_state, data, size) == XXH_ERROR) {
      throw std::runtime_error("XXH3_128bits_update failed");
    }
  }
  XXH128_hash_t digest() noexcept { return XXH3_128bits_digest(_state); }
};

}  // namespace

file_cmp_t::file_cmp_t(std::filesystem::path path, const uint64_t size,
                       const uint32_t max_hash)
    : _path(std::move(path)),
      _size(size),
      _remain_sz(size),
      _max_hash(max_hash) {
  _file_hashes.reserve(_max_hash);
}

std::strong_ordering file_cmp_t::operator<=>(const file_cmp_t &rhs) const {
  std::strong_ordering cmp = _size <=> rhs._size;
  for (auto i = 0U; i < _max_hash && cmp == std::strong_ordering::equal;
       ++i) {
    lazy_hash(i);
    rhs.lazy_hash(i);
    cmp = _file_hashes[i].high64 <=> rhs._file_hashes[i].high64;
    if (cmp != std::strong_ordering::equal) {
      break;
    }
    cmp = _file_hashes[i].low64 <=> rhs._file_hashes[i].low64;
  }
  close_file();
  rhs.close_file();
  return cmp;
}

void file_cmp_t::open_file() const {
  if (!_file_stream.is_open()) {
    _file_stream.open(_path, std::ios::binary);
    if (!_file_stream.is_open()) {
      throw std::filesystem::filesystem_error(
          "cannot open for comparison", _path,
          std::make_error_code(std::errc::io_error));
    }
    auto processed = _size - _remain_sz;
    _file_stream.seekg((int64_t)processed);
  }
}

void file_cmp_t::close_file() const noexcept {
  if (_file_stream.is_open()) {
    _file_stream.close();
  }
}

void file_cmp_t::lazy_hash(const uint32_t idx) const {
  if (idx < _file_hashes.size()) {
    return;
  }
  open_file();
  hasher_t hasher;

  auto blk_sz =
      std::min(idx == 0U ? hash_blk_sz : hash_blk_sz << (idx - 1U), _remain_sz);
  _remain_sz -= blk_sz;
  if (_buf.empty()) {
    _buf.resize(std::max(std::min(buf_sz, _size), 1UL));
  }

  while (blk_sz > 0) {
    const auto read_sz = std::min((uint64_t)_buf.size(), blk_sz);
    const auto read_len =
        _file_stream.read(_buf.data(), (int64_t)read_sz).gcount();
    if (read_sz != (uint64_t)read_len) {
      // the file shrank or became unreadable since it was sized
      close_file();
      throw std::filesystem::filesystem_error(
          "short read during comparison", _path,
          std::make_error_code(std::errc::io_error));
    }
    hasher.update(_buf.data(), read_sz);
    blk_sz -= read_sz;
  }
  _file_hashes.emplace_back(hasher.digest());
}

bool same_content(const std::filesystem::path &lhs,
                  const std::filesystem::path &rhs) {
  if (std::filesystem::equivalent(lhs, rhs)) {
    return true;
  }
  const auto size = std::filesystem::file_size(lhs);
  if (size != std::filesystem::file_size(rhs)) {
    return false;
  }
  const auto max_hash = max_hash_for(size);
  file_cmp_t lhs_cmp(lhs, size, max_hash);
  file_cmp_t rhs_cmp(rhs, size, max_hash);
  return lhs_cmp == rhs_cmp;
}

}  // namespace detail_v1

}  // namespace undup

#include "checksum.hh"

#include <openssl/evp.h>

#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace undup {

inline namespace detail_v1 {

namespace {

// RAII wrapper for libcrypto digest context.
class digester_t {
  EVP_MD_CTX *_ctx;

 public:
  explicit digester_t(const EVP_MD *md) {
    _ctx = EVP_MD_CTX_new();
    if (_ctx == nullptr) {
      throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(_ctx, md, nullptr) != 1) {
      EVP_MD_CTX_free(_ctx);
      throw std::runtime_error("EVP_DigestInit_ex failed");
    }
  }
  ~digester_t() noexcept { EVP_MD_CTX_free(_ctx); }

  digester_t(const digester_t &rhs) = delete;
  digester_t(digester_t &&rhs) = delete;
  digester_t &operator=(const digester_t &rhs) = delete;
  digester_t &operator=(digester_t &&rhs) = delete;

  void update(const char *data, const std::size_t size) {
    if (EVP_DigestUpdate(_ctx, data, size) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }
  std::string hex_digest() {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(_ctx, md, &len) != 1) {
      throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return to_hex(md, len);
  }
};

std::error_code last_error() noexcept {
  return errno != 0 ? std::error_code(errno, std::generic_category())
                    : std::make_error_code(std::errc::io_error);
}

}  // namespace

bool is_known_digest(const std::string &digest) noexcept {
  return EVP_get_digestbyname(digest.c_str()) != nullptr;
}

std::string to_hex(const unsigned char *data, const std::size_t len) {
  constexpr char digits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    hex += digits[data[i] >> 4];
    hex += digits[data[i] & 0x0f];
  }
  return hex;
}

std::string file_checksum(const std::filesystem::path &path,
                          const std::string &digest) {
  if (path.empty()) {
    throw std::invalid_argument("file_checksum requires a path");
  }
  const EVP_MD *md = EVP_get_digestbyname(digest.c_str());
  if (md == nullptr) {
    throw std::invalid_argument("invalid hash algorithm: " + digest);
  }

  errno = 0;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    throw std::filesystem::filesystem_error("cannot open for hashing", path,
                                            last_error());
  }
  digester_t digester(md);
  std::vector<char> buf(digest_buf_sz);
  while (ifs.read(buf.data(), (std::streamsize)buf.size()) ||
         ifs.gcount() > 0) {
    digester.update(buf.data(), (std::size_t)ifs.gcount());
  }
  if (ifs.bad()) {
    throw std::filesystem::filesystem_error("read error while hashing", path,
                                            last_error());
  }
  return digester.hex_digest();
}

}  // namespace detail_v1

}  // namespace undup

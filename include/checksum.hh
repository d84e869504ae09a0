#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "config.hh"

namespace undup {

inline namespace detail_v1 {

/**
 * @brief check a digest name against libcrypto
 *
 * @param digest digest name, e.g. sha1 or md5
 * @return true if libcrypto provides it
 */
bool is_known_digest(const std::string &digest) noexcept;

/**
 * @brief lowercase hex encoding
 */
std::string to_hex(const unsigned char *data, std::size_t len);

/**
 * @brief hex digest of a file's content, symlinks are followed
 *
 * @param path file to hash
 * @param digest digest name supported by libcrypto
 * @return lowercase hex digest
 * @throws std::invalid_argument empty path or unknown digest
 * @throws std::filesystem::filesystem_error file cannot be read
 */
std::string file_checksum(const std::filesystem::path &path,
                          const std::string &digest = default_digest);

}  // namespace detail_v1

}  // namespace undup

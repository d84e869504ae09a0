#pragma once

#include <cstdint>
#include <string>

#define UNDUP_EXPORT __attribute__((visibility("default")))

namespace undup {

// 512B
constexpr auto hash_blk_sz = 512UL;
// 16MiB
constexpr auto buf_sz = 16UL * 1024UL * 1024UL;
// 64KiB
constexpr auto digest_buf_sz = 64UL * 1024UL;

constexpr auto hash_seed = 0x178ee47c0190226cUL;

// schema version this build reads and writes
constexpr auto schema_version = 3U;

constexpr auto default_digest = "sha1";

// 30s
constexpr auto default_busy_timeout_ms = 30000;

constexpr auto default_threads = 4U;

struct index_options_t {
  // digest for new stores, an existing store keeps the one it was created with
  std::string digest = default_digest;
  int busy_timeout_ms = default_busy_timeout_ms;
  bool create_if_missing = true;
};

}  // namespace undup

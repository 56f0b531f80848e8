// Copyright (c) 2025 VillageSQL Inc. and Contributors

#include "uuid_generator.h"

#include <chrono>
#include <climits>

// Use OpenSSL for secure random number generation
#include <openssl/rand.h>

namespace sql_uuid {

namespace {

// Unix timestamps are carried in the top 48 bits of a v7 UUID
constexpr uint64_t kUnixTsMask = (uint64_t{1} << 48) - 1;

void set_version_and_variant(unsigned char* binary_uuid, int version) {
  binary_uuid[6] = static_cast<unsigned char>((binary_uuid[6] & 0x0F) |
                                              (version << 4));
  binary_uuid[8] = (binary_uuid[8] & 0x3F) | 0x80;  // Variant 10
}

}  // namespace

ErrorCode OpenSslEntropySource::fill(unsigned char* buf, size_t len) {
  if (len > static_cast<size_t>(INT_MAX)) {
    return ErrorCode::kEntropyUnavailable;
  }
  if (RAND_bytes(buf, static_cast<int>(len)) != 1) {
    return ErrorCode::kEntropyUnavailable;
  }
  return ErrorCode::kOk;
}

uint64_t SystemClock::now_unix_ms() {
  auto now = std::chrono::system_clock::now();
  auto duration = now.time_since_epoch();
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(duration)
          .count());
}

ErrorCode generate_uuid_v4(EntropySource& entropy, Uuid* out) {
  Uuid uuid;

  // Generate 128 bits (16 bytes) of random data
  ErrorCode rc = entropy.fill(uuid.bytes, kUuidBinarySize);
  if (rc != ErrorCode::kOk) return rc;

  set_version_and_variant(uuid.bytes, 4);

  *out = uuid;
  return ErrorCode::kOk;
}

ErrorCode generate_uuid_v7(EntropySource& entropy, Clock& clock, Uuid* out) {
  uint64_t unix_ts_ms = clock.now_unix_ms() & kUnixTsMask;

  Uuid uuid;

  // Random bytes for the rest; bytes 0-5 are overwritten below
  ErrorCode rc = entropy.fill(uuid.bytes, kUuidBinarySize);
  if (rc != ErrorCode::kOk) return rc;

  // Unix timestamp in milliseconds (48 bits, big-endian) -> bytes 0-5
  uuid.bytes[0] = (unix_ts_ms >> 40) & 0xFF;
  uuid.bytes[1] = (unix_ts_ms >> 32) & 0xFF;
  uuid.bytes[2] = (unix_ts_ms >> 24) & 0xFF;
  uuid.bytes[3] = (unix_ts_ms >> 16) & 0xFF;
  uuid.bytes[4] = (unix_ts_ms >> 8) & 0xFF;
  uuid.bytes[5] = unix_ts_ms & 0xFF;

  set_version_and_variant(uuid.bytes, 7);

  *out = uuid;
  return ErrorCode::kOk;
}

}  // namespace sql_uuid

// Copyright (c) 2025 VillageSQL Inc. and Contributors

#ifndef SQL_UUID_SRC_UUID_GENERATOR_H_
#define SQL_UUID_SRC_UUID_GENERATOR_H_

#include <cstddef>
#include <cstdint>

#include "uuid_codec.h"
#include "uuid_error.h"

namespace sql_uuid {

// Source of cryptographically suitable random bytes, supplied by the host.
class EntropySource {
 public:
  virtual ~EntropySource() = default;

  // Fills |len| bytes of |buf|, or returns kEntropyUnavailable.
  virtual ErrorCode fill(unsigned char* buf, size_t len) = 0;
};

// Wall clock, supplied by the host.
class Clock {
 public:
  virtual ~Clock() = default;

  // Milliseconds since 1970-01-01 00:00:00 UTC.
  virtual uint64_t now_unix_ms() = 0;
};

// Entropy from OpenSSL's CSPRNG.
class OpenSslEntropySource : public EntropySource {
 public:
  ErrorCode fill(unsigned char* buf, size_t len) override;
};

// std::chrono::system_clock.
class SystemClock : public Clock {
 public:
  uint64_t now_unix_ms() override;
};

// Random UUID: 122 random bits, version 4, variant 10.
ErrorCode generate_uuid_v4(EntropySource& entropy, Uuid* out);

// Unix epoch time-ordered UUID: low 48 bits of the clock reading, big-endian,
// in bytes 0-5, version 7, variant 10, remaining 74 bits random.
ErrorCode generate_uuid_v7(EntropySource& entropy, Clock& clock, Uuid* out);

}  // namespace sql_uuid

#endif  // SQL_UUID_SRC_UUID_GENERATOR_H_

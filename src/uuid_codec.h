// Copyright (c) 2025 VillageSQL Inc. and Contributors

#ifndef SQL_UUID_SRC_UUID_CODEC_H_
#define SQL_UUID_SRC_UUID_CODEC_H_

#include <cstddef>
#include <cstdint>

#include "uuid_error.h"

namespace sql_uuid {

// UUID is stored as 16 bytes (128 bits) in binary format
static constexpr size_t kUuidBinarySize = 16;

// 32 hex characters (2 per byte) + 4 hyphens = 36 total characters
static constexpr size_t kUuidStringLength = 36;

// A 128-bit UUID in canonical (big-endian) byte order.
struct Uuid {
  unsigned char bytes[kUuidBinarySize];
};

bool operator==(const Uuid& a, const Uuid& b);
bool operator!=(const Uuid& a, const Uuid& b);
bool operator<(const Uuid& a, const Uuid& b);

// Storage class of a host argument.
enum class ValueType { kNull, kInteger, kFloat, kText, kBlob };

// Non-owning view of one host argument. |data| and |size| are only
// meaningful for kText and kBlob.
struct SqlValue {
  ValueType type;
  const unsigned char* data;
  size_t size;
};

SqlValue make_null_value();
SqlValue make_text_value(const char* str, size_t len);
SqlValue make_blob_value(const unsigned char* data, size_t len);

// Parses the 36-character 8-4-4-4-12 form. Hex digits are accepted in either
// case; any other length, hyphen placement or character is kInvalidFormat.
ErrorCode parse_uuid_text(const char* str, size_t len, Uuid* out);

// Accepts exactly 16 bytes; any other length is kInvalidFormat.
ErrorCode parse_uuid_binary(const unsigned char* data, size_t len, Uuid* out);

// Dispatches on |value.type|: text and blob are parsed, every other storage
// class is kInvalidType.
ErrorCode parse_uuid(const SqlValue& value, Uuid* out);

// Writes the lowercase canonical text form. |out| is not NUL-terminated.
void format_uuid_text(const Uuid& uuid, char out[kUuidStringLength]);

void format_uuid_binary(const Uuid& uuid,
                        unsigned char out[kUuidBinarySize]);

// Version nibble (bits 4-7 of byte 6).
int uuid_version(const Uuid& uuid);

// True when the variant bits are 10 (RFC 9562 variant).
bool uuid_is_rfc_variant(const Uuid& uuid);

// Big-endian 48-bit Unix millisecond prefix of a v7 UUID.
uint64_t uuid_v7_timestamp_ms(const Uuid& uuid);

// Lexicographic comparison of the binary forms: -1, 0 or 1.
int compare_uuids(const Uuid& a, const Uuid& b);

}  // namespace sql_uuid

#endif  // SQL_UUID_SRC_UUID_CODEC_H_

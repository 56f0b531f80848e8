// Copyright (c) 2025 VillageSQL Inc. and Contributors

#include "uuid_codec.h"

#include <cstring>

namespace sql_uuid {

namespace {

const char kHexChars[] = "0123456789abcdef";

bool is_hyphen_position(size_t i) {
  return i == 8 || i == 13 || i == 18 || i == 23;
}

int hex_char_to_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

bool operator==(const Uuid& a, const Uuid& b) {
  return memcmp(a.bytes, b.bytes, kUuidBinarySize) == 0;
}

bool operator!=(const Uuid& a, const Uuid& b) { return !(a == b); }

bool operator<(const Uuid& a, const Uuid& b) {
  return memcmp(a.bytes, b.bytes, kUuidBinarySize) < 0;
}

SqlValue make_null_value() { return SqlValue{ValueType::kNull, nullptr, 0}; }

SqlValue make_text_value(const char* str, size_t len) {
  return SqlValue{ValueType::kText,
                  reinterpret_cast<const unsigned char*>(str), len};
}

SqlValue make_blob_value(const unsigned char* data, size_t len) {
  return SqlValue{ValueType::kBlob, data, len};
}

ErrorCode parse_uuid_text(const char* str, size_t len, Uuid* out) {
  if (!str || len != kUuidStringLength) return ErrorCode::kInvalidFormat;

  // Decode into a scratch value so |out| is untouched on failure
  Uuid parsed;
  size_t binary_idx = 0;
  size_t hex_idx = 0;

  while (hex_idx < kUuidStringLength) {
    if (is_hyphen_position(hex_idx)) {
      if (str[hex_idx] != '-') return ErrorCode::kInvalidFormat;
      hex_idx++;
      continue;
    }

    // Hyphen positions are even-aligned with byte boundaries, so a pair of
    // hex digits never straddles one.
    int high_nibble = hex_char_to_value(str[hex_idx]);
    int low_nibble = hex_char_to_value(str[hex_idx + 1]);
    if (high_nibble < 0 || low_nibble < 0) return ErrorCode::kInvalidFormat;

    parsed.bytes[binary_idx++] =
        static_cast<unsigned char>((high_nibble << 4) | low_nibble);
    hex_idx += 2;
  }

  if (binary_idx != kUuidBinarySize) return ErrorCode::kInvalidFormat;

  *out = parsed;
  return ErrorCode::kOk;
}

ErrorCode parse_uuid_binary(const unsigned char* data, size_t len,
                            Uuid* out) {
  if (!data || len != kUuidBinarySize) return ErrorCode::kInvalidFormat;

  memcpy(out->bytes, data, kUuidBinarySize);
  return ErrorCode::kOk;
}

ErrorCode parse_uuid(const SqlValue& value, Uuid* out) {
  switch (value.type) {
    case ValueType::kText:
      return parse_uuid_text(reinterpret_cast<const char*>(value.data),
                             value.size, out);
    case ValueType::kBlob:
      return parse_uuid_binary(value.data, value.size, out);
    case ValueType::kNull:
    case ValueType::kInteger:
    case ValueType::kFloat:
      break;
  }
  return ErrorCode::kInvalidType;
}

void format_uuid_text(const Uuid& uuid, char out[kUuidStringLength]) {
  size_t pos = 0;

  // Format as: 550e8400-e29b-41d4-a716-446655440000
  for (size_t i = 0; i < kUuidBinarySize; ++i) {
    unsigned char byte = uuid.bytes[i];
    out[pos++] = kHexChars[byte >> 4];
    out[pos++] = kHexChars[byte & 0x0F];

    // Add hyphens after bytes 3, 5, 7, 9
    if (i == 3 || i == 5 || i == 7 || i == 9) {
      out[pos++] = '-';
    }
  }
}

void format_uuid_binary(const Uuid& uuid,
                        unsigned char out[kUuidBinarySize]) {
  memcpy(out, uuid.bytes, kUuidBinarySize);
}

int uuid_version(const Uuid& uuid) { return (uuid.bytes[6] >> 4) & 0x0F; }

bool uuid_is_rfc_variant(const Uuid& uuid) {
  return (uuid.bytes[8] & 0xC0) == 0x80;
}

uint64_t uuid_v7_timestamp_ms(const Uuid& uuid) {
  return (static_cast<uint64_t>(uuid.bytes[0]) << 40) |
         (static_cast<uint64_t>(uuid.bytes[1]) << 32) |
         (static_cast<uint64_t>(uuid.bytes[2]) << 24) |
         (static_cast<uint64_t>(uuid.bytes[3]) << 16) |
         (static_cast<uint64_t>(uuid.bytes[4]) << 8) |
         static_cast<uint64_t>(uuid.bytes[5]);
}

int compare_uuids(const Uuid& a, const Uuid& b) {
  int cmp = memcmp(a.bytes, b.bytes, kUuidBinarySize);
  return (cmp < 0) ? -1 : (cmp > 0) ? 1 : 0;
}

}  // namespace sql_uuid

// Copyright (c) 2025 VillageSQL Inc. and Contributors

#include <villagesql/extension.h>

#include <cstddef>
#include <cstring>

#include "uuid_codec.h"
#include "uuid_error.h"
#include "uuid_functions.h"

using namespace villagesql::extension_builder;
using namespace villagesql::func_builder;
using namespace villagesql::type_builder;

using sql_uuid::ErrorCode;
using sql_uuid::FunctionDescriptor;
using sql_uuid::SqlValue;
using sql_uuid::Uuid;
using sql_uuid::kUuidBinarySize;
using sql_uuid::kUuidStringLength;

// Custom type name constant
constexpr const char* UUID = "uuid";

// =============================================================================
// UUID Type Functions (encode, decode, compare)
// =============================================================================

// Encode: string -> binary (16 bytes)
bool uuid_encode(unsigned char* buffer, size_t buffer_size,
                 const char* from, size_t from_len, size_t* length) {
  if (buffer_size < kUuidBinarySize) {
    return true;  // error
  }

  Uuid uuid;
  if (sql_uuid::parse_uuid_text(from, from_len, &uuid) != ErrorCode::kOk) {
    return true;  // error - invalid UUID format
  }

  sql_uuid::format_uuid_binary(uuid, buffer);
  *length = kUuidBinarySize;
  return false;  // success
}

// Decode: binary -> string (36 chars)
bool uuid_decode(const unsigned char* buffer, size_t buffer_size,
                 char* to, size_t to_size, size_t* to_length) {
  if (to_size < kUuidStringLength) {
    return true;  // error
  }

  Uuid uuid;
  if (sql_uuid::parse_uuid_binary(buffer, buffer_size, &uuid) !=
      ErrorCode::kOk) {
    return true;  // error
  }

  sql_uuid::format_uuid_text(uuid, to);
  *to_length = kUuidStringLength;
  return false;  // success
}

// Compare: lexicographic comparison of binary UUIDs
int uuid_compare(const unsigned char* data1, size_t len1,
                 const unsigned char* data2, size_t len2) {
  Uuid uuid1;
  Uuid uuid2;
  if (sql_uuid::parse_uuid_binary(data1, len1, &uuid1) != ErrorCode::kOk ||
      sql_uuid::parse_uuid_binary(data2, len2, &uuid2) != ErrorCode::kOk) {
    // Treat the shorter value as "less"
    if (len1 != len2) return (len1 < len2) ? -1 : 1;
    return memcmp(data1, data2, len1);
  }

  return sql_uuid::compare_uuids(uuid1, uuid2);
}

// =============================================================================
// VDF Implementations
// =============================================================================

namespace {

// Writes a binding's result into the VDF result slot. Text results go to
// str_buf, binary results to bin_buf.
class VefResultSink : public sql_uuid::ResultSink {
 public:
  explicit VefResultSink(vef_vdf_result_t* result) : result_(result) {}

  void set_text(const char* str, size_t len) override {
    memcpy(result_->str_buf, str, len);
    result_->type = VEF_RESULT_VALUE;
    result_->actual_len = len;
  }

  void set_blob(const unsigned char* data, size_t len) override {
    memcpy(result_->bin_buf, data, len);
    result_->type = VEF_RESULT_VALUE;
    result_->actual_len = len;
  }

  void set_error(ErrorCode code) override {
    result_->type = VEF_RESULT_ERROR;
    strcpy(result_->error_msg, sql_uuid::error_message(code));
  }

 private:
  vef_vdf_result_t* result_;
};

void run_uuid_function(const char* name, vef_invalue_t* arg,
                       vef_vdf_result_t* result) {
  VefResultSink sink(result);
  int argc = arg ? 1 : 0;

  const FunctionDescriptor* function = sql_uuid::find_uuid_function(name, argc);
  if (!function) {
    sink.set_error(ErrorCode::kArityError);
    return;
  }

  SqlValue args[1];
  if (arg) {
    args[0] = sql_uuid::string_argument_value(arg->str_value, arg->str_len,
                                              arg->is_null);
  }

  sql_uuid::invoke_uuid_function(*function,
                                 sql_uuid::default_generator_context(), argc,
                                 args, &sink);
}

}  // namespace

// UUID() - random v4 UUID as text
void uuid_impl(vef_context_t* ctx, vef_vdf_result_t* result) {
  run_uuid_function("uuid", nullptr, result);
}

// UUID_STR(x) - UUID text in any case as canonical lowercase text
void uuid_str_impl(vef_context_t* ctx, vef_invalue_t* arg,
                   vef_vdf_result_t* result) {
  run_uuid_function("uuid_str", arg, result);
}

// UUID_BLOB() - random v4 UUID, returns UUID type
void uuid_blob_impl(vef_context_t* ctx, vef_vdf_result_t* result) {
  run_uuid_function("uuid_blob", nullptr, result);
}

// UUID7() - Unix epoch time-ordered UUID as text
void uuid7_impl(vef_context_t* ctx, vef_vdf_result_t* result) {
  run_uuid_function("uuid7", nullptr, result);
}

// UUID7_BLOB() - Unix epoch time-ordered UUID, returns UUID type
void uuid7_blob_impl(vef_context_t* ctx, vef_vdf_result_t* result) {
  run_uuid_function("uuid7_blob", nullptr, result);
}

// =============================================================================
// Extension Registration
// =============================================================================

VEF_GENERATE_ENTRY_POINTS(
  make_extension("vsql_uuid", "0.1.0")
    // UUID type definition
    .type(make_type(UUID)
      .persisted_length(kUuidBinarySize)
      .max_decode_buffer_length(kUuidStringLength + 1)
      .encode(&uuid_encode)
      .decode(&uuid_decode)
      .compare(&uuid_compare)
      .build())

    // Generators
    .func(make_func<&uuid_impl>("UUID")
      .returns(STRING)
      .buffer_size(kUuidStringLength)
      .build())

    .func(make_func<&uuid_blob_impl>("UUID_BLOB")
      .returns(UUID)
      .build())

    .func(make_func<&uuid7_impl>("UUID7")
      .returns(STRING)
      .buffer_size(kUuidStringLength)
      .build())

    .func(make_func<&uuid7_blob_impl>("UUID7_BLOB")
      .returns(UUID)
      .build())

    // Conversion; text <-> binary goes through the uuid type's encode/decode
    .func(make_func<&uuid_str_impl>("UUID_STR")
      .returns(STRING)
      .param(STRING)
      .buffer_size(kUuidStringLength)
      .build())
)

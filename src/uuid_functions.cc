// Copyright (c) 2025 VillageSQL Inc. and Contributors

#include "uuid_functions.h"

#include <cstring>

#include <spdlog/spdlog.h>

namespace sql_uuid {

// =============================================================================
// Result helpers
// =============================================================================

namespace {

void emit_text(const Uuid& uuid, ResultSink* sink) {
  char text[kUuidStringLength];
  format_uuid_text(uuid, text);
  sink->set_text(text, kUuidStringLength);
}

void emit_blob(const Uuid& uuid, ResultSink* sink) {
  unsigned char binary_uuid[kUuidBinarySize];
  format_uuid_binary(uuid, binary_uuid);
  sink->set_blob(binary_uuid, kUuidBinarySize);
}

// Generator failures are logged; parse failures only go back to the caller.
void emit_generator_error(const char* function_name, ErrorCode rc,
                          ResultSink* sink) {
  spdlog::warn("{}: {}", function_name, error_message(rc));
  sink->set_error(rc);
}

// =============================================================================
// Function implementations
// =============================================================================

// uuid() - random v4 UUID as canonical text
void uuid_impl(const GeneratorContext& context, int /*argc*/,
               const SqlValue* /*argv*/, ResultSink* sink) {
  Uuid uuid;
  ErrorCode rc = generate_uuid_v4(*context.entropy, &uuid);
  if (rc != ErrorCode::kOk) {
    emit_generator_error("uuid", rc, sink);
    return;
  }
  emit_text(uuid, sink);
}

// uuid_str(X) - text or blob UUID as canonical text
void uuid_str_impl(const GeneratorContext& /*context*/, int /*argc*/,
                   const SqlValue* argv, ResultSink* sink) {
  Uuid uuid;
  ErrorCode rc = parse_uuid(argv[0], &uuid);
  if (rc != ErrorCode::kOk) {
    sink->set_error(rc);
    return;
  }
  emit_text(uuid, sink);
}

// uuid_blob() - random v4 UUID as 16 bytes
void uuid_blob_generate_impl(const GeneratorContext& context, int /*argc*/,
                             const SqlValue* /*argv*/, ResultSink* sink) {
  Uuid uuid;
  ErrorCode rc = generate_uuid_v4(*context.entropy, &uuid);
  if (rc != ErrorCode::kOk) {
    emit_generator_error("uuid_blob", rc, sink);
    return;
  }
  emit_blob(uuid, sink);
}

// uuid_blob(X), uuid7_blob(X) - text or blob UUID as 16 bytes. The input is
// reformatted, never regenerated.
void uuid_blob_convert_impl(const GeneratorContext& /*context*/,
                            int /*argc*/, const SqlValue* argv,
                            ResultSink* sink) {
  Uuid uuid;
  ErrorCode rc = parse_uuid(argv[0], &uuid);
  if (rc != ErrorCode::kOk) {
    sink->set_error(rc);
    return;
  }
  emit_blob(uuid, sink);
}

// uuid7() - time-ordered v7 UUID as canonical text
void uuid7_impl(const GeneratorContext& context, int /*argc*/,
                const SqlValue* /*argv*/, ResultSink* sink) {
  Uuid uuid;
  ErrorCode rc = generate_uuid_v7(*context.entropy, *context.clock, &uuid);
  if (rc != ErrorCode::kOk) {
    emit_generator_error("uuid7", rc, sink);
    return;
  }
  emit_text(uuid, sink);
}

// uuid7_blob() - time-ordered v7 UUID as 16 bytes
void uuid7_blob_generate_impl(const GeneratorContext& context, int /*argc*/,
                              const SqlValue* /*argv*/, ResultSink* sink) {
  Uuid uuid;
  ErrorCode rc = generate_uuid_v7(*context.entropy, *context.clock, &uuid);
  if (rc != ErrorCode::kOk) {
    emit_generator_error("uuid7_blob", rc, sink);
    return;
  }
  emit_blob(uuid, sink);
}

const FunctionDescriptor kUuidFunctions[] = {
    {"uuid", 0, false, &uuid_impl},
    {"uuid_str", 1, true, &uuid_str_impl},
    {"uuid_blob", 0, false, &uuid_blob_generate_impl},
    {"uuid_blob", 1, true, &uuid_blob_convert_impl},
    {"uuid7", 0, false, &uuid7_impl},
    {"uuid7_blob", 0, false, &uuid7_blob_generate_impl},
    {"uuid7_blob", 1, true, &uuid_blob_convert_impl},
};

constexpr size_t kUuidFunctionCount =
    sizeof(kUuidFunctions) / sizeof(kUuidFunctions[0]);

}  // namespace

// =============================================================================
// Function table
// =============================================================================

const GeneratorContext& default_generator_context() {
  static OpenSslEntropySource entropy;
  static SystemClock clock;
  static const GeneratorContext context{&entropy, &clock};
  return context;
}

const FunctionDescriptor* uuid_function_table(size_t* count) {
  *count = kUuidFunctionCount;
  return kUuidFunctions;
}

const FunctionDescriptor* find_uuid_function(const char* name, int arity) {
  if (!name) return nullptr;

  for (const FunctionDescriptor& function : kUuidFunctions) {
    if (function.arity == arity && strcmp(function.name, name) == 0) {
      return &function;
    }
  }
  return nullptr;
}

SqlValue string_argument_value(const char* str, size_t len, bool is_null) {
  if (is_null) return make_null_value();
  return make_text_value(str, len);
}

void invoke_uuid_function(const FunctionDescriptor& function,
                          const GeneratorContext& context, int argc,
                          const SqlValue* argv, ResultSink* sink) {
  if (argc != function.arity || (argc > 0 && !argv)) {
    sink->set_error(ErrorCode::kArityError);
    return;
  }
  function.impl(context, argc, argv, sink);
}

// =============================================================================
// Registration
// =============================================================================

ErrorCode register_uuid_functions(FunctionRegistrar* registrar,
                                  const GeneratorContext& context) {
  if (!registrar) {
    spdlog::error("sql_uuid: no function registrar supplied");
    return ErrorCode::kRegistrationError;
  }
  // A missing capability is a setup error, not a per-call one
  if (!context.entropy || !context.clock) {
    spdlog::error("sql_uuid: generator context is missing {}",
                  !context.entropy ? "an entropy source" : "a clock");
    return ErrorCode::kRegistrationError;
  }

  for (const FunctionDescriptor& function : kUuidFunctions) {
    ErrorCode rc = registrar->register_function(function, context);
    if (rc != ErrorCode::kOk) {
      spdlog::error("sql_uuid: failed to register {}/{}: {}", function.name,
                    function.arity, error_message(rc));
      return ErrorCode::kRegistrationError;
    }
    spdlog::debug("sql_uuid: registered {}/{} ({})", function.name,
                  function.arity,
                  function.deterministic ? "deterministic"
                                         : "non-deterministic");
  }

  spdlog::debug("sql_uuid: registered {} functions", kUuidFunctionCount);
  return ErrorCode::kOk;
}

}  // namespace sql_uuid

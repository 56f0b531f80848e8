// Copyright (c) 2025 VillageSQL Inc. and Contributors

#include "sqlite_uuid.h"

#include <spdlog/spdlog.h>

#include <memory>

namespace sql_uuid {

namespace {

// Largest arity in the function table
constexpr int kMaxArguments = 1;

// Per-registration state handed to SQLite as the function's user data and
// released by its destroy callback.
struct SqliteBinding {
  const FunctionDescriptor* function;
  GeneratorContext context;
};

class SqliteResultSink : public ResultSink {
 public:
  explicit SqliteResultSink(sqlite3_context* ctx) : ctx_(ctx) {}

  void set_text(const char* str, size_t len) override {
    sqlite3_result_text(ctx_, str, static_cast<int>(len), SQLITE_TRANSIENT);
  }

  void set_blob(const unsigned char* data, size_t len) override {
    sqlite3_result_blob(ctx_, data, static_cast<int>(len), SQLITE_TRANSIENT);
  }

  void set_error(ErrorCode code) override {
    sqlite3_result_error(ctx_, error_message(code), -1);
    int rc = sqlite_error_code(code);
    if (rc != SQLITE_ERROR) sqlite3_result_error_code(ctx_, rc);
  }

 private:
  sqlite3_context* ctx_;
};

SqlValue to_sql_value(sqlite3_value* value) {
  switch (sqlite3_value_type(value)) {
    case SQLITE_TEXT: {
      // sqlite3_value_bytes must follow the pointer fetch
      const unsigned char* text = sqlite3_value_text(value);
      int bytes = sqlite3_value_bytes(value);
      return SqlValue{ValueType::kText, text, static_cast<size_t>(bytes)};
    }
    case SQLITE_BLOB: {
      const void* blob = sqlite3_value_blob(value);
      int bytes = sqlite3_value_bytes(value);
      return make_blob_value(static_cast<const unsigned char*>(blob),
                             static_cast<size_t>(bytes));
    }
    case SQLITE_INTEGER:
      return SqlValue{ValueType::kInteger, nullptr, 0};
    case SQLITE_FLOAT:
      return SqlValue{ValueType::kFloat, nullptr, 0};
    default:
      return make_null_value();
  }
}

void sqlite_scalar_callback(sqlite3_context* ctx, int argc,
                            sqlite3_value** argv) {
  const SqliteBinding* binding =
      static_cast<const SqliteBinding*>(sqlite3_user_data(ctx));
  SqliteResultSink sink(ctx);

  if (argc < 0 || argc > kMaxArguments) {
    sink.set_error(ErrorCode::kArityError);
    return;
  }

  SqlValue args[kMaxArguments];
  for (int i = 0; i < argc; ++i) {
    args[i] = to_sql_value(argv[i]);
  }

  invoke_uuid_function(*binding->function, binding->context, argc, args,
                       &sink);
}

void destroy_binding(void* binding) {
  delete static_cast<SqliteBinding*>(binding);
}

}  // namespace

int sqlite_error_code(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return SQLITE_OK;
    case ErrorCode::kInvalidType:
      return SQLITE_MISMATCH;
    case ErrorCode::kEntropyUnavailable:
      return SQLITE_INTERNAL;
    case ErrorCode::kInvalidFormat:
    case ErrorCode::kArityError:
    case ErrorCode::kRegistrationError:
      break;
  }
  return SQLITE_ERROR;
}

ErrorCode SqliteFunctionRegistrar::register_function(
    const FunctionDescriptor& function, const GeneratorContext& context) {
  // Usable from schema expressions (column DEFAULTs, views, triggers)
  int flags = SQLITE_UTF8 | SQLITE_INNOCUOUS;
  if (function.deterministic) flags |= SQLITE_DETERMINISTIC;

  // SQLite owns the binding from here on and runs destroy_binding even when
  // registration fails
  std::unique_ptr<SqliteBinding> binding(
      new SqliteBinding{&function, context});
  last_result_code_ = sqlite3_create_function_v2(
      db_, function.name, function.arity, flags, binding.release(),
      &sqlite_scalar_callback, nullptr, nullptr, &destroy_binding);

  if (last_result_code_ != SQLITE_OK) {
    spdlog::error("sql_uuid: sqlite3_create_function_v2({}, {}) failed: {}",
                  function.name, function.arity,
                  sqlite3_errstr(last_result_code_));
    return ErrorCode::kRegistrationError;
  }
  return ErrorCode::kOk;
}

int register_sqlite_uuid_functions(sqlite3* db,
                                   const GeneratorContext& context) {
  if (!db) return SQLITE_MISUSE;

  SqliteFunctionRegistrar registrar(db);
  ErrorCode rc = register_uuid_functions(&registrar, context);
  if (rc == ErrorCode::kOk) return SQLITE_OK;

  // Prefer the host's own code when it was the host that refused
  int host_rc = registrar.last_result_code();
  return host_rc != SQLITE_OK ? host_rc : sqlite_error_code(rc);
}

int sql_uuid_auto_register() {
  return sqlite3_auto_extension(
      reinterpret_cast<void (*)(void)>(&sqlite3_uuid_init));
}

}  // namespace sql_uuid

extern "C" int sqlite3_uuid_init(sqlite3* db, char** pz_err_msg,
                                 const sqlite3_api_routines* /*p_api*/) {
  int rc = sql_uuid::register_sqlite_uuid_functions(
      db, sql_uuid::default_generator_context());
  if (rc != SQLITE_OK && pz_err_msg) {
    *pz_err_msg = sqlite3_mprintf(
        "%s", sql_uuid::error_message(sql_uuid::ErrorCode::kRegistrationError));
  }
  return rc;
}

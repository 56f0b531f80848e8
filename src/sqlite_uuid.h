// Copyright (c) 2025 VillageSQL Inc. and Contributors

#ifndef SQL_UUID_SRC_SQLITE_UUID_H_
#define SQL_UUID_SRC_SQLITE_UUID_H_

#include <sqlite3.h>

#include "uuid_error.h"
#include "uuid_functions.h"

namespace sql_uuid {

// Installs descriptors into one SQLite connection with
// sqlite3_create_function_v2.
class SqliteFunctionRegistrar : public FunctionRegistrar {
 public:
  explicit SqliteFunctionRegistrar(sqlite3* db) : db_(db) {}

  ErrorCode register_function(const FunctionDescriptor& function,
                              const GeneratorContext& context) override;

  // SQLite result code of the most recent registration attempt.
  int last_result_code() const { return last_result_code_; }

 private:
  sqlite3* db_;
  int last_result_code_ = SQLITE_OK;
};

// SQLite result code used when a call fails with |code|.
int sqlite_error_code(ErrorCode code);

// Registers every UUID function on |db| using |context| for entropy and time.
// Returns SQLITE_OK or the error SQLite reported.
//
// The connection keeps the EntropySource and Clock pointers in |context|, not
// copies of them: both objects must outlive |db|.
int register_sqlite_uuid_functions(sqlite3* db,
                                   const GeneratorContext& context);

// Makes every connection opened from now on in this process register the UUID
// functions with the default generator context.
int sql_uuid_auto_register();

}  // namespace sql_uuid

extern "C" {

// Extension entry point. Registers uuid(), uuid_str(), uuid_blob(), uuid7()
// and uuid7_blob() on |db| with OpenSSL entropy and the system clock.
int sqlite3_uuid_init(sqlite3* db, char** pz_err_msg,
                      const sqlite3_api_routines* p_api);

}  // extern "C"

#endif  // SQL_UUID_SRC_SQLITE_UUID_H_

// Copyright (c) 2025 VillageSQL Inc. and Contributors

#ifndef SQL_UUID_SRC_UUID_FUNCTIONS_H_
#define SQL_UUID_SRC_UUID_FUNCTIONS_H_

#include <cstddef>

#include "uuid_codec.h"
#include "uuid_error.h"
#include "uuid_generator.h"

namespace sql_uuid {

// Capabilities injected once at registration and read by every generator
// call. Neither pointer is owned.
struct GeneratorContext {
  EntropySource* entropy;
  Clock* clock;
};

// Process-wide production context: OpenSSL entropy and the system clock.
const GeneratorContext& default_generator_context();

// Where a binding writes its single result. Exactly one setter is called per
// invocation.
class ResultSink {
 public:
  virtual ~ResultSink() = default;

  virtual void set_text(const char* str, size_t len) = 0;
  virtual void set_blob(const unsigned char* data, size_t len) = 0;
  virtual void set_error(ErrorCode code) = 0;
};

using ScalarImpl = void (*)(const GeneratorContext& context, int argc,
                            const SqlValue* argv, ResultSink* sink);

// One (name, arity) entry of the SQL surface.
struct FunctionDescriptor {
  const char* name;
  int arity;
  // False for the zero-argument generators so hosts never cache or
  // constant-fold their results.
  bool deterministic;
  ScalarImpl impl;
};

// Returns the table of every (name, arity) pair and stores its length in
// |count|.
const FunctionDescriptor* uuid_function_table(size_t* count);

// Looks up the entry for |name| taking |arity| arguments, or nullptr.
const FunctionDescriptor* find_uuid_function(const char* name, int arity);

// Argument value for hosts whose string parameters carry no text/binary
// storage class. Non-null strings are always text, whatever their length.
SqlValue string_argument_value(const char* str, size_t len, bool is_null);

// Checks |argc| against the descriptor's arity, then runs it.
void invoke_uuid_function(const FunctionDescriptor& function,
                          const GeneratorContext& context, int argc,
                          const SqlValue* argv, ResultSink* sink);

// Host-side function table. Implementations install one descriptor into a
// single connection or module.
class FunctionRegistrar {
 public:
  virtual ~FunctionRegistrar() = default;

  // Returns kOk, or kRegistrationError if the host refused the function.
  virtual ErrorCode register_function(const FunctionDescriptor& function,
                                      const GeneratorContext& context) = 0;
};

// Installs every entry of uuid_function_table(). Fails with
// kRegistrationError if |context| is missing a capability or the host
// refuses any function; registration stops at the first refusal.
//
// Mutates the host's function table: callers must not run queries on the
// same connection concurrently.
ErrorCode register_uuid_functions(FunctionRegistrar* registrar,
                                  const GeneratorContext& context);

}  // namespace sql_uuid

#endif  // SQL_UUID_SRC_UUID_FUNCTIONS_H_

// Copyright (c) 2025 VillageSQL Inc. and Contributors

#ifndef SQL_UUID_SRC_UUID_ERROR_H_
#define SQL_UUID_SRC_UUID_ERROR_H_

namespace sql_uuid {

// Outcome of every codec, generator, binding and registration call.
enum class ErrorCode {
  kOk = 0,
  // Argument storage class is neither text nor binary.
  kInvalidType,
  // Text or binary argument does not have the canonical UUID shape.
  kInvalidFormat,
  // Function invoked with an unsupported argument count.
  kArityError,
  // Host refused to install a function, or the generator context is
  // incomplete.
  kRegistrationError,
  // Entropy source failed to deliver random bytes.
  kEntropyUnavailable,
};

// Fixed message for |code|; never null.
const char* error_message(ErrorCode code);

}  // namespace sql_uuid

#endif  // SQL_UUID_SRC_UUID_ERROR_H_

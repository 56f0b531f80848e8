// Copyright (c) 2025 VillageSQL Inc. and Contributors

#include "uuid_error.h"

namespace sql_uuid {

const char* error_message(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kInvalidType:
      return "invalid UUID type: expected text or blob";
    case ErrorCode::kInvalidFormat:
      return "invalid UUID format";
    case ErrorCode::kArityError:
      return "wrong number of arguments";
    case ErrorCode::kRegistrationError:
      return "failed to register UUID function";
    case ErrorCode::kEntropyUnavailable:
      return "failed to read random bytes";
  }
  return "unknown error";
}

}  // namespace sql_uuid

// Copyright (c) 2025 VillageSQL Inc. and Contributors

#ifndef SQL_UUID_TEST_TEST_DOUBLES_TEST_DOUBLE_RESULT_SINK_H_
#define SQL_UUID_TEST_TEST_DOUBLES_TEST_DOUBLE_RESULT_SINK_H_

#include <string>
#include <vector>

#include "uuid_functions.h"

namespace sql_uuid::test {

class TestDoubleResultSink : public ResultSink {
 public:
  enum class Kind { kNone, kText, kBlob, kError };

  Kind result = Kind::kNone;
  int calls = 0;
  std::string text;
  std::vector<unsigned char> blob;
  ErrorCode error = ErrorCode::kOk;

  void set_text(const char* str, size_t len) override {
    ++calls;
    result = Kind::kText;
    text.assign(str, len);
  }

  void set_blob(const unsigned char* data, size_t len) override {
    ++calls;
    result = Kind::kBlob;
    blob.assign(data, data + len);
  }

  void set_error(ErrorCode code) override {
    ++calls;
    result = Kind::kError;
    error = code;
  }
};

}  // namespace sql_uuid::test

#endif  // SQL_UUID_TEST_TEST_DOUBLES_TEST_DOUBLE_RESULT_SINK_H_

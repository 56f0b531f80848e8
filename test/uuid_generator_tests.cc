// Copyright (c) 2025 VillageSQL Inc. and Contributors

#include <catch2/catch.hpp>

#include <chrono>
#include <cstring>
#include <set>
#include <string>

#include "test_doubles/test_double_clock.h"
#include "test_doubles/test_double_entropy_source.h"
#include "uuid_codec.h"
#include "uuid_generator.h"

using sql_uuid::ErrorCode;
using sql_uuid::Uuid;
using sql_uuid::kUuidBinarySize;
using sql_uuid::test::TestDoubleClock;
using sql_uuid::test::TestDoubleEntropySource;

TEST_CASE("generate_uuid_v4 sets version 4 and variant 10", "[generator][v4]") {
  TestDoubleEntropySource entropy;

  SECTION("all-ones entropy keeps every other bit set") {
    entropy.fill_byte = 0xFF;
    Uuid uuid;
    REQUIRE(sql_uuid::generate_uuid_v4(entropy, &uuid) == ErrorCode::kOk);

    REQUIRE(uuid.bytes[6] == 0x4F);
    REQUIRE(uuid.bytes[8] == 0xBF);
    for (size_t i = 0; i < kUuidBinarySize; ++i) {
      if (i != 6 && i != 8) REQUIRE(uuid.bytes[i] == 0xFF);
    }
  }

  SECTION("all-zero entropy keeps every other bit clear") {
    entropy.fill_byte = 0x00;
    Uuid uuid;
    REQUIRE(sql_uuid::generate_uuid_v4(entropy, &uuid) == ErrorCode::kOk);

    REQUIRE(uuid.bytes[6] == 0x40);
    REQUIRE(uuid.bytes[8] == 0x80);
    for (size_t i = 0; i < kUuidBinarySize; ++i) {
      if (i != 6 && i != 8) REQUIRE(uuid.bytes[i] == 0x00);
    }
  }
}

TEST_CASE("generate_uuid_v4 with OpenSSL entropy", "[generator][v4]") {
  sql_uuid::OpenSslEntropySource entropy;
  std::set<std::string> seen;

  for (int i = 0; i < 256; ++i) {
    Uuid uuid;
    REQUIRE(sql_uuid::generate_uuid_v4(entropy, &uuid) == ErrorCode::kOk);
    REQUIRE(sql_uuid::uuid_version(uuid) == 4);
    REQUIRE(sql_uuid::uuid_is_rfc_variant(uuid));
    seen.insert(std::string(reinterpret_cast<const char*>(uuid.bytes),
                            kUuidBinarySize));
  }

  REQUIRE(seen.size() == 256);
}

TEST_CASE("generate_uuid_v7 encodes the clock in the top 48 bits",
          "[generator][v7]") {
  TestDoubleEntropySource entropy;
  entropy.fill_byte = 0xFF;
  TestDoubleClock clock;
  clock.now_ms = 0x01890a5dac96ULL;

  Uuid uuid;
  REQUIRE(sql_uuid::generate_uuid_v7(entropy, clock, &uuid) ==
          ErrorCode::kOk);

  REQUIRE(uuid.bytes[0] == 0x01);
  REQUIRE(uuid.bytes[1] == 0x89);
  REQUIRE(uuid.bytes[2] == 0x0a);
  REQUIRE(uuid.bytes[3] == 0x5d);
  REQUIRE(uuid.bytes[4] == 0xac);
  REQUIRE(uuid.bytes[5] == 0x96);
  REQUIRE(uuid.bytes[6] == 0x7F);
  REQUIRE(uuid.bytes[8] == 0xBF);
  REQUIRE(sql_uuid::uuid_version(uuid) == 7);
  REQUIRE(sql_uuid::uuid_is_rfc_variant(uuid));
  REQUIRE(sql_uuid::uuid_v7_timestamp_ms(uuid) == 0x01890a5dac96ULL);
}

TEST_CASE("generate_uuid_v7 truncates timestamps to 48 bits",
          "[generator][v7]") {
  TestDoubleEntropySource entropy;
  TestDoubleClock clock;
  clock.now_ms = 0xABCD000000000042ULL;

  Uuid uuid;
  REQUIRE(sql_uuid::generate_uuid_v7(entropy, clock, &uuid) ==
          ErrorCode::kOk);
  REQUIRE(sql_uuid::uuid_v7_timestamp_ms(uuid) == 0x000000000042ULL);
}

TEST_CASE("generate_uuid_v7 is ordered by clock reading", "[generator][v7]") {
  TestDoubleEntropySource entropy;
  // Running counter so consecutive random tails differ
  entropy.fill_byte = -1;
  TestDoubleClock clock;
  clock.now_ms = 1700000000000ULL;

  SECTION("increasing clock gives increasing timestamps and binary order") {
    clock.step_ms = 1;
    Uuid previous;
    REQUIRE(sql_uuid::generate_uuid_v7(entropy, clock, &previous) ==
            ErrorCode::kOk);

    for (int i = 0; i < 100; ++i) {
      Uuid next;
      REQUIRE(sql_uuid::generate_uuid_v7(entropy, clock, &next) ==
              ErrorCode::kOk);
      REQUIRE(sql_uuid::uuid_v7_timestamp_ms(previous) <
              sql_uuid::uuid_v7_timestamp_ms(next));
      REQUIRE(previous < next);
      previous = next;
    }
  }

  SECTION("equal clock readings give equal timestamps") {
    clock.step_ms = 0;
    Uuid first;
    Uuid second;
    REQUIRE(sql_uuid::generate_uuid_v7(entropy, clock, &first) ==
            ErrorCode::kOk);
    REQUIRE(sql_uuid::generate_uuid_v7(entropy, clock, &second) ==
            ErrorCode::kOk);
    REQUIRE(sql_uuid::uuid_v7_timestamp_ms(first) ==
            sql_uuid::uuid_v7_timestamp_ms(second));
    REQUIRE(first != second);
  }
}

TEST_CASE("generate_uuid_v7 with OpenSSL entropy and the system clock",
          "[generator][v7]") {
  sql_uuid::OpenSslEntropySource entropy;
  sql_uuid::SystemClock clock;

  uint64_t before = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());

  Uuid first;
  Uuid second;
  REQUIRE(sql_uuid::generate_uuid_v7(entropy, clock, &first) ==
          ErrorCode::kOk);
  REQUIRE(sql_uuid::generate_uuid_v7(entropy, clock, &second) ==
          ErrorCode::kOk);

  REQUIRE(sql_uuid::uuid_version(first) == 7);
  REQUIRE(sql_uuid::uuid_v7_timestamp_ms(first) >= before);
  REQUIRE(sql_uuid::uuid_v7_timestamp_ms(first) <=
          sql_uuid::uuid_v7_timestamp_ms(second));
  REQUIRE(first != second);
}

TEST_CASE("generators report entropy failure", "[generator]") {
  TestDoubleEntropySource entropy;
  entropy.fail = true;
  TestDoubleClock clock;

  Uuid uuid;
  memset(uuid.bytes, 0x5A, kUuidBinarySize);
  const Uuid untouched = uuid;

  REQUIRE(sql_uuid::generate_uuid_v4(entropy, &uuid) ==
          ErrorCode::kEntropyUnavailable);
  REQUIRE(sql_uuid::generate_uuid_v7(entropy, clock, &uuid) ==
          ErrorCode::kEntropyUnavailable);
  REQUIRE(uuid == untouched);
}

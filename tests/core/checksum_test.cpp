#include "core/checksum.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

TEST_CASE("ComputeCksum matches coreutils cksum", "[core][checksum]") {
  // `printf '' | cksum` and `printf 'hello\n' | cksum`.
  const tracr::core::CksumDigest empty = tracr::core::ComputeCksum("");
  REQUIRE(empty.crc == 4294967295U);
  REQUIRE(empty.size_bytes == 0U);

  const tracr::core::CksumDigest hello = tracr::core::ComputeCksum("hello\n");
  REQUIRE(hello.crc == 3015617425U);
  REQUIRE(hello.size_bytes == 6U);
}

TEST_CASE("A single flipped byte changes the digest", "[core][checksum]") {
  const auto original = tracr::core::ComputeCksum("FROM python:3.11-slim\n");
  const auto flipped = tracr::core::ComputeCksum("GROM python:3.11-slim\n");
  REQUIRE(original != flipped);
  REQUIRE(original.size_bytes == flipped.size_bytes);
}

TEST_CASE("ParseCksumOutput reads crc and size from the first line", "[core][checksum]") {
  tracr::core::CksumDigest digest;
  REQUIRE(tracr::core::ParseCksumOutput("3015617425 6 /tmp/hello.txt\n", digest));
  REQUIRE(digest.crc == 3015617425U);
  REQUIRE(digest.size_bytes == 6U);
  REQUIRE(tracr::core::ToString(digest) == "3015617425 6");

  REQUIRE_FALSE(tracr::core::ParseCksumOutput("cksum: missing operand\n", digest));
  REQUIRE_FALSE(tracr::core::ParseCksumOutput("", digest));
}

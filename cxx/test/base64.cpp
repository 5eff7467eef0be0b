#include "sn/log/log.hpp"
#include "sn/sys/base64.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace sn;

TEST_CASE("Base64", "[base64]")
{
  auto const bytes = [](std::string const &s) { return std::vector<uint8_t>(s.begin(), s.end()); };

  SECTION("Encode")
  {
    CHECK(Base64Encode({}) == "");
    CHECK(Base64Encode(bytes("f")) == "Zg==");
    CHECK(Base64Encode(bytes("fo")) == "Zm8=");
    CHECK(Base64Encode(bytes("foo")) == "Zm9v");
    CHECK(Base64Encode(bytes("foobar")) == "Zm9vYmFy");
  }

  SECTION("Decode")
  {
    CHECK(Base64Decode("Zm9vYmFy") == bytes("foobar"));
    CHECK(Base64Decode("Zm8=") == bytes("fo"));
    CHECK(Base64Decode("Zm8") == bytes("fo"));
    CHECK(Base64Decode("Zm9v\n YmFy\n") == bytes("foobar"));
    std::vector<uint8_t> const all{0x00, 0xFF, 0x80, 0x7F, 0x3E, 0x3F};
    CHECK(Base64Decode(Base64Encode(all)) == all);
  }

  SECTION("Invalid")
  {
    CHECK_THROWS_AS(Base64Decode("Zm9v!"), Log::Failure);
    CHECK_THROWS_AS(Base64Decode("Zg==Zg=="), Log::Failure);
    CHECK_THROWS_AS(Base64Decode("Z"), Log::Failure);
  }
}

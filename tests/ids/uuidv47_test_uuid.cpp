// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of uuidv47, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <sstream>

using uuidv47::ids::Uuid;
using uuidv47::ids::UuidParseError;

TEST_CASE("Uuid parse and format", "[uuid][text]")
{
  const std::string text = "018f4e7c-3c4a-7000-8000-123456789abc";

  SECTION("Canonical lowercase round trip")
  {
    const Uuid u = uuidv47::ids::parseUuid(text);
    REQUIRE(u[0] == 0x01);
    REQUIRE(u[1] == 0x8f);
    REQUIRE(u[6] == 0x70);
    REQUIRE(u[15] == 0xbc);
    REQUIRE(u.version() == 7);
    REQUIRE(u.hasRfc4122Variant());
    REQUIRE(uuidv47::ids::formatUuid(u) == text);
  }

  SECTION("Uppercase input is accepted and formatted lowercase")
  {
    const Uuid u = uuidv47::ids::parseUuid("018F4E7C-3C4A-7000-8000-123456789ABC");
    REQUIRE(u.toString() == text);
  }

  SECTION("Mixed case")
  {
    REQUIRE(uuidv47::ids::parseUuid("018f4E7c-3C4a-7000-8000-123456789AbC").toString() == text);
  }

  SECTION("Nil and all-ones")
  {
    REQUIRE(Uuid().isNil());
    REQUIRE(Uuid().toString() == "00000000-0000-0000-0000-000000000000");
    const Uuid ones = uuidv47::ids::parseUuid("ffffffff-ffff-ffff-ffff-ffffffffffff");
    REQUIRE(ones.version() == 15);
    REQUIRE_FALSE(ones.isNil());
  }

  SECTION("Stream output")
  {
    std::ostringstream oss;
    oss << uuidv47::ids::parseUuid(text);
    REQUIRE(oss.str() == text);
  }
}

TEST_CASE("Uuid parse errors", "[uuid][text][errors]")
{
  SECTION("Wrong length")
  {
    try
    {
      (void)uuidv47::ids::parseUuid("018f4e7c-3c4a-7000-8000-123456789ab");
      FAIL("expected UuidParseError");
    }
    catch (const UuidParseError &e)
    {
      REQUIRE(std::string(e.what()) == "Invalid UUID string length: expected 36, got 35");
    }
    REQUIRE_THROWS_AS(uuidv47::ids::parseUuid(""), UuidParseError);
    REQUIRE_THROWS_AS(uuidv47::ids::parseUuid("018f4e7c3c4a70008000123456789abc"),
                      UuidParseError);
  }

  SECTION("Missing dash")
  {
    try
    {
      (void)uuidv47::ids::parseUuid("018f4e7c-3c4a-7000x8000-123456789abc");
      FAIL("expected UuidParseError");
    }
    catch (const UuidParseError &e)
    {
      REQUIRE(std::string(e.what()) == "Invalid UUID format: missing dash at position 18");
    }
  }

  SECTION("Bad hex digit")
  {
    try
    {
      (void)uuidv47::ids::parseUuid("018f4e7c-3c4a-7000-8000-12345678gabc");
      FAIL("expected UuidParseError");
    }
    catch (const UuidParseError &e)
    {
      REQUIRE(std::string(e.what()) == "Invalid hex character in UUID at position 14");
    }
  }

  SECTION("UuidParseError is a runtime_error")
  {
    REQUIRE_THROWS_AS(uuidv47::ids::parseUuid("not-a-uuid"), std::runtime_error);
  }
}

TEST_CASE("isValidUuidString", "[uuid][text]")
{
  REQUIRE(uuidv47::ids::isValidUuidString("018f4e7c-3c4a-7000-8000-123456789abc"));
  REQUIRE(uuidv47::ids::isValidUuidString("018F4E7C-3C4A-7000-8000-123456789ABC"));
  REQUIRE(uuidv47::ids::isValidUuidString("00000000-0000-0000-0000-000000000000"));

  REQUIRE_FALSE(uuidv47::ids::isValidUuidString(""));
  REQUIRE_FALSE(uuidv47::ids::isValidUuidString("018f4e7c3c4a70008000123456789abc"));
  REQUIRE_FALSE(uuidv47::ids::isValidUuidString("018f4e7c-3c4a-7000-8000-123456789abcd"));
  REQUIRE_FALSE(uuidv47::ids::isValidUuidString("018f4e7c-3c4a-7000-8000-123456789abz"));
  REQUIRE_FALSE(uuidv47::ids::isValidUuidString("018f4e7c-3c4a-7000-8000-123456789-bc"));
  REQUIRE_FALSE(uuidv47::ids::isValidUuidString("{18f4e7c-3c4a-7000-8000-123456789ab}"));
}

TEST_CASE("parseUuidWithOptions", "[uuid][text][options]")
{
  SECTION("Valid text reports version")
  {
    const auto result = uuidv47::ids::parseUuidWithOptions("018f4e7c-3c4a-7000-8000-123456789abc");
    REQUIRE(result.isValid);
    REQUIRE(result.version == 7);
    REQUIRE(result.uuid.toString() == "018f4e7c-3c4a-7000-8000-123456789abc");
  }

  SECTION("Invalid text does not throw")
  {
    uuidv47::ids::ParseResult result;
    REQUIRE_NOTHROW(result = uuidv47::ids::parseUuidWithOptions("garbage"));
    REQUIRE_FALSE(result.isValid);
    REQUIRE(result.version == 0);
    REQUIRE(result.uuid.isNil());
  }

  SECTION("Skipping validation tolerates misplaced dashes")
  {
    uuidv47::ids::ParseOptions options;
    options.skipValidation = true;

    // Dash characters are not interpreted; position 18 must still decode
    const auto strict = uuidv47::ids::parseUuidWithOptions("018f4e7c-3c4a-7000x8000-123456789abc");
    REQUIRE_FALSE(strict.isValid);

    const auto lax =
      uuidv47::ids::parseUuidWithOptions("018f4e7c-3c4a-7000x8000-123456789abc", options);
    REQUIRE(lax.isValid);
    REQUIRE(lax.uuid.toString() == "018f4e7c-3c4a-7000-8000-123456789abc");
  }

  SECTION("Skipping validation still rejects undecodable text")
  {
    uuidv47::ids::ParseOptions options;
    options.skipValidation = true;
    REQUIRE_FALSE(uuidv47::ids::parseUuidWithOptions("short", options).isValid);
    REQUIRE_FALSE(
      uuidv47::ids::parseUuidWithOptions("zz8f4e7c-3c4a-7000-8000-123456789abc", options)
        .isValid);
  }
}

TEST_CASE("Uuid bit fields", "[uuid][layout]")
{
  const Uuid v7 = uuidv47::test::craftV7(0x0000123456789abcULL, 0x0abc, 0x0123456789abcdefULL);

  REQUIRE(v7.timestamp48() == 0x0000123456789abcULL);
  REQUIRE(uuidv47::ids::getUuidVersion(v7) == 7);

  Uuid copy = v7;
  copy.setVersion(uuidv47::ids::UuidVersion::V4);
  REQUIRE(copy.version() == 4);
  REQUIRE((copy[6] & 0x0F) == (v7[6] & 0x0F));

  copy.setTimestamp48(0x0000ffffffffffffULL);
  REQUIRE(copy.timestamp48() == 0x0000ffffffffffffULL);
  REQUIRE(copy[6] == static_cast<std::uint8_t>(0x40 | (v7[6] & 0x0F)));

  SECTION("fromBytes requires 16 bytes")
  {
    const auto bytes = v7.bytes();
    REQUIRE(Uuid::fromBytes(bytes.data(), bytes.size()) == v7);
    REQUIRE_THROWS_AS(Uuid::fromBytes(bytes.data(), 15), std::invalid_argument);
  }

  SECTION("Ordering follows bytes")
  {
    const Uuid later = uuidv47::test::craftV7(0x0000123456789abdULL, 0, 0);
    REQUIRE(v7 < later);
    REQUIRE_FALSE(later < v7);
  }
}

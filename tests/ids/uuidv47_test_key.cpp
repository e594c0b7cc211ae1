// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of uuidv47, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <set>
#include <utility>
#include <vector>

using uuidv47::ids::Key;

TEST_CASE("Key byte serialization", "[key][bytes]")
{
  const Key key(0x0706050403020100ULL, 0x0f0e0d0c0b0a0908ULL);

  SECTION("Halves are little-endian")
  {
    const auto bytes = key.toBytes();
    for (std::size_t i = 0; i < Key::kSize; ++i)
    {
      REQUIRE(bytes[i] == i);
    }
    REQUIRE(Key::fromBytes(bytes) == key);
  }

  SECTION("Accepts any byte container")
  {
    const std::vector<std::uint8_t> buf = {0xef, 0xcd, 0xab, 0x89, 0x67, 0x45, 0x23, 0x01,
                                           0x10, 0x32, 0x54, 0x76, 0x98, 0xba, 0xdc, 0xfe};
    const Key k = Key::fromBytes(buf);
    REQUIRE(k.k0() == 0x0123456789abcdefULL);
    REQUIRE(k.k1() == 0xfedcba9876543210ULL);
  }

  SECTION("Rejects wrong sizes")
  {
    const std::vector<std::uint8_t> shortBuf(15, 0);
    const std::vector<std::uint8_t> longBuf(17, 0);
    REQUIRE_THROWS_AS(Key::fromBytes(shortBuf), std::invalid_argument);
    REQUIRE_THROWS_AS(Key::fromBytes(longBuf), std::invalid_argument);
    REQUIRE_THROWS_WITH(Key::fromBytes(shortBuf.data(), 0), "Key buffer must be exactly 16 bytes");
  }
}

TEST_CASE("Key hex serialization", "[key][hex]")
{
  const Key key(0x0706050403020100ULL, 0x0f0e0d0c0b0a0908ULL);

  REQUIRE(key.toHex() == "000102030405060708090a0b0c0d0e0f");
  REQUIRE(Key::fromHex("000102030405060708090a0b0c0d0e0f") == key);
  REQUIRE(Key::fromHex("000102030405060708090A0B0C0D0E0F") == key);

  SECTION("Invalid hex")
  {
    REQUIRE_THROWS_AS(Key::fromHex(""), std::invalid_argument);
    REQUIRE_THROWS_AS(Key::fromHex("000102030405060708090a0b0c0d0e"), std::invalid_argument);
    REQUIRE_THROWS_AS(Key::fromHex("000102030405060708090a0b0c0d0e0f00"), std::invalid_argument);
    REQUIRE_THROWS_AS(Key::fromHex("0001020304050607080g0a0b0c0d0e0f"), std::invalid_argument);
  }
}

TEST_CASE("Key equality", "[key]")
{
  REQUIRE(Key(1, 2) == Key(1, 2));
  REQUIRE(Key(1, 2) != Key(2, 1));
  REQUIRE(Key(0, 0) != Key(0, 1));
}

TEST_CASE("Key generation", "[key][random]")
{
  SECTION("Single keys differ")
  {
    const Key a = Key::generate();
    const Key b = Key::generate();
    REQUIRE(a != b);
    REQUIRE(Key::fromBytes(a.toBytes()) == a);
  }

  SECTION("generateMany returns distinct keys")
  {
    const auto keys = Key::generateMany(32);
    REQUIRE(keys.size() == 32);

    std::set<std::pair<std::uint64_t, std::uint64_t>> seen;
    for (const auto &k : keys)
    {
      seen.emplace(k.k0(), k.k1());
    }
    REQUIRE(seen.size() == keys.size());
  }

  SECTION("generateMany with zero count")
  {
    REQUIRE(Key::generateMany(0).empty());
  }

  SECTION("Generated keys drive the facade")
  {
    const Key key = Key::generate();
    const auto v7 = uuidv47::test::craftV7(0x018f4e7c3c4aULL, 0x0123, 0x0456789abcdefULL);
    REQUIRE(uuidv47::ids::decodeV4Facade(uuidv47::ids::encodeV4Facade(v7, key), key) == v7);
  }
}

TEST_CASE("SecureRng fills buffers", "[key][random]")
{
  std::vector<std::uint8_t> a(64, 0);
  std::vector<std::uint8_t> b(64, 0);
  uuidv47::crypto::SecureRng::fill(a);
  uuidv47::crypto::SecureRng::fill(b);
  REQUIRE(a != b);

  REQUIRE_NOTHROW(uuidv47::crypto::SecureRng::fill(nullptr, 0));
}

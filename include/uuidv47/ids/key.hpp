// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of uuidv47, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "uuidv47/crypto/secure_rng.hpp"
#include "uuidv47/ids/uuid.hpp"
#include "uuidv47/util/byte_order.hpp"

namespace uuidv47
{
namespace ids
{

  /// \brief 128-bit SipHash key shared by the encoder and decoder of facades.
  ///
  /// Serialized form is 16 bytes: k0 little-endian in bytes 0-7, k1
  /// little-endian in bytes 8-15. The hex form is those 16 bytes as 32
  /// lowercase hex digits.
  class Key
  {
  public:
    static constexpr std::size_t kSize = 16;
    static constexpr std::size_t kHexLength = kSize * 2;

    using Bytes = std::array<std::uint8_t, kSize>;

    Key(std::uint64_t k0, std::uint64_t k1) : _k0(k0), _k1(k1) {}

    std::uint64_t k0() const { return _k0; }
    std::uint64_t k1() const { return _k1; }

    /// \brief Build a key from its 16-byte serialized form.
    /// \throws std::invalid_argument if len is not 16
    static Key fromBytes(const std::uint8_t *data, std::size_t len)
    {
      if (len != kSize)
      {
        throw std::invalid_argument("Key buffer must be exactly 16 bytes");
      }
      return Key(util::readU64LE(data), util::readU64LE(data + 8));
    }

    template <typename Container> static Key fromBytes(const Container &c)
    {
      static_assert(sizeof(typename Container::value_type) == 1, "byte container required");
      return fromBytes(reinterpret_cast<const std::uint8_t *>(c.data()), c.size());
    }

    Bytes toBytes() const
    {
      Bytes out{};
      util::writeU64LE(out.data(), _k0);
      util::writeU64LE(out.data() + 8, _k1);
      return out;
    }

    /// \brief Build a key from 32 hex digits (either case).
    /// \throws std::invalid_argument on wrong length or non-hex characters
    static Key fromHex(const std::string &hex)
    {
      if (hex.size() != kHexLength)
      {
        throw std::invalid_argument("Key hex must be exactly 32 characters, got " +
                                    std::to_string(hex.size()));
      }
      Bytes bytes{};
      for (std::size_t i = 0; i < kSize; ++i)
      {
        const int hi = detail::hexValue(hex[i * 2]);
        const int lo = detail::hexValue(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0)
        {
          throw std::invalid_argument("Invalid hex character in key at byte " +
                                      std::to_string(i));
        }
        bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
      }
      return fromBytes(bytes);
    }

    std::string toHex() const
    {
      static constexpr char kHexDigits[] = "0123456789abcdef";
      const Bytes bytes = toBytes();
      std::string out;
      out.reserve(kHexLength);
      for (auto b : bytes)
      {
        out.push_back(kHexDigits[b >> 4]);
        out.push_back(kHexDigits[b & 0x0F]);
      }
      return out;
    }

    /// \brief Generate a key from the secure random source.
    /// \throws std::runtime_error if the random source fails
    static Key generate()
    {
      Bytes bytes{};
      crypto::SecureRng::fill(bytes);
      return fromBytes(bytes);
    }

    /// \brief Generate \p count keys from a single random draw.
    /// \throws std::runtime_error if the random source fails
    static std::vector<Key> generateMany(std::size_t count)
    {
      std::vector<Key> keys;
      if (count == 0)
      {
        return keys;
      }
      std::vector<std::uint8_t> material(count * kSize);
      crypto::SecureRng::fill(material);

      keys.reserve(count);
      for (std::size_t i = 0; i < count; ++i)
      {
        keys.push_back(fromBytes(material.data() + i * kSize, kSize));
      }
      return keys;
    }

    friend bool operator==(const Key &a, const Key &b) { return a._k0 == b._k0 && a._k1 == b._k1; }
    friend bool operator!=(const Key &a, const Key &b) { return !(a == b); }

  private:
    std::uint64_t _k0;
    std::uint64_t _k1;
  };

} // namespace ids
} // namespace uuidv47

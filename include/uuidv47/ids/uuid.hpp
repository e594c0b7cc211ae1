// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of uuidv47, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

#include "uuidv47/util/byte_order.hpp"

namespace uuidv47
{
namespace ids
{

  /// \brief UUID versions the facade transform works with.
  enum class UuidVersion : int
  {
    V4 = 4,
    V7 = 7
  };

  /// \brief Raised when UUID text is not in canonical 8-4-4-4-12 form.
  class UuidParseError : public std::runtime_error
  {
  public:
    explicit UuidParseError(const std::string &message) : std::runtime_error(message) {}
  };

  /// \brief 128-bit RFC 4122/9562 identifier held as 16 big-endian bytes.
  ///
  /// Layout used by the facade transform:
  /// - bytes 0-5: 48-bit timestamp (v7) or encrypted timestamp (v4 facade)
  /// - byte 6 high nibble: version
  /// - byte 6 low nibble, byte 7: rand_a (12 bits)
  /// - byte 8 top 2 bits: variant (10), low 6 bits + bytes 9-15: rand_b
  class Uuid
  {
  public:
    static constexpr std::size_t kSize = 16;
    static constexpr std::size_t kStringLength = 36;
    static constexpr std::uint8_t kVersionMask = 0x0F;
    static constexpr unsigned kVersionShift = 4;
    static constexpr std::uint8_t kVariantClearMask = 0x3F;
    static constexpr std::uint8_t kVariantRfc4122 = 0x80;

    using Bytes = std::array<std::uint8_t, kSize>;

    /// \brief Construct the nil UUID.
    Uuid() : _bytes{} {}

    explicit Uuid(const Bytes &bytes) : _bytes(bytes) {}

    /// \brief Construct from a raw buffer.
    /// \throws std::invalid_argument if len is not 16
    static Uuid fromBytes(const std::uint8_t *data, std::size_t len)
    {
      if (len != kSize)
      {
        throw std::invalid_argument("UUID buffer must be exactly 16 bytes, got " +
                                    std::to_string(len));
      }
      Bytes b{};
      std::copy(data, data + kSize, b.begin());
      return Uuid(b);
    }

    const Bytes &bytes() const { return _bytes; }
    const std::uint8_t *data() const { return _bytes.data(); }
    std::uint8_t operator[](std::size_t i) const { return _bytes[i]; }

    /// \brief Version nibble (high nibble of byte 6).
    int version() const { return (_bytes[6] >> kVersionShift) & kVersionMask; }

    /// \brief Replace the version nibble, keeping rand_a bits.
    void setVersion(int version)
    {
      _bytes[6] = static_cast<std::uint8_t>((_bytes[6] & kVersionMask) |
                                            ((version & kVersionMask) << kVersionShift));
    }

    void setVersion(UuidVersion version) { setVersion(static_cast<int>(version)); }

    /// \brief True if the top two bits of byte 8 are binary 10.
    bool hasRfc4122Variant() const { return (_bytes[8] & 0xC0) == kVariantRfc4122; }

    /// \brief Force the variant bits of byte 8 to binary 10.
    void setVariantRfc4122()
    {
      _bytes[8] = static_cast<std::uint8_t>((_bytes[8] & kVariantClearMask) | kVariantRfc4122);
    }

    /// \brief The 48-bit big-endian field in bytes 0-5.
    std::uint64_t timestamp48() const { return util::read48BitsBE(_bytes.data()); }

    void setTimestamp48(std::uint64_t value)
    {
      util::write48BitsBE(_bytes.data(), value & util::kMask48Bits);
    }

    bool isNil() const
    {
      return std::all_of(_bytes.begin(), _bytes.end(), [](std::uint8_t b) { return b == 0; });
    }

    /// \brief Canonical lowercase text form, e.g.
    /// "018f4e7c-3c4a-7000-8000-123456789abc".
    std::string toString() const
    {
      static constexpr char kHexDigits[] = "0123456789abcdef";

      std::string s;
      s.resize(kStringLength);

      std::size_t p = 0;
      for (std::size_t i = 0; i < kSize; ++i)
      {
        if (i == 4 || i == 6 || i == 8 || i == 10)
        {
          s[p++] = '-';
        }
        s[p++] = kHexDigits[_bytes[i] >> 4];
        s[p++] = kHexDigits[_bytes[i] & 0x0F];
      }
      return s;
    }

    friend bool operator==(const Uuid &a, const Uuid &b) { return a._bytes == b._bytes; }
    friend bool operator!=(const Uuid &a, const Uuid &b) { return a._bytes != b._bytes; }
    friend bool operator<(const Uuid &a, const Uuid &b) { return a._bytes < b._bytes; }

    friend std::ostream &operator<<(std::ostream &os, const Uuid &u) { return os << u.toString(); }

  private:
    Bytes _bytes;
  };

  /// \brief Options for parseUuidWithOptions().
  struct ParseOptions
  {
    /// Skip the length/dash/hex pre-check. Text that cannot be decoded is
    /// still reported as invalid.
    bool skipValidation = false;
  };

  /// \brief Result of a non-throwing parse.
  struct ParseResult
  {
    Uuid uuid;
    int version = 0;
    bool isValid = false;
  };

  namespace detail
  {
    /// Hex digit value by character code, -1 for non-hex characters.
    inline constexpr std::array<std::int8_t, 256> makeHexValueTable()
    {
      std::array<std::int8_t, 256> table{};
      for (std::size_t i = 0; i < table.size(); ++i)
      {
        table[i] = -1;
      }
      for (int c = '0'; c <= '9'; ++c)
      {
        table[static_cast<std::size_t>(c)] = static_cast<std::int8_t>(c - '0');
      }
      for (int c = 'a'; c <= 'f'; ++c)
      {
        table[static_cast<std::size_t>(c)] = static_cast<std::int8_t>(c - 'a' + 10);
      }
      for (int c = 'A'; c <= 'F'; ++c)
      {
        table[static_cast<std::size_t>(c)] = static_cast<std::int8_t>(c - 'A' + 10);
      }
      return table;
    }

    inline constexpr std::array<std::int8_t, 256> kHexValues = makeHexValueTable();

    inline constexpr std::array<std::size_t, 4> kDashPositions = {8, 13, 18, 23};

    inline int hexValue(char c) { return kHexValues[static_cast<unsigned char>(c)]; }

    inline bool isDashPosition(std::size_t pos)
    {
      return std::find(kDashPositions.begin(), kDashPositions.end(), pos) != kDashPositions.end();
    }

    /// \brief Decode the 32 hex digits of a 36-char string, skipping dash
    /// positions. Returns the byte index of the first bad digit, or -1.
    inline int decodeHex(const std::string &text, Uuid::Bytes &out)
    {
      std::size_t pos = 0;
      for (std::size_t i = 0; i < Uuid::kSize; ++i)
      {
        if (isDashPosition(pos))
        {
          ++pos;
        }
        const int hi = hexValue(text[pos]);
        const int lo = hexValue(text[pos + 1]);
        if (hi < 0 || lo < 0)
        {
          return static_cast<int>(i);
        }
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
        pos += 2;
      }
      return -1;
    }
  } // namespace detail

  /// \brief Version nibble of \p uuid.
  inline int getUuidVersion(const Uuid &uuid) { return uuid.version(); }

  /// \brief Format \p uuid in canonical 8-4-4-4-12 lowercase form.
  inline std::string formatUuid(const Uuid &uuid) { return uuid.toString(); }

  /// \brief Parse canonical 8-4-4-4-12 text (hex digits in either case).
  /// \throws UuidParseError on wrong length, misplaced dashes or bad hex
  inline Uuid parseUuid(const std::string &text)
  {
    if (text.size() != Uuid::kStringLength)
    {
      throw UuidParseError("Invalid UUID string length: expected " +
                           std::to_string(Uuid::kStringLength) + ", got " +
                           std::to_string(text.size()));
    }
    for (auto pos : detail::kDashPositions)
    {
      if (text[pos] != '-')
      {
        throw UuidParseError("Invalid UUID format: missing dash at position " +
                             std::to_string(pos));
      }
    }

    Uuid::Bytes bytes{};
    const int bad = detail::decodeHex(text, bytes);
    if (bad >= 0)
    {
      throw UuidParseError("Invalid hex character in UUID at position " + std::to_string(bad));
    }
    return Uuid(bytes);
  }

  /// \brief True if \p text is a canonical 8-4-4-4-12 UUID string.
  inline bool isValidUuidString(const std::string &text)
  {
    if (text.size() != Uuid::kStringLength)
    {
      return false;
    }
    for (std::size_t pos = 0; pos < text.size(); ++pos)
    {
      if (detail::isDashPosition(pos))
      {
        if (text[pos] != '-')
        {
          return false;
        }
      }
      else if (detail::hexValue(text[pos]) < 0)
      {
        return false;
      }
    }
    return true;
  }

  /// \brief Parse without throwing on malformed input.
  ///
  /// Invalid text yields isValid == false and version == 0.
  inline ParseResult parseUuidWithOptions(const std::string &text,
                                          const ParseOptions &options = {})
  {
    ParseResult result;
    if (!options.skipValidation && !isValidUuidString(text))
    {
      return result;
    }
    if (text.size() != Uuid::kStringLength)
    {
      return result;
    }

    Uuid::Bytes bytes{};
    if (detail::decodeHex(text, bytes) >= 0)
    {
      return result;
    }
    result.uuid = Uuid(bytes);
    result.version = result.uuid.version();
    result.isValid = true;
    return result;
  }

} // namespace ids
} // namespace uuidv47

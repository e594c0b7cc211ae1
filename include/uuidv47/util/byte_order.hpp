// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of uuidv47, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <cstdint>

namespace uuidv47
{
namespace util
{

  /// \brief Mask selecting the low 48 bits of a 64-bit word.
  inline constexpr std::uint64_t kMask48Bits = 0x0000FFFFFFFFFFFFULL;

  /// \brief Rotate a 64-bit word left by \p bits (1..63).
  inline constexpr std::uint64_t rotl64(std::uint64_t value, unsigned bits)
  {
    return (value << bits) | (value >> (64U - bits));
  }

  /// \brief Read 8 bytes as a little-endian 64-bit value.
  inline std::uint64_t readU64LE(const std::uint8_t *p)
  {
    return static_cast<std::uint64_t>(p[0]) | (static_cast<std::uint64_t>(p[1]) << 8) |
           (static_cast<std::uint64_t>(p[2]) << 16) | (static_cast<std::uint64_t>(p[3]) << 24) |
           (static_cast<std::uint64_t>(p[4]) << 32) | (static_cast<std::uint64_t>(p[5]) << 40) |
           (static_cast<std::uint64_t>(p[6]) << 48) | (static_cast<std::uint64_t>(p[7]) << 56);
  }

  /// \brief Write a 64-bit value as 8 little-endian bytes.
  inline void writeU64LE(std::uint8_t *p, std::uint64_t value)
  {
    for (std::size_t i = 0; i < 8; ++i)
    {
      p[i] = static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF);
    }
  }

  /// \brief Read 6 bytes as a big-endian 48-bit value.
  inline std::uint64_t read48BitsBE(const std::uint8_t *p)
  {
    return (static_cast<std::uint64_t>(p[0]) << 40) | (static_cast<std::uint64_t>(p[1]) << 32) |
           (static_cast<std::uint64_t>(p[2]) << 24) | (static_cast<std::uint64_t>(p[3]) << 16) |
           (static_cast<std::uint64_t>(p[4]) << 8) | static_cast<std::uint64_t>(p[5]);
  }

  /// \brief Write the low 48 bits of \p value as 6 big-endian bytes.
  inline void write48BitsBE(std::uint8_t *p, std::uint64_t value)
  {
    p[0] = static_cast<std::uint8_t>((value >> 40) & 0xFF);
    p[1] = static_cast<std::uint8_t>((value >> 32) & 0xFF);
    p[2] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
    p[3] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
    p[4] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
    p[5] = static_cast<std::uint8_t>(value & 0xFF);
  }

} // namespace util
} // namespace uuidv47

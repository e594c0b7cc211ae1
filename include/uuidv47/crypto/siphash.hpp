// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of uuidv47, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <cstdint>

#include "uuidv47/util/byte_order.hpp"

namespace uuidv47
{
namespace crypto
{

/// \brief SipHash-2-4 keyed pseudorandom function.
///
/// Produces a 64-bit digest of an arbitrary byte message under a 128-bit key
/// (k0, k1). Output matches the reference implementation by Aumasson and
/// Bernstein, including its published test vectors.
class SipHash
{
public:
  static constexpr std::uint64_t kV0Init = 0x736f6d6570736575ULL; // "somepseu"
  static constexpr std::uint64_t kV1Init = 0x646f72616e646f6dULL; // "dorandom"
  static constexpr std::uint64_t kV2Init = 0x6c7967656e657261ULL; // "lygenera"
  static constexpr std::uint64_t kV3Init = 0x7465646279746573ULL; // "tedbytes"
  static constexpr std::uint64_t kFinalizationXor = 0xFF;
  static constexpr int kCompressionRounds = 2;
  static constexpr int kFinalizationRounds = 4;

  /// \brief Compute SipHash-2-4 over a message of any length.
  /// \param data Message bytes (may be null when len is 0)
  /// \param len Message length in bytes
  /// \param k0 First key word
  /// \param k1 Second key word
  /// \return 64-bit digest
  static std::uint64_t compute(const std::uint8_t *data, std::size_t len, std::uint64_t k0,
                               std::uint64_t k1)
  {
    State s(k0, k1);

    const std::size_t fullBlocks = len / 8;
    const std::size_t remainder = len % 8;

    std::size_t offset = 0;
    for (std::size_t i = 0; i < fullBlocks; ++i)
    {
      s.absorb(util::readU64LE(data + offset));
      offset += 8;
    }

    // Length (mod 256) lives in the top byte of the final block
    std::uint64_t last = static_cast<std::uint64_t>(len & 0xFF) << 56;
    for (std::size_t i = 0; i < remainder; ++i)
    {
      last |= static_cast<std::uint64_t>(data[offset + i]) << (i * 8);
    }
    s.absorb(last);

    return s.finish();
  }

  /// \brief Compute SipHash-2-4 over exactly 10 bytes.
  ///
  /// Same output as compute(data, 10, k0, k1) with the block loop and length
  /// handling unrolled. This is the only message shape the facade transform
  /// produces.
  static std::uint64_t computeFixed10(const std::uint8_t *data, std::uint64_t k0,
                                      std::uint64_t k1)
  {
    State s(k0, k1);
    s.absorb(util::readU64LE(data));
    s.absorb((10ULL << 56) | (static_cast<std::uint64_t>(data[9]) << 8) |
             static_cast<std::uint64_t>(data[8]));
    return s.finish();
  }

private:
  struct State
  {
    std::uint64_t v0;
    std::uint64_t v1;
    std::uint64_t v2;
    std::uint64_t v3;

    State(std::uint64_t k0, std::uint64_t k1)
        : v0(kV0Init ^ k0), v1(kV1Init ^ k1), v2(kV2Init ^ k0), v3(kV3Init ^ k1)
    {
    }

    void round()
    {
      v0 += v1;
      v2 += v3;
      v1 = util::rotl64(v1, 13);
      v3 = util::rotl64(v3, 16);
      v1 ^= v0;
      v3 ^= v2;
      v0 = util::rotl64(v0, 32);

      v2 += v1;
      v0 += v3;
      v1 = util::rotl64(v1, 17);
      v3 = util::rotl64(v3, 21);
      v1 ^= v2;
      v3 ^= v0;
      v2 = util::rotl64(v2, 32);
    }

    void absorb(std::uint64_t m)
    {
      v3 ^= m;
      for (int i = 0; i < kCompressionRounds; ++i)
      {
        round();
      }
      v0 ^= m;
    }

    std::uint64_t finish()
    {
      v2 ^= kFinalizationXor;
      for (int i = 0; i < kFinalizationRounds; ++i)
      {
        round();
      }
      return v0 ^ v1 ^ v2 ^ v3;
    }
  };
};

} // namespace crypto
} // namespace uuidv47

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

#include "uuidv47/crypto/siphash.hpp"
#include "uuidv47/ids/key.hpp"
#include "uuidv47/ids/uuid.hpp"
#include "uuidv47/util/byte_order.hpp"

namespace uuidv47
{
namespace ids
{

  /// \brief Raised when encode sees a non-v7 UUID or decode sees a non-v4 one.
  class InvalidVersionError : public std::runtime_error
  {
  public:
    InvalidVersionError(int actualVersion, int expectedVersion)
        : std::runtime_error("Input UUID must be version " + std::to_string(expectedVersion) +
                             " (found version " + std::to_string(actualVersion) + ")"),
          _actualVersion(actualVersion), _expectedVersion(expectedVersion)
    {
    }

    int actualVersion() const { return _actualVersion; }
    int expectedVersion() const { return _expectedVersion; }

  private:
    int _actualVersion;
    int _expectedVersion;
  };

  /// \brief Per-call options for the facade transform.
  struct TransformOptions
  {
    /// Skip the version check for inputs already validated by the caller.
    /// A wrong-version input then produces a structurally valid but
    /// meaningless result instead of an error.
    bool skipValidation = false;
  };

  inline constexpr std::size_t kMaskInputSize = 10;

  using MaskInput = std::array<std::uint8_t, kMaskInputSize>;

  /// \brief Collect the bits the transform never touches:
  /// [b6 & 0x0F][b7][b8 & 0x3F][b9..b15].
  ///
  /// The result is the same for a v7 UUID and its v4 facade, which is what
  /// lets decode rebuild the mask without any stored state.
  inline MaskInput buildMaskInput(const Uuid &uuid)
  {
    MaskInput msg{};
    msg[0] = static_cast<std::uint8_t>(uuid[6] & Uuid::kVersionMask);
    msg[1] = uuid[7];
    msg[2] = static_cast<std::uint8_t>(uuid[8] & Uuid::kVariantClearMask);
    for (std::size_t i = 9; i < Uuid::kSize; ++i)
    {
      msg[i - 6] = uuid[i];
    }
    return msg;
  }

  namespace detail
  {
    inline std::uint64_t timestampMask(const Uuid &uuid, const Key &key)
    {
      const MaskInput msg = buildMaskInput(uuid);
      return crypto::SipHash::computeFixed10(msg.data(), key.k0(), key.k1()) & util::kMask48Bits;
    }

    inline Uuid transform(const Uuid &input, const Key &key, UuidVersion from, UuidVersion to,
                          const TransformOptions &options)
    {
      if (!options.skipValidation && input.version() != static_cast<int>(from))
      {
        throw InvalidVersionError(input.version(), static_cast<int>(from));
      }

      Uuid out = input;
      out.setTimestamp48(input.timestamp48() ^ timestampMask(input, key));
      out.setVersion(to);
      out.setVariantRfc4122();
      return out;
    }

    template <typename Fn>
    std::vector<Uuid> mapAll(const std::vector<Uuid> &inputs, Fn &&fn)
    {
      std::vector<Uuid> out;
      out.reserve(inputs.size());
      for (const auto &u : inputs)
      {
        out.push_back(fn(u));
      }
      return out;
    }
  } // namespace detail

  /// \brief Hide the timestamp of a v7 UUID behind a v4-looking facade.
  /// \param uuidV7 Time-ordered identifier; left untouched
  /// \param key Shared secret
  /// \param options Transform options
  /// \return Facade with version 4 and RFC 4122 variant bits
  /// \throws InvalidVersionError if the input is not version 7 and
  /// validation is enabled
  inline Uuid encodeV4Facade(const Uuid &uuidV7, const Key &key,
                             const TransformOptions &options = {})
  {
    return detail::transform(uuidV7, key, UuidVersion::V7, UuidVersion::V4, options);
  }

  /// \brief Recover the v7 UUID from a facade produced with the same key.
  ///
  /// A different key is not detectable: the result is a well-formed v7 UUID
  /// with an unrelated timestamp.
  /// \throws InvalidVersionError if the input is not version 4 and
  /// validation is enabled
  inline Uuid decodeV4Facade(const Uuid &uuidV4Facade, const Key &key,
                             const TransformOptions &options = {})
  {
    return detail::transform(uuidV4Facade, key, UuidVersion::V4, UuidVersion::V7, options);
  }

  /// \brief encodeV4Facade() over a sequence, preserving order. The first
  /// failing item aborts the whole batch.
  inline std::vector<Uuid> batchEncodeV4Facade(const std::vector<Uuid> &uuidsV7, const Key &key,
                                               const TransformOptions &options = {})
  {
    return detail::mapAll(uuidsV7,
                          [&](const Uuid &u) { return encodeV4Facade(u, key, options); });
  }

  /// \brief decodeV4Facade() over a sequence, preserving order.
  inline std::vector<Uuid> batchDecodeV4Facade(const std::vector<Uuid> &facades, const Key &key,
                                               const TransformOptions &options = {})
  {
    return detail::mapAll(facades,
                          [&](const Uuid &u) { return decodeV4Facade(u, key, options); });
  }

} // namespace ids
} // namespace uuidv47

// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of uuidv47, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

#include <openssl/err.h>
#include <openssl/rand.h>

namespace uuidv47
{
namespace crypto
{

/// \brief Source of key material backed by OpenSSL RAND_bytes().
class SecureRng
{
public:
  /// \brief Fill a buffer with cryptographically secure random bytes.
  /// \param dst Destination buffer
  /// \param len Number of bytes to generate
  /// \throws std::runtime_error if RAND_bytes fails
  static void fill(std::uint8_t *dst, std::size_t len)
  {
    // RAND_bytes takes an int length; large requests are served in chunks
    constexpr std::size_t kMaxChunk = static_cast<std::size_t>(std::numeric_limits<int>::max());
    while (len > 0)
    {
      const std::size_t chunk = len < kMaxChunk ? len : kMaxChunk;
      if (RAND_bytes(dst, static_cast<int>(chunk)) != 1)
      {
        throw std::runtime_error("SecureRng: RAND_bytes failed: " + lastError());
      }
      dst += chunk;
      len -= chunk;
    }
  }

  /// \brief Fill a container with cryptographically secure random bytes.
  /// \tparam Container Container type with byte-sized elements
  /// \throws std::runtime_error if RAND_bytes fails
  template <typename Container> static void fill(Container &c)
  {
    static_assert(sizeof(typename Container::value_type) == 1, "byte container required");
    fill(reinterpret_cast<std::uint8_t *>(c.data()), c.size());
  }

private:
  static std::string lastError()
  {
    unsigned long code = ERR_peek_last_error(); // NOLINT(google-runtime-int)
    if (code == 0UL)
    {
      return "no OpenSSL error available";
    }
    char buf[256] = {0};
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(buf);
  }
};

} // namespace crypto
} // namespace uuidv47

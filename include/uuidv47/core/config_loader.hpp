// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of uuidv47, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <uuidv47/core/logger.hpp>
#include <uuidv47/parsers/minimal_toml.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace uuidv47
{
namespace core
{
/// \brief Loads a TOML configuration file and exposes typed lookups by
/// dotted key ("log.level").
class ConfigLoader
{
public:
  /// \brief Constructs and loads a TOML configuration file.
  /// \throws std::runtime_error if the file is missing or malformed
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { load(); }

  /// \brief Re-reads the file. On failure the previous table is cleared and
  /// the reason is logged.
  bool reload()
  {
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _lastError.clear();
      return true;
    }
    catch (const std::runtime_error &e)
    {
      _table = parsers::toml::table{};
      _lastError = e.what();
      UUIDV47_LOG_WARN("ConfigLoader: " << _lastError);
      return false;
    }
  }

  /// \throws std::runtime_error if nothing could be loaded
  const parsers::toml::table &load()
  {
    if (_table.empty())
    {
      if (!reload())
      {
        throw std::runtime_error("Failed to load configuration file: " + _filename + " (" +
                                 _lastError + ")");
      }
    }
    return _table;
  }

  const parsers::toml::table &table() const { return _table; }

  const std::string &filename() const { return _filename; }

  /// \brief Typed lookup; std::nullopt if missing or of another type.
  /// \tparam T int64_t, bool or std::string
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node && node.is_value())
    {
      return node.as<T>();
    }
    return std::nullopt;
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

private:
  std::string _filename;
  std::string _lastError;
  parsers::toml::table _table;
};

} // namespace core
} // namespace uuidv47

// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of uuidv47, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "core/config_loader.hpp"
#include "core/logger.hpp"
#include "crypto/secure_rng.hpp"
#include "crypto/siphash.hpp"
#include "ids/facade.hpp"
#include "ids/key.hpp"
#include "ids/uuid.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#define UUIDV47_DEFAULT_CONFIG_FILE_PATH "/etc/uuidv47/uuidv47.toml"

namespace uuidv47
{

/// \brief Bundles a key with default transform options so call sites only
/// deal with UUIDs.
///
/// Immutable after construction and safe to share between threads.
class FacadeCodec
{
public:
  /// \brief Mirrors the TOML layout of a codec configuration file.
  struct Config
  {
    struct KeyConfig
    {
      std::optional<std::string> hex;
    } key;
    struct TransformConfig
    {
      std::optional<bool> skipValidation;
    } transform;
    struct LogConfig
    {
      std::optional<std::string> level;
      std::optional<std::string> file;
      std::optional<std::string> format;
      std::optional<std::string> timeFormat;
    } log;
  };

  explicit FacadeCodec(const ids::Key &key, const ids::TransformOptions &options = {})
      : _key(key), _options(options)
  {
  }

  /// \brief Read a Config from an already-loaded configuration.
  static Config readConfig(const core::ConfigLoader &loader)
  {
    Config cfg;
    cfg.key.hex = loader.getString("key.hex");
    cfg.transform.skipValidation = loader.getBool("transform.skip_validation");
    cfg.log.level = loader.getString("log.level");
    cfg.log.file = loader.getString("log.file");
    cfg.log.format = loader.getString("log.format");
    cfg.log.timeFormat = loader.getString("log.time_format");
    return cfg;
  }

  /// \brief Initialize the logger from cfg.log and build a codec from
  /// cfg.key and cfg.transform.
  /// \throws std::runtime_error if key.hex is missing
  /// \throws std::invalid_argument if key.hex is malformed
  static FacadeCodec fromConfig(const Config &cfg)
  {
    const char *DEFAULT_LOG_LEVEL = "info";
    const char *DEFAULT_LOG_FILE = "";
    const char *DEFAULT_LOG_TIME_FORMAT = "%Y-%m-%d %H:%M:%S";

    core::Logger::init(core::Logger::levelFromString(cfg.log.level.value_or(DEFAULT_LOG_LEVEL)),
                       cfg.log.file.value_or(DEFAULT_LOG_FILE),
                       cfg.log.timeFormat.value_or(DEFAULT_LOG_TIME_FORMAT));
    if (cfg.log.format)
    {
      core::Logger::setLogFormat(*cfg.log.format);
    }

    UUIDV47_LOG_INFO("FacadeCodec: log.level = " << cfg.log.level.value_or("<unset>"));
    UUIDV47_LOG_INFO("FacadeCodec: log.file = " << cfg.log.file.value_or("<unset>"));
    UUIDV47_LOG_INFO("FacadeCodec: transform.skip_validation = "
                     << (cfg.transform.skipValidation.has_value()
                           ? (*cfg.transform.skipValidation ? "true" : "false")
                           : "<unset>"));

    if (!cfg.key.hex)
    {
      UUIDV47_LOG_ERROR("FacadeCodec: key.hex is not configured");
      throw std::runtime_error("FacadeCodec: key.hex is required");
    }

    ids::TransformOptions options;
    options.skipValidation = cfg.transform.skipValidation.value_or(false);
    if (options.skipValidation)
    {
      UUIDV47_LOG_WARN("FacadeCodec: version validation disabled; wrong-version input "
                       "produces meaningless output");
    }
    return FacadeCodec(ids::Key::fromHex(*cfg.key.hex), options);
  }

  /// \brief Load a TOML file and build a codec from it.
  static FacadeCodec fromConfigFile(const std::string &path = UUIDV47_DEFAULT_CONFIG_FILE_PATH)
  {
    core::ConfigLoader loader(path);
    return fromConfig(readConfig(loader));
  }

  const ids::Key &key() const { return _key; }
  const ids::TransformOptions &options() const { return _options; }

  ids::Uuid encode(const ids::Uuid &uuidV7) const
  {
    return ids::encodeV4Facade(uuidV7, _key, _options);
  }

  ids::Uuid decode(const ids::Uuid &facade) const
  {
    return ids::decodeV4Facade(facade, _key, _options);
  }

  /// \brief Encode canonical text to canonical text.
  /// \throws ids::UuidParseError, ids::InvalidVersionError
  std::string encodeString(const std::string &uuidV7) const
  {
    return encode(ids::parseUuid(uuidV7)).toString();
  }

  std::string decodeString(const std::string &facade) const
  {
    return decode(ids::parseUuid(facade)).toString();
  }

  std::vector<ids::Uuid> encodeBatch(const std::vector<ids::Uuid> &uuidsV7) const
  {
    return ids::batchEncodeV4Facade(uuidsV7, _key, _options);
  }

  std::vector<ids::Uuid> decodeBatch(const std::vector<ids::Uuid> &facades) const
  {
    return ids::batchDecodeV4Facade(facades, _key, _options);
  }

private:
  ids::Key _key;
  ids::TransformOptions _options;
};

} // namespace uuidv47

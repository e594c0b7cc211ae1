/// \file uuidv47_example.cpp
/// \brief Command-line example that turns time-ordered UUIDv7 identifiers
/// into UUIDv4-looking facades and back.
///
/// The example shows how to:
///
/// - Build a FacadeCodec from a TOML configuration file, or from a freshly
///   generated key when no file is given.
/// - Mint v7 identifiers from the wall clock and SecureRng.
/// - Encode them for external use and decode them again with the same key.
/// - Log through the integrated Logger.
///
/// Usage: uuidv47_example [config.toml] [uuid...]
///
/// With no UUID arguments a handful of fresh v7 identifiers is generated.
/// Arguments of version 7 are encoded; arguments of version 4 are decoded.

#include "uuidv47/uuidv47.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{
uuidv47::ids::Uuid mintV7()
{
  const auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();

  uuidv47::ids::Uuid::Bytes bytes{};
  uuidv47::crypto::SecureRng::fill(bytes);

  uuidv47::ids::Uuid uuid(bytes);
  uuid.setTimestamp48(static_cast<std::uint64_t>(nowMs));
  uuid.setVersion(uuidv47::ids::UuidVersion::V7);
  uuid.setVariantRfc4122();
  return uuid;
}

bool endsWith(const std::string &s, const std::string &suffix)
{
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
} // namespace

int main(int argc, char **argv)
{
  std::vector<std::string> args(argv + 1, argv + argc);

  try
  {
    std::unique_ptr<uuidv47::FacadeCodec> codec;
    if (!args.empty() && endsWith(args.front(), ".toml"))
    {
      codec = std::make_unique<uuidv47::FacadeCodec>(
        uuidv47::FacadeCodec::fromConfigFile(args.front()));
      args.erase(args.begin());
    }
    else
    {
      uuidv47::core::Logger::init(uuidv47::core::Logger::Level::Info);
      const auto key = uuidv47::ids::Key::generate();
      UUIDV47_LOG_INFO("No configuration given, generated key " << key.toHex());
      codec = std::make_unique<uuidv47::FacadeCodec>(key);
    }

    if (args.empty())
    {
      for (int i = 0; i < 5; ++i)
      {
        const auto v7 = mintV7();
        const auto facade = codec->encode(v7);
        std::cout << v7 << " -> " << facade << " -> " << codec->decode(facade) << std::endl;
      }
      return 0;
    }

    for (const auto &text : args)
    {
      const auto parsed = uuidv47::ids::parseUuidWithOptions(text);
      if (!parsed.isValid)
      {
        UUIDV47_LOG_ERROR("Not a UUID: " << text);
        continue;
      }
      switch (parsed.version)
      {
      case 7:
        std::cout << text << " -> " << codec->encode(parsed.uuid) << std::endl;
        break;
      case 4:
        std::cout << text << " -> " << codec->decode(parsed.uuid) << std::endl;
        break;
      default:
        UUIDV47_LOG_WARN("Skipping version " << parsed.version << " UUID " << text);
        break;
      }
    }
  }
  catch (const std::exception &e)
  {
    UUIDV47_LOG_FATAL("uuidv47_example: " << e.what());
    return 1;
  }
  return 0;
}

#pragma once
#include "node_store.hpp"
#include "pipeline.hpp"
#include "registry.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace codex
{

  enum class Backend
  {
    Memory,
    Lmdb
  };

  const char *toString(Backend b);
  std::optional<Backend> parseBackend(std::string_view s);

  // "90", "90s", "15m", "2h", "7d"; nullopt if malformed or negative
  std::optional<std::chrono::seconds> parseDuration(std::string_view s);

  struct Config
  {
    std::filesystem::path dataDir{"data"};
    Backend backend{Backend::Memory};
    size_t mapSizeBytes{size_t(1ull << 30)};
    std::optional<std::chrono::seconds> gasRetention{}; // unset: keep Gas nodes forever
    std::optional<std::chrono::seconds> itemTtl{};
    std::chrono::seconds cleanupInterval{60};
    std::string bind{"unix:/tmp/codex.sock"};

    size_t summarySentences{3};
    size_t summaryMaxChars{500};
    size_t maxConcepts{10};
    double minConceptScore{0.0};

    // throws ValidationError
    void validate() const;
  };

  struct Stores
  {
    std::unique_ptr<IceStore> ice;
    std::unique_ptr<WaterStore> water;
    std::unique_ptr<EdgeStore> edges;
  };

  Stores openStores(const Config &config);
  std::unique_ptr<Registry> openRegistry(const Config &config);
  PipelineOptions pipelineOptions(const Config &config);

} // namespace codex

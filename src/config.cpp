#include "config.hpp"
#include "errors.hpp"
#include "memory_store.hpp"
#include "store.hpp"
#include <charconv>
#include <kj/debug.h>

namespace codex
{

  const char *toString(Backend b)
  {
    switch (b)
    {
    case Backend::Memory:
      return "memory";
    case Backend::Lmdb:
      return "lmdb";
    }
    return "unknown";
  }

  std::optional<Backend> parseBackend(std::string_view s)
  {
    if (s == "memory")
      return Backend::Memory;
    if (s == "lmdb")
      return Backend::Lmdb;
    return std::nullopt;
  }

  std::optional<std::chrono::seconds> parseDuration(std::string_view s)
  {
    if (s.empty())
      return std::nullopt;
    int64_t scale = 1;
    switch (s.back())
    {
    case 's':
      s.remove_suffix(1);
      break;
    case 'm':
      scale = 60;
      s.remove_suffix(1);
      break;
    case 'h':
      scale = 3600;
      s.remove_suffix(1);
      break;
    case 'd':
      scale = 86400;
      s.remove_suffix(1);
      break;
    default:
      break;
    }
    int64_t n = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
    if (s.empty() || ec != std::errc() || ptr != s.data() + s.size() || n < 0)
      return std::nullopt;
    return std::chrono::seconds(n * scale);
  }

  void Config::validate() const
  {
    if (backend == Backend::Lmdb && dataDir.empty())
      throw ValidationError("lmdb backend requires a data directory");
    if (mapSizeBytes < (size_t(1) << 20))
      throw ValidationError("map size must be at least 1 MiB");
    if (cleanupInterval.count() <= 0)
      throw ValidationError("cleanup interval must be positive");
    if (itemTtl && itemTtl->count() <= 0)
      throw ValidationError("item ttl must be positive");
    if (bind.empty())
      throw ValidationError("bind address must not be empty");
    if (summarySentences == 0 || summaryMaxChars == 0)
      throw ValidationError("summary limits must be positive");
    if (maxConcepts == 0)
      throw ValidationError("max concepts must be positive");
  }

  Stores openStores(const Config &config)
  {
    config.validate();
    Stores s{};
    if (config.backend == Backend::Lmdb)
    {
      s.ice = std::make_unique<LmdbNodeStore>(config.dataDir / "ice", "ice", config.mapSizeBytes);
      s.water = std::make_unique<WaterStore>(
          std::make_unique<LmdbNodeStore>(config.dataDir / "water", "water", config.mapSizeBytes));
      s.edges = std::make_unique<LmdbEdgeStore>(config.dataDir / "edges", config.mapSizeBytes);
    }
    else
    {
      s.ice = std::make_unique<MemoryNodeStore>();
      s.water = std::make_unique<WaterStore>(std::make_unique<MemoryNodeStore>());
      s.edges = std::make_unique<MemoryEdgeStore>();
    }
    KJ_LOG(INFO, "stores opened", toString(config.backend));
    return s;
  }

  std::unique_ptr<Registry> openRegistry(const Config &config)
  {
    auto s = openStores(config);
    return std::make_unique<Registry>(std::move(s.ice), std::move(s.water), std::move(s.edges), config.gasRetention);
  }

  PipelineOptions pipelineOptions(const Config &config)
  {
    PipelineOptions o{};
    o.summarySentences = config.summarySentences;
    o.summaryMaxChars = config.summaryMaxChars;
    o.maxConcepts = config.maxConcepts;
    o.minConceptScore = config.minConceptScore;
    o.itemTtl = config.itemTtl;
    return o;
  }

} // namespace codex

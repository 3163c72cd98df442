#pragma once
#include "node_store.hpp"
#include <array>
#include <chrono>
#include <memory>
#include <shared_mutex>

namespace codex
{

  struct RegistryStats
  {
    StoreStats ice{};
    StoreStats water{};
    uint64_t edgeCount{0};
    uint64_t gasCount{0};
  };

  struct CleanupReport
  {
    std::vector<std::string> expired{};   // water nodes past expiresAt
    std::vector<std::string> gasPurged{}; // gas nodes past the retention window
    size_t edgesRemoved{0};
  };

  // Unified node/edge surface over the Ice and Water tiers.
  //
  // A node lives in exactly one tier, chosen by its state: Ice nodes in the
  // Ice store, Water and Gas nodes in the Water store. Every operation on one
  // id runs under that id's stripe lock; migrations write the new tier before
  // removing the old copy while holding the stripe exclusively, and point
  // reads hold it shared, so a reader never sees a node in neither tier.
  class Registry
  {
  public:
    Registry(std::unique_ptr<IceStore> ice,
             std::unique_ptr<WaterStore> water,
             std::unique_ptr<EdgeStore> edges,
             std::optional<std::chrono::seconds> gasRetention = std::nullopt);

    Registry(const Registry &) = delete;
    Registry &operator=(const Registry &) = delete;

    // Throws ValidationError for malformed nodes and disallowed transitions.
    // Entering Gas stamps `gasAt` and drops `expiresAt`.
    void upsert(const Node &node);
    void upsert(const Edge &edge);
    // Like upsert, but a node already in Ice stays there (its `expiresAt` is
    // dropped) instead of being rejected as a demotion. Returns the stored tier.
    NodeState upsertKeepingIce(Node node);

    // Ice first, then Water. Gas nodes are returned.
    std::optional<Node> get(const std::string &id);
    bool nodeExists(const std::string &id);

    // Gas nodes are excluded; results are ordered by id.
    std::vector<Node> getNodesByType(const std::string &typeId);
    std::vector<Node> getNodesByTypePrefix(const std::string &prefix);
    std::vector<Node> getNodesByState(NodeState state);

    // only edges whose endpoints both resolve
    std::vector<Edge> getEdgesFrom(const std::string &id);
    std::vector<Edge> getEdgesTo(const std::string &id);

    // Logical delete. Returns false if the id does not resolve.
    bool softDelete(const std::string &id);
    // Water -> Ice; drops `expiresAt`. Returns false if the id does not resolve.
    bool promote(const std::string &id);

    RegistryStats stats();
    CleanupReport cleanupExpired(Clock::time_point now = Clock::now());

  private:
    static constexpr size_t kStripes = 64;

    std::shared_mutex &stripe(const std::string &id);
    std::optional<Node> findLocked(const std::string &id, Clock::time_point now);
    void writeLocked(Node node, std::optional<NodeState> from, Clock::time_point now);
    std::vector<Edge> resolvable(std::vector<Edge> edges);

    std::unique_ptr<IceStore> ice_;
    std::unique_ptr<WaterStore> water_;
    std::unique_ptr<EdgeStore> edges_;
    std::optional<std::chrono::seconds> gasRetention_{};
    std::array<std::shared_mutex, kStripes> stripes_{};
  };

} // namespace codex

#pragma once
#include "model.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codex
{

  using Clock = std::chrono::system_clock;

  struct StoreStats
  {
    std::string backend{};
    uint64_t nodeCount{0};
    std::map<NodeState, uint64_t> byState{};
    std::map<std::string, uint64_t> byType{};
    uint64_t expiredCount{0}; // water tier only
  };

  // Key-value persistence for nodes. Every call is atomic and either returns a
  // definite result or throws StorageUnavailable.
  class NodeStore
  {
  public:
    virtual ~NodeStore() = default;

    virtual std::optional<Node> get(const std::string &id) = 0;
    virtual void put(const Node &node) = 0;
    // returns false if the id was absent
    virtual bool remove(const std::string &id) = 0;
    virtual std::vector<Node> listByType(const std::string &typeId) = 0;
    virtual std::vector<Node> listByState(NodeState state) = 0;
    virtual std::vector<Node> listAll() = 0;
    virtual StoreStats stats() = 0;
  };

  // The Ice tier is a plain node store.
  using IceStore = NodeStore;

  // Working-set tier: a node store whose entries may carry an `expiresAt`
  // hint. Expired entries read as misses until purged.
  class WaterStore
  {
  public:
    explicit WaterStore(std::unique_ptr<NodeStore> backend);

    std::optional<Node> get(const std::string &id, Clock::time_point now = Clock::now());
    void put(const Node &node);
    bool remove(const std::string &id);
    std::vector<Node> listByType(const std::string &typeId, Clock::time_point now = Clock::now());
    std::vector<Node> listByState(NodeState state, Clock::time_point now = Clock::now());
    std::vector<Node> listAll();

    std::vector<Node> listExpired(Clock::time_point now);
    // returns the ids that were purged
    std::vector<std::string> purgeExpired(Clock::time_point now);
    bool removeIfExpired(const std::string &id, Clock::time_point now);
    StoreStats stats(Clock::time_point now = Clock::now());

    static bool isExpired(const Node &n, Clock::time_point now);

  private:
    std::unique_ptr<NodeStore> backend_;
  };

  // Adjacency index keyed by (fromId, toId, role); not tier-partitioned.
  class EdgeStore
  {
  public:
    virtual ~EdgeStore() = default;

    // replaces any edge with the same (fromId, toId, role)
    virtual void put(const Edge &edge) = 0;
    virtual bool remove(const std::string &fromId, const std::string &toId, const std::string &role) = 0;
    // drops every edge with `id` as either endpoint; returns how many
    virtual size_t removeTouching(const std::string &id) = 0;
    virtual std::vector<Edge> from(const std::string &id) = 0;
    virtual std::vector<Edge> to(const std::string &id) = 0;
    virtual uint64_t count() = 0;
  };

  int64_t toMillis(Clock::time_point t);

} // namespace codex

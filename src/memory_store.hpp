#pragma once
#include "node_store.hpp"
#include <set>
#include <shared_mutex>
#include <tuple>
#include <unordered_map>

namespace codex
{

  // Volatile node store; contents are lost with the process.
  class MemoryNodeStore final : public NodeStore
  {
  public:
    std::optional<Node> get(const std::string &id) override;
    void put(const Node &node) override;
    bool remove(const std::string &id) override;
    std::vector<Node> listByType(const std::string &typeId) override;
    std::vector<Node> listByState(NodeState state) override;
    std::vector<Node> listAll() override;
    StoreStats stats() override;

  private:
    void unindexLocked(const Node &n);

    std::shared_mutex mu_;
    std::unordered_map<std::string, Node> nodes_;
    std::unordered_map<std::string, std::set<std::string>> byType_;
  };

  class MemoryEdgeStore final : public EdgeStore
  {
  public:
    void put(const Edge &edge) override;
    bool remove(const std::string &fromId, const std::string &toId, const std::string &role) override;
    size_t removeTouching(const std::string &id) override;
    std::vector<Edge> from(const std::string &id) override;
    std::vector<Edge> to(const std::string &id) override;
    uint64_t count() override;

  private:
    // (role, other endpoint) keeps one edge per triple
    using Slot = std::tuple<std::string, std::string>;

    bool removeLocked(const std::string &fromId, const std::string &toId, const std::string &role);

    std::shared_mutex mu_;
    std::unordered_map<std::string, std::map<Slot, Edge>> out_;
    std::unordered_map<std::string, std::set<Slot>> in_;
    uint64_t count_{0};
  };

} // namespace codex

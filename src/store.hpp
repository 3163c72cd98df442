#pragma once
#include "env.hpp"
#include "node_store.hpp"
#include <string>

namespace codex
{

  // Durable node store: one LMDB environment per tier. The tier name is
  // recorded in the `meta` database on first open and checked on every reopen
  // so an ice directory is never mounted as water.
  class LmdbNodeStore final : public NodeStore
  {
  public:
    LmdbNodeStore(const std::filesystem::path &dir, std::string tier, size_t mapSizeBytes = size_t(1ull << 30));

    std::optional<Node> get(const std::string &id) override;
    void put(const Node &node) override;
    bool remove(const std::string &id) override;
    std::vector<Node> listByType(const std::string &typeId) override;
    std::vector<Node> listByState(NodeState state) override;
    std::vector<Node> listAll() override;
    StoreStats stats() override;

  private:
    Env env_;
    std::string tier_{};
  };

  class LmdbEdgeStore final : public EdgeStore
  {
  public:
    explicit LmdbEdgeStore(const std::filesystem::path &dir, size_t mapSizeBytes = size_t(1ull << 30));

    void put(const Edge &edge) override;
    bool remove(const std::string &fromId, const std::string &toId, const std::string &role) override;
    size_t removeTouching(const std::string &id) override;
    std::vector<Edge> from(const std::string &id) override;
    std::vector<Edge> to(const std::string &id) override;
    uint64_t count() override;

  private:
    Env env_;
  };

} // namespace codex

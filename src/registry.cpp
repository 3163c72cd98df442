#include "registry.hpp"
#include "errors.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>
#include <kj/debug.h>

namespace codex
{

  Registry::Registry(std::unique_ptr<IceStore> ice,
                     std::unique_ptr<WaterStore> water,
                     std::unique_ptr<EdgeStore> edges,
                     std::optional<std::chrono::seconds> gasRetention)
      : ice_(std::move(ice)), water_(std::move(water)), edges_(std::move(edges)), gasRetention_(gasRetention)
  {
    if (!ice_ || !water_ || !edges_)
      throw StorageUnavailable("registry requires ice, water and edge stores");
  }

  std::shared_mutex &Registry::stripe(const std::string &id)
  {
    return stripes_[std::hash<std::string>{}(id) % kStripes];
  }

  std::optional<Node> Registry::findLocked(const std::string &id, Clock::time_point now)
  {
    if (auto n = ice_->get(id))
      return n;
    return water_->get(id, now);
  }

  // Runs `remove` for the copy a migration leaves behind. If it fails the new
  // copy is rolled back and the original error propagates.
  template <typename Remove, typename Rollback>
  static void finish_migration(const std::string &id, Remove &&remove, Rollback &&rollback)
  {
    try
    {
      remove();
    }
    catch (const std::exception &)
    {
      try
      {
        rollback();
      }
      catch (const std::exception &e)
      {
        KJ_LOG(ERROR, "registry: migration rollback failed", id, e.what());
      }
      throw;
    }
  }

  void Registry::writeLocked(Node node, std::optional<NodeState> from, Clock::time_point now)
  {
    checkTransition(node.id, from, node.state);

    if (node.state == NodeState::Gas)
    {
      node.meta.erase(std::string(metakeys::ExpiresAt));
      if (from != NodeState::Gas || !metaInt(node.meta, metakeys::GasAt))
        node.meta.insert_or_assign(std::string(metakeys::GasAt), MetaValue{toMillis(now)});
    }

    if (node.state == NodeState::Ice)
    {
      ice_->put(node);
      if (from == NodeState::Ice)
        return;
      // also clears an expired working copy that read as absent
      finish_migration(
          node.id, [&]
          { water_->remove(node.id); },
          [&]
          { ice_->remove(node.id); });
      if (from)
        KJ_LOG(INFO, "registry: migrated", node.id, toString(*from), toString(node.state));
      return;
    }

    water_->put(node);
    if (from == NodeState::Ice)
    {
      finish_migration(
          node.id, [&]
          { ice_->remove(node.id); },
          [&]
          { water_->remove(node.id); });
      KJ_LOG(INFO, "registry: migrated", node.id, toString(*from), toString(node.state));
    }
    else if (node.state == NodeState::Gas && from != NodeState::Gas)
    {
      KJ_LOG(INFO, "registry: logically deleted", node.id);
    }
  }

  void Registry::upsert(const Node &node)
  {
    validate(node);
    auto now = Clock::now();
    std::unique_lock lk(stripe(node.id));
    auto cur = findLocked(node.id, now);
    writeLocked(node, cur ? std::optional<NodeState>(cur->state) : std::nullopt, now);
  }

  NodeState Registry::upsertKeepingIce(Node node)
  {
    validate(node);
    auto now = Clock::now();
    std::unique_lock lk(stripe(node.id));
    auto cur = findLocked(node.id, now);
    if (cur && cur->state == NodeState::Ice)
    {
      node.state = NodeState::Ice;
      node.meta.erase(std::string(metakeys::ExpiresAt));
    }
    writeLocked(node, cur ? std::optional<NodeState>(cur->state) : std::nullopt, now);
    return node.state;
  }

  void Registry::upsert(const Edge &edge)
  {
    validate(edge);
    edges_->put(edge);
  }

  std::optional<Node> Registry::get(const std::string &id)
  {
    std::shared_lock lk(stripe(id));
    return findLocked(id, Clock::now());
  }

  bool Registry::nodeExists(const std::string &id)
  {
    return get(id).has_value();
  }

  // Water is read before Ice: a node promoted between the two reads shows up
  // in Ice, and a node seen in both keeps its Ice copy.
  template <typename Pred>
  static std::vector<Node> merge_tiers(std::vector<Node> water, std::vector<Node> ice, Pred keep)
  {
    std::map<std::string, Node> byId;
    for (auto &n : water)
    {
      if (keep(n))
        byId.insert_or_assign(n.id, std::move(n));
    }
    for (auto &n : ice)
    {
      if (keep(n))
        byId.insert_or_assign(n.id, std::move(n));
    }
    std::vector<Node> out;
    out.reserve(byId.size());
    for (auto &[id, n] : byId)
      out.push_back(std::move(n));
    return out;
  }

  std::vector<Node> Registry::getNodesByType(const std::string &typeId)
  {
    auto water = water_->listByType(typeId);
    auto ice = ice_->listByType(typeId);
    return merge_tiers(std::move(water), std::move(ice), [](const Node &n)
                       { return n.state != NodeState::Gas; });
  }

  std::vector<Node> Registry::getNodesByTypePrefix(const std::string &prefix)
  {
    auto now = Clock::now();
    auto water = water_->listAll();
    auto ice = ice_->listAll();
    return merge_tiers(std::move(water), std::move(ice), [&](const Node &n)
                       { return n.state != NodeState::Gas && n.typeId.compare(0, prefix.size(), prefix) == 0 &&
                                !(n.state == NodeState::Water && WaterStore::isExpired(n, now)); });
  }

  std::vector<Node> Registry::getNodesByState(NodeState state)
  {
    auto all = [](const Node &)
    { return true; };
    if (state == NodeState::Ice)
      return merge_tiers({}, ice_->listByState(state), all);
    return merge_tiers(water_->listByState(state), {}, all);
  }

  std::vector<Edge> Registry::resolvable(std::vector<Edge> edges)
  {
    std::unordered_map<std::string, bool> seen;
    auto resolves = [&](const std::string &id)
    {
      auto it = seen.find(id);
      if (it != seen.end())
        return it->second;
      bool ok = nodeExists(id);
      seen.emplace(id, ok);
      return ok;
    };
    std::vector<Edge> out;
    for (auto &e : edges)
    {
      if (resolves(e.fromId) && resolves(e.toId))
        out.push_back(std::move(e));
    }
    return out;
  }

  std::vector<Edge> Registry::getEdgesFrom(const std::string &id)
  {
    return resolvable(edges_->from(id));
  }

  std::vector<Edge> Registry::getEdgesTo(const std::string &id)
  {
    return resolvable(edges_->to(id));
  }

  bool Registry::softDelete(const std::string &id)
  {
    auto now = Clock::now();
    std::unique_lock lk(stripe(id));
    auto cur = findLocked(id, now);
    if (!cur)
      return false;
    if (cur->state == NodeState::Gas)
      return true;
    auto from = cur->state;
    cur->state = NodeState::Gas;
    writeLocked(std::move(*cur), from, now);
    return true;
  }

  bool Registry::promote(const std::string &id)
  {
    auto now = Clock::now();
    std::unique_lock lk(stripe(id));
    auto cur = findLocked(id, now);
    if (!cur)
      return false;
    if (cur->state == NodeState::Ice)
      return true;
    auto from = cur->state;
    cur->state = NodeState::Ice;
    cur->meta.erase(std::string(metakeys::ExpiresAt));
    writeLocked(std::move(*cur), from, now);
    return true;
  }

  RegistryStats Registry::stats()
  {
    RegistryStats s{};
    s.ice = ice_->stats();
    s.water = water_->stats();
    s.edgeCount = edges_->count();
    auto it = s.water.byState.find(NodeState::Gas);
    s.gasCount = it == s.water.byState.end() ? 0 : it->second;
    return s;
  }

  CleanupReport Registry::cleanupExpired(Clock::time_point now)
  {
    CleanupReport report{};

    for (const auto &n : water_->listExpired(now))
    {
      std::unique_lock lk(stripe(n.id));
      if (!water_->removeIfExpired(n.id, now))
        continue;
      report.edgesRemoved += edges_->removeTouching(n.id);
      report.expired.push_back(n.id);
    }

    if (gasRetention_)
    {
      int64_t cutoff = toMillis(now - *gasRetention_);
      for (const auto &n : water_->listByState(NodeState::Gas, now))
      {
        std::unique_lock lk(stripe(n.id));
        // re-check under the lock; the node may have been rewritten
        auto cur = water_->get(n.id, now);
        if (!cur || cur->state != NodeState::Gas)
          continue;
        auto gasAt = metaInt(cur->meta, metakeys::GasAt);
        if (!gasAt || *gasAt > cutoff)
          continue;
        if (!water_->remove(n.id))
          continue;
        report.edgesRemoved += edges_->removeTouching(n.id);
        report.gasPurged.push_back(n.id);
      }
    }

    if (!report.expired.empty() || !report.gasPurged.empty())
      KJ_LOG(INFO, "registry: cleanup", report.expired.size(), report.gasPurged.size(), report.edgesRemoved);
    return report;
  }

} // namespace codex

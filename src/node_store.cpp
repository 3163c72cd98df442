#include "node_store.hpp"
#include <algorithm>
#include <kj/debug.h>

namespace codex
{

  int64_t toMillis(Clock::time_point t)
  {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
  }

  WaterStore::WaterStore(std::unique_ptr<NodeStore> backend) : backend_(std::move(backend)) {}

  bool WaterStore::isExpired(const Node &n, Clock::time_point now)
  {
    auto at = metaInt(n.meta, metakeys::ExpiresAt);
    return at && *at <= toMillis(now);
  }

  static std::vector<Node> dropExpired(std::vector<Node> nodes, Clock::time_point now)
  {
    nodes.erase(std::remove_if(nodes.begin(), nodes.end(), [&](const Node &n)
                               { return WaterStore::isExpired(n, now); }),
                nodes.end());
    return nodes;
  }

  std::optional<Node> WaterStore::get(const std::string &id, Clock::time_point now)
  {
    auto n = backend_->get(id);
    if (n && isExpired(*n, now))
      return std::nullopt;
    return n;
  }

  void WaterStore::put(const Node &node) { backend_->put(node); }

  bool WaterStore::remove(const std::string &id) { return backend_->remove(id); }

  std::vector<Node> WaterStore::listByType(const std::string &typeId, Clock::time_point now)
  {
    return dropExpired(backend_->listByType(typeId), now);
  }

  std::vector<Node> WaterStore::listByState(NodeState state, Clock::time_point now)
  {
    return dropExpired(backend_->listByState(state), now);
  }

  std::vector<Node> WaterStore::listAll() { return backend_->listAll(); }

  std::vector<Node> WaterStore::listExpired(Clock::time_point now)
  {
    std::vector<Node> out;
    for (auto &n : backend_->listAll())
    {
      if (isExpired(n, now))
        out.push_back(std::move(n));
    }
    return out;
  }

  std::vector<std::string> WaterStore::purgeExpired(Clock::time_point now)
  {
    std::vector<std::string> purged;
    for (const auto &n : listExpired(now))
    {
      if (removeIfExpired(n.id, now))
        purged.push_back(n.id);
    }
    if (!purged.empty())
      KJ_LOG(INFO, "water: purged expired nodes", purged.size());
    return purged;
  }

  bool WaterStore::removeIfExpired(const std::string &id, Clock::time_point now)
  {
    // the node may have been refreshed since it was listed
    auto cur = backend_->get(id);
    if (!cur || !isExpired(*cur, now))
      return false;
    return backend_->remove(id);
  }

  StoreStats WaterStore::stats(Clock::time_point now)
  {
    StoreStats s = backend_->stats();
    s.expiredCount = listExpired(now).size();
    return s;
  }

} // namespace codex

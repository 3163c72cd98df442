#include "memory_store.hpp"
#include <mutex>

namespace codex
{

  // -------------------- nodes ---------------------------

  std::optional<Node> MemoryNodeStore::get(const std::string &id)
  {
    std::shared_lock lk(mu_);
    auto it = nodes_.find(id);
    if (it == nodes_.end())
      return std::nullopt;
    return it->second;
  }

  void MemoryNodeStore::unindexLocked(const Node &n)
  {
    auto it = byType_.find(n.typeId);
    if (it == byType_.end())
      return;
    it->second.erase(n.id);
    if (it->second.empty())
      byType_.erase(it);
  }

  void MemoryNodeStore::put(const Node &node)
  {
    std::unique_lock lk(mu_);
    auto it = nodes_.find(node.id);
    if (it != nodes_.end())
    {
      unindexLocked(it->second);
      it->second = node;
    }
    else
    {
      nodes_.emplace(node.id, node);
    }
    byType_[node.typeId].insert(node.id);
  }

  bool MemoryNodeStore::remove(const std::string &id)
  {
    std::unique_lock lk(mu_);
    auto it = nodes_.find(id);
    if (it == nodes_.end())
      return false;
    unindexLocked(it->second);
    nodes_.erase(it);
    return true;
  }

  std::vector<Node> MemoryNodeStore::listByType(const std::string &typeId)
  {
    std::shared_lock lk(mu_);
    std::vector<Node> out;
    auto it = byType_.find(typeId);
    if (it == byType_.end())
      return out;
    out.reserve(it->second.size());
    for (const auto &id : it->second)
      out.push_back(nodes_.at(id));
    return out;
  }

  std::vector<Node> MemoryNodeStore::listByState(NodeState state)
  {
    std::shared_lock lk(mu_);
    std::vector<Node> out;
    for (const auto &[id, n] : nodes_)
    {
      if (n.state == state)
        out.push_back(n);
    }
    return out;
  }

  std::vector<Node> MemoryNodeStore::listAll()
  {
    std::shared_lock lk(mu_);
    std::vector<Node> out;
    out.reserve(nodes_.size());
    for (const auto &[id, n] : nodes_)
      out.push_back(n);
    return out;
  }

  StoreStats MemoryNodeStore::stats()
  {
    std::shared_lock lk(mu_);
    StoreStats s{};
    s.backend = "memory";
    s.nodeCount = nodes_.size();
    for (const auto &[id, n] : nodes_)
      ++s.byState[n.state];
    for (const auto &[typeId, ids] : byType_)
      s.byType[typeId] = ids.size();
    return s;
  }

  // -------------------- edges ---------------------------

  void MemoryEdgeStore::put(const Edge &edge)
  {
    std::unique_lock lk(mu_);
    auto [it, inserted] = out_[edge.fromId].insert_or_assign(Slot{edge.role, edge.toId}, edge);
    (void)it;
    if (inserted)
    {
      in_[edge.toId].insert(Slot{edge.role, edge.fromId});
      ++count_;
    }
  }

  bool MemoryEdgeStore::removeLocked(const std::string &fromId, const std::string &toId, const std::string &role)
  {
    auto oit = out_.find(fromId);
    if (oit == out_.end() || oit->second.erase(Slot{role, toId}) == 0)
      return false;
    if (oit->second.empty())
      out_.erase(oit);
    auto iit = in_.find(toId);
    if (iit != in_.end())
    {
      iit->second.erase(Slot{role, fromId});
      if (iit->second.empty())
        in_.erase(iit);
    }
    --count_;
    return true;
  }

  bool MemoryEdgeStore::remove(const std::string &fromId, const std::string &toId, const std::string &role)
  {
    std::unique_lock lk(mu_);
    return removeLocked(fromId, toId, role);
  }

  size_t MemoryEdgeStore::removeTouching(const std::string &id)
  {
    std::unique_lock lk(mu_);
    std::vector<std::tuple<std::string, std::string, std::string>> doomed;
    if (auto oit = out_.find(id); oit != out_.end())
    {
      for (const auto &[slot, e] : oit->second)
        doomed.emplace_back(id, std::get<1>(slot), std::get<0>(slot));
    }
    if (auto iit = in_.find(id); iit != in_.end())
    {
      for (const auto &slot : iit->second)
        doomed.emplace_back(std::get<1>(slot), id, std::get<0>(slot));
    }
    size_t n = 0;
    for (const auto &[f, t, r] : doomed)
      n += removeLocked(f, t, r) ? 1 : 0;
    return n;
  }

  std::vector<Edge> MemoryEdgeStore::from(const std::string &id)
  {
    std::shared_lock lk(mu_);
    std::vector<Edge> out;
    auto it = out_.find(id);
    if (it == out_.end())
      return out;
    out.reserve(it->second.size());
    for (const auto &[slot, e] : it->second)
      out.push_back(e);
    return out;
  }

  std::vector<Edge> MemoryEdgeStore::to(const std::string &id)
  {
    std::shared_lock lk(mu_);
    std::vector<Edge> out;
    auto it = in_.find(id);
    if (it == in_.end())
      return out;
    for (const auto &[role, fromId] : it->second)
    {
      auto oit = out_.find(fromId);
      if (oit == out_.end())
        continue;
      auto eit = oit->second.find(Slot{role, id});
      if (eit != oit->second.end())
        out.push_back(eit->second);
    }
    return out;
  }

  uint64_t MemoryEdgeStore::count()
  {
    std::shared_lock lk(mu_);
    return count_;
  }

} // namespace codex

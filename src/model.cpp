#include "model.hpp"
#include "errors.hpp"
#include <chrono>
#include <cmath>
#include <unordered_map>

namespace codex
{

  int ContentRef::payloadCount() const
  {
    return int(inlineJson.has_value()) + int(inlineBytes.has_value()) + int(externalUri.has_value());
  }

  const char *toString(NodeState s)
  {
    switch (s)
    {
    case NodeState::Ice:
      return "ice";
    case NodeState::Water:
      return "water";
    case NodeState::Gas:
      return "gas";
    }
    return "unknown";
  }

  std::optional<NodeState> parseNodeState(std::string_view s)
  {
    if (s == "ice" || s == "Ice")
      return NodeState::Ice;
    if (s == "water" || s == "Water")
      return NodeState::Water;
    if (s == "gas" || s == "Gas")
      return NodeState::Gas;
    return std::nullopt;
  }

  // rows: current state (Ice, Water, Gas); columns: requested state
  static constexpr bool kTransitions[3][3] = {
      /* Ice   */ {true, false, true},
      /* Water */ {true, true, true},
      /* Gas   */ {false, false, true},
  };

  bool transitionAllowed(std::optional<NodeState> from, NodeState to)
  {
    if (!from)
      return true;
    return kTransitions[static_cast<int>(*from)][static_cast<int>(to)];
  }

  void checkTransition(const std::string &id, std::optional<NodeState> from, NodeState to)
  {
    if (!transitionAllowed(from, to))
      throw ValidationError("node " + id + ": transition " + toString(*from) + " -> " + toString(to) + " not allowed");
  }

  const std::vector<std::string> &requiredMetaKeys(std::string_view typeId)
  {
    static const std::unordered_map<std::string_view, std::vector<std::string>> schema = {
        {types::NewsItem, {"source", "publishedAt"}},
        {types::NewsSource, {"sourceId"}},
        {types::Concept, {"name", "conceptId"}},
        {types::OntologyAxis, {"name", "frequency"}},
    };
    static const std::vector<std::string> none;
    auto it = schema.find(typeId);
    return it == schema.end() ? none : it->second;
  }

  static void checkIdent(std::string_view what, const std::string &v)
  {
    if (v.empty())
      throw ValidationError(std::string(what) + " must not be empty");
    if (v.find('\0') != std::string::npos)
      throw ValidationError(std::string(what) + " must not contain NUL");
  }

  static void checkMeta(const std::string &owner, const Meta &m)
  {
    for (const auto &[k, v] : m)
    {
      if (k.empty() || k.find('\0') != std::string::npos)
        throw ValidationError(owner + ": invalid meta key");
      if (std::holds_alternative<double>(v) && !std::isfinite(std::get<double>(v)))
        throw ValidationError(owner + ": meta '" + k + "' is not finite");
    }
  }

  void validate(const Node &n)
  {
    checkIdent("node id", n.id);
    checkIdent("node typeId", n.typeId);
    if (n.typeId.size() + 1 + n.id.size() > kMaxKeyBytes)
      throw ValidationError("node id and typeId exceed " + std::to_string(kMaxKeyBytes) + " bytes");
    if (n.content && n.content->payloadCount() > 1)
      throw ValidationError("node " + n.id + ": content has more than one payload");
    checkMeta("node " + n.id, n.meta);
    for (const auto &key : requiredMetaKeys(n.typeId))
    {
      if (n.meta.find(key) == n.meta.end())
        throw ValidationError("node " + n.id + " (" + n.typeId + "): missing meta '" + key + "'");
    }
  }

  void validate(const Edge &e)
  {
    checkIdent("edge fromId", e.fromId);
    checkIdent("edge toId", e.toId);
    checkIdent("edge role", e.role);
    if (e.fromId.size() + e.role.size() + e.toId.size() + 2 > kMaxKeyBytes)
      throw ValidationError("edge " + e.role + ": endpoint ids and role exceed " + std::to_string(kMaxKeyBytes) + " bytes");
    if (!std::isfinite(e.weight))
      throw ValidationError("edge " + e.fromId + " -> " + e.toId + ": weight is not finite");
    checkMeta("edge " + e.fromId + " -> " + e.toId, e.meta);
  }

  std::optional<std::string> metaString(const Meta &m, std::string_view key)
  {
    auto it = m.find(key);
    if (it == m.end() || !std::holds_alternative<std::string>(it->second))
      return std::nullopt;
    return std::get<std::string>(it->second);
  }

  std::optional<int64_t> metaInt(const Meta &m, std::string_view key)
  {
    auto it = m.find(key);
    if (it == m.end() || !std::holds_alternative<int64_t>(it->second))
      return std::nullopt;
    return std::get<int64_t>(it->second);
  }

  std::optional<double> metaDouble(const Meta &m, std::string_view key)
  {
    auto it = m.find(key);
    if (it == m.end())
      return std::nullopt;
    if (std::holds_alternative<double>(it->second))
      return std::get<double>(it->second);
    if (std::holds_alternative<int64_t>(it->second))
      return static_cast<double>(std::get<int64_t>(it->second));
    return std::nullopt;
  }

  std::vector<std::string> metaStrings(const Meta &m, std::string_view key)
  {
    auto it = m.find(key);
    if (it == m.end() || !std::holds_alternative<std::vector<std::string>>(it->second))
      return {};
    return std::get<std::vector<std::string>>(it->second);
  }

  int64_t nowMillis()
  {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
  }

} // namespace codex

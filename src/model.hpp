#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace codex
{

  using MetaValue = std::variant<std::monostate, bool, int64_t, double, std::string, std::vector<std::string>>;
  using Meta = std::map<std::string, MetaValue, std::less<>>;

  enum class NodeState : uint8_t
  {
    Ice = 0,
    Water = 1,
    Gas = 2
  };

  // mediaType plus at most one payload variant
  struct ContentRef
  {
    std::string mediaType{};
    std::optional<std::string> inlineJson{};
    std::optional<std::string> inlineBytes{};
    std::optional<std::string> externalUri{};

    int payloadCount() const;
    bool operator==(const ContentRef &) const = default;
  };

  struct Node
  {
    std::string id{};
    std::string typeId{};
    NodeState state{NodeState::Water};
    std::string locale{};
    std::string title{};
    std::string description{};
    std::optional<ContentRef> content{};
    Meta meta{};

    bool operator==(const Node &) const = default;
  };

  struct Edge
  {
    std::string fromId{};
    std::string toId{};
    std::string role{};
    double weight{1.0};
    Meta meta{};

    bool operator==(const Edge &) const = default;
  };

  // -------------------- well-known type ids / roles ---------------------------

  namespace types
  {
    inline constexpr std::string_view NewsItem = "codex.news.item";
    inline constexpr std::string_view NewsSource = "codex.news.source";
    inline constexpr std::string_view NewsContent = "codex.news.content";
    inline constexpr std::string_view NewsSummary = "codex.news.summary";
    inline constexpr std::string_view Concept = "codex.concept";
    inline constexpr std::string_view OntologyAxis = "codex.ontology.axis";
    inline constexpr std::string_view MetaType = "codex.meta.type";
  } // namespace types

  namespace roles
  {
    inline constexpr std::string_view HasContent = "has-content";
    inline constexpr std::string_view SummarizedAs = "summarized-as";
    inline constexpr std::string_view ContainsConcept = "contains-concept";
    inline constexpr std::string_view ConnectsToUcoreVia = "connects-to-ucore-via";
    inline constexpr std::string_view ConnectsFromUcore = "connects-from-ucore";
    inline constexpr std::string_view LeadsTo = "leads-to";
    inline constexpr std::string_view InstanceOf = "instance-of";
    inline constexpr std::string_view FromSource = "from_source";
  } // namespace roles

  // lifecycle keys owned by the registry
  namespace metakeys
  {
    inline constexpr std::string_view ExpiresAt = "expiresAt"; // int64 epoch ms
    inline constexpr std::string_view GasAt = "gasAt";         // int64 epoch ms
  } // namespace metakeys

  // -------------------- lifecycle ---------------------------

  const char *toString(NodeState s);
  std::optional<NodeState> parseNodeState(std::string_view s);

  // `from` is empty for a node that does not exist yet
  bool transitionAllowed(std::optional<NodeState> from, NodeState to);
  void checkTransition(const std::string &id, std::optional<NodeState> from, NodeState to);

  // -------------------- validation ---------------------------

  // required meta keys for a typeId; empty for free-form types
  const std::vector<std::string> &requiredMetaKeys(std::string_view typeId);

  // Longest storage key any backend accepts (LMDB's default key limit). A node
  // is indexed under <typeId>\0<id>, an edge under <from>\0<role>\0<to>.
  constexpr size_t kMaxKeyBytes = 511;

  void validate(const Node &n);
  void validate(const Edge &e);

  // -------------------- meta access ---------------------------

  std::optional<std::string> metaString(const Meta &m, std::string_view key);
  std::optional<int64_t> metaInt(const Meta &m, std::string_view key);
  std::optional<double> metaDouble(const Meta &m, std::string_view key);
  std::vector<std::string> metaStrings(const Meta &m, std::string_view key);

  int64_t nowMillis();

} // namespace codex

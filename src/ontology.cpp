#include "ontology.hpp"
#include "text.hpp"
#include <algorithm>
#include <kj/debug.h>

namespace codex
{

  namespace
  {
    constexpr double kExactMatch = 1.0;
    constexpr double kPrefixMatch = 0.5;
    constexpr double kSignatureAmplitude = 0.25;
    constexpr size_t kMinPrefix = 4;

    struct Hierarchy
    {
      std::string_view from;
      std::string_view to;
      double weight;
    };

    constexpr Hierarchy kLeadsTo[] = {
        {"grounding", "connective", 0.8},
        {"connective", "awareness", 0.7},
        {"awareness", "grounding", 0.9},
    };

    constexpr std::string_view kSeededTypes[] = {
        types::NewsItem,
        types::NewsSource,
        types::NewsContent,
        types::NewsSummary,
        types::Concept,
        types::OntologyAxis,
    };

    double keyword_match(const std::string &token, const std::vector<std::string> &keywords)
    {
      double best = 0.0;
      for (const auto &kw : keywords)
      {
        if (token == kw)
          return kExactMatch;
        const auto &shorter = token.size() < kw.size() ? token : kw;
        const auto &longer = token.size() < kw.size() ? kw : token;
        if (shorter.size() >= kMinPrefix && longer.compare(0, shorter.size(), shorter) == 0)
          best = kPrefixMatch;
      }
      return best;
    }

    bool put_if_absent(Registry &registry, const Node &n)
    {
      if (registry.nodeExists(n.id))
        return false;
      registry.upsert(n);
      return true;
    }
  } // namespace

  const std::vector<Axis> &canonicalAxes()
  {
    static const std::vector<Axis> axes = {
        {axisNodeId("grounding"), "grounding", 432.0,
         {"earth", "body", "nature", "health", "food", "climate", "economy", "money", "home",
          "physical", "material", "infrastructure", "security", "energy", "land", "work"}},
        {axisNodeId("connective"), "connective", 528.0,
         {"love", "community", "relationship", "connection", "social", "family", "culture", "peace",
          "unity", "heart", "collaboration", "art", "music", "people", "compassion", "healing"}},
        {axisNodeId("awareness"), "awareness", 741.0,
         {"awareness", "consciousness", "mind", "intention", "presence", "clarity", "insight",
          "science", "quantum", "research", "knowledge", "learning", "technology", "intelligence",
          "discovery", "innovation"}},
    };
    return axes;
  }

  std::string axisNodeId(std::string_view axisName)
  {
    return "u-core-axis-" + std::string(axisName);
  }

  std::string typeNodeId(std::string_view typeId)
  {
    return "type:" + std::string(typeId);
  }

  Node axisNode(const Axis &axis)
  {
    Node n{};
    n.id = axis.id;
    n.typeId = std::string(types::OntologyAxis);
    n.state = NodeState::Ice;
    n.locale = "en";
    n.title = axis.name;
    n.description = "U-Core ontology axis";
    n.meta["name"] = axis.name;
    n.meta["frequency"] = axis.frequency;
    n.meta["keywords"] = axis.keywords;
    return n;
  }

  void seedOntology(Registry &registry)
  {
    size_t created = 0;
    for (const auto &axis : canonicalAxes())
      created += put_if_absent(registry, axisNode(axis)) ? 1 : 0;

    for (const auto &h : kLeadsTo)
    {
      Edge e{};
      e.fromId = axisNodeId(h.from);
      e.toId = axisNodeId(h.to);
      e.role = std::string(roles::LeadsTo);
      e.weight = h.weight;
      registry.upsert(e);
    }

    for (auto typeId : kSeededTypes)
    {
      Node n{};
      n.id = typeNodeId(typeId);
      n.typeId = std::string(types::MetaType);
      n.state = NodeState::Ice;
      n.title = std::string(typeId);
      n.meta["typeId"] = std::string(typeId);
      created += put_if_absent(registry, n) ? 1 : 0;
    }

    if (created)
      KJ_LOG(INFO, "ontology seeded", created);
  }

  std::vector<Axis> loadAxes(Registry &registry)
  {
    std::vector<Axis> out;
    for (const auto &n : registry.getNodesByType(std::string(types::OntologyAxis)))
    {
      auto freq = metaDouble(n.meta, "frequency");
      if (!freq)
      {
        KJ_LOG(WARNING, "axis without frequency", n.id);
        continue;
      }
      Axis a{};
      a.id = n.id;
      a.name = metaString(n.meta, "name").value_or(n.title);
      a.frequency = *freq;
      for (const auto &kw : metaStrings(n.meta, "keywords"))
        a.keywords.push_back(lowercase(kw));
      out.push_back(std::move(a));
    }
    return out;
  }

  std::vector<Attractor> toAttractors(const std::vector<Axis> &axes)
  {
    std::vector<Attractor> out;
    out.reserve(axes.size());
    for (const auto &a : axes)
      out.push_back(Attractor{a.id, a.frequency});
    return out;
  }

  ConceptSymbol symbolFor(std::string_view conceptName, const std::vector<Axis> &axes)
  {
    ConceptSymbol sym{};
    auto name = lowercase(trim(conceptName));
    auto tokens = wordTokens(name);

    for (const auto &axis : axes)
    {
      double amp = 0.0;
      for (const auto &t : tokens)
        amp = std::max(amp, keyword_match(t, axis.keywords));
      if (amp > 0.0)
        sym.components.push_back(WaveComponent{axis.id, axis.frequency, 0.0, amp});
    }

    uint64_t h = fnv1a64(name);
    double freq = 300.0 + double(h % 600000ull) / 1000.0;
    sym.components.push_back(WaveComponent{"signature", freq, 0.0, kSignatureAmplitude});
    return sym;
  }

} // namespace codex

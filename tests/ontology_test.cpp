#include "ontology.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>

using namespace codex;
using codex::testing::memoryRegistry;

namespace
{

  const WaveComponent *componentFor(const ConceptSymbol &s, const std::string &band)
  {
    for (const auto &c : s.components)
    {
      if (c.band == band)
        return &c;
    }
    return nullptr;
  }

} // namespace

TEST(Ontology, CanonicalAxesMatchAttractors)
{
  const auto &axes = canonicalAxes();
  const auto &attractors = canonicalAttractors();
  ASSERT_EQ(axes.size(), attractors.size());
  for (size_t i = 0; i < axes.size(); ++i)
  {
    EXPECT_EQ(axes[i].name, attractors[i].band);
    EXPECT_EQ(axes[i].frequency, attractors[i].frequency);
    EXPECT_EQ(axes[i].id, axisNodeId(axes[i].name));
    EXPECT_FALSE(axes[i].keywords.empty());
  }
  EXPECT_EQ(axisNodeId("grounding"), "u-core-axis-grounding");
  EXPECT_EQ(typeNodeId(types::Concept), "type:codex.concept");
}

TEST(Ontology, SeedIsIdempotent)
{
  auto reg = memoryRegistry();
  seedOntology(*reg);
  auto first = reg->stats();
  seedOntology(*reg);
  auto second = reg->stats();

  EXPECT_EQ(first.ice.nodeCount, 9u);
  EXPECT_EQ(second.ice.nodeCount, first.ice.nodeCount);
  EXPECT_EQ(second.edgeCount, 3u);

  auto leads = reg->getEdgesFrom(axisNodeId("grounding"));
  ASSERT_EQ(leads.size(), 1u);
  EXPECT_EQ(leads[0].toId, axisNodeId("connective"));
  EXPECT_DOUBLE_EQ(leads[0].weight, 0.8);
}

TEST(Ontology, SeedKeepsEditedAxes)
{
  auto reg = memoryRegistry();
  auto edited = axisNode(canonicalAxes()[0]);
  edited.description = "curated";
  reg->upsert(edited);
  seedOntology(*reg);
  EXPECT_EQ(reg->get(edited.id)->description, "curated");
}

TEST(Ontology, LoadAxesReadsRegistry)
{
  auto reg = memoryRegistry();
  seedOntology(*reg);
  auto axes = loadAxes(*reg);
  ASSERT_EQ(axes.size(), 3u);
  // ordered by id
  EXPECT_EQ(axes[0].id, "u-core-axis-awareness");
  EXPECT_EQ(axes[0].frequency, 741.0);
  EXPECT_EQ(axes[1].id, "u-core-axis-connective");
  EXPECT_EQ(axes[2].id, "u-core-axis-grounding");

  auto attractors = toAttractors(axes);
  EXPECT_EQ(attractors[0].band, "u-core-axis-awareness");
}

TEST(Ontology, SymbolForKeywordMatches)
{
  const auto &axes = canonicalAxes();

  auto exact = symbolFor("Quantum", axes);
  auto *aw = componentFor(exact, axisNodeId("awareness"));
  ASSERT_NE(aw, nullptr);
  EXPECT_DOUBLE_EQ(aw->amplitude, 1.0);
  EXPECT_EQ(aw->frequency, 741.0);

  auto prefix = symbolFor("healthcare", axes);
  auto *gr = componentFor(prefix, axisNodeId("grounding"));
  ASSERT_NE(gr, nullptr);
  EXPECT_DOUBLE_EQ(gr->amplitude, 0.5);

  // three letters are too few for a prefix match
  auto shortWord = symbolFor("art", axes);
  EXPECT_NE(componentFor(shortWord, axisNodeId("connective")), nullptr) << "exact match still counts";
  EXPECT_EQ(componentFor(symbolFor("ene", axes), axisNodeId("grounding")), nullptr);
}

TEST(Ontology, SymbolSignatureIsDeterministic)
{
  const auto &axes = canonicalAxes();
  auto a = symbolFor("Zebra Crossing", axes);
  auto b = symbolFor("  zebra crossing ", axes);
  EXPECT_EQ(a, b);

  ASSERT_EQ(a.components.size(), 1u);
  const auto &sig = a.components[0];
  EXPECT_EQ(sig.band, "signature");
  EXPECT_GE(sig.frequency, 300.0);
  EXPECT_LT(sig.frequency, 900.0);
  EXPECT_DOUBLE_EQ(sig.amplitude, 0.25);
  EXPECT_NE(symbolFor("zebra", axes), a);
}

TEST(Ontology, KeywordAxisWinsOverSignature)
{
  auto axes = canonicalAxes();
  auto attractors = toAttractors(axes);
  EXPECT_EQ(bestAttractor(symbolFor("quantum", axes), attractors)->band, "u-core-axis-awareness");
  EXPECT_EQ(bestAttractor(symbolFor("community", axes), attractors)->band, "u-core-axis-connective");
  EXPECT_EQ(bestAttractor(symbolFor("climate", axes), attractors)->band, "u-core-axis-grounding");
}

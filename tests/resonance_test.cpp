#include "resonance.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>

using namespace codex;

namespace
{

  ConceptSymbol tone(double hz, double mix = 0.2)
  {
    return ConceptSymbol{{WaveComponent{"", hz, 0.0, 1.0}}, mix};
  }

  ConceptSymbol chord()
  {
    return ConceptSymbol{{WaveComponent{"a", 440.0, 0.3, 1.0},
                          WaveComponent{"b", 520.0, 1.1, 0.5},
                          WaveComponent{"c", 760.0, 2.0, 0.25}},
                         0.2};
  }

} // namespace

TEST(Resonance, CanonicalAttractors)
{
  const auto &a = canonicalAttractors();
  ASSERT_EQ(a.size(), 3u);
  EXPECT_EQ(a[0].band, "grounding");
  EXPECT_EQ(a[0].frequency, 432.0);
  EXPECT_EQ(a[1].band, "connective");
  EXPECT_EQ(a[1].frequency, 528.0);
  EXPECT_EQ(a[2].band, "awareness");
  EXPECT_EQ(a[2].frequency, 741.0);
}

TEST(Resonance, DominantBandPicksNearestAttractor)
{
  EXPECT_EQ(dominantBand(tone(432).components)->band, "grounding");
  EXPECT_DOUBLE_EQ(dominantBand(tone(432).components)->score, 1.0);
  EXPECT_EQ(dominantBand(tone(530).components)->band, "connective");
  EXPECT_EQ(dominantBand(tone(700).components)->band, "awareness");

  // amplitude outweighs count
  std::vector<WaveComponent> mixed = {{"", 432.0, 0.0, 0.1}, {"", 741.0, 0.0, 3.0}};
  EXPECT_EQ(dominantBand(mixed)->band, "awareness");
}

TEST(Resonance, DominantBandTieGoesToSmallestName)
{
  // 480 Hz is equidistant from 432 and 528
  auto best = dominantBand(tone(480).components);
  ASSERT_TRUE(best.has_value());
  EXPECT_EQ(best->band, "connective");
}

TEST(Resonance, DominantBandWithCustomAttractors)
{
  std::vector<Attractor> axes = {{"u-core-axis-low", 100.0}, {"u-core-axis-high", 900.0}};
  auto best = bestAttractor(tone(850), axes);
  ASSERT_TRUE(best.has_value());
  EXPECT_EQ(best->band, "u-core-axis-high");
  EXPECT_EQ(best->frequency, 900.0);
  EXPECT_GT(best->score, 0.0);
  EXPECT_LE(best->score, 1.0);

  EXPECT_FALSE(bestAttractor(tone(850), {}).has_value());
  EXPECT_FALSE(dominantBand({}).has_value());
}

TEST(Resonance, IdenticalToneScoresOne)
{
  EXPECT_NEAR(resonance(tone(432), tone(432)), 1.0, 1e-12);
  EXPECT_NEAR(distance(tone(432), tone(432)), 0.0, 1e-5);
}

TEST(Resonance, Symmetric)
{
  auto a = chord();
  auto b = ConceptSymbol{{WaveComponent{"x", 450.0, 0.7, 2.0}, WaveComponent{"y", 735.0, 0.0, 1.0}}, 0.5};
  EXPECT_EQ(resonance(a, b), resonance(b, a));
  EXPECT_EQ(distance(a, b), distance(b, a));
  EXPECT_EQ(resonance(a, tone(432)), resonance(tone(432), a));
}

TEST(Resonance, IndependentOfComponentOrder)
{
  auto a = chord();
  auto shuffled = a;
  std::reverse(shuffled.components.begin(), shuffled.components.end());
  auto b = tone(512);
  EXPECT_EQ(resonance(a, b), resonance(shuffled, b));
  EXPECT_EQ(resonance(a, b), resonance(a, b));
}

TEST(Resonance, DispersedFrequenciesBarelyResonate)
{
  ConceptSymbol dispersed{{WaveComponent{"", 100.0, 0.0, 1.0},
                           WaveComponent{"", 2000.0, 0.0, 1.0},
                           WaveComponent{"", 5000.0, 0.0, 1.0}},
                          0.2};
  double r = resonance(tone(432), dispersed);
  EXPECT_GE(r, 0.0);
  EXPECT_LT(r, 0.05);
  EXPECT_GT(distance(tone(432), dispersed), 1.99);
}

TEST(Resonance, OppositePhaseCancels)
{
  ConceptSymbol a{{WaveComponent{"", 600.0, 0.0, 1.0}}, 0.0};
  ConceptSymbol b{{WaveComponent{"", 600.0, std::numbers::pi, 1.0}}, 0.0};
  EXPECT_NEAR(resonance(a, b), 0.0, 1e-12);
}

TEST(Resonance, EmptySymbols)
{
  ConceptSymbol empty{};
  EXPECT_EQ(resonance(empty, tone(432)), 0.0);
  EXPECT_EQ(resonance(tone(432), empty), 0.0);
  EXPECT_EQ(distance(empty, empty), 2.0);

  // components that carry nothing count as absent
  ConceptSymbol silent{{WaveComponent{"", 432.0, 0.0, 0.0}}, 0.2};
  EXPECT_EQ(resonance(silent, tone(432)), 0.0);
}

TEST(Resonance, NonFiniteComponentsAreIgnored)
{
  auto clean = chord();
  auto noisy = clean;
  noisy.components.push_back(WaveComponent{"bad", std::numeric_limits<double>::quiet_NaN(), 0.0, 1.0});
  noisy.components.push_back(WaveComponent{"worse", 500.0, 0.0, std::numeric_limits<double>::infinity()});
  EXPECT_EQ(resonance(noisy, tone(500)), resonance(clean, tone(500)));
}

TEST(Resonance, DistanceGrowsWithDetuning)
{
  double prev = distance(tone(432), tone(432));
  for (double d = 5.0; d <= 200.0; d += 5.0)
  {
    double cur = distance(tone(432), tone(432 + d));
    EXPECT_GE(cur, prev) << "detuned by " << d;
    EXPECT_LE(cur, 2.0);
    prev = cur;
  }
  EXPECT_GT(prev, 1.9);
}

TEST(Resonance, ScoresStayInUnitRange)
{
  for (double mix : {0.0, 0.5, 1.0, 7.0, -3.0})
  {
    double r = resonance(tone(432, mix), chord());
    EXPECT_GE(r, 0.0);
    EXPECT_LE(r, 1.0);
  }
}

#include "resonance.hpp"
#include <algorithm>
#include <cmath>
#include <tuple>

namespace codex
{

  namespace
  {
    constexpr double kBandwidthHz = 10.0; // dominant-band falloff
    constexpr double kSigmaHz = 24.0;     // pairwise frequency kernel width

    bool usable(const WaveComponent &c)
    {
      return std::isfinite(c.frequency) && std::isfinite(c.phase) && std::isfinite(c.amplitude) && c.amplitude > 0.0;
    }

    auto order_key(const WaveComponent &c)
    {
      return std::tie(c.frequency, c.phase, c.amplitude, c.band);
    }

    // usable components in a fixed order, so summation order depends only on
    // the multiset
    std::vector<WaveComponent> canonical(const std::vector<WaveComponent> &in)
    {
      std::vector<WaveComponent> out;
      out.reserve(in.size());
      for (const auto &c : in)
      {
        if (usable(c))
          out.push_back(c);
      }
      std::sort(out.begin(), out.end(), [](const WaveComponent &x, const WaveComponent &y)
                { return order_key(x) < order_key(y); });
      return out;
    }

    bool symbol_less(const std::vector<WaveComponent> &a, double mixA, const std::vector<WaveComponent> &b, double mixB)
    {
      if (mixA != mixB)
        return mixA < mixB;
      return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
                                          [](const WaveComponent &x, const WaveComponent &y)
                                          { return order_key(x) < order_key(y); });
    }

    double pair_kernel(const WaveComponent &x, const WaveComponent &y)
    {
      double df = x.frequency - y.frequency;
      double closeness = std::exp(-(df * df) / (2.0 * kSigmaHz * kSigmaHz));
      double alignment = (1.0 + std::cos(x.phase - y.phase)) / 2.0;
      return closeness * alignment;
    }

    double clamp01(double x)
    {
      if (!(x > 0.0))
        return 0.0;
      return x > 1.0 ? 1.0 : x;
    }

    double resonance_sorted(const std::vector<WaveComponent> &a, double mixA,
                            const std::vector<WaveComponent> &b, double mixB)
    {
      double weighted = 0.0;
      double total = 0.0;
      for (const auto &x : a)
      {
        for (const auto &y : b)
        {
          double w = x.amplitude * y.amplitude;
          weighted += w * pair_kernel(x, y);
          total += w;
        }
      }
      double coherence = total > 0.0 ? weighted / total : 0.0;

      double bonus = 0.0;
      auto da = dominantBand(a);
      auto db = dominantBand(b);
      if (da && db && da->band == db->band)
        bonus = std::sqrt(da->score * db->score);

      double beta = clamp01((mixA + mixB) / 2.0);
      return clamp01((1.0 - beta) * coherence + beta * bonus);
    }
  } // namespace

  const std::vector<Attractor> &canonicalAttractors()
  {
    static const std::vector<Attractor> table = {
        {"grounding", 432.0},
        {"connective", 528.0},
        {"awareness", 741.0},
    };
    return table;
  }

  std::optional<BandAffinity> dominantBand(const std::vector<WaveComponent> &components,
                                           const std::vector<Attractor> &attractors)
  {
    auto comps = canonical(components);
    double total = 0.0;
    for (const auto &c : comps)
      total += c.amplitude;
    if (comps.empty() || !(total > 0.0) || attractors.empty())
      return std::nullopt;

    std::optional<BandAffinity> best;
    for (const auto &a : attractors)
    {
      double s = 0.0;
      for (const auto &c : comps)
        s += c.amplitude / (1.0 + std::fabs(c.frequency - a.frequency) / kBandwidthHz);
      s /= total;
      if (!best || s > best->score || (s == best->score && a.band < best->band))
        best = BandAffinity{a.band, a.frequency, s};
    }
    return best;
  }

  std::optional<BandAffinity> bestAttractor(const ConceptSymbol &symbol, const std::vector<Attractor> &attractors)
  {
    return dominantBand(symbol.components, attractors);
  }

  double resonance(const ConceptSymbol &a, const ConceptSymbol &b)
  {
    auto ca = canonical(a.components);
    auto cb = canonical(b.components);
    if (ca.empty() || cb.empty())
      return 0.0;
    double mixA = std::isfinite(a.mix) ? a.mix : 0.0;
    double mixB = std::isfinite(b.mix) ? b.mix : 0.0;
    if (symbol_less(cb, mixB, ca, mixA))
      return resonance_sorted(cb, mixB, ca, mixA);
    return resonance_sorted(ca, mixA, cb, mixB);
  }

  double distance(const ConceptSymbol &a, const ConceptSymbol &b)
  {
    double r = resonance(a, b);
    return 2.0 * std::sqrt(std::max(0.0, 1.0 - r * r));
  }

} // namespace codex

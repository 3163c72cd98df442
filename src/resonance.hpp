#pragma once
#include <optional>
#include <string>
#include <vector>

namespace codex
{

  struct WaveComponent
  {
    std::string band{};
    double frequency{0.0}; // Hz
    double phase{0.0};     // radians
    double amplitude{1.0};

    bool operator==(const WaveComponent &) const = default;
  };

  struct ConceptSymbol
  {
    std::vector<WaveComponent> components{};
    double mix{0.2}; // weight of the shared-band bonus

    bool operator==(const ConceptSymbol &) const = default;
  };

  struct Attractor
  {
    std::string band{};
    double frequency{0.0};
  };

  struct BandAffinity
  {
    std::string band{};
    double frequency{0.0};
    double score{0.0}; // in (0, 1]
  };

  // grounding 432 Hz, connective 528 Hz, awareness 741 Hz
  const std::vector<Attractor> &canonicalAttractors();

  // Attractor with the highest amplitude-weighted inverse-distance score; ties
  // go to the smallest band name. nullopt when there is nothing to weigh.
  std::optional<BandAffinity> dominantBand(const std::vector<WaveComponent> &components,
                                           const std::vector<Attractor> &attractors = canonicalAttractors());

  std::optional<BandAffinity> bestAttractor(const ConceptSymbol &symbol, const std::vector<Attractor> &attractors);

  // Symmetric similarity in [0, 1]; 0 if either symbol is empty.
  double resonance(const ConceptSymbol &a, const ConceptSymbol &b);

  // 2 * sqrt(1 - r^2), in [0, 2]; 2 if either symbol is empty.
  double distance(const ConceptSymbol &a, const ConceptSymbol &b);

} // namespace codex

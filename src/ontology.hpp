#pragma once
#include "registry.hpp"
#include "resonance.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace codex
{

  struct Axis
  {
    std::string id{};
    std::string name{};
    double frequency{0.0};
    std::vector<std::string> keywords{};
  };

  // the three U-Core axes, one per canonical attractor
  const std::vector<Axis> &canonicalAxes();

  std::string axisNodeId(std::string_view axisName); // u-core-axis-<name>
  std::string typeNodeId(std::string_view typeId);   // type:<typeId>

  Node axisNode(const Axis &axis);

  // Writes the axis nodes, their `leads-to` hierarchy and the type descriptor
  // nodes for the pipeline types. Existing nodes are left untouched.
  void seedOntology(Registry &registry);

  // Axis nodes currently in the registry, ordered by id. Nodes without a
  // numeric frequency are skipped.
  std::vector<Axis> loadAxes(Registry &registry);

  // band = axis id
  std::vector<Attractor> toAttractors(const std::vector<Axis> &axes);

  // Deterministic symbol for a concept name: one component per keyword-matched
  // axis plus a hash-derived signature component.
  ConceptSymbol symbolFor(std::string_view conceptName, const std::vector<Axis> &axes);

} // namespace codex

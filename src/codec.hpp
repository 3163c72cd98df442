#pragma once
#include "model.hpp"
#include <string>
#include <string_view>

namespace codex
{

  // Binary record layout for durable backends. Decoding throws StorageUnavailable
  // on any truncated or trailing data so a corrupt record never reaches a caller.
  std::string encodeNode(const Node &n);
  Node decodeNode(std::string_view bytes);

  std::string encodeEdge(const Edge &e);
  Edge decodeEdge(std::string_view bytes);

} // namespace codex

#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace codex
{

  // ASCII lowercase; other bytes pass through unchanged
  std::string lowercase(std::string_view s);
  std::string trim(std::string_view s);

  // lowercase runs of letters and digits
  std::vector<std::string> wordTokens(std::string_view s);

  // Strips markup, decodes the common HTML entities and collapses whitespace.
  std::string normalizeText(std::string_view raw);

  // The first `sentences` sentences, cut at a word boundary so the result is at
  // most `maxChars` long.
  std::string leadingSentences(std::string_view text, size_t sentences, size_t maxChars);

  uint64_t fnv1a64(std::string_view s);

} // namespace codex

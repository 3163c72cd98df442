#include "text.hpp"
#include <cctype>
#include <cstdint>
#include <utility>

namespace codex
{

  static inline bool is_space(char c)
  {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  }

  std::string lowercase(std::string_view s)
  {
    std::string out(s);
    for (auto &c : out)
      c = char(std::tolower(static_cast<unsigned char>(c)));
    return out;
  }

  std::string trim(std::string_view s)
  {
    size_t b = 0, e = s.size();
    while (b < e && is_space(s[b]))
      ++b;
    while (e > b && is_space(s[e - 1]))
      --e;
    return std::string(s.substr(b, e - b));
  }

  std::vector<std::string> wordTokens(std::string_view s)
  {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s)
    {
      if (std::isalnum(static_cast<unsigned char>(c)))
      {
        cur.push_back(char(std::tolower(static_cast<unsigned char>(c))));
      }
      else if (!cur.empty())
      {
        out.push_back(std::move(cur));
        cur.clear();
      }
    }
    if (!cur.empty())
      out.push_back(std::move(cur));
    return out;
  }

  // `<` opens a tag only when followed by a name, `/` or `!` and closed by `>`.
  static bool is_tag_at(std::string_view raw, size_t i, size_t &close)
  {
    if (i + 1 >= raw.size())
      return false;
    unsigned char next = static_cast<unsigned char>(raw[i + 1]);
    if (!std::isalpha(next) && next != '/' && next != '!')
      return false;
    close = raw.find('>', i + 1);
    return close != std::string_view::npos;
  }

  static const std::pair<std::string_view, char> kEntities[] = {
      {"&amp;", '&'},
      {"&lt;", '<'},
      {"&gt;", '>'},
      {"&quot;", '"'},
      {"&#39;", '\''},
      {"&apos;", '\''},
      {"&nbsp;", ' '},
  };

  std::string normalizeText(std::string_view raw)
  {
    std::string decoded;
    decoded.reserve(raw.size());
    for (size_t i = 0; i < raw.size();)
    {
      char c = raw[i];
      size_t close = 0;
      if (c == '<' && is_tag_at(raw, i, close))
      {
        decoded.push_back(' ');
        i = close + 1;
        continue;
      }
      if (c == '&')
      {
        bool matched = false;
        for (const auto &[name, ch] : kEntities)
        {
          if (raw.compare(i, name.size(), name) == 0)
          {
            decoded.push_back(ch);
            i += name.size();
            matched = true;
            break;
          }
        }
        if (matched)
          continue;
      }
      decoded.push_back(c);
      ++i;
    }

    std::string out;
    out.reserve(decoded.size());
    bool pendingSpace = false;
    for (char c : decoded)
    {
      if (is_space(c))
      {
        pendingSpace = !out.empty();
        continue;
      }
      if (pendingSpace)
        out.push_back(' ');
      pendingSpace = false;
      out.push_back(c);
    }
    return out;
  }

  std::string leadingSentences(std::string_view text, size_t sentences, size_t maxChars)
  {
    size_t end = text.size();
    size_t found = 0;
    for (size_t i = 0; i < text.size() && found < sentences; ++i)
    {
      char c = text[i];
      if ((c == '.' || c == '!' || c == '?') && (i + 1 == text.size() || is_space(text[i + 1])))
      {
        ++found;
        if (found == sentences)
          end = i + 1;
      }
    }
    std::string out = trim(text.substr(0, end));
    if (out.size() <= maxChars)
      return out;

    auto cut = out.rfind(' ', maxChars);
    if (cut == std::string::npos || cut == 0)
    {
      cut = maxChars;
      // back off UTF-8 continuation bytes so a code point is never split
      while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80)
        --cut;
    }
    return trim(std::string_view(out).substr(0, cut));
  }

  uint64_t fnv1a64(std::string_view s)
  {
    uint64_t h = 14695981039346656037ull;
    for (char c : s)
    {
      h ^= static_cast<unsigned char>(c);
      h *= 1099511628211ull;
    }
    return h;
  }

} // namespace codex

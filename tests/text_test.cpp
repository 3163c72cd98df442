#include "text.hpp"
#include <gtest/gtest.h>

using namespace codex;

TEST(Text, LowercaseAndTrim)
{
  EXPECT_EQ(lowercase("Quantum Café"), "quantum café");
  EXPECT_EQ(trim("  \t spaced out \n"), "spaced out");
  EXPECT_EQ(trim("   "), "");
}

TEST(Text, WordTokens)
{
  EXPECT_EQ(wordTokens("Qubits, entanglement & 2024's CERN-run!"),
            (std::vector<std::string>{"qubits", "entanglement", "2024", "s", "cern", "run"}));
  EXPECT_TRUE(wordTokens(" ,.; ").empty());
}

TEST(Text, NormalizeStripsMarkupAndEntities)
{
  EXPECT_EQ(normalizeText("<p>Quantum&nbsp;leap</p>\n\n<b>R&amp;D</b>"), "Quantum leap R&D");
  EXPECT_EQ(normalizeText("a &lt;b&gt; &quot;c&quot; &#39;d&apos;"), "a <b> \"c\" 'd'");
  EXPECT_EQ(normalizeText("keep &unknown; entity"), "keep &unknown; entity");
  EXPECT_EQ(normalizeText("text <unterminated tag"), "text <unterminated tag");
  EXPECT_EQ(normalizeText(""), "");
}

TEST(Text, NormalizeKeepsLiteralAngleBrackets)
{
  EXPECT_EQ(normalizeText("Rates fell for loans <100k. Analysts expect more cuts next year."),
            "Rates fell for loans <100k. Analysts expect more cuts next year.");
  EXPECT_EQ(normalizeText("if a < b and c > d then"), "if a < b and c > d then");
  EXPECT_EQ(normalizeText("x <= y <br/>z"), "x <= y z");
  EXPECT_EQ(normalizeText("<!-- note -->kept"), "kept");
  EXPECT_EQ(normalizeText("ends with <"), "ends with <");
}

TEST(Text, LeadingSentences)
{
  std::string body = "First sentence. Second one! Third? Fourth.";
  EXPECT_EQ(leadingSentences(body, 2, 500), "First sentence. Second one!");
  EXPECT_EQ(leadingSentences(body, 10, 500), body);
  EXPECT_EQ(leadingSentences("Version 2.0 shipped today. More soon.", 1, 500), "Version 2.0 shipped today.");
  EXPECT_EQ(leadingSentences("no terminator here", 3, 500), "no terminator here");
}

TEST(Text, LeadingSentencesCutsAtWordBoundary)
{
  auto s = leadingSentences("alpha beta gamma delta.", 1, 12);
  EXPECT_EQ(s, "alpha beta");
  EXPECT_LE(s.size(), 12u);

  EXPECT_EQ(leadingSentences("supercalifragilistic.", 1, 5), "super");
}

TEST(Text, LeadingSentencesNeverSplitsCodePoints)
{
  std::string accents;
  for (int i = 0; i < 10; ++i)
    accents += "\xc3\xa9";
  auto s = leadingSentences(accents, 3, 5);
  EXPECT_EQ(s, "\xc3\xa9\xc3\xa9");

  auto euro = leadingSentences("\xe2\x82\xac\xe2\x82\xac", 1, 4);
  EXPECT_EQ(euro, "\xe2\x82\xac");
}

TEST(Text, Fnv1aIsStable)
{
  EXPECT_EQ(fnv1a64(""), 14695981039346656037ull);
  EXPECT_EQ(fnv1a64("a"), 0xaf63dc4c8601ec8cull);
  EXPECT_NE(fnv1a64("quantum"), fnv1a64("quantun"));
}

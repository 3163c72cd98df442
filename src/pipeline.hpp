#pragma once
#include "ontology.hpp"
#include "registry.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

namespace codex
{

  struct RawItem
  {
    std::string id{};
    std::string title{};
    std::string content{}; // may carry markup
    std::string source{};  // source id
    int64_t publishedAt{0}; // epoch ms
    std::vector<std::string> tags{};
    std::string url{};
  };

  struct ConceptCandidate
  {
    std::string name{};
    double score{1.0};
  };

  // Text in, scored concepts out. Implementations may throw anything derived
  // from std::exception; the pipeline records the failure and carries on.
  class ConceptExtractor
  {
  public:
    virtual ~ConceptExtractor() = default;
    virtual std::vector<ConceptCandidate> extractConcepts(const std::string &text) = 0;
  };

  class SourceDirectory
  {
  public:
    virtual ~SourceDirectory() = default;
    virtual std::optional<std::string> displayName(const std::string &sourceId) = 0;
  };

  // Local frequency-based extraction: the most frequent non-stopword tokens,
  // scored relative to the most frequent one.
  class KeywordConceptExtractor final : public ConceptExtractor
  {
  public:
    explicit KeywordConceptExtractor(size_t maxConcepts = 5, size_t minLength = 4);

    std::vector<ConceptCandidate> extractConcepts(const std::string &text) override;

  private:
    size_t maxConcepts_;
    size_t minLength_;
    std::set<std::string> stopwords_;
  };

  // Reads display names from `news-source-<id>` nodes.
  class RegistrySourceDirectory final : public SourceDirectory
  {
  public:
    explicit RegistrySourceDirectory(Registry &registry);
    std::optional<std::string> displayName(const std::string &sourceId) override;

  private:
    Registry &registry_;
  };

  class MapSourceDirectory final : public SourceDirectory
  {
  public:
    explicit MapSourceDirectory(std::map<std::string, std::string> names);
    std::optional<std::string> displayName(const std::string &sourceId) override;

  private:
    std::map<std::string, std::string> names_;
  };

  struct PipelineOptions
  {
    size_t summarySentences{3};
    size_t summaryMaxChars{500};
    size_t maxConcepts{10};
    double minConceptScore{0.0};
    std::optional<std::chrono::seconds> itemTtl{}; // stamps expiresAt on item/content/summary
  };

  enum class PipelineStatus
  {
    Complete,
    Degraded,
    Cancelled
  };

  const char *toString(PipelineStatus s);

  struct PipelineResult
  {
    std::string itemId{};
    std::string contentNodeId{};
    std::string summaryNodeId{};
    std::vector<std::string> conceptNodeIds{};
    std::vector<std::string> axisIds{}; // chosen axes, in concept order
    std::vector<std::string> errors{};
    PipelineStatus status{PipelineStatus::Complete};
  };

  std::string contentNodeId(std::string_view itemId);
  std::string summaryNodeId(std::string_view itemId);
  std::string conceptNodeId(std::string_view conceptName);
  std::string sourceNodeId(std::string_view sourceId);

  // Turns raw items into item -> content -> summary -> concepts -> axis
  // lineages. Every derived id is a function of its parent id and edges are
  // keyed by (from, to, role), so running an item again rewrites rather than
  // duplicates.
  class IngestionPipeline
  {
  public:
    IngestionPipeline(Registry &registry, ConceptExtractor &extractor, SourceDirectory &sources,
                      PipelineOptions options = {});

    // Throws ValidationError for a malformed item and propagates storage
    // errors from the first stage; later stage failures are recorded in the
    // result and the item's meta.
    PipelineResult ingest(const RawItem &item, std::stop_token stop = {});

    // Items run concurrently on up to `parallelism` threads. Results keep the
    // input order; the first item-level exception is rethrown after all
    // workers finish.
    std::vector<PipelineResult> ingestBatch(const std::vector<RawItem> &items, size_t parallelism,
                                            std::stop_token stop = {});

  private:
    Node itemNode(const RawItem &item, const std::string &sourceName) const;
    void ensureSource(const RawItem &item, const std::string &sourceName);
    void upsertDerived(Node node, bool expiring);
    void link(const std::string &from, const std::string &to, std::string_view role, double weight = 1.0);
    std::vector<ConceptCandidate> cleanCandidates(std::vector<ConceptCandidate> raw) const;
    std::string resolveConcept(const ConceptCandidate &c);

    Registry &registry_;
    ConceptExtractor &extractor_;
    SourceDirectory &sources_;
    PipelineOptions options_;
  };

} // namespace codex

#include "pipeline.hpp"
#include "errors.hpp"
#include "text.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <exception>
#include <thread>
#include <unordered_map>
#include <kj/debug.h>

namespace codex
{

  namespace
  {
    constexpr std::string_view kPipelineVersion = "2.0";
    constexpr std::string_view kCreatedFrom = "news-pipeline";

    bool all_digits(const std::string &s)
    {
      return std::all_of(s.begin(), s.end(), [](unsigned char c)
                         { return std::isdigit(c) != 0; });
    }
  } // namespace

  const char *toString(PipelineStatus s)
  {
    switch (s)
    {
    case PipelineStatus::Complete:
      return "complete";
    case PipelineStatus::Degraded:
      return "degraded";
    case PipelineStatus::Cancelled:
      return "cancelled";
    }
    return "unknown";
  }

  std::string contentNodeId(std::string_view itemId) { return "content:" + std::string(itemId); }
  std::string summaryNodeId(std::string_view itemId) { return "summary:" + std::string(itemId); }
  std::string conceptNodeId(std::string_view conceptName) { return "concept:" + lowercase(trim(conceptName)); }
  std::string sourceNodeId(std::string_view sourceId) { return "news-source-" + std::string(sourceId); }

  // -------------------- collaborators --------------------

  KeywordConceptExtractor::KeywordConceptExtractor(size_t maxConcepts, size_t minLength)
      : maxConcepts_(maxConcepts), minLength_(minLength),
        stopwords_{"about", "after", "again", "also", "been", "before", "being", "between", "both",
                   "could", "does", "doing", "during", "each", "from", "further", "have", "having",
                   "here", "into", "just", "more", "most", "much", "must", "only", "other", "over",
                   "said", "same", "says", "should", "some", "such", "than", "that", "their", "them",
                   "then", "there", "these", "they", "this", "those", "through", "under", "until",
                   "very", "were", "what", "when", "where", "which", "while", "will", "with",
                   "would", "your", "new", "news", "today", "year", "years"}
  {
  }

  std::vector<ConceptCandidate> KeywordConceptExtractor::extractConcepts(const std::string &text)
  {
    std::unordered_map<std::string, size_t> counts;
    std::vector<std::string> order;
    for (auto &t : wordTokens(text))
    {
      if (t.size() < minLength_ || all_digits(t) || stopwords_.count(t))
        continue;
      if (counts[t]++ == 0)
        order.push_back(t);
    }
    if (order.empty())
      return {};

    std::stable_sort(order.begin(), order.end(), [&](const std::string &a, const std::string &b)
                     { return counts[a] > counts[b]; });
    if (order.size() > maxConcepts_)
      order.resize(maxConcepts_);

    double top = double(counts[order.front()]);
    std::vector<ConceptCandidate> out;
    out.reserve(order.size());
    for (const auto &t : order)
      out.push_back(ConceptCandidate{t, double(counts[t]) / top});
    return out;
  }

  RegistrySourceDirectory::RegistrySourceDirectory(Registry &registry) : registry_(registry) {}

  std::optional<std::string> RegistrySourceDirectory::displayName(const std::string &sourceId)
  {
    auto n = registry_.get(sourceNodeId(sourceId));
    if (!n)
      return std::nullopt;
    auto name = metaString(n->meta, "name");
    if (name && !name->empty())
      return name;
    if (!n->title.empty())
      return n->title;
    return std::nullopt;
  }

  MapSourceDirectory::MapSourceDirectory(std::map<std::string, std::string> names) : names_(std::move(names)) {}

  std::optional<std::string> MapSourceDirectory::displayName(const std::string &sourceId)
  {
    auto it = names_.find(sourceId);
    if (it == names_.end())
      return std::nullopt;
    return it->second;
  }

  // -------------------- pipeline --------------------

  IngestionPipeline::IngestionPipeline(Registry &registry, ConceptExtractor &extractor, SourceDirectory &sources,
                                       PipelineOptions options)
      : registry_(registry), extractor_(extractor), sources_(sources), options_(std::move(options))
  {
    seedOntology(registry_);
  }

  Node IngestionPipeline::itemNode(const RawItem &item, const std::string &sourceName) const
  {
    Node n{};
    n.id = item.id;
    n.typeId = std::string(types::NewsItem);
    n.state = NodeState::Water;
    n.locale = "en";
    n.title = item.title;
    if (!item.content.empty())
      n.content = ContentRef{"text/html", std::nullopt, item.content, std::nullopt};
    else if (!item.url.empty())
      n.content = ContentRef{"text/html", std::nullopt, std::nullopt, item.url};
    n.meta["source"] = sourceName;
    n.meta["sourceId"] = item.source;
    n.meta["publishedAt"] = item.publishedAt;
    n.meta["tags"] = item.tags;
    if (!item.url.empty())
      n.meta["url"] = item.url;
    return n;
  }

  void IngestionPipeline::ensureSource(const RawItem &item, const std::string &sourceName)
  {
    auto id = sourceNodeId(item.source);
    if (registry_.nodeExists(id))
      return;
    Node n{};
    n.id = id;
    n.typeId = std::string(types::NewsSource);
    n.state = NodeState::Ice;
    n.title = sourceName;
    n.meta["sourceId"] = item.source;
    n.meta["name"] = sourceName;
    registry_.upsert(n);
  }

  // A node someone promoted to Ice keeps its tier when the pipeline rewrites it.
  void IngestionPipeline::upsertDerived(Node node, bool expiring)
  {
    if (expiring && options_.itemTtl)
    {
      auto ttl = std::chrono::duration_cast<std::chrono::milliseconds>(*options_.itemTtl).count();
      node.meta[std::string(metakeys::ExpiresAt)] = int64_t(nowMillis() + ttl);
    }
    registry_.upsertKeepingIce(std::move(node));
  }

  void IngestionPipeline::link(const std::string &from, const std::string &to, std::string_view role, double weight)
  {
    Edge e{};
    e.fromId = from;
    e.toId = to;
    e.role = std::string(role);
    e.weight = weight;
    e.meta["module"] = std::string(kCreatedFrom);
    registry_.upsert(e);
  }

  std::vector<ConceptCandidate> IngestionPipeline::cleanCandidates(std::vector<ConceptCandidate> raw) const
  {
    std::vector<ConceptCandidate> out;
    std::unordered_map<std::string, size_t> seen; // lowercase name -> index in out
    for (auto &c : raw)
    {
      c.name = trim(c.name);
      if (c.name.empty() || !std::isfinite(c.score) || c.score < options_.minConceptScore)
        continue;
      auto key = lowercase(c.name);
      auto it = seen.find(key);
      if (it == seen.end())
      {
        seen.emplace(key, out.size());
        out.push_back(std::move(c));
      }
      else if (c.score > out[it->second].score)
      {
        out[it->second].score = c.score;
      }
    }
    std::stable_sort(out.begin(), out.end(), [](const ConceptCandidate &a, const ConceptCandidate &b)
                     { return a.score > b.score; });
    if (out.size() > options_.maxConcepts)
      out.resize(options_.maxConcepts);
    return out;
  }

  std::string IngestionPipeline::resolveConcept(const ConceptCandidate &c)
  {
    auto id = conceptNodeId(c.name);
    if (auto existing = registry_.get(id))
    {
      if (existing->state == NodeState::Gas)
        throw ValidationError("concept " + id + " was deleted");
      return id;
    }

    auto wanted = lowercase(c.name);
    for (const auto &n : registry_.getNodesByType(std::string(types::Concept)))
    {
      if (lowercase(metaString(n.meta, "name").value_or(n.title)) == wanted)
        return n.id;
    }

    Node n{};
    n.id = id;
    n.typeId = std::string(types::Concept);
    n.state = NodeState::Water;
    n.locale = "en";
    n.title = c.name;
    n.meta["name"] = c.name;
    n.meta["conceptId"] = id;
    n.meta["createdFrom"] = std::string(kCreatedFrom);
    registry_.upsert(n);
    KJ_LOG(INFO, "pipeline: concept created", id);
    return id;
  }

  PipelineResult IngestionPipeline::ingest(const RawItem &item, std::stop_token stop)
  {
    if (item.id.empty())
      throw ValidationError("raw item id must not be empty");

    PipelineResult r{};
    r.itemId = item.id;

    // stage 1: item, source registration, type link
    std::string sourceName = item.source;
    if (!item.source.empty())
    {
      try
      {
        if (auto name = sources_.displayName(item.source))
          sourceName = *name;
      }
      catch (const std::exception &e)
      {
        r.errors.push_back(std::string("source: ") + e.what());
      }
    }
    Node itemBase = itemNode(item, sourceName);
    upsertDerived(itemBase, true);
    if (!item.source.empty())
    {
      ensureSource(item, sourceName);
      link(item.id, sourceNodeId(item.source), roles::FromSource);
    }
    link(item.id, typeNodeId(types::NewsItem), roles::InstanceOf);

    bool cancelled = false;
    auto runStage = [&](const char *name, auto &&fn)
    {
      if (cancelled || stop.stop_requested())
      {
        cancelled = true;
        return;
      }
      try
      {
        fn();
      }
      catch (const std::exception &e)
      {
        r.errors.push_back(std::string(name) + ": " + e.what());
        KJ_LOG(WARNING, "pipeline: stage failed", item.id, name, e.what());
      }
    };

    // later stages work from in-memory text even if an earlier write failed
    std::string text = normalizeText(item.content);
    std::string summary = leadingSentences(text, options_.summarySentences, options_.summaryMaxChars);
    if (summary.empty())
      summary = leadingSentences(normalizeText(item.title), 1, options_.summaryMaxChars);

    runStage("content", [&]
             {
      Node n{};
      n.id = contentNodeId(item.id);
      n.typeId = std::string(types::NewsContent);
      n.state = NodeState::Water;
      n.locale = "en";
      n.title = item.title;
      n.content = ContentRef{"text/plain", std::nullopt, text, std::nullopt};
      n.meta["parentId"] = item.id;
      n.meta["charCount"] = int64_t(text.size());
      upsertDerived(n, true);
      link(item.id, n.id, roles::HasContent);
      r.contentNodeId = n.id; });

    runStage("summary", [&]
             {
      Node n{};
      n.id = summaryNodeId(item.id);
      n.typeId = std::string(types::NewsSummary);
      n.state = NodeState::Water;
      n.locale = "en";
      n.title = item.title;
      n.description = summary;
      n.content = ContentRef{"text/plain", std::nullopt, summary, std::nullopt};
      n.meta["parentId"] = contentNodeId(item.id);
      upsertDerived(n, true);
      link(contentNodeId(item.id), n.id, roles::SummarizedAs);
      r.summaryNodeId = n.id; });

    std::vector<std::pair<std::string, std::string>> concepts; // (node id, name)
    runStage("concepts", [&]
             {
      auto candidates = cleanCandidates(extractor_.extractConcepts(summary));
      if (candidates.empty())
        throw ExternalServiceError("no concepts extracted");
      for (const auto &c : candidates)
      {
        try
        {
          auto id = resolveConcept(c);
          // candidates arrive best first; another name resolving to the same node adds nothing
          if (std::find(r.conceptNodeIds.begin(), r.conceptNodeIds.end(), id) != r.conceptNodeIds.end())
            continue;
          link(summaryNodeId(item.id), id, roles::ContainsConcept, c.score);
          concepts.emplace_back(id, c.name);
          r.conceptNodeIds.push_back(id);
        }
        catch (const std::exception &e)
        {
          r.errors.push_back("concepts: " + c.name + ": " + e.what());
        }
      } });

    if (!concepts.empty())
    {
      runStage("alignment", [&]
               {
        auto axes = loadAxes(registry_);
        auto attractors = toAttractors(axes);
        if (attractors.empty())
          throw ValidationError("no ontology axes");
        for (const auto &[id, name] : concepts)
        {
          try
          {
            auto best = bestAttractor(symbolFor(name, axes), attractors);
            if (!best)
              throw ValidationError("no attractor for " + name);
            link(id, best->band, roles::ConnectsToUcoreVia, best->score);
            link(best->band, id, roles::ConnectsFromUcore, best->score);
            r.axisIds.push_back(best->band);
          }
          catch (const std::exception &e)
          {
            r.errors.push_back("alignment: " + name + ": " + e.what());
          }
        } });
    }

    r.status = cancelled ? PipelineStatus::Cancelled
                         : (r.errors.empty() ? PipelineStatus::Complete : PipelineStatus::Degraded);

    Node done = itemBase;
    done.meta["pipelineVersion"] = std::string(kPipelineVersion);
    if (!r.contentNodeId.empty())
      done.meta["contentNodeId"] = r.contentNodeId;
    if (!r.summaryNodeId.empty())
      done.meta["summaryNodeId"] = r.summaryNodeId;
    done.meta["conceptNodeIds"] = r.conceptNodeIds;
    done.meta["ucoreAxisIds"] = r.axisIds;
    done.meta["pipelineStatus"] = std::string(toString(r.status));
    done.meta["pipelineErrors"] = r.errors;
    upsertDerived(done, true);

    if (r.status != PipelineStatus::Complete)
      KJ_LOG(INFO, "pipeline: item finished", item.id, toString(r.status), r.errors.size());
    return r;
  }

  std::vector<PipelineResult> IngestionPipeline::ingestBatch(const std::vector<RawItem> &items, size_t parallelism,
                                                             std::stop_token stop)
  {
    std::vector<PipelineResult> results(items.size());
    std::vector<std::exception_ptr> failures(items.size());
    std::atomic<size_t> next{0};

    auto worker = [&]
    {
      for (size_t i = next.fetch_add(1); i < items.size(); i = next.fetch_add(1))
      {
        try
        {
          results[i] = ingest(items[i], stop);
        }
        catch (...)
        {
          failures[i] = std::current_exception();
        }
      }
    };

    size_t n = std::clamp<size_t>(parallelism, 1, std::max<size_t>(items.size(), 1));
    std::vector<std::thread> threads;
    threads.reserve(n);
    for (size_t t = 0; t < n; ++t)
      threads.emplace_back(worker);
    for (auto &t : threads)
      t.join();

    KJ_LOG(INFO, "pipeline: batch finished", items.size(), n);
    for (auto &f : failures)
    {
      if (f)
        std::rethrow_exception(f);
    }
    return results;
  }

} // namespace codex

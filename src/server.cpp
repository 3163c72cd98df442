#include "server.hpp"
#include "errors.hpp"
#include <kj/debug.h>
#include <kj/array.h>

namespace codex::rpc
{

  namespace
  {

    std::string toStd(capnp::Text::Reader t)
    {
      return std::string(t.begin(), t.size());
    }

    std::vector<std::string> toStd(capnp::List<capnp::Text>::Reader list)
    {
      std::vector<std::string> out;
      out.reserve(list.size());
      for (auto t : list)
        out.push_back(toStd(t));
      return out;
    }

    void setTextList(capnp::List<capnp::Text>::Builder b, const std::vector<std::string> &v)
    {
      for (uint32_t i = 0; i < v.size(); ++i)
        b.set(i, v[i]);
    }

    codex::NodeState fromRpcState(NodeState s)
    {
      switch (s)
      {
      case NodeState::ICE:
        return codex::NodeState::Ice;
      case NodeState::GAS:
        return codex::NodeState::Gas;
      case NodeState::WATER:
      default:
        return codex::NodeState::Water;
      }
    }

    NodeState toRpcState(codex::NodeState s)
    {
      switch (s)
      {
      case codex::NodeState::Ice:
        return NodeState::ICE;
      case codex::NodeState::Gas:
        return NodeState::GAS;
      case codex::NodeState::Water:
      default:
        return NodeState::WATER;
      }
    }

    codex::MetaValue fromRpcValue(MetaValue::Reader v)
    {
      switch (v.which())
      {
      case MetaValue::BOOLV:
        return v.getBoolv();
      case MetaValue::I64:
        return static_cast<int64_t>(v.getI64());
      case MetaValue::F64:
        return static_cast<double>(v.getF64());
      case MetaValue::TEXT:
        return toStd(v.getText());
      case MetaValue::TEXT_LIST:
        return toStd(v.getTextList());
      case MetaValue::NULLV:
      default:
        return std::monostate{};
      }
    }

    void toRpcValue(MetaValue::Builder b, const codex::MetaValue &v)
    {
      if (std::holds_alternative<bool>(v))
      {
        b.setBoolv(std::get<bool>(v));
        return;
      }
      if (std::holds_alternative<int64_t>(v))
      {
        b.setI64(std::get<int64_t>(v));
        return;
      }
      if (std::holds_alternative<double>(v))
      {
        b.setF64(std::get<double>(v));
        return;
      }
      if (std::holds_alternative<std::string>(v))
      {
        b.setText(std::get<std::string>(v));
        return;
      }
      if (std::holds_alternative<std::vector<std::string>>(v))
      {
        const auto &list = std::get<std::vector<std::string>>(v);
        setTextList(b.initTextList(list.size()), list);
        return;
      }
      b.setNullv();
    }

    codex::Meta fromRpcMeta(capnp::List<MetaEntry>::Reader entries)
    {
      codex::Meta out;
      for (auto e : entries)
        out.insert_or_assign(toStd(e.getKey()), fromRpcValue(e.getVal()));
      return out;
    }

    void toRpcMeta(capnp::List<MetaEntry>::Builder b, const codex::Meta &m)
    {
      uint32_t i = 0;
      for (const auto &[k, v] : m)
      {
        b[i].setKey(k);
        toRpcValue(b[i].initVal(), v);
        ++i;
      }
    }

    codex::Node fromRpcNode(Node::Reader r)
    {
      codex::Node n{};
      n.id = toStd(r.getId());
      n.typeId = toStd(r.getTypeId());
      n.state = fromRpcState(r.getState());
      n.locale = toStd(r.getLocale());
      n.title = toStd(r.getTitle());
      n.description = toStd(r.getDescription());
      if (r.getHasContent())
      {
        auto c = r.getContent();
        codex::ContentRef ref{};
        ref.mediaType = toStd(c.getMediaType());
        switch (c.which())
        {
        case ContentRef::INLINE_JSON:
          ref.inlineJson = toStd(c.getInlineJson());
          break;
        case ContentRef::INLINE_BYTES:
        {
          auto d = c.getInlineBytes();
          ref.inlineBytes = std::string(reinterpret_cast<const char *>(d.begin()), d.size());
          break;
        }
        case ContentRef::EXTERNAL_URI:
          ref.externalUri = toStd(c.getExternalUri());
          break;
        case ContentRef::NONE:
        default:
          break;
        }
        n.content = std::move(ref);
      }
      n.meta = fromRpcMeta(r.getMeta());
      return n;
    }

    void toRpcNode(Node::Builder b, const codex::Node &n)
    {
      b.setId(n.id);
      b.setTypeId(n.typeId);
      b.setState(toRpcState(n.state));
      b.setLocale(n.locale);
      b.setTitle(n.title);
      b.setDescription(n.description);
      b.setHasContent(n.content.has_value());
      if (n.content)
      {
        auto c = b.initContent();
        c.setMediaType(n.content->mediaType);
        if (n.content->inlineJson)
          c.setInlineJson(*n.content->inlineJson);
        else if (n.content->inlineBytes)
          c.setInlineBytes(kj::ArrayPtr<const capnp::byte>(reinterpret_cast<const capnp::byte *>(n.content->inlineBytes->data()),
                                                           n.content->inlineBytes->size()));
        else if (n.content->externalUri)
          c.setExternalUri(*n.content->externalUri);
        else
          c.setNone();
      }
      toRpcMeta(b.initMeta(n.meta.size()), n.meta);
    }

    codex::Edge fromRpcEdge(Edge::Reader r)
    {
      codex::Edge e{};
      e.fromId = toStd(r.getFromId());
      e.toId = toStd(r.getToId());
      e.role = toStd(r.getRole());
      e.weight = r.getWeight();
      e.meta = fromRpcMeta(r.getMeta());
      return e;
    }

    void toRpcEdge(Edge::Builder b, const codex::Edge &e)
    {
      b.setFromId(e.fromId);
      b.setToId(e.toId);
      b.setRole(e.role);
      b.setWeight(e.weight);
      toRpcMeta(b.initMeta(e.meta.size()), e.meta);
    }

    void toRpcStoreStats(StoreStats::Builder b, const codex::StoreStats &s)
    {
      auto count = [&](codex::NodeState st) -> uint64_t
      {
        auto it = s.byState.find(st);
        return it == s.byState.end() ? 0 : it->second;
      };
      b.setBackend(s.backend);
      b.setNodeCount(s.nodeCount);
      b.setIceCount(count(codex::NodeState::Ice));
      b.setWaterCount(count(codex::NodeState::Water));
      b.setGasCount(count(codex::NodeState::Gas));
      b.setExpiredCount(s.expiredCount);
      auto types = b.initByType(s.byType.size());
      uint32_t i = 0;
      for (const auto &[typeId, n] : s.byType)
      {
        types[i].setTypeId(typeId);
        types[i].setCount(n);
        ++i;
      }
    }

    template <typename Nodes>
    void toRpcNodes(Nodes b, const std::vector<codex::Node> &nodes)
    {
      for (uint32_t i = 0; i < nodes.size(); ++i)
        toRpcNode(b[i], nodes[i]);
    }

    template <typename Edges>
    void toRpcEdges(Edges b, const std::vector<codex::Edge> &edges)
    {
      for (uint32_t i = 0; i < edges.size(); ++i)
        toRpcEdge(b[i], edges[i]);
    }

    // Registry errors become RPC exceptions; storage failures are also logged
    // here since the caller only sees the remote description.
    template <typename Func>
    kj::Promise<void> guarded(const char *op, Func &&fn)
    {
      try
      {
        fn();
        return kj::READY_NOW;
      }
      catch (const codex::ValidationError &e)
      {
        return KJ_EXCEPTION(FAILED, "invalid request", op, e.what());
      }
      catch (const codex::StorageUnavailable &e)
      {
        KJ_LOG(ERROR, "storage unavailable", op, e.what());
        return KJ_EXCEPTION(OVERLOADED, "storage unavailable", op, e.what());
      }
    }

  } // namespace

  CodexImpl::CodexImpl(codex::Registry &registry, codex::IngestionPipeline &pipeline)
      : registry_(registry), pipeline_(pipeline) {}

  kj::Promise<void> CodexImpl::getNode(GetNodeContext ctx)
  {
    return guarded("getNode", [&]
                   {
      auto n = registry_.get(toStd(ctx.getParams().getId()));
      auto res = ctx.getResults();
      res.setFound(n.has_value());
      if (n)
        toRpcNode(res.initNode(), *n); });
  }

  kj::Promise<void> CodexImpl::getNodesByType(GetNodesByTypeContext ctx)
  {
    return guarded("getNodesByType", [&]
                   {
      auto nodes = registry_.getNodesByType(toStd(ctx.getParams().getTypeId()));
      toRpcNodes(ctx.getResults().initNodes(nodes.size()), nodes); });
  }

  kj::Promise<void> CodexImpl::getNodesByState(GetNodesByStateContext ctx)
  {
    return guarded("getNodesByState", [&]
                   {
      auto nodes = registry_.getNodesByState(fromRpcState(ctx.getParams().getState()));
      toRpcNodes(ctx.getResults().initNodes(nodes.size()), nodes); });
  }

  kj::Promise<void> CodexImpl::getEdgesFrom(GetEdgesFromContext ctx)
  {
    return guarded("getEdgesFrom", [&]
                   {
      auto edges = registry_.getEdgesFrom(toStd(ctx.getParams().getId()));
      toRpcEdges(ctx.getResults().initEdges(edges.size()), edges); });
  }

  kj::Promise<void> CodexImpl::getEdgesTo(GetEdgesToContext ctx)
  {
    return guarded("getEdgesTo", [&]
                   {
      auto edges = registry_.getEdgesTo(toStd(ctx.getParams().getId()));
      toRpcEdges(ctx.getResults().initEdges(edges.size()), edges); });
  }

  kj::Promise<void> CodexImpl::upsertNode(UpsertNodeContext ctx)
  {
    return guarded("upsertNode", [&]
                   { registry_.upsert(fromRpcNode(ctx.getParams().getNode())); });
  }

  kj::Promise<void> CodexImpl::upsertEdge(UpsertEdgeContext ctx)
  {
    return guarded("upsertEdge", [&]
                   { registry_.upsert(fromRpcEdge(ctx.getParams().getEdge())); });
  }

  kj::Promise<void> CodexImpl::softDelete(SoftDeleteContext ctx)
  {
    return guarded("softDelete", [&]
                   { ctx.getResults().setFound(registry_.softDelete(toStd(ctx.getParams().getId()))); });
  }

  kj::Promise<void> CodexImpl::promote(PromoteContext ctx)
  {
    return guarded("promote", [&]
                   { ctx.getResults().setFound(registry_.promote(toStd(ctx.getParams().getId()))); });
  }

  kj::Promise<void> CodexImpl::ingest(IngestContext ctx)
  {
    return guarded("ingest", [&]
                   {
      auto in = ctx.getParams().getItem();
      codex::RawItem item{};
      item.id = toStd(in.getId());
      item.title = toStd(in.getTitle());
      item.content = toStd(in.getContent());
      item.source = toStd(in.getSource());
      item.publishedAt = in.getPublishedAt();
      item.tags = toStd(in.getTags());
      item.url = toStd(in.getUrl());

      auto r = pipeline_.ingest(item);

      auto out = ctx.getResults().initResult();
      out.setItemId(r.itemId);
      out.setContentNodeId(r.contentNodeId);
      out.setSummaryNodeId(r.summaryNodeId);
      setTextList(out.initConceptNodeIds(r.conceptNodeIds.size()), r.conceptNodeIds);
      setTextList(out.initAxisIds(r.axisIds.size()), r.axisIds);
      setTextList(out.initErrors(r.errors.size()), r.errors);
      out.setStatus(codex::toString(r.status)); });
  }

  kj::Promise<void> CodexImpl::stats(StatsContext ctx)
  {
    return guarded("stats", [&]
                   {
      auto s = registry_.stats();
      auto out = ctx.getResults().initStats();
      toRpcStoreStats(out.initIce(), s.ice);
      toRpcStoreStats(out.initWater(), s.water);
      out.setEdgeCount(s.edgeCount);
      out.setGasCount(s.gasCount); });
  }

  kj::Promise<void> CodexImpl::cleanupExpired(CleanupExpiredContext ctx)
  {
    return guarded("cleanupExpired", [&]
                   {
      auto report = registry_.cleanupExpired();
      auto out = ctx.getResults().initResult();
      setTextList(out.initExpired(report.expired.size()), report.expired);
      setTextList(out.initGasPurged(report.gasPurged.size()), report.gasPurged);
      out.setEdgesRemoved(report.edgesRemoved); });
  }

} // namespace codex::rpc

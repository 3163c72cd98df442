#pragma once
#include "pipeline.hpp"
#include "registry.hpp"
#include "schemas/codex.capnp.h"
#include <capnp/ez-rpc.h>
#include <kj/async-io.h>

namespace codex::rpc
{

  class CodexImpl final : public Codex::Server
  {
  public:
    CodexImpl(codex::Registry &registry, codex::IngestionPipeline &pipeline);

    kj::Promise<void> getNode(GetNodeContext ctx) override;
    kj::Promise<void> getNodesByType(GetNodesByTypeContext ctx) override;
    kj::Promise<void> getNodesByState(GetNodesByStateContext ctx) override;
    kj::Promise<void> getEdgesFrom(GetEdgesFromContext ctx) override;
    kj::Promise<void> getEdgesTo(GetEdgesToContext ctx) override;

    kj::Promise<void> upsertNode(UpsertNodeContext ctx) override;
    kj::Promise<void> upsertEdge(UpsertEdgeContext ctx) override;
    kj::Promise<void> softDelete(SoftDeleteContext ctx) override;
    kj::Promise<void> promote(PromoteContext ctx) override;

    kj::Promise<void> ingest(IngestContext ctx) override;
    kj::Promise<void> stats(StatsContext ctx) override;
    kj::Promise<void> cleanupExpired(CleanupExpiredContext ctx) override;

  private:
    codex::Registry &registry_;
    codex::IngestionPipeline &pipeline_;
  };

} // namespace codex::rpc

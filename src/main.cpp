#include "config.hpp"
#include "pipeline.hpp"
#include "registry.hpp"
#include "server.hpp"
#include <capnp/ez-rpc.h>
#include <kj/async-io.h>
#include <kj/main.h>
#include <kj/debug.h>
#include <kj/timer.h>
#include <charconv>
#include <cstring>
#include <unistd.h>

namespace
{

  kj::Promise<void> cleanupLoop(kj::Timer &timer, codex::Registry &registry, kj::Duration interval)
  {
    return timer.afterDelay(interval).then([&timer, &registry, interval]() -> kj::Promise<void>
                                           {
      try
      {
        registry.cleanupExpired();
      }
      catch (const std::exception &e)
      {
        // retried on the next tick
        KJ_LOG(ERROR, "periodic cleanup failed", e.what());
      }
      return cleanupLoop(timer, registry, interval); });
  }

} // namespace

class CodexdApp
{
public:
  explicit CodexdApp(kj::ProcessContext &context) : context_(context) {}

  kj::MainFunc getMain()
  {
    return kj::MainBuilder(context_, "0.1", "Codex knowledge graph server using capnproto RPC")
        .addOption({'v'}, KJ_BIND_METHOD(*this, optVerbose),
                   "increase logging verbosity (INFO)")
        .addOptionWithArg({'b', "bind"}, KJ_BIND_METHOD(*this, optBind),
                          "bind", "bind address (e.g., unix:/tmp/codex.sock or 0.0.0.0:0)")
        .addOptionWithArg({'d', "data"}, KJ_BIND_METHOD(*this, optData),
                          "dir", "data directory for the lmdb backend (default: data)")
        .addOptionWithArg({"backend"}, KJ_BIND_METHOD(*this, optBackend),
                          "kind", "storage backend: memory or lmdb (default: memory)")
        .addOptionWithArg({"map-size"}, KJ_BIND_METHOD(*this, optMapSize),
                          "mib", "lmdb map size per tier in MiB (default: 1024)")
        .addOptionWithArg({"gas-retention"}, KJ_BIND_METHOD(*this, optGasRetention),
                          "duration", "purge logically deleted nodes after this long (default: keep)")
        .addOptionWithArg({"item-ttl"}, KJ_BIND_METHOD(*this, optItemTtl),
                          "duration", "expire ingested items after this long (default: never)")
        .addOptionWithArg({"cleanup-interval"}, KJ_BIND_METHOD(*this, optCleanupInterval),
                          "duration", "period of the expiry sweep (default: 60s)")
        .callAfterParsing(KJ_BIND_METHOD(*this, run))
        .build();
  }

private:
  kj::ProcessContext &context_;
  codex::Config config_{};

  kj::MainBuilder::Validity optVerbose()
  {
    context_.increaseLoggingVerbosity();
    return true;
  }

  kj::MainBuilder::Validity optBind(kj::StringPtr value)
  {
    config_.bind = value.cStr();
    return true;
  }

  kj::MainBuilder::Validity optData(kj::StringPtr value)
  {
    config_.dataDir = value.cStr();
    return true;
  }

  kj::MainBuilder::Validity optBackend(kj::StringPtr value)
  {
    auto b = codex::parseBackend(value.cStr());
    if (!b)
      return "expected memory or lmdb";
    config_.backend = *b;
    return true;
  }

  kj::MainBuilder::Validity optMapSize(kj::StringPtr value)
  {
    size_t mib = 0;
    auto [ptr, ec] = std::from_chars(value.begin(), value.end(), mib);
    if (ec != std::errc() || ptr != value.end() || mib == 0)
      return "expected a positive number of MiB";
    config_.mapSizeBytes = mib << 20;
    return true;
  }

  kj::MainBuilder::Validity optGasRetention(kj::StringPtr value)
  {
    auto d = codex::parseDuration(value.cStr());
    if (!d)
      return "expected a duration like 30d";
    config_.gasRetention = *d;
    return true;
  }

  kj::MainBuilder::Validity optItemTtl(kj::StringPtr value)
  {
    auto d = codex::parseDuration(value.cStr());
    if (!d)
      return "expected a duration like 12h";
    config_.itemTtl = *d;
    return true;
  }

  kj::MainBuilder::Validity optCleanupInterval(kj::StringPtr value)
  {
    auto d = codex::parseDuration(value.cStr());
    if (!d)
      return "expected a duration like 60s";
    config_.cleanupInterval = *d;
    return true;
  }

  kj::MainBuilder::Validity run()
  {
    try
    {
      config_.validate();
      auto registry = codex::openRegistry(config_);
      codex::KeywordConceptExtractor extractor(config_.maxConcepts);
      codex::RegistrySourceDirectory sources(*registry);
      codex::IngestionPipeline pipeline(*registry, extractor, sources, codex::pipelineOptions(config_));

      const char *bindC = config_.bind.c_str();
      if (std::strncmp(bindC, "unix:", 5) == 0)
      {
        const char *path = bindC + 5;
        ::unlink(path);
      }

      capnp::EzRpcServer server(kj::heap<codex::rpc::CodexImpl>(*registry, pipeline), bindC);
      auto &waitScope = server.getWaitScope();
      if (std::strncmp(bindC, "unix:", 5) == 0)
      {
        KJ_LOG(INFO, "codexd listening on ", bindC);
      }
      else
      {
        auto addr = server.getPort().wait(waitScope);
        KJ_LOG(INFO, "codexd listening on ", bindC, " (port ", addr, ")");
      }

      auto &timer = server.getIoProvider().getTimer();
      auto sweeper = cleanupLoop(timer, *registry, config_.cleanupInterval.count() * kj::SECONDS)
                         .eagerlyEvaluate([](kj::Exception &&e)
                                          { KJ_LOG(ERROR, "cleanup loop stopped", e); });
      kj::NEVER_DONE.wait(waitScope);
    }
    catch (const std::exception &e)
    {
      KJ_LOG(ERROR, "fatal: ", e.what());
      return kj::MainBuilder::Validity("fatal error");
    }
    return true;
  }
};

KJ_MAIN(CodexdApp);

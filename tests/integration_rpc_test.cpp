#include "schemas/codex.capnp.h"
#include "config.hpp"
#include "pipeline.hpp"
#include "server.hpp"
#include "test_util.hpp"
#include <capnp/ez-rpc.h>
#include <gtest/gtest.h>
#include <kj/async-io.h>
#include <kj/debug.h>
#include <filesystem>
#include <thread>
#include <chrono>
#include <cstring>
#include <unistd.h>

using codex::testing::uniqueTempPath;

namespace
{

  std::string str(capnp::Text::Reader t)
  {
    return std::string(t.begin(), t.size());
  }

  struct RpcServerThread
  {
    std::string bind;
    std::thread th;

    explicit RpcServerThread(std::string bind_) : bind(std::move(bind_))
    {
      th = std::thread([this]()
                       {
      try {
        kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);

        codex::Config config{};
        auto registry = codex::openRegistry(config);
        codex::KeywordConceptExtractor extractor(config.maxConcepts);
        codex::RegistrySourceDirectory sources(*registry);
        codex::IngestionPipeline pipeline(*registry, extractor, sources, codex::pipelineOptions(config));

        const char* bindC = bind.c_str();
        if (std::strncmp(bindC, "unix:", 5) == 0) {
          const char* path = bindC + 5;
          ::unlink(path);
        }

        capnp::EzRpcServer server(kj::heap<codex::rpc::CodexImpl>(*registry, pipeline), bindC);
        auto& waitScope = server.getWaitScope();
        kj::NEVER_DONE.wait(waitScope);
      } catch (const std::exception& e) {
        KJ_LOG(ERROR, "RpcServerThread failed", e.what());
      } });
      th.detach();
    }
  };

  void waitForUnixSocketReady(const std::string &path, int maxMs = 2000)
  {
    using namespace std::chrono_literals;
    for (int i = 0; i < maxMs / 10; ++i)
    {
      if (std::filesystem::exists(path))
        return;
      std::this_thread::sleep_for(10ms);
    }
  }

  void fillNode(codex::rpc::Node::Builder b, const char *id, codex::rpc::NodeState state)
  {
    b.setId(id);
    b.setTypeId("codex.test.thing");
    b.setState(state);
    b.setLocale("en");
    b.setTitle(std::string("title of ") + id);
  }

} // namespace

class IntegrationRpc : public ::testing::Test
{
protected:
  static std::string sockPath;
  static std::string bind;
  static std::unique_ptr<RpcServerThread> server;
  static std::unique_ptr<capnp::EzRpcClient> client;

  static void SetUpTestSuite()
  {
    sockPath = uniqueTempPath("codex-test-sock-", ".sock");
    bind = std::string("unix:") + sockPath;
    server = std::make_unique<RpcServerThread>(bind);
    waitForUnixSocketReady(sockPath);
    client = std::make_unique<capnp::EzRpcClient>(bind.c_str());
  }

  static void TearDownTestSuite()
  {
    client.reset();
    server.reset();
  }
};

std::string IntegrationRpc::sockPath;
std::string IntegrationRpc::bind;
std::unique_ptr<RpcServerThread> IntegrationRpc::server;
std::unique_ptr<capnp::EzRpcClient> IntegrationRpc::client;

TEST_F(IntegrationRpc, Step01_UpsertIceNodeWithContent)
{
  auto &ws = client->getWaitScope();
  auto cap = client->getMain<codex::rpc::Codex>();

  auto req = cap.upsertNodeRequest();
  auto n = req.initNode();
  fillNode(n, "alpha", codex::rpc::NodeState::ICE);
  n.setHasContent(true);
  auto c = n.initContent();
  c.setMediaType("application/json");
  c.setInlineJson("{\"k\":1}");
  auto meta = n.initMeta(3);
  meta[0].setKey("weight");
  meta[0].initVal().setF64(0.5);
  meta[1].setKey("pinned");
  meta[1].initVal().setBoolv(true);
  meta[2].setKey("tags");
  auto tags = meta[2].initVal().initTextList(2);
  tags.set(0, "x");
  tags.set(1, "y");
  req.send().wait(ws);
}

TEST_F(IntegrationRpc, Step02_GetNodeReturnsWhatWasWritten)
{
  auto &ws = client->getWaitScope();
  auto cap = client->getMain<codex::rpc::Codex>();

  auto req = cap.getNodeRequest();
  req.setId("alpha");
  auto resp = req.send().wait(ws);
  ASSERT_TRUE(resp.getFound());
  auto n = resp.getNode();
  EXPECT_EQ(str(n.getId()), "alpha");
  EXPECT_EQ(n.getState(), codex::rpc::NodeState::ICE);
  ASSERT_TRUE(n.getHasContent());
  EXPECT_EQ(n.getContent().which(), codex::rpc::ContentRef::INLINE_JSON);
  EXPECT_EQ(str(n.getContent().getInlineJson()), "{\"k\":1}");

  bool hasWeight = false, hasTags = false;
  for (auto e : n.getMeta())
  {
    if (str(e.getKey()) == "weight")
    {
      hasWeight = true;
      EXPECT_EQ(e.getVal().which(), codex::rpc::MetaValue::F64);
      EXPECT_DOUBLE_EQ(e.getVal().getF64(), 0.5);
    }
    if (str(e.getKey()) == "tags")
    {
      hasTags = true;
      EXPECT_EQ(e.getVal().getTextList().size(), 2u);
    }
  }
  EXPECT_TRUE(hasWeight);
  EXPECT_TRUE(hasTags);

  auto missing = cap.getNodeRequest();
  missing.setId("nobody");
  EXPECT_FALSE(missing.send().wait(ws).getFound());
}

TEST_F(IntegrationRpc, Step03_WaterNodeAndEdge)
{
  auto &ws = client->getWaitScope();
  auto cap = client->getMain<codex::rpc::Codex>();

  {
    auto req = cap.upsertNodeRequest();
    fillNode(req.initNode(), "beta", codex::rpc::NodeState::WATER);
    req.send().wait(ws);
  }
  {
    auto req = cap.upsertEdgeRequest();
    auto e = req.initEdge();
    e.setFromId("alpha");
    e.setToId("beta");
    e.setRole("leads-to");
    e.setWeight(0.75);
    req.send().wait(ws);
  }

  auto from = cap.getEdgesFromRequest();
  from.setId("alpha");
  auto edges = from.send().wait(ws).getEdges();
  ASSERT_EQ(edges.size(), 1u);
  EXPECT_EQ(str(edges[0].getToId()), "beta");
  EXPECT_DOUBLE_EQ(edges[0].getWeight(), 0.75);

  auto to = cap.getEdgesToRequest();
  to.setId("beta");
  EXPECT_EQ(to.send().wait(ws).getEdges().size(), 1u);
}

TEST_F(IntegrationRpc, Step04_DemotionIsRejected)
{
  auto &ws = client->getWaitScope();
  auto cap = client->getMain<codex::rpc::Codex>();

  auto req = cap.upsertNodeRequest();
  fillNode(req.initNode(), "alpha", codex::rpc::NodeState::WATER);
  EXPECT_ANY_THROW(req.send().wait(ws));

  auto bad = cap.upsertEdgeRequest();
  bad.initEdge().setFromId("alpha");
  EXPECT_ANY_THROW(bad.send().wait(ws));
}

TEST_F(IntegrationRpc, Step05_PromoteMovesToIce)
{
  auto &ws = client->getWaitScope();
  auto cap = client->getMain<codex::rpc::Codex>();

  auto req = cap.promoteRequest();
  req.setId("beta");
  EXPECT_TRUE(req.send().wait(ws).getFound());

  auto byState = cap.getNodesByStateRequest();
  byState.setState(codex::rpc::NodeState::ICE);
  auto nodes = byState.send().wait(ws).getNodes();
  bool hasBeta = false;
  for (auto n : nodes)
    hasBeta = hasBeta || str(n.getId()) == "beta";
  EXPECT_TRUE(hasBeta);
}

TEST_F(IntegrationRpc, Step06_SoftDeleteHidesFromListings)
{
  auto &ws = client->getWaitScope();
  auto cap = client->getMain<codex::rpc::Codex>();

  auto del = cap.softDeleteRequest();
  del.setId("beta");
  EXPECT_TRUE(del.send().wait(ws).getFound());

  auto list = cap.getNodesByTypeRequest();
  list.setTypeId("codex.test.thing");
  auto nodes = list.send().wait(ws).getNodes();
  ASSERT_EQ(nodes.size(), 1u);
  EXPECT_EQ(str(nodes[0].getId()), "alpha");

  auto get = cap.getNodeRequest();
  get.setId("beta");
  auto resp = get.send().wait(ws);
  ASSERT_TRUE(resp.getFound());
  EXPECT_EQ(resp.getNode().getState(), codex::rpc::NodeState::GAS);
}

TEST_F(IntegrationRpc, Step07_IngestBuildsLineage)
{
  auto &ws = client->getWaitScope();
  auto cap = client->getMain<codex::rpc::Codex>();

  auto req = cap.ingestRequest();
  auto item = req.initItem();
  item.setId("n1");
  item.setTitle("Quantum leap");
  item.setContent("<p>Quantum research advances. Quantum computing follows.</p>");
  item.setSource("wire");
  item.setPublishedAt(1700000000000);
  auto r = req.send().wait(ws).getResult();

  EXPECT_EQ(str(r.getStatus()), "complete");
  EXPECT_EQ(str(r.getContentNodeId()), "content:n1");
  EXPECT_EQ(str(r.getSummaryNodeId()), "summary:n1");
  ASSERT_GE(r.getConceptNodeIds().size(), 1u);
  EXPECT_EQ(str(r.getConceptNodeIds()[0]), "concept:quantum");
  EXPECT_EQ(str(r.getAxisIds()[0]), "u-core-axis-awareness");
  EXPECT_EQ(r.getErrors().size(), 0u);

  auto from = cap.getEdgesFromRequest();
  from.setId("summary:n1");
  EXPECT_EQ(from.send().wait(ws).getEdges().size(), r.getConceptNodeIds().size());
}

TEST_F(IntegrationRpc, Step08_StatsAndCleanup)
{
  auto &ws = client->getWaitScope();
  auto cap = client->getMain<codex::rpc::Codex>();

  auto stats = cap.statsRequest().send().wait(ws).getStats();
  EXPECT_EQ(str(stats.getIce().getBackend()), "memory");
  EXPECT_EQ(stats.getGasCount(), 1u);
  EXPECT_GE(stats.getIce().getIceCount(), 10u);
  EXPECT_GT(stats.getEdgeCount(), 3u);

  auto cleanup = cap.cleanupExpiredRequest().send().wait(ws).getResult();
  EXPECT_EQ(cleanup.getExpired().size(), 0u);
  EXPECT_EQ(cleanup.getGasPurged().size(), 0u);
}

#include "store.hpp"
#include "codec.hpp"
#include "encode.hpp"
#include <lmdb.h>
#include <cstring>
#include <string_view>
#include <utility>
#include <kj/debug.h>

namespace codex
{
  // -------------------- raw LMDB helpers --------------------

  static inline MDB_val make_val(std::string_view s)
  {
    return MDB_val{s.size(), const_cast<char *>(s.data())};
  }

  static inline std::string_view as_view(const MDB_val &v)
  {
    return std::string_view(static_cast<const char *>(v.mv_data), v.mv_size);
  }

  static bool mdb_get_val(MDB_txn *tx, DbHandle dbi, std::string_view key, MDB_val &out)
  {
    MDB_val k = make_val(key);
    int rc = mdb_get(tx, dbi, &k, &out);
    if (rc == MDB_NOTFOUND)
      return false;
    if (rc)
      throw MdbError(mdb_strerror(rc));
    return true;
  }

  static void mdb_put_val(MDB_txn *tx, DbHandle dbi, std::string_view key, std::string_view value)
  {
    MDB_val k = make_val(key);
    MDB_val v = make_val(value);
    int rc = mdb_put(tx, dbi, &k, &v, 0);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  // returns false if the key was absent
  static bool mdb_del_key(MDB_txn *tx, DbHandle dbi, std::string_view key)
  {
    MDB_val k = make_val(key);
    int rc = mdb_del(tx, dbi, &k, nullptr);
    if (rc == MDB_NOTFOUND)
      return false;
    if (rc)
      throw MdbError(mdb_strerror(rc));
    return true;
  }

  static uint64_t entry_count(MDB_txn *tx, DbHandle dbi)
  {
    MDB_stat st{};
    int rc = mdb_stat(tx, dbi, &st);
    if (rc)
      throw MdbError(mdb_strerror(rc));
    return st.ms_entries;
  }

  // Copies out every (key, value) whose key starts with `prefix`. The cursor is
  // closed before any decoding happens so a corrupt record cannot leak it.
  static std::vector<std::pair<std::string, std::string>> scan_prefix(MDB_txn *tx, DbHandle dbi, std::string_view prefix)
  {
    std::vector<std::pair<std::string, std::string>> out;
    MDB_cursor *cur{};
    int rc = mdb_cursor_open(tx, dbi, &cur);
    if (rc)
      throw MdbError(mdb_strerror(rc));
    MDB_val k = make_val(prefix), v{};
    rc = mdb_cursor_get(cur, &k, &v, prefix.empty() ? MDB_FIRST : MDB_SET_RANGE);
    while (rc == 0)
    {
      auto key = as_view(k);
      if (!has_prefix(key, prefix))
        break;
      out.emplace_back(std::string(key), std::string(as_view(v)));
      rc = mdb_cursor_get(cur, &k, &v, MDB_NEXT);
    }
    mdb_cursor_close(cur);
    if (rc && rc != MDB_NOTFOUND)
      throw MdbError(mdb_strerror(rc));
    return out;
  }

  static void ensure_schema(Txn &tx, Env &env, const std::string &tier)
  {
    MDB_val v{};
    auto versionKey = key_meta_schema_version();
    if (!mdb_get_val(tx.get(), env.meta(), versionKey, v))
    {
      std::string version;
      put_be32(version, 1u); // initial schema version
      mdb_put_val(tx.get(), env.meta(), versionKey, version);
    }
    else if (v.mv_size != 4 || read_be32(static_cast<const unsigned char *>(v.mv_data)) != 1u)
    {
      throw MdbError(env.path().string() + ": unsupported schema version");
    }

    auto tierKey = key_meta_tier();
    if (!mdb_get_val(tx.get(), env.meta(), tierKey, v))
      mdb_put_val(tx.get(), env.meta(), tierKey, tier);
    else if (as_view(v) != tier)
      throw MdbError(env.path().string() + ": holds tier '" + std::string(as_view(v)) + "', expected '" + tier + "'");
  }

  // -------------------- nodes --------------------

  LmdbNodeStore::LmdbNodeStore(const std::filesystem::path &dir, std::string tier, size_t mapSizeBytes)
      : env_(dir, mapSizeBytes), tier_(std::move(tier))
  {
    Txn tx(env_.raw(), true);
    ensure_schema(tx, env_, tier_);
    tx.commit();
    KJ_LOG(INFO, "lmdb node store opened", tier_, env_.path().string());
  }

  static std::optional<Node> read_node(MDB_txn *tx, Env &env, const std::string &id)
  {
    MDB_val v{};
    if (!mdb_get_val(tx, env.nodes(), key_node(id), v))
      return std::nullopt;
    return decodeNode(as_view(v));
  }

  static void unindex_node(MDB_txn *tx, Env &env, const Node &n)
  {
    mdb_del_key(tx, env.typeIndex(), key_type_index(n.typeId, n.id));
    mdb_del_key(tx, env.stateIndex(), key_state_index(static_cast<uint8_t>(n.state), n.id));
  }

  std::optional<Node> LmdbNodeStore::get(const std::string &id)
  {
    Txn tx(env_.raw(), false);
    return read_node(tx.get(), env_, id);
  }

  void LmdbNodeStore::put(const Node &node)
  {
    Txn tx(env_.raw(), true);
    if (auto old = read_node(tx.get(), env_, node.id))
      unindex_node(tx.get(), env_, *old);
    mdb_put_val(tx.get(), env_.nodes(), key_node(node.id), encodeNode(node));
    mdb_put_val(tx.get(), env_.typeIndex(), key_type_index(node.typeId, node.id), {});
    mdb_put_val(tx.get(), env_.stateIndex(), key_state_index(static_cast<uint8_t>(node.state), node.id), {});
    tx.commit();
  }

  bool LmdbNodeStore::remove(const std::string &id)
  {
    Txn tx(env_.raw(), true);
    auto old = read_node(tx.get(), env_, id);
    if (!old)
      return false;
    unindex_node(tx.get(), env_, *old);
    mdb_del_key(tx.get(), env_.nodes(), key_node(id));
    tx.commit();
    return true;
  }

  // resolves index entries `<prefix><id>` to nodes within one read txn
  static std::vector<Node> resolve_index(Txn &tx, Env &env, DbHandle index, const std::string &prefix)
  {
    std::vector<Node> out;
    for (const auto &[key, unused] : scan_prefix(tx.get(), index, prefix))
    {
      auto id = key.substr(prefix.size());
      if (auto n = read_node(tx.get(), env, id))
        out.push_back(std::move(*n));
      else
        KJ_LOG(WARNING, "dangling index entry", env.path().string(), id);
    }
    return out;
  }

  std::vector<Node> LmdbNodeStore::listByType(const std::string &typeId)
  {
    Txn tx(env_.raw(), false);
    return resolve_index(tx, env_, env_.typeIndex(), key_type_prefix(typeId));
  }

  std::vector<Node> LmdbNodeStore::listByState(NodeState state)
  {
    Txn tx(env_.raw(), false);
    return resolve_index(tx, env_, env_.stateIndex(), key_state_index(static_cast<uint8_t>(state), {}));
  }

  std::vector<Node> LmdbNodeStore::listAll()
  {
    Txn tx(env_.raw(), false);
    std::vector<Node> out;
    for (const auto &[key, value] : scan_prefix(tx.get(), env_.nodes(), {}))
      out.push_back(decodeNode(value));
    return out;
  }

  StoreStats LmdbNodeStore::stats()
  {
    Txn tx(env_.raw(), false);
    StoreStats s{};
    s.backend = "lmdb";
    s.nodeCount = entry_count(tx.get(), env_.nodes());
    for (const auto &[key, unused] : scan_prefix(tx.get(), env_.stateIndex(), {}))
    {
      if (key.empty() || uint8_t(key[0]) > uint8_t(NodeState::Gas))
        throw MdbError("corrupt state index key");
      ++s.byState[static_cast<NodeState>(uint8_t(key[0]))];
    }
    for (const auto &[key, unused] : scan_prefix(tx.get(), env_.typeIndex(), {}))
    {
      auto sep = key.find('\0');
      if (sep == std::string::npos)
        throw MdbError("corrupt type index key");
      ++s.byType[key.substr(0, sep)];
    }
    return s;
  }

  // -------------------- edges --------------------

  LmdbEdgeStore::LmdbEdgeStore(const std::filesystem::path &dir, size_t mapSizeBytes) : env_(dir, mapSizeBytes)
  {
    Txn tx(env_.raw(), true);
    ensure_schema(tx, env_, "edges");
    tx.commit();
    KJ_LOG(INFO, "lmdb edge store opened", env_.path().string());
  }

  // splits the tail `<role>\0<other>` of an edge key
  static std::pair<std::string, std::string> split_edge_tail(std::string_view tail)
  {
    auto sep = tail.find('\0');
    if (sep == std::string_view::npos)
      throw MdbError("corrupt edge key");
    return {std::string(tail.substr(0, sep)), std::string(tail.substr(sep + 1))};
  }

  void LmdbEdgeStore::put(const Edge &edge)
  {
    Txn tx(env_.raw(), true);
    mdb_put_val(tx.get(), env_.edgesBySrc(), key_edge(edge.fromId, edge.role, edge.toId), encodeEdge(edge));
    mdb_put_val(tx.get(), env_.edgesByDst(), key_edge(edge.toId, edge.role, edge.fromId), {});
    tx.commit();
  }

  static bool remove_edge(MDB_txn *tx, Env &env, const std::string &fromId, const std::string &toId, const std::string &role)
  {
    bool existed = mdb_del_key(tx, env.edgesBySrc(), key_edge(fromId, role, toId));
    mdb_del_key(tx, env.edgesByDst(), key_edge(toId, role, fromId));
    return existed;
  }

  bool LmdbEdgeStore::remove(const std::string &fromId, const std::string &toId, const std::string &role)
  {
    Txn tx(env_.raw(), true);
    bool existed = remove_edge(tx.get(), env_, fromId, toId, role);
    tx.commit();
    return existed;
  }

  size_t LmdbEdgeStore::removeTouching(const std::string &id)
  {
    Txn tx(env_.raw(), true);
    auto prefix = key_edge_prefix(id);
    size_t n = 0;
    for (const auto &[key, unused] : scan_prefix(tx.get(), env_.edgesBySrc(), prefix))
    {
      auto [role, toId] = split_edge_tail(std::string_view(key).substr(prefix.size()));
      n += remove_edge(tx.get(), env_, id, toId, role) ? 1 : 0;
    }
    for (const auto &[key, unused] : scan_prefix(tx.get(), env_.edgesByDst(), prefix))
    {
      auto [role, fromId] = split_edge_tail(std::string_view(key).substr(prefix.size()));
      n += remove_edge(tx.get(), env_, fromId, id, role) ? 1 : 0;
    }
    tx.commit();
    return n;
  }

  std::vector<Edge> LmdbEdgeStore::from(const std::string &id)
  {
    Txn tx(env_.raw(), false);
    std::vector<Edge> out;
    for (const auto &[key, value] : scan_prefix(tx.get(), env_.edgesBySrc(), key_edge_prefix(id)))
      out.push_back(decodeEdge(value));
    return out;
  }

  std::vector<Edge> LmdbEdgeStore::to(const std::string &id)
  {
    Txn tx(env_.raw(), false);
    auto prefix = key_edge_prefix(id);
    std::vector<Edge> out;
    for (const auto &[key, unused] : scan_prefix(tx.get(), env_.edgesByDst(), prefix))
    {
      auto [role, fromId] = split_edge_tail(std::string_view(key).substr(prefix.size()));
      MDB_val v{};
      if (mdb_get_val(tx.get(), env_.edgesBySrc(), key_edge(fromId, role, id), v))
        out.push_back(decodeEdge(as_view(v)));
    }
    return out;
  }

  uint64_t LmdbEdgeStore::count()
  {
    Txn tx(env_.raw(), false);
    return entry_count(tx.get(), env_.edgesBySrc());
  }

} // namespace codex

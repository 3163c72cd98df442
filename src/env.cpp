#include "env.hpp"
#include <lmdb.h>
#include <utility>

namespace codex
{

  Txn::Txn(MDB_env *env, bool rw) : env_(env), rw_(rw)
  {
    int rc = mdb_txn_begin(env_, nullptr, rw_ ? 0 : MDB_RDONLY, &txn_);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  Txn::~Txn() noexcept
  {
    if (txn_)
      mdb_txn_abort(txn_);
  }

  Txn::Txn(Txn &&other) noexcept : env_(other.env_), txn_(other.txn_), rw_(other.rw_)
  {
    other.txn_ = nullptr;
  }

  Txn &Txn::operator=(Txn &&other) noexcept
  {
    if (this != &other)
    {
      abort();
      env_ = other.env_;
      txn_ = other.txn_;
      rw_ = other.rw_;
      other.txn_ = nullptr;
    }
    return *this;
  }

  MDB_txn *Txn::get() const { return txn_; }

  void Txn::commit()
  {
    int rc = mdb_txn_commit(txn_);
    txn_ = nullptr;
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  void Txn::abort() noexcept
  {
    if (txn_)
    {
      mdb_txn_abort(txn_);
      txn_ = nullptr;
    }
  }

  Env::Env(const std::filesystem::path &path, size_t mapSizeBytes) : path_(path)
  {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec)
      throw MdbError("cannot create " + path.string() + ": " + ec.message());

    int rc = mdb_env_create(&env_);
    if (rc)
      throw MdbError(mdb_strerror(rc));
    rc = mdb_env_set_maxdbs(env_, 8);
    if (!rc)
      rc = mdb_env_set_mapsize(env_, mapSizeBytes);
    if (!rc)
      rc = mdb_env_open(env_, path.c_str(), 0, 0664);
    if (rc)
    {
      mdb_env_close(env_);
      env_ = nullptr;
      throw MdbError(mdb_strerror(rc));
    }
    // open main DBIs
    Txn tx(env_, true);
    open(tx.get(), nodes_, "nodes");
    open(tx.get(), typeIndex_, "typeIndex");
    open(tx.get(), stateIndex_, "stateIndex");

    open(tx.get(), edgesBySrc_, "edgesBySrc");
    open(tx.get(), edgesByDst_, "edgesByDst");

    open(tx.get(), meta_, "meta");
    tx.commit();
  }

  Env::~Env() noexcept
  {
    if (env_)
      mdb_env_close(env_);
  }

  Env::Env(Env &&other) noexcept
      : env_(other.env_),
        path_(std::move(other.path_)),
        nodes_(other.nodes_),
        typeIndex_(other.typeIndex_),
        stateIndex_(other.stateIndex_),
        edgesBySrc_(other.edgesBySrc_),
        edgesByDst_(other.edgesByDst_),
        meta_(other.meta_)
  {
    other.env_ = nullptr;
  }

  Env &Env::operator=(Env &&other) noexcept
  {
    if (this != &other)
    {
      if (env_)
        mdb_env_close(env_);
      env_ = other.env_;
      path_ = std::move(other.path_);
      nodes_ = other.nodes_;
      typeIndex_ = other.typeIndex_;
      stateIndex_ = other.stateIndex_;

      edgesBySrc_ = other.edgesBySrc_;
      edgesByDst_ = other.edgesByDst_;

      meta_ = other.meta_;
      other.env_ = nullptr;
    }
    return *this;
  }

  MDB_env *Env::raw() const { return env_; }
  const std::filesystem::path &Env::path() const { return path_; }

  DbHandle Env::nodes() const { return nodes_; }
  DbHandle Env::typeIndex() const { return typeIndex_; }
  DbHandle Env::stateIndex() const { return stateIndex_; }

  DbHandle Env::edgesBySrc() const { return edgesBySrc_; }
  DbHandle Env::edgesByDst() const { return edgesByDst_; }

  DbHandle Env::meta() const { return meta_; }

  void Env::open(MDB_txn *tx, DbHandle &out, const char *name)
  {
    int rc = mdb_dbi_open(tx, name, MDB_CREATE, &out);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

} // namespace codex

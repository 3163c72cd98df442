#pragma once
#include "errors.hpp"
#include <filesystem>

struct MDB_env;
struct MDB_txn;
using DbHandle = unsigned int;

namespace codex
{

  struct MdbError : StorageUnavailable
  {
    using StorageUnavailable::StorageUnavailable;
  };

  class Txn
  {
  public:
    Txn(MDB_env *env, bool rw);
    ~Txn() noexcept;
    Txn(const Txn &) = delete;
    Txn &operator=(const Txn &) = delete;
    Txn(Txn &&other) noexcept;
    Txn &operator=(Txn &&other) noexcept;

    MDB_txn *get() const;
    void commit();
    void abort() noexcept;

  private:
    MDB_env *env_{};
    MDB_txn *txn_{};
    bool rw_{};
  };

  // One LMDB environment (a directory). Each persistence tier and the edge
  // index open their own environment; all share the same named-database layout.
  class Env
  {
  public:
    Env(const std::filesystem::path &path, size_t mapSizeBytes = size_t(1ull << 30));
    ~Env() noexcept;
    Env(const Env &) = delete;
    Env &operator=(const Env &) = delete;
    Env(Env &&other) noexcept;
    Env &operator=(Env &&other) noexcept;

    MDB_env *raw() const;
    const std::filesystem::path &path() const;

    DbHandle nodes() const;
    DbHandle typeIndex() const;
    DbHandle stateIndex() const;

    DbHandle edgesBySrc() const;
    DbHandle edgesByDst() const;

    DbHandle meta() const;

  private:
    static void open(MDB_txn *tx, DbHandle &out, const char *name);

    MDB_env *env_{};
    std::filesystem::path path_{};
    DbHandle nodes_{};
    DbHandle typeIndex_{};
    DbHandle stateIndex_{};

    DbHandle edgesBySrc_{};
    DbHandle edgesByDst_{};

    DbHandle meta_{};
  };

} // namespace codex

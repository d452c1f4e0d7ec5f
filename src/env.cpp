#include "env.hpp"
#include "encode.hpp"
#include <lmdb.h>
#include <utility>

namespace morpheus
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

  Env::Env(const std::filesystem::path &path, size_t mapSizeBytes)
  {
    int rc = mdb_env_create(&env_);
    if (rc)
      throw MdbError(mdb_strerror(rc));
    mdb_env_set_maxdbs(env_, 8);
    mdb_env_set_mapsize(env_, mapSizeBytes);
    // snapshots are held by transaction objects, not threads
    rc = mdb_env_open(env_, path.c_str(), MDB_NOTLS, 0664);
    if (rc)
    {
      mdb_env_close(env_);
      env_ = nullptr;
      throw MdbError(mdb_strerror(rc));
    }
    try
    {
      Txn tx(env_, true);
      open(tx.get(), cells_, "cells");
      open(tx.get(), schemas_, "schemas");
      open(tx.get(), schemasByName_, "schemasByName");
      open(tx.get(), meta_, "meta");
      ensureFormatVersion(tx.get());
      tx.commit();
    }
    catch (const MdbError &)
    {
      mdb_env_close(env_);
      env_ = nullptr;
      throw;
    }
  }

  Env::~Env() noexcept
  {
    if (env_)
      mdb_env_close(env_);
  }

  Env::Env(Env &&other) noexcept
      : env_(other.env_),
        cells_(other.cells_),
        schemas_(other.schemas_),
        schemasByName_(other.schemasByName_),
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
      cells_ = other.cells_;
      schemas_ = other.schemas_;
      schemasByName_ = other.schemasByName_;
      meta_ = other.meta_;
      other.env_ = nullptr;
    }
    return *this;
  }

  MDB_env *Env::raw() const { return env_; }
  DbHandle Env::cells() const { return cells_; }
  DbHandle Env::schemas() const { return schemas_; }
  DbHandle Env::schemasByName() const { return schemasByName_; }
  DbHandle Env::meta() const { return meta_; }

  // stamps a fresh environment, refuses one written in another cell layout
  void Env::ensureFormatVersion(MDB_txn *tx)
  {
    auto key = key_meta_format_version();
    MDB_val k{key.size(), const_cast<char *>(key.data())}, v{};
    int rc = mdb_get(tx, meta_, &k, &v);
    if (rc == MDB_NOTFOUND)
    {
      std::string val;
      put_be32(val, kFormatVersion);
      MDB_val nv{val.size(), const_cast<char *>(val.data())};
      rc = mdb_put(tx, meta_, &k, &nv, 0);
      if (rc)
        throw MdbError(mdb_strerror(rc));
      return;
    }
    if (rc)
      throw MdbError(mdb_strerror(rc));
    if (v.mv_size != 4 || read_be32(static_cast<const unsigned char *>(v.mv_data)) != kFormatVersion)
      throw MdbError("unsupported data format version");
  }

  void Env::open(MDB_txn *tx, DbHandle &out, const char *name)
  {
    int rc = mdb_dbi_open(tx, name, MDB_CREATE, &out);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

} // namespace morpheus

#include "cell_store.hpp"
#include "codec.hpp"
#include "encode.hpp"
#include "env.hpp"
#include <lmdb.h>
#include <algorithm>
#include <string_view>

namespace morpheus
{

  // -------------------- buffered transaction --------------------

  TxnOutcome<std::optional<Cell>, StoreError> BufferedCellTxn::read(const Id &id)
  {
    using Out = TxnOutcome<std::optional<Cell>, StoreError>;
    auto w = writes_.find(id);
    if (w != writes_.end())
      return Out::ok(w->second);

    auto fetched = fetch(id);
    if (!fetched.isOk())
      return Out::fatal(fetched.error());
    const auto &cell = fetched.value();
    uint64_t version = cell ? cell->header.version : 0;

    auto seen = reads_.find(id);
    if (seen != reads_.end() && seen->second != version)
      return Out::retry("cell " + to_string(id) + " changed during transaction");
    reads_[id] = version;
    return Out::ok(std::move(fetched).value());
  }

  void BufferedCellTxn::write(const Cell &cell)
  {
    writes_[cell.header.id] = cell;
  }

  void BufferedCellTxn::remove(const Id &id)
  {
    writes_[id] = std::nullopt;
  }

  CommitBatch BufferedCellTxn::batch() const
  {
    CommitBatch b{};
    b.reads.reserve(reads_.size());
    for (const auto &[id, version] : reads_)
      b.reads.push_back(ReadVersion{id, version});
    b.writes.reserve(writes_.size());
    for (const auto &[id, cell] : writes_)
      b.writes.push_back(WriteOp{id, cell});
    return b;
  }

  TxnOutcome<std::optional<Cell>, GraphError> txn_read(CellTxn &txn, const Id &id)
  {
    using Out = TxnOutcome<std::optional<Cell>, GraphError>;
    auto r = txn.read(id);
    if (r.isRetry())
      return Out::retry(r.reason());
    if (r.isFatal())
      return Out::fatal(GraphError(r.error()));
    return Out::ok(std::move(r).value());
  }

  // -------------------- lmdb helpers --------------------

  namespace
  {

    std::optional<Cell> get_cell(MDB_txn *tx, DbHandle dbi, const Id &id)
    {
      auto key = key_cell_be(id.higher, id.lower);
      MDB_val k{key.size(), const_cast<char *>(key.data())}, v{};
      int rc = mdb_get(tx, dbi, &k, &v);
      if (rc == MDB_NOTFOUND)
        return std::nullopt;
      if (rc)
        throw MdbError(mdb_strerror(rc));
      return decode_cell(id, std::string_view(static_cast<const char *>(v.mv_data), v.mv_size));
    }

    // <u32 schema>|<u64 version>|... ; 0 when absent
    uint64_t current_version(MDB_txn *tx, DbHandle dbi, const Id &id)
    {
      auto key = key_cell_be(id.higher, id.lower);
      MDB_val k{key.size(), const_cast<char *>(key.data())}, v{};
      int rc = mdb_get(tx, dbi, &k, &v);
      if (rc == MDB_NOTFOUND)
        return 0;
      if (rc)
        throw MdbError(mdb_strerror(rc));
      if (v.mv_size < 12)
        throw MdbError("corrupt cell header");
      return read_be64(static_cast<const unsigned char *>(v.mv_data) + 4);
    }

    // Versions come from one store-wide counter, so a cell that is removed
    // and created again never repeats a version an older reader recorded.
    uint64_t next_version(MDB_txn *tx, DbHandle meta, uint64_t current)
    {
      auto key = key_meta_cell_seq();
      MDB_val k{key.size(), const_cast<char *>(key.data())}, v{};
      uint64_t seq = 0;
      int rc = mdb_get(tx, meta, &k, &v);
      if (rc == 0)
      {
        if (v.mv_size != 8)
          throw MdbError("corrupt cell sequence");
        seq = read_be64(static_cast<const unsigned char *>(v.mv_data));
      }
      else if (rc != MDB_NOTFOUND)
        throw MdbError(mdb_strerror(rc));

      uint64_t next = std::max(seq, current) + 1;
      std::string val;
      put_be64(val, next);
      MDB_val nv{val.size(), const_cast<char *>(val.data())};
      rc = mdb_put(tx, meta, &k, &nv, 0);
      if (rc)
        throw MdbError(mdb_strerror(rc));
      return next;
    }

    void put_cell(MDB_txn *tx, DbHandle dbi, const Cell &cell)
    {
      auto key = key_cell_be(cell.header.id.higher, cell.header.id.lower);
      auto bytes = encode_cell(cell);
      MDB_val k{key.size(), const_cast<char *>(key.data())};
      MDB_val v{bytes.size(), const_cast<char *>(bytes.data())};
      int rc = mdb_put(tx, dbi, &k, &v, 0);
      if (rc)
        throw MdbError(mdb_strerror(rc));
    }

    bool del_cell(MDB_txn *tx, DbHandle dbi, const Id &id)
    {
      auto key = key_cell_be(id.higher, id.lower);
      MDB_val k{key.size(), const_cast<char *>(key.data())};
      int rc = mdb_del(tx, dbi, &k, nullptr);
      if (rc == MDB_NOTFOUND)
        return false;
      if (rc)
        throw MdbError(mdb_strerror(rc));
      return true;
    }

    StoreError storage_error(const std::exception &e)
    {
      return StoreError{StoreError::Kind::Storage, e.what()};
    }

    // Reads every cell through one read-only LMDB snapshot.
    class LmdbCellTxn final : public BufferedCellTxn
    {
    public:
      explicit LmdbCellTxn(Env &env) : env_(env), snapshot_(std::in_place, env.raw(), false) {}

      void release() noexcept override { snapshot_.reset(); }

    protected:
      Result<std::optional<Cell>, StoreError> fetch(const Id &id) override
      {
        using R = Result<std::optional<Cell>, StoreError>;
        if (!snapshot_)
          return R::err({StoreError::Kind::Storage, "transaction snapshot already released"});
        try
        {
          return R::ok(get_cell(snapshot_->get(), env_.cells(), id));
        }
        catch (const MdbError &e)
        {
          return R::err(storage_error(e));
        }
        catch (const CodecError &e)
        {
          return R::err(storage_error(e));
        }
      }

    private:
      Env &env_;
      std::optional<Txn> snapshot_;
    };

  } // namespace

  // -------------------- store --------------------

  LmdbCellStore::LmdbCellStore(Env &env, CellStoreOptions options) : CellStore(options), env_(env) {}

  Result<Cell, StoreError> LmdbCellStore::read(const Id &id)
  {
    using R = Result<Cell, StoreError>;
    try
    {
      Txn tx(env_.raw(), false);
      auto cell = get_cell(tx.get(), env_.cells(), id);
      if (!cell)
        return R::err({StoreError::Kind::CellNotFound, to_string(id)});
      return R::ok(std::move(*cell));
    }
    catch (const MdbError &e)
    {
      return R::err(storage_error(e));
    }
    catch (const CodecError &e)
    {
      return R::err(storage_error(e));
    }
  }

  Result<CellHeader, StoreError> LmdbCellStore::write(const Cell &cell, WriteMode mode)
  {
    using R = Result<CellHeader, StoreError>;
    try
    {
      Txn tx(env_.raw(), true);
      uint64_t version = current_version(tx.get(), env_.cells(), cell.header.id);
      if (mode == WriteMode::Insert && version != 0)
        return R::err({StoreError::Kind::CellAlreadyExists, to_string(cell.header.id)});
      Cell stored = cell;
      stored.header.version = next_version(tx.get(), env_.meta(), version);
      put_cell(tx.get(), env_.cells(), stored);
      tx.commit();
      return R::ok(stored.header);
    }
    catch (const MdbError &e)
    {
      return R::err(storage_error(e));
    }
  }

  Result<Unit, StoreError> LmdbCellStore::remove(const Id &id)
  {
    using R = Result<Unit, StoreError>;
    try
    {
      Txn tx(env_.raw(), true);
      if (!del_cell(tx.get(), env_.cells(), id))
        return R::err({StoreError::Kind::CellNotFound, to_string(id)});
      tx.commit();
      return R::ok(Unit{});
    }
    catch (const MdbError &e)
    {
      return R::err(storage_error(e));
    }
  }

  Result<std::unique_ptr<BufferedCellTxn>, StoreError> LmdbCellStore::begin()
  {
    using R = Result<std::unique_ptr<BufferedCellTxn>, StoreError>;
    try
    {
      return R::ok(std::make_unique<LmdbCellTxn>(env_));
    }
    catch (const MdbError &e)
    {
      return R::err(storage_error(e));
    }
  }

  Result<CommitStatus, StoreError> LmdbCellStore::commit(const CommitBatch &batch)
  {
    using R = Result<CommitStatus, StoreError>;
    try
    {
      Txn tx(env_.raw(), true);
      for (const auto &r : batch.reads)
      {
        if (current_version(tx.get(), env_.cells(), r.id) != r.version)
          return R::ok(CommitStatus::Conflict);
      }
      for (const auto &w : batch.writes)
      {
        if (!w.cell)
        {
          del_cell(tx.get(), env_.cells(), w.id);
          continue;
        }
        Cell stored = *w.cell;
        stored.header.id = w.id;
        stored.header.version = next_version(tx.get(), env_.meta(), current_version(tx.get(), env_.cells(), w.id));
        put_cell(tx.get(), env_.cells(), stored);
      }
      if (!batch.writes.empty())
        tx.commit();
      return R::ok(CommitStatus::Committed);
    }
    catch (const MdbError &e)
    {
      return R::err(storage_error(e));
    }
  }

} // namespace morpheus

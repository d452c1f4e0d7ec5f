#pragma once
#include "types.hpp"
#include "errors.hpp"
#include "outcome.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <type_traits>
#include <vector>
#include <kj/debug.h>

namespace morpheus
{

  class Env;

  enum class WriteMode : uint8_t
  {
    Upsert = 0,
    Insert = 1 // fail with CellAlreadyExists instead of overwriting
  };

  enum class CommitStatus : uint8_t
  {
    Committed = 0,
    Conflict = 1
  };

  struct CellStoreOptions
  {
    uint32_t maxAttempts{16}; // closure runs per transaction() call
  };

  // version a transaction observed for a cell; 0 = absent. Versions grow
  // across the whole store and are never reused, even for a recreated cell.
  struct ReadVersion
  {
    Id id{};
    uint64_t version{0};
  };

  // buffered mutation; an empty cell removes `id`
  struct WriteOp
  {
    Id id{};
    std::optional<Cell> cell{};
  };

  struct CommitBatch
  {
    std::vector<ReadVersion> reads{};
    std::vector<WriteOp> writes{};
  };

  // Scoped view of the store inside one transaction attempt.
  class CellTxn
  {
  public:
    virtual ~CellTxn() = default;

    // nullopt when the cell does not exist in this transaction's view
    virtual TxnOutcome<std::optional<Cell>, StoreError> read(const Id &id) = 0;
    // writes and removals become visible to later reads of the same
    // transaction and reach the store only on commit
    virtual void write(const Cell &cell) = 0;
    virtual void remove(const Id &id) = 0;
  };

  // Optimistic transaction: remembers the version of every cell it read and
  // buffers every mutation until commit.
  class BufferedCellTxn : public CellTxn
  {
  public:
    TxnOutcome<std::optional<Cell>, StoreError> read(const Id &id) override;
    void write(const Cell &cell) override;
    void remove(const Id &id) override;

    CommitBatch batch() const;
    bool hasWrites() const { return !writes_.empty(); }

    // drops any snapshot the transaction holds; called before commit
    virtual void release() noexcept {}

  protected:
    // committed state of `id`; nullopt when absent
    virtual Result<std::optional<Cell>, StoreError> fetch(const Id &id) = 0;

  private:
    std::map<Id, uint64_t> reads_;
    std::map<Id, std::optional<Cell>> writes_;
  };

  // Versioned cell store capability, local or remote.
  class CellStore
  {
  public:
    explicit CellStore(CellStoreOptions options = {}) : options_(options) {}
    virtual ~CellStore() = default;

    // CellNotFound when absent
    virtual Result<Cell, StoreError> read(const Id &id) = 0;
    virtual Result<CellHeader, StoreError> write(const Cell &cell, WriteMode mode = WriteMode::Upsert) = 0;
    // CellNotFound when absent
    virtual Result<Unit, StoreError> remove(const Id &id) = 0;

    virtual Result<std::unique_ptr<BufferedCellTxn>, StoreError> begin() = 0;
    // validates the read versions and applies the writes atomically
    virtual Result<CommitStatus, StoreError> commit(const CommitBatch &batch) = 0;

    // Runs `fn` inside a transaction and commits its writes. On a commit
    // conflict, or when `fn` asks for a retry, the closure is run again with a
    // fresh transaction, up to options().maxAttempts times; after that the
    // Retry outcome is handed back to the caller. `fn` must therefore be safe
    // to run more than once and is always invoked as const.
    template <typename F>
    auto transaction(const F &fn) -> std::invoke_result_t<const F &, CellTxn &>;

    const CellStoreOptions &options() const { return options_; }

  protected:
    CellStoreOptions options_;
  };

  class LmdbCellStore final : public CellStore
  {
  public:
    explicit LmdbCellStore(Env &env, CellStoreOptions options = {});

    Result<Cell, StoreError> read(const Id &id) override;
    Result<CellHeader, StoreError> write(const Cell &cell, WriteMode mode = WriteMode::Upsert) override;
    Result<Unit, StoreError> remove(const Id &id) override;
    Result<std::unique_ptr<BufferedCellTxn>, StoreError> begin() override;
    Result<CommitStatus, StoreError> commit(const CommitBatch &batch) override;

  private:
    Env &env_;
  };

  // reads `id` inside `txn`, reporting store failures as graph errors
  TxnOutcome<std::optional<Cell>, GraphError> txn_read(CellTxn &txn, const Id &id);

  // -------------------- transaction driver ---------------------------

  template <typename F>
  auto CellStore::transaction(const F &fn) -> std::invoke_result_t<const F &, CellTxn &>
  {
    using Out = std::invoke_result_t<const F &, CellTxn &>;
    std::string lastReason = "no attempt made";
    for (uint32_t attempt = 1; attempt <= options_.maxAttempts; ++attempt)
    {
      auto begun = begin();
      if (!begun.isOk())
        return Out::fatal(begun.error());
      std::unique_ptr<BufferedCellTxn> txn = std::move(begun).value();

      auto out = fn(static_cast<CellTxn &>(*txn));
      txn->release();
      if (out.isRetry())
      {
        lastReason = out.reason();
        KJ_LOG(INFO, "transaction aborted, retrying", attempt, lastReason.c_str());
        continue;
      }
      if (out.isFatal())
      {
        // a failure computed from reads that changed since is retried
        auto checked = commit(CommitBatch{txn->batch().reads, {}});
        if (checked.isOk() && checked.value() == CommitStatus::Conflict)
        {
          lastReason = "reads changed before failure";
          KJ_LOG(INFO, "transaction failed on stale reads, retrying", attempt);
          continue;
        }
        return out;
      }

      auto committed = commit(txn->batch());
      if (!committed.isOk())
        return Out::fatal(committed.error());
      if (committed.value() == CommitStatus::Committed)
        return out;
      lastReason = "commit conflict";
      KJ_LOG(INFO, "transaction conflict, retrying", attempt);
    }
    KJ_LOG(WARNING, "transaction retries exhausted", options_.maxAttempts, lastReason.c_str());
    return Out::retry(lastReason);
  }

} // namespace morpheus

#include "test_support.hpp"
#include "codec.hpp"
#include "encode.hpp"
#include <gtest/gtest.h>
#include <lmdb.h>

using namespace morpheus;
using morpheus::testing::TempStore;

namespace
{

  Cell makeCell(const Id &id, int64_t n)
  {
    Cell c{};
    c.header.schema = 3000;
    c.header.id = id;
    c.data["n"] = n;
    return c;
  }

  int64_t counter(const Cell &c) { return std::get<int64_t>(c.data.at("n")); }

} // namespace

TEST(CellStore, WriteBumpsVersion)
{
  TempStore db;
  Id id{1, 1};
  auto first = db.store.write(makeCell(id, 1));
  ASSERT_TRUE(first.isOk());
  EXPECT_EQ(first.value().version, 1u);
  auto second = db.store.write(makeCell(id, 2));
  ASSERT_TRUE(second.isOk());
  EXPECT_EQ(second.value().version, 2u);

  auto read = db.store.read(id);
  ASSERT_TRUE(read.isOk());
  EXPECT_EQ(read.value().header.version, 2u);
  EXPECT_EQ(read.value().header.schema, 3000u);
  EXPECT_EQ(counter(read.value()), 2);
}

TEST(CellStore, InsertRefusesExistingCell)
{
  TempStore db;
  Id id{1, 2};
  ASSERT_TRUE(db.store.write(makeCell(id, 1), WriteMode::Insert).isOk());
  auto again = db.store.write(makeCell(id, 2), WriteMode::Insert);
  ASSERT_FALSE(again.isOk());
  EXPECT_EQ(again.error().kind, StoreError::Kind::CellAlreadyExists);
  EXPECT_EQ(counter(db.store.read(id).value()), 1);
}

TEST(CellStore, MissingCells)
{
  TempStore db;
  auto read = db.store.read(Id{9, 9});
  ASSERT_FALSE(read.isOk());
  EXPECT_EQ(read.error().kind, StoreError::Kind::CellNotFound);
  auto removed = db.store.remove(Id{9, 9});
  ASSERT_FALSE(removed.isOk());
  EXPECT_EQ(removed.error().kind, StoreError::Kind::CellNotFound);
}

TEST(CellStore, TransactionReadsItsOwnWrites)
{
  TempStore db;
  Id id{1, 3};
  auto out = db.store.transaction([&](CellTxn &txn) -> TxnOutcome<int64_t, StoreError>
                                  {
    auto before = txn.read(id);
    if (!before.isOk()) return before.as<int64_t>();
    if (before.value()) return TxnOutcome<int64_t, StoreError>::fatal({StoreError::Kind::Storage, "unexpected cell"});
    txn.write(makeCell(id, 5));
    auto after = txn.read(id);
    if (!after.isOk()) return after.as<int64_t>();
    txn.remove(id);
    auto gone = txn.read(id);
    if (!gone.isOk()) return gone.as<int64_t>();
    if (gone.value()) return TxnOutcome<int64_t, StoreError>::fatal({StoreError::Kind::Storage, "remove not visible"});
    txn.write(makeCell(id, 6));
    return TxnOutcome<int64_t, StoreError>::ok(counter(*after.value())); });
  ASSERT_TRUE(out.isOk());
  EXPECT_EQ(out.value(), 5);
  EXPECT_EQ(counter(db.store.read(id).value()), 6);
}

TEST(CellStore, StaleCommitConflicts)
{
  TempStore db;
  Id id{1, 4};
  ASSERT_TRUE(db.store.write(makeCell(id, 1)).isOk());

  auto begun = db.store.begin();
  ASSERT_TRUE(begun.isOk());
  auto txn = std::move(begun).value();
  auto seen = txn->read(id);
  ASSERT_TRUE(seen.isOk());
  txn->write(makeCell(id, counter(*seen.value()) + 1));
  txn->release();

  ASSERT_TRUE(db.store.write(makeCell(id, 10)).isOk());

  auto committed = db.store.commit(txn->batch());
  ASSERT_TRUE(committed.isOk());
  EXPECT_EQ(committed.value(), CommitStatus::Conflict);
  EXPECT_EQ(counter(db.store.read(id).value()), 10);
}

TEST(CellStore, AbsentReadConflictsWithLaterCreate)
{
  TempStore db;
  Id id{1, 5};
  auto txn = db.store.begin().value();
  auto seen = txn->read(id);
  ASSERT_TRUE(seen.isOk());
  EXPECT_FALSE(seen.value().has_value());
  txn->write(makeCell(id, 1));
  txn->release();

  ASSERT_TRUE(db.store.write(makeCell(id, 7)).isOk());
  auto committed = db.store.commit(txn->batch());
  ASSERT_TRUE(committed.isOk());
  EXPECT_EQ(committed.value(), CommitStatus::Conflict);
}

TEST(CellStore, TransactionRetriesAfterConflict)
{
  TempStore db;
  Id id{1, 6};
  ASSERT_TRUE(db.store.write(makeCell(id, 1)).isOk());

  int attempts = 0;
  auto out = db.store.transaction([&](CellTxn &txn) -> TxnOutcome<Unit, StoreError>
                                  {
    ++attempts;
    auto cur = txn.read(id);
    if (!cur.isOk()) return cur.as<Unit>();
    // a competing writer lands between our read and our commit
    if (attempts == 1) {
      auto w = db.store.write(makeCell(id, 100));
      if (!w.isOk()) return TxnOutcome<Unit, StoreError>::fatal(w.error());
    }
    txn.write(makeCell(id, counter(*cur.value()) + 1));
    return TxnOutcome<Unit, StoreError>::ok(Unit{}); });
  ASSERT_TRUE(out.isOk());
  EXPECT_EQ(attempts, 2);
  EXPECT_EQ(counter(db.store.read(id).value()), 101);
}

TEST(CellStore, ExhaustedRetriesReachTheCaller)
{
  TempStore db(CellStoreOptions{3});
  int attempts = 0;
  auto out = db.store.transaction([&](CellTxn &) -> TxnOutcome<Unit, StoreError>
                                  {
    ++attempts;
    return TxnOutcome<Unit, StoreError>::retry("always busy"); });
  ASSERT_TRUE(out.isRetry());
  EXPECT_EQ(out.reason(), "always busy");
  EXPECT_EQ(attempts, 3);
}

TEST(CellStore, FatalOutcomeDiscardsWrites)
{
  TempStore db;
  Id id{1, 7};
  auto out = db.store.transaction([&](CellTxn &txn) -> TxnOutcome<Unit, StoreError>
                                  {
    txn.write(makeCell(id, 1));
    return TxnOutcome<Unit, StoreError>::fatal({StoreError::Kind::Storage, "stop"}); });
  ASSERT_TRUE(out.isFatal());
  EXPECT_FALSE(db.store.read(id).isOk());
}

TEST(CellStore, RecreatedCellNeverRepeatsAVersion)
{
  TempStore db;
  Id id{1, 8};
  auto first = db.store.write(makeCell(id, 1));
  ASSERT_TRUE(first.isOk());

  auto txn = db.store.begin().value();
  auto seen = txn->read(id);
  ASSERT_TRUE(seen.isOk());
  ASSERT_TRUE(seen.value().has_value());
  txn->write(makeCell(id, counter(*seen.value()) + 1));
  txn->release();

  ASSERT_TRUE(db.store.remove(id).isOk());
  auto recreated = db.store.write(makeCell(id, 50), WriteMode::Insert);
  ASSERT_TRUE(recreated.isOk());
  EXPECT_GT(recreated.value().version, first.value().version);

  auto committed = db.store.commit(txn->batch());
  ASSERT_TRUE(committed.isOk());
  EXPECT_EQ(committed.value(), CommitStatus::Conflict);
  EXPECT_EQ(counter(db.store.read(id).value()), 50);
}

TEST(CellStore, RecreatedCellConflictsInsideTransactions)
{
  TempStore db;
  Id id{1, 9};
  ASSERT_TRUE(db.store.write(makeCell(id, 1)).isOk());

  int attempts = 0;
  auto out = db.store.transaction([&](CellTxn &txn) -> TxnOutcome<Unit, StoreError>
                                  {
    ++attempts;
    auto cur = txn.read(id);
    if (!cur.isOk()) return cur.as<Unit>();
    if (attempts == 1) {
      // removed and created again before this attempt commits
      auto removed = db.store.remove(id);
      if (!removed.isOk()) return TxnOutcome<Unit, StoreError>::fatal(removed.error());
      auto created = db.store.write(makeCell(id, 100), WriteMode::Insert);
      if (!created.isOk()) return TxnOutcome<Unit, StoreError>::fatal(created.error());
    }
    txn.write(makeCell(id, counter(*cur.value()) + 1));
    return TxnOutcome<Unit, StoreError>::ok(Unit{}); });
  ASSERT_TRUE(out.isOk());
  EXPECT_EQ(attempts, 2);
  EXPECT_EQ(counter(db.store.read(id).value()), 101);
}

TEST(CellStore, FailureOnStaleReadsIsRetried)
{
  TempStore db;
  Id id{1, 10};
  ASSERT_TRUE(db.store.write(makeCell(id, 1)).isOk());

  int attempts = 0;
  auto out = db.store.transaction([&](CellTxn &txn) -> TxnOutcome<int64_t, StoreError>
                                  {
    ++attempts;
    auto cur = txn.read(id);
    if (!cur.isOk()) return cur.as<int64_t>();
    if (!cur.value()) return TxnOutcome<int64_t, StoreError>::fatal({StoreError::Kind::CellNotFound, "cell vanished"});
    if (attempts == 1) {
      // the view this attempt judged by is overwritten before it reports
      auto w = db.store.write(makeCell(id, 2));
      if (!w.isOk()) return TxnOutcome<int64_t, StoreError>::fatal(w.error());
      return TxnOutcome<int64_t, StoreError>::fatal({StoreError::Kind::Storage, "inconsistent view"});
    }
    return TxnOutcome<int64_t, StoreError>::ok(counter(*cur.value())); });
  ASSERT_TRUE(out.isOk());
  EXPECT_EQ(attempts, 2);
  EXPECT_EQ(out.value(), 2);
}

TEST(CellStore, FailureOnCurrentReadsIsFinal)
{
  TempStore db;
  Id id{1, 11};
  ASSERT_TRUE(db.store.write(makeCell(id, 1)).isOk());

  int attempts = 0;
  auto out = db.store.transaction([&](CellTxn &txn) -> TxnOutcome<Unit, StoreError>
                                  {
    ++attempts;
    auto cur = txn.read(id);
    if (!cur.isOk()) return cur.as<Unit>();
    return TxnOutcome<Unit, StoreError>::fatal({StoreError::Kind::Storage, "rejected"}); });
  ASSERT_TRUE(out.isFatal());
  EXPECT_EQ(out.error().message, "rejected");
  EXPECT_EQ(attempts, 1);
}

TEST(CellStore, KeyIdsAreDeterministic)
{
  EXPECT_EQ(encode_cell_key(1024, std::string("alice")), encode_cell_key(1024, std::string("alice")));
  EXPECT_NE(encode_cell_key(1024, std::string("alice")), encode_cell_key(1025, std::string("alice")));
  EXPECT_NE(encode_cell_key(1024, std::string("alice")), encode_cell_key(1024, std::string("bob")));
  EXPECT_FALSE(random_id(1024).isUnit());
}

TEST(CellStore, RefusesForeignFormatVersion)
{
  std::filesystem::path dir(morpheus::testing::uniqueTempPath("morpheus-test-db-"));
  std::filesystem::create_directories(dir);
  {
    Env env(dir, size_t(16) << 20);
    Txn tx(env.raw(), true);
    auto key = key_meta_format_version();
    std::string val;
    put_be32(val, kFormatVersion + 1);
    MDB_val k{key.size(), key.data()}, v{val.size(), val.data()};
    ASSERT_EQ(mdb_put(tx.get(), env.meta(), &k, &v, 0), 0);
    tx.commit();
  }
  EXPECT_THROW({ Env reopened(dir, size_t(16) << 20); }, MdbError);
  std::filesystem::remove_all(dir);
}

#pragma once
#include "cell_store.hpp"
#include "fields.hpp"
#include <cstdint>
#include <utility>
#include <vector>

namespace morpheus
{

  struct IdListPolicy
  {
    uint32_t segmentCapacity{128};   // members per segment cell
    bool reclaimEmptySegments{true}; // unlink non-head segments emptied by remove
  };

  // One cell of an id list chain. `tail` and `seq` are kept on the head only.
  struct Segment
  {
    Id id{};
    IdArray members{};
    Id next{};
    Id tail{};
    int64_t seq{0};
  };

  // Ordered membership for one (owner, direction, edge schema) key, chained
  // over as many segment cells as its size needs. Every call works inside the
  // transaction the list was opened with.
  class IdList
  {
  public:
    IdList(CellTxn &txn, const Id &owner, EdgeDirection direction, uint32_t edgeSchema, IdListPolicy policy = {});

    static Id headId(const Id &owner, EdgeDirection direction, uint32_t edgeSchema);
    const Id &head() const { return head_; }

    TxnOutcome<IdArray, GraphError> all();
    TxnOutcome<uint64_t, GraphError> size();
    TxnOutcome<Unit, GraphError> append(const Id &member);
    // removes the first occurrence; ListMemberNotFound when absent
    TxnOutcome<Unit, GraphError> remove(const Id &member);
    // deletes every segment of the list
    TxnOutcome<Unit, GraphError> clear();

    // the chain from head to tail; empty when the list was never written
    TxnOutcome<std::vector<Segment>, GraphError> segments();

  private:
    TxnOutcome<std::optional<Segment>, GraphError> readSegment(const Id &id);
    void writeSegment(const Segment &seg);

    CellTxn &txn_;
    IdListPolicy policy_;
    Id head_;
  };

  // Per-vertex, per-direction index of the id lists that exist for it, keyed
  // by edge schema. A vertex's adjacency handle points at this cell.
  class TypeList
  {
  public:
    using Entry = std::pair<uint32_t, Id>; // edge schema, id list head

    TypeList(CellTxn &txn, const Id &id) : txn_(txn), id_(id) {}

    static Id idFor(const Id &owner, EdgeDirection direction);

    // empty when the type list cell does not exist
    TxnOutcome<std::vector<Entry>, GraphError> entries();
    // records `listHead` under `edgeSchema`, creating the cell when needed
    TxnOutcome<Unit, GraphError> ensure(uint32_t edgeSchema, const Id &listHead);
    void drop() { txn_.remove(id_); }

  private:
    CellTxn &txn_;
    Id id_;
  };

} // namespace morpheus

#include "id_list.hpp"
#include "codec.hpp"
#include <algorithm>
#include <set>
#include <kj/debug.h>

namespace morpheus
{

  const char *to_string(EdgeDirection d)
  {
    switch (d)
    {
    case EdgeDirection::Inbound:
      return "inbound";
    case EdgeDirection::Outbound:
      return "outbound";
    case EdgeDirection::Undirected:
      return "undirected";
    }
    return "unknown";
  }

  namespace
  {

    GraphError corrupted(const Id &id, const char *what)
    {
      KJ_LOG(WARNING, "corrupt adjacency cell", to_string(id).c_str(), what);
      return GraphError(ErrorKind::ListCorrupted, to_string(id) + ": " + what);
    }

    template <typename T>
    const T *field(const Cell &cell, const char *name)
    {
      auto it = cell.data.find(name);
      if (it == cell.data.end())
        return nullptr;
      return std::get_if<T>(&it->second);
    }

  } // namespace

  // -------------------- id list --------------------

  IdList::IdList(CellTxn &txn, const Id &owner, EdgeDirection direction, uint32_t edgeSchema, IdListPolicy policy)
      : txn_(txn), policy_(policy), head_(headId(owner, direction, edgeSchema))
  {
    if (policy_.segmentCapacity == 0)
      policy_.segmentCapacity = 1;
  }

  Id IdList::headId(const Id &owner, EdgeDirection direction, uint32_t edgeSchema)
  {
    return derive_id(ID_LIST_SCHEMA_ID, owner, static_cast<uint64_t>(direction), edgeSchema);
  }

  TxnOutcome<std::optional<Segment>, GraphError> IdList::readSegment(const Id &id)
  {
    using Out = TxnOutcome<std::optional<Segment>, GraphError>;
    auto r = txn_read(txn_, id);
    if (!r.isOk())
      return r.as<std::optional<Segment>>();
    const auto &cell = r.value();
    if (!cell)
      return Out::ok(std::nullopt);
    if (cell->header.schema != ID_LIST_SCHEMA_ID)
      return Out::fatal(corrupted(id, "segment has a foreign schema"));

    const auto *members = field<IdArray>(*cell, LIST_FIELD);
    const auto *next = field<Id>(*cell, NEXT_FIELD);
    if (!members || !next)
      return Out::fatal(corrupted(id, "segment misses list or next"));
    Segment seg{};
    seg.id = id;
    seg.members = *members;
    seg.next = *next;
    if (const auto *tail = field<Id>(*cell, TAIL_FIELD))
      seg.tail = *tail;
    if (const auto *seq = field<int64_t>(*cell, SEQ_FIELD))
      seg.seq = *seq;
    return Out::ok(std::move(seg));
  }

  void IdList::writeSegment(const Segment &seg)
  {
    Cell cell{};
    cell.header.schema = ID_LIST_SCHEMA_ID;
    cell.header.id = seg.id;
    cell.data[LIST_FIELD] = seg.members;
    cell.data[NEXT_FIELD] = seg.next;
    if (seg.id == head_)
    {
      cell.data[TAIL_FIELD] = seg.tail;
      cell.data[SEQ_FIELD] = seg.seq;
    }
    txn_.write(cell);
  }

  TxnOutcome<std::vector<Segment>, GraphError> IdList::segments()
  {
    using Out = TxnOutcome<std::vector<Segment>, GraphError>;
    std::vector<Segment> chain;
    std::set<Id> visited;
    Id cursor = head_;
    while (!cursor.isUnit())
    {
      if (!visited.insert(cursor).second)
        return Out::fatal(corrupted(cursor, "segment chain loops"));
      auto seg = readSegment(cursor);
      if (!seg.isOk())
        return seg.as<std::vector<Segment>>();
      if (!seg.value())
      {
        if (cursor == head_)
          return Out::ok(std::move(chain));
        return Out::fatal(corrupted(cursor, "segment chain points at a missing cell"));
      }
      cursor = seg.value()->next;
      chain.push_back(std::move(*seg.value()));
    }
    return Out::ok(std::move(chain));
  }

  TxnOutcome<IdArray, GraphError> IdList::all()
  {
    using Out = TxnOutcome<IdArray, GraphError>;
    auto chain = segments();
    if (!chain.isOk())
      return chain.as<IdArray>();
    IdArray out;
    for (const auto &seg : chain.value())
      out.insert(out.end(), seg.members.begin(), seg.members.end());
    return Out::ok(std::move(out));
  }

  TxnOutcome<uint64_t, GraphError> IdList::size()
  {
    using Out = TxnOutcome<uint64_t, GraphError>;
    auto chain = segments();
    if (!chain.isOk())
      return chain.as<uint64_t>();
    uint64_t n = 0;
    for (const auto &seg : chain.value())
      n += seg.members.size();
    return Out::ok(n);
  }

  TxnOutcome<Unit, GraphError> IdList::append(const Id &member)
  {
    using Out = TxnOutcome<Unit, GraphError>;
    auto headRead = readSegment(head_);
    if (!headRead.isOk())
      return headRead.as<Unit>();
    if (!headRead.value())
    {
      Segment fresh{};
      fresh.id = head_;
      fresh.members.push_back(member);
      fresh.tail = head_;
      writeSegment(fresh);
      return Out::ok(Unit{});
    }

    Segment &head = *headRead.value();
    Id tailId = head.tail.isUnit() ? head_ : head.tail;
    std::optional<Segment> tailRead;
    if (tailId != head_)
    {
      auto r = readSegment(tailId);
      if (!r.isOk())
        return r.as<Unit>();
      if (!r.value())
        return Out::fatal(corrupted(tailId, "tail segment is missing"));
      tailRead = std::move(r.value());
    }
    Segment &tail = tailRead ? *tailRead : head;
    if (!tail.next.isUnit())
      return Out::fatal(corrupted(tailId, "tail segment has a successor"));

    if (tail.members.size() < policy_.segmentCapacity)
    {
      tail.members.push_back(member);
      writeSegment(tail);
      return Out::ok(Unit{});
    }

    // tail is full: chain a new segment behind it
    head.seq += 1;
    Segment grown{};
    grown.id = derive_id(ID_LIST_SCHEMA_ID, head_, static_cast<uint64_t>(head.seq));
    grown.members.push_back(member);
    tail.next = grown.id;
    head.tail = grown.id;
    writeSegment(grown);
    if (tailRead)
      writeSegment(tail);
    writeSegment(head);
    return Out::ok(Unit{});
  }

  TxnOutcome<Unit, GraphError> IdList::remove(const Id &member)
  {
    using Out = TxnOutcome<Unit, GraphError>;
    auto chainRead = segments();
    if (!chainRead.isOk())
      return chainRead.as<Unit>();
    auto &chain = chainRead.value();

    for (size_t i = 0; i < chain.size(); ++i)
    {
      auto &members = chain[i].members;
      auto it = std::find(members.begin(), members.end(), member);
      if (it == members.end())
        continue;
      members.erase(it);

      if (i == 0 || !members.empty() || !policy_.reclaimEmptySegments)
      {
        writeSegment(chain[i]);
        return Out::ok(Unit{});
      }

      // unlink the emptied segment; chain[0] is the head
      Segment &prev = chain[i - 1];
      prev.next = chain[i].next;
      if (chain[0].tail == chain[i].id)
        chain[0].tail = prev.id;
      writeSegment(prev);
      if (i - 1 != 0)
        writeSegment(chain[0]);
      txn_.remove(chain[i].id);
      return Out::ok(Unit{});
    }
    return Out::fatal(GraphError(ErrorKind::ListMemberNotFound, to_string(member)));
  }

  TxnOutcome<Unit, GraphError> IdList::clear()
  {
    using Out = TxnOutcome<Unit, GraphError>;
    auto chain = segments();
    if (!chain.isOk())
      return chain.as<Unit>();
    for (const auto &seg : chain.value())
      txn_.remove(seg.id);
    return Out::ok(Unit{});
  }

  // -------------------- type list --------------------

  Id TypeList::idFor(const Id &owner, EdgeDirection direction)
  {
    return derive_id(TYPE_LIST_SCHEMA_ID, owner, static_cast<uint64_t>(direction));
  }

  TxnOutcome<std::vector<TypeList::Entry>, GraphError> TypeList::entries()
  {
    using Out = TxnOutcome<std::vector<Entry>, GraphError>;
    auto r = txn_read(txn_, id_);
    if (!r.isOk())
      return r.as<std::vector<Entry>>();
    std::vector<Entry> out;
    const auto &cell = r.value();
    if (!cell)
      return Out::ok(std::move(out));
    if (cell->header.schema != TYPE_LIST_SCHEMA_ID)
      return Out::fatal(corrupted(id_, "type list has a foreign schema"));
    const auto *types = field<IntArray>(*cell, TYPES_FIELD);
    const auto *lists = field<IdArray>(*cell, LISTS_FIELD);
    if (!types || !lists || types->size() != lists->size())
      return Out::fatal(corrupted(id_, "type list arrays do not line up"));
    out.reserve(types->size());
    for (size_t i = 0; i < types->size(); ++i)
      out.emplace_back(static_cast<uint32_t>((*types)[i]), (*lists)[i]);
    return Out::ok(std::move(out));
  }

  TxnOutcome<Unit, GraphError> TypeList::ensure(uint32_t edgeSchema, const Id &listHead)
  {
    using Out = TxnOutcome<Unit, GraphError>;
    auto current = entries();
    if (!current.isOk())
      return current.as<Unit>();
    IntArray types;
    IdArray lists;
    for (const auto &[schema, head] : current.value())
    {
      if (schema == edgeSchema)
        return Out::ok(Unit{});
      types.push_back(schema);
      lists.push_back(head);
    }
    types.push_back(edgeSchema);
    lists.push_back(listHead);

    Cell cell{};
    cell.header.schema = TYPE_LIST_SCHEMA_ID;
    cell.header.id = id_;
    cell.data[TYPES_FIELD] = std::move(types);
    cell.data[LISTS_FIELD] = std::move(lists);
    txn_.write(cell);
    return Out::ok(Unit{});
  }

} // namespace morpheus

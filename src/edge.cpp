#include "edge.hpp"
#include "codec.hpp"
#include "vertex.hpp"

namespace morpheus
{

  std::vector<Registration> DirectedEdge::registrations() const
  {
    return {
        Registration{start, EdgeDirection::Outbound, body ? body->id : end},
        Registration{end, EdgeDirection::Inbound, body ? body->id : start},
    };
  }

  std::vector<Registration> UndirectedEdge::registrations() const
  {
    std::vector<Registration> out{Registration{start, EdgeDirection::Undirected, body ? body->id : end}};
    if (end != start)
      out.push_back(Registration{end, EdgeDirection::Undirected, body ? body->id : start});
    return out;
  }

  Id opposite(const Edge &e, const Id &vertex)
  {
    return edge_start(e) == vertex ? edge_end(e) : edge_start(e);
  }

  Result<EdgeAttributes, GraphError> edge_attributes(SchemaCatalog &schemas, uint32_t schemaId)
  {
    using R = Result<EdgeAttributes, GraphError>;
    auto lookup = schemas.schemaType(schemaId);
    if (!lookup.isOk())
      return R::err(GraphError(lookup.error()));
    const auto &type = lookup.value();
    if (!type)
      return R::err(GraphError(ErrorKind::SchemaNotFound, std::to_string(schemaId)));
    if (type->kind != SchemaKind::Edge)
      return R::err(GraphError(ErrorKind::SchemaNotEdge, std::to_string(schemaId)));
    return R::ok(type->edge);
  }

  namespace
  {

    Edge make_edge(EdgeType type, uint32_t schema, const Id &start, const Id &end, std::optional<EdgeBody> body)
    {
      if (type == EdgeType::Directed)
        return DirectedEdge{schema, start, end, std::move(body)};
      return UndirectedEdge{schema, start, end, std::move(body)};
    }

    // Adds `reg.member` to the id list of `reg.vertex`, materializing the
    // vertex's type list handle and the type list entry on first use.
    TxnOutcome<Unit, GraphError> register_member(CellTxn &txn, SchemaCatalog &schemas, const IdListPolicy &policy,
                                                 const Registration &reg, uint32_t schemaId)
    {
      using Out = TxnOutcome<Unit, GraphError>;
      auto read = txn_read(txn, reg.vertex);
      if (!read.isOk())
        return read.as<Unit>();
      if (!read.value())
        return Out::fatal(GraphError(ErrorKind::VertexNotFound, to_string(reg.vertex)));
      Cell &cell = *read.value();
      auto vertex = is_vertex_cell(schemas, cell);
      if (!vertex.isOk())
        return Out::fatal(vertex.error());
      if (!vertex.value())
        return Out::fatal(GraphError(ErrorKind::VertexNotFound, to_string(reg.vertex) + " is not a vertex"));

      Id handle{};
      auto &slot = cell.data[direction_field(reg.direction)];
      if (const auto *id = std::get_if<Id>(&slot))
        handle = *id;
      if (handle.isUnit())
      {
        handle = TypeList::idFor(reg.vertex, reg.direction);
        slot = handle;
        txn.write(cell);
      }

      IdList list(txn, reg.vertex, reg.direction, schemaId, policy);
      auto ensured = TypeList(txn, handle).ensure(schemaId, list.head());
      if (!ensured.isOk())
        return ensured;
      return list.append(reg.member);
    }

  } // namespace

  TxnOutcome<Edge, GraphError> link_edge(CellTxn &txn, SchemaCatalog &schemas, const IdListPolicy &policy,
                                         const Id &from, const Id &to, uint32_t schemaId,
                                         std::optional<Map> body)
  {
    using Out = TxnOutcome<Edge, GraphError>;
    auto attrs = edge_attributes(schemas, schemaId);
    if (!attrs.isOk())
      return Out::fatal(attrs.error());
    if (attrs.value().hasBody && !body)
      return Out::fatal(GraphError(ErrorKind::BodyRequired, std::to_string(schemaId)));
    if (!attrs.value().hasBody && body)
      return Out::fatal(GraphError(ErrorKind::BodyShouldNotExisted, std::to_string(schemaId)));

    std::optional<EdgeBody> edgeBody;
    if (body)
    {
      auto lookup = schemas.getSchema(schemaId);
      if (!lookup.isOk())
        return Out::fatal(GraphError(lookup.error()));
      const auto &schema = lookup.value();
      if (!schema)
        return Out::fatal(GraphError(ErrorKind::SchemaNotFound, std::to_string(schemaId)));
      if (auto why = check_layout(*schema, *body))
        return Out::fatal(GraphError(ErrorKind::CannotGenerateCellByData, *why));

      Cell cell{};
      cell.header.schema = schemaId;
      cell.header.id = random_id(schemaId);
      cell.data = *body;
      cell.data[EDGE_START_FIELD] = from;
      cell.data[EDGE_END_FIELD] = to;
      txn.write(cell);
      edgeBody = EdgeBody{cell.header.id, std::move(*body)};
    }

    Edge edge = make_edge(attrs.value().edgeType, schemaId, from, to, std::move(edgeBody));
    for (const auto &reg : edge_registrations(edge))
    {
      auto r = register_member(txn, schemas, policy, reg, schemaId);
      if (!r.isOk())
        return r.as<Edge>();
    }
    return Out::ok(std::move(edge));
  }

  TxnOutcome<Unit, GraphError> unlink_edge(CellTxn &txn, const IdListPolicy &policy, const Edge &edge)
  {
    using Out = TxnOutcome<Unit, GraphError>;
    for (const auto &reg : edge_registrations(edge))
    {
      IdList list(txn, reg.vertex, reg.direction, edge_schema(edge), policy);
      auto r = list.remove(reg.member);
      if (r.isFatal() && r.error().kind == ErrorKind::ListMemberNotFound)
        return Out::fatal(GraphError(ErrorKind::EdgeNotFound, to_string(reg.vertex) + " does not list " + to_string(reg.member)));
      if (!r.isOk())
        return r;
    }
    if (const auto &body = edge_body(edge))
      txn.remove(body->id);
    return Out::ok(Unit{});
  }

  TxnOutcome<Edge, GraphError> edge_from_member(CellTxn &txn, const Id &vertex, EdgeDirection direction,
                                                uint32_t schemaId, const EdgeAttributes &attrs, const Id &member)
  {
    using Out = TxnOutcome<Edge, GraphError>;
    if (!attrs.hasBody)
    {
      if (direction == EdgeDirection::Inbound)
        return Out::ok(make_edge(attrs.edgeType, schemaId, member, vertex, std::nullopt));
      return Out::ok(make_edge(attrs.edgeType, schemaId, vertex, member, std::nullopt));
    }

    auto read = txn_read(txn, member);
    if (!read.isOk())
      return read.as<Edge>();
    if (!read.value())
      return Out::fatal(GraphError(ErrorKind::EdgeNotFound, "missing edge body " + to_string(member)));
    Cell &cell = *read.value();
    if (cell.header.schema != schemaId)
      return Out::fatal(GraphError(ErrorKind::ListCorrupted, "edge body " + to_string(member) + " has a foreign schema"));

    auto takeId = [&](const char *name) -> std::optional<Id>
    {
      auto it = cell.data.find(name);
      if (it == cell.data.end() || !std::holds_alternative<Id>(it->second))
        return std::nullopt;
      Id id = std::get<Id>(it->second);
      cell.data.erase(it);
      return id;
    };
    auto start = takeId(EDGE_START_FIELD);
    auto end = takeId(EDGE_END_FIELD);
    if (!start || !end)
      return Out::fatal(GraphError(ErrorKind::ListCorrupted, "edge body " + to_string(member) + " misses its endpoints"));
    return Out::ok(make_edge(attrs.edgeType, schemaId, *start, *end, EdgeBody{member, std::move(cell.data)}));
  }

} // namespace morpheus

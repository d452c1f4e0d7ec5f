#include "graph.hpp"
#include "codec.hpp"
#include <set>
#include <utility>
#include <kj/debug.h>

namespace morpheus
{

  // -------------------- transaction --------------------

  GraphTransaction::GraphTransaction(CellTxn &txn, SchemaCatalog &schemas, const GraphOptions &options)
      : txn_(txn), schemas_(schemas), options_(options) {}

  TxnOutcome<Vertex, GraphError> GraphTransaction::newVertex(uint32_t schemaId, Map data)
  {
    return txn_new_vertex(txn_, schemas_, schemaId, std::move(data));
  }

  TxnOutcome<std::optional<Vertex>, GraphError> GraphTransaction::readVertex(const Id &id)
  {
    return txn_read_vertex(txn_, schemas_, id);
  }

  TxnOutcome<std::optional<Vertex>, GraphError> GraphTransaction::getVertex(uint32_t schemaId, const Value &key)
  {
    return txn_read_vertex(txn_, schemas_, encode_cell_key(schemaId, key));
  }

  TxnOutcome<Unit, GraphError> GraphTransaction::requireVertex(const Id &id)
  {
    using Out = TxnOutcome<Unit, GraphError>;
    auto r = txn_read_vertex(txn_, schemas_, id);
    if (!r.isOk())
      return r.as<Unit>();
    if (!r.value())
      return Out::fatal(GraphError(ErrorKind::VertexNotFound, to_string(id)));
    return Out::ok(Unit{});
  }

  TxnOutcome<Unit, GraphError> GraphTransaction::removeVertex(const Id &id)
  {
    using Out = TxnOutcome<Unit, GraphError>;
    auto read = txn_read_vertex(txn_, schemas_, id);
    if (!read.isOk())
      return read.as<Unit>();
    if (!read.value())
      return Out::fatal(GraphError(ErrorKind::VertexNotFound, to_string(id)));
    const Vertex &vertex = *read.value();

    std::set<Id> droppedBodies;
    for (auto direction : {EdgeDirection::Inbound, EdgeDirection::Outbound, EdgeDirection::Undirected})
    {
      const Id &handle = vertex.adjacency().get(direction);
      if (handle.isUnit())
        continue;
      TypeList types(txn_, handle);
      auto entries = types.entries();
      if (!entries.isOk())
        return entries.as<Unit>();

      for (const auto &[schemaId, head] : entries.value())
      {
        auto attrs = edge_attributes(schemas_, schemaId);
        if (!attrs.isOk())
          return Out::fatal(attrs.error());
        IdList list(txn_, id, direction, schemaId, options_.idList);
        if (list.head() != head)
          return Out::fatal(GraphError(ErrorKind::ListCorrupted, std::string(to_string(direction)) + " type list of " + to_string(id) + " points at a foreign list"));
        auto members = list.all();
        if (!members.isOk())
          return members.as<Unit>();

        for (const auto &member : members.value())
        {
          auto edge = edge_from_member(txn_, id, direction, schemaId, attrs.value(), member);
          if (!edge.isOk())
            return edge.as<Unit>();
          // lists of `id` itself go away wholesale below
          for (const auto &reg : edge_registrations(edge.value()))
          {
            if (reg.vertex == id)
              continue;
            IdList other(txn_, reg.vertex, reg.direction, schemaId, options_.idList);
            auto removed = other.remove(reg.member);
            if (!removed.isOk())
              return removed;
          }
          const auto &body = edge_body(edge.value());
          if (body && droppedBodies.insert(body->id).second)
            txn_.remove(body->id);
        }
        auto cleared = list.clear();
        if (!cleared.isOk())
          return cleared;
      }
      types.drop();
    }
    return txn_remove_vertex_cell(txn_, schemas_, id);
  }

  TxnOutcome<Unit, GraphError> GraphTransaction::removeVertexByKey(uint32_t schemaId, const Value &key)
  {
    return removeVertex(encode_cell_key(schemaId, key));
  }

  TxnOutcome<Edge, GraphError> GraphTransaction::link(const Id &from, const Id &to, uint32_t edgeSchemaId,
                                                      std::optional<Map> body)
  {
    return link_edge(txn_, schemas_, options_.idList, from, to, edgeSchemaId, std::move(body));
  }

  TxnOutcome<Unit, GraphError> GraphTransaction::unlink(const Edge &edge)
  {
    return unlink_edge(txn_, options_.idList, edge);
  }

  TxnOutcome<Unit, GraphError> GraphTransaction::collect(std::vector<Edge> &out, const Id &vertex, uint32_t edgeSchemaId,
                                                         const EdgeAttributes &attrs, EdgeDirection direction)
  {
    using Out = TxnOutcome<Unit, GraphError>;
    IdList list(txn_, vertex, direction, edgeSchemaId, options_.idList);
    auto members = list.all();
    if (!members.isOk())
      return members.as<Unit>();
    out.reserve(out.size() + members.value().size());
    for (const auto &member : members.value())
    {
      auto edge = edge_from_member(txn_, vertex, direction, edgeSchemaId, attrs, member);
      if (!edge.isOk())
        return edge.as<Unit>();
      out.push_back(std::move(edge).value());
    }
    return Out::ok(Unit{});
  }

  TxnOutcome<std::vector<Edge>, GraphError> GraphTransaction::neighbourhoods(const Id &vertex, uint32_t edgeSchemaId,
                                                                             EdgeDirection direction)
  {
    using Out = TxnOutcome<std::vector<Edge>, GraphError>;
    auto attrs = edge_attributes(schemas_, edgeSchemaId);
    if (!attrs.isOk())
      return Out::fatal(attrs.error());
    auto exists = requireVertex(vertex);
    if (!exists.isOk())
      return exists.as<std::vector<Edge>>();
    std::vector<Edge> out;
    auto r = collect(out, vertex, edgeSchemaId, attrs.value(), direction);
    if (!r.isOk())
      return r.as<std::vector<Edge>>();
    return Out::ok(std::move(out));
  }

  TxnOutcome<std::vector<Edge>, GraphError> GraphTransaction::neighbourhoods(const Id &vertex, EdgeDirection direction)
  {
    using Out = TxnOutcome<std::vector<Edge>, GraphError>;
    auto read = txn_read_vertex(txn_, schemas_, vertex);
    if (!read.isOk())
      return read.as<std::vector<Edge>>();
    if (!read.value())
      return Out::fatal(GraphError(ErrorKind::VertexNotFound, to_string(vertex)));
    std::vector<Edge> out;
    const Id &handle = read.value()->adjacency().get(direction);
    if (handle.isUnit())
      return Out::ok(std::move(out));

    auto entries = TypeList(txn_, handle).entries();
    if (!entries.isOk())
      return entries.as<std::vector<Edge>>();
    for (const auto &entry : entries.value())
    {
      auto attrs = edge_attributes(schemas_, entry.first);
      if (!attrs.isOk())
        return Out::fatal(attrs.error());
      auto r = collect(out, vertex, entry.first, attrs.value(), direction);
      if (!r.isOk())
        return r.as<std::vector<Edge>>();
    }
    return Out::ok(std::move(out));
  }

  TxnOutcome<uint64_t, GraphError> GraphTransaction::degree(const Id &vertex, uint32_t edgeSchemaId, EdgeDirection direction)
  {
    using Out = TxnOutcome<uint64_t, GraphError>;
    auto attrs = edge_attributes(schemas_, edgeSchemaId);
    if (!attrs.isOk())
      return Out::fatal(attrs.error());
    auto exists = requireVertex(vertex);
    if (!exists.isOk())
      return exists.as<uint64_t>();
    return IdList(txn_, vertex, direction, edgeSchemaId, options_.idList).size();
  }

  // -------------------- facade --------------------

  Result<Unit, SchemaError> Graph::ensureInitialized(SchemaCatalog &schemas)
  {
    auto r = schemas.bootstrap(ID_LIST_SCHEMA_ID, ID_LIST_SCHEMA_NAME, id_list_fields());
    if (!r.isOk())
    {
      KJ_LOG(ERROR, "cannot bootstrap id list schema", r.error().message.c_str());
      return r;
    }
    r = schemas.bootstrap(TYPE_LIST_SCHEMA_ID, TYPE_LIST_SCHEMA_NAME, type_list_fields());
    if (!r.isOk())
      KJ_LOG(ERROR, "cannot bootstrap type list schema", r.error().message.c_str());
    return r;
  }

  Graph::Graph(CellStore &store, SchemaCatalog &schemas, GraphOptions options)
      : store_(store), schemas_(schemas), options_(options)
  {
    for (auto [id, name] : {std::pair{ID_LIST_SCHEMA_ID, ID_LIST_SCHEMA_NAME}, std::pair{TYPE_LIST_SCHEMA_ID, TYPE_LIST_SCHEMA_NAME}})
    {
      auto found = schemas_.getSchema(id);
      if (!found.isOk())
        throw GraphInitError("cannot consult schema catalog: " + found.error().message);
      if (!found.value() || found.value()->name != name)
        throw GraphInitError("adjacency schemas missing; run Graph::ensureInitialized first");
    }
  }

  Result<uint32_t, SchemaError> Graph::defineVertexSchema(MorpheusSchema schema)
  {
    schema.type = SchemaType::vertex();
    return schemas_.registerSchema(schema);
  }

  Result<uint32_t, SchemaError> Graph::defineEdgeSchema(MorpheusSchema schema, EdgeAttributes attrs)
  {
    schema.type = SchemaType::edgeOf(attrs);
    return schemas_.registerSchema(schema);
  }

  Result<Vertex, GraphError> Graph::newVertex(uint32_t schemaId, Map data)
  {
    using R = Result<Vertex, GraphError>;
    auto cell = vertex_to_cell(schemas_, Vertex::create(schemaId, std::move(data)));
    if (!cell.isOk())
      return R::err(cell.error());
    auto header = store_.write(cell.value(), WriteMode::Insert);
    if (!header.isOk())
      return R::err(GraphError(header.error()));
    cell.value().header = header.value();
    return R::ok(cell_to_vertex(std::move(cell).value()));
  }

  Result<std::optional<Vertex>, GraphError> Graph::readVertex(const Id &id)
  {
    using R = Result<std::optional<Vertex>, GraphError>;
    auto cell = store_.read(id);
    if (!cell.isOk())
    {
      if (cell.error().kind == StoreError::Kind::CellNotFound)
        return R::ok(std::nullopt);
      return R::err(GraphError(cell.error()));
    }
    auto vertex = is_vertex_cell(schemas_, cell.value());
    if (!vertex.isOk())
      return R::err(vertex.error());
    if (!vertex.value())
      return R::ok(std::nullopt);
    return R::ok(cell_to_vertex(std::move(cell).value()));
  }

  Result<std::optional<Vertex>, GraphError> Graph::getVertex(uint32_t schemaId, const Value &key)
  {
    return readVertex(encode_cell_key(schemaId, key));
  }

  TxnOutcome<Unit, GraphError> Graph::removeVertex(const Id &id)
  {
    return transaction([&](GraphTransaction &txn) { return txn.removeVertex(id); });
  }

  TxnOutcome<Unit, GraphError> Graph::removeVertexByKey(uint32_t schemaId, const Value &key)
  {
    return removeVertex(encode_cell_key(schemaId, key));
  }

} // namespace morpheus

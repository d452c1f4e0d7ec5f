#include "vertex.hpp"
#include "codec.hpp"

namespace morpheus
{

  Vertex Vertex::create(uint32_t schemaId, Map data)
  {
    Vertex v{};
    v.schema_ = schemaId;
    v.data_ = std::move(data);
    return v;
  }

  Result<Cell, GraphError> vertex_to_cell(SchemaCatalog &schemas, const Vertex &vertex)
  {
    using R = Result<Cell, GraphError>;
    auto lookup = schemas.getSchema(vertex.schema_);
    if (!lookup.isOk())
      return R::err(GraphError(lookup.error()));
    const auto &schema = lookup.value();
    if (!schema)
      return R::err(GraphError(ErrorKind::SchemaNotFound, std::to_string(vertex.schema_)));
    if (schema->type.kind != SchemaKind::Vertex)
      return R::err(GraphError(ErrorKind::SchemaNotVertex, schema->name));
    if (auto why = check_layout(*schema, vertex.data_))
      return R::err(GraphError(ErrorKind::CannotGenerateCellByData, *why));

    Cell cell{};
    cell.header.schema = vertex.schema_;
    cell.header.id = vertex.id_;
    if (cell.header.id.isUnit())
    {
      if (schema->keyField.empty())
        cell.header.id = random_id(vertex.schema_);
      else
        cell.header.id = encode_cell_key(vertex.schema_, vertex.data_.at(schema->keyField));
    }
    cell.data = vertex.data_;
    cell.data[INBOUND_FIELD] = vertex.adjacency_.inbound;
    cell.data[OUTBOUND_FIELD] = vertex.adjacency_.outbound;
    cell.data[UNDIRECTED_FIELD] = vertex.adjacency_.undirected;
    return R::ok(std::move(cell));
  }

  Vertex cell_to_vertex(Cell cell)
  {
    Vertex v{};
    v.id_ = cell.header.id;
    v.schema_ = cell.header.schema;
    auto take = [&](const char *name, Id &out)
    {
      auto it = cell.data.find(name);
      if (it == cell.data.end())
        return;
      if (const auto *id = std::get_if<Id>(&it->second))
        out = *id;
      cell.data.erase(it);
    };
    take(INBOUND_FIELD, v.adjacency_.inbound);
    take(OUTBOUND_FIELD, v.adjacency_.outbound);
    take(UNDIRECTED_FIELD, v.adjacency_.undirected);
    v.data_ = std::move(cell.data);
    return v;
  }

  Result<bool, GraphError> is_vertex_cell(SchemaCatalog &schemas, const Cell &cell)
  {
    using R = Result<bool, GraphError>;
    auto type = schemas.schemaType(cell.header.schema);
    if (!type.isOk())
      return R::err(GraphError(type.error()));
    return R::ok(type.value() && type.value()->kind == SchemaKind::Vertex);
  }

  // -------------------- transactional primitives --------------------

  TxnOutcome<std::optional<Vertex>, GraphError> txn_read_vertex(CellTxn &txn, SchemaCatalog &schemas, const Id &id)
  {
    using Out = TxnOutcome<std::optional<Vertex>, GraphError>;
    auto r = txn_read(txn, id);
    if (!r.isOk())
      return r.as<std::optional<Vertex>>();
    if (!r.value())
      return Out::ok(std::nullopt);
    auto vertex = is_vertex_cell(schemas, *r.value());
    if (!vertex.isOk())
      return Out::fatal(vertex.error());
    if (!vertex.value())
      return Out::ok(std::nullopt);
    return Out::ok(cell_to_vertex(std::move(*r.value())));
  }

  TxnOutcome<Vertex, GraphError> txn_new_vertex(CellTxn &txn, SchemaCatalog &schemas, uint32_t schemaId, Map data)
  {
    using Out = TxnOutcome<Vertex, GraphError>;
    auto cell = vertex_to_cell(schemas, Vertex::create(schemaId, std::move(data)));
    if (!cell.isOk())
      return Out::fatal(cell.error());
    auto existing = txn_read(txn, cell.value().header.id);
    if (!existing.isOk())
      return existing.as<Vertex>();
    if (existing.value())
      return Out::fatal(GraphError(ErrorKind::VertexAlreadyExists, to_string(cell.value().header.id)));
    txn.write(cell.value());
    return Out::ok(cell_to_vertex(std::move(cell).value()));
  }

  TxnOutcome<Unit, GraphError> txn_replace_vertex(CellTxn &txn, SchemaCatalog &schemas,
                                                  const Vertex &stored, Vertex replacement)
  {
    using Out = TxnOutcome<Unit, GraphError>;
    if (replacement.schema_ != stored.schema_)
      return Out::fatal(GraphError(ErrorKind::CannotGenerateCellByData, "update may not change the vertex schema"));
    replacement.id_ = stored.id_;
    replacement.adjacency_ = stored.adjacency_;
    auto cell = vertex_to_cell(schemas, replacement);
    if (!cell.isOk())
      return Out::fatal(cell.error());
    txn.write(cell.value());
    return Out::ok(Unit{});
  }

  TxnOutcome<Unit, GraphError> txn_remove_vertex_cell(CellTxn &txn, SchemaCatalog &schemas, const Id &id)
  {
    using Out = TxnOutcome<Unit, GraphError>;
    auto r = txn_read_vertex(txn, schemas, id);
    if (!r.isOk())
      return r.as<Unit>();
    if (!r.value())
      return Out::fatal(GraphError(ErrorKind::VertexNotFound, to_string(id)));
    txn.remove(id);
    return Out::ok(Unit{});
  }

} // namespace morpheus

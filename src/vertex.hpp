#pragma once
#include "cell_store.hpp"
#include "fields.hpp"
#include "schema.hpp"
#include <optional>
#include <type_traits>

namespace morpheus
{

  // Type list ids per direction; unit until the first edge in that direction.
  struct AdjacencyHeads
  {
    Id inbound{};
    Id outbound{};
    Id undirected{};

    const Id &get(EdgeDirection d) const
    {
      switch (d)
      {
      case EdgeDirection::Inbound:
        return inbound;
      case EdgeDirection::Outbound:
        return outbound;
      case EdgeDirection::Undirected:
      default:
        return undirected;
      }
    }

    Id &get(EdgeDirection d) { return const_cast<Id &>(static_cast<const AdjacencyHeads &>(*this).get(d)); }
  };

  // A graph node: user data plus the adjacency handles the graph layer keeps
  // beside it. The handles never appear in data().
  class Vertex
  {
  public:
    Vertex() = default;

    // unsaved vertex; its id is assigned when it is first written
    static Vertex create(uint32_t schemaId, Map data);

    const Id &id() const { return id_; }
    uint32_t schema() const { return schema_; }
    const Map &data() const { return data_; }
    Map &data() { return data_; }
    const AdjacencyHeads &adjacency() const { return adjacency_; }

  private:
    friend Result<Cell, GraphError> vertex_to_cell(SchemaCatalog &schemas, const Vertex &vertex);
    friend Vertex cell_to_vertex(Cell cell);
    friend TxnOutcome<Unit, GraphError> txn_replace_vertex(CellTxn &txn, SchemaCatalog &schemas,
                                                           const Vertex &stored, Vertex replacement);

    Id id_{};
    uint32_t schema_{0};
    Map data_{};
    AdjacencyHeads adjacency_{};
  };

  // Validates the vertex against its schema and lays it out as a cell,
  // hidden adjacency fields included. Assigns the id of an unsaved vertex.
  Result<Cell, GraphError> vertex_to_cell(SchemaCatalog &schemas, const Vertex &vertex);

  // Splits a stored cell back into user data and adjacency handles.
  Vertex cell_to_vertex(Cell cell);

  // whether `cell` belongs to a vertex schema; adjacency and edge body cells
  // share the id space with vertices
  Result<bool, GraphError> is_vertex_cell(SchemaCatalog &schemas, const Cell &cell);

  // -------------------- transactional primitives ---------------------------

  // nullopt when `id` is absent or names a cell that is not a vertex
  TxnOutcome<std::optional<Vertex>, GraphError> txn_read_vertex(CellTxn &txn, SchemaCatalog &schemas, const Id &id);

  // VertexAlreadyExists when a cell with the vertex's id is present
  TxnOutcome<Vertex, GraphError> txn_new_vertex(CellTxn &txn, SchemaCatalog &schemas, uint32_t schemaId, Map data);

  // writes `replacement` over `stored`, keeping id, schema and adjacency
  TxnOutcome<Unit, GraphError> txn_replace_vertex(CellTxn &txn, SchemaCatalog &schemas,
                                                  const Vertex &stored, Vertex replacement);

  // Deletes only the vertex cell; VertexNotFound when absent.
  TxnOutcome<Unit, GraphError> txn_remove_vertex_cell(CellTxn &txn, SchemaCatalog &schemas, const Id &id);

  // Reads the vertex and commits what `update` returns. An empty optional
  // leaves the vertex untouched and is not an error. `update` may run once per
  // transaction attempt, so it must be free of side effects outside the
  // vertex it is handed; it is invoked as const.
  template <typename U>
  TxnOutcome<Unit, GraphError> txn_update_vertex(CellTxn &txn, SchemaCatalog &schemas, const Id &id, const U &update)
  {
    static_assert(std::is_invocable_r_v<std::optional<Vertex>, const U &, Vertex>,
                  "update must be callable as const and return std::optional<Vertex>");
    using Out = TxnOutcome<Unit, GraphError>;
    auto read = txn_read_vertex(txn, schemas, id);
    if (!read.isOk())
      return read.as<Unit>();
    if (!read.value())
      return Out::fatal(GraphError(ErrorKind::VertexNotFound, to_string(id)));
    const Vertex &stored = *read.value();
    std::optional<Vertex> replacement = update(stored);
    if (!replacement)
      return Out::ok(Unit{});
    return txn_replace_vertex(txn, schemas, stored, std::move(*replacement));
  }

} // namespace morpheus

#pragma once
#include "cell_store.hpp"
#include "id_list.hpp"
#include "schema.hpp"
#include <optional>
#include <variant>
#include <vector>

namespace morpheus
{

  // Attribute cell of an edge whose schema requires a body.
  struct EdgeBody
  {
    Id id{};
    Map data{};
  };

  // One id list entry an edge owns: `member` sits in the list of
  // (vertex, direction, edge schema).
  struct Registration
  {
    Id vertex{};
    EdgeDirection direction{EdgeDirection::Outbound};
    Id member{};
  };

  // start -> end; listed in start's outbound and end's inbound lists
  struct DirectedEdge
  {
    static constexpr EdgeType type = EdgeType::Directed;

    uint32_t schema{0};
    Id start{};
    Id end{};
    std::optional<EdgeBody> body{};

    std::vector<Registration> registrations() const;
  };

  // listed in the undirected list of both endpoints, once for a self loop
  struct UndirectedEdge
  {
    static constexpr EdgeType type = EdgeType::Undirected;

    uint32_t schema{0};
    Id start{};
    Id end{};
    std::optional<EdgeBody> body{};

    std::vector<Registration> registrations() const;
  };

  using Edge = std::variant<DirectedEdge, UndirectedEdge>;

  inline EdgeType edge_type(const Edge &e)
  {
    return std::visit([](const auto &x) { return x.type; }, e);
  }
  inline uint32_t edge_schema(const Edge &e)
  {
    return std::visit([](const auto &x) { return x.schema; }, e);
  }
  inline const Id &edge_start(const Edge &e)
  {
    return std::visit([](const auto &x) -> const Id & { return x.start; }, e);
  }
  inline const Id &edge_end(const Edge &e)
  {
    return std::visit([](const auto &x) -> const Id & { return x.end; }, e);
  }
  inline const std::optional<EdgeBody> &edge_body(const Edge &e)
  {
    return std::visit([](const auto &x) -> const std::optional<EdgeBody> & { return x.body; }, e);
  }
  inline std::vector<Registration> edge_registrations(const Edge &e)
  {
    return std::visit([](const auto &x) { return x.registrations(); }, e);
  }

  // the endpoint of `e` that is not `vertex`; `vertex` itself for a self loop
  Id opposite(const Edge &e, const Id &vertex);

  // -------------------- protocol ---------------------------

  // Checks that `schemaId` is an edge schema and that `body` is present
  // exactly when the schema requires one, before touching the store. Then
  // writes the body cell, if any, and registers the edge in the id lists of
  // both endpoints.
  TxnOutcome<Edge, GraphError> link_edge(CellTxn &txn, SchemaCatalog &schemas, const IdListPolicy &policy,
                                         const Id &from, const Id &to, uint32_t schemaId,
                                         std::optional<Map> body);

  // Reverses link_edge; EdgeNotFound when a registration is missing.
  TxnOutcome<Unit, GraphError> unlink_edge(CellTxn &txn, const IdListPolicy &policy, const Edge &edge);

  // Rebuilds the edge behind `member` found in (vertex, direction, schemaId).
  TxnOutcome<Edge, GraphError> edge_from_member(CellTxn &txn, const Id &vertex, EdgeDirection direction,
                                                uint32_t schemaId, const EdgeAttributes &attrs, const Id &member);

  // edge schema attributes, or SchemaNotFound / SchemaNotEdge
  Result<EdgeAttributes, GraphError> edge_attributes(SchemaCatalog &schemas, uint32_t schemaId);

} // namespace morpheus

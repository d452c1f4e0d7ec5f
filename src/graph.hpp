#pragma once
#include "cell_store.hpp"
#include "codec.hpp"
#include "edge.hpp"
#include "id_list.hpp"
#include "schema.hpp"
#include "vertex.hpp"
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace morpheus
{

  struct GraphOptions
  {
    IdListPolicy idList{};
  };

  // the built-in adjacency schemas are missing from the catalog
  struct GraphInitError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  // Graph operations bound to one store transaction attempt. Only valid for
  // the duration of the closure passed to Graph::transaction.
  class GraphTransaction
  {
  public:
    GraphTransaction(CellTxn &txn, SchemaCatalog &schemas, const GraphOptions &options);
    GraphTransaction(const GraphTransaction &) = delete;
    GraphTransaction &operator=(const GraphTransaction &) = delete;

    TxnOutcome<Vertex, GraphError> newVertex(uint32_t schemaId, Map data);
    TxnOutcome<std::optional<Vertex>, GraphError> readVertex(const Id &id);
    TxnOutcome<std::optional<Vertex>, GraphError> getVertex(uint32_t schemaId, const Value &key);

    template <typename U>
    TxnOutcome<Unit, GraphError> updateVertex(const Id &id, const U &update)
    {
      return txn_update_vertex(txn_, schemas_, id, update);
    }
    template <typename U>
    TxnOutcome<Unit, GraphError> updateVertexByKey(uint32_t schemaId, const Value &key, const U &update)
    {
      return txn_update_vertex(txn_, schemas_, encode_cell_key(schemaId, key), update);
    }

    // detaches every incident edge, then deletes the vertex
    TxnOutcome<Unit, GraphError> removeVertex(const Id &id);
    TxnOutcome<Unit, GraphError> removeVertexByKey(uint32_t schemaId, const Value &key);

    TxnOutcome<Edge, GraphError> link(const Id &from, const Id &to, uint32_t edgeSchemaId,
                                      std::optional<Map> body = std::nullopt);
    TxnOutcome<Unit, GraphError> unlink(const Edge &edge);

    // Edges of `edgeSchemaId` listed for `vertex` in `direction`. The first
    // member that cannot be resolved fails the whole call.
    TxnOutcome<std::vector<Edge>, GraphError> neighbourhoods(const Id &vertex, uint32_t edgeSchemaId, EdgeDirection direction);
    // same, across every edge schema the vertex has a list for
    TxnOutcome<std::vector<Edge>, GraphError> neighbourhoods(const Id &vertex, EdgeDirection direction);
    TxnOutcome<uint64_t, GraphError> degree(const Id &vertex, uint32_t edgeSchemaId, EdgeDirection direction);

  private:
    TxnOutcome<Unit, GraphError> requireVertex(const Id &id);
    TxnOutcome<Unit, GraphError> collect(std::vector<Edge> &out, const Id &vertex, uint32_t edgeSchemaId,
                                         const EdgeAttributes &attrs, EdgeDirection direction);

    CellTxn &txn_;
    SchemaCatalog &schemas_;
    const GraphOptions &options_;
  };

  class Graph
  {
  public:
    // Registers the two built-in adjacency schemas unless they exist. Run once
    // at startup, before constructing any Graph on `schemas`.
    static Result<Unit, SchemaError> ensureInitialized(SchemaCatalog &schemas);

    // throws GraphInitError when ensureInitialized has not been run
    Graph(CellStore &store, SchemaCatalog &schemas, GraphOptions options = {});

    Result<uint32_t, SchemaError> defineVertexSchema(MorpheusSchema schema);
    Result<uint32_t, SchemaError> defineEdgeSchema(MorpheusSchema schema, EdgeAttributes attrs);

    // single-cell insert; VertexAlreadyExists instead of overwriting
    Result<Vertex, GraphError> newVertex(uint32_t schemaId, Map data);
    // nullopt when the vertex does not exist
    Result<std::optional<Vertex>, GraphError> readVertex(const Id &id);
    Result<std::optional<Vertex>, GraphError> getVertex(uint32_t schemaId, const Value &key);

    TxnOutcome<Unit, GraphError> removeVertex(const Id &id);
    TxnOutcome<Unit, GraphError> removeVertexByKey(uint32_t schemaId, const Value &key);

    template <typename U>
    TxnOutcome<Unit, GraphError> updateVertex(const Id &id, const U &update)
    {
      return transaction([&](GraphTransaction &txn) { return txn.updateVertex(id, update); });
    }
    template <typename U>
    TxnOutcome<Unit, GraphError> updateVertexByKey(uint32_t schemaId, const Value &key, const U &update)
    {
      return updateVertex(encode_cell_key(schemaId, key), update);
    }

    // Runs `fn` against a GraphTransaction and commits atomically. `fn` is
    // invoked as const and may run several times when the store detects a
    // conflict, so it must not carry side effects beyond the transaction.
    // Retry in the result means the attempts ran out: run the closure again.
    template <typename F>
    auto transaction(const F &fn) -> std::invoke_result_t<const F &, GraphTransaction &>
    {
      return store_.transaction([&](CellTxn &txn)
                                {
                                  GraphTransaction gt(txn, schemas_, options_);
                                  return fn(gt); });
    }

    CellStore &store() { return store_; }
    SchemaCatalog &schemas() { return schemas_; }
    const GraphOptions &options() const { return options_; }

  private:
    CellStore &store_;
    SchemaCatalog &schemas_;
    GraphOptions options_;
  };

} // namespace morpheus

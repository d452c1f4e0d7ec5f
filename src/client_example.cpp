#include "graph.hpp"
#include "remote.hpp"
#include <capnp/ez-rpc.h>
#include <kj/debug.h>
#include <iostream>
#include <stdexcept>

using namespace morpheus;

static uint32_t defineOrLookup(Graph &graph, const MorpheusSchema &schema, std::optional<EdgeAttributes> edge)
{
  auto r = edge ? graph.defineEdgeSchema(schema, *edge) : graph.defineVertexSchema(schema);
  if (r.isOk())
    return r.value();
  if (r.error().kind == SchemaError::Kind::NameExists)
  {
    auto id = graph.schemas().idByName(schema.name);
    if (id.isOk() && id.value())
      return *id.value();
  }
  throw std::runtime_error("cannot define schema " + schema.name + ": " + r.error().message);
}

int main(int argc, char **argv)
{
  const char *addr = (argc > 1) ? argv[1] : "unix:/tmp/morpheus.sock";
  capnp::EzRpcClient client(addr);
  RemoteCellStore store(client);
  RemoteSchemaCatalog schemas(client);

  auto init = Graph::ensureInitialized(schemas);
  if (!init.isOk())
  {
    std::cerr << "bootstrap failed: " << init.error().message << "\n";
    return 1;
  }
  Graph graph(store, schemas);

  MorpheusSchema person{};
  person.name = "example.person";
  person.keyField = "name";
  person.fields = {{"name", ValueType::Text, false}};
  uint32_t personId = defineOrLookup(graph, person, std::nullopt);

  MorpheusSchema knows{};
  knows.name = "example.knows";
  knows.fields = {{"since", ValueType::I64, false}};
  uint32_t knowsId = defineOrLookup(graph, knows, EdgeAttributes{EdgeType::Directed, true});

  // create two people and link them in one transaction
  auto linked = graph.transaction([&](GraphTransaction &txn) -> TxnOutcome<Edge, GraphError>
                                  {
    auto a = txn.getVertex(personId, std::string("alice"));
    if (!a.isOk()) return a.as<Edge>();
    Id alice = a.value() ? a.value()->id() : Id{};
    if (!a.value()) {
      auto created = txn.newVertex(personId, Map{{"name", std::string("alice")}});
      if (!created.isOk()) return created.as<Edge>();
      alice = created.value().id();
    }
    auto bob = txn.newVertex(personId, Map{{"name", std::string("bob")}});
    if (bob.isFatal() && bob.error().kind == ErrorKind::VertexAlreadyExists) {
      auto existing = txn.getVertex(personId, std::string("bob"));
      if (!existing.isOk()) return existing.as<Edge>();
      return txn.link(alice, (*existing.value()).id(), knowsId, Map{{"since", int64_t(2020)}});
    }
    if (!bob.isOk()) return bob.as<Edge>();
    return txn.link(alice, bob.value().id(), knowsId, Map{{"since", int64_t(2020)}}); });

  if (!linked.isOk())
  {
    if (linked.isRetry())
      std::cerr << "link gave up after retries: " << linked.reason() << "\n";
    else
      std::cerr << "link failed: " << to_string(linked.error().kind) << ": " << linked.error().message << "\n";
    return 1;
  }
  std::cout << "edge " << to_string(edge_start(linked.value())) << " -> " << to_string(edge_end(linked.value())) << "\n";

  auto out = graph.transaction([&](GraphTransaction &txn)
                               { return txn.neighbourhoods(edge_start(linked.value()), knowsId, EdgeDirection::Outbound); });
  if (!out.isOk())
  {
    std::cerr << "neighbourhood query failed: " << (out.isRetry() ? out.reason() : out.error().message) << "\n";
    return 1;
  }
  std::cout << "alice knows " << out.value().size() << " people\n";
  for (const auto &e : out.value())
    std::cout << "\t" << to_string(edge_end(e)) << "\n";
}

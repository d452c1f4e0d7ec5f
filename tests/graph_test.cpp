#include "test_support.hpp"
#include "codec.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <thread>

using namespace morpheus;
using morpheus::testing::CountingTxn;
using morpheus::testing::TempStore;

namespace
{

  bool hasHiddenField(const Map &data)
  {
    return std::any_of(data.begin(), data.end(), [](const auto &kv)
                       { return is_reserved_field(kv.first); });
  }

  IdArray ends(const std::vector<Edge> &edges)
  {
    IdArray out;
    for (const auto &e : edges)
      out.push_back(edge_end(e));
    return out;
  }

  // Delegates to a local catalog until `down` is set, then fails every
  // lookup the way a lost catalog connection does.
  class SwitchableCatalog final : public SchemaCatalog
  {
  public:
    explicit SwitchableCatalog(SchemaCatalog &inner) : inner_(inner) {}

    SchemaLookup<SchemaType> schemaType(uint32_t id) override
    {
      if (down)
        return SchemaLookup<SchemaType>::err(outage());
      return inner_.schemaType(id);
    }
    SchemaLookup<MorpheusSchema> getSchema(uint32_t id) override
    {
      if (down)
        return SchemaLookup<MorpheusSchema>::err(outage());
      return inner_.getSchema(id);
    }
    SchemaLookup<uint32_t> idByName(std::string_view name) override
    {
      if (down)
        return SchemaLookup<uint32_t>::err(outage());
      return inner_.idByName(name);
    }
    Result<uint32_t, SchemaError> registerSchema(const MorpheusSchema &schema) override
    {
      return inner_.registerSchema(schema);
    }
    Result<Unit, SchemaError> bootstrap(uint32_t id, const std::string &name, const std::vector<FieldDef> &fields) override
    {
      return inner_.bootstrap(id, name, fields);
    }

    bool down = false;

  private:
    static SchemaError outage() { return SchemaError{SchemaError::Kind::Transport, "catalog unreachable"}; }

    SchemaCatalog &inner_;
  };

  class GraphTest : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      ASSERT_TRUE(Graph::ensureInitialized(db.schemas).isOk());
      graph = std::make_unique<Graph>(db.store, db.schemas, GraphOptions{IdListPolicy{4, true}});

      MorpheusSchema person{};
      person.name = "test.person";
      person.keyField = "name";
      person.fields = {{"name", ValueType::Text, false}, {"age", ValueType::I64, true}};
      personId = define(person, std::nullopt);

      MorpheusSchema follows{};
      follows.name = "test.follows";
      followsId = define(follows, EdgeAttributes{EdgeType::Directed, false});

      MorpheusSchema knows{};
      knows.name = "test.knows";
      knows.fields = {{"since", ValueType::I64, false}};
      knowsId = define(knows, EdgeAttributes{EdgeType::Directed, true});

      MorpheusSchema friends{};
      friends.name = "test.friends";
      friendsId = define(friends, EdgeAttributes{EdgeType::Undirected, false});

      MorpheusSchema married{};
      married.name = "test.married";
      married.fields = {{"year", ValueType::I64, false}};
      marriedId = define(married, EdgeAttributes{EdgeType::Undirected, true});
    }

    uint32_t define(const MorpheusSchema &schema, std::optional<EdgeAttributes> edge)
    {
      auto r = edge ? graph->defineEdgeSchema(schema, *edge) : graph->defineVertexSchema(schema);
      EXPECT_TRUE(r.isOk());
      return r.isOk() ? r.value() : 0;
    }

    Id person(const std::string &name)
    {
      auto v = graph->newVertex(personId, Map{{"name", name}});
      EXPECT_TRUE(v.isOk());
      return v.isOk() ? v.value().id() : Id{};
    }

    TxnOutcome<Edge, GraphError> link(const Id &from, const Id &to, uint32_t schema, std::optional<Map> body = std::nullopt)
    {
      return graph->transaction([&](GraphTransaction &txn)
                                { return txn.link(from, to, schema, body); });
    }

    TxnOutcome<std::vector<Edge>, GraphError> around(const Id &v, uint32_t schema, EdgeDirection d)
    {
      return graph->transaction([&](GraphTransaction &txn)
                                { return txn.neighbourhoods(v, schema, d); });
    }

    TempStore db;
    std::unique_ptr<Graph> graph;
    uint32_t personId = 0, followsId = 0, knowsId = 0, friendsId = 0, marriedId = 0;
  };

} // namespace

// -------------------- bootstrap --------------------

TEST(GraphInit, ConstructorRequiresBootstrap)
{
  TempStore db;
  EXPECT_THROW({ Graph g(db.store, db.schemas); }, GraphInitError);
  ASSERT_TRUE(Graph::ensureInitialized(db.schemas).isOk());
  EXPECT_NO_THROW({ Graph g(db.store, db.schemas); });
}

TEST(GraphInit, BootstrapIsIdempotent)
{
  TempStore db;
  ASSERT_TRUE(Graph::ensureInitialized(db.schemas).isOk());
  size_t n = db.schemas.size();
  ASSERT_TRUE(Graph::ensureInitialized(db.schemas).isOk());
  EXPECT_EQ(db.schemas.size(), n);
  EXPECT_EQ(db.schemas.idByName(ID_LIST_SCHEMA_NAME).value(), ID_LIST_SCHEMA_ID);
  EXPECT_EQ(db.schemas.idByName(TYPE_LIST_SCHEMA_NAME).value(), TYPE_LIST_SCHEMA_ID);
}

TEST(GraphInit, CatalogSurvivesReopen)
{
  std::filesystem::path dir;
  uint32_t id = 0;
  {
    TempStore db;
    dir = db.dir;
    ASSERT_TRUE(Graph::ensureInitialized(db.schemas).isOk());
    MorpheusSchema s{};
    s.name = "test.city";
    s.type = SchemaType::vertex();
    auto r = db.schemas.registerSchema(s);
    ASSERT_TRUE(r.isOk());
    id = r.value();

    SchemaContainer reopened(db.env);
    EXPECT_EQ(reopened.idByName("test.city").value(), id);
    ASSERT_TRUE(reopened.schemaType(TYPE_LIST_SCHEMA_ID).value().has_value());
    auto next = reopened.registerSchema(MorpheusSchema{0, "test.town", SchemaType::vertex(), "", false, {}});
    ASSERT_TRUE(next.isOk());
    EXPECT_GT(next.value(), id);
  }
  EXPECT_FALSE(std::filesystem::exists(dir));
}

TEST(GraphInit, BuiltInSchemaIdsAreReserved)
{
  TempStore db;
  MorpheusSchema squatter{};
  squatter.id = ID_LIST_SCHEMA_ID;
  squatter.name = "test.squatter";
  squatter.type = SchemaType::vertex();
  auto taken = db.schemas.registerSchema(squatter);
  ASSERT_FALSE(taken.isOk());
  EXPECT_EQ(taken.error().kind, SchemaError::Kind::IdExists);
  squatter.id = 7;
  EXPECT_FALSE(db.schemas.registerSchema(squatter).isOk());

  ASSERT_TRUE(db.schemas.bootstrap(TYPE_LIST_SCHEMA_ID, "test.impostor", {}).isOk());
  auto init = Graph::ensureInitialized(db.schemas);
  ASSERT_FALSE(init.isOk());
  EXPECT_EQ(init.error().kind, SchemaError::Kind::IdExists);
  EXPECT_THROW({ Graph g(db.store, db.schemas); }, GraphInitError);

  EXPECT_FALSE(db.schemas.bootstrap(kFirstUserSchemaId, "test.user", {}).isOk());
}

// -------------------- vertices --------------------

TEST_F(GraphTest, HiddenFieldsNeverSurface)
{
  Id alice = person("alice");
  Id bob = person("bob");
  ASSERT_TRUE(link(alice, bob, followsId).isOk());
  ASSERT_TRUE(link(alice, bob, friendsId).isOk());

  auto read = graph->readVertex(alice);
  ASSERT_TRUE(read.isOk());
  ASSERT_TRUE(read.value().has_value());
  EXPECT_FALSE(hasHiddenField(read.value()->data()));
  EXPECT_EQ(read.value()->data().size(), 1u);
  EXPECT_FALSE(read.value()->adjacency().outbound.isUnit());
  EXPECT_FALSE(read.value()->adjacency().undirected.isUnit());
  EXPECT_TRUE(read.value()->adjacency().inbound.isUnit());
}

TEST_F(GraphTest, ReservedFieldNamesAreRejected)
{
  auto v = graph->newVertex(personId, Map{{"name", std::string("eve")}, {"__outbound", Id{1, 1}}});
  ASSERT_FALSE(v.isOk());
  EXPECT_EQ(v.error().kind, ErrorKind::CannotGenerateCellByData);
  EXPECT_EQ(v.error().category(), ErrorCategory::Validation);
}

TEST_F(GraphTest, VertexSchemaChecks)
{
  auto missing = graph->newVertex(9999, Map{});
  ASSERT_FALSE(missing.isOk());
  EXPECT_EQ(missing.error().kind, ErrorKind::SchemaNotFound);

  auto wrongKind = graph->newVertex(followsId, Map{});
  ASSERT_FALSE(wrongKind.isOk());
  EXPECT_EQ(wrongKind.error().kind, ErrorKind::SchemaNotVertex);

  auto badType = graph->newVertex(personId, Map{{"name", int64_t(3)}});
  ASSERT_FALSE(badType.isOk());
  EXPECT_EQ(badType.error().kind, ErrorKind::CannotGenerateCellByData);
}

TEST_F(GraphTest, NewVertexDoesNotOverwrite)
{
  Id alice = person("alice");
  Id bob = person("bob");
  ASSERT_TRUE(link(alice, bob, followsId).isOk());

  auto again = graph->newVertex(personId, Map{{"name", std::string("alice")}});
  ASSERT_FALSE(again.isOk());
  EXPECT_EQ(again.error().kind, ErrorKind::VertexAlreadyExists);

  auto out = around(alice, followsId, EdgeDirection::Outbound);
  ASSERT_TRUE(out.isOk());
  EXPECT_EQ(out.value().size(), 1u);
}

TEST_F(GraphTest, KeyedVerticesAreFoundByKey)
{
  Id alice = person("alice");
  EXPECT_EQ(alice, encode_cell_key(personId, std::string("alice")));
  auto found = graph->getVertex(personId, std::string("alice"));
  ASSERT_TRUE(found.isOk());
  ASSERT_TRUE(found.value().has_value());
  EXPECT_EQ(found.value()->id(), alice);
  EXPECT_EQ(std::get<std::string>(found.value()->data().at("name")), "alice");

  auto absent = graph->getVertex(personId, std::string("nobody"));
  ASSERT_TRUE(absent.isOk());
  EXPECT_FALSE(absent.value().has_value());
}

TEST_F(GraphTest, UpdateKeepsAdjacency)
{
  Id alice = person("alice");
  Id bob = person("bob");
  ASSERT_TRUE(link(alice, bob, followsId).isOk());

  auto updated = graph->updateVertex(alice, [](Vertex v) -> std::optional<Vertex>
                                     {
    v.data()["age"] = int64_t(33);
    return v; });
  ASSERT_TRUE(updated.isOk());

  auto read = graph->readVertex(alice);
  ASSERT_TRUE(read.isOk());
  EXPECT_EQ(std::get<int64_t>(read.value()->data().at("age")), 33);
  auto out = around(alice, followsId, EdgeDirection::Outbound);
  ASSERT_TRUE(out.isOk());
  EXPECT_EQ(ends(out.value()), IdArray{bob});
}

TEST_F(GraphTest, UpdateReturningNothingIsANoOp)
{
  Id alice = person("alice");
  auto before = graph->readVertex(alice);
  ASSERT_TRUE(before.isOk());
  auto r = graph->updateVertexByKey(personId, std::string("alice"), [](Vertex) -> std::optional<Vertex>
                                    { return std::nullopt; });
  ASSERT_TRUE(r.isOk());
  auto cell = db.store.read(alice);
  ASSERT_TRUE(cell.isOk());
  EXPECT_EQ(cell.value().header.version, 1u);
}

TEST_F(GraphTest, UpdateByKeyAddressesTheKeyedVertex)
{
  Id alice = person("alice");
  auto facade = graph->updateVertexByKey(personId, std::string("alice"), [](Vertex v) -> std::optional<Vertex>
                                         {
    v.data()["age"] = int64_t(40);
    return v; });
  ASSERT_TRUE(facade.isOk());

  auto inTxn = graph->transaction([&](GraphTransaction &txn)
                                  { return txn.updateVertexByKey(personId, std::string("alice"), [](Vertex v) -> std::optional<Vertex>
                                                                 {
    v.data()["age"] = std::get<int64_t>(v.data().at("age")) + 1;
    return v; }); });
  ASSERT_TRUE(inTxn.isOk());

  auto read = graph->readVertex(alice);
  ASSERT_TRUE(read.isOk());
  EXPECT_EQ(std::get<int64_t>(read.value()->data().at("age")), 41);

  auto missing = graph->updateVertexByKey(personId, std::string("nobody"), [](Vertex v) -> std::optional<Vertex>
                                          { return v; });
  ASSERT_TRUE(missing.isFatal());
  EXPECT_EQ(missing.error().kind, ErrorKind::VertexNotFound);
}

TEST_F(GraphTest, NonVertexCellsAreNotVertices)
{
  Id alice = person("alice");
  Id bob = person("bob");
  auto linked = link(alice, bob, knowsId, Map{{"since", int64_t(2001)}});
  ASSERT_TRUE(linked.isOk());
  Id bodyId = edge_body(linked.value())->id;
  Id segmentId = IdList::headId(alice, EdgeDirection::Outbound, knowsId);

  for (const Id &id : {bodyId, segmentId})
  {
    auto facade = graph->readVertex(id);
    ASSERT_TRUE(facade.isOk());
    EXPECT_FALSE(facade.value().has_value());

    auto inTxn = graph->transaction([&](GraphTransaction &txn)
                                    { return txn.readVertex(id); });
    ASSERT_TRUE(inTxn.isOk());
    EXPECT_FALSE(inTxn.value().has_value());

    auto removed = graph->removeVertex(id);
    ASSERT_TRUE(removed.isFatal());
    EXPECT_EQ(removed.error().kind, ErrorKind::VertexNotFound);

    auto updated = graph->updateVertex(id, [](Vertex v) -> std::optional<Vertex>
                                       { return v; });
    ASSERT_TRUE(updated.isFatal());
    EXPECT_EQ(updated.error().kind, ErrorKind::VertexNotFound);

    auto listed = graph->transaction([&](GraphTransaction &txn)
                                     { return txn.neighbourhoods(id, knowsId, EdgeDirection::Outbound); });
    ASSERT_TRUE(listed.isFatal());
    EXPECT_EQ(listed.error().kind, ErrorKind::VertexNotFound);
  }

  auto intoBody = link(alice, bodyId, followsId);
  ASSERT_TRUE(intoBody.isFatal());
  EXPECT_EQ(intoBody.error().kind, ErrorKind::VertexNotFound);

  EXPECT_TRUE(db.store.read(bodyId).isOk());
  auto out = around(alice, knowsId, EdgeDirection::Outbound);
  ASSERT_TRUE(out.isOk());
  EXPECT_EQ(ends(out.value()), IdArray{bob});
}

TEST_F(GraphTest, UpdateOfMissingVertexFails)
{
  auto r = graph->updateVertex(Id{5, 5}, [](Vertex v) -> std::optional<Vertex>
                               { return v; });
  ASSERT_TRUE(r.isFatal());
  EXPECT_EQ(r.error().kind, ErrorKind::VertexNotFound);
}

// -------------------- edges --------------------

TEST_F(GraphTest, BodyMismatchFailsBeforeTouchingTheStore)
{
  Id alice = person("alice");
  Id bob = person("bob");

  int interactions = -1;
  auto required = graph->store().transaction([&](CellTxn &inner)
                                             {
    CountingTxn counting(inner);
    GraphTransaction txn(counting, db.schemas, graph->options());
    auto r = txn.link(alice, bob, knowsId);
    interactions = counting.interactions();
    return r; });
  ASSERT_TRUE(required.isFatal());
  EXPECT_EQ(required.error().kind, ErrorKind::BodyRequired);
  EXPECT_EQ(interactions, 0);

  interactions = -1;
  auto forbidden = graph->store().transaction([&](CellTxn &inner)
                                              {
    CountingTxn counting(inner);
    GraphTransaction txn(counting, db.schemas, graph->options());
    auto r = txn.link(alice, bob, followsId, Map{{"since", int64_t(1)}});
    interactions = counting.interactions();
    return r; });
  ASSERT_TRUE(forbidden.isFatal());
  EXPECT_EQ(forbidden.error().kind, ErrorKind::BodyShouldNotExisted);
  EXPECT_EQ(interactions, 0);
}

TEST_F(GraphTest, LinkSchemaChecks)
{
  Id alice = person("alice");
  Id bob = person("bob");

  auto notEdge = link(alice, bob, personId);
  ASSERT_TRUE(notEdge.isFatal());
  EXPECT_EQ(notEdge.error().kind, ErrorKind::SchemaNotEdge);

  auto unknown = link(alice, bob, 7777);
  ASSERT_TRUE(unknown.isFatal());
  EXPECT_EQ(unknown.error().kind, ErrorKind::SchemaNotFound);

  auto badBody = link(alice, bob, knowsId, Map{{"since", std::string("never")}});
  ASSERT_TRUE(badBody.isFatal());
  EXPECT_EQ(badBody.error().kind, ErrorKind::CannotGenerateCellByData);

  auto ghost = link(alice, Id{3, 3}, followsId);
  ASSERT_TRUE(ghost.isFatal());
  EXPECT_EQ(ghost.error().kind, ErrorKind::VertexNotFound);
}

TEST_F(GraphTest, DirectedEdgesAreListedAtBothEnds)
{
  Id alice = person("alice");
  Id bob = person("bob");
  Id carol = person("carol");
  ASSERT_TRUE(link(alice, bob, followsId).isOk());
  ASSERT_TRUE(link(alice, carol, followsId).isOk());
  ASSERT_TRUE(link(carol, bob, followsId).isOk());

  auto out = around(alice, followsId, EdgeDirection::Outbound);
  ASSERT_TRUE(out.isOk());
  EXPECT_EQ(ends(out.value()), (IdArray{bob, carol}));
  for (const auto &e : out.value())
  {
    EXPECT_EQ(edge_type(e), EdgeType::Directed);
    EXPECT_EQ(edge_start(e), alice);
    EXPECT_FALSE(edge_body(e).has_value());
  }

  auto in = around(bob, followsId, EdgeDirection::Inbound);
  ASSERT_TRUE(in.isOk());
  ASSERT_EQ(in.value().size(), 2u);
  EXPECT_EQ(edge_start(in.value()[0]), alice);
  EXPECT_EQ(edge_start(in.value()[1]), carol);
  EXPECT_EQ(opposite(in.value()[1], bob), carol);

  auto none = around(bob, followsId, EdgeDirection::Outbound);
  ASSERT_TRUE(none.isOk());
  EXPECT_TRUE(none.value().empty());

  auto degree = graph->transaction([&](GraphTransaction &txn)
                                   { return txn.degree(bob, followsId, EdgeDirection::Inbound); });
  ASSERT_TRUE(degree.isOk());
  EXPECT_EQ(degree.value(), 2u);
}

TEST_F(GraphTest, EdgeBodiesCarryUserFieldsOnly)
{
  Id alice = person("alice");
  Id bob = person("bob");
  auto linked = link(alice, bob, knowsId, Map{{"since", int64_t(2015)}});
  ASSERT_TRUE(linked.isOk());
  ASSERT_TRUE(edge_body(linked.value()).has_value());

  auto in = around(bob, knowsId, EdgeDirection::Inbound);
  ASSERT_TRUE(in.isOk());
  ASSERT_EQ(in.value().size(), 1u);
  const auto &body = edge_body(in.value()[0]);
  ASSERT_TRUE(body.has_value());
  EXPECT_EQ(body->id, edge_body(linked.value())->id);
  EXPECT_EQ(body->data.size(), 1u);
  EXPECT_EQ(std::get<int64_t>(body->data.at("since")), 2015);
  EXPECT_EQ(edge_start(in.value()[0]), alice);
  EXPECT_EQ(edge_end(in.value()[0]), bob);
}

TEST_F(GraphTest, UndirectedEdgesAppearOnBothSides)
{
  Id alice = person("alice");
  Id bob = person("bob");
  ASSERT_TRUE(link(alice, bob, friendsId).isOk());
  ASSERT_TRUE(link(alice, alice, friendsId).isOk());

  auto fromAlice = around(alice, friendsId, EdgeDirection::Undirected);
  ASSERT_TRUE(fromAlice.isOk());
  ASSERT_EQ(fromAlice.value().size(), 2u);
  EXPECT_EQ(edge_type(fromAlice.value()[0]), EdgeType::Undirected);
  EXPECT_EQ(opposite(fromAlice.value()[0], alice), bob);
  EXPECT_EQ(opposite(fromAlice.value()[1], alice), alice);

  auto fromBob = around(bob, friendsId, EdgeDirection::Undirected);
  ASSERT_TRUE(fromBob.isOk());
  ASSERT_EQ(fromBob.value().size(), 1u);
  EXPECT_EQ(opposite(fromBob.value()[0], bob), alice);

  auto married = link(alice, bob, marriedId, Map{{"year", int64_t(2019)}});
  ASSERT_TRUE(married.isOk());
  auto spouses = around(bob, marriedId, EdgeDirection::Undirected);
  ASSERT_TRUE(spouses.isOk());
  ASSERT_EQ(spouses.value().size(), 1u);
  EXPECT_EQ(opposite(spouses.value()[0], bob), alice);
}

TEST_F(GraphTest, NeighbourhoodsAcrossSchemas)
{
  Id alice = person("alice");
  Id bob = person("bob");
  Id carol = person("carol");
  ASSERT_TRUE(link(alice, bob, followsId).isOk());
  ASSERT_TRUE(link(alice, carol, knowsId, Map{{"since", int64_t(1)}}).isOk());

  auto all = graph->transaction([&](GraphTransaction &txn)
                                { return txn.neighbourhoods(alice, EdgeDirection::Outbound); });
  ASSERT_TRUE(all.isOk());
  ASSERT_EQ(all.value().size(), 2u);
  EXPECT_EQ(edge_schema(all.value()[0]), followsId);
  EXPECT_EQ(edge_schema(all.value()[1]), knowsId);

  auto none = graph->transaction([&](GraphTransaction &txn)
                                 { return txn.neighbourhoods(carol, EdgeDirection::Outbound); });
  ASSERT_TRUE(none.isOk());
  EXPECT_TRUE(none.value().empty());
}

TEST_F(GraphTest, NeighbourhoodQueriesFailFast)
{
  Id alice = person("alice");
  auto missing = around(Id{8, 8}, followsId, EdgeDirection::Outbound);
  ASSERT_TRUE(missing.isFatal());
  EXPECT_EQ(missing.error().kind, ErrorKind::VertexNotFound);

  auto notEdge = around(alice, personId, EdgeDirection::Outbound);
  ASSERT_TRUE(notEdge.isFatal());
  EXPECT_EQ(notEdge.error().kind, ErrorKind::SchemaNotEdge);

  // a body cell deleted behind the graph's back
  Id bob = person("bob");
  auto linked = link(alice, bob, knowsId, Map{{"since", int64_t(1)}});
  ASSERT_TRUE(linked.isOk());
  ASSERT_TRUE(db.store.remove(edge_body(linked.value())->id).isOk());
  auto broken = around(alice, knowsId, EdgeDirection::Outbound);
  ASSERT_TRUE(broken.isFatal());
  EXPECT_EQ(broken.error().kind, ErrorKind::EdgeNotFound);
}

TEST_F(GraphTest, UnlinkRemovesBothRegistrations)
{
  Id alice = person("alice");
  Id bob = person("bob");
  auto linked = link(alice, bob, knowsId, Map{{"since", int64_t(2000)}});
  ASSERT_TRUE(linked.isOk());
  const Edge edge = linked.value();

  auto unlinked = graph->transaction([&](GraphTransaction &txn)
                                     { return txn.unlink(edge); });
  ASSERT_TRUE(unlinked.isOk());

  EXPECT_TRUE(around(alice, knowsId, EdgeDirection::Outbound).value().empty());
  EXPECT_TRUE(around(bob, knowsId, EdgeDirection::Inbound).value().empty());
  EXPECT_FALSE(db.store.read(edge_body(edge)->id).isOk());

  auto again = graph->transaction([&](GraphTransaction &txn)
                                  { return txn.unlink(edge); });
  ASSERT_TRUE(again.isFatal());
  EXPECT_EQ(again.error().kind, ErrorKind::EdgeNotFound);
}

TEST_F(GraphTest, CatalogOutageIsATransportFailure)
{
  SwitchableCatalog catalog(db.schemas);
  Graph remote(db.store, catalog);
  Id alice = person("alice");
  Id bob = person("bob");
  catalog.down = true;

  auto created = remote.newVertex(personId, Map{{"name", std::string("carol")}});
  ASSERT_FALSE(created.isOk());
  EXPECT_EQ(created.error().category(), ErrorCategory::Transport);

  auto linked = remote.transaction([&](GraphTransaction &txn)
                                   { return txn.link(alice, bob, followsId); });
  ASSERT_TRUE(linked.isFatal());
  EXPECT_EQ(linked.error().kind, ErrorKind::TransportNotApplied);
  EXPECT_EQ(linked.error().category(), ErrorCategory::Transport);

  auto read = remote.readVertex(alice);
  ASSERT_FALSE(read.isOk());
  EXPECT_EQ(read.error().category(), ErrorCategory::Transport);

  catalog.down = false;
  EXPECT_TRUE(remote.transaction([&](GraphTransaction &txn)
                                 { return txn.link(alice, bob, followsId); })
                  .isOk());
}

// -------------------- removal --------------------

TEST_F(GraphTest, RemoveVertexDetachesIncidentEdges)
{
  Id alice = person("alice");
  Id bob = person("bob");
  Id carol = person("carol");
  ASSERT_TRUE(link(alice, bob, followsId).isOk());
  ASSERT_TRUE(link(carol, bob, followsId).isOk());
  auto knows = link(bob, carol, knowsId, Map{{"since", int64_t(5)}});
  ASSERT_TRUE(knows.isOk());
  ASSERT_TRUE(link(bob, alice, friendsId).isOk());
  ASSERT_TRUE(link(bob, bob, friendsId).isOk());

  auto removed = graph->removeVertex(bob);
  ASSERT_TRUE(removed.isOk());

  auto gone = graph->readVertex(bob);
  ASSERT_TRUE(gone.isOk());
  EXPECT_FALSE(gone.value().has_value());

  EXPECT_TRUE(around(alice, followsId, EdgeDirection::Outbound).value().empty());
  EXPECT_TRUE(around(carol, followsId, EdgeDirection::Outbound).value().empty());
  EXPECT_TRUE(around(carol, knowsId, EdgeDirection::Inbound).value().empty());
  EXPECT_TRUE(around(alice, friendsId, EdgeDirection::Undirected).value().empty());
  EXPECT_FALSE(db.store.read(edge_body(knows.value())->id).isOk());

  // bob's own adjacency cells are gone too
  EXPECT_FALSE(db.store.read(IdList::headId(bob, EdgeDirection::Inbound, followsId)).isOk());
  EXPECT_FALSE(db.store.read(TypeList::idFor(bob, EdgeDirection::Undirected)).isOk());
}

TEST_F(GraphTest, RemoveByKeyThenGetReportsAbsence)
{
  person("alice");
  auto removed = graph->removeVertexByKey(personId, std::string("alice"));
  ASSERT_TRUE(removed.isOk());

  auto get = graph->getVertex(personId, std::string("alice"));
  ASSERT_TRUE(get.isOk());
  EXPECT_FALSE(get.value().has_value());

  auto again = graph->removeVertexByKey(personId, std::string("alice"));
  ASSERT_TRUE(again.isFatal());
  EXPECT_EQ(again.error().kind, ErrorKind::VertexNotFound);
  EXPECT_EQ(again.error().category(), ErrorCategory::Domain);
}

TEST_F(GraphTest, RemoveVertexInsideTransaction)
{
  Id alice = person("alice");
  auto r = graph->transaction([&](GraphTransaction &txn) -> TxnOutcome<bool, GraphError>
                              {
    auto removed = txn.removeVertex(alice);
    if (!removed.isOk()) return removed.as<bool>();
    auto read = txn.readVertex(alice);
    if (!read.isOk()) return read.as<bool>();
    return TxnOutcome<bool, GraphError>::ok(read.value().has_value()); });
  ASSERT_TRUE(r.isOk());
  EXPECT_FALSE(r.value());
}

// -------------------- concurrency --------------------

TEST_F(GraphTest, ConcurrentLinksLoseNoMembers)
{
  Id hub = person("hub");
  constexpr int kPerThread = 12;
  std::vector<Id> targets;
  for (int i = 0; i < 2 * kPerThread; ++i)
    targets.push_back(person("t" + std::to_string(i)));

  auto worker = [&](int offset)
  {
    for (int i = 0; i < kPerThread; ++i)
    {
      const Id &to = targets[offset + i];
      TxnOutcome<Edge, GraphError> r = link(hub, to, followsId);
      while (r.isRetry())
        r = link(hub, to, followsId);
      EXPECT_TRUE(r.isOk());
    }
  };
  std::thread a(worker, 0);
  std::thread b(worker, kPerThread);
  a.join();
  b.join();

  auto degree = graph->transaction([&](GraphTransaction &txn)
                                   { return txn.degree(hub, followsId, EdgeDirection::Outbound); });
  ASSERT_TRUE(degree.isOk());
  EXPECT_EQ(degree.value(), uint64_t(2 * kPerThread));
  for (const auto &t : targets)
  {
    auto in = around(t, followsId, EdgeDirection::Inbound);
    ASSERT_TRUE(in.isOk());
    EXPECT_EQ(in.value().size(), 1u);
  }
}

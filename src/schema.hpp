#pragma once
#include "types.hpp"
#include "errors.hpp"
#include "outcome.hpp"
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace morpheus
{

  class Env;

  inline constexpr uint32_t kFirstUserSchemaId = 1024;

  enum class EdgeType : uint8_t
  {
    Directed = 0,
    Undirected = 1
  };

  struct EdgeAttributes
  {
    EdgeType edgeType{EdgeType::Directed};
    bool hasBody{false};

    bool operator==(const EdgeAttributes &other) const = default;
  };

  enum class SchemaKind : uint8_t
  {
    Unspecified = 0,
    Vertex = 1,
    Edge = 2
  };

  struct SchemaType
  {
    SchemaKind kind{SchemaKind::Unspecified};
    EdgeAttributes edge{}; // meaningful only when kind == Edge

    static SchemaType vertex() { return SchemaType{SchemaKind::Vertex, {}}; }
    static SchemaType edgeOf(EdgeAttributes attrs) { return SchemaType{SchemaKind::Edge, attrs}; }

    bool operator==(const SchemaType &other) const = default;
  };

  struct FieldDef
  {
    std::string name{};
    ValueType type{ValueType::Null};
    bool nullable{false};
  };

  struct MorpheusSchema
  {
    uint32_t id{0}; // 0 -> allocate on registration
    std::string name{};
    SchemaType type{};
    std::string keyField{}; // empty -> cells get random ids
    bool dynamic{false};    // accept undeclared fields
    std::vector<FieldDef> fields{};
  };

  // Names starting with "__" belong to the graph layer's hidden fields.
  inline bool is_reserved_field(std::string_view name)
  {
    return name.size() >= 2 && name[0] == '_' && name[1] == '_';
  }

  // nullopt when `data` conforms to the schema layout, otherwise the reason
  std::optional<std::string> check_layout(const MorpheusSchema &schema, const Map &data);

  std::string encode_schema(const MorpheusSchema &schema);
  MorpheusSchema decode_schema(std::string_view bytes);

  template <typename T>
  using SchemaLookup = Result<std::optional<T>, SchemaError>;

  // Registry mapping schema ids to their classification and field layout.
  // Implementations must tolerate concurrent use from many graphs.
  class SchemaCatalog
  {
  public:
    virtual ~SchemaCatalog() = default;

    // nullopt when nothing is registered under the key; an error only when
    // the catalog could not be consulted
    virtual SchemaLookup<SchemaType> schemaType(uint32_t id) = 0;
    virtual SchemaLookup<MorpheusSchema> getSchema(uint32_t id) = 0;
    virtual SchemaLookup<uint32_t> idByName(std::string_view name) = 0;

    // returns the id the schema was registered under
    virtual Result<uint32_t, SchemaError> registerSchema(const MorpheusSchema &schema) = 0;

    // Insert-if-absent for the built-in schemas below kFirstUserSchemaId. An
    // existing schema with `id` is left untouched when it carries `name`.
    virtual Result<Unit, SchemaError> bootstrap(uint32_t id, const std::string &name, const std::vector<FieldDef> &fields) = 0;
  };

  class SchemaContainer final : public SchemaCatalog
  {
  public:
    SchemaContainer() = default;
    // persists into the env's schema buckets and reloads what is already there
    explicit SchemaContainer(Env &env);

    SchemaLookup<SchemaType> schemaType(uint32_t id) override;
    SchemaLookup<MorpheusSchema> getSchema(uint32_t id) override;
    SchemaLookup<uint32_t> idByName(std::string_view name) override;
    Result<uint32_t, SchemaError> registerSchema(const MorpheusSchema &schema) override;
    Result<Unit, SchemaError> bootstrap(uint32_t id, const std::string &name, const std::vector<FieldDef> &fields) override;

    std::vector<MorpheusSchema> all() const;
    size_t size() const;

  private:
    void load();
    Result<Unit, SchemaError> insertLocked(const MorpheusSchema &schema, bool bumpSeq);

    Env *env_{nullptr};
    mutable std::shared_mutex mu_;
    std::unordered_map<uint32_t, MorpheusSchema> byId_;
    std::unordered_map<std::string, uint32_t> byName_;
    uint32_t nextId_{kFirstUserSchemaId};
  };

} // namespace morpheus

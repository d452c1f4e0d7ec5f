#include "schema.hpp"
#include "codec.hpp"
#include "encode.hpp"
#include "env.hpp"
#include <lmdb.h>
#include <mutex>
#include <kj/debug.h>

namespace morpheus
{

  // -------------------- layout --------------------

  std::optional<std::string> check_layout(const MorpheusSchema &schema, const Map &data)
  {
    for (const auto &f : schema.fields)
    {
      auto it = data.find(f.name);
      if (it == data.end() || type_of(it->second) == ValueType::Null)
      {
        if (!f.nullable)
          return "missing field '" + f.name + "'";
        continue;
      }
      if (type_of(it->second) != f.type)
        return "field '" + f.name + "' has the wrong type";
    }
    for (const auto &[key, val] : data)
    {
      if (is_reserved_field(key))
        return "field name '" + key + "' is reserved";
      if (schema.dynamic)
        continue;
      bool declared = false;
      for (const auto &f : schema.fields)
        if (f.name == key)
        {
          declared = true;
          break;
        }
      if (!declared)
        return "field '" + key + "' is not declared";
    }
    return std::nullopt;
  }

  // -------------------- descriptor encoding --------------------

  std::string encode_schema(const MorpheusSchema &schema)
  {
    std::string s;
    put_be32(s, schema.id);
    encode_string(s, schema.name);
    s.push_back(char(schema.type.kind));
    s.push_back(char(schema.type.edge.edgeType));
    s.push_back(schema.type.edge.hasBody ? 1 : 0);
    encode_string(s, schema.keyField);
    s.push_back(schema.dynamic ? 1 : 0);
    put_be32(s, static_cast<uint32_t>(schema.fields.size()));
    for (const auto &f : schema.fields)
    {
      encode_string(s, f.name);
      s.push_back(char(f.type));
      s.push_back(f.nullable ? 1 : 0);
    }
    return s;
  }

  MorpheusSchema decode_schema(std::string_view bytes)
  {
    const unsigned char *p = reinterpret_cast<const unsigned char *>(bytes.data());
    const unsigned char *end = p + bytes.size();
    MorpheusSchema out{};
    if (end - p < 4)
      throw CodecError("corrupt schema id");
    out.id = read_be32(p);
    p += 4;
    p = decode_string(p, end, out.name);
    if (end - p < 3)
      throw CodecError("corrupt schema type");
    out.type.kind = static_cast<SchemaKind>(*p++);
    out.type.edge.edgeType = static_cast<EdgeType>(*p++);
    out.type.edge.hasBody = *p++ != 0;
    p = decode_string(p, end, out.keyField);
    if (end - p < 5)
      throw CodecError("corrupt schema fields");
    out.dynamic = *p++ != 0;
    uint32_t n = read_be32(p);
    p += 4;
    out.fields.reserve(n);
    for (uint32_t i = 0; i < n; ++i)
    {
      FieldDef f{};
      p = decode_string(p, end, f.name);
      if (end - p < 2)
        throw CodecError("corrupt field def");
      f.type = static_cast<ValueType>(*p++);
      f.nullable = *p++ != 0;
      out.fields.push_back(std::move(f));
    }
    if (p != end)
      throw CodecError("trailing data in schema");
    return out;
  }

  // -------------------- container --------------------

  SchemaContainer::SchemaContainer(Env &env) : env_(&env)
  {
    load();
  }

  void SchemaContainer::load()
  {
    Txn tx(env_->raw(), false);
    MDB_cursor *cur{};
    int rc = mdb_cursor_open(tx.get(), env_->schemas(), &cur);
    if (rc)
      throw MdbError(mdb_strerror(rc));
    MDB_val k{}, v{};
    rc = mdb_cursor_get(cur, &k, &v, MDB_FIRST);
    while (rc == 0)
    {
      auto schema = decode_schema(std::string_view(static_cast<const char *>(v.mv_data), v.mv_size));
      byName_[schema.name] = schema.id;
      byId_[schema.id] = std::move(schema);
      rc = mdb_cursor_get(cur, &k, &v, MDB_NEXT);
    }
    mdb_cursor_close(cur);
    if (rc != MDB_NOTFOUND)
      throw MdbError(mdb_strerror(rc));

    auto seqKey = key_meta_schema_seq();
    MDB_val sk{seqKey.size(), const_cast<char *>(seqKey.data())}, sv{};
    rc = mdb_get(tx.get(), env_->meta(), &sk, &sv);
    if (rc == 0 && sv.mv_size == 4)
      nextId_ = read_be32(static_cast<const unsigned char *>(sv.mv_data));
    else if (rc != 0 && rc != MDB_NOTFOUND)
      throw MdbError(mdb_strerror(rc));
    KJ_LOG(INFO, "schema catalog loaded", byId_.size(), nextId_);
  }

  SchemaLookup<SchemaType> SchemaContainer::schemaType(uint32_t id)
  {
    std::shared_lock lock(mu_);
    auto it = byId_.find(id);
    if (it == byId_.end())
      return SchemaLookup<SchemaType>::ok(std::nullopt);
    return SchemaLookup<SchemaType>::ok(it->second.type);
  }

  SchemaLookup<MorpheusSchema> SchemaContainer::getSchema(uint32_t id)
  {
    std::shared_lock lock(mu_);
    auto it = byId_.find(id);
    if (it == byId_.end())
      return SchemaLookup<MorpheusSchema>::ok(std::nullopt);
    return SchemaLookup<MorpheusSchema>::ok(it->second);
  }

  SchemaLookup<uint32_t> SchemaContainer::idByName(std::string_view name)
  {
    std::shared_lock lock(mu_);
    auto it = byName_.find(std::string(name));
    if (it == byName_.end())
      return SchemaLookup<uint32_t>::ok(std::nullopt);
    return SchemaLookup<uint32_t>::ok(it->second);
  }

  Result<uint32_t, SchemaError> SchemaContainer::registerSchema(const MorpheusSchema &schema)
  {
    for (const auto &f : schema.fields)
      if (is_reserved_field(f.name))
        return Result<uint32_t, SchemaError>::err({SchemaError::Kind::ReservedName, f.name});
    if (!schema.keyField.empty())
    {
      bool declared = false;
      for (const auto &f : schema.fields)
        declared = declared || (f.name == schema.keyField && !f.nullable);
      if (!declared)
        return Result<uint32_t, SchemaError>::err({SchemaError::Kind::InvalidField, "key field must be a declared non-null field"});
    }

    std::unique_lock lock(mu_);
    if (byName_.count(schema.name))
      return Result<uint32_t, SchemaError>::err({SchemaError::Kind::NameExists, schema.name});
    MorpheusSchema stored = schema;
    bool allocated = stored.id == 0;
    if (allocated)
    {
      while (byId_.count(nextId_))
        ++nextId_;
      stored.id = nextId_;
    }
    else if (stored.id < kFirstUserSchemaId)
    {
      return Result<uint32_t, SchemaError>::err({SchemaError::Kind::IdExists, std::to_string(stored.id) + " is reserved for built-in schemas"});
    }
    else if (byId_.count(stored.id))
    {
      return Result<uint32_t, SchemaError>::err({SchemaError::Kind::IdExists, std::to_string(stored.id)});
    }
    auto r = insertLocked(stored, allocated);
    if (!r.isOk())
      return Result<uint32_t, SchemaError>::err(r.error());
    return Result<uint32_t, SchemaError>::ok(stored.id);
  }

  Result<Unit, SchemaError> SchemaContainer::bootstrap(uint32_t id, const std::string &name, const std::vector<FieldDef> &fields)
  {
    if (id >= kFirstUserSchemaId)
      return Result<Unit, SchemaError>::err({SchemaError::Kind::InvalidField, std::to_string(id) + " is a user schema id"});
    std::unique_lock lock(mu_);
    auto existing = byId_.find(id);
    if (existing != byId_.end())
    {
      if (existing->second.name != name)
        return Result<Unit, SchemaError>::err({SchemaError::Kind::IdExists, std::to_string(id) + " is taken by " + existing->second.name});
      return Result<Unit, SchemaError>::ok(Unit{});
    }
    auto named = byName_.find(name);
    if (named != byName_.end())
      return Result<Unit, SchemaError>::err({SchemaError::Kind::NameExists, name});
    MorpheusSchema schema{};
    schema.id = id;
    schema.name = name;
    schema.fields = fields;
    KJ_LOG(INFO, "bootstrapping schema", id, name.c_str());
    return insertLocked(schema, false);
  }

  Result<Unit, SchemaError> SchemaContainer::insertLocked(const MorpheusSchema &schema, bool bumpSeq)
  {
    if (env_)
    {
      try
      {
        Txn tx(env_->raw(), true);
        auto idk = key_u32_be(schema.id);
        auto bytes = encode_schema(schema);
        MDB_val k{idk.size(), const_cast<char *>(idk.data())};
        MDB_val v{bytes.size(), const_cast<char *>(bytes.data())};
        int rc = mdb_put(tx.get(), env_->schemas(), &k, &v, 0);
        if (rc)
          throw MdbError(mdb_strerror(rc));

        // name -> id (big-endian 4 bytes)
        auto nk = key_name(schema.name);
        MDB_val nameKey{nk.size(), const_cast<char *>(nk.data())};
        MDB_val idVal{idk.size(), const_cast<char *>(idk.data())};
        rc = mdb_put(tx.get(), env_->schemasByName(), &nameKey, &idVal, 0);
        if (rc)
          throw MdbError(mdb_strerror(rc));

        if (bumpSeq)
        {
          auto seqKey = key_meta_schema_seq();
          std::string seq;
          put_be32(seq, schema.id + 1);
          MDB_val sk{seqKey.size(), const_cast<char *>(seqKey.data())};
          MDB_val sv{seq.size(), const_cast<char *>(seq.data())};
          rc = mdb_put(tx.get(), env_->meta(), &sk, &sv, 0);
          if (rc)
            throw MdbError(mdb_strerror(rc));
        }
        tx.commit();
      }
      catch (const MdbError &e)
      {
        KJ_LOG(ERROR, "schema persistence failed", schema.id, e.what());
        return Result<Unit, SchemaError>::err({SchemaError::Kind::Storage, e.what()});
      }
    }
    if (bumpSeq)
      nextId_ = schema.id + 1;
    byName_[schema.name] = schema.id;
    byId_[schema.id] = schema;
    return Result<Unit, SchemaError>::ok(Unit{});
  }

  std::vector<MorpheusSchema> SchemaContainer::all() const
  {
    std::shared_lock lock(mu_);
    std::vector<MorpheusSchema> out;
    out.reserve(byId_.size());
    for (const auto &[id, schema] : byId_)
      out.push_back(schema);
    return out;
  }

  size_t SchemaContainer::size() const
  {
    std::shared_lock lock(mu_);
    return byId_.size();
  }

} // namespace morpheus

#include "rpc_convert.hpp"
#include <kj/debug.h>

namespace morpheus::rpc
{

  morpheus::Id fromRpc(Id::Reader id)
  {
    return morpheus::Id{id.getHigher(), id.getLower()};
  }

  void toRpc(Id::Builder b, const morpheus::Id &id)
  {
    b.setHigher(id.higher);
    b.setLower(id.lower);
  }

  // -------------------- values --------------------

  morpheus::Value fromRpc(Value::Reader v)
  {
    switch (v.which())
    {
    case Value::BOOLV:
      return static_cast<bool>(v.getBoolv());
    case Value::I64:
      return static_cast<int64_t>(v.getI64());
    case Value::F64:
      return static_cast<double>(v.getF64());
    case Value::TEXT:
    {
      auto t = v.getText();
      return std::string(t.begin(), t.size());
    }
    case Value::ID:
      return fromRpc(v.getId());
    case Value::ID_ARRAY:
    {
      morpheus::IdArray out;
      auto items = v.getIdArray();
      out.reserve(items.size());
      for (auto id : items)
        out.push_back(fromRpc(id));
      return out;
    }
    case Value::INT_ARRAY:
    {
      morpheus::IntArray out;
      auto items = v.getIntArray();
      out.reserve(items.size());
      for (auto x : items)
        out.push_back(x);
      return out;
    }
    case Value::NULLV:
    default:
      return std::monostate{};
    }
  }

  void toRpc(Value::Builder b, const morpheus::Value &v)
  {
    switch (type_of(v))
    {
    case ValueType::Bool:
      b.setBoolv(std::get<bool>(v));
      return;
    case ValueType::I64:
      b.setI64(std::get<int64_t>(v));
      return;
    case ValueType::F64:
      b.setF64(std::get<double>(v));
      return;
    case ValueType::Text:
      b.setText(std::get<std::string>(v));
      return;
    case ValueType::Id:
      toRpc(b.initId(), std::get<morpheus::Id>(v));
      return;
    case ValueType::IdArray:
    {
      const auto &ids = std::get<morpheus::IdArray>(v);
      auto arr = b.initIdArray(ids.size());
      for (uint32_t i = 0; i < ids.size(); ++i)
        toRpc(arr[i], ids[i]);
      return;
    }
    case ValueType::IntArray:
    {
      const auto &xs = std::get<morpheus::IntArray>(v);
      auto arr = b.initIntArray(xs.size());
      for (uint32_t i = 0; i < xs.size(); ++i)
        arr.set(i, xs[i]);
      return;
    }
    case ValueType::Null:
      break;
    }
    b.setNullv();
  }

  // -------------------- cells --------------------

  morpheus::Cell fromRpc(Cell::Reader c)
  {
    morpheus::Cell out{};
    out.header.schema = c.getSchema();
    out.header.id = fromRpc(c.getId());
    out.header.version = c.getVersion();
    for (auto f : c.getFields())
      out.data.emplace(std::string(f.getKey().cStr()), fromRpc(f.getVal()));
    return out;
  }

  void toRpc(Cell::Builder b, const morpheus::Cell &cell)
  {
    b.setSchema(cell.header.schema);
    toRpc(b.initId(), cell.header.id);
    b.setVersion(cell.header.version);
    auto fields = b.initFields(cell.data.size());
    uint32_t i = 0;
    for (const auto &[key, val] : cell.data)
    {
      fields[i].setKey(key);
      toRpc(fields[i].initVal(), val);
      ++i;
    }
  }

  // -------------------- schemas --------------------

  morpheus::FieldDef fromRpc(FieldDef::Reader f)
  {
    KJ_REQUIRE(f.getType() <= static_cast<uint8_t>(ValueType::IntArray), "unknown field type", f.getType());
    return morpheus::FieldDef{std::string(f.getName().cStr()), static_cast<ValueType>(f.getType()), f.getNullable()};
  }

  void toRpc(FieldDef::Builder b, const morpheus::FieldDef &f)
  {
    b.setName(f.name);
    b.setType(static_cast<uint8_t>(f.type));
    b.setNullable(f.nullable);
  }

  morpheus::MorpheusSchema fromRpc(Schema::Reader s)
  {
    morpheus::MorpheusSchema out{};
    out.id = s.getId();
    out.name = s.getName().cStr();
    switch (s.getKind())
    {
    case SchemaKind::VERTEX:
      out.type = SchemaType::vertex();
      break;
    case SchemaKind::EDGE:
      out.type = SchemaType::edgeOf(EdgeAttributes{
          s.getEdgeType() == EdgeType::UNDIRECTED ? morpheus::EdgeType::Undirected : morpheus::EdgeType::Directed,
          s.getHasBody()});
      break;
    case SchemaKind::UNSPECIFIED:
    default:
      break;
    }
    out.keyField = s.getKeyField().cStr();
    out.dynamic = s.getDynamic();
    auto fields = s.getFields();
    out.fields.reserve(fields.size());
    for (auto f : fields)
      out.fields.push_back(fromRpc(f));
    return out;
  }

  void toRpc(Schema::Builder b, const morpheus::MorpheusSchema &s)
  {
    b.setId(s.id);
    b.setName(s.name);
    switch (s.type.kind)
    {
    case morpheus::SchemaKind::Vertex:
      b.setKind(SchemaKind::VERTEX);
      break;
    case morpheus::SchemaKind::Edge:
      b.setKind(SchemaKind::EDGE);
      break;
    case morpheus::SchemaKind::Unspecified:
      b.setKind(SchemaKind::UNSPECIFIED);
      break;
    }
    b.setEdgeType(s.type.edge.edgeType == morpheus::EdgeType::Undirected ? EdgeType::UNDIRECTED : EdgeType::DIRECTED);
    b.setHasBody(s.type.edge.hasBody);
    b.setKeyField(s.keyField);
    b.setDynamic(s.dynamic);
    auto fields = b.initFields(s.fields.size());
    for (uint32_t i = 0; i < s.fields.size(); ++i)
      toRpc(fields[i], s.fields[i]);
  }

  // -------------------- statuses --------------------

  StoreStatus toRpc(StoreError::Kind kind)
  {
    switch (kind)
    {
    case StoreError::Kind::CellNotFound:
      return StoreStatus::NOT_FOUND;
    case StoreError::Kind::CellAlreadyExists:
      return StoreStatus::ALREADY_EXISTS;
    default:
      return StoreStatus::STORAGE;
    }
  }

  SchemaStatus toRpc(SchemaError::Kind kind)
  {
    switch (kind)
    {
    case SchemaError::Kind::NameExists:
      return SchemaStatus::NAME_EXISTS;
    case SchemaError::Kind::IdExists:
      return SchemaStatus::ID_EXISTS;
    case SchemaError::Kind::ReservedName:
      return SchemaStatus::RESERVED_NAME;
    case SchemaError::Kind::InvalidField:
      return SchemaStatus::INVALID_FIELD;
    default:
      return SchemaStatus::STORAGE;
    }
  }

  SchemaError::Kind fromRpc(SchemaStatus status)
  {
    switch (status)
    {
    case SchemaStatus::NAME_EXISTS:
      return SchemaError::Kind::NameExists;
    case SchemaStatus::ID_EXISTS:
      return SchemaError::Kind::IdExists;
    case SchemaStatus::RESERVED_NAME:
      return SchemaError::Kind::ReservedName;
    case SchemaStatus::INVALID_FIELD:
      return SchemaError::Kind::InvalidField;
    default:
      return SchemaError::Kind::Storage;
    }
  }

} // namespace morpheus::rpc

#pragma once
#include "cell_store.hpp"
#include "schema.hpp"
#include "types.hpp"
#include "schemas/morpheus.capnp.h"

namespace morpheus::rpc
{

  morpheus::Id fromRpc(Id::Reader id);
  void toRpc(Id::Builder b, const morpheus::Id &id);

  morpheus::Value fromRpc(Value::Reader v);
  void toRpc(Value::Builder b, const morpheus::Value &v);

  morpheus::Cell fromRpc(Cell::Reader c);
  void toRpc(Cell::Builder b, const morpheus::Cell &cell);

  morpheus::FieldDef fromRpc(FieldDef::Reader f);
  void toRpc(FieldDef::Builder b, const morpheus::FieldDef &f);

  morpheus::MorpheusSchema fromRpc(Schema::Reader s);
  void toRpc(Schema::Builder b, const morpheus::MorpheusSchema &s);

  StoreStatus toRpc(StoreError::Kind kind);
  SchemaStatus toRpc(SchemaError::Kind kind);
  SchemaError::Kind fromRpc(SchemaStatus status);

} // namespace morpheus::rpc

#pragma once
#include "cell_store.hpp"
#include "schema.hpp"
#include "schemas/morpheus.capnp.h"
#include <capnp/ez-rpc.h>
#include <kj/async-io.h>

namespace morpheus::rpc
{

  // Serves a cell store and its schema catalog to remote graphs.
  class CellServiceImpl final : public CellService::Server
  {
  public:
    CellServiceImpl(morpheus::CellStore &store, morpheus::SchemaContainer &schemas);

    kj::Promise<void> readCell(ReadCellContext ctx) override;
    kj::Promise<void> writeCell(WriteCellContext ctx) override;
    kj::Promise<void> removeCell(RemoveCellContext ctx) override;
    kj::Promise<void> commit(CommitContext ctx) override;

    kj::Promise<void> getSchema(GetSchemaContext ctx) override;
    kj::Promise<void> getSchemaByName(GetSchemaByNameContext ctx) override;
    kj::Promise<void> listSchemas(ListSchemasContext ctx) override;
    kj::Promise<void> registerSchema(RegisterSchemaContext ctx) override;
    kj::Promise<void> bootstrapSchema(BootstrapSchemaContext ctx) override;

  private:
    morpheus::CellStore &store_;
    morpheus::SchemaContainer &schemas_;
  };

} // namespace morpheus::rpc

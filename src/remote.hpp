#pragma once
#include "cell_store.hpp"
#include "schema.hpp"
#include "schemas/morpheus.capnp.h"
#include <capnp/ez-rpc.h>
#include <mutex>
#include <unordered_map>

namespace morpheus
{

  // Cell store reached through a CellService capability. Requests block on the
  // client's wait scope, so the store must be used from the thread that owns
  // the EzRpcClient.
  class RemoteCellStore final : public CellStore
  {
  public:
    explicit RemoteCellStore(capnp::EzRpcClient &client, CellStoreOptions options = {});

    Result<Cell, StoreError> read(const Id &id) override;
    Result<CellHeader, StoreError> write(const Cell &cell, WriteMode mode = WriteMode::Upsert) override;
    Result<Unit, StoreError> remove(const Id &id) override;
    Result<std::unique_ptr<BufferedCellTxn>, StoreError> begin() override;
    Result<CommitStatus, StoreError> commit(const CommitBatch &batch) override;

    // committed state of `id`, nullopt when absent
    Result<std::optional<Cell>, StoreError> fetch(const Id &id);

  private:
    capnp::EzRpcClient &client_;
    rpc::CellService::Client cap_;
  };

  // Schema catalog served by the same capability. Registered schemas never
  // change, so lookups by id are cached.
  class RemoteSchemaCatalog final : public SchemaCatalog
  {
  public:
    explicit RemoteSchemaCatalog(capnp::EzRpcClient &client);

    SchemaLookup<SchemaType> schemaType(uint32_t id) override;
    SchemaLookup<MorpheusSchema> getSchema(uint32_t id) override;
    SchemaLookup<uint32_t> idByName(std::string_view name) override;
    Result<uint32_t, SchemaError> registerSchema(const MorpheusSchema &schema) override;
    Result<Unit, SchemaError> bootstrap(uint32_t id, const std::string &name, const std::vector<FieldDef> &fields) override;

    Result<std::vector<MorpheusSchema>, SchemaError> all();

  private:
    capnp::EzRpcClient &client_;
    rpc::CellService::Client cap_;
    std::mutex mu_;
    std::unordered_map<uint32_t, MorpheusSchema> cache_;
  };

  // DISCONNECTED -> TransportLost, anything else -> TransportNotApplied
  StoreError transport_error(const kj::Exception &e);

} // namespace morpheus

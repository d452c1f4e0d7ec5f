#include "remote.hpp"
#include "rpc_convert.hpp"
#include <kj/debug.h>

namespace morpheus
{

  StoreError transport_error(const kj::Exception &e)
  {
    auto kind = e.getType() == kj::Exception::Type::DISCONNECTED
                    ? StoreError::Kind::TransportLost
                    : StoreError::Kind::TransportNotApplied;
    return StoreError{kind, e.getDescription().cStr()};
  }

  namespace
  {

    StoreError status_error(rpc::StoreStatus status, capnp::Text::Reader message)
    {
      StoreError::Kind kind = StoreError::Kind::Storage;
      if (status == rpc::StoreStatus::NOT_FOUND)
        kind = StoreError::Kind::CellNotFound;
      else if (status == rpc::StoreStatus::ALREADY_EXISTS)
        kind = StoreError::Kind::CellAlreadyExists;
      return StoreError{kind, message.cStr()};
    }

    SchemaError schema_transport_error(const kj::Exception &e)
    {
      return SchemaError{SchemaError::Kind::Transport, e.getDescription().cStr()};
    }

    class RemoteCellTxn final : public BufferedCellTxn
    {
    public:
      explicit RemoteCellTxn(RemoteCellStore &store) : store_(store) {}

    protected:
      Result<std::optional<Cell>, StoreError> fetch(const Id &id) override
      {
        return store_.fetch(id);
      }

    private:
      RemoteCellStore &store_;
    };

  } // namespace

  // -------------------- store --------------------

  RemoteCellStore::RemoteCellStore(capnp::EzRpcClient &client, CellStoreOptions options)
      : CellStore(options), client_(client), cap_(client.getMain<rpc::CellService>()) {}

  Result<std::optional<Cell>, StoreError> RemoteCellStore::fetch(const Id &id)
  {
    using R = Result<std::optional<Cell>, StoreError>;
    auto r = read(id);
    if (r.isOk())
      return R::ok(std::move(r).value());
    if (r.error().kind == StoreError::Kind::CellNotFound)
      return R::ok(std::nullopt);
    return R::err(r.error());
  }

  Result<Cell, StoreError> RemoteCellStore::read(const Id &id)
  {
    using R = Result<Cell, StoreError>;
    try
    {
      auto req = cap_.readCellRequest();
      rpc::toRpc(req.initId(), id);
      auto resp = req.send().wait(client_.getWaitScope());
      if (resp.getStatus() != rpc::StoreStatus::OK)
        return R::err(status_error(resp.getStatus(), resp.getMessage()));
      return R::ok(rpc::fromRpc(resp.getCell()));
    }
    catch (const kj::Exception &e)
    {
      return R::err(transport_error(e));
    }
  }

  Result<CellHeader, StoreError> RemoteCellStore::write(const Cell &cell, WriteMode mode)
  {
    using R = Result<CellHeader, StoreError>;
    try
    {
      auto req = cap_.writeCellRequest();
      rpc::toRpc(req.initCell(), cell);
      req.setMode(mode == WriteMode::Insert ? rpc::WriteMode::INSERT : rpc::WriteMode::UPSERT);
      auto resp = req.send().wait(client_.getWaitScope());
      if (resp.getStatus() != rpc::StoreStatus::OK)
        return R::err(status_error(resp.getStatus(), resp.getMessage()));
      CellHeader header = cell.header;
      header.version = resp.getVersion();
      return R::ok(header);
    }
    catch (const kj::Exception &e)
    {
      return R::err(transport_error(e));
    }
  }

  Result<Unit, StoreError> RemoteCellStore::remove(const Id &id)
  {
    using R = Result<Unit, StoreError>;
    try
    {
      auto req = cap_.removeCellRequest();
      rpc::toRpc(req.initId(), id);
      auto resp = req.send().wait(client_.getWaitScope());
      if (resp.getStatus() != rpc::StoreStatus::OK)
        return R::err(status_error(resp.getStatus(), resp.getMessage()));
      return R::ok(Unit{});
    }
    catch (const kj::Exception &e)
    {
      return R::err(transport_error(e));
    }
  }

  Result<std::unique_ptr<BufferedCellTxn>, StoreError> RemoteCellStore::begin()
  {
    using R = Result<std::unique_ptr<BufferedCellTxn>, StoreError>;
    return R::ok(std::make_unique<RemoteCellTxn>(*this));
  }

  Result<CommitStatus, StoreError> RemoteCellStore::commit(const CommitBatch &batch)
  {
    using R = Result<CommitStatus, StoreError>;
    try
    {
      auto req = cap_.commitRequest();
      auto reads = req.initReads(batch.reads.size());
      for (uint32_t i = 0; i < batch.reads.size(); ++i)
      {
        rpc::toRpc(reads[i].initId(), batch.reads[i].id);
        reads[i].setVersion(batch.reads[i].version);
      }
      auto writes = req.initWrites(batch.writes.size());
      for (uint32_t i = 0; i < batch.writes.size(); ++i)
      {
        const auto &w = batch.writes[i];
        rpc::toRpc(writes[i].initId(), w.id);
        if (w.cell)
          rpc::toRpc(writes[i].initPut(), *w.cell);
        else
          writes[i].setRemove();
      }
      auto resp = req.send().wait(client_.getWaitScope());
      if (resp.getStatus() != rpc::StoreStatus::OK)
        return R::err(status_error(resp.getStatus(), resp.getMessage()));
      return R::ok(resp.getResult() == rpc::CommitStatus::COMMITTED ? CommitStatus::Committed : CommitStatus::Conflict);
    }
    catch (const kj::Exception &e)
    {
      KJ_LOG(WARNING, "commit request failed", e.getDescription());
      return R::err(transport_error(e));
    }
  }

  // -------------------- schema catalog --------------------

  RemoteSchemaCatalog::RemoteSchemaCatalog(capnp::EzRpcClient &client)
      : client_(client), cap_(client.getMain<rpc::CellService>()) {}

  SchemaLookup<MorpheusSchema> RemoteSchemaCatalog::getSchema(uint32_t id)
  {
    using R = SchemaLookup<MorpheusSchema>;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = cache_.find(id);
      if (it != cache_.end())
        return R::ok(it->second);
    }
    try
    {
      auto req = cap_.getSchemaRequest();
      req.setId(id);
      auto resp = req.send().wait(client_.getWaitScope());
      if (resp.getStatus() != rpc::SchemaStatus::OK)
        return R::err(SchemaError{rpc::fromRpc(resp.getStatus()), resp.getMessage().cStr()});
      if (!resp.getFound())
        return R::ok(std::nullopt);
      auto schema = rpc::fromRpc(resp.getSchema());
      std::lock_guard<std::mutex> lk(mu_);
      cache_[id] = schema;
      return R::ok(std::move(schema));
    }
    catch (const kj::Exception &e)
    {
      KJ_LOG(WARNING, "schema lookup failed", id, e.getDescription());
      return R::err(schema_transport_error(e));
    }
  }

  SchemaLookup<SchemaType> RemoteSchemaCatalog::schemaType(uint32_t id)
  {
    using R = SchemaLookup<SchemaType>;
    auto schema = getSchema(id);
    if (!schema.isOk())
      return R::err(schema.error());
    if (!schema.value())
      return R::ok(std::nullopt);
    return R::ok(schema.value()->type);
  }

  SchemaLookup<uint32_t> RemoteSchemaCatalog::idByName(std::string_view name)
  {
    using R = SchemaLookup<uint32_t>;
    try
    {
      auto req = cap_.getSchemaByNameRequest();
      std::string owned(name);
      req.setName(owned);
      auto resp = req.send().wait(client_.getWaitScope());
      if (resp.getStatus() != rpc::SchemaStatus::OK)
        return R::err(SchemaError{rpc::fromRpc(resp.getStatus()), resp.getMessage().cStr()});
      if (!resp.getFound())
        return R::ok(std::nullopt);
      return R::ok(resp.getId());
    }
    catch (const kj::Exception &e)
    {
      KJ_LOG(WARNING, "schema lookup failed", e.getDescription());
      return R::err(schema_transport_error(e));
    }
  }

  Result<uint32_t, SchemaError> RemoteSchemaCatalog::registerSchema(const MorpheusSchema &schema)
  {
    using R = Result<uint32_t, SchemaError>;
    try
    {
      auto req = cap_.registerSchemaRequest();
      rpc::toRpc(req.initSchema(), schema);
      auto resp = req.send().wait(client_.getWaitScope());
      if (resp.getStatus() != rpc::SchemaStatus::OK)
        return R::err(SchemaError{rpc::fromRpc(resp.getStatus()), resp.getMessage().cStr()});
      return R::ok(resp.getId());
    }
    catch (const kj::Exception &e)
    {
      return R::err(schema_transport_error(e));
    }
  }

  Result<Unit, SchemaError> RemoteSchemaCatalog::bootstrap(uint32_t id, const std::string &name, const std::vector<FieldDef> &fields)
  {
    using R = Result<Unit, SchemaError>;
    try
    {
      auto req = cap_.bootstrapSchemaRequest();
      req.setId(id);
      req.setName(name);
      auto out = req.initFields(fields.size());
      for (uint32_t i = 0; i < fields.size(); ++i)
        rpc::toRpc(out[i], fields[i]);
      auto resp = req.send().wait(client_.getWaitScope());
      if (resp.getStatus() != rpc::SchemaStatus::OK)
        return R::err(SchemaError{rpc::fromRpc(resp.getStatus()), resp.getMessage().cStr()});
      return R::ok(Unit{});
    }
    catch (const kj::Exception &e)
    {
      return R::err(schema_transport_error(e));
    }
  }

  Result<std::vector<MorpheusSchema>, SchemaError> RemoteSchemaCatalog::all()
  {
    using R = Result<std::vector<MorpheusSchema>, SchemaError>;
    try
    {
      std::vector<MorpheusSchema> out;
      auto resp = cap_.listSchemasRequest().send().wait(client_.getWaitScope());
      for (auto s : resp.getSchemas())
        out.push_back(rpc::fromRpc(s));
      return R::ok(std::move(out));
    }
    catch (const kj::Exception &e)
    {
      return R::err(schema_transport_error(e));
    }
  }

} // namespace morpheus

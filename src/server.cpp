#include "server.hpp"
#include "rpc_convert.hpp"
#include <kj/debug.h>

namespace morpheus::rpc
{

  CellServiceImpl::CellServiceImpl(morpheus::CellStore &store, morpheus::SchemaContainer &schemas)
      : store_(store), schemas_(schemas) {}

  // -------------------- cells --------------------

  kj::Promise<void> CellServiceImpl::readCell(ReadCellContext ctx)
  {
    auto params = ctx.getParams();
    auto r = store_.read(fromRpc(params.getId()));

    auto res = ctx.getResults();
    if (!r.isOk())
    {
      res.setStatus(toRpc(r.error().kind));
      res.setMessage(r.error().message);
      return kj::READY_NOW;
    }
    res.setStatus(StoreStatus::OK);
    toRpc(res.initCell(), r.value());
    return kj::READY_NOW;
  }

  kj::Promise<void> CellServiceImpl::writeCell(WriteCellContext ctx)
  {
    auto params = ctx.getParams();
    auto cell = fromRpc(params.getCell());
    auto mode = params.getMode() == WriteMode::INSERT ? morpheus::WriteMode::Insert : morpheus::WriteMode::Upsert;
    auto r = store_.write(cell, mode);

    auto res = ctx.getResults();
    if (!r.isOk())
    {
      res.setStatus(toRpc(r.error().kind));
      res.setMessage(r.error().message);
      return kj::READY_NOW;
    }
    res.setStatus(StoreStatus::OK);
    res.setVersion(r.value().version);
    return kj::READY_NOW;
  }

  kj::Promise<void> CellServiceImpl::removeCell(RemoveCellContext ctx)
  {
    auto r = store_.remove(fromRpc(ctx.getParams().getId()));
    auto res = ctx.getResults();
    if (!r.isOk())
    {
      res.setStatus(toRpc(r.error().kind));
      res.setMessage(r.error().message);
      return kj::READY_NOW;
    }
    res.setStatus(StoreStatus::OK);
    return kj::READY_NOW;
  }

  kj::Promise<void> CellServiceImpl::commit(CommitContext ctx)
  {
    auto params = ctx.getParams();
    morpheus::CommitBatch batch{};
    {
      auto reads = params.getReads();
      batch.reads.reserve(reads.size());
      for (auto r : reads)
        batch.reads.push_back(morpheus::ReadVersion{fromRpc(r.getId()), r.getVersion()});
    }
    {
      auto writes = params.getWrites();
      batch.writes.reserve(writes.size());
      for (auto w : writes)
      {
        morpheus::WriteOp op{fromRpc(w.getId()), std::nullopt};
        if (w.isPut())
          op.cell = fromRpc(w.getPut());
        batch.writes.push_back(std::move(op));
      }
    }

    auto r = store_.commit(batch);
    auto res = ctx.getResults();
    if (!r.isOk())
    {
      KJ_LOG(WARNING, "remote commit failed", to_string(r.error().kind), r.error().message.c_str());
      res.setStatus(toRpc(r.error().kind));
      res.setMessage(r.error().message);
      return kj::READY_NOW;
    }
    res.setStatus(StoreStatus::OK);
    res.setResult(r.value() == morpheus::CommitStatus::Committed ? CommitStatus::COMMITTED : CommitStatus::CONFLICT);
    return kj::READY_NOW;
  }

  // -------------------- schemas --------------------

  kj::Promise<void> CellServiceImpl::getSchema(GetSchemaContext ctx)
  {
    auto schema = schemas_.getSchema(ctx.getParams().getId());
    auto res = ctx.getResults();
    if (!schema.isOk())
    {
      res.setStatus(toRpc(schema.error().kind));
      res.setMessage(schema.error().message);
      return kj::READY_NOW;
    }
    res.setStatus(SchemaStatus::OK);
    res.setFound(schema.value().has_value());
    if (schema.value())
      toRpc(res.initSchema(), *schema.value());
    return kj::READY_NOW;
  }

  kj::Promise<void> CellServiceImpl::getSchemaByName(GetSchemaByNameContext ctx)
  {
    auto name = ctx.getParams().getName();
    auto id = schemas_.idByName(std::string_view(name.cStr(), name.size()));
    auto res = ctx.getResults();
    if (!id.isOk())
    {
      res.setStatus(toRpc(id.error().kind));
      res.setMessage(id.error().message);
      return kj::READY_NOW;
    }
    res.setStatus(SchemaStatus::OK);
    res.setFound(id.value().has_value());
    if (id.value())
      res.setId(*id.value());
    return kj::READY_NOW;
  }

  kj::Promise<void> CellServiceImpl::listSchemas(ListSchemasContext ctx)
  {
    auto all = schemas_.all();
    auto out = ctx.getResults().initSchemas(all.size());
    for (uint32_t i = 0; i < all.size(); ++i)
      toRpc(out[i], all[i]);
    return kj::READY_NOW;
  }

  kj::Promise<void> CellServiceImpl::registerSchema(RegisterSchemaContext ctx)
  {
    auto r = schemas_.registerSchema(fromRpc(ctx.getParams().getSchema()));
    auto res = ctx.getResults();
    if (!r.isOk())
    {
      res.setStatus(toRpc(r.error().kind));
      res.setMessage(r.error().message);
      return kj::READY_NOW;
    }
    res.setStatus(SchemaStatus::OK);
    res.setId(r.value());
    return kj::READY_NOW;
  }

  kj::Promise<void> CellServiceImpl::bootstrapSchema(BootstrapSchemaContext ctx)
  {
    auto params = ctx.getParams();
    std::vector<morpheus::FieldDef> fields;
    for (auto f : params.getFields())
      fields.push_back(fromRpc(f));
    auto r = schemas_.bootstrap(params.getId(), params.getName().cStr(), fields);
    auto res = ctx.getResults();
    if (!r.isOk())
    {
      res.setStatus(toRpc(r.error().kind));
      res.setMessage(r.error().message);
      return kj::READY_NOW;
    }
    res.setStatus(SchemaStatus::OK);
    return kj::READY_NOW;
  }

} // namespace morpheus::rpc

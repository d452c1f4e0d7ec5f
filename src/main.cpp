#include "env.hpp"
#include "cell_store.hpp"
#include "graph.hpp"
#include "schema.hpp"
#include "server.hpp"
#include <capnp/ez-rpc.h>
#include <kj/async-io.h>
#include <kj/main.h>
#include <kj/debug.h>
#include <filesystem>
#include <cstring>
#include <cstdlib>
#include <unistd.h>

class MorpheusdApp
{
public:
  explicit MorpheusdApp(kj::ProcessContext &context) : context_(context) {}

  kj::MainFunc getMain()
  {
    return kj::MainBuilder(context_, "0.1", "Morpheus graph cell store server using capnproto RPC")
        .addOption({'v'}, KJ_BIND_METHOD(*this, optVerbose),
                   "increase logging verbosity (INFO)")
        .addOptionWithArg({'b', "bind"}, KJ_BIND_METHOD(*this, optBind),
                          "bind", "bind address (e.g., unix:/tmp/morpheus.sock or 0.0.0.0:0)")
        .addOptionWithArg({'d', "data"}, KJ_BIND_METHOD(*this, optData),
                          "dir", "data directory for LMDB (default: data)")
        .addOptionWithArg({'m', "map-size"}, KJ_BIND_METHOD(*this, optMapSize),
                          "mib", "LMDB map size in MiB (default: 1024)")
        .addOptionWithArg({'r', "max-attempts"}, KJ_BIND_METHOD(*this, optMaxAttempts),
                          "n", "closure runs per transaction before giving up (default: 16)")
        .callAfterParsing(KJ_BIND_METHOD(*this, run))
        .build();
  }

private:
  kj::ProcessContext &context_;
  kj::String bind_ = kj::heapString("unix:/tmp/morpheus.sock");
  kj::String dataDir_ = kj::heapString("data");
  size_t mapSizeBytes_ = size_t(1ull << 30);
  morpheus::CellStoreOptions storeOptions_{};

  kj::MainBuilder::Validity optVerbose()
  {
    context_.increaseLoggingVerbosity();
    return true;
  }

  kj::MainBuilder::Validity optBind(kj::StringPtr value)
  {
    bind_ = kj::heapString(value);
    return true;
  }

  kj::MainBuilder::Validity optData(kj::StringPtr value)
  {
    dataDir_ = kj::heapString(value);
    return true;
  }

  kj::MainBuilder::Validity optMapSize(kj::StringPtr value)
  {
    char *end = nullptr;
    unsigned long long mib = std::strtoull(value.cStr(), &end, 10);
    if (end == value.cStr() || *end != '\0' || mib == 0)
      return "map size must be a positive number of MiB";
    mapSizeBytes_ = size_t(mib) << 20;
    return true;
  }

  kj::MainBuilder::Validity optMaxAttempts(kj::StringPtr value)
  {
    char *end = nullptr;
    unsigned long n = std::strtoul(value.cStr(), &end, 10);
    if (end == value.cStr() || *end != '\0' || n == 0)
      return "max attempts must be a positive integer";
    storeOptions_.maxAttempts = static_cast<uint32_t>(n);
    return true;
  }

  kj::MainBuilder::Validity run()
  {
    try
    {
      std::filesystem::create_directories(std::filesystem::path(dataDir_.cStr()));

      morpheus::Env env(std::filesystem::path(dataDir_.cStr()), mapSizeBytes_);
      morpheus::LmdbCellStore store(env, storeOptions_);
      morpheus::SchemaContainer schemas(env);
      auto init = morpheus::Graph::ensureInitialized(schemas);
      if (!init.isOk())
        return kj::MainBuilder::Validity(kj::str("cannot initialize schemas: ", init.error().message.c_str()));
      KJ_LOG(INFO, "schemas loaded", schemas.size());

      const char *bindC = bind_.cStr();
      if (std::strncmp(bindC, "unix:", 5) == 0)
      {
        const char *path = bindC + 5;
        ::unlink(path);
      }

      capnp::EzRpcServer server(kj::heap<morpheus::rpc::CellServiceImpl>(store, schemas), bindC);
      auto &waitScope = server.getWaitScope();
      if (std::strncmp(bindC, "unix:", 5) == 0)
      {
        KJ_LOG(INFO, "morpheusd listening on ", bindC);
      }
      else
      {
        auto addr = server.getPort().wait(waitScope);
        KJ_LOG(INFO, "morpheusd listening on ", bindC, " (port ", addr, ")");
      }
      kj::NEVER_DONE.wait(waitScope);
    }
    catch (const std::exception &e)
    {
      KJ_LOG(ERROR, "fatal: ", e.what());
      return kj::MainBuilder::Validity("fatal error");
    }
    return true;
  }
};

KJ_MAIN(MorpheusdApp);

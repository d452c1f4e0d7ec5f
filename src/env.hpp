#pragma once
#include <cstdint>
#include <filesystem>
#include <stdexcept>

struct MDB_env;
struct MDB_txn;
using DbHandle = unsigned int;

namespace morpheus
{

  struct MdbError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  class Txn
  {
  public:
    Txn(MDB_env *env, bool rw);
    ~Txn() noexcept;
    Txn(const Txn &) = delete;
    Txn &operator=(const Txn &) = delete;
    Txn(Txn &&other) noexcept;
    Txn &operator=(Txn &&other) noexcept;

    MDB_txn *get() const;
    void commit();
    void abort() noexcept;

  private:
    MDB_env *env_{};
    MDB_txn *txn_{};
    bool rw_{};
  };

  // on-disk cell layout; bumped when encode_cell changes
  inline constexpr uint32_t kFormatVersion = 1;

  class Env
  {
  public:
    Env(const std::filesystem::path &path, size_t mapSizeBytes = size_t(1ull << 30));
    ~Env() noexcept;
    Env(const Env &) = delete;
    Env &operator=(const Env &) = delete;
    Env(Env &&other) noexcept;
    Env &operator=(Env &&other) noexcept;

    MDB_env *raw() const;
    DbHandle cells() const;
    DbHandle schemas() const;
    DbHandle schemasByName() const;
    DbHandle meta() const;

  private:
    static void open(MDB_txn *tx, DbHandle &out, const char *name);
    void ensureFormatVersion(MDB_txn *tx);

    MDB_env *env_{};
    DbHandle cells_{};
    DbHandle schemas_{};
    DbHandle schemasByName_{};
    DbHandle meta_{};
  };

} // namespace morpheus

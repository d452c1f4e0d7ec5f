#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace morpheus
{

  // Failure reported by a cell store, local or remote.
  struct StoreError
  {
    enum class Kind : uint8_t
    {
      CellNotFound,
      CellAlreadyExists,
      Storage,
      TransportNotApplied, // request definitely did not take effect
      TransportLost        // connection lost, outcome unknown
    };

    Kind kind{Kind::Storage};
    std::string message{};
  };

  struct SchemaError
  {
    enum class Kind : uint8_t
    {
      NameExists,
      IdExists,
      ReservedName,
      InvalidField,
      Storage,
      Transport
    };

    Kind kind{Kind::Storage};
    std::string message{};
  };

  enum class ErrorCategory : uint8_t
  {
    Validation,
    Storage,
    Transport,
    Domain
  };

  enum class ErrorKind : uint8_t
  {
    SchemaNotFound,
    SchemaNotVertex,
    SchemaNotEdge,
    CannotGenerateCellByData,
    BodyRequired,
    BodyShouldNotExisted,
    VertexNotFound,
    VertexAlreadyExists,
    EdgeNotFound,
    ListCorrupted,
    ListMemberNotFound,
    Storage,
    TransportNotApplied,
    TransportLost
  };

  struct GraphError
  {
    ErrorKind kind{ErrorKind::Storage};
    std::string message{};

    GraphError() = default;
    GraphError(ErrorKind k, std::string msg = {}) : kind(k), message(std::move(msg)) {}
    GraphError(const StoreError &e);
    // failed catalog lookup
    GraphError(const SchemaError &e);

    ErrorCategory category() const;
  };

  const char *to_string(ErrorKind kind);
  const char *to_string(StoreError::Kind kind);

} // namespace morpheus

#include "errors.hpp"

namespace morpheus
{

  GraphError::GraphError(const StoreError &e) : message(e.message)
  {
    switch (e.kind)
    {
    case StoreError::Kind::CellNotFound:
      kind = ErrorKind::VertexNotFound;
      break;
    case StoreError::Kind::CellAlreadyExists:
      kind = ErrorKind::VertexAlreadyExists;
      break;
    case StoreError::Kind::TransportNotApplied:
      kind = ErrorKind::TransportNotApplied;
      break;
    case StoreError::Kind::TransportLost:
      kind = ErrorKind::TransportLost;
      break;
    case StoreError::Kind::Storage:
    default:
      kind = ErrorKind::Storage;
      break;
    }
  }

  GraphError::GraphError(const SchemaError &e) : message(e.message)
  {
    kind = e.kind == SchemaError::Kind::Transport ? ErrorKind::TransportNotApplied : ErrorKind::Storage;
  }

  ErrorCategory GraphError::category() const
  {
    switch (kind)
    {
    case ErrorKind::SchemaNotFound:
    case ErrorKind::SchemaNotVertex:
    case ErrorKind::SchemaNotEdge:
    case ErrorKind::CannotGenerateCellByData:
    case ErrorKind::BodyRequired:
    case ErrorKind::BodyShouldNotExisted:
    case ErrorKind::VertexAlreadyExists:
      return ErrorCategory::Validation;
    case ErrorKind::Storage:
      return ErrorCategory::Storage;
    case ErrorKind::TransportNotApplied:
    case ErrorKind::TransportLost:
      return ErrorCategory::Transport;
    case ErrorKind::VertexNotFound:
    case ErrorKind::EdgeNotFound:
    case ErrorKind::ListCorrupted:
    case ErrorKind::ListMemberNotFound:
    default:
      return ErrorCategory::Domain;
    }
  }

  const char *to_string(ErrorKind kind)
  {
    switch (kind)
    {
    case ErrorKind::SchemaNotFound:
      return "schema not found";
    case ErrorKind::SchemaNotVertex:
      return "schema is not a vertex schema";
    case ErrorKind::SchemaNotEdge:
      return "schema is not an edge schema";
    case ErrorKind::CannotGenerateCellByData:
      return "data does not match schema layout";
    case ErrorKind::BodyRequired:
      return "edge schema requires a body";
    case ErrorKind::BodyShouldNotExisted:
      return "edge schema does not take a body";
    case ErrorKind::VertexNotFound:
      return "vertex not found";
    case ErrorKind::VertexAlreadyExists:
      return "vertex already exists";
    case ErrorKind::EdgeNotFound:
      return "edge not found";
    case ErrorKind::ListCorrupted:
      return "id list corrupted";
    case ErrorKind::ListMemberNotFound:
      return "id list member not found";
    case ErrorKind::Storage:
      return "storage error";
    case ErrorKind::TransportNotApplied:
      return "transport error (not applied)";
    case ErrorKind::TransportLost:
      return "transport error (connection lost)";
    }
    return "unknown";
  }

  const char *to_string(StoreError::Kind kind)
  {
    switch (kind)
    {
    case StoreError::Kind::CellNotFound:
      return "cell not found";
    case StoreError::Kind::CellAlreadyExists:
      return "cell already exists";
    case StoreError::Kind::Storage:
      return "storage error";
    case StoreError::Kind::TransportNotApplied:
      return "transport error (not applied)";
    case StoreError::Kind::TransportLost:
      return "transport error (connection lost)";
    }
    return "unknown";
  }

} // namespace morpheus

#pragma once
#include "schema.hpp"
#include <cstdint>
#include <vector>

namespace morpheus
{

  // built-in schemas backing every adjacency cell
  inline constexpr uint32_t ID_LIST_SCHEMA_ID = 100;
  inline constexpr uint32_t TYPE_LIST_SCHEMA_ID = 101;
  inline constexpr const char *ID_LIST_SCHEMA_NAME = "morpheus.id_list";
  inline constexpr const char *TYPE_LIST_SCHEMA_NAME = "morpheus.type_list";

  enum class EdgeDirection : uint8_t
  {
    Inbound = 0,
    Outbound = 1,
    Undirected = 2
  };

  const char *to_string(EdgeDirection d);

  // hidden vertex fields: type list id per direction
  inline constexpr const char *INBOUND_FIELD = "__inbound";
  inline constexpr const char *OUTBOUND_FIELD = "__outbound";
  inline constexpr const char *UNDIRECTED_FIELD = "__undirected";

  inline const char *direction_field(EdgeDirection d)
  {
    switch (d)
    {
    case EdgeDirection::Inbound:
      return INBOUND_FIELD;
    case EdgeDirection::Outbound:
      return OUTBOUND_FIELD;
    case EdgeDirection::Undirected:
    default:
      return UNDIRECTED_FIELD;
    }
  }

  // hidden edge body fields
  inline constexpr const char *EDGE_START_FIELD = "__start";
  inline constexpr const char *EDGE_END_FIELD = "__end";

  // id list segment fields; tail and seq are only set on the head segment
  inline constexpr const char *LIST_FIELD = "list";
  inline constexpr const char *NEXT_FIELD = "next";
  inline constexpr const char *TAIL_FIELD = "tail";
  inline constexpr const char *SEQ_FIELD = "seq";

  // type list fields: parallel arrays of edge schema ids and id list heads
  inline constexpr const char *TYPES_FIELD = "types";
  inline constexpr const char *LISTS_FIELD = "lists";

  inline std::vector<FieldDef> id_list_fields()
  {
    return {
        FieldDef{LIST_FIELD, ValueType::IdArray, false},
        FieldDef{NEXT_FIELD, ValueType::Id, false},
        FieldDef{TAIL_FIELD, ValueType::Id, true},
        FieldDef{SEQ_FIELD, ValueType::I64, true},
    };
  }

  inline std::vector<FieldDef> type_list_fields()
  {
    return {
        FieldDef{TYPES_FIELD, ValueType::IntArray, false},
        FieldDef{LISTS_FIELD, ValueType::IdArray, false},
    };
  }

} // namespace morpheus

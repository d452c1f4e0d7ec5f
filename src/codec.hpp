#pragma once
#include "types.hpp"
#include <stdexcept>
#include <string>
#include <string_view>

namespace morpheus
{

  struct CodecError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  // -------------------- value / cell encoding ---------------------------

  void encode_string(std::string &out, std::string_view s);
  const unsigned char *decode_string(const unsigned char *p, const unsigned char *end, std::string &out);

  void encode_id(std::string &out, const Id &id);
  const unsigned char *decode_id(const unsigned char *p, const unsigned char *end, Id &out);

  void encode_value(std::string &out, const Value &v);
  const unsigned char *decode_value(const unsigned char *p, const unsigned char *end, Value &out);

  // <u32 schema>|<u64 version>|<u32 n>|(<string key><value>)*n
  std::string encode_cell(const Cell &cell);
  Cell decode_cell(const Id &id, std::string_view bytes);

  // -------------------- identifiers ---------------------------

  // deterministic id of the cell holding `key` under `schemaId`
  Id encode_cell_key(uint32_t schemaId, const Value &key);

  // fresh id under `schemaId`, never the unit id
  Id random_id(uint32_t schemaId);

  // deterministic child id of `base`, used for adjacency cells
  Id derive_id(uint32_t schemaId, const Id &base, uint64_t a, uint64_t b = 0);

} // namespace morpheus

#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace morpheus
{

  inline void put_be64(std::string &s, uint64_t x)
  {
    for (int i = 7; i >= 0; --i)
      s.push_back(char((x >> (i * 8)) & 0xff));
  }
  inline void put_be32(std::string &s, uint32_t x)
  {
    for (int i = 3; i >= 0; --i)
      s.push_back(char((x >> (i * 8)) & 0xff));
  }

  inline uint64_t read_be64(const unsigned char *p)
  {
    uint64_t x = 0;
    for (int i = 0; i < 8; ++i)
      x = (x << 8) | p[i];
    return x;
  }
  inline uint32_t read_be32(const unsigned char *p)
  {
    uint32_t x = 0;
    for (int i = 0; i < 4; ++i)
      x = (x << 8) | p[i];
    return x;
  }

  // 64-bit FNV-1a, stable across processes and platforms
  inline uint64_t fnv1a64(std::string_view bytes, uint64_t seed = 0xcbf29ce484222325ull)
  {
    uint64_t h = seed;
    for (unsigned char c : bytes)
    {
      h ^= c;
      h *= 0x100000001b3ull;
    }
    return h;
  }

  // cells: <u64 higher>|<u64 lower>
  inline std::string key_cell_be(uint64_t higher, uint64_t lower)
  {
    std::string k;
    k.reserve(16);
    put_be64(k, higher);
    put_be64(k, lower);
    return k;
  }

  // schemas: <u32 schemaId>
  inline std::string key_u32_be(uint32_t id)
  {
    std::string k;
    k.reserve(4);
    put_be32(k, id);
    return k;
  }

  // schemasByName: raw string key
  inline std::string key_name(std::string_view name)
  {
    return std::string(name);
  }

  // meta bucket string keys
  inline std::string key_meta_schema_seq() { return std::string("schemaSeq"); }
  inline std::string key_meta_format_version() { return std::string("formatVersion"); }
  // last cell version handed out by any commit
  inline std::string key_meta_cell_seq() { return std::string("cellSeq"); }

} // namespace morpheus

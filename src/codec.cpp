#include "codec.hpp"
#include "encode.hpp"
#include <cstring>
#include <random>
#include <cstdio>

namespace morpheus
{

  std::string to_string(const Id &id)
  {
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%016llx:%016llx",
                  static_cast<unsigned long long>(id.higher),
                  static_cast<unsigned long long>(id.lower));
    return std::string(buf);
  }

  // -------------------- primitives --------------------

  void encode_string(std::string &out, std::string_view s)
  {
    put_be32(out, static_cast<uint32_t>(s.size()));
    out.append(s.data(), s.size());
  }

  const unsigned char *decode_string(const unsigned char *p, const unsigned char *end, std::string &out)
  {
    if (end - p < 4)
      throw CodecError("corrupt string len");
    uint32_t len = read_be32(p);
    p += 4;
    if (end - p < static_cast<std::ptrdiff_t>(len))
      throw CodecError("corrupt string data");
    out.assign(reinterpret_cast<const char *>(p), len);
    return p + len;
  }

  void encode_id(std::string &out, const Id &id)
  {
    put_be64(out, id.higher);
    put_be64(out, id.lower);
  }

  const unsigned char *decode_id(const unsigned char *p, const unsigned char *end, Id &out)
  {
    if (end - p < 16)
      throw CodecError("corrupt id");
    out.higher = read_be64(p);
    out.lower = read_be64(p + 8);
    return p + 16;
  }

  // -------------------- values --------------------

  void encode_value(std::string &out, const Value &v)
  {
    out.push_back(char(type_of(v)));
    switch (type_of(v))
    {
    case ValueType::Null:
      return;
    case ValueType::Bool:
      out.push_back(std::get<bool>(v) ? 1 : 0);
      return;
    case ValueType::I64:
      put_be64(out, static_cast<uint64_t>(std::get<int64_t>(v)));
      return;
    case ValueType::F64:
    {
      double d = std::get<double>(v);
      static_assert(sizeof(double) == 8, "double not 8 bytes");
      uint64_t ux;
      std::memcpy(&ux, &d, 8);
      put_be64(out, ux);
      return;
    }
    case ValueType::Text:
      encode_string(out, std::get<std::string>(v));
      return;
    case ValueType::Id:
      encode_id(out, std::get<Id>(v));
      return;
    case ValueType::IdArray:
    {
      const auto &ids = std::get<IdArray>(v);
      put_be32(out, static_cast<uint32_t>(ids.size()));
      for (const auto &id : ids)
        encode_id(out, id);
      return;
    }
    case ValueType::IntArray:
    {
      const auto &xs = std::get<IntArray>(v);
      put_be32(out, static_cast<uint32_t>(xs.size()));
      for (int64_t x : xs)
        put_be64(out, static_cast<uint64_t>(x));
      return;
    }
    }
  }

  const unsigned char *decode_value(const unsigned char *p, const unsigned char *end, Value &out)
  {
    if (p >= end)
      throw CodecError("corrupt value: empty");
    auto tag = static_cast<ValueType>(*p++);
    switch (tag)
    {
    case ValueType::Null:
      out = std::monostate{};
      return p;
    case ValueType::Bool:
      if (end - p < 1)
        throw CodecError("corrupt bool");
      out = bool(*p++ != 0);
      return p;
    case ValueType::I64:
      if (end - p < 8)
        throw CodecError("corrupt i64");
      out = static_cast<int64_t>(read_be64(p));
      return p + 8;
    case ValueType::F64:
    {
      if (end - p < 8)
        throw CodecError("corrupt f64");
      uint64_t ux = read_be64(p);
      double d;
      std::memcpy(&d, &ux, 8);
      out = d;
      return p + 8;
    }
    case ValueType::Text:
    {
      std::string s;
      p = decode_string(p, end, s);
      out = std::move(s);
      return p;
    }
    case ValueType::Id:
    {
      Id id{};
      p = decode_id(p, end, id);
      out = id;
      return p;
    }
    case ValueType::IdArray:
    {
      if (end - p < 4)
        throw CodecError("corrupt id array len");
      uint32_t n = read_be32(p);
      p += 4;
      if ((end - p) / 16 < static_cast<std::ptrdiff_t>(n))
        throw CodecError("corrupt id array data");
      IdArray ids(n);
      for (uint32_t i = 0; i < n; ++i)
        p = decode_id(p, end, ids[i]);
      out = std::move(ids);
      return p;
    }
    case ValueType::IntArray:
    {
      if (end - p < 4)
        throw CodecError("corrupt int array len");
      uint32_t n = read_be32(p);
      p += 4;
      if ((end - p) / 8 < static_cast<std::ptrdiff_t>(n))
        throw CodecError("corrupt int array data");
      IntArray xs(n);
      for (uint32_t i = 0; i < n; ++i, p += 8)
        xs[i] = static_cast<int64_t>(read_be64(p));
      out = std::move(xs);
      return p;
    }
    default:
      throw CodecError("unknown value tag");
    }
  }

  // -------------------- cells --------------------

  std::string encode_cell(const Cell &cell)
  {
    std::string s;
    s.reserve(4 + 8 + 4 + cell.data.size() * 24);
    put_be32(s, cell.header.schema);
    put_be64(s, cell.header.version);
    put_be32(s, static_cast<uint32_t>(cell.data.size()));
    for (const auto &[key, val] : cell.data)
    {
      encode_string(s, key);
      encode_value(s, val);
    }
    return s;
  }

  Cell decode_cell(const Id &id, std::string_view bytes)
  {
    const unsigned char *p = reinterpret_cast<const unsigned char *>(bytes.data());
    const unsigned char *end = p + bytes.size();
    if (end - p < 16)
      throw CodecError("corrupt cell header");
    Cell c{};
    c.header.id = id;
    c.header.schema = read_be32(p);
    c.header.version = read_be64(p + 4);
    uint32_t n = read_be32(p + 12);
    p += 16;
    for (uint32_t i = 0; i < n; ++i)
    {
      std::string key;
      Value val;
      p = decode_string(p, end, key);
      p = decode_value(p, end, val);
      c.data.emplace(std::move(key), std::move(val));
    }
    if (p != end)
      throw CodecError("trailing data in cell");
    return c;
  }

  // -------------------- identifiers --------------------

  Id encode_cell_key(uint32_t schemaId, const Value &key)
  {
    std::string bytes;
    encode_value(bytes, key);
    return Id{schemaId, fnv1a64(bytes)};
  }

  Id random_id(uint32_t schemaId)
  {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t lower = 0;
    while (lower == 0)
      lower = rng();
    return Id{schemaId, lower};
  }

  Id derive_id(uint32_t schemaId, const Id &base, uint64_t a, uint64_t b)
  {
    std::string bytes;
    bytes.reserve(32);
    encode_id(bytes, base);
    put_be64(bytes, a);
    put_be64(bytes, b);
    uint64_t lower = fnv1a64(bytes);
    return Id{schemaId, lower == 0 ? 1 : lower};
  }

} // namespace morpheus

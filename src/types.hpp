#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace morpheus
{

  // 128-bit cell identifier; {0, 0} is the unit (null) id
  struct Id
  {
    uint64_t higher{0};
    uint64_t lower{0};

    static Id unit() { return Id{}; }
    bool isUnit() const { return higher == 0 && lower == 0; }

    bool operator==(const Id &other) const = default;
    bool operator<(const Id &other) const
    {
      return higher != other.higher ? higher < other.higher : lower < other.lower;
    }
  };

  using IdArray = std::vector<Id>;
  using IntArray = std::vector<int64_t>;

  using Value = std::variant<std::monostate, bool, int64_t, double, std::string, Id, IdArray, IntArray>;

  // order matches Value alternatives
  enum class ValueType : uint8_t
  {
    Null = 0,
    Bool = 1,
    I64 = 2,
    F64 = 3,
    Text = 4,
    Id = 5,
    IdArray = 6,
    IntArray = 7
  };

  inline ValueType type_of(const Value &v) { return static_cast<ValueType>(v.index()); }

  using Map = std::map<std::string, Value>;

  struct CellHeader
  {
    uint32_t schema{0};
    Id id{};
    uint64_t version{0}; // 0 = never written
  };

  struct Cell
  {
    CellHeader header{};
    Map data{};
  };

  std::string to_string(const Id &id);

} // namespace morpheus

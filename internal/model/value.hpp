#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace schemadb::model {

enum class ColumnType : std::uint8_t {
  kText    = 0,
  kInteger = 1,
};

constexpr std::string_view ToString(ColumnType type) {
  switch (type) {
    case ColumnType::kInteger:
      return "INTEGER";
    case ColumnType::kText:
    default:
      return "TEXT";
  }
}

std::optional<ColumnType> ParseColumnType(std::string_view name);

/*
  A single cell.

  Declared columns are TEXT or INTEGER; double only shows up when reading
  physical data written by something else.
*/
using Value = std::variant<std::nullptr_t, std::int64_t, double, std::string>;

inline bool IsNull(const Value& value) {
  return std::holds_alternative<std::nullptr_t>(value);
}

std::string ToDisplayString(const Value& value);

struct Field {
  std::string name;
  Value       value;

  bool operator==(const Field& other) const {
    return name == other.name && value == other.value;
  }
  bool operator!=(const Field& other) const {
    return !(*this == other);
  }
};

// Ordered (column, value) pairs, physical order for raw rows and declared
// order for serialized instances.
using Row = std::vector<Field>;

const Value* FindField(const Row& row, std::string_view name);

// One entry of PRAGMA table_info.
struct ColumnInfo {
  int                        cid = 0;
  std::string                name;
  std::string                type;
  bool                       not_null = false;
  std::optional<std::string> default_literal;
  bool                       primary_key = false;
};

} // namespace schemadb::model

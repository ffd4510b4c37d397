#include "internal/model/value.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace schemadb::model {

std::optional<ColumnType> ParseColumnType(std::string_view name) {
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "TEXT") return ColumnType::kText;
  if (upper == "INTEGER") return ColumnType::kInteger;
  return std::nullopt;
}

std::string ToDisplayString(const Value& value) {
  if (std::holds_alternative<std::nullptr_t>(value)) {
    return "NULL";
  }
  if (const auto* i = std::get_if<std::int64_t>(&value)) {
    return std::to_string(*i);
  }
  if (const auto* d = std::get_if<double>(&value)) {
    std::ostringstream out;
    out << *d;
    return out.str();
  }
  return std::get<std::string>(value);
}

const Value* FindField(const Row& row, std::string_view name) {
  for (const auto& field : row) {
    if (field.name == name) return &field.value;
  }
  return nullptr;
}

} // namespace schemadb::model

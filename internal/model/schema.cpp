#include "internal/model/schema.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace schemadb::model {

namespace {

// Coerce a declared default to the column's storage type.
Value NormalizeDefault(const std::string& table, const ColumnDefinition& column, const Value& value) {
  if (IsNull(value)) return value;

  if (column.type == ColumnType::kText) {
    if (std::holds_alternative<std::string>(value)) return value;
    return ToDisplayString(value);
  }

  if (const auto* i = std::get_if<std::int64_t>(&value)) return *i;

  if (const auto* d = std::get_if<double>(&value)) {
    // [-2^63, 2^63) is exactly representable as double; outside it the cast is undefined
    constexpr double kMin = -9223372036854775808.0;
    constexpr double kMax = 9223372036854775808.0;
    if (!std::isfinite(*d) || *d < kMin || *d >= kMax) {
      throw util::ConfigurationError("default value for INTEGER column '" + table + "." + column.name + "' is out of range");
    }
    const auto truncated = static_cast<std::int64_t>(*d);
    if (static_cast<double>(truncated) == *d) return truncated;
  }

  if (const auto* s = std::get_if<std::string>(&value)) {
    errno          = 0;
    char* end      = nullptr;
    const auto num = std::strtoll(s->c_str(), &end, 10);
    if (!s->empty() && end && *end == '\0' && errno == 0) return static_cast<std::int64_t>(num);
  }

  throw util::ConfigurationError("default value for INTEGER column '" + table + "." + column.name + "' is not an integer");
}

} // namespace

bool IsValidIdentifier(std::string_view name) {
  if (name.empty()) return false;

  const auto first = static_cast<unsigned char>(name.front());
  if (!std::isalpha(first) && first != '_') return false;

  for (char c : name) {
    const auto uc = static_cast<unsigned char>(c);
    if (!std::isalnum(uc) && uc != '_') return false;
  }
  return true;
}

void RequireIdentifier(std::string_view what, std::string_view name) {
  if (!IsValidIdentifier(name)) {
    throw util::ConfigurationError("invalid " + std::string(what) + " identifier '" + std::string(name) + "'");
  }
}

std::string QuoteIdentifier(std::string_view name) {
  std::string out;
  out.reserve(name.size() + 2);
  out.push_back('"');
  for (char c : name) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

TableDefinition::TableDefinition(std::string name, std::vector<ColumnDefinition> columns)
    : name_(std::move(name)), columns_(std::move(columns)) {
  RequireIdentifier("table", name_);

  if (columns_.empty()) {
    throw util::ConfigurationError("table '" + name_ + "' declares no columns");
  }

  std::unordered_set<std::string> seen;
  for (std::size_t i = 0; i < columns_.size(); ++i) {
    auto& column = columns_[i];
    RequireIdentifier("column", column.name);

    if (!seen.insert(column.name).second) {
      throw util::ConfigurationError("duplicate column '" + column.name + "' in table '" + name_ + "'");
    }

    if (column.previous_name) {
      RequireIdentifier("column", *column.previous_name);
      if (*column.previous_name == column.name) column.previous_name.reset();
    }

    if (column.primary_key) {
      if (primary_key_index_) {
        throw util::ConfigurationError("table '" + name_ + "' declares more than one primary key");
      }
      primary_key_index_ = i;
    }

    if (column.default_value) {
      column.default_value = NormalizeDefault(name_, column, *column.default_value);
    }
  }
}

const ColumnDefinition* TableDefinition::PrimaryKey() const {
  return primary_key_index_ ? &columns_[*primary_key_index_] : nullptr;
}

const ColumnDefinition* TableDefinition::Find(std::string_view column) const {
  auto index = IndexOf(column);
  return index ? &columns_[*index] : nullptr;
}

std::optional<std::size_t> TableDefinition::IndexOf(std::string_view column) const {
  for (std::size_t i = 0; i < columns_.size(); ++i) {
    if (columns_[i].name == column) return i;
  }
  return std::nullopt;
}

Value TableDefinition::DefaultFor(std::size_t index) const {
  const auto& column = columns_.at(index);
  return column.default_value ? *column.default_value : Value{nullptr};
}

Schema::Schema(std::vector<TableDefinition> tables) : tables_(std::move(tables)) {
  std::unordered_set<std::string> seen;
  for (const auto& table : tables_) {
    if (!seen.insert(table.Name()).second) {
      throw util::ConfigurationError("duplicate table '" + table.Name() + "' in schema");
    }
  }
}

const TableDefinition* Schema::Find(std::string_view table) const {
  for (const auto& def : tables_) {
    if (def.Name() == table) return &def;
  }
  return nullptr;
}

} // namespace schemadb::model

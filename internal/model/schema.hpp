#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/value.hpp"

namespace schemadb::model {

/*
  Declarative table/column description.

  Built once, validated in the constructors, never mutated afterwards.
  Everything that ends up interpolated into SQL (table and column names)
  must pass IsValidIdentifier().
*/

struct ColumnDefinition {
  std::string name;
  ColumnType  type = ColumnType::kText;

  bool primary_key = false;

  // excluded from ToObject(false)
  bool sensitive = false;

  std::optional<Value> default_value;

  // physical name to rename from during migration
  std::optional<std::string> previous_name;
};

class TableDefinition {
 public:
  TableDefinition(std::string name, std::vector<ColumnDefinition> columns);

  const std::string& Name() const {
    return name_;
  }

  const std::vector<ColumnDefinition>& Columns() const {
    return columns_;
  }

  // nullptr for a key-less table
  const ColumnDefinition* PrimaryKey() const;

  const ColumnDefinition* Find(std::string_view column) const;

  std::optional<std::size_t> IndexOf(std::string_view column) const;

  // Declared default, or NULL when the column has none.
  Value DefaultFor(std::size_t index) const;

 private:
  std::string                   name_;
  std::vector<ColumnDefinition> columns_;
  std::optional<std::size_t>    primary_key_index_;
};

class Schema {
 public:
  Schema() = default;
  explicit Schema(std::vector<TableDefinition> tables);

  const std::vector<TableDefinition>& Tables() const {
    return tables_;
  }

  const TableDefinition* Find(std::string_view table) const;

  bool Contains(std::string_view table) const {
    return Find(table) != nullptr;
  }

 private:
  std::vector<TableDefinition> tables_;
};

bool IsValidIdentifier(std::string_view name);

// Throws util::ConfigurationError naming `what` when `name` is not a plain identifier.
void RequireIdentifier(std::string_view what, std::string_view name);

// "name" with embedded quotes doubled. Callers validate first.
std::string QuoteIdentifier(std::string_view name);

} // namespace schemadb::model

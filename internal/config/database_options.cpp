#include "internal/config/database_options.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "internal/util/errors.hpp"

namespace schemadb::config {

namespace rc = schemadb::runtime::config;

static model::Value ToValue(const google::protobuf::Value& value, const std::string& where) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      return nullptr;
    case google::protobuf::Value::kNumberValue:
      return value.number_value();
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kBoolValue:
      return static_cast<std::int64_t>(value.bool_value() ? 1 : 0);
    default:
      throw util::ConfigurationError("default value of " + where + " must be a scalar");
  }
}

static model::ColumnDefinition BuildColumn(const std::string& table, const rc::ColumnConfig& config) {
  const std::string where = table + "." + config.name();

  model::ColumnDefinition column;
  column.name = config.name();

  const std::string type = config.type().empty() ? "TEXT" : config.type();
  auto parsed = model::ParseColumnType(type);
  if (!parsed) {
    throw util::ConfigurationError("unknown column type '" + type + "' for " + where);
  }
  column.type        = *parsed;
  column.primary_key = config.pkey();
  column.sensitive   = config.sensitive();

  if (config.has_default_value()) {
    column.default_value = ToValue(config.default_value(), where);
  }
  if (!config.old().empty()) {
    column.previous_name = config.old();
  }
  return column;
}

model::Schema BuildSchema(const rc::SchemaConfig& config) {
  std::vector<model::TableDefinition> tables;
  tables.reserve(config.tables_size());

  for (const auto& table : config.tables()) {
    std::vector<model::ColumnDefinition> columns;
    columns.reserve(table.columns_size());
    for (const auto& column : table.columns()) {
      columns.push_back(BuildColumn(table.name(), column));
    }
    tables.emplace_back(table.name(), std::move(columns));
  }

  return model::Schema(std::move(tables));
}

core::DatabaseOptions BuildDatabaseOptions(const rc::RuntimeConfig& config) {
  if (config.database().path().empty()) {
    throw util::ConfigurationError("database.path is required");
  }

  core::DatabaseOptions options;
  options.path          = config.database().path();
  options.delete_unused = config.database().delete_unused();
  options.reorder       = config.database().reorder();
  options.schema        = BuildSchema(config.schema());

  const auto& backup     = config.maintenance().backup();
  options.backup_path    = backup.path();
  options.backup_enabled = backup.enabled();
  if (backup.interval_ms() > 0) {
    options.backup_interval = std::chrono::milliseconds(backup.interval_ms());
  }

  const auto& vacuum     = config.maintenance().vacuum();
  options.vacuum_enabled = vacuum.enabled();
  if (vacuum.interval_ms() > 0) {
    options.vacuum_interval = std::chrono::milliseconds(vacuum.interval_ms());
  }

  return options;
}

} // namespace schemadb::config

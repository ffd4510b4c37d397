#include "internal/orm/model.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace schemadb::orm {

using model::Value;

Model::Model(model::TableDefinition definition, std::shared_ptr<db::RowStore> store)
    : definition_(std::move(definition)), store_(std::move(store)) {
  for (const auto& column : definition_.Columns()) {
    columns_.emplace(column.name, BindColumn(column));
  }

  if (!PrimaryKey()) {
    SCHEMADB_LOG_WARN("table has no primary key, identity operations (find/save/delete/move/convert) are unavailable",
                      {observability::StringField("table", TableName())});
  }
}

const model::ColumnDefinition& Model::RequirePrimaryKey(std::string_view operation) const {
  const auto* pkey = PrimaryKey();
  if (!pkey) {
    throw util::ConfigurationError("cannot " + std::string(operation) + ": no primary key defined for table '" + TableName() + "'");
  }
  return *pkey;
}

ColumnActions Model::BindColumn(const model::ColumnDefinition& column) {
  const std::string name = column.name;

  auto set_value = [this, name](const Value& pkey, const Value& value) {
    const auto& key = RequirePrimaryKey("setValue");
    return store_->UpdateColumn(TableName(), name, value, key.name, pkey);
  };

  auto fetch = [this, name](const Value& value, db::Comparison comparison) {
    return ToInstances(store_->SelectRows(TableName(), name, value, comparison));
  };

  auto move = [this, name](const Model& destination, const Value& value, db::Comparison comparison) {
    return store_->MoveRows(TableName(), destination.TableName(), name, value, comparison);
  };

  auto update_values = [this, name](const Value& new_value, const std::string& where_column, const Value& where_value) {
    return store_->UpdateColumn(TableName(), name, new_value, where_column, where_value);
  };

  return ColumnActions(name, std::move(set_value), std::move(fetch), std::move(move), std::move(update_values));
}

std::vector<Instance> Model::ToInstances(const db::Result& result) const {
  std::vector<Instance> out;
  out.reserve(result.rows.size());
  for (const auto& row : result.rows) {
    out.push_back(FromObject(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Static side
// ------------------------------------------------------------------

std::optional<Instance> Model::Find(const Value& pkey) const {
  const auto& key = RequirePrimaryKey("find");

  db::Result r = store_->SelectOne(TableName(), key.name, pkey);
  if (!r.row) return std::nullopt;
  return FromObject(*r.row);
}

db::Result Model::Delete(const Value& pkey) const {
  const auto& key = RequirePrimaryKey("delete");
  return store_->DeleteOne(TableName(), key.name, pkey);
}

db::Result Model::Move(const Value& pkey, const Model& destination) const {
  const auto& key = RequirePrimaryKey("move");
  return store_->MoveRows(TableName(), destination.TableName(), key.name, pkey, db::Comparison::Equal, 1);
}

std::vector<Instance> Model::All() const {
  return ToInstances(store_->SelectRows(TableName(), {}, nullptr, db::Comparison::All));
}

Instance Model::Create(std::vector<Value> values) const {
  const auto& columns = definition_.Columns();
  if (values.size() > columns.size()) {
    throw util::ConfigurationError("create: " + std::to_string(values.size()) + " values for " + std::to_string(columns.size()) +
                                   " columns of table '" + TableName() + "'");
  }

  for (std::size_t i = values.size(); i < columns.size(); ++i) {
    values.push_back(definition_.DefaultFor(i));
  }
  return Instance(*this, std::move(values));
}

Instance Model::FromObject(const model::Row& fields) const {
  const auto&        columns = definition_.Columns();
  std::vector<Value> values;
  values.reserve(columns.size());

  for (std::size_t i = 0; i < columns.size(); ++i) {
    const Value* found = model::FindField(fields, columns[i].name);
    values.push_back(found ? *found : definition_.DefaultFor(i));
  }
  return Instance(*this, std::move(values));
}

db::Result Model::SetValue(const std::string& column, const Value& value, const Value& pkey) const {
  const auto& key = RequirePrimaryKey("setValue");
  return store_->UpdateColumn(TableName(), Column(column).Name(), value, key.name, pkey);
}

const ColumnActions& Model::Column(std::string_view name) const {
  auto it = columns_.find(name);
  if (it == columns_.end()) {
    throw util::ConfigurationError("unknown column '" + std::string(name) + "' in table '" + TableName() + "'");
  }
  return it->second;
}

} // namespace schemadb::orm

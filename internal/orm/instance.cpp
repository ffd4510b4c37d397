#include "internal/orm/instance.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/orm/model.hpp"
#include "internal/util/errors.hpp"

namespace schemadb::orm {

using model::Value;

Instance::Instance(const Model& model, std::vector<Value> values)
    : model_(&model), values_(std::move(values)), snapshot_(std::make_shared<const std::vector<Value>>(values_)) {
  if (values_.size() != model_->Definition().Columns().size()) {
    throw util::ConfigurationError("instance of '" + model_->TableName() + "' needs one value per declared column");
  }
}

std::size_t Instance::IndexOf(std::string_view column) const {
  auto index = model_->Definition().IndexOf(column);
  if (!index) {
    throw util::ConfigurationError("unknown column '" + std::string(column) + "' in table '" + model_->TableName() + "'");
  }
  return *index;
}

const Value& Instance::Get(std::string_view column) const {
  return values_[IndexOf(column)];
}

void Instance::Set(std::string_view column, Value value) {
  values_[IndexOf(column)] = std::move(value);
}

std::vector<std::string> Instance::ChangedColumns() const {
  const auto&              columns = model_->Definition().Columns();
  std::vector<std::string> changed;
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (columns[i].primary_key) continue;
    if (values_[i] != (*snapshot_)[i]) changed.push_back(columns[i].name);
  }
  return changed;
}

db::Result Instance::Save() {
  const auto& key     = model_->RequirePrimaryKey("save");
  const auto& columns = model_->Definition().Columns();
  const auto& table   = model_->TableName();
  auto&       store   = model_->Store();
  const Value pkey    = Get(key.name);

  db::Result exists = store.ValueExists(table, key.name, pkey);
  if (!exists.Succeeded()) return exists;

  if (!exists.status) {
    model::Row fields;
    fields.reserve(columns.size());
    for (std::size_t i = 0; i < columns.size(); ++i) {
      fields.push_back({columns[i].name, values_[i]});
    }

    db::Result r = store.InsertRow(table, fields);
    if (r.Succeeded()) snapshot_ = std::make_shared<const std::vector<Value>>(values_);
    return r;
  }

  // the primary key itself is never updated
  model::Row changes;
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (columns[i].primary_key || values_[i] == (*snapshot_)[i]) continue;
    changes.push_back({columns[i].name, values_[i]});
  }

  if (changes.empty()) {
    db::Result r = db::Result::Ok();
    r.changes    = 0;
    return r;
  }

  db::Result r = store.UpdateColumns(table, changes, key.name, pkey);
  if (r.Succeeded()) snapshot_ = std::make_shared<const std::vector<Value>>(values_);
  return r;
}

db::Result Instance::Delete() const {
  const auto& key = model_->RequirePrimaryKey("delete");
  return model_->Store().DeleteOne(model_->TableName(), key.name, Get(key.name));
}

db::Result Instance::Move(const Model& destination) const {
  const auto& key = model_->RequirePrimaryKey("move");
  return model_->Move(Get(key.name), destination);
}

std::optional<Instance> Instance::Convert(const Model& destination) const {
  model_->RequirePrimaryKey("convert");

  const auto& dest_key  = destination.RequirePrimaryKey("convert");
  Instance    converted = destination.FromObject(ToObject(true));

  // an existing destination row would turn Save() into a diff against itself
  db::Result taken = destination.Store().ValueExists(destination.TableName(), dest_key.name, converted.Get(dest_key.name));
  if (!taken.Succeeded() || taken.status) {
    SCHEMADB_LOG_WARN("convert aborted, destination key already present",
                      {observability::StringField("from", model_->TableName()), observability::StringField("to", destination.TableName()),
                       observability::IntField("code", db::ToInt(taken.Succeeded() ? db::StatusCode::Conflict : taken.code))});
    return std::nullopt;
  }

  db::Result saved = converted.Save();
  if (!saved) {
    SCHEMADB_LOG_WARN("convert aborted, destination save failed",
                      {observability::StringField("from", model_->TableName()), observability::StringField("to", destination.TableName()),
                       observability::IntField("code", db::ToInt(saved.code))});
    return std::nullopt;
  }

  db::Result deleted = Delete();
  if (!deleted.Succeeded()) {
    SCHEMADB_LOG_WARN("convert left the original row in place",
                      {observability::StringField("from", model_->TableName()), observability::StringField("error", deleted.message)});
  }
  return converted;
}

model::Row Instance::ToObject(bool include_sensitive) const {
  const auto& columns = model_->Definition().Columns();
  model::Row  out;
  out.reserve(columns.size());
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (columns[i].sensitive && !include_sensitive) continue;
    out.push_back({columns[i].name, values_[i]});
  }
  return out;
}

} // namespace schemadb::orm

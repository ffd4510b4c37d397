#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/row_store.hpp"
#include "internal/model/schema.hpp"
#include "internal/orm/column_actions.hpp"
#include "internal/orm/instance.hpp"

namespace schemadb::orm {

/*
  Generic typed API for one declared table.

  One Model per TableDefinition, sharing the database's RowStore. Identity
  operations (Find, Delete, Move, SetValue, Instance::Save/Delete/Move/
  Convert) need a declared primary key and throw util::ConfigurationError
  before touching the engine when there is none.

  Not copyable or movable: the per-column closures capture `this`.
*/
class Model {
 public:
  Model(model::TableDefinition definition, std::shared_ptr<db::RowStore> store);

  Model(const Model&)            = delete;
  Model& operator=(const Model&) = delete;

  const std::string& TableName() const {
    return definition_.Name();
  }

  const model::TableDefinition& Definition() const {
    return definition_;
  }

  // nullptr for a key-less table
  const model::ColumnDefinition* PrimaryKey() const {
    return definition_.PrimaryKey();
  }

  const model::ColumnDefinition& RequirePrimaryKey(std::string_view operation) const;

  std::optional<Instance> Find(const model::Value& pkey) const;
  db::Result              Delete(const model::Value& pkey) const;
  db::Result              Move(const model::Value& pkey, const Model& destination) const;

  // every row, unbounded
  std::vector<Instance> All() const;

  // unsaved instance; values in declared order, missing trailing values take defaults
  Instance Create(std::vector<model::Value> values) const;

  // unsaved instance; fields matched by name, missing ones take defaults, extras ignored
  Instance FromObject(const model::Row& fields) const;

  db::Result SetValue(const std::string& column, const model::Value& value, const model::Value& pkey) const;

  const ColumnActions& Column(std::string_view name) const;

  const std::map<std::string, ColumnActions, std::less<>>& Columns() const {
    return columns_;
  }

  db::RowStore& Store() const {
    return *store_;
  }

 private:
  ColumnActions BindColumn(const model::ColumnDefinition& column);

  std::vector<Instance> ToInstances(const db::Result& result) const;

  model::TableDefinition                           definition_;
  std::shared_ptr<db::RowStore>                    store_;
  std::map<std::string, ColumnActions, std::less<>> columns_;
};

} // namespace schemadb::orm

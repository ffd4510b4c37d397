#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/row_store.hpp"
#include "internal/model/value.hpp"
#include "internal/orm/instance.hpp"

namespace schemadb::orm {

class Model;

/*
  Per-column helpers of a Model.

  A bundle of closures bound to (table, column, row store) when the Model
  is built; Model::Columns() is the keyed collection of these.
*/
class ColumnActions {
 public:
  using SetValueFn     = std::function<db::Result(const model::Value& pkey, const model::Value& value)>;
  using FetchFn        = std::function<std::vector<Instance>(const model::Value& value, db::Comparison comparison)>;
  using MoveFn         = std::function<db::Result(const Model& destination, const model::Value& value, db::Comparison comparison)>;
  using UpdateValuesFn = std::function<db::Result(const model::Value& new_value, const std::string& where_column, const model::Value& where_value)>;

  ColumnActions(std::string name, SetValueFn set_value, FetchFn fetch, MoveFn move, UpdateValuesFn update_values)
      : name_(std::move(name)),
        set_value_(std::move(set_value)),
        fetch_(std::move(fetch)),
        move_(std::move(move)),
        update_values_(std::move(update_values)) {
  }

  const std::string& Name() const {
    return name_;
  }

  // this column on the row keyed by `pkey`; ConfigurationError on a key-less table
  db::Result SetValue(const model::Value& pkey, const model::Value& value) const {
    return set_value_(pkey, value);
  }

  std::vector<Instance> Fetch(const model::Value& value, db::Comparison comparison = db::Comparison::Equal) const {
    return fetch_(value, comparison);
  }

  // move every row matching this column into `destination`
  db::Result Move(const Model& destination, const model::Value& value, db::Comparison comparison = db::Comparison::Equal) const {
    return move_(destination, value, comparison);
  }

  // SET this column = new_value WHERE where_column = where_value
  db::Result UpdateValues(const model::Value& new_value, const ColumnActions& where_column, const model::Value& where_value) const {
    return update_values_(new_value, where_column.Name(), where_value);
  }

 private:
  std::string    name_;
  SetValueFn     set_value_;
  FetchFn        fetch_;
  MoveFn         move_;
  UpdateValuesFn update_values_;
};

} // namespace schemadb::orm

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/model/value.hpp"

namespace schemadb::orm {

class Model;

/*
  One in-memory row of a Model.

  Holds copied values in declared column order plus an immutable snapshot
  of the values as loaded (or as constructed). Save() diffs against the
  snapshot field by field and replaces it on success. Never holds a
  cursor; the Model it came from must outlive it.
*/
class Instance {
 public:
  Instance(const Model& model, std::vector<model::Value> values);

  const Model& Owner() const {
    return *model_;
  }

  // Throws util::ConfigurationError for an undeclared column.
  const model::Value& Get(std::string_view column) const;
  void                Set(std::string_view column, model::Value value);

  const std::vector<model::Value>& Values() const {
    return values_;
  }

  // Non-key columns whose value differs from the snapshot.
  std::vector<std::string> ChangedColumns() const;

  /*
    Insert when no row carries this instance's primary key, otherwise
    update only the changed non-key columns. Nothing changed: no write,
    {200, status true, changes 0}.
  */
  db::Result Save();

  db::Result Delete() const;

  // Relocate this row (by primary key) into `destination`'s table.
  db::Result Move(const Model& destination) const;

  /*
    Rebuild this row as an instance of `destination` (missing fields take
    defaults, extra fields are dropped), save it, then delete the original.
    std::nullopt when the destination save failed; the original is kept.
  */
  std::optional<Instance> Convert(const Model& destination) const;

  // Declared columns in order; sensitive ones only when `include_sensitive`.
  model::Row ToObject(bool include_sensitive = true) const;

 private:
  using Snapshot = std::shared_ptr<const std::vector<model::Value>>;

  std::size_t IndexOf(std::string_view column) const;

  const Model*              model_;
  std::vector<model::Value> values_;
  Snapshot                  snapshot_;
};

} // namespace schemadb::orm

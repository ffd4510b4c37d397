#pragma once

#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/table_catalog.hpp"
#include "internal/model/schema.hpp"

namespace schemadb::migration {

struct MigrationOptions {
  // drop physical tables/columns that are not declared
  bool delete_unused = false;

  // rebuild tables whose physical column order differs from the declaration
  bool reorder = false;
};

/*
  Structural changes applied by one Run(). All zero on a conformant
  database; failed_tables lists tables whose steps were cut short.
*/
struct MigrationReport {
  int tables_created  = 0;
  int tables_rebuilt  = 0;
  int tables_dropped  = 0;
  int columns_added   = 0;
  int columns_renamed = 0;
  int columns_dropped = 0;

  std::vector<std::string> failed_tables;

  int TotalChanges() const {
    return tables_created + tables_rebuilt + tables_dropped + columns_added + columns_renamed + columns_dropped;
  }
};

/*
  Reconciles physical tables/columns with a declared Schema.

  Per table: EnsureTable (create, or ReconcileColumns), then ReorderColumns
  when enabled. Steps are fail-fast per table: the first failing step
  skips the rest for that table, other tables still run. PruneTables runs
  last and only when every table succeeded. Nothing is rolled back across
  tables. Running twice in a row makes no changes the second time.
*/
class Migrator {
 public:
  Migrator(db::TableCatalog& catalog, MigrationOptions options);

  db::Result Run(const model::Schema& schema);

  db::Result EnsureTable(const model::TableDefinition& table);
  db::Result ReconcileColumns(const model::TableDefinition& table);

  // status=false when the order already matched and nothing was rebuilt
  db::Result ReorderColumns(const model::TableDefinition& table);

  db::Result PruneTables(const model::Schema& schema);

  const MigrationReport& Report() const {
    return report_;
  }

 private:
  db::TableCatalog& catalog_;
  MigrationOptions  options_;
  MigrationReport   report_;
};

} // namespace schemadb::migration

#include "internal/migration/migrator.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/row_store.hpp"

namespace {

using schemadb::db::Comparison;
using schemadb::db::Result;
using schemadb::db::RowStore;
using schemadb::db::TableCatalog;
using schemadb::db::sqlite::SqliteDB;
using schemadb::migration::MigrationOptions;
using schemadb::migration::Migrator;
using schemadb::model::ColumnDefinition;
using schemadb::model::ColumnType;
using schemadb::model::Schema;
using schemadb::model::TableDefinition;
using schemadb::model::Value;

struct Fixture {
  std::shared_ptr<SqliteDB>     db;
  std::unique_ptr<TableCatalog> catalog;
  std::unique_ptr<RowStore>     rows;

  explicit Fixture(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / "schemadb_migrator_tests";
    std::filesystem::create_directories(dir);
    const auto path = dir / (name + ".db");
    std::filesystem::remove(path);

    db = std::make_shared<SqliteDB>(path.string());
    catalog = std::make_unique<TableCatalog>(db, nullptr);
    rows    = std::make_unique<RowStore>(db, nullptr);
  }

  std::vector<std::string> ColumnNames(const std::string& table) {
    std::vector<std::string> names;
    for (const auto& info : catalog->TableInfo(table).info) names.push_back(info.name);
    return names;
  }

  // bumped by SQLite on every structural change
  std::int64_t SchemaVersion() {
    return std::get<std::int64_t>(db->All("PRAGMA schema_version;").front().front().value);
  }

  // each row as a set of "column=value" strings, independent of column order
  std::multiset<std::set<std::string>> RowSets(const std::string& table) {
    std::multiset<std::set<std::string>> out;
    for (const auto& row : rows->SelectRows(table, "", nullptr, Comparison::All).rows) {
      std::set<std::string> fields;
      for (const auto& field : row) fields.insert(field.name + "=" + schemadb::model::ToDisplayString(field.value));
      out.insert(fields);
    }
    return out;
  }
};

ColumnDefinition Column(std::string name, ColumnType type = ColumnType::kText, bool pkey = false) {
  ColumnDefinition column;
  column.name        = std::move(name);
  column.type        = type;
  column.primary_key = pkey;
  return column;
}

Schema ItemsSchema() {
  ColumnDefinition size = Column("size", ColumnType::kInteger);
  size.default_value    = Value{std::int64_t{0}};
  return Schema({TableDefinition("items", {Column("id", ColumnType::kText, true), Column("url"), size})});
}

void TestCreatesDeclaredTables() {
  Fixture  f("create");
  Migrator migrator(*f.catalog, MigrationOptions{});

  Result r = migrator.Run(ItemsSchema());
  assert(r);
  assert(migrator.Report().tables_created == 1);
  assert((f.ColumnNames("items") == std::vector<std::string>{"id", "url", "size"}));
  assert(f.catalog->TableInfo("items").info[0].primary_key);
}

void TestSecondRunIsNoOp() {
  Fixture f("idempotent");
  {
    Migrator first(*f.catalog, MigrationOptions{true, true});
    assert(first.Run(ItemsSchema()));
  }

  const auto before = f.SchemaVersion();
  Migrator   second(*f.catalog, MigrationOptions{true, true});
  Result     r = second.Run(ItemsSchema());
  assert(r);
  assert(r.changes == 0);
  assert(second.Report().TotalChanges() == 0);
  assert(f.SchemaVersion() == before);
}

void TestAddsMissingColumnsWithDefaults() {
  Fixture f("add");
  f.db->Exec("CREATE TABLE items (id TEXT PRIMARY KEY, url TEXT);");
  f.db->Exec("INSERT INTO items VALUES ('a', 'http://a');");

  Migrator migrator(*f.catalog, MigrationOptions{});
  assert(migrator.Run(ItemsSchema()));
  assert(migrator.Report().columns_added == 1);

  Result row = f.rows->SelectOne("items", "id", std::string("a"));
  assert(*schemadb::model::FindField(*row.row, "size") == Value{std::int64_t{0}});
}

void TestRenamesPreviousColumn() {
  Fixture f("rename");
  f.db->Exec("CREATE TABLE items (id TEXT PRIMARY KEY, link TEXT, size INTEGER);");
  f.db->Exec("INSERT INTO items VALUES ('a', 'http://a', 1);");

  ColumnDefinition url = Column("url");
  url.previous_name    = "link";
  Schema schema({TableDefinition("items", {Column("id", ColumnType::kText, true), url, Column("size", ColumnType::kInteger)})});

  Migrator migrator(*f.catalog, MigrationOptions{});
  assert(migrator.Run(schema));
  assert(migrator.Report().columns_renamed == 1);
  assert(migrator.Report().columns_added == 0);
  assert((f.ColumnNames("items") == std::vector<std::string>{"id", "url", "size"}));

  Result row = f.rows->SelectOne("items", "id", std::string("a"));
  assert(*schemadb::model::FindField(*row.row, "url") == Value{std::string("http://a")});

  // the old name is gone now: nothing left to rename
  Migrator again(*f.catalog, MigrationOptions{});
  assert(again.Run(schema));
  assert(again.Report().TotalChanges() == 0);
}

void TestDeleteUnusedDropsColumnsAndTables() {
  Fixture f("prune");
  f.db->Exec("CREATE TABLE items (id TEXT PRIMARY KEY, url TEXT, size INTEGER, legacy TEXT);");
  f.db->Exec("CREATE TABLE leftovers (x TEXT);");

  Migrator keep(*f.catalog, MigrationOptions{false, false});
  assert(keep.Run(ItemsSchema()));
  assert(f.catalog->TableExists("leftovers").status);
  assert(f.catalog->ColumnExists("items", "legacy").status);

  Migrator prune(*f.catalog, MigrationOptions{true, false});
  assert(prune.Run(ItemsSchema()));
  assert(prune.Report().tables_dropped == 1);
  assert(prune.Report().columns_dropped == 1);
  assert(!f.catalog->TableExists("leftovers").status);
  assert((f.ColumnNames("items") == std::vector<std::string>{"id", "url", "size"}));
}

void TestReorderPreservesRowData() {
  Fixture f("reorder");
  f.db->Exec("CREATE TABLE items (size INTEGER, extra TEXT, url TEXT, id TEXT PRIMARY KEY);");
  f.db->Exec("INSERT INTO items VALUES (1, 'e1', 'http://a', 'a');");
  f.db->Exec("INSERT INTO items VALUES (2, NULL, 'http://b', 'b');");
  f.db->Exec("INSERT INTO items VALUES (NULL, 'e3', NULL, 'c');");

  const auto before = f.RowSets("items");

  Migrator migrator(*f.catalog, MigrationOptions{false, true});
  assert(migrator.Run(ItemsSchema()));
  assert(migrator.Report().tables_rebuilt == 1);

  // declared first, leftovers after
  assert((f.ColumnNames("items") == std::vector<std::string>{"id", "url", "size", "extra"}));
  assert(f.RowSets("items") == before);

  const auto version = f.SchemaVersion();
  Result     again   = migrator.ReorderColumns(*ItemsSchema().Find("items"));
  assert(again.Succeeded());
  assert(!again.status);
  assert(f.SchemaVersion() == version);
}

void TestFailedTableBlocksPruning() {
  Fixture f("failure");
  f.db->Exec("CREATE TABLE leftovers (x TEXT);");
  // a view named like a declared table makes its reconciliation fail
  f.db->Exec("CREATE VIEW items AS SELECT 1 AS id;");

  Migrator migrator(*f.catalog, MigrationOptions{true, false});
  Result   r = migrator.Run(ItemsSchema());
  assert(!r.Succeeded());
  assert(migrator.Report().failed_tables.size() == 1);
  assert(migrator.Report().failed_tables.front() == "items");
  assert(f.catalog->TableExists("leftovers").status);
}

} // namespace

int main() {
  TestCreatesDeclaredTables();
  TestSecondRunIsNoOp();
  TestAddsMissingColumnsWithDefaults();
  TestRenamesPreviousColumn();
  TestDeleteUnusedDropsColumnsAndTables();
  TestReorderPreservesRowData();
  TestFailedTableBlocksPruning();

  std::cout << "schemadb_unit_migrator: pass\n";
  return 0;
}

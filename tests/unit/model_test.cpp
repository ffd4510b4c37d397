#include "internal/orm/model.hpp"

#include <cassert>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/row_store.hpp"
#include "internal/db/table_catalog.hpp"
#include "internal/migration/migrator.hpp"
#include "internal/orm/instance.hpp"
#include "internal/util/errors.hpp"

namespace {

using schemadb::db::Comparison;
using schemadb::db::Result;
using schemadb::db::RowStore;
using schemadb::db::StatusCode;
using schemadb::db::TableCatalog;
using schemadb::db::sqlite::SqliteDB;
using schemadb::model::ColumnDefinition;
using schemadb::model::ColumnType;
using schemadb::model::FindField;
using schemadb::model::Row;
using schemadb::model::Schema;
using schemadb::model::TableDefinition;
using schemadb::model::Value;
using schemadb::orm::Instance;
using schemadb::orm::Model;
using schemadb::util::ConfigurationError;

ColumnDefinition Column(std::string name, ColumnType type = ColumnType::kText, bool pkey = false) {
  ColumnDefinition column;
  column.name        = std::move(name);
  column.type        = type;
  column.primary_key = pkey;
  return column;
}

TableDefinition Items(const std::string& name) {
  return TableDefinition(name, {Column("id", ColumnType::kText, true), Column("url"), Column("size", ColumnType::kInteger)});
}

TableDefinition Users() {
  ColumnDefinition password = Column("password");
  password.sensitive        = true;
  ColumnDefinition role     = Column("role");
  role.default_value        = Value{std::string("viewer")};
  return TableDefinition("users", {Column("name", ColumnType::kText, true), password, role});
}

TableDefinition Members() {
  ColumnDefinition joined = Column("joined", ColumnType::kInteger);
  joined.default_value    = Value{std::int64_t{1}};
  return TableDefinition("members", {Column("name", ColumnType::kText, true), Column("role"), joined});
}

struct Fixture {
  std::shared_ptr<SqliteDB> db;
  std::shared_ptr<RowStore> rows;
  std::unique_ptr<Model>    items;
  std::unique_ptr<Model>    archive;
  std::unique_ptr<Model>    users;
  std::unique_ptr<Model>    members;
  std::unique_ptr<Model>    log;

  explicit Fixture(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / "schemadb_model_tests";
    std::filesystem::create_directories(dir);
    const auto path = dir / (name + ".db");
    std::filesystem::remove(path);

    db = std::make_shared<SqliteDB>(path.string());
    rows = std::make_shared<RowStore>(db, nullptr);

    Schema schema({Items("items"), Items("archive"), Users(), Members(), TableDefinition("log", {Column("line")})});

    TableCatalog                  catalog(db, nullptr);
    schemadb::migration::Migrator migrator(catalog, {});
    assert(migrator.Run(schema));

    items   = std::make_unique<Model>(*schema.Find("items"), rows);
    archive = std::make_unique<Model>(*schema.Find("archive"), rows);
    users   = std::make_unique<Model>(*schema.Find("users"), rows);
    members = std::make_unique<Model>(*schema.Find("members"), rows);
    log     = std::make_unique<Model>(*schema.Find("log"), rows);
  }
};

bool SameRow(const Row& actual, const Row& expected) {
  return actual == expected;
}

void TestCreateSaveFind() {
  Fixture f("create_find");

  Instance item = f.items->Create({std::string("a"), std::string("http://x"), std::int64_t{10}});
  Result   saved = item.Save();
  assert(saved.code == StatusCode::OK);
  assert(saved.status);

  auto found = f.items->Find(std::string("a"));
  assert(found.has_value());
  assert(SameRow(found->ToObject(true), Row{{"id", std::string("a")}, {"url", std::string("http://x")}, {"size", std::int64_t{10}}}));

  assert(!f.items->Find(std::string("missing")).has_value());
}

void TestColumnSetValue() {
  Fixture f("column_set_value");
  assert(f.items->Create({std::string("a"), std::string("http://x"), std::int64_t{10}}).Save());

  Result r = f.items->Column("url").SetValue(std::string("a"), std::string("http://y"));
  assert(r.code == StatusCode::OK);
  assert(r.status);
  assert(r.changes == 1);
  assert(f.items->Find(std::string("a"))->Get("url") == Value{std::string("http://y")});

  Result by_model = f.items->SetValue("size", std::int64_t{11}, std::string("a"));
  assert(by_model.changes == 1);
  assert(f.items->Find(std::string("a"))->Get("size") == Value{std::int64_t{11}});
}

void TestSaveWritesOnlyChangedColumns() {
  Fixture f("diff_save");
  assert(f.items->Create({std::string("a"), std::string("http://x"), std::int64_t{10}}).Save());

  auto item = f.items->Find(std::string("a"));
  assert(item->ChangedColumns().empty());

  item->Set("size", std::int64_t{20});
  assert((item->ChangedColumns() == std::vector<std::string>{"size"}));

  // a write behind the instance's back to a column it didn't touch survives the save
  assert(f.items->SetValue("url", std::string("http://other"), std::string("a")));

  Result r = item->Save();
  assert(r);
  assert(r.changes == 1);

  auto reloaded = f.items->Find(std::string("a"));
  assert(reloaded->Get("size") == Value{std::int64_t{20}});
  assert(reloaded->Get("url") == Value{std::string("http://other")});

  // snapshot was refreshed: nothing left to write
  assert(item->ChangedColumns().empty());
  Result again = item->Save();
  assert(again.code == StatusCode::OK);
  assert(again.status);
  assert(again.changes == 0);
}

void TestDelete() {
  Fixture f("delete");
  assert(f.items->Create({std::string("a"), std::string("u"), std::int64_t{1}}).Save());
  assert(f.items->Create({std::string("b"), std::string("u"), std::int64_t{2}}).Save());

  assert(f.items->Delete(std::string("a")));
  assert(!f.items->Find(std::string("a")).has_value());

  auto b = f.items->Find(std::string("b"));
  assert(b->Delete());
  assert(f.items->All().empty());
}

void TestMove() {
  Fixture f("move");
  assert(f.items->Create({std::string("a"), std::string("u"), std::int64_t{1}}).Save());

  auto item = f.items->Find(std::string("a"));
  assert(item->Move(*f.archive));
  assert(!f.items->Find(std::string("a")).has_value());

  auto moved = f.archive->Find(std::string("a"));
  assert(moved.has_value());
  assert(moved->Get("size") == Value{std::int64_t{1}});

  assert(f.archive->Move(std::string("a"), *f.items));
  assert(f.items->Find(std::string("a")).has_value());
}

void TestColumnHelpers() {
  Fixture f("column_helpers");
  assert(f.items->Create({std::string("a"), std::string("u"), std::int64_t{1}}).Save());
  assert(f.items->Create({std::string("b"), std::string("u"), std::int64_t{5}}).Save());
  assert(f.items->Create({std::string("c"), std::string("v"), std::int64_t{9}}).Save());

  auto matches = f.items->Column("url").Fetch(std::string("u"), Comparison::Equal);
  assert(matches.size() == 2);

  auto large = f.items->Column("size").Fetch(std::int64_t{5}, Comparison::GreaterEqual);
  assert(large.size() == 2);

  Result updated = f.items->Column("url").UpdateValues(std::string("w"), f.items->Column("size"), std::int64_t{9});
  assert(updated.changes == 1);
  assert(f.items->Find(std::string("c"))->Get("url") == Value{std::string("w")});

  Result moved = f.items->Column("size").Move(*f.archive, std::int64_t{5}, Comparison::Less);
  assert(moved.changes == 1);
  assert(f.archive->Find(std::string("a")).has_value());
  assert(f.items->All().size() == 2);

  assert(f.items->Columns().size() == 3);
}

void TestConvert() {
  Fixture f("convert");
  assert(f.users->Create({std::string("ann"), std::string("secret")}).Save());

  auto user = f.users->Find(std::string("ann"));
  assert(user->Get("role") == Value{std::string("viewer")});

  // fields missing in the source take destination defaults, extra ones are dropped
  auto member = user->Convert(*f.members);
  assert(member.has_value());
  assert(SameRow(member->ToObject(true), Row{{"name", std::string("ann")}, {"role", std::string("viewer")}, {"joined", std::int64_t{1}}}));

  assert(!f.users->Find(std::string("ann")).has_value());
  assert(f.members->Find(std::string("ann")).has_value());
}

void TestConvertKeepsOriginalOnFailure() {
  Fixture f("convert_failure");
  f.db->Exec("CREATE TABLE strict_items (id TEXT PRIMARY KEY, url TEXT, size INTEGER, owner TEXT NOT NULL);");
  Model strict(TableDefinition("strict_items", {Column("id", ColumnType::kText, true), Column("url"), Column("size", ColumnType::kInteger)}),
               f.rows);

  assert(f.items->Create({std::string("a"), std::string("u"), std::int64_t{1}}).Save());
  auto item = f.items->Find(std::string("a"));

  // owner has no value and no default: the destination insert fails
  auto converted = item->Convert(strict);
  assert(!converted.has_value());
  assert(f.items->Find(std::string("a")).has_value());
  assert(!strict.Find(std::string("a")).has_value());
}

void TestConvertMovesRow() {
  Fixture f("convert_move");
  assert(f.items->Create({std::string("a"), std::string("u"), std::int64_t{1}}).Save());

  auto converted = f.items->Find(std::string("a"))->Convert(*f.archive);
  assert(converted.has_value());
  assert(&converted->Owner() == f.archive.get());
  assert(!f.items->Find(std::string("a")).has_value());
  assert(f.archive->Find(std::string("a"))->Get("url") == Value{std::string("u")});
}

void TestConvertRefusesExistingDestinationKey() {
  Fixture f("convert_clash");
  assert(f.items->Create({std::string("a"), std::string("NEW"), std::int64_t{1}}).Save());
  assert(f.archive->Create({std::string("a"), std::string("OLD"), std::int64_t{2}}).Save());

  auto converted = f.items->Find(std::string("a"))->Convert(*f.archive);
  assert(!converted.has_value());

  // both rows stay exactly as they were
  assert(f.items->Find(std::string("a"))->Get("url") == Value{std::string("NEW")});
  assert(f.archive->Find(std::string("a"))->Get("url") == Value{std::string("OLD")});
}

void TestSensitiveColumnsAreHidden() {
  Fixture f("sensitive");
  Instance user = f.users->Create({std::string("ann"), std::string("secret"), std::string("admin")});

  Row open = user.ToObject(false);
  assert(FindField(open, "password") == nullptr);
  assert(open.size() == 2);

  Row full = user.ToObject(true);
  assert(FindField(full, "password") != nullptr);
  assert(*FindField(full, "password") == Value{std::string("secret")});
}

void TestKeylessTableRejectsIdentityOperations() {
  Fixture f("keyless");
  Instance line = f.log->Create({std::string("hello")});

  auto throws = [](auto&& fn) {
    try {
      fn();
    } catch (const ConfigurationError&) {
      return true;
    }
    return false;
  };

  assert(throws([&] { (void)f.log->Find(std::string("hello")); }));
  assert(throws([&] { (void)f.log->Delete(std::string("hello")); }));
  assert(throws([&] { (void)f.log->Move(std::string("hello"), *f.items); }));
  assert(throws([&] { (void)line.Save(); }));
  assert(throws([&] { (void)line.Delete(); }));
  assert(throws([&] { (void)line.Move(*f.items); }));
  assert(throws([&] { (void)line.Convert(*f.items); }));
  assert(throws([&] { (void)f.log->Column("line").SetValue(std::string("x"), std::string("y")); }));

  // nothing reached the engine
  assert(f.log->All().empty());

  // scans still work
  assert(f.rows->Insert("log", {std::string("raw")}));
  assert(f.log->All().size() == 1);
  assert(f.log->Column("line").Fetch(std::string("raw"), Comparison::Equal).size() == 1);
}

void TestUnknownColumnsAndArity() {
  Fixture f("unknown");
  bool threw = false;
  try {
    (void)f.items->Column("nope");
  } catch (const ConfigurationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)f.items->Create({std::string("a"), std::string("b"), std::int64_t{1}, std::int64_t{2}});
  } catch (const ConfigurationError&) {
    threw = true;
  }
  assert(threw);

  Instance partial = f.items->Create({std::string("a")});
  assert(partial.Get("url") == Value{nullptr});
}

} // namespace

int main() {
  TestCreateSaveFind();
  TestColumnSetValue();
  TestSaveWritesOnlyChangedColumns();
  TestDelete();
  TestMove();
  TestColumnHelpers();
  TestConvert();
  TestConvertKeepsOriginalOnFailure();
  TestConvertMovesRow();
  TestConvertRefusesExistingDestinationKey();
  TestSensitiveColumnsAreHidden();
  TestKeylessTableRejectsIdentityOperations();
  TestUnknownColumnsAndArity();

  std::cout << "schemadb_unit_model: pass\n";
  return 0;
}

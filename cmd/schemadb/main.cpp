#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "internal/config/config_loader.hpp"
#include "internal/config/database_options.hpp"
#include "internal/core/database.hpp"
#include "internal/observability/logging.hpp"

using schemadb::core::Database;
using schemadb::db::Result;

static void Usage() {
  std::cout << "Usage:\n"
            << "  schemadb <config.yaml> migrate\n"
            << "  schemadb <config.yaml> tables\n"
            << "  schemadb <config.yaml> info <table>\n"
            << "  schemadb <config.yaml> dump <table>\n"
            << "  schemadb <config.yaml> backup [path]\n"
            << "  schemadb <config.yaml> vacuum\n";
}

static void PrintRow(const schemadb::model::Row& row) {
  bool first = true;
  for (const auto& field : row) {
    if (!first) std::cout << "\t";
    std::cout << field.name << "=" << schemadb::model::ToDisplayString(field.value);
    first = false;
  }
  std::cout << "\n";
}

static int Report(const Result& r) {
  std::cout << "code=" << schemadb::db::ToInt(r.code) << " status=" << (r.status ? "true" : "false");
  if (r.changes) std::cout << " changes=" << *r.changes;
  if (!r.message.empty()) std::cout << " message=\"" << r.message << "\"";
  std::cout << "\n";
  return r.Succeeded() || r.code == schemadb::db::StatusCode::NoExistingBackup ? 0 : 2;
}

static int Run(Database& db, const std::string& cmd, int argc, char** argv) {
  // ------------------------------------------------------------
  // migrate: Open() already ran it, print what changed
  // ------------------------------------------------------------
  if (cmd == "migrate") {
    const auto& report = db.LastMigration();
    std::cout << "tables_created=" << report.tables_created << " tables_rebuilt=" << report.tables_rebuilt
              << " tables_dropped=" << report.tables_dropped << " columns_added=" << report.columns_added
              << " columns_renamed=" << report.columns_renamed << " columns_dropped=" << report.columns_dropped << "\n";
    return 0;
  }

  if (cmd == "tables") {
    Result r = db.Catalog().ListTables();
    if (!r.Succeeded()) return Report(r);
    for (const auto& row : r.rows) {
      std::cout << schemadb::model::ToDisplayString(row.front().value) << "\n";
    }
    return 0;
  }

  if (cmd == "info") {
    if (argc < 4) {
      Usage();
      return 1;
    }
    Result r = db.Catalog().TableInfo(argv[3]);
    if (!r.Succeeded()) return Report(r);
    for (const auto& column : r.info) {
      std::cout << column.cid << "\t" << column.name << "\t" << column.type << (column.not_null ? "\tNOT NULL" : "")
                << (column.primary_key ? "\tPK" : "") << (column.default_literal ? "\tDEFAULT " + *column.default_literal : "")
                << "\n";
    }
    return 0;
  }

  if (cmd == "dump") {
    if (argc < 4) {
      Usage();
      return 1;
    }
    Result r = db.Rows().SelectRows(argv[3], "", nullptr, schemadb::db::Comparison::All);
    if (!r.Succeeded()) return Report(r);
    for (const auto& row : r.rows) PrintRow(row);
    return 0;
  }

  if (cmd == "backup") {
    std::optional<std::string> destination;
    if (argc >= 4) destination = argv[3];
    return Report(db.Backup(destination));
  }

  if (cmd == "vacuum") {
    return Report(db.Vacuum());
  }

  Usage();
  return 1;
}

static int Execute(schemadb::core::DatabaseOptions options, const std::string& cmd, int argc, char** argv) {
  Database db(std::move(options));

  Result opened = db.Open();
  if (!opened.Succeeded()) return Report(opened);

  int rc = Run(db, cmd, argc, argv);

  Result closed = db.Close();
  if (!closed.Succeeded() && rc == 0) rc = Report(closed);
  return rc;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = schemadb::config::ConfigLoader::LoadFromYaml(config_path);
    schemadb::observability::InitializeLogging(config);

    auto options = schemadb::config::BuildDatabaseOptions(config);

    // one-shot command, no background maintenance
    options.backup_enabled = false;
    options.vacuum_enabled = false;

    int rc = Execute(std::move(options), cmd, argc, argv);
    schemadb::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    SCHEMADB_LOG_ERROR("Fatal error", {schemadb::observability::StringField("error", e.what())});
    schemadb::observability::ShutdownLogging();
    return 2;
  }
}

#pragma once

namespace schemadb::db::sql {

/*
  Fixed catalog SQL.

  Statements that need table or column names are assembled by the
  row store / catalog from validated, quoted identifiers.
*/

static constexpr const char* SELECT_USER_TABLES =
    "SELECT name FROM sqlite_master"
    " WHERE type='table' AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\'"
    " ORDER BY name;";

static constexpr const char* SELECT_TABLE_EXISTS =
    "SELECT name FROM sqlite_master WHERE type='table' AND name=?;";

// table-valued pragma so the table name binds as a parameter
static constexpr const char* SELECT_TABLE_INFO =
    "SELECT cid,name,type,\"notnull\",dflt_value,pk"
    " FROM pragma_table_info(?) ORDER BY cid;";

static constexpr const char* BEGIN    = "BEGIN;";
static constexpr const char* COMMIT   = "COMMIT;";
static constexpr const char* ROLLBACK = "ROLLBACK;";
static constexpr const char* VACUUM   = "VACUUM;";

}

#pragma once

#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace aiknowsys::db::sqlite {

/*
  Knowledge-base schema.

  Every statement is idempotent (IF NOT EXISTS) and is re-applied on each
  Init(), after older layouts are migrated. The *_fts tables are FTS5 external-content tables; only the
  triggers below write to them.
*/
const std::vector<std::string>& SchemaStatements();

// Stored in PRAGMA user_version once the schema is applied.
// 2: plans keyed by <project_id>:<name>
constexpr int kSchemaVersion = 2;

// Throws std::runtime_error when a statement fails or the file was written
// by a newer schema.
void ApplySchema(SqliteDB& db);

} // namespace aiknowsys::db::sqlite

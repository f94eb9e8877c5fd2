#include "schema.hpp"

#include <stdexcept>

namespace aiknowsys::db::sqlite {

namespace {

// FTS5 external content: removal must go through the 'delete' command with the old values.
std::vector<std::string> FtsStatements(const std::string& table, const std::string& columns) {
  const std::string fts    = table + "_fts";
  std::string       new_values;
  std::string       old_values;
  {
    std::size_t start = 0;
    while (true) {
      auto comma = columns.find(',', start);
      auto col   = columns.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
      new_values += (new_values.empty() ? "" : ", ") + std::string("new.") + col;
      old_values += (old_values.empty() ? "" : ", ") + std::string("old.") + col;
      if (comma == std::string::npos) break;
      start = comma + 1;
    }
  }

  return {
      "CREATE VIRTUAL TABLE IF NOT EXISTS " + fts + " USING fts5(" + columns + ", content='" + table + "', content_rowid='rowid', tokenize='porter unicode61');",
      "CREATE TRIGGER IF NOT EXISTS " + table + "_ai AFTER INSERT ON " + table + " BEGIN INSERT INTO " + fts + "(rowid, " + columns + ") VALUES (new.rowid, " +
          new_values + "); END;",
      "CREATE TRIGGER IF NOT EXISTS " + table + "_ad AFTER DELETE ON " + table + " BEGIN INSERT INTO " + fts + "(" + fts + ", rowid, " + columns +
          ") VALUES ('delete', old.rowid, " + old_values + "); END;",
      "CREATE TRIGGER IF NOT EXISTS " + table + "_au AFTER UPDATE ON " + table + " BEGIN INSERT INTO " + fts + "(" + fts + ", rowid, " + columns +
          ") VALUES ('delete', old.rowid, " + old_values + "); INSERT INTO " + fts + "(rowid, " + columns + ") VALUES (new.rowid, " + new_values + "); END;",
  };
}

std::vector<std::string> BuildSchema() {
  std::vector<std::string> sql = {
      "CREATE TABLE IF NOT EXISTS projects (id TEXT PRIMARY KEY, name TEXT NOT NULL, path TEXT, tech_stack TEXT NOT NULL DEFAULT '{}', created_at TEXT NOT NULL, "
      "updated_at TEXT NOT NULL);",

      // id = <project_id>:<name>, so two projects may hold a plan of the same name
      "CREATE TABLE IF NOT EXISTS plans (id TEXT PRIMARY KEY, project_id TEXT NOT NULL REFERENCES projects(id) ON DELETE CASCADE, name TEXT NOT NULL, "
      "title TEXT NOT NULL, "
      "status TEXT NOT NULL CHECK (status IN ('ACTIVE','PAUSED','PLANNED','COMPLETE','CANCELLED')), author TEXT NOT NULL DEFAULT 'unknown', priority TEXT, "
      "type TEXT, description TEXT, topics TEXT NOT NULL DEFAULT '[]', file TEXT, content TEXT NOT NULL DEFAULT '', created_at TEXT NOT NULL, "
      "updated_at TEXT NOT NULL);",

      // same keying as plans; plan_id is a free-text reference, not a foreign key
      "CREATE TABLE IF NOT EXISTS sessions (id TEXT PRIMARY KEY, project_id TEXT NOT NULL REFERENCES projects(id) ON DELETE CASCADE, name TEXT NOT NULL, "
      "date TEXT NOT NULL, topic TEXT NOT NULL, plan_id TEXT, status TEXT, phases TEXT NOT NULL DEFAULT '[]', topics TEXT NOT NULL DEFAULT '[]', file TEXT, "
      "content TEXT NOT NULL DEFAULT '', created_at TEXT NOT NULL, updated_at TEXT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS patterns (id INTEGER PRIMARY KEY AUTOINCREMENT, project_id TEXT NOT NULL REFERENCES projects(id) ON DELETE CASCADE, "
      "slug TEXT NOT NULL, category TEXT NOT NULL, title TEXT NOT NULL, keywords TEXT NOT NULL DEFAULT '[]', file TEXT, content TEXT NOT NULL DEFAULT '', "
      "created_at TEXT NOT NULL, UNIQUE (project_id, slug));",

      "CREATE INDEX IF NOT EXISTS idx_plans_project_status ON plans(project_id, status);",
      "CREATE INDEX IF NOT EXISTS idx_plans_updated ON plans(updated_at);",
      "CREATE INDEX IF NOT EXISTS idx_sessions_project_date ON sessions(project_id, date);",
      "CREATE INDEX IF NOT EXISTS idx_sessions_plan ON sessions(plan_id);",
  };

  for (auto& stmt : FtsStatements("plans", "title,content")) sql.push_back(std::move(stmt));
  for (auto& stmt : FtsStatements("sessions", "topic,content")) sql.push_back(std::move(stmt));
  for (auto& stmt : FtsStatements("patterns", "title,content")) sql.push_back(std::move(stmt));
  return sql;
}

// Version 1 keyed plans by their bare name. Plans are derived from the
// markdown files, so the old table is dropped and the next rebuild refills it.
void MigratePlanKeys(SqliteDB& db) {
  auto st = db.Prepare("SELECT COUNT(*), COALESCE(SUM(name = 'name'), 0) FROM pragma_table_info('plans');");
  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw std::runtime_error(db.Path() + ": cannot inspect plans table: " + sqlite3_errmsg(db.Handle()));
  }
  const bool exists   = sqlite3_column_int(st.get(), 0) > 0;
  const bool has_name = sqlite3_column_int(st.get(), 1) > 0;
  st.reset();
  if (!exists || has_name) return;

  db.Exec("DROP TRIGGER IF EXISTS plans_ai;");
  db.Exec("DROP TRIGGER IF EXISTS plans_ad;");
  db.Exec("DROP TRIGGER IF EXISTS plans_au;");
  db.Exec("DROP TABLE IF EXISTS plans_fts;");
  db.Exec("DROP TABLE plans;");
}

} // namespace

const std::vector<std::string>& SchemaStatements() {
  static const std::vector<std::string> kSchema = BuildSchema();
  return kSchema;
}

void ApplySchema(SqliteDB& db) {
  const int version = db.UserVersion();
  if (version > kSchemaVersion) {
    throw std::runtime_error(db.Path() + ": schema version " + std::to_string(version) + " is newer than this build supports (" +
                             std::to_string(kSchemaVersion) + ")");
  }

  if (version < 2) MigratePlanKeys(db);

  for (const auto& sql : SchemaStatements()) {
    db.Exec(sql);
  }

  // fail early if an existing database predates these columns
  db.Exec("SELECT id,project_id,name,title,status,author,topics,file,content,created_at,updated_at FROM plans LIMIT 1;");
  db.Exec("SELECT id,project_id,name,date,topic,plan_id,phases,topics,file,content FROM sessions LIMIT 1;");
  db.Exec("SELECT id,project_id,slug,category,title,keywords,file,content,created_at FROM patterns LIMIT 1;");

  if (version != kSchemaVersion) db.SetUserVersion(kSchemaVersion);
}

} // namespace aiknowsys::db::sqlite

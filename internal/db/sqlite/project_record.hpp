#pragma once

#include <string>

namespace aiknowsys::db::sqlite {

/*
  Row of the SQLite `projects` table. Plans, sessions and patterns of one
  repository hang off it, so several repositories can share a database.
*/
struct ProjectRecord {
  std::string id;
  std::string name;
  std::string path;

  // JSON object text
  std::string tech_stack = "{}";

  std::string created_at;
  std::string updated_at;
};

} // namespace aiknowsys::db::sqlite

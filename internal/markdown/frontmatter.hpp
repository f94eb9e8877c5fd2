#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace aiknowsys::markdown {

/*
  Typed view of a YAML frontmatter block.

  Only the keys the knowledge base understands are kept; unknown keys are
  ignored. Lists accept either a YAML sequence or a single scalar.
*/
struct Frontmatter {
  std::optional<std::string> id;
  std::optional<std::string> title;
  std::optional<std::string> status;
  std::optional<std::string> author;
  std::optional<std::string> created;
  std::optional<std::string> updated;
  std::optional<std::string> date;
  std::optional<std::string> topic;
  std::optional<std::string> plan;
  std::optional<std::string> description;
  std::optional<std::string> priority;
  std::optional<std::string> type;
  std::optional<std::string> category;

  std::vector<std::string> topics;
  std::vector<std::string> phases;
  std::vector<std::string> keywords;
};

struct ParsedDocument {
  Frontmatter frontmatter;
  bool        has_frontmatter = false;
  std::string body;

  // Per-field problems (wrong YAML shape); the field is left unset.
  std::vector<std::string> warnings;
};

// YAML syntax error, or a frontmatter block that is not a mapping.
class FrontmatterError : public std::runtime_error {
 public:
  explicit FrontmatterError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// CRLF is normalized before parsing. Throws FrontmatterError.
ParsedDocument ParseDocument(std::string_view text);

} // namespace aiknowsys::markdown

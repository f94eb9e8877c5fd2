#include "internal/markdown/frontmatter.hpp"

#include <yaml-cpp/yaml.h>

#include <utility>

#include "internal/util/strings.hpp"

namespace aiknowsys::markdown {

namespace {

std::string NormalizeNewlines(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\r') {
      if (i + 1 < text.size() && text[i + 1] == '\n') continue;
      out.push_back('\n');
      continue;
    }
    out.push_back(text[i]);
  }
  return out;
}

bool IsDelimiter(std::string_view line) {
  return util::Trim(line) == "---";
}

void ReadScalar(const YAML::Node& root, const char* key, std::optional<std::string>& out, std::vector<std::string>& warnings) {
  const auto node = root[key];
  if (!node || node.IsNull()) {
    return;
  }
  if (!node.IsScalar()) {
    warnings.push_back(std::string("frontmatter field '") + key + "' must be a scalar");
    return;
  }
  out = util::Trim(node.Scalar());
}

void ReadList(const YAML::Node& root, const char* key, std::vector<std::string>& out, std::vector<std::string>& warnings) {
  const auto node = root[key];
  if (!node || node.IsNull()) {
    return;
  }
  if (node.IsScalar()) {
    // "topics: a, b" is common in hand-written files
    const std::string scalar = node.Scalar();
    std::size_t       start  = 0;
    while (true) {
      const auto comma = scalar.find(',', start);
      auto       item  = util::Trim(std::string_view(scalar).substr(start, comma == std::string::npos ? std::string::npos : comma - start));
      if (!item.empty()) out.push_back(std::move(item));
      if (comma == std::string::npos) break;
      start = comma + 1;
    }
    return;
  }
  if (!node.IsSequence()) {
    warnings.push_back(std::string("frontmatter field '") + key + "' must be a list");
    return;
  }
  for (const auto& item : node) {
    if (item.IsScalar()) {
      out.push_back(util::Trim(item.Scalar()));
    } else {
      warnings.push_back(std::string("frontmatter field '") + key + "' contains a non-scalar item");
    }
  }
}

Frontmatter ToFrontmatter(const YAML::Node& root, std::vector<std::string>& warnings) {
  Frontmatter fm;
  ReadScalar(root, "id", fm.id, warnings);
  ReadScalar(root, "title", fm.title, warnings);
  ReadScalar(root, "status", fm.status, warnings);
  ReadScalar(root, "author", fm.author, warnings);
  ReadScalar(root, "created", fm.created, warnings);
  ReadScalar(root, "updated", fm.updated, warnings);
  ReadScalar(root, "date", fm.date, warnings);
  ReadScalar(root, "topic", fm.topic, warnings);
  ReadScalar(root, "plan", fm.plan, warnings);
  ReadScalar(root, "description", fm.description, warnings);
  ReadScalar(root, "priority", fm.priority, warnings);
  ReadScalar(root, "type", fm.type, warnings);
  ReadScalar(root, "category", fm.category, warnings);
  ReadList(root, "topics", fm.topics, warnings);
  ReadList(root, "phases", fm.phases, warnings);
  ReadList(root, "keywords", fm.keywords, warnings);
  return fm;
}

} // namespace

ParsedDocument ParseDocument(std::string_view text) {
  ParsedDocument doc;
  const std::string normalized = NormalizeNewlines(text);

  const auto first_end = normalized.find('\n');
  if (first_end == std::string::npos || !IsDelimiter(std::string_view(normalized).substr(0, first_end))) {
    doc.body = normalized;
    return doc;
  }

  // find the closing delimiter line
  std::size_t line_start = first_end + 1;
  std::size_t close_start = std::string::npos;
  std::size_t close_end   = std::string::npos;
  while (line_start <= normalized.size()) {
    auto line_end = normalized.find('\n', line_start);
    const auto len = (line_end == std::string::npos ? normalized.size() : line_end) - line_start;
    if (IsDelimiter(std::string_view(normalized).substr(line_start, len))) {
      close_start = line_start;
      close_end   = line_end == std::string::npos ? normalized.size() : line_end + 1;
      break;
    }
    if (line_end == std::string::npos) break;
    line_start = line_end + 1;
  }

  if (close_start == std::string::npos) {
    // unterminated block: treat the whole file as body
    doc.body = normalized;
    return doc;
  }

  const std::string block = normalized.substr(first_end + 1, close_start - (first_end + 1));
  doc.body                = normalized.substr(close_end);
  doc.has_frontmatter     = true;

  YAML::Node root;
  try {
    root = YAML::Load(block);
  } catch (const YAML::Exception& e) {
    throw FrontmatterError("invalid YAML frontmatter: " + std::string(e.what()));
  }

  if (root.IsNull()) {
    return doc;
  }
  if (!root.IsMap()) {
    throw FrontmatterError("frontmatter must be a YAML mapping");
  }

  doc.frontmatter = ToFrontmatter(root, doc.warnings);
  return doc;
}

} // namespace aiknowsys::markdown

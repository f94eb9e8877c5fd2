#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"

namespace aiknowsys::config {

using aiknowsys::runtime::config::ProjectConfig;
using aiknowsys::runtime::config::RuntimeConfig;

namespace {

/*
  YAML has no schema of its own, so plain scalars are typed by shape:
  true/false become bools, anything strtod consumes whole becomes a number.
  Quoted scalars ('"0.4"') always stay strings.
*/
google::protobuf::Value ScalarValue(const YAML::Node& node) {
  google::protobuf::Value value;
  const std::string&      text = node.Scalar();

  if (node.Tag() != "!") {
    if (text == "true" || text == "false") {
      value.set_bool_value(text == "true");
      return value;
    }
    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (!text.empty() && end && *end == '\0') {
      value.set_number_value(number);
      return value;
    }
  }
  value.set_string_value(text);
  return value;
}

google::protobuf::Value ToValue(const YAML::Node& node, const std::string& path) {
  google::protobuf::Value value;
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value.set_null_value(google::protobuf::NULL_VALUE);
      break;
    case YAML::NodeType::Scalar:
      value = ScalarValue(node);
      break;
    case YAML::NodeType::Sequence: {
      auto* list = value.mutable_list_value();
      for (const auto& item : node) *list->add_values() = ToValue(item, path);
      break;
    }
    case YAML::NodeType::Map: {
      auto& fields = *value.mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) fields[entry.first.Scalar()] = ToValue(entry.second, path);
      break;
    }
    default:
      throw util::ValidationError(path + ":" + std::to_string(node.Mark().line + 1) + ": unsupported YAML node");
  }
  return value;
}

} // namespace

// ------------------------------------------------------------------
// Runtime config
// ------------------------------------------------------------------

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  config.mutable_logging()->set_level("info");
  config.mutable_storage()->set_rebuild("if_stale");
  config.mutable_patterns()->set_similarity_threshold(0.4);
  config.mutable_patterns()->set_min_frequency(3);
  config.mutable_patterns()->set_window_days(30);
  config.mutable_tracing()->set_service_name("aiknowsys");
  return config;
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::ValidationError("Cannot load config " + path + ": " + e.what());
  }

  // yaml -> protobuf Value -> JSON -> RuntimeConfig reuses protobuf's field checks
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToValue(root, path), &json);
  if (!status.ok()) {
    throw util::ValidationError("Cannot convert config " + path + ": " + std::string(status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  RuntimeConfig loaded;
  status = google::protobuf::util::JsonStringToMessage(json, &loaded, options);
  if (!status.ok()) {
    throw util::ValidationError("Invalid config " + path + ": " + std::string(status.message()));
  }

  // proto3 scalars have no presence; zero means "not set"
  auto config = Defaults();
  config.MergeFrom(loaded);
  return config;
}

// ------------------------------------------------------------------
// Project config
// ------------------------------------------------------------------

std::optional<ProjectConfig> ConfigLoader::LoadProjectConfig(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::nullopt;
  }

  std::string json;
  try {
    json = util::ReadTextFile(path);
  } catch (const std::exception& e) {
    AIKNOWSYS_LOG_WARN("project config unreadable", {observability::PathField("path", path), observability::StringField("error", e.what())});
    return std::nullopt;
  }

  ProjectConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    AIKNOWSYS_LOG_WARN("project config malformed, using defaults",
                       {observability::PathField("path", path), observability::StringField("error", std::string(status.message()))});
    return std::nullopt;
  }
  return config;
}

} // namespace aiknowsys::config

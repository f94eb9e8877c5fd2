#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "config/config.pb.h"

namespace aiknowsys::config {

class ConfigLoader {
 public:
  /*
    Reads the aiknowsysctl YAML config; fields the file leaves unset keep
    their Defaults() value. Load and parse failures, unknown keys included,
    throw util::ValidationError naming the file.
  */
  static aiknowsys::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Built-in values, also used to fill fields a YAML file leaves unset.
  static aiknowsys::runtime::config::RuntimeConfig Defaults();

  /*
    Per-project .aiknowsys.config (JSON).

    Missing, unreadable or malformed files yield nullopt; never throws.
  */
  static std::optional<aiknowsys::runtime::config::ProjectConfig> LoadProjectConfig(const std::filesystem::path& path);
};

} // namespace aiknowsys::config

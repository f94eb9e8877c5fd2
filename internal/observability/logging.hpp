#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace aiknowsys::runtime::config {
class RuntimeConfig;
}

namespace aiknowsys::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Paths are logged with forward slashes so lines grep the same on every platform.
LogField PathField(std::string_view key, const std::filesystem::path& value);

// key=value pairs separated by spaces; values containing blanks, quotes or '=' are quoted.
std::string FormatFields(std::initializer_list<LogField> fields);

// spdlog level names plus "warning"; nullopt for anything else.
std::optional<spdlog::level::level_enum> ParseLevel(std::string_view name);

/*
  Installs the "aiknowsys" logger on stderr; stdout is reserved for command
  results, which callers pipe into other tools.

  Level: AIKNOWSYS_LOG_LEVEL, then logging.level, then "info". An unknown
  name falls back to the default with a warning.
*/
void InitializeLogging(const aiknowsys::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace aiknowsys::observability

#define AIKNOWSYS_LOG_DEBUG(message, ...) ::aiknowsys::observability::Log(spdlog::level::debug, (message), ##__VA_ARGS__)
#define AIKNOWSYS_LOG_INFO(message, ...) ::aiknowsys::observability::Log(spdlog::level::info, (message), ##__VA_ARGS__)
#define AIKNOWSYS_LOG_WARN(message, ...) ::aiknowsys::observability::Log(spdlog::level::warn, (message), ##__VA_ARGS__)
#define AIKNOWSYS_LOG_ERROR(message, ...) ::aiknowsys::observability::Log(spdlog::level::err, (message), ##__VA_ARGS__)

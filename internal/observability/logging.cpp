#include "internal/observability/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

#include "config/config.pb.h"

namespace aiknowsys::observability {
namespace {

constexpr const char* kLoggerName     = "aiknowsys";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string FirstSet(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env); value && *value) return value;
  if (!configured.empty()) return configured;
  return fallback;
}

bool NeedsQuoting(const std::string& value) {
  return value.empty() || value.find_first_of(" \t\r\n\"=") != std::string::npos;
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField PathField(std::string_view key, const std::filesystem::path& value) {
  return {std::string(key), value.generic_string()};
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out += ' ';
    out += field.key;
    out += '=';
    if (!NeedsQuoting(field.value)) {
      out += field.value;
      continue;
    }
    out += '"';
    for (char c : field.value) {
      switch (c) {
        case '\n':
          out += "\\n";
          break;
        case '\r':
          out += "\\r";
          break;
        case '"':
        case '\\':
          out += '\\';
          [[fallthrough]];
        default:
          out += c;
      }
    }
    out += '"';
  }
  return out;
}

std::optional<spdlog::level::level_enum> ParseLevel(std::string_view name) {
  if (name == "warning") return spdlog::level::warn;
  const auto level = spdlog::level::from_str(std::string(name));
  // from_str maps unknown names to off
  if (level == spdlog::level::off && name != "off") return std::nullopt;
  return level;
}

void InitializeLogging(const aiknowsys::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
  }
  logger->set_pattern(FirstSet("AIKNOWSYS_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));

  const auto name  = FirstSet("AIKNOWSYS_LOG_LEVEL", config.logging().level(), kDefaultLevel);
  const auto level = ParseLevel(name);
  logger->set_level(level.value_or(spdlog::level::info));

  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);

  if (!level) {
    Log(spdlog::level::warn, "unknown log level, using info", {StringField("level", name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger_raw();
  if (!logger || !logger->should_log(level)) return;

  if (fields.size() == 0) {
    logger->log(level, "{}", message);
    return;
  }
  logger->log(level, "{} {}", message, FormatFields(fields));
}

} // namespace aiknowsys::observability

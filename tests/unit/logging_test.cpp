#include <spdlog/spdlog.h>

#include <cassert>
#include <cstdlib>
#include <iostream>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace {

using namespace aiknowsys::observability;

void TestFormatFields() {
  assert(FormatFields({}).empty());
  assert(FormatFields({StringField("adapter", "json"), IntField("plans", 3), BoolField("stale", false)}) == "adapter=json plans=3 stale=false");

  // values that would split or confuse key=value parsing are quoted
  assert(FormatFields({StringField("query", "dynamic import")}) == "query=\"dynamic import\"");
  assert(FormatFields({StringField("error", "say \"hi\"")}) == "error=\"say \\\"hi\\\"\"");
  assert(FormatFields({StringField("expr", "a=b")}) == "expr=\"a=b\"");
  assert(FormatFields({StringField("text", "two\nlines")}) == "text=\"two\\nlines\"");
  assert(FormatFields({StringField("user", "")}) == "user=\"\"");
}

void TestPathField() {
  const auto field = PathField("file", std::filesystem::path("sessions") / "2026-01-20.md");
  assert(field.key == "file");
  assert(field.value == "sessions/2026-01-20.md");
}

void TestParseLevel() {
  assert(ParseLevel("debug") == spdlog::level::debug);
  assert(ParseLevel("warn") == spdlog::level::warn);
  assert(ParseLevel("warning") == spdlog::level::warn);
  assert(ParseLevel("off") == spdlog::level::off);
  assert(!ParseLevel("verbose").has_value());
  assert(!ParseLevel("").has_value());
}

void TestInitializeLogging() {
  unsetenv("AIKNOWSYS_LOG_LEVEL");
  unsetenv("AIKNOWSYS_LOG_PATTERN");

  aiknowsys::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("error");
  InitializeLogging(config);
  assert(spdlog::default_logger()->name() == "aiknowsys");
  assert(spdlog::default_logger()->level() == spdlog::level::err);

  // the environment wins over the file
  setenv("AIKNOWSYS_LOG_LEVEL", "debug", 1);
  InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::debug);

  setenv("AIKNOWSYS_LOG_LEVEL", "chatty", 1);
  InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::info);
  unsetenv("AIKNOWSYS_LOG_LEVEL");

  AIKNOWSYS_LOG_INFO("logging test", {StringField("phase", "after init")});
}

void TestSpanWithoutTracing() {
  aiknowsys::runtime::config::RuntimeConfig config;
  assert(!InitializeTracing(config));

  SpanScope span("test.span");
  span.SetAttribute("count", static_cast<std::int64_t>(1));
  span.MarkFailed("ignored");
  ShutdownTracing();
}

} // namespace

int main() {
  TestFormatFields();
  TestPathField();
  TestParseLevel();
  TestInitializeLogging();
  TestSpanWithoutTracing();
  ShutdownLogging();

  std::cout << "aiknowsys_unit_logging: pass\n";
  return 0;
}

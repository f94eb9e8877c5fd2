#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "aiknowsys/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/query_core.hpp"
#include "internal/db/sqlite/sqlite_storage.hpp"
#include "internal/factory.hpp"
#include "internal/learning/pattern_detector.hpp"
#include "internal/learning/pattern_tracker.hpp"
#include "internal/learning/skill_generator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

using aiknowsys::runtime::config::RuntimeConfig;
namespace core     = aiknowsys::core;
namespace factory  = aiknowsys::factory;
namespace learning = aiknowsys::learning;

static void Usage() {
  std::cout << "Usage:\n"
            << "  aiknowsysctl [--config <file>] [--dir <path>] [--adapter json|sqlite] [--rebuild always|if_stale|never] <command> [args]\n"
            << "\n"
            << "Commands:\n"
            << "  rebuild-index\n"
            << "  query-plans [status=ACTIVE] [author=name] [topic=t] [updated-after=YYYY-MM-DD] [updated-before=YYYY-MM-DD] [content]\n"
            << "  query-sessions [date=D] [date-after=D] [date-before=D] [topic=t] [plan=id] [days=N] [content]\n"
            << "  search <query> [scope=all|plans|sessions|learned]\n"
            << "  stats\n"
            << "  detect-patterns [threshold=N]\n"
            << "  extract-pattern <term> [user=name]\n"
            << "  auto-create [threshold=N] [user=name]\n";
}

// key=value pairs; a bare word is a flag with an empty value
struct Args {
  std::vector<std::string>           positional;
  std::map<std::string, std::string> named;

  std::optional<std::string> Get(const std::string& key) const {
    auto it = named.find(key);
    if (it == named.end()) return std::nullopt;
    return it->second;
  }

  bool Has(const std::string& key) const {
    return named.count(key) > 0;
  }
};

static std::optional<Args> ParseArgs(int first, int argc, char** argv, const std::set<std::string>& keys, const std::set<std::string>& flags) {
  Args args;
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto        eq  = arg.find('=');
    if (eq != std::string::npos && keys.count(arg.substr(0, eq))) {
      args.named[arg.substr(0, eq)] = arg.substr(eq + 1);
    } else if (flags.count(arg)) {
      args.named[arg] = "";
    } else if (eq == std::string::npos) {
      args.positional.push_back(arg);
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      return std::nullopt;
    }
  }
  return args;
}

static void Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("cannot render result: " + std::string(status.message()));
  }
  std::cout << json;
}

static google::protobuf::ListValue ToList(const std::vector<std::string>& values) {
  google::protobuf::ListValue list;
  for (const auto& v : values) list.add_values()->set_string_value(v);
  return list;
}

static google::protobuf::Struct ToStruct(const learning::DetectedPattern& pattern) {
  google::protobuf::Struct out;
  auto&                    fields = *out.mutable_fields();
  fields["error"].set_string_value(pattern.error);
  fields["frequency"].set_number_value(pattern.frequency);
  fields["first_seen"].set_string_value(pattern.first_seen);
  fields["last_seen"].set_string_value(pattern.last_seen);
  fields["common_resolution"].set_string_value(pattern.common_resolution);
  *fields["keywords"].mutable_list_value() = ToList(pattern.keywords);
  *fields["examples"].mutable_list_value() = ToList(pattern.examples);
  return out;
}

static std::optional<int> ParseInt(const std::optional<std::string>& value, const char* name) {
  if (!value) return std::nullopt;
  try {
    std::size_t used   = 0;
    const int   parsed = std::stoi(*value, &used);
    if (used == value->size()) return parsed;
  } catch (const std::exception&) {
    // reported below
  }
  throw aiknowsys::util::ValidationError(std::string("Invalid ") + name + ": " + *value);
}

static learning::SkillOptions SkillOptionsFrom(const Args& args) {
  learning::SkillOptions options;
  if (auto user = args.Get("user"); user && !user->empty()) {
    options.shared   = false;
    options.username = *user;
  }
  return options;
}

static learning::DetectOptions DetectOptionsFrom(const RuntimeConfig& config) {
  learning::DetectOptions options;
  if (config.patterns().similarity_threshold() > 0) options.similarity = config.patterns().similarity_threshold();
  if (config.patterns().min_frequency() > 0) options.threshold = config.patterns().min_frequency();
  if (config.patterns().window_days() > 0) options.window_days = config.patterns().window_days();
  return options;
}

static void Shutdown() {
  aiknowsys::observability::ShutdownLogging();
  aiknowsys::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (const char* env = std::getenv("AIKNOWSYS_CONFIG")) config_path = env;

  std::string dir;
  std::string adapter;
  std::string rebuild;

  int i = 1;
  for (; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg.rfind("--", 0) != 0) break;
    if (i + 1 >= argc) {
      Usage();
      return 1;
    }
    if (arg == "--config") {
      config_path = argv[++i];
    } else if (arg == "--dir") {
      dir = argv[++i];
    } else if (arg == "--adapter") {
      adapter = argv[++i];
    } else if (arg == "--rebuild") {
      rebuild = argv[++i];
    } else {
      Usage();
      return 1;
    }
  }
  if (i >= argc) {
    Usage();
    return 1;
  }
  const std::string cmd = argv[i++];

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    RuntimeConfig config = config_path.empty() ? aiknowsys::config::ConfigLoader::Defaults() : aiknowsys::config::ConfigLoader::LoadFromYaml(config_path);
    if (!adapter.empty()) config.mutable_storage()->set_adapter(adapter);
    if (!rebuild.empty()) config.mutable_storage()->set_rebuild(rebuild);

    aiknowsys::observability::InitializeTracing(config);
    aiknowsys::observability::InitializeLogging(config);

    const auto storage = factory::StorageOptionsFromConfig(config);
    const auto target  = core::ResolveTargetDir(dir);

    // ------------------------------------------------------------

    if (cmd == "rebuild-index") {
      auto options    = storage;
      options.rebuild = factory::RebuildPolicy::kNever;

      factory::ScopedStorage handle(factory::CreateStorage(target, options));
      auto                   report = handle->RebuildIndex();
      handle.Close();
      Print(report);
    }

    // ------------------------------------------------------------

    else if (cmd == "query-plans") {
      auto args = ParseArgs(i, argc, argv, {"status", "author", "topic", "updated-after", "updated-before"}, {"content"});
      if (!args || !args->positional.empty()) {
        Usage();
        Shutdown();
        return 1;
      }

      core::QueryPlansOptions options;
      options.status          = args->Get("status");
      options.author          = args->Get("author");
      options.topic           = args->Get("topic");
      options.updated_after   = args->Get("updated-after");
      options.updated_before  = args->Get("updated-before");
      options.include_content = args->Has("content");
      options.dir             = target;
      options.storage         = storage;
      Print(core::QueryPlansCore(options));
    }

    // ------------------------------------------------------------

    else if (cmd == "query-sessions") {
      auto args = ParseArgs(i, argc, argv, {"date", "date-after", "date-before", "topic", "plan", "days"}, {"content"});
      if (!args || !args->positional.empty()) {
        Usage();
        Shutdown();
        return 1;
      }

      core::QuerySessionsOptions options;
      options.date            = args->Get("date");
      options.date_after      = args->Get("date-after");
      options.date_before     = args->Get("date-before");
      options.topic           = args->Get("topic");
      options.plan            = args->Get("plan");
      options.days            = ParseInt(args->Get("days"), "days");
      options.include_content = args->Has("content");
      options.dir             = target;
      options.storage         = storage;
      Print(core::QuerySessionsCore(options));
    }

    // ------------------------------------------------------------

    else if (cmd == "search") {
      auto args = ParseArgs(i, argc, argv, {"scope"}, {});
      if (!args || args->positional.empty()) {
        Usage();
        Shutdown();
        return 1;
      }

      core::SearchContextOptions options;
      for (const auto& word : args->positional) options.query += (options.query.empty() ? "" : " ") + word;
      options.scope   = args->Get("scope").value_or("all");
      options.dir     = target;
      options.storage = storage;
      Print(core::SearchContextCore(options));
    }

    // ------------------------------------------------------------

    else if (cmd == "stats") {
      aiknowsys::db::sqlite::SqliteStorage sqlite;
      sqlite.Init(target);
      auto stats = sqlite.GetStats();
      sqlite.Close();
      Print(stats);
    }

    // ------------------------------------------------------------

    else if (cmd == "detect-patterns") {
      auto args = ParseArgs(i, argc, argv, {"threshold"}, {});
      if (!args || !args->positional.empty()) {
        Usage();
        Shutdown();
        return 1;
      }

      auto detect = DetectOptionsFrom(config);
      if (auto threshold = ParseInt(args->Get("threshold"), "threshold")) detect.threshold = *threshold;

      const auto result = learning::DetectPatterns(target, detect);

      google::protobuf::Struct out;
      auto&                    patterns = *(*out.mutable_fields())["patterns"].mutable_list_value();
      for (const auto& pattern : result.patterns) *patterns.add_values()->mutable_struct_value() = ToStruct(pattern);
      *(*out.mutable_fields())["errors"].mutable_list_value() = ToList(result.errors);
      Print(out);
    }

    // ------------------------------------------------------------

    else if (cmd == "extract-pattern") {
      auto args = ParseArgs(i, argc, argv, {"user"}, {});
      if (!args || args->positional.empty()) {
        Usage();
        Shutdown();
        return 1;
      }

      std::string term;
      for (const auto& word : args->positional) term += (term.empty() ? "" : " ") + word;

      learning::PatternTracker tracker(target);
      const auto               result = learning::ExtractPattern(target, term, tracker, SkillOptionsFrom(*args), DetectOptionsFrom(config));

      google::protobuf::Struct out;
      auto&                    fields = *out.mutable_fields();
      fields["success"].set_bool_value(result.success);
      fields["message"].set_string_value(result.message);
      fields["path"].set_string_value(result.path.string());
      fields["created"].set_bool_value(result.created);
      fields["existed"].set_bool_value(result.existed);
      Print(out);
      if (!result.success) {
        Shutdown();
        return 2;
      }
    }

    // ------------------------------------------------------------

    else if (cmd == "auto-create") {
      auto args = ParseArgs(i, argc, argv, {"threshold", "user"}, {});
      if (!args || !args->positional.empty()) {
        Usage();
        Shutdown();
        return 1;
      }

      auto detect    = DetectOptionsFrom(config);
      auto threshold = ParseInt(args->Get("threshold"), "threshold").value_or(detect.threshold);

      learning::PatternTracker tracker(target);
      const auto               result = learning::AutoCreateSkills(target, threshold, tracker, SkillOptionsFrom(*args), detect);

      std::vector<std::string> created;
      for (const auto& skill : result.created) created.push_back(skill.path.string());

      google::protobuf::Struct out;
      *(*out.mutable_fields())["created"].mutable_list_value() = ToList(created);
      *(*out.mutable_fields())["skipped"].mutable_list_value() = ToList(result.skipped);
      *(*out.mutable_fields())["errors"].mutable_list_value()  = ToList(result.errors);
      Print(out);
    }

    // ------------------------------------------------------------

    else {
      std::cerr << "unknown command: " << cmd << "\n";
      Usage();
      Shutdown();
      return 1;
    }

    Shutdown();
  } catch (const aiknowsys::util::Error& e) {
    std::cerr << e.what() << "\n";
    Shutdown();
    return 2;
  } catch (const std::exception& e) {
    AIKNOWSYS_LOG_ERROR("unexpected error", {aiknowsys::observability::StringField("command", cmd), aiknowsys::observability::StringField("error", e.what())});
    Shutdown();
    return 3;
  }

  return 0;
}

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

#include "config/config.pb.h"
#include "internal/db/api/storage_adapter.hpp"

namespace aiknowsys::factory {

enum class AdapterKind {
  kJson,
  kSqlite,
};

enum class RebuildPolicy {
  kAlways,
  kIfStale,
  kNever,
};

struct StorageOptions {
  // nullopt: sqlite when the located database file exists, json otherwise
  std::optional<AdapterKind> adapter;
  RebuildPolicy              rebuild = RebuildPolicy::kIfStale;
};

// "json" | "sqlite"; "" and "auto" mean nullopt. Throws util::ValidationError.
std::optional<AdapterKind> ParseAdapterKind(std::string_view text);

// "always" | "if_stale" | "never"; "" means if_stale. Throws util::ValidationError.
RebuildPolicy ParseRebuildPolicy(std::string_view text);

StorageOptions StorageOptionsFromConfig(const aiknowsys::runtime::config::RuntimeConfig& config);

AdapterKind SelectAdapter(const std::filesystem::path& target_dir, const StorageOptions& options);

/*
  True when some markdown file under .aiknowsys/ is newer than the adapter's
  IndexTimestamp(), when an indexed plan or session file no longer exists,
  or when the adapter cannot tell.
*/
bool IsStale(const std::filesystem::path& target_dir, db::StorageAdapter& adapter);

/*
  CreateStorage

  The only place that knows concrete backend types. Returns an initialized
  adapter, rebuilt first when the rebuild policy asks for it.
*/
std::unique_ptr<db::StorageAdapter> CreateStorage(const std::filesystem::path& target_dir, const StorageOptions& options = {});

/*
  Owns one adapter for one logical operation and closes it on every exit
  path. Close() on the success path lets close errors reach the caller; the
  destructor only logs them.
*/
class ScopedStorage {
 public:
  explicit ScopedStorage(std::unique_ptr<db::StorageAdapter> storage);
  ~ScopedStorage();

  ScopedStorage(const ScopedStorage&)            = delete;
  ScopedStorage& operator=(const ScopedStorage&) = delete;

  db::StorageAdapter* operator->() const {
    return storage_.get();
  }

  db::StorageAdapter& operator*() const {
    return *storage_;
  }

  void Close();

 private:
  std::unique_ptr<db::StorageAdapter> storage_;
  bool                                closed_ = false;
};

} // namespace aiknowsys::factory

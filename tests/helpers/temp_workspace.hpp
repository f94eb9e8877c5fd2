#pragma once

#include <unistd.h>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace aiknowsys::testing {

/*
  Scratch project directory under the system temp dir, removed on scope exit.
*/
class TempWorkspace {
 public:
  explicit TempWorkspace(const std::string& name) {
    static std::atomic<int> counter{0};
    root_ = std::filesystem::temp_directory_path() /
            ("aiknowsys_" + name + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1)));
    std::filesystem::remove_all(root_);
    std::filesystem::create_directories(root_);
  }

  ~TempWorkspace() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempWorkspace(const TempWorkspace&)            = delete;
  TempWorkspace& operator=(const TempWorkspace&) = delete;

  const std::filesystem::path& Root() const {
    return root_;
  }

  std::filesystem::path Knowledge() const {
    return root_ / ".aiknowsys";
  }

  // Writes `content` to Root()/rel, creating parent directories.
  std::filesystem::path Write(const std::string& rel, const std::string& content) const {
    const auto path = root_ / rel;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("cannot write " + path.string());
    out << content;
    return path;
  }

  std::string Read(const std::string& rel) const {
    std::ifstream in(root_ / rel, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  }

  bool Exists(const std::string& rel) const {
    return std::filesystem::exists(root_ / rel);
  }

 private:
  std::filesystem::path root_;
};

// Sets (or clears) an environment variable for the current scope.
class ScopedEnv {
 public:
  ScopedEnv(const char* name, const std::optional<std::string>& value) : name_(name) {
    if (const char* old = std::getenv(name)) previous_ = old;
    if (value) {
      ::setenv(name, value->c_str(), 1);
    } else {
      ::unsetenv(name);
    }
  }

  ~ScopedEnv() {
    if (previous_) {
      ::setenv(name_.c_str(), previous_->c_str(), 1);
    } else {
      ::unsetenv(name_.c_str());
    }
  }

  ScopedEnv(const ScopedEnv&)            = delete;
  ScopedEnv& operator=(const ScopedEnv&) = delete;

 private:
  std::string                name_;
  std::optional<std::string> previous_;
};

} // namespace aiknowsys::testing

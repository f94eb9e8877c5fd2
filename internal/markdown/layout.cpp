#include "internal/markdown/layout.hpp"

#include <algorithm>
#include <system_error>

#include "internal/util/strings.hpp"

namespace aiknowsys::markdown {

bool IsPlanFileName(const std::string& filename) {
  return util::StartsWith(filename, kPlanPrefix) && util::EndsWith(filename, ".md");
}

bool IsActivePointerFileName(const std::string& filename) {
  return util::StartsWith(filename, kActivePrefix) && util::EndsWith(filename, ".md");
}

std::vector<std::filesystem::path> ListMarkdownFiles(const std::filesystem::path& dir) {
  std::vector<std::filesystem::path> files;

  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return files;
  }

  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && it->path().extension() == ".md") {
      files.push_back(it->path());
    }
  }

  std::sort(files.begin(), files.end());
  return files;
}

std::vector<std::filesystem::path> ListPlanFiles(const std::filesystem::path& target) {
  std::vector<std::filesystem::path> plans;
  for (const auto& dir : {KnowledgeDir(target), PlansDir(target)}) {
    for (auto& file : ListMarkdownFiles(dir)) {
      if (IsPlanFileName(file.filename().string())) {
        plans.push_back(std::move(file));
      }
    }
  }
  return plans;
}

std::string RelativeToKnowledgeDir(const std::filesystem::path& target, const std::filesystem::path& file) {
  return file.lexically_relative(KnowledgeDir(target)).generic_string();
}

} // namespace aiknowsys::markdown

#include "file_io.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace aiknowsys::util {

std::string ReadTextFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + path.string());
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw std::runtime_error("read failed: " + path.string());
  }
  return buffer.str();
}

void WriteTextFileAtomic(const std::filesystem::path& path, std::string_view content) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("cannot create directory " + path.parent_path().string() + ": " + ec.message());
    }
  }

  const auto tmp_path = path.string() + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot open " + tmp_path + " for writing");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
      throw std::runtime_error("write failed: " + tmp_path);
    }
  }

  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    const auto reason = ec.message();
    std::filesystem::remove(tmp_path, ec);
    throw std::runtime_error("cannot replace " + path.string() + ": " + reason);
  }
}

} // namespace aiknowsys::util

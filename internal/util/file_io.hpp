#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace aiknowsys::util {

// Throws std::runtime_error when the file cannot be opened or read.
std::string ReadTextFile(const std::filesystem::path& path);

/*
  write tmp -> flush -> rename

  Readers never observe a half-written file. Throws std::runtime_error.
*/
void WriteTextFileAtomic(const std::filesystem::path& path, std::string_view content);

} // namespace aiknowsys::util

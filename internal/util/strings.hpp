#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace aiknowsys::util {

std::string ToLower(std::string_view s);
std::string ToUpper(std::string_view s);
std::string Trim(std::string_view s);

bool StartsWith(std::string_view s, std::string_view prefix);
bool EndsWith(std::string_view s, std::string_view suffix);

// ASCII case-insensitive search. Returns npos when absent or needle is empty.
std::size_t FindIgnoreCase(std::string_view haystack, std::string_view needle, std::size_t from = 0);
bool        ContainsIgnoreCase(std::string_view haystack, std::string_view needle);
std::size_t CountIgnoreCase(std::string_view haystack, std::string_view needle);

/*
  ASCII letters are lowercased; runs of ASCII punctuation and blanks become
  one '-', with none leading or trailing. Non-ASCII UTF-8 text is kept
  as-is, and truncation never splits a multi-byte character.
*/
std::string Slugify(std::string_view s, std::size_t max_length = 80);

// Words of ASCII alphanumerics and non-ASCII UTF-8 characters, ASCII-lowercased.
std::vector<std::string> SplitWords(std::string_view s);

std::vector<std::string> SplitLines(std::string_view s);

std::string JoinStrings(const std::vector<std::string>& parts, std::string_view sep);

/*
  Window of at most `before` chars ahead of and `after` chars following `pos`,
  newlines flattened to spaces and trimmed.
*/
std::string Snippet(std::string_view text, std::size_t pos, std::size_t before, std::size_t after);

// 1-based line number of byte offset `pos`.
int LineOf(std::string_view text, std::size_t pos);

} // namespace aiknowsys::util

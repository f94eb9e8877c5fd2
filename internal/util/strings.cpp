#include "strings.hpp"

#include <algorithm>
#include <cctype>

namespace aiknowsys::util {

namespace {

// ASCII only; UTF-8 bytes pass through untouched
char Lower(char c) {
  return c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c;
}

// Every byte of a multi-byte UTF-8 sequence counts, so non-Latin words survive.
bool IsWordByte(char c) {
  const auto u = static_cast<unsigned char>(c);
  return u >= 0x80 || std::isalnum(u) != 0;
}

bool IsContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

std::string ToLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), Lower);
  return out;
}

std::string ToUpper(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); });
  return out;
}

std::string Trim(std::string_view s) {
  const auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return std::string(s);
}

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

bool EndsWith(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

std::size_t FindIgnoreCase(std::string_view haystack, std::string_view needle, std::size_t from) {
  if (needle.empty() || needle.size() > haystack.size()) {
    return std::string_view::npos;
  }
  for (std::size_t i = from; i + needle.size() <= haystack.size(); ++i) {
    std::size_t j = 0;
    while (j < needle.size() && Lower(haystack[i + j]) == Lower(needle[j])) ++j;
    if (j == needle.size()) return i;
  }
  return std::string_view::npos;
}

bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle) {
  return FindIgnoreCase(haystack, needle) != std::string_view::npos;
}

std::size_t CountIgnoreCase(std::string_view haystack, std::string_view needle) {
  std::size_t count = 0;
  for (auto pos = FindIgnoreCase(haystack, needle); pos != std::string_view::npos; pos = FindIgnoreCase(haystack, needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

std::string Slugify(std::string_view s, std::size_t max_length) {
  std::string slug;
  slug.reserve(s.size());
  bool pending_dash = false;
  for (char c : s) {
    if (IsWordByte(c)) {
      if (pending_dash && !slug.empty()) slug.push_back('-');
      pending_dash = false;
      slug.push_back(Lower(c));
    } else {
      pending_dash = true;
    }
  }

  if (slug.size() > max_length) {
    std::size_t cut = max_length;
    while (cut > 0 && IsContinuationByte(slug[cut])) --cut;
    slug.resize(cut);
    while (!slug.empty() && slug.back() == '-') slug.pop_back();
  }
  return slug;
}

std::vector<std::string> SplitWords(std::string_view s) {
  std::vector<std::string> words;
  std::string              current;
  for (char c : s) {
    if (IsWordByte(c)) {
      current.push_back(Lower(c));
    } else if (!current.empty()) {
      words.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) words.push_back(std::move(current));
  return words;
}

std::vector<std::string> SplitLines(std::string_view s) {
  std::vector<std::string> lines;
  std::size_t              start = 0;
  while (start <= s.size()) {
    auto end = s.find('\n', start);
    if (end == std::string_view::npos) {
      auto line = s.substr(start);
      if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
      if (!line.empty()) lines.emplace_back(line);
      break;
    }
    auto line = s.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    lines.emplace_back(line);
    start = end + 1;
  }
  return lines;
}

std::string JoinStrings(const std::vector<std::string>& parts, std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i) out.append(sep);
    out.append(parts[i]);
  }
  return out;
}

std::string Snippet(std::string_view text, std::size_t pos, std::size_t before, std::size_t after) {
  if (pos > text.size()) pos = text.size();
  const std::size_t start = pos > before ? pos - before : 0;
  const std::size_t end   = std::min(text.size(), pos + after);

  std::string window(text.substr(start, end - start));
  std::replace(window.begin(), window.end(), '\n', ' ');
  std::replace(window.begin(), window.end(), '\r', ' ');
  return Trim(window);
}

int LineOf(std::string_view text, std::size_t pos) {
  if (pos > text.size()) pos = text.size();
  return 1 + static_cast<int>(std::count(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(pos), '\n'));
}

} // namespace aiknowsys::util

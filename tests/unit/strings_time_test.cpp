#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace aiknowsys::util;

void TestSlugify() {
  assert(Slugify("ESM: chalk import error!") == "esm-chalk-import-error");
  assert(Slugify("  --Hello__World--  ") == "hello-world");
  assert(Slugify("!!!").empty());

  const std::string long_text(200, 'a');
  assert(Slugify(long_text).size() == 80);
  // truncation never leaves a trailing hyphen
  assert(Slugify(std::string(79, 'a') + " b") == std::string(79, 'a'));

  // UTF-8 text is kept whole, even when truncated
  assert(Slugify("Ошибка: импорт модуля") == "Ошибка-импорт-модуля");
  assert(Slugify("使用 动态导入!") == "使用-动态导入");
  const auto cut = Slugify(std::string(79, 'a') + "я");
  assert(cut == std::string(79, 'a'));
}

void TestCaseInsensitiveSearch() {
  assert(FindIgnoreCase("Token and TOKEN", "token") == 0);
  assert(FindIgnoreCase("Token and TOKEN", "token", 1) == 10);
  assert(CountIgnoreCase("Token and TOKEN and tok", "token") == 2);
  assert(!ContainsIgnoreCase("abc", ""));
  assert(FindIgnoreCase("ab", "abc") == std::string::npos);
}

void TestWordsAndLines() {
  const auto words = SplitWords("Can't import chalk (ESM)!");
  assert(words.size() == 5);
  assert(words[0] == "can");
  assert(words[1] == "t");
  assert(words[4] == "esm");

  const auto cyrillic = SplitWords("Ошибка импорта, ESM");
  assert(cyrillic.size() == 3);
  assert(cyrillic[0] == "Ошибка");
  assert(cyrillic[2] == "esm");

  const auto lines = SplitLines("one\r\ntwo\n\nthree\r");
  assert(lines.size() == 4);
  assert(lines[0] == "one");
  assert(lines[2].empty());
  assert(lines[3] == "three");
}

void TestSnippetAndLine() {
  const std::string text = "first line\nsecond line with needle\nthird";
  const auto        pos  = text.find("needle");
  assert(LineOf(text, pos) == 2);
  assert(LineOf(text, 0) == 1);

  const auto snippet = Snippet(text, pos, 50, 100);
  assert(snippet.find('\n') == std::string::npos);
  assert(snippet.find("needle") != std::string::npos);

  const std::string long_text = std::string(80, 'x') + "needle" + std::string(200, 'y');
  const auto        window    = Snippet(long_text, 80, 50, 100);
  assert(window.size() == 150);
  assert(window.substr(50, 6) == "needle");
}

void TestDates() {
  assert(IsValidDate("2026-01-20"));
  assert(IsValidDate("2024-02-29"));
  assert(!IsValidDate("2026-02-30"));
  assert(!IsValidDate("2026-13-01"));
  assert(!IsValidDate("2026-1-20"));
  assert(!IsValidDate("20260120"));
  assert(!IsValidDate("2026-01-2x"));

  const auto day = ParseDate("2026-03-01");
  assert(day.has_value());
  assert(FormatDate(*day) == "2026-03-01");
  assert(DateDaysBefore(*day, 1) == "2026-02-28");
  assert(DateDaysBefore(*day, 0) == "2026-03-01");

  assert(FormatTimestamp(*day + std::chrono::milliseconds(1500)) == "2026-03-01T00:00:01Z");
}

} // namespace

int main() {
  TestSlugify();
  TestCaseInsensitiveSearch();
  TestWordsAndLines();
  TestSnippetAndLine();
  TestDates();

  std::cout << "aiknowsys_unit_strings_time: pass\n";
  return 0;
}

#include <set>
#include <string>
#include <string_view>

#include "support/StringOperator.hpp"

std::set<std::string> multicol::splitString(const std::string &str, char delimiter) {
  std::set<std::string> result;
  std::size_t start = 0;
  std::size_t end = str.find(delimiter);
  while (end != std::string::npos) {
    if (end != start)
      result.insert(str.substr(start, end - start));
    start = end + 1;
    end = str.find(delimiter, start);
  }
  if (start < str.length())
    result.insert(str.substr(start, std::string::npos));
  return result;
}

std::string_view multicol::trimString(std::string_view str) {
  constexpr std::string_view whitespace = " \t\r\n";
  std::size_t const begin = str.find_first_not_of(whitespace);
  if (begin == std::string_view::npos)
    return {};
  std::size_t const end = str.find_last_not_of(whitespace);
  return str.substr(begin, end - begin + 1U);
}

#ifdef MULTICOL_ENABLE_UNIT_TESTS
#include <gtest/gtest.h>
namespace multicol::ut {

TEST(StringOperator, SplitString) {
  std::set<std::string> result = splitString("MultiDict;Script", ';');
  EXPECT_EQ(result.size(), 2);
  EXPECT_TRUE(result.contains("MultiDict"));
  EXPECT_TRUE(result.contains("Script"));

  result = splitString("MultiDict;;MultiDict", ';');
  EXPECT_EQ(result.size(), 1);

  result = splitString("", ';');
  EXPECT_TRUE(result.empty());
}

TEST(StringOperator, TrimString) {
  EXPECT_EQ(trimString("  add a 1\r\n"), "add a 1");
  EXPECT_EQ(trimString("\t"), "");
  EXPECT_EQ(trimString(""), "");
  EXPECT_EQ(trimString("x"), "x");
}

} // namespace multicol::ut

#endif // MULTICOL_ENABLE_UNIT_TESTS

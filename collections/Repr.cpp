#include <cctype>
#include <cstddef>
#include <fmt/format.h>
#include <string>
#include <string_view>

#include "collections/Errors.hpp"
#include "collections/Repr.hpp"

namespace multicol {

void ReprReader::skipSpaces() {
  while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0)
    ++pos_;
}

bool ReprReader::consume(char c) {
  skipSpaces();
  if (pos_ < text_.size() && text_[pos_] == c) {
    ++pos_;
    return true;
  }
  return false;
}

void ReprReader::expect(char c) {
  if (!consume(c))
    fail(fmt::format("expected '{}'", c));
}

std::string_view ReprReader::readIdentifier() {
  std::size_t const begin = pos_;
  if (pos_ < text_.size() && (std::isalpha(static_cast<unsigned char>(text_[pos_])) != 0 || text_[pos_] == '_')) {
    while (pos_ < text_.size() && (std::isalnum(static_cast<unsigned char>(text_[pos_])) != 0 || text_[pos_] == '_'))
      ++pos_;
  }
  return text_.substr(begin, pos_ - begin);
}

std::string ReprReader::readQuoted() {
  if (atEnd() || (text_[pos_] != '\'' && text_[pos_] != '"'))
    fail("expected quoted string");
  char const quote = text_[pos_++];
  std::string value{};
  while (true) {
    if (atEnd())
      fail("unterminated string");
    char const c = text_[pos_++];
    if (c == quote)
      return value;
    if (c != '\\') {
      value += c;
      continue;
    }
    if (atEnd())
      fail("unterminated escape");
    char const escaped = text_[pos_++];
    switch (escaped) {
    case 'n':
      value += '\n';
      break;
    case 't':
      value += '\t';
      break;
    case 'r':
      value += '\r';
      break;
    case '\\':
    case '\'':
    case '"':
      value += escaped;
      break;
    default:
      --pos_;
      fail(fmt::format("unknown escape '\\{}'", escaped));
    }
  }
}

std::string_view ReprReader::readScalar() {
  std::size_t const begin = pos_;
  while (pos_ < text_.size()) {
    char const c = text_[pos_];
    if (c == ',' || c == ')' || c == ']' || std::isspace(static_cast<unsigned char>(c)) != 0)
      break;
    ++pos_;
  }
  if (pos_ == begin)
    fail("expected scalar");
  return text_.substr(begin, pos_ - begin);
}

void ReprReader::fail(std::string const &what) const { throw ReprError(what, pos_); }

void appendQuoted(std::string &out, std::string_view text) {
  out += '\'';
  for (char const c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '\'':
      out += "\\'";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\r':
      out += "\\r";
      break;
    default:
      out += c;
    }
  }
  out += '\'';
}

} // namespace multicol

#ifdef MULTICOL_ENABLE_UNIT_TESTS
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <utility>
#include <vector>

namespace multicol::ut {

using ::testing::ElementsAre;
using ::testing::Pair;

TEST(ReprTest, QuoteEscapes) {
  std::string out{};
  appendQuoted(out, "it's a\\b\n");
  EXPECT_EQ(out, R"('it\'s a\\b\n')");
}

TEST(ReprTest, ParseWrapped) {
  auto const items = parseRepr<std::string, int>("MultiDict([('a', 1), ('b', -2), ('a', 3)])");
  EXPECT_THAT(items, ElementsAre(Pair("a", 1), Pair("b", -2), Pair("a", 3)));
}

TEST(ReprTest, ParseBareListAndSpaces) {
  auto const items = parseRepr<std::string, std::string>("  [ ( \"x\" ,'y' ) ]  ");
  EXPECT_THAT(items, ElementsAre(Pair("x", "y")));
}

TEST(ReprTest, ParseEmpty) {
  EXPECT_TRUE((parseRepr<std::string, int>("MultiDict([])").empty()));
  EXPECT_TRUE((parseRepr<std::string, int>("[]").empty()));
}

TEST(ReprTest, ParseScalars) {
  auto const items = parseRepr<bool, double>("[(True, 1.5), (False, -0.25)]");
  EXPECT_THAT(items, ElementsAre(Pair(true, 1.5), Pair(false, -0.25)));
}

TEST(ReprTest, ParseCharacters) {
  auto const items = parseRepr<char, char>(R"([('a', 'x'), ('\'', "\n")])");
  EXPECT_THAT(items, ElementsAre(Pair('a', 'x'), Pair('\'', '\n')));
  EXPECT_THROW((parseRepr<std::string, char>("[('a', 'xy')]")), ReprError);
  EXPECT_THROW((parseRepr<std::string, char>("[('a', '')]")), ReprError);
  EXPECT_THROW((parseRepr<std::string, char>("[('a', x)]")), ReprError);
}

TEST(ReprTest, ParseEscapedString) {
  auto const items = parseRepr<std::string, std::string>(R"([('it\'s', 'a\\b\tc')])");
  EXPECT_THAT(items, ElementsAre(Pair("it's", "a\\b\tc")));
}

TEST(ReprTest, ErrorOffset) {
  try {
    parseRepr<std::string, int>("[('a', x1)]");
    FAIL() << "expected ReprError";
  } catch (ReprError const &e) {
    EXPECT_EQ(e.offset(), 7U);
  }
}

TEST(ReprTest, Errors) {
  EXPECT_THROW((parseRepr<std::string, int>("[('a', 1)")), ReprError);
  EXPECT_THROW((parseRepr<std::string, int>("[('a' 1)]")), ReprError);
  EXPECT_THROW((parseRepr<std::string, int>("[('a, 1)]")), ReprError);
  EXPECT_THROW((parseRepr<std::string, int>("[('a', 1)] tail")), ReprError);
  EXPECT_THROW((parseRepr<std::string, int>("[(a, 1)]")), ReprError);
  EXPECT_THROW((parseRepr<std::string, bool>("[('a', true)]")), ReprError);
  EXPECT_THROW((parseRepr<std::string, std::string>(R"([('a\q', 'b')])")), ReprError);
}

} // namespace multicol::ut

#endif // MULTICOL_ENABLE_UNIT_TESTS

#include <cctype>
#include <cstddef>
#include <fmt/format.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Tokenizer.hpp"
#include "collections/Errors.hpp"
#include "collections/Repr.hpp"
#include "script/Runner.hpp"
#include "support/StringOperator.hpp"

namespace multicol::script {

static bool isSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

static std::string_view stripComment(std::string_view line) {
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    char const c = line[i];
    if (quote != '\0') {
      if (c == '\\')
        ++i;
      else if (c == quote)
        quote = '\0';
    } else if (c == '\'' || c == '"') {
      quote = c;
    } else if (c == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::optional<Command> parseLine(std::string_view line) {
  std::string_view const text = trimString(stripComment(line));
  if (text.empty())
    return std::nullopt;
  std::size_t nameEnd = 0;
  while (nameEnd < text.size() && !isSpace(text[nameEnd]))
    ++nameEnd;
  return Command{
      .name = std::string{text.substr(0, nameEnd)},
      .rest = std::string{trimString(text.substr(nameEnd))},
  };
}

std::vector<std::string> tokenize(std::string_view text) {
  std::vector<std::string> tokens{};
  std::size_t pos = 0;
  while (true) {
    while (pos < text.size() && isSpace(text[pos]))
      ++pos;
    if (pos == text.size())
      return tokens;
    if (text[pos] == '\'' || text[pos] == '"') {
      ReprReader reader{text.substr(pos)};
      try {
        tokens.push_back(reader.readQuoted());
      } catch (ReprError const &e) {
        throw ScriptError(fmt::format("column {}: malformed quoted token", pos + e.offset() + 1U));
      }
      pos += reader.offset();
      if (pos < text.size() && !isSpace(text[pos]))
        throw ScriptError(fmt::format("column {}: expected space after quoted token", pos + 1U));
      continue;
    }
    std::size_t const begin = pos;
    while (pos < text.size() && !isSpace(text[pos]))
      ++pos;
    tokens.emplace_back(text.substr(begin, pos - begin));
  }
}

} // namespace multicol::script

#ifdef MULTICOL_ENABLE_UNIT_TESTS
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace multicol::script::ut {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(ScriptTokenizerTest, ParseLine) {
  std::optional<Command> const cmd = parseLine("  add  a 1   # trailing comment");
  ASSERT_TRUE(cmd.has_value());
  EXPECT_EQ(cmd->name, "add");
  EXPECT_EQ(cmd->rest, "a 1");

  std::optional<Command> const bare = parseLine("len");
  ASSERT_TRUE(bare.has_value());
  EXPECT_EQ(bare->name, "len");
  EXPECT_EQ(bare->rest, "");
}

TEST(ScriptTokenizerTest, BlankAndCommentLines) {
  EXPECT_FALSE(parseLine("").has_value());
  EXPECT_FALSE(parseLine("   \t").has_value());
  EXPECT_FALSE(parseLine("# only a comment").has_value());
}

TEST(ScriptTokenizerTest, HashInsideQuotesIsKept) {
  std::optional<Command> const cmd = parseLine(R"(add 'a#b' "c\"#" # comment)");
  ASSERT_TRUE(cmd.has_value());
  EXPECT_EQ(cmd->rest, R"('a#b' "c\"#")");
  EXPECT_THAT(tokenize(cmd->rest), ElementsAre("a#b", "c\"#"));
}

TEST(ScriptTokenizerTest, Tokenize) {
  EXPECT_THAT(tokenize("a 1"), ElementsAre("a", "1"));
  EXPECT_THAT(tokenize("  'two words'\t\"x\\ny\"  bare "), ElementsAre("two words", "x\ny", "bare"));
  EXPECT_THAT(tokenize("''"), ElementsAre(""));
  EXPECT_THAT(tokenize(""), IsEmpty());
}

TEST(ScriptTokenizerTest, MalformedQuotes) {
  EXPECT_THROW(tokenize("'open"), ScriptError);
  EXPECT_THROW(tokenize("'a'b"), ScriptError);
  EXPECT_THROW(tokenize(R"('bad\q')"), ScriptError);
}

} // namespace multicol::script::ut

#endif // MULTICOL_ENABLE_UNIT_TESTS

#include <string>

#include "collections/MultiDict.hpp"

template class multicol::MultiDict<std::string, std::string>;

#ifdef MULTICOL_ENABLE_UNIT_TESTS
#include <cstddef>
#include <fmt/format.h>
#include <functional>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <map>
#include <optional>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

#include "unittests/Helper.hpp"
#include "unittests/ListMultiDict.hpp"

namespace multicol::ut {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Pair;
using Dict = MultiDict<std::string, int>;
using Items = std::vector<std::pair<std::string, int>>;

TEST(MultiDictTest, Creation) {
  Dict const empty{};
  EXPECT_EQ(empty.size(), 0U);
  EXPECT_TRUE(empty.empty());

  Dict const fromList{Items{{"a", 1}, {"b", 2}, {"a", 3}}};
  EXPECT_ITEMS(fromList, {{"a", 1}, {"b", 2}, {"a", 3}});
  EXPECT_CONSISTENT(fromList);

  Dict const withTrailing{Items{{"a", 1}}, {{"b", 2}, {"a", 3}}};
  EXPECT_ITEMS(withTrailing, {{"a", 1}, {"b", 2}, {"a", 3}});

  std::map<std::string, int> const source{{"y", 2}, {"x", 1}};
  Dict const fromMap{source};
  EXPECT_ITEMS(fromMap, {{"x", 1}, {"y", 2}});

  Items const pairs{{"k", 1}, {"k", 2}};
  Dict const fromIterators(pairs.begin(), pairs.end());
  EXPECT_ITEMS(fromIterators, {{"k", 1}, {"k", 2}});

  Dict const copy{fromList};
  EXPECT_EQ(copy, fromList);
}

TEST(MultiDictTest, Queries) {
  Dict const md{{"a", 1}, {"b", 2}, {"a", 3}};
  EXPECT_EQ(md.getFirst("a"), 1);
  EXPECT_EQ(md.at("b"), 2);
  EXPECT_THROW(md.at("c"), KeyNotFound);
  EXPECT_THROW(md.getFirst("c"), KeyNotFound);
  EXPECT_EQ(md.getFirst("c", 0), 0);
  EXPECT_THAT(md.getAll("a"), ElementsAre(1, 3));
  EXPECT_THAT(md.getAll("c"), IsEmpty());
  EXPECT_THAT(md.getAll("c", {5, 6}), ElementsAre(5, 6));
  EXPECT_THROW(md.requireAll("c"), KeyNotFound);
  EXPECT_EQ(md.count("a"), 2U);
  EXPECT_EQ(md.count("c"), 0U);
  EXPECT_TRUE(md.contains("a"));
  EXPECT_FALSE(md.contains("c"));
  EXPECT_EQ(md.get("b"), std::optional<int>{2});
  EXPECT_EQ(md.entryAt(2U), (std::pair<std::string, int>{"a", 3}));
  EXPECT_THROW(md.entryAt(3U), std::out_of_range);
}

TEST(MultiDictTest, AddKeepsOrderAndDuplicates) {
  Dict md{};
  md.add("a", 1);
  md.add("b", 2);
  md.add("a", 3);
  md.add("a", 3);
  EXPECT_ITEMS(md, {{"a", 1}, {"b", 2}, {"a", 3}, {"a", 3}});
  EXPECT_EQ(md.count("a"), 3U);
  EXPECT_CONSISTENT(md);
}

TEST(MultiDictTest, SetCollapsesToFirstPosition) {
  Dict md{{"a", 1}, {"b", 2}, {"a", 3}, {"c", 4}, {"a", 5}};
  md.set("a", 9);
  EXPECT_ITEMS(md, {{"a", 9}, {"b", 2}, {"c", 4}});
  EXPECT_CONSISTENT(md);
  md.set("b", 7);
  EXPECT_ITEMS(md, {{"a", 9}, {"b", 7}, {"c", 4}});
  md.set("d", 0);
  EXPECT_ITEMS(md, {{"a", 9}, {"b", 7}, {"c", 4}, {"d", 0}});
  EXPECT_CONSISTENT(md);
}

TEST(MultiDictTest, PopFirstFromMiddle) {
  Dict md{{"a", 1}, {"b", 2}, {"a", 3}, {"c", 4}};
  EXPECT_EQ(md.popFirst("a"), 1);
  EXPECT_ITEMS(md, {{"b", 2}, {"a", 3}, {"c", 4}});
  EXPECT_CONSISTENT(md);
  EXPECT_EQ(md.popFirst("b"), 2);
  EXPECT_ITEMS(md, {{"a", 3}, {"c", 4}});
  EXPECT_EQ(md.getFirst("c"), 4);
  EXPECT_CONSISTENT(md);
}

TEST(MultiDictTest, PopFirstFromTail) {
  Dict md{{"a", 1}, {"b", 2}};
  EXPECT_EQ(md.popFirst("b"), 2);
  EXPECT_ITEMS(md, {{"a", 1}});
  EXPECT_FALSE(md.contains("b"));
  EXPECT_CONSISTENT(md);
}

TEST(MultiDictTest, PopFirstMissing) {
  Dict md{{"a", 1}};
  EXPECT_THROW(md.popFirst("x"), KeyNotFound);
  EXPECT_EQ(md.popFirst("x", 42), 42);
  EXPECT_EQ(md.tryPopFirst("x"), std::nullopt);
  EXPECT_ITEMS(md, {{"a", 1}});
}

TEST(MultiDictTest, PopAllAndErase) {
  Dict md{{"a", 1}, {"b", 2}, {"a", 3}, {"c", 4}};
  EXPECT_THAT(md.popAll("a"), ElementsAre(1, 3));
  EXPECT_ITEMS(md, {{"b", 2}, {"c", 4}});
  EXPECT_CONSISTENT(md);
  EXPECT_THROW(md.popAll("a"), KeyNotFound);
  EXPECT_THAT(md.popAll("a", {}), IsEmpty());
  md.erase("b");
  EXPECT_ITEMS(md, {{"c", 4}});
  EXPECT_THROW(md.erase("b"), KeyNotFound);
  EXPECT_CONSISTENT(md);
}

TEST(MultiDictTest, PopItemIsLastInFirstOut) {
  Dict md{{"a", 1}, {"b", 2}, {"a", 3}};
  EXPECT_EQ(md.popItem(), (std::pair<std::string, int>{"a", 3}));
  EXPECT_EQ(md.popItem(), (std::pair<std::string, int>{"b", 2}));
  EXPECT_CONSISTENT(md);
  EXPECT_EQ(md.popItem(), (std::pair<std::string, int>{"a", 1}));
  EXPECT_THROW(md.popItem(), EmptyContainer);
  EXPECT_EQ(md.tryPopItem(), std::nullopt);
}

TEST(MultiDictTest, ClearIsIdempotent) {
  Dict md{{"a", 1}, {"b", 2}};
  md.clear();
  EXPECT_TRUE(md.empty());
  EXPECT_FALSE(md.contains("a"));
  md.clear();
  EXPECT_TRUE(md.empty());
  EXPECT_CONSISTENT(md);
}

TEST(MultiDictTest, SetDefault) {
  Dict md{{"a", 1}};
  EXPECT_EQ(md.setDefault("a", 5), 1);
  EXPECT_EQ(md.setDefault("b", 5), 5);
  EXPECT_ITEMS(md, {{"a", 1}, {"b", 5}});
}

TEST(MultiDictTest, Views) {
  Dict md{{"a", 1}, {"b", 2}, {"a", 3}};
  auto const keys = md.keys();
  auto const values = md.values();
  auto const items = md.items();
  EXPECT_THAT(keys.toVector(), ElementsAre("a", "b", "a"));
  EXPECT_THAT(values.toVector(), ElementsAre(1, 2, 3));
  EXPECT_THAT(items.toVector(), ElementsAre(Pair("a", 1), Pair("b", 2), Pair("a", 3)));
  EXPECT_EQ(keys.size(), 3U);
  EXPECT_TRUE(keys.contains("b"));
  EXPECT_FALSE(keys.contains("z"));
  EXPECT_TRUE(values.contains(3));
  EXPECT_FALSE(values.contains(4));
  EXPECT_TRUE(items.contains({"a", 3}));
  EXPECT_FALSE(items.contains({"b", 3}));

  md.add("z", 26);
  EXPECT_EQ(keys.size(), 4U);
  EXPECT_TRUE(keys.contains("z"));
  EXPECT_THAT(values.toVector(), ElementsAre(1, 2, 3, 26));
}

TEST(MultiDictTest, RangeFor) {
  Dict const md{{"a", 1}, {"b", 2}, {"a", 3}};
  std::string joined{};
  for (auto const &[key, value] : md)
    joined += fmt::format("{}={};", key, value);
  EXPECT_EQ(joined, "a=1;b=2;a=3;");
}

TEST(MultiDictTest, MutationDuringIterationStaysInBounds) {
  Dict md{{"a", 1}, {"b", 2}, {"c", 3}, {"d", 4}};
  std::size_t steps = 0U;
  for (auto it = md.begin(); it != md.end(); ++it) {
    EXPECT_LT(it.position(), md.size());
    md.popItem();
    ++steps;
  }
  EXPECT_LE(steps, 4U);
  EXPECT_CONSISTENT(md);

  Dict other{{"a", 1}, {"b", 2}, {"a", 3}};
  auto const keys = other.keys();
  auto it = keys.begin();
  other.clear();
  EXPECT_TRUE(it == keys.end());
}

TEST(MultiDictTest, Extend) {
  Dict md{{"a", 1}};
  md.extend(Items{{"a", 2}, {"b", 3}});
  EXPECT_ITEMS(md, {{"a", 1}, {"a", 2}, {"b", 3}});
  md.extend({{"c", 4}});
  md.extend(Items{}, {{"a", 5}});
  EXPECT_ITEMS(md, {{"a", 1}, {"a", 2}, {"b", 3}, {"c", 4}, {"a", 5}});
  EXPECT_CONSISTENT(md);
}

TEST(MultiDictTest, ExtendFromAnotherMultiDict) {
  Dict md{{"a", 1}};
  Dict const other{{"a", 2}, {"b", 3}};
  md.extend(other);
  EXPECT_ITEMS(md, {{"a", 1}, {"a", 2}, {"b", 3}});
}

TEST(MultiDictTest, MergeOnlyAddsAbsentKeys) {
  Dict md{{"a", 1}};
  md.merge({{"a", 2}, {"b", 3}, {"b", 4}});
  EXPECT_ITEMS(md, {{"a", 1}, {"b", 3}, {"b", 4}});
  EXPECT_CONSISTENT(md);
  md.merge(Items{{"b", 5}}, {{"c", 6}});
  EXPECT_ITEMS(md, {{"a", 1}, {"b", 3}, {"b", 4}, {"c", 6}});
}

TEST(MultiDictTest, Update) {
  Dict md{{"a", 1}, {"b", 2}, {"a", 3}};
  md.update({{"a", 9}, {"a", 10}, {"c", 5}, {"c", 6}});
  EXPECT_ITEMS(md, {{"a", 9}, {"b", 2}, {"a", 10}, {"c", 5}, {"c", 6}});
  EXPECT_CONSISTENT(md);
  md.update(Items{{"b", 0}}, {{"a", 7}});
  EXPECT_ITEMS(md, {{"a", 7}, {"b", 0}, {"c", 5}, {"c", 6}});
  EXPECT_CONSISTENT(md);
}

TEST(MultiDictTest, Equality) {
  Dict const left{{"a", 1}, {"b", 2}};
  Dict const same{{"a", 1}, {"b", 2}};
  Dict const swapped{{"b", 2}, {"a", 1}};
  EXPECT_EQ(left, same);
  EXPECT_FALSE(left == swapped);
  EXPECT_TRUE(left.equals(same));
  EXPECT_FALSE(left.equals(swapped));
}

TEST(MultiDictTest, ReprRoundTrip) {
  Dict const md{{"a", 1}, {"it's", -2}, {"a", 3}};
  std::string const text = repr(md);
  EXPECT_EQ(text, R"(MultiDict([('a', 1), ('it\'s', -2), ('a', 3)]))");
  EXPECT_EQ(fmt::format("{}", md), text);
  EXPECT_EQ(Dict::fromRepr(text), md);
  EXPECT_EQ(repr(Dict{}), "MultiDict([])");
  EXPECT_THROW(Dict::fromRepr("MultiDict([('a', )])"), ReprError);
}

TEST(MultiDictTest, CharacterReprRoundTrip) {
  MultiDict<std::string, char> const md{{"a", 'x'}, {"b", '\''}, {"a", ' '}};
  std::string const text = repr(md);
  EXPECT_EQ(text, R"(MultiDict([('a', 'x'), ('b', '\''), ('a', ' ')]))");
  EXPECT_EQ((MultiDict<std::string, char>::fromRepr(text)), md);

  MultiDict<char, int> const byChar{{'k', 1}, {'k', 2}};
  EXPECT_EQ((MultiDict<char, int>::fromRepr(repr(byChar))), byChar);
}

TEST(MultiDictTest, StringInstantiation) {
  MultiDict<std::string, std::string> md{{"k", "v"}, {"k", "w"}};
  md.set("k", "x");
  EXPECT_EQ(repr(md), "MultiDict([('k', 'x')])");
}

struct ThrowingHash {
  std::size_t operator()(std::string const &key) const {
    if (key == "boom")
      throw std::runtime_error("hash failure");
    return std::hash<std::string>{}(key);
  }
};

TEST(MultiDictTest, FailedMutationsLeaveContentUnchanged) {
  using Fragile = MultiDict<std::string, int, ThrowingHash>;
  Fragile md{{"a", 1}, {"b", 2}, {"a", 3}};
  Items const before = md.toList();

  EXPECT_THROW(md.add("boom", 0), std::runtime_error);
  EXPECT_THROW(md.set("boom", 0), std::runtime_error);
  EXPECT_THROW(md.extend({{"c", 4}, {"d", 5}, {"boom", 0}}), std::runtime_error);
  EXPECT_THROW(md.merge({{"c", 4}, {"boom", 0}}), std::runtime_error);
  EXPECT_THROW(md.update({{"a", 9}, {"c", 4}, {"boom", 0}}), std::runtime_error);

  EXPECT_EQ(md.toList(), before);
  EXPECT_CONSISTENT(md);
}

struct SwitchableHash {
  static inline bool failing = false;
  std::size_t operator()(std::string const &key) const {
    if (failing)
      throw std::runtime_error("hash failure");
    return std::hash<std::string>{}(key);
  }
};

TEST(MultiDictTest, FailedPopItemKeepsTailEntry) {
  using Fragile = MultiDict<std::string, int, SwitchableHash>;
  Fragile md{{"a", 1}, {"b", 2}};
  SwitchableHash::failing = true;
  EXPECT_THROW(md.tryPopItem(), std::runtime_error);
  EXPECT_THROW(md.popItem(), std::runtime_error);
  SwitchableHash::failing = false;
  EXPECT_ITEMS(md, {{"a", 1}, {"b", 2}});
  EXPECT_CONSISTENT(md);
  EXPECT_EQ(md.popItem(), (std::pair<std::string, int>{"b", 2}));
}

TEST(MultiDictTest, MatchesListModel) {
  std::mt19937 rng{20260917U};
  std::uniform_int_distribution<int> opDist{0, 8};
  std::uniform_int_distribution<int> keyDist{0, 4};
  std::uniform_int_distribution<int> valueDist{0, 99};
  auto const randomKey = [&]() -> std::string { return fmt::format("k{}", keyDist(rng)); };

  Dict dict{};
  ListMultiDict<std::string, int> model{};
  for (std::size_t step = 0U; step < 2000U; ++step) {
    int const op = opDist(rng);
    std::string const key = randomKey();
    int const value = valueDist(rng);
    switch (op) {
    case 0:
    case 1:
      dict.add(key, value);
      model.add(key, value);
      break;
    case 2:
      dict.set(key, value);
      model.set(key, value);
      break;
    case 3:
      ASSERT_EQ(dict.tryPopFirst(key), model.tryPopFirst(key));
      break;
    case 4:
      ASSERT_EQ(dict.removeAll(key), model.removeAll(key));
      break;
    case 5:
      ASSERT_EQ(dict.tryPopItem(), model.tryPopItem());
      break;
    case 6: {
      Items const batch{{key, value}, {randomKey(), value + 1}, {key, value + 2}};
      dict.update(batch);
      model.update(batch);
      break;
    }
    case 7: {
      Items const batch{{key, value}, {randomKey(), value + 1}};
      dict.merge(batch);
      model.merge(batch);
      break;
    }
    default:
      ASSERT_EQ(dict.getAll(key), model.getAll(key));
      ASSERT_EQ(dict.count(key), model.count(key));
      break;
    }
    ASSERT_EQ(dict.toList(), model.toList()) << "step " << step;
    ASSERT_TRUE(checkConsistent(dict)) << "step " << step;
    ASSERT_EQ(dict.contains(key), dict.get(key).has_value()) << "step " << step;
    ASSERT_EQ(model.contains(key), model.get(key).has_value()) << "step " << step;
    auto const items = dict.items();
    Dict const rebuilt(items.begin(), items.end());
    ASSERT_EQ(rebuilt, dict) << "step " << step;
  }
}

} // namespace multicol::ut

#endif // MULTICOL_ENABLE_UNIT_TESTS

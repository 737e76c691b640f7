#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "Helper.hpp"
#include "ListMultiDict.hpp"
#include "collections/Errors.hpp"
#include "collections/MultiDict.hpp"
#include "collections/MultiMapping.hpp"
#include "collections/Repr.hpp"

namespace multicol::ut {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using Items = std::vector<std::pair<std::string, int>>;

// Every operation below runs on the defaults derived from the four primitives of ListMultiDict.

TEST(MultiMappingDefaultTest, Queries) {
  ListMultiDict<std::string, int> const md{{"a", 1}, {"b", 2}, {"a", 3}};
  EXPECT_EQ(md.size(), 3U);
  EXPECT_FALSE(md.empty());
  EXPECT_EQ(md.count("a"), 2U);
  EXPECT_TRUE(md.contains("b"));
  EXPECT_FALSE(md.contains("missing"));
  EXPECT_EQ(md.get("a"), std::optional<int>{1});
  EXPECT_EQ(md.get("missing"), std::nullopt);
  EXPECT_EQ(md.getFirst("a"), 1);
  EXPECT_EQ(md.getFirst("missing", 42), 42);
  EXPECT_THROW(md.getFirst("missing"), KeyNotFound);
  EXPECT_THAT(md.getAll("a"), ElementsAre(1, 3));
  EXPECT_THAT(md.getAll("missing"), IsEmpty());
  EXPECT_THAT(md.getAll("missing", {7}), ElementsAre(7));
  EXPECT_THROW(md.requireAll("missing"), KeyNotFound);
  EXPECT_THAT(md.keyList(), ElementsAre("a", "b", "a"));
  EXPECT_THAT(md.valueList(), ElementsAre(1, 2, 3));
  EXPECT_EQ(repr(md), "ListMultiDict([('a', 1), ('b', 2), ('a', 3)])");
}

TEST(MultiMappingDefaultTest, SetCollapsesDuplicates) {
  ListMultiDict<std::string, int> md{{"a", 1}, {"b", 2}, {"a", 3}};
  md.set("a", 99);
  EXPECT_ITEMS(md, {{"a", 99}, {"b", 2}});
  md.set("c", 4);
  EXPECT_ITEMS(md, {{"a", 99}, {"b", 2}, {"c", 4}});
}

TEST(MultiMappingDefaultTest, PopFirst) {
  ListMultiDict<std::string, int> md{{"a", 1}, {"b", 2}, {"a", 3}};
  EXPECT_EQ(md.popFirst("a"), 1);
  EXPECT_ITEMS(md, {{"b", 2}, {"a", 3}});
  EXPECT_EQ(md.popFirst("missing", -1), -1);
  EXPECT_THROW(md.popFirst("missing"), KeyNotFound);
  EXPECT_ITEMS(md, {{"b", 2}, {"a", 3}});
}

TEST(MultiMappingDefaultTest, PopAllEraseAndPopItem) {
  ListMultiDict<std::string, int> md{{"a", 1}, {"b", 2}, {"a", 3}, {"c", 4}};
  EXPECT_THAT(md.popAll("a"), ElementsAre(1, 3));
  EXPECT_ITEMS(md, {{"b", 2}, {"c", 4}});
  EXPECT_THROW(md.popAll("a"), KeyNotFound);
  EXPECT_THAT(md.popAll("a", {0}), ElementsAre(0));
  EXPECT_EQ(md.popItem(), (std::pair<std::string, int>{"c", 4}));
  md.erase("b");
  EXPECT_TRUE(md.empty());
  EXPECT_THROW(md.erase("b"), KeyNotFound);
  EXPECT_THROW(md.popItem(), EmptyContainer);
  EXPECT_EQ(md.tryPopItem(), std::nullopt);
}

TEST(MultiMappingDefaultTest, Clear) {
  ListMultiDict<std::string, int> md{{"a", 1}, {"b", 2}, {"a", 3}};
  md.clear();
  EXPECT_EQ(md.size(), 0U);
  md.clear();
  EXPECT_EQ(md.size(), 0U);
}

TEST(MultiMappingDefaultTest, SetDefault) {
  ListMultiDict<std::string, int> md{{"x", 1}, {"x", 2}};
  EXPECT_EQ(md.setDefault("x", 5), 1);
  EXPECT_EQ(md.setDefault("y", 5), 5);
  EXPECT_ITEMS(md, {{"x", 1}, {"x", 2}, {"y", 5}});
}

TEST(MultiMappingDefaultTest, Extend) {
  ListMultiDict<std::string, int> md{{"a", 1}};
  md.extend(Items{{"a", 2}, {"b", 3}}, {{"a", 4}});
  EXPECT_ITEMS(md, {{"a", 1}, {"a", 2}, {"b", 3}, {"a", 4}});
}

TEST(MultiMappingDefaultTest, MergeUsesPreBatchKeys) {
  ListMultiDict<std::string, int> md{{"a", 1}};
  md.merge({{"a", 2}, {"b", 3}, {"b", 4}});
  EXPECT_ITEMS(md, {{"a", 1}, {"b", 3}, {"b", 4}});
}

TEST(MultiMappingDefaultTest, UpdateReplacesOncePerExistingKey) {
  ListMultiDict<std::string, int> md{{"a", 1}, {"b", 2}, {"a", 3}};
  md.update({{"a", 9}, {"a", 10}, {"c", 5}, {"c", 6}});
  EXPECT_ITEMS(md, {{"a", 9}, {"b", 2}, {"a", 10}, {"c", 5}, {"c", 6}});
}

TEST(MultiMappingDefaultTest, FailedSetRestoresEntries) {
  ListMultiDict<std::string, int> md{{"a", 1}, {"b", 2}, {"a", 3}};
  md.failAfter(1U);
  EXPECT_THROW(md.set("a", 9), std::runtime_error);
  EXPECT_ITEMS(md, {{"a", 1}, {"b", 2}, {"a", 3}});
}

TEST(MultiMappingDefaultTest, FailedExtendRestoresEntries) {
  ListMultiDict<std::string, int> md{{"a", 1}};
  md.failAfter(1U);
  EXPECT_THROW(md.extend({{"b", 2}, {"c", 3}}), std::runtime_error);
  EXPECT_ITEMS(md, {{"a", 1}});
}

TEST(MultiMappingDefaultTest, FailedPopFirstKeepsValue) {
  ListMultiDict<std::string, int> md{{"a", 1}, {"b", 2}};
  md.failAfter(0U);
  EXPECT_THROW(md.popFirst("a"), std::runtime_error);
  EXPECT_ITEMS(md, {{"a", 1}, {"b", 2}});
}

TEST(MultiMappingDefaultTest, EqualsAcrossImplementations) {
  ListMultiDict<std::string, int> const list{{"a", 1}, {"b", 2}, {"a", 3}};
  MultiDict<std::string, int> const dict{{"a", 1}, {"b", 2}, {"a", 3}};
  MultiDict<std::string, int> const reordered{{"a", 3}, {"b", 2}, {"a", 1}};
  EXPECT_TRUE(list.equals(dict));
  EXPECT_TRUE(dict.equals(list));
  EXPECT_FALSE(list.equals(reordered));
}

TEST(MultiMappingDefaultTest, ExtendFromMapKeepsMapOrder) {
  ListMultiDict<std::string, int> md{};
  md.extend(std::map<std::string, int>{{"b", 2}, {"a", 1}});
  EXPECT_ITEMS(md, {{"a", 1}, {"b", 2}});
}

} // namespace multicol::ut

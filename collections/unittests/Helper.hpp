#pragma once

#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>

#include "collections/Errors.hpp"
#include "collections/MultiMapping.hpp"
#include "collections/Repr.hpp"

#define EXPECT_ITEMS(mapping, ...) EXPECT_TRUE(::multicol::ut::checkItems(mapping, __VA_ARGS__))
#define EXPECT_CONSISTENT(dict) EXPECT_TRUE(::multicol::ut::checkConsistent(dict))

namespace multicol::ut {

template <class K, class V> std::string reprList(std::vector<std::pair<K, V>> const &items) {
  std::string out{"["};
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i != 0U)
      out += ", ";
    out += '(';
    ReprTraits<K>::format(out, items[i].first);
    out += ", ";
    ReprTraits<V>::format(out, items[i].second);
    out += ')';
  }
  out += ']';
  return out;
}

template <class K, class V>
testing::AssertionResult checkItems(MultiMapping<K, V> const &mapping, std::vector<std::pair<K, V>> const &expected) {
  if (mapping.size() == expected.size() && mapping.toList() == expected)
    return testing::AssertionSuccess();
  return testing::AssertionFailure() << " actual:   " << repr(mapping) << "\n expected: " << reprList(expected)
                                     << "\n";
}

template <class Dict> testing::AssertionResult checkConsistent(Dict const &dict) {
  try {
    dict.verify();
  } catch (InvariantViolation const &e) {
    return testing::AssertionFailure() << " " << e.what() << "\n in " << repr(dict) << "\n";
  }
  return testing::AssertionSuccess();
}

} // namespace multicol::ut

#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "collections/MultiMapping.hpp"

namespace multicol::ut {

/// @brief multi-mapping which only implements the four primitives over a plain vector.
/// Every other operation comes from the defaults of `MutableMultiMapping`.
template <class K, class V> class ListMultiDict : public MutableMultiMapping<K, V> {
public:
  using typename MutableMultiMapping<K, V>::value_type;
  using typename MultiMapping<K, V>::Visitor;
  using MultiMapping<K, V>::getAll;

  ListMultiDict() = default;
  ListMultiDict(std::initializer_list<value_type> init) : items_(init) {}

  char const *typeName() const override { return "ListMultiDict"; }

  void forEach(Visitor const &visitor) const override {
    for (value_type const &item : items_) {
      if (!visitor(item.first, item.second))
        return;
    }
  }
  std::vector<V> getAll(K const &key) const override {
    std::vector<V> values{};
    for (value_type const &item : items_) {
      if (item.first == key)
        values.push_back(item.second);
    }
    return values;
  }
  void add(K key, V value) override {
    if (failAfter_.has_value()) {
      if (*failAfter_ == 0U) {
        failAfter_.reset();
        throw std::runtime_error("injected add failure");
      }
      --*failAfter_;
    }
    items_.emplace_back(std::move(key), std::move(value));
  }
  std::vector<V> removeAll(K const &key) override {
    std::vector<V> values{};
    std::vector<value_type> kept{};
    for (value_type &item : items_) {
      if (item.first == key)
        values.push_back(std::move(item.second));
      else
        kept.push_back(std::move(item));
    }
    items_ = std::move(kept);
    return values;
  }

  /// @brief the add after @param n successful adds throws once.
  void failAfter(std::size_t n) { failAfter_ = n; }

private:
  std::vector<value_type> items_;
  std::optional<std::size_t> failAfter_;
};

} // namespace multicol::ut

#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <fmt/format.h>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "collections/Errors.hpp"
#include "collections/MultiMapping.hpp"
#include "collections/Repr.hpp"
#include "collections/Views.hpp"
#include "support/Debug.hpp"

namespace multicol {

/// @brief ordered multi-valued dictionary.
///
/// Entries live in the Entry Log, a vector in insertion order which is the source of truth for order and
/// multiplicity. The Position Index maps every key to the ascending positions of its entries in the Entry Log.
/// Appends and removals at the tail keep the index in O(1). Any removal in the middle compacts the Entry Log in
/// one pass and renumbers every position list through a translation table, O(n) in total.
///
/// Every mutation gives the strong exception guarantee, assuming moves of K and V do not throw.
/// Views and iterators read the live Entry Log. Mutating the container while iterating never reads out of bounds
/// but which entries the iteration sees after the mutation is unspecified.
template <class K, class V, class Hash = std::hash<K>, class KeyEqual = std::equal_to<K>>
class MultiDict : public MutableMultiMapping<K, V> {
  using Base = MutableMultiMapping<K, V>;
  using Index = std::unordered_map<K, std::vector<std::size_t>, Hash, KeyEqual>;

public:
  using typename Base::value_type;
  using Visitor = typename MultiMapping<K, V>::Visitor;
  using size_type = std::size_t;
  using iterator = typename ItemsView<MultiDict, K, V>::iterator;
  using const_iterator = iterator;

  static constexpr char const *debugName = "MultiDict";

  MultiDict() = default;
  MultiDict(std::initializer_list<value_type> init) { appendAll(init); }
  template <std::input_iterator It> MultiDict(It first, It last) {
    for (; first != last; ++first)
      append(value_type(*first));
  }
  template <class Range>
    requires PairRangeOf<Range, K, V>
  explicit MultiDict(Range const &source) {
    appendAll(source);
  }
  /// @param trailing seed pairs appended after @param source
  template <class Range>
    requires PairRangeOf<Range, K, V>
  MultiDict(Range const &source, std::initializer_list<value_type> trailing) {
    appendAll(source);
    appendAll(trailing);
  }

  /// @brief rebuild a container from the output of `repr`.
  static MultiDict fromRepr(std::string_view text) { return MultiDict(parseRepr<K, V>(text)); }

  char const *typeName() const override { return "MultiDict"; }

  // ---- queries ----

  using MultiMapping<K, V>::getAll;

  void forEach(Visitor const &visitor) const override {
    for (value_type const &entry : entries_) {
      if (!visitor(entry.first, entry.second))
        return;
    }
  }
  std::vector<V> getAll(K const &key) const override {
    std::vector<V> values{};
    auto const it = index_.find(key);
    if (it == index_.end())
      return values;
    values.reserve(it->second.size());
    for (std::size_t const pos : it->second)
      values.push_back(entries_[pos].second);
    return values;
  }
  std::size_t size() const override { return entries_.size(); }
  std::size_t count(K const &key) const override {
    auto const it = index_.find(key);
    return it == index_.end() ? 0U : it->second.size();
  }
  bool contains(K const &key) const override { return index_.contains(key); }
  std::optional<V> get(K const &key) const override {
    V const *value = findFirst(key);
    if (value == nullptr)
      return std::nullopt;
    return *value;
  }

  /// @return reference to the first value of @param key
  /// @throw KeyNotFound
  V const &at(K const &key) const {
    V const *value = findFirst(key);
    if (value == nullptr)
      throw KeyNotFound("at");
    return *value;
  }
  /// @return entry at @param pos of the Entry Log
  /// @throw std::out_of_range
  value_type const &entryAt(std::size_t pos) const { return entries_.at(pos); }

  KeysView<MultiDict, K> keys() const { return KeysView<MultiDict, K>{*this}; }
  ValuesView<MultiDict, V> values() const { return ValuesView<MultiDict, V>{*this}; }
  ItemsView<MultiDict, K, V> items() const { return ItemsView<MultiDict, K, V>{*this}; }
  iterator begin() const { return items().begin(); }
  iterator end() const { return items().end(); }

  bool operator==(MultiDict const &other) const { return entries_ == other.entries_; }

  // ---- mutations ----

  void add(K key, V value) override {
    append(std::move(key), std::move(value));
    afterMutation();
  }

  void set(K key, V value) override {
    auto const it = index_.find(key);
    if (it == index_.end()) {
      append(std::move(key), std::move(value));
      afterMutation();
      return;
    }
    std::vector<std::size_t> &positions = it->second;
    if (positions.size() == 1U) {
      entries_[positions.front()].second = std::move(value);
      afterMutation();
      return;
    }
    std::vector<std::size_t> const removed(positions.begin() + 1, positions.end());
    std::vector<std::size_t> const renumbered = renumbering(removed);
    entries_[positions.front()].second = std::move(value);
    positions.resize(1U);
    compact(removed, renumbered);
    afterMutation();
  }

  std::vector<V> removeAll(K const &key) override {
    auto const it = index_.find(key);
    if (it == index_.end())
      return {};
    std::vector<std::size_t> const removed = it->second;
    std::vector<std::size_t> const renumbered = renumbering(removed);
    std::vector<V> values{};
    values.reserve(removed.size());
    for (std::size_t const pos : removed)
      values.push_back(std::move(entries_[pos].second));
    index_.erase(it);
    compact(removed, renumbered);
    afterMutation();
    return values;
  }

  std::optional<V> tryPopFirst(K const &key) override {
    auto const it = index_.find(key);
    if (it == index_.end())
      return std::nullopt;
    std::vector<std::size_t> &positions = it->second;
    std::size_t const first = positions.front();
    if (first + 1U == entries_.size()) {
      // the only entry of this key sits at the tail, no position shifts
      std::optional<V> popped{std::move(entries_.back().second)};
      index_.erase(it);
      entries_.pop_back();
      if (support::isDebug(debugName))
        fmt::print("[{}] pop tail entry {}\n", debugName, first);
      afterMutation();
      return popped;
    }
    std::vector<std::size_t> const removed{first};
    std::vector<std::size_t> const renumbered = renumbering(removed);
    std::optional<V> popped{std::move(entries_[first].second)};
    if (positions.size() == 1U)
      index_.erase(it);
    else
      positions.erase(positions.begin());
    compact(removed, renumbered);
    afterMutation();
    return popped;
  }

  std::optional<value_type> tryPopItem() override {
    if (entries_.empty())
      return std::nullopt;
    std::optional<value_type> popped{popBack()};
    afterMutation();
    return popped;
  }

  void clear() override {
    entries_.clear();
    index_.clear();
  }

  void swap(MultiDict &other) noexcept {
    entries_.swap(other.entries_);
    index_.swap(other.index_);
  }

  /// @brief check every Position Index invariant against the Entry Log, O(n).
  /// @throw InvariantViolation
  void verify() const {
    std::vector<bool> seen(entries_.size(), false);
    std::size_t indexed = 0U;
    for (auto const &[key, positions] : index_) {
      if (positions.empty())
        throw InvariantViolation("key without position");
      for (std::size_t i = 0; i < positions.size(); ++i) {
        std::size_t const pos = positions[i];
        if (pos >= entries_.size())
          throw InvariantViolation(fmt::format("position {} out of range {}", pos, entries_.size()));
        if (i > 0U && positions[i - 1U] >= pos)
          throw InvariantViolation(fmt::format("positions not ascending at {}", pos));
        if (seen[pos])
          throw InvariantViolation(fmt::format("position {} indexed twice", pos));
        if (!index_.key_eq()(entries_[pos].first, key))
          throw InvariantViolation(fmt::format("position {} indexed under another key", pos));
        seen[pos] = true;
        ++indexed;
      }
    }
    if (indexed != entries_.size())
      throw InvariantViolation(fmt::format("{} of {} entries indexed", indexed, entries_.size()));
  }

protected:
  void extendBatch(std::vector<value_type> batch) override {
    std::size_t const before = entries_.size();
    try {
      for (value_type &item : batch)
        append(std::move(item.first), std::move(item.second));
    } catch (...) {
      truncate(before);
      throw;
    }
    afterMutation();
  }

  void mergeBatch(std::vector<value_type> batch) override {
    std::size_t const before = entries_.size();
    try {
      for (value_type &item : batch) {
        if (!existedBefore(item.first, before))
          append(std::move(item.first), std::move(item.second));
      }
    } catch (...) {
      truncate(before);
      throw;
    }
    afterMutation();
  }

  void updateBatch(std::vector<value_type> batch) override {
    MultiDict next(*this);
    next.applyUpdate(std::move(batch));
    swap(next);
    afterMutation();
  }

private:
  std::vector<value_type> entries_;
  Index index_;

  template <class Range> void appendAll(Range const &source) {
    for (auto const &element : source)
      append(value_type(element));
  }
  void append(value_type entry) { append(std::move(entry.first), std::move(entry.second)); }
  void append(K key, V value) {
    std::size_t const pos = entries_.size();
    auto const [it, inserted] = index_.try_emplace(key);
    try {
      it->second.push_back(pos);
      entries_.emplace_back(std::move(key), std::move(value));
    } catch (...) {
      if (!it->second.empty() && it->second.back() == pos)
        it->second.pop_back();
      if (inserted)
        index_.erase(it);
      throw;
    }
  }

  /// @brief remove the tail entry. The index lookup runs before anything is moved.
  value_type popBack() {
    auto const it = index_.find(entries_.back().first);
    assert(it != index_.end() && it->second.back() + 1U == entries_.size());
    value_type entry{std::move(entries_.back())};
    it->second.pop_back();
    if (it->second.empty())
      index_.erase(it);
    entries_.pop_back();
    return entry;
  }
  void truncate(std::size_t n) {
    while (entries_.size() > n)
      popBack();
  }

  V const *findFirst(K const &key) const {
    auto const it = index_.find(key);
    if (it == index_.end())
      return nullptr;
    return &entries_[it->second.front()].second;
  }
  bool existedBefore(K const &key, std::size_t before) const {
    auto const it = index_.find(key);
    return it != index_.end() && it->second.front() < before;
  }

  /// @return new position of every surviving entry once the ascending positions @param removed are dropped.
  std::vector<std::size_t> renumbering(std::vector<std::size_t> const &removed) const {
    std::vector<std::size_t> renumbered(entries_.size());
    auto next = removed.begin();
    std::size_t skipped = 0U;
    for (std::size_t pos = 0U; pos < entries_.size(); ++pos) {
      if (next != removed.end() && *next == pos) {
        ++next;
        ++skipped;
        continue;
      }
      renumbered[pos] = pos - skipped;
    }
    return renumbered;
  }
  /// @brief drop the entries at @param removed and renumber the index.
  /// The caller has already taken @param removed out of the position lists.
  void compact(std::vector<std::size_t> const &removed, std::vector<std::size_t> const &renumbered) {
    std::size_t const oldSize = entries_.size();
    auto next = removed.begin();
    std::size_t out = removed.front();
    for (std::size_t in = removed.front(); in < oldSize; ++in) {
      if (next != removed.end() && *next == in) {
        ++next;
        continue;
      }
      entries_[out++] = std::move(entries_[in]);
    }
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(out), entries_.end());
    for (auto &[key, positions] : index_) {
      for (std::size_t &pos : positions)
        pos = renumbered[pos];
    }
    if (support::isDebug(debugName))
      fmt::print("[{}] compact: removed {} of {} entries\n", debugName, removed.size(), oldSize);
  }

  void applyUpdate(std::vector<value_type> batch) {
    std::size_t const before = entries_.size();
    std::unordered_set<K, Hash, KeyEqual> replaced{};
    std::vector<std::size_t> removed{};
    for (value_type &item : batch) {
      auto const it = index_.find(item.first);
      if (it != index_.end() && it->second.front() < before && !replaced.contains(item.first)) {
        std::vector<std::size_t> &positions = it->second;
        entries_[positions.front()].second = std::move(item.second);
        removed.insert(removed.end(), positions.begin() + 1, positions.end());
        positions.resize(1U);
        replaced.insert(std::move(item.first));
      } else {
        append(std::move(item.first), std::move(item.second));
      }
    }
    if (removed.empty())
      return;
    std::sort(removed.begin(), removed.end());
    compact(removed, renumbering(removed));
  }

  void afterMutation() const {
    if (support::isDebug(debugName))
      verify();
  }
};

} // namespace multicol

template <class K, class V, class Hash, class KeyEqual>
struct fmt::formatter<multicol::MultiDict<K, V, Hash, KeyEqual>> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(multicol::MultiDict<K, V, Hash, KeyEqual> const &m, FormatContext &ctx) const {
    std::string const text = multicol::repr(m);
    return fmt::formatter<std::string_view>::format(std::string_view{text}, ctx);
  }
};

extern template class multicol::MultiDict<std::string, std::string>;

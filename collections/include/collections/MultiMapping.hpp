#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <ranges>
#include <utility>
#include <vector>

#include "collections/Errors.hpp"

namespace multicol {

/// @brief range whose elements can build a `std::pair<K, V>`, e.g. `std::map<K, V>` or `std::vector<std::pair<K, V>>`.
template <class R, class K, class V>
concept PairRangeOf =
    std::ranges::input_range<R const> && std::constructible_from<std::pair<K, V>, std::ranges::range_reference_t<R const>>;

/// @brief read-only mapping which can hold several values for the same key, in insertion order.
///
/// Implementations provide `forEach` and `getAll`. Every other query is derived from these two and can be
/// overridden when the implementation knows a faster way.
template <class K, class V> class MultiMapping {
public:
  using key_type = K;
  using mapped_type = V;
  using value_type = std::pair<K, V>;
  /// return false to stop the iteration
  using Visitor = std::function<bool(K const &, V const &)>;

  virtual ~MultiMapping() = default;

  virtual char const *typeName() const { return "MultiMapping"; }

  /// @brief visit every entry in insertion order, keys with several values are visited several times.
  virtual void forEach(Visitor const &visitor) const = 0;
  /// @return every value of @param key in insertion order, empty when the key is absent.
  virtual std::vector<V> getAll(K const &key) const = 0;

  /// @return number of entries, not number of distinct keys.
  virtual std::size_t size() const {
    std::size_t n = 0U;
    forEach([&n](K const &, V const &) -> bool {
      ++n;
      return true;
    });
    return n;
  }
  virtual std::size_t count(K const &key) const { return getAll(key).size(); }
  virtual bool contains(K const &key) const { return count(key) != 0U; }
  /// @return first value of @param key
  virtual std::optional<V> get(K const &key) const {
    std::vector<V> values = getAll(key);
    if (values.empty())
      return std::nullopt;
    return std::move(values.front());
  }

  bool empty() const { return size() == 0U; }

  V getFirst(K const &key) const {
    std::optional<V> value = get(key);
    if (!value.has_value())
      throw KeyNotFound("getFirst");
    return std::move(value).value();
  }
  V getFirst(K const &key, V fallback) const {
    std::optional<V> value = get(key);
    if (!value.has_value())
      return fallback;
    return std::move(value).value();
  }

  std::vector<V> getAll(K const &key, std::vector<V> fallback) const {
    std::vector<V> values = getAll(key);
    if (values.empty())
      return fallback;
    return values;
  }
  std::vector<V> requireAll(K const &key) const {
    std::vector<V> values = getAll(key);
    if (values.empty())
      throw KeyNotFound("requireAll");
    return values;
  }

  std::vector<value_type> toList() const {
    std::vector<value_type> items{};
    forEach([&items](K const &key, V const &value) -> bool {
      items.emplace_back(key, value);
      return true;
    });
    return items;
  }
  std::vector<K> keyList() const {
    std::vector<K> keys{};
    forEach([&keys](K const &key, V const &) -> bool {
      keys.push_back(key);
      return true;
    });
    return keys;
  }
  std::vector<V> valueList() const {
    std::vector<V> values{};
    forEach([&values](K const &, V const &value) -> bool {
      values.push_back(value);
      return true;
    });
    return values;
  }

  /// @return true iff both hold the same entries in the same order.
  bool equals(MultiMapping const &other) const { return size() == other.size() && toList() == other.toList(); }
};

/// @brief mutable multi-mapping.
///
/// Implementations provide `add` and `removeAll` on top of the `MultiMapping` primitives. The derived mutations
/// rewrite the whole content through the primitives, which is O(n), and restore the previous content when
/// a primitive throws.
template <class K, class V> class MutableMultiMapping : public MultiMapping<K, V> {
public:
  using typename MultiMapping<K, V>::value_type;

  /// @brief append an entry, never replaces.
  virtual void add(K key, V value) = 0;
  /// @brief remove every entry of @param key.
  /// @return removed values in insertion order, empty when the key is absent.
  virtual std::vector<V> removeAll(K const &key) = 0;

  /// @brief replace the value of the first entry of @param key and remove the other entries of that key.
  /// Appends when the key is absent.
  virtual void set(K key, V value) {
    if (!this->contains(key)) {
      add(std::move(key), std::move(value));
      return;
    }
    rewrite([&key, &value](std::vector<value_type> &items) -> void {
      std::vector<value_type> kept{};
      kept.reserve(items.size());
      bool replaced = false;
      for (value_type &item : items) {
        if (item.first == key) {
          if (replaced)
            continue;
          item.second = std::move(value);
          replaced = true;
        }
        kept.push_back(std::move(item));
      }
      items = std::move(kept);
    });
  }
  /// @brief remove the first entry of @param key.
  virtual std::optional<V> tryPopFirst(K const &key) {
    if (!this->contains(key))
      return std::nullopt;
    std::optional<V> popped{};
    rewrite([&key, &popped](std::vector<value_type> &items) -> void {
      auto it = std::find_if(items.begin(), items.end(), [&key](value_type const &item) { return item.first == key; });
      popped.emplace(std::move(it->second));
      items.erase(it);
    });
    return popped;
  }
  /// @brief remove the most recently inserted entry.
  virtual std::optional<value_type> tryPopItem() {
    if (this->empty())
      return std::nullopt;
    std::optional<value_type> popped{};
    rewrite([&popped](std::vector<value_type> &items) -> void {
      popped.emplace(std::move(items.back()));
      items.pop_back();
    });
    return popped;
  }
  virtual void clear() {
    for (K const &key : this->keyList())
      removeAll(key);
  }

  V popFirst(K const &key) {
    std::optional<V> value = tryPopFirst(key);
    if (!value.has_value())
      throw KeyNotFound("popFirst");
    return std::move(value).value();
  }
  V popFirst(K const &key, V fallback) {
    std::optional<V> value = tryPopFirst(key);
    if (!value.has_value())
      return fallback;
    return std::move(value).value();
  }
  std::vector<V> popAll(K const &key) {
    std::vector<V> values = removeAll(key);
    if (values.empty())
      throw KeyNotFound("popAll");
    return values;
  }
  std::vector<V> popAll(K const &key, std::vector<V> fallback) {
    std::vector<V> values = removeAll(key);
    if (values.empty())
      return fallback;
    return values;
  }
  void erase(K const &key) {
    if (removeAll(key).empty())
      throw KeyNotFound("erase");
  }
  value_type popItem() {
    std::optional<value_type> item = tryPopItem();
    if (!item.has_value())
      throw EmptyContainer("popItem");
    return std::move(item).value();
  }
  /// @return first value of @param key, or @param value after adding it when the key is absent.
  V setDefault(K key, V value) {
    std::optional<V> existing = this->get(key);
    if (existing.has_value())
      return std::move(existing).value();
    add(std::move(key), value);
    return value;
  }

  /// @brief `add` every pair of @param other in order.
  template <class Range>
    requires PairRangeOf<Range, K, V>
  void extend(Range const &other) {
    extendBatch(toBatch(other));
  }
  void extend(std::initializer_list<value_type> other) { extendBatch(toBatch(other)); }
  template <class Range>
    requires PairRangeOf<Range, K, V>
  void extend(Range const &other, std::initializer_list<value_type> trailing) {
    extendBatch(toBatch(other, trailing));
  }

  /// @brief `add` the pairs of @param other whose key was absent before the call.
  template <class Range>
    requires PairRangeOf<Range, K, V>
  void merge(Range const &other) {
    mergeBatch(toBatch(other));
  }
  void merge(std::initializer_list<value_type> other) { mergeBatch(toBatch(other)); }
  template <class Range>
    requires PairRangeOf<Range, K, V>
  void merge(Range const &other, std::initializer_list<value_type> trailing) {
    mergeBatch(toBatch(other, trailing));
  }

  /// @brief for keys present before the call, the first pair of @param other replaces like `set` and the later
  /// pairs are added. Pairs of other keys are added.
  template <class Range>
    requires PairRangeOf<Range, K, V>
  void update(Range const &other) {
    updateBatch(toBatch(other));
  }
  void update(std::initializer_list<value_type> other) { updateBatch(toBatch(other)); }
  template <class Range>
    requires PairRangeOf<Range, K, V>
  void update(Range const &other, std::initializer_list<value_type> trailing) {
    updateBatch(toBatch(other, trailing));
  }

protected:
  virtual void extendBatch(std::vector<value_type> batch) {
    transact([this, &batch]() -> void {
      for (value_type &item : batch)
        add(std::move(item.first), std::move(item.second));
    });
  }
  virtual void mergeBatch(std::vector<value_type> batch) {
    std::vector<bool> const existed = presenceBeforeBatch(batch);
    transact([this, &batch, &existed]() -> void {
      for (std::size_t i = 0; i < batch.size(); ++i) {
        if (!existed[i])
          add(std::move(batch[i].first), std::move(batch[i].second));
      }
    });
  }
  virtual void updateBatch(std::vector<value_type> batch) {
    std::vector<bool> const existed = presenceBeforeBatch(batch);
    transact([this, &batch, &existed]() -> void {
      std::vector<K> replaced{};
      for (std::size_t i = 0; i < batch.size(); ++i) {
        K &key = batch[i].first;
        if (existed[i] && std::find(replaced.begin(), replaced.end(), key) == replaced.end()) {
          replaced.push_back(key);
          set(std::move(key), std::move(batch[i].second));
        } else {
          add(std::move(key), std::move(batch[i].second));
        }
      }
    });
  }

  template <class Range> static std::vector<value_type> toBatch(Range const &range) {
    std::vector<value_type> batch{};
    for (auto const &element : range)
      batch.emplace_back(element);
    return batch;
  }
  template <class Range>
  static std::vector<value_type> toBatch(Range const &range, std::initializer_list<value_type> trailing) {
    std::vector<value_type> batch = toBatch(range);
    batch.insert(batch.end(), trailing.begin(), trailing.end());
    return batch;
  }

private:
  std::vector<bool> presenceBeforeBatch(std::vector<value_type> const &batch) const {
    std::vector<bool> existed{};
    existed.reserve(batch.size());
    for (value_type const &item : batch)
      existed.push_back(this->contains(item.first));
    return existed;
  }

  void restore(std::vector<value_type> const &snapshot) {
    clear();
    for (value_type const &item : snapshot)
      add(item.first, item.second);
  }
  /// @brief run @param fn, put the previous entries back if it throws.
  template <class Fn> void transact(Fn &&fn) {
    std::vector<value_type> const snapshot = this->toList();
    try {
      fn();
    } catch (...) {
      restore(snapshot);
      throw;
    }
  }
  /// @brief replace the whole content by the entries @param fn leaves in the list it receives.
  template <class Fn> void rewrite(Fn &&fn) {
    std::vector<value_type> const snapshot = this->toList();
    std::vector<value_type> items = snapshot;
    fn(items);
    try {
      clear();
      for (value_type &item : items)
        add(std::move(item.first), std::move(item.second));
    } catch (...) {
      restore(snapshot);
      throw;
    }
  }
};

} // namespace multicol

#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>
#include <utility>
#include <vector>

namespace multicol {

namespace detail {

struct ProjectKey {
  template <class Entry> auto const &operator()(Entry const &entry) const { return entry.first; }
};
struct ProjectValue {
  template <class Entry> auto const &operator()(Entry const &entry) const { return entry.second; }
};
struct ProjectItem {
  template <class Entry> Entry const &operator()(Entry const &entry) const { return entry; }
};

/// @brief forward iterator over the Entry Log of @tparam Owner.
///
/// The position is checked against the live Entry Log whenever the iterator is compared, so a mutation of the
/// owner during an iteration ends or shifts the iteration instead of reading out of bounds.
template <class Owner, class T, class Projection> class EntryIterator {
  Owner const *owner_;
  std::size_t pos_;

public:
  static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

  using iterator_category = std::forward_iterator_tag;
  using value_type = T;
  using difference_type = std::ptrdiff_t;
  using pointer = T const *;
  using reference = T const &;

  EntryIterator() : owner_(nullptr), pos_(npos) {}
  EntryIterator(Owner const *owner, std::size_t pos) : owner_(owner), pos_(pos) {}

  reference operator*() const { return Projection{}(owner_->entryAt(pos_)); }
  pointer operator->() const { return &**this; }

  EntryIterator &operator++() {
    ++pos_;
    return *this;
  }
  EntryIterator operator++(int) {
    EntryIterator old = *this;
    ++pos_;
    return old;
  }

  bool operator==(EntryIterator const &o) const {
    bool const end = isEnd();
    if (end || o.isEnd())
      return end == o.isEnd();
    return owner_ == o.owner_ && pos_ == o.pos_;
  }
  bool operator!=(EntryIterator const &o) const { return !(*this == o); }

  std::size_t position() const { return pos_; }

private:
  bool isEnd() const { return owner_ == nullptr || pos_ >= owner_->size(); }
};

template <class Owner, class T, class Projection> class ViewBase {
protected:
  Owner const *owner_;

public:
  using iterator = EntryIterator<Owner, T, Projection>;
  using const_iterator = iterator;
  using value_type = T;

  explicit ViewBase(Owner const &owner) : owner_(&owner) {}

  iterator begin() const { return iterator{owner_, 0U}; }
  iterator end() const { return iterator{owner_, iterator::npos}; }
  std::size_t size() const { return owner_->size(); }
  bool empty() const { return owner_->size() == 0U; }

  std::vector<T> toVector() const { return std::vector<T>(begin(), end()); }
};

} // namespace detail

/// @brief every key once per entry, in Entry Log order.
template <class Owner, class K>
class KeysView : public detail::ViewBase<Owner, K, detail::ProjectKey> {
public:
  using detail::ViewBase<Owner, K, detail::ProjectKey>::ViewBase;

  /// @note O(1) through the Position Index.
  bool contains(K const &key) const { return this->owner_->contains(key); }
};

template <class Owner, class V>
class ValuesView : public detail::ViewBase<Owner, V, detail::ProjectValue> {
public:
  using detail::ViewBase<Owner, V, detail::ProjectValue>::ViewBase;

  bool contains(V const &value) const { return std::find(this->begin(), this->end(), value) != this->end(); }
};

template <class Owner, class K, class V>
class ItemsView : public detail::ViewBase<Owner, std::pair<K, V>, detail::ProjectItem> {
public:
  using detail::ViewBase<Owner, std::pair<K, V>, detail::ProjectItem>::ViewBase;

  bool contains(std::pair<K, V> const &item) const {
    std::vector<V> const values = this->owner_->getAll(item.first);
    return std::find(values.begin(), values.end(), item.second) != values.end();
  }
};

} // namespace multicol

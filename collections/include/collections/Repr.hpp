#pragma once

#include <charconv>
#include <concepts>
#include <cstddef>
#include <fmt/format.h>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "collections/Errors.hpp"
#include "collections/MultiMapping.hpp"

namespace multicol {

/// @brief cursor over a textual representation. Every failure throws `ReprError` with the current offset.
class ReprReader {
  std::string_view text_;
  std::size_t pos_;

public:
  explicit ReprReader(std::string_view text) : text_(text), pos_(0U) {}

  std::size_t offset() const { return pos_; }
  bool atEnd() const { return pos_ >= text_.size(); }
  void skipSpaces();

  /// @return true and skip @param c when it is the next non-space character.
  bool consume(char c);
  void expect(char c);
  /// @return identifier at the current position, empty when there is none.
  std::string_view readIdentifier();
  /// @brief single- or double-quoted string with `\\`, `\'`, `\"`, `\n`, `\t` and `\r` escapes.
  std::string readQuoted();
  /// @return bare token up to the next space, ',', ')' or ']'.
  std::string_view readScalar();

  [[noreturn]] void fail(std::string const &what) const;
};

/// @brief append @param text quoted with single quotes.
void appendQuoted(std::string &out, std::string_view text);

/// @brief how a scalar type is written into and read back from a representation.
template <class T> struct ReprTraits;

template <> struct ReprTraits<std::string> {
  static void format(std::string &out, std::string const &value) { appendQuoted(out, value); }
  static std::string parse(ReprReader &reader) { return reader.readQuoted(); }
};

template <> struct ReprTraits<bool> {
  static void format(std::string &out, bool value) { out += value ? "True" : "False"; }
  static bool parse(ReprReader &reader) {
    std::string_view const token = reader.readScalar();
    if (token == "True")
      return true;
    if (token == "False")
      return false;
    reader.fail(fmt::format("expected True or False, got '{}'", token));
  }
};

/// @brief one quoted character, e.g. `'x'`.
template <> struct ReprTraits<char> {
  static void format(std::string &out, char value) { appendQuoted(out, std::string_view{&value, 1U}); }
  static char parse(ReprReader &reader) {
    std::size_t const begin = reader.offset();
    std::string const text = reader.readQuoted();
    if (text.size() != 1U)
      throw ReprError(fmt::format("expected one character, got {}", text.size()), begin);
    return text.front();
  }
};

template <class T>
concept CharacterType = std::same_as<T, char> || std::same_as<T, wchar_t> || std::same_as<T, char8_t> ||
                        std::same_as<T, char16_t> || std::same_as<T, char32_t>;

/// @note character types other than `char` have no textual form.
template <class T>
  requires(std::integral<T> || std::floating_point<T>) && (!std::same_as<T, bool>) && (!CharacterType<T>)
struct ReprTraits<T> {
  static void format(std::string &out, T value) { fmt::format_to(std::back_inserter(out), "{}", value); }
  static T parse(ReprReader &reader) {
    std::size_t const begin = reader.offset();
    std::string_view const token = reader.readScalar();
    T value{};
    auto const [end, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc{} || end != token.data() + token.size())
      throw ReprError(fmt::format("invalid number '{}'", token), begin);
    return value;
  }
};

/// @return `TypeName([(k1, v1), (k2, v2)])` listing every entry in order.
template <class K, class V> std::string repr(MultiMapping<K, V> const &m) {
  std::string out{m.typeName()};
  out += "([";
  bool first = true;
  m.forEach([&out, &first](K const &key, V const &value) -> bool {
    if (!first)
      out += ", ";
    first = false;
    out += '(';
    ReprTraits<K>::format(out, key);
    out += ", ";
    ReprTraits<V>::format(out, value);
    out += ')';
    return true;
  });
  out += "])";
  return out;
}

/// @brief parse the output of `repr`, or the bare `[(k, v), ...]` list, back into ordered pairs.
template <class K, class V> std::vector<std::pair<K, V>> parseRepr(std::string_view text) {
  ReprReader reader{text};
  reader.skipSpaces();
  bool const wrapped = !reader.readIdentifier().empty();
  if (wrapped)
    reader.expect('(');
  reader.expect('[');
  std::vector<std::pair<K, V>> items{};
  if (!reader.consume(']')) {
    do {
      reader.expect('(');
      reader.skipSpaces();
      K key = ReprTraits<K>::parse(reader);
      reader.expect(',');
      reader.skipSpaces();
      V value = ReprTraits<V>::parse(reader);
      reader.expect(')');
      items.emplace_back(std::move(key), std::move(value));
    } while (reader.consume(','));
    reader.expect(']');
  }
  if (wrapped)
    reader.expect(')');
  reader.skipSpaces();
  if (!reader.atEnd())
    reader.fail("trailing characters");
  return items;
}

} // namespace multicol

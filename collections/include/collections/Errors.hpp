#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace multicol {

/// @brief required-result lookup, pop or erase on a key which has no entry.
struct KeyNotFound : public std::out_of_range {
  explicit KeyNotFound(std::string const &operation) : std::out_of_range(operation + ": key not found") {}
};

/// @brief removal of an arbitrary entry from a container without entries.
struct EmptyContainer : public std::out_of_range {
  explicit EmptyContainer(std::string const &operation) : std::out_of_range(operation + ": container is empty") {}
};

/// @brief Entry Log and Position Index are out of sync. Never caused by user input.
struct InvariantViolation : public std::logic_error {
  explicit InvariantViolation(std::string const &what) : std::logic_error("invariant violation: " + what) {}
};

struct ReprError : public std::invalid_argument {
  ReprError(std::string const &what, std::size_t offset)
      : std::invalid_argument("invalid repr at offset " + std::to_string(offset) + ": " + what), offset_(offset) {}

  std::size_t offset() const { return offset_; }

private:
  std::size_t offset_;
};

} // namespace multicol

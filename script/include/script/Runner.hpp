#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace multicol::script {

/// @brief unknown command, wrong arity or malformed token in a script line.
struct ScriptError : public std::runtime_error {
  explicit ScriptError(std::string const &what) : std::runtime_error(what) {}
};

struct Config {
  /// check the container invariants after every command
  bool verifyEachStep = false;
};

struct Output {
  std::string text;
  std::size_t failedCommands;
};

/// @brief execute every line of @param input against one `MultiDict<std::string, std::string>`.
/// Each command writes one result line. A failing command writes `error: <message>` and execution goes on.
/// @throw InvariantViolation when the container is found inconsistent.
Output runScript(std::string const &input, Config const &config);

} // namespace multicol::script

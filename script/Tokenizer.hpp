#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace multicol::script {

struct Command {
  std::string name;
  /// text after the command name, comment and surrounding spaces removed
  std::string rest;
};

/// @return command of one script line, std::nullopt for blank and comment-only lines.
std::optional<Command> parseLine(std::string_view line);

/// @brief split @param text into bare words and quoted strings.
/// @throw ScriptError on a malformed quoted string.
std::vector<std::string> tokenize(std::string_view text);

} // namespace multicol::script

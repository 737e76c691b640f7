#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <string_view>

namespace multicol {

std::set<std::string> splitString(const std::string &str, char delimiter);

/// @return @param str without leading and trailing spaces, tabs, CR and LF.
std::string_view trimString(std::string_view str);

} // namespace multicol

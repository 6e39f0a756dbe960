#pragma once

#include <string>
#include <string_view>

namespace progress::util {

std::string ToLower(std::string_view value);
std::string Trim(std::string_view value);

// ASCII case-insensitive comparison; milestone names are matched this way.
bool EqualsIgnoreCase(std::string_view a, std::string_view b);

} // namespace progress::util

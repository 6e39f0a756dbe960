#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace progress::model {

enum class Dimension : std::uint8_t {
  kArea        = 0,
  kSystem      = 1,
  kTestPackage = 2,
  kWelder      = 3,
};

inline constexpr std::array<Dimension, 4> kAllDimensions = {
    Dimension::kArea, Dimension::kSystem, Dimension::kTestPackage, Dimension::kWelder,
};

// Label of the row that collects items without an assignment.
inline constexpr std::string_view kUnassignedLabel = "Not Assigned";

constexpr std::string_view ToString(Dimension dimension) {
  switch (dimension) {
    case Dimension::kArea:
      return "area";
    case Dimension::kSystem:
      return "system";
    case Dimension::kTestPackage:
      return "test_package";
    case Dimension::kWelder:
    default:
      return "welder";
  }
}

std::optional<Dimension> ParseDimension(std::string_view value);

} // namespace progress::model

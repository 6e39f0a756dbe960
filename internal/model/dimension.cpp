#include "dimension.hpp"

#include "internal/util/strings.hpp"

namespace progress::model {

std::optional<Dimension> ParseDimension(std::string_view value) {
  const auto lowered = util::ToLower(value);
  for (auto dimension : kAllDimensions) {
    if (lowered == ToString(dimension)) {
      return dimension;
    }
  }
  if (lowered == "test-package" || lowered == "testpackage") {
    return Dimension::kTestPackage;
  }
  return std::nullopt;
}

} // namespace progress::model

#include "category.hpp"

#include "internal/util/strings.hpp"

namespace progress::model {

std::optional<Category> ParseCategory(std::string_view value) {
  const auto lowered = util::ToLower(value);
  for (auto category : kAllCategories) {
    if (lowered == ToString(category)) {
      return category;
    }
  }
  return std::nullopt;
}

std::optional<CompletionKind> ParseCompletionKind(std::string_view value) {
  const auto lowered = util::ToLower(value);
  if (lowered == "discrete") return CompletionKind::kDiscrete;
  if (lowered == "partial") return CompletionKind::kPartial;
  return std::nullopt;
}

double CategoryHours::Sum() const {
  double total = 0.0;
  for (double h : hours_) total += h;
  return total;
}

CategoryHours& CategoryHours::operator+=(const CategoryHours& other) {
  for (std::size_t i = 0; i < kCategoryCount; ++i) hours_[i] += other.hours_[i];
  return *this;
}

CategoryHours& CategoryHours::operator-=(const CategoryHours& other) {
  for (std::size_t i = 0; i < kCategoryCount; ++i) hours_[i] -= other.hours_[i];
  return *this;
}

} // namespace progress::model

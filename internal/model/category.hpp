#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace progress::model {

enum class Category : std::uint8_t {
  kReceive = 0,
  kInstall = 1,
  kPunch   = 2,
  kTest    = 3,
  kRestore = 4,
};

inline constexpr std::size_t kCategoryCount = 5;

inline constexpr std::array<Category, kCategoryCount> kAllCategories = {
    Category::kReceive, Category::kInstall, Category::kPunch, Category::kTest, Category::kRestore,
};

constexpr std::string_view ToString(Category category) {
  switch (category) {
    case Category::kReceive:
      return "receive";
    case Category::kInstall:
      return "install";
    case Category::kPunch:
      return "punch";
    case Category::kTest:
      return "test";
    case Category::kRestore:
    default:
      return "restore";
  }
}

std::optional<Category> ParseCategory(std::string_view value);

enum class CompletionKind : std::uint8_t {
  kDiscrete = 0,
  kPartial  = 1,
};

constexpr std::string_view ToString(CompletionKind kind) {
  return kind == CompletionKind::kPartial ? "partial" : "discrete";
}

std::optional<CompletionKind> ParseCompletionKind(std::string_view value);

/*
  Hours split across the five reporting categories.
*/
class CategoryHours {
 public:
  double& operator[](Category category) {
    return hours_[static_cast<std::size_t>(category)];
  }
  double operator[](Category category) const {
    return hours_[static_cast<std::size_t>(category)];
  }

  double Sum() const;

  CategoryHours& operator+=(const CategoryHours& other);
  CategoryHours& operator-=(const CategoryHours& other);

 private:
  std::array<double, kCategoryCount> hours_{};
};

} // namespace progress::model

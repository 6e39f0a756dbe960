#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "category.hpp"

namespace progress::model {

struct MilestoneEntry {
  std::string    name;
  double         weight = 0.0;
  CompletionKind kind   = CompletionKind::kDiscrete;
  Category       category = Category::kInstall;
};

/*
  Ordered milestone schedule for one (project, item type) pair after the
  project overrides have been merged onto the type default.

  An empty project_id means the type default was resolved.
*/
struct ResolvedSchedule {
  std::string                 project_id;
  std::string                 item_type;
  std::vector<MilestoneEntry> entries;
  uint64_t                    default_version  = 0;
  uint64_t                    override_version = 0;

  // Case-insensitive lookup by milestone name.
  const MilestoneEntry* Find(std::string_view name) const;

  double TotalWeight() const;
  double CategoryWeight(Category category) const;
};

} // namespace progress::model

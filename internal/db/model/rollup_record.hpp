#pragma once

#include <cstdint>
#include <string>

#include "internal/model/category.hpp"
#include "internal/model/dimension.hpp"

namespace progress::db::model {

struct RollupRecord {
  std::string                project_id;
  progress::model::Dimension dimension = progress::model::Dimension::kArea;
  std::string                dimension_value; // empty = unassigned

  uint64_t                       item_count     = 0;
  double                         budgeted_hours = 0.0;
  double                         earned_hours   = 0.0;
  progress::model::CategoryHours category_budget;
  progress::model::CategoryHours category_earned;

  uint64_t refreshed_at_ms = 0;
};

} // namespace progress::db::model

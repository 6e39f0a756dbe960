#pragma once

#include <cstdint>
#include <string>

#include "internal/model/dimension.hpp"

namespace progress::db::model {

struct DimensionRecord {
  std::string                project_id;
  progress::model::Dimension dimension = progress::model::Dimension::kArea;
  std::string                id;
  std::string                name;
  uint64_t                   updated_at_ms = 0;
};

} // namespace progress::db::model

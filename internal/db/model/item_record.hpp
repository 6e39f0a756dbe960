#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "internal/model/dimension.hpp"

namespace progress::db::model {

struct ItemRecord {
  std::string id;
  std::string project_id;
  std::string item_type;
  std::string identity_key;

  double budgeted_hours   = 0.0;
  double percent_complete = 0.0;
  double earned_hours     = 0.0;

  // Cached projection of the latest event per milestone.
  std::map<std::string, double> milestones;

  uint64_t template_default_version  = 0;
  uint64_t template_override_version = 0;

  std::string area_id;
  std::string system_id;
  std::string test_package_id;
  std::string drawing_id;
  std::string welder_id;

  bool        retired = false;
  std::string retire_reason;

  uint64_t    created_at_ms = 0;
  uint64_t    updated_at_ms = 0;
  std::string updated_by;
};

inline const std::string& DimensionValue(const ItemRecord& item, progress::model::Dimension dimension) {
  switch (dimension) {
    case progress::model::Dimension::kArea:
      return item.area_id;
    case progress::model::Dimension::kSystem:
      return item.system_id;
    case progress::model::Dimension::kTestPackage:
      return item.test_package_id;
    case progress::model::Dimension::kWelder:
    default:
      return item.welder_id;
  }
}

} // namespace progress::db::model

#pragma once

#include <cstdint>
#include <string>

#include "internal/model/category.hpp"

namespace progress::db::model {

/*
  One milestone row of a schedule. An empty project_id marks a type default
  row (NULL in SQL); a set project_id marks a project override row.
*/
struct TemplateRecord {
  std::string                     project_id;
  std::string                     item_type;
  std::string                     milestone_name;
  double                          weight     = 0.0;
  progress::model::CompletionKind kind       = progress::model::CompletionKind::kDiscrete;
  progress::model::Category       category   = progress::model::Category::kInstall;
  int                             sort_order = 0;
  uint64_t                        version    = 0;
  uint64_t                        updated_at_ms = 0;
  std::string                     updated_by;
};

} // namespace progress::db::model

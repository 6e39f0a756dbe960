#pragma once

#include <cstdint>
#include <string>

namespace progress::db::model {

// Audit entry for a template write. Entry lists are stored as JSON.
struct TemplateChangeRecord {
  std::string change_id;
  std::string project_id; // empty for default schedule writes
  std::string item_type;
  std::string old_entries_json;
  std::string new_entries_json;
  std::string actor;
  uint64_t    changed_at_ms      = 0;
  uint64_t    recalculated_items = 0;
};

} // namespace progress::db::model

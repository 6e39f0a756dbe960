#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/dimension.hpp"

namespace progress::db {

struct ItemFilter {
  std::string project_id;
  std::string item_type; // empty = every type
  bool        include_retired = false;

  // Restrict to items carrying this dimension value ("" = unassigned).
  std::optional<progress::model::Dimension> dimension;
  std::string                               dimension_value;
};

/*
  Event range scan. Results are ordered by (created_at_ms, seq).
  Bounds are half-open: from_ms <= created_at_ms < until_ms.
*/
struct EventFilter {
  std::string             project_id;
  std::string             item_id; // empty = whole project
  std::optional<uint64_t> from_ms;
  std::optional<uint64_t> until_ms;
};

} // namespace progress::db

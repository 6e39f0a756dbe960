#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "internal/db/model/milestone_event_record.hpp"
#include "internal/model/milestone_value.hpp"

namespace progress::report {

/*
  Rebuilds a milestone map from events ordered by (created_at_ms, seq).
  The latest event per milestone wins; events at or after until_ms are
  ignored when a bound is given.
*/
model::MilestoneMap ReplayMilestones(const std::vector<db::model::MilestoneEventRecord>& events,
                                     std::optional<uint64_t> until_ms = std::nullopt);

// Same, over pointers into a larger event list.
model::MilestoneMap ReplayMilestones(const std::vector<const db::model::MilestoneEventRecord*>& events,
                                     std::optional<uint64_t> until_ms = std::nullopt);

} // namespace progress::report

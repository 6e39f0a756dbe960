#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "internal/db/model/item_record.hpp"
#include "internal/db/model/milestone_event_record.hpp"
#include "internal/model/dimension.hpp"
#include "internal/model/schedule.hpp"
#include "progress/engine/v1.hpp"

namespace progress::report {

// Cached and replayed percent-complete may differ by this many points before drift is reported.
inline constexpr double kDriftTolerancePercent = 0.01;

struct DeltaQuery {
  std::string      project_id;
  model::Dimension dimension = model::Dimension::kArea;
  uint64_t         start_ms  = 0; // inclusive
  uint64_t         end_ms    = 0; // exclusive
};

// Schedule an item resolves to. Throws when the item has none.
using ScheduleLookup = std::function<const model::ResolvedSchedule&(const db::model::ItemRecord&)>;

/*
  Earned-hours delta of a project over [start_ms, end_ms), grouped by one
  dimension.

  Works from the event log only; cached item figures are used solely for the
  drift and untracked-progress cross-checks.

  items:  every item of the project (retired ones are skipped)
  events: the project's whole log ordered by (created_at_ms, seq)
  labels: dimension value -> display name

  Throws util::InvalidArgument when start_ms >= end_ms.
*/
engine::v1::DeltaReport AggregateDelta(const DeltaQuery& query, const std::vector<db::model::ItemRecord>& items,
                                       const std::vector<db::model::MilestoneEventRecord>& events, const ScheduleLookup& schedules,
                                       const std::map<std::string, std::string>& labels);

} // namespace progress::report

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/schedule.hpp"

namespace progress::templates {

// Resolved weights must sum to 100 within this bound.
inline constexpr double kDefaultWeightTolerance = 0.01;

// Stored schedule for one (project, item type); empty project_id = type default.
struct ScheduleDefinition {
  std::string                        project_id;
  std::string                        item_type;
  std::vector<model::MilestoneEntry> entries;
  uint64_t                           version = 0;
};

// Override as supplied by a caller; unset kind or category inherit from the default.
struct OverrideEntry {
  std::string                          name;
  double                               weight = 0.0;
  std::optional<model::CompletionKind> kind;
  std::optional<model::Category>       category;
};

/*
  Validates a default schedule on its own: at least one entry, weights in
  [0, 100], no duplicate names (case-insensitive) and a weight sum of 100.

  Throws util::SchemaInvalid.
*/
void ValidateDefaultSchedule(const ScheduleDefinition& defaults, double tolerance = kDefaultWeightTolerance);

/*
  Completes caller overrides against the default: names are matched
  case-insensitively and rewritten to the default's spelling, and unset
  kind/category are copied from the default entry.

  Throws util::SchemaInvalid for a name the default does not have, a
  duplicate override or a weight outside [0, 100].
*/
std::vector<model::MilestoneEntry> CompleteOverrides(const ScheduleDefinition& defaults, const std::vector<OverrideEntry>& overrides);

/*
  The single merge point of the two-tier schedule.

  Walks the default in order; a matching override replaces weight, kind and
  category. The result must satisfy the 100-sum within tolerance.
*/
model::ResolvedSchedule MergeSchedule(const ScheduleDefinition& defaults, const ScheduleDefinition* overrides,
                                      double tolerance = kDefaultWeightTolerance);

} // namespace progress::templates

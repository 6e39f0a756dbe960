#pragma once

#include <string>
#include <vector>

#include "internal/model/category.hpp"
#include "internal/model/milestone_value.hpp"
#include "internal/model/schedule.hpp"

namespace progress::calc {

// Category hours must reconcile with total earned hours within this bound.
inline constexpr double kReconciliationToleranceHours = 0.01;

struct ProgressBreakdown {
  double                   percent_complete = 0.0;
  double                   earned_hours     = 0.0;
  double                   budgeted_hours   = 0.0;
  model::CategoryHours     category_earned;
  model::CategoryHours     category_budget;
  std::vector<std::string> unknown_milestones;
};

/*
  Pure progress arithmetic over a resolved schedule and an item's current
  milestone values.

  Milestone values are expected in canonical form (see
  model::NormalizeMilestoneValue). Names are matched case-insensitively;
  names missing from the schedule are excluded from every sum.

  Throws util::SchemaInvalid for an empty schedule and util::InvalidArgument
  for a negative budget or a value outside [0, 100].
*/

// Weight points an entry contributes at the given value.
double EntryContribution(const model::MilestoneEntry& entry, double value);

double PercentComplete(const model::ResolvedSchedule& schedule, const model::MilestoneMap& milestones);
double EarnedHours(double budgeted_hours, double percent_complete);

// Category path. Shaped differently from EarnedHours so the two cross-check each other.
model::CategoryHours CategoryEarnedHours(const model::ResolvedSchedule& schedule, const model::MilestoneMap& milestones,
                                         double budgeted_hours);
model::CategoryHours CategoryBudgetHours(const model::ResolvedSchedule& schedule, double budgeted_hours);

std::vector<std::string> UnknownMilestones(const model::ResolvedSchedule& schedule, const model::MilestoneMap& milestones);

ProgressBreakdown Compute(const model::ResolvedSchedule& schedule, const model::MilestoneMap& milestones, double budgeted_hours);

bool Reconciles(const ProgressBreakdown& breakdown, double tolerance_hours = kReconciliationToleranceHours);

// Throws util::InvariantViolation naming the item when Reconciles() fails.
void EnsureReconciles(const ProgressBreakdown& breakdown, const std::string& item_id,
                      double tolerance_hours = kReconciliationToleranceHours);

} // namespace progress::calc

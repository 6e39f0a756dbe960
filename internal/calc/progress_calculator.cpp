#include "progress_calculator.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

#include "internal/util/errors.hpp"

namespace progress::calc {

namespace {

void CheckSchedule(const model::ResolvedSchedule& schedule) {
  if (schedule.entries.empty()) {
    throw util::SchemaInvalid("milestone schedule for '" + schedule.item_type + "' has no entries");
  }
}

void CheckBudget(double budgeted_hours) {
  if (!std::isfinite(budgeted_hours) || budgeted_hours < 0.0) {
    throw util::InvalidArgument(fmt::format("budgeted hours must be a non-negative number, got {}", budgeted_hours));
  }
}

double ValueOf(const model::MilestoneMap& milestones, const model::MilestoneEntry& entry) {
  auto value = model::LookupMilestone(milestones, entry.name);
  if (!value) {
    return model::kNotStarted;
  }
  if (!std::isfinite(*value) || *value < 0.0 || *value > 100.0) {
    throw util::InvalidArgument(fmt::format("milestone '{}' holds out-of-range value {}", entry.name, *value));
  }
  return *value;
}

} // namespace

double EntryContribution(const model::MilestoneEntry& entry, double value) {
  if (entry.kind == model::CompletionKind::kDiscrete) {
    return model::IsComplete(value) ? entry.weight : 0.0;
  }
  return entry.weight * value / 100.0;
}

double PercentComplete(const model::ResolvedSchedule& schedule, const model::MilestoneMap& milestones) {
  CheckSchedule(schedule);

  double total = 0.0;
  for (const auto& entry : schedule.entries) {
    total += EntryContribution(entry, ValueOf(milestones, entry));
  }
  return std::clamp(total, 0.0, 100.0);
}

double EarnedHours(double budgeted_hours, double percent_complete) {
  CheckBudget(budgeted_hours);
  return budgeted_hours * percent_complete / 100.0;
}

model::CategoryHours CategoryEarnedHours(const model::ResolvedSchedule& schedule, const model::MilestoneMap& milestones,
                                         double budgeted_hours) {
  CheckSchedule(schedule);
  CheckBudget(budgeted_hours);

  model::CategoryHours weighted;
  for (const auto& entry : schedule.entries) {
    weighted[entry.category] += EntryContribution(entry, ValueOf(milestones, entry));
  }

  model::CategoryHours earned;
  for (auto category : model::kAllCategories) {
    const double category_weight = schedule.CategoryWeight(category);
    if (category_weight <= 0.0) {
      continue;
    }
    const double category_pct = weighted[category] / category_weight * 100.0;
    earned[category]          = budgeted_hours * category_weight / 100.0 * category_pct / 100.0;
  }
  return earned;
}

model::CategoryHours CategoryBudgetHours(const model::ResolvedSchedule& schedule, double budgeted_hours) {
  CheckBudget(budgeted_hours);

  model::CategoryHours budget;
  for (auto category : model::kAllCategories) {
    budget[category] = budgeted_hours * schedule.CategoryWeight(category) / 100.0;
  }
  return budget;
}

std::vector<std::string> UnknownMilestones(const model::ResolvedSchedule& schedule, const model::MilestoneMap& milestones) {
  std::vector<std::string> unknown;
  for (const auto& [name, value] : milestones) {
    if (!schedule.Find(name)) {
      unknown.push_back(name);
    }
  }
  return unknown;
}

ProgressBreakdown Compute(const model::ResolvedSchedule& schedule, const model::MilestoneMap& milestones, double budgeted_hours) {
  ProgressBreakdown out;
  out.budgeted_hours     = budgeted_hours;
  out.percent_complete   = PercentComplete(schedule, milestones);
  out.earned_hours       = EarnedHours(budgeted_hours, out.percent_complete);
  out.category_earned    = CategoryEarnedHours(schedule, milestones, budgeted_hours);
  out.category_budget    = CategoryBudgetHours(schedule, budgeted_hours);
  out.unknown_milestones = UnknownMilestones(schedule, milestones);
  return out;
}

bool Reconciles(const ProgressBreakdown& breakdown, double tolerance_hours) {
  return std::fabs(breakdown.category_earned.Sum() - breakdown.earned_hours) <= tolerance_hours;
}

void EnsureReconciles(const ProgressBreakdown& breakdown, const std::string& item_id, double tolerance_hours) {
  if (Reconciles(breakdown, tolerance_hours)) {
    return;
  }
  throw util::InvariantViolation(fmt::format("item {}: category earned hours {:.4f} do not reconcile with earned hours {:.4f}", item_id,
                                             breakdown.category_earned.Sum(), breakdown.earned_hours));
}

} // namespace progress::calc

#include "internal/calc/progress_calculator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <random>

#include "internal/templates/default_templates.hpp"
#include "internal/util/errors.hpp"

namespace {

using progress::model::Category;
using progress::model::CompletionKind;
using progress::model::MilestoneMap;
using progress::model::ResolvedSchedule;

bool Near(double a, double b, double tolerance = 1e-9) {
  return std::fabs(a - b) <= tolerance;
}

ResolvedSchedule Resolve(const std::string& item_type) {
  for (const auto& t : progress::templates::DefaultTemplates()) {
    if (t.item_type == item_type) {
      ResolvedSchedule schedule;
      schedule.item_type = t.item_type;
      schedule.entries   = t.entries;
      return schedule;
    }
  }
  throw std::runtime_error("no built-in schedule for " + item_type);
}

void TestSpoolScenario() {
  const auto   schedule   = Resolve("spool");
  MilestoneMap milestones = {{"Receive", 100.0}, {"Erect", 100.0}, {"Connect", 0.0}};

  const auto breakdown = progress::calc::Compute(schedule, milestones, 10.0);
  assert(Near(breakdown.percent_complete, 45.0));
  assert(Near(breakdown.earned_hours, 4.5));
  assert(Near(breakdown.category_earned[Category::kReceive], 0.5));
  assert(Near(breakdown.category_earned[Category::kInstall], 4.0));
  assert(Near(breakdown.category_earned[Category::kPunch], 0.0));
  assert(Near(breakdown.category_earned[Category::kTest], 0.0));
  assert(Near(breakdown.category_earned[Category::kRestore], 0.0));
  assert(Near(breakdown.category_budget[Category::kInstall], 8.0));
  assert(progress::calc::Reconciles(breakdown));
}

void TestZeroWeightCategoryReportsZero() {
  const auto schedule = Resolve("field_weld");
  assert(schedule.CategoryWeight(Category::kReceive) == 0.0);

  MilestoneMap milestones;
  for (const auto& entry : schedule.entries) milestones[entry.name] = 100.0;

  const auto breakdown = progress::calc::Compute(schedule, milestones, 12.0);
  assert(Near(breakdown.category_earned[Category::kReceive], 0.0));
  assert(Near(breakdown.earned_hours, 12.0));
  assert(Near(breakdown.percent_complete, 100.0));
  assert(progress::calc::Reconciles(breakdown));
}

void TestPartialMilestonesContributeProportionally() {
  const auto   schedule   = Resolve("threaded_pipe");
  MilestoneMap milestones = {{"Fabricate", 50.0}, {"install", 25.0}};

  // 16 * 0.5 + 16 * 0.25
  const double percent = progress::calc::PercentComplete(schedule, milestones);
  assert(Near(percent, 12.0));
}

void TestUnknownMilestonesAreExcluded() {
  const auto   schedule   = Resolve("valve");
  MilestoneMap milestones = {{"Receive", 100.0}, {"Hydro", 100.0}};

  const auto breakdown = progress::calc::Compute(schedule, milestones, 5.0);
  assert(Near(breakdown.percent_complete, 10.0));
  assert(breakdown.unknown_milestones.size() == 1);
  assert(breakdown.unknown_milestones[0] == "Hydro");
}

void TestCategorySumReconcilesForRandomStates() {
  std::mt19937                           rng(20240601);
  std::uniform_real_distribution<double> pct(0.0, 100.0);
  std::uniform_real_distribution<double> hours(0.0, 250.0);
  std::bernoulli_distribution            coin(0.5);

  for (const auto& t : progress::templates::DefaultTemplates()) {
    ResolvedSchedule schedule;
    schedule.item_type = t.item_type;
    schedule.entries   = t.entries;

    for (int round = 0; round < 200; ++round) {
      MilestoneMap milestones;
      for (const auto& entry : schedule.entries) {
        if (entry.kind == CompletionKind::kPartial) {
          milestones[entry.name] = pct(rng);
        } else if (coin(rng)) {
          milestones[entry.name] = 100.0;
        }
      }
      const auto breakdown = progress::calc::Compute(schedule, milestones, hours(rng));
      assert(std::fabs(breakdown.category_earned.Sum() - breakdown.earned_hours) <= 0.01);
    }
  }
}

void TestPercentIsMonotonicInEachMilestone() {
  const auto schedule = Resolve("threaded_pipe");

  for (const auto& entry : schedule.entries) {
    MilestoneMap milestones = {{"Connect", 40.0}, {"Punch", 100.0}};
    double       previous   = -1.0;
    for (double value = 0.0; value <= 100.0; value += 10.0) {
      milestones[entry.name] = entry.kind == CompletionKind::kDiscrete ? (value >= 100.0 ? 100.0 : 0.0) : value;
      const double percent   = progress::calc::PercentComplete(schedule, milestones);
      assert(percent >= previous);
      previous = percent;
    }
  }
}

void TestRecomputeIsIdempotent() {
  const auto   schedule   = Resolve("spool");
  MilestoneMap milestones = {{"Receive", 100.0}, {"Connect", 100.0}, {"Test", 100.0}};

  const auto first  = progress::calc::Compute(schedule, milestones, 7.25);
  const auto second = progress::calc::Compute(schedule, milestones, 7.25);
  assert(first.percent_complete == second.percent_complete);
  assert(first.earned_hours == second.earned_hours);
  for (auto category : progress::model::kAllCategories) {
    assert(first.category_earned[category] == second.category_earned[category]);
  }
}

void TestMalformedInputFailsFast() {
  bool threw = false;
  try {
    (void)progress::calc::Compute(ResolvedSchedule{}, {}, 1.0);
  } catch (const progress::util::SchemaInvalid&) {
    threw = true;
  }
  assert(threw && "an empty schedule must not compute to zero");

  threw = false;
  try {
    (void)progress::calc::Compute(Resolve("spool"), {}, -1.0);
  } catch (const progress::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw && "negative budget must be rejected");
}

void TestEnsureReconcilesRaisesInvariantViolation() {
  progress::calc::ProgressBreakdown breakdown;
  breakdown.earned_hours                       = 4.5;
  breakdown.category_earned[Category::kInstall] = 4.0;

  bool threw = false;
  try {
    progress::calc::EnsureReconciles(breakdown, "item-1");
  } catch (const progress::util::InvariantViolation& e) {
    threw = std::string(e.what()).find("item-1") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSpoolScenario();
  TestZeroWeightCategoryReportsZero();
  TestPartialMilestonesContributeProportionally();
  TestUnknownMilestonesAreExcluded();
  TestCategorySumReconcilesForRandomStates();
  TestPercentIsMonotonicInEachMilestone();
  TestRecomputeIsIdempotent();
  TestMalformedInputFailsFast();
  TestEnsureReconcilesRaisesInvariantViolation();

  std::cout << "progress_engine_unit_progress_calculator: pass\n";
  return 0;
}

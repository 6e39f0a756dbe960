#include "internal/model/milestone_value.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace {

using progress::model::CompletionKind;
using progress::model::kComplete;
using progress::model::kNotStarted;
using progress::model::NormalizeMilestoneValue;
using progress::model::NormalizeUnscheduledValue;

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const progress::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestDiscreteAcceptsLegacyCompleteForms() {
  assert(NormalizeMilestoneValue(true, CompletionKind::kDiscrete) == kComplete);
  assert(NormalizeMilestoneValue(1.0, CompletionKind::kDiscrete) == kComplete);
  assert(NormalizeMilestoneValue(100.0, CompletionKind::kDiscrete) == kComplete);

  assert(NormalizeMilestoneValue(false, CompletionKind::kDiscrete) == kNotStarted);
  assert(NormalizeMilestoneValue(0.0, CompletionKind::kDiscrete) == kNotStarted);
}

void TestDiscreteRejectsPartialNumbers() {
  assert(ThrowsInvalidArgument([] { (void)NormalizeMilestoneValue(50.0, CompletionKind::kDiscrete); }));
  assert(ThrowsInvalidArgument([] { (void)NormalizeMilestoneValue(0.5, CompletionKind::kDiscrete); }));
  assert(ThrowsInvalidArgument([] { (void)NormalizeMilestoneValue(-1.0, CompletionKind::kDiscrete); }));
}

void TestPartialKeepsPercentages() {
  assert(NormalizeMilestoneValue(37.5, CompletionKind::kPartial) == 37.5);
  // a partial 1 is one percent, not a completion flag
  assert(NormalizeMilestoneValue(1.0, CompletionKind::kPartial) == 1.0);
  assert(NormalizeMilestoneValue(true, CompletionKind::kPartial) == kComplete);
  assert(NormalizeMilestoneValue(false, CompletionKind::kPartial) == kNotStarted);

  assert(ThrowsInvalidArgument([] { (void)NormalizeMilestoneValue(100.5, CompletionKind::kPartial); }));
  assert(ThrowsInvalidArgument([] { (void)NormalizeMilestoneValue(std::numeric_limits<double>::quiet_NaN(), CompletionKind::kPartial); }));
}

void TestUnscheduledValuesAreRangeChecked() {
  assert(NormalizeUnscheduledValue(true) == kComplete);
  assert(NormalizeUnscheduledValue(42.0) == 42.0);
  assert(ThrowsInvalidArgument([] { (void)NormalizeUnscheduledValue(-0.1); }));
}

void TestLookupAndEraseIgnoreCase() {
  progress::model::MilestoneMap milestones{{"Weld Made", 100.0}, {"Punch", 0.0}};

  auto found = progress::model::LookupMilestone(milestones, "weld made");
  assert(found.has_value() && *found == 100.0);
  assert(!progress::model::LookupMilestone(milestones, "Restore").has_value());

  assert(progress::model::EraseMilestone(milestones, "PUNCH") == 1);
  assert(milestones.size() == 1);
}

} // namespace

int main() {
  TestDiscreteAcceptsLegacyCompleteForms();
  TestDiscreteRejectsPartialNumbers();
  TestPartialKeepsPercentages();
  TestUnscheduledValuesAreRangeChecked();
  TestLookupAndEraseIgnoreCase();

  std::cout << "progress_engine_unit_milestone_value: pass\n";
  return 0;
}

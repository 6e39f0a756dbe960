#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "category.hpp"

namespace progress::model {

// Canonical stored representation of a finished milestone.
inline constexpr double kComplete   = 100.0;
inline constexpr double kNotStarted = 0.0;

// Milestone name -> canonical value in [0, 100].
using MilestoneMap = std::map<std::string, double>;

// Value as received from a caller: a completion flag or a number.
using RawMilestoneValue = std::variant<bool, double>;

/*
  Boundary normalization.

  discrete: true/false, 1/0 and 100/0 map to kComplete/kNotStarted.
  partial:  numbers in [0, 100] are kept, true/false map to 100/0.

  Anything else throws util::InvalidArgument.
*/
double NormalizeMilestoneValue(const RawMilestoneValue& raw, CompletionKind kind);

// For names missing from the schedule: flags map to 100/0, numbers must lie in [0, 100].
double NormalizeUnscheduledValue(const RawMilestoneValue& raw);

inline bool IsComplete(double value) {
  return value == kComplete;
}

std::optional<double> LookupMilestone(const MilestoneMap& milestones, std::string_view name);

// Drops every spelling of name; returns how many keys were removed.
std::size_t EraseMilestone(MilestoneMap& milestones, std::string_view name);

} // namespace progress::model

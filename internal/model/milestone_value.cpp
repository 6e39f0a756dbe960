#include "milestone_value.hpp"

#include <cmath>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace progress::model {

namespace {

double CheckedPercent(double value) {
  if (!std::isfinite(value) || value < 0.0 || value > 100.0) {
    throw util::InvalidArgument("milestone value must lie in [0, 100], got " + std::to_string(value));
  }
  return value;
}

} // namespace

double NormalizeMilestoneValue(const RawMilestoneValue& raw, CompletionKind kind) {
  if (const auto* flag = std::get_if<bool>(&raw)) {
    return *flag ? kComplete : kNotStarted;
  }

  const double value = std::get<double>(raw);
  if (kind == CompletionKind::kPartial) {
    return CheckedPercent(value);
  }

  if (value == 0.0) return kNotStarted;
  if (value == 1.0 || value == kComplete) return kComplete;
  throw util::InvalidArgument("discrete milestone accepts true/false, 1/0 or 100/0, got " + std::to_string(value));
}

double NormalizeUnscheduledValue(const RawMilestoneValue& raw) {
  if (const auto* flag = std::get_if<bool>(&raw)) {
    return *flag ? kComplete : kNotStarted;
  }
  return CheckedPercent(std::get<double>(raw));
}

std::optional<double> LookupMilestone(const MilestoneMap& milestones, std::string_view name) {
  auto exact = milestones.find(std::string(name));
  if (exact != milestones.end()) {
    return exact->second;
  }
  for (const auto& [key, value] : milestones) {
    if (util::EqualsIgnoreCase(key, name)) {
      return value;
    }
  }
  return std::nullopt;
}

std::size_t EraseMilestone(MilestoneMap& milestones, std::string_view name) {
  std::size_t removed = 0;
  for (auto it = milestones.begin(); it != milestones.end();) {
    if (util::EqualsIgnoreCase(it->first, name)) {
      it = milestones.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

} // namespace progress::model

#include "schedule.hpp"

#include "internal/util/strings.hpp"

namespace progress::model {

const MilestoneEntry* ResolvedSchedule::Find(std::string_view name) const {
  for (const auto& entry : entries) {
    if (util::EqualsIgnoreCase(entry.name, name)) {
      return &entry;
    }
  }
  return nullptr;
}

double ResolvedSchedule::TotalWeight() const {
  double total = 0.0;
  for (const auto& entry : entries) total += entry.weight;
  return total;
}

double ResolvedSchedule::CategoryWeight(Category category) const {
  double total = 0.0;
  for (const auto& entry : entries) {
    if (entry.category == category) total += entry.weight;
  }
  return total;
}

} // namespace progress::model

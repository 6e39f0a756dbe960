#include "event_replay.hpp"

namespace progress::report {

namespace {

void Apply(model::MilestoneMap& milestones, const db::model::MilestoneEventRecord& event, std::optional<uint64_t> until_ms) {
  if (until_ms && event.created_at_ms >= *until_ms) {
    return;
  }
  milestones[event.milestone_name] = event.new_value;
}

} // namespace

model::MilestoneMap ReplayMilestones(const std::vector<db::model::MilestoneEventRecord>& events, std::optional<uint64_t> until_ms) {
  model::MilestoneMap milestones;
  for (const auto& event : events) Apply(milestones, event, until_ms);
  return milestones;
}

model::MilestoneMap ReplayMilestones(const std::vector<const db::model::MilestoneEventRecord*>& events, std::optional<uint64_t> until_ms) {
  model::MilestoneMap milestones;
  for (const auto* event : events) Apply(milestones, *event, until_ms);
  return milestones;
}

} // namespace progress::report

#include "template_resolver.hpp"

#include <cmath>
#include <unordered_set>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace progress::templates {

namespace {

std::string Describe(const std::string& project_id, const std::string& item_type) {
  return project_id.empty() ? "'" + item_type + "'" : "'" + item_type + "' in project " + project_id;
}

void CheckWeight(const std::string& owner, const std::string& name, double weight) {
  if (!std::isfinite(weight) || weight < 0.0 || weight > 100.0) {
    throw util::SchemaInvalid("schedule " + owner + ": weight of '" + name + "' must lie in [0, 100]");
  }
}

void CheckSum(const model::ResolvedSchedule& schedule, double tolerance) {
  const double total = schedule.TotalWeight();
  if (std::fabs(total - 100.0) > tolerance) {
    throw util::SchemaInvalid("schedule " + Describe(schedule.project_id, schedule.item_type) + " weights sum to " + std::to_string(total) +
                              ", expected 100");
  }
}

const model::MilestoneEntry* FindEntry(const std::vector<model::MilestoneEntry>& entries, const std::string& name) {
  for (const auto& entry : entries) {
    if (util::EqualsIgnoreCase(entry.name, name)) return &entry;
  }
  return nullptr;
}

} // namespace

void ValidateDefaultSchedule(const ScheduleDefinition& defaults, double tolerance) {
  const auto owner = Describe("", defaults.item_type);
  if (defaults.entries.empty()) {
    throw util::SchemaInvalid("schedule " + owner + " has no milestones");
  }

  std::unordered_set<std::string> seen;
  for (const auto& entry : defaults.entries) {
    if (util::Trim(entry.name).empty()) {
      throw util::SchemaInvalid("schedule " + owner + " has a milestone without a name");
    }
    CheckWeight(owner, entry.name, entry.weight);
    if (!seen.insert(util::ToLower(entry.name)).second) {
      throw util::SchemaInvalid("schedule " + owner + " lists '" + entry.name + "' twice");
    }
  }

  model::ResolvedSchedule resolved;
  resolved.item_type = defaults.item_type;
  resolved.entries   = defaults.entries;
  CheckSum(resolved, tolerance);
}

std::vector<model::MilestoneEntry> CompleteOverrides(const ScheduleDefinition& defaults, const std::vector<OverrideEntry>& overrides) {
  std::vector<model::MilestoneEntry> out;
  out.reserve(overrides.size());

  std::unordered_set<std::string> seen;
  for (const auto& o : overrides) {
    const auto* base = FindEntry(defaults.entries, o.name);
    if (!base) {
      throw util::SchemaInvalid("override names milestone '" + o.name + "' which " + Describe("", defaults.item_type) + " does not have");
    }
    if (!seen.insert(util::ToLower(base->name)).second) {
      throw util::SchemaInvalid("override lists '" + base->name + "' twice");
    }
    CheckWeight(Describe("", defaults.item_type), base->name, o.weight);

    out.push_back(model::MilestoneEntry{base->name, o.weight, o.kind.value_or(base->kind), o.category.value_or(base->category)});
  }
  return out;
}

model::ResolvedSchedule MergeSchedule(const ScheduleDefinition& defaults, const ScheduleDefinition* overrides, double tolerance) {
  model::ResolvedSchedule resolved;
  resolved.item_type       = defaults.item_type;
  resolved.default_version = defaults.version;

  if (defaults.entries.empty()) {
    throw util::SchemaInvalid("schedule " + Describe("", defaults.item_type) + " has no milestones");
  }

  if (overrides) {
    resolved.project_id       = overrides->project_id;
    resolved.override_version = overrides->version;
    for (const auto& o : overrides->entries) {
      if (!FindEntry(defaults.entries, o.name)) {
        throw util::SchemaInvalid("override names milestone '" + o.name + "' which " + Describe("", defaults.item_type) +
                                  " does not have");
      }
    }
  }

  for (const auto& entry : defaults.entries) {
    const model::MilestoneEntry* o = overrides ? FindEntry(overrides->entries, entry.name) : nullptr;
    if (o) {
      CheckWeight(Describe(resolved.project_id, resolved.item_type), entry.name, o->weight);
      resolved.entries.push_back(model::MilestoneEntry{entry.name, o->weight, o->kind, o->category});
    } else {
      resolved.entries.push_back(entry);
    }
  }

  CheckSum(resolved, tolerance);
  return resolved;
}

} // namespace progress::templates

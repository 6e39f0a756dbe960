#include "template_registry.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

#include "default_templates.hpp"
#include "internal/model/proto_convert.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace progress::templates {

namespace {

constexpr char kKeySeparator = '\x1f';

std::vector<db::model::TemplateRecord> ToRows(const ScheduleDefinition& definition, const std::string& actor, uint64_t now_ms) {
  std::vector<db::model::TemplateRecord> rows;
  rows.reserve(definition.entries.size());
  int order = 0;
  for (const auto& entry : definition.entries) {
    db::model::TemplateRecord row;
    row.project_id     = definition.project_id;
    row.item_type      = definition.item_type;
    row.milestone_name = entry.name;
    row.weight         = entry.weight;
    row.kind           = entry.kind;
    row.category       = entry.category;
    row.sort_order     = order++;
    row.version        = definition.version;
    row.updated_at_ms  = now_ms;
    row.updated_by     = actor;
    rows.push_back(std::move(row));
  }
  return rows;
}

void RequireName(const std::string& value, const char* what) {
  if (util::Trim(value).empty()) {
    throw util::InvalidArgument(std::string(what) + " is required");
  }
}

} // namespace

TemplateRegistry::TemplateRegistry(std::shared_ptr<db::Repository> repository, double weight_tolerance)
    : repository_(std::move(repository)), weight_tolerance_(weight_tolerance > 0.0 ? weight_tolerance : kDefaultWeightTolerance) {
}

void TemplateRegistry::SetRecalculator(std::weak_ptr<ItemRecalculator> recalculator) {
  std::lock_guard lock(recalculator_mutex_);
  recalculator_ = std::move(recalculator);
}

std::shared_ptr<ItemRecalculator> TemplateRegistry::AttachedRecalculator() {
  std::lock_guard lock(recalculator_mutex_);
  return recalculator_.lock();
}

std::string TemplateRegistry::CacheKey(const std::string& project_id, const std::string& item_type) {
  return project_id + kKeySeparator + item_type;
}

// ------------------------------------------------------------------
// Loading
// ------------------------------------------------------------------

TemplateRegistry::Definitions TemplateRegistry::LoadDefinitions(db::Transaction& tx, const std::string& item_type) {
  Definitions definitions;
  for (const auto& row : repository_->ListTemplateRows(tx, item_type)) {
    auto& definition      = definitions[row.project_id];
    definition.project_id = row.project_id;
    definition.item_type  = row.item_type;
    definition.version    = std::max(definition.version, row.version);
    definition.entries.push_back(model::MilestoneEntry{row.milestone_name, row.weight, row.kind, row.category});
  }
  return definitions;
}

ScheduleDefinition TemplateRegistry::RequireDefault(const Definitions& definitions, const std::string& item_type) const {
  auto it = definitions.find("");
  if (it == definitions.end()) {
    throw util::NotFound("no milestone schedule for item type '" + item_type + "'");
  }
  return it->second;
}

void TemplateRegistry::WriteDefinition(db::Transaction& tx, const ScheduleDefinition& definition, const std::string& actor) {
  db::ThrowIfError(
      repository_->ReplaceTemplateRows(tx, definition.project_id, definition.item_type, ToRows(definition, actor, util::NowMs())),
      "write schedule rows");
}

void TemplateRegistry::LogChange(db::Transaction& tx, const std::string& project_id, const std::string& item_type,
                                 const std::vector<model::MilestoneEntry>& old_entries, const std::vector<model::MilestoneEntry>& new_entries,
                                 const std::string& actor, uint64_t recalculated_items) {
  db::model::TemplateChangeRecord change;
  change.change_id          = util::NewId();
  change.project_id         = project_id;
  change.item_type          = item_type;
  change.old_entries_json   = model::EncodeEntries(old_entries);
  change.new_entries_json   = model::EncodeEntries(new_entries);
  change.actor              = actor;
  change.changed_at_ms      = util::NowMs();
  change.recalculated_items = recalculated_items;
  db::ThrowIfError(repository_->InsertTemplateChange(tx, change), "log template change");
}

// ------------------------------------------------------------------
// Defaults
// ------------------------------------------------------------------

std::vector<std::string> TemplateRegistry::ListItemTypes() {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListTemplateRows(*tx, "");
  tx->Commit();

  std::set<std::string> types;
  for (const auto& row : rows) {
    if (row.project_id.empty()) types.insert(row.item_type);
  }
  return {types.begin(), types.end()};
}

model::ResolvedSchedule TemplateRegistry::GetDefaultSchedule(const std::string& item_type) {
  RequireName(item_type, "item_type");

  auto tx          = repository_->Begin();
  auto definitions = LoadDefinitions(*tx, item_type);
  tx->Commit();

  return MergeSchedule(RequireDefault(definitions, item_type), nullptr, weight_tolerance_);
}

model::ResolvedSchedule TemplateRegistry::PutDefaultSchedule(const std::string& item_type, const std::vector<model::MilestoneEntry>& entries,
                                                             const std::string& actor) {
  RequireName(item_type, "item_type");

  auto tx          = repository_->Begin();
  auto definitions = LoadDefinitions(*tx, item_type);

  ScheduleDefinition previous;
  if (auto it = definitions.find(""); it != definitions.end()) {
    previous = it->second;
  }

  ScheduleDefinition next{"", item_type, entries, previous.version + 1};
  ValidateDefaultSchedule(next, weight_tolerance_);

  // every project override of this type must still resolve
  for (const auto& [project_id, definition] : definitions) {
    if (project_id.empty()) continue;
    MergeSchedule(next, &definition, weight_tolerance_);
  }

  WriteDefinition(*tx, next, actor);

  uint64_t recalculated = 0;
  if (auto recalculator = AttachedRecalculator()) {
    for (const auto& project_id : repository_->ListItemProjects(*tx, item_type)) {
      auto it       = definitions.find(project_id);
      auto schedule = MergeSchedule(next, it == definitions.end() ? nullptr : &it->second, weight_tolerance_);
      schedule.project_id = project_id;
      recalculated += recalculator->RecalculateItems(*tx, schedule, actor);
    }
  }

  LogChange(*tx, "", item_type, previous.entries, next.entries, actor, recalculated);
  tx->Commit();
  InvalidateType(item_type);

  PROGRESS_LOG_INFO("default schedule written", {observability::StringField("item_type", item_type),
                                                 observability::IntField("version", static_cast<int64_t>(next.version)),
                                                 observability::IntField("recalculated_items", static_cast<int64_t>(recalculated)),
                                                 observability::StringField("actor", actor)});
  return MergeSchedule(next, nullptr, weight_tolerance_);
}

// ------------------------------------------------------------------
// Project overrides
// ------------------------------------------------------------------

OverrideWriteResult TemplateRegistry::PutProjectOverrides(const std::string& project_id, const std::string& item_type,
                                                          const std::vector<OverrideEntry>& overrides, const std::string& actor,
                                                          std::optional<uint64_t> expected_version, bool recalculate_existing) {
  RequireName(project_id, "project_id");
  RequireName(item_type, "item_type");
  if (overrides.empty()) {
    throw util::InvalidArgument("override set is empty; clear the overrides instead");
  }

  auto       tx          = repository_->Begin();
  auto       definitions = LoadDefinitions(*tx, item_type);
  const auto defaults    = RequireDefault(definitions, item_type);

  ScheduleDefinition current{project_id, item_type, {}, 0};
  if (auto it = definitions.find(project_id); it != definitions.end()) {
    current = it->second;
  }
  if (expected_version && *expected_version != current.version) {
    throw util::Conflict("overrides for '" + item_type + "' in project " + project_id + " were modified by another user (expected version " +
                         std::to_string(*expected_version) + ", found " + std::to_string(current.version) + ")");
  }

  ScheduleDefinition next{project_id, item_type, CompleteOverrides(defaults, overrides), current.version + 1};

  OverrideWriteResult result;
  result.schedule = MergeSchedule(defaults, &next, weight_tolerance_);

  WriteDefinition(*tx, next, actor);

  if (recalculate_existing) {
    auto recalculator = AttachedRecalculator();
    if (!recalculator) {
      throw std::runtime_error("item recalculation requested but no recalculator is attached");
    }
    result.recalculated_items = recalculator->RecalculateItems(*tx, result.schedule, actor);
  }

  LogChange(*tx, project_id, item_type, current.entries, next.entries, actor, result.recalculated_items);
  tx->Commit();
  Invalidate(project_id, item_type);

  PROGRESS_LOG_INFO("project overrides written", {observability::StringField("project_id", project_id),
                                                  observability::StringField("item_type", item_type),
                                                  observability::IntField("version", static_cast<int64_t>(next.version)),
                                                  observability::IntField("recalculated_items", static_cast<int64_t>(result.recalculated_items)),
                                                  observability::StringField("actor", actor)});
  return result;
}

model::ResolvedSchedule TemplateRegistry::ClearProjectOverrides(const std::string& project_id, const std::string& item_type,
                                                                const std::string& actor) {
  RequireName(project_id, "project_id");
  RequireName(item_type, "item_type");

  auto       tx          = repository_->Begin();
  auto       definitions = LoadDefinitions(*tx, item_type);
  const auto defaults    = RequireDefault(definitions, item_type);

  auto schedule       = MergeSchedule(defaults, nullptr, weight_tolerance_);
  schedule.project_id = project_id;

  auto it = definitions.find(project_id);
  if (it != definitions.end()) {
    db::ThrowIfError(repository_->ReplaceTemplateRows(*tx, project_id, item_type, {}), "clear overrides");

    uint64_t recalculated = 0;
    if (auto recalculator = AttachedRecalculator()) {
      recalculated = recalculator->RecalculateItems(*tx, schedule, actor);
    }
    LogChange(*tx, project_id, item_type, it->second.entries, {}, actor, recalculated);
  }
  tx->Commit();
  Invalidate(project_id, item_type);

  return schedule;
}

std::vector<OverrideSet> TemplateRegistry::ListProjectOverrides(const std::string& project_id) {
  RequireName(project_id, "project_id");

  auto tx   = repository_->Begin();
  auto rows = repository_->ListTemplateRows(*tx, "");
  tx->Commit();

  std::vector<OverrideSet> out;
  for (const auto& row : rows) {
    if (row.project_id != project_id) continue;
    if (out.empty() || out.back().item_type != row.item_type) {
      out.push_back(OverrideSet{row.item_type, {}, 0});
    }
    out.back().entries.push_back(model::MilestoneEntry{row.milestone_name, row.weight, row.kind, row.category});
    out.back().version = std::max(out.back().version, row.version);
  }
  return out;
}

std::vector<db::model::TemplateChangeRecord> TemplateRegistry::ListTemplateChanges(const std::string& project_id,
                                                                                   const std::string& item_type) {
  auto tx      = repository_->Begin();
  auto changes = repository_->ListTemplateChanges(*tx, project_id, item_type);
  tx->Commit();
  return changes;
}

// ------------------------------------------------------------------
// Resolution
// ------------------------------------------------------------------

model::ResolvedSchedule TemplateRegistry::Resolve(const std::string& project_id, const std::string& item_type) {
  const auto key = CacheKey(project_id, item_type);

  // Taken before Begin(): a write committing after this point bumps the
  // generation, so rows read from an older snapshot are never cached.
  uint64_t generation = 0;
  {
    std::shared_lock lock(cache_mutex_);
    if (auto it = cache_.find(key); it != cache_.end()) {
      return it->second;
    }
    generation = cache_generation_;
  }

  auto tx       = repository_->Begin();
  auto schedule = ResolveUncached(*tx, project_id, item_type);
  tx->Commit();

  std::unique_lock lock(cache_mutex_);
  if (generation == cache_generation_) {
    cache_[key] = schedule;
  }
  return schedule;
}

// Reads the cache but never fills it; the caller's snapshot may predate the latest write.
model::ResolvedSchedule TemplateRegistry::Resolve(db::Transaction& tx, const std::string& project_id, const std::string& item_type) {
  {
    std::shared_lock lock(cache_mutex_);
    if (auto it = cache_.find(CacheKey(project_id, item_type)); it != cache_.end()) {
      return it->second;
    }
  }
  return ResolveUncached(tx, project_id, item_type);
}

model::ResolvedSchedule TemplateRegistry::ResolveUncached(db::Transaction& tx, const std::string& project_id, const std::string& item_type) {
  RequireName(item_type, "item_type");

  auto       definitions = LoadDefinitions(tx, item_type);
  const auto defaults    = RequireDefault(definitions, item_type);

  const ScheduleDefinition* overrides = nullptr;
  if (!project_id.empty()) {
    if (auto it = definitions.find(project_id); it != definitions.end()) {
      overrides = &it->second;
    }
  }
  return MergeSchedule(defaults, overrides, weight_tolerance_);
}

void TemplateRegistry::Invalidate(const std::string& project_id, const std::string& item_type) {
  std::unique_lock lock(cache_mutex_);
  ++cache_generation_;
  cache_.erase(CacheKey(project_id, item_type));
}

void TemplateRegistry::InvalidateType(const std::string& item_type) {
  const std::string suffix = kKeySeparator + item_type;

  std::unique_lock lock(cache_mutex_);
  ++cache_generation_;
  for (auto it = cache_.begin(); it != cache_.end();) {
    const auto& key = it->first;
    if (key.size() >= suffix.size() && key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0) {
      it = cache_.erase(it);
    } else {
      ++it;
    }
  }
}

// ------------------------------------------------------------------
// Seeding
// ------------------------------------------------------------------

std::size_t TemplateRegistry::SeedDefaults(const std::string& actor) {
  std::vector<std::string> seeded;

  auto tx = repository_->Begin();
  for (const auto& builtin : DefaultTemplates()) {
    auto definitions = LoadDefinitions(*tx, builtin.item_type);
    if (definitions.count("")) continue;

    ScheduleDefinition definition{"", builtin.item_type, builtin.entries, 1};
    ValidateDefaultSchedule(definition, weight_tolerance_);
    WriteDefinition(*tx, definition, actor);
    LogChange(*tx, "", builtin.item_type, {}, definition.entries, actor, 0);
    seeded.push_back(builtin.item_type);
  }
  tx->Commit();

  for (const auto& type : seeded) InvalidateType(type);
  if (!seeded.empty()) {
    PROGRESS_LOG_INFO("default schedules seeded", {observability::IntField("count", static_cast<int64_t>(seeded.size()))});
  }
  return seeded.size();
}

} // namespace progress::templates

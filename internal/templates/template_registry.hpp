#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/schedule.hpp"
#include "template_resolver.hpp"

namespace progress::templates {

/*
  Recomputes the cached figures of existing items after their schedule
  changed. Runs inside the caller's transaction.
*/
class ItemRecalculator {
 public:
  virtual ~ItemRecalculator() = default;

  // Returns the number of items rewritten.
  virtual uint64_t RecalculateItems(db::Transaction& tx, const model::ResolvedSchedule& schedule, const std::string& actor) = 0;
};

struct OverrideSet {
  std::string                        item_type;
  std::vector<model::MilestoneEntry> entries;
  uint64_t                           version = 0;
};

struct OverrideWriteResult {
  model::ResolvedSchedule schedule;
  uint64_t                recalculated_items = 0;
};

/*
  TemplateRegistry

  Owns the default and per-project milestone schedules.

  - Every write re-validates each schedule the written pair resolves to
    and is rejected as a whole on failure.
  - Default writes and override clears recalculate the affected items in
    the same transaction whenever a recalculator is attached.
  - Resolutions are cached per (project, item type); a committed write
    drops the affected entries.
  - Resolve(tx, ...) never opens its own transaction, so callers holding
    a write transaction can use it. Only Resolve(project, type) fills the
    cache, from a transaction it begins itself.
*/
class TemplateRegistry {
 public:
  explicit TemplateRegistry(std::shared_ptr<db::Repository> repository, double weight_tolerance = kDefaultWeightTolerance);

  void SetRecalculator(std::weak_ptr<ItemRecalculator> recalculator);

  std::vector<std::string> ListItemTypes();
  model::ResolvedSchedule  GetDefaultSchedule(const std::string& item_type);
  model::ResolvedSchedule  PutDefaultSchedule(const std::string& item_type, const std::vector<model::MilestoneEntry>& entries,
                                              const std::string& actor);

  OverrideWriteResult     PutProjectOverrides(const std::string& project_id, const std::string& item_type,
                                              const std::vector<OverrideEntry>& overrides, const std::string& actor,
                                              std::optional<uint64_t> expected_version, bool recalculate_existing);
  model::ResolvedSchedule ClearProjectOverrides(const std::string& project_id, const std::string& item_type, const std::string& actor);
  std::vector<OverrideSet> ListProjectOverrides(const std::string& project_id);

  std::vector<db::model::TemplateChangeRecord> ListTemplateChanges(const std::string& project_id, const std::string& item_type);

  model::ResolvedSchedule Resolve(const std::string& project_id, const std::string& item_type);
  model::ResolvedSchedule Resolve(db::Transaction& tx, const std::string& project_id, const std::string& item_type);
  model::ResolvedSchedule ResolveUncached(db::Transaction& tx, const std::string& project_id, const std::string& item_type);

  // Installs every built-in default whose type has no schedule yet. Returns how many were added.
  std::size_t SeedDefaults(const std::string& actor = "system");

  double WeightTolerance() const {
    return weight_tolerance_;
  }

 private:
  using Definitions = std::unordered_map<std::string, ScheduleDefinition>; // keyed by project_id

  std::shared_ptr<ItemRecalculator> AttachedRecalculator();

  static std::string CacheKey(const std::string& project_id, const std::string& item_type);

  Definitions        LoadDefinitions(db::Transaction& tx, const std::string& item_type);
  ScheduleDefinition RequireDefault(const Definitions& definitions, const std::string& item_type) const;
  void               WriteDefinition(db::Transaction& tx, const ScheduleDefinition& definition, const std::string& actor);
  void               LogChange(db::Transaction& tx, const std::string& project_id, const std::string& item_type,
                               const std::vector<model::MilestoneEntry>& old_entries, const std::vector<model::MilestoneEntry>& new_entries,
                               const std::string& actor, uint64_t recalculated_items);

  void Invalidate(const std::string& project_id, const std::string& item_type);
  void InvalidateType(const std::string& item_type);

  std::shared_ptr<db::Repository> repository_;
  double                          weight_tolerance_;

  std::mutex                      recalculator_mutex_;
  std::weak_ptr<ItemRecalculator> recalculator_;

  // Bumped on every invalidation so a load racing a write never caches stale rows.
  mutable std::shared_mutex                                cache_mutex_;
  uint64_t                                                 cache_generation_ = 0;
  std::unordered_map<std::string, model::ResolvedSchedule> cache_;
};

} // namespace progress::templates

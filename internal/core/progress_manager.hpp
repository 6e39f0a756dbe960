#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/calc/progress_calculator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/dimension.hpp"
#include "internal/report/delta_aggregator.hpp"
#include "internal/templates/template_registry.hpp"
#include "progress/engine/v1.hpp"

namespace progress::core {

enum class RollupRefresh {
  kEager,  // rows of the written item are recomputed inside the write transaction
  kOnRead, // snapshots rebuild the whole project first
};

struct EngineOptions {
  double        reconciliation_tolerance_hours = calc::kReconciliationToleranceHours;
  RollupRefresh rollup_refresh                 = RollupRefresh::kEager;
  uint64_t      max_clock_skew_ms              = 300'000; // recorded_at beyond now + skew is rejected
};

/*
  ProgressManager

  Owns every write to items and the milestone event log.

  - An event append, the item's cached figures and (in eager mode) the
    rollup rows the item belongs to are written in one transaction.
  - Cached figures are a projection of the log; ReplayItem and
    RebuildRollups re-derive them.
  - Category hours must reconcile with total earned hours before anything
    is written; a failure aborts the transaction.
*/
class ProgressManager : public templates::ItemRecalculator {
 public:
  ProgressManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<templates::TemplateRegistry> registry,
                  EngineOptions options = {});

  engine::v1::ComputeItemProgressResponse   ComputeItem(const std::string& item_id);
  engine::v1::CreateItemResponse            CreateItem(const engine::v1::CreateItemRequest& request);
  engine::v1::RecordMilestoneChangeResponse RecordMilestoneChange(const engine::v1::RecordMilestoneChangeRequest& request);
  engine::v1::CorrectMilestoneEventResponse CorrectMilestoneEvent(const engine::v1::CorrectMilestoneEventRequest& request);
  engine::v1::RetireItemResponse            RetireItem(const engine::v1::RetireItemRequest& request);
  engine::v1::ReplayItemResponse            ReplayItem(const std::string& item_id, bool apply);

  engine::v1::RebuildRollupsResponse RebuildRollups(const std::string& project_id);
  engine::v1::RollupSnapshot         GetRollupSnapshot(const std::string& project_id, model::Dimension dimension);
  engine::v1::DeltaReport            GetDeltaReport(const report::DeltaQuery& query);

  void UpsertDimension(const std::string& project_id, model::Dimension dimension, const std::string& id, const std::string& name);

  uint64_t RecalculateItems(db::Transaction& tx, const model::ResolvedSchedule& schedule, const std::string& actor) override;

 private:
  class ScheduleCache;

  db::model::ItemRecord RequireItem(db::Transaction& tx, const std::string& item_id);

  // Refreshes percent, earned hours and template versions; throws on a reconciliation failure.
  calc::ProgressBreakdown Recompute(db::model::ItemRecord& item, const model::ResolvedSchedule& schedule, const char* path);
  void                    CheckReconciles(const calc::ProgressBreakdown& breakdown, const std::string& item_id, const char* path);

  // Eager mode only: moves the rows the item leaves and joins by its before/after figures.
  // `before` is null for a new item.
  void RefreshItemRollups(db::Transaction& tx, const db::model::ItemRecord* before, const db::model::ItemRecord& after,
                          ScheduleCache& schedules);

  // Rewrites every rollup row of the project; returns the rows written.
  uint64_t WriteProjectRollups(db::Transaction& tx, const std::string& project_id, ScheduleCache& schedules,
                               engine::v1::RebuildRollupsResponse* report);

  std::shared_ptr<db::Repository>              repository_;
  std::shared_ptr<templates::TemplateRegistry> registry_;
  EngineOptions                                options_;
};

} // namespace progress::core

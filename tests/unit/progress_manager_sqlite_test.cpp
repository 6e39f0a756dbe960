#include <sqlite3.h>

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <set>
#include <string>

#include "internal/core/progress_manager.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace progress::engine::v1;
using progress::core::ProgressManager;
using progress::model::Dimension;

constexpr uint64_t kHour = 3'600'000;

bool Near(double a, double b) {
  return std::fabs(a - b) <= 1e-6;
}

struct Engine {
  std::shared_ptr<progress::db::sqlite::SqliteDB>         db;
  std::shared_ptr<progress::db::sqlite::SqliteRepository> repository;
  std::shared_ptr<progress::templates::TemplateRegistry>  registry;
  std::shared_ptr<ProgressManager>                        manager;
};

Engine MakeEngine() {
  Engine engine;
  engine.db = std::make_shared<progress::db::sqlite::SqliteDB>(":memory:", false);
  for (const auto* sql : progress::db::sql::kSqliteSchema) {
    engine.db->Exec(sql);
  }
  engine.repository = std::make_shared<progress::db::sqlite::SqliteRepository>(engine.db);
  engine.registry   = std::make_shared<progress::templates::TemplateRegistry>(engine.repository);
  engine.registry->SeedDefaults();
  engine.manager = std::make_shared<ProgressManager>(engine.repository, engine.registry);
  engine.registry->SetRecalculator(engine.manager);
  return engine;
}

MilestoneValue Flag(bool complete) {
  MilestoneValue value;
  value.set_complete(complete);
  return value;
}

CreateItemRequest SpoolRequest(const std::string& spool_no, const std::string& area, double budget) {
  CreateItemRequest req;
  req.set_project_id("P-1");
  req.set_item_type("spool");
  (*req.mutable_identity())["spool_no"] = spool_no;
  req.set_budgeted_hours(budget);
  req.mutable_dimensions()->set_area_id(area);
  req.set_actor("foreman");
  return req;
}

RecordMilestoneChangeRequest Record(const std::string& item_id, const std::string& milestone, bool complete, uint64_t recorded_at_ms) {
  RecordMilestoneChangeRequest req;
  req.set_item_id(item_id);
  req.set_milestone(milestone);
  *req.mutable_value()       = Flag(complete);
  *req.mutable_recorded_at() = progress::util::MillisToProto(recorded_at_ms);
  req.set_actor("foreman");
  return req;
}

progress::db::model::ItemRecord LoadItem(Engine& engine, const std::string& item_id) {
  auto tx   = engine.repository->Begin();
  auto item = engine.repository->GetItem(*tx, item_id);
  tx->Commit();
  assert(item.has_value());
  return *item;
}

std::set<std::string> IndexNames(Engine& engine) {
  sqlite3_stmt* st = nullptr;
  const int     rc = sqlite3_prepare_v2(engine.db->Handle(), "SELECT name FROM sqlite_master WHERE type='index';", -1, &st, nullptr);
  assert(rc == SQLITE_OK);

  std::set<std::string> names;
  while (sqlite3_step(st) == SQLITE_ROW) {
    names.insert(reinterpret_cast<const char*>(sqlite3_column_text(st, 0)));
  }
  sqlite3_finalize(st);
  return names;
}

void TestWriteCorrectReportAndRebuild() {
  auto       engine = MakeEngine();
  const auto base   = progress::util::NowMs() - 72 * kHour;

  const auto item  = engine.manager->CreateItem(SpoolRequest("S-1", "A1", 10.0)).item();
  const auto other = engine.manager->CreateItem(SpoolRequest("S-2", "", 6.0)).item();

  const auto erect = engine.manager->RecordMilestoneChange(Record(item.id(), "Erect", true, base + 1 * kHour)).event();
  engine.manager->RecordMilestoneChange(Record(item.id(), "Receive", true, base + 2 * kHour));
  engine.manager->RecordMilestoneChange(Record(other.id(), "Receive", true, base + 2 * kHour));
  assert(Near(LoadItem(engine, item.id()).percent_complete, 45.0));

  // the event and the item update land together; the rejected write leaves nothing
  MilestoneValue partial;
  partial.set_number(50);
  RecordMilestoneChangeRequest bad = Record(item.id(), "Connect", true, base + 3 * kHour);
  *bad.mutable_value()             = partial;
  bool threw                       = false;
  try {
    engine.manager->RecordMilestoneChange(bad);
  } catch (const progress::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(LoadItem(engine, item.id()).milestones.count("Connect") == 0);

  CorrectMilestoneEventRequest correct;
  correct.set_seq(erect.seq());
  correct.set_actor("qc");
  correct.set_reason("erected on the wrong rack");
  const auto corrected = engine.manager->CorrectMilestoneEvent(correct);
  assert(corrected.event().kind() == EVENT_KIND_CORRECTION);
  assert(Near(corrected.item().percent_complete(), 5.0));

  progress::report::DeltaQuery window;
  window.project_id = "P-1";
  window.dimension  = Dimension::kArea;
  window.start_ms   = base;
  window.end_ms     = base + 3 * kHour;
  assert(Near(engine.manager->GetDeltaReport(window).total().delta_hours(), 4.5 + 0.3));

  progress::report::DeltaQuery since = window;
  since.start_ms                     = base + 3 * kHour;
  since.end_ms                       = progress::util::NowMs() + kHour;
  const auto report                  = engine.manager->GetDeltaReport(since);
  assert(Near(report.total().delta_hours(), -4.0));
  assert(report.drift_size() == 0);

  const auto snapshot = engine.manager->GetRollupSnapshot("P-1", Dimension::kArea);
  assert(snapshot.rows_size() == 2);
  assert(Near(snapshot.total().budgeted_hours(), 16.0));
  assert(Near(snapshot.total().earned_hours(), 0.5 + 0.3));

  const auto rebuilt = engine.manager->RebuildRollups("P-1");
  assert(rebuilt.drift_size() == 0);
  assert(rebuilt.alerts_size() == 0);
  assert(!engine.manager->ReplayItem(item.id(), false).drift());
}

void TestOverrideRecalculationCommitsThroughSqlite() {
  auto       engine = MakeEngine();
  auto       req    = SpoolRequest("S-1", "A1", 10.0);
  (*req.mutable_initial_milestones())["Receive"] = Flag(true);
  const auto item                                = engine.manager->CreateItem(req).item();

  const auto result = engine.registry->PutProjectOverrides(
      "P-1", "spool", {{"Receive", 2, std::nullopt, std::nullopt}, {"Erect", 43, std::nullopt, std::nullopt}}, "planner", std::nullopt, true);
  assert(result.recalculated_items == 1);
  assert(Near(LoadItem(engine, item.id()).percent_complete, 2.0));
  assert(engine.registry->Resolve("P-1", "spool").Find("Receive")->weight == 2);

  engine.registry->ClearProjectOverrides("P-1", "spool", "planner");
  assert(Near(LoadItem(engine, item.id()).percent_complete, 5.0));
  assert(engine.manager->RebuildRollups("P-1").drift_size() == 0);
}

void TestSchemaIndexesDimensionAndEventLookups() {
  auto       engine = MakeEngine();
  const auto names  = IndexNames(engine);
  for (const char* name : {"items_project_area", "items_project_system", "items_project_test_package", "items_project_welder",
                           "milestone_events_item_time", "milestone_events_project_time"}) {
    assert(names.count(name) == 1);
  }
}

} // namespace

int main() {
  TestWriteCorrectReportAndRebuild();
  TestOverrideRecalculationCommitsThroughSqlite();
  TestSchemaIndexesDimensionAndEventLookups();

  std::cout << "progress_engine_unit_progress_manager_sqlite: pass\n";
  return 0;
}

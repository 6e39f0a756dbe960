#include "internal/core/progress_manager.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace progress::engine::v1;
using progress::core::EngineOptions;
using progress::core::ProgressManager;
using progress::core::RollupRefresh;
using progress::model::Dimension;

constexpr uint64_t kHour = 3'600'000;

bool Near(double a, double b) {
  return std::fabs(a - b) <= 1e-6;
}

struct Engine {
  std::shared_ptr<progress::db::memory::MemoryRepository> repository;
  std::shared_ptr<progress::templates::TemplateRegistry>  registry;
  std::shared_ptr<ProgressManager>                        manager;
};

Engine MakeEngine(RollupRefresh refresh = RollupRefresh::kEager) {
  Engine engine;
  engine.repository = std::make_shared<progress::db::memory::MemoryRepository>();
  engine.registry   = std::make_shared<progress::templates::TemplateRegistry>(engine.repository);
  engine.registry->SeedDefaults();

  EngineOptions options;
  options.rollup_refresh = refresh;
  engine.manager         = std::make_shared<ProgressManager>(engine.repository, engine.registry, options);
  engine.registry->SetRecalculator(engine.manager);
  return engine;
}

MilestoneValue Flag(bool complete) {
  MilestoneValue value;
  value.set_complete(complete);
  return value;
}

MilestoneValue Number(double number) {
  MilestoneValue value;
  value.set_number(number);
  return value;
}

CreateItemRequest SpoolRequest(const std::string& spool_no, const std::string& area, double budget) {
  CreateItemRequest req;
  req.set_project_id("P-1");
  req.set_item_type("spool");
  (*req.mutable_identity())["drawing"]  = "DWG-100";
  (*req.mutable_identity())["spool_no"] = spool_no;
  req.set_budgeted_hours(budget);
  req.mutable_dimensions()->set_area_id(area);
  req.set_actor("foreman");
  return req;
}

RecordMilestoneChangeRequest Record(const std::string& item_id, const std::string& milestone, const MilestoneValue& value,
                                    uint64_t recorded_at_ms = 0) {
  RecordMilestoneChangeRequest req;
  req.set_item_id(item_id);
  req.set_milestone(milestone);
  *req.mutable_value() = value;
  req.set_actor("foreman");
  if (recorded_at_ms != 0) {
    *req.mutable_recorded_at() = progress::util::MillisToProto(recorded_at_ms);
  }
  return req;
}

std::size_t EventCount(Engine& engine, const std::string& item_id) {
  auto                     tx = engine.repository->Begin();
  progress::db::EventFilter filter;
  filter.project_id = "P-1";
  filter.item_id    = item_id;
  const auto count  = engine.repository->ListMilestoneEvents(*tx, filter).size();
  tx->Commit();
  return count;
}

progress::db::model::ItemRecord LoadItem(Engine& engine, const std::string& item_id) {
  auto tx   = engine.repository->Begin();
  auto item = engine.repository->GetItem(*tx, item_id);
  tx->Commit();
  assert(item.has_value());
  return *item;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestCreateItemComputesScenarioFigures() {
  auto engine = MakeEngine();

  auto req                                     = SpoolRequest("S-1", "A1", 10.0);
  (*req.mutable_initial_milestones())["receive"] = Flag(true);
  (*req.mutable_initial_milestones())["Erect"]   = Number(1);
  (*req.mutable_initial_milestones())["Connect"] = Number(0);

  const auto resp = engine.manager->CreateItem(req);
  assert(resp.item().identity_key() == "drawing=DWG-100;spool_no=S-1");
  assert(Near(resp.progress().percent_complete(), 45.0));
  assert(Near(resp.progress().earned_hours(), 4.5));
  assert(Near(resp.progress().category_earned().receive(), 0.5));
  assert(Near(resp.progress().category_earned().install(), 4.0));
  assert(resp.item().template_default_version() == 1);

  // stored under the schedule's spelling, zeros are not logged
  assert(resp.item().milestones().count("Receive") == 1);
  assert(resp.item().milestones().count("Connect") == 0);
  assert(EventCount(engine, resp.item().id()) == 2);

  assert(Throws<progress::util::AlreadyExists>([&] { engine.manager->CreateItem(SpoolRequest("S-1", "A2", 3.0)); }));
}

void TestMilestoneWriteUpdatesItemEventAndRollupTogether() {
  auto       engine = MakeEngine();
  const auto item   = engine.manager->CreateItem(SpoolRequest("S-1", "A1", 10.0)).item();

  const auto resp = engine.manager->RecordMilestoneChange(Record(item.id(), "Erect", Flag(true)));
  assert(resp.has_event());
  assert(resp.event().previous_value() == 0.0);
  assert(resp.event().new_value() == 100.0);
  assert(resp.event().kind() == EVENT_KIND_UPDATE);
  assert(Near(resp.item().percent_complete(), 40.0));

  const auto stored = LoadItem(engine, item.id());
  assert(Near(stored.earned_hours, 4.0));
  assert(EventCount(engine, item.id()) == 1);

  const auto snapshot = engine.manager->GetRollupSnapshot("P-1", Dimension::kArea);
  assert(snapshot.rows_size() == 1);
  assert(Near(snapshot.rows(0).earned_hours(), 4.0));
  assert(Near(snapshot.rows(0).category_earned().install(), 4.0));
  assert(Near(snapshot.total().budgeted_hours(), 10.0));
}

void TestRejectedWriteLeavesNoTrace() {
  auto       engine = MakeEngine();
  const auto item   = engine.manager->CreateItem(SpoolRequest("S-1", "A1", 10.0)).item();
  engine.manager->RecordMilestoneChange(Record(item.id(), "Receive", Flag(true)));

  // discrete milestone given a partial value
  assert(Throws<progress::util::InvalidArgument>([&] { engine.manager->RecordMilestoneChange(Record(item.id(), "Erect", Number(50))); }));

  const auto stored = LoadItem(engine, item.id());
  assert(stored.milestones.size() == 1);
  assert(Near(stored.percent_complete, 5.0));
  assert(EventCount(engine, item.id()) == 1);
}

void TestRepeatedValueIsNotLogged() {
  auto       engine = MakeEngine();
  const auto item   = engine.manager->CreateItem(SpoolRequest("S-1", "A1", 10.0)).item();
  engine.manager->RecordMilestoneChange(Record(item.id(), "Receive", Flag(true)));

  const auto again = engine.manager->RecordMilestoneChange(Record(item.id(), "RECEIVE", Number(100)));
  assert(!again.has_event());
  assert(EventCount(engine, item.id()) == 1);
}

void TestBackdatedWriteIsRejected() {
  auto       engine = MakeEngine();
  const auto item   = engine.manager->CreateItem(SpoolRequest("S-1", "A1", 10.0)).item();
  const auto base   = progress::util::NowMs() - 48 * kHour;

  engine.manager->RecordMilestoneChange(Record(item.id(), "Erect", Flag(true), base + 2 * kHour));
  assert(Throws<progress::util::InvalidArgument>(
      [&] { engine.manager->RecordMilestoneChange(Record(item.id(), "Erect", Flag(false), base + 1 * kHour)); }));

  // other milestones keep their own ordering
  engine.manager->RecordMilestoneChange(Record(item.id(), "Receive", Flag(true), base + 1 * kHour));
}

void TestFutureTimestampBeyondSkewIsRejected() {
  auto       engine = MakeEngine();
  const auto item   = engine.manager->CreateItem(SpoolRequest("S-1", "A1", 10.0)).item();
  const auto now    = progress::util::NowMs();

  assert(Throws<progress::util::InvalidArgument>(
      [&] { engine.manager->RecordMilestoneChange(Record(item.id(), "Erect", Flag(true), now + 24 * kHour)); }));
  assert(EventCount(engine, item.id()) == 0);

  // a clock slightly ahead of the server's is tolerated
  engine.manager->RecordMilestoneChange(Record(item.id(), "Erect", Flag(true), now + 60'000));

  // nothing later is blocked by the rejected far-future write
  engine.manager->RecordMilestoneChange(Record(item.id(), "Receive", Flag(true)));
  assert(EventCount(engine, item.id()) == 2);
}

void TestUnknownMilestoneIsStoredButExcluded() {
  auto       engine = MakeEngine();
  const auto item   = engine.manager->CreateItem(SpoolRequest("S-1", "A1", 10.0)).item();

  const auto resp = engine.manager->RecordMilestoneChange(Record(item.id(), "Hydro", Flag(true)));
  assert(resp.has_event());
  assert(Near(resp.progress().percent_complete(), 0.0));
  assert(resp.progress().unknown_milestones_size() == 1);
  assert(resp.item().milestones().at("Hydro") == 100.0);
}

void TestRetiredItemRejectsWritesAndLeavesRollups() {
  auto       engine = MakeEngine();
  const auto item   = engine.manager->CreateItem(SpoolRequest("S-1", "A1", 10.0)).item();

  RetireItemRequest retire;
  retire.set_item_id(item.id());
  retire.set_reason("deleted from drawing");
  retire.set_actor("planner");
  assert(engine.manager->RetireItem(retire).item().retired());
  assert(engine.manager->RetireItem(retire).item().retired());

  assert(Throws<progress::util::Conflict>([&] { engine.manager->RecordMilestoneChange(Record(item.id(), "Erect", Flag(true))); }));
  assert(engine.manager->GetRollupSnapshot("P-1", Dimension::kArea).rows_size() == 0);
}

void TestCorrectionProducesNegativeDelta() {
  auto       engine = MakeEngine();
  const auto item   = engine.manager->CreateItem(SpoolRequest("S-1", "A1", 10.0)).item();
  const auto base   = progress::util::NowMs() - 72 * kHour;

  const auto first  = engine.manager->RecordMilestoneChange(Record(item.id(), "Erect", Flag(true), base + 1 * kHour)).event();
  const auto second = engine.manager->RecordMilestoneChange(Record(item.id(), "Receive", Flag(true), base + 2 * kHour)).event();
  (void)second;

  CorrectMilestoneEventRequest correct;
  correct.set_seq(first.seq());
  correct.set_actor("qc");
  correct.set_reason("erected on the wrong rack");
  const auto corrected = engine.manager->CorrectMilestoneEvent(correct);
  assert(corrected.event().kind() == EVENT_KIND_CORRECTION);
  assert(corrected.event().corrects_seq() == first.seq());
  assert(corrected.event().previous_value() == 100.0);
  assert(corrected.event().new_value() == 0.0);
  assert(Near(corrected.item().percent_complete(), 5.0));

  // superseded events cannot be corrected again
  assert(Throws<progress::util::Conflict>([&] { engine.manager->CorrectMilestoneEvent(correct); }));
  correct.set_reason("");
  assert(Throws<progress::util::InvalidArgument>([&] { engine.manager->CorrectMilestoneEvent(correct); }));

  progress::report::DeltaQuery before;
  before.project_id = "P-1";
  before.dimension  = Dimension::kArea;
  before.start_ms   = base;
  before.end_ms     = base + 3 * kHour;
  assert(Near(engine.manager->GetDeltaReport(before).total().delta_hours(), 4.5));

  progress::report::DeltaQuery after = before;
  after.start_ms                     = base + 3 * kHour;
  after.end_ms                       = progress::util::NowMs() + kHour;
  const auto report                  = engine.manager->GetDeltaReport(after);
  assert(Near(report.total().delta_hours(), -4.0));
  assert(report.drift_size() == 0);
}

void TestReplayReproducesCachedMilestones() {
  auto       engine = MakeEngine();
  auto       req    = SpoolRequest("S-1", "A1", 8.0);
  (*req.mutable_initial_milestones())["Receive"] = Flag(true);
  const auto item                                = engine.manager->CreateItem(req).item();

  engine.manager->RecordMilestoneChange(Record(item.id(), "Erect", Flag(true)));
  engine.manager->RecordMilestoneChange(Record(item.id(), "Connect", Flag(true)));
  engine.manager->RecordMilestoneChange(Record(item.id(), "Connect", Flag(false)));

  const auto clean = engine.manager->ReplayItem(item.id(), false);
  assert(!clean.drift());
  assert(clean.event_count() == 4);
  assert(clean.replayed_milestones().size() == clean.cached_milestones().size());
  for (const auto& [name, value] : clean.cached_milestones()) {
    assert(clean.replayed_milestones().at(name) == value);
  }

  // cached state written around the log
  {
    auto tx     = engine.repository->Begin();
    auto stored = engine.repository->GetItem(*tx, item.id());
    stored->milestones["Test"] = 100.0;
    stored->percent_complete   = 50.0;
    assert(engine.repository->UpdateItem(*tx, *stored));
    tx->Commit();
  }

  const auto dirty = engine.manager->ReplayItem(item.id(), true);
  assert(dirty.drift());
  assert(dirty.applied());
  assert(Near(dirty.replayed_percent(), 45.0));

  const auto repaired = LoadItem(engine, item.id());
  assert(repaired.milestones.count("Test") == 0);
  assert(Near(repaired.percent_complete, 45.0));
  assert(!engine.manager->ReplayItem(item.id(), false).drift());
}

void TestLegacyImportIsUntrackedProgress() {
  auto engine = MakeEngine();
  auto req    = SpoolRequest("S-9", "A1", 10.0);
  req.set_legacy_import(true);
  (*req.mutable_initial_milestones())["Receive"] = Flag(true);
  const auto item                                = engine.manager->CreateItem(req).item();
  assert(EventCount(engine, item.id()) == 0);

  progress::report::DeltaQuery query;
  query.project_id  = "P-1";
  query.dimension   = Dimension::kArea;
  query.start_ms    = 0;
  query.end_ms      = progress::util::NowMs() + kHour;
  const auto report = engine.manager->GetDeltaReport(query);
  assert(report.untracked_size() == 1);
  assert(report.untracked(0).item_id() == item.id());
  assert(Near(report.total().delta_hours(), 0.0));

  // no history to replay from; the cached state stays
  const auto replay = engine.manager->ReplayItem(item.id(), true);
  assert(replay.drift());
  assert(!replay.applied());
}

void TestRebuildRepairsTamperedRollups() {
  auto       engine = MakeEngine();
  const auto a      = engine.manager->CreateItem(SpoolRequest("S-1", "A1", 10.0)).item();
  const auto b      = engine.manager->CreateItem(SpoolRequest("S-2", "", 6.0)).item();
  engine.manager->RecordMilestoneChange(Record(a.id(), "Erect", Flag(true)));
  engine.manager->RecordMilestoneChange(Record(b.id(), "Receive", Flag(true)));

  {
    auto                             tx = engine.repository->Begin();
    progress::db::model::RollupRecord bogus;
    bogus.project_id      = "P-1";
    bogus.dimension       = Dimension::kArea;
    bogus.dimension_value = "A1";
    bogus.item_count      = 3;
    bogus.budgeted_hours  = 99.0;
    bogus.earned_hours    = 50.0;
    assert(engine.repository->UpsertRollup(*tx, bogus));
    tx->Commit();
  }

  const auto rebuilt = engine.manager->RebuildRollups("P-1");
  assert(rebuilt.drift_size() == 1);
  assert(rebuilt.drift(0).dimension_value() == "A1");
  assert(Near(rebuilt.drift(0).cached_budgeted_hours(), 99.0));
  assert(Near(rebuilt.drift(0).rebuilt_budgeted_hours(), 10.0));
  assert(rebuilt.alerts_size() == 0);

  engine.manager->UpsertDimension("P-1", Dimension::kArea, "A1", "Pipe Rack 1");
  const auto snapshot = engine.manager->GetRollupSnapshot("P-1", Dimension::kArea);
  assert(snapshot.rows_size() == 2);
  assert(snapshot.rows(0).label() == "Pipe Rack 1");
  assert(snapshot.rows(1).dimension_value().empty());
  assert(snapshot.rows(1).label() == "Not Assigned");
  assert(Near(snapshot.total().budgeted_hours(), 16.0));
  assert(Near(snapshot.total().earned_hours(), 4.0 + 0.3));
  assert(snapshot.total().label() == "Total");

  assert(engine.manager->RebuildRollups("P-1").drift_size() == 0);
}

void TestOverrideRecalculatesExistingItems() {
  auto       engine = MakeEngine();
  const auto item   = engine.manager->CreateItem(SpoolRequest("S-1", "A1", 10.0)).item();
  engine.manager->RecordMilestoneChange(Record(item.id(), "Receive", Flag(true)));

  const auto result = engine.registry->PutProjectOverrides(
      "P-1", "spool", {{"Receive", 2, std::nullopt, std::nullopt}, {"Erect", 43, std::nullopt, std::nullopt}}, "planner", std::nullopt, true);
  assert(result.recalculated_items == 1);

  const auto stored = LoadItem(engine, item.id());
  assert(Near(stored.percent_complete, 2.0));
  assert(stored.template_override_version == 1);

  const auto snapshot = engine.manager->GetRollupSnapshot("P-1", Dimension::kArea);
  assert(Near(snapshot.total().earned_hours(), 0.2));

  const auto computed = engine.manager->ComputeItem(item.id());
  assert(Near(computed.progress().earned_hours(), 0.2));
}

void AssertCachedFiguresMatchReplay(Engine& engine, const std::string& item_id) {
  const auto replay = engine.manager->ReplayItem(item_id, false);
  assert(!replay.drift());
  assert(Near(replay.cached_percent(), replay.replayed_percent()));
}

void TestClearingOverridesRecalculatesExistingItems() {
  auto       engine = MakeEngine();
  const auto item   = engine.manager->CreateItem(SpoolRequest("S-1", "A1", 10.0)).item();
  engine.manager->RecordMilestoneChange(Record(item.id(), "Receive", Flag(true)));

  engine.registry->PutProjectOverrides("P-1", "spool",
                                       {{"Receive", 2, std::nullopt, std::nullopt}, {"Erect", 43, std::nullopt, std::nullopt}}, "planner",
                                       std::nullopt, true);
  assert(Near(LoadItem(engine, item.id()).percent_complete, 2.0));

  engine.registry->ClearProjectOverrides("P-1", "spool", "planner");

  const auto stored = LoadItem(engine, item.id());
  assert(Near(stored.percent_complete, 5.0));
  assert(Near(stored.earned_hours, 0.5));
  assert(stored.template_override_version == 0);
  assert(engine.registry->ListTemplateChanges("P-1", "spool")[0].recalculated_items == 1);
  AssertCachedFiguresMatchReplay(engine, item.id());

  assert(Near(engine.manager->GetRollupSnapshot("P-1", Dimension::kArea).total().earned_hours(), 0.5));
  assert(engine.manager->RebuildRollups("P-1").drift_size() == 0);
}

void TestDefaultWriteRecalculatesEveryProject() {
  auto       engine = MakeEngine();
  auto       first  = SpoolRequest("S-1", "A1", 10.0);
  auto       second = SpoolRequest("S-1", "A1", 10.0);
  second.set_project_id("P-2");
  (*first.mutable_initial_milestones())["Receive"]  = Flag(true);
  (*second.mutable_initial_milestones())["Receive"] = Flag(true);
  const auto plain      = engine.manager->CreateItem(first).item();
  const auto overridden = engine.manager->CreateItem(second).item();

  engine.registry->PutProjectOverrides("P-2", "spool",
                                       {{"Receive", 2, std::nullopt, std::nullopt}, {"Erect", 43, std::nullopt, std::nullopt}}, "planner",
                                       std::nullopt, true);

  auto entries = engine.registry->GetDefaultSchedule("spool").entries;
  for (auto& entry : entries) {
    if (entry.name == "Receive") entry.weight = 10;
    if (entry.name == "Erect") entry.weight = 35;
  }
  engine.registry->PutDefaultSchedule("spool", entries, "admin");
  assert(engine.registry->ListTemplateChanges("", "spool")[0].recalculated_items == 2);

  const auto p1 = LoadItem(engine, plain.id());
  assert(Near(p1.percent_complete, 10.0));
  assert(p1.template_default_version == 2);
  AssertCachedFiguresMatchReplay(engine, plain.id());
  assert(Near(engine.manager->GetRollupSnapshot("P-1", Dimension::kArea).total().earned_hours(), 1.0));
  assert(engine.manager->RebuildRollups("P-1").drift_size() == 0);

  // the project override still decides Receive for P-2
  const auto p2 = LoadItem(engine, overridden.id());
  assert(Near(p2.percent_complete, 2.0));
  assert(p2.template_default_version == 2);
  assert(p2.template_override_version == 1);
  AssertCachedFiguresMatchReplay(engine, overridden.id());
  assert(engine.manager->RebuildRollups("P-2").drift_size() == 0);
}

void TestEagerRollupsTrackWritesWithoutRebuild() {
  auto       engine = MakeEngine();
  const auto a      = engine.manager->CreateItem(SpoolRequest("S-1", "A1", 10.0)).item();
  const auto b      = engine.manager->CreateItem(SpoolRequest("S-2", "A1", 6.0)).item();
  const auto c      = engine.manager->CreateItem(SpoolRequest("S-3", "", 4.0)).item();

  const auto erect = engine.manager->RecordMilestoneChange(Record(a.id(), "Erect", Flag(true))).event();
  engine.manager->RecordMilestoneChange(Record(b.id(), "Receive", Flag(true)));
  engine.manager->RecordMilestoneChange(Record(c.id(), "Connect", Flag(true)));

  CorrectMilestoneEventRequest correct;
  correct.set_seq(erect.seq());
  correct.set_actor("qc");
  correct.set_reason("wrong spool");
  engine.manager->CorrectMilestoneEvent(correct);

  RetireItemRequest retire;
  retire.set_item_id(b.id());
  retire.set_reason("deleted from drawing");
  retire.set_actor("planner");
  engine.manager->RetireItem(retire);

  // A1 keeps only S-1, whose erect was corrected away
  {
    auto tx  = engine.repository->Begin();
    auto row = engine.repository->GetRollup(*tx, "P-1", Dimension::kArea, "A1");
    tx->Commit();
    assert(row.has_value());
    assert(row->item_count == 1);
    assert(Near(row->budgeted_hours, 10.0));
    assert(Near(row->earned_hours, 0.0));
    assert(Near(row->category_earned.Sum(), 0.0));
  }

  const auto snapshot = engine.manager->GetRollupSnapshot("P-1", Dimension::kArea);
  assert(Near(snapshot.total().budgeted_hours(), 14.0));
  assert(Near(snapshot.total().earned_hours(), 1.6));
  assert(Near(snapshot.total().category_earned().install(), 1.6));

  // the rows kept by the writes are the rows a rebuild derives
  const auto rebuilt = engine.manager->RebuildRollups("P-1");
  assert(rebuilt.drift_size() == 0);
  assert(rebuilt.alerts_size() == 0);
}

void TestOnReadRefreshRebuildsSnapshots() {
  auto       engine = MakeEngine(RollupRefresh::kOnRead);
  const auto item   = engine.manager->CreateItem(SpoolRequest("S-1", "A1", 10.0)).item();
  engine.manager->RecordMilestoneChange(Record(item.id(), "Receive", Flag(true)));

  {
    auto tx = engine.repository->Begin();
    assert(engine.repository->ListRollups(*tx, "P-1", Dimension::kArea).empty());
    tx->Commit();
  }

  const auto snapshot = engine.manager->GetRollupSnapshot("P-1", Dimension::kArea);
  assert(snapshot.rows_size() == 1);
  assert(Near(snapshot.total().earned_hours(), 0.5));
}

void TestMissingItemIsNotFound() {
  auto engine = MakeEngine();
  assert(Throws<progress::util::NotFound>([&] { engine.manager->ComputeItem("nope"); }));
  assert(Throws<progress::util::NotFound>([&] { engine.manager->RecordMilestoneChange(Record("nope", "Erect", Flag(true))); }));
}

} // namespace

int main() {
  TestCreateItemComputesScenarioFigures();
  TestMilestoneWriteUpdatesItemEventAndRollupTogether();
  TestRejectedWriteLeavesNoTrace();
  TestRepeatedValueIsNotLogged();
  TestBackdatedWriteIsRejected();
  TestFutureTimestampBeyondSkewIsRejected();
  TestUnknownMilestoneIsStoredButExcluded();
  TestRetiredItemRejectsWritesAndLeavesRollups();
  TestCorrectionProducesNegativeDelta();
  TestReplayReproducesCachedMilestones();
  TestLegacyImportIsUntrackedProgress();
  TestRebuildRepairsTamperedRollups();
  TestOverrideRecalculatesExistingItems();
  TestClearingOverridesRecalculatesExistingItems();
  TestDefaultWriteRecalculatesEveryProject();
  TestEagerRollupsTrackWritesWithoutRebuild();
  TestOnReadRefreshRebuildsSnapshots();
  TestMissingItemIsNotFound();

  std::cout << "progress_engine_unit_progress_manager: pass\n";
  return 0;
}

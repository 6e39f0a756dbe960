#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "progress/engine/v1.hpp"

namespace {

using namespace progress::engine::v1;

bool Near(double a, double b) {
  return std::fabs(a - b) <= 1e-6;
}

progress::factory::RuntimeDependencies BuildDeps() {
  progress::runtime::config::RuntimeConfig config;
  config.mutable_engine()->set_seed_default_templates(true);
  config.mutable_engine()->set_rollup_refresh(progress::runtime::config::ROLLUP_REFRESH_EAGER);
  return progress::factory::BuildRuntime(config, std::make_shared<progress::db::memory::MemoryRepository>());
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

std::string CreateWeld(progress::factory::RuntimeDependencies& deps, const std::string& weld_no, const std::string& welder) {
  CreateItemRequest req;
  req.set_project_id("P-7");
  req.set_item_type("field_weld");
  (*req.mutable_identity())["weld_no"] = weld_no;
  req.set_budgeted_hours(4.0);
  req.mutable_dimensions()->set_welder_id(welder);
  req.mutable_dimensions()->set_system_id("SYS-1");
  req.set_actor("foreman");
  return deps.progress_service->CreateItem(req).item().id();
}

void TestResolveTemplateReflectsOverrides() {
  auto deps = BuildDeps();

  ResolveTemplateRequest resolve;
  resolve.set_project_id("P-7");
  resolve.set_item_type("field_weld");
  auto schedule = deps.progress_service->ResolveTemplate(resolve).schedule();
  assert(schedule.entries_size() == 5);
  assert(schedule.entries(1).name() == "Weld Made");
  assert(schedule.entries(1).kind() == COMPLETION_KIND_DISCRETE);
  assert(schedule.entries(1).category() == CATEGORY_INSTALL);

  PutProjectOverridesRequest put;
  put.set_project_id("P-7");
  put.set_item_type("field_weld");
  put.set_actor("planner");
  put.set_expected_version(0);
  auto* fit_up = put.add_overrides();
  fit_up->set_name("fit-up");
  fit_up->set_weight(20);
  auto* weld = put.add_overrides();
  weld->set_name("Weld Made");
  weld->set_weight(50);
  const auto written = deps.template_service->PutProjectOverrides(put);
  assert(written.schedule().override_version() == 1);

  schedule = deps.progress_service->ResolveTemplate(resolve).schedule();
  assert(schedule.entries(0).weight() == 20);
  assert(schedule.entries(0).category() == CATEGORY_INSTALL);

  // same expected version again is stale
  assert(Throws<progress::util::Conflict>([&] { deps.template_service->PutProjectOverrides(put); }));

  ListProjectOverridesRequest list;
  list.set_project_id("P-7");
  assert(deps.template_service->ListProjectOverrides(list).overrides_size() == 1);

  ListTemplateChangesRequest changes;
  changes.set_project_id("P-7");
  const auto logged = deps.template_service->ListTemplateChanges(changes);
  assert(logged.changes_size() == 1);
  assert(logged.changes(0).new_entries_size() == 2);
  assert(logged.changes(0).actor() == "planner");
}

void TestWritesRequireActor() {
  auto deps = BuildDeps();

  PutDefaultScheduleRequest put;
  put.set_item_type("pump");
  auto* entry = put.add_entries();
  entry->set_name("Set");
  entry->set_weight(100);
  entry->set_kind(COMPLETION_KIND_DISCRETE);
  entry->set_category(CATEGORY_INSTALL);
  assert(Throws<progress::util::InvalidArgument>([&] { deps.template_service->PutDefaultSchedule(put); }));

  put.set_actor("admin");
  assert(deps.template_service->PutDefaultSchedule(put).schedule().default_version() == 1);

  ListItemTypesRequest types;
  const auto           listed = deps.template_service->ListItemTypes(types);
  bool                 found  = false;
  for (const auto& type : listed.item_types()) found = found || type == "pump";
  assert(found);
}

void TestReadOperationsOverWelderDimension() {
  auto       deps  = BuildDeps();
  const auto w1    = CreateWeld(deps, "FW-1", "W-17");
  const auto w2    = CreateWeld(deps, "FW-2", "W-17");
  const auto start = progress::util::NowMs();

  RecordMilestoneChangeRequest record;
  record.set_item_id(w1);
  record.set_milestone("weld made");
  record.mutable_value()->set_complete(true);
  record.set_actor("foreman");
  const auto recorded = deps.progress_service->RecordMilestoneChange(record);
  assert(recorded.event().milestone() == "Weld Made");
  assert(Near(recorded.progress().earned_hours(), 2.4));

  record.set_item_id(w2);
  record.set_milestone("Fit-Up");
  deps.progress_service->RecordMilestoneChange(record);

  ComputeItemProgressRequest compute;
  compute.set_item_id(w1);
  const auto computed = deps.progress_service->ComputeItemProgress(compute);
  assert(Near(computed.progress().percent_complete(), 60.0));
  assert(Near(computed.progress().category_earned().receive(), 0.0));
  assert(Near(computed.progress().category_budget().install(), 2.8));

  UpsertDimensionRequest label;
  label.set_project_id("P-7");
  label.set_dimension(DIMENSION_WELDER);
  label.set_id("W-17");
  label.set_name("J. Smith");
  deps.progress_service->UpsertDimension(label);

  GetRollupSnapshotRequest snapshot;
  snapshot.set_project_id("P-7");
  snapshot.set_dimension(DIMENSION_WELDER);
  const auto rollup = deps.progress_service->GetRollupSnapshot(snapshot).snapshot();
  assert(rollup.rows_size() == 1);
  assert(rollup.rows(0).label() == "J. Smith");
  assert(rollup.rows(0).item_count() == 2);
  assert(Near(rollup.rows(0).budgeted_hours(), 8.0));
  assert(Near(rollup.rows(0).earned_hours(), 2.4 + 0.4));
  assert(Near(rollup.rows(0).percent_complete(), 35.0));

  GetDeltaReportRequest delta;
  delta.set_project_id("P-7");
  delta.set_dimension(DIMENSION_WELDER);
  *delta.mutable_start() = progress::util::MillisToProto(start);
  *delta.mutable_end()   = progress::util::MillisToProto(progress::util::NowMs() + 60'000);
  const auto report      = deps.progress_service->GetDeltaReport(delta).report();
  assert(report.rows_size() == 1);
  assert(report.rows(0).items_with_activity() == 2);
  assert(Near(report.rows(0).budgeted_hours(), 8.0));
  assert(Near(report.total().delta_hours(), 2.8));
}

void TestMalformedReadRequestsAreRejected() {
  auto deps = BuildDeps();

  GetRollupSnapshotRequest snapshot;
  snapshot.set_project_id("P-7");
  assert(Throws<progress::util::InvalidArgument>([&] { deps.progress_service->GetRollupSnapshot(snapshot); }));

  GetDeltaReportRequest delta;
  delta.set_project_id("P-7");
  delta.set_dimension(DIMENSION_AREA);
  *delta.mutable_start() = progress::util::MillisToProto(1000);
  assert(Throws<progress::util::InvalidArgument>([&] { deps.progress_service->GetDeltaReport(delta); }));

  *delta.mutable_end() = progress::util::MillisToProto(1000);
  assert(Throws<progress::util::InvalidArgument>([&] { deps.progress_service->GetDeltaReport(delta); }));

  // a pre-epoch start is rejected, not read as the epoch
  *delta.mutable_end() = progress::util::MillisToProto(5000);
  delta.mutable_start()->set_seconds(-5);
  assert(Throws<progress::util::InvalidArgument>([&] { deps.progress_service->GetDeltaReport(delta); }));

  delta.mutable_start()->set_seconds(1);
  delta.mutable_start()->set_nanos(-1);
  assert(Throws<progress::util::InvalidArgument>([&] { deps.progress_service->GetDeltaReport(delta); }));
  delta.mutable_start()->set_nanos(1'000'000'000);
  assert(Throws<progress::util::InvalidArgument>([&] { deps.progress_service->GetDeltaReport(delta); }));

  delta.mutable_start()->set_nanos(500'000'000);
  assert(progress::util::ProtoToMillis(delta.start()) == 1500);

  ResolveTemplateRequest resolve;
  resolve.set_item_type("no_such_type");
  assert(Throws<progress::util::NotFound>([&] { deps.progress_service->ResolveTemplate(resolve); }));
}

void TestReplayAndRebuildThroughService() {
  auto       deps = BuildDeps();
  const auto id   = CreateWeld(deps, "FW-1", "W-17");

  RecordMilestoneChangeRequest record;
  record.set_item_id(id);
  record.set_milestone("Fit-Up");
  record.mutable_value()->set_number(1);
  record.set_actor("foreman");
  deps.progress_service->RecordMilestoneChange(record);

  ReplayItemRequest replay;
  replay.set_item_id(id);
  const auto replayed = deps.progress_service->ReplayItem(replay);
  assert(!replayed.drift());
  assert(replayed.event_count() == 1);

  RebuildRollupsRequest rebuild;
  rebuild.set_project_id("P-7");
  const auto rebuilt = deps.progress_service->RebuildRollups(rebuild);
  assert(rebuilt.drift_size() == 0);
  assert(rebuilt.rows_written() > 0);
}

} // namespace

int main() {
  TestResolveTemplateReflectsOverrides();
  TestWritesRequireActor();
  TestReadOperationsOverWelderDimension();
  TestMalformedReadRequestsAreRejected();
  TestReplayAndRebuildThroughService();

  std::cout << "progress_engine_unit_progress_service: pass\n";
  return 0;
}

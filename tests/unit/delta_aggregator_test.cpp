#include "internal/report/delta_aggregator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

#include "internal/calc/progress_calculator.hpp"
#include "internal/report/event_replay.hpp"
#include "internal/templates/default_templates.hpp"
#include "internal/util/errors.hpp"

namespace {

using progress::db::model::EventKind;
using progress::db::model::ItemRecord;
using progress::db::model::MilestoneEventRecord;
using progress::model::Dimension;
using progress::model::ResolvedSchedule;
using progress::report::DeltaQuery;

constexpr uint64_t kHour = 3'600'000;

bool Near(double a, double b) {
  return std::fabs(a - b) <= 1e-9;
}

const ResolvedSchedule& SpoolSchedule() {
  static const ResolvedSchedule schedule = [] {
    ResolvedSchedule s;
    s.project_id = "P-1";
    s.item_type  = "spool";
    for (const auto& t : progress::templates::DefaultTemplates()) {
      if (t.item_type == "spool") s.entries = t.entries;
    }
    return s;
  }();
  return schedule;
}

ItemRecord Item(const std::string& id, const std::string& area, double budget) {
  ItemRecord item;
  item.id             = id;
  item.project_id     = "P-1";
  item.item_type      = "spool";
  item.area_id        = area;
  item.budgeted_hours = budget;
  return item;
}

class EventLog {
 public:
  EventLog& Add(const std::string& item_id, const std::string& milestone, double previous, double value, uint64_t at_ms) {
    MilestoneEventRecord event;
    event.seq            = next_seq_++;
    event.project_id     = "P-1";
    event.item_id        = item_id;
    event.milestone_name = milestone;
    event.previous_value = previous;
    event.new_value      = value;
    event.actor          = "tester";
    event.created_at_ms  = at_ms;
    events_.push_back(event);
    return *this;
  }

  EventLog& Correct(const std::string& item_id, const std::string& milestone, double previous, double value, uint64_t at_ms,
                    uint64_t corrects_seq) {
    Add(item_id, milestone, previous, value, at_ms);
    events_.back().kind         = EventKind::kCorrection;
    events_.back().corrects_seq = corrects_seq;
    return *this;
  }

  const std::vector<MilestoneEventRecord>& Events() const {
    return events_;
  }

 private:
  std::vector<MilestoneEventRecord> events_;
  uint64_t                          next_seq_ = 1;
};

// Cached figures as the write path would leave them after the whole log.
void SyncCache(ItemRecord& item, const EventLog& log) {
  std::vector<MilestoneEventRecord> own;
  for (const auto& event : log.Events()) {
    if (event.item_id == item.id) own.push_back(event);
  }
  item.milestones       = progress::report::ReplayMilestones(own);
  item.percent_complete = progress::calc::PercentComplete(SpoolSchedule(), item.milestones);
  item.earned_hours     = item.budgeted_hours * item.percent_complete / 100.0;
}

progress::engine::v1::DeltaReport Run(const std::vector<ItemRecord>& items, const EventLog& log, uint64_t start_ms, uint64_t end_ms,
                                      const std::map<std::string, std::string>& labels = {}) {
  DeltaQuery query;
  query.project_id = "P-1";
  query.dimension  = Dimension::kArea;
  query.start_ms   = start_ms;
  query.end_ms     = end_ms;
  return progress::report::AggregateDelta(
      query, items, log.Events(), [](const ItemRecord&) -> const ResolvedSchedule& { return SpoolSchedule(); }, labels);
}

void TestWindowBeforeAnyEventContributesNothing() {
  EventLog log;
  log.Add("i-1", "Receive", 0, 100, 10 * kHour).Add("i-1", "Erect", 0, 100, 11 * kHour);

  auto item = Item("i-1", "A1", 10.0);
  SyncCache(item, log);

  const auto report = Run({item}, log, 1 * kHour, 5 * kHour);
  assert(report.rows_size() == 0);
  assert(Near(report.total().delta_hours(), 0.0));
  assert(Near(report.total().budgeted_hours(), 0.0));
  assert(report.total().items_with_activity() == 0);
  assert(report.untracked_size() == 0);
  assert(report.drift_size() == 0);
}

void TestBudgetCountedOncePerItem() {
  EventLog log;
  log.Add("i-1", "Receive", 0, 100, 2 * kHour)
      .Add("i-1", "Erect", 0, 100, 3 * kHour)
      .Add("i-1", "Punch", 0, 100, 4 * kHour)
      .Add("i-2", "Receive", 0, 100, 3 * kHour);

  auto a = Item("i-1", "A1", 10.0);
  auto b = Item("i-2", "A1", 20.0);
  SyncCache(a, log);
  SyncCache(b, log);

  const auto report = Run({a, b}, log, 1 * kHour, 6 * kHour, {{"A1", "Area One"}});
  assert(report.rows_size() == 1);

  const auto& row = report.rows(0);
  assert(row.dimension_value() == "A1");
  assert(row.label() == "Area One");
  assert(row.items_with_activity() == 2);
  assert(Near(row.budgeted_hours(), 30.0));
  // 10h * (5 + 40 + 5)% + 20h * 5%
  assert(Near(row.delta_hours(), 5.0 + 1.0));
  assert(Near(row.category_delta().receive(), 0.5 + 1.0));
  assert(Near(row.category_delta().install(), 4.0));
  assert(Near(row.category_delta().punch(), 0.5));
  assert(Near(row.category_budget().receive(), 0.5 + 1.0));
  assert(Near(report.total().budgeted_hours(), 30.0));
  assert(Near(report.total().delta_percent(), 6.0 / 30.0 * 100.0));
}

void TestNetChangeUsesFirstPreviousAndLastValue() {
  EventLog log;
  log.Add("i-1", "Erect", 0, 100, 2 * kHour).Add("i-1", "Erect", 100, 0, 3 * kHour).Add("i-1", "Erect", 0, 100, 4 * kHour);

  auto item = Item("i-1", "A1", 10.0);
  SyncCache(item, log);

  const auto report = Run({item}, log, 1 * kHour, 6 * kHour);
  assert(Near(report.total().delta_hours(), 4.0));
}

void TestCorrectionYieldsSignedNegativeDelta() {
  EventLog log;
  log.Add("i-1", "Erect", 0, 100, 2 * kHour).Correct("i-1", "Erect", 100, 0, 8 * kHour, 1);

  auto item = Item("i-1", "", 10.0);
  SyncCache(item, log);

  const auto report = Run({item}, log, 5 * kHour, 10 * kHour);
  assert(report.rows_size() == 1);
  assert(report.rows(0).label() == std::string(progress::model::kUnassignedLabel));
  assert(Near(report.total().delta_hours(), -4.0));
  assert(Near(report.total().category_delta().install(), -4.0));
  assert(Near(report.total().earned_at_window_end_hours(), 0.0));
}

void TestEarnedAtWindowEndIgnoresLaterEvents() {
  EventLog log;
  log.Add("i-1", "Receive", 0, 100, 1 * kHour).Add("i-1", "Erect", 0, 100, 3 * kHour).Add("i-1", "Connect", 0, 100, 9 * kHour);

  auto item = Item("i-1", "A1", 10.0);
  SyncCache(item, log);

  const auto report = Run({item}, log, 2 * kHour, 5 * kHour);
  assert(Near(report.total().delta_hours(), 4.0));
  assert(Near(report.total().earned_at_window_end_hours(), 4.5));
}

void TestUntrackedProgressIsReportedNotAggregated() {
  EventLog log;
  auto     legacy         = Item("legacy", "A1", 10.0);
  legacy.milestones       = {{"Receive", 100.0}};
  legacy.percent_complete = 5.0;
  legacy.earned_hours     = 0.5;

  const auto report = Run({legacy}, log, 0, 10 * kHour);
  assert(report.untracked_size() == 1);
  assert(report.untracked(0).item_id() == "legacy");
  assert(Near(report.untracked(0).cached_earned_hours(), 0.5));
  assert(report.rows_size() == 0);
  assert(Near(report.total().budgeted_hours(), 0.0));
}

void TestCachedDriftIsFlagged() {
  EventLog log;
  log.Add("i-1", "Receive", 0, 100, 1 * kHour);

  auto item = Item("i-1", "A1", 10.0);
  SyncCache(item, log);
  item.percent_complete = 50.0; // written outside the log

  const auto report = Run({item}, log, 0, 2 * kHour);
  assert(report.drift_size() == 1);
  assert(Near(report.drift(0).cached_percent(), 50.0));
  assert(Near(report.drift(0).replayed_percent(), 5.0));
  // the delta itself still comes from the log
  assert(Near(report.total().delta_hours(), 0.5));
}

void TestUnknownMilestoneEventsAreCountedAndExcluded() {
  EventLog log;
  log.Add("i-1", "Hydro", 0, 100, 1 * kHour).Add("i-1", "Hydro", 100, 0, 2 * kHour).Add("i-1", "Receive", 0, 100, 2 * kHour);

  auto item = Item("i-1", "A1", 10.0);
  SyncCache(item, log);

  const auto report = Run({item}, log, 0, 3 * kHour);
  assert(report.unknown_milestones_size() == 1);
  assert(report.unknown_milestones(0).milestone() == "Hydro");
  assert(report.unknown_milestones(0).event_count() == 2);
  assert(Near(report.total().delta_hours(), 0.5));
}

void TestRetiredItemsAreSkipped() {
  EventLog log;
  log.Add("i-1", "Receive", 0, 100, 1 * kHour);

  auto item = Item("i-1", "A1", 10.0);
  SyncCache(item, log);
  item.retired = true;

  const auto report = Run({item}, log, 0, 2 * kHour);
  assert(report.rows_size() == 0);
  assert(Near(report.total().budgeted_hours(), 0.0));
}

void TestEmptyWindowIsRejected() {
  EventLog log;
  bool     threw = false;
  try {
    (void)Run({}, log, 5 * kHour, 5 * kHour);
  } catch (const progress::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestWindowBeforeAnyEventContributesNothing();
  TestBudgetCountedOncePerItem();
  TestNetChangeUsesFirstPreviousAndLastValue();
  TestCorrectionYieldsSignedNegativeDelta();
  TestEarnedAtWindowEndIgnoresLaterEvents();
  TestUntrackedProgressIsReportedNotAggregated();
  TestCachedDriftIsFlagged();
  TestUnknownMilestoneEventsAreCountedAndExcluded();
  TestRetiredItemsAreSkipped();
  TestEmptyWindowIsRejected();

  std::cout << "progress_engine_unit_delta_aggregator: pass\n";
  return 0;
}

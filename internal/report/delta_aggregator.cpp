#include "delta_aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

#include "event_replay.hpp"
#include "internal/calc/progress_calculator.hpp"
#include "internal/model/proto_convert.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace progress::report {

namespace {

using EventList = std::vector<const db::model::MilestoneEventRecord*>;

struct RowTotals {
  uint64_t             items_with_activity = 0;
  double               budgeted_hours      = 0.0;
  model::CategoryHours category_budget;
  model::CategoryHours category_delta;
  double               delta_hours       = 0.0;
  double               earned_at_end     = 0.0;

  void Add(const RowTotals& other) {
    items_with_activity += other.items_with_activity;
    budgeted_hours += other.budgeted_hours;
    category_budget += other.category_budget;
    category_delta += other.category_delta;
    delta_hours += other.delta_hours;
    earned_at_end += other.earned_at_end;
  }
};

// First and last in-window event of one scheduled milestone.
struct MilestoneWindow {
  const model::MilestoneEntry*          entry = nullptr;
  const db::model::MilestoneEventRecord* first = nullptr;
  const db::model::MilestoneEventRecord* last  = nullptr;
};

engine::v1::DeltaRow ToRow(const std::string& value, const std::string& label, const RowTotals& totals) {
  engine::v1::DeltaRow row;
  row.set_dimension_value(value);
  row.set_label(label);
  row.set_items_with_activity(totals.items_with_activity);
  row.set_budgeted_hours(totals.budgeted_hours);
  *row.mutable_category_budget() = model::ToProto(totals.category_budget);
  *row.mutable_category_delta()  = model::ToProto(totals.category_delta);
  row.set_delta_hours(totals.delta_hours);
  row.set_delta_percent(totals.budgeted_hours > 0.0 ? totals.delta_hours / totals.budgeted_hours * 100.0 : 0.0);
  row.set_earned_at_window_end_hours(totals.earned_at_end);
  return row;
}

std::string LabelFor(const std::string& value, const std::map<std::string, std::string>& labels) {
  if (value.empty()) return std::string(model::kUnassignedLabel);
  auto it = labels.find(value);
  return it == labels.end() ? value : it->second;
}

} // namespace

engine::v1::DeltaReport AggregateDelta(const DeltaQuery& query, const std::vector<db::model::ItemRecord>& items,
                                       const std::vector<db::model::MilestoneEventRecord>& events, const ScheduleLookup& schedules,
                                       const std::map<std::string, std::string>& labels) {
  if (query.start_ms >= query.end_ms) {
    throw util::InvalidArgument("delta window start must be before its end");
  }

  engine::v1::DeltaReport report;
  report.set_project_id(query.project_id);
  report.set_dimension(model::ToProto(query.dimension));
  *report.mutable_window_start() = util::MillisToProto(query.start_ms);
  *report.mutable_window_end()   = util::MillisToProto(query.end_ms);

  std::unordered_map<std::string, EventList> by_item;
  for (const auto& event : events) by_item[event.item_id].push_back(&event);

  static const EventList           kNoEvents;
  std::map<std::string, RowTotals> rows;
  RowTotals                        total;

  for (const auto& item : items) {
    if (item.retired) continue;

    const auto& schedule   = schedules(item);
    auto        found      = by_item.find(item.id);
    const auto& log        = found == by_item.end() ? kNoEvents : found->second;
    const bool  has_events = !log.empty();

    // cross-check: cached projection against a full replay
    if (!has_events) {
      if (item.percent_complete > 0.0) {
        auto* untracked = report.add_untracked();
        untracked->set_item_id(item.id);
        untracked->set_cached_percent(item.percent_complete);
        untracked->set_cached_earned_hours(item.earned_hours);
      }
      continue;
    }

    const double replayed_percent = calc::PercentComplete(schedule, ReplayMilestones(log));
    if (std::fabs(replayed_percent - item.percent_complete) > kDriftTolerancePercent) {
      auto* drift = report.add_drift();
      drift->set_item_id(item.id);
      drift->set_cached_percent(item.percent_complete);
      drift->set_replayed_percent(replayed_percent);
    }

    // window slice, one entry per scheduled milestone in schedule order
    std::vector<MilestoneWindow>    windows;
    std::map<std::string, uint64_t> unknown;
    for (const auto* event : log) {
      if (event->created_at_ms < query.start_ms || event->created_at_ms >= query.end_ms) continue;

      const auto* entry = schedule.Find(event->milestone_name);
      if (!entry) {
        ++unknown[event->milestone_name];
        continue;
      }
      auto it = std::find_if(windows.begin(), windows.end(), [entry](const MilestoneWindow& w) {
        return w.entry == entry;
      });
      if (it == windows.end()) {
        windows.push_back(MilestoneWindow{entry, event, event});
      } else {
        it->last = event;
      }
    }

    for (const auto& [milestone, count] : unknown) {
      auto* issue = report.add_unknown_milestones();
      issue->set_item_id(item.id);
      issue->set_milestone(milestone);
      issue->set_event_count(count);
    }

    if (windows.empty()) continue;

    RowTotals contribution;
    contribution.items_with_activity = 1;
    contribution.budgeted_hours      = item.budgeted_hours;
    contribution.category_budget     = calc::CategoryBudgetHours(schedule, item.budgeted_hours);
    for (const auto& w : windows) {
      const double points = calc::EntryContribution(*w.entry, w.last->new_value) - calc::EntryContribution(*w.entry, w.first->previous_value);
      const double hours  = item.budgeted_hours * points / 100.0;
      contribution.category_delta[w.entry->category] += hours;
      contribution.delta_hours += hours;
    }
    contribution.earned_at_end =
        calc::EarnedHours(item.budgeted_hours, calc::PercentComplete(schedule, ReplayMilestones(log, query.end_ms)));

    rows[db::model::DimensionValue(item, query.dimension)].Add(contribution);
    total.Add(contribution);
  }

  // assigned values in order, the unassigned row last
  for (const auto& [value, totals] : rows) {
    if (value.empty()) continue;
    *report.add_rows() = ToRow(value, LabelFor(value, labels), totals);
  }
  if (auto it = rows.find(""); it != rows.end()) {
    *report.add_rows() = ToRow("", LabelFor("", labels), it->second);
  }
  *report.mutable_total() = ToRow("", "Total", total);
  return report;
}

} // namespace progress::report

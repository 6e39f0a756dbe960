#include "progress_manager.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <optional>

#include "internal/model/milestone_value.hpp"
#include "internal/model/proto_convert.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/report/event_replay.hpp"
#include "internal/report/rollup_builder.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "record_convert.hpp"

namespace progress::core {

using namespace progress::engine::v1;
using observability::BoolField;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr char kTotalLabel[] = "Total";

void RequireField(const std::string& value, const char* what) {
  if (util::Trim(value).empty()) {
    throw util::InvalidArgument(std::string(what) + " is required");
  }
}

void RequireWritable(const db::model::ItemRecord& item) {
  if (item.retired) {
    throw util::Conflict("item " + item.id + " is retired");
  }
}

// Canonical identity: field=value pairs sorted by field, joined with ';'.
std::string IdentityKey(const google::protobuf::Map<std::string, std::string>& identity) {
  std::map<std::string, std::string> sorted;
  for (const auto& [field, value] : identity) {
    auto key = util::Trim(field);
    if (key.empty()) throw util::InvalidArgument("identity field name is empty");
    sorted[key] = util::Trim(value);
  }

  std::string out;
  for (const auto& [field, value] : sorted) {
    if (!out.empty()) out += ';';
    out += field + '=' + value;
  }
  return out;
}

// Name under which an off-schedule milestone is stored: an existing spelling wins.
std::string StoredSpelling(const model::MilestoneMap& milestones, const std::string& requested) {
  for (const auto& [key, value] : milestones) {
    if (util::EqualsIgnoreCase(key, requested)) return key;
  }
  return util::Trim(requested);
}

void SetMilestone(model::MilestoneMap& milestones, const std::string& name, double value) {
  model::EraseMilestone(milestones, name);
  milestones[name] = value;
}

const db::model::MilestoneEventRecord* LatestEvent(const std::vector<db::model::MilestoneEventRecord>& events, const std::string& milestone) {
  const db::model::MilestoneEventRecord* latest = nullptr;
  for (const auto& event : events) {
    if (util::EqualsIgnoreCase(event.milestone_name, milestone)) latest = &event;
  }
  return latest;
}

db::model::MilestoneEventRecord NewEvent(const db::model::ItemRecord& item, const std::string& milestone, double previous_value,
                                         double new_value, const std::string& actor, uint64_t created_at_ms) {
  db::model::MilestoneEventRecord event;
  event.event_id       = util::NewId();
  event.project_id     = item.project_id;
  event.item_id        = item.id;
  event.milestone_name = milestone;
  event.previous_value = previous_value;
  event.new_value      = new_value;
  event.actor          = actor;
  event.created_at_ms  = created_at_ms;
  return event;
}

std::vector<db::model::MilestoneEventRecord> ItemEvents(db::Repository& repository, db::Transaction& tx, const db::model::ItemRecord& item) {
  db::EventFilter filter;
  filter.project_id = item.project_id;
  filter.item_id    = item.id;
  return repository.ListMilestoneEvents(tx, filter);
}

std::map<std::string, std::string> LabelMap(const std::vector<db::model::DimensionRecord>& records) {
  std::map<std::string, std::string> labels;
  for (const auto& record : records) labels[record.id] = record.name;
  return labels;
}

} // namespace

// Resolved schedules for the items touched by one transaction.
class ProgressManager::ScheduleCache {
 public:
  ScheduleCache(templates::TemplateRegistry& registry, db::Transaction& tx) : registry_(registry), tx_(tx) {
  }

  // Serves this schedule for its (project, item type) instead of resolving.
  void Pin(const model::ResolvedSchedule& schedule) {
    schedules_[Key(schedule.project_id, schedule.item_type)] = schedule;
  }

  const model::ResolvedSchedule& For(const db::model::ItemRecord& item) {
    const auto key = Key(item.project_id, item.item_type);
    auto       it  = schedules_.find(key);
    if (it == schedules_.end()) {
      it = schedules_.emplace(key, registry_.Resolve(tx_, item.project_id, item.item_type)).first;
    }
    return it->second;
  }

 private:
  static std::string Key(const std::string& project_id, const std::string& item_type) {
    return project_id + '\x1f' + item_type;
  }

  templates::TemplateRegistry&                   registry_;
  db::Transaction&                               tx_;
  std::map<std::string, model::ResolvedSchedule> schedules_;
};

ProgressManager::ProgressManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<templates::TemplateRegistry> registry,
                                 EngineOptions options)
    : repository_(std::move(repository)), registry_(std::move(registry)), options_(options) {
  if (options_.reconciliation_tolerance_hours <= 0.0) {
    options_.reconciliation_tolerance_hours = calc::kReconciliationToleranceHours;
  }
}

db::model::ItemRecord ProgressManager::RequireItem(db::Transaction& tx, const std::string& item_id) {
  auto item = repository_->GetItem(tx, item_id);
  if (!item) throw util::NotFound("item " + item_id + " not found");
  return *item;
}

void ProgressManager::CheckReconciles(const calc::ProgressBreakdown& breakdown, const std::string& item_id, const char* path) {
  try {
    calc::EnsureReconciles(breakdown, item_id, options_.reconciliation_tolerance_hours);
  } catch (const util::InvariantViolation& e) {
    observability::Metrics::Instance().RecordInvariantViolation(path);
    PROGRESS_LOG_ERROR("category hours do not reconcile",
                       {StringField("item_id", item_id), StringField("path", path), DoubleField("earned_hours", breakdown.earned_hours),
                        DoubleField("category_sum_hours", breakdown.category_earned.Sum()), StringField("error", e.what())});
    throw;
  }
}

calc::ProgressBreakdown ProgressManager::Recompute(db::model::ItemRecord& item, const model::ResolvedSchedule& schedule, const char* path) {
  auto breakdown = calc::Compute(schedule, item.milestones, item.budgeted_hours);
  CheckReconciles(breakdown, item.id, path);

  for (const auto& name : breakdown.unknown_milestones) {
    PROGRESS_LOG_WARN("milestone not in schedule; excluded from progress",
                      {StringField("item_id", item.id), StringField("item_type", item.item_type), StringField("milestone", name)});
  }

  item.percent_complete          = breakdown.percent_complete;
  item.earned_hours              = breakdown.earned_hours;
  item.template_default_version  = schedule.default_version;
  item.template_override_version = schedule.override_version;
  return breakdown;
}

// ------------------------------------------------------------------
// Rollups
// ------------------------------------------------------------------

void ProgressManager::RefreshItemRollups(db::Transaction& tx, const db::model::ItemRecord* before, const db::model::ItemRecord& after,
                                         ScheduleCache& schedules) {
  if (options_.rollup_refresh != RollupRefresh::kEager) return;

  std::optional<report::ItemContribution> leaving;
  if (before && !before->retired) {
    leaving = report::ItemContribution{before, calc::Compute(schedules.For(*before), before->milestones, before->budgeted_hours)};
  }
  std::optional<report::ItemContribution> joining;
  if (!after.retired) {
    joining = report::ItemContribution{&after, calc::Compute(schedules.For(after), after.milestones, after.budgeted_hours)};
  }

  const auto now   = util::NowMs();
  auto       apply = [&](model::Dimension dimension, const std::string& value, const report::ItemContribution* out,
                   const report::ItemContribution* in) {
    if (!out && !in) return;
    auto row = repository_->GetRollup(tx, after.project_id, dimension, value);
    if (!row) {
      row                  = db::model::RollupRecord{};
      row->project_id      = after.project_id;
      row->dimension       = dimension;
      row->dimension_value = value;
    }
    // an emptied group keeps a zero row until the next rebuild
    report::ApplyItemChange(*row, out, in, now);
    db::ThrowIfError(repository_->UpsertRollup(tx, *row), "refresh rollup");
  };

  for (const auto dimension : model::kAllDimensions) {
    const auto& to = db::model::DimensionValue(after, dimension);
    if (before && db::model::DimensionValue(*before, dimension) != to) {
      apply(dimension, db::model::DimensionValue(*before, dimension), leaving ? &*leaving : nullptr, nullptr);
      apply(dimension, to, nullptr, joining ? &*joining : nullptr);
    } else {
      apply(dimension, to, leaving ? &*leaving : nullptr, joining ? &*joining : nullptr);
    }
  }
}

uint64_t ProgressManager::WriteProjectRollups(db::Transaction& tx, const std::string& project_id, ScheduleCache& schedules,
                                              RebuildRollupsResponse* report) {
  db::ItemFilter filter;
  filter.project_id = project_id;
  auto items        = repository_->ListItems(tx, filter);

  std::vector<report::ItemContribution> contributions;
  contributions.reserve(items.size());
  for (auto& item : items) {
    const auto& schedule  = schedules.For(item);
    auto        breakdown = calc::Compute(schedule, item.milestones, item.budgeted_hours);

    if (!calc::Reconciles(breakdown, options_.reconciliation_tolerance_hours)) {
      observability::Metrics::Instance().RecordInvariantViolation("rebuild");
      PROGRESS_LOG_ERROR("category hours do not reconcile", {StringField("item_id", item.id), StringField("path", "rebuild"),
                                                             DoubleField("earned_hours", breakdown.earned_hours),
                                                             DoubleField("category_sum_hours", breakdown.category_earned.Sum())});
      if (report) {
        auto* alert = report->add_alerts();
        alert->set_item_id(item.id);
        alert->set_earned_hours(breakdown.earned_hours);
        alert->set_category_sum_hours(breakdown.category_earned.Sum());
        alert->set_message("category earned hours do not sum to total earned hours");
      }
    }

    // cached figures follow the total path
    if (item.percent_complete != breakdown.percent_complete || item.earned_hours != breakdown.earned_hours ||
        item.template_default_version != schedule.default_version || item.template_override_version != schedule.override_version) {
      item.percent_complete          = breakdown.percent_complete;
      item.earned_hours              = breakdown.earned_hours;
      item.template_default_version  = schedule.default_version;
      item.template_override_version = schedule.override_version;
      db::ThrowIfError(repository_->UpdateItem(tx, item), "rewrite item figures");
    }
    contributions.push_back({&item, std::move(breakdown)});
  }

  const auto                                        now = util::NowMs();
  std::vector<std::vector<db::model::RollupRecord>> rebuilt;
  rebuilt.reserve(model::kAllDimensions.size());
  for (const auto dimension : model::kAllDimensions) {
    rebuilt.push_back(report::BuildRollups(project_id, dimension, contributions, now));
    if (report) {
      auto drift = report::CompareRollups(dimension, repository_->ListRollups(tx, project_id, dimension), rebuilt.back(),
                                          options_.reconciliation_tolerance_hours);
      for (auto& entry : drift) *report->add_drift() = std::move(entry);
    }
  }

  db::ThrowIfError(repository_->DeleteRollups(tx, project_id), "clear rollups");
  uint64_t written = 0;
  for (const auto& rows : rebuilt) {
    for (const auto& row : rows) {
      db::ThrowIfError(repository_->UpsertRollup(tx, row), "write rollup");
      ++written;
    }
  }
  return written;
}

RebuildRollupsResponse ProgressManager::RebuildRollups(const std::string& project_id) {
  RequireField(project_id, "project_id");

  RebuildRollupsResponse response;
  auto                   tx = repository_->Begin();
  ScheduleCache          schedules(*registry_, *tx);
  response.set_rows_written(WriteProjectRollups(*tx, project_id, schedules, &response));
  tx->Commit();

  if (response.drift_size() > 0 || response.alerts_size() > 0) {
    PROGRESS_LOG_WARN("rollup rebuild repaired drift", {StringField("project_id", project_id), IntField("drift_rows", response.drift_size()),
                                                        IntField("integrity_alerts", response.alerts_size())});
  }
  observability::Metrics::Instance().RecordReportIssues("rollup_rebuild", 0, static_cast<uint64_t>(response.drift_size()));
  return response;
}

RollupSnapshot ProgressManager::GetRollupSnapshot(const std::string& project_id, model::Dimension dimension) {
  RequireField(project_id, "project_id");
  if (options_.rollup_refresh == RollupRefresh::kOnRead) {
    RebuildRollups(project_id);
  }

  auto tx     = repository_->Begin();
  auto rows   = repository_->ListRollups(*tx, project_id, dimension);
  auto labels = LabelMap(repository_->ListDimensions(*tx, project_id, dimension));
  tx->Commit();

  std::sort(rows.begin(), rows.end(), [](const db::model::RollupRecord& a, const db::model::RollupRecord& b) {
    if (a.dimension_value.empty() != b.dimension_value.empty()) return b.dimension_value.empty();
    return a.dimension_value < b.dimension_value;
  });

  RollupSnapshot snapshot;
  snapshot.set_project_id(project_id);
  snapshot.set_dimension(model::ToProto(dimension));

  db::model::RollupRecord total;
  total.project_id = project_id;
  total.dimension  = dimension;
  for (const auto& row : rows) {
    if (row.item_count == 0) continue;

    std::string label;
    if (row.dimension_value.empty()) {
      label = std::string(model::kUnassignedLabel);
    } else {
      auto it = labels.find(row.dimension_value);
      label   = it == labels.end() ? row.dimension_value : it->second;
    }
    *snapshot.add_rows() = ToProto(row, label);

    total.item_count += row.item_count;
    total.budgeted_hours += row.budgeted_hours;
    total.earned_hours += row.earned_hours;
    total.category_budget += row.category_budget;
    total.category_earned += row.category_earned;
    total.refreshed_at_ms = std::max(total.refreshed_at_ms, row.refreshed_at_ms);
  }
  *snapshot.mutable_total() = ToProto(total, kTotalLabel);
  return snapshot;
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

ComputeItemProgressResponse ProgressManager::ComputeItem(const std::string& item_id) {
  RequireField(item_id, "item_id");

  auto          tx   = repository_->Begin();
  auto          item = RequireItem(*tx, item_id);
  ScheduleCache schedules(*registry_, *tx);
  const auto    breakdown = calc::Compute(schedules.For(item), item.milestones, item.budgeted_hours);
  tx->Commit();

  CheckReconciles(breakdown, item.id, "compute");

  ComputeItemProgressResponse response;
  *response.mutable_item()     = ToProto(item);
  *response.mutable_progress() = ToProto(item.id, breakdown);
  return response;
}

DeltaReport ProgressManager::GetDeltaReport(const report::DeltaQuery& query) {
  RequireField(query.project_id, "project_id");
  if (query.start_ms >= query.end_ms) {
    throw util::InvalidArgument("delta window start must be before its end");
  }

  auto tx = repository_->Begin();

  db::ItemFilter item_filter;
  item_filter.project_id = query.project_id;
  const auto items       = repository_->ListItems(*tx, item_filter);

  db::EventFilter event_filter;
  event_filter.project_id = query.project_id;
  const auto events       = repository_->ListMilestoneEvents(*tx, event_filter);

  const auto    labels = LabelMap(repository_->ListDimensions(*tx, query.project_id, query.dimension));
  ScheduleCache schedules(*registry_, *tx);

  auto report = report::AggregateDelta(
      query, items, events,
      [&schedules](const db::model::ItemRecord& item) -> const model::ResolvedSchedule& {
        return schedules.For(item);
      },
      labels);
  tx->Commit();

  observability::Metrics::Instance().RecordReportIssues("delta", static_cast<uint64_t>(report.untracked_size()),
                                                        static_cast<uint64_t>(report.drift_size()));
  if (report.untracked_size() > 0 || report.drift_size() > 0) {
    PROGRESS_LOG_WARN("delta report found cached state without history",
                      {StringField("project_id", query.project_id), IntField("untracked_items", report.untracked_size()),
                       IntField("drift_items", report.drift_size())});
  }
  return report;
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

CreateItemResponse ProgressManager::CreateItem(const CreateItemRequest& request) {
  RequireField(request.project_id(), "project_id");
  RequireField(request.item_type(), "item_type");
  RequireField(request.actor(), "actor");
  if (request.identity().empty()) {
    throw util::InvalidArgument("identity is required");
  }
  if (!std::isfinite(request.budgeted_hours()) || request.budgeted_hours() < 0.0) {
    throw util::InvalidArgument("budgeted_hours must be a non-negative number");
  }

  const auto identity_key = IdentityKey(request.identity());
  const auto now          = util::NowMs();

  auto tx = repository_->Begin();
  if (repository_->FindItemByKey(*tx, request.project_id(), request.item_type(), identity_key)) {
    throw util::AlreadyExists("item '" + identity_key + "' of type " + request.item_type() + " already exists in project " +
                              request.project_id());
  }

  db::model::ItemRecord item;
  item.id              = util::NewId();
  item.project_id      = request.project_id();
  item.item_type       = request.item_type();
  item.identity_key    = identity_key;
  item.budgeted_hours  = request.budgeted_hours();
  item.area_id         = request.dimensions().area_id();
  item.system_id       = request.dimensions().system_id();
  item.test_package_id = request.dimensions().test_package_id();
  item.drawing_id      = request.dimensions().drawing_id();
  item.welder_id       = request.dimensions().welder_id();
  item.created_at_ms   = now;
  item.updated_at_ms   = now;
  item.updated_by      = request.actor();

  ScheduleCache schedules(*registry_, *tx);
  const auto&   schedule = schedules.For(item);

  // sorted so events are appended in a stable order
  std::map<std::string, MilestoneValue> initial;
  for (const auto& [requested, raw] : request.initial_milestones()) initial[requested] = raw;

  model::MilestoneMap given;
  for (const auto& [requested, raw] : initial) {
    RequireField(requested, "milestone name");
    const auto* entry = schedule.Find(requested);
    const auto  name  = entry ? entry->name : util::Trim(requested);
    if (model::LookupMilestone(given, name)) {
      throw util::InvalidArgument("milestone '" + name + "' is given more than once");
    }
    const auto value = model::RawValueFromProto(raw);
    given[name]      = entry ? model::NormalizeMilestoneValue(value, entry->kind) : model::NormalizeUnscheduledValue(value);
  }
  for (const auto& [name, value] : given) {
    if (value != model::kNotStarted) item.milestones[name] = value;
  }

  const auto breakdown = Recompute(item, schedule, "create");
  db::ThrowIfError(repository_->InsertItem(*tx, item), "insert item");

  if (!request.legacy_import()) {
    for (const auto& [name, value] : item.milestones) {
      auto event = NewEvent(item, name, model::kNotStarted, value, request.actor(), now);
      db::ThrowIfError(repository_->AppendMilestoneEvent(*tx, event), "append milestone event");
    }
  }

  RefreshItemRollups(*tx, nullptr, item, schedules);
  tx->Commit();

  if (!request.legacy_import()) {
    for (std::size_t i = 0; i < item.milestones.size(); ++i) observability::Metrics::Instance().RecordMilestoneWrite(item.item_type);
  }
  PROGRESS_LOG_INFO("item created", {StringField("item_id", item.id), StringField("project_id", item.project_id),
                                     StringField("item_type", item.item_type), StringField("identity_key", item.identity_key),
                                     BoolField("legacy_import", request.legacy_import())});

  CreateItemResponse response;
  *response.mutable_item()     = ToProto(item);
  *response.mutable_progress() = ToProto(item.id, breakdown);
  return response;
}

RecordMilestoneChangeResponse ProgressManager::RecordMilestoneChange(const RecordMilestoneChangeRequest& request) {
  RequireField(request.item_id(), "item_id");
  RequireField(request.milestone(), "milestone");
  RequireField(request.actor(), "actor");

  const auto raw         = model::RawValueFromProto(request.value());
  const auto recorded_at = request.has_recorded_at() ? util::ProtoToMillis(request.recorded_at()) : util::NowMs();
  if (recorded_at > util::NowMs() + options_.max_clock_skew_ms) {
    throw util::InvalidArgument("recorded_at lies more than " + std::to_string(options_.max_clock_skew_ms / 1000) +
                                "s in the future");
  }

  auto tx   = repository_->Begin();
  auto item = RequireItem(*tx, request.item_id());
  RequireWritable(item);

  ScheduleCache schedules(*registry_, *tx);
  const auto&   schedule = schedules.For(item);
  const auto*   entry    = schedule.Find(request.milestone());

  const auto   name     = entry ? entry->name : StoredSpelling(item.milestones, request.milestone());
  const double value    = entry ? model::NormalizeMilestoneValue(raw, entry->kind) : model::NormalizeUnscheduledValue(raw);
  const double previous = model::LookupMilestone(item.milestones, name).value_or(model::kNotStarted);

  RecordMilestoneChangeResponse response;
  if (value == previous) {
    const auto breakdown = calc::Compute(schedule, item.milestones, item.budgeted_hours);
    tx->Commit();
    *response.mutable_item()     = ToProto(item);
    *response.mutable_progress() = ToProto(item.id, breakdown);
    return response;
  }

  const auto  events = ItemEvents(*repository_, *tx, item);
  const auto* latest = LatestEvent(events, name);
  if (latest && recorded_at < latest->created_at_ms) {
    throw util::InvalidArgument("recorded_at precedes the latest change of milestone '" + name + "'");
  }

  const auto before = item;
  SetMilestone(item.milestones, name, value);
  const auto breakdown = Recompute(item, schedule, "record");
  item.updated_at_ms   = util::NowMs();
  item.updated_by      = request.actor();

  auto event = NewEvent(item, name, previous, value, request.actor(), recorded_at);
  db::ThrowIfError(repository_->AppendMilestoneEvent(*tx, event), "append milestone event");
  db::ThrowIfError(repository_->UpdateItem(*tx, item), "update item");
  RefreshItemRollups(*tx, &before, item, schedules);
  tx->Commit();

  observability::Metrics::Instance().RecordMilestoneWrite(item.item_type);
  PROGRESS_LOG_INFO("milestone recorded", {StringField("item_id", item.id), StringField("milestone", name), DoubleField("previous", previous),
                                           DoubleField("value", value), IntField("seq", static_cast<int64_t>(event.seq)),
                                           StringField("actor", request.actor())});

  *response.mutable_item()     = ToProto(item);
  *response.mutable_progress() = ToProto(item.id, breakdown);
  *response.mutable_event()    = ToProto(event);
  return response;
}

CorrectMilestoneEventResponse ProgressManager::CorrectMilestoneEvent(const CorrectMilestoneEventRequest& request) {
  if (request.seq() == 0) {
    throw util::InvalidArgument("seq is required");
  }
  RequireField(request.actor(), "actor");
  RequireField(request.reason(), "reason");

  auto tx     = repository_->Begin();
  auto target = repository_->GetMilestoneEvent(*tx, request.seq());
  if (!target) throw util::NotFound("milestone event " + std::to_string(request.seq()) + " not found");

  auto item = RequireItem(*tx, target->item_id);
  RequireWritable(item);

  const auto  events = ItemEvents(*repository_, *tx, item);
  const auto* latest = LatestEvent(events, target->milestone_name);
  if (!latest || latest->seq != target->seq) {
    throw util::Conflict("event " + std::to_string(target->seq) + " is not the latest change of milestone '" + target->milestone_name +
                         "'; only the latest change can be corrected");
  }

  ScheduleCache schedules(*registry_, *tx);
  const auto&   schedule = schedules.For(item);

  const double current = model::LookupMilestone(item.milestones, target->milestone_name).value_or(model::kNotStarted);
  const auto   before  = item;
  SetMilestone(item.milestones, target->milestone_name, target->previous_value);
  const auto breakdown = Recompute(item, schedule, "correct");
  item.updated_at_ms   = util::NowMs();
  item.updated_by      = request.actor();

  auto correction = NewEvent(item, target->milestone_name, current, target->previous_value, request.actor(),
                             std::max(item.updated_at_ms, latest->created_at_ms));
  correction.kind         = db::model::EventKind::kCorrection;
  correction.corrects_seq = target->seq;
  correction.reason       = request.reason();
  db::ThrowIfError(repository_->AppendMilestoneEvent(*tx, correction), "append correction event");
  db::ThrowIfError(repository_->UpdateItem(*tx, item), "update item");
  RefreshItemRollups(*tx, &before, item, schedules);
  tx->Commit();

  observability::Metrics::Instance().RecordMilestoneWrite(item.item_type);
  PROGRESS_LOG_INFO("milestone event corrected",
                    {StringField("item_id", item.id), StringField("milestone", target->milestone_name),
                     IntField("corrects_seq", static_cast<int64_t>(target->seq)), IntField("seq", static_cast<int64_t>(correction.seq)),
                     StringField("actor", request.actor()), StringField("reason", request.reason())});

  CorrectMilestoneEventResponse response;
  *response.mutable_item()     = ToProto(item);
  *response.mutable_progress() = ToProto(item.id, breakdown);
  *response.mutable_event()    = ToProto(correction);
  return response;
}

RetireItemResponse ProgressManager::RetireItem(const RetireItemRequest& request) {
  RequireField(request.item_id(), "item_id");
  RequireField(request.actor(), "actor");

  auto tx   = repository_->Begin();
  auto item = RequireItem(*tx, request.item_id());
  if (!item.retired) {
    const auto before  = item;
    item.retired       = true;
    item.retire_reason = request.reason();
    item.updated_at_ms = util::NowMs();
    item.updated_by    = request.actor();
    db::ThrowIfError(repository_->UpdateItem(*tx, item), "retire item");

    ScheduleCache schedules(*registry_, *tx);
    RefreshItemRollups(*tx, &before, item, schedules);
    PROGRESS_LOG_INFO("item retired", {StringField("item_id", item.id), StringField("reason", request.reason()),
                                       StringField("actor", request.actor())});
  }
  tx->Commit();

  RetireItemResponse response;
  *response.mutable_item() = ToProto(item);
  return response;
}

ReplayItemResponse ProgressManager::ReplayItem(const std::string& item_id, bool apply) {
  RequireField(item_id, "item_id");

  auto          tx     = repository_->Begin();
  auto          item   = RequireItem(*tx, item_id);
  const auto    events = ItemEvents(*repository_, *tx, item);
  ScheduleCache schedules(*registry_, *tx);
  const auto&   schedule = schedules.For(item);

  const auto   replayed         = report::ReplayMilestones(events);
  const double replayed_percent = calc::PercentComplete(schedule, replayed);
  const bool   drift =
      replayed != item.milestones || std::fabs(replayed_percent - item.percent_complete) > report::kDriftTolerancePercent;

  ReplayItemResponse response;
  response.set_item_id(item.id);
  response.mutable_cached_milestones()->insert(item.milestones.begin(), item.milestones.end());
  response.mutable_replayed_milestones()->insert(replayed.begin(), replayed.end());
  response.set_cached_percent(item.percent_complete);
  response.set_replayed_percent(replayed_percent);
  response.set_event_count(events.size());
  response.set_drift(drift);

  // an item without history keeps its cached state
  if (apply && drift && !events.empty()) {
    item.milestones = replayed;
    Recompute(item, schedule, "replay");
    item.updated_at_ms = util::NowMs();
    db::ThrowIfError(repository_->UpdateItem(*tx, item), "apply replay");
    // the rows may have been built from the drifted figures
    if (options_.rollup_refresh == RollupRefresh::kEager) {
      WriteProjectRollups(*tx, item.project_id, schedules, nullptr);
    }
    response.set_applied(true);
  }
  tx->Commit();

  if (drift) {
    PROGRESS_LOG_WARN("cached milestones differ from event log",
                      {StringField("item_id", item.id), DoubleField("cached_percent", response.cached_percent()),
                       DoubleField("replayed_percent", replayed_percent), BoolField("applied", response.applied())});
  }
  return response;
}

void ProgressManager::UpsertDimension(const std::string& project_id, model::Dimension dimension, const std::string& id,
                                      const std::string& name) {
  RequireField(project_id, "project_id");
  RequireField(id, "id");

  db::model::DimensionRecord record;
  record.project_id    = project_id;
  record.dimension     = dimension;
  record.id            = id;
  record.name          = name.empty() ? id : name;
  record.updated_at_ms = util::NowMs();

  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->UpsertDimension(*tx, record), "upsert dimension");
  tx->Commit();
}

uint64_t ProgressManager::RecalculateItems(db::Transaction& tx, const model::ResolvedSchedule& schedule, const std::string& actor) {
  db::ItemFilter filter;
  filter.project_id = schedule.project_id;
  filter.item_type  = schedule.item_type;
  auto items        = repository_->ListItems(tx, filter);
  if (items.empty()) return 0;

  // the registry's cache still holds the committed schedule
  ScheduleCache schedules(*registry_, tx);
  schedules.Pin(schedule);

  const auto now = util::NowMs();
  for (auto& item : items) {
    Recompute(item, schedule, "recalculate");
    item.updated_at_ms = now;
    item.updated_by    = actor;
    db::ThrowIfError(repository_->UpdateItem(tx, item), "recalculate item");
  }

  if (options_.rollup_refresh == RollupRefresh::kEager) {
    WriteProjectRollups(tx, schedule.project_id, schedules, nullptr);
  }
  return items.size();
}

} // namespace progress::core

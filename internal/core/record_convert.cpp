#include "record_convert.hpp"

#include "internal/model/proto_convert.hpp"
#include "internal/util/time.hpp"

namespace progress::core {

namespace v1 = ::progress::engine::v1;

v1::Item ToProto(const db::model::ItemRecord& record) {
  v1::Item item;
  item.set_id(record.id);
  item.set_project_id(record.project_id);
  item.set_item_type(record.item_type);
  item.set_identity_key(record.identity_key);
  item.set_budgeted_hours(record.budgeted_hours);
  item.set_percent_complete(record.percent_complete);
  item.set_earned_hours(record.earned_hours);
  item.mutable_milestones()->insert(record.milestones.begin(), record.milestones.end());
  item.set_template_default_version(record.template_default_version);
  item.set_template_override_version(record.template_override_version);

  auto* dims = item.mutable_dimensions();
  dims->set_area_id(record.area_id);
  dims->set_system_id(record.system_id);
  dims->set_test_package_id(record.test_package_id);
  dims->set_drawing_id(record.drawing_id);
  dims->set_welder_id(record.welder_id);

  item.set_retired(record.retired);
  item.set_retire_reason(record.retire_reason);
  *item.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  *item.mutable_updated_at() = util::MillisToProto(record.updated_at_ms);
  item.set_updated_by(record.updated_by);
  return item;
}

v1::MilestoneEvent ToProto(const db::model::MilestoneEventRecord& record) {
  v1::MilestoneEvent event;
  event.set_seq(record.seq);
  event.set_event_id(record.event_id);
  event.set_project_id(record.project_id);
  event.set_item_id(record.item_id);
  event.set_milestone(record.milestone_name);
  event.set_previous_value(record.previous_value);
  event.set_new_value(record.new_value);
  event.set_actor(record.actor);
  *event.mutable_recorded_at() = util::MillisToProto(record.created_at_ms);
  event.set_kind(record.kind == db::model::EventKind::kCorrection ? v1::EVENT_KIND_CORRECTION : v1::EVENT_KIND_UPDATE);
  event.set_corrects_seq(record.corrects_seq);
  event.set_reason(record.reason);
  return event;
}

v1::TemplateChange ToProto(const db::model::TemplateChangeRecord& record) {
  v1::TemplateChange change;
  change.set_change_id(record.change_id);
  change.set_project_id(record.project_id);
  change.set_item_type(record.item_type);
  model::ToProto(model::DecodeEntries(record.old_entries_json), change.mutable_old_entries());
  model::ToProto(model::DecodeEntries(record.new_entries_json), change.mutable_new_entries());
  change.set_actor(record.actor);
  *change.mutable_changed_at() = util::MillisToProto(record.changed_at_ms);
  change.set_recalculated_items(record.recalculated_items);
  return change;
}

v1::RollupRow ToProto(const db::model::RollupRecord& record, const std::string& label) {
  v1::RollupRow row;
  row.set_dimension(model::ToProto(record.dimension));
  row.set_dimension_value(record.dimension_value);
  row.set_label(label);
  row.set_item_count(record.item_count);
  row.set_budgeted_hours(record.budgeted_hours);
  row.set_earned_hours(record.earned_hours);
  row.set_percent_complete(record.budgeted_hours > 0.0 ? record.earned_hours / record.budgeted_hours * 100.0 : 0.0);
  *row.mutable_category_budget() = model::ToProto(record.category_budget);
  *row.mutable_category_earned() = model::ToProto(record.category_earned);
  *row.mutable_refreshed_at()    = util::MillisToProto(record.refreshed_at_ms);
  return row;
}

v1::ItemProgress ToProto(const std::string& item_id, const calc::ProgressBreakdown& breakdown) {
  v1::ItemProgress progress;
  progress.set_item_id(item_id);
  progress.set_percent_complete(breakdown.percent_complete);
  progress.set_earned_hours(breakdown.earned_hours);
  progress.set_budgeted_hours(breakdown.budgeted_hours);
  *progress.mutable_category_earned() = model::ToProto(breakdown.category_earned);
  *progress.mutable_category_budget() = model::ToProto(breakdown.category_budget);
  for (const auto& name : breakdown.unknown_milestones) progress.add_unknown_milestones(name);
  return progress;
}

} // namespace progress::core

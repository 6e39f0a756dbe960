#include "pg_repository.hpp"

#include <limits>
#include <stdexcept>

#include "internal/util/json.hpp"

namespace progress::db::postgres {

namespace {

constexpr const char* kItemColumns =
    "id,project_id,item_type,identity_key,budgeted_hours,percent_complete,earned_hours,milestones::text,"
    "template_default_version,template_override_version,area_id,system_id,test_package_id,drawing_id,welder_id,"
    "retired,retire_reason,created_at_ms,updated_at_ms,updated_by";

constexpr const char* kEventColumns =
    "seq,event_id,project_id,item_id,milestone_name,previous_value,new_value,actor,created_at_ms,kind,"
    "COALESCE(corrects_seq,0),reason";

constexpr const char* kRollupColumns =
    "project_id,dimension,dimension_value,item_count,budgeted_hours,earned_hours,"
    "receive_budget,install_budget,punch_budget,test_budget,restore_budget,"
    "receive_earned,install_earned,punch_earned,test_earned,restore_earned,refreshed_at_ms";

std::string Text(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

const char* DimensionColumn(progress::model::Dimension dimension) {
  switch (dimension) {
    case progress::model::Dimension::kArea:
      return "area_id";
    case progress::model::Dimension::kSystem:
      return "system_id";
    case progress::model::Dimension::kTestPackage:
      return "test_package_id";
    case progress::model::Dimension::kWelder:
    default:
      return "welder_id";
  }
}

model::ItemRecord ReadItem(const pqxx::row& row) {
  model::ItemRecord r;
  r.id                        = Text(row[0]);
  r.project_id                = Text(row[1]);
  r.item_type                 = Text(row[2]);
  r.identity_key              = Text(row[3]);
  r.budgeted_hours            = row[4].as<double>();
  r.percent_complete          = row[5].as<double>();
  r.earned_hours              = row[6].as<double>();
  r.milestones                = util::DecodeMilestoneMap(Text(row[7]));
  r.template_default_version  = row[8].as<uint64_t>();
  r.template_override_version = row[9].as<uint64_t>();
  r.area_id                   = Text(row[10]);
  r.system_id                 = Text(row[11]);
  r.test_package_id           = Text(row[12]);
  r.drawing_id                = Text(row[13]);
  r.welder_id                 = Text(row[14]);
  r.retired                   = row[15].as<bool>();
  r.retire_reason             = Text(row[16]);
  r.created_at_ms             = row[17].as<uint64_t>();
  r.updated_at_ms             = row[18].as<uint64_t>();
  r.updated_by                = Text(row[19]);
  return r;
}

model::TemplateRecord ReadTemplate(const pqxx::row& row) {
  model::TemplateRecord r;
  r.project_id     = Text(row[0]);
  r.item_type      = Text(row[1]);
  r.milestone_name = Text(row[2]);
  r.weight         = row[3].as<double>();

  auto kind     = progress::model::ParseCompletionKind(Text(row[4]));
  auto category = progress::model::ParseCategory(Text(row[5]));
  if (!kind || !category) {
    throw std::runtime_error("corrupt template row for " + r.item_type + "/" + r.milestone_name);
  }
  r.kind          = *kind;
  r.category      = *category;
  r.sort_order    = row[6].as<int>();
  r.version       = row[7].as<uint64_t>();
  r.updated_at_ms = row[8].as<uint64_t>();
  r.updated_by    = Text(row[9]);
  return r;
}

model::MilestoneEventRecord ReadEvent(const pqxx::row& row) {
  model::MilestoneEventRecord r;
  r.seq            = row[0].as<uint64_t>();
  r.event_id       = Text(row[1]);
  r.project_id     = Text(row[2]);
  r.item_id        = Text(row[3]);
  r.milestone_name = Text(row[4]);
  r.previous_value = row[5].as<double>();
  r.new_value      = row[6].as<double>();
  r.actor          = Text(row[7]);
  r.created_at_ms  = row[8].as<uint64_t>();
  auto kind        = model::ParseEventKind(Text(row[9]));
  if (!kind) {
    throw std::runtime_error("corrupt event kind at seq " + std::to_string(r.seq));
  }
  r.kind         = *kind;
  r.corrects_seq = row[10].as<uint64_t>();
  r.reason       = Text(row[11]);
  return r;
}

model::RollupRecord ReadRollup(const pqxx::row& row) {
  model::RollupRecord r;
  r.project_id = Text(row[0]);
  auto dim     = progress::model::ParseDimension(Text(row[1]));
  if (!dim) {
    throw std::runtime_error("corrupt rollup dimension for project " + r.project_id);
  }
  r.dimension       = *dim;
  r.dimension_value = Text(row[2]);
  r.item_count      = row[3].as<uint64_t>();
  r.budgeted_hours  = row[4].as<double>();
  r.earned_hours    = row[5].as<double>();
  int col           = 6;
  for (auto category : progress::model::kAllCategories) r.category_budget[category] = row[col++].as<double>();
  for (auto category : progress::model::kAllCategories) r.category_earned[category] = row[col++].as<double>();
  r.refreshed_at_ms = row[col].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::transaction_rollback*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Items
// ------------------------------------------------------------------

Result PgRepository::InsertItem(Transaction& t, const model::ItemRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_item", r.id, r.project_id, r.item_type, r.identity_key, r.budgeted_hours, r.percent_complete,
                               r.earned_hours, util::EncodeMilestoneMap(r.milestones), r.template_default_version,
                               r.template_override_version, r.area_id, r.system_id, r.test_package_id, r.drawing_id, r.welder_id,
                               r.retired, r.retire_reason, r.created_at_ms, r.updated_at_ms, r.updated_by);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateItem(Transaction& t, const model::ItemRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_item", r.id, r.project_id, r.item_type, r.identity_key, r.budgeted_hours,
                                          r.percent_complete, r.earned_hours, util::EncodeMilestoneMap(r.milestones),
                                          r.template_default_version, r.template_override_version, r.area_id, r.system_id,
                                          r.test_package_id, r.drawing_id, r.welder_id, r.retired, r.retire_reason, r.created_at_ms,
                                          r.updated_at_ms, r.updated_by);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "item " + r.id + " not found");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ItemRecord> PgRepository::GetItem(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_item", id);
  if (res.empty()) return std::nullopt;
  return ReadItem(res[0]);
}

std::optional<model::ItemRecord> PgRepository::FindItemByKey(Transaction& t, const std::string& project_id, const std::string& item_type,
                                                             const std::string& identity_key) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kItemColumns + " FROM items WHERE project_id=$1 AND item_type=$2 AND identity_key=$3;", project_id,
      item_type, identity_key);
  if (res.empty()) return std::nullopt;
  return ReadItem(res[0]);
}

std::vector<model::ItemRecord> PgRepository::ListItems(Transaction& t, const ItemFilter& filter) {
  const char* column = DimensionColumn(filter.dimension.value_or(progress::model::Dimension::kArea));
  auto        sql    = std::string("SELECT ") + kItemColumns +
              " FROM items WHERE project_id=$1 AND ($2 = '' OR item_type=$2) AND ($3 OR NOT retired)"
              " AND (NOT $4 OR " + column + "=$5) ORDER BY id;";

  auto res = TX(t).Work().exec_params(sql, filter.project_id, filter.item_type, filter.include_retired, filter.dimension.has_value(),
                                      filter.dimension_value);

  std::vector<model::ItemRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadItem(row));
  return out;
}

std::vector<std::string> PgRepository::ListItemProjects(Transaction& t, const std::string& item_type) {
  auto res = TX(t).Work().exec_params("SELECT DISTINCT project_id FROM items WHERE item_type=$1 AND NOT retired ORDER BY project_id;",
                                      item_type);

  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(row[0].as<std::string>());
  return out;
}

// ------------------------------------------------------------------
// Milestone schedules
// ------------------------------------------------------------------

Result PgRepository::ReplaceTemplateRows(Transaction& t, const std::string& project_id, const std::string& item_type,
                                         const std::vector<model::TemplateRecord>& rows) {
  try {
    auto& work = TX(t).Work();
    work.exec_params("DELETE FROM milestone_templates WHERE COALESCE(project_id,'')=$1 AND item_type=$2;", project_id, item_type);
    for (const auto& row : rows) {
      work.exec_params(
          "INSERT INTO milestone_templates(project_id,item_type,milestone_name,weight,kind,category,sort_order,version,"
          "updated_at_ms,updated_by) VALUES(NULLIF($1,''),$2,$3,$4,$5,$6,$7,$8,$9,$10);",
          project_id, item_type, row.milestone_name, row.weight, std::string(progress::model::ToString(row.kind)),
          std::string(progress::model::ToString(row.category)), row.sort_order, row.version, row.updated_at_ms, row.updated_by);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TemplateRecord> PgRepository::ListTemplateRows(Transaction& t, const std::string& item_type) {
  auto res = TX(t).Work().exec_params(
      "SELECT COALESCE(project_id,''),item_type,milestone_name,weight,kind,category,sort_order,version,updated_at_ms,updated_by "
      "FROM milestone_templates WHERE ($1 = '' OR item_type=$1) ORDER BY item_type, COALESCE(project_id,''), sort_order;",
      item_type);

  std::vector<model::TemplateRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadTemplate(row));
  return out;
}

Result PgRepository::InsertTemplateChange(Transaction& t, const model::TemplateChangeRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO template_changes(change_id,project_id,item_type,old_entries,new_entries,actor,changed_at_ms,recalculated_items) "
        "VALUES($1,NULLIF($2,''),$3,$4::jsonb,$5::jsonb,$6,$7,$8);",
        r.change_id, r.project_id, r.item_type, r.old_entries_json, r.new_entries_json, r.actor, r.changed_at_ms, r.recalculated_items);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TemplateChangeRecord> PgRepository::ListTemplateChanges(Transaction& t, const std::string& project_id,
                                                                           const std::string& item_type) {
  auto res = TX(t).Work().exec_params(
      "SELECT change_id,COALESCE(project_id,''),item_type,old_entries::text,new_entries::text,actor,changed_at_ms,recalculated_items "
      "FROM template_changes WHERE COALESCE(project_id,'')=$1 AND ($2 = '' OR item_type=$2) ORDER BY seq DESC;",
      project_id, item_type);

  std::vector<model::TemplateChangeRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::TemplateChangeRecord r;
    r.change_id          = Text(row[0]);
    r.project_id         = Text(row[1]);
    r.item_type          = Text(row[2]);
    r.old_entries_json   = Text(row[3]);
    r.new_entries_json   = Text(row[4]);
    r.actor              = Text(row[5]);
    r.changed_at_ms      = row[6].as<uint64_t>();
    r.recalculated_items = row[7].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Milestone events
// ------------------------------------------------------------------

Result PgRepository::AppendMilestoneEvent(Transaction& t, model::MilestoneEventRecord& event) {
  try {
    auto res = TX(t).Work().exec_prepared("append_event", event.event_id, event.project_id, event.item_id, event.milestone_name,
                                          event.previous_value, event.new_value, event.actor, event.created_at_ms,
                                          std::string(model::ToString(event.kind)), event.corrects_seq, event.reason);
    event.seq = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MilestoneEventRecord> PgRepository::GetMilestoneEvent(Transaction& t, uint64_t seq) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kEventColumns + " FROM milestone_events WHERE seq=$1;", seq);
  if (res.empty()) return std::nullopt;
  return ReadEvent(res[0]);
}

std::vector<model::MilestoneEventRecord> PgRepository::ListMilestoneEvents(Transaction& t, const EventFilter& filter) {
  const uint64_t from  = filter.from_ms.value_or(0);
  const uint64_t until = filter.until_ms.value_or(static_cast<uint64_t>(std::numeric_limits<int64_t>::max()));

  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kEventColumns +
                                          " FROM milestone_events WHERE project_id=$1 AND ($2 = '' OR item_id=$2)"
                                          " AND created_at_ms>=$3 AND created_at_ms<$4 ORDER BY created_at_ms, seq;",
                                      filter.project_id, filter.item_id, from, until);

  std::vector<model::MilestoneEventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadEvent(row));
  return out;
}

// ------------------------------------------------------------------
// Rollups
// ------------------------------------------------------------------

Result PgRepository::UpsertRollup(Transaction& t, const model::RollupRecord& r) {
  using progress::model::Category;
  try {
    TX(t).Work().exec_params(
        std::string("INSERT INTO dimension_rollups(") + kRollupColumns +
            ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17) "
            "ON CONFLICT(project_id,dimension,dimension_value) DO UPDATE SET item_count=EXCLUDED.item_count,"
            "budgeted_hours=EXCLUDED.budgeted_hours,earned_hours=EXCLUDED.earned_hours,"
            "receive_budget=EXCLUDED.receive_budget,install_budget=EXCLUDED.install_budget,punch_budget=EXCLUDED.punch_budget,"
            "test_budget=EXCLUDED.test_budget,restore_budget=EXCLUDED.restore_budget,"
            "receive_earned=EXCLUDED.receive_earned,install_earned=EXCLUDED.install_earned,punch_earned=EXCLUDED.punch_earned,"
            "test_earned=EXCLUDED.test_earned,restore_earned=EXCLUDED.restore_earned,refreshed_at_ms=EXCLUDED.refreshed_at_ms;",
        r.project_id, std::string(progress::model::ToString(r.dimension)), r.dimension_value, r.item_count, r.budgeted_hours,
        r.earned_hours, r.category_budget[Category::kReceive], r.category_budget[Category::kInstall], r.category_budget[Category::kPunch],
        r.category_budget[Category::kTest], r.category_budget[Category::kRestore], r.category_earned[Category::kReceive],
        r.category_earned[Category::kInstall], r.category_earned[Category::kPunch], r.category_earned[Category::kTest],
        r.category_earned[Category::kRestore], r.refreshed_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RollupRecord> PgRepository::ListRollups(Transaction& t, const std::string& project_id,
                                                           progress::model::Dimension dimension) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRollupColumns +
                                          " FROM dimension_rollups WHERE project_id=$1 AND dimension=$2 ORDER BY dimension_value;",
                                      project_id, std::string(progress::model::ToString(dimension)));

  std::vector<model::RollupRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadRollup(row));
  return out;
}

std::optional<model::RollupRecord> PgRepository::GetRollup(Transaction& t, const std::string& project_id,
                                                           progress::model::Dimension dimension, const std::string& dimension_value) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRollupColumns +
                                          " FROM dimension_rollups WHERE project_id=$1 AND dimension=$2 AND dimension_value=$3;",
                                      project_id, std::string(progress::model::ToString(dimension)), dimension_value);
  if (res.empty()) return std::nullopt;
  return ReadRollup(res[0]);
}

Result PgRepository::DeleteRollups(Transaction& t, const std::string& project_id) {
  try {
    TX(t).Work().exec_params("DELETE FROM dimension_rollups WHERE project_id=$1;", project_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Dimensions
// ------------------------------------------------------------------

Result PgRepository::UpsertDimension(Transaction& t, const model::DimensionRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO dimensions(project_id,dimension,id,name,updated_at_ms) VALUES($1,$2,$3,$4,$5) "
        "ON CONFLICT(project_id,dimension,id) DO UPDATE SET name=EXCLUDED.name,updated_at_ms=EXCLUDED.updated_at_ms;",
        r.project_id, std::string(progress::model::ToString(r.dimension)), r.id, r.name, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::DimensionRecord> PgRepository::ListDimensions(Transaction& t, const std::string& project_id,
                                                                 progress::model::Dimension dimension) {
  auto res = TX(t).Work().exec_params(
      "SELECT project_id,id,name,updated_at_ms FROM dimensions WHERE project_id=$1 AND dimension=$2 ORDER BY id;", project_id,
      std::string(progress::model::ToString(dimension)));

  std::vector<model::DimensionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::DimensionRecord r;
    r.project_id    = Text(row[0]);
    r.dimension     = dimension;
    r.id            = Text(row[1]);
    r.name          = Text(row[2]);
    r.updated_at_ms = row[3].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace progress::db::postgres

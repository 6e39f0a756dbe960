#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/util/json.hpp"

namespace progress::db::sqlite {

using progress::db::ErrorCode;
using progress::db::Result;

namespace {

constexpr const char* kItemColumns =
    "id,project_id,item_type,identity_key,budgeted_hours,percent_complete,earned_hours,milestones,"
    "template_default_version,template_override_version,area_id,system_id,test_package_id,drawing_id,welder_id,"
    "retired,retire_reason,created_at_ms,updated_at_ms,updated_by";

constexpr const char* kEventColumns =
    "seq,event_id,project_id,item_id,milestone_name,previous_value,new_value,actor,created_at_ms,kind,"
    "COALESCE(corrects_seq,0),reason";

constexpr const char* kRollupColumns =
    "project_id,dimension,dimension_value,item_count,budgeted_hours,earned_hours,"
    "receive_budget,install_budget,punch_budget,test_budget,restore_budget,"
    "receive_earned,install_earned,punch_earned,test_earned,restore_earned,refreshed_at_ms";

// Prepared statement owned for the duration of one call.
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
      throw std::runtime_error("sqlite prepare: " + std::string(sqlite3_errmsg(db)));
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
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

// Binds every item column in kItemColumns order, starting at index 1.
void BindItem(sqlite3_stmt* st, const model::ItemRecord& r) {
  BindText(st, 1, r.id);
  BindText(st, 2, r.project_id);
  BindText(st, 3, r.item_type);
  BindText(st, 4, r.identity_key);
  BindDouble(st, 5, r.budgeted_hours);
  BindDouble(st, 6, r.percent_complete);
  BindDouble(st, 7, r.earned_hours);
  BindText(st, 8, util::EncodeMilestoneMap(r.milestones));
  BindU64(st, 9, r.template_default_version);
  BindU64(st, 10, r.template_override_version);
  BindText(st, 11, r.area_id);
  BindText(st, 12, r.system_id);
  BindText(st, 13, r.test_package_id);
  BindText(st, 14, r.drawing_id);
  BindText(st, 15, r.welder_id);
  BindI32(st, 16, r.retired ? 1 : 0);
  BindText(st, 17, r.retire_reason);
  BindU64(st, 18, r.created_at_ms);
  BindU64(st, 19, r.updated_at_ms);
  BindText(st, 20, r.updated_by);
}

model::ItemRecord ReadItem(sqlite3_stmt* st) {
  model::ItemRecord r;
  r.id                        = ColText(st, 0);
  r.project_id                = ColText(st, 1);
  r.item_type                 = ColText(st, 2);
  r.identity_key              = ColText(st, 3);
  r.budgeted_hours            = ColDouble(st, 4);
  r.percent_complete          = ColDouble(st, 5);
  r.earned_hours              = ColDouble(st, 6);
  r.milestones                = util::DecodeMilestoneMap(ColText(st, 7));
  r.template_default_version  = ColU64(st, 8);
  r.template_override_version = ColU64(st, 9);
  r.area_id                   = ColText(st, 10);
  r.system_id                 = ColText(st, 11);
  r.test_package_id           = ColText(st, 12);
  r.drawing_id                = ColText(st, 13);
  r.welder_id                 = ColText(st, 14);
  r.retired                   = ColI32(st, 15) != 0;
  r.retire_reason             = ColText(st, 16);
  r.created_at_ms             = ColU64(st, 17);
  r.updated_at_ms             = ColU64(st, 18);
  r.updated_by                = ColText(st, 19);
  return r;
}

model::TemplateRecord ReadTemplate(sqlite3_stmt* st) {
  model::TemplateRecord r;
  r.project_id     = ColText(st, 0);
  r.item_type      = ColText(st, 1);
  r.milestone_name = ColText(st, 2);
  r.weight         = ColDouble(st, 3);

  auto kind     = progress::model::ParseCompletionKind(ColText(st, 4));
  auto category = progress::model::ParseCategory(ColText(st, 5));
  if (!kind || !category) {
    throw std::runtime_error("corrupt template row for " + r.item_type + "/" + r.milestone_name);
  }
  r.kind          = *kind;
  r.category      = *category;
  r.sort_order    = ColI32(st, 6);
  r.version       = ColU64(st, 7);
  r.updated_at_ms = ColU64(st, 8);
  r.updated_by    = ColText(st, 9);
  return r;
}

model::MilestoneEventRecord ReadEvent(sqlite3_stmt* st) {
  model::MilestoneEventRecord r;
  r.seq            = ColU64(st, 0);
  r.event_id       = ColText(st, 1);
  r.project_id     = ColText(st, 2);
  r.item_id        = ColText(st, 3);
  r.milestone_name = ColText(st, 4);
  r.previous_value = ColDouble(st, 5);
  r.new_value      = ColDouble(st, 6);
  r.actor          = ColText(st, 7);
  r.created_at_ms  = ColU64(st, 8);
  auto kind        = model::ParseEventKind(ColText(st, 9));
  if (!kind) {
    throw std::runtime_error("corrupt event kind at seq " + std::to_string(r.seq));
  }
  r.kind         = *kind;
  r.corrects_seq = ColU64(st, 10);
  r.reason       = ColText(st, 11);
  return r;
}

model::RollupRecord ReadRollup(sqlite3_stmt* st) {
  model::RollupRecord r;
  r.project_id = ColText(st, 0);
  auto dim     = progress::model::ParseDimension(ColText(st, 1));
  if (!dim) {
    throw std::runtime_error("corrupt rollup dimension for project " + r.project_id);
  }
  r.dimension       = *dim;
  r.dimension_value = ColText(st, 2);
  r.item_count      = ColU64(st, 3);
  r.budgeted_hours  = ColDouble(st, 4);
  r.earned_hours    = ColDouble(st, 5);
  int col           = 6;
  for (auto category : progress::model::kAllCategories) r.category_budget[category] = ColDouble(st, col++);
  for (auto category : progress::model::kAllCategories) r.category_earned[category] = ColDouble(st, col++);
  r.refreshed_at_ms = ColU64(st, col);
  return r;
}

template <typename Record, typename Reader>
std::vector<Record> ReadAll(sqlite3* db, sqlite3_stmt* st, Reader read) {
  std::vector<Record> out;
  int                 rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(read(st));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error("sqlite step: " + std::string(sqlite3_errmsg(db)));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Items
// ------------------------------------------------------------------

Result SqliteRepository::InsertItem(Transaction& t, const model::ItemRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("INSERT INTO items(") + kItemColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  BindItem(st.get(), r);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpdateItem(Transaction& t, const model::ItemRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE items SET project_id=?2,item_type=?3,identity_key=?4,budgeted_hours=?5,percent_complete=?6,earned_hours=?7,"
               "milestones=?8,template_default_version=?9,template_override_version=?10,area_id=?11,system_id=?12,"
               "test_package_id=?13,drawing_id=?14,welder_id=?15,retired=?16,retire_reason=?17,created_at_ms=?18,"
               "updated_at_ms=?19,updated_by=?20 WHERE id=?1;");
  BindItem(st.get(), r);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "item " + r.id + " not found");
  }
  return result;
}

std::optional<model::ItemRecord> SqliteRepository::GetItem(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("SELECT ") + kItemColumns + " FROM items WHERE id=?;");
  BindText(st.get(), 1, id);

  auto rows = ReadAll<model::ItemRecord>(db, st.get(), ReadItem);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::optional<model::ItemRecord> SqliteRepository::FindItemByKey(Transaction& t, const std::string& project_id, const std::string& item_type,
                                                                 const std::string& identity_key) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("SELECT ") + kItemColumns + " FROM items WHERE project_id=? AND item_type=? AND identity_key=?;");
  BindText(st.get(), 1, project_id);
  BindText(st.get(), 2, item_type);
  BindText(st.get(), 3, identity_key);

  auto rows = ReadAll<model::ItemRecord>(db, st.get(), ReadItem);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::vector<model::ItemRecord> SqliteRepository::ListItems(Transaction& t, const ItemFilter& filter) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kItemColumns + " FROM items WHERE project_id=?";
  if (!filter.item_type.empty()) sql += " AND item_type=?";
  if (!filter.include_retired) sql += " AND retired=0";
  if (filter.dimension) sql += std::string(" AND ") + DimensionColumn(*filter.dimension) + "=?";
  sql += " ORDER BY id;";

  Statement st(db, sql);
  int       idx = 1;
  BindText(st.get(), idx++, filter.project_id);
  if (!filter.item_type.empty()) BindText(st.get(), idx++, filter.item_type);
  if (filter.dimension) BindText(st.get(), idx++, filter.dimension_value);

  return ReadAll<model::ItemRecord>(db, st.get(), ReadItem);
}

std::vector<std::string> SqliteRepository::ListItemProjects(Transaction& t, const std::string& item_type) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT DISTINCT project_id FROM items WHERE item_type=? AND retired=0 ORDER BY project_id;");
  BindText(st.get(), 1, item_type);

  return ReadAll<std::string>(db, st.get(), [](sqlite3_stmt* row) { return ColText(row, 0); });
}

// ------------------------------------------------------------------
// Milestone schedules
// ------------------------------------------------------------------

Result SqliteRepository::ReplaceTemplateRows(Transaction& t, const std::string& project_id, const std::string& item_type,
                                             const std::vector<model::TemplateRecord>& rows) {
  auto* db = TX(t).Handle();
  {
    Statement del(db, "DELETE FROM milestone_templates WHERE COALESCE(project_id,'')=? AND item_type=?;");
    BindText(del.get(), 1, project_id);
    BindText(del.get(), 2, item_type);
    auto result = Translate(db, sqlite3_step(del.get()));
    if (!result) return result;
  }

  for (const auto& row : rows) {
    Statement st(db,
                 "INSERT INTO milestone_templates(project_id,item_type,milestone_name,weight,kind,category,sort_order,version,"
                 "updated_at_ms,updated_by) VALUES(NULLIF(?,''),?,?,?,?,?,?,?,?,?);");
    BindText(st.get(), 1, project_id);
    BindText(st.get(), 2, item_type);
    BindText(st.get(), 3, row.milestone_name);
    BindDouble(st.get(), 4, row.weight);
    BindText(st.get(), 5, std::string(progress::model::ToString(row.kind)));
    BindText(st.get(), 6, std::string(progress::model::ToString(row.category)));
    BindI32(st.get(), 7, row.sort_order);
    BindU64(st.get(), 8, row.version);
    BindU64(st.get(), 9, row.updated_at_ms);
    BindText(st.get(), 10, row.updated_by);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;
  }
  return Result::Ok();
}

std::vector<model::TemplateRecord> SqliteRepository::ListTemplateRows(Transaction& t, const std::string& item_type) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string(
      "SELECT COALESCE(project_id,''),item_type,milestone_name,weight,kind,category,sort_order,version,updated_at_ms,updated_by "
      "FROM milestone_templates");
  if (!item_type.empty()) sql += " WHERE item_type=?";
  sql += " ORDER BY item_type, COALESCE(project_id,''), sort_order;";

  Statement st(db, sql);
  if (!item_type.empty()) BindText(st.get(), 1, item_type);
  return ReadAll<model::TemplateRecord>(db, st.get(), ReadTemplate);
}

Result SqliteRepository::InsertTemplateChange(Transaction& t, const model::TemplateChangeRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO template_changes(change_id,project_id,item_type,old_entries,new_entries,actor,changed_at_ms,"
               "recalculated_items) VALUES(?,NULLIF(?,''),?,?,?,?,?,?);");
  BindText(st.get(), 1, r.change_id);
  BindText(st.get(), 2, r.project_id);
  BindText(st.get(), 3, r.item_type);
  BindText(st.get(), 4, r.old_entries_json);
  BindText(st.get(), 5, r.new_entries_json);
  BindText(st.get(), 6, r.actor);
  BindU64(st.get(), 7, r.changed_at_ms);
  BindU64(st.get(), 8, r.recalculated_items);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::TemplateChangeRecord> SqliteRepository::ListTemplateChanges(Transaction& t, const std::string& project_id,
                                                                               const std::string& item_type) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string(
      "SELECT change_id,COALESCE(project_id,''),item_type,old_entries,new_entries,actor,changed_at_ms,recalculated_items "
      "FROM template_changes WHERE COALESCE(project_id,'')=?");
  if (!item_type.empty()) sql += " AND item_type=?";
  sql += " ORDER BY seq DESC;";

  Statement st(db, sql);
  BindText(st.get(), 1, project_id);
  if (!item_type.empty()) BindText(st.get(), 2, item_type);

  return ReadAll<model::TemplateChangeRecord>(db, st.get(), [](sqlite3_stmt* row) {
    model::TemplateChangeRecord r;
    r.change_id          = ColText(row, 0);
    r.project_id         = ColText(row, 1);
    r.item_type          = ColText(row, 2);
    r.old_entries_json   = ColText(row, 3);
    r.new_entries_json   = ColText(row, 4);
    r.actor              = ColText(row, 5);
    r.changed_at_ms      = ColU64(row, 6);
    r.recalculated_items = ColU64(row, 7);
    return r;
  });
}

// ------------------------------------------------------------------
// Milestone events
// ------------------------------------------------------------------

Result SqliteRepository::AppendMilestoneEvent(Transaction& t, model::MilestoneEventRecord& event) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO milestone_events(event_id,project_id,item_id,milestone_name,previous_value,new_value,actor,"
               "created_at_ms,kind,corrects_seq,reason) VALUES(?,?,?,?,?,?,?,?,?,NULLIF(?,0),?);");
  BindText(st.get(), 1, event.event_id);
  BindText(st.get(), 2, event.project_id);
  BindText(st.get(), 3, event.item_id);
  BindText(st.get(), 4, event.milestone_name);
  BindDouble(st.get(), 5, event.previous_value);
  BindDouble(st.get(), 6, event.new_value);
  BindText(st.get(), 7, event.actor);
  BindU64(st.get(), 8, event.created_at_ms);
  BindText(st.get(), 9, std::string(model::ToString(event.kind)));
  BindU64(st.get(), 10, event.corrects_seq);
  BindText(st.get(), 11, event.reason);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result) {
    event.seq = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  }
  return result;
}

std::optional<model::MilestoneEventRecord> SqliteRepository::GetMilestoneEvent(Transaction& t, uint64_t seq) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("SELECT ") + kEventColumns + " FROM milestone_events WHERE seq=?;");
  BindU64(st.get(), 1, seq);

  auto rows = ReadAll<model::MilestoneEventRecord>(db, st.get(), ReadEvent);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::vector<model::MilestoneEventRecord> SqliteRepository::ListMilestoneEvents(Transaction& t, const EventFilter& filter) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kEventColumns + " FROM milestone_events WHERE project_id=?";
  if (!filter.item_id.empty()) sql += " AND item_id=?";
  if (filter.from_ms) sql += " AND created_at_ms>=?";
  if (filter.until_ms) sql += " AND created_at_ms<?";
  sql += " ORDER BY created_at_ms, seq;";

  Statement st(db, sql);
  int       idx = 1;
  BindText(st.get(), idx++, filter.project_id);
  if (!filter.item_id.empty()) BindText(st.get(), idx++, filter.item_id);
  if (filter.from_ms) BindU64(st.get(), idx++, *filter.from_ms);
  if (filter.until_ms) BindU64(st.get(), idx++, *filter.until_ms);

  return ReadAll<model::MilestoneEventRecord>(db, st.get(), ReadEvent);
}

// ------------------------------------------------------------------
// Rollups
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRollup(Transaction& t, const model::RollupRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("INSERT OR REPLACE INTO dimension_rollups(") + kRollupColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.project_id);
  BindText(st.get(), 2, std::string(progress::model::ToString(r.dimension)));
  BindText(st.get(), 3, r.dimension_value);
  BindU64(st.get(), 4, r.item_count);
  BindDouble(st.get(), 5, r.budgeted_hours);
  BindDouble(st.get(), 6, r.earned_hours);
  int idx = 7;
  for (auto category : progress::model::kAllCategories) BindDouble(st.get(), idx++, r.category_budget[category]);
  for (auto category : progress::model::kAllCategories) BindDouble(st.get(), idx++, r.category_earned[category]);
  BindU64(st.get(), idx, r.refreshed_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::RollupRecord> SqliteRepository::ListRollups(Transaction& t, const std::string& project_id,
                                                               progress::model::Dimension dimension) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("SELECT ") + kRollupColumns + " FROM dimension_rollups WHERE project_id=? AND dimension=? ORDER BY dimension_value;");
  BindText(st.get(), 1, project_id);
  BindText(st.get(), 2, std::string(progress::model::ToString(dimension)));
  return ReadAll<model::RollupRecord>(db, st.get(), ReadRollup);
}

std::optional<model::RollupRecord> SqliteRepository::GetRollup(Transaction& t, const std::string& project_id,
                                                               progress::model::Dimension dimension, const std::string& dimension_value) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("SELECT ") + kRollupColumns +
                       " FROM dimension_rollups WHERE project_id=? AND dimension=? AND dimension_value=?;");
  BindText(st.get(), 1, project_id);
  BindText(st.get(), 2, std::string(progress::model::ToString(dimension)));
  BindText(st.get(), 3, dimension_value);

  auto rows = ReadAll<model::RollupRecord>(db, st.get(), ReadRollup);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

Result SqliteRepository::DeleteRollups(Transaction& t, const std::string& project_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM dimension_rollups WHERE project_id=?;");
  BindText(st.get(), 1, project_id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Dimensions
// ------------------------------------------------------------------

Result SqliteRepository::UpsertDimension(Transaction& t, const model::DimensionRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT OR REPLACE INTO dimensions(project_id,dimension,id,name,updated_at_ms) VALUES(?,?,?,?,?);");
  BindText(st.get(), 1, r.project_id);
  BindText(st.get(), 2, std::string(progress::model::ToString(r.dimension)));
  BindText(st.get(), 3, r.id);
  BindText(st.get(), 4, r.name);
  BindU64(st.get(), 5, r.updated_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::DimensionRecord> SqliteRepository::ListDimensions(Transaction& t, const std::string& project_id,
                                                                     progress::model::Dimension dimension) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT project_id,id,name,updated_at_ms FROM dimensions WHERE project_id=? AND dimension=? ORDER BY id;");
  BindText(st.get(), 1, project_id);
  BindText(st.get(), 2, std::string(progress::model::ToString(dimension)));

  return ReadAll<model::DimensionRecord>(db, st.get(), [dimension](sqlite3_stmt* row) {
    model::DimensionRecord r;
    r.project_id    = ColText(row, 0);
    r.dimension     = dimension;
    r.id            = ColText(row, 1);
    r.name          = ColText(row, 2);
    r.updated_at_ms = ColU64(row, 3);
    return r;
  });
}

} // namespace progress::db::sqlite

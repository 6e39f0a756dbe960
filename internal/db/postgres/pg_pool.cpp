#include "pg_pool.hpp"

namespace progress::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    std::lock_guard failed(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  constexpr const char* kItemColumns =
      "id,project_id,item_type,identity_key,budgeted_hours,percent_complete,earned_hours,milestones::text,"
      "template_default_version,template_override_version,area_id,system_id,test_package_id,drawing_id,welder_id,"
      "retired,retire_reason,created_at_ms,updated_at_ms,updated_by";

  conn.prepare("get_item", std::string("SELECT ") + kItemColumns + " FROM items WHERE id=$1");

  conn.prepare("insert_item",
               "INSERT INTO items(id,project_id,item_type,identity_key,budgeted_hours,percent_complete,earned_hours,milestones,"
               "template_default_version,template_override_version,area_id,system_id,test_package_id,drawing_id,welder_id,"
               "retired,retire_reason,created_at_ms,updated_at_ms,updated_by) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8::jsonb,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19,$20)");

  conn.prepare("update_item",
               "UPDATE items SET project_id=$2,item_type=$3,identity_key=$4,budgeted_hours=$5,percent_complete=$6,"
               "earned_hours=$7,milestones=$8::jsonb,template_default_version=$9,template_override_version=$10,"
               "area_id=$11,system_id=$12,test_package_id=$13,drawing_id=$14,welder_id=$15,retired=$16,"
               "retire_reason=$17,created_at_ms=$18,updated_at_ms=$19,updated_by=$20 WHERE id=$1");

  conn.prepare("append_event",
               "INSERT INTO milestone_events(event_id,project_id,item_id,milestone_name,previous_value,new_value,actor,"
               "created_at_ms,kind,corrects_seq,reason) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,NULLIF($10,0),$11) RETURNING seq");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (!conn->is_open()) {
      --live_connections_;
      delete conn;
    } else {
      idle_.emplace_back(conn);
    }
  }
  cv_.notify_one();
}

} // namespace progress::db::postgres

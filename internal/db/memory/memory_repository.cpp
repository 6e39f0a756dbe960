#include "memory_repository.hpp"

#include <algorithm>
#include <set>
#include <tuple>

#include "memory_tx.hpp"

namespace progress::db::memory {

namespace {

std::string RollupKey(const std::string& project_id, progress::model::Dimension dimension, const std::string& value) {
  return project_id + "#" + std::string(progress::model::ToString(dimension)) + "#" + value;
}

std::string DimensionKey(const std::string& project_id, progress::model::Dimension dimension, const std::string& id) {
  return project_id + "#" + std::string(progress::model::ToString(dimension)) + "#" + id;
}

bool MatchesFilter(const model::ItemRecord& item, const ItemFilter& filter) {
  if (item.project_id != filter.project_id) return false;
  if (!filter.item_type.empty() && item.item_type != filter.item_type) return false;
  if (!filter.include_retired && item.retired) return false;
  if (filter.dimension && model::DimensionValue(item, *filter.dimension) != filter.dimension_value) return false;
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Items
// ------------------------------------------------------------------

Result MemoryRepository::InsertItem(Transaction& t, const model::ItemRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.items.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "item " + r.id + " already exists");
  for (const auto& [_, existing] : s.items) {
    if (existing.project_id == r.project_id && existing.item_type == r.item_type && existing.identity_key == r.identity_key) {
      return Result::Err(ErrorCode::AlreadyExists, "item key " + r.identity_key + " already exists");
    }
  }
  s.items[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateItem(Transaction& t, const model::ItemRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.items.find(r.id);
  if (it == s.items.end()) return Result::Err(ErrorCode::NotFound, "item " + r.id + " not found");
  it->second = r;
  return Result::Ok();
}

std::optional<model::ItemRecord> MemoryRepository::GetItem(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.items.find(id);
  if (it == s.items.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ItemRecord> MemoryRepository::FindItemByKey(Transaction& t, const std::string& project_id, const std::string& item_type,
                                                                 const std::string& identity_key) {
  for (const auto& [_, item] : TX(t).View().items) {
    if (item.project_id == project_id && item.item_type == item_type && item.identity_key == identity_key) {
      return item;
    }
  }
  return std::nullopt;
}

std::vector<model::ItemRecord> MemoryRepository::ListItems(Transaction& t, const ItemFilter& filter) {
  std::vector<model::ItemRecord> out;
  for (const auto& [_, item] : TX(t).View().items) {
    if (MatchesFilter(item, filter)) out.push_back(item);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return out;
}

std::vector<std::string> MemoryRepository::ListItemProjects(Transaction& t, const std::string& item_type) {
  std::set<std::string> projects;
  for (const auto& [_, item] : TX(t).View().items) {
    if (!item.retired && item.item_type == item_type) projects.insert(item.project_id);
  }
  return {projects.begin(), projects.end()};
}

// ------------------------------------------------------------------
// Milestone schedules
// ------------------------------------------------------------------

Result MemoryRepository::ReplaceTemplateRows(Transaction& t, const std::string& project_id, const std::string& item_type,
                                             const std::vector<model::TemplateRecord>& rows) {
  auto& s = TX(t).Mutable();
  std::erase_if(s.templates, [&](const model::TemplateRecord& r) { return r.project_id == project_id && r.item_type == item_type; });
  for (auto row : rows) {
    row.project_id = project_id;
    row.item_type  = item_type;
    s.templates.push_back(std::move(row));
  }
  return Result::Ok();
}

std::vector<model::TemplateRecord> MemoryRepository::ListTemplateRows(Transaction& t, const std::string& item_type) {
  std::vector<model::TemplateRecord> out;
  for (const auto& row : TX(t).View().templates) {
    if (item_type.empty() || row.item_type == item_type) out.push_back(row);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return std::tie(a.item_type, a.project_id, a.sort_order) < std::tie(b.item_type, b.project_id, b.sort_order);
  });
  return out;
}

Result MemoryRepository::InsertTemplateChange(Transaction& t, const model::TemplateChangeRecord& r) {
  TX(t).Mutable().template_changes.push_back(r);
  return Result::Ok();
}

std::vector<model::TemplateChangeRecord> MemoryRepository::ListTemplateChanges(Transaction& t, const std::string& project_id,
                                                                               const std::string& item_type) {
  std::vector<model::TemplateChangeRecord> out;
  const auto&                              changes = TX(t).View().template_changes;
  for (auto it = changes.rbegin(); it != changes.rend(); ++it) {
    if (it->project_id != project_id) continue;
    if (!item_type.empty() && it->item_type != item_type) continue;
    out.push_back(*it);
  }
  return out;
}

// ------------------------------------------------------------------
// Milestone events
// ------------------------------------------------------------------

Result MemoryRepository::AppendMilestoneEvent(Transaction& t, model::MilestoneEventRecord& event) {
  auto& s   = TX(t).Mutable();
  event.seq = s.next_event_seq++;
  s.events.push_back(event);
  return Result::Ok();
}

std::optional<model::MilestoneEventRecord> MemoryRepository::GetMilestoneEvent(Transaction& t, uint64_t seq) {
  for (const auto& event : TX(t).View().events) {
    if (event.seq == seq) return event;
  }
  return std::nullopt;
}

std::vector<model::MilestoneEventRecord> MemoryRepository::ListMilestoneEvents(Transaction& t, const EventFilter& filter) {
  std::vector<model::MilestoneEventRecord> out;
  for (const auto& event : TX(t).View().events) {
    if (event.project_id != filter.project_id) continue;
    if (!filter.item_id.empty() && event.item_id != filter.item_id) continue;
    if (filter.from_ms && event.created_at_ms < *filter.from_ms) continue;
    if (filter.until_ms && event.created_at_ms >= *filter.until_ms) continue;
    out.push_back(event);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return std::tie(a.created_at_ms, a.seq) < std::tie(b.created_at_ms, b.seq);
  });
  return out;
}

// ------------------------------------------------------------------
// Rollups
// ------------------------------------------------------------------

Result MemoryRepository::UpsertRollup(Transaction& t, const model::RollupRecord& r) {
  TX(t).Mutable().rollups[RollupKey(r.project_id, r.dimension, r.dimension_value)] = r;
  return Result::Ok();
}

std::vector<model::RollupRecord> MemoryRepository::ListRollups(Transaction& t, const std::string& project_id,
                                                               progress::model::Dimension dimension) {
  std::vector<model::RollupRecord> out;
  for (const auto& [_, row] : TX(t).View().rollups) {
    if (row.project_id == project_id && row.dimension == dimension) out.push_back(row);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.dimension_value < b.dimension_value; });
  return out;
}

std::optional<model::RollupRecord> MemoryRepository::GetRollup(Transaction& t, const std::string& project_id,
                                                               progress::model::Dimension dimension, const std::string& dimension_value) {
  const auto& rollups = TX(t).View().rollups;
  auto        it      = rollups.find(RollupKey(project_id, dimension, dimension_value));
  if (it == rollups.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteRollups(Transaction& t, const std::string& project_id) {
  std::erase_if(TX(t).Mutable().rollups, [&](const auto& entry) { return entry.second.project_id == project_id; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Dimensions
// ------------------------------------------------------------------

Result MemoryRepository::UpsertDimension(Transaction& t, const model::DimensionRecord& r) {
  TX(t).Mutable().dimensions[DimensionKey(r.project_id, r.dimension, r.id)] = r;
  return Result::Ok();
}

std::vector<model::DimensionRecord> MemoryRepository::ListDimensions(Transaction& t, const std::string& project_id,
                                                                     progress::model::Dimension dimension) {
  std::vector<model::DimensionRecord> out;
  for (const auto& [_, row] : TX(t).View().dimensions) {
    if (row.project_id == project_id && row.dimension == dimension) out.push_back(row);
  }
  return out;
}

} // namespace progress::db::memory

#include "rollup_builder.hpp"

#include <cmath>
#include <map>

#include "internal/model/proto_convert.hpp"

namespace progress::report {

namespace {

void Accumulate(db::model::RollupRecord& row, const ItemContribution& contribution) {
  row.item_count += 1;
  row.budgeted_hours += contribution.progress.budgeted_hours;
  row.earned_hours += contribution.progress.earned_hours;
  row.category_budget += contribution.progress.category_budget;
  row.category_earned += contribution.progress.category_earned;
}

void Remove(db::model::RollupRecord& row, const ItemContribution& contribution) {
  if (row.item_count > 0) row.item_count -= 1;
  row.budgeted_hours -= contribution.progress.budgeted_hours;
  row.earned_hours -= contribution.progress.earned_hours;
  row.category_budget -= contribution.progress.category_budget;
  row.category_earned -= contribution.progress.category_earned;
}

db::model::RollupRecord EmptyRow(const std::string& project_id, model::Dimension dimension, const std::string& dimension_value,
                                 uint64_t refreshed_at_ms) {
  db::model::RollupRecord row;
  row.project_id      = project_id;
  row.dimension       = dimension;
  row.dimension_value = dimension_value;
  row.refreshed_at_ms = refreshed_at_ms;
  return row;
}

} // namespace

std::vector<db::model::RollupRecord> BuildRollups(const std::string& project_id, model::Dimension dimension,
                                                  const std::vector<ItemContribution>& items, uint64_t refreshed_at_ms) {
  std::map<std::string, db::model::RollupRecord> rows;
  for (const auto& contribution : items) {
    const auto& value = db::model::DimensionValue(*contribution.item, dimension);
    auto        it    = rows.find(value);
    if (it == rows.end()) {
      it = rows.emplace(value, EmptyRow(project_id, dimension, value, refreshed_at_ms)).first;
    }
    Accumulate(it->second, contribution);
  }

  std::vector<db::model::RollupRecord> out;
  out.reserve(rows.size());
  for (auto& [value, row] : rows) out.push_back(std::move(row));
  return out;
}

db::model::RollupRecord BuildRollupRow(const std::string& project_id, model::Dimension dimension, const std::string& dimension_value,
                                       const std::vector<ItemContribution>& items, uint64_t refreshed_at_ms) {
  auto row = EmptyRow(project_id, dimension, dimension_value, refreshed_at_ms);
  for (const auto& contribution : items) Accumulate(row, contribution);
  return row;
}

void ApplyItemChange(db::model::RollupRecord& row, const ItemContribution* before, const ItemContribution* after,
                     uint64_t refreshed_at_ms) {
  if (before) Remove(row, *before);
  if (after) Accumulate(row, *after);
  if (row.item_count == 0) {
    row = EmptyRow(row.project_id, row.dimension, row.dimension_value, refreshed_at_ms);
  }
  row.refreshed_at_ms = refreshed_at_ms;
}

std::vector<engine::v1::RollupDrift> CompareRollups(model::Dimension dimension, const std::vector<db::model::RollupRecord>& cached,
                                                    const std::vector<db::model::RollupRecord>& rebuilt, double tolerance_hours) {
  struct Pair {
    const db::model::RollupRecord* cached  = nullptr;
    const db::model::RollupRecord* rebuilt = nullptr;
  };
  std::map<std::string, Pair> by_value;
  for (const auto& row : cached) {
    // rows emptied by eager refresh carry nothing
    if (row.item_count > 0) by_value[row.dimension_value].cached = &row;
  }
  for (const auto& row : rebuilt) by_value[row.dimension_value].rebuilt = &row;

  std::vector<engine::v1::RollupDrift> drift;
  for (const auto& [value, pair] : by_value) {
    const double cached_budget  = pair.cached ? pair.cached->budgeted_hours : 0.0;
    const double cached_earned  = pair.cached ? pair.cached->earned_hours : 0.0;
    const double rebuilt_budget = pair.rebuilt ? pair.rebuilt->budgeted_hours : 0.0;
    const double rebuilt_earned = pair.rebuilt ? pair.rebuilt->earned_hours : 0.0;
    const bool   missing        = !pair.cached || !pair.rebuilt;

    if (!missing && std::fabs(cached_budget - rebuilt_budget) <= tolerance_hours && std::fabs(cached_earned - rebuilt_earned) <= tolerance_hours) {
      continue;
    }

    engine::v1::RollupDrift entry;
    entry.set_dimension(model::ToProto(dimension));
    entry.set_dimension_value(value);
    entry.set_cached_budgeted_hours(cached_budget);
    entry.set_rebuilt_budgeted_hours(rebuilt_budget);
    entry.set_cached_earned_hours(cached_earned);
    entry.set_rebuilt_earned_hours(rebuilt_earned);
    drift.push_back(std::move(entry));
  }
  return drift;
}

} // namespace progress::report

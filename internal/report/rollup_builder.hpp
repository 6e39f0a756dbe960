#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/calc/progress_calculator.hpp"
#include "internal/db/model/item_record.hpp"
#include "internal/db/model/rollup_record.hpp"
#include "internal/model/dimension.hpp"
#include "progress/engine/v1.hpp"

namespace progress::report {

struct ItemContribution {
  const db::model::ItemRecord* item = nullptr;
  calc::ProgressBreakdown      progress;
};

/*
  Rollup rows are a pure function of the items and their breakdowns.

  Each item counts once: its budget and total earned hours go to the row of
  its dimension value (empty = unassigned), its category hours to the same
  row's category columns.
*/
std::vector<db::model::RollupRecord> BuildRollups(const std::string& project_id, model::Dimension dimension,
                                                  const std::vector<ItemContribution>& items, uint64_t refreshed_at_ms);

// Row for a single dimension value, built from items that all carry that value.
db::model::RollupRecord BuildRollupRow(const std::string& project_id, model::Dimension dimension, const std::string& dimension_value,
                                       const std::vector<ItemContribution>& items, uint64_t refreshed_at_ms);

// Moves a cached row by one item's change: `before` leaves the row, `after`
// joins it. Either side may be null. A row left without items is zeroed.
void ApplyItemChange(db::model::RollupRecord& row, const ItemContribution* before, const ItemContribution* after,
                     uint64_t refreshed_at_ms);

// Rows whose budget or earned hours differ by more than tolerance_hours, including rows only one side has.
std::vector<engine::v1::RollupDrift> CompareRollups(model::Dimension dimension, const std::vector<db::model::RollupRecord>& cached,
                                                    const std::vector<db::model::RollupRecord>& rebuilt, double tolerance_hours);

} // namespace progress::report

#pragma once

#include <string>

#include "internal/calc/progress_calculator.hpp"
#include "internal/db/model/item_record.hpp"
#include "internal/db/model/milestone_event_record.hpp"
#include "internal/db/model/rollup_record.hpp"
#include "internal/db/model/template_change_record.hpp"
#include "progress/engine/v1.hpp"

namespace progress::core {

// Stored records to their wire messages.

engine::v1::Item           ToProto(const db::model::ItemRecord& record);
engine::v1::MilestoneEvent ToProto(const db::model::MilestoneEventRecord& record);
engine::v1::TemplateChange ToProto(const db::model::TemplateChangeRecord& record);
engine::v1::RollupRow      ToProto(const db::model::RollupRecord& record, const std::string& label);
engine::v1::ItemProgress   ToProto(const std::string& item_id, const calc::ProgressBreakdown& breakdown);

} // namespace progress::core

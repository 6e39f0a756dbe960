#pragma once

#include <optional>
#include <string>
#include <vector>

#include "category.hpp"
#include "dimension.hpp"
#include "milestone_value.hpp"
#include "progress/engine/v1.hpp"
#include "schedule.hpp"

namespace progress::model {

/*
  Conversions between the domain types and their wire messages.

  Unspecified wire enums come back as std::nullopt; callers decide whether
  that means "inherit" or "invalid".
*/

engine::v1::Category       ToProto(Category category);
std::optional<Category>    FromProto(engine::v1::Category category);
engine::v1::CompletionKind ToProto(CompletionKind kind);
std::optional<CompletionKind> FromProto(engine::v1::CompletionKind kind);
engine::v1::Dimension      ToProto(Dimension dimension);
std::optional<Dimension>   FromProto(engine::v1::Dimension dimension);

// Throws util::InvalidArgument for DIMENSION_UNSPECIFIED.
Dimension RequireDimension(engine::v1::Dimension dimension);

engine::v1::CategoryHours ToProto(const CategoryHours& hours);

engine::v1::MilestoneEntry ToProto(const MilestoneEntry& entry);
void ToProto(const std::vector<MilestoneEntry>& entries, google::protobuf::RepeatedPtrField<engine::v1::MilestoneEntry>* out);

// Full entry: kind and category must be set.
MilestoneEntry EntryFromProto(const engine::v1::MilestoneEntry& entry);

engine::v1::MilestoneSchedule ToProto(const ResolvedSchedule& schedule);

// Throws util::InvalidArgument when no value is set.
RawMilestoneValue RawValueFromProto(const engine::v1::MilestoneValue& value);

// Entry lists as stored in the template change log.
std::string                 EncodeEntries(const std::vector<MilestoneEntry>& entries);
std::vector<MilestoneEntry> DecodeEntries(const std::string& json);

} // namespace progress::model

#include "proto_convert.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace progress::model {

namespace v1 = ::progress::engine::v1;

v1::Category ToProto(Category category) {
  switch (category) {
    case Category::kReceive:
      return v1::CATEGORY_RECEIVE;
    case Category::kInstall:
      return v1::CATEGORY_INSTALL;
    case Category::kPunch:
      return v1::CATEGORY_PUNCH;
    case Category::kTest:
      return v1::CATEGORY_TEST;
    case Category::kRestore:
    default:
      return v1::CATEGORY_RESTORE;
  }
}

std::optional<Category> FromProto(v1::Category category) {
  switch (category) {
    case v1::CATEGORY_RECEIVE:
      return Category::kReceive;
    case v1::CATEGORY_INSTALL:
      return Category::kInstall;
    case v1::CATEGORY_PUNCH:
      return Category::kPunch;
    case v1::CATEGORY_TEST:
      return Category::kTest;
    case v1::CATEGORY_RESTORE:
      return Category::kRestore;
    default:
      return std::nullopt;
  }
}

v1::CompletionKind ToProto(CompletionKind kind) {
  return kind == CompletionKind::kPartial ? v1::COMPLETION_KIND_PARTIAL : v1::COMPLETION_KIND_DISCRETE;
}

std::optional<CompletionKind> FromProto(v1::CompletionKind kind) {
  switch (kind) {
    case v1::COMPLETION_KIND_DISCRETE:
      return CompletionKind::kDiscrete;
    case v1::COMPLETION_KIND_PARTIAL:
      return CompletionKind::kPartial;
    default:
      return std::nullopt;
  }
}

v1::Dimension ToProto(Dimension dimension) {
  switch (dimension) {
    case Dimension::kArea:
      return v1::DIMENSION_AREA;
    case Dimension::kSystem:
      return v1::DIMENSION_SYSTEM;
    case Dimension::kTestPackage:
      return v1::DIMENSION_TEST_PACKAGE;
    case Dimension::kWelder:
    default:
      return v1::DIMENSION_WELDER;
  }
}

std::optional<Dimension> FromProto(v1::Dimension dimension) {
  switch (dimension) {
    case v1::DIMENSION_AREA:
      return Dimension::kArea;
    case v1::DIMENSION_SYSTEM:
      return Dimension::kSystem;
    case v1::DIMENSION_TEST_PACKAGE:
      return Dimension::kTestPackage;
    case v1::DIMENSION_WELDER:
      return Dimension::kWelder;
    default:
      return std::nullopt;
  }
}

Dimension RequireDimension(v1::Dimension dimension) {
  auto parsed = FromProto(dimension);
  if (!parsed) {
    throw util::InvalidArgument("dimension is required");
  }
  return *parsed;
}

v1::CategoryHours ToProto(const CategoryHours& hours) {
  v1::CategoryHours out;
  out.set_receive(hours[Category::kReceive]);
  out.set_install(hours[Category::kInstall]);
  out.set_punch(hours[Category::kPunch]);
  out.set_test(hours[Category::kTest]);
  out.set_restore(hours[Category::kRestore]);
  return out;
}

v1::MilestoneEntry ToProto(const MilestoneEntry& entry) {
  v1::MilestoneEntry out;
  out.set_name(entry.name);
  out.set_weight(entry.weight);
  out.set_kind(ToProto(entry.kind));
  out.set_category(ToProto(entry.category));
  return out;
}

void ToProto(const std::vector<MilestoneEntry>& entries, google::protobuf::RepeatedPtrField<v1::MilestoneEntry>* out) {
  out->Clear();
  for (const auto& entry : entries) {
    *out->Add() = ToProto(entry);
  }
}

MilestoneEntry EntryFromProto(const v1::MilestoneEntry& entry) {
  auto kind     = FromProto(entry.kind());
  auto category = FromProto(entry.category());
  if (!kind || !category) {
    throw util::InvalidArgument("milestone '" + entry.name() + "' needs a completion kind and a category");
  }
  return MilestoneEntry{entry.name(), entry.weight(), *kind, *category};
}

v1::MilestoneSchedule ToProto(const ResolvedSchedule& schedule) {
  v1::MilestoneSchedule out;
  out.set_project_id(schedule.project_id);
  out.set_item_type(schedule.item_type);
  ToProto(schedule.entries, out.mutable_entries());
  out.set_default_version(schedule.default_version);
  out.set_override_version(schedule.override_version);
  return out;
}

RawMilestoneValue RawValueFromProto(const v1::MilestoneValue& value) {
  switch (value.value_case()) {
    case v1::MilestoneValue::kComplete:
      return value.complete();
    case v1::MilestoneValue::kNumber:
      return value.number();
    default:
      throw util::InvalidArgument("milestone value is required");
  }
}

std::string EncodeEntries(const std::vector<MilestoneEntry>& entries) {
  v1::MilestoneEntryList list;
  ToProto(entries, list.mutable_entries());

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(list, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode milestone entries: " + std::string(status.message()));
  }
  return json;
}

std::vector<MilestoneEntry> DecodeEntries(const std::string& json) {
  std::vector<MilestoneEntry> entries;
  if (json.empty()) {
    return entries;
  }

  v1::MilestoneEntryList list;
  auto                   status = google::protobuf::util::JsonStringToMessage(json, &list);
  if (!status.ok()) {
    throw std::runtime_error("corrupt milestone entries: " + std::string(status.message()));
  }
  for (const auto& entry : list.entries()) {
    entries.push_back(EntryFromProto(entry));
  }
  return entries;
}

} // namespace progress::model

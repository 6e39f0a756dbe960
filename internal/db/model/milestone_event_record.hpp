#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace progress::db::model {

enum class EventKind : std::uint8_t {
  kUpdate     = 0,
  kCorrection = 1,
};

constexpr std::string_view ToString(EventKind kind) {
  return kind == EventKind::kCorrection ? "correction" : "update";
}

inline std::optional<EventKind> ParseEventKind(std::string_view value) {
  if (value == "update") return EventKind::kUpdate;
  if (value == "correction") return EventKind::kCorrection;
  return std::nullopt;
}

/*
  Append-only milestone change. Never updated or deleted.
*/
struct MilestoneEventRecord {
  uint64_t    seq = 0; // assigned on append
  std::string event_id;
  std::string project_id;
  std::string item_id;
  std::string milestone_name;
  double      previous_value = 0.0;
  double      new_value      = 0.0;
  std::string actor;
  uint64_t    created_at_ms = 0;
  EventKind   kind          = EventKind::kUpdate;
  uint64_t    corrects_seq  = 0;
  std::string reason;
};

} // namespace progress::db::model

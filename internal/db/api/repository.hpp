#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/dimension_record.hpp"
#include "internal/db/model/item_record.hpp"
#include "internal/db/model/milestone_event_record.hpp"
#include "internal/db/model/rollup_record.hpp"
#include "internal/db/model/template_change_record.hpp"
#include "internal/db/model/template_record.hpp"

namespace progress::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - An event append and the item update written in the same
    transaction become visible together or not at all
  - Milestone events are append-only: there is no update or delete

  The DB is the source of truth for:
    items
    milestone schedules
    the milestone event log
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Items
  // ---------------------------------------------------------------------

  virtual Result InsertItem(Transaction&, const model::ItemRecord&) = 0;

  virtual Result UpdateItem(Transaction&, const model::ItemRecord&) = 0;

  virtual std::optional<model::ItemRecord> GetItem(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::ItemRecord> FindItemByKey(Transaction&, const std::string& project_id, const std::string& item_type,
                                                         const std::string& identity_key) = 0;

  virtual std::vector<model::ItemRecord> ListItems(Transaction&, const ItemFilter&) = 0;

  // Distinct projects holding at least one active item of the type, sorted.
  virtual std::vector<std::string> ListItemProjects(Transaction&, const std::string& item_type) = 0;

  // ---------------------------------------------------------------------
  // Milestone schedules
  // ---------------------------------------------------------------------

  // Replaces every row of (project_id, item_type); empty project_id = type default.
  virtual Result ReplaceTemplateRows(Transaction&, const std::string& project_id, const std::string& item_type,
                                     const std::vector<model::TemplateRecord>& rows) = 0;

  // Default and override rows of one type, or of every type when item_type is empty.
  // Ordered by (item_type, project_id, sort_order).
  virtual std::vector<model::TemplateRecord> ListTemplateRows(Transaction&, const std::string& item_type) = 0;

  virtual Result InsertTemplateChange(Transaction&, const model::TemplateChangeRecord&) = 0;

  // Newest first. Empty item_type lists every type of the project.
  virtual std::vector<model::TemplateChangeRecord> ListTemplateChanges(Transaction&, const std::string& project_id,
                                                                       const std::string& item_type) = 0;

  // ---------------------------------------------------------------------
  // Milestone event log (append-only)
  // ---------------------------------------------------------------------

  // Assigns event.seq.
  virtual Result AppendMilestoneEvent(Transaction&, model::MilestoneEventRecord& event) = 0;

  virtual std::optional<model::MilestoneEventRecord> GetMilestoneEvent(Transaction&, uint64_t seq) = 0;

  virtual std::vector<model::MilestoneEventRecord> ListMilestoneEvents(Transaction&, const EventFilter&) = 0;

  // ---------------------------------------------------------------------
  // Rollup cache (derived, rebuildable)
  // ---------------------------------------------------------------------

  virtual Result UpsertRollup(Transaction&, const model::RollupRecord&) = 0;

  virtual std::vector<model::RollupRecord> ListRollups(Transaction&, const std::string& project_id, progress::model::Dimension dimension) = 0;

  virtual std::optional<model::RollupRecord> GetRollup(Transaction&, const std::string& project_id, progress::model::Dimension dimension,
                                                       const std::string& dimension_value) = 0;

  virtual Result DeleteRollups(Transaction&, const std::string& project_id) = 0;

  // ---------------------------------------------------------------------
  // Dimension labels
  // ---------------------------------------------------------------------

  virtual Result UpsertDimension(Transaction&, const model::DimensionRecord&) = 0;

  virtual std::vector<model::DimensionRecord> ListDimensions(Transaction&, const std::string& project_id,
                                                             progress::model::Dimension dimension) = 0;
};

} // namespace progress::db

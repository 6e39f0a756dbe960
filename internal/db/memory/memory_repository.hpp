#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace progress::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                           InsertItem(Transaction&, const model::ItemRecord&) override;
  Result                           UpdateItem(Transaction&, const model::ItemRecord&) override;
  std::optional<model::ItemRecord> GetItem(Transaction&, const std::string& id) override;
  std::optional<model::ItemRecord> FindItemByKey(Transaction&, const std::string& project_id, const std::string& item_type,
                                                 const std::string& identity_key) override;
  std::vector<model::ItemRecord>   ListItems(Transaction&, const ItemFilter&) override;
  std::vector<std::string>         ListItemProjects(Transaction&, const std::string& item_type) override;

  Result ReplaceTemplateRows(Transaction&, const std::string& project_id, const std::string& item_type,
                             const std::vector<model::TemplateRecord>& rows) override;
  std::vector<model::TemplateRecord>       ListTemplateRows(Transaction&, const std::string& item_type) override;
  Result                                   InsertTemplateChange(Transaction&, const model::TemplateChangeRecord&) override;
  std::vector<model::TemplateChangeRecord> ListTemplateChanges(Transaction&, const std::string& project_id,
                                                               const std::string& item_type) override;

  Result                                     AppendMilestoneEvent(Transaction&, model::MilestoneEventRecord& event) override;
  std::optional<model::MilestoneEventRecord> GetMilestoneEvent(Transaction&, uint64_t seq) override;
  std::vector<model::MilestoneEventRecord>   ListMilestoneEvents(Transaction&, const EventFilter&) override;

  Result                           UpsertRollup(Transaction&, const model::RollupRecord&) override;
  std::vector<model::RollupRecord> ListRollups(Transaction&, const std::string& project_id, progress::model::Dimension dimension) override;
  std::optional<model::RollupRecord> GetRollup(Transaction&, const std::string& project_id, progress::model::Dimension dimension,
                                               const std::string& dimension_value) override;
  Result                           DeleteRollups(Transaction&, const std::string& project_id) override;

  Result                              UpsertDimension(Transaction&, const model::DimensionRecord&) override;
  std::vector<model::DimensionRecord> ListDimensions(Transaction&, const std::string& project_id,
                                                     progress::model::Dimension dimension) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ItemRecord> items;
    std::vector<model::TemplateRecord>                  templates;
    std::vector<model::TemplateChangeRecord>            template_changes;
    std::vector<model::MilestoneEventRecord>            events; // append order == seq order
    std::map<std::string, model::RollupRecord>          rollups;
    std::map<std::string, model::DimensionRecord>       dimensions;
    uint64_t                                            next_event_seq = 1;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace progress::db::memory

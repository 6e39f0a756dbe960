#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace progress::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace progress::db::postgres

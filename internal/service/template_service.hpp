#pragma once

#include "progress/engine/v1.hpp"
#include "service_context.hpp"

namespace progress::service {

class TemplateService {
 public:
  explicit TemplateService(ServiceContext ctx);

  engine::v1::ListItemTypesResponse         ListItemTypes(const engine::v1::ListItemTypesRequest& req);
  engine::v1::GetDefaultScheduleResponse    GetDefaultSchedule(const engine::v1::GetDefaultScheduleRequest& req);
  engine::v1::PutDefaultScheduleResponse    PutDefaultSchedule(const engine::v1::PutDefaultScheduleRequest& req);
  engine::v1::PutProjectOverridesResponse   PutProjectOverrides(const engine::v1::PutProjectOverridesRequest& req);
  engine::v1::ClearProjectOverridesResponse ClearProjectOverrides(const engine::v1::ClearProjectOverridesRequest& req);
  engine::v1::ListProjectOverridesResponse  ListProjectOverrides(const engine::v1::ListProjectOverridesRequest& req);
  engine::v1::ListTemplateChangesResponse   ListTemplateChanges(const engine::v1::ListTemplateChangesRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace progress::service

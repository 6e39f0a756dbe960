#pragma once

#include <string>
#include <vector>

#include "internal/model/schedule.hpp"

namespace progress::templates {

struct DefaultTemplate {
  std::string                        item_type;
  std::vector<model::MilestoneEntry> entries;
};

// Built-in schedules installed by TemplateRegistry::SeedDefaults.
const std::vector<DefaultTemplate>& DefaultTemplates();

} // namespace progress::templates

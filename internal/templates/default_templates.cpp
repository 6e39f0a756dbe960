#include "default_templates.hpp"

namespace progress::templates {

namespace {

using model::Category;
using model::CompletionKind;
using model::MilestoneEntry;

MilestoneEntry Discrete(std::string name, double weight, Category category) {
  return MilestoneEntry{std::move(name), weight, CompletionKind::kDiscrete, category};
}

MilestoneEntry Partial(std::string name, double weight, Category category) {
  return MilestoneEntry{std::move(name), weight, CompletionKind::kPartial, category};
}

// Receive / Install / Punch / Test / Restore, shared by most component types.
std::vector<MilestoneEntry> ComponentSchedule() {
  return {
      Discrete("Receive", 10, Category::kReceive), Discrete("Install", 60, Category::kInstall), Discrete("Punch", 10, Category::kPunch),
      Discrete("Test", 15, Category::kTest),       Discrete("Restore", 5, Category::kRestore),
  };
}

std::vector<DefaultTemplate> BuildDefaults() {
  std::vector<DefaultTemplate> out;

  out.push_back({"spool",
                 {
                     Discrete("Receive", 5, Category::kReceive),
                     Discrete("Erect", 40, Category::kInstall),
                     Discrete("Connect", 40, Category::kInstall),
                     Discrete("Punch", 5, Category::kPunch),
                     Discrete("Test", 5, Category::kTest),
                     Discrete("Restore", 5, Category::kRestore),
                 }});

  out.push_back({"field_weld",
                 {
                     Discrete("Fit-Up", 10, Category::kInstall),
                     Discrete("Weld Made", 60, Category::kInstall),
                     Discrete("Punch", 10, Category::kPunch),
                     Discrete("Test", 15, Category::kTest),
                     Discrete("Restore", 5, Category::kRestore),
                 }});

  for (const char* type : {"support", "valve", "fitting", "flange", "instrument", "tubing", "hose", "misc_component"}) {
    out.push_back({type, ComponentSchedule()});
  }

  out.push_back({"threaded_pipe",
                 {
                     Partial("Fabricate", 16, Category::kInstall),
                     Partial("Install", 16, Category::kInstall),
                     Partial("Erect", 16, Category::kInstall),
                     Partial("Connect", 16, Category::kInstall),
                     Partial("Support", 16, Category::kInstall),
                     Discrete("Punch", 5, Category::kPunch),
                     Discrete("Test", 10, Category::kTest),
                     Discrete("Restore", 5, Category::kRestore),
                 }});
  return out;
}

} // namespace

const std::vector<DefaultTemplate>& DefaultTemplates() {
  static const std::vector<DefaultTemplate> defaults = BuildDefaults();
  return defaults;
}

} // namespace progress::templates

#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/progress_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/progress_service.hpp"
#include "internal/service/template_service.hpp"
#include "internal/templates/template_registry.hpp"

namespace progress::factory {

/*
  RuntimeDependencies

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<templates::TemplateRegistry> registry;
  std::shared_ptr<core::ProgressManager>       manager;

  std::shared_ptr<service::ProgressService> progress_service;
  std::shared_ptr<service::TemplateService> template_service;
};

/*
  BuildRuntime

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
RuntimeDependencies BuildRuntime(const progress::runtime::config::RuntimeConfig& config);

// Same graph over a caller-supplied repository; the config's database section is ignored.
RuntimeDependencies BuildRuntime(const progress::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository);

} // namespace progress::factory

#pragma once

#include <memory>

namespace progress::core {
class ProgressManager;
}
namespace progress::templates {
class TemplateRegistry;
}
namespace progress::db {
class Repository;
}

namespace progress::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<progress::core::ProgressManager>       manager;
  std::shared_ptr<progress::templates::TemplateRegistry> registry;
  std::shared_ptr<progress::db::Repository>              repository;
};

} // namespace progress::service

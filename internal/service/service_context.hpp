#pragma once

#include <memory>

namespace osforge::db { class BuildStore; }
namespace osforge::scheduler { class BuildScheduler; }

namespace osforge::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<osforge::db::BuildStore>             store;
  std::shared_ptr<osforge::scheduler::BuildScheduler> scheduler;
};

} // namespace osforge::service

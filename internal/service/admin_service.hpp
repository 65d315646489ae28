#pragma once

#include "osforge/build/v1.hpp"
#include "service_context.hpp"

namespace osforge::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  osforge::build::v1::HealthResponse Health(const osforge::build::v1::HealthRequest& req);

  osforge::build::v1::StatsResponse Stats(const osforge::build::v1::StatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace osforge::service

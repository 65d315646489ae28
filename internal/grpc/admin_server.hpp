#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "osforge/build/v1.hpp"

namespace osforge::grpc {

class AdminServer final : public osforge::build::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<osforge::service::AdminService> svc);

  ::grpc::Status Health(::grpc::ServerContext*, const osforge::build::v1::HealthRequest*, osforge::build::v1::HealthResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*, const osforge::build::v1::StatsRequest*, osforge::build::v1::StatsResponse*) override;

 private:
  std::shared_ptr<osforge::service::AdminService> service_;
};

} // namespace osforge::grpc

#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/build_service.hpp"
#include "osforge/build/v1.hpp"

namespace osforge::grpc {

class BuildServer final : public osforge::build::v1::BuildService::Service {
 public:
  explicit BuildServer(std::shared_ptr<osforge::service::BuildService> svc);

  ::grpc::Status StartBuild(::grpc::ServerContext* ctx, const osforge::build::v1::StartBuildRequest* req,
                            osforge::build::v1::StartBuildResponse* resp) override;

  ::grpc::Status GetBuildStatus(::grpc::ServerContext* ctx, const osforge::build::v1::GetBuildStatusRequest* req,
                                osforge::build::v1::GetBuildStatusResponse* resp) override;

  ::grpc::Status GetBuildLogs(::grpc::ServerContext* ctx, const osforge::build::v1::GetBuildLogsRequest* req,
                              osforge::build::v1::GetBuildLogsResponse* resp) override;

 private:
  std::shared_ptr<osforge::service::BuildService> service_;
};

} // namespace osforge::grpc

#include "build_server.hpp"

#include "grpc_error.hpp"

namespace osforge::grpc {

using namespace osforge::build::v1;

BuildServer::BuildServer(std::shared_ptr<osforge::service::BuildService> svc) : service_(std::move(svc)) {
}

::grpc::Status BuildServer::StartBuild(::grpc::ServerContext*, const StartBuildRequest* req, StartBuildResponse* resp) {
  try {
    *resp = service_->StartBuild(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BuildServer::GetBuildStatus(::grpc::ServerContext*, const GetBuildStatusRequest* req, GetBuildStatusResponse* resp) {
  try {
    *resp = service_->GetBuildStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BuildServer::GetBuildLogs(::grpc::ServerContext*, const GetBuildLogsRequest* req, GetBuildLogsResponse* resp) {
  try {
    *resp = service_->GetBuildLogs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace osforge::grpc

#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace osforge::grpc {

using namespace osforge::build::v1;

AdminServer::AdminServer(std::shared_ptr<osforge::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Health(::grpc::ServerContext*, const HealthRequest* req, HealthResponse* resp) {
  try {
    *resp = service_->Health(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace osforge::grpc

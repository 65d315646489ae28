#include "client/cpp/build_client.h"

#include <grpcpp/client_context.h>

#include <cctype>

namespace osforge::client {

using namespace osforge::build::v1;

namespace {

arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  switch (status.error_code()) {
    case grpc::StatusCode::INVALID_ARGUMENT:
      return arrow::Status::Invalid(std::string(action), " rejected: ", status.error_message());
    case grpc::StatusCode::NOT_FOUND:
      return arrow::Status::KeyError(std::string(action), ": ", status.error_message());
    default:
      return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
  }
}

}  // namespace

BuildClient::BuildClient(std::shared_ptr<grpc::Channel> channel)
    : build_stub_(BuildService::NewStub(channel)), admin_stub_(AdminService::NewStub(std::move(channel))) {}

arrow::Status BuildClient::ValidateBuildId(std::string_view build_id) {
  if (build_id.size() != 36) {
    return arrow::Status::Invalid("build id must be a 36-character uuid, got ", build_id.size(), " characters");
  }
  for (size_t i = 0; i < build_id.size(); ++i) {
    const char c = build_id[i];
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (c != '-') {
        return arrow::Status::Invalid("build id has a misplaced separator: ", build_id);
      }
    } else if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return arrow::Status::Invalid("build id contains non-hex character: ", build_id);
    }
  }
  return arrow::Status::OK();
}

arrow::Status BuildClient::Health() const {
  HealthRequest  req;
  HealthResponse resp;
  grpc::ClientContext ctx;
  return GrpcToArrow(admin_stub_->Health(&ctx, req, &resp), "Health");
}

arrow::Status BuildClient::WaitUntilHealthy(int attempts, std::chrono::milliseconds delay) const {
  const bool healthy = client::WaitUntilHealthy(
      [this, delay] {
        HealthRequest  req;
        HealthResponse resp;
        grpc::ClientContext ctx;
        ApplyDeadline(&ctx, delay);
        return admin_stub_->Health(&ctx, req, &resp);
      },
      attempts, delay);
  if (!healthy) {
    return arrow::Status::IOError("server not healthy after ", attempts, " attempts");
  }
  return arrow::Status::OK();
}

arrow::Result<std::string> BuildClient::StartBuild(const std::string& spec_json) const {
  StartBuildRequest req;
  req.set_spec_json(spec_json);

  StartBuildResponse  resp;
  grpc::ClientContext ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(build_stub_->StartBuild(&ctx, req, &resp), "StartBuild"));
  return resp.build_id();
}

arrow::Result<std::string> BuildClient::StartBuild(const BuildSpecification& spec) const {
  StartBuildRequest req;
  *req.mutable_spec() = spec;

  StartBuildResponse  resp;
  grpc::ClientContext ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(build_stub_->StartBuild(&ctx, req, &resp), "StartBuild"));
  return resp.build_id();
}

arrow::Result<GetBuildStatusResponse> BuildClient::GetBuildStatus(const std::string& build_id) const {
  ARROW_RETURN_NOT_OK(ValidateBuildId(build_id));

  GetBuildStatusRequest req;
  req.set_build_id(build_id);

  GetBuildStatusResponse resp;
  grpc::ClientContext    ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(build_stub_->GetBuildStatus(&ctx, req, &resp), "GetBuildStatus"));
  return resp;
}

arrow::Result<GetBuildLogsResponse> BuildClient::GetBuildLogs(const std::string& build_id, uint64_t offset) const {
  ARROW_RETURN_NOT_OK(ValidateBuildId(build_id));

  GetBuildLogsRequest req;
  req.set_build_id(build_id);
  req.set_offset(offset);

  GetBuildLogsResponse resp;
  grpc::ClientContext  ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(build_stub_->GetBuildLogs(&ctx, req, &resp), "GetBuildLogs"));
  return resp;
}

arrow::Result<StatsResponse> BuildClient::Stats() const {
  StatsRequest  req;
  StatsResponse resp;
  grpc::ClientContext ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->Stats(&ctx, req, &resp), "Stats"));
  return resp;
}

arrow::Result<GetBuildStatusResponse> BuildClient::WaitForCompletion(const std::string& build_id, PollOptions options,
                                                                     StatusPoller::OnError on_error) const {
  ARROW_RETURN_NOT_OK(ValidateBuildId(build_id));

  StatusPoller poller(
      [this, &build_id](GetBuildStatusResponse* resp, std::chrono::milliseconds budget) {
        GetBuildStatusRequest req;
        req.set_build_id(build_id);
        grpc::ClientContext ctx;
        ApplyDeadline(&ctx, budget);
        return build_stub_->GetBuildStatus(&ctx, req, resp);
      },
      options);
  poller.SetOnError(std::move(on_error));

  auto outcome = poller.Run();
  if (!outcome.completed) {
    return arrow::Status::Invalid("build ", build_id, " did not finish within ", options.timeout.count(), "ms");
  }
  return outcome.last;
}

}  // namespace osforge::client

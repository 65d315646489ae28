#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "client/cpp/status_poller.h"
#include "osforge/build/v1.hpp"

namespace osforge::client {

/*
  Blocking client for BuildService and AdminService.

  gRPC failures come back as arrow::Status: INVALID_ARGUMENT as Invalid,
  NOT_FOUND as KeyError, anything else as IOError.
*/
class BuildClient {
 public:
  explicit BuildClient(std::shared_ptr<grpc::Channel> channel);

  arrow::Status Health() const;

  // Calls Health up to attempts times, delay apart; each call has a deadline of delay.
  arrow::Status WaitUntilHealthy(int attempts = 10, std::chrono::milliseconds delay = std::chrono::seconds(1)) const;

  arrow::Result<std::string> StartBuild(const std::string& spec_json) const;
  arrow::Result<std::string> StartBuild(const osforge::build::v1::BuildSpecification& spec) const;

  arrow::Result<osforge::build::v1::GetBuildStatusResponse> GetBuildStatus(const std::string& build_id) const;

  arrow::Result<osforge::build::v1::GetBuildLogsResponse> GetBuildLogs(const std::string& build_id, uint64_t offset = 0) const;

  arrow::Result<osforge::build::v1::StatsResponse> Stats() const;

  // Polls until terminal. Transient poll failures go to on_error; the
  // result is Invalid on timeout and carries the last status otherwise.
  arrow::Result<osforge::build::v1::GetBuildStatusResponse> WaitForCompletion(const std::string& build_id, PollOptions options = {},
                                                                             StatusPoller::OnError on_error = {}) const;

  static arrow::Status ValidateBuildId(std::string_view build_id);

 private:
  std::unique_ptr<osforge::build::v1::BuildService::Stub> build_stub_;
  std::unique_ptr<osforge::build::v1::AdminService::Stub> admin_stub_;
};

} // namespace osforge::client

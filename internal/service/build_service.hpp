#pragma once

#include "osforge/build/v1.hpp"
#include "service_context.hpp"

namespace osforge::service {

/*
  Submission and polling operations.

  Build ids must be canonical UUIDs (util::InvalidArgument otherwise);
  unknown ids raise util::NotFound. Every read returns the record as it is
  right now, possibly mid-build.
*/
class BuildService {
 public:
  explicit BuildService(ServiceContext ctx);

  osforge::build::v1::StartBuildResponse StartBuild(const osforge::build::v1::StartBuildRequest& req);

  osforge::build::v1::GetBuildStatusResponse GetBuildStatus(const osforge::build::v1::GetBuildStatusRequest& req);

  osforge::build::v1::GetBuildLogsResponse GetBuildLogs(const osforge::build::v1::GetBuildLogsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace osforge::service

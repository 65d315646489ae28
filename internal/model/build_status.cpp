#include "internal/model/build_status.hpp"

namespace osforge::model {

std::optional<BuildStatus> BuildStatusFromString(std::string_view text) {
  for (auto status : {BuildStatus::kPending, BuildStatus::kInProgress, BuildStatus::kSuccess, BuildStatus::kFailure}) {
    if (ToString(status) == text) {
      return status;
    }
  }
  return std::nullopt;
}

osforge::build::v1::BuildStatus ToProto(BuildStatus status) {
  switch (status) {
    case BuildStatus::kPending:
      return osforge::build::v1::PENDING;
    case BuildStatus::kInProgress:
      return osforge::build::v1::IN_PROGRESS;
    case BuildStatus::kSuccess:
      return osforge::build::v1::SUCCESS;
    case BuildStatus::kFailure:
      return osforge::build::v1::FAILURE;
  }
  return osforge::build::v1::BUILD_STATUS_UNSPECIFIED;
}

std::optional<ArtifactType> ArtifactTypeFromString(std::string_view text) {
  for (auto type : {ArtifactType::kIso, ArtifactType::kDockerImage, ArtifactType::kDockerImageRef}) {
    if (ToString(type) == text) {
      return type;
    }
  }
  return std::nullopt;
}

} // namespace osforge::model

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "osforge/build/v1.hpp"

namespace osforge::model {

enum class BuildStatus : std::uint8_t {
  kPending    = 1,
  kInProgress = 2,
  kSuccess    = 3,
  kFailure    = 4,
};

constexpr bool IsTerminal(BuildStatus status) {
  return status == BuildStatus::kSuccess || status == BuildStatus::kFailure;
}

/*
  Status only moves forward:

    PENDING -> IN_PROGRESS -> SUCCESS | FAILURE
    PENDING -> FAILURE        (task could not be started)

  Re-entering the current status is not a transition and is rejected.
*/
constexpr bool CanTransition(BuildStatus from, BuildStatus to) {
  if (IsTerminal(from) || from == to) {
    return false;
  }
  if (from == BuildStatus::kPending) {
    return to == BuildStatus::kInProgress || to == BuildStatus::kFailure;
  }
  return IsTerminal(to);
}

constexpr std::string_view ToString(BuildStatus status) {
  switch (status) {
    case BuildStatus::kPending:
      return "PENDING";
    case BuildStatus::kInProgress:
      return "IN_PROGRESS";
    case BuildStatus::kSuccess:
      return "SUCCESS";
    case BuildStatus::kFailure:
      return "FAILURE";
  }
  return "UNKNOWN";
}

std::optional<BuildStatus> BuildStatusFromString(std::string_view text);

osforge::build::v1::BuildStatus ToProto(BuildStatus status);

enum class ArtifactType : std::uint8_t {
  kIso,
  kDockerImage,
  kDockerImageRef,
};

constexpr std::string_view ToString(ArtifactType type) {
  switch (type) {
    case ArtifactType::kIso:
      return "iso";
    case ArtifactType::kDockerImage:
      return "docker-image";
    case ArtifactType::kDockerImageRef:
      return "docker-image-ref";
  }
  return "unknown";
}

std::optional<ArtifactType> ArtifactTypeFromString(std::string_view text);

} // namespace osforge::model

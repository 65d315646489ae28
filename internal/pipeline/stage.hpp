#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/pipeline/artifact_registry.hpp"
#include "internal/pipeline/build_log.hpp"
#include "internal/pipeline/toolchain.hpp"

namespace osforge::pipeline {

// Mutable per-build state handed from stage to stage.
struct StageContext {
  std::string                                   build_id;
  const osforge::build::v1::BuildSpecification& spec;
  std::filesystem::path                         workspace;
  BuildLog&                                     log;

  std::optional<ResolvedPackageSet> packages;
  std::optional<RootfsHandle>       rootfs;
  std::vector<StagedArtifact>       staged;
};

struct StageResult {
  bool                                   ok = true;
  std::vector<std::string>               log_lines;
  std::vector<db::model::ArtifactRecord> artifacts;
  std::string                            error;

  static StageResult Success(std::vector<std::string> lines = {}) {
    StageResult r;
    r.log_lines = std::move(lines);
    return r;
  }

  static StageResult Failure(std::string error, std::vector<std::string> lines = {}) {
    StageResult r;
    r.ok        = false;
    r.error     = std::move(error);
    r.log_lines = std::move(lines);
    return r;
  }
};

/*
  One unit of pipeline work.

  Run reports expected failures through StageResult; an exception escaping
  Run is treated by the executor as a failure of this stage.
*/
class Stage {
 public:
  virtual ~Stage() = default;

  virtual std::string_view Name() const              = 0;
  virtual StageResult      Run(StageContext& context) = 0;
};

} // namespace osforge::pipeline

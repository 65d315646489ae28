#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/build_store.hpp"
#include "internal/pipeline/artifact_registry.hpp"
#include "internal/pipeline/stage.hpp"

namespace osforge::pipeline {

struct ExecutorOptions {
  std::filesystem::path workspace_root = std::filesystem::temp_directory_path() / "osforge" / "workspaces";
  bool                  keep_workspace = false;
};

/*
  Drives one build from PENDING to a terminal status.

  Stages run strictly in order; the first failure stops the pipeline and no
  later stage runs. Only artifacts returned by successful stages are
  registered. After the last stage the completeness invariant is checked:
  at least one iso and at least one docker-image or docker-image-ref.

  Run never throws for a stage or tool failure; every path ends with the
  build in SUCCESS or FAILURE.
*/
class PipelineExecutor {
 public:
  PipelineExecutor(std::shared_ptr<db::BuildStore> store, std::vector<std::shared_ptr<Stage>> stages, ExecutorOptions options = {});

  osforge::model::BuildStatus Run(const std::string& build_id);

  std::size_t StageCount() const {
    return stages_.size();
  }

 private:
  osforge::model::BuildStatus RunStages(const std::string& build_id, const osforge::build::v1::BuildSpecification& spec, BuildLog& log);

  void CleanupWorkspace(const std::filesystem::path& workspace, BuildLog& log) const;

  std::shared_ptr<db::BuildStore>     store_;
  std::vector<std::shared_ptr<Stage>> stages_;
  ExecutorOptions                     options_;
};

} // namespace osforge::pipeline

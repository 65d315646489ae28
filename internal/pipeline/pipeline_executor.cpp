#include "internal/pipeline/pipeline_executor.hpp"

#include <chrono>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace osforge::pipeline {

namespace fs = std::filesystem;

using osforge::model::BuildStatus;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
}

std::string FormatMs(double ms) {
  return std::to_string(static_cast<std::int64_t>(ms)) + "ms";
}

} // namespace

PipelineExecutor::PipelineExecutor(std::shared_ptr<db::BuildStore> store, std::vector<std::shared_ptr<Stage>> stages, ExecutorOptions options)
    : store_(std::move(store)), stages_(std::move(stages)), options_(std::move(options)) {
}

BuildStatus PipelineExecutor::Run(const std::string& build_id) {
  observability::SpanScope span("osforge.pipeline.run");
  span.SetAttribute("build.id", build_id);

  auto record = store_->Get(build_id);
  if (!record) {
    throw util::NotFound("build not found: " + build_id);
  }

  BuildLog log(*store_, build_id);
  OSFORGE_LOG_INFO("build started", {observability::StringField("build_id", build_id), observability::StringField("base", record->spec.base())});

  BuildStatus outcome = BuildStatus::kFailure;
  try {
    outcome = RunStages(build_id, record->spec, log);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    OSFORGE_LOG_ERROR("pipeline aborted", {observability::StringField("build_id", build_id), observability::StringField("error", e.what())});
    log.Append(std::string("pipeline aborted: ") + e.what());
    outcome = BuildStatus::kFailure;
  }

  log.Append(outcome == BuildStatus::kSuccess ? "build succeeded" : "build failed");
  store_->SetStatus(build_id, outcome);

  span.SetAttribute("build.status", osforge::model::ToString(outcome));
  observability::Metrics::Instance().RecordBuildOutcome(osforge::model::ToString(outcome));
  OSFORGE_LOG_INFO("build finished",
                   {observability::StringField("build_id", build_id), observability::StringField("status", osforge::model::ToString(outcome))});
  return outcome;
}

BuildStatus PipelineExecutor::RunStages(const std::string& build_id, const osforge::build::v1::BuildSpecification& spec, BuildLog& log) {
  const auto workspace = options_.workspace_root / build_id;

  std::error_code ec;
  fs::create_directories(workspace, ec);
  if (ec) {
    log.Append("workspace setup failed: " + workspace.string() + ": " + ec.message());
    return BuildStatus::kFailure;
  }
  log.Append("workspace created: " + workspace.string());

  // IN_PROGRESS marks the start of stage 1; a workspace failure goes straight
  // from PENDING to FAILURE.
  store_->SetStatus(build_id, BuildStatus::kInProgress);

  StageContext ctx{build_id, spec, workspace, log, std::nullopt, std::nullopt, {}};

  std::vector<db::model::ArtifactRecord> registered;
  bool                                   failed = false;
  const auto                             total  = stages_.size();

  for (std::size_t i = 0; i < total && !failed; ++i) {
    auto&      stage = *stages_[i];
    const auto name  = std::string(stage.Name());
    const auto label = "Stage " + std::to_string(i + 1) + "/" + std::to_string(total) + " " + name;

    observability::SpanScope span("osforge.pipeline.stage");
    span.SetAttribute("stage", name);
    log.Append(label + ": started");

    const auto  started = std::chrono::steady_clock::now();
    StageResult result;
    try {
      result = stage.Run(ctx);
    } catch (const std::exception& e) {
      result = StageResult::Failure(e.what());
    }
    const auto elapsed = ElapsedMs(started);

    for (const auto& line : result.log_lines) {
      log.Append(line);
    }
    observability::Metrics::Instance().ObserveStageDurationMs(name, result.ok, elapsed);

    if (!result.ok) {
      span.RecordException(result.error);
      log.Append("stage " + name + " failed: " + result.error);
      failed = true;
      break;
    }

    for (const auto& artifact : result.artifacts) {
      store_->AddArtifact(build_id, artifact);
      registered.push_back(artifact);
    }
    log.Append(label + ": completed in " + FormatMs(elapsed));
  }

  if (!failed) {
    auto missing = ArtifactRegistry::MissingRequiredTypes(registered);
    for (const auto& type : missing) {
      log.Append("artifact completeness check failed: missing " + type);
    }
    failed = !missing.empty();
  }

  CleanupWorkspace(workspace, log);
  return failed ? BuildStatus::kFailure : BuildStatus::kSuccess;
}

void PipelineExecutor::CleanupWorkspace(const fs::path& workspace, BuildLog& log) const {
  if (options_.keep_workspace) {
    log.Append("workspace kept: " + workspace.string());
    return;
  }

  std::error_code ec;
  fs::remove_all(workspace, ec);
  if (ec) {
    log.Append("workspace cleanup failed: " + ec.message());
    return;
  }
  log.Append("workspace removed: " + workspace.string());
}

} // namespace osforge::pipeline

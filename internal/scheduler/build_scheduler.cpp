#include "internal/scheduler/build_scheduler.hpp"

#include <system_error>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/validation/spec_validator.hpp"

namespace osforge::scheduler {

using osforge::model::BuildStatus;
using observability::StringField;

namespace {

bool IsReady(const std::shared_future<BuildStatus>& future) {
  return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // namespace

BuildScheduler::BuildScheduler(std::shared_ptr<db::BuildStore> store, std::shared_ptr<pipeline::PipelineExecutor> executor)
    : store_(std::move(store)), executor_(std::move(executor)) {
}

BuildScheduler::~BuildScheduler() {
  Shutdown();
}

std::string BuildScheduler::Submit(std::string_view spec_json) {
  return Launch(validation::SpecValidator::Validate(spec_json));
}

std::string BuildScheduler::Submit(const osforge::build::v1::BuildSpecification& spec) {
  return Launch(validation::SpecValidator::Validate(spec));
}

std::string BuildScheduler::Launch(const osforge::build::v1::BuildSpecification& validated) {
  std::lock_guard lock(mutex_);
  if (shutting_down_) {
    throw util::InvalidState("scheduler is shutting down");
  }

  auto build_id = store_->Create(validated);

  std::shared_future<BuildStatus> task;
  try {
    task = std::async(std::launch::async,
                      [executor = executor_, store = store_, build_id]() -> BuildStatus {
                        try {
                          return executor->Run(build_id);
                        } catch (const std::exception& e) {
                          OSFORGE_LOG_ERROR("build task failed", {StringField("build_id", build_id), StringField("error", e.what())});
                          auto record = store->Get(build_id);
                          return record ? record->status : BuildStatus::kFailure;
                        }
                      })
               .share();
  } catch (const std::system_error& e) {
    OSFORGE_LOG_ERROR("build task could not be started", {StringField("build_id", build_id), StringField("error", e.what())});
    store_->AppendLog(build_id, std::string("build could not be started: ") + e.what());
    store_->SetStatus(build_id, BuildStatus::kFailure);
    throw util::ResourceExhausted("build task could not be started");
  }

  tasks_.emplace(build_id, std::move(task));
  PruneLocked();

  OSFORGE_LOG_INFO("build submitted", {StringField("build_id", build_id), StringField("base", validated.base()),
                                       StringField("architecture", validated.architecture())});
  return build_id;
}

std::optional<BuildStatus> BuildScheduler::Wait(const std::string& build_id, std::chrono::milliseconds timeout) {
  std::shared_future<BuildStatus> task;
  {
    std::lock_guard lock(mutex_);
    auto            it = tasks_.find(build_id);
    if (it != tasks_.end()) {
      task = it->second;
    }
  }

  if (!task.valid()) {
    auto record = store_->Get(build_id);
    if (!record) {
      throw util::NotFound("build not found: " + build_id);
    }
    if (osforge::model::IsTerminal(record->status)) {
      return record->status;
    }
    return std::nullopt;
  }

  if (task.wait_for(timeout) != std::future_status::ready) {
    return std::nullopt;
  }
  return task.get();
}

void BuildScheduler::Shutdown() {
  std::vector<std::shared_future<BuildStatus>> pending;
  {
    std::lock_guard lock(mutex_);
    shutting_down_ = true;
    for (const auto& [_, task] : tasks_) {
      pending.push_back(task);
    }
  }

  for (auto& task : pending) {
    task.wait();
  }

  std::lock_guard lock(mutex_);
  PruneLocked();
}

std::size_t BuildScheduler::InFlight() const {
  std::lock_guard lock(mutex_);
  std::size_t     count = 0;
  for (const auto& [_, task] : tasks_) {
    if (!IsReady(task)) {
      ++count;
    }
  }
  return count;
}

void BuildScheduler::PruneLocked() {
  std::int64_t running = 0;
  for (auto it = tasks_.begin(); it != tasks_.end();) {
    if (IsReady(it->second)) {
      it = tasks_.erase(it);
    } else {
      ++running;
      ++it;
    }
  }
  observability::Metrics::Instance().SetBuildsInFlight(running);
}

} // namespace osforge::scheduler

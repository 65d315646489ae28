#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_build_store.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/build_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/artifact_registry.hpp"
#include "internal/pipeline/command_tools.hpp"
#include "internal/pipeline/pipeline_executor.hpp"
#include "internal/pipeline/stages.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/build_service.hpp"
#include "internal/service/service_context.hpp"
#if OSFORGE_DB_SQLITE
#include "internal/db/sqlite/sqlite_build_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#endif

namespace osforge::factory {

namespace {

constexpr const char* kDefaultArtifactRoot = "artifacts";

pipeline::ExecutorOptions ExecutorOptionsFrom(const osforge::runtime::config::PipelineConfig& config) {
  pipeline::ExecutorOptions options;
  if (!config.workspace_root().empty()) {
    options.workspace_root = config.workspace_root();
  }
  options.keep_workspace = config.keep_workspace();
  return options;
}

} // namespace

std::shared_ptr<db::BuildStore> MakeBuildStore(const osforge::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if OSFORGE_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    OSFORGE_LOG_INFO("using sqlite build store", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteBuildStore>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  OSFORGE_LOG_INFO("using in-memory build store");
  return std::make_shared<db::memory::MemoryBuildStore>();
}

/*
    Build full application dependency graph
*/
Application Build(const osforge::runtime::config::RuntimeConfig& config, const pipeline::Toolchain& toolchain) {
  Application app;

  // ------------------------------------------------------------------
  // Store + pipeline
  // ------------------------------------------------------------------
  app.store = MakeBuildStore(config);

  const auto& pipeline_config = config.pipeline();
  const auto  artifact_root   = pipeline_config.artifact_root().empty() ? std::string(kDefaultArtifactRoot) : pipeline_config.artifact_root();

  auto registry = std::make_shared<pipeline::ArtifactRegistry>(artifact_root);
  auto stages   = pipeline::MakeDefaultStages(toolchain, registry, pipeline_config.registry_url());
  auto executor = std::make_shared<pipeline::PipelineExecutor>(app.store, std::move(stages), ExecutorOptionsFrom(pipeline_config));

  app.scheduler = std::make_shared<scheduler::BuildScheduler>(app.store, executor);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store     = app.store;
  ctx.scheduler = app.scheduler;

  auto build_service = std::make_shared<service::BuildService>(ctx);
  auto admin_service = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::BuildServer>(build_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

Application Build(const osforge::runtime::config::RuntimeConfig& config) {
  return Build(config, pipeline::MakeCommandToolchain(config.toolchain()));
}

} // namespace osforge::factory

#include "client/cpp/build_client.h"

#include <grpcpp/create_channel.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/security/credentials.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "fake_toolchain.hpp"
#include "internal/db/memory/memory_build_store.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/build_server.hpp"
#include "internal/pipeline/stages.hpp"
#include "internal/scheduler/build_scheduler.hpp"
#include "internal/service/service_context.hpp"

namespace {

using namespace std::chrono_literals;

using osforge::client::BuildClient;

void TestValidateBuildId() {
  assert(BuildClient::ValidateBuildId("00112233-4455-4677-8899-aabbccddeeff").ok());
  assert(BuildClient::ValidateBuildId("00112233-4455-4677-8899-aabbccddeefg").IsInvalid());
  assert(BuildClient::ValidateBuildId("00112233445546778899aabbccddeeff").IsInvalid());
  assert(BuildClient::ValidateBuildId("").IsInvalid());
}

void TestRpcHelpersRejectInvalidIdBeforeGrpcCall() {
  auto        channel = grpc::CreateChannel("dns:///127.0.0.1:1", grpc::InsecureChannelCredentials());
  BuildClient client(channel);

  const auto status = client.GetBuildStatus("../../etc");
  assert(!status.ok());
  assert(status.status().IsInvalid());

  const auto logs = client.GetBuildLogs("short");
  assert(!logs.ok());
  assert(logs.status().IsInvalid());
}

void TestUnreachableServerIsIOError() {
  auto        channel = grpc::CreateChannel("dns:///127.0.0.1:1", grpc::InsecureChannelCredentials());
  BuildClient client(channel);

  const auto health = client.Health();
  assert(health.IsIOError());
}

// Serves the real services over a loopback port with fake image tooling.
void TestEndToEndAgainstInProcessServer() {
  osforge::testing::FakeToolchain tools;
  const auto                      root = osforge::testing::FreshDir("osforge_build_client_tests", "e2e");

  osforge::service::ServiceContext ctx;
  ctx.store     = std::make_shared<osforge::db::memory::MemoryBuildStore>();
  auto registry = std::make_shared<osforge::pipeline::ArtifactRegistry>(root / "artifacts");
  osforge::pipeline::ExecutorOptions options;
  options.workspace_root = root / "workspaces";
  auto executor = std::make_shared<osforge::pipeline::PipelineExecutor>(ctx.store, osforge::pipeline::MakeDefaultStages(tools.Get(), registry, ""),
                                                                        options);
  ctx.scheduler = std::make_shared<osforge::scheduler::BuildScheduler>(ctx.store, executor);

  osforge::grpc::BuildServer build_server(std::make_shared<osforge::service::BuildService>(ctx));
  osforge::grpc::AdminServer admin_server(std::make_shared<osforge::service::AdminService>(ctx));

  int                 port = 0;
  ::grpc::ServerBuilder builder;
  builder.AddListeningPort("127.0.0.1:0", ::grpc::InsecureServerCredentials(), &port);
  builder.RegisterService(&build_server);
  builder.RegisterService(&admin_server);
  auto server = builder.BuildAndStart();
  assert(server);
  assert(port > 0);

  BuildClient client(::grpc::CreateChannel("127.0.0.1:" + std::to_string(port), grpc::InsecureChannelCredentials()));
  assert(client.WaitUntilHealthy(10, 500ms).ok());

  const auto rejected = client.StartBuild(std::string(R"({"base": "arch"})"));
  assert(rejected.status().IsInvalid());

  const auto build_id = client.StartBuild(std::string(osforge::testing::SampleSpecJson()));
  assert(build_id.ok());

  osforge::client::PollOptions poll;
  poll.interval = 50ms;
  poll.timeout  = 10s;
  const auto final_status = client.WaitForCompletion(*build_id, poll);
  assert(final_status.ok());
  assert(final_status->status() == osforge::build::v1::SUCCESS);
  assert(osforge::client::MissingRequiredArtifacts(*final_status).empty());

  const auto missing = client.GetBuildStatus("00000000-0000-4000-8000-000000000000");
  assert(missing.status().IsKeyError());

  const auto stats = client.Stats();
  assert(stats.ok());
  assert(stats->builds_succeeded() == 1);

  ctx.scheduler->Shutdown();
  server->Shutdown();
}

} // namespace

int main() {
  TestValidateBuildId();
  TestRpcHelpersRejectInvalidIdBeforeGrpcCall();
  TestUnreachableServerIsIOError();
  TestEndToEndAgainstInProcessServer();

  std::cout << "osforge_unit_build_client: pass\n";
  return 0;
}

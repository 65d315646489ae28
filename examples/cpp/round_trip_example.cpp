#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "client/cpp/build_client.h"
#include "osforge/build/v1.hpp"

int main(int argc, char** argv) {
  // Allow overriding the service endpoint for remote or containerized runs.
  const std::string target    = argc > 1 ? argv[1] : "localhost:50051";
  const std::string spec_path = argc > 2 ? argv[2] : "examples/specs/minimal.json";

  std::ifstream in(spec_path);
  if (!in) {
    std::cerr << "cannot read " << spec_path << '\n';
    return 1;
  }
  std::ostringstream spec_json;
  spec_json << in.rdbuf();

  osforge::client::BuildClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  auto healthy = client.WaitUntilHealthy();
  if (!healthy.ok()) {
    std::cerr << "WaitUntilHealthy failed: " << healthy.ToString() << '\n';
    return 1;
  }

  auto build_id = client.StartBuild(spec_json.str());
  if (!build_id.ok()) {
    std::cerr << "StartBuild failed: " << build_id.status().ToString() << '\n';
    return 1;
  }
  std::cout << "Submitted build " << *build_id << '\n';

  // Poll every two seconds for up to ten minutes; a failed poll is only reported.
  osforge::client::PollOptions options;
  options.interval = std::chrono::seconds(2);

  auto final_status = client.WaitForCompletion(*build_id, options, [](const grpc::Status& s) {
    std::cerr << "poll failed: " << s.error_message() << '\n';
  });
  if (!final_status.ok()) {
    std::cerr << "WaitForCompletion failed: " << final_status.status().ToString() << '\n';
    return 1;
  }

  const auto& resp = *final_status;
  std::cout << "Build finished with " << osforge::build::v1::BuildStatus_Name(resp.status()) << '\n';

  // Tail the log from the start through the dedicated logs call.
  auto logs = client.GetBuildLogs(*build_id);
  if (logs.ok()) {
    for (const auto& entry : logs->logs()) {
      std::cout << "  " << entry.message() << '\n';
    }
  }

  for (const auto& [type, url] : resp.download_urls()) {
    std::cout << type << " -> " << url << '\n';
  }

  for (const auto& missing : osforge::client::MissingRequiredArtifacts(resp)) {
    std::cerr << "missing artifact: " << missing << '\n';
  }
  return resp.status() == osforge::build::v1::SUCCESS ? 0 : 2;
}

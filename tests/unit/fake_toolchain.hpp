#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/pipeline/toolchain.hpp"

namespace osforge::testing {

namespace fs = std::filesystem;

inline fs::path FreshDir(const std::string& suite, const std::string& name) {
  auto dir = fs::temp_directory_path() / suite / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

inline void Touch(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::trunc);
  out << content;
}

inline std::string ReadAll(const fs::path& path) {
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

class FakeResolver final : public pipeline::PackageResolver {
 public:
  pipeline::ToolResult<pipeline::ResolvedPackageSet> Resolve(std::string_view distro, const osforge::build::v1::PackageSelection&) override {
    pipeline::ResolvedPackageSet set{std::string(distro), {"git", "zsh"}, {"echo post-install"}};
    return pipeline::ToolResult<pipeline::ResolvedPackageSet>::Ok(set, {"resolved 2 packages for " + std::string(distro)});
  }
};

/*
  Creates <workspace>/rootfs. fail_with returns an error; throw_with throws;
  delay keeps the build IN_PROGRESS for a while. A valid gate holds the call
  after its first output line until the gate is released.
*/
class FakeBootstrapper final : public pipeline::FilesystemBootstrapper {
 public:
  std::string               fail_with;
  std::string               throw_with;
  std::chrono::milliseconds delay{0};
  std::shared_future<void>  gate;

  pipeline::ToolResult<pipeline::RootfsHandle> Bootstrap(const pipeline::ResolvedPackageSet& packages, const pipeline::BootstrapConfig& config,
                                                         const pipeline::LineSink& sink) override {
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }
    if (!throw_with.empty()) {
      throw std::runtime_error(throw_with);
    }
    if (!fail_with.empty()) {
      return pipeline::ToolResult<pipeline::RootfsHandle>::Err(fail_with, {"error: target not found"});
    }

    sink("installing " + std::to_string(packages.packages.size()) + " packages");
    if (gate.valid()) {
      gate.wait();
    }
    pipeline::RootfsHandle handle{config.workspace / "rootfs"};
    fs::create_directories(handle.path);
    return pipeline::ToolResult<pipeline::RootfsHandle>::Ok(handle);
  }
};

class FakeMasterer final : public pipeline::ImageMasterer {
 public:
  std::atomic<int> calls{0};
  std::string      fail_with;

  pipeline::ToolResult<fs::path> MasterIso(const pipeline::ImageRequest& request, const pipeline::LineSink& sink) override {
    ++calls;
    sink("mastering iso");
    if (!fail_with.empty()) {
      return pipeline::ToolResult<fs::path>::Err(fail_with, {"xorriso : FAILURE : Cannot find boot image"});
    }
    auto iso = request.workspace / "iso" / ("osforge-" + request.build_id + ".iso");
    Touch(iso, "ISO");
    return pipeline::ToolResult<fs::path>::Ok(iso);
  }
};

class FakeImageBuilder final : public pipeline::ContainerImageBuilder {
 public:
  std::atomic<int> calls{0};

  pipeline::ToolResult<pipeline::ContainerImage> BuildImage(const pipeline::ImageRequest& request, const pipeline::LineSink&) override {
    ++calls;
    pipeline::ContainerImage image;
    image.tag     = "osforge-" + request.build_id + ":latest";
    image.archive = request.workspace / "image" / ("osforge-" + request.build_id + ".tar");
    Touch(image.archive, "TAR");
    return pipeline::ToolResult<pipeline::ContainerImage>::Ok(image);
  }
};

class FakePusher final : public pipeline::RegistryPusher {
 public:
  bool        fail = false;
  std::string last_remote;

  pipeline::ToolResult<std::string> Push(const pipeline::ContainerImage&, const std::string& remote_tag, const pipeline::LineSink&) override {
    last_remote = remote_tag;
    if (fail) {
      return pipeline::ToolResult<std::string>::Err("denied: requested access to the resource is denied");
    }
    return pipeline::ToolResult<std::string>::Ok(remote_tag);
  }
};

struct FakeToolchain {
  std::shared_ptr<FakeResolver>     resolver     = std::make_shared<FakeResolver>();
  std::shared_ptr<FakeBootstrapper> bootstrapper = std::make_shared<FakeBootstrapper>();
  std::shared_ptr<FakeMasterer>     masterer     = std::make_shared<FakeMasterer>();
  std::shared_ptr<FakeImageBuilder> builder      = std::make_shared<FakeImageBuilder>();
  std::shared_ptr<FakePusher>       pusher;

  pipeline::Toolchain Get() const {
    return pipeline::Toolchain{resolver, bootstrapper, masterer, builder, pusher};
  }
};

inline osforge::build::v1::BuildSpecification SampleSpec() {
  osforge::build::v1::BuildSpecification spec;
  spec.set_name("SteelOS");
  spec.set_base("arch");
  spec.set_kernel("linux-zen");
  spec.set_init("systemd");
  spec.set_architecture("x86_64");
  spec.mutable_display()->set_server("wayland");
  spec.mutable_display()->set_compositor("hyprland");
  spec.mutable_packages()->add_dev("git");
  spec.add_security_features("secure-boot");
  spec.mutable_defaults()->set_swappiness(10);
  spec.mutable_defaults()->set_kernel_params("quiet splash");
  return spec;
}

inline const char* SampleSpecJson() {
  return R"({
    "name": "SteelOS", "base": "arch", "kernel": "linux-zen", "init": "systemd", "architecture": "x86_64",
    "display": {"server": "wayland", "compositor": "hyprland"},
    "packages": {"dev": ["git"]},
    "defaults": {"swappiness": 10}
  })";
}

} // namespace osforge::testing

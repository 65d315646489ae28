#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "osforge/build/v1.hpp"

namespace osforge::pipeline {

// Receives each line of collaborator output as it is produced.
using LineSink = std::function<void(std::string_view)>;

/*
  Uniform collaborator outcome. Tools never throw for an expected failure;
  they return Err with a reason the executor turns into a stage failure.
*/
template <typename T>
struct ToolResult {
  bool                     ok = false;
  T                        value{};
  std::string              error;
  std::vector<std::string> log_lines;

  static ToolResult Ok(T value, std::vector<std::string> lines = {}) {
    ToolResult r;
    r.ok        = true;
    r.value     = std::move(value);
    r.log_lines = std::move(lines);
    return r;
  }

  static ToolResult Err(std::string error, std::vector<std::string> lines = {}) {
    ToolResult r;
    r.ok        = false;
    r.error     = std::move(error);
    r.log_lines = std::move(lines);
    return r;
  }
};

struct ResolvedPackageSet {
  std::string              distro;
  std::vector<std::string> packages;
  // Shell commands to run inside the rootfs once packages are installed.
  std::vector<std::string> post_install;
};

struct BootstrapConfig {
  std::string           build_id;
  std::string           base;
  std::string           architecture;
  std::string           kernel;
  std::string           init;
  std::filesystem::path workspace;
};

struct RootfsHandle {
  std::filesystem::path path;
};

struct ImageRequest {
  std::string           build_id;
  std::string           base;
  std::string           architecture;
  std::filesystem::path workspace;
  RootfsHandle          rootfs;
};

struct ContainerImage {
  std::string           tag;
  std::filesystem::path archive;
};

// ------------------------------------------------------------
// Collaborator interfaces
// ------------------------------------------------------------

class PackageResolver {
 public:
  virtual ~PackageResolver() = default;

  virtual ToolResult<ResolvedPackageSet> Resolve(std::string_view distro, const osforge::build::v1::PackageSelection& packages) = 0;
};

class FilesystemBootstrapper {
 public:
  virtual ~FilesystemBootstrapper() = default;

  virtual ToolResult<RootfsHandle> Bootstrap(const ResolvedPackageSet& packages, const BootstrapConfig& config, const LineSink& sink) = 0;
};

class ImageMasterer {
 public:
  virtual ~ImageMasterer() = default;

  // Returns the path of the produced ISO file.
  virtual ToolResult<std::filesystem::path> MasterIso(const ImageRequest& request, const LineSink& sink) = 0;
};

class ContainerImageBuilder {
 public:
  virtual ~ContainerImageBuilder() = default;

  virtual ToolResult<ContainerImage> BuildImage(const ImageRequest& request, const LineSink& sink) = 0;
};

class RegistryPusher {
 public:
  virtual ~RegistryPusher() = default;

  // Returns the remote reference the image is reachable under.
  virtual ToolResult<std::string> Push(const ContainerImage& image, const std::string& remote_tag, const LineSink& sink) = 0;
};

struct Toolchain {
  std::shared_ptr<PackageResolver>        resolver;
  std::shared_ptr<FilesystemBootstrapper> bootstrapper;
  std::shared_ptr<ImageMasterer>          masterer;
  std::shared_ptr<ContainerImageBuilder>  image_builder;
  // Optional; without it images are exported as archives only.
  std::shared_ptr<RegistryPusher> pusher;
};

} // namespace osforge::pipeline

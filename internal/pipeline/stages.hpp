#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/pipeline/stage.hpp"

namespace osforge::pipeline {

inline constexpr std::string_view kStageResolvePackages   = "resolve-packages";
inline constexpr std::string_view kStageBootstrapRootfs   = "bootstrap-rootfs";
inline constexpr std::string_view kStageConfigureSystem   = "configure-system";
inline constexpr std::string_view kStageConfigureDisplay  = "configure-display";
inline constexpr std::string_view kStageMasterIso         = "master-iso";
inline constexpr std::string_view kStageBuildContainer    = "build-container-image";
inline constexpr std::string_view kStageFinalizeArtifacts = "finalize-artifacts";

class ResolvePackagesStage final : public Stage {
 public:
  explicit ResolvePackagesStage(std::shared_ptr<PackageResolver> resolver);

  std::string_view Name() const override {
    return kStageResolvePackages;
  }
  StageResult Run(StageContext& context) override;

 private:
  std::shared_ptr<PackageResolver> resolver_;
};

class BootstrapRootfsStage final : public Stage {
 public:
  explicit BootstrapRootfsStage(std::shared_ptr<FilesystemBootstrapper> bootstrapper);

  std::string_view Name() const override {
    return kStageBootstrapRootfs;
  }
  StageResult Run(StageContext& context) override;

 private:
  std::shared_ptr<FilesystemBootstrapper> bootstrapper_;
};

// Writes sysctl, kernel cmdline and the system manifest into the rootfs.
class ConfigureSystemStage final : public Stage {
 public:
  std::string_view Name() const override {
    return kStageConfigureSystem;
  }
  StageResult Run(StageContext& context) override;
};

class ConfigureDisplayStage final : public Stage {
 public:
  std::string_view Name() const override {
    return kStageConfigureDisplay;
  }
  StageResult Run(StageContext& context) override;
};

class MasterIsoStage final : public Stage {
 public:
  explicit MasterIsoStage(std::shared_ptr<ImageMasterer> masterer);

  std::string_view Name() const override {
    return kStageMasterIso;
  }
  StageResult Run(StageContext& context) override;

 private:
  std::shared_ptr<ImageMasterer> masterer_;
};

/*
  Builds the container image. With a pusher and a registry URL the image is
  pushed and staged as a docker-image-ref; a failed push falls back to the
  exported archive (docker-image).
*/
class BuildContainerImageStage final : public Stage {
 public:
  BuildContainerImageStage(std::shared_ptr<ContainerImageBuilder> builder, std::shared_ptr<RegistryPusher> pusher, std::string registry_url);

  std::string_view Name() const override {
    return kStageBuildContainer;
  }
  StageResult Run(StageContext& context) override;

 private:
  std::shared_ptr<ContainerImageBuilder> builder_;
  std::shared_ptr<RegistryPusher>        pusher_;
  std::string                            registry_url_;
};

class FinalizeArtifactsStage final : public Stage {
 public:
  explicit FinalizeArtifactsStage(std::shared_ptr<ArtifactRegistry> registry);

  std::string_view Name() const override {
    return kStageFinalizeArtifacts;
  }
  StageResult Run(StageContext& context) override;

 private:
  std::shared_ptr<ArtifactRegistry> registry_;
};

// The seven stages in execution order.
std::vector<std::shared_ptr<Stage>> MakeDefaultStages(const Toolchain& toolchain, std::shared_ptr<ArtifactRegistry> registry,
                                                      const std::string& registry_url);

} // namespace osforge::pipeline

#include "internal/pipeline/stages.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace osforge::pipeline {

namespace fs = std::filesystem;

namespace {

void WriteFile(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot write " + path.string());
  }
  out << content;
  if (!out.flush()) {
    throw std::runtime_error("write failed: " + path.string());
  }
}

const char* OnOff(bool value) {
  return value ? "on" : "off";
}

ImageRequest MakeImageRequest(const StageContext& ctx) {
  ImageRequest request;
  request.build_id     = ctx.build_id;
  request.base         = ctx.spec.base();
  request.architecture = ctx.spec.architecture();
  request.workspace    = ctx.workspace;
  request.rootfs       = *ctx.rootfs;
  return request;
}

template <typename T>
StageResult FromTool(const ToolResult<T>& result) {
  if (!result.ok) {
    return StageResult::Failure(result.error, result.log_lines);
  }
  return StageResult::Success(result.log_lines);
}

} // namespace

// ------------------------------------------------------------
// resolve-packages
// ------------------------------------------------------------

ResolvePackagesStage::ResolvePackagesStage(std::shared_ptr<PackageResolver> resolver) : resolver_(std::move(resolver)) {
}

StageResult ResolvePackagesStage::Run(StageContext& ctx) {
  auto result = resolver_->Resolve(ctx.spec.base(), ctx.spec.packages());
  auto stage  = FromTool(result);
  if (result.ok) {
    ctx.packages = std::move(result.value);
  }
  return stage;
}

// ------------------------------------------------------------
// bootstrap-rootfs
// ------------------------------------------------------------

BootstrapRootfsStage::BootstrapRootfsStage(std::shared_ptr<FilesystemBootstrapper> bootstrapper) : bootstrapper_(std::move(bootstrapper)) {
}

StageResult BootstrapRootfsStage::Run(StageContext& ctx) {
  if (!ctx.packages) {
    return StageResult::Failure("no resolved package set");
  }

  BootstrapConfig config;
  config.build_id     = ctx.build_id;
  config.base         = ctx.spec.base();
  config.architecture = ctx.spec.architecture();
  config.kernel       = ctx.spec.kernel();
  config.init         = ctx.spec.init();
  config.workspace    = ctx.workspace;

  auto result = bootstrapper_->Bootstrap(*ctx.packages, config, ctx.log.Sink());
  auto stage  = FromTool(result);
  if (result.ok) {
    ctx.rootfs = result.value;
    stage.log_lines.push_back("root filesystem ready at " + result.value.path.string());
  }
  return stage;
}

// ------------------------------------------------------------
// configure-system
// ------------------------------------------------------------

StageResult ConfigureSystemStage::Run(StageContext& ctx) {
  if (!ctx.rootfs) {
    return StageResult::Failure("no root filesystem");
  }

  const auto& root     = ctx.rootfs->path;
  const auto& spec     = ctx.spec;
  const auto& defaults = spec.defaults();

  std::vector<std::string> lines;

  if (defaults.has_swappiness()) {
    WriteFile(root / "etc/sysctl.d/99-osforge.conf", "vm.swappiness = " + std::to_string(defaults.swappiness()) + "\n");
    lines.push_back("swappiness set to " + std::to_string(defaults.swappiness()));
  }

  if (!defaults.kernel_params().empty()) {
    WriteFile(root / "etc/kernel/cmdline", defaults.kernel_params() + "\n");
    lines.push_back("kernel parameters: " + defaults.kernel_params());
  }

  std::ostringstream manifest;
  manifest << "name=" << spec.name() << "\n"
           << "base=" << spec.base() << "\n"
           << "kernel=" << spec.kernel() << "\n"
           << "init=" << spec.init() << "\n"
           << "architecture=" << spec.architecture() << "\n"
           << "trim=" << OnOff(defaults.has_trim() && defaults.trim()) << "\n"
           << "dns_over_https=" << OnOff(defaults.dns_over_https()) << "\n"
           << "mac_randomization=" << OnOff(defaults.mac_randomization()) << "\n";
  for (const auto& feature : spec.security_features()) {
    manifest << "security_feature=" << feature << "\n";
    lines.push_back("security feature requested: " + feature);
  }
  WriteFile(root / "etc/osforge/system.conf", manifest.str());

  if (ctx.packages && !ctx.packages->post_install.empty()) {
    std::string script = "#!/bin/sh\nset -e\n";
    for (const auto& step : ctx.packages->post_install) {
      script += step + "\n";
    }
    WriteFile(root / "etc/osforge/post-install.sh", script);
    fs::permissions(root / "etc/osforge/post-install.sh", fs::perms::owner_exec, fs::perm_options::add);
    lines.push_back("post-install steps: " + std::to_string(ctx.packages->post_install.size()));
  }

  lines.push_back("init system " + spec.init() + ", kernel " + spec.kernel());
  return StageResult::Success(std::move(lines));
}

// ------------------------------------------------------------
// configure-display
// ------------------------------------------------------------

StageResult ConfigureDisplayStage::Run(StageContext& ctx) {
  if (!ctx.rootfs) {
    return StageResult::Failure("no root filesystem");
  }

  const auto& display = ctx.spec.display();

  std::ostringstream out;
  auto               put = [&out](const char* key, const std::string& value) {
    if (!value.empty()) {
      out << key << "=" << value << "\n";
    }
  };
  put("server", display.server());
  put("compositor", display.compositor());
  put("bar", display.bar());
  put("launcher", display.launcher());
  put("terminal", display.terminal());
  put("notifications", display.notifications());
  put("lockscreen", display.lockscreen());

  WriteFile(ctx.rootfs->path / "etc/osforge/display.conf", out.str());

  if (display.server().empty() && display.compositor().empty()) {
    return StageResult::Success({"no display stack requested"});
  }
  return StageResult::Success({"display stack: " + display.server() + "/" + display.compositor()});
}

// ------------------------------------------------------------
// master-iso
// ------------------------------------------------------------

MasterIsoStage::MasterIsoStage(std::shared_ptr<ImageMasterer> masterer) : masterer_(std::move(masterer)) {
}

StageResult MasterIsoStage::Run(StageContext& ctx) {
  if (!ctx.rootfs) {
    return StageResult::Failure("no root filesystem");
  }

  auto result = masterer_->MasterIso(MakeImageRequest(ctx), ctx.log.Sink());
  auto stage  = FromTool(result);
  if (result.ok) {
    ctx.staged.push_back(StagedArtifact{osforge::model::ArtifactType::kIso, result.value, result.value.filename().string(), ""});
    stage.log_lines.push_back("iso image ready: " + result.value.filename().string());
  }
  return stage;
}

// ------------------------------------------------------------
// build-container-image
// ------------------------------------------------------------

BuildContainerImageStage::BuildContainerImageStage(std::shared_ptr<ContainerImageBuilder> builder, std::shared_ptr<RegistryPusher> pusher,
                                                   std::string registry_url)
    : builder_(std::move(builder)), pusher_(std::move(pusher)), registry_url_(std::move(registry_url)) {
}

StageResult BuildContainerImageStage::Run(StageContext& ctx) {
  if (!ctx.rootfs) {
    return StageResult::Failure("no root filesystem");
  }

  auto result = builder_->BuildImage(MakeImageRequest(ctx), ctx.log.Sink());
  auto stage  = FromTool(result);
  if (!result.ok) {
    return stage;
  }
  const auto& image = result.value;

  if (pusher_ && !registry_url_.empty()) {
    const auto remote = registry_url_ + "/osforge-" + ctx.build_id + ":latest";
    auto       pushed = pusher_->Push(image, remote, ctx.log.Sink());
    stage.log_lines.insert(stage.log_lines.end(), pushed.log_lines.begin(), pushed.log_lines.end());
    if (pushed.ok) {
      ctx.staged.push_back(StagedArtifact{osforge::model::ArtifactType::kDockerImageRef, {}, "docker-manifest", pushed.value});
      stage.log_lines.push_back("pushed container image to " + pushed.value);
      return stage;
    }
    stage.log_lines.push_back("registry push failed: " + pushed.error + "; falling back to image archive");
  }

  ctx.staged.push_back(StagedArtifact{osforge::model::ArtifactType::kDockerImage, image.archive, image.archive.filename().string(), ""});
  stage.log_lines.push_back("exported container image " + image.tag);
  return stage;
}

// ------------------------------------------------------------
// finalize-artifacts
// ------------------------------------------------------------

FinalizeArtifactsStage::FinalizeArtifactsStage(std::shared_ptr<ArtifactRegistry> registry) : registry_(std::move(registry)) {
}

StageResult FinalizeArtifactsStage::Run(StageContext& ctx) {
  StageResult result;
  result.artifacts = registry_->Publish(ctx.build_id, ctx.staged);
  for (const auto& artifact : result.artifacts) {
    result.log_lines.push_back("artifact " + std::string(osforge::model::ToString(artifact.type)) + ": " + artifact.url);
  }
  ctx.staged.clear();
  return result;
}

std::vector<std::shared_ptr<Stage>> MakeDefaultStages(const Toolchain& toolchain, std::shared_ptr<ArtifactRegistry> registry,
                                                      const std::string& registry_url) {
  if (!toolchain.resolver || !toolchain.bootstrapper || !toolchain.masterer || !toolchain.image_builder) {
    throw std::invalid_argument("toolchain is missing a required collaborator");
  }

  return {
      std::make_shared<ResolvePackagesStage>(toolchain.resolver),
      std::make_shared<BootstrapRootfsStage>(toolchain.bootstrapper),
      std::make_shared<ConfigureSystemStage>(),
      std::make_shared<ConfigureDisplayStage>(),
      std::make_shared<MasterIsoStage>(toolchain.masterer),
      std::make_shared<BuildContainerImageStage>(toolchain.image_builder, toolchain.pusher, registry_url),
      std::make_shared<FinalizeArtifactsStage>(std::move(registry)),
  };
}

} // namespace osforge::pipeline

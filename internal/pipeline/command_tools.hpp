#pragma once

#include <map>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/pipeline/toolchain.hpp"

namespace osforge::pipeline {

using TemplateValues = std::map<std::string, std::string>;

/*
  Expands "{name}" placeholders in each argv token from values. A token that
  is exactly "{packages}" is replaced by one token per package. Unknown
  placeholders are left as written.
*/
std::vector<std::string> ExpandTemplate(const std::vector<std::string>& argv_template, const TemplateValues& values,
                                        const std::vector<std::string>& packages = {});

// ------------------------------------------------------------
// argv-template collaborators
// ------------------------------------------------------------

class CommandBootstrapper final : public FilesystemBootstrapper {
 public:
  explicit CommandBootstrapper(std::vector<std::string> argv_template);

  ToolResult<RootfsHandle> Bootstrap(const ResolvedPackageSet& packages, const BootstrapConfig& config, const LineSink& sink) override;

 private:
  std::vector<std::string> template_;
};

class CommandImageMasterer final : public ImageMasterer {
 public:
  explicit CommandImageMasterer(std::vector<std::string> argv_template);

  ToolResult<std::filesystem::path> MasterIso(const ImageRequest& request, const LineSink& sink) override;

 private:
  std::vector<std::string> template_;
};

class CommandImageBuilder final : public ContainerImageBuilder {
 public:
  CommandImageBuilder(std::vector<std::string> build_template, std::vector<std::string> export_template);

  ToolResult<ContainerImage> BuildImage(const ImageRequest& request, const LineSink& sink) override;

 private:
  std::vector<std::string> build_template_;
  std::vector<std::string> export_template_;
};

class CommandRegistryPusher final : public RegistryPusher {
 public:
  explicit CommandRegistryPusher(std::vector<std::string> argv_template);

  ToolResult<std::string> Push(const ContainerImage& image, const std::string& remote_tag, const LineSink& sink) override;

 private:
  std::vector<std::string> template_;
};

// Wires the command tools from configuration; the pusher is left empty when
// no push command is configured.
Toolchain MakeCommandToolchain(const osforge::runtime::config::ToolchainConfig& config);

} // namespace osforge::pipeline

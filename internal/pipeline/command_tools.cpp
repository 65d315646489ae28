#include "internal/pipeline/command_tools.hpp"

#include <algorithm>
#include <system_error>

#include "internal/pipeline/catalog_package_resolver.hpp"
#include "internal/pipeline/command_runner.hpp"

namespace osforge::pipeline {

namespace fs = std::filesystem;

namespace {

std::string ExpandToken(const std::string& token, const TemplateValues& values) {
  std::string out;
  out.reserve(token.size());

  std::size_t pos = 0;
  while (pos < token.size()) {
    auto open = token.find('{', pos);
    if (open == std::string::npos) {
      out.append(token, pos, std::string::npos);
      break;
    }
    auto close = token.find('}', open);
    if (close == std::string::npos) {
      out.append(token, pos, std::string::npos);
      break;
    }

    out.append(token, pos, open - pos);
    auto key = token.substr(open + 1, close - open - 1);
    auto it  = values.find(key);
    if (it != values.end()) {
      out += it->second;
    } else {
      out.append(token, open, close - open + 1);
    }
    pos = close + 1;
  }
  return out;
}

// Runs one configured command, returning an error string on failure.
std::optional<std::string> Execute(const char* what, const std::vector<std::string>& argv, const LineSink& sink,
                                   const std::optional<fs::path>& working_dir = std::nullopt) {
  if (argv.empty()) {
    return std::string("no ") + what + " command configured";
  }

  CommandOutcome outcome;
  try {
    outcome = RunCommand(argv, sink, working_dir);
  } catch (const std::exception& e) {
    return std::string(what) + " command could not be started: " + e.what();
  }

  if (outcome.exit_code == 127) {
    return std::string(what) + " command not executable: " + argv.front();
  }
  if (outcome.exit_code != 0) {
    return std::string(what) + " command exited with code " + std::to_string(outcome.exit_code);
  }
  return std::nullopt;
}

std::optional<std::string> EnsureDirectory(const fs::path& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    return "cannot create " + dir.string() + ": " + ec.message();
  }
  return std::nullopt;
}

TemplateValues BaseValues(const std::string& build_id, const std::string& base, const std::string& arch, const fs::path& workspace) {
  return TemplateValues{
      {"build_id", build_id},
      {"base", base},
      {"arch", arch},
      {"workspace", workspace.string()},
  };
}

std::string ImageTag(const std::string& build_id) {
  return "osforge-" + build_id + ":latest";
}

} // namespace

std::vector<std::string> ExpandTemplate(const std::vector<std::string>& argv_template, const TemplateValues& values,
                                        const std::vector<std::string>& packages) {
  std::vector<std::string> argv;
  argv.reserve(argv_template.size() + packages.size());
  for (const auto& token : argv_template) {
    if (token == "{packages}") {
      argv.insert(argv.end(), packages.begin(), packages.end());
      continue;
    }
    argv.push_back(ExpandToken(token, values));
  }
  return argv;
}

// ------------------------------------------------------------
// Bootstrap
// ------------------------------------------------------------

CommandBootstrapper::CommandBootstrapper(std::vector<std::string> argv_template) : template_(std::move(argv_template)) {
}

ToolResult<RootfsHandle> CommandBootstrapper::Bootstrap(const ResolvedPackageSet& packages, const BootstrapConfig& config, const LineSink& sink) {
  RootfsHandle handle{config.workspace / "rootfs"};
  if (auto err = EnsureDirectory(handle.path)) {
    return ToolResult<RootfsHandle>::Err(*err);
  }

  auto values      = BaseValues(config.build_id, config.base, config.architecture, config.workspace);
  values["kernel"] = config.kernel;
  values["init"]   = config.init;
  values["rootfs"] = handle.path.string();

  if (auto err = Execute("bootstrap", ExpandTemplate(template_, values, packages.packages), sink, config.workspace)) {
    return ToolResult<RootfsHandle>::Err(*err);
  }
  return ToolResult<RootfsHandle>::Ok(handle);
}

// ------------------------------------------------------------
// ISO mastering
// ------------------------------------------------------------

CommandImageMasterer::CommandImageMasterer(std::vector<std::string> argv_template) : template_(std::move(argv_template)) {
}

ToolResult<fs::path> CommandImageMasterer::MasterIso(const ImageRequest& request, const LineSink& sink) {
  const auto output = request.workspace / "iso";
  if (auto err = EnsureDirectory(output)) {
    return ToolResult<fs::path>::Err(*err);
  }

  auto values      = BaseValues(request.build_id, request.base, request.architecture, request.workspace);
  values["rootfs"] = request.rootfs.path.string();
  values["output"] = output.string();

  if (auto err = Execute("iso mastering", ExpandTemplate(template_, values), sink, request.workspace)) {
    return ToolResult<fs::path>::Err(*err);
  }

  std::vector<fs::path> isos;
  for (const auto& entry : fs::directory_iterator(output)) {
    if (entry.is_regular_file() && entry.path().extension() == ".iso") {
      isos.push_back(entry.path());
    }
  }
  if (isos.empty()) {
    return ToolResult<fs::path>::Err("iso mastering produced no .iso file in " + output.string());
  }
  std::sort(isos.begin(), isos.end());
  return ToolResult<fs::path>::Ok(isos.front());
}

// ------------------------------------------------------------
// Container image
// ------------------------------------------------------------

CommandImageBuilder::CommandImageBuilder(std::vector<std::string> build_template, std::vector<std::string> export_template)
    : build_template_(std::move(build_template)), export_template_(std::move(export_template)) {
}

ToolResult<ContainerImage> CommandImageBuilder::BuildImage(const ImageRequest& request, const LineSink& sink) {
  const auto output = request.workspace / "image";
  if (auto err = EnsureDirectory(output)) {
    return ToolResult<ContainerImage>::Err(*err);
  }

  ContainerImage image;
  image.tag     = ImageTag(request.build_id);
  image.archive = output / ("osforge-" + request.build_id + ".tar");

  auto values             = BaseValues(request.build_id, request.base, request.architecture, request.workspace);
  values["rootfs"]        = request.rootfs.path.string();
  values["output"]        = output.string();
  values["tag"]           = image.tag;
  values["image_archive"] = image.archive.string();

  if (auto err = Execute("image build", ExpandTemplate(build_template_, values), sink, request.workspace)) {
    return ToolResult<ContainerImage>::Err(*err);
  }
  if (auto err = Execute("image export", ExpandTemplate(export_template_, values), sink, request.workspace)) {
    return ToolResult<ContainerImage>::Err(*err);
  }

  std::error_code ec;
  if (!fs::is_regular_file(image.archive, ec)) {
    return ToolResult<ContainerImage>::Err("image export produced no archive at " + image.archive.string());
  }
  return ToolResult<ContainerImage>::Ok(image);
}

// ------------------------------------------------------------
// Registry push
// ------------------------------------------------------------

CommandRegistryPusher::CommandRegistryPusher(std::vector<std::string> argv_template) : template_(std::move(argv_template)) {
}

ToolResult<std::string> CommandRegistryPusher::Push(const ContainerImage& image, const std::string& remote_tag, const LineSink& sink) {
  TemplateValues values{
      {"tag", image.tag},
      {"remote", remote_tag},
      {"image_archive", image.archive.string()},
  };

  if (auto err = Execute("registry push", ExpandTemplate(template_, values), sink)) {
    return ToolResult<std::string>::Err(*err);
  }
  return ToolResult<std::string>::Ok(remote_tag);
}

Toolchain MakeCommandToolchain(const osforge::runtime::config::ToolchainConfig& config) {
  auto to_vector = [](const auto& repeated) { return std::vector<std::string>(repeated.begin(), repeated.end()); };

  Toolchain toolchain;
  toolchain.resolver      = std::make_shared<CatalogPackageResolver>();
  toolchain.bootstrapper  = std::make_shared<CommandBootstrapper>(to_vector(config.bootstrap()));
  toolchain.masterer      = std::make_shared<CommandImageMasterer>(to_vector(config.master_iso()));
  toolchain.image_builder = std::make_shared<CommandImageBuilder>(to_vector(config.build_image()), to_vector(config.export_image()));
  if (config.push_image_size() > 0) {
    toolchain.pusher = std::make_shared<CommandRegistryPusher>(to_vector(config.push_image()));
  }
  return toolchain;
}

} // namespace osforge::pipeline

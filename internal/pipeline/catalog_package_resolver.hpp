#pragma once

#include "internal/pipeline/toolchain.hpp"

namespace osforge::pipeline {

/*
  Built-in package resolver.

  Maps abstract package names onto per-distro names from a static catalog.
  Names the catalog does not know pass through unchanged; names the catalog
  marks unavailable for the distro are dropped with a warning line. Meta
  packages (oh-my-zsh) expand into their prerequisites plus a post-install
  step. Output order follows category order then list order, deduplicated.
*/
class CatalogPackageResolver final : public PackageResolver {
 public:
  ToolResult<ResolvedPackageSet> Resolve(std::string_view distro, const osforge::build::v1::PackageSelection& packages) override;

  static bool SupportsDistro(std::string_view distro);
};

} // namespace osforge::pipeline

#include "internal/pipeline/catalog_package_resolver.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

namespace {

using osforge::pipeline::CatalogPackageResolver;

bool Has(const std::vector<std::string>& values, const std::string& v) {
  return std::find(values.begin(), values.end(), v) != values.end();
}

void TestNamesMapPerDistro() {
  osforge::build::v1::PackageSelection packages;
  packages.add_dev("python");
  packages.add_dev("docker");
  packages.add_utils("fd");

  CatalogPackageResolver resolver;

  auto arch = resolver.Resolve("arch", packages);
  assert(arch.ok);
  assert(arch.value.distro == "arch");
  assert(arch.value.packages == (std::vector<std::string>{"python", "docker", "fd"}));

  auto debian = resolver.Resolve("debian", packages);
  assert(debian.ok);
  assert(debian.value.packages == (std::vector<std::string>{"python3", "docker.io", "fd-find"}));
  assert(debian.log_lines.back() == "resolved 3 packages for debian");
}

void TestUnavailablePackageWarnsAndIsDropped() {
  osforge::build::v1::PackageSelection packages;
  packages.add_utils("yay");
  packages.add_utils("htop");

  auto result = CatalogPackageResolver().Resolve("ubuntu", packages);
  assert(result.ok);
  assert(result.value.packages == (std::vector<std::string>{"htop"}));
  assert(Has(result.log_lines, "warning: package 'yay' is not available on ubuntu"));
}

void TestUnknownNamesPassThrough() {
  osforge::build::v1::PackageSelection packages;
  packages.add_system("some-custom-tool");

  auto result = CatalogPackageResolver().Resolve("alpine", packages);
  assert(result.ok);
  assert(result.value.packages == (std::vector<std::string>{"some-custom-tool"}));
}

void TestMetaPackageExpandsAndDeduplicates() {
  osforge::build::v1::PackageSelection packages;
  packages.add_system("zsh");
  packages.add_system("oh-my-zsh");
  packages.add_dev("git");

  auto result = CatalogPackageResolver().Resolve("arch", packages);
  assert(result.ok);
  assert(result.value.packages == (std::vector<std::string>{"zsh", "git"}));
  assert(result.value.post_install.size() == 2);
}

void TestUnsupportedDistroIsAnError() {
  osforge::build::v1::PackageSelection packages;
  packages.add_system("git");

  CatalogPackageResolver resolver;
  assert(!CatalogPackageResolver::SupportsDistro("gentoo"));
  auto result = resolver.Resolve("gentoo", packages);
  assert(!result.ok);
  assert(result.error == "no package catalog for base distribution gentoo");
}

void TestInvalidNameIsAnError() {
  osforge::build::v1::PackageSelection packages;
  packages.add_system("bad name");

  auto result = CatalogPackageResolver().Resolve("arch", packages);
  assert(!result.ok);
  assert(result.error.find("invalid package name") != std::string::npos);
}

} // namespace

int main() {
  TestNamesMapPerDistro();
  TestUnavailablePackageWarnsAndIsDropped();
  TestUnknownNamesPassThrough();
  TestMetaPackageExpandsAndDeduplicates();
  TestUnsupportedDistroIsAnError();
  TestInvalidNameIsAnError();

  std::cout << "osforge_unit_catalog_package_resolver: pass\n";
  return 0;
}

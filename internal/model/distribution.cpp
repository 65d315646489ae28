#include "internal/model/distribution.hpp"

namespace osforge::model {

namespace {

template <typename Enum, std::size_t N>
std::optional<Enum> ParseFrom(const std::array<Enum, N>& values, std::string_view text) {
  for (auto value : values) {
    if (ToString(value) == text) {
      return value;
    }
  }
  return std::nullopt;
}

} // namespace

std::string_view ToString(BaseDistro base) {
  switch (base) {
    case BaseDistro::kArch:
      return "arch";
    case BaseDistro::kDebian:
      return "debian";
    case BaseDistro::kUbuntu:
      return "ubuntu";
    case BaseDistro::kAlpine:
      return "alpine";
    case BaseDistro::kFedora:
      return "fedora";
    case BaseDistro::kOpenSuse:
      return "opensuse";
    case BaseDistro::kVoid:
      return "void";
    case BaseDistro::kGentoo:
      return "gentoo";
  }
  return "unknown";
}

std::string_view ToString(InitSystem init) {
  switch (init) {
    case InitSystem::kSystemd:
      return "systemd";
    case InitSystem::kOpenRc:
      return "openrc";
    case InitSystem::kRunit:
      return "runit";
    case InitSystem::kS6:
      return "s6";
  }
  return "unknown";
}

std::string_view ToString(Architecture arch) {
  switch (arch) {
    case Architecture::kX86_64:
      return "x86_64";
    case Architecture::kAarch64:
      return "aarch64";
  }
  return "unknown";
}

std::optional<BaseDistro> ParseBaseDistro(std::string_view text) {
  return ParseFrom(kAllBaseDistros, text);
}

std::optional<InitSystem> ParseInitSystem(std::string_view text) {
  return ParseFrom(kAllInitSystems, text);
}

std::optional<Architecture> ParseArchitecture(std::string_view text) {
  return ParseFrom(kAllArchitectures, text);
}

bool SupportsInit(BaseDistro base, InitSystem init) {
  switch (base) {
    case BaseDistro::kArch:
      return true;
    case BaseDistro::kDebian:
      return init == InitSystem::kSystemd || init == InitSystem::kOpenRc;
    case BaseDistro::kUbuntu:
    case BaseDistro::kFedora:
    case BaseDistro::kOpenSuse:
      return init == InitSystem::kSystemd;
    case BaseDistro::kAlpine:
      return init == InitSystem::kOpenRc;
    case BaseDistro::kVoid:
      return init == InitSystem::kRunit;
    case BaseDistro::kGentoo:
      return init == InitSystem::kOpenRc || init == InitSystem::kSystemd;
  }
  return false;
}

} // namespace osforge::model

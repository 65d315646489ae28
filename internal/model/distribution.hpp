#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace osforge::model {

enum class BaseDistro : std::uint8_t {
  kArch,
  kDebian,
  kUbuntu,
  kAlpine,
  kFedora,
  kOpenSuse,
  kVoid,
  kGentoo,
};

enum class InitSystem : std::uint8_t {
  kSystemd,
  kOpenRc,
  kRunit,
  kS6,
};

enum class Architecture : std::uint8_t {
  kX86_64,
  kAarch64,
};

inline constexpr std::array<BaseDistro, 8> kAllBaseDistros = {
    BaseDistro::kArch,   BaseDistro::kDebian,   BaseDistro::kUbuntu, BaseDistro::kAlpine,
    BaseDistro::kFedora, BaseDistro::kOpenSuse, BaseDistro::kVoid,   BaseDistro::kGentoo,
};

inline constexpr std::array<InitSystem, 4> kAllInitSystems = {
    InitSystem::kSystemd,
    InitSystem::kOpenRc,
    InitSystem::kRunit,
    InitSystem::kS6,
};

inline constexpr std::array<Architecture, 2> kAllArchitectures = {
    Architecture::kX86_64,
    Architecture::kAarch64,
};

std::string_view ToString(BaseDistro base);
std::string_view ToString(InitSystem init);
std::string_view ToString(Architecture arch);

std::optional<BaseDistro>   ParseBaseDistro(std::string_view text);
std::optional<InitSystem>   ParseInitSystem(std::string_view text);
std::optional<Architecture> ParseArchitecture(std::string_view text);

// Init systems each base distribution ships with.
bool SupportsInit(BaseDistro base, InitSystem init);

} // namespace osforge::model

#include "internal/pipeline/catalog_package_resolver.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/sanitizer.hpp"

namespace osforge::pipeline {

namespace {

// nullptr marks a package that does not exist on that distro.
struct CatalogEntry {
  const char* name;
  const char* arch;
  const char* debian;
  const char* ubuntu;
  const char* alpine;
};

constexpr CatalogEntry kCatalog[] = {
    // containers
    {"docker", "docker", "docker.io", "docker.io", "docker"},
    {"docker-compose", "docker-compose", "docker-compose", "docker-compose", "docker-cli-compose"},
    {"podman", "podman", "podman", "podman", "podman"},
    {"kubernetes", "kubectl", "kubectl", "kubectl", "kubectl"},
    {"k3s", "k3s-bin", nullptr, nullptr, nullptr},
    // languages
    {"python", "python", "python3", "python3", "python3"},
    {"pip", "python-pip", "python3-pip", "python3-pip", "py3-pip"},
    {"nodejs", "nodejs", "nodejs", "nodejs", "nodejs"},
    {"rust", "rust", "rustc", "rustc", "rust"},
    {"go", "go", "golang", "golang", "go"},
    {"java", "jdk-openjdk", "default-jdk", "default-jdk", "openjdk17"},
    // editors and vcs
    {"neovim", "neovim", "neovim", "neovim", "neovim"},
    {"vim", "vim", "vim", "vim", "vim"},
    {"vscode", "code", nullptr, nullptr, nullptr},
    {"git", "git", "git", "git", "git"},
    {"github-cli", "github-cli", "gh", "gh", "github-cli"},
    {"delta", "git-delta", nullptr, nullptr, nullptr},
    // security
    {"apparmor", "apparmor", "apparmor", "apparmor", nullptr},
    {"selinux", nullptr, "selinux-basics", "selinux-basics", nullptr},
    {"nftables", "nftables", "nftables", "nftables", "nftables"},
    {"ufw", "ufw", "ufw", "ufw", nullptr},
    {"fail2ban", "fail2ban", "fail2ban", "fail2ban", "fail2ban"},
    {"firejail", "firejail", "firejail", "firejail", nullptr},
    {"wireshark-cli", "wireshark-cli", "tshark", "tshark", "tshark"},
    {"wireguard", "wireguard-tools", "wireguard", "wireguard", "wireguard-tools"},
    {"tailscale", "tailscale", nullptr, nullptr, "tailscale"},
    // networking and servers
    {"networkmanager", "networkmanager", "network-manager", "network-manager", "networkmanager"},
    {"nginx", "nginx", "nginx", "nginx", "nginx"},
    {"apache", "apache", "apache2", "apache2", "apache2"},
    {"redis", "redis", "redis-server", "redis-server", "redis"},
    {"sqlite", "sqlite", "sqlite3", "sqlite3", "sqlite"},
    // media
    {"ffmpeg", "ffmpeg", "ffmpeg", "ffmpeg", "ffmpeg"},
    {"pipewire", "pipewire", "pipewire", "pipewire", "pipewire"},
    {"alsa-utils", "alsa-utils", "alsa-utils", "alsa-utils", "alsa-utils"},
    // shells and utils
    {"zsh", "zsh", "zsh", "zsh", "zsh"},
    {"fish", "fish", "fish", "fish", "fish"},
    {"yay", "yay", nullptr, nullptr, nullptr},
    {"reflector", "reflector", nullptr, nullptr, nullptr},
    {"curl", "curl", "curl", "curl", "curl"},
    {"htop", "htop", "htop", "htop", "htop"},
    {"fd", "fd", "fd-find", "fd-find", "fd"},
    // display
    {"hyprland", "hyprland", nullptr, nullptr, nullptr},
    {"sway", "sway", "sway", "sway", "sway"},
    {"i3", "i3-wm", "i3", "i3", "i3wm"},
    {"waybar", "waybar", "waybar", "waybar", "waybar"},
    {"rofi-wayland", "rofi-wayland", "rofi", "rofi", "rofi-wayland"},
    {"foot", "foot", "foot", "foot", "foot"},
    {"kitty", "kitty", "kitty", "kitty", "kitty"},
    // browsers
    {"firefox", "firefox", "firefox-esr", "firefox", "firefox"},
    {"chromium", "chromium", "chromium", "chromium-browser", "chromium"},
};

struct MetaPackage {
  const char*              name;
  std::vector<const char*> requires_packages;
  std::vector<const char*> post_install;
};

const std::vector<MetaPackage>& MetaPackages() {
  static const std::vector<MetaPackage> metas = {
      {"oh-my-zsh",
       {"zsh", "git"},
       {"git clone --depth=1 https://github.com/ohmyzsh/ohmyzsh.git /opt/oh-my-zsh", "ln -sf /opt/oh-my-zsh /usr/share/oh-my-zsh"}},
  };
  return metas;
}

constexpr std::string_view kSupportedDistros[] = {"arch", "debian", "ubuntu", "alpine"};

std::string Lower(std::string_view in) {
  std::string out(in);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

const CatalogEntry* FindEntry(const std::string& name) {
  for (const auto& entry : kCatalog) {
    if (name == entry.name) {
      return &entry;
    }
  }
  return nullptr;
}

const MetaPackage* FindMeta(const std::string& name) {
  for (const auto& meta : MetaPackages()) {
    if (name == meta.name) {
      return &meta;
    }
  }
  return nullptr;
}

const char* DistroName(const CatalogEntry& entry, std::string_view distro) {
  if (distro == "arch") return entry.arch;
  if (distro == "debian") return entry.debian;
  if (distro == "ubuntu") return entry.ubuntu;
  return entry.alpine;
}

class Accumulator {
 public:
  explicit Accumulator(std::string_view distro) : distro_(distro) {
  }

  void Add(const std::string& raw) {
    const auto key = Lower(raw);

    if (const auto* meta = FindMeta(key)) {
      for (const auto* prerequisite : meta->requires_packages) {
        Add(prerequisite);
      }
      for (const auto* step : meta->post_install) {
        result_.post_install.emplace_back(step);
      }
      lines_.push_back("meta package " + key + " expanded");
      return;
    }

    const auto* entry = FindEntry(key);
    if (!entry) {
      Push(raw);
      return;
    }

    const char* mapped = DistroName(*entry, distro_);
    if (!mapped) {
      lines_.push_back("warning: package '" + raw + "' is not available on " + std::string(distro_));
      return;
    }
    Push(mapped);
  }

  ToolResult<ResolvedPackageSet> Finish() {
    result_.distro = std::string(distro_);
    lines_.push_back("resolved " + std::to_string(result_.packages.size()) + " packages for " + result_.distro);
    return ToolResult<ResolvedPackageSet>::Ok(std::move(result_), std::move(lines_));
  }

 private:
  void Push(const std::string& name) {
    if (std::find(result_.packages.begin(), result_.packages.end(), name) == result_.packages.end()) {
      result_.packages.push_back(name);
    }
  }

  std::string_view         distro_;
  ResolvedPackageSet       result_;
  std::vector<std::string> lines_;
};

} // namespace

bool CatalogPackageResolver::SupportsDistro(std::string_view distro) {
  return std::find(std::begin(kSupportedDistros), std::end(kSupportedDistros), distro) != std::end(kSupportedDistros);
}

ToolResult<ResolvedPackageSet> CatalogPackageResolver::Resolve(std::string_view distro, const osforge::build::v1::PackageSelection& packages) {
  if (!SupportsDistro(distro)) {
    return ToolResult<ResolvedPackageSet>::Err("no package catalog for base distribution " + std::string(distro));
  }

  Accumulator acc(distro);
  for (const auto* category : {&packages.system(), &packages.dev(), &packages.security(), &packages.utils(), &packages.media(), &packages.browsers()}) {
    for (const auto& name : *category) {
      auto trimmed = std::string(util::Trim(name));
      if (!util::IsValidPackageName(trimmed)) {
        return ToolResult<ResolvedPackageSet>::Err("invalid package name: " + name);
      }
      acc.Add(trimmed);
    }
  }
  return acc.Finish();
}

} // namespace osforge::pipeline

#pragma once

#include "../config.hpp"
#include "../error.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cdihook {

struct SymlinkEntry {
    std::string target;
    std::string link;
};

// Instructions produced for one container start or hot-plug event.
struct HookPlan {
    // Informational; the rootfs to act on is passed separately.
    std::string container_rootfs;
    std::vector<std::string> ld_cache_updates;
    std::vector<SymlinkEntry> symlinks;
};

// Unix char devices and bind mounts, configured by the device subsystem.
struct ConfigDevices {
    std::vector<std::map<std::string, std::string>> unix_char_devs;
    std::vector<std::map<std::string, std::string>> bind_mounts;
};

// out is only assigned when the whole file decodes.
std::optional<Error> load_hook_plan(const std::string& path, HookPlan& out);
std::optional<Error> load_config_devices(const std::string& path, ConfigDevices& out);

std::string hooks_file_name(const HookConfig& config, const std::string& device_name);
std::string config_devices_file_name(const HookConfig& config, const std::string& device_name);

}  // namespace cdihook

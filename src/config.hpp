#pragma once

#include "error.hpp"
#include "log.hpp"

#include <sys/types.h>
#include <optional>
#include <string>

namespace cdihook {

// Names and modes used by every stage. Defaults come from defs.hpp.
struct HookConfig {
    std::string ld_conf_dir;
    std::string ld_conf_file;
    std::string ld_cache_file;
    std::string ldconfig_path;
    std::string hooks_file_suffix;
    std::string config_devices_file_suffix;
    mode_t dir_mode;
    mode_t file_mode;
    // Warn when an existing symlink points somewhere else. It is never replaced.
    bool check_existing_symlinks;
    LogLevel log_level;

    HookConfig();
};

// Reads key=value lines into config. Keys absent from the file keep their value.
std::optional<Error> load_hook_config(const std::string& path, HookConfig& config);

}  // namespace cdihook

#include "config.hpp"
#include "defs.hpp"
#include "utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>

namespace cdihook {

HookConfig::HookConfig()
    : ld_conf_dir(LD_CONF_DIR),
      ld_conf_file(LD_CONF_FILE_NAME),
      ld_cache_file(LD_CACHE_FILE),
      ldconfig_path(LDCONFIG_PATH),
      hooks_file_suffix(HOOKS_FILE_SUFFIX),
      config_devices_file_suffix(CONFIG_DEVICES_FILE_SUFFIX),
      dir_mode(DEFAULT_DIR_MODE),
      file_mode(DEFAULT_FILE_MODE),
      check_existing_symlinks(false),
      log_level(LogLevel::INFO) {}

static bool parse_mode(const std::string& value, mode_t& out) {
    if (value.empty())
        return false;
    char* end = nullptr;
    errno = 0;
    unsigned long mode = strtoul(value.c_str(), &end, 8);
    if (errno != 0 || *end != '\0' || mode > 07777)
        return false;
    out = static_cast<mode_t>(mode);
    return true;
}

static bool parse_bool(const std::string& value, bool& out) {
    if (value == "true" || value == "1" || value == "yes") {
        out = true;
    } else if (value == "false" || value == "0" || value == "no") {
        out = false;
    } else {
        return false;
    }
    return true;
}

std::optional<Error> load_hook_config(const std::string& path, HookConfig& config) {
    std::ifstream ifs(path);
    if (!ifs) {
        return make_errno_error("Failed opening the hook config file", path, errno);
    }

    HookConfig parsed = config;
    std::string line;
    size_t line_no = 0;
    while (std::getline(ifs, line)) {
        line_no++;
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return make_error(ErrorKind::DecodeError,
                              "Missing '=' on line " + std::to_string(line_no) +
                                  " of the hook config file",
                              path);
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        bool ok = true;

        if (key == "ld_conf_dir") {
            parsed.ld_conf_dir = value;
        } else if (key == "ld_conf_file") {
            ok = !value.empty() && value.find('/') == std::string::npos;
            parsed.ld_conf_file = value;
        } else if (key == "ld_cache_file") {
            ok = !value.empty();
            parsed.ld_cache_file = value;
        } else if (key == "ldconfig_path") {
            ok = is_absolute(value);
            parsed.ldconfig_path = value;
        } else if (key == "hooks_file_suffix") {
            ok = !value.empty();
            parsed.hooks_file_suffix = value;
        } else if (key == "config_devices_file_suffix") {
            ok = !value.empty();
            parsed.config_devices_file_suffix = value;
        } else if (key == "dir_mode") {
            ok = parse_mode(value, parsed.dir_mode);
        } else if (key == "file_mode") {
            ok = parse_mode(value, parsed.file_mode);
        } else if (key == "check_existing_symlinks") {
            ok = parse_bool(value, parsed.check_existing_symlinks);
        } else if (key == "log_level") {
            ok = parse_log_level(value, parsed.log_level);
        } else {
            LOGW("Ignoring unknown key '%s' in %s", key.c_str(), path.c_str());
        }

        if (!ok) {
            return make_error(ErrorKind::DecodeError,
                              "Invalid value '" + value + "' for '" + key + "' in the hook config file",
                              path);
        }
    }

    if (ifs.bad()) {
        return make_errno_error("Failed reading the hook config file", path, errno);
    }

    config = parsed;
    return std::nullopt;
}

}  // namespace cdihook

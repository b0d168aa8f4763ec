#pragma once

#include <sys/types.h>
#include <cstdint>

namespace cdihook {

// Version info
constexpr const char* CDIHOOK_VERSION = "1.0.0";
constexpr int CDIHOOK_VERSION_CODE = 10000;

// Configuration
constexpr const char* DEFAULT_CONFIG_PATH = "/etc/cdi-hook.conf";

// Linker paths, relative to the container rootfs
constexpr const char* LD_CONF_DIR = "etc/ld.so.conf.d";
// The 00- prefix makes the fragment sort before every other one.
constexpr const char* LD_CONF_FILE_NAME = "00-cdi-hook.conf";
constexpr const char* LD_CACHE_FILE = "etc/ld.so.cache";

// Host tool, never the container's copy
constexpr const char* LDCONFIG_PATH = "/sbin/ldconfig";

// Sibling artifacts written by the device configuration subsystem
constexpr const char* HOOKS_FILE_SUFFIX = "_cdi_hooks.json";
constexpr const char* CONFIG_DEVICES_FILE_SUFFIX = "_cdi_config_devices.json";

// Environment set by LXC for mount hooks
constexpr const char* LXC_ROOTFS_MOUNT_ENV = "LXC_ROOTFS_MOUNT";

constexpr mode_t DEFAULT_DIR_MODE = 0755;
constexpr mode_t DEFAULT_FILE_MODE = 0644;

}  // namespace cdihook

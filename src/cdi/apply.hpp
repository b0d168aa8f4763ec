#pragma once

#include "../config.hpp"
#include "../error.hpp"
#include "ldconfig.hpp"

#include <optional>
#include <string>

namespace cdihook {

/**
 * Applies a CDI hooks file to a container: creates the symlinks, then merges
 * the ld cache updates into the linker conf fragment and rebuilds the linker
 * cache. Called at container start and on hot-plug, so re-applying the same
 * file is harmless.
 *
 * Callers must serialise invocations against the same rootfs.
 *
 * hooks_file_path: JSON file describing the hooks
 * rootfs: the container's root filesystem mount point, as seen from the host
 */
std::optional<Error> apply_hooks_to_container(const std::string& hooks_file_path,
                                              const std::string& rootfs,
                                              const HookConfig& config, CommandRunner& runner);

std::optional<Error> apply_hooks_to_container(const std::string& hooks_file_path,
                                              const std::string& rootfs);

}  // namespace cdihook

#pragma once

#include "../config.hpp"
#include "../error.hpp"
#include "hooks.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cdihook {

// Path of link inside rootfs. link is cleaned as an absolute path first so
// ".." can't leave rootfs.
std::string rootfs_path(const std::string& rootfs, const std::string& link);

// Checks that every entry resolves, without touching the filesystem.
std::optional<Error> validate_symlinks(const std::vector<SymlinkEntry>& entries);

// Creates the symlinks in order and stops at the first failure. A path that
// already exists counts as created.
std::optional<Error> apply_symlinks(const std::string& rootfs,
                                    const std::vector<SymlinkEntry>& entries,
                                    const HookConfig& config);

}  // namespace cdihook

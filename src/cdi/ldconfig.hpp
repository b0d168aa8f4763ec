#pragma once

#include "../config.hpp"
#include "../error.hpp"
#include "../utils.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cdihook {

// Runs a host command to completion and captures its combined output.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual ExecResult run(const std::vector<std::string>& args) = 0;
};

class HostCommandRunner : public CommandRunner {
public:
    ExecResult run(const std::vector<std::string>& args) override;
};

std::string linker_conf_path(const std::string& rootfs, const HookConfig& config);

/**
 * Appends the entries of updates missing from the linker conf fragment,
 * creating the fragment if needed. Existing lines are never modified or
 * reordered and each entry is written at most once.
 */
std::optional<Error> merge_linker_config(const std::string& rootfs,
                                         const std::vector<std::string>& updates,
                                         const HookConfig& config);

/**
 * Drops the container's ld.so.cache and rebuilds it with the host's
 * ldconfig pointed at rootfs, so nothing from the container is executed.
 */
std::optional<Error> regenerate_linker_cache(const std::string& rootfs, const HookConfig& config,
                                             CommandRunner& runner);

}  // namespace cdihook

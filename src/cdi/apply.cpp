#include "apply.hpp"
#include "../log.hpp"
#include "hooks.hpp"
#include "symlinks.hpp"

#include <sys/stat.h>
#include <cerrno>

namespace cdihook {

std::optional<Error> apply_hooks_to_container(const std::string& hooks_file_path,
                                              const std::string& rootfs,
                                              const HookConfig& config, CommandRunner& runner) {
    struct stat st;
    if (stat(rootfs.c_str(), &st) != 0) {
        return make_errno_error("Failed accessing the container rootfs", rootfs, errno);
    }
    if (!S_ISDIR(st.st_mode)) {
        return make_error(ErrorKind::NotFound, "The container rootfs is not a directory", rootfs,
                          ENOTDIR);
    }

    HookPlan plan;
    if (auto err = load_hook_plan(hooks_file_path, plan))
        return err;

    LOGI("Applying CDI hooks from %s to %s", hooks_file_path.c_str(), rootfs.c_str());
    if (!plan.container_rootfs.empty() && plan.container_rootfs != rootfs) {
        LOGD("Hooks file was written for %s", plan.container_rootfs.c_str());
    }

    // Reject a bad plan before anything is written
    if (auto err = validate_symlinks(plan.symlinks))
        return err;

    if (auto err = apply_symlinks(rootfs, plan.symlinks, config))
        return err;
    LOGI("Applied %zu CDI symlinks", plan.symlinks.size());

    if (plan.ld_cache_updates.empty()) {
        LOGD("No ld cache updates");
        return std::nullopt;
    }

    if (auto err = merge_linker_config(rootfs, plan.ld_cache_updates, config))
        return err;
    LOGI("Merged %zu ld cache entries into %s", plan.ld_cache_updates.size(),
         linker_conf_path(rootfs, config).c_str());

    return regenerate_linker_cache(rootfs, config, runner);
}

std::optional<Error> apply_hooks_to_container(const std::string& hooks_file_path,
                                              const std::string& rootfs) {
    HostCommandRunner runner;
    return apply_hooks_to_container(hooks_file_path, rootfs, HookConfig(), runner);
}

}  // namespace cdihook

#include "symlinks.hpp"
#include "../log.hpp"
#include "../utils.hpp"
#include "path_resolver.hpp"

#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <climits>
#include <cstring>

namespace cdihook {

std::string rootfs_path(const std::string& rootfs, const std::string& link) {
    return clean_path(join_path(rootfs, clean_path("/" + link)));
}

std::optional<Error> validate_symlinks(const std::vector<SymlinkEntry>& entries) {
    for (size_t i = 0; i < entries.size(); i++) {
        std::string target;
        if (auto err = resolve_target_relative_to_link(entries[i].link, entries[i].target, target)) {
            err->message = "Failed resolving a CDI symlink: " + err->message;
            err->entry_index = i;
            return err;
        }
    }

    return std::nullopt;
}

static void warn_if_target_differs(const std::string& path, const std::string& target) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        LOGW("Failed to inspect existing %s: %s", path.c_str(), strerror(errno));
        return;
    }
    if (!S_ISLNK(st.st_mode)) {
        LOGW("%s already exists and is not a symlink, leaving it in place", path.c_str());
        return;
    }

    char buf[PATH_MAX];
    ssize_t len = readlink(path.c_str(), buf, sizeof(buf) - 1);
    if (len < 0) {
        LOGW("Failed to read symlink %s: %s", path.c_str(), strerror(errno));
        return;
    }
    buf[len] = '\0';

    if (target != buf) {
        LOGW("Symlink %s points to %s instead of %s, leaving it in place", path.c_str(), buf,
             target.c_str());
    }
}

std::optional<Error> apply_symlinks(const std::string& rootfs,
                                    const std::vector<SymlinkEntry>& entries,
                                    const HookConfig& config) {
    for (size_t i = 0; i < entries.size(); i++) {
        const SymlinkEntry& entry = entries[i];

        std::string target;
        if (auto err = resolve_target_relative_to_link(entry.link, entry.target, target)) {
            err->message = "Failed resolving a CDI symlink: " + err->message;
            err->entry_index = i;
            return err;
        }

        std::string link_path = rootfs_path(rootfs, entry.link);
        std::string parent = clean_path(link_path + "/..");

        if (!ensure_dir_exists(parent, config.dir_mode)) {
            Error err = make_error(ErrorKind::IOError,
                                   "Failed creating the directory for the CDI symlink", parent,
                                   errno);
            err.entry_index = i;
            err.link = entry.link;
            err.target = entry.target;
            return err;
        }

        if (symlink(target.c_str(), link_path.c_str()) != 0) {
            if (errno != EEXIST) {
                Error err = make_error(ErrorKind::IOError, "Failed creating the CDI symlink",
                                       link_path, errno);
                err.entry_index = i;
                err.link = entry.link;
                err.target = entry.target;
                return err;
            }

            LOGD("%s already exists, keeping it", link_path.c_str());
            if (config.check_existing_symlinks) {
                warn_if_target_differs(link_path, target);
            }
            continue;
        }

        LOGD("Created symlink %s -> %s", link_path.c_str(), target.c_str());
    }

    return std::nullopt;
}

}  // namespace cdihook

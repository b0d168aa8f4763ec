#include "ldconfig.hpp"
#include "../log.hpp"
#include "symlinks.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <sstream>
#include <unordered_set>

namespace cdihook {

ExecResult HostCommandRunner::run(const std::vector<std::string>& args) {
    return exec_command(args);
}

std::string linker_conf_path(const std::string& rootfs, const HookConfig& config) {
    return join_path(rootfs_path(rootfs, config.ld_conf_dir), config.ld_conf_file);
}

static std::string missing_entries(const std::vector<std::string>& updates,
                                   std::unordered_set<std::string>& known) {
    std::string content;
    for (const auto& update : updates) {
        if (known.insert(update).second) {
            content += update;
            content += '\n';
        }
    }
    return content;
}

static std::optional<Error> append_to_existing(const std::string& path,
                                               const std::vector<std::string>& updates) {
    UniqueFd fd(open(path.c_str(), O_RDWR | O_APPEND | O_CLOEXEC));
    if (!fd.valid()) {
        return make_errno_error("Failed opening the linker conf file", path, errno);
    }

    std::string existing;
    if (!read_fd(fd.get(), existing)) {
        return make_error(ErrorKind::IOError, "Failed reading the linker conf file", path, errno);
    }

    std::unordered_set<std::string> known;
    std::istringstream iss(existing);
    std::string line;
    while (std::getline(iss, line)) {
        known.insert(trim(line));
    }

    std::string content = missing_entries(updates, known);
    if (content.empty()) {
        LOGD("%s already has every entry", path.c_str());
        return std::nullopt;
    }
    // Keep the last existing line from merging with the first new one
    if (!existing.empty() && existing.back() != '\n') {
        content.insert(content.begin(), '\n');
    }

    if (!write_all(fd.get(), content)) {
        return make_error(ErrorKind::IOError, "Failed writing to the linker conf file", path,
                          errno);
    }

    LOGD("Appended to %s:\n%s", path.c_str(), content.c_str());
    return std::nullopt;
}

static std::optional<Error> create_new(const std::string& path,
                                       const std::vector<std::string>& updates, mode_t mode) {
    UniqueFd fd(open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, mode));
    if (!fd.valid()) {
        return make_error(ErrorKind::IOError, "Failed creating the linker conf file", path, errno);
    }

    std::unordered_set<std::string> known;
    if (!write_all(fd.get(), missing_entries(updates, known))) {
        return make_error(ErrorKind::IOError, "Failed writing to the linker conf file", path,
                          errno);
    }

    LOGD("Created %s with %zu entries", path.c_str(), known.size());
    return std::nullopt;
}

std::optional<Error> merge_linker_config(const std::string& rootfs,
                                         const std::vector<std::string>& updates,
                                         const HookConfig& config) {
    if (updates.empty())
        return std::nullopt;

    std::string conf_dir = rootfs_path(rootfs, config.ld_conf_dir);
    if (!ensure_dir_exists(conf_dir, config.dir_mode)) {
        return make_error(ErrorKind::IOError, "Failed creating the linker conf directory",
                          conf_dir, errno);
    }

    std::string conf_path = join_path(conf_dir, config.ld_conf_file);
    struct stat st;
    if (stat(conf_path.c_str(), &st) == 0) {
        return append_to_existing(conf_path, updates);
    }
    if (errno == ENOENT) {
        return create_new(conf_path, updates, config.file_mode);
    }

    return make_error(ErrorKind::IOError,
                      "Could not stat the linker conf file to add CDI linker entries", conf_path,
                      errno);
}

std::optional<Error> regenerate_linker_cache(const std::string& rootfs, const HookConfig& config,
                                             CommandRunner& runner) {
    std::string cache_path = rootfs_path(rootfs, config.ld_cache_file);
    if (unlink(cache_path.c_str()) != 0) {
        if (errno != ENOENT) {
            return make_error(ErrorKind::IOError, "Failed removing the linker cache", cache_path,
                              errno);
        }
        LOGD("No linker cache at %s", cache_path.c_str());
    }

    std::vector<std::string> args = {config.ldconfig_path, "-r", rootfs};
    LOGI("Running %s -r %s", config.ldconfig_path.c_str(), rootfs.c_str());

    ExecResult result = runner.run(args);
    if (result.exit_code != 0) {
        Error err = make_error(ErrorKind::SubprocessError,
                               "Failed running ldconfig in the container rootfs",
                               config.ldconfig_path);
        err.exit_code = result.exit_code;
        err.output = result.output;
        return err;
    }

    return std::nullopt;
}

}  // namespace cdihook

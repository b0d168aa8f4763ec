#include "utils.hpp"
#include "log.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

namespace cdihook {

bool ensure_dir_exists(const std::string& path, mode_t mode) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        if (!S_ISDIR(st.st_mode)) {
            errno = ENOTDIR;
            return false;
        }
        return true;
    }

    // Create directory recursively
    std::string current;
    for (char c : path) {
        current += c;
        if (c == '/' && current.size() > 1) {
            if (mkdir(current.c_str(), mode) != 0 && errno != EEXIST) {
                LOGD("Failed to create directory %s: %s", current.c_str(), strerror(errno));
                return false;
            }
        }
    }

    if (mkdir(path.c_str(), mode) != 0 && errno != EEXIST) {
        LOGD("Failed to create directory %s: %s", path.c_str(), strerror(errno));
        return false;
    }

    // EEXIST on the last component may still be a file
    if (stat(path.c_str(), &st) != 0) {
        return false;
    }
    if (!S_ISDIR(st.st_mode)) {
        errno = ENOTDIR;
        return false;
    }

    return true;
}

bool is_absolute(const std::string& path) {
    return !path.empty() && path[0] == '/';
}

std::string join_path(const std::string& base, const std::string& name) {
    if (base.empty())
        return name;
    if (name.empty())
        return base;
    if (base.back() == '/' || name.front() == '/')
        return base + name;
    return base + "/" + name;
}

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos)
        return "";
    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

UniqueFd::~UniqueFd() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

bool read_fd(int fd, std::string& out) {
    char buf[4096];
    for (;;) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n == 0)
            return true;
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        out.append(buf, n);
    }
}

bool write_all(int fd, const std::string& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = write(fd, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        offset += static_cast<size_t>(n);
    }
    return true;
}

ExecResult exec_command(const std::vector<std::string>& args) {
    ExecResult result{-1, ""};

    if (args.empty()) {
        result.output = "no command given";
        return result;
    }

    int output_pipe[2];
    if (pipe2(output_pipe, O_CLOEXEC) != 0) {
        result.output = std::string("pipe: ") + strerror(errno);
        LOGE("Failed to create pipe: %s", strerror(errno));
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.output = std::string("fork: ") + strerror(errno);
        LOGE("Failed to fork: %s", strerror(errno));
        close(output_pipe[0]);
        close(output_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process: both streams share one pipe
        dup2(output_pipe[1], STDOUT_FILENO);
        dup2(output_pipe[1], STDERR_FILENO);

        std::vector<char*> c_args;
        for (const auto& arg : args) {
            c_args.push_back(const_cast<char*>(arg.c_str()));
        }
        c_args.push_back(nullptr);

        execv(c_args[0], c_args.data());
        fprintf(stderr, "exec %s: %s\n", c_args[0], strerror(errno));
        _exit(127);
    }

    // Parent process
    close(output_pipe[1]);

    char buf[1024];
    ssize_t n;
    while ((n = read(output_pipe[0], buf, sizeof(buf))) != 0) {
        if (n < 0) {
            if (errno == EINTR)
                continue;
            break;
        }
        result.output.append(buf, n);
    }
    close(output_pipe[0]);

    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.output += std::string("waitpid: ") + strerror(errno);
            LOGE("Failed to wait for %s: %s", args[0].c_str(), strerror(errno));
            return result;
        }
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    return result;
}

}  // namespace cdihook

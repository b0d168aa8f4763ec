#pragma once

#include <sys/types.h>
#include <string>
#include <vector>

namespace cdihook {

// File system utilities
// On failure errno describes the component that could not be created.
bool ensure_dir_exists(const std::string& path, mode_t mode = 0755);

// Path utilities
bool is_absolute(const std::string& path);
std::string join_path(const std::string& base, const std::string& name);

// String utilities
std::string trim(const std::string& str);

// File I/O
// Owns a file descriptor and closes it on every exit path.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd();

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};

// Reads the whole descriptor. On failure errno is set.
bool read_fd(int fd, std::string& out);
// Retries short writes. On failure errno is set.
bool write_all(int fd, const std::string& data);

// Command execution
struct ExecResult {
    int exit_code;
    // stdout and stderr interleaved as the child wrote them
    std::string output;
};
ExecResult exec_command(const std::vector<std::string>& args);

}  // namespace cdihook

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace cdihook {

enum class ErrorKind {
    NotFound,
    DecodeError,
    InvalidLink,
    PathError,
    IOError,
    SubprocessError,
};

const char* error_kind_name(ErrorKind kind);

// Failure of one pipeline stage. Only the fields relevant to the kind are set.
struct Error {
    ErrorKind kind;
    std::string message;
    std::string path;
    std::optional<size_t> entry_index;
    std::string link;
    std::string target;
    int sys_errno = 0;
    int exit_code = 0;
    std::string output;

    std::string to_string() const;
};

Error make_error(ErrorKind kind, const std::string& message, const std::string& path = "",
                 int sys_errno = 0);

// Maps ENOENT to NotFound and everything else to IOError.
Error make_errno_error(const std::string& message, const std::string& path, int sys_errno);

}  // namespace cdihook

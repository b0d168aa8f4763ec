#include "error.hpp"

#include <cerrno>
#include <cstring>

namespace cdihook {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound:
        return "NotFound";
    case ErrorKind::DecodeError:
        return "DecodeError";
    case ErrorKind::InvalidLink:
        return "InvalidLink";
    case ErrorKind::PathError:
        return "PathError";
    case ErrorKind::IOError:
        return "IOError";
    case ErrorKind::SubprocessError:
        return "SubprocessError";
    }
    return "Unknown";
}

std::string Error::to_string() const {
    std::string result = message;

    if (!path.empty()) {
        result += " at \"" + path + "\"";
    }
    if (entry_index || !link.empty() || !target.empty()) {
        result += " (";
        if (entry_index) {
            result += "entry " + std::to_string(*entry_index) + ", ";
        }
        result += "link: \"" + link + "\", target: \"" + target + "\")";
    }
    if (sys_errno != 0) {
        result += ": ";
        result += strerror(sys_errno);
    }
    if (kind == ErrorKind::SubprocessError) {
        result += ": exit status " + std::to_string(exit_code);
        if (!output.empty()) {
            result += ": " + output;
            // ldconfig output ends with a newline
            while (!result.empty() && (result.back() == '\n' || result.back() == '\r')) {
                result.pop_back();
            }
        }
    }

    return result;
}

Error make_error(ErrorKind kind, const std::string& message, const std::string& path,
                 int sys_errno) {
    Error err{kind, message, path};
    err.sys_errno = sys_errno;
    return err;
}

Error make_errno_error(const std::string& message, const std::string& path, int sys_errno) {
    ErrorKind kind = sys_errno == ENOENT ? ErrorKind::NotFound : ErrorKind::IOError;
    return make_error(kind, message, path, sys_errno);
}

}  // namespace cdihook

#pragma once

#include "../error.hpp"

#include <optional>
#include <string>

namespace cdihook {

// Lexical cleanup: collapses separators, "." and "..", drops a trailing
// separator. Never touches the filesystem. An empty path cleans to ".".
std::string clean_path(const std::string& path);

// Converts target into a path relative to the directory holding link.
// link must be absolute. A relative target is returned as is.
std::optional<Error> resolve_target_relative_to_link(const std::string& link,
                                                     const std::string& target, std::string& out);

}  // namespace cdihook

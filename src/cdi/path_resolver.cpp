#include "path_resolver.hpp"
#include "../utils.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace cdihook {

std::string clean_path(const std::string& path) {
    if (path.empty())
        return ".";

    std::string cleaned = fs::path(path).lexically_normal().string();
    while (cleaned.size() > 1 && cleaned.back() == '/') {
        cleaned.pop_back();
    }
    if (cleaned.empty())
        return ".";
    return cleaned;
}

std::optional<Error> resolve_target_relative_to_link(const std::string& link,
                                                     const std::string& target, std::string& out) {
    if (!is_absolute(link)) {
        Error err = make_error(ErrorKind::InvalidLink, "The link must be an absolute path");
        err.link = link;
        err.target = target;
        return err;
    }

    if (!is_absolute(target)) {
        out = target;
        return std::nullopt;
    }

    fs::path link_dir = fs::path(clean_path(link)).parent_path();
    fs::path rel = fs::path(clean_path(target)).lexically_relative(link_dir);
    if (rel.empty()) {
        Error err = make_error(ErrorKind::PathError,
                               "Can't make the target relative to " + link_dir.string());
        err.link = link;
        err.target = target;
        return err;
    }

    out = rel.string();
    return std::nullopt;
}

}  // namespace cdihook

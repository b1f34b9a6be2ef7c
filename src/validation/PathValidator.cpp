#include "validation/PathValidator.hpp"

#include <algorithm>

namespace tr::validation {

std::string_view stripCurrentDirPrefix(std::string_view path) {
    if (path.starts_with("./")) path.remove_prefix(2);
    return path;
}

Check<PathError> validatePath(const std::string_view path, const FileKind kind) {
    const std::string raw{path};

    if (path.find('\0') != std::string_view::npos || path.find('\n') != std::string_view::npos)
        return Check<PathError>::fail(path_error::InvalidCharacters{raw});

    if (path.find("../") != std::string_view::npos)
        return Check<PathError>::fail(path_error::Traversal{raw});

    const auto stripped = stripCurrentDirPrefix(path);
    const auto& suffixes = suffixesFor(kind);

    const auto matched = std::ranges::find_if(suffixes, [&](const std::string_view suffix) {
        return stripped.ends_with(suffix);
    });
    if (matched == suffixes.end())
        return Check<PathError>::fail(path_error::WrongKind{raw, kind});

    if (stripped == *matched)
        return Check<PathError>::fail(path_error::Malformed{raw});

    return Check<PathError>::pass();
}

std::string normalizeToWorkingDirectory(const std::string_view path, const std::string_view workingDir) {
    if (workingDir.empty() || workingDir == CURRENT_DIRECTORY) return std::string{path};

    std::string prefix{workingDir};
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    prefix.push_back('/');

    const auto stripped = stripCurrentDirPrefix(path);
    if (stripped.starts_with(prefix)) return std::string{stripped.substr(prefix.size())};
    return std::string{path};
}

}

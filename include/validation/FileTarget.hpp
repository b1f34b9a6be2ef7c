#pragma once

#include "validation/Check.hpp"
#include "validation/errors.hpp"
#include "validation/FileKind.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace tr::validation {

[[nodiscard]] Check<LineNumberError> validateLineNumbers(const std::vector<int64_t>& lines);

class ValidatedFileTarget {
public:
    using Result = std::variant<ValidatedFileTarget, TargetError>;

    // Path is checked before line numbers; the first failing rule is reported.
    [[nodiscard]] static Result create(std::string path, const std::vector<int64_t>& lines, FileKind kind);

    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] const std::vector<int64_t>& lineNumbers() const { return lines_; }
    [[nodiscard]] FileKind kind() const { return kind_; }

private:
    ValidatedFileTarget(std::string path, std::vector<int64_t> lines, FileKind kind);

    std::string path_;
    std::vector<int64_t> lines_;
    FileKind kind_;
};

}

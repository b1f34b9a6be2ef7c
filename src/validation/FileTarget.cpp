#include "validation/FileTarget.hpp"
#include "validation/PathValidator.hpp"

namespace tr::validation {

Check<LineNumberError> validateLineNumbers(const std::vector<int64_t>& lines) {
    for (std::size_t i = 0; i < lines.size(); ++i)
        if (lines[i] <= 0) return Check<LineNumberError>::fail({lines[i], i});
    return Check<LineNumberError>::pass();
}

ValidatedFileTarget::ValidatedFileTarget(std::string path, std::vector<int64_t> lines, const FileKind kind)
    : path_(std::move(path)), lines_(std::move(lines)), kind_(kind) {}

ValidatedFileTarget::Result ValidatedFileTarget::create(std::string path,
                                                        const std::vector<int64_t>& lines,
                                                        const FileKind kind) {
    if (const auto check = validatePath(path, kind); !check) return TargetError{*check.error};
    if (const auto check = validateLineNumbers(lines); !check) return TargetError{*check.error};
    return ValidatedFileTarget{std::move(path), lines, kind};
}

}

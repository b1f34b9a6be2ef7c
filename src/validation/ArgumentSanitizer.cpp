#include "validation/ArgumentSanitizer.hpp"
#include "validation/PathValidator.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>

namespace tr::validation {

namespace {

using Result = Check<ArgumentError>;

std::optional<FlagValue> lookupFlag(const std::string_view flag) {
    const auto& rules = flagAllowlist();
    const auto it = std::ranges::find_if(rules, [&](const FlagRule& r) { return r.name == flag; });
    if (it == rules.end()) return std::nullopt;
    return it->value;
}

bool isFlag(const std::string_view token) { return token.starts_with('-'); }

bool isDigits(const std::string_view s) {
    return !s.empty() && std::ranges::all_of(s, [](const char c) { return c >= '0' && c <= '9'; });
}

bool fitsUnsigned64(const std::string_view s) {
    uint64_t v = 0;
    for (const char c : s) {
        const auto digit = static_cast<uint64_t>(c - '0');
        if (v > (std::numeric_limits<uint64_t>::max() - digit) / 10) return false;
        v = v * 10 + digit;
    }
    return true;
}

Result invalidValue(const std::string_view flag, const std::string_view value, std::string reason) {
    return Result::fail(argument_error::InvalidValue{std::string{flag}, std::string{value}, std::move(reason)});
}

Result checkOutputPath(const std::string_view flag, const std::string_view value) {
    if (value.find("../") != std::string_view::npos) return invalidValue(flag, value, "path traversal is not allowed");
    if (value.starts_with('/')) return invalidValue(flag, value, "absolute paths are not allowed");

    const auto& dirs = allowedOutputDirectories();
    const bool allowed = std::ranges::any_of(dirs, [&](const std::string_view dir) { return value.starts_with(dir); });
    if (!allowed) return invalidValue(flag, value, "output must be written under tmp/, log/, coverage/ or spec/reports/");

    return Result::pass();
}

Result checkRequirePath(const std::string_view flag, const std::string_view value) {
    if (value.starts_with('/')) return invalidValue(flag, value, "absolute paths are not allowed");
    if (value.find("../") != std::string_view::npos) return invalidValue(flag, value, "path traversal is not allowed");
    if (!value.ends_with(".rb")) return invalidValue(flag, value, "required files must end with '.rb'");
    return Result::pass();
}

Result checkSeed(const std::string_view flag, const std::string_view value) {
    if (!isDigits(value)) return invalidValue(flag, value, "seed must be a non-negative integer");
    if (!fitsUnsigned64(value)) return invalidValue(flag, value, "seed is out of range");
    return Result::pass();
}

Result checkValue(const FlagValue shape, const std::string_view flag, const std::string_view value) {
    switch (shape) {
    case FlagValue::OutputPath: return checkOutputPath(flag, value);
    case FlagValue::RequirePath: return checkRequirePath(flag, value);
    case FlagValue::Seed: return checkSeed(flag, value);
    case FlagValue::Optional:
        if (!isDigits(value)) return invalidValue(flag, value, "value must be numeric");
        return Result::pass();
    case FlagValue::None:
    case FlagValue::Free:
        return Result::pass();
    }
    return Result::pass();
}

}

const std::vector<FlagRule>& flagAllowlist() {
    static const std::vector<FlagRule> rules = {
        {"--out", FlagValue::OutputPath},
        {"-o", FlagValue::OutputPath},
        {"--deprecation-out", FlagValue::OutputPath},
        {"--require", FlagValue::RequirePath},
        {"-r", FlagValue::RequirePath},
        {"--seed", FlagValue::Seed},
        {"--format", FlagValue::Free},
        {"-f", FlagValue::Free},
        {"--tag", FlagValue::Free},
        {"-t", FlagValue::Free},
        {"--example", FlagValue::Free},
        {"-e", FlagValue::Free},
        {"--pattern", FlagValue::Free},
        {"-P", FlagValue::Free},
        {"--order", FlagValue::Free},
        {"--profile", FlagValue::Optional},
        {"-p", FlagValue::Optional},
        {"--no-profile", FlagValue::None},
        {"--backtrace", FlagValue::None},
        {"-b", FlagValue::None},
        {"--color", FlagValue::None},
        {"--no-color", FlagValue::None},
        {"--force-color", FlagValue::None},
        {"--dry-run", FlagValue::None},
        {"--fail-fast", FlagValue::None},
        {"--no-fail-fast", FlagValue::None},
        {"--warnings", FlagValue::None},
        {"-w", FlagValue::None},
    };
    return rules;
}

const std::vector<std::string_view>& allowedOutputDirectories() {
    static const std::vector<std::string_view> dirs = {"tmp/", "log/", "coverage/", "spec/reports/"};
    return dirs;
}

Check<ArgumentError> sanitizeToken(const std::string_view token, const std::size_t index) {
    if (token.size() > MAX_ARGUMENT_LENGTH)
        return Result::fail(argument_error::ArgumentTooLong{index, token.size()});

    if (const auto pos = token.find_first_of(DANGEROUS_CHARACTERS); pos != std::string_view::npos)
        return Result::fail(argument_error::DangerousCharacter{std::string{token}, token[pos]});

    return Result::pass();
}

Check<ArgumentError> validateArguments(const std::vector<std::string>& tokens) {
    if (tokens.size() > MAX_ARGUMENTS) return Result::fail(argument_error::TooManyArguments{tokens.size()});

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];
        if (auto check = sanitizeToken(token, i); !check) return check;

        if (!isFlag(token)) {
            if (auto check = validatePath(token, FileKind::Rspec); !check)
                return Result::fail(argument_error::InvalidPath{*check.error});
            continue;
        }

        const auto shape = lookupFlag(token);
        if (!shape) return Result::fail(argument_error::DisallowedFlag{token});

        if (*shape == FlagValue::None) continue;

        const bool hasNext = i + 1 < tokens.size() && !isFlag(tokens[i + 1]);

        if (*shape == FlagValue::Optional) {
            if (!hasNext) continue;
        } else if (!hasNext) {
            return Result::fail(argument_error::MissingValue{token});
        }

        const std::string& value = tokens[++i];
        if (auto check = sanitizeToken(value, i); !check) return check;
        if (auto check = checkValue(*shape, token, value); !check) return check;
    }

    return Result::pass();
}

}

#include "process/Invocation.hpp"

#include <algorithm>
#include <fmt/core.h>

namespace tr::process {

namespace {

bool needsQuotes(const std::string_view s) {
    if (s.empty()) return true;
    return std::ranges::any_of(s, [](const char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '"' || c == '\'' || c == '\\';
    });
}

std::string dqQuote(const std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (const char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

}

std::vector<std::string> Invocation::argv() const {
    std::vector<std::string> out;
    out.reserve(1 + args.size());
    out.push_back(program);
    out.insert(out.end(), args.begin(), args.end());
    return out;
}

std::string Invocation::commandLine() const {
    std::string out;
    for (const auto& token : argv()) {
        if (!out.empty()) out.push_back(' ');
        out += needsQuotes(token) ? dqQuote(token) : token;
    }
    return out;
}

std::string ExecutionResult::exitCodeString() const {
    if (exit_code) return std::to_string(*exit_code);
    if (term_signal) return fmt::format("unknown (signal {})", *term_signal);
    return "unknown";
}

}

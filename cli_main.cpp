#include "config/Config.hpp"
#include "protocols/framing.hpp"
#include "protocols/tools/types.hpp"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <fmt/core.h>

using nlohmann::json;
using namespace tr::protocols;

namespace {

constexpr int EXIT_INVALID = 2;

int usage() {
    fmt::print(stderr,
               "usage: trctl [-s socket] <command> [args...]\n"
               "  rspec <file> [line...]     run one spec file, optionally at line numbers\n"
               "  rspec-args [--] <arg...>   run rspec with an allowlisted argument list\n"
               "  cypress <file>             run one Cypress spec\n"
               "  tools                      list the server's tools\n"
               "  info                       show server name and version\n");
    return EXIT_INVALID;
}

bool parseLine(const std::string& s, int64_t& out) {
    const auto* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, out);
    return ec == std::errc() && ptr == end;
}

int connectTo(const std::string& path) {
    const int s = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (s < 0) return -1;
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", path.c_str());
    if (::connect(s, reinterpret_cast<sockaddr*>(&addr), sizeof(sa_family_t) + std::strlen(addr.sun_path) + 1) != 0) {
        const int saved = errno;
        ::close(s);
        errno = saved;
        return -1;
    }
    return s;
}

int printReply(const std::string& command, const json& r) {
    if (!r.value("ok", false)) {
        const auto& err = r.contains("error") ? r["error"] : json::object();
        const int code = err.value("code", 0);
        fmt::print(stderr, "{}\n", err.value("message", std::string{"unknown error"}));
        return code == static_cast<int>(tr::tools::ErrorCode::InvalidParams) ? EXIT_INVALID : 1;
    }

    if (command == "tools") {
        for (const auto& t : r["tools"]) fmt::print("{:<16} {}\n", t["name"].get<std::string>(), t["description"].get<std::string>());
    } else if (command == "info") {
        const auto& s = r["server"];
        fmt::print("{} {}\n{}\n", s["name"].get<std::string>(), s["version"].get<std::string>(),
                   s["instructions"].get<std::string>());
    } else {
        fmt::print("{}\n", r["content"].get<std::string>());
    }
    return 0;
}

}

int main(int argc, char** argv) {
    std::string socketPath = tr::config::ServerConfig{}.socket_path;

    int i = 1;
    if (i + 1 < argc && std::strcmp(argv[i], "-s") == 0) {
        socketPath = argv[i + 1];
        i += 2;
    }
    if (i >= argc) return usage();

    const std::string command = argv[i++];
    std::vector<std::string> rest(argv + i, argv + argc);

    json req;
    if (command == "rspec") {
        if (rest.empty()) return usage();
        std::vector<int64_t> lines;
        for (size_t k = 1; k < rest.size(); ++k) {
            int64_t n = 0;
            if (!parseLine(rest[k], n)) {
                fmt::print(stderr, "trctl: line number '{}' is not an integer\n", rest[k]);
                return EXIT_INVALID;
            }
            lines.push_back(n);
        }
        req = {{"method", "tools/call"}, {"tool", "run_rspec"}, {"arguments", {{"file", rest[0]}}}};
        if (!lines.empty()) req["arguments"]["line_numbers"] = lines;
    } else if (command == "rspec-args") {
        if (!rest.empty() && rest.front() == "--") rest.erase(rest.begin());
        req = {{"method", "tools/call"}, {"tool", "run_rspec_args"}, {"arguments", {{"args", rest}}}};
    } else if (command == "cypress") {
        if (rest.size() != 1) return usage();
        req = {{"method", "tools/call"}, {"tool", "run_cypress"}, {"arguments", {{"file", rest[0]}}}};
    } else if (command == "tools") {
        req = {{"method", "tools/list"}};
    } else if (command == "info") {
        req = {{"method", "server/info"}};
    } else {
        return usage();
    }

    const int s = connectTo(socketPath);
    if (s < 0) {
        fmt::print(stderr, "trctl: connect {}: {}\n", socketPath, std::strerror(errno));
        return 1;
    }

    try {
        if (!sendJson(s, req)) {
            fmt::print(stderr, "trctl: failed to send request\n");
            ::close(s);
            return 1;
        }
        // Replies carry whole test reports; they are not bound by the request cap
        const auto reply = recvJson(s, UINT32_MAX);
        ::close(s);
        return printReply(command, reply);
    } catch (const std::exception& e) {
        ::close(s);
        fmt::print(stderr, "trctl: {}\n", e.what());
        return 1;
    }
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace tr::protocols {

// Frames are a 4-byte big-endian length followed by that many bytes of JSON.

inline constexpr size_t FRAME_HEADER_BYTES = 4;

struct FrameTooLarge : std::runtime_error {
    uint32_t length;
    size_t limit;

    FrameTooLarge(uint32_t len, size_t max);
};

bool readn(int fd, void* buf, size_t n);
bool writen(int fd, const void* buf, size_t n);

// Returns false if the peer went away mid-frame.
[[nodiscard]] bool sendFrame(int fd, const std::string& body);
[[nodiscard]] bool sendJson(int fd, const nlohmann::json& j);

// Throws FrameTooLarge before reading an oversized body, std::runtime_error on EOF.
[[nodiscard]] std::string recvFrame(int fd, size_t maxBytes);
[[nodiscard]] nlohmann::json recvJson(int fd, size_t maxBytes);

}

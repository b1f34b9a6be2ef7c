#pragma once

#include <stdexcept>
#include <string>

namespace tr::runner {

// Caller supplied something the validators rejected; nothing was spawned.
class InvalidParams : public std::invalid_argument {
public:
    explicit InvalidParams(const std::string& msg) : std::invalid_argument(msg) {}
};

// The environment failed us (runner binary missing, fork failed, ...).
class InternalError : public std::runtime_error {
public:
    explicit InternalError(const std::string& msg) : std::runtime_error(msg) {}
};

}

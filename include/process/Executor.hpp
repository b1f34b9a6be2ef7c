#pragma once

#include "process/Invocation.hpp"

#include <stdexcept>
#include <string>

namespace tr::process {

// The process could not be started at all (fork, pipe, chdir or exec failed).
class SpawnError : public std::runtime_error {
public:
    SpawnError(std::string program, std::string stage, int err);

    [[nodiscard]] const std::string& program() const noexcept { return program_; }
    [[nodiscard]] const std::string& stage() const noexcept { return stage_; }
    [[nodiscard]] int error() const noexcept { return errno_; }

private:
    std::string program_;
    std::string stage_;
    int errno_;
};

class Executor {
public:
    virtual ~Executor() = default;

    /**
     * Spawns the invocation, waits for it to exit and returns everything it wrote.
     * stdin is /dev/null; stdout and stderr are captured in full. There is no timeout.
     * A non-zero exit code is returned as data; only failing to start throws SpawnError.
     */
    [[nodiscard]] virtual ExecutionResult run(const Invocation& invocation) const;
};

}

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/askai_errors.hpp"

namespace askai::process {

struct LaunchSpec {
    std::string program;
    std::vector<std::string> args;
    // Directories searched before PATH, also prepended to the child's PATH.
    std::vector<std::string> search_paths;
};

struct ProcessOutcome {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
};

using CompletionCallback = std::function<void(ProcessOutcome)>;

// A launched process. Owned by whoever launched it for one attempt.
class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    // Kills the process if it is still running and waits until it is reaped.
    // The completion callback never fires after terminate() returns.
    // Safe to call more than once and from several threads.
    virtual void terminate() = 0;

    virtual bool running() const = 0;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // Starts `spec.program` with `spec.args`. `on_exit` fires at most once,
    // asynchronously, after the process exits and its output is drained.
    virtual core::errors::Result<std::shared_ptr<ProcessHandle>> launch(
        const LaunchSpec& spec, CompletionCallback on_exit) = 0;
};

}  // namespace askai::process

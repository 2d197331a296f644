#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>
#include "process/process_launcher.hpp"

namespace askai::process {

// Child process watched by a dedicated thread that drains stdout/stderr and
// reaps the child. The child leads its own process group, and the group is
// killed before the child is reaped, so nothing it spawned outlives it.
class PosixProcessHandle final : public ProcessHandle {
public:
    PosixProcessHandle(pid_t pid, int stdout_fd, int stderr_fd);
    ~PosixProcessHandle() override;

    PosixProcessHandle(const PosixProcessHandle&) = delete;
    PosixProcessHandle& operator=(const PosixProcessHandle&) = delete;

    void start(CompletionCallback on_exit);
    void terminate() override;
    bool running() const override;

    pid_t pid() const { return pid_; }

private:
    void watch(CompletionCallback on_exit);
    void join_watcher();

    const pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;

    mutable std::mutex reap_mutex_;
    bool reaped_ = false;
    std::atomic_bool terminated_{false};

    std::mutex join_mutex_;
    std::thread watcher_;
};

class PosixProcessLauncher final : public ProcessLauncher {
public:
    core::errors::Result<std::shared_ptr<ProcessHandle>> launch(
        const LaunchSpec& spec, CompletionCallback on_exit) override;

    // Absolute path of `program` found in `search_paths` then PATH; programs
    // containing '/' are returned as-is when executable.
    static core::errors::Result<std::string> resolve_program(
        const std::string& program, const std::vector<std::string>& search_paths);
};

}  // namespace askai::process

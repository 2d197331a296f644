#include "process/posix_process_launcher.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/text/text_utils.hpp"

extern char** environ;

namespace askai::process {

using core::errors::AskAiError;
using core::errors::ErrorCategory;

namespace {

constexpr int kPollIntervalMs = 50;
// Output still held open by grandchildren is abandoned after this long.
constexpr auto kPostExitDrainLimit = std::chrono::milliseconds(500);

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

// Both ends close on exec so concurrently launched children never inherit
// another attempt's pipes.
bool open_pipe(int fds[2]) {
    if (pipe(fds) != 0) {
        return false;
    }
    for (int i = 0; i < 2; ++i) {
        const int flags = fcntl(fds[i], F_GETFD, 0);
        if (flags == -1 || fcntl(fds[i], F_SETFD, flags | FD_CLOEXEC) == -1) {
            static_cast<void>(close(fds[0]));
            static_cast<void>(close(fds[1]));
            fds[0] = -1;
            fds[1] = -1;
            return false;
        }
    }
    return true;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void drain_pipe(int& fd, std::string& out) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        close_fd(fd);
        return;
    }
}

bool is_executable(const std::string& path) {
    return !path.empty() && access(path.c_str(), X_OK) == 0;
}

std::vector<std::string> split_path(const std::string& value) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= value.size()) {
        const std::size_t colon = value.find(':', start);
        const std::size_t end = colon == std::string::npos ? value.size() : colon;
        if (end > start) {
            parts.push_back(value.substr(start, end - start));
        }
        if (colon == std::string::npos) {
            break;
        }
        start = colon + 1;
    }
    return parts;
}

std::string build_path_variable(const std::vector<std::string>& search_paths) {
    std::string path;
    for (const auto& dir : search_paths) {
        if (!path.empty()) {
            path += ":";
        }
        path += core::text::expand_home(dir);
    }
    const char* inherited = std::getenv("PATH");
    if (inherited != nullptr && inherited[0] != '\0') {
        if (!path.empty()) {
            path += ":";
        }
        path += inherited;
    }
    return path;
}

// Environment for the child, with PATH replaced when extra paths are set.
std::vector<std::string> build_environment(const std::vector<std::string>& search_paths) {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        if (!search_paths.empty() && std::strncmp(*entry, "PATH=", 5) == 0) {
            continue;
        }
        env.emplace_back(*entry);
    }
    if (!search_paths.empty()) {
        env.push_back("PATH=" + build_path_variable(search_paths));
    }
    return env;
}

std::vector<char*> to_c_array(std::vector<std::string>& values) {
    std::vector<char*> pointers;
    pointers.reserve(values.size() + 1);
    for (auto& value : values) {
        pointers.push_back(value.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

}  // namespace

PosixProcessHandle::PosixProcessHandle(const pid_t pid, const int stdout_fd,
                                       const int stderr_fd)
    : pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

PosixProcessHandle::~PosixProcessHandle() {
    terminate();
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (watcher_.joinable()) {
        // Only reachable when the last owner drops the handle from inside the
        // completion callback.
        watcher_.detach();
    }
}

void PosixProcessHandle::start(CompletionCallback on_exit) {
    std::lock_guard<std::mutex> lock(join_mutex_);
    watcher_ = std::thread(&PosixProcessHandle::watch, this, std::move(on_exit));
}

bool PosixProcessHandle::running() const {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    return !reaped_;
}

void PosixProcessHandle::terminate() {
    terminated_.store(true);
    {
        std::lock_guard<std::mutex> lock(reap_mutex_);
        if (!reaped_) {
            static_cast<void>(kill(-pid_, SIGKILL));
            static_cast<void>(kill(pid_, SIGKILL));
            LOG_DEBUG("Killed process " + std::to_string(pid_));
        }
    }
    join_watcher();
}

void PosixProcessHandle::join_watcher() {
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (watcher_.joinable() && watcher_.get_id() != std::this_thread::get_id()) {
        watcher_.join();
    }
}

void PosixProcessHandle::watch(CompletionCallback on_exit) {
    ProcessOutcome outcome;
    bool child_exited = false;
    bool child_lost = false;
    std::chrono::steady_clock::time_point exited_at;

    while (true) {
        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_fd_ >= 0) {
            fds[nfds].fd = stdout_fd_;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_fd_ >= 0) {
            fds[nfds].fd = stderr_fd_;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        static_cast<void>(poll(nfds > 0 ? fds : nullptr, nfds, kPollIntervalMs));

        drain_pipe(stdout_fd_, outcome.stdout_text);
        drain_pipe(stderr_fd_, outcome.stderr_text);

        if (!child_exited) {
            // WNOWAIT leaves the leader unreaped, so its pid and process group
            // id stay reserved until the group has been killed.
            siginfo_t info{};
            const int rc = waitid(P_PID, static_cast<id_t>(pid_), &info,
                                  WEXITED | WNOHANG | WNOWAIT);
            if (rc == 0 && info.si_pid == pid_) {
                child_exited = true;
                exited_at = std::chrono::steady_clock::now();
            } else if (rc < 0 && errno != EINTR) {
                child_exited = true;
                child_lost = true;
                exited_at = std::chrono::steady_clock::now();
            }
        }

        if (!child_exited) {
            continue;
        }
        const bool drained = stdout_fd_ < 0 && stderr_fd_ < 0;
        if (drained || terminated_.load() ||
            std::chrono::steady_clock::now() - exited_at > kPostExitDrainLimit) {
            break;
        }
    }

    int status = -1;
    {
        std::lock_guard<std::mutex> lock(reap_mutex_);
        if (!child_lost) {
            // Anything the leader left behind dies with it.
            static_cast<void>(kill(-pid_, SIGKILL));
            pid_t waited = -1;
            do {
                waited = waitpid(pid_, &status, 0);
            } while (waited < 0 && errno == EINTR);
            if (waited != pid_) {
                status = -1;
            }
        }
        reaped_ = true;
    }

    close_fd(stdout_fd_);
    close_fd(stderr_fd_);

    if (status == -1) {
        outcome.exit_code = -1;
    } else if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exit_code = 128 + WTERMSIG(status);
    } else {
        outcome.exit_code = -1;
    }

    if (!terminated_.load()) {
        on_exit(std::move(outcome));
    }
}

core::errors::Result<std::string> PosixProcessLauncher::resolve_program(
    const std::string& program, const std::vector<std::string>& search_paths) {
    if (program.empty()) {
        return AskAiError{ErrorCategory::Provider, "Provider command is empty.",
                          "process_error"};
    }

    const std::string expanded = core::text::expand_home(program);
    if (expanded.find('/') != std::string::npos) {
        if (is_executable(expanded)) {
            return expanded;
        }
        return AskAiError{ErrorCategory::Provider,
                          "Command is not executable: " + expanded, "process_error"};
    }

    std::vector<std::string> dirs;
    for (const auto& dir : search_paths) {
        dirs.push_back(core::text::expand_home(dir));
    }
    const char* inherited = std::getenv("PATH");
    if (inherited != nullptr) {
        for (auto& dir : split_path(inherited)) {
            dirs.push_back(std::move(dir));
        }
    }

    for (const auto& dir : dirs) {
        const std::string candidate = dir + "/" + expanded;
        if (is_executable(candidate)) {
            return candidate;
        }
    }
    return AskAiError{ErrorCategory::Provider, "Command not found: " + expanded,
                      "process_error",
                      "Install the provider CLI or add its directory to environment.paths."};
}

core::errors::Result<std::shared_ptr<ProcessHandle>> PosixProcessLauncher::launch(
    const LaunchSpec& spec, CompletionCallback on_exit) {
    auto resolved = resolve_program(spec.program, spec.search_paths);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::string executable = core::errors::get_value(resolved);

    // Everything the child needs is allocated before fork().
    std::vector<std::string> argv_storage;
    argv_storage.reserve(spec.args.size() + 1);
    argv_storage.push_back(spec.program);
    for (const auto& arg : spec.args) {
        argv_storage.push_back(arg);
    }
    std::vector<std::string> env_storage = build_environment(spec.search_paths);
    std::vector<char*> argv = to_c_array(argv_storage);
    std::vector<char*> envp = to_c_array(env_storage);
    const std::string exec_failure = "askai: failed to execute " + executable + "\n";

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (!open_pipe(stdout_pipe)) {
        return AskAiError{ErrorCategory::Internal, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }
    if (!open_pipe(stderr_pipe)) {
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        return AskAiError{ErrorCategory::Internal, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }
    int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);

    const pid_t pid = fork();
    if (pid < 0) {
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]);
        close_fd(stderr_pipe[1]);
        close_fd(null_fd);
        return AskAiError{ErrorCategory::Internal, "Failed to fork process.",
                          "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        if (null_fd >= 0) {
            static_cast<void>(dup2(null_fd, STDIN_FILENO));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        execve(executable.c_str(), argv.data(), envp.data());
        static_cast<void>(write(STDERR_FILENO, exec_failure.data(), exec_failure.size()));
        _exit(127);
    }

    // Also set from the parent so kill(-pid) works even before the child runs.
    static_cast<void>(setpgid(pid, pid));
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(null_fd);
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    LOG_DEBUG("Launched " + executable + " as pid " + std::to_string(pid));

    auto handle = std::make_shared<PosixProcessHandle>(pid, stdout_pipe[0], stderr_pipe[0]);
    handle->start(std::move(on_exit));
    return std::shared_ptr<ProcessHandle>(handle);
}

}  // namespace askai::process

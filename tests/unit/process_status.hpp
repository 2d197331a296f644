#pragma once

#include <chrono>
#include <fstream>
#include <iterator>
#include <signal.h>
#include <string>
#include <sys/types.h>
#include <thread>

namespace askai::testing {

// Zombies left to a non-reaping init count as gone.
inline bool is_process_alive(const pid_t pid) {
    if (pid <= 0 || kill(pid, 0) == -1) {
        return false;
    }
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat) {
        return true;
    }
    const std::string line((std::istreambuf_iterator<char>(stat)),
                           std::istreambuf_iterator<char>());
    const std::size_t paren = line.rfind(')');
    if (paren == std::string::npos || paren + 2 >= line.size()) {
        return true;
    }
    const char state = line[paren + 2];
    return state != 'Z' && state != 'X';
}

// Signal delivery is asynchronous, so allow the kernel a moment.
inline bool wait_until_gone(const pid_t pid,
                            const std::chrono::milliseconds limit = std::chrono::seconds(1)) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (is_process_alive(pid)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

}  // namespace askai::testing

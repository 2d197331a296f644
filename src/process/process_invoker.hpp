#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "process/process_launcher.hpp"
#include "protocol/invocation_contract.hpp"
#include "registry/provider_registry.hpp"

namespace askai::process {

// Runs one provider attempt with a deadline. Every call owns its own attempt
// state, so a single invoker can be shared by concurrent requests.
class ProcessInvoker {
public:
    explicit ProcessInvoker(std::shared_ptr<ProcessLauncher> launcher,
                            std::vector<std::string> search_paths = {});

    // Blocks until the process exits, the timeout elapses or `cancel_token` is
    // set. The process is no longer running when this returns.
    protocol::InvocationResult invoke(
        const registry::ProviderSpec& spec, const std::string& prompt,
        std::chrono::milliseconds timeout,
        const std::shared_ptr<std::atomic_bool>& cancel_token = nullptr) const;

    // Provider arguments with ${prompt} substituted, or the prompt appended
    // when no argument references it.
    static std::vector<std::string> build_arguments(const registry::ProviderSpec& spec,
                                                    const std::string& prompt);

    static protocol::InvocationResult classify(const ProcessOutcome& outcome);

private:
    std::shared_ptr<ProcessLauncher> launcher_;
    std::vector<std::string> search_paths_;
};

}  // namespace askai::process

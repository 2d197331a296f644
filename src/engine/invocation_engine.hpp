#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "config/app_config.hpp"
#include "process/process_invoker.hpp"
#include "process/process_launcher.hpp"
#include "prompt/prompt_library.hpp"
#include "protocol/invocation_contract.hpp"
#include "registry/provider_registry.hpp"
#include "session/request_tracker.hpp"

namespace askai::engine {

struct CallOptions {
    bool allow_fallback = true;
    std::optional<std::chrono::milliseconds> timeout;  // replaces every provider timeout
};

// Renders prompts, resolves the provider chain and invokes providers in order
// until one succeeds. Thread-safe; independent requests run concurrently.
class InvocationEngine {
public:
    InvocationEngine(config::AppConfig config,
                     std::shared_ptr<process::ProcessLauncher> launcher);
    ~InvocationEngine();

    InvocationEngine(const InvocationEngine&) = delete;
    InvocationEngine& operator=(const InvocationEngine&) = delete;

    // Sends `prompt` verbatim to `provider_id` (empty selects the default),
    // falling back through the chain unless disabled. A failure message is
    // prefixed with the id of the last provider tried.
    protocol::OperationOutcome call(const std::string& provider_id,
                                    const std::string& prompt,
                                    const CallOptions& options = {});

    protocol::OperationOutcome perform_operation(const std::string& operation_id,
                                                 const std::string& text,
                                                 const protocol::ParamMap& params = {});

    protocol::InvocationResult perform(const protocol::InvocationRequest& request);

    // Runs on its own thread. The engine must outlive the returned future.
    std::future<protocol::OperationOutcome> perform_operation_async(
        std::string operation_id, std::string text, protocol::ParamMap params = {});

    // Cancels in-flight requests and waits for them to return. Later requests
    // fail immediately.
    void shutdown();

    bool is_shut_down() const;
    std::size_t in_flight_count() const { return tracker_.in_flight_count(); }

    const config::AppConfig& config() const { return config_; }
    const prompt::PromptLibrary& prompt_library() const { return library_; }
    const registry::ProviderRegistry& registry() const { return registry_; }

private:
    struct ChainOutcome {
        protocol::InvocationResult result;
        std::string last_provider_id;
    };

    ChainOutcome run_chain(const std::string& request_id,
                           const std::vector<registry::ProviderSpec>& chain,
                           const std::string& prompt,
                           const std::optional<std::chrono::milliseconds>& timeout_override);

    protocol::InvocationResult reject(const std::string& request_id,
                                      const core::errors::AskAiError& error);

    std::chrono::milliseconds timeout_for(
        const registry::ProviderSpec& spec,
        const std::optional<std::chrono::milliseconds>& timeout_override) const;

    bool enter();
    void leave();

    const config::AppConfig config_;
    const prompt::PromptLibrary library_;
    const registry::ProviderRegistry registry_;
    const process::ProcessInvoker invoker_;
    session::RequestTracker tracker_;

    mutable std::mutex lifecycle_mutex_;
    std::condition_variable idle_cv_;
    std::size_t active_requests_ = 0;
    bool shut_down_ = false;
};

}  // namespace askai::engine

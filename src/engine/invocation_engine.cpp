#include "engine/invocation_engine.hpp"

#include <functional>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/text/text_utils.hpp"

namespace askai::engine {

using core::errors::AskAiError;
using core::errors::ErrorCategory;
using protocol::InvocationRequest;
using protocol::InvocationResult;
using protocol::OperationOutcome;

namespace {

AskAiError shut_down_error() {
    return AskAiError{ErrorCategory::Execution, "Engine is shut down", "shut_down"};
}

AskAiError cancelled_error() {
    return AskAiError{ErrorCategory::Execution, "Operation cancelled", "cancelled"};
}

std::string tag(const std::string& request_id) {
    return "[" + request_id + "] ";
}

void note_transition(const std::string& request_id,
                     const core::errors::Result<session::RequestState>& result) {
    if (core::errors::is_error(result)) {
        LOG_DEBUG(tag(request_id) + core::errors::get_error(result).message);
    }
}

// Leaves the engine's active-request count when a request returns.
class ActiveScope {
public:
    explicit ActiveScope(std::function<void()> on_exit) : on_exit_(std::move(on_exit)) {}
    ~ActiveScope() { on_exit_(); }

    ActiveScope(const ActiveScope&) = delete;
    ActiveScope& operator=(const ActiveScope&) = delete;

private:
    std::function<void()> on_exit_;
};

}  // namespace

InvocationEngine::InvocationEngine(config::AppConfig config,
                                   std::shared_ptr<process::ProcessLauncher> launcher)
    : config_(std::move(config)),
      library_(config_.operations),
      registry_(config_.providers, config_.default_provider),
      invoker_(std::move(launcher), config_.search_paths) {
    for (const auto& issue : registry_.validate()) {
        LOG_WARN("Config: " + issue);
    }
}

InvocationEngine::~InvocationEngine() {
    shutdown();
}

bool InvocationEngine::enter() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (shut_down_) {
        return false;
    }
    ++active_requests_;
    return true;
}

void InvocationEngine::leave() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    --active_requests_;
    if (active_requests_ == 0) {
        idle_cv_.notify_all();
    }
}

bool InvocationEngine::is_shut_down() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return shut_down_;
}

void InvocationEngine::shutdown() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (!shut_down_) {
            shut_down_ = true;
            LOG_DEBUG("InvocationEngine: shutting down");
        }
    }

    const std::size_t cancelled = tracker_.cancel_all();
    if (cancelled > 0) {
        LOG_INFO("InvocationEngine: cancelled " + std::to_string(cancelled) +
                 " in-flight request(s)");
    }

    std::unique_lock<std::mutex> lock(lifecycle_mutex_);
    idle_cv_.wait(lock, [this] { return active_requests_ == 0; });
}

std::chrono::milliseconds InvocationEngine::timeout_for(
    const registry::ProviderSpec& spec,
    const std::optional<std::chrono::milliseconds>& timeout_override) const {
    if (timeout_override) {
        return *timeout_override;
    }
    if (spec.timeout) {
        return *spec.timeout;
    }
    return config_.timeout;
}

InvocationResult InvocationEngine::reject(const std::string& request_id,
                                          const AskAiError& error) {
    LOG_DEBUG(tag(request_id) + "rejected: " + error.message);
    note_transition(request_id, tracker_.mark_rejected(request_id, error.message));
    tracker_.finish(request_id);
    return error;
}

InvocationEngine::ChainOutcome InvocationEngine::run_chain(
    const std::string& request_id, const std::vector<registry::ProviderSpec>& chain,
    const std::string& prompt,
    const std::optional<std::chrono::milliseconds>& timeout_override) {
    auto token_result = tracker_.get_cancel_token(request_id);
    if (core::errors::is_error(token_result)) {
        return ChainOutcome{core::errors::get_error(token_result), ""};
    }
    const auto cancel_token = core::errors::get_value(token_result);

    ChainOutcome outcome{AskAiError{ErrorCategory::Input, "No provider configured",
                                    "no_provider_configured"},
                         ""};
    for (std::size_t i = 0; i < chain.size(); ++i) {
        const auto& provider = chain[i];
        if (cancel_token->load() || is_shut_down()) {
            outcome.result = cancelled_error();
            break;
        }

        auto marked = tracker_.mark_invoking(request_id, provider.id);
        if (core::errors::is_error(marked)) {
            outcome.result = cancelled_error();
            break;
        }

        const auto timeout = timeout_for(provider, timeout_override);
        LOG_DEBUG(tag(request_id) + "invoking " + provider.id + " (attempt " +
                  std::to_string(i + 1) + "/" + std::to_string(chain.size()) + ")");
        outcome.last_provider_id = provider.id;
        outcome.result = invoker_.invoke(provider, prompt, timeout, cancel_token);

        if (!core::errors::is_error(outcome.result)) {
            note_transition(request_id, tracker_.mark_succeeded(request_id));
            LOG_INFO(tag(request_id) + provider.id + " succeeded");
            return outcome;
        }

        const AskAiError& error = core::errors::get_error(outcome.result);
        LOG_WARN(tag(request_id) + provider.id + " failed (" + error.code + "): " +
                 error.message);
        if (!core::errors::is_retryable(error)) {
            break;
        }
    }

    if (core::errors::is_error(outcome.result) &&
        core::errors::get_error(outcome.result).code == "cancelled") {
        note_transition(request_id, tracker_.cancel(request_id));
    } else if (core::errors::is_error(outcome.result)) {
        note_transition(request_id,
                        tracker_.mark_exhausted(
                            request_id, core::errors::get_error(outcome.result).message));
        LOG_WARN(tag(request_id) + "all providers failed");
    }
    return outcome;
}

InvocationResult InvocationEngine::perform(const InvocationRequest& request) {
    if (!enter()) {
        return shut_down_error();
    }
    ActiveScope scope([this] { leave(); });

    if (request.operation_id.empty()) {
        return AskAiError{ErrorCategory::Input, "No operation specified",
                          "no_operation_specified"};
    }
    if (core::text::is_blank(request.text)) {
        return AskAiError{ErrorCategory::Input, "No text provided", "no_text_provided"};
    }

    auto begun = tracker_.begin(request.operation_id);
    if (core::errors::is_error(begun)) {
        return core::errors::get_error(begun);
    }
    const std::string request_id = core::errors::get_value(begun);
    LOG_INFO(tag(request_id) + "operation '" + request.operation_id + "'");

    auto rendered = library_.render(request.operation_id, request.text, request.params);
    if (core::errors::is_error(rendered)) {
        return reject(request_id, core::errors::get_error(rendered));
    }

    note_transition(request_id, tracker_.mark_resolving(request_id));
    auto resolved = registry_.resolve_chain(request.provider_id.value_or(""));
    if (core::errors::is_error(resolved)) {
        return reject(request_id, core::errors::get_error(resolved));
    }
    std::vector<registry::ProviderSpec> chain = core::errors::get_value(resolved);
    if (config_.max_attempts > 0 && chain.size() > config_.max_attempts) {
        chain.resize(config_.max_attempts);
    }

    ChainOutcome outcome =
        run_chain(request_id, chain, core::errors::get_value(rendered), std::nullopt);
    tracker_.finish(request_id);
    return outcome.result;
}

OperationOutcome InvocationEngine::perform_operation(const std::string& operation_id,
                                                     const std::string& text,
                                                     const protocol::ParamMap& params) {
    InvocationRequest request;
    request.operation_id = operation_id;
    request.text = text;
    request.params = params;
    return protocol::to_outcome(perform(request));
}

std::future<OperationOutcome> InvocationEngine::perform_operation_async(
    std::string operation_id, std::string text, protocol::ParamMap params) {
    return std::async(std::launch::async,
                      [this, operation_id = std::move(operation_id),
                       text = std::move(text), params = std::move(params)]() {
                          return perform_operation(operation_id, text, params);
                      });
}

OperationOutcome InvocationEngine::call(const std::string& provider_id,
                                        const std::string& prompt,
                                        const CallOptions& options) {
    if (!enter()) {
        return protocol::to_outcome(shut_down_error());
    }
    ActiveScope scope([this] { leave(); });

    if (core::text::is_blank(prompt)) {
        return OperationOutcome{false, "No text provided"};
    }

    auto begun = tracker_.begin("");
    if (core::errors::is_error(begun)) {
        return protocol::to_outcome(core::errors::get_error(begun));
    }
    const std::string request_id = core::errors::get_value(begun);
    LOG_INFO(tag(request_id) + "call " +
             (provider_id.empty() ? std::string("(default provider)") : provider_id));

    note_transition(request_id, tracker_.mark_resolving(request_id));
    auto resolved = registry_.resolve_chain(provider_id);
    if (core::errors::is_error(resolved)) {
        return protocol::to_outcome(reject(request_id, core::errors::get_error(resolved)));
    }
    std::vector<registry::ProviderSpec> chain = core::errors::get_value(resolved);
    std::size_t limit = options.allow_fallback ? config_.max_attempts : 1;
    if (limit > 0 && chain.size() > limit) {
        chain.resize(limit);
    }

    ChainOutcome outcome = run_chain(request_id, chain, prompt, options.timeout);
    tracker_.finish(request_id);
    if (!core::errors::is_error(outcome.result)) {
        return OperationOutcome{true, core::errors::get_value(outcome.result)};
    }
    const AskAiError& error = core::errors::get_error(outcome.result);
    if (outcome.last_provider_id.empty()) {
        return OperationOutcome{false, error.message};
    }
    return OperationOutcome{false, outcome.last_provider_id + ": " + error.message};
}

}  // namespace askai::engine

#include "process/process_invoker.hpp"

#include <algorithm>
#include <future>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/text/text_utils.hpp"

namespace askai::process {

using core::errors::AskAiError;
using core::errors::ErrorCategory;

namespace {

constexpr auto kWaitSlice = std::chrono::milliseconds(50);
constexpr const char* kPromptPlaceholder = "${prompt}";

// One in-flight attempt. Whichever of exit, timeout or cancellation claims it
// first decides the result.
struct RunningProcess {
    std::chrono::steady_clock::time_point started;
    std::chrono::steady_clock::time_point deadline;
    std::promise<ProcessOutcome> promise;
    std::atomic_bool settled{false};

    bool claim() {
        bool expected = false;
        return settled.compare_exchange_strong(expected, true);
    }

    void settle(ProcessOutcome outcome) {
        if (claim()) {
            promise.set_value(std::move(outcome));
        }
    }
};

std::string replace_all(std::string value, const std::string& from,
                        const std::string& to) {
    std::size_t pos = value.find(from);
    while (pos != std::string::npos) {
        value.replace(pos, from.size(), to);
        pos = value.find(from, pos + to.size());
    }
    return value;
}

}  // namespace

ProcessInvoker::ProcessInvoker(std::shared_ptr<ProcessLauncher> launcher,
                               std::vector<std::string> search_paths)
    : launcher_(std::move(launcher)), search_paths_(std::move(search_paths)) {}

std::vector<std::string> ProcessInvoker::build_arguments(
    const registry::ProviderSpec& spec, const std::string& prompt) {
    std::vector<std::string> args;
    args.reserve(spec.args.size() + 1);
    bool substituted = false;
    for (const auto& arg : spec.args) {
        if (arg.find(kPromptPlaceholder) != std::string::npos) {
            args.push_back(replace_all(arg, kPromptPlaceholder, prompt));
            substituted = true;
        } else {
            args.push_back(arg);
        }
    }
    if (!substituted) {
        args.push_back(prompt);
    }
    return args;
}

protocol::InvocationResult ProcessInvoker::classify(const ProcessOutcome& outcome) {
    const std::string out = core::text::trim(outcome.stdout_text);
    const std::string err = core::text::trim(outcome.stderr_text);

    if (outcome.exit_code == 0) {
        if (!out.empty()) {
            return out;
        }
        return AskAiError{ErrorCategory::Provider, err.empty() ? "empty output" : err,
                          "empty_response"};
    }

    std::string detail = err;
    if (detail.empty()) {
        detail = out;
    }
    if (detail.empty()) {
        detail = "command failed with exit code " + std::to_string(outcome.exit_code);
    }
    return AskAiError{ErrorCategory::Provider, detail, "process_error"};
}

protocol::InvocationResult ProcessInvoker::invoke(
    const registry::ProviderSpec& spec, const std::string& prompt,
    const std::chrono::milliseconds timeout,
    const std::shared_ptr<std::atomic_bool>& cancel_token) const {
    if (cancel_token && cancel_token->load()) {
        return AskAiError{ErrorCategory::Execution, "Operation cancelled", "cancelled"};
    }

    auto attempt = std::make_shared<RunningProcess>();
    attempt->started = std::chrono::steady_clock::now();
    attempt->deadline = attempt->started + timeout;
    std::future<ProcessOutcome> completion = attempt->promise.get_future();

    LaunchSpec launch_spec;
    launch_spec.program = spec.program;
    launch_spec.args = build_arguments(spec, prompt);
    launch_spec.search_paths = search_paths_;

    auto launched = launcher_->launch(
        launch_spec, [attempt](ProcessOutcome outcome) { attempt->settle(std::move(outcome)); });
    if (core::errors::is_error(launched)) {
        const AskAiError& error = core::errors::get_error(launched);
        return AskAiError{ErrorCategory::Provider, error.message, "process_error",
                          error.hint};
    }
    std::shared_ptr<ProcessHandle> handle = core::errors::get_value(launched);

    while (true) {
        const auto now = std::chrono::steady_clock::now();
        const auto slice_end = std::min(attempt->deadline, now + kWaitSlice);
        if (completion.wait_until(slice_end) == std::future_status::ready) {
            handle->terminate();
            return classify(completion.get());
        }

        if (cancel_token && cancel_token->load() && attempt->claim()) {
            handle->terminate();
            LOG_DEBUG("ProcessInvoker: " + spec.id + " cancelled");
            return AskAiError{ErrorCategory::Execution, "Operation cancelled",
                              "cancelled"};
        }

        if (std::chrono::steady_clock::now() >= attempt->deadline && attempt->claim()) {
            handle->terminate();
            const double seconds =
                std::chrono::duration<double>(timeout).count();
            return AskAiError{ErrorCategory::Provider,
                              "operation timed out after " +
                                  core::text::format_seconds(seconds) + "s",
                              "timeout"};
        }
    }
}

}  // namespace askai::process

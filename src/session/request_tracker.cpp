#include "session/request_tracker.hpp"
#include <utility>
#include "core/config/request_id.hpp"
#include "core/logging/logger.hpp"

namespace askai::session {

using core::errors::AskAiError;
using core::errors::ErrorCategory;

bool RequestTracker::is_terminal(const RequestState state) {
    return state == RequestState::Succeeded || state == RequestState::Exhausted ||
           state == RequestState::Rejected || state == RequestState::Cancelled;
}

std::string RequestTracker::to_string(const RequestState state) {
    switch (state) {
        case RequestState::Rendering:
            return "rendering";
        case RequestState::Resolving:
            return "resolving";
        case RequestState::Invoking:
            return "invoking";
        case RequestState::Succeeded:
            return "succeeded";
        case RequestState::Exhausted:
            return "exhausted";
        case RequestState::Rejected:
            return "rejected";
        case RequestState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

core::errors::Result<std::string> RequestTracker::begin(const std::string& operation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string request_id = core::config::generate_request_id();
        if (requests_.find(request_id) != requests_.end()) {
            continue;
        }

        RequestRecord record;
        record.request_id = request_id;
        record.operation_id = operation_id;
        record.state = RequestState::Rendering;
        record.cancel_token = std::make_shared<std::atomic_bool>(false);
        requests_.emplace(request_id, std::move(record));
        LOG_DEBUG("RequestTracker: " + request_id + " started (" +
                  (operation_id.empty() ? std::string("call") : operation_id) + ")");
        return request_id;
    }

    return AskAiError{ErrorCategory::Internal, "Unable to allocate unique request ID.",
                      "request_id_generation_failed"};
}

core::errors::Result<RequestState> RequestTracker::mark_resolving(
    const std::string& request_id) {
    return transition(request_id, RequestState::Resolving, std::nullopt);
}

core::errors::Result<RequestState> RequestTracker::mark_invoking(
    const std::string& request_id, const std::string& provider_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = requests_.find(request_id);
        if (it != requests_.end() && !is_terminal(it->second.state)) {
            it->second.provider_id = provider_id;
            ++it->second.attempt;
        }
    }
    return transition(request_id, RequestState::Invoking, std::nullopt);
}

core::errors::Result<RequestState> RequestTracker::mark_succeeded(
    const std::string& request_id) {
    return transition(request_id, RequestState::Succeeded, std::nullopt);
}

core::errors::Result<RequestState> RequestTracker::mark_exhausted(
    const std::string& request_id, const std::string& reason) {
    return transition(request_id, RequestState::Exhausted, reason);
}

core::errors::Result<RequestState> RequestTracker::mark_rejected(
    const std::string& request_id, const std::string& reason) {
    return transition(request_id, RequestState::Rejected, reason);
}

core::errors::Result<RequestState> RequestTracker::cancel(const std::string& request_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = requests_.find(request_id);
        if (it != requests_.end() && !is_terminal(it->second.state)) {
            it->second.cancel_token->store(true);
        }
    }
    return transition(request_id, RequestState::Cancelled, std::nullopt);
}

core::errors::Result<RequestState> RequestTracker::transition(
    const std::string& request_id, const RequestState next_state,
    const std::optional<std::string>& failure_reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return AskAiError{ErrorCategory::Input, "Request ID not found: " + request_id,
                          "request_not_found"};
    }

    if (is_terminal(it->second.state)) {
        return AskAiError{ErrorCategory::Input,
                          "Request is already terminal: " + to_string(it->second.state),
                          "invalid_state_transition"};
    }

    const std::string prev = to_string(it->second.state);
    it->second.state = next_state;
    it->second.failure_reason = failure_reason;
    std::string suffix;
    if (next_state == RequestState::Invoking && it->second.provider_id) {
        suffix = " (" + *it->second.provider_id + ", attempt " +
                 std::to_string(it->second.attempt) + ")";
    }
    LOG_DEBUG("RequestTracker: " + request_id + " transition " + prev + " -> " +
              to_string(next_state) + suffix);
    return it->second.state;
}

core::errors::Result<RequestState> RequestTracker::get_state(
    const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return AskAiError{ErrorCategory::Input, "Request ID not found: " + request_id,
                          "request_not_found"};
    }
    return it->second.state;
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> RequestTracker::get_cancel_token(
    const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return AskAiError{ErrorCategory::Input, "Request ID not found: " + request_id,
                          "request_not_found"};
    }
    return it->second.cancel_token;
}

void RequestTracker::finish(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request_id);
    if (it != requests_.end() && is_terminal(it->second.state)) {
        requests_.erase(it);
    }
}

std::size_t RequestTracker::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t signalled = 0;
    for (auto& entry : requests_) {
        if (!is_terminal(entry.second.state)) {
            entry.second.cancel_token->store(true);
            ++signalled;
        }
    }
    return signalled;
}

std::size_t RequestTracker::in_flight_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& entry : requests_) {
        if (!is_terminal(entry.second.state)) {
            ++count;
        }
    }
    return count;
}

}  // namespace askai::session

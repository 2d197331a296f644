#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/askai_errors.hpp"

namespace askai::session {

enum class RequestState {
    Rendering,
    Resolving,
    Invoking,
    Succeeded,
    Exhausted,
    Rejected,
    Cancelled
};

struct RequestRecord {
    std::string request_id;
    std::string operation_id;
    RequestState state = RequestState::Rendering;
    std::optional<std::string> provider_id;  // provider of the current attempt
    std::size_t attempt = 0;
    std::optional<std::string> failure_reason;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// In-flight requests of one engine. Terminal requests are removed by
// finish() once the caller has its result.
class RequestTracker {
public:
    core::errors::Result<std::string> begin(const std::string& operation_id);

    core::errors::Result<RequestState> mark_resolving(const std::string& request_id);
    core::errors::Result<RequestState> mark_invoking(const std::string& request_id,
                                                     const std::string& provider_id);
    core::errors::Result<RequestState> mark_succeeded(const std::string& request_id);
    core::errors::Result<RequestState> mark_exhausted(const std::string& request_id,
                                                      const std::string& reason);
    core::errors::Result<RequestState> mark_rejected(const std::string& request_id,
                                                     const std::string& reason);
    core::errors::Result<RequestState> cancel(const std::string& request_id);

    core::errors::Result<RequestState> get_state(const std::string& request_id) const;
    core::errors::Result<std::shared_ptr<std::atomic_bool>> get_cancel_token(
        const std::string& request_id) const;

    // Drops the record of a terminal request.
    void finish(const std::string& request_id);

    // Sets the cancel token of every request; returns how many were signalled.
    std::size_t cancel_all();

    std::size_t in_flight_count() const;

    static bool is_terminal(RequestState state);
    static std::string to_string(RequestState state);

private:
    core::errors::Result<RequestState> transition(
        const std::string& request_id, RequestState next_state,
        const std::optional<std::string>& failure_reason);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestRecord> requests_;
};

}  // namespace askai::session

#include "engine/connectivity_prober.hpp"

#include <future>
#include <utility>
#include "core/errors/askai_errors.hpp"
#include "core/logging/logger.hpp"

namespace askai::engine {

const char* ConnectivityProber::probe_prompt() {
    return "Reply with exactly: OK";
}

protocol::OperationOutcome ConnectivityProber::test(const std::string& provider_id) const {
    const std::string id =
        provider_id.empty() ? engine_.registry().default_provider_id() : provider_id;

    CallOptions options;
    options.allow_fallback = false;
    options.timeout = engine_.config().probe_timeout;

    protocol::OperationOutcome outcome = engine_.call(id, probe_prompt(), options);
    if (outcome.success) {
        LOG_DEBUG("Probe " + id + " replied: " + outcome.text);
        return protocol::OperationOutcome{true, id + " is working correctly"};
    }
    LOG_WARN("Probe " + id + " failed: " + outcome.text);
    return outcome;
}

std::vector<ProbeReport> ConnectivityProber::test_all() const {
    std::vector<std::string> ids;
    auto chain = engine_.registry().resolve_chain("");
    if (!core::errors::is_error(chain)) {
        for (const auto& provider : core::errors::get_value(chain)) {
            ids.push_back(provider.id);
        }
    } else {
        for (const auto& provider : engine_.registry().enabled_providers()) {
            ids.push_back(provider.id);
        }
    }

    std::vector<std::future<protocol::OperationOutcome>> pending;
    pending.reserve(ids.size());
    for (const auto& id : ids) {
        pending.push_back(std::async(std::launch::async, [this, id]() { return test(id); }));
    }

    std::vector<ProbeReport> reports;
    reports.reserve(ids.size());
    for (std::size_t i = 0; i < ids.size(); ++i) {
        reports.push_back(ProbeReport{ids[i], pending[i].get()});
    }
    return reports;
}

}  // namespace askai::engine

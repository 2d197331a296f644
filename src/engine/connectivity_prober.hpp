#pragma once

#include <string>
#include <vector>
#include "engine/invocation_engine.hpp"
#include "protocol/invocation_contract.hpp"

namespace askai::engine {

struct ProbeReport {
    std::string provider_id;
    protocol::OperationOutcome outcome;
};

// Checks that providers answer a minimal prompt.
class ConnectivityProber {
public:
    explicit ConnectivityProber(InvocationEngine& engine) : engine_(engine) {}

    // Probes one provider without fallback; empty selects the default.
    protocol::OperationOutcome test(const std::string& provider_id) const;

    // Probes every enabled provider concurrently, reported in chain order.
    std::vector<ProbeReport> test_all() const;

    static const char* probe_prompt();

private:
    InvocationEngine& engine_;
};

}  // namespace askai::engine

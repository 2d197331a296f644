#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/askai_errors.hpp"

namespace askai::registry {

// An external LLM command-line tool. An argument containing ${prompt}
// receives the prompt; when no argument does, the prompt is appended as the
// trailing argument.
struct ProviderSpec {
    std::string id;
    std::string program;
    std::vector<std::string> args;
    bool enabled = true;
    int priority = 0;  // lower runs first; unique among enabled providers
    std::optional<std::chrono::milliseconds> timeout;  // overrides the global timeout
};

class ProviderRegistry {
public:
    ProviderRegistry(std::vector<ProviderSpec> providers,
                     std::string default_provider_id);

    // Ordered providers to try for `requested_provider_id` (empty selects the
    // default). The first entry is the requested provider, followed by the
    // other enabled providers by ascending priority.
    core::errors::Result<std::vector<ProviderSpec>> resolve_chain(
        const std::string& requested_provider_id) const;

    // Known providers, enabled or not.
    std::optional<ProviderSpec> find(const std::string& provider_id) const;

    // Enabled providers by ascending priority.
    std::vector<ProviderSpec> enabled_providers() const;

    const std::string& default_provider_id() const { return default_provider_id_; }

    // Human-readable configuration problems; empty when the registry is usable.
    std::vector<std::string> validate() const;

private:
    std::vector<ProviderSpec> providers_;
    std::string default_provider_id_;
};

}  // namespace askai::registry

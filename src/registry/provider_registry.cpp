#include "registry/provider_registry.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace askai::registry {

using core::errors::AskAiError;
using core::errors::ErrorCategory;

namespace {

bool ranks_before(const ProviderSpec& a, const ProviderSpec& b) {
    if (a.priority != b.priority) {
        return a.priority < b.priority;
    }
    return a.id < b.id;
}

AskAiError unknown_provider(const std::string& provider_id) {
    return AskAiError{ErrorCategory::Input, "Unknown provider: " + provider_id,
                      "unknown_provider",
                      "Check the provider id and its 'enabled' flag in the config."};
}

AskAiError no_provider_configured() {
    return AskAiError{ErrorCategory::Input, "No provider configured",
                      "no_provider_configured",
                      "Set llm.defaultProvider and enable at least one provider."};
}

}  // namespace

ProviderRegistry::ProviderRegistry(std::vector<ProviderSpec> providers,
                                   std::string default_provider_id)
    : providers_(std::move(providers)),
      default_provider_id_(std::move(default_provider_id)) {
    std::stable_sort(providers_.begin(), providers_.end(), ranks_before);
}

std::optional<ProviderSpec> ProviderRegistry::find(
    const std::string& provider_id) const {
    for (const auto& provider : providers_) {
        if (provider.id == provider_id) {
            return provider;
        }
    }
    return std::nullopt;
}

std::vector<ProviderSpec> ProviderRegistry::enabled_providers() const {
    std::vector<ProviderSpec> enabled;
    for (const auto& provider : providers_) {
        if (provider.enabled) {
            enabled.push_back(provider);
        }
    }
    return enabled;
}

core::errors::Result<std::vector<ProviderSpec>> ProviderRegistry::resolve_chain(
    const std::string& requested_provider_id) const {
    const std::vector<ProviderSpec> enabled = enabled_providers();
    if (enabled.empty()) {
        return no_provider_configured();
    }

    std::string first_id = requested_provider_id;
    if (first_id.empty()) {
        if (default_provider_id_.empty()) {
            return no_provider_configured();
        }
        first_id = default_provider_id_;
    }

    auto first = std::find_if(enabled.begin(), enabled.end(),
                              [&first_id](const ProviderSpec& provider) {
                                  return provider.id == first_id;
                              });
    if (first == enabled.end()) {
        return unknown_provider(first_id);
    }

    std::vector<ProviderSpec> chain;
    chain.reserve(enabled.size());
    chain.push_back(*first);
    for (const auto& provider : enabled) {
        if (provider.id != first_id) {
            chain.push_back(provider);
        }
    }
    return chain;
}

std::vector<std::string> ProviderRegistry::validate() const {
    std::vector<std::string> issues;
    std::map<int, std::string> ranks;
    bool has_enabled = false;

    for (const auto& provider : providers_) {
        if (!provider.enabled) {
            continue;
        }
        has_enabled = true;
        if (provider.program.empty()) {
            issues.push_back("Provider " + provider.id + " has no command specified");
        }
        auto [it, inserted] = ranks.emplace(provider.priority, provider.id);
        if (!inserted) {
            issues.push_back("Providers " + it->second + " and " + provider.id +
                             " share priority " + std::to_string(provider.priority));
        }
    }

    if (!has_enabled) {
        issues.push_back("No LLM providers are enabled");
    }

    if (default_provider_id_.empty()) {
        issues.push_back("No default provider configured");
    } else {
        const auto default_spec = find(default_provider_id_);
        if (!default_spec.has_value() || !default_spec->enabled) {
            issues.push_back("Default provider " + default_provider_id_ +
                             " is not enabled");
        }
    }
    return issues;
}

}  // namespace askai::registry

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include "prompt/prompt_library.hpp"
#include "registry/provider_registry.hpp"

namespace askai::config {

// Immutable engine configuration, built once and injected at construction.
struct AppConfig {
    std::string default_provider;
    std::string fallback_provider;
    std::vector<registry::ProviderSpec> providers;
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds probe_timeout{10000};
    std::size_t max_attempts = 0;  // 0 tries the whole chain
    std::vector<prompt::OperationSpec> operations;
    std::vector<std::string> search_paths;  // searched before PATH
};

}  // namespace askai::config

#include "config/config_loader.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/text/text_utils.hpp"

namespace askai::config {

using core::errors::AskAiError;
using core::errors::ErrorCategory;
using json = nlohmann::json;

namespace {

constexpr double kMaxTimeoutSeconds = 3600.0;

constexpr const char* kConfigHint =
    "Top-level keys are 'environment', 'llm' and 'prompts'; timeouts are in seconds.";

AskAiError invalid(const std::string& message) {
    return AskAiError{ErrorCategory::Input, message, "invalid_config", kConfigHint};
}

registry::ProviderSpec make_provider(std::string id, std::string program,
                                     std::vector<std::string> args) {
    registry::ProviderSpec spec;
    spec.id = std::move(id);
    spec.program = std::move(program);
    spec.args = std::move(args);
    return spec;
}

// Seconds as given in the file (integer or fractional) to milliseconds.
std::optional<AskAiError> read_seconds(const json& node, const std::string& field,
                                       std::chrono::milliseconds& out) {
    if (!node.is_number()) {
        return invalid("'" + field + "' must be a number of seconds");
    }
    const double seconds = node.get<double>();
    if (!std::isfinite(seconds) || seconds <= 0.0) {
        return invalid("'" + field + "' must be a positive number of seconds");
    }
    if (seconds > kMaxTimeoutSeconds) {
        return invalid("'" + field + "' must not exceed 3600 seconds");
    }
    out = std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
    return std::nullopt;
}

std::optional<AskAiError> read_string(const json& object, const char* key,
                                      const std::string& field, std::string& out) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        return invalid("'" + field + "' must be a string");
    }
    out = it->get<std::string>();
    return std::nullopt;
}

std::optional<AskAiError> read_string_list(const json& node, const std::string& field,
                                           std::vector<std::string>& out) {
    if (!node.is_array()) {
        return invalid("'" + field + "' must be an array of strings");
    }
    std::vector<std::string> values;
    for (const auto& item : node) {
        if (!item.is_string()) {
            return invalid("'" + field + "' must be an array of strings");
        }
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return std::nullopt;
}

std::optional<AskAiError> apply_provider(const std::string& id, const json& node,
                                         registry::ProviderSpec& spec,
                                         bool& priority_set) {
    const std::string prefix = "llm.providers." + id;
    if (!node.is_object()) {
        return invalid("'" + prefix + "' must be an object");
    }
    spec.id = id;

    if (auto error = read_string(node, "command", prefix + ".command", spec.program)) {
        return error;
    }
    if (const auto it = node.find("args"); it != node.end()) {
        if (auto error = read_string_list(*it, prefix + ".args", spec.args)) {
            return error;
        }
    }
    if (const auto it = node.find("enabled"); it != node.end()) {
        if (!it->is_boolean()) {
            return invalid("'" + prefix + ".enabled' must be a boolean");
        }
        spec.enabled = it->get<bool>();
    }
    if (const auto it = node.find("timeout"); it != node.end()) {
        std::chrono::milliseconds timeout{0};
        if (auto error = read_seconds(*it, prefix + ".timeout", timeout)) {
            return error;
        }
        spec.timeout = timeout;
    }
    if (const auto it = node.find("priority"); it != node.end()) {
        if (!it->is_number_integer()) {
            return invalid("'" + prefix + ".priority' must be an integer");
        }
        spec.priority = it->get<int>();
        priority_set = true;
    }
    return std::nullopt;
}

// Default provider first, fallback second, everything else by id.
void assign_priorities(AppConfig& config, const std::map<std::string, bool>& explicit_priority) {
    std::vector<registry::ProviderSpec*> ranked;
    for (auto& provider : config.providers) {
        const auto it = explicit_priority.find(provider.id);
        if (it == explicit_priority.end() || !it->second) {
            ranked.push_back(&provider);
        }
    }

    auto rank = [&config](const registry::ProviderSpec& spec) {
        if (spec.id == config.default_provider) {
            return 0;
        }
        if (spec.id == config.fallback_provider) {
            return 1;
        }
        return 2;
    };
    std::stable_sort(ranked.begin(), ranked.end(),
                     [&rank](const registry::ProviderSpec* a, const registry::ProviderSpec* b) {
                         const int ra = rank(*a);
                         const int rb = rank(*b);
                         if (ra != rb) {
                             return ra < rb;
                         }
                         return a->id < b->id;
                     });

    // Implicit priorities start after the largest explicit one.
    int next = 0;
    for (const auto& provider : config.providers) {
        const auto it = explicit_priority.find(provider.id);
        if (it != explicit_priority.end() && it->second) {
            next = std::max(next, provider.priority + 1);
        }
    }
    for (auto* provider : ranked) {
        provider->priority = next++;
    }
}

std::optional<AskAiError> apply_llm(const json& llm, AppConfig& config,
                                    std::map<std::string, bool>& explicit_priority) {
    if (!llm.is_object()) {
        return invalid("'llm' must be an object");
    }
    if (auto error = read_string(llm, "defaultProvider", "llm.defaultProvider",
                                 config.default_provider)) {
        return error;
    }
    if (auto error = read_string(llm, "fallbackProvider", "llm.fallbackProvider",
                                 config.fallback_provider)) {
        return error;
    }
    if (const auto it = llm.find("timeout"); it != llm.end()) {
        if (auto error = read_seconds(*it, "llm.timeout", config.timeout)) {
            return error;
        }
    }
    if (const auto it = llm.find("probeTimeout"); it != llm.end()) {
        if (auto error = read_seconds(*it, "llm.probeTimeout", config.probe_timeout)) {
            return error;
        }
    }
    if (const auto it = llm.find("maxAttempts"); it != llm.end()) {
        if (!it->is_number_integer() || it->get<long long>() < 0) {
            return invalid("'llm.maxAttempts' must be a non-negative integer");
        }
        config.max_attempts = it->get<std::size_t>();
    }

    const auto providers = llm.find("providers");
    if (providers == llm.end()) {
        return std::nullopt;
    }
    if (!providers->is_object()) {
        return invalid("'llm.providers' must be an object");
    }
    for (const auto& entry : providers->items()) {
        const std::string id = entry.key();
        const json& node = entry.value();
        auto existing = std::find_if(config.providers.begin(), config.providers.end(),
                                     [&id](const registry::ProviderSpec& spec) {
                                         return spec.id == id;
                                     });
        registry::ProviderSpec spec;
        if (existing != config.providers.end()) {
            spec = *existing;
        }
        bool priority_set = false;
        if (auto error = apply_provider(id, node, spec, priority_set)) {
            return error;
        }
        if (spec.program.empty()) {
            spec.program = id;
        }
        explicit_priority[id] = priority_set;
        if (existing != config.providers.end()) {
            *existing = std::move(spec);
        } else {
            config.providers.push_back(std::move(spec));
        }
    }
    return std::nullopt;
}

std::optional<AskAiError> apply_prompts(const json& prompts, AppConfig& config) {
    if (!prompts.is_object()) {
        return invalid("'prompts' must be an object");
    }
    for (const auto& entry : prompts.items()) {
        const std::string id = entry.key();
        const json& node = entry.value();
        const std::string prefix = "prompts." + id;
        if (!node.is_object()) {
            return invalid("'" + prefix + "' must be an object");
        }
        prompt::OperationSpec operation;
        operation.id = id;
        operation.title = id;
        if (auto error = read_string(node, "title", prefix + ".title", operation.title)) {
            return error;
        }
        if (auto error = read_string(node, "description", prefix + ".description",
                                     operation.description)) {
            return error;
        }
        if (auto error = read_string(node, "category", prefix + ".category",
                                     operation.category)) {
            return error;
        }
        if (auto error = read_string(node, "template", prefix + ".template",
                                     operation.instruction)) {
            return error;
        }
        if (core::text::is_blank(operation.instruction)) {
            return invalid("'" + prefix + ".template' must not be empty");
        }
        operation.kind = id == "custom" ? prompt::OperationKind::Custom
                                        : prompt::OperationKind::Template;
        config.operations.push_back(std::move(operation));
    }
    return std::nullopt;
}

}  // namespace

AppConfig default_config() {
    AppConfig config;
    config.default_provider = "gemini";
    config.fallback_provider = "claude";
    config.providers.push_back(
        make_provider("gemini", "gemini", {"-m", "gemini-2.5-flash", "-p"}));
    config.providers.push_back(make_provider("claude", "claude", {"-p"}));
    config.providers[0].priority = 0;
    config.providers[1].priority = 1;
    config.operations = prompt::PromptLibrary::builtin_operations();
    return config;
}

core::errors::Result<AppConfig> parse_config(const json& document) {
    AppConfig config = default_config();
    if (document.is_null()) {
        return config;
    }
    if (!document.is_object()) {
        return invalid("Configuration root must be an object");
    }

    try {
        if (const auto it = document.find("environment"); it != document.end()) {
            if (!it->is_object()) {
                return invalid("'environment' must be an object");
            }
            if (const auto paths = it->find("paths"); paths != it->end()) {
                if (auto error = read_string_list(*paths, "environment.paths",
                                                  config.search_paths)) {
                    return *error;
                }
            }
        }

        std::map<std::string, bool> explicit_priority;
        if (const auto it = document.find("llm"); it != document.end()) {
            if (auto error = apply_llm(*it, config, explicit_priority)) {
                return *error;
            }
        }
        for (const auto& provider : config.providers) {
            explicit_priority.emplace(provider.id, false);
        }
        assign_priorities(config, explicit_priority);

        if (const auto it = document.find("prompts"); it != document.end()) {
            if (auto error = apply_prompts(*it, config)) {
                return *error;
            }
        }
    } catch (const json::exception& e) {
        return invalid(std::string("Invalid configuration: ") + e.what());
    }

    LOG_DEBUG("Config: " + std::to_string(config.providers.size()) + " providers, " +
              std::to_string(config.operations.size()) + " operations, default '" +
              config.default_provider + "'");
    return config;
}

core::errors::Result<AppConfig> load_config_file(const std::string& path) {
    const std::string expanded = core::text::expand_home(path);
    std::ifstream in(expanded);
    if (!in.is_open()) {
        return AskAiError{ErrorCategory::Input, "Config file not found: " + expanded,
                          "config_not_found"};
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return AskAiError{ErrorCategory::Input, "Failed to read config file: " + expanded,
                          "config_read_failed"};
    }

    json document;
    try {
        document = json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        return invalid("Malformed JSON in " + expanded + ": " + e.what());
    }

    LOG_INFO("Loaded configuration from " + expanded);
    return parse_config(document);
}

}  // namespace askai::config

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "config/app_config.hpp"
#include "core/errors/askai_errors.hpp"

namespace askai::config {

// Built-in providers (gemini, claude) and operations.
AppConfig default_config();

// Overlays `document` on default_config(). Providers and prompts named in the
// document replace or extend the defaults by id.
core::errors::Result<AppConfig> parse_config(const nlohmann::json& document);

core::errors::Result<AppConfig> load_config_file(const std::string& path);

}  // namespace askai::config

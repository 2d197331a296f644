#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include "app/cli_parser.hpp"
#include "config/config_loader.hpp"
#include "core/errors/askai_errors.hpp"
#include "core/logging/logger.hpp"
#include "engine/connectivity_prober.hpp"
#include "engine/invocation_engine.hpp"
#include "process/posix_process_launcher.hpp"

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitInputError = 2;

void report_error(const std::string& stage, const askai::core::errors::AskAiError& err) {
    LOG_ERROR(stage + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

int print_outcome(const askai::protocol::OperationOutcome& outcome) {
    if (outcome.success) {
        std::cout << outcome.text << std::endl;
        return kExitSuccess;
    }
    std::cerr << "Error: " << outcome.text << std::endl;
    return kExitFailure;
}

int list_operations(const askai::engine::InvocationEngine& engine) {
    for (const auto& op : engine.prompt_library().list_operations()) {
        std::cout << op.id << "\t" << op.title;
        if (!op.description.empty()) {
            std::cout << " - " << op.description;
        }
        const auto params = askai::prompt::PromptLibrary::required_parameters(op);
        for (const auto& param : params) {
            std::cout << " [" << param << "=...]";
        }
        std::cout << "\n";
    }
    return kExitSuccess;
}

int check_config(const askai::engine::InvocationEngine& engine) {
    const auto issues = engine.registry().validate();
    if (issues.empty()) {
        std::cout << "Configuration OK (" << engine.registry().enabled_providers().size()
                  << " enabled providers, default '"
                  << engine.registry().default_provider_id() << "')" << std::endl;
        return kExitSuccess;
    }
    for (const auto& issue : issues) {
        std::cout << "- " << issue << "\n";
    }
    return kExitInputError;
}

int run_tests(askai::engine::InvocationEngine& engine, const askai::protocol::CliRequest& req) {
    askai::engine::ConnectivityProber prober(engine);
    if (req.provider_id) {
        return print_outcome(prober.test(*req.provider_id));
    }

    const auto reports = prober.test_all();
    if (reports.empty()) {
        std::cerr << "Error: No provider configured" << std::endl;
        return kExitInputError;
    }
    int exit_code = kExitSuccess;
    for (const auto& report : reports) {
        std::cout << (report.outcome.success ? "[ok]   " : "[fail] ") << report.provider_id
                  << ": " << report.outcome.text << "\n";
        if (!report.outcome.success) {
            exit_code = kExitFailure;
        }
    }
    return exit_code;
}

int run_operation(askai::engine::InvocationEngine& engine, const askai::protocol::CliRequest& req) {
    askai::protocol::InvocationRequest request;
    request.operation_id = req.operation_id;
    request.params = req.params;
    request.provider_id = req.provider_id;
    if (req.text) {
        request.text = *req.text;
    } else {
        request.text.assign(std::istreambuf_iterator<char>(std::cin),
                            std::istreambuf_iterator<char>());
    }

    const auto result = engine.perform(request);
    if (askai::core::errors::is_error(result) &&
        askai::core::errors::get_error(result).category ==
            askai::core::errors::ErrorCategory::Input) {
        report_error("Invalid request", askai::core::errors::get_error(result));
        return kExitInputError;
    }
    return print_outcome(askai::protocol::to_outcome(result));
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized input errors
    auto parsed = askai::app::cli::parse_and_validate(argc, argv);
    if (askai::core::errors::is_error(parsed)) {
        report_error("Input error", askai::core::errors::get_error(parsed));
        return kExitInputError;
    }
    const auto& req = askai::core::errors::get_value(parsed);

    askai::core::logging::Logger::get().set_context("askai");
    if (req.verbose) {
        askai::core::logging::Logger::get().set_level(askai::core::logging::LogLevel::DEBUG);
    }

    // 2. Build the configuration: built-in defaults, overlaid by --config
    askai::config::AppConfig config = askai::config::default_config();
    if (req.config_path) {
        auto loaded = askai::config::load_config_file(*req.config_path);
        if (askai::core::errors::is_error(loaded)) {
            report_error("Config error", askai::core::errors::get_error(loaded));
            return kExitInputError;
        }
        config = askai::core::errors::get_value(loaded);
    }
    if (req.timeout) {
        config.timeout = *req.timeout;
        config.probe_timeout = *req.timeout;
        for (auto& provider : config.providers) {
            provider.timeout.reset();
        }
    }

    // 3. Dispatch
    askai::engine::InvocationEngine engine(
        std::move(config), std::make_shared<askai::process::PosixProcessLauncher>());

    switch (req.command) {
        case askai::protocol::CliCommand::Run:
            return run_operation(engine, req);
        case askai::protocol::CliCommand::Call: {
            const auto outcome = engine.call(req.provider_id.value_or(""), req.prompt);
            if (!outcome.success && outcome.text.rfind("Unknown provider", 0) == 0) {
                std::cerr << "Error: " << outcome.text << std::endl;
                return kExitInputError;
            }
            return print_outcome(outcome);
        }
        case askai::protocol::CliCommand::Test:
            return run_tests(engine, req);
        case askai::protocol::CliCommand::Operations:
            return list_operations(engine);
        case askai::protocol::CliCommand::Check:
            return check_config(engine);
    }
    return kExitFailure;
}

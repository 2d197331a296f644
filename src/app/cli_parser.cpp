#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

namespace askai::app::cli {

    using namespace askai::core::errors;
    using askai::protocol::CliCommand;
    using askai::protocol::CliRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> operation;
        std::optional<std::string> text;
        std::vector<std::string> params;
        std::optional<std::string> provider;
        std::optional<std::string> prompt;
        std::optional<std::string> config;
        std::optional<std::string> timeout;
        bool verbose = false;
    };

    std::string usage() {
        return "Usage: askai <run|call|test|operations|check> [options]\n"
               "  run --operation <id> [--text <text>] [--param key=value]... [--provider <id>]\n"
               "  call --prompt <text> [--provider <id>]\n"
               "  test [--provider <id>]\n"
               "  operations\n"
               "  check\n"
               "Common options: --config <path> --timeout <seconds> --verbose";
    }

    std::optional<CliCommand> command_from_string(const std::string& command) {
        if (command == "run") return CliCommand::Run;
        if (command == "call") return CliCommand::Call;
        if (command == "test") return CliCommand::Test;
        if (command == "operations") return CliCommand::Operations;
        if (command == "check") return CliCommand::Check;
        return std::nullopt;
    }

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return AskAiError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        std::string command = argv[1];
        auto parsed_command = command_from_string(command);
        if (!parsed_command) {
            return AskAiError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", usage()};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--operation") {
                if (i + 1 < args.size()) raw.operation = args[++i];
                else return AskAiError{ErrorCategory::Input, "Missing value for --operation", "missing_value"};
            } else if (args[i] == "--text") {
                if (i + 1 < args.size()) raw.text = args[++i];
                else return AskAiError{ErrorCategory::Input, "Missing value for --text", "missing_value"};
            } else if (args[i] == "--param") {
                if (i + 1 < args.size()) raw.params.push_back(args[++i]);
                else return AskAiError{ErrorCategory::Input, "Missing value for --param", "missing_value"};
            } else if (args[i] == "--provider") {
                if (i + 1 < args.size()) raw.provider = args[++i];
                else return AskAiError{ErrorCategory::Input, "Missing value for --provider", "missing_value"};
            } else if (args[i] == "--prompt") {
                if (i + 1 < args.size()) raw.prompt = args[++i];
                else return AskAiError{ErrorCategory::Input, "Missing value for --prompt", "missing_value"};
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return AskAiError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--timeout") {
                if (i + 1 < args.size()) raw.timeout = args[++i];
                else return AskAiError{ErrorCategory::Input, "Missing value for --timeout", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return AskAiError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        CliRequest req;
        req.command = *parsed_command;
        req.verbose = raw.verbose;
        req.config_path = raw.config;
        req.provider_id = raw.provider;

        if (req.command == CliCommand::Run) {
            if (!raw.operation.has_value() || raw.operation->empty()) {
                return AskAiError{ErrorCategory::Input, "Must provide --operation", "missing_required_flag", "Run 'askai operations' to list them."};
            }
            req.operation_id = raw.operation.value();
            req.text = raw.text;
        } else if (raw.operation || raw.text || !raw.params.empty()) {
            return AskAiError{ErrorCategory::Input, "--operation, --text and --param are only valid with 'run'", "conflicting_flags"};
        }

        if (req.command == CliCommand::Call) {
            if (!raw.prompt.has_value() || raw.prompt->empty()) {
                return AskAiError{ErrorCategory::Input, "Must provide --prompt", "missing_required_flag"};
            }
            req.prompt = raw.prompt.value();
        } else if (raw.prompt) {
            return AskAiError{ErrorCategory::Input, "--prompt is only valid with 'call'", "conflicting_flags"};
        }

        if (raw.provider && (req.command == CliCommand::Operations || req.command == CliCommand::Check)) {
            return AskAiError{ErrorCategory::Input, "--provider is not valid with '" + command + "'", "conflicting_flags"};
        }

        // key=value parameters, later duplicates win
        for (const auto& param : raw.params) {
            const auto eq = param.find('=');
            if (eq == std::string::npos || eq == 0) {
                return AskAiError{ErrorCategory::Input, "Invalid --param: " + param, "invalid_param", "Use --param key=value."};
            }
            req.params[param.substr(0, eq)] = param.substr(eq + 1);
        }

        // Exception-free integer parsing
        if (raw.timeout) {
            uint32_t seconds = 0;
            const char* begin = raw.timeout->data();
            const char* end = raw.timeout->data() + raw.timeout->size();
            auto [ptr, ec] = std::from_chars(begin, end, seconds);
            if (ec != std::errc() || ptr != end) {
                return AskAiError{ErrorCategory::Input, "Invalid number for --timeout", "invalid_integer", "Provide a whole number of seconds."};
            }
            if (seconds == 0 || seconds > 3600) {
                return AskAiError{ErrorCategory::Input, "--timeout out of bounds", "bounds_error", "Must be between 1 and 3600."};
            }
            req.timeout = std::chrono::seconds(seconds);
        }

        return req;
    }

} // namespace askai::app::cli

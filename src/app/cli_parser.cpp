#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace cloudctx::app::cli {

    using namespace cloudctx::core::errors;
    using cloudctx::core::config::ServerKind;
    using cloudctx::core::config::ServerOptions;

    namespace {
        constexpr const char* kUsage =
            "Usage: cloudctx_server serve --server <aws|forticnapp> "
            "[--cli-path PATH] [--timeout-seconds N] [--verbose]";
    }

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> server;
        std::optional<std::string> cli_path;
        std::optional<std::string> timeout_seconds;
        bool verbose = false;
    };

    Result<ServerOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ToolError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        std::string command = argv[1];
        if (command != "serve") {
            return ToolError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'serve' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'serve' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--server") {
                if (i + 1 < args.size()) raw.server = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --server", "missing_value"};
            } else if (args[i] == "--cli-path") {
                if (i + 1 < args.size()) raw.cli_path = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --cli-path", "missing_value"};
            } else if (args[i] == "--timeout-seconds") {
                if (i + 1 < args.size()) raw.timeout_seconds = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --timeout-seconds", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return ToolError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", kUsage};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        ServerOptions options;
        options.verbose = raw.verbose;

        if (!raw.server.has_value()) {
            return ToolError{ErrorCategory::Input, "Must provide --server", "missing_required_flag", kUsage};
        }
        if (raw.server.value() == "aws") {
            options.server = ServerKind::Aws;
        } else if (raw.server.value() == "forticnapp") {
            options.server = ServerKind::ForticNapp;
        } else {
            return ToolError{ErrorCategory::Input, "Unknown server: " + raw.server.value(), "invalid_server", "Choose 'aws' or 'forticnapp'."};
        }

        if (raw.cli_path) {
            if (raw.cli_path->empty()) {
                return ToolError{ErrorCategory::Input, "--cli-path cannot be empty", "missing_value"};
            }
            options.cli_path = raw.cli_path.value();
        }

        // Exception-free integer parsing
        if (raw.timeout_seconds) {
            uint32_t seconds = 0;
            const char* begin = raw.timeout_seconds->data();
            const char* end = raw.timeout_seconds->data() + raw.timeout_seconds->size();
            auto [ptr, ec] = std::from_chars(begin, end, seconds);
            if (ec != std::errc() || ptr != end) {
                return ToolError{ErrorCategory::Input, "Invalid number for --timeout-seconds", "invalid_integer", "Provide a positive integer."};
            }
            if (seconds == 0 || seconds > 600) {
                return ToolError{ErrorCategory::Input, "--timeout-seconds out of bounds", "bounds_error", "Must be between 1 and 600."};
            }
            options.timeout_seconds = seconds;
        }

        return options;
    }

} // namespace cloudctx::app::cli

#include "exec/cli_program.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace cloudctx::exec {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

std::string seconds_text(const std::uint32_t timeout_ms) {
    if (timeout_ms % 1000 == 0) {
        return std::to_string(timeout_ms / 1000) + " seconds";
    }
    return std::to_string(timeout_ms) + " milliseconds";
}

}  // namespace

ProgramProfile aws_cli_profile() {
    ProgramProfile profile;
    profile.display_name = "AWS CLI";
    profile.binary = "aws";
    profile.output_flag = {"--output", "json"};
    profile.timeout_ms = 30000;
    profile.install_hint = "Please install it: https://aws.amazon.com/cli/";
    return profile;
}

ProgramProfile lacework_cli_profile() {
    ProgramProfile profile;
    profile.display_name = "Lacework";
    profile.binary = "lacework";
    profile.output_flag = {"--json"};
    profile.timeout_ms = 60000;
    profile.install_hint =
        "Please install it: https://docs.fortinet.com/document/lacework-forticnapp/latest/cli-reference";
    return profile;
}

core::errors::Result<nlohmann::json> require_json(
    const ExternalCommandResult& result, const ProgramProfile& profile) {
    switch (result.status) {
        case ExitStatus::NotFound:
            return ToolError{ErrorCategory::CommandNotFound,
                             profile.display_name + " not found. " + profile.install_hint,
                             "command_not_found", profile.install_hint};
        case ExitStatus::TimedOut:
            return ToolError{ErrorCategory::CommandTimedOut,
                             profile.display_name + " command timed out after " +
                                 seconds_text(profile.timeout_ms),
                             "command_timed_out"};
        case ExitStatus::NonZero: {
            const std::string& diagnostics =
                result.stderr_text.empty() ? result.stdout_text : result.stderr_text;
            return ToolError{ErrorCategory::CommandNonZeroExit,
                             profile.display_name + " command failed: " + diagnostics,
                             "command_failed"};
        }
        case ExitStatus::Success:
            break;
    }

    if (!result.parsed_json.has_value()) {
        return ToolError{ErrorCategory::MalformedCommandOutput,
                         "Failed to parse JSON output: " + result.parse_error,
                         "malformed_output"};
    }
    return result.parsed_json.value();
}

CliProgram::CliProgram(ProgramProfile profile, CommandExecutor executor)
    : profile_(std::move(profile)), executor_(executor) {}

core::errors::Result<nlohmann::json> CliProgram::run_json(
    const std::vector<std::string>& args) const {
    CommandRequest request;
    request.argv.reserve(args.size() + 1);
    request.argv.push_back(profile_.binary);
    request.argv.insert(request.argv.end(), args.begin(), args.end());
    request.output_flag = profile_.output_flag;
    request.timeout_ms = profile_.timeout_ms;

    auto executed = executor_.execute(request);
    if (core::errors::is_error(executed)) {
        return core::errors::get_error(executed);
    }
    const auto& result = core::errors::get_value(executed);
    if (result.status != ExitStatus::Success) {
        LOG_WARN(profile_.display_name + " exited with status " +
                 to_string(result.status) + " (exit code " +
                 std::to_string(result.exit_code) + ")");
    }
    return require_json(result, profile_);
}

}  // namespace cloudctx::exec

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"

namespace cloudctx::exec {

enum class ExitStatus {
    Success,
    NonZero,
    TimedOut,
    NotFound
};

struct CommandRequest {
    // argv[0] is the program, resolved against PATH unless it contains '/'.
    std::vector<std::string> argv;
    // Appended when its first token is not already present in argv.
    std::vector<std::string> output_flag;
    std::uint32_t timeout_ms = 30000;
};

struct ExternalCommandResult {
    ExitStatus status = ExitStatus::Success;
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<nlohmann::json> parsed_json;
    // Set only when status is Success and stdout did not parse.
    std::string parse_error;
    double duration_ms = 0.0;
};

std::string to_string(ExitStatus status);

class CommandExecutor {
public:
    // Runs the program once and classifies the outcome. Only pipe or fork
    // failures are returned as errors; everything the child does is
    // reported through ExternalCommandResult::status.
    core::errors::Result<ExternalCommandResult> execute(
        const CommandRequest& request) const;

    static std::optional<std::string> resolve_program(const std::string& program);

    static std::vector<std::string> with_output_flag(
        std::vector<std::string> argv, const std::vector<std::string>& output_flag);
};

}  // namespace cloudctx::exec

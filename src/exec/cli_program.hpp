#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "exec/command_executor.hpp"

namespace cloudctx::exec {

// Everything that differs between the vendor CLIs the servers shell out to.
struct ProgramProfile {
    std::string display_name;  // used in error text, e.g. "AWS CLI"
    std::string binary;
    std::vector<std::string> output_flag;
    std::uint32_t timeout_ms = 30000;
    std::string install_hint;
};

ProgramProfile aws_cli_profile();
ProgramProfile lacework_cli_profile();

// Maps a classified command outcome onto the error taxonomy, yielding the
// parsed JSON document only for a clean, parseable run.
core::errors::Result<nlohmann::json> require_json(
    const ExternalCommandResult& result, const ProgramProfile& profile);

class CliProgram {
public:
    explicit CliProgram(ProgramProfile profile, CommandExecutor executor = {});

    // Runs `<binary> args... <output flag>` once and returns its JSON output.
    core::errors::Result<nlohmann::json> run_json(
        const std::vector<std::string>& args) const;

    const ProgramProfile& profile() const { return profile_; }

private:
    ProgramProfile profile_;
    CommandExecutor executor_;
};

}  // namespace cloudctx::exec

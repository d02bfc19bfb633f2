#include "app/server_factory.hpp"

#include "tools/aws_tools.hpp"
#include "tools/forticnapp_tools.hpp"

namespace cloudctx::app {

using core::config::ServerKind;
using core::config::ServerOptions;

exec::ProgramProfile profile_for(const ServerOptions& options) {
    auto profile = options.server == ServerKind::Aws ? exec::aws_cli_profile()
                                                     : exec::lacework_cli_profile();
    if (options.cli_path.has_value()) {
        profile.binary = options.cli_path.value();
    }
    if (options.timeout_seconds.has_value()) {
        profile.timeout_ms = options.timeout_seconds.value() * 1000;
    }
    return profile;
}

session::ServerInfo server_info_for(const ServerOptions& options) {
    return session::ServerInfo{core::config::to_string(options.server), kServerVersion};
}

core::errors::Status populate_registry(tools::ToolRegistry& registry,
                                       const ServerOptions& options) {
    const exec::CliProgram program(profile_for(options));
    switch (options.server) {
        case ServerKind::Aws:
            return tools::register_aws_tools(registry, program);
        case ServerKind::ForticNapp:
            return tools::register_forticnapp_tools(registry, program);
    }
    return core::errors::ToolError{core::errors::ErrorCategory::Internal,
                                   "Unsupported server kind", "invalid_server"};
}

}  // namespace cloudctx::app

#pragma once

#include "core/config/server_options.hpp"
#include "core/errors/tool_errors.hpp"
#include "exec/cli_program.hpp"
#include "session/protocol_session.hpp"
#include "tools/tool_registry.hpp"

namespace cloudctx::app {

inline constexpr const char* kServerVersion = "1.0.0";

// Vendor profile for the selected server with command-line overrides applied.
exec::ProgramProfile profile_for(const core::config::ServerOptions& options);

session::ServerInfo server_info_for(const core::config::ServerOptions& options);

// Registers the selected server's tool catalog.
core::errors::Status populate_registry(tools::ToolRegistry& registry,
                                       const core::config::ServerOptions& options);

}  // namespace cloudctx::app

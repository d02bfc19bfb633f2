#pragma once
#include "core/config/server_options.hpp"
#include "core/errors/tool_errors.hpp"

namespace cloudctx::app::cli {
    cloudctx::core::errors::Result<cloudctx::core::config::ServerOptions> parse_and_validate(int argc, char* argv[]);
}

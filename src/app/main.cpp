#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "app/server_factory.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/tool_errors.hpp"
#include "core/logging/logger.hpp"
#include "session/protocol_session.hpp"
#include "tools/tool_registry.hpp"

int main(int argc, char* argv[]) {
    // 1. Tag every log line of this process with one session id
    cloudctx::core::logging::Logger::get().set_session_id(
        cloudctx::core::config::generate_session_id());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = cloudctx::app::cli::parse_and_validate(argc, argv);
    if (cloudctx::core::errors::is_error(parsed)) {
        const auto& err = cloudctx::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& options = cloudctx::core::errors::get_value(parsed);
    if (options.verbose) {
        cloudctx::core::logging::Logger::get().set_min_level(
            cloudctx::core::logging::LogLevel::DEBUG);
    }

    const auto profile = cloudctx::app::profile_for(options);
    LOG_INFO("Starting " + cloudctx::core::config::to_string(options.server) +
             " server (binary=" + profile.binary + ", timeout=" +
             std::to_string(profile.timeout_ms / 1000) + "s)");

    // 3. Build the tool catalog once; it is read-only from here on
    cloudctx::tools::ToolRegistry registry;
    auto populated = cloudctx::app::populate_registry(registry, options);
    if (cloudctx::core::errors::is_error(populated)) {
        const auto& err = cloudctx::core::errors::get_error(populated);
        LOG_ERROR("Failed to build tool registry [" + err.code + "]: " + err.message);
        return 3;
    }

    // 4. Serve until the host closes standard input
    cloudctx::session::ProtocolSession session(
        registry, cloudctx::app::server_info_for(options), std::cin, std::cout);
    session.run();
    return 0;
}

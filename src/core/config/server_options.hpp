#pragma once
#include <string>
#include <cstdint>
#include <optional>

namespace cloudctx::core::config {

    enum class ServerKind {
        Aws,        // EC2 instance and security-group tools over the aws CLI
        ForticNapp  // Vulnerability tools over the lacework CLI
    };

    // Represents the validated command line required to start a server
    struct ServerOptions {
        ServerKind server = ServerKind::Aws;
        std::optional<std::string> cli_path;       // overrides the vendor binary
        std::optional<uint32_t> timeout_seconds;   // overrides the per-vendor default
        bool verbose = false;
    };

    inline std::string to_string(const ServerKind kind) {
        switch (kind) {
            case ServerKind::Aws: return "aws";
            case ServerKind::ForticNapp: return "forticnapp";
            default: return "unknown";
        }
    }

} // namespace cloudctx::core::config

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include "meta/logging.hpp"
#include "mytftpd/dispatch.hpp"

namespace RollTftp::Driver {
    struct ServerConfig {
        std::string address {"0.0.0.0"};
        std::string port {};
        std::filesystem::path root {};
        EngineConfig engine {};
        Meta::LogLevel log_level {Meta::LogLevel::info};
    };

    struct ConfigResult {
        std::optional<ServerConfig> config;
        std::string error;
    };

    [[nodiscard]] std::string_view usageText() noexcept;

    /**
     * @brief Reads `rolltftpd <port> <root dir> [-a address] [-t timeout] [-r retries] [-b max blksize] [-v | -q]`.
     * @note Only checks values. Whether the root exists or the port can be bound is left to startup.
     */
    [[nodiscard]] ConfigResult parseServerArgs(int argc, const char* const argv[]);
}

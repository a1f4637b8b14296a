#include <cstdint>
#include <utility>
#include <fmt/format.h>
#include "meta/helpers.hpp"
#include "mytftp/messaging.hpp"
#include "mytftp/options.hpp"
#include "mytftpd/config.hpp"

namespace RollTftp::Driver {
    static constexpr auto min_positional_argc = 3;
    static constexpr unsigned int min_allowed_port = 1U;
    static constexpr unsigned int max_allowed_port = 65535U;
    static constexpr unsigned int max_retry_limit = 255U;

    std::string_view usageText() noexcept {
        return "usage: ./rolltftpd <port> <root dir> [-a address] [-t timeout secs] [-r retries] [-b max blksize] [-v | -q]\n";
    }

    template <Meta::UnsignedKind T>
    [[nodiscard]] static std::optional<T> parseBounded(std::string_view text, T lowest, T highest) noexcept {
        const auto [value, status] = Meta::parseDecimal<T>(text);

        if (status != Meta::NumberStatus::ok or value < lowest or value > highest) {
            return {};
        }

        return value;
    }

    ConfigResult parseServerArgs(int argc, const char* const argv[]) {
        if (argc < min_positional_argc) {
            return {{}, "missing <port> or <root dir>"};
        }

        ServerConfig temp;

        if (not parseBounded<unsigned int>(argv[1], min_allowed_port, max_allowed_port)) {
            return {{}, fmt::format("invalid port: {}", argv[1])};
        }

        temp.port = argv[1];
        temp.root = argv[2];

        for (auto arg_pos = min_positional_argc; arg_pos < argc; arg_pos++) {
            const std::string_view flag = argv[arg_pos];

            if (flag == "-v") {
                temp.log_level = Meta::LogLevel::debug;
                continue;
            } else if (flag == "-q") {
                temp.log_level = Meta::LogLevel::warning;
                continue;
            }

            if (flag != "-a" and flag != "-t" and flag != "-r" and flag != "-b") {
                return {{}, fmt::format("unknown argument: {}", flag)};
            }

            if (arg_pos + 1 >= argc) {
                return {{}, fmt::format("missing value for {}", flag)};
            }

            const std::string_view value = argv[++arg_pos];

            if (flag == "-a") {
                temp.address = value;
            } else if (flag == "-t") {
                const auto timeout_opt = parseBounded<unsigned int>(value, MyTftp::min_timeout_secs, MyTftp::max_timeout_secs);

                if (not timeout_opt) {
                    return {{}, fmt::format("invalid timeout (1-255 secs): {}", value)};
                }

                temp.engine.default_timeout = std::chrono::seconds {*timeout_opt};
            } else if (flag == "-r") {
                const auto retries_opt = parseBounded<unsigned int>(value, 0U, max_retry_limit);

                if (not retries_opt) {
                    return {{}, fmt::format("invalid retry limit (0-255): {}", value)};
                }

                temp.engine.retry_limit = *retries_opt;
            } else {
                const auto blksize_opt = parseBounded<std::size_t>(value, MyTftp::min_block_size, MyTftp::max_block_size);

                if (not blksize_opt) {
                    return {{}, fmt::format("invalid max blksize (8-65464): {}", value)};
                }

                temp.engine.limits.max_blksize = *blksize_opt;
            }
        }

        return {std::move(temp), {}};
    }
}

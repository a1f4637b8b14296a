#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include "mytftp/messaging.hpp"
#include "mytftp/types.hpp"

namespace RollTftp::MyTftp {
    inline constexpr std::string_view option_name_blksize = "blksize";
    inline constexpr std::string_view option_name_timeout = "timeout";
    inline constexpr std::string_view option_name_tsize = "tsize";

    inline constexpr std::size_t min_block_size = 8UL;
    inline constexpr unsigned int min_timeout_secs = 1U;
    inline constexpr unsigned int max_timeout_secs = 255U;

    struct NegotiationLimits {
        std::size_t min_blksize {min_block_size};
        std::size_t max_blksize {max_block_size};
        unsigned int min_timeout {min_timeout_secs};
        unsigned int max_timeout {max_timeout_secs};
    };

    /// NOTE: The OACK body in request order, plus the typed values the transfer runs with.
    struct AcceptedOptions {
        OptionList entries;
        std::optional<std::size_t> blksize;
        std::optional<unsigned int> timeout;
        std::optional<std::uint64_t> tsize;

        [[nodiscard]] bool empty() const noexcept {
            return entries.empty();
        }
    };

    /**
     * @brief Resolves an RRQ's RFC-2347 options against the engine limits.
     * @param requested Options exactly as decoded from the request.
     * @param source_length Byte length reported by the handler's source, if it knows one.
     * @param limits Engine bounds. `max_blksize` is capped at `max_block_size` regardless of the value passed.
     * @note `blksize` is clamped, `timeout` is dropped when out of range, `tsize` always reports the real size (0 when unknown). Unknown names are ignored.
     */
    [[nodiscard]] AcceptedOptions negotiate(const OptionList& requested, std::optional<std::uint64_t> source_length, const NegotiationLimits& limits = {});
}

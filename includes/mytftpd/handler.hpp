#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "mytftp/types.hpp"

namespace RollTftp::Driver {
    enum class HandlerError : unsigned char {
        none,
        not_found,
        access_denied,
        io_failure
    };

    [[nodiscard]] constexpr MyTftp::ErrorCode toErrorCode(HandlerError error) noexcept {
        switch (error) {
            case HandlerError::not_found: return MyTftp::ErrorCode::file_not_found;
            case HandlerError::access_denied: return MyTftp::ErrorCode::access_violation;
            default: return MyTftp::ErrorCode::not_defined;
        }
    }

    struct ReadResult {
        HandlerError error;
        std::string detail;
        MyTftp::PacketBytes data;
    };

    /**
     * @brief A readable byte stream for one transfer, pulled a block at a time.
     * @note A successful `read` returns at most `max_length` octets. A short read means the stream ended.
     */
    class Source {
    public:
        virtual ~Source() = default;

        [[nodiscard]] virtual ReadResult read(std::uint64_t offset, std::size_t max_length) = 0;
        [[nodiscard]] virtual std::optional<std::uint64_t> length() const = 0;
    };

    struct OpenResult {
        HandlerError error;
        std::string detail;
        std::unique_ptr<Source> source;
    };

    /// NOTE: Maps a requested path to a source. Implementations decide what exists and what may be read.
    class Handler {
    public:
        virtual ~Handler() = default;

        [[nodiscard]] virtual OpenResult open(const std::string& path, MyTftp::DataMode mode) = 0;
    };
}

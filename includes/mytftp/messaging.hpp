#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include "mybsock/buffers.hpp"
#include "mytftp/types.hpp"

namespace RollTftp::MyTftp {
    using OctetView = MyBSock::BufferView<tftp_u8>;

    inline constexpr std::size_t opcode_size = 2UL;
    inline constexpr std::size_t data_header_size = 4UL;
    inline constexpr std::size_t default_block_size = 512UL;
    inline constexpr std::size_t max_block_size = 65464UL;
    inline constexpr std::size_t max_datagram_size = data_header_size + max_block_size;

    /// NOTE: Marks a failed field read, since no real position can reach it.
    inline constexpr auto dud_pos = std::numeric_limits<std::size_t>::max();

    [[nodiscard]] const std::string& toFileModeName(DataMode mode) noexcept;
    [[nodiscard]] DataMode toFileMode(std::string_view mode_name) noexcept;
    [[nodiscard]] std::string_view toErrorMsg(ErrorCode errcode) noexcept;
    [[nodiscard]] std::string_view toOpcodeName(Opcode op) noexcept;
    [[nodiscard]] std::string_view toDecodeStatusName(DecodeStatus status) noexcept;

    template <typename DataType>
    struct HelperResult {
        DataType data;
        std::size_t current_pos;
    };

    [[nodiscard]] HelperResult<tftp_u16> readU16(OctetView source, std::size_t begin) noexcept;

    /// NOTE: Reads up to the next NUL. An unterminated string fails with `dud_pos`, and a successful read skips past the NUL.
    [[nodiscard]] HelperResult<std::string> readText(OctetView source, std::size_t begin);

    [[nodiscard]] HelperResult<PacketBytes> readBlob(OctetView source, std::size_t begin);

    /// NOTE: Reads RFC-2347 `name\0value\0` pairs until the end of `source`.
    [[nodiscard]] DecodeStatus readOptions(OctetView source, std::size_t begin, OptionList& options);

    void writeU16(PacketBytes& target, tftp_u16 value);
    void writeText(PacketBytes& target, std::string_view value);
    void writeBlob(PacketBytes& target, const PacketBytes& value);
    void writeOptions(PacketBytes& target, const OptionList& options);

    [[nodiscard]] DecodeResult parseMessage(OctetView source);

    /**
     * @brief Encodes any well-formed message to its wire form.
     * @note Throws `std::logic_error` when `msg.op` disagrees with its payload, a string holds a NUL, or a DATA payload exceeds `max_block_size`. All of those are caller bugs.
     */
    [[nodiscard]] PacketBytes serializeMessage(const Message& msg);

    /// NOTE: Encodes DATA against a negotiated block size, throwing `std::logic_error` when the payload is larger.
    [[nodiscard]] PacketBytes serializeData(const DataPayload& payload, std::size_t block_size);

    [[nodiscard]] Message makeErrorMessage(ErrorCode errcode, std::string message);
    [[nodiscard]] Message makeErrorMessage(ErrorCode errcode);
}

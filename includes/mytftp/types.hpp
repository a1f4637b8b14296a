#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace RollTftp::MyTftp {
    using tftp_u8 = unsigned char;
    using tftp_u16 = unsigned short;

    using PacketBytes = std::vector<tftp_u8>;

    enum class Opcode : tftp_u16 {
        none,
        rrq,
        wrq,
        data,
        ack,
        err,
        oack,
        last = oack
    };

    enum class DataMode : unsigned char {
        netascii,
        octet,
        mail,
        dud,
        last = dud
    };

    /// NOTE: RFC-1350 section 5 codes plus RFC-2347's code 8. Unlisted wire values are kept verbatim.
    enum class ErrorCode : tftp_u16 {
        not_defined,
        file_not_found,
        access_violation,
        disk_full,
        illegal_operation,
        unknown_tid,
        file_already_exists,
        no_such_user,
        option_negotiation_failed,
        last = option_negotiation_failed
    };

    enum class DecodeStatus : unsigned char {
        ok,
        unknown_opcode,
        truncated,
        malformed_options,
        bad_mode
    };

    using OptionEntry = std::pair<std::string, std::string>;
    using OptionList = std::vector<OptionEntry>;

    struct DudPayload {
        [[nodiscard]] constexpr bool operator==(const DudPayload& other) const noexcept = default;
    };

    /// NOTE: Shared by RRQ and WRQ, which differ only by opcode.
    struct RWPayload {
        std::string filename;
        DataMode mode;
        OptionList options;

        [[nodiscard]] bool operator==(const RWPayload& other) const = default;
    };

    struct DataPayload {
        tftp_u16 block_n;
        PacketBytes data;

        [[nodiscard]] bool operator==(const DataPayload& other) const = default;
    };

    struct AckPayload {
        tftp_u16 block_n;

        [[nodiscard]] constexpr bool operator==(const AckPayload& other) const noexcept = default;
    };

    struct ErrorPayload {
        ErrorCode error;
        std::string message;

        [[nodiscard]] bool operator==(const ErrorPayload& other) const = default;
    };

    struct OackPayload {
        OptionList options;

        [[nodiscard]] bool operator==(const OackPayload& other) const = default;
    };

    struct Message {
        Opcode op;
        std::variant<DudPayload, RWPayload, DataPayload, AckPayload, ErrorPayload, OackPayload> payload;

        [[nodiscard]] bool operator==(const Message& other) const = default;
    };

    struct DecodeResult {
        DecodeStatus status;
        Message msg;
    };
}

#include <array>
#include <stdexcept>
#include <utility>
#include "meta/helpers.hpp"
#include "mytftp/messaging.hpp"

namespace RollTftp::MyTftp {
    static const std::string mode_name_netascii = "netascii";
    static const std::string mode_name_octet = "octet";
    static const std::string mode_name_mail = "mail";
    static const std::string mode_name_dud = "";

    static constexpr std::array<std::string_view, static_cast<std::size_t>(ErrorCode::last) + 1> errcode_msgs = {
        "Not defined",
        "File not found",
        "Access violation",
        "Disk full or allocation exceeded",
        "Illegal TFTP operation",
        "Unknown transfer ID",
        "File already exists",
        "No such user",
        "Option negotiation failed"
    };

    static constexpr std::array<std::string_view, static_cast<std::size_t>(Opcode::last) + 1> opcode_names = {
        "NONE",
        "RRQ",
        "WRQ",
        "DATA",
        "ACK",
        "ERROR",
        "OACK"
    };

    const std::string& toFileModeName(DataMode mode) noexcept {
        switch (mode) {
            case DataMode::netascii: return mode_name_netascii;
            case DataMode::octet: return mode_name_octet;
            case DataMode::mail: return mode_name_mail;
            default: return mode_name_dud;
        }
    }

    DataMode toFileMode(std::string_view mode_name) noexcept {
        if (Meta::equalsIgnoreCase(mode_name, mode_name_netascii)) {
            return DataMode::netascii;
        } else if (Meta::equalsIgnoreCase(mode_name, mode_name_octet)) {
            return DataMode::octet;
        } else if (Meta::equalsIgnoreCase(mode_name, mode_name_mail)) {
            return DataMode::mail;
        }

        return DataMode::dud;
    }

    std::string_view toErrorMsg(ErrorCode errcode) noexcept {
        const auto errcode_n = static_cast<std::size_t>(errcode);

        if (errcode_n >= errcode_msgs.size()) {
            return errcode_msgs[0];
        }

        return errcode_msgs[errcode_n];
    }

    std::string_view toOpcodeName(Opcode op) noexcept {
        const auto op_n = static_cast<std::size_t>(op);

        if (op_n >= opcode_names.size()) {
            return opcode_names[0];
        }

        return opcode_names[op_n];
    }

    std::string_view toDecodeStatusName(DecodeStatus status) noexcept {
        switch (status) {
            case DecodeStatus::ok: return "ok";
            case DecodeStatus::unknown_opcode: return "unknown opcode";
            case DecodeStatus::truncated: return "truncated";
            case DecodeStatus::malformed_options: return "malformed options";
            case DecodeStatus::bad_mode: return "bad transfer mode";
            default: return "unknown";
        }
    }

    HelperResult<tftp_u16> readU16(OctetView source, std::size_t begin) noexcept {
        const auto source_len = source.getLength();

        if (begin > source_len or source_len - begin < 2UL) {
            return {0, dud_pos};
        }

        const auto high = static_cast<tftp_u16>(source[begin]);
        const auto low = static_cast<tftp_u16>(source[begin + 1UL]);

        return {static_cast<tftp_u16>((high << 8) | low), begin + 2UL};
    }

    HelperResult<std::string> readText(OctetView source, std::size_t begin) {
        std::string temp;
        const auto source_len = source.getLength();

        if (begin >= source_len) {
            return {std::move(temp), dud_pos};
        }

        auto read_offset = begin;

        for (; read_offset < source_len; read_offset++) {
            const auto c = static_cast<char>(source[read_offset]);

            if (c == '\0') {
                break;
            }

            temp += c;
        }

        if (read_offset == source_len) {
            return {std::string {}, dud_pos};
        }

        /// NOTE: +1 to skip the NUL delimiter before the next field.
        return {std::move(temp), read_offset + 1UL};
    }

    HelperResult<PacketBytes> readBlob(OctetView source, std::size_t begin) {
        const auto source_len = source.getLength();

        if (begin > source_len) {
            return {{}, dud_pos};
        }

        return {source.subView(begin, source_len - begin).toOwned(), source_len};
    }

    DecodeStatus readOptions(OctetView source, std::size_t begin, OptionList& options) {
        const auto source_len = source.getLength();
        auto parse_pos = begin;

        while (parse_pos < source_len) {
            auto [name, pos_1] = readText(source, parse_pos);

            if (pos_1 == dud_pos) {
                return DecodeStatus::truncated;
            }

            if (pos_1 >= source_len) {
                return DecodeStatus::malformed_options;
            }

            auto [value, pos_2] = readText(source, pos_1);

            if (pos_2 == dud_pos) {
                return DecodeStatus::truncated;
            }

            options.emplace_back(std::move(name), std::move(value));
            parse_pos = pos_2;
        }

        return DecodeStatus::ok;
    }

    void writeU16(PacketBytes& target, tftp_u16 value) {
        target.push_back(static_cast<tftp_u8>((value >> 8) & 0xffU));
        target.push_back(static_cast<tftp_u8>(value & 0xffU));
    }

    void writeText(PacketBytes& target, std::string_view value) {
        if (value.find('\0') != std::string_view::npos) {
            throw std::logic_error {"TFTP text field contains a NUL octet"};
        }

        target.insert(target.end(), value.begin(), value.end());
        target.push_back(0);
    }

    void writeBlob(PacketBytes& target, const PacketBytes& value) {
        target.insert(target.end(), value.begin(), value.end());
    }

    void writeOptions(PacketBytes& target, const OptionList& options) {
        for (const auto& [name, value] : options) {
            writeText(target, name);
            writeText(target, value);
        }
    }

    static DecodeResult parseRWPayload(OctetView source, Opcode op) {
        auto [filename, pos_1] = readText(source, opcode_size);

        if (pos_1 == dud_pos) {
            return {DecodeStatus::truncated, {Opcode::none, DudPayload {}}};
        }

        auto [mode_name, pos_2] = readText(source, pos_1);

        if (pos_2 == dud_pos) {
            return {DecodeStatus::truncated, {Opcode::none, DudPayload {}}};
        }

        const auto mode = toFileMode(mode_name);

        if (mode == DataMode::dud) {
            return {DecodeStatus::bad_mode, {Opcode::none, DudPayload {}}};
        }

        OptionList options;

        if (const auto options_status = readOptions(source, pos_2, options); options_status != DecodeStatus::ok) {
            return {options_status, {Opcode::none, DudPayload {}}};
        }

        return {
            DecodeStatus::ok,
            {op, RWPayload {std::move(filename), mode, std::move(options)}}
        };
    }

    static DecodeResult parseDataPayload(OctetView source) {
        const auto [block_n, pos_1] = readU16(source, opcode_size);

        if (pos_1 == dud_pos) {
            return {DecodeStatus::truncated, {Opcode::none, DudPayload {}}};
        }

        auto [data_blob, pos_2] = readBlob(source, pos_1);

        if (pos_2 == dud_pos) {
            return {DecodeStatus::truncated, {Opcode::none, DudPayload {}}};
        }

        return {DecodeStatus::ok, {Opcode::data, DataPayload {block_n, std::move(data_blob)}}};
    }

    static DecodeResult parseAckPayload(OctetView source) {
        const auto [block_n, pos_1] = readU16(source, opcode_size);

        if (pos_1 == dud_pos) {
            return {DecodeStatus::truncated, {Opcode::none, DudPayload {}}};
        }

        return {DecodeStatus::ok, {Opcode::ack, AckPayload {block_n}}};
    }

    static DecodeResult parseErrorPayload(OctetView source) {
        const auto [raw_errcode, pos_1] = readU16(source, opcode_size);

        if (pos_1 == dud_pos) {
            return {DecodeStatus::truncated, {Opcode::none, DudPayload {}}};
        }

        auto [raw_msg, pos_2] = readText(source, pos_1);

        if (pos_2 == dud_pos) {
            return {DecodeStatus::truncated, {Opcode::none, DudPayload {}}};
        }

        return {
            DecodeStatus::ok,
            {Opcode::err, ErrorPayload {static_cast<ErrorCode>(raw_errcode), std::move(raw_msg)}}
        };
    }

    static DecodeResult parseOackPayload(OctetView source) {
        OptionList options;

        if (const auto options_status = readOptions(source, opcode_size, options); options_status != DecodeStatus::ok) {
            return {options_status, {Opcode::none, DudPayload {}}};
        }

        return {DecodeStatus::ok, {Opcode::oack, OackPayload {std::move(options)}}};
    }

    DecodeResult parseMessage(OctetView source) {
        const auto [opcode, pos] = readU16(source, 0UL);

        if (pos == dud_pos) {
            return {DecodeStatus::truncated, {Opcode::none, DudPayload {}}};
        }

        const auto opcode_enum_v = static_cast<Opcode>(opcode);

        switch (opcode_enum_v) {
            case Opcode::rrq:
            case Opcode::wrq:
                return parseRWPayload(source, opcode_enum_v);
            case Opcode::data:
                return parseDataPayload(source);
            case Opcode::ack:
                return parseAckPayload(source);
            case Opcode::err:
                return parseErrorPayload(source);
            case Opcode::oack:
                return parseOackPayload(source);
            default:
                return {DecodeStatus::unknown_opcode, {Opcode::none, DudPayload {}}};
        }
    }

    template <typename PayloadT>
    [[nodiscard]] static const PayloadT& expectPayload(const Message& msg) {
        const auto* payload_ptr = std::get_if<PayloadT>(&msg.payload);

        if (payload_ptr == nullptr) {
            throw std::logic_error {"TFTP message opcode does not match its payload"};
        }

        return *payload_ptr;
    }

    PacketBytes serializeMessage(const Message& msg) {
        PacketBytes temp;
        const auto msg_opcode = msg.op;

        switch (msg_opcode) {
            case Opcode::rrq:
            case Opcode::wrq: {
                const auto& [filename, mode, options] = expectPayload<RWPayload>(msg);

                if (mode == DataMode::dud) {
                    throw std::logic_error {"TFTP request has no transfer mode"};
                }

                writeU16(temp, static_cast<tftp_u16>(msg_opcode));
                writeText(temp, filename);
                writeText(temp, toFileModeName(mode));
                writeOptions(temp, options);
                break;
            }
            case Opcode::data:
                return serializeData(expectPayload<DataPayload>(msg), max_block_size);
            case Opcode::ack: {
                const auto& [block_n] = expectPayload<AckPayload>(msg);

                writeU16(temp, static_cast<tftp_u16>(msg_opcode));
                writeU16(temp, block_n);
                break;
            }
            case Opcode::err: {
                const auto& [errcode, message] = expectPayload<ErrorPayload>(msg);

                writeU16(temp, static_cast<tftp_u16>(msg_opcode));
                writeU16(temp, static_cast<tftp_u16>(errcode));
                writeText(temp, message);
                break;
            }
            case Opcode::oack: {
                const auto& [options] = expectPayload<OackPayload>(msg);

                writeU16(temp, static_cast<tftp_u16>(msg_opcode));
                writeOptions(temp, options);
                break;
            }
            default:
                throw std::logic_error {"cannot serialize a TFTP message without an opcode"};
        }

        return temp;
    }

    PacketBytes serializeData(const DataPayload& payload, std::size_t block_size) {
        const auto& [block_n, data_blob] = payload;

        if (data_blob.size() > block_size or data_blob.size() > max_block_size) {
            throw std::logic_error {"TFTP DATA payload exceeds the negotiated block size"};
        }

        PacketBytes temp;
        temp.reserve(data_header_size + data_blob.size());

        writeU16(temp, static_cast<tftp_u16>(Opcode::data));
        writeU16(temp, block_n);
        writeBlob(temp, data_blob);

        return temp;
    }

    Message makeErrorMessage(ErrorCode errcode, std::string message) {
        return {Opcode::err, ErrorPayload {errcode, std::move(message)}};
    }

    Message makeErrorMessage(ErrorCode errcode) {
        return makeErrorMessage(errcode, std::string {toErrorMsg(errcode)});
    }
}

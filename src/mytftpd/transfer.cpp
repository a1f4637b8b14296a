#include <utility>
#include <variant>
#include <fmt/format.h>
#include "mytftpd/transfer.hpp"

namespace RollTftp::Driver {
    std::string_view toStateName(TransferState state) noexcept {
        switch (state) {
            case TransferState::awaiting_option_ack: return "awaiting-oack-ack";
            case TransferState::sending_data: return "sending-data";
            case TransferState::awaiting_ack: return "awaiting-ack";
            case TransferState::complete: return "complete";
            case TransferState::failed: return "failed";
            default: return "unknown";
        }
    }

    TransferSettings resolveSettings(const MyTftp::AcceptedOptions& accepted, std::chrono::seconds default_timeout, unsigned int retry_limit) noexcept {
        return {
            accepted.blksize.value_or(MyTftp::default_block_size),
            accepted.timeout ? std::chrono::seconds {*accepted.timeout} : default_timeout,
            retry_limit
        };
    }

    Transfer::Transfer(MyBSock::Endpoint peer, std::unique_ptr<Source> source, MyTftp::AcceptedOptions accepted, TransferSettings settings, MyBSock::DatagramSink& sink)
    : m_peer {peer}, m_source {std::move(source)}, m_oack_options {std::move(accepted.entries)}, m_settings {settings}, m_sink {sink}, m_sequencer {}, m_in_flight {}, m_deadline {}, m_detail {}, m_bytes_sent {0ULL}, m_retries {0U}, m_state {TransferState::sending_data}, m_final_block {false} {}

    /// @note Only use for unconditional state transitions.
    TransferState Transfer::transition(TransferState next) noexcept {
        m_state = next;

        return m_state;
    }

    void Transfer::sendInFlight(TimePoint now) {
        /// NOTE: A failed send is not fatal here: the armed timer resends it like a lost datagram.
        [[maybe_unused]] const auto send_status = m_sink.sendTo(m_peer, m_in_flight);

        m_deadline = now + m_settings.timeout;
    }

    void Transfer::sendReply(const MyTftp::Message& msg) {
        const auto reply_bytes = MyTftp::serializeMessage(msg);

        [[maybe_unused]] const auto send_status = m_sink.sendTo(m_peer, reply_bytes);
    }

    TransferState Transfer::stateSendData(TimePoint now) {
        const auto block_size = m_settings.block_size;
        auto [read_error, read_detail, chunk_data] = m_source->read(m_sequencer.getOffset(block_size), block_size);

        if (read_error != HandlerError::none) {
            auto reply_text = read_detail.empty() ? std::string {MyTftp::toErrorMsg(toErrorCode(read_error))} : read_detail;

            return stateFail(fmt::format("source read failed: {}", reply_text), MyTftp::makeErrorMessage(toErrorCode(read_error), reply_text));
        }

        if (chunk_data.size() > block_size) {
            return stateFail("source returned an oversized block", MyTftp::makeErrorMessage(MyTftp::ErrorCode::not_defined, "Server read error"));
        }

        const auto chunk_size = chunk_data.size();

        m_final_block = chunk_size < block_size;
        m_in_flight = MyTftp::serializeData({m_sequencer.getWireBlock(), std::move(chunk_data)}, block_size);
        m_bytes_sent += chunk_size;
        m_retries = 0U;

        sendInFlight(now);

        return transition(TransferState::awaiting_ack);
    }

    TransferState Transfer::stateFail(std::string detail, std::optional<MyTftp::Message> reply) {
        if (reply) {
            sendReply(*reply);
        }

        m_detail = std::move(detail);
        m_deadline.reset();
        m_in_flight.clear();
        m_source.reset();

        return transition(TransferState::failed);
    }

    TransferState Transfer::stateComplete() {
        m_deadline.reset();
        m_in_flight.clear();
        m_source.reset();

        return transition(TransferState::complete);
    }

    TransferState Transfer::start(TimePoint now) {
        if (m_state != TransferState::sending_data or not m_in_flight.empty()) {
            return m_state;
        }

        if (not m_oack_options.empty()) {
            m_in_flight = MyTftp::serializeMessage({MyTftp::Opcode::oack, MyTftp::OackPayload {m_oack_options}});
            m_retries = 0U;

            sendInFlight(now);

            return transition(TransferState::awaiting_option_ack);
        }

        return stateSendData(now);
    }

    TransferState Transfer::onPacket(const MyTftp::Message& msg, TimePoint now) {
        if (isTerminal()) {
            return m_state;
        }

        if (msg.op == MyTftp::Opcode::err) {
            const auto& [peer_errcode, peer_message] = std::get<MyTftp::ErrorPayload>(msg.payload);

            return stateFail(fmt::format("peer sent ERROR {}: {}", static_cast<int>(peer_errcode), peer_message), std::nullopt);
        }

        if (msg.op != MyTftp::Opcode::ack) {
            return stateFail(fmt::format("unexpected {} while {}", MyTftp::toOpcodeName(msg.op), toStateName(m_state)), MyTftp::makeErrorMessage(MyTftp::ErrorCode::illegal_operation));
        }

        const auto [ack_block] = std::get<MyTftp::AckPayload>(msg.payload);

        if (m_state == TransferState::awaiting_option_ack) {
            if (ack_block != 0) {
                return stateFail(fmt::format("ACK {} before option acknowledgement", ack_block), MyTftp::makeErrorMessage(MyTftp::ErrorCode::illegal_operation));
            }

            return stateSendData(now);
        }

        const auto current_block = m_sequencer.getWireBlock();

        if (ack_block == current_block) {
            if (m_final_block) {
                return stateComplete();
            }

            m_sequencer.advance();

            return stateSendData(now);
        }

        /// NOTE: Stale and duplicate ACKs are expected on a lossy path, so they change nothing and trigger no resend.
        if (isEarlierBlock(current_block, ack_block)) {
            return m_state;
        }

        return stateFail(fmt::format("ACK {} is ahead of block {}", ack_block, current_block), MyTftp::makeErrorMessage(MyTftp::ErrorCode::illegal_operation));
    }

    TransferState Transfer::onMalformed(MyTftp::DecodeStatus status) {
        if (isTerminal()) {
            return m_state;
        }

        return stateFail(fmt::format("malformed packet from peer ({})", MyTftp::toDecodeStatusName(status)), MyTftp::makeErrorMessage(MyTftp::ErrorCode::illegal_operation));
    }

    TransferState Transfer::onTimeout(TimePoint now) {
        if (isTerminal() or m_in_flight.empty()) {
            return m_state;
        }

        if (m_retries >= m_settings.retry_limit) {
            return stateFail(fmt::format("no response after {} retransmissions", m_retries), std::nullopt);
        }

        ++m_retries;
        sendInFlight(now);

        return m_state;
    }
}

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "mybsock/endpoint.hpp"
#include "mybsock/sockets.hpp"
#include "mytftp/messaging.hpp"
#include "mytftp/options.hpp"
#include "mytftp/types.hpp"
#include "mytftpd/handler.hpp"
#include "mytftpd/sequencer.hpp"

namespace RollTftp::Driver {
    using TransferClock = std::chrono::steady_clock;
    using TimePoint = TransferClock::time_point;

    namespace Constants {
        inline constexpr std::chrono::seconds default_timeout {3};
        inline constexpr unsigned int default_retry_limit = 5U;
    }

    enum class TransferState : unsigned char {
        awaiting_option_ack,
        sending_data,
        awaiting_ack,
        complete,
        failed
    };

    [[nodiscard]] std::string_view toStateName(TransferState state) noexcept;

    struct TransferSettings {
        std::size_t block_size {MyTftp::default_block_size};
        std::chrono::seconds timeout {Constants::default_timeout};
        unsigned int retry_limit {Constants::default_retry_limit};
    };

    /// NOTE: Negotiated values win, and RFC-1350 defaults plus the configured timeout fill the rest.
    [[nodiscard]] TransferSettings resolveSettings(const MyTftp::AcceptedOptions& accepted, std::chrono::seconds default_timeout, unsigned int retry_limit) noexcept;

    /**
     * @brief Serves one RRQ to one peer: optional OACK, then one DATA block at a time until the short block is acknowledged.
     * @note Driven only by `start`, `onPacket`, `onMalformed` and `onTimeout`. Each returns the resulting state. The owner fires `onTimeout` once `getDeadline()` has passed.
     */
    class Transfer {
    private:
        MyBSock::Endpoint m_peer;
        std::unique_ptr<Source> m_source;
        MyTftp::OptionList m_oack_options;
        TransferSettings m_settings;
        MyBSock::DatagramSink& m_sink;
        BlockSequencer m_sequencer;
        MyTftp::PacketBytes m_in_flight;
        std::optional<TimePoint> m_deadline;
        std::string m_detail;
        std::uint64_t m_bytes_sent;
        unsigned int m_retries;
        TransferState m_state;
        bool m_final_block;

        [[nodiscard]] TransferState transition(TransferState next) noexcept;

        void sendInFlight(TimePoint now);
        void sendReply(const MyTftp::Message& msg);

        TransferState stateSendData(TimePoint now);
        TransferState stateFail(std::string detail, std::optional<MyTftp::Message> reply);
        TransferState stateComplete();

    public:
        Transfer() = delete;
        Transfer(MyBSock::Endpoint peer, std::unique_ptr<Source> source, MyTftp::AcceptedOptions accepted, TransferSettings settings, MyBSock::DatagramSink& sink);

        Transfer(const Transfer& other) = delete;
        Transfer& operator=(const Transfer& other) = delete;

        TransferState start(TimePoint now);
        TransferState onPacket(const MyTftp::Message& msg, TimePoint now);
        TransferState onMalformed(MyTftp::DecodeStatus status);
        TransferState onTimeout(TimePoint now);

        [[nodiscard]] TransferState getState() const noexcept {
            return m_state;
        }

        [[nodiscard]] bool isTerminal() const noexcept {
            return m_state == TransferState::complete or m_state == TransferState::failed;
        }

        [[nodiscard]] const std::optional<TimePoint>& getDeadline() const noexcept {
            return m_deadline;
        }

        [[nodiscard]] const MyBSock::Endpoint& getPeer() const noexcept {
            return m_peer;
        }

        [[nodiscard]] const TransferSettings& getSettings() const noexcept {
            return m_settings;
        }

        [[nodiscard]] BlockPosition getPosition() const noexcept {
            return m_sequencer.getPosition();
        }

        [[nodiscard]] unsigned int getRetries() const noexcept {
            return m_retries;
        }

        [[nodiscard]] std::uint64_t getBytesSent() const noexcept {
            return m_bytes_sent;
        }

        [[nodiscard]] bool holdsSource() const noexcept {
            return m_source != nullptr;
        }

        [[nodiscard]] const std::string& getDetail() const noexcept {
            return m_detail;
        }
    };
}

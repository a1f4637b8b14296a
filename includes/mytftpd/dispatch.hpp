#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <unordered_map>
#include "meta/logging.hpp"
#include "mybsock/endpoint.hpp"
#include "mybsock/sockets.hpp"
#include "mytftp/messaging.hpp"
#include "mytftp/options.hpp"
#include "mytftpd/handler.hpp"
#include "mytftpd/transfer.hpp"

namespace RollTftp::Driver {
    struct EngineConfig {
        MyTftp::NegotiationLimits limits {};
        std::chrono::seconds default_timeout {Constants::default_timeout};
        unsigned int retry_limit {Constants::default_retry_limit};
    };

    /**
     * @brief Routes datagrams from the shared socket to per-peer transfers and owns their lifetimes.
     * @note Single owner: all calls must come from one thread (the reactor), which is what serializes the session table.
     */
    class Dispatcher {
    private:
        using SessionTable = std::unordered_map<MyBSock::Endpoint, std::unique_ptr<Transfer>, MyBSock::EndpointHash>;

        SessionTable m_sessions;
        EngineConfig m_config;
        Handler& m_handler;
        MyBSock::DatagramSink& m_sink;
        Meta::Logger& m_logger;

        void replyError(const MyBSock::Endpoint& peer, MyTftp::ErrorCode errcode, std::string message);
        void handleNewRequest(const MyBSock::Endpoint& peer, const MyTftp::Message& msg, TimePoint now);
        void reapIfTerminal(SessionTable::iterator session_it);

    public:
        Dispatcher(EngineConfig config, Handler& handler, MyBSock::DatagramSink& sink, Meta::Logger& logger);

        Dispatcher(const Dispatcher& other) = delete;
        Dispatcher& operator=(const Dispatcher& other) = delete;

        void onDatagram(MyTftp::OctetView octets, const MyBSock::Endpoint& peer, TimePoint now);
        void onTick(TimePoint now);

        [[nodiscard]] std::optional<TimePoint> nextDeadline() const noexcept;

        [[nodiscard]] std::size_t activeCount() const noexcept {
            return m_sessions.size();
        }

        [[nodiscard]] bool hasSession(const MyBSock::Endpoint& peer) const {
            return m_sessions.contains(peer);
        }

        /// NOTE: Read-only peek for diagnostics and tests. Null when no session exists for `peer`.
        [[nodiscard]] const Transfer* findSession(const MyBSock::Endpoint& peer) const;
    };
}

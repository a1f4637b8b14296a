#include <utility>
#include <variant>
#include <vector>
#include "meta/helpers.hpp"
#include "mybsock/endpoint.hpp"
#include "mytftpd/dispatch.hpp"

namespace RollTftp::Driver {
    using Meta::LogLevel;

    Dispatcher::Dispatcher(EngineConfig config, Handler& handler, MyBSock::DatagramSink& sink, Meta::Logger& logger)
    : m_sessions {}, m_config {config}, m_handler {handler}, m_sink {sink}, m_logger {logger} {}

    void Dispatcher::replyError(const MyBSock::Endpoint& peer, MyTftp::ErrorCode errcode, std::string message) {
        const auto reply_bytes = MyTftp::serializeMessage(MyTftp::makeErrorMessage(errcode, std::move(message)));

        if (m_sink.sendTo(peer, reply_bytes) != MyBSock::IOStatus::ok) {
            m_logger.logMessage<LogLevel::warning>("could not send ERROR {} to {}", static_cast<int>(errcode), MyBSock::toString(peer));
        }
    }

    void Dispatcher::handleNewRequest(const MyBSock::Endpoint& peer, const MyTftp::Message& msg, TimePoint now) {
        const auto& [filename, mode, options] = std::get<MyTftp::RWPayload>(msg.payload);
        const auto shown_name = Meta::escapeForLog(filename);

        if (msg.op == MyTftp::Opcode::wrq) {
            m_logger.logMessage<LogLevel::info>("rejecting WRQ for '{}' from {}", shown_name, MyBSock::toString(peer));
            replyError(peer, MyTftp::ErrorCode::not_defined, "write not supported");
            return;
        }

        if (mode == MyTftp::DataMode::mail) {
            m_logger.logMessage<LogLevel::info>("rejecting mail-mode RRQ for '{}' from {}", shown_name, MyBSock::toString(peer));
            replyError(peer, MyTftp::ErrorCode::illegal_operation, "mail mode not supported");
            return;
        }

        auto [open_error, open_detail, source] = m_handler.open(filename, mode);

        if (open_error != HandlerError::none or source == nullptr) {
            const auto errcode = (source == nullptr and open_error == HandlerError::none) ? MyTftp::ErrorCode::not_defined : toErrorCode(open_error);
            const auto reply_text = open_detail.empty() ? std::string {MyTftp::toErrorMsg(errcode)} : open_detail;

            m_logger.logMessage<LogLevel::info>("RRQ for '{}' from {} refused: {}", shown_name, MyBSock::toString(peer), reply_text);
            replyError(peer, errcode, reply_text);
            return;
        }

        auto accepted = MyTftp::negotiate(options, source->length(), m_config.limits);
        const auto settings = resolveSettings(accepted, m_config.default_timeout, m_config.retry_limit);

        m_logger.logMessage<LogLevel::info>("RRQ for '{}' ({}) from {}: blksize={}, timeout={}s, {} option(s) accepted", shown_name, MyTftp::toFileModeName(mode), MyBSock::toString(peer), settings.block_size, settings.timeout.count(), accepted.entries.size());

        auto transfer = std::make_unique<Transfer>(peer, std::move(source), std::move(accepted), settings, m_sink);
        [[maybe_unused]] auto [session_it, inserted] = m_sessions.emplace(peer, std::move(transfer));

        session_it->second->start(now);
        reapIfTerminal(session_it);
    }

    void Dispatcher::reapIfTerminal(SessionTable::iterator session_it) {
        const auto& transfer = *session_it->second;

        if (not transfer.isTerminal()) {
            return;
        }

        const auto peer_name = MyBSock::toString(session_it->first);

        if (transfer.getState() == TransferState::complete) {
            m_logger.logMessage<LogLevel::info>("transfer to {} complete, {} bytes", peer_name, transfer.getBytesSent());
        } else {
            m_logger.logMessage<LogLevel::warning>("transfer to {} failed: {}", peer_name, transfer.getDetail());
        }

        m_sessions.erase(session_it);
    }

    void Dispatcher::onDatagram(MyTftp::OctetView octets, const MyBSock::Endpoint& peer, TimePoint now) {
        auto [decode_status, msg] = MyTftp::parseMessage(octets);

        if (auto session_it = m_sessions.find(peer); session_it != m_sessions.end()) {
            if (decode_status != MyTftp::DecodeStatus::ok) {
                session_it->second->onMalformed(decode_status);
            } else if (msg.op == MyTftp::Opcode::rrq) {
                /// NOTE: Clients resend an RRQ when the first reply is lost. The running session already answers it.
                m_logger.logMessage<LogLevel::debug>("ignoring repeated RRQ from {}", MyBSock::toString(peer));
                return;
            } else {
                session_it->second->onPacket(msg, now);
            }

            reapIfTerminal(session_it);
            return;
        }

        if (decode_status != MyTftp::DecodeStatus::ok) {
            m_logger.logMessage<LogLevel::warning>("ignoring malformed packet from {}: {}", MyBSock::toString(peer), MyTftp::toDecodeStatusName(decode_status));
            return;
        }

        if (msg.op == MyTftp::Opcode::rrq or msg.op == MyTftp::Opcode::wrq) {
            handleNewRequest(peer, msg, now);
            return;
        }

        m_logger.logMessage<LogLevel::debug>("ignoring stray {} from {}", MyTftp::toOpcodeName(msg.op), MyBSock::toString(peer));
    }

    void Dispatcher::onTick(TimePoint now) {
        std::vector<MyBSock::Endpoint> expired_peers;

        for (const auto& [peer, transfer] : m_sessions) {
            const auto& deadline = transfer->getDeadline();

            if (deadline and *deadline <= now) {
                expired_peers.push_back(peer);
            }
        }

        for (const auto& peer : expired_peers) {
            auto session_it = m_sessions.find(peer);

            if (session_it == m_sessions.end()) {
                continue;
            }

            m_logger.logMessage<LogLevel::debug>("timeout for {} after {} retransmission(s)", MyBSock::toString(peer), session_it->second->getRetries());
            session_it->second->onTimeout(now);
            reapIfTerminal(session_it);
        }
    }

    std::optional<TimePoint> Dispatcher::nextDeadline() const noexcept {
        std::optional<TimePoint> earliest;

        for (const auto& [peer, transfer] : m_sessions) {
            const auto& deadline = transfer->getDeadline();

            if (deadline and (not earliest or *deadline < *earliest)) {
                earliest = deadline;
            }
        }

        return earliest;
    }

    const Transfer* Dispatcher::findSession(const MyBSock::Endpoint& peer) const {
        const auto session_it = m_sessions.find(peer);

        return (session_it != m_sessions.end()) ? session_it->second.get() : nullptr;
    }
}

#include <algorithm>
#include <atomic>
#include <csignal>
#include <utility>
#include "mybsock/endpoint.hpp"
#include "mytftpd/driver.hpp"

namespace RollTftp::Driver {
    using Meta::LogLevel;

    static std::atomic<MyServer*> stop_target {nullptr};

    static_assert(std::atomic<MyServer*>::is_always_lock_free, "signal handlers may only touch lock-free atomics");

    static void onStopSignal([[maybe_unused]] int signal_n) {
        if (auto* server = stop_target.load(); server != nullptr) {
            server->requestStop();
        }
    }

    MyServer::MyServer(MyBSock::UDPServerSocket socket, Handler& handler, EngineConfig config, Meta::Logger& logger)
    : m_in_buffer {}, m_socket {std::move(socket)}, m_logger {logger}, m_dispatcher {config, handler, m_socket, logger}, m_halt {} {}

    std::chrono::milliseconds MyServer::computeWait(TimePoint now) const noexcept {
        const auto deadline = m_dispatcher.nextDeadline();

        if (not deadline) {
            return Constants::idle_wait;
        }

        if (*deadline <= now) {
            return std::chrono::milliseconds {0};
        }

        const auto until_deadline = std::chrono::ceil<std::chrono::milliseconds>(*deadline - now);

        return std::min(until_deadline, Constants::idle_wait);
    }

    void MyServer::stateReceive() {
        const auto [peer, status] = m_socket.receiveFrom(m_in_buffer);

        if (status != MyBSock::IOStatus::ok) {
            m_logger.logMessage<LogLevel::warning>("receive failed, dropping datagram");
            return;
        }

        m_logger.logMessage<LogLevel::debug>("{} bytes from {}", m_in_buffer.getLength(), MyBSock::toString(peer));
        m_dispatcher.onDatagram(m_in_buffer.view(), peer, TransferClock::now());
    }

    void MyServer::requestStop() noexcept {
        m_halt.test_and_set();
    }

    bool MyServer::runService() {
        if (not m_socket.isUsable()) {
            return false;
        }

        m_logger.logMessage<LogLevel::info>("serving, press Ctrl+C to stop");

        while (not m_halt.test()) {
            const auto wait_status = m_socket.waitReadable(computeWait(TransferClock::now()));

            if (wait_status == MyBSock::IOStatus::pipe_closed) {
                m_logger.logMessage<LogLevel::fatal>("socket closed unexpectedly");
                return false;
            }

            if (wait_status == MyBSock::IOStatus::ok) {
                stateReceive();
            }

            m_dispatcher.onTick(TransferClock::now());
        }

        m_logger.logMessage<LogLevel::info>("stopping, abandoning {} active transfer(s)", m_dispatcher.activeCount());

        return true;
    }

    bool bindStopSignals(MyServer* server) noexcept {
        stop_target.store(server);

        const auto disposition = (server != nullptr) ? onStopSignal : SIG_DFL;
        const auto int_ok = std::signal(SIGINT, disposition) != SIG_ERR;
        const auto term_ok = std::signal(SIGTERM, disposition) != SIG_ERR;

        return int_ok and term_ok;
    }
}

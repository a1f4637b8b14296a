#pragma once

#include <atomic>
#include <chrono>
#include "meta/logging.hpp"
#include "mybsock/buffers.hpp"
#include "mybsock/sockets.hpp"
#include "mytftp/messaging.hpp"
#include "mytftp/types.hpp"
#include "mytftpd/dispatch.hpp"
#include "mytftpd/handler.hpp"

namespace RollTftp::Driver {
    namespace Constants {
        /// NOTE: Upper bound on one idle wait, so a stop request is noticed even with no traffic.
        inline constexpr std::chrono::milliseconds idle_wait {250};
    }

    /**
     * @brief Single-threaded reactor: waits for a datagram or the earliest transfer deadline, then feeds the dispatcher.
     * @note Every session is touched only from `runService`, so the session table needs no lock.
     */
    class MyServer {
    private:
        MyBSock::FixedBuffer<MyTftp::tftp_u8, MyTftp::max_datagram_size> m_in_buffer;
        MyBSock::UDPServerSocket m_socket;
        Meta::Logger& m_logger;
        Dispatcher m_dispatcher;
        std::atomic_flag m_halt;

        [[nodiscard]] std::chrono::milliseconds computeWait(TimePoint now) const noexcept;
        void stateReceive();

    public:
        MyServer() = delete;
        MyServer(MyBSock::UDPServerSocket socket, Handler& handler, EngineConfig config, Meta::Logger& logger);

        MyServer(const MyServer& other) = delete;
        MyServer& operator=(const MyServer& other) = delete;

        /// NOTE: Safe to call from a signal handler.
        void requestStop() noexcept;

        [[nodiscard]] bool isStopRequested() const noexcept {
            return m_halt.test();
        }

        [[nodiscard]] bool runService();
    };

    /**
     * @brief Routes SIGINT and SIGTERM to `server->requestStop()`. Passing nullptr detaches and restores the default dispositions.
     * @note The target is held in a lock-free atomic, so the handler never touches a half-written pointer. Returns false if a handler could not be installed.
     */
    [[nodiscard]] bool bindStopSignals(MyServer* server) noexcept;
}

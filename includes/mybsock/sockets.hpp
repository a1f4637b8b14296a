#pragma once

#include <chrono>
#include <unistd.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <arpa/inet.h>
#include "mybsock/buffers.hpp"
#include "mybsock/endpoint.hpp"

namespace RollTftp::MyBSock {
    enum class IOStatus {
        ok,
        invalid_args,
        timed_out,
        pipe_closed
    };

    struct IOResult {
        Endpoint peer;
        IOStatus status;
    };

    /// NOTE: The outbound half of the transport boundary. Transfers and the dispatcher only ever see this.
    class DatagramSink {
    public:
        virtual ~DatagramSink() = default;

        virtual IOStatus sendTo(const Endpoint& peer, BufferView<unsigned char> octets) = 0;
    };

    class UDPServerSocket : public DatagramSink {
    private:
        int m_fd;
        bool m_ready;
        bool m_closed;

    public:
        UDPServerSocket() noexcept;
        UDPServerSocket(int fd) noexcept;
        ~UDPServerSocket() override;

        UDPServerSocket(const UDPServerSocket& other) = delete;
        UDPServerSocket& operator=(const UDPServerSocket& other) = delete;

        UDPServerSocket(UDPServerSocket&& other) noexcept;
        UDPServerSocket& operator=(UDPServerSocket&& other) noexcept;

        [[nodiscard]] bool isUsable() const noexcept;

        /// NOTE: Waits up to `timeout` for a datagram. An interrupted wait reports `timed_out` so callers can recheck their halt flags.
        [[nodiscard]] IOStatus waitReadable(std::chrono::milliseconds timeout) noexcept;

        IOStatus sendTo(const Endpoint& peer, BufferView<unsigned char> octets) override;

        template <Meta::OctetKind BufferT, std::size_t BufferN>
        [[nodiscard]] IOResult receiveFrom(FixedBuffer<BufferT, BufferN>& buffer) {
            if (not isUsable()) {
                return { {}, IOStatus::pipe_closed };
            }

            buffer.reset();

            sockaddr_storage peer_addr {};
            socklen_t sa_size = sizeof(peer_addr);
            const auto count = recvfrom(m_fd, buffer.viewPtr(), buffer.getSize(), 0, reinterpret_cast<sockaddr*>(&peer_addr), &sa_size);

            if (count < 0) {
                return { {}, IOStatus::pipe_closed };
            }

            const auto peer_opt = fromSockaddr(peer_addr);

            if (not peer_opt) {
                return { {}, IOStatus::invalid_args };
            }

            buffer.markLength(static_cast<std::size_t>(count));

            return { *peer_opt, IOStatus::ok };
        }
    };
}

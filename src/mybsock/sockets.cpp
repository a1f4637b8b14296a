#include <cerrno>
#include <utility>
#include <poll.h>
#include "mybsock/sockets.hpp"

namespace RollTftp::MyBSock {
    static constexpr auto dud_socket_fd = -1;
    static constexpr auto poll_failed = -1;

    bool UDPServerSocket::isUsable() const noexcept {
        return not m_closed and m_ready;
    }

    UDPServerSocket::UDPServerSocket() noexcept
    : m_fd {dud_socket_fd}, m_ready {false}, m_closed {true} {}

    UDPServerSocket::UDPServerSocket(int fd) noexcept
    : m_fd {fd}, m_ready {fd != dud_socket_fd}, m_closed {not m_ready} {}

    UDPServerSocket::~UDPServerSocket() {
        if (not m_ready or m_closed) {
            return;
        }

        close(m_fd);
        m_closed = true;
    }

    UDPServerSocket::UDPServerSocket(UDPServerSocket&& other) noexcept
    : m_fd {std::exchange(other.m_fd, dud_socket_fd)},
    m_ready {std::exchange(other.m_ready, false)},
    m_closed {std::exchange(other.m_closed, true)} {}

    UDPServerSocket& UDPServerSocket::operator=(UDPServerSocket&& other) noexcept {
        if (&other == this) {
            return *this;
        }

        if (m_fd != dud_socket_fd and not m_closed) {
            close(m_fd);
        }

        m_fd = std::exchange(other.m_fd, dud_socket_fd);
        m_ready = std::exchange(other.m_ready, false);
        m_closed = std::exchange(other.m_closed, true);

        return *this;
    }

    IOStatus UDPServerSocket::waitReadable(std::chrono::milliseconds timeout) noexcept {
        if (not isUsable()) {
            return IOStatus::pipe_closed;
        }

        pollfd watched {m_fd, POLLIN, 0};
        const auto wait_ms = (timeout.count() < 0) ? 0 : static_cast<int>(timeout.count());
        const auto ready_count = poll(&watched, 1, wait_ms);

        if (ready_count == poll_failed) {
            return (errno == EINTR) ? IOStatus::timed_out : IOStatus::pipe_closed;
        }

        if (ready_count == 0) {
            return IOStatus::timed_out;
        }

        if ((watched.revents & (POLLERR | POLLNVAL)) != 0) {
            return IOStatus::pipe_closed;
        }

        return IOStatus::ok;
    }

    IOStatus UDPServerSocket::sendTo(const Endpoint& peer, BufferView<unsigned char> octets) {
        if (not isUsable()) {
            return IOStatus::pipe_closed;
        }

        if (not octets) {
            return IOStatus::invalid_args;
        }

        sockaddr_storage peer_addr;
        const auto peer_addr_len = toSockaddr(peer, peer_addr);
        const auto count = sendto(m_fd, octets.viewPtr(), octets.getLength(), 0, reinterpret_cast<const sockaddr*>(&peer_addr), peer_addr_len);

        if (count < 0 or static_cast<std::size_t>(count) != octets.getLength()) {
            return IOStatus::pipe_closed;
        }

        return IOStatus::ok;
    }
}

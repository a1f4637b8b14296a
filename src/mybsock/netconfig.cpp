#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <unistd.h>
#include <sys/socket.h>
#include "mybsock/netconfig.hpp"

namespace RollTftp::MyBSock {
    static constexpr auto lookup_ok = 0;
    static constexpr auto syscall_failed = -1;

    static addrinfo* lookupPassiveUdp(const char* host_cstr, const char* port_cstr) {
        addrinfo hints {};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_DGRAM;
        hints.ai_flags = AI_PASSIVE;

        addrinfo* head = nullptr;

        if (const auto lookup_status = getaddrinfo(host_cstr, port_cstr, &hints, &head); lookup_status != lookup_ok) {
            throw std::runtime_error {std::string {"address lookup failed: "} + gai_strerror(lookup_status)};
        }

        return head;
    }

    SocketGenerator::SocketGenerator(const char* host_cstr, const char* port_cstr)
    : m_candidates {lookupPassiveUdp(host_cstr, port_cstr)}, m_cursor {m_candidates.get()}, m_last_errno {0} {}

    SocketGenerator::operator bool() const noexcept {
        return m_cursor != nullptr;
    }

    std::optional<int> SocketGenerator::operator()() {
        if (m_cursor == nullptr) {
            return {};
        }

        const auto* candidate = std::exchange(m_cursor, m_cursor->ai_next);
        const auto socket_fd = socket(candidate->ai_family, candidate->ai_socktype, candidate->ai_protocol);

        if (socket_fd == syscall_failed) {
            m_last_errno = errno;
            return {};
        }

        if (bind(socket_fd, candidate->ai_addr, candidate->ai_addrlen) == syscall_failed) {
            m_last_errno = errno;
            close(socket_fd);
            return {};
        }

        m_last_errno = 0;

        return socket_fd;
    }

    std::string SocketGenerator::getLastError() const {
        if (m_last_errno == 0) {
            return "no usable local address";
        }

        return std::strerror(m_last_errno);
    }
}

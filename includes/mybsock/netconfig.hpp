#pragma once

#include <memory>
#include <optional>
#include <string>
#include <netdb.h>

namespace RollTftp::MyBSock {
    struct AddrInfoDeleter {
        void operator()(addrinfo* head) const noexcept {
            if (head != nullptr) {
                freeaddrinfo(head);
            }
        }
    };

    /**
     * @brief Walks the passive UDP candidates (IPv4 or IPv6, whichever the host resolves to) for a host and port. Each call tries to bind the next one.
     * @note Throws `std::runtime_error` when the lookup itself fails. A failed bind only skips that candidate, and `getLastError` says why.
     */
    class SocketGenerator {
    private:
        std::unique_ptr<addrinfo, AddrInfoDeleter> m_candidates;
        const addrinfo* m_cursor;
        int m_last_errno;

    public:
        SocketGenerator() = delete;
        SocketGenerator(const char* host_cstr, const char* port_cstr);

        explicit operator bool() const noexcept;
        [[nodiscard]] std::optional<int> operator()();

        [[nodiscard]] std::string getLastError() const;
    };
}

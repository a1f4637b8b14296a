#include <cstring>
#include <arpa/inet.h>
#include <fmt/format.h>
#include "mybsock/endpoint.hpp"

namespace RollTftp::MyBSock {
    std::optional<Endpoint> fromSockaddr(const sockaddr_storage& addr) noexcept {
        Endpoint temp {};

        if (addr.ss_family == AF_INET) {
            sockaddr_in addr4;
            std::memcpy(&addr4, &addr, sizeof(addr4));

            temp.family = AddressFamily::ipv4;
            std::memcpy(temp.address.data(), &addr4.sin_addr, sizeof(addr4.sin_addr));
            temp.port = ntohs(addr4.sin_port);

            return temp;
        }

        if (addr.ss_family == AF_INET6) {
            sockaddr_in6 addr6;
            std::memcpy(&addr6, &addr, sizeof(addr6));

            temp.family = AddressFamily::ipv6;
            std::memcpy(temp.address.data(), &addr6.sin6_addr, sizeof(addr6.sin6_addr));
            temp.port = ntohs(addr6.sin6_port);
            temp.scope_id = addr6.sin6_scope_id;

            return temp;
        }

        return {};
    }

    socklen_t toSockaddr(const Endpoint& endpoint, sockaddr_storage& out) noexcept {
        std::memset(&out, 0, sizeof(out));

        if (endpoint.family == AddressFamily::ipv4) {
            sockaddr_in addr4 {};
            addr4.sin_family = AF_INET;
            addr4.sin_port = htons(endpoint.port);
            std::memcpy(&addr4.sin_addr, endpoint.address.data(), sizeof(addr4.sin_addr));
            std::memcpy(&out, &addr4, sizeof(addr4));

            return sizeof(addr4);
        }

        sockaddr_in6 addr6 {};
        addr6.sin6_family = AF_INET6;
        addr6.sin6_port = htons(endpoint.port);
        addr6.sin6_scope_id = endpoint.scope_id;
        std::memcpy(&addr6.sin6_addr, endpoint.address.data(), sizeof(addr6.sin6_addr));
        std::memcpy(&out, &addr6, sizeof(addr6));

        return sizeof(addr6);
    }

    std::string toString(const Endpoint& endpoint) {
        const auto& octets = endpoint.address;

        if (endpoint.family == AddressFamily::ipv4) {
            return fmt::format("{}.{}.{}.{}:{}", octets[0], octets[1], octets[2], octets[3], endpoint.port);
        }

        in6_addr addr6;
        std::memcpy(&addr6, octets.data(), sizeof(addr6));

        char text_buffer[INET6_ADDRSTRLEN] {};

        if (inet_ntop(AF_INET6, &addr6, text_buffer, sizeof(text_buffer)) == nullptr) {
            return fmt::format("[?]:{}", endpoint.port);
        }

        if (endpoint.scope_id != 0U) {
            return fmt::format("[{}%{}]:{}", text_buffer, endpoint.scope_id, endpoint.port);
        }

        return fmt::format("[{}]:{}", text_buffer, endpoint.port);
    }
}

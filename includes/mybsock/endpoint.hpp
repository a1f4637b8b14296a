#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <netinet/in.h>
#include <sys/socket.h>

namespace RollTftp::MyBSock {
    enum class AddressFamily : unsigned char {
        ipv4,
        ipv6
    };

    using AddressOctets = std::array<std::uint8_t, 16>;

    /**
     * @brief A UDP peer (the TFTP "TID"): address family, address octets in network order, port in host order.
     * @note IPv4 uses the first 4 octets and leaves the rest zero. `scope_id` is only meaningful for link-local IPv6.
     */
    struct Endpoint {
        AddressFamily family;
        AddressOctets address;
        std::uint16_t port;
        std::uint32_t scope_id;

        [[nodiscard]] constexpr bool operator==(const Endpoint& other) const noexcept = default;
    };

    /// NOTE: Empty for families other than AF_INET and AF_INET6.
    [[nodiscard]] std::optional<Endpoint> fromSockaddr(const sockaddr_storage& addr) noexcept;

    /// NOTE: Fills `out` and returns the address length to pass to `sendto`.
    [[nodiscard]] socklen_t toSockaddr(const Endpoint& endpoint, sockaddr_storage& out) noexcept;

    /// NOTE: `a.b.c.d:port` for IPv4, `[v6addr%scope]:port` for IPv6.
    [[nodiscard]] std::string toString(const Endpoint& endpoint);

    [[nodiscard]] constexpr Endpoint makeEndpoint(std::uint8_t a, std::uint8_t b, std::uint8_t c, std::uint8_t d, std::uint16_t port) noexcept {
        return {AddressFamily::ipv4, {a, b, c, d}, port, 0U};
    }

    [[nodiscard]] constexpr Endpoint makeEndpoint6(const AddressOctets& address, std::uint16_t port, std::uint32_t scope_id = 0U) noexcept {
        return {AddressFamily::ipv6, address, port, scope_id};
    }

    struct EndpointHash {
        [[nodiscard]] std::size_t operator()(const Endpoint& endpoint) const noexcept {
            // FNV-1a over every field that takes part in equality
            constexpr std::uint64_t fnv_offset = 14695981039346656037ULL;
            constexpr std::uint64_t fnv_prime = 1099511628211ULL;

            auto temp = fnv_offset;
            const auto mix = [&temp](std::uint64_t octet) {
                temp = (temp ^ (octet & 0xffU)) * fnv_prime;
            };

            mix(static_cast<std::uint64_t>(endpoint.family));

            for (const auto octet : endpoint.address) {
                mix(octet);
            }

            mix(endpoint.port >> 8);
            mix(endpoint.port);

            for (auto shift = 0; shift < 32; shift += 8) {
                mix(endpoint.scope_id >> shift);
            }

            return static_cast<std::size_t>(temp);
        }
    };
}

#pragma once

#include <initializer_list>
#include <iostream>
#include <string_view>
#include <vector>
#include "mybsock/buffers.hpp"
#include "mybsock/endpoint.hpp"
#include "mybsock/sockets.hpp"
#include "mytftp/messaging.hpp"
#include "mytftp/types.hpp"

namespace test {

// Test statistics
struct TestStats {
    int total = 0;
    int passed = 0;
    int failed = 0;

    void print() const {
        std::cout << "\n========== Test Results ==========\n";
        std::cout << "Total:  " << total << "\n";
        std::cout << "Passed: " << passed << " ("
                  << (total > 0 ? (passed * 100.0 / total) : 0) << "%)\n";
        std::cout << "Failed: " << failed << "\n";
        std::cout << "==================================\n";
    }

    int exitCode() const {
        return failed == 0 ? 0 : 1;
    }
};

inline void check(TestStats& stats, bool ok, std::string_view description) {
    stats.total++;
    if (ok) {
        stats.passed++;
        std::cout << "  ✓ " << description << "\n";
    } else {
        stats.failed++;
        std::cout << "  ✗ " << description << "\n";
    }
}

inline RollTftp::MyTftp::PacketBytes bytesOf(std::initializer_list<int> octets) {
    RollTftp::MyTftp::PacketBytes temp;
    for (int octet : octets) {
        temp.push_back(static_cast<RollTftp::MyTftp::tftp_u8>(octet));
    }
    return temp;
}

inline RollTftp::MyTftp::PacketBytes bytesOf(std::string_view text) {
    return {text.begin(), text.end()};
}

// Patterned content so that misplaced offsets show up as wrong bytes
inline RollTftp::MyTftp::PacketBytes makeBlob(std::size_t size) {
    RollTftp::MyTftp::PacketBytes temp(size);
    for (std::size_t i = 0; i < size; i++) {
        temp[i] = static_cast<RollTftp::MyTftp::tftp_u8>((i * 7 + i / 251) & 0xff);
    }
    return temp;
}

// Records outbound datagrams instead of hitting a socket
class RecordingSink : public RollTftp::MyBSock::DatagramSink {
public:
    struct Sent {
        RollTftp::MyBSock::Endpoint peer;
        RollTftp::MyTftp::PacketBytes octets;
    };

    std::vector<Sent> sent;

    RollTftp::MyBSock::IOStatus sendTo(const RollTftp::MyBSock::Endpoint& peer,
                                       RollTftp::MyBSock::BufferView<unsigned char> octets) override {
        sent.push_back({peer, octets.toOwned()});
        return RollTftp::MyBSock::IOStatus::ok;
    }

    RollTftp::MyTftp::Message decoded(std::size_t index) const {
        return RollTftp::MyTftp::parseMessage(sent.at(index).octets).msg;
    }

    RollTftp::MyTftp::Message last() const {
        return decoded(sent.size() - 1);
    }

    void clear() {
        sent.clear();
    }
};

inline RollTftp::MyTftp::Message ackOf(RollTftp::MyTftp::tftp_u16 block) {
    return {RollTftp::MyTftp::Opcode::ack, RollTftp::MyTftp::AckPayload {block}};
}

inline RollTftp::MyTftp::PacketBytes ackBytes(RollTftp::MyTftp::tftp_u16 block) {
    return RollTftp::MyTftp::serializeMessage(ackOf(block));
}

} // namespace test

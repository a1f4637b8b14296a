#include "test_common.hpp"
#include <chrono>
#include <iostream>
#include <sstream>
#include <string_view>
#include <variant>
#include "meta/helpers.hpp"
#include "meta/logging.hpp"
#include "mybsock/endpoint.hpp"
#include "mytftpd/dispatch.hpp"
#include "mytftpd/handlers.hpp"

using namespace RollTftp::Driver;
using namespace RollTftp::MyTftp;
using namespace std::string_view_literals;
using RollTftp::Meta::LogLevel;
using RollTftp::Meta::Logger;
using RollTftp::MyBSock::Endpoint;
using RollTftp::MyBSock::makeEndpoint;
using test::TestStats;
using test::RecordingSink;
using test::ackBytes;
using test::bytesOf;
using test::check;

namespace {
    constexpr Endpoint alice = makeEndpoint(192, 168, 1, 20, 50001);
    constexpr Endpoint bob = makeEndpoint(192, 168, 1, 21, 50001);
    constexpr Endpoint alice_other_port = makeEndpoint(192, 168, 1, 20, 50002);
    const TimePoint t0 {};

    struct Fixture {
        std::ostringstream log_sink;
        Logger logger {log_sink, "dispatch-test", LogLevel::debug};
        MemoryHandler handler;
        RecordingSink sink;
        Dispatcher dispatcher;

        explicit Fixture(EngineConfig config = {})
        : dispatcher {config, handler, sink, logger} {
            handler.addEntry("small.txt", test::makeBlob(1000));
            handler.addEntry("empty.txt", {});
        }
    };

    PacketBytes rrqBytes(std::string_view name, const OptionList& options = {}) {
        return serializeMessage({Opcode::rrq, RWPayload {std::string {name}, DataMode::octet, options}});
    }

    const ErrorPayload* errorOf(const Message& msg) {
        return std::get_if<ErrorPayload>(&msg.payload);
    }
}

// =================== A. New requests ===================
void testNewRequests(TestStats& stats) {
    std::cout << "\n[A. New Requests]\n";

    {
        Fixture fx;
        fx.dispatcher.onDatagram(rrqBytes("small.txt"), alice, t0);
        check(stats, fx.dispatcher.hasSession(alice) && fx.dispatcher.activeCount() == 1, "RRQ for an existing file opens a session");
        check(stats, fx.sink.sent.size() == 1 && fx.sink.sent[0].peer == alice && fx.sink.last().op == Opcode::data, "the session sends DATA 1 to the requester");
        check(stats, fx.log_sink.str().find("dispatch-test [INFO]: RRQ for 'small.txt'") != std::string::npos, "accepted requests are logged");
    }

    {
        Fixture fx;
        fx.dispatcher.onDatagram(rrqBytes("nope.bin"), alice, t0);
        const auto reply = fx.sink.last();
        check(stats, errorOf(reply) && errorOf(reply)->error == ErrorCode::file_not_found, "unknown file answers ERROR 1");
        check(stats, fx.dispatcher.activeCount() == 0, "and opens no session");
    }

    {
        Fixture fx;
        fx.dispatcher.onDatagram(serializeMessage({Opcode::wrq, RWPayload {"up.bin", DataMode::octet, {}}}), alice, t0);
        const auto reply = fx.sink.last();
        check(stats, errorOf(reply) && errorOf(reply)->error == ErrorCode::not_defined && errorOf(reply)->message == "write not supported",
              "WRQ answers ERROR 0 'write not supported'");
        check(stats, fx.dispatcher.activeCount() == 0, "and opens no session");
    }

    {
        Fixture fx;
        fx.dispatcher.onDatagram(serializeMessage({Opcode::rrq, RWPayload {"small.txt", DataMode::mail, {}}}), alice, t0);
        const auto reply = fx.sink.last();
        check(stats, errorOf(reply) && errorOf(reply)->error == ErrorCode::illegal_operation && fx.dispatcher.activeCount() == 0,
              "mail mode answers ERROR 4");
    }

    {
        Fixture fx;
        fx.dispatcher.onDatagram(rrqBytes("small.txt", {{"blksize", "100000"}}), alice, t0);
        const auto reply = fx.sink.last();
        const auto* oack = std::get_if<OackPayload>(&reply.payload);
        check(stats, oack && oack->options == OptionList {{"blksize", "65464"}}, "RRQ options are negotiated into an OACK");
        check(stats, fx.dispatcher.findSession(alice) && fx.dispatcher.findSession(alice)->getState() == TransferState::awaiting_option_ack,
              "the session waits for ACK 0");
    }

    {
        EngineConfig config;
        config.limits.max_blksize = 1024;
        Fixture fx {config};
        fx.dispatcher.onDatagram(rrqBytes("small.txt", {{"blksize", "8192"}}), alice, t0);
        const auto* session = fx.dispatcher.findSession(alice);
        check(stats, session && session->getSettings().block_size == 1024, "the configured blksize ceiling applies");
    }
}

// =================== B. Routing ===================
void testRouting(TestStats& stats) {
    std::cout << "\n[B. Routing]\n";

    Fixture fx;
    fx.dispatcher.onDatagram(rrqBytes("small.txt"), alice, t0);
    fx.dispatcher.onDatagram(rrqBytes("small.txt"), bob, t0);
    check(stats, fx.dispatcher.activeCount() == 2, "two peers get two sessions");

    fx.dispatcher.onDatagram(rrqBytes("small.txt"), alice, t0);
    check(stats, fx.dispatcher.activeCount() == 2 && fx.sink.sent.size() == 2, "a repeated RRQ from an active peer is ignored");

    fx.dispatcher.onDatagram(rrqBytes("small.txt"), alice_other_port, t0);
    check(stats, fx.dispatcher.activeCount() == 3, "a new source port is a new peer");

    fx.sink.clear();
    fx.dispatcher.onDatagram(ackBytes(1), alice, t0);
    check(stats, fx.sink.sent.size() == 1 && fx.sink.sent[0].peer == alice, "ACK routes to the sending peer only");
    check(stats, fx.dispatcher.findSession(bob)->getPosition().block == 1, "other sessions do not move");

    fx.dispatcher.onDatagram(ackBytes(2), alice, t0);
    check(stats, !fx.dispatcher.hasSession(alice) && fx.dispatcher.activeCount() == 2, "a completed session is removed");

    fx.sink.clear();
    fx.dispatcher.onDatagram(ackBytes(1), makeEndpoint(10, 9, 8, 7, 1234), t0);
    check(stats, fx.sink.sent.empty() && fx.dispatcher.activeCount() == 2, "a stray ACK from an unknown peer is dropped silently");

    fx.dispatcher.onDatagram(bytesOf({0, 4, 0}), makeEndpoint(10, 9, 8, 7, 1234), t0);
    check(stats, fx.sink.sent.empty(), "a malformed packet from an unknown peer gets no reply");
    check(stats, fx.log_sink.str().find("ignoring malformed packet") != std::string::npos, "but is logged");

    fx.dispatcher.onDatagram(bytesOf({0, 4, 0}), bob, t0);
    const auto reply = fx.sink.last();
    check(stats, errorOf(reply) && errorOf(reply)->error == ErrorCode::illegal_operation && fx.sink.sent.back().peer == bob,
          "a malformed packet from a session peer answers ERROR 4");
    check(stats, !fx.dispatcher.hasSession(bob), "and ends that session");

    fx.sink.clear();
    fx.dispatcher.onDatagram(serializeMessage(makeErrorMessage(ErrorCode::not_defined, "abort")), alice_other_port, t0);
    check(stats, fx.sink.sent.empty() && fx.dispatcher.activeCount() == 0, "a peer ERROR ends its session without a reply");
}

// =================== C. Timers ===================
void testTimers(TestStats& stats) {
    std::cout << "\n[C. Timers]\n";

    EngineConfig config;
    config.retry_limit = 2;
    Fixture fx {config};

    check(stats, !fx.dispatcher.nextDeadline(), "no sessions, no deadline");

    fx.dispatcher.onDatagram(rrqBytes("small.txt"), alice, t0);
    fx.dispatcher.onDatagram(rrqBytes("empty.txt", {{"timeout", "1"}}), bob, t0);
    check(stats, fx.dispatcher.nextDeadline() == t0 + std::chrono::seconds {1}, "the earliest deadline wins");

    fx.sink.clear();
    fx.dispatcher.onTick(t0 + std::chrono::milliseconds {500});
    check(stats, fx.sink.sent.empty(), "nothing fires before a deadline");

    fx.dispatcher.onTick(t0 + std::chrono::seconds {1});
    check(stats, fx.sink.sent.size() == 1 && fx.sink.sent[0].peer == bob, "only the expired session retransmits");

    auto now = t0;
    for (int i = 0; i < 3; i++) {
        now += Constants::default_timeout;
        fx.dispatcher.onTick(now);
    }

    check(stats, fx.dispatcher.activeCount() == 0, "sessions past the retry limit are removed");
    check(stats, fx.log_sink.str().find("failed: no response after 2 retransmissions") != std::string::npos, "exhaustion is logged as a failure");
    check(stats, !fx.dispatcher.nextDeadline(), "no deadline remains");
}

// =================== D. Option acknowledgement wait ===================
void testOptionWait(TestStats& stats) {
    std::cout << "\n[D. Option Acknowledgement Wait]\n";

    EngineConfig config;
    config.retry_limit = 1;
    Fixture fx {config};

    fx.dispatcher.onDatagram(rrqBytes("small.txt", {{"blksize", "1024"}}), alice, t0);
    fx.dispatcher.onDatagram(rrqBytes("small.txt", {{"tsize", "0"}}), bob, t0);
    check(stats, fx.dispatcher.activeCount() == 2 && fx.sink.sent.size() == 2, "both sessions wait on an OACK");

    fx.sink.clear();
    fx.dispatcher.onDatagram(serializeMessage(makeErrorMessage(ErrorCode::option_negotiation_failed)), bob, t0);
    check(stats, !fx.dispatcher.hasSession(bob) && fx.sink.sent.empty(), "ERROR 8 during the OACK wait removes the session without a reply");

    fx.dispatcher.onTick(t0 + Constants::default_timeout);
    check(stats, fx.sink.sent.size() == 1 && fx.sink.last().op == Opcode::oack, "an unanswered OACK is resent");

    fx.dispatcher.onTick(t0 + 2 * Constants::default_timeout);
    check(stats, fx.dispatcher.activeCount() == 0 && fx.sink.sent.size() == 1, "an OACK past the retry limit removes the session silently");
}

// =================== E. Address families ===================
void testAddressFamilies(TestStats& stats) {
    std::cout << "\n[E. Address Families]\n";

    constexpr RollTftp::MyBSock::AddressOctets v6_octets {0x20, 0x01, 0x0d, 0xb8, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0x20};
    constexpr auto carol = RollTftp::MyBSock::makeEndpoint6(v6_octets, 50001);

    Fixture fx;
    fx.dispatcher.onDatagram(rrqBytes("small.txt"), carol, t0);
    fx.dispatcher.onDatagram(rrqBytes("small.txt"), alice, t0);
    check(stats, fx.dispatcher.hasSession(carol) && fx.dispatcher.activeCount() == 2, "an IPv6 peer gets its own session");
    check(stats, fx.sink.sent[0].peer == carol, "its DATA goes back to the IPv6 endpoint");

    fx.dispatcher.onDatagram(ackBytes(1), carol, t0);
    fx.dispatcher.onDatagram(ackBytes(2), carol, t0);
    check(stats, !fx.dispatcher.hasSession(carol) && fx.dispatcher.hasSession(alice), "the IPv6 transfer completes independently");
    check(stats, fx.log_sink.str().find("transfer to [2001:db8::20]:50001 complete") != std::string::npos, "IPv6 peers are logged in bracket form");
}

// =================== F. Log hygiene ===================
void testLogEscaping(TestStats& stats) {
    std::cout << "\n[F. Log Hygiene]\n";

    check(stats, RollTftp::Meta::escapeForLog("pxelinux.0") == "pxelinux.0", "printable names are logged as-is");
    check(stats, RollTftp::Meta::escapeForLog("a\nb\\c\x7f") == "a\\x0ab\\x5cc\\x7f", "controls, DEL and backslash are hex-escaped");

    Fixture fx;
    fx.dispatcher.onDatagram(rrqBytes("evil\ninjected [INFO]: \x1b[31mfake"), alice, t0);

    const auto logged = fx.log_sink.str();
    check(stats, logged.find("evil\\x0ainjected [INFO]: \\x1b[31mfake") != std::string::npos, "a requested name with control characters is escaped in the log");
    check(stats, logged.find("evil\n") == std::string::npos && logged.find('\x1b') == std::string::npos, "no raw control characters reach the log");
}

int main() {
    std::cout << "Dispatcher tests\n";

    TestStats stats;
    testNewRequests(stats);
    testRouting(stats);
    testTimers(stats);
    testOptionWait(stats);
    testAddressFamilies(stats);
    testLogEscaping(stats);

    stats.print();
    return stats.exitCode();
}

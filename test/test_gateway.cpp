#include "pseudo_terminal.hpp"

#include <catch2/catch.hpp>
#include <ramses/gateway.hpp>

#include <csignal>
#include <cstdio>
#include <string>
#include <unistd.h>
#include <vector>

using namespace ramses;

namespace {

std::string writePacketLog(const std::string& name, const std::vector<PacketT>& packets) {
    std::string path = "/tmp/ramses_test_" + std::to_string(::getpid()) + "_" + name;
    std::remove(path.c_str());
    PacketLogWriter writer(path);
    for (const auto& pkt : packets) {
        writer.write(pkt);
    }
    return path;
}

const std::vector<PacketT> TEST_PACKETS{
        makePacket("1F09|I|01:145038", "I --- 01:145038 --:------ 01:145038 1F09 003 FF04B5",
                msecs(1000)),
        makePacket("30C9|I|04:056053", "I --- 04:056053 --:------ 01:145038 30C9 003 0007C1",
                msecs(2000)),
        makePacket("1F09|RP|01:145038", "RP --- 01:145038 18:000730 --:------ 1F09 003 FF0532",
                msecs(3000)),
};

}  // namespace

TEST_CASE("Gateway Replay", "[gateway]") {
    std::string path = writePacketLog("replay.log", TEST_PACKETS);
    std::vector<std::string> received;
    Gateway::Config config;
    config.input_file = path;
    config.msg_handler = [&received](const Message& msg) { received.push_back(msg.getFrame()); };
    Gateway gwy(std::move(config));

    REQUIRE(gwy.start() == Gateway::ExitReason::END_OF_INPUT);
    REQUIRE(received.size() == TEST_PACKETS.size());
    for (size_t i = 0; i < received.size(); ++i) {
        REQUIRE(received[i] == TEST_PACKETS[i].frame);
    }

    // a gateway only runs once
    try {
        gwy.start();
        FAIL("started twice");
    } catch (const Error& e) {
        REQUIRE(e.type == Gateway::ALREADY_STARTED);
    }
    std::remove(path.c_str());
}

TEST_CASE("Gateway Graceful Exit", "[gateway]") {
    std::string path = writePacketLog("graceful.log", TEST_PACKETS);
    int received = 0;
    Gateway* gateway = nullptr;
    Gateway::Config config;
    config.input_file = path;
    config.msg_handler = [&](const Message&) {
        ++received;
        gateway->stop();
    };
    Gateway gwy(std::move(config));
    gateway = &gwy;

    REQUIRE(gwy.start() == Gateway::ExitReason::GRACEFUL_EXIT);
    REQUIRE(received == 1);
    std::remove(path.c_str());
}

TEST_CASE("Gateway Interrupted", "[gateway]") {
    std::string path = writePacketLog("interrupted.log", TEST_PACKETS);
    Gateway::Config config;
    config.input_file = path;
    config.msg_handler = [](const Message&) { std::raise(SIGINT); };
    Gateway gwy(std::move(config));

    REQUIRE(gwy.start() == Gateway::ExitReason::INTERRUPTED);
    std::remove(path.c_str());
}

TEST_CASE("Gateway No Input", "[gateway]") {
    Gateway gwy(Gateway::Config{});
    try {
        gwy.start();
        FAIL("started without input");
    } catch (const Error& e) {
        REQUIRE(e.type == Gateway::NO_INPUT_SPECIFIED);
    }
}

TEST_CASE("Gateway Reply Callbacks", "[gateway]") {
    std::string path = writePacketLog("callbacks.log", TEST_PACKETS);
    msecs now(0);
    Gateway::Config config;
    config.input_file = path;
    config.local_clock = [&now]() { return now; };
    Gateway gwy(std::move(config));

    std::vector<std::string> replies;
    int expired = 0;
    auto handler = [&](const Message* msg) {
        if (msg) {
            replies.push_back(msg->getHeader());
        } else {
            ++expired;
        }
    };
    // without a packet stack the commands are dropped, the callbacks stay
    gwy.sendCommand(makeCommand("1F09|RQ|01:145038", "RQ --- 18:000730 01:145038 --:------ 1F09 001 00"),
            "1F09|RP|01:145038", handler, msecs(1000));
    gwy.sendCommand(makeCommand("3220|RQ|01:123456|00", "RQ --- 18:000730 01:123456 --:------ 3220 005 0000000000"),
            "3220|RP|01:123456|00", handler, msecs(500));
    gwy.sendCommand(makeCommand("", "I --- 18:000730 --:------ 18:000730 0008 002 0000"),
            "30C9|I|04:056053", handler, msecs(0), true);
    REQUIRE(gwy.getCallbacks().size() == 3);

    now = msecs(800);
    REQUIRE(gwy.start() == Gateway::ExitReason::END_OF_INPUT);
    // the first packet expires the 3220 request, the daemon stays
    REQUIRE(expired == 1);
    REQUIRE(replies == std::vector<std::string>{"30C9|I|04:056053", "1F09|RP|01:145038"});
    REQUIRE(gwy.getCallbacks().size() == 1);
    REQUIRE(gwy.getCallbacks().contains("30C9|I|04:056053"));
    std::remove(path.c_str());
}

TEST_CASE("Gateway Reply Without Timeout", "[gateway]") {
    std::string path = writePacketLog("no_timeout.log", TEST_PACKETS);
    msecs now(1000);
    Gateway::Config config;
    config.input_file = path;
    config.local_clock = [&now]() { return now; };
    Gateway gwy(std::move(config));

    int expired = 0;
    gwy.sendCommand(makeCommand("", "RQ --- 18:000730 01:145038 --:------ 0004 002 0000"),
            "0004|RP|01:145038", [&expired](const Message* msg) { expired += !msg; },
            msecs::max());
    REQUIRE(gwy.getCallbacks().getCallbacks().at("0004|RP|01:145038").deadline == msecs::max());

    // much later, it is still waiting
    now = msecs::max() - msecs(1);
    REQUIRE(gwy.start() == Gateway::ExitReason::END_OF_INPUT);
    REQUIRE(expired == 0);
    REQUIRE(gwy.getCallbacks().contains("0004|RP|01:145038"));
    std::remove(path.c_str());
}

TEST_CASE("Gateway Serial", "[gateway]") {
    PseudoTerminal pty;
    REQUIRE(pty.isOpen());
    std::string log_path = "/tmp/ramses_test_" + std::to_string(::getpid()) + "_serial.log";
    std::remove(log_path.c_str());

    std::vector<std::string> received;
    Gateway* gateway = nullptr;
    Gateway::Config config;
    config.serial_port = pty.getSlavePath();
    config.packet_log = log_path;
    config.msg_handler = [&](const Message& msg) {
        received.push_back(msg.getFrame());
        gateway->stop();
    };
    Gateway gwy(std::move(config));
    gateway = &gwy;

    std::string request = "RQ --- 18:000730 01:145038 --:------ 1F09 001 00";
    std::string reply = "045 RP --- 01:145038 18:000730 --:------ 1F09 003 FF0532";
    std::string written;
    // commands are only dispatched once the serial stack is up
    gwy.getLoop().post([&]() {
        gwy.sendCommand(makeCommand("1F09|RQ|01:145038", request));
        // answer like a gateway would, once the request went out
        gwy.getLoop().callLater(msecs(50), [&]() {
            written = pty.read(request.size() + 2);
            pty.write(reply + "\r\n");
        });
    });
    REQUIRE(gwy.start() == Gateway::ExitReason::GRACEFUL_EXIT);
    REQUIRE(written == request + "\r\n");
    REQUIRE(received == std::vector<std::string>{reply});
    REQUIRE(gwy.getPacketLog());
    REQUIRE(gwy.getPacketLog()->getRecordCount() == 1);
    REQUIRE(gwy.getPktTransport()->isClosing());

    PacketLogReader reader(log_path);
    PacketT pkt;
    REQUIRE(reader.read(pkt));
    REQUIRE(pkt.frame == reply);
    std::remove(log_path.c_str());
}

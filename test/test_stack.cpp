#include "pseudo_terminal.hpp"

#include <catch2/catch.hpp>
#include <ramses/stack.hpp>

#include <string>
#include <vector>

using namespace ramses;

namespace {

// takes over the dispatcher of a message transport and answers every command
class RelayProtocol : public Protocol, public PacketProtocol {
public:
    explicit RelayProtocol(MessageProtocol::MessageHandler msg_handler)
            : _msg_handler(std::move(msg_handler)) {}

    void connectionMade(Transport* transport) override { _transport = transport; }
    void dataReceived(const Message& msg) override {
        if (_msg_handler) {
            _msg_handler(msg);
        }
    }
    void connectionLost(const Error*) override { _transport = nullptr; }
    void pauseWriting() override {}
    void resumeWriting() override {}

    void sendData(CommandT cmd, DoneCallback done) override {
        frames.push_back(cmd.frame);
        done();
    }

    Transport* getTransport() { return _transport; }

    std::vector<std::string> frames;

private:
    MessageProtocol::MessageHandler _msg_handler;
    Transport* _transport = nullptr;
};

void spin(EventLoop& loop, int iterations = 10) {
    for (int i = 0; i < iterations; ++i) {
        loop.poll(msecs(0));
    }
}

}  // namespace

TEST_CASE("Create Message Stack", "[stack]") {
    Gateway::Config config;
    config.max_buffer_size = 50;
    Gateway gwy(std::move(config));

    std::vector<std::string> received;
    auto msg_stack = createMessageStack(
            gwy, [&received](const Message& msg) { received.push_back(msg.getFrame()); });
    REQUIRE(msg_stack.first);
    REQUIRE(msg_stack.second);
    REQUIRE(msg_stack.first->getTransport() == msg_stack.second.get());
    REQUIRE(msg_stack.second->getProtocols().size() == 1);
    REQUIRE(msg_stack.second->getCallbacks() == &gwy.getCallbacks());
    // no packet layer yet
    REQUIRE(!msg_stack.second->hasDispatcher());

    msg_stack.second->pktReceiver(makePacket("", "frame", msecs(0)));
    REQUIRE(received == std::vector<std::string>{"frame"});

    // the gateway builds its own stack on construction
    REQUIRE(gwy.getMsgProtocol());
    REQUIRE(gwy.getMsgProtocol()->getTransport() == gwy.getMsgTransport().get());
}

TEST_CASE("Create Packet Stack", "[stack]") {
    PseudoTerminal pty;
    REQUIRE(pty.isOpen());
    Gateway gwy(Gateway::Config{});
    const auto& msg_transport = gwy.getMsgTransport();

    auto pkt_stack = createPacketStack(gwy, msg_transport, pty.getSlavePath());
    REQUIRE(pkt_stack.first);
    REQUIRE(pkt_stack.second);
    REQUIRE(pkt_stack.first->getTransport() == pkt_stack.second.get());
    REQUIRE(msg_transport->hasDispatcher());

    // commands flow down to the serial port
    gwy.getMsgProtocol()->sendData(makeCommand("", "RQ --- 18:000730 01:145038 --:------ 1F09 001 00"));
    spin(gwy.getLoop());
    std::string expected = "RQ --- 18:000730 01:145038 --:------ 1F09 001 00\r\n";
    REQUIRE(pty.read(expected.size()) == expected);

    // and lines flow up to the message layer
    std::vector<std::string> received;
    auto client = createClient(
            gwy,
            [](MessageProtocol::MessageHandler msg_handler) {
                return std::make_shared<RelayProtocol>(std::move(msg_handler));
            },
            [&received](const Message& msg) { received.push_back(msg.getFrame()); });
    // the client took over the dispatcher, so give it back to the serial stack
    msg_transport->setDispatcher([weak_protocol = std::weak_ptr<GatewayProtocol>(pkt_stack.first)](
                                         CommandT cmd, MessageTransport::DoneCallback done) {
        if (auto protocol = weak_protocol.lock()) {
            protocol->sendData(std::move(cmd), std::move(done));
        } else {
            done();
        }
    });
    REQUIRE(pty.write("045 RP --- 01:145038 18:000730 --:------ 1F09 003 FF0532\r\n"));
    auto deadline = getNow<msecs>() + msecs(500);
    while (received.empty() && getNow<msecs>() < deadline) {
        gwy.getLoop().poll(msecs(10));
    }
    REQUIRE(received ==
            std::vector<std::string>{"045 RP --- 01:145038 18:000730 --:------ 1F09 003 FF0532"});

    // losing the serial link closes the message transport
    pkt_stack.second->abort();
    spin(gwy.getLoop());
    REQUIRE(msg_transport->getState() == MessageTransport::State::CLOSED);
    REQUIRE(!client.first->getTransport());
}

TEST_CASE("Packet Stack Transport Dropped", "[stack]") {
    PseudoTerminal pty;
    REQUIRE(pty.isOpen());
    Gateway gwy(Gateway::Config{});
    const auto& msg_transport = gwy.getMsgTransport();
    auto pkt_stack = createPacketStack(gwy, msg_transport, pty.getSlavePath());

    // queue a command, then drop the serial transport before it is dispatched
    gwy.sendCommand(makeCommand("", "RQ --- 18:000730 01:145038 --:------ 1F09 001 00"));
    pkt_stack.second.reset();
    REQUIRE(!pkt_stack.first->getTransport());
    REQUIRE(msg_transport->isClosing());

    // the queued command drains into the protocol without touching the link
    spin(gwy.getLoop());
    REQUIRE(msg_transport->getState() == MessageTransport::State::CLOSED);
    REQUIRE(msg_transport->getQueueSize() == 0);
    REQUIRE(pty.read(1, 50).empty());
}

TEST_CASE("Create Packet Stack Missing Port", "[stack]") {
    Gateway gwy(Gateway::Config{});
    try {
        createPacketStack(gwy, gwy.getMsgTransport(), "/dev/ramses_no_such_port");
        FAIL("opened a missing port");
    } catch (const Error& e) {
        REQUIRE(e.type == SerialPort::SERIAL_OPEN_FAIL);
    }
    REQUIRE(!gwy.getMsgTransport()->hasDispatcher());
}

TEST_CASE("Create Client", "[stack]") {
    Gateway gwy(Gateway::Config{});
    std::vector<std::string> gateway_received;
    std::vector<std::string> client_received;

    auto client = createClient(
            gwy,
            [](MessageProtocol::MessageHandler msg_handler) {
                return std::make_shared<RelayProtocol>(std::move(msg_handler));
            },
            [&client_received](const Message& msg) { client_received.push_back(msg.getFrame()); });
    REQUIRE(client.second == gwy.getMsgTransport());
    REQUIRE(client.first->getTransport() == gwy.getMsgTransport().get());
    REQUIRE(gwy.getMsgTransport()->getProtocols().size() == 2);

    // the client consumes what the gateway sends
    gwy.sendCommand(makeCommand("", "a"));
    gwy.sendCommand(makeCommand("", "b", PRIORITY_HIGH));
    spin(gwy.getLoop());
    REQUIRE(client.first->frames == std::vector<std::string>{"b", "a"});

    // a second client does not fit
    try {
        createClient(gwy,
                [](MessageProtocol::MessageHandler msg_handler) {
                    return std::make_shared<RelayProtocol>(std::move(msg_handler));
                },
                nullptr);
        FAIL("subscribed a third protocol");
    } catch (const Error& e) {
        REQUIRE(e.type == MessageTransport::TOO_MANY_PROTOCOLS);
    }

    // inbound messages reach every subscriber
    client.second->pktReceiver(makePacket("", "reply", msecs(0)));
    REQUIRE(client_received == std::vector<std::string>{"reply"});
}

#pragma once
#include <ramses/gateway.hpp>

#include <type_traits>
#include <utility>

namespace ramses {

// the architecture is: msg -> pkt -> ser

using MessageStack = std::pair<std::shared_ptr<MessageProtocol>, std::shared_ptr<MessageTransport>>;
using PacketStack = std::pair<std::shared_ptr<GatewayProtocol>, std::shared_ptr<SerialTransport>>;

// message protocol and transport, without a dispatcher until a packet stack exists
MessageStack createMessageStack(Gateway& gwy, MessageProtocol::MessageHandler msg_handler);

// opens the serial port and makes the gateway protocol the dispatcher of msg_transport
PacketStack createPacketStack(Gateway& gwy, const std::shared_ptr<MessageTransport>& msg_transport,
        const std::string& serial_port);

// Subscribes a client protocol to the gateway's message transport and makes
// it the active dispatcher sink. The client has to consume dispatched
// commands itself (PacketProtocol), a protocol writing back into the same
// transport would feed its own queue.
template <class ProtocolFactory>
auto createClient(Gateway& gwy, ProtocolFactory protocol_factory,
        MessageProtocol::MessageHandler msg_handler) {
    auto protocol = protocol_factory(std::move(msg_handler));
    using ClientProtocol = typename decltype(protocol)::element_type;
    static_assert(std::is_base_of<Protocol, ClientProtocol>::value,
            "client must be a message protocol");
    static_assert(std::is_base_of<PacketProtocol, ClientProtocol>::value,
            "client must accept dispatched commands");
    const auto& msg_transport = gwy.getMsgTransport();
    msg_transport->setProtocol(protocol);
    std::weak_ptr<ClientProtocol> weak_protocol = protocol;
    msg_transport->setDispatcher([weak_protocol](CommandT cmd, MessageTransport::DoneCallback done) {
        if (auto client = weak_protocol.lock()) {
            client->sendData(std::move(cmd), std::move(done));
        } else {
            done();
        }
    });
    return std::make_pair(protocol, msg_transport);
}

}  // namespace ramses

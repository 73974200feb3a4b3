#include <ramses/stack.hpp>

namespace ramses {

MessageStack createMessageStack(Gateway& gwy, MessageProtocol::MessageHandler msg_handler) {
    const auto& config = gwy.getConfig();
    auto msg_protocol =
            std::make_shared<MessageProtocol>(gwy.getLoop(), std::move(msg_handler), config.logger);
    auto msg_transport = std::make_shared<MessageTransport>(gwy.getLoop(),
            MessageTransport::Config{
                    config.max_buffer_size,  // max buffer size
                    {},                      // extra
                    gwy.getCallbacksPtr(),   // callbacks
                    config.logger,           // logger
                    config.local_clock,      // local clock
            });
    msg_transport->setProtocol(msg_protocol);
    return {msg_protocol, msg_transport};
}

PacketStack createPacketStack(Gateway& gwy, const std::shared_ptr<MessageTransport>& msg_transport,
        const std::string& serial_port) {
    const auto& config = gwy.getConfig();
    SerialPort port(serial_port, config.serial, config.logger);
    // received packets are logged first, then handed to the message layer
    std::weak_ptr<MessageTransport> weak_transport = msg_transport;
    PacketLogWriter* packet_log = gwy.getPacketLog();
    auto pkt_handler = [weak_transport, packet_log](PacketT pkt) {
        if (packet_log) {
            packet_log->write(pkt);
        }
        if (auto transport = weak_transport.lock()) {
            transport->pktReceiver(std::move(pkt));
        }
    };
    // no link left to drain into, wind the message layer down
    auto lost_handler = [weak_transport](const Error*) {
        if (auto transport = weak_transport.lock()) {
            transport->close();
        }
    };
    auto pkt_protocol = std::make_shared<GatewayProtocol>(gwy.getLoop(), std::move(pkt_handler),
            GatewayProtocol::Config{
                    config.tx_gap,            // tx gap
                    512,                      // max line length
                    config.disable_sending,   // disable sending
                    config.packet_parser,     // packet parser
                    std::move(lost_handler),  // lost handler
                    config.logger,            // logger
                    config.local_clock,       // local clock
            });
    SerialTransport::Config serial_config;
    serial_config.logger = config.logger;
    auto pkt_transport = std::make_shared<SerialTransport>(
            gwy.getLoop(), pkt_protocol, std::move(port), std::move(serial_config));
    // complete the pipeline
    std::weak_ptr<GatewayProtocol> weak_protocol = pkt_protocol;
    msg_transport->setDispatcher([weak_protocol](CommandT cmd, MessageTransport::DoneCallback done) {
        if (auto protocol = weak_protocol.lock()) {
            protocol->sendData(std::move(cmd), std::move(done));
        } else {
            done();
        }
    });
    return {pkt_protocol, pkt_transport};
}

}  // namespace ramses

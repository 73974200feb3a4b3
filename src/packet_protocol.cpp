#include <ramses/packet_protocol.hpp>

namespace ramses {

bool parseOpaqueLine(const std::string& line, msecs dtm, PacketT& pkt) {
    pkt.dtm = dtm.count();
    pkt.header.clear();
    pkt.frame = line;
    return true;
}

GatewayProtocol::GatewayProtocol(EventLoop& loop, PacketHandler pkt_handler, Config config)
        : _loop(loop)
        , _pkt_handler(std::move(pkt_handler))
        , _packet_parser(std::move(config.packet_parser))
        , _lost_handler(std::move(config.lost_handler))
        , _logger(std::move(config.logger))
        , _local_clock(std::move(config.local_clock))
        , _tx_gap(config.tx_gap)
        , _max_line_length(config.max_line_length)
        , _disable_sending(config.disable_sending) {
    if (!_packet_parser) {
        _packet_parser = parseOpaqueLine;
    }
}

void GatewayProtocol::sendData(CommandT cmd, DoneCallback done) {
    if (_disable_sending) {
        IF_PTR(_logger, log, Logger::DEBUG, Error(STRERR(SENDING_DISABLED)), cmd.frame.data(),
                cmd.frame.size());
        complete(std::move(done));
        return;
    }
    if (!_transport || _transport->isClosing()) {
        IF_PTR(_logger, log, Logger::ERROR, Error(STRERR(NOT_CONNECTED)), cmd.frame.data(),
                cmd.frame.size());
        complete(std::move(done));
        return;
    }
    if (_pause_writing) {
        _pending.push_back({std::move(cmd), std::move(done)});
        return;
    }
    transmit(std::move(cmd), std::move(done));
}

void GatewayProtocol::connectionMade(SerialTransport* transport) {
    _transport = transport;
    IF_PTR(_logger, log, Logger::INFO, Error(STRERR(CONNECTION_MADE)));
}

void GatewayProtocol::dataReceived(const char* data, size_t len) {
    for (size_t i = 0; i < len; ++i) {
        if (data[i] == '\n') {
            if (!_discarding) {
                receiveLine(std::move(_line_buffer));
            }
            _line_buffer.clear();
            _discarding = false;
            continue;
        }
        if (_discarding) {
            continue;
        }
        if (_line_buffer.size() >= _max_line_length) {
            IF_PTR(_logger, log, Logger::WARN, Error(STRERR(LINE_TOO_LONG)),
                    _line_buffer.data(), _line_buffer.size());
            _line_buffer.clear();
            _discarding = true;
            continue;
        }
        _line_buffer.push_back(data[i]);
    }
}

void GatewayProtocol::connectionLost(const Error* error) {
    _transport = nullptr;
    IF_PTR(_logger, log, Logger::INFO, Error(STRERR(CONNECTION_LOST), error ? error->type : 0));
    // release held commands so the dispatcher above does not stall
    while (!_pending.empty()) {
        auto pending = std::move(_pending.front());
        _pending.pop_front();
        IF_PTR(_logger, log, Logger::ERROR, Error(STRERR(NOT_CONNECTED)),
                pending.cmd.frame.data(), pending.cmd.frame.size());
        complete(std::move(pending.done));
    }
    if (_lost_handler) {
        _lost_handler(error);
    }
}

void GatewayProtocol::pauseWriting() {
    _pause_writing = true;
    IF_PTR(_logger, log, Logger::DEBUG, Error(STRERR(WRITING_PAUSED)));
}

void GatewayProtocol::resumeWriting() {
    _pause_writing = false;
    IF_PTR(_logger, log, Logger::DEBUG, Error(STRERR(WRITING_RESUMED), _pending.size()));
    while (!_pause_writing && !_pending.empty() && _transport) {
        auto pending = std::move(_pending.front());
        _pending.pop_front();
        transmit(std::move(pending.cmd), std::move(pending.done));
    }
}

void GatewayProtocol::transmit(CommandT cmd, DoneCallback done) {
    _transport->write(cmd.frame + "\r\n");
    IF_PTR(_logger, log, Logger::TRACE, Error(STRERR(COMMAND_SENT)), cmd.frame.data(),
            cmd.frame.size());
    complete(std::move(done));
}

void GatewayProtocol::complete(DoneCallback done) {
    if (!done) {
        return;
    }
    if (_tx_gap > msecs(0) && _loop.callLater(_tx_gap, done) >= 0) {
        return;
    }
    _loop.post(std::move(done));
}

void GatewayProtocol::receiveLine(std::string line) {
    // strip the trailing \r and any padding the gateway adds
    const char* whitespace = " \t\r";
    auto first = line.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return;
    }
    line = line.substr(first, line.find_last_not_of(whitespace) - first + 1);
    PacketT pkt;
    if (!_packet_parser(line, _local_clock(), pkt)) {
        IF_PTR(_logger, log, Logger::WARN, Error(STRERR(LINE_REJECTED)), line.data(),
                line.size());
        return;
    }
    IF_PTR(_logger, log, Logger::TRACE, Error(STRERR(PACKET_PARSED)), &pkt, sizeof(pkt));
    _pkt_handler(std::move(pkt));
}

}  // namespace ramses

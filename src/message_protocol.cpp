#include <ramses/message_protocol.hpp>

namespace ramses {

void MessageProtocol::connectionMade(Transport* transport) {
    _transport = transport;
    IF_PTR(_logger, log, Logger::INFO, Error(STRERR(CONNECTION_MADE)));
}

void MessageProtocol::dataReceived(const Message& msg) {
    IF_PTR(_logger, log, Logger::TRACE, Error(STRERR(MESSAGE_RECEIVED)), &msg, sizeof(msg));
    if (_msg_handler) {
        _msg_handler(msg);
    }
}

void MessageProtocol::connectionLost(const Error* error) {
    IF_PTR(_logger, log, Logger::INFO, Error(STRERR(CONNECTION_LOST), error ? error->type : 0));
    _loop.stop();
}

void MessageProtocol::pauseWriting() {
    _pause_writing = true;
    IF_PTR(_logger, log, Logger::DEBUG, Error(STRERR(WRITING_PAUSED)));
}

void MessageProtocol::resumeWriting() {
    _pause_writing = false;
    IF_PTR(_logger, log, Logger::DEBUG, Error(STRERR(WRITING_RESUMED), _pending.size()));
    // flush held commands in order, unless writing gets paused again meanwhile
    while (!_pause_writing && !_pending.empty()) {
        CommandT cmd = std::move(_pending.front());
        _pending.pop_front();
        try {
            _transport->write(std::move(cmd));
        } catch (const Error& e) {
            Error error(STRERR(DEFERRED_WRITE_FAIL), e.type);
            IF_PTR(_logger, log, Logger::ERROR, error, &cmd, sizeof(cmd));
        }
    }
}

void MessageProtocol::sendData(CommandT cmd) {
    if (!_transport) {
        Error error(STRERR(NOT_CONNECTED));
        IF_PTR(_logger, log, Logger::ERROR, error, &cmd, sizeof(cmd));
        throw error;
    }
    if (_pause_writing || !_pending.empty()) {
        IF_PTR(_logger, log, Logger::TRACE, Error(STRERR(COMMAND_DEFERRED)), &cmd, sizeof(cmd));
        _pending.emplace_back(std::move(cmd));
        return;
    }
    IF_PTR(_logger, log, Logger::TRACE, Error(STRERR(COMMAND_SENT)), &cmd, sizeof(cmd));
    _transport->write(std::move(cmd));
}

}  // namespace ramses

#include <ramses/message_transport.hpp>

#include <algorithm>

namespace ramses {

MessageTransport::MessageTransport(EventLoop& loop, Config config)
        : _loop(loop)
        , _extra(std::move(config.extra))
        , _callbacks(std::move(config.callbacks))
        , _logger(std::move(config.logger))
        , _local_clock(std::move(config.local_clock))
        , _max_buffer_size(config.max_buffer_size) {}

void MessageTransport::write(CommandT cmd) {
    if (_state != State::OPEN) {
        Error error(STRERR(TRANSPORT_CLOSED));
        IF_PTR(_logger, log, Logger::ERROR, error, &cmd, sizeof(cmd));
        throw error;
    }
    // nothing can drain the queue yet
    if (!_dispatch_sink) {
        IF_PTR(_logger, log, Logger::DEBUG, Error(STRERR(COMMAND_DROPPED)), &cmd, sizeof(cmd));
        return;
    }
    QueueKey key(cmd.priority, _sequence++);
    IF_PTR(_logger, log, Logger::TRACE, Error(STRERR(COMMAND_QUEUED)), &cmd, sizeof(cmd));
    _queue.emplace(key, std::move(cmd));
    // ask the protocols to hold off once the high-water hint is reached
    if (!_writing_paused && _max_buffer_size && _queue.size() >= _max_buffer_size) {
        _writing_paused = true;
        IF_PTR(_logger, log, Logger::DEBUG, Error(STRERR(WRITING_PAUSED), _queue.size()));
        for (const auto& protocol : _protocols) {
            protocol->pauseWriting();
        }
    }
    scheduleDispatch();
}

void MessageTransport::close() {
    if (_state != State::OPEN) {
        return;
    }
    _state = State::CLOSING;
    IF_PTR(_logger, log, Logger::INFO, Error(STRERR(TRANSPORT_CLOSING), _queue.size()));
    scheduleDispatch();
}

void MessageTransport::abort() {
    if (_state == State::CLOSED) {
        return;
    }
    _state = State::CLOSED;
    IF_PTR(_logger, log, Logger::INFO, Error(STRERR(TRANSPORT_ABORTED), _queue.size()));
    _queue.clear();
    scheduleDispatch();
}

std::string MessageTransport::getExtraInfo(
        const std::string& name, const std::string& default_value) const {
    if (name == WRITER_TASK) {
        if (!_dispatcher_started) {
            return default_value;
        }
        return _connection_lost ? "done" : "running";
    }
    auto extra = _extra.find(name);
    return extra == _extra.end() ? default_value : extra->second;
}

void MessageTransport::setProtocol(std::shared_ptr<Protocol> protocol) {
    if (!protocol) {
        Error error(STRERR(PROTOCOL_IS_NULL));
        IF_PTR(_logger, log, Logger::ERROR, error);
        throw error;
    }
    if (std::find(_protocols.begin(), _protocols.end(), protocol) != _protocols.end()) {
        return;
    }
    if (_protocols.size() >= MAX_PROTOCOLS) {
        Error error(STRERR(TOO_MANY_PROTOCOLS), _protocols.size());
        IF_PTR(_logger, log, Logger::ERROR, error);
        throw error;
    }
    _protocols.emplace_back(protocol);
    IF_PTR(_logger, log, Logger::DEBUG, Error(STRERR(PROTOCOL_ADDED), _protocols.size()));
    protocol->connectionMade(this);
}

void MessageTransport::setDispatcher(DispatchSink dispatch_sink) {
    if (_dispatch_sink) {
        IF_PTR(_logger, log, Logger::DEBUG, Error(STRERR(DISPATCHER_REPLACED)));
    }
    _dispatch_sink = std::move(dispatch_sink);
    if (!_dispatcher_started) {
        _dispatcher_started = true;
        IF_PTR(_logger, log, Logger::INFO, Error(STRERR(DISPATCHER_STARTED)));
    }
    scheduleDispatch();
}

void MessageTransport::pktReceiver(PacketT pkt) {
    Message msg(std::move(pkt));
    IF_PTR(_logger, log, Logger::TRACE, Error(STRERR(PACKET_RECEIVED)), &msg, sizeof(msg));
    // reply callbacks fire before the general fan out
    if (_callbacks) {
        _callbacks->onMessageArrival(msg, _local_clock());
    }
    // copy so a protocol may subscribe another one while being notified
    auto protocols = _protocols;
    for (const auto& protocol : protocols) {
        protocol->dataReceived(msg);
    }
}

void MessageTransport::notSupported() const {
    Error error(STRERR(NOT_SUPPORTED));
    IF_PTR(_logger, log, Logger::ERROR, error);
    throw error;
}

void MessageTransport::scheduleDispatch() {
    if (_dispatch_scheduled || _connection_lost) {
        return;
    }
    _dispatch_scheduled = true;
    std::weak_ptr<MessageTransport> weak_self = weak_from_this();
    _loop.post([weak_self]() {
        if (auto self = weak_self.lock()) {
            self->dispatchNext();
        }
    });
}

void MessageTransport::dispatchNext() {
    _dispatch_scheduled = false;
    // single command in flight, completion schedules the next one
    if (_in_flight) {
        return;
    }
    if (_queue.empty()) {
        // idle until write() or close() wakes the dispatcher again
        if (_state == State::OPEN) {
            return;
        }
        _state = State::CLOSED;
        connectionLost();
        return;
    }
    auto node = _queue.extract(_queue.begin());
    CommandT cmd = std::move(node.mapped());
    if (_writing_paused && _queue.size() <= _max_buffer_size / 2) {
        _writing_paused = false;
        IF_PTR(_logger, log, Logger::DEBUG, Error(STRERR(WRITING_RESUMED), _queue.size()));
        for (const auto& protocol : _protocols) {
            protocol->resumeWriting();
        }
    }
    if (!_dispatch_sink) {
        scheduleDispatch();
        return;
    }
    IF_PTR(_logger, log, Logger::TRACE, Error(STRERR(COMMAND_DISPATCHED)), &cmd, sizeof(cmd));
    _in_flight = true;
    std::weak_ptr<MessageTransport> weak_self = weak_from_this();
    _dispatch_sink(std::move(cmd), [weak_self]() {
        if (auto self = weak_self.lock()) {
            self->_in_flight = false;
            self->scheduleDispatch();
        }
    });
}

void MessageTransport::connectionLost() {
    if (_connection_lost) {
        return;
    }
    _connection_lost = true;
    IF_PTR(_logger, log, Logger::INFO, Error(STRERR(DISPATCHER_STOPPED)));
    auto protocols = _protocols;
    for (const auto& protocol : protocols) {
        protocol->connectionLost(nullptr);
    }
}

}  // namespace ramses

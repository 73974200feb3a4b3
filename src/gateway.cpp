#include <ramses/gateway.hpp>
#include <ramses/stack.hpp>

#include <cerrno>
#include <csignal>

namespace ramses {

namespace {

volatile std::sig_atomic_t s_interrupted = 0;

void onSignal(int) {
    s_interrupted = 1;
}

// installs the interrupt handlers for the lifetime of a run
class SignalGuard {
public:
    SignalGuard() {
        s_interrupted = 0;
        struct sigaction action {};
        action.sa_handler = onSignal;
        sigemptyset(&action.sa_mask);
        // no SA_RESTART, a blocked poll has to return EINTR
        action.sa_flags = 0;
        sigaction(SIGINT, &action, &_old_int);
        sigaction(SIGTERM, &action, &_old_term);
    }

    ~SignalGuard() {
        sigaction(SIGINT, &_old_int, nullptr);
        sigaction(SIGTERM, &_old_term, nullptr);
    }

    SignalGuard(const SignalGuard&) = delete;
    SignalGuard& operator=(const SignalGuard&) = delete;

private:
    struct sigaction _old_int {};
    struct sigaction _old_term {};
};

}  // namespace

Gateway::Gateway(Config config)
        : _config(std::move(config))
        , _loop(_config.logger)
        , _callbacks(std::make_shared<CallbackRegistry>(_config.logger)) {
    auto msg_stack = createMessageStack(*this, _config.msg_handler);
    _msg_protocol = std::move(msg_stack.first);
    _msg_transport = std::move(msg_stack.second);
    IF_PTR(_config.logger, log, Logger::INFO, Error(STRERR(Gateway::INITIALIZED)));
}

Gateway::ExitReason Gateway::start() {
    if (_started) {
        Error error(STRERR(ALREADY_STARTED));
        IF_PTR(_config.logger, log, Logger::ERROR, error);
        throw error;
    }
    if (_config.serial_port.empty() && _config.input_file.empty()) {
        Error error(STRERR(NO_INPUT_SPECIFIED));
        IF_PTR(_config.logger, log, Logger::ERROR, error);
        throw error;
    }
    _started = true;
    if (!_config.serial_port.empty()) {
        if (!_config.packet_log.empty()) {
            _packet_log = std::make_unique<PacketLogWriter>(_config.packet_log, _config.logger);
        }
        auto pkt_stack = createPacketStack(*this, _msg_transport, _config.serial_port);
        _pkt_protocol = std::move(pkt_stack.first);
        _pkt_transport = std::move(pkt_stack.second);
    } else {
        _replay = std::make_unique<PacketLogReader>(_config.input_file, _config.logger);
        _loop.post([this]() { replayNext(); });
    }

    bool interrupted = runLoop() == EINTR;
    if (_pkt_transport) {
        _pkt_transport->abort();
    }
    if (interrupted) {
        IF_PTR(_config.logger, log, Logger::INFO, Error(STRERR(INTERRUPTED)));
        return ExitReason::INTERRUPTED;
    }
    if (_exit_reason == ExitReason::END_OF_INPUT) {
        IF_PTR(_config.logger, log, Logger::INFO, Error(STRERR(END_OF_INPUT)),
                _config.input_file.data(), _config.input_file.size());
    } else {
        IF_PTR(_config.logger, log, Logger::INFO, Error(STRERR(GRACEFUL_EXIT)));
    }
    return _exit_reason;
}

void Gateway::stop() {
    _exit_reason = ExitReason::GRACEFUL_EXIT;
    _loop.stop();
}

void Gateway::sendCommand(CommandT cmd) {
    IF_PTR(_config.logger, log, Logger::DEBUG, Error(STRERR(COMMAND_SENT)), cmd.frame.data(),
            cmd.frame.size());
    _msg_protocol->sendData(std::move(cmd));
}

void Gateway::sendCommand(CommandT cmd, const std::string& reply_header,
        CallbackRegistry::Handler handler, msecs timeout, bool daemon) {
    CallbackRegistry::Callback callback;
    callback.handler = std::move(handler);
    callback.daemon = daemon;
    // msecs::max() or anything past it never expires
    msecs now = getTime();
    if (!daemon && timeout < msecs::max() - now) {
        callback.deadline = now + timeout;
    }
    _callbacks->add(reply_header, std::move(callback));
    sendCommand(std::move(cmd));
}

void Gateway::replayNext() {
    PacketT pkt;
    if (!_replay->read(pkt)) {
        _exit_reason = ExitReason::END_OF_INPUT;
        _loop.stop();
        return;
    }
    IF_PTR(_config.logger, log, Logger::TRACE, Error(STRERR(PACKET_REPLAYED)), &pkt, sizeof(pkt));
    _msg_transport->pktReceiver(std::move(pkt));
    // one packet per iteration, so other tasks keep running during a replay
    _loop.post([this]() { replayNext(); });
}

int Gateway::runLoop() {
    SignalGuard signal_guard;
    // signals that arrive outside of a poll only set the flag
    int timer_id = _loop.addTimer(SIGNAL_CHECK_INTERVAL, [this](int) {
        if (s_interrupted) {
            _loop.stop();
        }
    });
    int err = 0;
    do {
        err = _loop.run();
        // EINTR from a signal that is not ours, keep going
    } while (err == EINTR && !s_interrupted);
    if (timer_id >= 0) {
        _loop.cancelTimer(timer_id);
    }
    return s_interrupted ? EINTR : 0;
}

}  // namespace ramses

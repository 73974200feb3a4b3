#pragma once
#include <ramses/callback_registry.hpp>
#include <ramses/event_loop.hpp>
#include <ramses/message_protocol.hpp>
#include <ramses/message_transport.hpp>
#include <ramses/packet_log.hpp>
#include <ramses/packet_protocol.hpp>
#include <ramses/serial_transport.hpp>

#include <memory>
#include <string>

namespace ramses {

// Owns the event loop, the callback registry and both protocol stacks.
//
// The message stack exists from construction on, so commands and callbacks
// can be queued before start(). start() attaches either a serial gateway or
// a packet log replay and runs the loop until one of the exit conditions.
class Gateway {
public:
    enum ErrorType {
        SUCCESS = 0,
        START_OFFSET = 800,
        // Error
        NO_INPUT_SPECIFIED,
        ALREADY_STARTED,
        // Info
        INITIALIZED,
        GRACEFUL_EXIT,
        INTERRUPTED,
        END_OF_INPUT,
        // Debug
        COMMAND_SENT,
        // Trace
        PACKET_REPLAYED,
    };

    enum class ExitReason { GRACEFUL_EXIT, INTERRUPTED, END_OF_INPUT };

    // how often a pending SIGINT / SIGTERM is checked for outside of a poll
    static constexpr msecs SIGNAL_CHECK_INTERVAL = msecs(100);

    struct Config {
        std::string serial_port;
        std::string input_file;   // packet log to replay when there is no serial port
        std::string packet_log;   // records every packet received from the serial port
        bool disable_sending = false;
        msecs tx_gap = msecs(0);
        size_t max_buffer_size = 200;
        SerialConfig serial = SERIAL_CONFIG;
        PacketParser packet_parser = parseOpaqueLine;
        MessageProtocol::MessageHandler msg_handler;
        std::shared_ptr<Logger> logger;
        std::function<msecs(void)> local_clock = []() {
            return std::chrono::duration_cast<msecs>(
                    std::chrono::system_clock::now().time_since_epoch());
        };
    };

    // no copy or move since the stacks hold on to the loop
    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;
    Gateway(Gateway&&) = delete;
    Gateway& operator=(Gateway&&) = delete;

    Gateway(Config config);

    ExitReason start();

    // graceful exit from start()
    void stop();

    void sendCommand(CommandT cmd);
    // registers a callback for the reply header before sending, the handler
    // gets nullptr if no reply arrived within timeout, msecs::max() waits forever
    void sendCommand(CommandT cmd, const std::string& reply_header,
            CallbackRegistry::Handler handler, msecs timeout, bool daemon = false);

    // accessors (FYI they are not thread safe)
    const Config& getConfig() const { return _config; }
    msecs getTime() const { return _config.local_clock(); }

    EventLoop& getLoop() { return _loop; }
    CallbackRegistry& getCallbacks() { return *_callbacks; }
    const std::shared_ptr<CallbackRegistry>& getCallbacksPtr() const { return _callbacks; }

    const std::shared_ptr<MessageProtocol>& getMsgProtocol() const { return _msg_protocol; }
    const std::shared_ptr<MessageTransport>& getMsgTransport() const { return _msg_transport; }
    const std::shared_ptr<GatewayProtocol>& getPktProtocol() const { return _pkt_protocol; }
    const std::shared_ptr<SerialTransport>& getPktTransport() const { return _pkt_transport; }
    PacketLogWriter* getPacketLog() { return _packet_log.get(); }

    Logger* getLogger() { return _config.logger.get(); }
    const Logger* getLogger() const { return _config.logger.get(); }

private:
    void replayNext();
    int runLoop();

    Config _config;
    EventLoop _loop;
    std::shared_ptr<CallbackRegistry> _callbacks;
    std::shared_ptr<MessageProtocol> _msg_protocol;
    std::shared_ptr<MessageTransport> _msg_transport;
    std::shared_ptr<GatewayProtocol> _pkt_protocol;
    std::shared_ptr<SerialTransport> _pkt_transport;
    std::unique_ptr<PacketLogWriter> _packet_log;
    std::unique_ptr<PacketLogReader> _replay;
    ExitReason _exit_reason = ExitReason::GRACEFUL_EXIT;
    bool _started = false;
};

}  // namespace ramses

#pragma once
#include <ramses/event_loop.hpp>
#include <ramses/message.hpp>
#include <ramses/serial_transport.hpp>

#include <deque>
#include <functional>
#include <string>

namespace ramses {

// Packet layer contract seen by a MessageTransport
class PacketProtocol {
public:
    using DoneCallback = std::function<void()>;
    using PacketHandler = std::function<void(PacketT pkt)>;

    virtual ~PacketProtocol() = default;

    // done is called exactly once, when the next command may be sent
    virtual void sendData(CommandT cmd, DoneCallback done) = 0;
};

// turns one received line into a packet, false rejects the line
using PacketParser = std::function<bool(const std::string& line, msecs dtm, PacketT& pkt)>;

// keeps the whole line as an opaque frame with no correlation header
bool parseOpaqueLine(const std::string& line, msecs dtm, PacketT& pkt);

// Line oriented packet protocol of a serial RAMSES-II gateway.
//
// Received bytes are split into lines, each line becomes a packet through the
// configured parser. Commands go out as one line each; the send completes
// tx_gap after the line was handed to the serial transport.
class GatewayProtocol : public PacketProtocol, public SerialProtocol {
public:
    enum ErrorType {
        SUCCESS = 0,
        START_OFFSET = 600,
        // Error
        NOT_CONNECTED,
        // Warn
        LINE_REJECTED,
        LINE_TOO_LONG,
        // Info
        CONNECTION_MADE,
        CONNECTION_LOST,
        // Debug
        SENDING_DISABLED,
        WRITING_PAUSED,
        WRITING_RESUMED,
        // Trace
        COMMAND_SENT,
        PACKET_PARSED,
    };

    struct Config {
        msecs tx_gap = msecs(0);
        size_t max_line_length = 512;
        bool disable_sending = false;
        PacketParser packet_parser = parseOpaqueLine;
        // told once the serial link is gone
        std::function<void(const Error* error)> lost_handler;
        std::shared_ptr<Logger> logger;
        std::function<msecs(void)> local_clock = []() { return getNow<msecs>(); };
    };

    // no copy or move since timers capture the protocol
    GatewayProtocol(const GatewayProtocol&) = delete;
    GatewayProtocol& operator=(const GatewayProtocol&) = delete;
    GatewayProtocol(GatewayProtocol&&) = delete;
    GatewayProtocol& operator=(GatewayProtocol&&) = delete;

    GatewayProtocol(EventLoop& loop, PacketHandler pkt_handler, Config config);

    // packet protocol interface
    void sendData(CommandT cmd, DoneCallback done) override;

    // serial protocol interface
    void connectionMade(SerialTransport* transport) override;
    void dataReceived(const char* data, size_t len) override;
    void connectionLost(const Error* error) override;
    void pauseWriting() override;
    void resumeWriting() override;

    // accessors
    SerialTransport* getTransport() { return _transport; }
    bool isWritingPaused() const { return _pause_writing; }
    size_t getPendingCommands() const { return _pending.size(); }

    Logger* getLogger() { return _logger.get(); }
    const Logger* getLogger() const { return _logger.get(); }

private:
    struct PendingCommand {
        CommandT cmd;
        DoneCallback done;
    };

    void transmit(CommandT cmd, DoneCallback done);
    void complete(DoneCallback done);
    void receiveLine(std::string line);

    EventLoop& _loop;
    PacketHandler _pkt_handler;
    PacketParser _packet_parser;
    std::function<void(const Error* error)> _lost_handler;
    std::deque<PendingCommand> _pending;
    std::string _line_buffer;
    std::shared_ptr<Logger> _logger;
    std::function<msecs(void)> _local_clock;
    SerialTransport* _transport = nullptr;
    msecs _tx_gap;
    size_t _max_line_length;
    bool _disable_sending;
    bool _pause_writing = false;
    bool _discarding = false;
};

}  // namespace ramses

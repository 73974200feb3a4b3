#pragma once
#include <ramses/callback_registry.hpp>
#include <ramses/event_loop.hpp>
#include <ramses/protocol.hpp>

#include <map>
#include <unordered_map>

namespace ramses {

static constexpr const char* WRITER_TASK = "writer_task";

// Transport between message protocols and a packet layer sink.
//
// Outbound commands are kept in a priority queue and handed to the sink one
// at a time, lowest (priority, arrival) first. The next command is only
// dispatched once the sink has reported completion. Inbound packets are
// matched against the callback registry, then fanned out to every subscribed
// protocol in registration order.
class MessageTransport : public Transport, public std::enable_shared_from_this<MessageTransport> {
public:
    enum ErrorType {
        SUCCESS = 0,
        START_OFFSET = 300,
        // Error
        TRANSPORT_CLOSED,
        TOO_MANY_PROTOCOLS,
        NOT_SUPPORTED,
        PROTOCOL_IS_NULL,
        // Info
        DISPATCHER_STARTED,
        DISPATCHER_STOPPED,
        TRANSPORT_CLOSING,
        TRANSPORT_ABORTED,
        // Debug
        PROTOCOL_ADDED,
        DISPATCHER_REPLACED,
        COMMAND_DROPPED,
        WRITING_PAUSED,
        WRITING_RESUMED,
        // Trace
        COMMAND_QUEUED,
        COMMAND_DISPATCHED,
        PACKET_RECEIVED,
    };

    enum class State { OPEN, CLOSING, CLOSED };

    using DoneCallback = std::function<void()>;
    // the sink must call done exactly once when it finished with the command
    using DispatchSink = std::function<void(CommandT cmd, DoneCallback done)>;

    static constexpr size_t MAX_PROTOCOLS = 2;

    struct Config {
        // queue size hint, protocols are asked to pause writing above it
        size_t max_buffer_size = 200;
        std::unordered_map<std::string, std::string> extra;
        std::shared_ptr<CallbackRegistry> callbacks;
        std::shared_ptr<Logger> logger;
        std::function<msecs(void)> local_clock = []() { return getNow<msecs>(); };
    };

    // no copy or move since the dispatcher captures the transport
    MessageTransport(const MessageTransport&) = delete;
    MessageTransport& operator=(const MessageTransport&) = delete;
    MessageTransport(MessageTransport&&) = delete;
    MessageTransport& operator=(MessageTransport&&) = delete;

    MessageTransport(EventLoop& loop, Config config);

    // transport interface
    void write(CommandT cmd) override;

    void close() override;
    void abort() override;
    bool isClosing() const override { return _state != State::OPEN; }

    std::string getExtraInfo(
            const std::string& name, const std::string& default_value = "") const override;

    void setProtocol(std::shared_ptr<Protocol> protocol) override;
    const std::vector<std::shared_ptr<Protocol>>& getProtocols() const override {
        return _protocols;
    }

    bool isReading() const override { notSupported(); }
    void pauseReading() override { notSupported(); }
    void resumeReading() override { notSupported(); }
    void setWriteBufferLimits(size_t, size_t) override { notSupported(); }
    size_t getWriteBufferSize() const override { notSupported(); }
    void writeEof() override { notSupported(); }

    // installs the packet layer sink and starts the dispatcher once
    void setDispatcher(DispatchSink dispatch_sink);

    // inbound entry point of the packet layer
    void pktReceiver(PacketT pkt);

    // accessors (FYI they are not thread safe)
    State getState() const { return _state; }
    size_t getQueueSize() const { return _queue.size(); }
    bool isDispatching() const { return _in_flight; }
    bool hasDispatcher() const { return static_cast<bool>(_dispatch_sink); }

    EventLoop& getLoop() { return _loop; }
    CallbackRegistry* getCallbacks() { return _callbacks.get(); }

    Logger* getLogger() { return _logger.get(); }
    const Logger* getLogger() const { return _logger.get(); }

private:
    // (priority, sequence) orders by priority then arrival
    using QueueKey = std::pair<int, uint64_t>;

    [[noreturn]] void notSupported() const;

    void scheduleDispatch();
    void dispatchNext();
    void connectionLost();

    EventLoop& _loop;
    std::map<QueueKey, CommandT> _queue;
    std::vector<std::shared_ptr<Protocol>> _protocols;
    std::unordered_map<std::string, std::string> _extra;
    DispatchSink _dispatch_sink;
    std::shared_ptr<CallbackRegistry> _callbacks;
    std::shared_ptr<Logger> _logger;
    std::function<msecs(void)> _local_clock;
    size_t _max_buffer_size;
    uint64_t _sequence = 0;
    State _state = State::OPEN;
    bool _dispatcher_started = false;
    bool _dispatch_scheduled = false;
    bool _in_flight = false;
    bool _writing_paused = false;
    bool _connection_lost = false;
};

}  // namespace ramses

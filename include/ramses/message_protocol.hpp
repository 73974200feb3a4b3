#pragma once
#include <ramses/event_loop.hpp>
#include <ramses/protocol.hpp>

#include <deque>

namespace ramses {

class MessageProtocol : public Protocol {
public:
    enum ErrorType {
        SUCCESS = 0,
        START_OFFSET = 400,
        // Error
        NOT_CONNECTED,
        DEFERRED_WRITE_FAIL,
        // Info
        CONNECTION_MADE,
        CONNECTION_LOST,
        // Debug
        WRITING_PAUSED,
        WRITING_RESUMED,
        // Trace
        COMMAND_DEFERRED,
        COMMAND_SENT,
        MESSAGE_RECEIVED,
    };

    using MessageHandler = std::function<void(const Message& msg)>;

    MessageProtocol(EventLoop& loop, MessageHandler msg_handler,
            std::shared_ptr<Logger> logger = nullptr)
            : _loop(loop)
            , _msg_handler(std::move(msg_handler))
            , _logger(std::move(logger)) {}

    // protocol interface
    void connectionMade(Transport* transport) override;
    void dataReceived(const Message& msg) override;
    // stops the owning event loop, this is the terminal path
    void connectionLost(const Error* error) override;
    void pauseWriting() override;
    void resumeWriting() override;

    // writes cmd to the transport, held back in order while writing is paused
    void sendData(CommandT cmd);

    // accessors
    Transport* getTransport() { return _transport; }
    bool isWritingPaused() const { return _pause_writing; }
    size_t getPendingCommands() const { return _pending.size(); }

    Logger* getLogger() { return _logger.get(); }
    const Logger* getLogger() const { return _logger.get(); }

private:
    EventLoop& _loop;
    MessageHandler _msg_handler;
    std::deque<CommandT> _pending;
    std::shared_ptr<Logger> _logger;
    Transport* _transport = nullptr;
    bool _pause_writing = false;
};

}  // namespace ramses

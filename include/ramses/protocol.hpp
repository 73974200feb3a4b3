#pragma once
#include <ramses/logger.hpp>
#include <ramses/message.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ramses {

class Transport;

// Message layer protocol, call order per transport:
// connectionMade -> dataReceived* -> connectionLost
class Protocol {
public:
    virtual ~Protocol() = default;

    virtual void connectionMade(Transport* transport) = 0;
    virtual void dataReceived(const Message& msg) = 0;
    // error is nullptr for a regular close
    virtual void connectionLost(const Error* error) = 0;

    // flow control, called by the transport around its buffer high-water mark
    virtual void pauseWriting() = 0;
    virtual void resumeWriting() = 0;
};

// Message layer transport, commands in and messages out
class Transport {
public:
    virtual ~Transport() = default;

    virtual void write(CommandT cmd) = 0;
    virtual void writelines(std::vector<CommandT> cmds) {
        for (auto& cmd : cmds) {
            write(std::move(cmd));
        }
    }

    virtual void close() = 0;
    virtual void abort() = 0;
    virtual bool isClosing() const = 0;

    virtual std::string getExtraInfo(
            const std::string& name, const std::string& default_value = "") const = 0;

    virtual void setProtocol(std::shared_ptr<Protocol> protocol) = 0;
    virtual const std::vector<std::shared_ptr<Protocol>>& getProtocols() const = 0;

    // capabilities a message transport does not offer
    virtual bool isReading() const = 0;
    virtual void pauseReading() = 0;
    virtual void resumeReading() = 0;
    virtual void setWriteBufferLimits(size_t high, size_t low) = 0;
    virtual size_t getWriteBufferSize() const = 0;
    virtual void writeEof() = 0;
    virtual bool canWriteEof() const { return false; }
};

}  // namespace ramses

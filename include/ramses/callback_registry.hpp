#pragma once
#include <ramses/logger.hpp>
#include <ramses/message.hpp>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace ramses {

// Pending request/reply correlations keyed by the expected reply header.
//
// Expiry is lazy: deadlines are only checked when a message arrives, so a
// callback can outlive its deadline for as long as the link stays silent.
// Not thread safe, only touch it from the event loop thread.
class CallbackRegistry {
public:
    enum ErrorType {
        SUCCESS = 0,
        START_OFFSET = 200,
        // Warn
        CALLBACK_REPLACED,
        // Debug
        CALLBACK_ADDED,
        CALLBACK_REMOVED,
        CALLBACK_EXPIRED,
        CALLBACK_FIRED,
    };

    // msg is nullptr when the callback expired before a reply arrived
    using Handler = std::function<void(const Message* msg)>;

    struct Callback {
        Handler handler;
        bool daemon = false;               // persists across firings, never expires
        msecs deadline = msecs::max();     // expired once deadline <= now
    };

    using CallbackLookup = std::unordered_map<std::string, Callback>;

    CallbackRegistry(std::shared_ptr<Logger> logger = nullptr)
            : _logger(std::move(logger)) {}

    void add(const std::string& header, Callback callback);

    bool remove(const std::string& header);

    // fire and discard expired callbacks, returns how many expired
    size_t expire(msecs now);

    // sweep expired callbacks, then fire the one matching the message header
    // returns true if a callback matched
    bool onMessageArrival(const Message& msg, msecs now);

    // accessors (FYI they are not thread safe)
    bool contains(const std::string& header) const { return _callbacks.count(header); }
    size_t size() const { return _callbacks.size(); }
    const CallbackLookup& getCallbacks() const { return _callbacks; }

    Logger* getLogger() { return _logger.get(); }
    const Logger* getLogger() const { return _logger.get(); }

private:
    CallbackLookup _callbacks;
    std::shared_ptr<Logger> _logger;
};

}  // namespace ramses

#include <ramses/callback_registry.hpp>

#include <vector>

namespace ramses {

void CallbackRegistry::add(const std::string& header, Callback callback) {
    auto& entry = _callbacks[header];
    if (entry.handler) {
        IF_PTR(_logger, log, Logger::WARN, Error(STRERR(CALLBACK_REPLACED)), header.data(),
                header.size());
    }
    entry = std::move(callback);
    IF_PTR(_logger, log, Logger::DEBUG, Error(STRERR(CALLBACK_ADDED)), header.data(),
            header.size());
}

bool CallbackRegistry::remove(const std::string& header) {
    if (!_callbacks.erase(header)) {
        return false;
    }
    IF_PTR(_logger, log, Logger::DEBUG, Error(STRERR(CALLBACK_REMOVED)), header.data(),
            header.size());
    return true;
}

size_t CallbackRegistry::expire(msecs now) {
    // unlink every expired entry before alerting, handlers may re-register
    std::vector<std::pair<std::string, Callback>> expired;
    for (auto callback = _callbacks.begin(); callback != _callbacks.end();) {
        if (callback->second.daemon || callback->second.deadline > now) {
            ++callback;
            continue;
        }
        expired.emplace_back(callback->first, std::move(callback->second));
        callback = _callbacks.erase(callback);
    }
    for (auto& callback : expired) {
        IF_PTR(_logger, log, Logger::DEBUG, Error(STRERR(CALLBACK_EXPIRED)),
                callback.first.data(), callback.first.size());
        if (callback.second.handler) {
            callback.second.handler(nullptr);
        }
    }
    return expired.size();
}

bool CallbackRegistry::onMessageArrival(const Message& msg, msecs now) {
    expire(now);
    auto callback = _callbacks.find(msg.getHeader());
    if (callback == _callbacks.end()) {
        return false;
    }
    IF_PTR(_logger, log, Logger::DEBUG, Error(STRERR(CALLBACK_FIRED)), &msg, sizeof(Message));
    if (callback->second.daemon) {
        auto handler = callback->second.handler;
        if (handler) {
            handler(&msg);
        }
        return true;
    }
    // one shot, drop the entry before the handler can replace it
    auto handler = std::move(callback->second.handler);
    _callbacks.erase(callback);
    if (handler) {
        handler(&msg);
    }
    return true;
}

}  // namespace ramses

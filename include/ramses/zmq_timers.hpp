#pragma once
#include <zmq.hpp>

#include <functional>
#include <memory>
#include <unordered_map>

namespace ramses {

class ZmqTimers {
public:
    using Handler = std::function<void(int)>;

    ZmqTimers()
            : _timers(zmq_timers_new()) {}

    ~ZmqTimers() { zmq_timers_destroy(&_timers); }

    ZmqTimers(const ZmqTimers&) = delete;
    ZmqTimers& operator=(const ZmqTimers&) = delete;

    int add(size_t interval, Handler handler) {
        int timer_id = zmq_timers_add(_timers, interval, callback_wrapper, this);
        if (timer_id >= 0) {
            _callbacks[timer_id] = std::make_shared<Handler>(std::move(handler));
        }
        return timer_id;
    }

    int cancel(int timer_id) {
        _callbacks.erase(timer_id);
        return zmq_timers_cancel(_timers, timer_id);
    }

    int set_interval(int timer_id, size_t interval) {
        return zmq_timers_set_interval(_timers, timer_id, interval);
    }

    int reset(int timer_id) { return zmq_timers_reset(_timers, timer_id); }

    long timeout() { return zmq_timers_timeout(_timers); }

    int execute() { return zmq_timers_execute(_timers); }

    size_t size() const { return _callbacks.size(); }

private:
    static void callback_wrapper(int timer_id, void* arg) {
        auto& callbacks = reinterpret_cast<ZmqTimers*>(arg)->_callbacks;
        auto callback = callbacks.find(timer_id);
        if (callback == callbacks.end()) {
            return;
        }
        // keep the handler alive in case it cancels its own timer
        auto handler = callback->second;
        (*handler)(timer_id);
    }

    std::unordered_map<int, std::shared_ptr<Handler>> _callbacks;
    void* _timers;
};

}  // namespace ramses

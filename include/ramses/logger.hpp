#pragma once
#include <chrono>
#include <exception>
#include <functional>
#include <map>

// expands an ErrorType enumerator into its name and value
#define STRERR(e) #e, e

#define IF_PTR(ptr, func, ...) \
    if (ptr)                   \
    ptr->func(__VA_ARGS__)

namespace ramses {

using msecs = std::chrono::milliseconds;

// Thrown for synchronous faults and passed to log handlers for everything else.
// msg is always a string literal, type is the component's ErrorType value and
// code carries an errno or a count where one applies.
struct Error : std::exception {
    Error(const char* msg, int type = 0, int code = 0)
            : msg(msg)
            , type(type)
            , code(code) {}

    const char* what() const noexcept override { return msg; }

    const char* msg;
    int type = 0;
    int code = 0;
};

template <class Duration>
Duration getNow() {
    return std::chrono::duration_cast<Duration>(
            std::chrono::steady_clock::now().time_since_epoch());
}

// Components share one logger, each handler receives every entry at or above
// the level it was added with. The data pointer is only valid for the call,
// it points at the frame, header or object the entry is about.
class Logger {
public:
    enum Level {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR,
        FATAL,
        N_LEVELS,
    };

    using LogHandler = std::function<void(msecs time, Level, Error error, const void*, size_t)>;

    static const char* getLevelName(Level level) {
        static const char* const names[N_LEVELS] = {
                "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
        return level >= TRACE && level < N_LEVELS ? names[level] : "UNKNOWN";
    }

    // time since construction unless a clock is installed
    std::function<msecs(void)>& getClock() { return _clock; }

    void addLogHandler(Level level, LogHandler log_handler) {
        if (log_handler) {
            _log_handlers.emplace(level, std::move(log_handler));
        }
    }

    bool isEnabled(Level level) const {
        return !_log_handlers.empty() && _log_handlers.begin()->first <= level;
    }

    void log(Level level, Error error, const void* data = nullptr, size_t data_len = 0) const {
        if (!isEnabled(level)) {
            return;
        }
        msecs time = _clock ? _clock() : getNow<msecs>() - _start_time;
        for (auto handler = _log_handlers.begin();
                handler != _log_handlers.end() && handler->first <= level; ++handler) {
            handler->second(time, level, error, data, data_len);
        }
    }

private:
    const msecs _start_time = getNow<msecs>();
    std::function<msecs(void)> _clock;
    std::multimap<Level, LogHandler> _log_handlers;
};

}  // namespace ramses

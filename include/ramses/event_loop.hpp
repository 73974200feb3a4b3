#pragma once
#include <ramses/logger.hpp>
#include <ramses/zmq_timers.hpp>

#include <deque>
#include <memory>
#include <unordered_map>
#include <vector>

namespace ramses {

// single threaded reactor, every transport and protocol callback runs on it
class EventLoop {
public:
    enum ErrorType {
        SUCCESS = 0,
        START_OFFSET = 100,
        // Error
        POLL_FAIL,
        TIMER_ADD_FAIL,
        // Warn
        FD_NOT_WATCHED,
        // Info
        LOOP_STARTED,
        LOOP_STOPPED,
        LOOP_INTERRUPTED,
        // Debug
        FD_WATCHED,
        FD_UNWATCHED,
    };

    using Task = std::function<void()>;
    using TimerCallback = std::function<void(int timer_id)>;
    using FdCallback = std::function<void(short revents)>;

    // upper bound of a single wait when there is nothing to wake the loop
    static constexpr msecs IDLE_TIMEOUT = msecs(1000);

    // no copy or move since callbacks capture the loop
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;
    EventLoop(EventLoop&&) = delete;
    EventLoop& operator=(EventLoop&&) = delete;

    EventLoop(std::shared_ptr<Logger> logger = nullptr)
            : _logger(std::move(logger)) {}

    // run task on the next loop iteration
    void post(Task task) { _tasks.emplace_back(std::move(task)); }

    int addTimer(msecs interval, TimerCallback timer_callback);
    int callLater(msecs delay, Task task);
    int cancelTimer(int timer_id) { return _timers.cancel(timer_id); }

    void watchFd(int fd, short events, FdCallback fd_callback);
    int setFdEvents(int fd, short events);
    void unwatchFd(int fd);

    // one iteration, -1 timeout waits until an fd or timer fires
    // returns 0 or EINTR when the wait was interrupted by a signal
    int poll(msecs timeout);

    // loop until stop() is called or a signal interrupts the wait
    int run();
    void stop() { _stopped = true; }

    // accessors
    bool isRunning() const { return _running; }
    bool isStopping() const { return _stopped; }
    size_t getPendingTasks() const { return _tasks.size(); }
    size_t getActiveTimers() const { return _timers.size(); }

    Logger* getLogger() { return _logger.get(); }
    const Logger* getLogger() const { return _logger.get(); }

private:
    void runPostedTasks();

    ZmqTimers _timers;
    std::deque<Task> _tasks;
    std::vector<zmq::pollitem_t> _poll_items;
    std::unordered_map<int, FdCallback> _fd_callbacks;
    std::shared_ptr<Logger> _logger;
    bool _running = false;
    bool _stopped = false;
};

}  // namespace ramses

#include <ramses/event_loop.hpp>

#include <algorithm>
#include <cerrno>

namespace ramses {

int EventLoop::addTimer(msecs interval, TimerCallback timer_callback) {
    int timer_id = _timers.add(interval.count(), std::move(timer_callback));
    if (timer_id < 0) {
        IF_PTR(_logger, log, Logger::ERROR, Error(STRERR(TIMER_ADD_FAIL), zmq_errno()));
    }
    return timer_id;
}

int EventLoop::callLater(msecs delay, Task task) {
    return addTimer(delay, [this, task = std::move(task)](int timer_id) {
        _timers.cancel(timer_id);
        task();
    });
}

void EventLoop::watchFd(int fd, short events, FdCallback fd_callback) {
    auto item = std::find_if(_poll_items.begin(), _poll_items.end(),
            [fd](const zmq::pollitem_t& item) { return item.fd == fd; });
    if (item == _poll_items.end()) {
        _poll_items.push_back({nullptr, fd, events, 0});
    } else {
        item->events = events;
    }
    _fd_callbacks[fd] = std::move(fd_callback);
    IF_PTR(_logger, log, Logger::DEBUG, Error(STRERR(FD_WATCHED), fd));
}

int EventLoop::setFdEvents(int fd, short events) {
    auto item = std::find_if(_poll_items.begin(), _poll_items.end(),
            [fd](const zmq::pollitem_t& item) { return item.fd == fd; });
    if (item == _poll_items.end()) {
        IF_PTR(_logger, log, Logger::WARN, Error(STRERR(FD_NOT_WATCHED), fd));
        return FD_NOT_WATCHED;
    }
    item->events = events;
    return SUCCESS;
}

void EventLoop::unwatchFd(int fd) {
    _poll_items.erase(std::remove_if(_poll_items.begin(), _poll_items.end(),
                              [fd](const zmq::pollitem_t& item) { return item.fd == fd; }),
            _poll_items.end());
    if (_fd_callbacks.erase(fd)) {
        IF_PTR(_logger, log, Logger::DEBUG, Error(STRERR(FD_UNWATCHED), fd));
    }
}

int EventLoop::poll(msecs timeout) {
    // don't wait while posted tasks are pending
    if (!_tasks.empty()) {
        timeout = msecs(0);
    }
    // wake up in time for the next timer, -1 wraps to the max
    timeout = msecs(std::min<uint32_t>(timeout.count(), _timers.timeout()));
    if (_poll_items.empty() && timeout > IDLE_TIMEOUT) {
        timeout = IDLE_TIMEOUT;
    }
    try {
        zmq::poll(_poll_items.data(), _poll_items.size(), timeout);
    } catch (const zmq::error_t& e) {
        if (e.num() == EINTR) {
            IF_PTR(_logger, log, Logger::INFO, Error(STRERR(LOOP_INTERRUPTED)));
            return EINTR;
        }
        Error error(STRERR(POLL_FAIL), e.num());
        IF_PTR(_logger, log, Logger::ERROR, error);
        throw error;
    }
    // collect ready fds first since callbacks may change the watch list
    std::vector<std::pair<int, short>> ready_fds;
    for (auto& item : _poll_items) {
        if (item.revents) {
            ready_fds.emplace_back(item.fd, item.revents);
            item.revents = 0;
        }
    }
    for (const auto& ready_fd : ready_fds) {
        auto fd_callback = _fd_callbacks.find(ready_fd.first);
        if (fd_callback == _fd_callbacks.end()) {
            continue;
        }
        auto handler = fd_callback->second;
        handler(ready_fd.second);
    }
    _timers.execute();
    runPostedTasks();
    return 0;
}

int EventLoop::run() {
    _running = true;
    IF_PTR(_logger, log, Logger::INFO, Error(STRERR(LOOP_STARTED)));
    int err = 0;
    while (!_stopped) {
        if ((err = poll(msecs(-1))) == EINTR) {
            break;
        }
    }
    _running = false;
    _stopped = false;
    if (!err) {
        IF_PTR(_logger, log, Logger::INFO, Error(STRERR(LOOP_STOPPED)));
    }
    return err;
}

void EventLoop::runPostedTasks() {
    // tasks posted from here on run in the next iteration
    std::deque<Task> tasks;
    tasks.swap(_tasks);
    for (auto& task : tasks) {
        task();
    }
}

}  // namespace ramses

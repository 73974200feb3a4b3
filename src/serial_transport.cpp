#include <ramses/serial_transport.hpp>

#include <cerrno>
#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

namespace ramses {

const SerialConfig SERIAL_CONFIG{
        115200,     // baudrate
        8,          // bytesize
        'N',        // parity
        1,          // stopbits
        false,      // xonxoff
        false,      // rtscts
        false,      // dsrdtr
        msecs(0),   // timeout
};

static bool toSpeed(int baudrate, speed_t& speed) {
    switch (baudrate) {
        case 9600: speed = B9600; return true;
        case 19200: speed = B19200; return true;
        case 38400: speed = B38400; return true;
        case 57600: speed = B57600; return true;
        case 115200: speed = B115200; return true;
        case 230400: speed = B230400; return true;
        default: return false;
    }
}

static bool configure(int fd, const SerialConfig& config) {
    termios tio{};
    if (::tcgetattr(fd, &tio) != 0) {
        return false;
    }
    ::cfmakeraw(&tio);
    speed_t speed;
    if (!toSpeed(config.baudrate, speed)) {
        return false;
    }
    ::cfsetispeed(&tio, speed);
    ::cfsetospeed(&tio, speed);
    // byte size
    tio.c_cflag &= ~CSIZE;
    switch (config.bytesize) {
        case 5: tio.c_cflag |= CS5; break;
        case 6: tio.c_cflag |= CS6; break;
        case 7: tio.c_cflag |= CS7; break;
        case 8: tio.c_cflag |= CS8; break;
        default: return false;
    }
    // parity
    switch (config.parity) {
        case 'N': tio.c_cflag &= ~PARENB; break;
        case 'E': tio.c_cflag |= PARENB; tio.c_cflag &= ~PARODD; break;
        case 'O': tio.c_cflag |= PARENB | PARODD; break;
        default: return false;
    }
    // stop bits
    switch (config.stopbits) {
        case 1: tio.c_cflag &= ~CSTOPB; break;
        case 2: tio.c_cflag |= CSTOPB; break;
        default: return false;
    }
    // flow control, dsr/dtr has no termios equivalent and is left alone
    if (config.xonxoff) {
        tio.c_iflag |= IXON | IXOFF;
    } else {
        tio.c_iflag &= ~(IXON | IXOFF | IXANY);
    }
    if (config.rtscts) {
        tio.c_cflag |= CRTSCTS;
    } else {
        tio.c_cflag &= ~CRTSCTS;
    }
    tio.c_cflag |= CLOCAL | CREAD;
    // reads never block, the event loop does the waiting
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = static_cast<cc_t>(config.timeout.count() / 100);
    if (::tcsetattr(fd, TCSANOW, &tio) != 0) {
        return false;
    }
    ::tcflush(fd, TCIOFLUSH);
    return true;
}

SerialPort::SerialPort(
        const std::string& port, const SerialConfig& config, std::shared_ptr<Logger> logger)
        : _port(port) {
    _fd = ::open(_port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (_fd < 0) {
        Error error(STRERR(SERIAL_OPEN_FAIL), errno);
        IF_PTR(logger, log, Logger::ERROR, error, _port.data(), _port.size());
        throw error;
    }
    if (!configure(_fd, config)) {
        Error error(STRERR(SERIAL_CONFIG_FAIL), errno);
        IF_PTR(logger, log, Logger::ERROR, error, _port.data(), _port.size());
        close();
        throw error;
    }
    IF_PTR(logger, log, Logger::INFO, Error(STRERR(SERIAL_OPENED), _fd), _port.data(),
            _port.size());
}

SerialPort::~SerialPort() {
    close();
}

SerialPort::SerialPort(SerialPort&& other) noexcept
        : _port(std::move(other._port))
        , _fd(other._fd) {
    other._fd = -1;
}

SerialPort& SerialPort::operator=(SerialPort&& other) noexcept {
    if (this != &other) {
        close();
        _port = std::move(other._port);
        _fd = other._fd;
        other._fd = -1;
    }
    return *this;
}

void SerialPort::close() {
    if (_fd >= 0) {
        ::close(_fd);
        _fd = -1;
    }
}

SerialTransport::SerialTransport(EventLoop& loop, std::shared_ptr<SerialProtocol> protocol,
        SerialPort port, Config config)
        : _loop(loop)
        , _protocol(std::move(protocol))
        , _port(std::move(port))
        , _logger(std::move(config.logger))
        , _high_water(config.high_water)
        , _low_water(config.low_water) {
    _read_buffer.resize(config.read_size);
    _loop.watchFd(_port.fd(), ZMQ_POLLIN, [this](short revents) { onEvents(revents); });
    _protocol->connectionMade(this);
}

SerialTransport::~SerialTransport() {
    // the protocol outlives us and must not keep pointing here
    abort();
}

void SerialTransport::write(const std::string& data) {
    if (isClosing()) {
        IF_PTR(_logger, log, Logger::WARN, Error(STRERR(WRITE_AFTER_CLOSE)), data.data(),
                data.size());
        return;
    }
    if (data.empty()) {
        return;
    }
    size_t offset = 0;
    // try writing straight away when nothing is queued ahead
    if (_write_buffer.empty()) {
        ssize_t written = ::write(_port.fd(), data.data(), data.size());
        if (written < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            Error error(STRERR(SERIAL_WRITE_FAIL), errno);
            IF_PTR(_logger, log, Logger::ERROR, error, data.data(), data.size());
            shutdown(&error);
            return;
        }
        if (written > 0) {
            offset = written;
            IF_PTR(_logger, log, Logger::TRACE, Error(STRERR(BYTES_WRITTEN), written),
                    data.data(), offset);
        }
    }
    _write_buffer.append(data, offset, std::string::npos);
    if (!_writing_paused && _write_buffer.size() > _high_water) {
        _writing_paused = true;
        IF_PTR(_logger, log, Logger::DEBUG, Error(STRERR(WRITING_PAUSED), _write_buffer.size()));
        _protocol->pauseWriting();
    }
    updateEvents();
}

void SerialTransport::close() {
    if (isClosing()) {
        return;
    }
    _closing = true;
    if (_write_buffer.empty()) {
        shutdown(nullptr);
    }
}

void SerialTransport::abort() {
    _write_buffer.clear();
    _closing = true;
    shutdown(nullptr);
}

void SerialTransport::onEvents(short revents) {
    if (revents & ZMQ_POLLIN) {
        readReady();
    }
    if (_port.isOpen() && (revents & ZMQ_POLLOUT)) {
        writeReady();
    }
    if (_port.isOpen() && (revents & ZMQ_POLLERR)) {
        Error error(STRERR(SERIAL_HANGUP));
        IF_PTR(_logger, log, Logger::ERROR, error);
        shutdown(&error);
    }
}

void SerialTransport::readReady() {
    while (_port.isOpen()) {
        ssize_t n_read = ::read(_port.fd(), &_read_buffer[0], _read_buffer.size());
        if (n_read > 0) {
            IF_PTR(_logger, log, Logger::TRACE, Error(STRERR(BYTES_RECEIVED), n_read),
                    _read_buffer.data(), n_read);
            _protocol->dataReceived(_read_buffer.data(), n_read);
            continue;
        }
        if (n_read < 0 && errno == EINTR) {
            continue;
        }
        // with VMIN 0 a drained tty reads 0 instead of EAGAIN, a hangup
        // shows up as POLLHUP / POLLERR or EIO instead
        if (n_read == 0 || errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        // dead device
        Error error(STRERR(SERIAL_READ_FAIL), errno);
        IF_PTR(_logger, log, Logger::ERROR, error);
        shutdown(&error);
    }
}

void SerialTransport::writeReady() {
    while (!_write_buffer.empty()) {
        ssize_t written = ::write(_port.fd(), _write_buffer.data(), _write_buffer.size());
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;
        }
        if (written < 0) {
            Error error(STRERR(SERIAL_WRITE_FAIL), errno);
            IF_PTR(_logger, log, Logger::ERROR, error);
            shutdown(&error);
            return;
        }
        IF_PTR(_logger, log, Logger::TRACE, Error(STRERR(BYTES_WRITTEN), written),
                _write_buffer.data(), written);
        _write_buffer.erase(0, written);
    }
    if (_writing_paused && _write_buffer.size() <= _low_water) {
        _writing_paused = false;
        IF_PTR(_logger, log, Logger::DEBUG, Error(STRERR(WRITING_RESUMED), _write_buffer.size()));
        _protocol->resumeWriting();
    }
    if (_closing && _write_buffer.empty()) {
        shutdown(nullptr);
        return;
    }
    updateEvents();
}

void SerialTransport::updateEvents() {
    if (_port.isOpen()) {
        _loop.setFdEvents(
                _port.fd(), _write_buffer.empty() ? ZMQ_POLLIN : ZMQ_POLLIN | ZMQ_POLLOUT);
    }
}

void SerialTransport::shutdown(const Error* error) {
    if (!_port.isOpen()) {
        return;
    }
    _loop.unwatchFd(_port.fd());
    _port.close();
    _closing = true;
    IF_PTR(_logger, log, Logger::INFO, Error(STRERR(SERIAL_CLOSED)));
    _protocol->connectionLost(error);
}

}  // namespace ramses

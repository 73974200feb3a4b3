#pragma once
#include <ramses/event_loop.hpp>

#include <memory>
#include <string>

namespace ramses {

// physical link parameters, handed verbatim to SerialPort
struct SerialConfig {
    int baudrate = 115200;
    int bytesize = 8;
    char parity = 'N';
    int stopbits = 1;
    bool xonxoff = false;
    bool rtscts = false;
    bool dsrdtr = false;
    msecs timeout = msecs(0);
};

// what a RAMSES-II gateway (HGI80 / evofw3) expects
extern const SerialConfig SERIAL_CONFIG;

// owns a non-blocking tty file descriptor configured for raw I/O
class SerialPort {
public:
    enum ErrorType {
        SUCCESS = 0,
        START_OFFSET = 500,
        // Error
        SERIAL_OPEN_FAIL,
        SERIAL_CONFIG_FAIL,
        // Info
        SERIAL_OPENED,
    };

    SerialPort(const std::string& port, const SerialConfig& config = SERIAL_CONFIG,
            std::shared_ptr<Logger> logger = nullptr);
    ~SerialPort();

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;
    SerialPort(SerialPort&& other) noexcept;
    SerialPort& operator=(SerialPort&& other) noexcept;

    int fd() const { return _fd; }
    const std::string& getPort() const { return _port; }
    bool isOpen() const { return _fd >= 0; }

    void close();

private:
    std::string _port;
    int _fd = -1;
};

class SerialTransport;

// byte level protocol driven by a SerialTransport
class SerialProtocol {
public:
    virtual ~SerialProtocol() = default;

    virtual void connectionMade(SerialTransport* transport) = 0;
    virtual void dataReceived(const char* data, size_t len) = 0;
    virtual void connectionLost(const Error* error) = 0;
    virtual void pauseWriting() = 0;
    virtual void resumeWriting() = 0;
};

// Event driven duplex byte stream over a SerialPort.
//
// Writes are buffered and flushed when the fd is writable; the protocol is
// asked to pause writing above high_water and resumed below low_water.
class SerialTransport {
public:
    enum ErrorType {
        SUCCESS = 0,
        START_OFFSET = 550,
        // Error
        SERIAL_READ_FAIL,
        SERIAL_WRITE_FAIL,
        SERIAL_HANGUP,
        // Warn
        WRITE_AFTER_CLOSE,
        // Info
        SERIAL_CLOSED,
        // Debug
        WRITING_PAUSED,
        WRITING_RESUMED,
        // Trace
        BYTES_RECEIVED,
        BYTES_WRITTEN,
    };

    struct Config {
        size_t high_water = 64 * 1024;
        size_t low_water = 16 * 1024;
        size_t read_size = 1024;
        std::shared_ptr<Logger> logger;
    };

    SerialTransport(const SerialTransport&) = delete;
    SerialTransport& operator=(const SerialTransport&) = delete;
    SerialTransport(SerialTransport&&) = delete;
    SerialTransport& operator=(SerialTransport&&) = delete;

    SerialTransport(EventLoop& loop, std::shared_ptr<SerialProtocol> protocol, SerialPort port,
            Config config);
    SerialTransport(EventLoop& loop, std::shared_ptr<SerialProtocol> protocol, SerialPort port)
            : SerialTransport(loop, std::move(protocol), std::move(port), Config{}) {}
    ~SerialTransport();

    void write(const std::string& data);

    // flush pending bytes, then close
    void close();
    // close now, pending bytes are lost
    void abort();

    bool isClosing() const { return _closing || !_port.isOpen(); }
    size_t getWriteBufferSize() const { return _write_buffer.size(); }

    SerialPort& getPort() { return _port; }
    SerialProtocol* getProtocol() { return _protocol.get(); }

    Logger* getLogger() { return _logger.get(); }
    const Logger* getLogger() const { return _logger.get(); }

private:
    void onEvents(short revents);
    void readReady();
    void writeReady();
    void updateEvents();
    void shutdown(const Error* error);

    EventLoop& _loop;
    std::shared_ptr<SerialProtocol> _protocol;
    SerialPort _port;
    std::string _write_buffer;
    std::string _read_buffer;
    std::shared_ptr<Logger> _logger;
    size_t _high_water;
    size_t _low_water;
    bool _closing = false;
    bool _writing_paused = false;
};

}  // namespace ramses

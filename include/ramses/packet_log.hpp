#pragma once
#include <ramses/logger.hpp>
#include <ramses/message.hpp>

#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace ramses {

// appends received packets as size prefixed flatbuffers records
class PacketLogWriter {
public:
    enum ErrorType {
        SUCCESS = 0,
        START_OFFSET = 700,
        // Error
        LOG_OPEN_FAIL,
        LOG_WRITE_FAIL,
        // Info
        LOG_OPENED,
        // Trace
        PACKET_LOGGED,
    };

    PacketLogWriter(const std::string& path, std::shared_ptr<Logger> logger = nullptr);

    bool write(const PacketT& pkt);

    const std::string& getPath() const { return _path; }
    size_t getRecordCount() const { return _record_count; }

private:
    std::string _path;
    std::ofstream _file;
    fb::FlatBufferBuilder _fbb;
    std::shared_ptr<Logger> _logger;
    size_t _record_count = 0;
};

// reads back the records of a PacketLogWriter in order
class PacketLogReader {
public:
    enum ErrorType {
        SUCCESS = 0,
        START_OFFSET = 750,
        // Error
        LOG_OPEN_FAIL,
        // Warn
        RECORD_TRUNCATED,
        RECORD_TOO_LARGE,
        RECORD_VERIFY_FAIL,
        // Info
        LOG_OPENED,
        LOG_EXHAUSTED,
    };

    static constexpr uint32_t MAX_RECORD_SIZE = 64 * 1024;

    PacketLogReader(const std::string& path, std::shared_ptr<Logger> logger = nullptr);

    // false at the end of the log or at the first damaged record
    bool read(PacketT& pkt);

    const std::string& getPath() const { return _path; }
    size_t getRecordCount() const { return _record_count; }

private:
    std::string _path;
    std::ifstream _file;
    std::vector<uint8_t> _buffer;
    std::shared_ptr<Logger> _logger;
    size_t _record_count = 0;
    bool _exhausted = false;
};

}  // namespace ramses

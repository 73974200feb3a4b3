#include <ramses/packet_log.hpp>

namespace ramses {

PacketLogWriter::PacketLogWriter(const std::string& path, std::shared_ptr<Logger> logger)
        : _path(path)
        , _file(path, std::ios::binary | std::ios::app)
        , _logger(std::move(logger)) {
    if (!_file) {
        Error error(STRERR(LOG_OPEN_FAIL));
        IF_PTR(_logger, log, Logger::ERROR, error, _path.data(), _path.size());
        throw error;
    }
    IF_PTR(_logger, log, Logger::INFO, Error(STRERR(LOG_OPENED)), _path.data(), _path.size());
}

bool PacketLogWriter::write(const PacketT& pkt) {
    _fbb.Clear();
    _fbb.FinishSizePrefixed(Packet::Pack(_fbb, &pkt));
    _file.write(reinterpret_cast<const char*>(_fbb.GetBufferPointer()), _fbb.GetSize());
    _file.flush();
    if (!_file) {
        IF_PTR(_logger, log, Logger::ERROR, Error(STRERR(LOG_WRITE_FAIL)), &pkt, sizeof(pkt));
        return false;
    }
    ++_record_count;
    IF_PTR(_logger, log, Logger::TRACE, Error(STRERR(PACKET_LOGGED)), _fbb.GetBufferPointer(),
            _fbb.GetSize());
    return true;
}

PacketLogReader::PacketLogReader(const std::string& path, std::shared_ptr<Logger> logger)
        : _path(path)
        , _file(path, std::ios::binary)
        , _logger(std::move(logger)) {
    if (!_file) {
        Error error(STRERR(LOG_OPEN_FAIL));
        IF_PTR(_logger, log, Logger::ERROR, error, _path.data(), _path.size());
        throw error;
    }
    IF_PTR(_logger, log, Logger::INFO, Error(STRERR(LOG_OPENED)), _path.data(), _path.size());
}

bool PacketLogReader::read(PacketT& pkt) {
    if (_exhausted) {
        return false;
    }
    const auto finish = [this](Logger::Level level, Error error) {
        _exhausted = true;
        IF_PTR(_logger, log, level, error, _path.data(), _path.size());
        return false;
    };
    // size prefix
    uint8_t prefix[sizeof(fb::uoffset_t)];
    _file.read(reinterpret_cast<char*>(prefix), sizeof(prefix));
    if (_file.gcount() == 0) {
        return finish(Logger::INFO, Error(STRERR(LOG_EXHAUSTED), _record_count));
    }
    if (_file.gcount() != sizeof(prefix)) {
        return finish(Logger::WARN, Error(STRERR(RECORD_TRUNCATED), _record_count));
    }
    auto size = fb::ReadScalar<fb::uoffset_t>(prefix);
    if (size > MAX_RECORD_SIZE) {
        return finish(Logger::WARN, Error(STRERR(RECORD_TOO_LARGE), _record_count));
    }
    // record
    _buffer.resize(size);
    _file.read(reinterpret_cast<char*>(_buffer.data()), size);
    if (static_cast<size_t>(_file.gcount()) != size) {
        return finish(Logger::WARN, Error(STRERR(RECORD_TRUNCATED), _record_count));
    }
    fb::Verifier verifier(_buffer.data(), _buffer.size());
    if (!verifier.VerifyBuffer<Packet>(nullptr)) {
        return finish(Logger::WARN, Error(STRERR(RECORD_VERIFY_FAIL), _record_count));
    }
    fb::GetRoot<Packet>(_buffer.data())->UnPackTo(&pkt);
    ++_record_count;
    return true;
}

}  // namespace ramses

#pragma once
#include <ramses/logger.hpp>
#include <ramses/msg_types_generated.h>

#include <string>

namespace ramses {

namespace fb = flatbuffers;

enum Priority : int8_t {
    PRIORITY_ASAP = 0,
    PRIORITY_HIGH = 2,
    PRIORITY_DEFAULT = 4,
    PRIORITY_LOW = 6,
};

inline CommandT makeCommand(
        std::string header, std::string frame, int8_t priority = PRIORITY_DEFAULT) {
    CommandT cmd;
    cmd.header = std::move(header);
    cmd.frame = std::move(frame);
    cmd.priority = priority;
    return cmd;
}

inline PacketT makePacket(std::string header, std::string frame, msecs dtm) {
    PacketT pkt;
    pkt.dtm = dtm.count();
    pkt.header = std::move(header);
    pkt.frame = std::move(frame);
    return pkt;
}

// decoded unit handed to message protocols, wraps exactly one packet
class Message {
public:
    explicit Message(PacketT pkt)
            : _pkt(std::move(pkt)) {}

    const std::string& getHeader() const { return _pkt.header; }
    const std::string& getFrame() const { return _pkt.frame; }
    msecs getTimestamp() const { return msecs(_pkt.dtm); }

    const PacketT& getPacket() const { return _pkt; }

private:
    PacketT _pkt;
};

}  // namespace ramses

#include "transport/itla_frame.hpp"
#include "common/endian.hpp"
#include "common/protocol.hpp"

namespace ppcl {

uint8_t ItlaFrame::checksum(const Frame& frame)
{
    uint8_t bip8 = (frame[0] & Protocol::LOW_NIBBLE) ^ frame[1] ^ frame[2] ^ frame[3];
    return static_cast<uint8_t>(((bip8 & 0xF0) >> 4) ^ (bip8 & 0x0F));
}

Frame ItlaFrame::encode(const RegisterCommand& cmd)
{
    Frame frame{};

    frame[0] = static_cast<uint8_t>(cmd.direction) & Protocol::DIRECTION_MASK;
    frame[1] = cmd.reg;
    write_be16(&frame[2], cmd.payload);

    frame[0] |= static_cast<uint8_t>(checksum(frame) << 4);
    return frame;
}

Result<DecodedFrame> ItlaFrame::decode(const Frame& frame)
{
    if (checksum(frame) != (frame[0] >> 4)) {
        return Result<DecodedFrame>::failure(Error::CHECKSUM_MISMATCH);
    }

    DecodedFrame decoded;
    decoded.status = static_cast<Status>(frame[0] & Protocol::STATUS_MASK);
    decoded.reg = frame[1];
    decoded.payload = read_be16(&frame[2]);

    return Result<DecodedFrame>::success(decoded);
}

} // namespace ppcl

#pragma once

#include <stdint.h>

#include "common/types.hpp"
#include "common/response.hpp"

namespace ppcl {

class ItlaFrame {
public:
    static Frame encode(const RegisterCommand& cmd);
    static Result<DecodedFrame> decode(const Frame& frame);

    // 4-bit XOR fold over the frame with byte0's high nibble masked off.
    static uint8_t checksum(const Frame& frame);
};

} // namespace ppcl

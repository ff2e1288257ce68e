#pragma once
#include <cstdint>

namespace ppcl {

// ITLA payloads travel most significant byte first.

inline void write_be16(uint8_t* buf, uint16_t val)
{
    buf[0] = static_cast<uint8_t>((val >> 8) & 0xFF);
    buf[1] = static_cast<uint8_t>(val & 0xFF);
}

inline uint16_t read_be16(const uint8_t* buf)
{
    return static_cast<uint16_t>((buf[0] << 8) | buf[1]);
}

} // namespace ppcl

#pragma once

#include <array>
#include <cstdint>
#include <optional>

#include "types.hpp"

namespace ppcl {

using Frame = std::array<uint8_t, 4>;

// Bit 0 of byte0 on a request: 0 reads the register back, 1 writes it.
enum class Direction : uint8_t
{
    WriteThenRead = 0x00,
    Write = 0x01
};

// Status bits 0..1 of byte0 on a response.
enum class Status : uint8_t
{
    NoError = 0x00,
    ExecutionError = 0x01,
    ExtendedAddressing = 0x02,
    CommandProcessingError = 0x03
};

const char* status_name(Status status);

struct RegisterCommand
{
    const uint8_t reg;
    const Direction direction;
    const uint16_t payload;

    static RegisterCommand write(uint8_t reg, uint16_t payload)
    {
        return RegisterCommand{reg, Direction::Write, payload};
    }

    static RegisterCommand read(uint8_t reg, uint16_t payload = 0)
    {
        return RegisterCommand{reg, Direction::WriteThenRead, payload};
    }
};

struct DecodedFrame
{
    Status status;
    uint8_t reg;
    uint16_t payload;
};

struct LaserConfig
{
    double min_wavelength_nm = 1515.0;
    double max_wavelength_nm = 1570.0;
    double min_power_dbm = 6.0;
    double max_power_dbm = 13.5;
};

struct LinkState
{
    bool connected = false;
    int baud_rate = 0;
    std::optional<Error> last_error;
};

} // namespace ppcl

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "common/types.hpp"

namespace ppcl {

// Byte pipe to the instrument. SerialPort is the hardware implementation;
// tests substitute a scripted one.
class Transport
{
public:
    virtual ~Transport() = default;

    virtual Result<bool> open(const std::string& port, int baud) = 0;
    virtual Result<bool> close() = 0;
    virtual bool is_open() const = 0;

    // Discard bytes received but not yet read.
    virtual Result<bool> flush_input() = 0;
    virtual Result<size_t> write(const uint8_t* data, size_t len) = 0;

    // Returns whatever is buffered right now, possibly nothing. Never blocks.
    virtual Result<std::vector<uint8_t>> read_available() = 0;
};

} // namespace ppcl

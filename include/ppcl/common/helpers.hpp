#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace ppcl {

std::string bytes_to_hex(const uint8_t* data, size_t len);

template<typename Container>
std::string bytes_to_hex(const Container& data)
{
    return bytes_to_hex(data.data(), data.size());
}

} // namespace ppcl

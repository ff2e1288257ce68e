#include "common/helpers.hpp"
#include "common/response.hpp"
#include "common/types.hpp"
#include <sstream>
#include <iomanip>

namespace ppcl {

std::string bytes_to_hex(const uint8_t* data, size_t len)
{
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        if (i > 0) {
            oss << ' ';
        }
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

const char* error_name(Error error)
{
    switch (error) {
        case Error::TIMEOUT: return "timeout";
        case Error::CHECKSUM_MISMATCH: return "checksum mismatch";
        case Error::BAUD_NEGOTIATION_FAILED: return "baud negotiation failed";
        case Error::EXTENDED_ADDRESSING_UNSUPPORTED: return "extended addressing unsupported";
        case Error::INVALID_RESPONSE: return "invalid response";
        case Error::RANGE_ERROR: return "value out of range";
        case Error::INVALID_CONFIG: return "invalid configuration";
        case Error::NOT_CONNECTED: return "not connected";
        case Error::PORT_ERROR: return "port error";
        case Error::WRITE_ERROR: return "write error";
    }
    return "unknown error";
}

const char* status_name(Status status)
{
    switch (status) {
        case Status::NoError: return "ok";
        case Status::ExecutionError: return "execution error";
        case Status::ExtendedAddressing: return "extended addressing";
        case Status::CommandProcessingError: return "command processing error";
    }
    return "unknown status";
}

} // namespace ppcl

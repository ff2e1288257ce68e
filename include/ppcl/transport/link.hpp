#pragma once

#include <functional>
#include <optional>
#include <string>

#include "common/types.hpp"
#include "common/response.hpp"
#include "common/protocol.hpp"
#include "transport/transport.hpp"

namespace ppcl {

class Link
{
public:
    using LogCallback = std::function<void(const std::string&)>;

    explicit Link(Transport& transport) : transport_(transport) {}

    Link(const Link&) = delete;
    Link& operator=(const Link&) = delete;

    // Opens at initial_baud, then walks Protocol::BAUD_CANDIDATES until a
    // Nop read comes back clean.
    Result<bool> connect(const std::string& port, int initial_baud);
    Result<bool> disconnect();

    Result<bool> transmit(const Frame& frame);
    Result<Frame> receive_frame(int timeout_ms);
    Result<DecodedFrame> exchange(const RegisterCommand& cmd);

    bool is_connected() const { return state_.connected; }
    LinkState state() const { return state_; }

    void set_timeout_ms(int timeout_ms) { timeout_ms_ = timeout_ms; }
    int timeout_ms() const { return timeout_ms_; }

    void set_log_callback(LogCallback cb) { log_callback_ = std::move(cb); }

private:
    Transport& transport_;
    LinkState state_;
    int timeout_ms_ = Protocol::RESPONSE_TIMEOUT_MS;
    LogCallback log_callback_;

    void log(const std::string& msg);
    Result<bool> try_baud(const std::string& port, int baud);
    Error fail(Error error);
};

} // namespace ppcl

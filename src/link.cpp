#include "transport/link.hpp"
#include "transport/itla_frame.hpp"
#include "common/helpers.hpp"
#include <algorithm>
#include <chrono>
#include <thread>
#include <vector>

namespace ppcl {

void Link::log(const std::string& msg)
{
    if (log_callback_) {
        log_callback_(msg);
    }
}

Error Link::fail(Error error)
{
    state_.last_error = error;
    return error;
}

Result<bool> Link::connect(const std::string& port, int initial_baud)
{
    if (state_.connected || transport_.is_open()) {
        auto reset = disconnect();
        if (!reset.ok()) {
            return reset;
        }
    }

    std::vector<int> bauds;
    bauds.push_back(initial_baud);
    for (size_t i = 0; i < Protocol::BAUD_CANDIDATE_COUNT; ++i) {
        if (Protocol::BAUD_CANDIDATES[i] != initial_baud) {
            bauds.push_back(Protocol::BAUD_CANDIDATES[i]);
        }
    }

    for (size_t i = 0; i < bauds.size(); ++i) {
        auto result = try_baud(port, bauds[i]);
        if (result.ok()) {
            state_.connected = true;
            state_.baud_rate = bauds[i];
            state_.last_error.reset();
            log("[LINK] Connected to " + port + " at " + std::to_string(bauds[i]) + " baud");
            return Result<bool>::success(true);
        }

        // The port itself is unusable, no point cycling speeds.
        if (i == 0 && result.error() == Error::PORT_ERROR) {
            log("[LINK] Cannot open " + port);
            return Result<bool>::failure(fail(Error::PORT_ERROR));
        }

        log("[LINK] No answer at " + std::to_string(bauds[i]) + " baud: " + error_name(result.error()));
    }

    log("[LINK] Baud negotiation failed on " + port);
    return Result<bool>::failure(fail(Error::BAUD_NEGOTIATION_FAILED));
}

Result<bool> Link::try_baud(const std::string& port, int baud)
{
    auto opened = transport_.open(port, baud);
    if (!opened.ok()) {
        return Result<bool>::failure(opened.error());
    }

    auto nop = exchange(RegisterCommand::read(Protocol::Reg::NOP));
    if (nop.ok() && nop.value().status == Status::NoError) {
        return Result<bool>::success(true);
    }

    auto closed = transport_.close();
    if (!closed.ok()) {
        log("[LINK] Close failed: " + std::string(error_name(closed.error())));
    }

    if (!nop.ok()) {
        return Result<bool>::failure(nop.error());
    }
    if (nop.value().status == Status::ExtendedAddressing) {
        return Result<bool>::failure(Error::EXTENDED_ADDRESSING_UNSUPPORTED);
    }
    return Result<bool>::failure(Error::INVALID_RESPONSE);
}

Result<bool> Link::disconnect()
{
    bool was_open = transport_.is_open();
    if (was_open) {
        auto closed = transport_.close();
        if (!closed.ok()) {
            return Result<bool>::failure(fail(closed.error()));
        }
        log("[LINK] Disconnected");
    }

    state_.connected = false;
    state_.baud_rate = 0;
    return Result<bool>::success(was_open);
}

Result<bool> Link::transmit(const Frame& frame)
{
    auto flushed = transport_.flush_input();
    if (!flushed.ok()) {
        return Result<bool>::failure(fail(flushed.error()));
    }

    auto written = transport_.write(frame.data(), frame.size());
    if (!written.ok()) {
        return Result<bool>::failure(fail(written.error()));
    }
    if (written.value() != frame.size()) {
        log("[LINK] Short write: " + std::to_string(written.value()) + " of " + std::to_string(frame.size()) + " bytes");
        return Result<bool>::failure(fail(Error::WRITE_ERROR));
    }

    return Result<bool>::success(true);
}

Result<Frame> Link::receive_frame(int timeout_ms)
{
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    std::vector<uint8_t> buffer;
    while (buffer.size() < Protocol::FRAME_SIZE) {
        auto chunk = transport_.read_available();
        if (!chunk.ok()) {
            return Result<Frame>::failure(fail(chunk.error()));
        }
        buffer.insert(buffer.end(), chunk.value().begin(), chunk.value().end());

        if (buffer.size() >= Protocol::FRAME_SIZE) {
            break;
        }
        if (Clock::now() >= deadline) {
            if (!buffer.empty()) {
                log("[LINK] RX timeout with partial frame: " + bytes_to_hex(buffer));
            }
            return Result<Frame>::failure(fail(Error::TIMEOUT));
        }
        std::this_thread::sleep_for(std::chrono::microseconds(Protocol::POLL_INTERVAL_US));
    }

    if (buffer.size() > Protocol::FRAME_SIZE) {
        log("[LINK] Dropping " + std::to_string(buffer.size() - Protocol::FRAME_SIZE) + " extra bytes: " + bytes_to_hex(buffer));
    }

    Frame frame;
    std::copy(buffer.begin(), buffer.begin() + Protocol::FRAME_SIZE, frame.begin());
    return Result<Frame>::success(frame);
}

Result<DecodedFrame> Link::exchange(const RegisterCommand& cmd)
{
    if (!transport_.is_open()) {
        return Result<DecodedFrame>::failure(fail(Error::NOT_CONNECTED));
    }

    Frame request = ItlaFrame::encode(cmd);
    auto sent = transmit(request);
    if (!sent.ok()) {
        return Result<DecodedFrame>::failure(sent.error());
    }

    auto received = receive_frame(timeout_ms_);
    if (!received.ok()) {
        return Result<DecodedFrame>::failure(received.error());
    }

    auto decoded = ItlaFrame::decode(received.value());
    if (!decoded.ok()) {
        log("[LINK] Checksum mismatch TX: " + bytes_to_hex(request) + " RX: " + bytes_to_hex(received.value()));
        return Result<DecodedFrame>::failure(fail(decoded.error()));
    }

    return decoded;
}

} // namespace ppcl

#pragma once

#include "transport/link.hpp"
#include "transport/transport.hpp"
#include "sync/ticket_sequencer.hpp"
#include "common/types.hpp"
#include "common/response.hpp"
#include "common/units.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <stdint.h>

namespace ppcl {

// Pure Photonics PPCL55x tunable laser. Safe to call from several threads;
// every register access waits its turn on the ticket queue.
class PpclLaser
{
public:
    static constexpr const char* DEFAULT_PORT = "/dev/ttyUSB0";
    static constexpr int DEFAULT_BAUD = 9600;

    using LogCallback = std::function<void(const std::string&)>;

    explicit PpclLaser(Transport& transport, const LaserConfig& config = LaserConfig());
    ~PpclLaser();

    PpclLaser(const PpclLaser&) = delete;
    PpclLaser& operator=(const PpclLaser&) = delete;

    static Result<bool> validate_config(const LaserConfig& config);

    Result<bool> connect(const std::string& port = DEFAULT_PORT, int baud = DEFAULT_BAUD);
    Result<bool> disconnect();

    /**
     * Tune to wavelength_nm. A lit laser is switched off for the Fcf1/Fcf2
     * writes and switched back on afterwards, even when a write fails.
     * Returns the status of the last frequency write attempted.
     */
    Result<Status> set_wavelength(double wavelength_nm);
    Result<Status> set_power(double power_dbm);
    Result<Status> set_channel(uint16_t channel = 1);
    Result<Status> set_mode(uint16_t mode);

    Result<Status> on();
    Result<Status> off();
    Result<Status> nop();

    Result<DecodedFrame> read_register(uint8_t reg);

    bool is_on() const { return power_on_.load(); }
    bool is_connected();
    LinkState link_state();
    const LaserConfig& config() const { return config_; }

    void set_timeout_ms(int timeout_ms);
    // May be swapped while other threads are issuing commands.
    void set_log_callback(LogCallback cb);

private:
    Link link_;
    TicketSequencer sequencer_;
    const LaserConfig config_;
    std::atomic<bool> power_on_{false};
    std::mutex log_mutex_;
    LogCallback log_callback_;

    void log(const std::string& msg);
    Result<DecodedFrame> transact(const RegisterCommand& cmd);
    Result<Status> write_register(uint8_t reg, uint16_t value);
    Result<Status> write_frequency(const units::FrequencyRegisters& regs);
};

} // namespace ppcl

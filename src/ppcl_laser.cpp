#include "devices/ppcl_laser.hpp"
#include "common/protocol.hpp"
#include <cmath>
#include <sstream>
#include <iomanip>

namespace ppcl {

namespace {

std::string reg_hex(uint8_t reg)
{
    std::ostringstream oss;
    oss << "0x" << std::uppercase << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(reg);
    return oss.str();
}

bool accepted(const Result<Status>& result)
{
    return result.ok() && result.value() == Status::NoError;
}

} // anonymous namespace

void PpclLaser::log(const std::string& msg)
{
    LogCallback cb;
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        cb = log_callback_;
    }
    if (cb) {
        cb(msg);
    }
}

PpclLaser::PpclLaser(Transport& transport, const LaserConfig& config)
    : link_(transport), config_(config) {}

PpclLaser::~PpclLaser()
{
    auto result = disconnect();
    if (!result.ok()) {
        log("[PPCL] Disconnect on shutdown failed: " + std::string(error_name(result.error())));
    }
}

Result<bool> PpclLaser::validate_config(const LaserConfig& config)
{
    if (!(config.min_wavelength_nm > 0.0) || !(config.min_wavelength_nm <= config.max_wavelength_nm)) {
        return Result<bool>::failure(Error::INVALID_CONFIG);
    }
    if (!(config.min_power_dbm <= config.max_power_dbm)) {
        return Result<bool>::failure(Error::INVALID_CONFIG);
    }
    return Result<bool>::success(true);
}

Result<bool> PpclLaser::connect(const std::string& port, int baud)
{
    auto valid = validate_config(config_);
    if (!valid.ok()) {
        log("[PPCL] Refusing to connect with inverted limits");
        return valid;
    }

    TicketGuard guard(sequencer_);
    power_on_.store(false);
    log("[PPCL] Connecting to " + port + " starting at " + std::to_string(baud) + " baud");
    return link_.connect(port, baud);
}

Result<bool> PpclLaser::disconnect()
{
    TicketGuard guard(sequencer_);
    power_on_.store(false);
    return link_.disconnect();
}

bool PpclLaser::is_connected()
{
    TicketGuard guard(sequencer_);
    return link_.is_connected();
}

LinkState PpclLaser::link_state()
{
    TicketGuard guard(sequencer_);
    return link_.state();
}

void PpclLaser::set_timeout_ms(int timeout_ms)
{
    TicketGuard guard(sequencer_);
    link_.set_timeout_ms(timeout_ms);
}

void PpclLaser::set_log_callback(LogCallback cb)
{
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        log_callback_ = cb;
    }
    // Link logs only while a ticket is held.
    TicketGuard guard(sequencer_);
    link_.set_log_callback(std::move(cb));
}

Result<DecodedFrame> PpclLaser::transact(const RegisterCommand& cmd)
{
    TicketGuard guard(sequencer_);

    if (!link_.is_connected()) {
        return Result<DecodedFrame>::failure(Error::NOT_CONNECTED);
    }

    auto response = link_.exchange(cmd);
    if (!response.ok()) {
        log("[PPCL] Register " + reg_hex(cmd.reg) + ": " + error_name(response.error()));
        return response;
    }

    // Status 2 announces an extended (AEA) reply, which this driver does not read.
    if (response.value().status == Status::ExtendedAddressing) {
        log("[PPCL] Register " + reg_hex(cmd.reg) + " requested an extended read");
        return Result<DecodedFrame>::failure(Error::EXTENDED_ADDRESSING_UNSUPPORTED);
    }

    if (response.value().status != Status::NoError) {
        log("[PPCL] Register " + reg_hex(cmd.reg) + ": " + status_name(response.value().status));
    }
    return response;
}

Result<Status> PpclLaser::write_register(uint8_t reg, uint16_t value)
{
    auto result = transact(RegisterCommand::write(reg, value));
    if (!result.ok()) {
        return Result<Status>::failure(result.error());
    }
    return Result<Status>::success(result.value().status);
}

Result<Status> PpclLaser::nop()
{
    auto result = transact(RegisterCommand::read(Protocol::Reg::NOP));
    if (!result.ok()) {
        return Result<Status>::failure(result.error());
    }
    return Result<Status>::success(result.value().status);
}

Result<DecodedFrame> PpclLaser::read_register(uint8_t reg)
{
    return transact(RegisterCommand::read(reg));
}

Result<Status> PpclLaser::on()
{
    auto enable = write_register(Protocol::Reg::RESENA, Protocol::Resena::SENA);
    if (!enable.ok()) {
        return enable;
    }
    if (enable.value() == Status::NoError) {
        power_on_.store(true);
    } else {
        log("[PPCL] Enable rejected, polling anyway");
    }

    // The ready poll always follows the Resena write.
    Result<Status> ready = enable;
    for (int i = 0; i < Protocol::READY_POLL_COUNT; ++i) {
        ready = nop();
        if (!ready.ok()) {
            return ready;
        }
    }
    return enable.value() == Status::NoError ? ready : enable;
}

Result<Status> PpclLaser::off()
{
    auto disable = write_register(Protocol::Reg::RESENA, Protocol::Resena::DISABLE);
    if (accepted(disable)) {
        power_on_.store(false);
    }
    return disable;
}

Result<Status> PpclLaser::write_frequency(const units::FrequencyRegisters& regs)
{
    auto coarse = write_register(Protocol::Reg::FCF1, regs.thz);
    if (!accepted(coarse)) {
        return coarse;
    }
    return write_register(Protocol::Reg::FCF2, regs.ghz_tenths);
}

Result<Status> PpclLaser::set_wavelength(double wavelength_nm)
{
    if (!(wavelength_nm >= config_.min_wavelength_nm && wavelength_nm <= config_.max_wavelength_nm)) {
        log("[PPCL] Wavelength " + std::to_string(wavelength_nm) + " nm outside limits");
        return Result<Status>::failure(Error::RANGE_ERROR);
    }

    units::FrequencyRegisters regs = units::wavelength_to_frequency_registers(wavelength_nm);

    if (!power_on_.load()) {
        return write_frequency(regs);
    }

    auto disabled = off();
    if (!accepted(disabled)) {
        log("[PPCL] Laser did not switch off before tuning");
    }
    auto written = write_frequency(regs);

    auto restored = on();
    if (!accepted(restored)) {
        log("[PPCL] Laser did not come back on after tuning");
        if (accepted(written)) {
            return restored;
        }
    }
    return written;
}

Result<Status> PpclLaser::set_power(double power_dbm)
{
    if (!(power_dbm >= config_.min_power_dbm && power_dbm <= config_.max_power_dbm)) {
        log("[PPCL] Power " + std::to_string(power_dbm) + " dBm outside limits");
        return Result<Status>::failure(Error::RANGE_ERROR);
    }

    // Register holds signed hundredths of a dBm.
    long hundredths = std::lround(power_dbm * 100.0);
    return write_register(Protocol::Reg::POWER, static_cast<uint16_t>(static_cast<int16_t>(hundredths)));
}

Result<Status> PpclLaser::set_channel(uint16_t channel)
{
    return write_register(Protocol::Reg::CHANNEL, channel);
}

Result<Status> PpclLaser::set_mode(uint16_t mode)
{
    return write_register(Protocol::Reg::MODE, mode);
}

} // namespace ppcl

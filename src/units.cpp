#include "common/units.hpp"
#include "common/protocol.hpp"
#include <cmath>

namespace ppcl {
namespace units {

double wavelength_to_frequency_ghz(double wavelength_nm)
{
    return Protocol::C_SPEED / wavelength_nm;
}

FrequencyRegisters wavelength_to_frequency_registers(double wavelength_nm)
{
    double freq = wavelength_to_frequency_ghz(wavelength_nm);

    long thz = static_cast<long>(std::floor(freq / 1000.0));
    long tenths = static_cast<long>(std::floor(freq * 10.0)) - thz * 10000;

    FrequencyRegisters regs;
    regs.thz = static_cast<uint16_t>(thz);
    regs.ghz_tenths = static_cast<uint16_t>(tenths);
    return regs;
}

} // namespace units
} // namespace ppcl

#pragma once

#include <cstdint>

namespace ppcl {
namespace units {

// Fcf1 / Fcf2 register pair: whole THz, remainder in tenths of a GHz.
struct FrequencyRegisters
{
    uint16_t thz;
    uint16_t ghz_tenths;
};

double wavelength_to_frequency_ghz(double wavelength_nm);

// No range check; callers validate the wavelength first.
FrequencyRegisters wavelength_to_frequency_registers(double wavelength_nm);

} // namespace units
} // namespace ppcl

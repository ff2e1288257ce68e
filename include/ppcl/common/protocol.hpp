#pragma once
#include <stdint.h>
#include <stddef.h>

namespace ppcl {

namespace Protocol
{
    // Timeouts (ms)
    constexpr int RESPONSE_TIMEOUT_MS = 500;
    constexpr int POLL_INTERVAL_US = 100;

    // Framing
    constexpr size_t FRAME_SIZE = 4;
    constexpr uint8_t DIRECTION_MASK = 0x01;
    constexpr uint8_t STATUS_MASK = 0x03;
    constexpr uint8_t LOW_NIBBLE = 0x0F;

    // Baud negotiation order
    constexpr int BAUD_CANDIDATES[] = { 4800, 9600, 19200, 38400, 57600, 115200 };
    constexpr size_t BAUD_CANDIDATE_COUNT = sizeof(BAUD_CANDIDATES) / sizeof(BAUD_CANDIDATES[0]);

    // Nop reads issued after enabling the laser
    constexpr int READY_POLL_COUNT = 10;

    // Speed of light (m/s); divided by a wavelength in nm it gives GHz
    constexpr double C_SPEED = 299792458.0;

    namespace Resena {
        constexpr uint16_t DISABLE = 0x00;
        constexpr uint16_t SENA = 0x08;
    }

    namespace Mode {
        constexpr uint16_t REGULAR = 0;
        constexpr uint16_t NO_DITHER = 1;
        constexpr uint16_t CLEAN = 2;
    }

    // Register map
    namespace Reg {
        constexpr uint8_t NOP = 0x00;
        constexpr uint8_t MFGR = 0x02;
        constexpr uint8_t MODEL = 0x03;
        constexpr uint8_t SERIAL = 0x04;
        constexpr uint8_t RELEASE = 0x06;
        constexpr uint8_t GENCFG = 0x08;
        constexpr uint8_t AEA_EAR = 0x0B;
        constexpr uint8_t IOCAP = 0x0D;
        constexpr uint8_t EAR = 0x10;
        constexpr uint8_t DLCONFIG = 0x14;
        constexpr uint8_t DLSTATUS = 0x15;
        constexpr uint8_t CHANNEL = 0x30;
        constexpr uint8_t POWER = 0x31;
        constexpr uint8_t RESENA = 0x32;
        constexpr uint8_t GRID = 0x34;
        constexpr uint8_t FCF1 = 0x35;
        constexpr uint8_t FCF2 = 0x36;
        constexpr uint8_t OOP = 0x42;
        constexpr uint8_t OPSL = 0x50;
        constexpr uint8_t OPSH = 0x51;
        constexpr uint8_t LFL1 = 0x52;
        constexpr uint8_t LFL2 = 0x53;
        constexpr uint8_t LFH1 = 0x54;
        constexpr uint8_t LFH2 = 0x55;
        constexpr uint8_t CURRENTS = 0x57;
        constexpr uint8_t TEMPS = 0x58;
        constexpr uint8_t FTF = 0x62;
        constexpr uint8_t MODE = 0x90;
        constexpr uint8_t PW = 0xE0;
        constexpr uint8_t CSWEEP_AMP = 0xE4;   // shared with Cscanamp
        constexpr uint8_t CSWEEP_SENA = 0xE5;  // shared with Cscanon / Csweepon
        constexpr uint8_t CSWEEP_OFFSET = 0xE6;
        constexpr uint8_t CJUMP_THZ = 0xEA;
        constexpr uint8_t CJUMP_GHZ = 0xEB;
        constexpr uint8_t CJUMP_SLED = 0xEC;
        constexpr uint8_t CJUMP_ON = 0xED;
        constexpr uint8_t CSCAN_SLED = 0xF0;
        constexpr uint8_t CSCAN_F1 = 0xF1;
        constexpr uint8_t CSCAN_F2 = 0xF2;
    }
}

} // namespace ppcl

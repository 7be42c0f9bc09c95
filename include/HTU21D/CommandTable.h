/// @file CommandTable.h
/// @brief Command definitions and bit masks for HTU21D
#pragma once

#include <cstdint>
#include <cstddef>

namespace HTU21D {
namespace cmd {

// ============================================================================
// I2C Address (7-bit, fixed)
// ============================================================================

static constexpr uint8_t I2C_ADDR = 0x40;

// ============================================================================
// CRC-8 parameters (x^8 + x^5 + x^4 + 1)
// ============================================================================

static constexpr uint8_t CRC_POLY = 0x31;
static constexpr uint32_t CRC_DIVISOR = 0x988000;  // CRC_POLY | 0x100, shifted to bit 23

// ============================================================================
// Measurement Commands
// ============================================================================

// Hold master: sensor stretches SCL until the conversion completes
static constexpr uint8_t CMD_TRIGGER_TEMP_HOLD = 0xE3;
static constexpr uint8_t CMD_TRIGGER_HUMIDITY_HOLD = 0xE5;

// No hold master: bus released, controller polls after conversion time
static constexpr uint8_t CMD_TRIGGER_TEMP_NO_HOLD = 0xF3;
static constexpr uint8_t CMD_TRIGGER_HUMIDITY_NO_HOLD = 0xF5;

// ============================================================================
// User register, reset
// ============================================================================

static constexpr uint8_t CMD_WRITE_USER_REG = 0xE6;
static constexpr uint8_t CMD_READ_USER_REG = 0xE7;
static constexpr uint8_t CMD_SOFT_RESET = 0xFE;

// ============================================================================
// User register bit masks
// ============================================================================

static constexpr uint8_t USER_REG_RESOLUTION_MASK = 0x81;   // bits 7 and 0
static constexpr uint8_t USER_REG_END_OF_BATTERY = 0x40;    // read-only, VDD < 2.25 V
static constexpr uint8_t USER_REG_HEATER_ENABLE = 0x04;
static constexpr uint8_t USER_REG_DISABLE_OTP_RELOAD = 0x02;

// Register content after power-on or soft reset
static constexpr uint8_t USER_REG_DEFAULT = 0x02;

// ============================================================================
// Measurement data
// ============================================================================

static constexpr uint16_t RAW_STATUS_MASK = 0x0003;   // low 2 bits are status
static constexpr uint16_t RAW_DATA_MASK = 0xFFFC;

static constexpr size_t DATA_WORD_BYTES = 2;
static constexpr size_t DATA_CRC_BYTES = 1;
static constexpr size_t MEASUREMENT_FRAME_LEN = 3;    // MSB, LSB, CRC
static constexpr size_t USER_REG_DATA_LEN = 1;

} // namespace cmd
} // namespace HTU21D

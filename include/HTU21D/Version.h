/// @file Version.h
/// @brief Library version information
#pragma once

#include <cstdint>

namespace HTU21D {

static constexpr uint8_t VERSION_MAJOR = 1;
static constexpr uint8_t VERSION_MINOR = 0;
static constexpr uint8_t VERSION_PATCH = 0;
static constexpr const char* VERSION = "1.0.0";

} // namespace HTU21D

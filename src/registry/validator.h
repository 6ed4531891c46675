#pragma once
#include <cstddef>
#include <cstdint>
#include "../config.h"
#include "../errors.h"

namespace lifxctl {

// Buffer sizes for canonical text forms, including the terminator
static const size_t ADDRESS_LEN    = 16;  // "255.255.255.255"
static const size_t IDENTIFIER_LEN = 18;  // "d0:73:d5:01:02:03"
static const size_t NAME_LEN       = LIFXCTL_MAX_NAME_LEN + 1;

// HSBK colour as the LIFX protocol carries it
struct ColorSpec {
    uint16_t hue;
    uint16_t saturation;
    uint16_t brightness;
    uint16_t kelvin;
};

// Validate an IPv4 dotted-quad (four decimal parts, each 0-255, at most
// three digits). Writes the canonical form (no leading zeros) to output.
// Returns false with INVALID_ADDRESS on any malformed input.
bool validateAddress(const char* text, char* output, size_t outputLen, Error& error);

// Validate a hardware identifier: six hex octet pairs separated by ':' or
// '-'. Writes the lowercase colon-separated form to output.
// Returns false with INVALID_IDENTIFIER on any malformed input.
bool validateIdentifier(const char* text, char* output, size_t outputLen, Error& error);

// Check a brightness level in [0, 65535]
bool validateBrightness(long value, uint16_t& level, Error& error);

// Check all four colour fields: hue, saturation, brightness in [0, 65535],
// kelvin in [LIFX_KELVIN_MIN, LIFX_KELVIN_MAX]. On failure color is
// untouched and badField (if given) names the first field out of range.
bool validateColor(long hue, long saturation, long brightness, long kelvin,
                   ColorSpec& color, Error& error, const char** badField = nullptr);

// Trim surrounding whitespace from a device name and check its length.
// Returns false with INVALID_NAME if empty after trimming or too long.
bool validateName(const char* text, char* output, size_t outputLen, Error& error);

} // namespace lifxctl

#include "validator.h"
#include <cctype>
#include <cstdio>
#include <cstring>

namespace lifxctl {

static bool isHexDigit(char c) {
    return (c >= '0' && c <= '9') ||
           (c >= 'a' && c <= 'f') ||
           (c >= 'A' && c <= 'F');
}

bool validateAddress(const char* text, char* output, size_t outputLen, Error& error) {
    error = Error::INVALID_ADDRESS;
    if (text == nullptr || output == nullptr) return false;

    int parts[4];
    int partCount = 0;
    const char* p = text;

    while (partCount < 4) {
        int digits = 0;
        int value = 0;
        while (*p >= '0' && *p <= '9') {
            if (++digits > 3) return false;
            value = value * 10 + (*p - '0');
            p++;
        }
        if (digits == 0 || value > 255) return false;
        parts[partCount++] = value;

        if (partCount < 4) {
            if (*p != '.') return false;
            p++;
        }
    }

    // Anything after the fourth part (a fifth part, whitespace) is rejected
    if (*p != '\0') return false;

    int len = snprintf(output, outputLen, "%d.%d.%d.%d",
                       parts[0], parts[1], parts[2], parts[3]);
    if (len < 0 || (size_t)len >= outputLen) return false;

    error = Error::NONE;
    return true;
}

bool validateIdentifier(const char* text, char* output, size_t outputLen, Error& error) {
    error = Error::INVALID_IDENTIFIER;
    if (text == nullptr || output == nullptr) return false;
    if (strlen(text) != IDENTIFIER_LEN - 1) return false;
    if (outputLen < IDENTIFIER_LEN) return false;

    // Layout: hh?hh?hh?hh?hh?hh where ? is ':' or '-'
    for (size_t i = 0; i < IDENTIFIER_LEN - 1; i++) {
        char c = text[i];
        if (i % 3 == 2) {
            if (c != ':' && c != '-') return false;
            output[i] = ':';
        } else {
            if (!isHexDigit(c)) return false;
            output[i] = (char)tolower((unsigned char)c);
        }
    }
    output[IDENTIFIER_LEN - 1] = '\0';

    error = Error::NONE;
    return true;
}

bool validateBrightness(long value, uint16_t& level, Error& error) {
    if (value < 0 || value > 65535) {
        error = Error::OUT_OF_RANGE;
        return false;
    }
    level = (uint16_t)value;
    error = Error::NONE;
    return true;
}

bool validateColor(long hue, long saturation, long brightness, long kelvin,
                   ColorSpec& color, Error& error, const char** badField) {
    const char* field = nullptr;
    if (hue < 0 || hue > 65535) {
        field = "hue";
    } else if (saturation < 0 || saturation > 65535) {
        field = "saturation";
    } else if (brightness < 0 || brightness > 65535) {
        field = "brightness";
    } else if (kelvin < LIFX_KELVIN_MIN || kelvin > LIFX_KELVIN_MAX) {
        field = "kelvin";
    }

    if (field != nullptr) {
        if (badField != nullptr) *badField = field;
        error = Error::OUT_OF_RANGE;
        return false;
    }

    color.hue = (uint16_t)hue;
    color.saturation = (uint16_t)saturation;
    color.brightness = (uint16_t)brightness;
    color.kelvin = (uint16_t)kelvin;
    error = Error::NONE;
    return true;
}

bool validateName(const char* text, char* output, size_t outputLen, Error& error) {
    error = Error::INVALID_NAME;
    if (text == nullptr || output == nullptr || outputLen == 0) return false;

    const char* start = text;
    while (*start != '\0' && isspace((unsigned char)*start)) start++;

    size_t len = strlen(start);
    while (len > 0 && isspace((unsigned char)start[len - 1])) len--;

    if (len == 0 || len > LIFXCTL_MAX_NAME_LEN || len >= outputLen) return false;

    memcpy(output, start, len);
    output[len] = '\0';
    error = Error::NONE;
    return true;
}

} // namespace lifxctl

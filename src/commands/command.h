#pragma once
#include <cstdint>
#include "../errors.h"
#include "../registry/validator.h"

namespace lifxctl {

enum class CommandKind : uint8_t {
    POWER_ON       = 0,
    POWER_OFF      = 1,
    SET_BRIGHTNESS = 2,
    SET_COLOR      = 3,
    STATUS         = 4
};

// A validated control command. Only buildCommand() produces one, so
// level/color are always in range for the kind.
struct Command {
    CommandKind kind;
    uint16_t level;     // SET_BRIGHTNESS only
    ColorSpec color;    // SET_COLOR only
};

// Parse a decimal integer argument. Accepts an optional leading '-' so
// negative values reach range checks; rejects empty input, other signs,
// whitespace and trailing characters.
bool parseIntArgument(const char* text, long& value);

// Build a command from its word and raw arguments:
//   on | off | status
//   setBrightness <level>
//   setColor <hue> <saturation> <brightness> <kelvin>
// Words match case-insensitively; surplus arguments are ignored.
// Fails with UNKNOWN_COMMAND, MISSING_ARGUMENT or OUT_OF_RANGE; badField
// (if given) names the offending argument.
bool buildCommand(const char* word, const char* const* args, int argc,
                  Command& command, Error& error, const char** badField = nullptr);

// Canonical command word, e.g. "setBrightness"
const char* commandKindToString(CommandKind kind);

} // namespace lifxctl

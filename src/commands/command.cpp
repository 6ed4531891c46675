#include "command.h"
#include <climits>
#include <cstring>
#include <strings.h>
#include "../debug_log.h"

namespace lifxctl {

bool parseIntArgument(const char* text, long& value) {
    if (text == nullptr || *text == '\0') return false;

    const char* p = text;
    bool negative = false;
    if (*p == '-') {
        negative = true;
        p++;
    }
    if (*p == '\0') return false;

    long result = 0;
    for (; *p != '\0'; p++) {
        if (*p < '0' || *p > '9') return false;
        // Saturate: anything this large is out of range for every field
        if (result > (LONG_MAX - 9) / 10) {
            result = LONG_MAX / 2;
            continue;
        }
        result = result * 10 + (*p - '0');
    }

    value = negative ? -result : result;
    return true;
}

static bool parseField(const char* text, const char* field, long& value,
                       Error& error, const char** badField) {
    if (!parseIntArgument(text, value)) {
        LOG_ERROR("CMD", "Argument %s is not an integer: '%s'", field, text);
        if (badField != nullptr) *badField = field;
        error = Error::OUT_OF_RANGE;
        return false;
    }
    return true;
}

bool buildCommand(const char* word, const char* const* args, int argc,
                  Command& command, Error& error, const char** badField) {
    if (word == nullptr) {
        error = Error::UNKNOWN_COMMAND;
        return false;
    }

    Command cmd;
    memset(&cmd, 0, sizeof(cmd));

    if (strcasecmp(word, "on") == 0) {
        cmd.kind = CommandKind::POWER_ON;
    } else if (strcasecmp(word, "off") == 0) {
        cmd.kind = CommandKind::POWER_OFF;
    } else if (strcasecmp(word, "status") == 0) {
        cmd.kind = CommandKind::STATUS;
    } else if (strcasecmp(word, "setBrightness") == 0) {
        if (argc < 1 || args == nullptr) {
            if (badField != nullptr) *badField = "level";
            error = Error::MISSING_ARGUMENT;
            return false;
        }
        long level;
        if (!parseField(args[0], "level", level, error, badField)) return false;
        if (!validateBrightness(level, cmd.level, error)) {
            if (badField != nullptr) *badField = "level";
            return false;
        }
        cmd.kind = CommandKind::SET_BRIGHTNESS;
    } else if (strcasecmp(word, "setColor") == 0) {
        if (argc < 4 || args == nullptr) {
            if (badField != nullptr) *badField = "hue saturation brightness kelvin";
            error = Error::MISSING_ARGUMENT;
            return false;
        }
        long h, s, b, k;
        if (!parseField(args[0], "hue", h, error, badField)) return false;
        if (!parseField(args[1], "saturation", s, error, badField)) return false;
        if (!parseField(args[2], "brightness", b, error, badField)) return false;
        if (!parseField(args[3], "kelvin", k, error, badField)) return false;
        if (!validateColor(h, s, b, k, cmd.color, error, badField)) return false;
        cmd.kind = CommandKind::SET_COLOR;
    } else {
        LOG_ERROR("CMD", "Unknown command: %s", word);
        error = Error::UNKNOWN_COMMAND;
        return false;
    }

    command = cmd;
    error = Error::NONE;
    return true;
}

const char* commandKindToString(CommandKind kind) {
    switch (kind) {
        case CommandKind::POWER_ON:       return "on";
        case CommandKind::POWER_OFF:      return "off";
        case CommandKind::SET_BRIGHTNESS: return "setBrightness";
        case CommandKind::SET_COLOR:      return "setColor";
        case CommandKind::STATUS:         return "status";
        default:                          return "unknown";
    }
}

} // namespace lifxctl

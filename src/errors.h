#pragma once
#include <cstdint>

namespace lifxctl {

// Failure kinds reported by every fallible operation
enum class Error : uint8_t {
    NONE                  = 0,
    INVALID_ADDRESS       = 1,   // Not an IPv4 dotted-quad
    INVALID_IDENTIFIER    = 2,   // Not six hex octets separated by ':' or '-'
    OUT_OF_RANGE          = 3,   // Brightness/colour argument outside its range
    NAME_CONFLICT         = 4,   // Name already used by a different device
    NOT_FOUND             = 5,   // No device with that name
    CORRUPT_REGISTRY      = 6,   // Registry file exists but cannot be parsed
    PERSISTENCE_ERROR     = 7,   // I/O failure while saving the registry
    DEVICE_UNREACHABLE    = 8,   // Connect failed or timed out
    DEVICE_COMMAND_FAILED = 9,   // Device reachable but did not acknowledge
    REGISTRY_FULL         = 10,
    UNKNOWN_COMMAND       = 11,
    MISSING_ARGUMENT      = 12,
    INVALID_NAME          = 13   // Empty or too long
};

// Stable code string, e.g. "name_conflict"
const char* errorToString(Error error);

// Process exit code for an error kind. NONE maps to 0, every other
// kind to its own non-zero code.
int errorExitCode(Error error);

} // namespace lifxctl

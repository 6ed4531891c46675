#include "errors.h"

namespace lifxctl {

const char* errorToString(Error error) {
    switch (error) {
        case Error::NONE:                  return "none";
        case Error::INVALID_ADDRESS:       return "invalid_address";
        case Error::INVALID_IDENTIFIER:    return "invalid_identifier";
        case Error::OUT_OF_RANGE:          return "out_of_range";
        case Error::NAME_CONFLICT:         return "name_conflict";
        case Error::NOT_FOUND:             return "not_found";
        case Error::CORRUPT_REGISTRY:      return "corrupt_registry";
        case Error::PERSISTENCE_ERROR:     return "persistence_error";
        case Error::DEVICE_UNREACHABLE:    return "device_unreachable";
        case Error::DEVICE_COMMAND_FAILED: return "device_command_failed";
        case Error::REGISTRY_FULL:         return "registry_full";
        case Error::UNKNOWN_COMMAND:       return "unknown_command";
        case Error::MISSING_ARGUMENT:      return "missing_argument";
        case Error::INVALID_NAME:          return "invalid_name";
        default:                           return "unknown";
    }
}

int errorExitCode(Error error) {
    // Exit codes 1 and 2 are left to usage errors from the CLI itself
    if (error == Error::NONE) return 0;
    return 10 + (int)error;
}

} // namespace lifxctl

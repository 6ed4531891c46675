#include "command_dispatcher.h"
#include <cstdio>
#include <cstring>
#include "../debug_log.h"

namespace lifxctl {

static void initResult(DispatchResult& result) {
    memset(&result, 0, sizeof(result));
    result.error = Error::NONE;
    result.state = DispatchState::RESOLVE;
    result.badField = nullptr;
    result.kind = CommandKind::STATUS;
    result.hasStatus = false;
    result.addressRefreshed = false;
    result.refreshError = Error::NONE;
}

const char* dispatchStateToString(DispatchState state) {
    switch (state) {
        case DispatchState::RESOLVE:  return "RESOLVE";
        case DispatchState::VALIDATE: return "VALIDATE";
        case DispatchState::CONNECT:  return "CONNECT";
        case DispatchState::EXECUTE:  return "EXECUTE";
        case DispatchState::REPORT:   return "REPORT";
        case DispatchState::DONE:     return "DONE";
        default:                      return "UNKNOWN";
    }
}

int formatDispatchReport(const DispatchResult& result, const char* name,
                         char* output, size_t outputLen) {
    if (output == nullptr || outputLen == 0) return -1;
    if (name == nullptr) name = "";

    const char* field = result.badField != nullptr ? result.badField : "argument";
    int len;

    switch (result.error) {
        case Error::NONE:
            if (result.hasStatus) {
                char label[48];
                label[0] = '\0';
                if (result.status.label[0] != '\0') {
                    snprintf(label, sizeof(label), "Label: %s\n", result.status.label);
                }
                len = snprintf(output, outputLen,
                               "Status for %s:\n"
                               "%s"
                               "Power: %s\n"
                               "Color:\n"
                               "  Hue: %u\n"
                               "  Saturation: %u\n"
                               "  Brightness: %u\n"
                               "  Kelvin: %u",
                               result.device.name,
                               label,
                               result.status.power ? "ON" : "OFF",
                               result.status.color.hue,
                               result.status.color.saturation,
                               result.status.color.brightness,
                               result.status.color.kelvin);
            } else {
                len = snprintf(output, outputLen,
                               "Command '%s' executed successfully on '%s'",
                               commandKindToString(result.kind), result.device.name);
            }
            break;
        case Error::NOT_FOUND:
            len = snprintf(output, outputLen,
                           "Device '%s' not found in configuration.", name);
            break;
        case Error::UNKNOWN_COMMAND:
            len = snprintf(output, outputLen,
                           "Unknown command for '%s' (expected on, off, setBrightness, "
                           "setColor or status)", name);
            break;
        case Error::MISSING_ARGUMENT:
            len = snprintf(output, outputLen, "Missing argument(s): %s", field);
            break;
        case Error::OUT_OF_RANGE:
            if (strcmp(field, "kelvin") == 0) {
                len = snprintf(output, outputLen, "Invalid kelvin: must be %d-%d",
                               LIFX_KELVIN_MIN, LIFX_KELVIN_MAX);
            } else {
                len = snprintf(output, outputLen, "Invalid %s: must be 0-65535", field);
            }
            break;
        case Error::DEVICE_UNREACHABLE:
            len = snprintf(output, outputLen,
                           "Device '%s' (%s, %s) is unreachable. "
                           "Run discovery to refresh its address.",
                           result.device.name, result.device.address,
                           result.device.identifier);
            break;
        case Error::DEVICE_COMMAND_FAILED:
            len = snprintf(output, outputLen,
                           "Device '%s' did not accept command '%s'",
                           result.device.name, commandKindToString(result.kind));
            break;
        default:
            len = snprintf(output, outputLen, "Command on '%s' failed: %s",
                           name, errorToString(result.error));
            break;
    }

    if (len < 0 || (size_t)len >= outputLen) return -1;
    return len;
}

CommandDispatcher::CommandDispatcher(Registry& registry, RegistryStore& store,
                                     Transport& transport)
    : _registry(registry), _store(store), _transport(transport) {}

bool CommandDispatcher::dispatch(const char* name, const char* word,
                                 const char* const* args, int argc,
                                 DispatchResult& result) {
    initResult(result);

    if (!resolve(name, result)) return false;

    result.state = DispatchState::VALIDATE;
    Command command;
    Error error;
    if (!buildCommand(word, args, argc, command, error, &result.badField)) {
        LOG_ERROR("CMD", "Invalid %s command for %s: %s",
                  word ? word : "(null)", result.device.name, errorToString(error));
        return fail(result, DispatchState::VALIDATE, error);
    }
    result.kind = command.kind;

    return connectAndExecute(command, result);
}

bool CommandDispatcher::execute(const char* name, const Command& command,
                                DispatchResult& result) {
    initResult(result);
    result.kind = command.kind;

    if (!resolve(name, result)) return false;
    return connectAndExecute(command, result);
}

bool CommandDispatcher::resolve(const char* name, DispatchResult& result) {
    result.state = DispatchState::RESOLVE;
    const DeviceRecord* record = findByName(_registry, name);
    if (record == nullptr) {
        LOG_ERROR("CMD", "Unknown device: %s", name ? name : "(null)");
        return fail(result, DispatchState::RESOLVE, Error::NOT_FOUND);
    }
    result.device = *record;
    return true;
}

bool CommandDispatcher::connectAndExecute(const Command& command, DispatchResult& result) {
    result.state = DispatchState::CONNECT;
    LOG_INFO("CMD", "Connecting to %s (%s, %s)", result.device.name,
             result.device.address, result.device.identifier);

    Error error;
    std::unique_ptr<DeviceHandle> handle =
        _transport.connect(result.device.identifier, result.device.address, error);
    if (!handle) {
        return fail(result, DispatchState::CONNECT, Error::DEVICE_UNREACHABLE);
    }

    // A different bulb answering at the old address is not our device
    if (strcmp(handle->identifier(), result.device.identifier) != 0) {
        LOG_ERROR("CMD", "%s answered as %s, expected %s", result.device.address,
                  handle->identifier(), result.device.identifier);
        return fail(result, DispatchState::CONNECT, Error::DEVICE_UNREACHABLE);
    }

    if (handle->address()[0] != '\0' &&
        strcmp(handle->address(), result.device.address) != 0) {
        refreshAddress(handle->address(), result);
    }

    if (!executeOn(*handle, command, result)) return false;

    result.state = DispatchState::DONE;
    result.error = Error::NONE;
    _processed++;
    LOG_INFO("CMD", "Command %s done on %s", commandKindToString(command.kind),
             result.device.name);
    return true;
}

bool CommandDispatcher::executeOn(DeviceHandle& handle, const Command& command,
                                  DispatchResult& result) {
    result.state = DispatchState::EXECUTE;
    Error error = Error::NONE;
    bool ok = false;

    switch (command.kind) {
        case CommandKind::POWER_ON:
            ok = handle.setPower(true, error);
            break;
        case CommandKind::POWER_OFF:
            ok = handle.setPower(false, error);
            break;
        case CommandKind::SET_BRIGHTNESS:
            ok = handle.setBrightness(command.level, error);
            break;
        case CommandKind::SET_COLOR:
            ok = handle.setColor(command.color, error);
            break;
        case CommandKind::STATUS:
            ok = handle.getStatus(result.status, error);
            result.hasStatus = ok;
            break;
        default:
            error = Error::UNKNOWN_COMMAND;
            break;
    }

    if (!ok) {
        if (error != Error::DEVICE_UNREACHABLE) {
            error = Error::DEVICE_COMMAND_FAILED;
        }
        LOG_ERROR("CMD", "Command %s failed on %s: %s", commandKindToString(command.kind),
                  result.device.name, errorToString(error));
        return fail(result, DispatchState::EXECUTE, error);
    }

    result.state = DispatchState::REPORT;
    return true;
}

void CommandDispatcher::refreshAddress(const char* address, DispatchResult& result) {
    DeviceRecord updated = result.device;
    strncpy(updated.address, address, sizeof(updated.address) - 1);
    updated.address[sizeof(updated.address) - 1] = '\0';

    // Work on a copy so a failed save leaves the in-memory registry as on disk
    Registry next = _registry;
    bool changed = false;
    Error error;
    if (!addOrUpdate(next, updated, changed, error) || !changed) {
        LOG_ERROR("CMD", "Cannot refresh address of %s to %s: %s",
                  result.device.name, address, errorToString(error));
        return;
    }

    if (!_store.save(next, error)) {
        LOG_ERROR("CMD", "Address of %s changed to %s but could not be saved",
                  result.device.name, address);
        result.refreshError = error;
        return;
    }

    _registry = next;
    LOG_INFO("CMD", "Updated address of %s: %s -> %s",
             result.device.name, result.device.address, address);
    strncpy(result.device.address, address, sizeof(result.device.address) - 1);
    result.device.address[sizeof(result.device.address) - 1] = '\0';
    result.addressRefreshed = true;
}

bool CommandDispatcher::fail(DispatchResult& result, DispatchState state, Error error) {
    result.state = state;
    result.error = error;
    _failed++;
    return false;
}

} // namespace lifxctl

#pragma once
#include <cstddef>
#include <cstdint>
#include "command.h"
#include "../errors.h"
#include "../registry/device_registry.h"
#include "../registry/registry_store.h"
#include "../transport/transport.h"

namespace lifxctl {

// Dispatch steps, in execution order. Arguments are validated before the
// transport is touched so invalid input never reaches the network.
enum class DispatchState : uint8_t {
    RESOLVE  = 0,   // name -> record
    VALIDATE = 1,   // raw arguments -> Command
    CONNECT  = 2,   // record address -> live handle
    EXECUTE  = 3,   // command -> device
    REPORT   = 4,
    DONE     = 5
};

struct DispatchResult {
    Error error;
    DispatchState state;      // DONE on success, otherwise the failing step
    const char* badField;     // argument named by a VALIDATE failure
    CommandKind kind;
    DeviceRecord device;      // valid once RESOLVE succeeded
    bool hasStatus;
    DeviceStatus status;      // STATUS only
    bool addressRefreshed;    // record address changed and was persisted
    Error refreshError;       // address changed but could not be persisted
};

const char* dispatchStateToString(DispatchState state);

// Operator-facing message for a finished dispatch. name is the name the
// operator asked for. Returns message length, or -1 if output is too small.
int formatDispatchReport(const DispatchResult& result, const char* name,
                         char* output, size_t outputLen);

// Runs one control command per call. Holds no state between calls apart
// from counters; the registry is only written when the device answered
// from a different address than the one on record.
class CommandDispatcher {
public:
    CommandDispatcher(Registry& registry, RegistryStore& store, Transport& transport);

    // Full state machine from raw command word and arguments
    bool dispatch(const char* name, const char* word, const char* const* args, int argc,
                  DispatchResult& result);

    // Same, for an already validated command
    bool execute(const char* name, const Command& command, DispatchResult& result);

    int commandsProcessed() const { return _processed; }
    int commandsFailed() const { return _failed; }

private:
    Registry& _registry;
    RegistryStore& _store;
    Transport& _transport;
    int _processed = 0;
    int _failed = 0;

    bool resolve(const char* name, DispatchResult& result);
    bool connectAndExecute(const Command& command, DispatchResult& result);
    bool executeOn(DeviceHandle& handle, const Command& command, DispatchResult& result);
    void refreshAddress(const char* address, DispatchResult& result);
    bool fail(DispatchResult& result, DispatchState state, Error error);
};

} // namespace lifxctl

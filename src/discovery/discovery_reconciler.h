#pragma once
#include <cstddef>
#include "../errors.h"
#include "../registry/device_registry.h"
#include "../registry/registry_store.h"
#include "../transport/transport.h"

namespace lifxctl {

enum class PromptResult : uint8_t {
    NAME   = 0,   // operator entered a name
    SKIP   = 1,   // leave this device unregistered
    CANCEL = 2    // stop reconciling; earlier merges stay persisted
};

// Operator interaction during reconciliation. askName blocks until the
// operator answers; there is no timeout.
class NamePrompt {
public:
    virtual ~NamePrompt() {}

    virtual PromptResult askName(const DiscoveredDevice& device, char* name, size_t nameLen) = 0;

    // The chosen name belongs to another device; this device is skipped
    virtual void reportConflict(const DiscoveredDevice& device, const char* name,
                                const DeviceRecord& owner) = 0;

    // The device was merged into the registry and persisted
    virtual void reportAdded(const DeviceRecord& record) = 0;
};

struct ReconcileSummary {
    int scanned;     // devices in the scan batch
    int added;       // new identifiers registered
    int updated;     // known identifiers whose address changed
    int unchanged;   // known identifiers already up to date
    int skipped;     // operator skipped, invalid name, or registry full
    int conflicts;   // chosen name already used by another device
    int invalid;     // malformed identifier or address in the scan
    bool cancelled;  // operator cancelled before the end of the batch
};

// Merge one scan batch into the registry, in arrival order.
// Known identifiers get their address refreshed (names are never touched);
// new identifiers are named through the prompt. Every accepted merge is
// saved before the next device is looked at, so cancelling or crashing
// keeps all earlier merges.
// Returns false with PERSISTENCE_ERROR if a save fails; the registry then
// holds exactly what was persisted before the failure.
bool reconcileDiscovered(Registry& registry, RegistryStore& store,
                         const DiscoveredDevice* devices, int count,
                         NamePrompt& prompt, ReconcileSummary& summary, Error& error);

} // namespace lifxctl

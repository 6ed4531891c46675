#include "discovery_reconciler.h"
#include <cstring>
#include "../debug_log.h"

namespace lifxctl {

// Apply one record to a copy of the registry and persist it. Only on a
// successful save does the copy replace the live registry.
static bool mergeAndSave(Registry& registry, RegistryStore& store,
                         const DeviceRecord& record, Error& error) {
    Registry next = registry;
    bool changed = false;
    if (!addOrUpdate(next, record, changed, error)) return false;
    if (!changed) return true;

    if (!store.save(next, error)) return false;
    registry = next;
    return true;
}

bool reconcileDiscovered(Registry& registry, RegistryStore& store,
                         const DiscoveredDevice* devices, int count,
                         NamePrompt& prompt, ReconcileSummary& summary, Error& error) {
    memset(&summary, 0, sizeof(summary));
    summary.scanned = count;
    error = Error::NONE;

    if (devices == nullptr || count <= 0) return true;

    for (int i = 0; i < count; i++) {
        const DiscoveredDevice& found = devices[i];

        char identifier[IDENTIFIER_LEN];
        char address[ADDRESS_LEN];
        Error fieldError;
        if (!validateIdentifier(found.identifier, identifier, sizeof(identifier), fieldError) ||
            !validateAddress(found.address, address, sizeof(address), fieldError)) {
            LOG_ERROR("DISC", "Ignoring malformed scan entry %s @ %s",
                      found.identifier, found.address);
            summary.invalid++;
            continue;
        }

        const DeviceRecord* known = findByIdentifier(registry, identifier);
        if (known != nullptr) {
            if (strcmp(known->address, address) == 0) {
                LOG_DEBUG("DISC", "%s (%s) unchanged at %s", known->name, identifier, address);
                summary.unchanged++;
                continue;
            }

            DeviceRecord updated = *known;
            strncpy(updated.address, address, sizeof(updated.address) - 1);
            updated.address[sizeof(updated.address) - 1] = '\0';

            if (!mergeAndSave(registry, store, updated, error)) {
                LOG_ERROR("DISC", "Failed to save address of %s: %s",
                          updated.name, errorToString(error));
                return false;
            }
            LOG_INFO("DISC", "%s moved to %s", updated.name, address);
            summary.updated++;
            continue;
        }

        DiscoveredDevice normalized;
        memcpy(normalized.identifier, identifier, sizeof(normalized.identifier));
        memcpy(normalized.address, address, sizeof(normalized.address));

        char name[NAME_LEN];
        name[0] = '\0';
        PromptResult answer = prompt.askName(normalized, name, sizeof(name));
        if (answer == PromptResult::CANCEL) {
            LOG_INFO("DISC", "Reconciliation cancelled after %d of %d devices", i, count);
            summary.cancelled = true;
            return true;
        }
        if (answer == PromptResult::SKIP) {
            summary.skipped++;
            continue;
        }

        DeviceRecord record;
        if (!makeDeviceRecord(identifier, address, name, record, fieldError)) {
            LOG_ERROR("DISC", "Rejected name for %s: %s", identifier, errorToString(fieldError));
            summary.skipped++;
            continue;
        }

        const DeviceRecord* owner = findByName(registry, record.name);
        if (owner != nullptr) {
            LOG_ERROR("DISC", "Name '%s' already belongs to %s, skipping %s",
                      record.name, owner->identifier, identifier);
            prompt.reportConflict(normalized, record.name, *owner);
            summary.conflicts++;
            continue;
        }

        if (!mergeAndSave(registry, store, record, error)) {
            if (error == Error::PERSISTENCE_ERROR) {
                LOG_ERROR("DISC", "Failed to save %s: %s", record.name, errorToString(error));
                return false;
            }
            // REGISTRY_FULL: nothing was written, move on
            LOG_ERROR("DISC", "Cannot add %s: %s", record.name, errorToString(error));
            summary.skipped++;
            error = Error::NONE;
            continue;
        }

        prompt.reportAdded(record);
        summary.added++;
    }

    LOG_INFO("DISC", "Reconciled %d devices: %d added, %d updated, %d skipped, %d conflicts",
             count, summary.added, summary.updated, summary.skipped, summary.conflicts);
    return true;
}

} // namespace lifxctl

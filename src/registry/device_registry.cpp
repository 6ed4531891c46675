#include "device_registry.h"
#include <algorithm>
#include <cstring>
#include <strings.h>
#include "../debug_log.h"

namespace lifxctl {

static bool recordsEqual(const DeviceRecord& a, const DeviceRecord& b) {
    return strcmp(a.identifier, b.identifier) == 0 &&
           strcmp(a.name, b.name) == 0 &&
           strcmp(a.address, b.address) == 0;
}

static bool nameLess(const DeviceRecord* a, const DeviceRecord* b) {
    int cmp = strcasecmp(a->name, b->name);
    if (cmp != 0) return cmp < 0;
    return strcmp(a->identifier, b->identifier) < 0;
}

void initRegistry(Registry& registry) {
    memset(&registry, 0, sizeof(registry));
    registry.count = 0;
}

bool makeDeviceRecord(const char* identifier, const char* address, const char* name,
                      DeviceRecord& record, Error& error) {
    DeviceRecord tmp;
    memset(&tmp, 0, sizeof(tmp));

    if (!validateIdentifier(identifier, tmp.identifier, sizeof(tmp.identifier), error)) return false;
    if (!validateAddress(address, tmp.address, sizeof(tmp.address), error)) return false;
    if (!validateName(name, tmp.name, sizeof(tmp.name), error)) return false;

    record = tmp;
    return true;
}

bool addOrUpdate(Registry& registry, const DeviceRecord& record, bool& changed, Error& error) {
    changed = false;

    // Re-validate so nothing malformed can enter the registry
    DeviceRecord normalized;
    if (!makeDeviceRecord(record.identifier, record.address, record.name, normalized, error)) {
        LOG_ERROR("REG", "Rejected record %s: %s", record.identifier, errorToString(error));
        return false;
    }

    DeviceRecord* existing = nullptr;
    for (int i = 0; i < registry.count; i++) {
        DeviceRecord& r = registry.devices[i];
        if (strcmp(r.identifier, normalized.identifier) == 0) {
            existing = &r;
        } else if (strcasecmp(r.name, normalized.name) == 0) {
            LOG_ERROR("REG", "Name '%s' already used by %s", normalized.name, r.identifier);
            error = Error::NAME_CONFLICT;
            return false;
        }
    }

    if (existing != nullptr) {
        if (recordsEqual(*existing, normalized)) {
            error = Error::NONE;
            return true;
        }
        LOG_INFO("REG", "Updated %s: name '%s' -> '%s', ip %s -> %s",
                 existing->identifier, existing->name, normalized.name,
                 existing->address, normalized.address);
        *existing = normalized;
        changed = true;
        error = Error::NONE;
        return true;
    }

    if (registry.count >= LIFXCTL_MAX_DEVICES) {
        LOG_ERROR("REG", "Registry full (%d devices)", registry.count);
        error = Error::REGISTRY_FULL;
        return false;
    }

    registry.devices[registry.count++] = normalized;
    LOG_INFO("REG", "Added %s as '%s' at %s",
             normalized.identifier, normalized.name, normalized.address);
    changed = true;
    error = Error::NONE;
    return true;
}

const DeviceRecord* findByName(const Registry& registry, const char* name) {
    if (name == nullptr) return nullptr;

    for (int i = 0; i < registry.count; i++) {
        if (strcasecmp(registry.devices[i].name, name) == 0) {
            return &registry.devices[i];
        }
    }
    return nullptr;
}

const DeviceRecord* findByIdentifier(const Registry& registry, const char* identifier) {
    if (identifier == nullptr) return nullptr;

    for (int i = 0; i < registry.count; i++) {
        if (strcmp(registry.devices[i].identifier, identifier) == 0) {
            return &registry.devices[i];
        }
    }
    return nullptr;
}

int listAll(const Registry& registry, const DeviceRecord** output, int maxOutput) {
    if (output == nullptr || maxOutput <= 0) return 0;

    int n = registry.count < maxOutput ? registry.count : maxOutput;
    for (int i = 0; i < n; i++) {
        output[i] = &registry.devices[i];
    }
    std::sort(output, output + n, nameLess);
    return n;
}

bool registryEquals(const Registry& a, const Registry& b) {
    if (a.count != b.count) return false;

    for (int i = 0; i < a.count; i++) {
        const DeviceRecord* other = findByIdentifier(b, a.devices[i].identifier);
        if (other == nullptr || !recordsEqual(a.devices[i], *other)) {
            return false;
        }
    }
    return true;
}

} // namespace lifxctl

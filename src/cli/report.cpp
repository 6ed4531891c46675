#include "report.h"

namespace lifxctl {

void printDeviceTable(const Registry& registry, FILE* out) {
    if (registry.count == 0) {
        fprintf(out, "No devices configured.\n");
        return;
    }

    const DeviceRecord* sorted[LIFXCTL_MAX_DEVICES];
    int n = listAll(registry, sorted, LIFXCTL_MAX_DEVICES);

    fprintf(out, "\nConfigured Devices:\n");
    fprintf(out, "------------------------------------------------------------\n");
    fprintf(out, "%-20s %-15s %-17s\n", "Name", "IP Address", "MAC Address");
    fprintf(out, "------------------------------------------------------------\n");
    for (int i = 0; i < n; i++) {
        fprintf(out, "%-20s %-15s %-17s\n",
                sorted[i]->name, sorted[i]->address, sorted[i]->identifier);
    }
}

void printReconcileSummary(const ReconcileSummary& summary, FILE* out) {
    if (summary.scanned == 0) {
        fprintf(out, "No LIFX devices answered the scan.\n");
        return;
    }

    fprintf(out, "\nScanned %d device(s): %d added, %d address(es) updated, "
                 "%d unchanged, %d skipped, %d name conflict(s)",
            summary.scanned, summary.added, summary.updated,
            summary.unchanged, summary.skipped, summary.conflicts);
    if (summary.invalid > 0) {
        fprintf(out, ", %d malformed", summary.invalid);
    }
    fprintf(out, "\n");

    if (summary.cancelled) {
        fprintf(out, "Discovery cancelled; devices named so far were saved.\n");
    }
}

int formatRegistryError(Error error, const char* path, const char* address,
                        const char* identifier, const char* name,
                        char* output, size_t outputLen) {
    if (output == nullptr || outputLen == 0) return -1;
    if (path == nullptr) path = "";
    if (address == nullptr) address = "";
    if (identifier == nullptr) identifier = "";
    if (name == nullptr) name = "";

    int len;
    switch (error) {
        case Error::INVALID_ADDRESS:
            len = snprintf(output, outputLen, "Invalid IP address format: %s", address);
            break;
        case Error::INVALID_IDENTIFIER:
            len = snprintf(output, outputLen, "Invalid MAC address format: %s", identifier);
            break;
        case Error::INVALID_NAME:
            len = snprintf(output, outputLen,
                           "Invalid device name '%s' (1-%d characters)",
                           name, LIFXCTL_MAX_NAME_LEN);
            break;
        case Error::NAME_CONFLICT:
            len = snprintf(output, outputLen, "Device name '%s' already exists", name);
            break;
        case Error::REGISTRY_FULL:
            len = snprintf(output, outputLen,
                           "Registry is full (%d devices)", LIFXCTL_MAX_DEVICES);
            break;
        case Error::CORRUPT_REGISTRY:
            len = snprintf(output, outputLen,
                           "Registry file %s is corrupt; fix or move it aside by hand", path);
            break;
        case Error::PERSISTENCE_ERROR:
            len = snprintf(output, outputLen, "Could not read or write registry file %s", path);
            break;
        default:
            len = snprintf(output, outputLen, "Registry operation failed: %s",
                           errorToString(error));
            break;
    }

    if (len < 0 || (size_t)len >= outputLen) return -1;
    return len;
}

} // namespace lifxctl

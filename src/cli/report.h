#pragma once
#include <cstdio>
#include "../errors.h"
#include "../discovery/discovery_reconciler.h"
#include "../registry/device_registry.h"

namespace lifxctl {

// Fixed-width Name / IP Address / MAC Address table, ordered by name.
// Prints "No devices configured." for an empty registry.
void printDeviceTable(const Registry& registry, FILE* out);

void printReconcileSummary(const ReconcileSummary& summary, FILE* out);

// Operator message for a failed manual registration or registry load.
// Names the offending field. Returns message length, or -1 if it does not fit.
int formatRegistryError(Error error, const char* path, const char* address,
                        const char* identifier, const char* name,
                        char* output, size_t outputLen);

} // namespace lifxctl

#pragma once
#include <cstdint>
#include "../config.h"
#include "../errors.h"
#include "validator.h"

namespace lifxctl {

struct DeviceRecord {
    char identifier[IDENTIFIER_LEN];  // canonical "aa:bb:cc:dd:ee:ff", unique key
    char name[NAME_LEN];              // operator label, unique (case-insensitive)
    char address[ADDRESS_LEN];        // last-known IPv4 address
};

// In-memory registry. Records are kept in insertion order; use listAll()
// for display order.
struct Registry {
    DeviceRecord devices[LIFXCTL_MAX_DEVICES];
    int count;
};

// Reset to an empty registry
void initRegistry(Registry& registry);

// Fill a record from raw text fields. Validates and normalises all three.
// Returns false with INVALID_IDENTIFIER, INVALID_ADDRESS or INVALID_NAME.
bool makeDeviceRecord(const char* identifier, const char* address, const char* name,
                      DeviceRecord& record, Error& error);

// Insert a record, or update name/address of the record with the same
// identifier. Fails with NAME_CONFLICT if another identifier already uses
// the name, REGISTRY_FULL when there is no room for a new identifier.
// The registry is untouched on failure. changed is false when the record
// was already present with identical fields.
bool addOrUpdate(Registry& registry, const DeviceRecord& record, bool& changed, Error& error);

// Look up by name (case-insensitive). Returns nullptr if not found.
const DeviceRecord* findByName(const Registry& registry, const char* name);

// Look up by canonical identifier. Returns nullptr if not found.
const DeviceRecord* findByIdentifier(const Registry& registry, const char* identifier);

// Fill output with pointers to every record ordered by name.
// Returns the number of records written.
int listAll(const Registry& registry, const DeviceRecord** output, int maxOutput);

// Content equality, independent of record order
bool registryEquals(const Registry& a, const Registry& b);

} // namespace lifxctl

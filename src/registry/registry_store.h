#pragma once
#include <cstddef>
#include <string>
#include "../errors.h"
#include "device_registry.h"

namespace lifxctl {

// --- Testable pure functions ---

// Encode the registry as {"devices": {"<id>": {"name": .., "ip": ..}}},
// pretty-printed. Returns false only if serialization produced nothing.
bool registryToJson(const Registry& registry, std::string& output);

// Decode a registry document. Keys are normalised to canonical identifiers.
// Any structural problem, invalid field, duplicate identifier or duplicate
// name fails with CORRUPT_REGISTRY; registry is untouched on failure.
bool registryFromJson(const char* json, size_t len, Registry& registry, Error& error);

// File-backed registry. One instance per process; the file is the only
// state shared between invocations. Concurrent writers resolve
// last-writer-wins: each save replaces the whole file atomically.
class RegistryStore {
public:
    explicit RegistryStore(const char* path);

    // Read the registry file. A missing file yields an empty registry.
    // Fails with CORRUPT_REGISTRY if the file cannot be parsed (the file is
    // left as is), PERSISTENCE_ERROR if it exists but cannot be read.
    bool load(Registry& registry, Error& error);

    // Write the full registry to a temporary file in the same directory,
    // fsync it and rename it over the registry path. A crash at any point
    // leaves either the old or the new file under the path, never a partial
    // one. Fails with PERSISTENCE_ERROR.
    bool save(const Registry& registry, Error& error);

    const char* path() const { return _path.c_str(); }
    int saveCount() const { return _saves; }

private:
    std::string _path;
    int _saves;

    bool writeFully(int fd, const char* data, size_t len);
    void syncParentDirectory();
};

// Manual registration, bypassing discovery: validate the raw fields, merge
// with addOrUpdate and persist. record receives the normalised fields.
// Nothing is written when the record is already present with identical
// fields (changed is false).
// Fails with INVALID_ADDRESS, INVALID_IDENTIFIER, INVALID_NAME,
// NAME_CONFLICT, REGISTRY_FULL or PERSISTENCE_ERROR; on failure the
// registry is untouched.
bool registerDevice(Registry& registry, RegistryStore& store,
                    const char* address, const char* identifier, const char* name,
                    DeviceRecord& record, bool& changed, Error& error);

} // namespace lifxctl

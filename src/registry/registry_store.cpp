#include "registry_store.h"
#include <ArduinoJson.h>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include "../debug_log.h"

namespace lifxctl {

bool registryToJson(const Registry& registry, std::string& output) {
    JsonDocument doc;
    JsonObject devices = doc["devices"].to<JsonObject>();

    for (int i = 0; i < registry.count; i++) {
        const DeviceRecord& r = registry.devices[i];
        JsonObject entry = devices[r.identifier].to<JsonObject>();
        entry["name"] = r.name;
        entry["ip"] = r.address;
    }

    output.clear();
    size_t len = serializeJsonPretty(doc, output);
    if (len == 0) return false;
    output += '\n';
    return true;
}

bool registryFromJson(const char* json, size_t len, Registry& registry, Error& error) {
    error = Error::CORRUPT_REGISTRY;
    if (json == nullptr) return false;

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, json, len);
    if (err) {
        LOG_ERROR("REG", "Registry is not valid JSON: %s", err.c_str());
        return false;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    if (root.isNull()) {
        LOG_ERROR("REG", "Registry root is not an object");
        return false;
    }

    JsonObjectConst devices = root["devices"].as<JsonObjectConst>();
    if (devices.isNull()) {
        LOG_ERROR("REG", "Registry has no devices object");
        return false;
    }

    Registry loaded;
    initRegistry(loaded);

    for (JsonPairConst kv : devices) {
        const char* key = kv.key().c_str();
        JsonObjectConst entry = kv.value().as<JsonObjectConst>();
        if (entry.isNull() ||
            !entry["name"].is<const char*>() ||
            !entry["ip"].is<const char*>()) {
            LOG_ERROR("REG", "Entry %s is missing name or ip", key);
            return false;
        }

        DeviceRecord record;
        Error fieldError;
        if (!makeDeviceRecord(key, entry["ip"].as<const char*>(),
                              entry["name"].as<const char*>(), record, fieldError)) {
            LOG_ERROR("REG", "Entry %s is invalid: %s", key, errorToString(fieldError));
            return false;
        }

        if (findByIdentifier(loaded, record.identifier) != nullptr) {
            LOG_ERROR("REG", "Duplicate identifier %s", record.identifier);
            return false;
        }

        bool changed;
        Error addError;
        if (!addOrUpdate(loaded, record, changed, addError)) {
            if (addError == Error::REGISTRY_FULL) {
                error = addError;
            }
            LOG_ERROR("REG", "Entry %s rejected: %s", key, errorToString(addError));
            return false;
        }
    }

    registry = loaded;
    error = Error::NONE;
    return true;
}

RegistryStore::RegistryStore(const char* path)
    : _path(path != nullptr ? path : LIFXCTL_REGISTRY_PATH), _saves(0) {}

bool RegistryStore::load(Registry& registry, Error& error) {
    FILE* file = fopen(_path.c_str(), "rb");
    if (file == nullptr) {
        if (errno == ENOENT) {
            LOG_INFO("REG", "No registry at %s, starting empty", _path.c_str());
            initRegistry(registry);
            error = Error::NONE;
            return true;
        }
        LOG_ERROR("REG", "Cannot open %s: %s", _path.c_str(), strerror(errno));
        error = Error::PERSISTENCE_ERROR;
        return false;
    }

    std::string content;
    char buf[4096];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), file)) > 0) {
        content.append(buf, n);
    }
    bool readFailed = ferror(file) != 0;
    fclose(file);

    if (readFailed) {
        LOG_ERROR("REG", "Read error on %s", _path.c_str());
        error = Error::PERSISTENCE_ERROR;
        return false;
    }

    if (!registryFromJson(content.data(), content.size(), registry, error)) {
        LOG_ERROR("REG", "Registry %s is corrupt, leaving it untouched", _path.c_str());
        return false;
    }

    LOG_DEBUG("REG", "Loaded %d devices from %s", registry.count, _path.c_str());
    return true;
}

bool RegistryStore::save(const Registry& registry, Error& error) {
    error = Error::PERSISTENCE_ERROR;

    std::string content;
    if (!registryToJson(registry, content)) {
        LOG_ERROR("REG", "Failed to serialize registry");
        return false;
    }

    // Temp file lives next to the target so rename() stays on one filesystem
    char tmpPath[PATH_MAX];
    int len = snprintf(tmpPath, sizeof(tmpPath), "%s.tmp.%ld",
                       _path.c_str(), (long)getpid());
    if (len < 0 || (size_t)len >= sizeof(tmpPath)) {
        LOG_ERROR("REG", "Registry path too long: %s", _path.c_str());
        return false;
    }

    int fd = open(tmpPath, O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        LOG_ERROR("REG", "Cannot create %s: %s", tmpPath, strerror(errno));
        return false;
    }

    bool ok = writeFully(fd, content.data(), content.size());
    if (ok && fsync(fd) != 0) {
        LOG_ERROR("REG", "fsync %s failed: %s", tmpPath, strerror(errno));
        ok = false;
    }
    if (close(fd) != 0 && ok) {
        LOG_ERROR("REG", "close %s failed: %s", tmpPath, strerror(errno));
        ok = false;
    }

    if (ok && rename(tmpPath, _path.c_str()) != 0) {
        LOG_ERROR("REG", "rename %s -> %s failed: %s",
                  tmpPath, _path.c_str(), strerror(errno));
        ok = false;
    }

    if (!ok) {
        if (unlink(tmpPath) != 0 && errno != ENOENT) {
            LOG_ERROR("REG", "Cannot remove %s: %s", tmpPath, strerror(errno));
        }
        return false;
    }

    syncParentDirectory();
    _saves++;
    LOG_DEBUG("REG", "Saved %d devices to %s (%zu bytes)",
              registry.count, _path.c_str(), content.size());
    error = Error::NONE;
    return true;
}

bool RegistryStore::writeFully(int fd, const char* data, size_t len) {
    size_t pos = 0;
    while (pos < len) {
        ssize_t n = write(fd, data + pos, len - pos);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("REG", "write failed: %s", strerror(errno));
            return false;
        }
        pos += (size_t)n;
    }
    return true;
}

void RegistryStore::syncParentDirectory() {
    std::string dir = ".";
    size_t slash = _path.find_last_of('/');
    if (slash == 0) {
        dir = "/";
    } else if (slash != std::string::npos) {
        dir = _path.substr(0, slash);
    }

    // The rename is already visible; this only makes it durable
    int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        LOG_DEBUG("REG", "Cannot open %s for sync: %s", dir.c_str(), strerror(errno));
        return;
    }
    if (fsync(fd) != 0) {
        LOG_DEBUG("REG", "fsync %s failed: %s", dir.c_str(), strerror(errno));
    }
    close(fd);
}

bool registerDevice(Registry& registry, RegistryStore& store,
                    const char* address, const char* identifier, const char* name,
                    DeviceRecord& record, bool& changed, Error& error) {
    changed = false;

    if (!makeDeviceRecord(identifier, address, name, record, error)) {
        LOG_ERROR("REG", "Cannot register %s @ %s: %s",
                  identifier ? identifier : "(null)", address ? address : "(null)",
                  errorToString(error));
        return false;
    }

    Registry next = registry;
    if (!addOrUpdate(next, record, changed, error)) return false;
    if (!changed) {
        LOG_INFO("REG", "%s already registered as '%s'", record.identifier, record.name);
        return true;
    }

    if (!store.save(next, error)) {
        changed = false;
        return false;
    }

    registry = next;
    return true;
}

} // namespace lifxctl

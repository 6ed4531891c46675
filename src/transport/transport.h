#pragma once
#include <cstdint>
#include <memory>
#include "../errors.h"
#include "../registry/validator.h"

namespace lifxctl {

// One scan response: no name, never persisted directly
struct DiscoveredDevice {
    char identifier[IDENTIFIER_LEN];
    char address[ADDRESS_LEN];
};

struct DeviceStatus {
    bool power;
    ColorSpec color;
    char label[33];   // label stored on the bulb, may be empty
};

// Live, connected reference to one device.
// Every control call blocks until the device acknowledges or the
// transport's timeout expires. On failure error is DEVICE_UNREACHABLE for
// a timeout and DEVICE_COMMAND_FAILED for a reply that rejects the command.
class DeviceHandle {
public:
    virtual ~DeviceHandle() {}

    // Identifier and address of the device that actually answered
    virtual const char* identifier() const = 0;
    virtual const char* address() const = 0;

    virtual bool setPower(bool on, Error& error) = 0;
    virtual bool setBrightness(uint16_t level, Error& error) = 0;
    virtual bool setColor(const ColorSpec& color, Error& error) = 0;
    virtual bool getStatus(DeviceStatus& status, Error& error) = 0;
};

// Network discovery and connection. Implementations own their timeouts and
// any retry policy; callers never retry.
class Transport {
public:
    virtual ~Transport() {}

    // Best-effort scan. Writes up to maxOutput responses in arrival order
    // and returns how many were written (0 when nothing answered).
    virtual int scan(unsigned long timeoutMs, DiscoveredDevice* output, int maxOutput) = 0;

    // Reach the device with this identifier at address.
    // Returns nullptr with DEVICE_UNREACHABLE if it does not answer.
    virtual std::unique_ptr<DeviceHandle> connect(const char* identifier, const char* address,
                                                  Error& error) = 0;
};

} // namespace lifxctl

#pragma once
#include <cstdint>
#include <memory>
#include "../config.h"
#include "transport.h"

namespace lifxctl {

// LIFX LAN transport over UDP/IPv4
class LifxTransport : public Transport {
public:
    // timeoutMs bounds every unicast request; port is the LIFX UDP port
    explicit LifxTransport(unsigned long timeoutMs = LIFX_REQUEST_TIMEOUT_MS,
                           uint16_t port = LIFX_PORT);

    int scan(unsigned long timeoutMs, DiscoveredDevice* output, int maxOutput) override;
    std::unique_ptr<DeviceHandle> connect(const char* identifier, const char* address,
                                          Error& error) override;

private:
    unsigned long _timeoutMs;
    uint16_t _port;
    uint32_t _source;
};

} // namespace lifxctl

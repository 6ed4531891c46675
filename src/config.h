#pragma once

// Defaults injected via build flags; the command line can override the
// registry path and the transport timeout at runtime.
#ifndef LIFXCTL_REGISTRY_PATH
#define LIFXCTL_REGISTRY_PATH     "lifx_config.json"
#endif
#ifndef LIFXCTL_REGISTRY_ENV
#define LIFXCTL_REGISTRY_ENV      "LIFXCTL_CONFIG"
#endif

// Tool identity
#define LIFXCTL_NAME              "lifxctl"
#define LIFXCTL_VERSION           "1.0.0"

// Registry limits
#ifndef LIFXCTL_MAX_DEVICES
#define LIFXCTL_MAX_DEVICES       64
#endif
#ifndef LIFXCTL_MAX_NAME_LEN
#define LIFXCTL_MAX_NAME_LEN      63
#endif

// LIFX LAN protocol
#define LIFX_PORT                 56700
#ifndef LIFX_DISCOVERY_TIMEOUT_MS
#define LIFX_DISCOVERY_TIMEOUT_MS 3000
#endif
#ifndef LIFX_REQUEST_TIMEOUT_MS
#define LIFX_REQUEST_TIMEOUT_MS   2000
#endif

// Supported colour temperature range (kelvin)
#define LIFX_KELVIN_MIN           2500
#define LIFX_KELVIN_MAX           9000

// Debug levels (compile-time)
#define DEBUG_LEVEL_NONE   0
#define DEBUG_LEVEL_ERROR  1
#define DEBUG_LEVEL_INFO   2
#define DEBUG_LEVEL_DEBUG  3
#define DEBUG_LEVEL_TRACE  4

#ifndef DEBUG_LEVEL
#define DEBUG_LEVEL        DEBUG_LEVEL_ERROR
#endif

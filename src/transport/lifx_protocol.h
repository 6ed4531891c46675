#pragma once
#include <cstddef>
#include <cstdint>
#include "transport.h"

namespace lifxctl {

// LIFX LAN frame: 36-byte header followed by a type-specific payload,
// all fields little-endian.
static const size_t LIFX_HEADER_SIZE   = 36;
static const uint16_t LIFX_PROTOCOL    = 1024;
static const size_t LIFX_MAX_FRAME     = 128;

// Message types
static const uint16_t LIFX_GET_SERVICE       = 2;
static const uint16_t LIFX_STATE_SERVICE     = 3;
static const uint16_t LIFX_ACKNOWLEDGEMENT   = 45;
static const uint16_t LIFX_LIGHT_GET         = 101;
static const uint16_t LIFX_LIGHT_SET_COLOR   = 102;
static const uint16_t LIFX_LIGHT_STATE       = 107;
static const uint16_t LIFX_LIGHT_SET_POWER   = 117;
static const uint16_t LIFX_LIGHT_STATE_POWER = 118;
static const uint16_t LIFX_STATE_UNHANDLED   = 223;

// StateService service code for the UDP control endpoint
static const uint8_t LIFX_SERVICE_UDP = 1;

// Payload sizes
static const size_t LIFX_SET_POWER_SIZE     = 6;   // level u16, duration u32
static const size_t LIFX_SET_COLOR_SIZE     = 13;  // reserved u8, HSBK, duration u32
static const size_t LIFX_STATE_SERVICE_SIZE = 5;   // service u8, port u32
static const size_t LIFX_LIGHT_STATE_SIZE   = 52;  // HSBK, reserved, power, label[32], reserved

struct LifxHeader {
    uint16_t size;          // total frame size including header
    bool tagged;            // true for broadcast to all devices
    uint32_t source;        // client id echoed back in replies
    uint8_t target[8];      // device MAC in first 6 bytes, zero for broadcast
    bool ackRequired;
    bool resRequired;
    uint8_t sequence;
    uint16_t type;
};

// --- Testable pure functions ---

// Fill a header for a request. target may be nullptr for a tagged
// (broadcast) frame.
void lifxInitHeader(LifxHeader& header, uint16_t type, uint32_t source,
                    const uint8_t* target, uint8_t sequence);

// Build a complete frame from header and payload. header.size is computed.
// Returns frame length, or -1 if output is too small.
int lifxBuildFrame(const LifxHeader& header, const uint8_t* payload, size_t payloadLen,
                   uint8_t* output, size_t outputLen);

// Parse and validate a received frame header (protocol number, size field
// consistent with frameLen). Sets payload/payloadLen to the bytes after
// the header.
bool lifxParseFrame(const uint8_t* frame, size_t frameLen, LifxHeader& header,
                    const uint8_t*& payload, size_t& payloadLen);

// Payload builders. Return payload length, or -1 if output is too small.
int lifxBuildSetPower(bool on, uint32_t durationMs, uint8_t* output, size_t outputLen);
int lifxBuildSetColor(const ColorSpec& color, uint32_t durationMs,
                      uint8_t* output, size_t outputLen);

// Payload parsers
bool lifxParseStateService(const uint8_t* payload, size_t len, uint8_t& service, uint32_t& port);
bool lifxParseLightState(const uint8_t* payload, size_t len, DeviceStatus& status);

// Convert between canonical identifier text and the 8-byte target field
// (MAC in the first 6 bytes, last 2 zero)
bool lifxIdentifierToTarget(const char* identifier, uint8_t* target);
void lifxTargetToIdentifier(const uint8_t* target, char* output, size_t outputLen);

} // namespace lifxctl

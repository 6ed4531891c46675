#include "lifx_protocol.h"
#include <cstdio>
#include <cstring>

namespace lifxctl {

static void putU16(uint8_t* p, uint16_t v) {
    p[0] = (uint8_t)(v & 0xFF);
    p[1] = (uint8_t)(v >> 8);
}

static void putU32(uint8_t* p, uint32_t v) {
    p[0] = (uint8_t)(v & 0xFF);
    p[1] = (uint8_t)((v >> 8) & 0xFF);
    p[2] = (uint8_t)((v >> 16) & 0xFF);
    p[3] = (uint8_t)(v >> 24);
}

static uint16_t getU16(const uint8_t* p) {
    return (uint16_t)(p[0] | (p[1] << 8));
}

static uint32_t getU32(const uint8_t* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) |
           ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void lifxInitHeader(LifxHeader& header, uint16_t type, uint32_t source,
                    const uint8_t* target, uint8_t sequence) {
    memset(&header, 0, sizeof(header));
    header.size = (uint16_t)LIFX_HEADER_SIZE;
    header.tagged = (target == nullptr);
    header.source = source;
    if (target != nullptr) {
        memcpy(header.target, target, sizeof(header.target));
    }
    header.sequence = sequence;
    header.type = type;
}

int lifxBuildFrame(const LifxHeader& header, const uint8_t* payload, size_t payloadLen,
                   uint8_t* output, size_t outputLen) {
    if (output == nullptr) return -1;
    if (payloadLen > 0 && payload == nullptr) return -1;

    size_t frameLen = LIFX_HEADER_SIZE + payloadLen;
    if (frameLen > outputLen || frameLen > 0xFFFF) return -1;

    memset(output, 0, LIFX_HEADER_SIZE);

    // Frame: size, protocol:12 | addressable:1 | tagged:1 | origin:2, source
    putU16(output, (uint16_t)frameLen);
    uint16_t flags = LIFX_PROTOCOL | (1 << 12);
    if (header.tagged) flags |= (1 << 13);
    putU16(output + 2, flags);
    putU32(output + 4, header.source);

    // Frame address: target[8], reserved[6], res_required:1 | ack_required:1, sequence
    memcpy(output + 8, header.target, 8);
    uint8_t addrFlags = 0;
    if (header.resRequired) addrFlags |= 0x01;
    if (header.ackRequired) addrFlags |= 0x02;
    output[22] = addrFlags;
    output[23] = header.sequence;

    // Protocol header: reserved u64, type u16, reserved u16
    putU16(output + 32, header.type);

    if (payloadLen > 0) {
        memcpy(output + LIFX_HEADER_SIZE, payload, payloadLen);
    }
    return (int)frameLen;
}

bool lifxParseFrame(const uint8_t* frame, size_t frameLen, LifxHeader& header,
                    const uint8_t*& payload, size_t& payloadLen) {
    if (frame == nullptr || frameLen < LIFX_HEADER_SIZE) return false;

    uint16_t size = getU16(frame);
    if (size < LIFX_HEADER_SIZE || size > frameLen) return false;

    uint16_t flags = getU16(frame + 2);
    if ((flags & 0x0FFF) != LIFX_PROTOCOL) return false;

    header.size = size;
    header.tagged = (flags & (1 << 13)) != 0;
    header.source = getU32(frame + 4);
    memcpy(header.target, frame + 8, 8);
    header.resRequired = (frame[22] & 0x01) != 0;
    header.ackRequired = (frame[22] & 0x02) != 0;
    header.sequence = frame[23];
    header.type = getU16(frame + 32);

    payload = frame + LIFX_HEADER_SIZE;
    payloadLen = size - LIFX_HEADER_SIZE;
    return true;
}

int lifxBuildSetPower(bool on, uint32_t durationMs, uint8_t* output, size_t outputLen) {
    if (output == nullptr || outputLen < LIFX_SET_POWER_SIZE) return -1;

    putU16(output, on ? 65535 : 0);
    putU32(output + 2, durationMs);
    return (int)LIFX_SET_POWER_SIZE;
}

int lifxBuildSetColor(const ColorSpec& color, uint32_t durationMs,
                      uint8_t* output, size_t outputLen) {
    if (output == nullptr || outputLen < LIFX_SET_COLOR_SIZE) return -1;

    output[0] = 0;
    putU16(output + 1, color.hue);
    putU16(output + 3, color.saturation);
    putU16(output + 5, color.brightness);
    putU16(output + 7, color.kelvin);
    putU32(output + 9, durationMs);
    return (int)LIFX_SET_COLOR_SIZE;
}

bool lifxParseStateService(const uint8_t* payload, size_t len, uint8_t& service, uint32_t& port) {
    if (payload == nullptr || len < LIFX_STATE_SERVICE_SIZE) return false;

    service = payload[0];
    port = getU32(payload + 1);
    return true;
}

bool lifxParseLightState(const uint8_t* payload, size_t len, DeviceStatus& status) {
    if (payload == nullptr || len < LIFX_LIGHT_STATE_SIZE) return false;

    status.color.hue = getU16(payload);
    status.color.saturation = getU16(payload + 2);
    status.color.brightness = getU16(payload + 4);
    status.color.kelvin = getU16(payload + 6);
    // payload[8..9] reserved
    status.power = getU16(payload + 10) != 0;

    // Label is a fixed 32-byte field, not always terminated
    memcpy(status.label, payload + 12, 32);
    status.label[32] = '\0';
    return true;
}

bool lifxIdentifierToTarget(const char* identifier, uint8_t* target) {
    if (identifier == nullptr || target == nullptr) return false;
    if (strlen(identifier) != IDENTIFIER_LEN - 1) return false;

    for (int i = 0; i < 6; i++) {
        int hi = hexValue(identifier[i * 3]);
        int lo = hexValue(identifier[i * 3 + 1]);
        if (hi < 0 || lo < 0) return false;
        if (i < 5 && identifier[i * 3 + 2] != ':') return false;
        target[i] = (uint8_t)((hi << 4) | lo);
    }
    target[6] = 0;
    target[7] = 0;
    return true;
}

void lifxTargetToIdentifier(const uint8_t* target, char* output, size_t outputLen) {
    snprintf(output, outputLen, "%02x:%02x:%02x:%02x:%02x:%02x",
             target[0], target[1], target[2], target[3], target[4], target[5]);
}

} // namespace lifxctl

#include "lifx_transport.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <netinet/in.h>
#include <poll.h>
#include <random>
#include <sys/socket.h>
#include <unistd.h>
#include "lifx_protocol.h"
#include "../debug_log.h"

namespace lifxctl {

// Broadcasts sent per scan, spread evenly over the scan timeout
static const int LIFX_SCAN_BROADCASTS = 3;

static unsigned long monotonicMs() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return (unsigned long)ts.tv_sec * 1000UL + (unsigned long)(ts.tv_nsec / 1000000);
}

// Milliseconds left before deadlineMs, 0 once it has passed
static unsigned long remainingMs(unsigned long nowMs, unsigned long deadlineMs) {
    return nowMs >= deadlineMs ? 0 : deadlineMs - nowMs;
}

namespace {

class UdpSocket {
public:
    UdpSocket() : _fd(-1) {}
    ~UdpSocket() { close(); }

    bool open(bool broadcast) {
        _fd = socket(AF_INET, SOCK_DGRAM, 0);
        if (_fd < 0) {
            LOG_ERROR("LIFX", "socket() failed: %s", strerror(errno));
            return false;
        }

        if (broadcast) {
            int enable = 1;
            if (setsockopt(_fd, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) < 0) {
                LOG_ERROR("LIFX", "SO_BROADCAST failed: %s", strerror(errno));
                close();
                return false;
            }
        }

        // Ephemeral local port; devices reply to the sender's port
        struct sockaddr_in local;
        memset(&local, 0, sizeof(local));
        local.sin_family = AF_INET;
        local.sin_port = 0;
        local.sin_addr.s_addr = htonl(INADDR_ANY);
        if (bind(_fd, (struct sockaddr*)&local, sizeof(local)) < 0) {
            LOG_ERROR("LIFX", "bind() failed: %s", strerror(errno));
            close();
            return false;
        }
        return true;
    }

    void close() {
        if (_fd >= 0) {
            ::close(_fd);
            _fd = -1;
        }
    }

    bool sendTo(in_addr_t address, uint16_t port, const uint8_t* data, size_t len) {
        struct sockaddr_in dest;
        memset(&dest, 0, sizeof(dest));
        dest.sin_family = AF_INET;
        dest.sin_port = htons(port);
        dest.sin_addr.s_addr = address;

        ssize_t sent = sendto(_fd, data, len, 0, (struct sockaddr*)&dest, sizeof(dest));
        if (sent < 0 || (size_t)sent != len) {
            LOG_ERROR("LIFX", "sendto failed: %s", strerror(errno));
            return false;
        }
        LOG_TRACE("LIFX", "TX %zu bytes", len);
        return true;
    }

    // Returns bytes received, 0 on timeout, -1 on socket error
    int receive(uint8_t* buf, size_t len, unsigned long timeoutMs, struct sockaddr_in& from) {
        struct pollfd pfd;
        pfd.fd = _fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, (int)timeoutMs);
        if (ready < 0) {
            if (errno == EINTR) return 0;
            LOG_ERROR("LIFX", "poll failed: %s", strerror(errno));
            return -1;
        }
        if (ready == 0) return 0;

        socklen_t fromLen = sizeof(from);
        ssize_t n = recvfrom(_fd, buf, len, 0, (struct sockaddr*)&from, &fromLen);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) return 0;
            LOG_ERROR("LIFX", "recvfrom failed: %s", strerror(errno));
            return -1;
        }
        LOG_TRACE("LIFX", "RX %zd bytes", n);
        return (int)n;
    }

private:
    int _fd;

    UdpSocket(const UdpSocket&);
    UdpSocket& operator=(const UdpSocket&);
};

class LifxHandle : public DeviceHandle {
public:
    LifxHandle(uint32_t source, unsigned long timeoutMs)
        : _source(source), _timeoutMs(timeoutMs), _address(0),
          _port(LIFX_PORT), _sequence(0), _scratchLen(0) {
        memset(_target, 0, sizeof(_target));
        memset(_replyTarget, 0, sizeof(_replyTarget));
        _identifier[0] = '\0';
        _addressText[0] = '\0';
    }

    // Open the socket and confirm a device with this target answers
    bool open(const uint8_t* target, in_addr_t address, uint16_t port, Error& error) {
        memcpy(_target, target, sizeof(_target));
        _address = address;
        _port = port;

        if (!_socket.open(false)) {
            error = Error::DEVICE_UNREACHABLE;
            return false;
        }

        uint8_t resp[LIFX_MAX_FRAME];
        size_t respLen = 0;
        struct sockaddr_in from;
        if (!request(LIFX_GET_SERVICE, nullptr, 0, false, LIFX_STATE_SERVICE,
                     resp, sizeof(resp), respLen, &from, error)) {
            return false;
        }

        uint8_t service = 0;
        uint32_t servicePort = 0;
        if (lifxParseStateService(resp, respLen, service, servicePort) &&
            service == LIFX_SERVICE_UDP && servicePort > 0 && servicePort <= 0xFFFF) {
            _port = (uint16_t)servicePort;
        }

        // Subsequent requests go to whichever address actually answered
        _address = from.sin_addr.s_addr;
        inet_ntop(AF_INET, &from.sin_addr, _addressText, sizeof(_addressText));
        lifxTargetToIdentifier(_replyTarget, _identifier, sizeof(_identifier));
        return true;
    }

    const char* identifier() const override { return _identifier; }
    const char* address() const override { return _addressText; }

    bool setPower(bool on, Error& error) override {
        uint8_t payload[LIFX_SET_POWER_SIZE];
        int len = lifxBuildSetPower(on, 0, payload, sizeof(payload));
        if (len < 0) {
            error = Error::DEVICE_COMMAND_FAILED;
            return false;
        }
        LOG_INFO("LIFX", "%s: power %s", _identifier, on ? "on" : "off");
        return request(LIFX_LIGHT_SET_POWER, payload, (size_t)len, true,
                       LIFX_ACKNOWLEDGEMENT, nullptr, 0, _scratchLen, nullptr, error);
    }

    bool setBrightness(uint16_t level, Error& error) override {
        // No brightness-only message: keep the current colour, change brightness
        DeviceStatus current;
        if (!getStatus(current, error)) return false;

        ColorSpec color = current.color;
        color.brightness = level;
        return setColor(color, error);
    }

    bool setColor(const ColorSpec& color, Error& error) override {
        uint8_t payload[LIFX_SET_COLOR_SIZE];
        int len = lifxBuildSetColor(color, 0, payload, sizeof(payload));
        if (len < 0) {
            error = Error::DEVICE_COMMAND_FAILED;
            return false;
        }
        LOG_INFO("LIFX", "%s: color h=%u s=%u b=%u k=%u", _identifier,
                 color.hue, color.saturation, color.brightness, color.kelvin);
        return request(LIFX_LIGHT_SET_COLOR, payload, (size_t)len, true,
                       LIFX_ACKNOWLEDGEMENT, nullptr, 0, _scratchLen, nullptr, error);
    }

    bool getStatus(DeviceStatus& status, Error& error) override {
        uint8_t resp[LIFX_MAX_FRAME];
        size_t respLen = 0;
        if (!request(LIFX_LIGHT_GET, nullptr, 0, false, LIFX_LIGHT_STATE,
                     resp, sizeof(resp), respLen, nullptr, error)) {
            return false;
        }
        if (!lifxParseLightState(resp, respLen, status)) {
            LOG_ERROR("LIFX", "%s: short State payload (%zu bytes)", _identifier, respLen);
            error = Error::DEVICE_COMMAND_FAILED;
            return false;
        }
        return true;
    }

private:
    UdpSocket _socket;
    uint32_t _source;
    unsigned long _timeoutMs;
    uint8_t _target[8];
    uint8_t _replyTarget[8];
    in_addr_t _address;
    uint16_t _port;
    uint8_t _sequence;
    size_t _scratchLen;
    char _identifier[IDENTIFIER_LEN];
    char _addressText[ADDRESS_LEN];

    // Send one request and wait for the matching reply of expectType.
    // Copies the reply payload to resp when resp is non-null.
    bool request(uint16_t type, const uint8_t* payload, size_t payloadLen,
                 bool ackRequired, uint16_t expectType,
                 uint8_t* resp, size_t respCap, size_t& respLen,
                 struct sockaddr_in* fromOut, Error& error) {
        uint8_t sequence = ++_sequence;

        LifxHeader header;
        lifxInitHeader(header, type, _source, _target, sequence);
        header.ackRequired = ackRequired;
        header.resRequired = !ackRequired;

        uint8_t frame[LIFX_MAX_FRAME];
        int frameLen = lifxBuildFrame(header, payload, payloadLen, frame, sizeof(frame));
        if (frameLen < 0) {
            error = Error::DEVICE_COMMAND_FAILED;
            return false;
        }

        if (!_socket.sendTo(_address, _port, frame, (size_t)frameLen)) {
            error = Error::DEVICE_UNREACHABLE;
            return false;
        }

        unsigned long deadline = monotonicMs() + _timeoutMs;
        uint8_t buf[LIFX_MAX_FRAME * 4];

        for (;;) {
            unsigned long wait = remainingMs(monotonicMs(), deadline);
            if (wait == 0) {
                LOG_ERROR("LIFX", "Timeout waiting for type %u (sent type %u, seq %u)",
                          expectType, type, sequence);
                error = Error::DEVICE_UNREACHABLE;
                return false;
            }

            struct sockaddr_in from;
            int n = _socket.receive(buf, sizeof(buf), wait, from);
            if (n < 0) {
                error = Error::DEVICE_UNREACHABLE;
                return false;
            }
            if (n == 0) continue;

            LifxHeader reply;
            const uint8_t* replyPayload = nullptr;
            size_t replyLen = 0;
            if (!lifxParseFrame(buf, (size_t)n, reply, replyPayload, replyLen)) {
                LOG_DEBUG("LIFX", "Ignoring malformed frame (%d bytes)", n);
                continue;
            }
            if (reply.source != _source || reply.sequence != sequence) continue;

            if (reply.type == LIFX_STATE_UNHANDLED) {
                LOG_ERROR("LIFX", "Device rejected message type %u", type);
                error = Error::DEVICE_COMMAND_FAILED;
                return false;
            }
            if (reply.type != expectType) continue;

            if (resp != nullptr) {
                respLen = replyLen < respCap ? replyLen : respCap;
                memcpy(resp, replyPayload, respLen);
            }
            memcpy(_replyTarget, reply.target, sizeof(_replyTarget));
            if (fromOut != nullptr) {
                *fromOut = from;
            }
            error = Error::NONE;
            return true;
        }
    }
};

} // namespace

LifxTransport::LifxTransport(unsigned long timeoutMs, uint16_t port)
    : _timeoutMs(timeoutMs), _port(port) {
    // Source 0 and 1 make devices broadcast their replies
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<uint32_t> dist(2, 0xFFFFFFFFu);
    _source = dist(gen);
}

int LifxTransport::scan(unsigned long timeoutMs, DiscoveredDevice* output, int maxOutput) {
    if (output == nullptr || maxOutput <= 0) return 0;

    UdpSocket sock;
    if (!sock.open(true)) return 0;

    LifxHeader header;
    lifxInitHeader(header, LIFX_GET_SERVICE, _source, nullptr, 0);
    header.resRequired = true;

    uint8_t frame[LIFX_MAX_FRAME];
    int frameLen = lifxBuildFrame(header, nullptr, 0, frame, sizeof(frame));
    if (frameLen < 0) return 0;

    in_addr_t broadcast = htonl(INADDR_BROADCAST);
    unsigned long start = monotonicMs();
    unsigned long deadline = start + timeoutMs;
    unsigned long interval = timeoutMs / LIFX_SCAN_BROADCASTS;
    unsigned long nextBroadcast = start;
    int sent = 0;
    int found = 0;

    LOG_INFO("LIFX", "Scanning for %lums on port %u", timeoutMs, _port);

    for (;;) {
        unsigned long now = monotonicMs();
        if (remainingMs(now, deadline) == 0) break;

        if (sent < LIFX_SCAN_BROADCASTS && now >= nextBroadcast) {
            if (!sock.sendTo(broadcast, _port, frame, (size_t)frameLen)) {
                LOG_ERROR("LIFX", "Broadcast %d of %d failed", sent + 1, LIFX_SCAN_BROADCASTS);
            }
            sent++;
            nextBroadcast = now + interval;
        }

        unsigned long wait = remainingMs(now, deadline);
        if (sent < LIFX_SCAN_BROADCASTS) {
            unsigned long untilNext = remainingMs(now, nextBroadcast);
            if (untilNext < wait) wait = untilNext;
        }
        if (wait == 0) continue;

        uint8_t buf[LIFX_MAX_FRAME * 4];
        struct sockaddr_in from;
        int n = sock.receive(buf, sizeof(buf), wait, from);
        if (n < 0) break;
        if (n == 0) continue;

        LifxHeader reply;
        const uint8_t* payload = nullptr;
        size_t payloadLen = 0;
        if (!lifxParseFrame(buf, (size_t)n, reply, payload, payloadLen)) continue;
        if (reply.source != _source || reply.type != LIFX_STATE_SERVICE) continue;

        uint8_t service = 0;
        uint32_t servicePort = 0;
        if (!lifxParseStateService(payload, payloadLen, service, servicePort)) continue;
        if (service != LIFX_SERVICE_UDP) continue;

        DiscoveredDevice device;
        lifxTargetToIdentifier(reply.target, device.identifier, sizeof(device.identifier));
        inet_ntop(AF_INET, &from.sin_addr, device.address, sizeof(device.address));

        bool duplicate = false;
        for (int i = 0; i < found; i++) {
            if (strcmp(output[i].identifier, device.identifier) == 0) {
                duplicate = true;
                break;
            }
        }
        if (duplicate) continue;

        LOG_INFO("LIFX", "Found %s at %s", device.identifier, device.address);
        output[found++] = device;
        if (found >= maxOutput) break;
    }

    LOG_INFO("LIFX", "Scan complete: %d device(s)", found);
    return found;
}

std::unique_ptr<DeviceHandle> LifxTransport::connect(const char* identifier, const char* address,
                                                     Error& error) {
    uint8_t target[8];
    if (!lifxIdentifierToTarget(identifier, target)) {
        error = Error::INVALID_IDENTIFIER;
        return std::unique_ptr<DeviceHandle>();
    }

    struct in_addr addr;
    if (address == nullptr || inet_pton(AF_INET, address, &addr) != 1) {
        error = Error::INVALID_ADDRESS;
        return std::unique_ptr<DeviceHandle>();
    }

    LOG_INFO("LIFX", "Connecting to %s at %s:%u", identifier, address, _port);

    std::unique_ptr<LifxHandle> handle(new LifxHandle(_source, _timeoutMs));
    if (!handle->open(target, addr.s_addr, _port, error)) {
        LOG_ERROR("LIFX", "%s did not answer at %s", identifier, address);
        error = Error::DEVICE_UNREACHABLE;
        return std::unique_ptr<DeviceHandle>();
    }

    error = Error::NONE;
    return std::unique_ptr<DeviceHandle>(handle.release());
}

} // namespace lifxctl

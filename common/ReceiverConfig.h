#ifndef RECEIVER_CONFIG_H
#define RECEIVER_CONFIG_H

#include <stdint.h>
#include "BeaconTypes.h"
#include "BeaconCodec.h"

static const uint32_t DEFAULT_SCAN_ON_MS             = 15000;
static const uint32_t DEFAULT_SCAN_OFF_MS            = 15000;
static const uint32_t DEFAULT_CONNECTION_TIMEOUT_MS  = 20000;

struct ReceiverConfig {
    DutyCycleConfig dutyCycle;
    uint32_t connectionTimeoutMs;
    uint64_t serviceId;
    uint16_t vendorId;
    uint64_t localBeaconCode;
    bool     localAdvertisesAsPeer;
};

inline ReceiverConfig defaultReceiverConfig() {
    ReceiverConfig c;
    c.dutyCycle.onDurationMs  = DEFAULT_SCAN_ON_MS;
    c.dutyCycle.offDurationMs = DEFAULT_SCAN_OFF_MS;
    c.connectionTimeoutMs     = DEFAULT_CONNECTION_TIMEOUT_MS;
    c.serviceId               = PROXIBEACON_SERVICE_ID;
    c.vendorId                = PROXIBEACON_VENDOR_ID;
    c.localBeaconCode         = 0;
    c.localAdvertisesAsPeer   = false;
    return c;
}

inline DutyCycleConfig makeDutyCycle(uint32_t onMs, uint32_t offMs) {
    DutyCycleConfig d;
    d.onDurationMs  = onMs  < MIN_PHASE_MS ? MIN_PHASE_MS : onMs;
    d.offDurationMs = offMs < MIN_PHASE_MS ? MIN_PHASE_MS : offMs;
    return d;
}

// Scan duty for the current performance mode and telemetry client state.
// A connected phone shares radio time with the scanner, so scanning backs off.
inline DutyCycleConfig dutyCycleForMode(bool highPerformance, bool clientConnected) {
    if (highPerformance && !clientConnected) {
        // Full performance, no BLE client -- maximum scan duty
        return makeDutyCycle(20000, 5000);
    } else if (highPerformance && clientConnected) {
        return makeDutyCycle(15000, 10000);
    } else if (!highPerformance && !clientConnected) {
        return makeDutyCycle(DEFAULT_SCAN_ON_MS, DEFAULT_SCAN_OFF_MS);
    }
    // Battery mode + BLE client -- conservative
    return makeDutyCycle(10000, 20000);
}

#endif

#ifndef BEACON_TYPES_H
#define BEACON_TYPES_H

#include <Arduino.h>
#include <stdint.h>
#include <string.h>

// 128-bit UUID split the way the detection protocol reads it:
// msb = bits 64..127 (service id), lsb = bits 0..63 (beacon code).
struct Uuid128 {
    uint64_t msb;
    uint64_t lsb;
};

inline bool operator==(const Uuid128& a, const Uuid128& b) {
    return a.msb == b.msb && a.lsb == b.lsb;
}

inline bool operator!=(const Uuid128& a, const Uuid128& b) {
    return !(a == b);
}

// Error codes carried by startFailed(code) and returned by the scanner.
enum BeaconError : int {
    BEACON_OK                       = 0,
    BEACON_ERR_RADIO_UNAVAILABLE    = 1,
    BEACON_ERR_SCAN_ALREADY_STARTED = 2,
    BEACON_ERR_SCAN_FAILED          = 3,
    BEACON_ERR_SCAN_REGISTRATION    = 4,
    BEACON_ERR_SCAN_UNSUPPORTED     = 5,
    BEACON_ERR_CONNECTION           = 6,
};

inline const char* beaconErrorName(int code) {
    switch (code) {
        case BEACON_OK:                       return "OK";
        case BEACON_ERR_RADIO_UNAVAILABLE:    return "RADIO_UNAVAILABLE";
        case BEACON_ERR_SCAN_ALREADY_STARTED: return "SCAN_ALREADY_STARTED";
        case BEACON_ERR_SCAN_FAILED:          return "SCAN_FAILED";
        case BEACON_ERR_SCAN_REGISTRATION:    return "SCAN_REGISTRATION_FAILED";
        case BEACON_ERR_SCAN_UNSUPPORTED:     return "SCAN_UNSUPPORTED";
        case BEACON_ERR_CONNECTION:           return "CONNECTION_ERROR";
        default:                              return "UNKNOWN_ERROR";
    }
}

// Constants
static const uint8_t  MAX_ADV_SERVICE_IDS    = 4;
static const uint16_t MAX_QUEUED_SIGHTINGS   = 128;
static const uint32_t MIN_PHASE_MS           = 1;

// Raw radio observation. Fixed size so the radio task can copy it without
// touching the heap.
struct Sighting {
    uint8_t  mac[6];
    uint8_t  addressType;
    int8_t   rssi;
    Uuid128  serviceIds[MAX_ADV_SERVICE_IDS];
    uint8_t  serviceIdCount;
    bool     hasManufacturerMarker;
    uint32_t observedAtMs;
};

// Peer handle equality: address plus address type.
inline bool samePeer(const Sighting& a, const Sighting& b) {
    return a.addressType == b.addressType && memcmp(a.mac, b.mac, 6) == 0;
}

// Ordered by resolution priority; lower value is attempted first.
enum class SightingCategory : uint8_t {
    NATIVE_PEER       = 0,  // unmarked, advertises the detection service
    MARKED_FOREGROUND = 1,  // vendor marker, still advertises the service
    MARKED_BACKGROUND = 2,  // vendor marker, service masked
};

inline const char* sightingCategoryName(SightingCategory category) {
    switch (category) {
        case SightingCategory::NATIVE_PEER:       return "native";
        case SightingCategory::MARKED_FOREGROUND: return "marked_foreground";
        case SightingCategory::MARKED_BACKGROUND: return "marked_background";
    }
    return "unknown";
}

struct ClassifiedSighting {
    SightingCategory category;
    Sighting         sighting;
};

struct DetectionEvent {
    uint32_t observedAtMs;
    uint64_t peerBeaconCode;
    int8_t   rssi;
};

struct DutyCycleConfig {
    uint32_t onDurationMs;
    uint32_t offDurationMs;
};

#endif

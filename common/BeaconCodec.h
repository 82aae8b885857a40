#ifndef BEACON_CODEC_H
#define BEACON_CODEC_H

#include "BeaconTypes.h"
#include <string.h>

// ============================================================
// Protocol constants
// ============================================================

// Upper 64 bits of the detection service UUID. Characteristic UUIDs carry
// the same upper half; their lower half is the owner's beacon code.
static const uint64_t PROXIBEACON_SERVICE_ID = 0x7fa3c2d9e6b0418aULL;

// Bluetooth SIG company identifier matched by the vendor-data filter.
static const uint16_t PROXIBEACON_VENDOR_ID = 0x004C;

// Identity report written to a peer that cannot discover this device:
// [0..7] local beacon code (LE, unsigned), [8..11] observed RSSI (LE, signed).
static const size_t IDENTITY_PAYLOAD_LEN = 12;

// ============================================================
// UUID helpers
// ============================================================

inline Uuid128 makeCharacteristicUuid(uint64_t serviceId, uint64_t beaconCode) {
    Uuid128 u = { serviceId, beaconCode };
    return u;
}

inline bool uuidMatchesService(const Uuid128& uuid, uint64_t serviceId) {
    return uuid.msb == serviceId;
}

// NimBLE and the BLE spec store 128-bit UUIDs little-endian:
// byte 0 is the least significant byte of the lsb half.
inline Uuid128 uuidFromLittleEndian(const uint8_t* bytes) {
    Uuid128 u = { 0, 0 };
    for (int8_t i = 7; i >= 0; i--) {
        u.lsb = (u.lsb << 8) | bytes[i];
        u.msb = (u.msb << 8) | bytes[i + 8];
    }
    return u;
}

inline void uuidToLittleEndian(const Uuid128& uuid, uint8_t* bytes) {
    for (uint8_t i = 0; i < 8; i++) {
        bytes[i]     = (uint8_t)(uuid.lsb >> (8 * i));
        bytes[i + 8] = (uint8_t)(uuid.msb >> (8 * i));
    }
}

// Canonical 8-4-4-4-12 text form, lower case. buf must hold 37 bytes.
inline void formatUuid(const Uuid128& uuid, char* buf, size_t bufSize) {
    snprintf(buf, bufSize, "%08x-%04x-%04x-%04x-%012llx",
             (unsigned)(uuid.msb >> 32),
             (unsigned)((uuid.msb >> 16) & 0xFFFF),
             (unsigned)(uuid.msb & 0xFFFF),
             (unsigned)(uuid.lsb >> 48),
             (unsigned long long)(uuid.lsb & 0xFFFFFFFFFFFFULL));
}

// aa:bb:cc:dd:ee:ff. buf must hold 18 bytes.
inline void formatMac(const uint8_t* mac, char* buf, size_t bufSize) {
    snprintf(buf, bufSize, "%02x:%02x:%02x:%02x:%02x:%02x",
             mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
}

// 16 lower-case hex digits. buf must hold 17 bytes.
inline void formatBeaconCode(uint64_t code, char* buf, size_t bufSize) {
    snprintf(buf, bufSize, "%016llx", (unsigned long long)code);
}

inline bool parseBeaconCode(const char* text, uint64_t& out) {
    if (text == nullptr) return false;
    size_t len = strlen(text);
    if (len == 0 || len > 16) return false;
    uint64_t value = 0;
    for (size_t i = 0; i < len; i++) {
        char c = text[i];
        uint8_t nibble;
        if (c >= '0' && c <= '9')      nibble = c - '0';
        else if (c >= 'a' && c <= 'f') nibble = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') nibble = c - 'A' + 10;
        else return false;
        value = (value << 4) | nibble;
    }
    out = value;
    return true;
}

// ============================================================
// Advertisement filters
// ============================================================

// Vendor filter: company id match, zero-length data and mask, so any
// payload from that vendor passes.
inline bool vendorFilterMatches(const uint8_t* manufacturerData, size_t len,
                                uint16_t vendorId) {
    if (manufacturerData == nullptr || len < 2) return false;
    uint16_t company = (uint16_t)manufacturerData[0] |
                       ((uint16_t)manufacturerData[1] << 8);
    return company == vendorId;
}

// Service filter: upper 64 bits fixed, lower 64 bits wildcarded.
inline bool serviceFilterMatches(const Uuid128& uuid, uint64_t serviceId) {
    return uuidMatchesService(uuid, serviceId);
}

inline bool sightingAdvertisesService(const Sighting& s, uint64_t serviceId) {
    for (uint8_t i = 0; i < s.serviceIdCount && i < MAX_ADV_SERVICE_IDS; i++) {
        if (uuidMatchesService(s.serviceIds[i], serviceId)) return true;
    }
    return false;
}

// A sighting is worth queuing if either filter accepted it.
inline bool sightingPassesFilters(const Sighting& s, uint64_t serviceId) {
    return s.hasManufacturerMarker || sightingAdvertisesService(s, serviceId);
}

// ============================================================
// Identity payload
// ============================================================

inline void encodeIdentityPayload(uint64_t localBeaconCode, int32_t rssi,
                                  uint8_t* out) {
    for (uint8_t i = 0; i < 8; i++) {
        out[i] = (uint8_t)(localBeaconCode >> (8 * i));
    }
    uint32_t r = (uint32_t)rssi;
    for (uint8_t i = 0; i < 4; i++) {
        out[8 + i] = (uint8_t)(r >> (8 * i));
    }
}

inline bool decodeIdentityPayload(const uint8_t* data, size_t len,
                                  uint64_t& beaconCode, int32_t& rssi) {
    if (data == nullptr || len != IDENTITY_PAYLOAD_LEN) return false;
    uint64_t code = 0;
    for (int8_t i = 7; i >= 0; i--) code = (code << 8) | data[i];
    uint32_t r = 0;
    for (int8_t i = 3; i >= 0; i--) r = (r << 8) | data[8 + i];
    beaconCode = code;
    rssi = (int32_t)r;
    return true;
}

#endif

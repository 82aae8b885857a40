#include "doctest.h"
#include "BeaconCodec.h"

// ============================================================
// UUID layout
// ============================================================

TEST_CASE("BeaconCodec: characteristic UUID carries service id and code") {
    Uuid128 u = makeCharacteristicUuid(PROXIBEACON_SERVICE_ID, 0x0123456789abcdefULL);
    CHECK(u.msb == PROXIBEACON_SERVICE_ID);
    CHECK(u.lsb == 0x0123456789abcdefULL);
    CHECK(uuidMatchesService(u, PROXIBEACON_SERVICE_ID));
    CHECK_FALSE(uuidMatchesService(u, 0x1ULL));
}

TEST_CASE("BeaconCodec: little-endian bytes map lsb first") {
    uint8_t bytes[16];
    for (uint8_t i = 0; i < 16; i++) bytes[i] = i;
    Uuid128 u = uuidFromLittleEndian(bytes);
    CHECK(u.lsb == 0x0706050403020100ULL);
    CHECK(u.msb == 0x0f0e0d0c0b0a0908ULL);

    uint8_t back[16];
    uuidToLittleEndian(u, back);
    CHECK(memcmp(bytes, back, 16) == 0);
}

TEST_CASE("BeaconCodec: formatUuid prints canonical text") {
    Uuid128 u = { 0x7fa3c2d9e6b0418aULL, 0x0000000000000042ULL };
    char buf[37];
    formatUuid(u, buf, sizeof(buf));
    CHECK(strcmp(buf, "7fa3c2d9-e6b0-418a-0000-000000000042") == 0);
}

// ============================================================
// Text helpers
// ============================================================

TEST_CASE("BeaconCodec: formatMac and formatBeaconCode") {
    uint8_t mac[6] = { 0xAA, 0xBB, 0x01, 0x02, 0x0C, 0xFF };
    char macStr[18];
    formatMac(mac, macStr, sizeof(macStr));
    CHECK(strcmp(macStr, "aa:bb:01:02:0c:ff") == 0);

    char codeStr[17];
    formatBeaconCode(0xABCULL, codeStr, sizeof(codeStr));
    CHECK(strcmp(codeStr, "0000000000000abc") == 0);
}

TEST_CASE("BeaconCodec: parseBeaconCode accepts 1-16 hex digits") {
    uint64_t code = 0;
    CHECK(parseBeaconCode("ff", code));
    CHECK(code == 0xFF);
    CHECK(parseBeaconCode("FEDCBA9876543210", code));
    CHECK(code == 0xFEDCBA9876543210ULL);

    code = 7;
    CHECK_FALSE(parseBeaconCode("", code));
    CHECK_FALSE(parseBeaconCode("12345678901234567", code));
    CHECK_FALSE(parseBeaconCode("12g4", code));
    CHECK_FALSE(parseBeaconCode(nullptr, code));
    CHECK(code == 7);
}

// ============================================================
// Advertisement filters
// ============================================================

TEST_CASE("BeaconCodec: vendor filter matches company id with any payload") {
    const uint8_t apple[] = { 0x4C, 0x00, 0x01, 0x02, 0x03 };
    const uint8_t appleBare[] = { 0x4C, 0x00 };
    const uint8_t other[] = { 0x06, 0x00, 0x01 };
    CHECK(vendorFilterMatches(apple, sizeof(apple), PROXIBEACON_VENDOR_ID));
    CHECK(vendorFilterMatches(appleBare, sizeof(appleBare), PROXIBEACON_VENDOR_ID));
    CHECK_FALSE(vendorFilterMatches(other, sizeof(other), PROXIBEACON_VENDOR_ID));
    CHECK_FALSE(vendorFilterMatches(apple, 1, PROXIBEACON_VENDOR_ID));
    CHECK_FALSE(vendorFilterMatches(nullptr, 0, PROXIBEACON_VENDOR_ID));
}

TEST_CASE("BeaconCodec: service filter wildcards the lower half") {
    Sighting s;
    memset(&s, 0, sizeof(s));
    CHECK_FALSE(sightingPassesFilters(s, PROXIBEACON_SERVICE_ID));

    s.serviceIds[0] = makeCharacteristicUuid(0x1234ULL, 0);
    s.serviceIds[1] = makeCharacteristicUuid(PROXIBEACON_SERVICE_ID, 0xDEADULL);
    s.serviceIdCount = 2;
    CHECK(sightingAdvertisesService(s, PROXIBEACON_SERVICE_ID));
    CHECK(sightingPassesFilters(s, PROXIBEACON_SERVICE_ID));

    s.serviceIdCount = 1;
    CHECK_FALSE(sightingAdvertisesService(s, PROXIBEACON_SERVICE_ID));

    s.hasManufacturerMarker = true;
    CHECK(sightingPassesFilters(s, PROXIBEACON_SERVICE_ID));
}

// ============================================================
// Identity payload
// ============================================================

TEST_CASE("BeaconCodec: identity payload is code then signed rssi, little-endian") {
    uint8_t out[IDENTITY_PAYLOAD_LEN];
    encodeIdentityPayload(0x0102030405060708ULL, -60, out);

    const uint8_t expected[IDENTITY_PAYLOAD_LEN] = {
        0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01,
        0xC4, 0xFF, 0xFF, 0xFF,
    };
    CHECK(memcmp(out, expected, sizeof(expected)) == 0);

    uint64_t code = 0;
    int32_t rssi = 0;
    CHECK(decodeIdentityPayload(out, sizeof(out), code, rssi));
    CHECK(code == 0x0102030405060708ULL);
    CHECK(rssi == -60);
}

TEST_CASE("BeaconCodec: identity payload of the wrong length is rejected") {
    uint8_t out[IDENTITY_PAYLOAD_LEN] = {0};
    uint64_t code = 1;
    int32_t rssi = 1;
    CHECK_FALSE(decodeIdentityPayload(out, 11, code, rssi));
    CHECK_FALSE(decodeIdentityPayload(out, 13, code, rssi));
    CHECK(code == 1);
    CHECK(rssi == 1);
}

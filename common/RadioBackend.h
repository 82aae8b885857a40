#ifndef RADIO_BACKEND_H
#define RADIO_BACKEND_H

#include <memory>
#include <vector>
#include "BeaconTypes.h"

// Radio seam between the portable receiver and a concrete BLE stack.
// The NimBLE implementation lives in the board sketch; host tests use a fake.

typedef uint32_t ScanHandle;
static const ScanHandle NO_SCAN_HANDLE = 0;

// Advertisement filter set handed to the backend at scan start.
struct ScanFilterSet {
    uint16_t vendorId;    // vendor-data filter, empty data and mask
    uint64_t serviceId;   // service filter on the upper 64 bits, lower wildcarded
};

/// Receives filtered advertisements. Called on the radio task.
class ScanSink {
public:
    virtual ~ScanSink() {}
    virtual void onSighting(const Sighting& sighting) = 0;
    virtual void onScanFailed(int errorCode) = 0;
};

class GattLink;

/// GATT client callbacks for one connection. Called on the radio task, or
/// synchronously from inside a GattLink call. Never called after the link's
/// close() has returned.
class GattLinkCallbacks {
public:
    virtual ~GattLinkCallbacks() {}
    virtual void onConnected(GattLink& link) = 0;
    // status 0 = success. characteristics lists every discovered
    // characteristic UUID across all services.
    virtual void onServicesDiscovered(GattLink& link, int status,
                                      const std::vector<Uuid128>& characteristics) = 0;
    virtual void onCharacteristicWritten(GattLink& link, int status) = 0;
    // Either side dropped the connection, or the connect attempt failed.
    virtual void onDisconnected(GattLink& link, int status) = 0;
};

/// One GATT client connection. Operations are asynchronous; results arrive
/// through GattLinkCallbacks.
class GattLink {
public:
    virtual ~GattLink() {}
    virtual bool discoverServices() = 0;
    virtual bool writeCharacteristic(const Uuid128& characteristic,
                                     const uint8_t* data, size_t len) = 0;
    virtual void disconnect() = 0;
    // Releases the connection. Callbacks stop before this returns.
    virtual void close() = 0;
};

class RadioBackend {
public:
    virtual ~RadioBackend() {}

    // Hardware present and able to scan.
    virtual bool isPresent() const = 0;
    // Radio powered on.
    virtual bool isEnabled() const = 0;

    // Starts a filtered scan delivering to sink. Returns BEACON_OK or a
    // BeaconError code.
    virtual int startScan(const ScanFilterSet& filters, ScanSink* sink) = 0;
    // Returns BEACON_OK or a BeaconError code.
    virtual int stopScan() = 0;
    virtual void cancelDiscovery() = 0;

    // Starts connecting to the peer. Returns nullptr when the attempt cannot
    // even be started.
    virtual std::shared_ptr<GattLink> connect(const Sighting& peer,
                                              GattLinkCallbacks* callbacks) = 0;
};

#endif

#ifndef NIMBLE_TELEMETRY_SINK_H
#define NIMBLE_TELEMETRY_SINK_H

#include <Arduino.h>
#include <atomic>
#include <functional>
#include "TelemetrySink.h"
#include "NimBleRadio.h"

/// TelemetrySink that notifies a companion app over a NimBLE GATT server.
/// Call begin() once after NimBLEDevice::init(). Lines go to every
/// subscribed client; with no client connected sendLine() is a no-op.
class NimBleTelemetrySink : public TelemetrySink {
public:
    /// Fires on the NimBLE host task when the first client connects (true)
    /// or the last one leaves (false).
    typedef std::function<void(bool connected)> PresenceHandler;

    void setPresenceHandler(PresenceHandler handler) { _presence = handler; }

    bool begin();

    bool isClientConnected() const override { return _clients.load() > 0; }
    void sendLine(const char* data, size_t len) override;

    uint8_t clientCount() const { return _clients.load(); }

private:
    std::atomic<uint8_t> _clients{0};
    std::atomic<uint16_t> _mtu{23};
    PresenceHandler _presence;

#if PROXIBEACON_BLE_SUPPORTED
    NimBLECharacteristic* _notifyChar = nullptr;

    class ServerHooks;
    ServerHooks* _hooks = nullptr;
    friend class ServerHooks;
#endif
};

#endif

#include "NimBleTelemetrySink.h"
#include "NotifyFraming.h"

#if PROXIBEACON_BLE_SUPPORTED

// Kept outside the detection service id space so peers never take this
// server for a beacon.
static const char* TELEMETRY_SERVICE_UUID = "5c0a7e10-3b1d-4f8e-9a21-6d2c4b8e0f01";
static const char* TELEMETRY_NOTIFY_UUID  = "5c0a7e10-3b1d-4f8e-9a21-6d2c4b8e0f02";

class NimBleTelemetrySink::ServerHooks : public NimBLEServerCallbacks {
public:
    explicit ServerHooks(NimBleTelemetrySink& owner) : _owner(owner) {}

    void onConnect(NimBLEServer* server, NimBLEConnInfo& connInfo) override {
        uint8_t clients = ++_owner._clients;
        Serial.printf("[TLM] Client %u connected (%u total)\n",
                      connInfo.getConnHandle(), clients);
        if (clients == 1 && _owner._presence) _owner._presence(true);
        // Keep advertising so a second app can attach.
        NimBLEDevice::getAdvertising()->start();
    }

    void onDisconnect(NimBLEServer* server, NimBLEConnInfo& connInfo, int reason) override {
        uint8_t clients = _owner._clients.load();
        if (clients > 0) clients = --_owner._clients;
        if (clients == 0) _owner._mtu = ATT_DEFAULT_MTU;
        Serial.printf("[TLM] Client %u left (reason=%d, %u remaining)\n",
                      connInfo.getConnHandle(), reason, clients);
        if (clients == 0 && _owner._presence) _owner._presence(false);
        NimBLEDevice::getAdvertising()->start();
    }

    void onMTUChange(uint16_t mtu, NimBLEConnInfo& connInfo) override {
        // Frames go to every client, so the smallest MTU wins.
        uint16_t current = _owner._mtu.load();
        if (current == ATT_DEFAULT_MTU || mtu < current) _owner._mtu = mtu;
    }

private:
    NimBleTelemetrySink& _owner;
};

bool NimBleTelemetrySink::begin() {
    if (!NimBLEDevice::isInitialized()) {
        Serial.println("[TLM] NimBLE not initialized, telemetry link disabled");
        return false;
    }
    NimBLEDevice::setMTU(247);

    NimBLEServer* server = NimBLEDevice::createServer();
    _hooks = new ServerHooks(*this);
    server->setCallbacks(_hooks, false);

    NimBLEService* service = server->createService(TELEMETRY_SERVICE_UUID);
    _notifyChar = service->createCharacteristic(TELEMETRY_NOTIFY_UUID,
                                                NIMBLE_PROPERTY::NOTIFY);
    if (_notifyChar == nullptr || !service->start()) {
        Serial.println("[TLM] Telemetry service setup failed");
        _notifyChar = nullptr;
        return false;
    }

    NimBLEAdvertising* advertising = NimBLEDevice::getAdvertising();
    advertising->addServiceUUID(service->getUUID());
    advertising->enableScanResponse(true);
    if (!advertising->start()) {
        Serial.println("[TLM] Advertising did not start");
        return false;
    }
    Serial.println("[TLM] Telemetry link advertising");
    return true;
}

void NimBleTelemetrySink::sendLine(const char* data, size_t len) {
    NimBLECharacteristic* chr = _notifyChar;
    if (chr == nullptr || !isClientConnected()) return;
    sendFramed(data, len, _mtu.load(), [chr](const uint8_t* frame, size_t n) {
        chr->setValue(frame, n);
        return chr->notify();
    });
}

#else  // !PROXIBEACON_BLE_SUPPORTED

bool NimBleTelemetrySink::begin() {
    Serial.println("[TLM] No Bluetooth controller, telemetry link disabled");
    return false;
}

void NimBleTelemetrySink::sendLine(const char* data, size_t len) {}

#endif

#include "NimBleRadio.h"
#include "BeaconCodec.h"

#if PROXIBEACON_BLE_SUPPORTED

namespace {

void copyMac(const NimBLEAddress& addr, uint8_t* mac) {
    std::string addrStr = addr.toString();
    sscanf(addrStr.c_str(), "%02hhx:%02hhx:%02hhx:%02hhx:%02hhx:%02hhx",
           &mac[0], &mac[1], &mac[2], &mac[3], &mac[4], &mac[5]);
}

NimBLEAddress toAddress(const Sighting& peer) {
    char macStr[18];
    formatMac(peer.mac, macStr, sizeof(macStr));
    return NimBLEAddress(std::string(macStr), peer.addressType);
}

Uuid128 toUuid128(const NimBLEUUID& uuid) {
    NimBLEUUID full = uuid;
    full.to128();
    return uuidFromLittleEndian(full.getValue());
}

NimBLEUUID toNimUuid(const Uuid128& uuid) {
    uint8_t bytes[16];
    uuidToLittleEndian(uuid, bytes);
    return NimBLEUUID(bytes, sizeof(bytes));
}

// ============================================================
// GATT link
// One task per connection. Commands from the exchange are queued and run
// there, because NimBLE client calls block until the peer answers.
// ============================================================

enum LinkCommand : uint8_t {
    LINK_CMD_DISCOVER = 1,
    LINK_CMD_WRITE    = 2,
    LINK_CMD_CLOSE    = 3,
};

static const uint8_t  LINK_QUEUE_DEPTH   = 4;
static const uint32_t LINK_TASK_STACK    = 4096;
static const uint8_t  MAX_WRITE_LEN      = 20;

class NimBleGattLink : public GattLink, public NimBLEClientCallbacks {
public:
    NimBleGattLink(const Sighting& peer, GattLinkCallbacks* callbacks)
        : _address(toAddress(peer)),
          _callbacks(callbacks),
          _queue(xQueueCreate(LINK_QUEUE_DEPTH, sizeof(uint8_t))),
          _closing(false),
          _writeLen(0) {}

    ~NimBleGattLink() {
        if (_queue) vQueueDelete(_queue);
    }

    // Spawns the connection task. The task keeps the link alive until it
    // has deleted its NimBLE client.
    static std::shared_ptr<NimBleGattLink> open(const Sighting& peer,
                                                GattLinkCallbacks* callbacks) {
        std::shared_ptr<NimBleGattLink> link(new NimBleGattLink(peer, callbacks));
        if (link->_queue == nullptr) {
            Serial.println("[GATT] Link queue allocation failed");
            return nullptr;
        }
        std::shared_ptr<NimBleGattLink>* holder = new std::shared_ptr<NimBleGattLink>(link);
        if (xTaskCreate(taskEntry, "gatt_link", LINK_TASK_STACK, holder, 1, nullptr) != pdPASS) {
            Serial.println("[GATT] Link task creation failed");
            delete holder;
            return nullptr;
        }
        return link;
    }

    // -- GattLink --

    bool discoverServices() override {
        return post(LINK_CMD_DISCOVER);
    }

    bool writeCharacteristic(const Uuid128& characteristic,
                             const uint8_t* data, size_t len) override {
        if (len > MAX_WRITE_LEN) return false;
        {
            std::lock_guard<std::mutex> lock(_clientMutex);
            _writeUuid = characteristic;
            memcpy(_writeData, data, len);
            _writeLen = len;
        }
        return post(LINK_CMD_WRITE);
    }

    void disconnect() override {
        std::lock_guard<std::mutex> lock(_clientMutex);
        if (_client && _client->isConnected()) _client->disconnect();
    }

    void close() override {
        {
            // Waits for a callback in flight on another task, then silences
            // the rest.
            std::lock_guard<std::recursive_mutex> lock(_callbackMutex);
            _callbacks = nullptr;
        }
        if (_closing.exchange(true)) return;
        disconnect();
        post(LINK_CMD_CLOSE);
    }

    // -- NimBLEClientCallbacks --

    void onDisconnect(NimBLEClient* client, int reason) override {
        std::lock_guard<std::recursive_mutex> lock(_callbackMutex);
        if (_callbacks) _callbacks->onDisconnected(*this, reason);
    }

private:
    NimBLEAddress _address;
    NimBLEClient* _client = nullptr;
    std::mutex _clientMutex;
    std::recursive_mutex _callbackMutex;
    GattLinkCallbacks* _callbacks;
    QueueHandle_t _queue;
    std::atomic<bool> _closing;
    Uuid128 _writeUuid;
    uint8_t _writeData[MAX_WRITE_LEN];
    size_t _writeLen;

    static void taskEntry(void* arg) {
        std::shared_ptr<NimBleGattLink>* holder =
            static_cast<std::shared_ptr<NimBleGattLink>*>(arg);
        std::shared_ptr<NimBleGattLink> self = *holder;
        delete holder;
        self->run();
        self.reset();
        vTaskDelete(nullptr);
    }

    bool post(uint8_t cmd) {
        return xQueueSend(_queue, &cmd, 0) == pdTRUE;
    }

    void run() {
        NimBLEClient* client = NimBLEDevice::createClient();
        if (client == nullptr) {
            Serial.println("[GATT] No free client slot");
            notifyDisconnected(-1);
            return;
        }
        client->setClientCallbacks(this, false);
        client->setConnectTimeout(NimBleRadio::CONNECT_TIMEOUT_MS);
        {
            std::lock_guard<std::mutex> lock(_clientMutex);
            _client = client;
        }

        if (_closing.load() || !client->connect(_address, true, false, false)) {
            notifyDisconnected(client->getLastError());
        } else {
            notifyConnected();
            uint8_t cmd = 0;
            while (!_closing.load()) {
                if (xQueueReceive(_queue, &cmd, portMAX_DELAY) != pdTRUE) continue;
                if (cmd == LINK_CMD_CLOSE) break;
                if (cmd == LINK_CMD_DISCOVER) runDiscovery(client);
                if (cmd == LINK_CMD_WRITE) runWrite(client);
            }
        }

        std::lock_guard<std::mutex> lock(_clientMutex);
        if (client->isConnected()) client->disconnect();
        NimBLEDevice::deleteClient(client);
        _client = nullptr;
    }

    void runDiscovery(NimBLEClient* client) {
        std::vector<Uuid128> found;
        int status = 0;
        if (!client->discoverAttributes()) {
            status = client->getLastError();
            if (status == 0) status = -1;
        } else {
            const std::vector<NimBLERemoteService*>& services = client->getServices(false);
            for (size_t i = 0; i < services.size(); i++) {
                const std::vector<NimBLERemoteCharacteristic*>& chars =
                    services[i]->getCharacteristics(false);
                for (size_t j = 0; j < chars.size(); j++) {
                    found.push_back(toUuid128(chars[j]->getUUID()));
                }
            }
        }
        std::lock_guard<std::recursive_mutex> lock(_callbackMutex);
        if (_callbacks) _callbacks->onServicesDiscovered(*this, status, found);
    }

    void runWrite(NimBLEClient* client) {
        Uuid128 uuid;
        uint8_t data[MAX_WRITE_LEN];
        size_t len;
        {
            std::lock_guard<std::mutex> lock(_clientMutex);
            uuid = _writeUuid;
            memcpy(data, _writeData, _writeLen);
            len = _writeLen;
        }

        NimBLEUUID target = toNimUuid(uuid);
        NimBLERemoteCharacteristic* chr = nullptr;
        const std::vector<NimBLERemoteService*>& services = client->getServices(false);
        for (size_t i = 0; i < services.size() && chr == nullptr; i++) {
            chr = services[i]->getCharacteristic(target);
        }

        int status = -1;
        if (chr != nullptr && chr->writeValue(data, len, true)) {
            status = 0;
        } else if (chr != nullptr) {
            status = client->getLastError();
            if (status == 0) status = -1;
        }
        std::lock_guard<std::recursive_mutex> lock(_callbackMutex);
        if (_callbacks) _callbacks->onCharacteristicWritten(*this, status);
    }

    void notifyConnected() {
        std::lock_guard<std::recursive_mutex> lock(_callbackMutex);
        if (_callbacks) _callbacks->onConnected(*this);
    }

    void notifyDisconnected(int reason) {
        std::lock_guard<std::recursive_mutex> lock(_callbackMutex);
        if (_callbacks) _callbacks->onDisconnected(*this, reason == 0 ? -1 : reason);
    }
};

}  // namespace

// ============================================================
// Scan observer
// ============================================================

class NimBleRadio::ScanObserver : public NimBLEScanCallbacks {
public:
    // Written by startScan() before the scan is armed, read on the host task.
    ScanFilterSet filters;
    std::atomic<ScanSink*> sink{nullptr};
    std::atomic<bool> stopRequested{false};

    void onResult(const NimBLEAdvertisedDevice* device) override {
        ScanSink* target = sink.load();
        if (target == nullptr) return;

        Sighting s;
        memset(&s, 0, sizeof(s));
        copyMac(device->getAddress(), s.mac);
        s.addressType = device->getAddress().getType();
        s.rssi = (int8_t)constrain(device->getRSSI(), -128, 127);
        s.observedAtMs = millis();

        if (device->haveManufacturerData()) {
            std::string md = device->getManufacturerData();
            s.hasManufacturerMarker = vendorFilterMatches(
                (const uint8_t*)md.data(), md.size(), filters.vendorId);
        }

        uint8_t count = device->getServiceUUIDCount();
        for (uint8_t i = 0; i < count; i++) {
            Uuid128 uuid = toUuid128(device->getServiceUUID(i));
            if (s.serviceIdCount < MAX_ADV_SERVICE_IDS) {
                s.serviceIds[s.serviceIdCount++] = uuid;
            } else if (serviceFilterMatches(uuid, filters.serviceId)) {
                // Full: the detection service id displaces the last slot.
                s.serviceIds[MAX_ADV_SERVICE_IDS - 1] = uuid;
            }
        }

        if (!sightingPassesFilters(s, filters.serviceId)) return;
        target->onSighting(s);
    }

    void onScanEnd(const NimBLEScanResults& results, int reason) override {
        ScanSink* target = sink.load();
        if (stopRequested.load() || target == nullptr) return;
        Serial.printf("[SCAN] Scan ended unexpectedly (reason=%d)\n", reason);
        target->onScanFailed(BEACON_ERR_SCAN_FAILED);
    }
};

void NimBleRadio::initialize() {
    if (!NimBLEDevice::isInitialized()) {
        NimBLEDevice::init("");
    }
    _scan = NimBLEDevice::getScan();
    _scan->setActiveScan(true);
    _scan->setInterval(SCAN_INTERVAL);
    _scan->setWindow(SCAN_WINDOW);
    // Results go straight to the sink; nothing is kept in NimBLE's list.
    _scan->setMaxResults(0);

    _observer = new ScanObserver();
    _scan->setScanCallbacks(_observer, false);
    Serial.println("[SCAN] Bluetooth scanner initialized");
}

bool NimBleRadio::isPresent() const {
    return _scan != nullptr;
}

bool NimBleRadio::isEnabled() const {
    return NimBLEDevice::isInitialized();
}

int NimBleRadio::startScan(const ScanFilterSet& filters, ScanSink* sink) {
    if (_scan == nullptr || !isEnabled()) return BEACON_ERR_RADIO_UNAVAILABLE;
    if (_scan->isScanning()) return BEACON_ERR_SCAN_ALREADY_STARTED;

    _observer->filters = filters;
    _observer->sink.store(sink);
    _observer->stopRequested = false;
    if (!_scan->start(0, false, true)) {
        _observer->stopRequested = true;
        return BEACON_ERR_SCAN_FAILED;
    }
    return BEACON_OK;
}

int NimBleRadio::stopScan() {
    if (_scan == nullptr || !isEnabled()) return BEACON_ERR_RADIO_UNAVAILABLE;
    _observer->stopRequested = true;
    if (_scan->isScanning() && !_scan->stop()) return BEACON_ERR_SCAN_FAILED;
    return BEACON_OK;
}

void NimBleRadio::cancelDiscovery() {
    if (_scan != nullptr) _scan->clearResults();
}

std::shared_ptr<GattLink> NimBleRadio::connect(const Sighting& peer,
                                               GattLinkCallbacks* callbacks) {
    if (!isEnabled()) return nullptr;
    return NimBleGattLink::open(peer, callbacks);
}

#else  // !PROXIBEACON_BLE_SUPPORTED

void NimBleRadio::initialize() {
    Serial.println("[SCAN] No Bluetooth controller on this target");
}

bool NimBleRadio::isPresent() const { return false; }
bool NimBleRadio::isEnabled() const { return false; }

int NimBleRadio::startScan(const ScanFilterSet& filters, ScanSink* sink) {
    return BEACON_ERR_RADIO_UNAVAILABLE;
}

int NimBleRadio::stopScan() { return BEACON_ERR_RADIO_UNAVAILABLE; }
void NimBleRadio::cancelDiscovery() {}

std::shared_ptr<GattLink> NimBleRadio::connect(const Sighting& peer,
                                               GattLinkCallbacks* callbacks) {
    return nullptr;
}

#endif

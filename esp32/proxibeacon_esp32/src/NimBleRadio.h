#ifndef NIMBLE_RADIO_H
#define NIMBLE_RADIO_H

#include <Arduino.h>
#include <atomic>
#include <memory>
#include <mutex>
#include "RadioBackend.h"

// ESP32-S2 has no Bluetooth controller. Gate BLE code so the sketch still
// builds there; the receiver then reports isSupported() == false.
#if defined(CONFIG_IDF_TARGET_ESP32S2) || defined(ARDUINO_ESP32S2_DEV) || \
    defined(ARDUINO_ESP32S2_WROVER)
#define PROXIBEACON_BLE_SUPPORTED 0
#else
#define PROXIBEACON_BLE_SUPPORTED 1
#include <NimBLEDevice.h>
#include <NimBLEScan.h>
#include <NimBLEAdvertisedDevice.h>
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/task.h"
#endif

/// RadioBackend over NimBLE-Arduino.
///
/// Scanning uses the shared NimBLEScan with duplicate filtering so each peer
/// is normally reported once per scan. GATT links run their blocking NimBLE
/// calls on a dedicated task per link and report back through callbacks.
class NimBleRadio : public RadioBackend {
public:
    static const uint16_t SCAN_INTERVAL = 100;
    static const uint16_t SCAN_WINDOW = 99;
    static const uint32_t CONNECT_TIMEOUT_MS = 5000;

    void initialize();

    bool isPresent() const override;
    bool isEnabled() const override;
    int startScan(const ScanFilterSet& filters, ScanSink* sink) override;
    int stopScan() override;
    void cancelDiscovery() override;
    std::shared_ptr<GattLink> connect(const Sighting& peer,
                                      GattLinkCallbacks* callbacks) override;

private:
#if PROXIBEACON_BLE_SUPPORTED
    NimBLEScan* _scan = nullptr;

    class ScanObserver;
    ScanObserver* _observer = nullptr;
    friend class ScanObserver;
#endif
};

#endif

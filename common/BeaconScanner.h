#ifndef BEACON_SCANNER_H
#define BEACON_SCANNER_H

#include <Arduino.h>
#include <atomic>
#include <functional>
#include <mutex>
#include "BeaconTypes.h"
#include "BeaconCodec.h"
#include "RadioBackend.h"
#include "SightingQueue.h"

/// Filtered BLE scan feeding the shared sighting queue.
///
/// startScan/stopScan run on the scheduler; onSighting/onScanFailed arrive on
/// the radio task. The active handle is the only state both sides touch.
class BeaconScanner : public ScanSink {
public:
    /// Invoked for scan failures other than "already started".
    typedef std::function<void(int errorCode)> ScanFailedHandler;

    BeaconScanner(RadioBackend& radio, SightingQueue& queue)
        : _radio(radio), _queue(queue), _activeHandle(NO_SCAN_HANDLE), _nextHandle(0) {
        _filters.vendorId = PROXIBEACON_VENDOR_ID;
        _filters.serviceId = PROXIBEACON_SERVICE_ID;
    }

    void setFilters(const ScanFilterSet& filters) {
        std::lock_guard<std::mutex> lock(_filterMutex);
        _filters = filters;
    }

    ScanFilterSet filters() const {
        std::lock_guard<std::mutex> lock(_filterMutex);
        return _filters;
    }

    void setScanFailedHandler(ScanFailedHandler handler) { _failedHandler = handler; }

    bool isRadioAvailable() const {
        return _radio.isPresent() && _radio.isEnabled();
    }

    /// Returns a non-zero handle, or NO_SCAN_HANDLE with errorCode set.
    ScanHandle startScan(int& errorCode) {
        if (!isRadioAvailable()) {
            errorCode = BEACON_ERR_RADIO_UNAVAILABLE;
            Serial.println("[SCAN] Radio unavailable, scan not started");
            return NO_SCAN_HANDLE;
        }

        int rc = _radio.startScan(filters(), this);
        if (rc == BEACON_ERR_SCAN_ALREADY_STARTED) {
            Serial.println("[SCAN] Scan already running");
        } else if (rc != BEACON_OK) {
            errorCode = rc;
            Serial.printf("[SCAN] Scan start failed (error=%s)\n", beaconErrorName(rc));
            return NO_SCAN_HANDLE;
        }

        ScanHandle handle = ++_nextHandle;
        if (handle == NO_SCAN_HANDLE) handle = ++_nextHandle;
        _activeHandle.store(handle);
        errorCode = BEACON_OK;
        Serial.printf("[SCAN] Scan started (handle=%lu)\n", (unsigned long)handle);
        return handle;
    }

    /// Stops the scan identified by handle. Failures are logged, never raised:
    /// a radio that was switched off has already stopped scanning.
    void stopScan(ScanHandle handle) {
        if (handle == NO_SCAN_HANDLE) return;
        ScanHandle expected = handle;
        _activeHandle.compare_exchange_strong(expected, NO_SCAN_HANDLE);

        int rc = _radio.stopScan();
        if (rc != BEACON_OK) {
            if (_radio.isEnabled()) {
                Serial.printf("[SCAN] Failed to stop scan while radio is on (error=%s)\n",
                              beaconErrorName(rc));
            } else {
                Serial.println("[SCAN] Scan stop skipped, radio already off");
            }
        } else {
            Serial.printf("[SCAN] Scan stopped (handle=%lu)\n", (unsigned long)handle);
        }
        _radio.cancelDiscovery();
    }

    bool isScanning() const { return _activeHandle.load() != NO_SCAN_HANDLE; }
    ScanHandle activeHandle() const { return _activeHandle.load(); }

    // -- ScanSink --

    void onSighting(const Sighting& sighting) override {
        if (!sightingPassesFilters(sighting, filters().serviceId)) return;
        _queue.push(sighting);
    }

    void onScanFailed(int errorCode) override {
        Serial.printf("[SCAN] Scan failed (error=%s)\n", beaconErrorName(errorCode));
        if (errorCode == BEACON_ERR_SCAN_ALREADY_STARTED) return;
        _activeHandle.store(NO_SCAN_HANDLE);
        if (_failedHandler) _failedHandler(errorCode);
    }

private:
    RadioBackend& _radio;
    SightingQueue& _queue;
    mutable std::mutex _filterMutex;
    ScanFilterSet _filters;
    ScanFailedHandler _failedHandler;
    std::atomic<ScanHandle> _activeHandle;
    ScanHandle _nextHandle;
};

#endif

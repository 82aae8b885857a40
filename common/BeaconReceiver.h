#ifndef BEACON_RECEIVER_H
#define BEACON_RECEIVER_H

#include <Arduino.h>
#include <atomic>
#include <mutex>
#include <vector>
#include "BeaconTypes.h"
#include "BeaconCodec.h"
#include "BeaconScanner.h"
#include "DutyCycleScheduler.h"
#include "EventBroadcaster.h"
#include "PeerCodeExchange.h"
#include "RadioBackend.h"
#include "ReceiverConfig.h"
#include "SightingClassifier.h"
#include "SightingQueue.h"

struct ReceiverStats {
    uint32_t scanPhases;
    uint32_t sightings;
    uint32_t sightingsDropped;
    uint32_t sightingsRejected;
    uint32_t exchanges;
    uint32_t detections;
    uint32_t timeouts;
    uint32_t connectionErrors;
};

/// Proximity detection engine: duty-cycled scan, classification and
/// sequential code exchange, with lifecycle and detection events delivered
/// through the listener registry.
///
/// Threading: start/stop/update/setDutyCycle may be called from the main
/// loop or a worker task; scan results and scan failures arrive on the radio
/// task. Exchange processing runs inside update() on the caller's thread,
/// one peer at a time. Stats are written only from that thread.
class BeaconReceiver : public DutyCycleHandler {
public:
    explicit BeaconReceiver(RadioBackend& radio)
        : _radio(radio),
          _scanner(radio, _queue),
          _exchange(radio, _broadcaster),
          _scheduler(*this),
          _started(false) {
        memset(&_stats, 0, sizeof(_stats));
        _scanner.setScanFailedHandler([this](int errorCode) {
            handleScanFailure(errorCode);
        });
        configure(defaultReceiverConfig());
    }

    bool addListener(BeaconListener* listener) { return _broadcaster.addListener(listener); }
    bool removeListener(BeaconListener* listener) { return _broadcaster.removeListener(listener); }

    void configure(const ReceiverConfig& config) {
        {
            std::lock_guard<std::mutex> lock(_configMutex);
            _config = config;
            _config.dutyCycle = makeDutyCycle(config.dutyCycle.onDurationMs,
                                              config.dutyCycle.offDurationMs);
        }
        ScanFilterSet filters;
        filters.vendorId = config.vendorId;
        filters.serviceId = config.serviceId;
        _scanner.setFilters(filters);
        _scheduler.setDutyCycle(config.dutyCycle.onDurationMs,
                                config.dutyCycle.offDurationMs);
    }

    ReceiverConfig config() const {
        std::lock_guard<std::mutex> lock(_configMutex);
        return _config;
    }

    void setDutyCycle(uint32_t onDurationMs, uint32_t offDurationMs) {
        Serial.printf("[RX] Set duty cycle (on=%lu, off=%lu)\n",
                      (unsigned long)onDurationMs, (unsigned long)offDurationMs);
        {
            std::lock_guard<std::mutex> lock(_configMutex);
            _config.dutyCycle = makeDutyCycle(onDurationMs, offDurationMs);
        }
        _scheduler.setDutyCycle(onDurationMs, offDurationMs);
    }

    void setLocalBeaconCode(uint64_t code) {
        std::lock_guard<std::mutex> lock(_configMutex);
        _config.localBeaconCode = code;
    }

    void setLocalAdvertisesAsPeer(bool advertises) {
        std::lock_guard<std::mutex> lock(_configMutex);
        _config.localAdvertisesAsPeer = advertises;
    }

    bool isSupported() const { return _radio.isPresent(); }
    bool isStarted() const { return _started.load(); }
    DutyCyclePhase phase() const { return _scheduler.phase(); }
    bool isScanning() const { return _scanner.isScanning(); }
    ReceiverStats stats() const { return _stats; }

    bool start() {
        if (_started.load()) {
            Serial.println("[RX] Beacon receiver already started");
            return false;
        }
        if (!isSupported() || !_scanner.isRadioAvailable()) {
            Serial.printf("[RX] Beacon receiver start failed (supported=%d, enabled=%d)\n",
                          isSupported() ? 1 : 0, _radio.isEnabled() ? 1 : 0);
            _broadcaster.broadcastStartFailed(BEACON_ERR_RADIO_UNAVAILABLE);
            return false;
        }
        // A scheduler left running by a scan failure is restarted cleanly.
        haltScanning();
        _queue.clear();
        _started.store(true);
        _broadcaster.broadcastStart();
        Serial.println("[RX] Beacon receiver started");
        _scheduler.start();
        return true;
    }

    // Scanning is off when this returns. An exchange in progress on another
    // thread runs to completion; no new phase starts.
    void stop() {
        bool wasStarted = _started.exchange(false);
        haltScanning();
        if (wasStarted) {
            _broadcaster.broadcastStop();
            Serial.println("[RX] Beacon receiver stopped");
        } else {
            Serial.println("[RX] Beacon receiver already stopped");
        }
    }

    // Call from loop().
    void update() {
        if (!_started.load()) {
            if (_scheduler.isRunning()) {
                Serial.println("[RX] Halting duty cycle after scan failure");
                haltScanning();
            }
            return;
        }
        _scheduler.update();
    }

    // -- DutyCycleHandler --

    void onScanPhaseStart() override {
        int errorCode = BEACON_OK;
        {
            std::lock_guard<std::mutex> lock(_scanMutex);
            if (!_scheduler.isRunning()) return;
            _stats.scanPhases++;
            _queue.clear();
            if (_scanner.startScan(errorCode) != NO_SCAN_HANDLE) return;
        }
        if (errorCode == BEACON_ERR_RADIO_UNAVAILABLE) {
            // Stay started; the next on phase retries once the radio is back.
            Serial.println("[RX] Radio off at phase start, will retry next phase");
            _broadcaster.broadcastStartFailed(errorCode);
        } else {
            handleScanFailure(errorCode);
        }
    }

    void onScanPhaseEnd() override {
        {
            std::lock_guard<std::mutex> lock(_scanMutex);
            _scanner.stopScan(_scanner.activeHandle());
        }
        processPendingSightings();
    }

    // Drains the queue and resolves every candidate, strongest first.
    void processPendingSightings() {
        std::vector<Sighting> drained;
        uint32_t dropped = _queue.drain(drained);
        _stats.sightings += drained.size();
        if (dropped > 0) {
            _stats.sightingsDropped += dropped;
            Serial.printf("[RX] %lu sightings dropped, queue full\n", (unsigned long)dropped);
        }
        if (drained.empty()) return;

        ReceiverConfig cfg = config();
        ExchangeContext context;
        context.serviceId = cfg.serviceId;
        context.localBeaconCode = cfg.localBeaconCode;
        context.localAdvertisesAsPeer = cfg.localAdvertisesAsPeer;
        _exchange.setContext(context);

        std::vector<ClassifiedSighting> ordered;
        _stats.sightingsRejected += classifySightings(drained, cfg.serviceId, ordered);
        Serial.printf("[RX] Processing %u sightings, %u candidates\n",
                      (unsigned)drained.size(), (unsigned)ordered.size());

        for (size_t i = 0; i < ordered.size(); i++) {
            DetectionEvent event;
            _stats.exchanges++;
            ExchangeOutcome outcome = _exchange.resolve(ordered[i], cfg.connectionTimeoutMs, event);
            switch (outcome) {
                case EXCHANGE_DETECTED:         _stats.detections++;       break;
                case EXCHANGE_TIMEOUT:          _stats.timeouts++;         break;
                case EXCHANGE_CONNECTION_ERROR: _stats.connectionErrors++; break;
                case EXCHANGE_NO_CODE:                                     break;
            }
        }
    }

private:
    RadioBackend& _radio;
    EventBroadcaster _broadcaster;
    SightingQueue _queue;
    BeaconScanner _scanner;
    PeerCodeExchange _exchange;
    DutyCycleScheduler _scheduler;
    std::atomic<bool> _started;
    std::mutex _scanMutex;
    mutable std::mutex _configMutex;
    ReceiverConfig _config;
    ReceiverStats _stats;

    void haltScanning() {
        _scheduler.stop();
        std::lock_guard<std::mutex> lock(_scanMutex);
        _scanner.stopScan(_scanner.activeHandle());
    }

    void handleScanFailure(int errorCode) {
        _started.store(false);
        _broadcaster.broadcastStartFailed(errorCode);
    }
};

#endif

#ifndef PEER_CODE_EXCHANGE_H
#define PEER_CODE_EXCHANGE_H

#include <Arduino.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>
#include "BeaconTypes.h"
#include "BeaconCodec.h"
#include "EventBroadcaster.h"
#include "RadioBackend.h"

// Per-connection progress. CLOSED is terminal.
enum class ExchangeState : uint8_t {
    CONNECTING,
    DISCOVERING_SERVICES,
    WRITING,
    CLOSED,
};

enum ExchangeOutcome : uint8_t {
    EXCHANGE_DETECTED         = 0,  // peer code resolved, detect event emitted
    EXCHANGE_NO_CODE          = 1,  // session ended without a peer code
    EXCHANGE_TIMEOUT          = 2,  // deadline passed, link force-closed
    EXCHANGE_CONNECTION_ERROR = 3,  // GATT-level failure, link force-closed
};

// What the local device contributes to every exchange.
struct ExchangeContext {
    uint64_t serviceId;
    uint64_t localBeaconCode;
    bool     localAdvertisesAsPeer;  // false: write identity to the peer instead
};

// ============================================================
// One-shot result slot
// Completed by whichever of the GATT callbacks or the timeout path gets
// there first; later completions are ignored.
// ============================================================

class ExchangeResult {
public:
    ExchangeResult() : _done(false), _hasCode(false), _code(0) {}

    bool complete(bool hasCode, uint64_t code) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_done) return false;
            _done = true;
            _hasCode = hasCode;
            _code = code;
        }
        _cv.notify_all();
        return true;
    }

    // Blocks until completed or the deadline passes. Returns true if completed.
    bool waitUntil(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(_mutex);
        return _cv.wait_until(lock, deadline, [this] { return _done; });
    }

    bool isComplete() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _done;
    }

    bool hasCode() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _hasCode;
    }

    uint64_t code() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _code;
    }

private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    bool _done;
    bool _hasCode;
    uint64_t _code;
};

// ============================================================
// Exchange session
// Drives connect -> discover -> (write) -> close for one peer.
// ============================================================

class ExchangeSession : public GattLinkCallbacks {
public:
    ExchangeSession(const ClassifiedSighting& target, const ExchangeContext& context)
        : _target(target),
          _context(context),
          _state((uint8_t)ExchangeState::CONNECTING),
          _linkOpen(true),
          _connectionError(false),
          _hasPeerCode(false),
          _peerCode(0),
          _retired(false) {
        formatMac(target.sighting.mac, _macStr, sizeof(_macStr));
    }

    // Hands over the link returned by RadioBackend::connect() so the owner
    // can force-close it.
    void attach(const std::shared_ptr<GattLink>& link) { _link = link; }

    ExchangeResult& result() { return _result; }

    ExchangeState state() const { return (ExchangeState)_state.load(); }
    bool isLinkOpen() const { return _linkOpen.load(); }
    bool hadConnectionError() const { return _connectionError.load(); }

    bool discoveredPeerCode(uint64_t& code) const {
        if (!_hasPeerCode.load(std::memory_order_acquire)) return false;
        code = _peerCode;
        return true;
    }

    // Closes the link exactly once. Returns false if it was already released.
    bool release(GattLink& link) {
        if (!_linkOpen.exchange(false)) return false;
        _state = (uint8_t)ExchangeState::CLOSED;
        link.close();
        Serial.printf("[GATT] %s closed\n", _macStr);
        return true;
    }

    // Owner-side release through the attached link (timeout and cleanup path).
    bool release() {
        std::shared_ptr<GattLink> link = _link;
        if (!link) {
            bool wasOpen = _linkOpen.exchange(false);
            _state = (uint8_t)ExchangeState::CLOSED;
            return wasOpen;
        }
        return release(*link);
    }

    // Waits out a callback still running on the radio task and ignores any
    // that follow. Call before the session goes out of scope.
    void retire() {
        std::lock_guard<std::recursive_mutex> lock(_callbackMutex);
        _retired = true;
    }

    // -- GattLinkCallbacks --

    void onConnected(GattLink& link) override {
        std::lock_guard<std::recursive_mutex> lock(_callbackMutex);
        if (_retired || !_linkOpen.load()) return;
        Serial.printf("[GATT] %s connected, discovering services\n", _macStr);
        _state = (uint8_t)ExchangeState::DISCOVERING_SERVICES;
        if (!link.discoverServices()) {
            Serial.printf("[GATT] %s service discovery request rejected\n", _macStr);
            fail(link);
        }
    }

    void onServicesDiscovered(GattLink& link, int status,
                              const std::vector<Uuid128>& characteristics) override {
        std::lock_guard<std::recursive_mutex> lock(_callbackMutex);
        if (_retired || !_linkOpen.load()) return;
        if (status != 0) {
            Serial.printf("[GATT] %s service discovery failed (status=%d)\n",
                          _macStr, status);
            fail(link);
            return;
        }

        for (size_t i = 0; i < characteristics.size(); i++) {
            if (!uuidMatchesService(characteristics[i], _context.serviceId)) continue;

            _peerCode = characteristics[i].lsb;
            _hasPeerCode.store(true, std::memory_order_release);
            char codeStr[17];
            formatBeaconCode(_peerCode, codeStr, sizeof(codeStr));
            Serial.printf("[GATT] %s peer code %s\n", _macStr, codeStr);

            if (!_context.localAdvertisesAsPeer) {
                // The peer cannot see us; leave our identity on its
                // characteristic before hanging up.
                uint8_t payload[IDENTITY_PAYLOAD_LEN];
                encodeIdentityPayload(_context.localBeaconCode,
                                      _target.sighting.rssi, payload);
                _state = (uint8_t)ExchangeState::WRITING;
                if (link.writeCharacteristic(characteristics[i], payload,
                                             sizeof(payload))) {
                    return;  // completes in onCharacteristicWritten
                }
                Serial.printf("[GATT] %s identity write not started\n", _macStr);
            }
            link.disconnect();
            _result.complete(true, _peerCode);
            return;
        }

        Serial.printf("[GATT] %s has no detection characteristic\n", _macStr);
        link.disconnect();
        _result.complete(false, 0);
    }

    void onCharacteristicWritten(GattLink& link, int status) override {
        std::lock_guard<std::recursive_mutex> lock(_callbackMutex);
        if (_retired || !_linkOpen.load()) return;
        if (status != 0) {
            Serial.printf("[GATT] %s identity write failed (status=%d)\n",
                          _macStr, status);
        }
        link.disconnect();
        release(link);
        completeWithDiscovered();
    }

    void onDisconnected(GattLink& link, int status) override {
        std::lock_guard<std::recursive_mutex> lock(_callbackMutex);
        if (_retired) return;
        Serial.printf("[GATT] %s disconnected (status=%d)\n", _macStr, status);
        if (status != 0 && state() == ExchangeState::CONNECTING) {
            _connectionError = true;
        }
        release(link);
        completeWithDiscovered();
    }

private:
    ClassifiedSighting _target;
    ExchangeContext _context;
    std::shared_ptr<GattLink> _link;
    ExchangeResult _result;
    std::atomic<uint8_t> _state;
    std::atomic<bool> _linkOpen;
    std::atomic<bool> _connectionError;
    std::atomic<bool> _hasPeerCode;
    uint64_t _peerCode;
    std::recursive_mutex _callbackMutex;
    bool _retired;
    char _macStr[18];

    void completeWithDiscovered() {
        uint64_t code = 0;
        bool has = discoveredPeerCode(code);
        _result.complete(has, code);
    }

    void fail(GattLink& link) {
        _connectionError = true;
        release(link);
        _result.complete(false, 0);
    }
};

// ============================================================
// PeerCodeExchange
// Resolves one classified sighting at a time into a detection event.
// ============================================================

class PeerCodeExchange {
public:
    PeerCodeExchange(RadioBackend& radio, EventBroadcaster& broadcaster)
        : _radio(radio), _broadcaster(broadcaster) {
        _context.serviceId = PROXIBEACON_SERVICE_ID;
        _context.localBeaconCode = 0;
        _context.localAdvertisesAsPeer = false;
    }

    void setContext(const ExchangeContext& context) { _context = context; }
    const ExchangeContext& context() const { return _context; }

    // Blocks for at most timeoutMs (measured from the start of the attempt,
    // never extended by progress). On EXCHANGE_DETECTED, event holds what was
    // broadcast.
    ExchangeOutcome resolve(const ClassifiedSighting& target, uint32_t timeoutMs,
                            DetectionEvent& event) {
        std::chrono::steady_clock::time_point deadline =
            std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);

        char macStr[18];
        formatMac(target.sighting.mac, macStr, sizeof(macStr));
        Serial.printf("[GATT] Resolving %s (type=%s, rssi=%d)\n", macStr,
                      sightingCategoryName(target.category), target.sighting.rssi);

        ExchangeSession session(target, _context);
        std::shared_ptr<GattLink> link = _radio.connect(target.sighting, &session);
        if (!link) {
            Serial.printf("[GATT] %s connect not started\n", macStr);
            return EXCHANGE_CONNECTION_ERROR;
        }
        session.attach(link);

        bool completed = session.result().waitUntil(deadline);
        ExchangeState stateAtDeadline = session.state();
        if (!completed) {
            completed = !session.result().complete(false, 0);
        }
        session.release();
        session.retire();

        bool hasCode = false;
        uint64_t code = 0;
        if (completed) {
            hasCode = session.result().hasCode();
            code = session.result().code();
        } else if (stateAtDeadline == ExchangeState::WRITING &&
                   session.discoveredPeerCode(code)) {
            // Only the identity write was outstanding; it is best effort.
            hasCode = true;
        }

        if (hasCode) {
            event.observedAtMs = millis();
            event.peerBeaconCode = code;
            event.rssi = target.sighting.rssi;
            _broadcaster.broadcastDetect(event);
            return EXCHANGE_DETECTED;
        }
        if (!completed) {
            Serial.printf("[GATT] %s timed out after %lu ms\n", macStr,
                          (unsigned long)timeoutMs);
            return EXCHANGE_TIMEOUT;
        }
        return session.hadConnectionError() ? EXCHANGE_CONNECTION_ERROR
                                            : EXCHANGE_NO_CODE;
    }

private:
    RadioBackend& _radio;
    EventBroadcaster& _broadcaster;
    ExchangeContext _context;
};

#endif

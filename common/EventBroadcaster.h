#ifndef EVENT_BROADCASTER_H
#define EVENT_BROADCASTER_H

#include <Arduino.h>
#include <exception>
#include <iterator>
#include <list>
#include <mutex>
#include <unordered_map>
#include <vector>
#include "BeaconTypes.h"

/// Receiver lifecycle and detection listener. Override what you need;
/// every callback runs synchronously on the broadcasting thread.
class BeaconListener {
public:
    virtual ~BeaconListener() {}

    virtual void onStart() {}
    virtual void onStartFailed(int errorCode) { (void)errorCode; }
    virtual void onStop() {}
    virtual void onDetect(const DetectionEvent& event) { (void)event; }
};

/// Ordered listener registry owned by the receiver.
///
/// add/remove are O(1) and idempotent. Each broadcast delivers to a snapshot
/// of the registry taken under the lock, so listeners may add or remove
/// listeners (themselves included) from inside a callback. A listener that
/// throws is logged and skipped; delivery to the rest continues.
class EventBroadcaster {
public:
    bool addListener(BeaconListener* listener) {
        if (listener == nullptr) return false;
        std::lock_guard<std::mutex> lock(_mutex);
        if (_index.count(listener)) return false;
        _order.push_back(listener);
        _index[listener] = std::prev(_order.end());
        return true;
    }

    bool removeListener(BeaconListener* listener) {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _index.find(listener);
        if (it == _index.end()) return false;
        _order.erase(it->second);
        _index.erase(it);
        return true;
    }

    size_t listenerCount() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _order.size();
    }

    void broadcastStart() {
        deliver("start", [](BeaconListener* l) { l->onStart(); });
    }

    void broadcastStartFailed(int errorCode) {
        deliver("startFailed", [errorCode](BeaconListener* l) {
            l->onStartFailed(errorCode);
        });
    }

    void broadcastStop() {
        deliver("stop", [](BeaconListener* l) { l->onStop(); });
    }

    void broadcastDetect(const DetectionEvent& event) {
        deliver("detect", [&event](BeaconListener* l) { l->onDetect(event); });
    }

private:
    mutable std::mutex _mutex;
    std::list<BeaconListener*> _order;
    std::unordered_map<BeaconListener*, std::list<BeaconListener*>::iterator> _index;

    std::vector<BeaconListener*> snapshot() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return std::vector<BeaconListener*>(_order.begin(), _order.end());
    }

    template <typename Fn>
    void deliver(const char* eventName, Fn fn) {
        std::vector<BeaconListener*> listeners = snapshot();
        for (size_t i = 0; i < listeners.size(); i++) {
            try {
                fn(listeners[i]);
            } catch (const std::exception& e) {
                Serial.printf("[BUS] Listener %u failed on %s: %s\n",
                              (unsigned)i, eventName, e.what());
            } catch (...) {
                Serial.printf("[BUS] Listener %u failed on %s: unknown exception\n",
                              (unsigned)i, eventName);
            }
        }
    }
};

#endif

#ifndef SIGHTING_QUEUE_H
#define SIGHTING_QUEUE_H

#include <mutex>
#include <vector>
#include "BeaconTypes.h"

// Multi-producer / single-consumer sighting buffer.
// push() runs on the radio callback task, drain() on the scheduler.
class SightingQueue {
public:
    explicit SightingQueue(size_t capacity = MAX_QUEUED_SIGHTINGS)
        : _capacity(capacity), _dropped(0) {
        _items.reserve(capacity);
    }

    // Returns false when the buffer is full; the sighting is counted as dropped.
    bool push(const Sighting& sighting) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_items.size() >= _capacity) {
            _dropped++;
            return false;
        }
        _items.push_back(sighting);
        return true;
    }

    // Moves everything queued so far into out and leaves the queue empty.
    // Returns the number of sightings dropped since the previous drain.
    uint32_t drain(std::vector<Sighting>& out) {
        out.clear();
        std::lock_guard<std::mutex> lock(_mutex);
        out.swap(_items);
        _items.reserve(_capacity);
        uint32_t dropped = _dropped;
        _dropped = 0;
        return dropped;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(_mutex);
        _items.clear();
        _dropped = 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _items.size();
    }

private:
    mutable std::mutex _mutex;
    std::vector<Sighting> _items;
    size_t _capacity;
    uint32_t _dropped;
};

#endif

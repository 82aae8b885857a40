#ifndef DUTY_CYCLE_SCHEDULER_H
#define DUTY_CYCLE_SCHEDULER_H

#include <Arduino.h>
#include <atomic>
#include <mutex>
#include "BeaconTypes.h"
#include "ReceiverConfig.h"

enum class DutyCyclePhase : uint8_t {
    STOPPED,
    SCANNING_ON,
    SCANNING_OFF,
};

inline const char* dutyCyclePhaseName(DutyCyclePhase phase) {
    switch (phase) {
        case DutyCyclePhase::STOPPED:      return "stopped";
        case DutyCyclePhase::SCANNING_ON:  return "on";
        case DutyCyclePhase::SCANNING_OFF: return "off";
    }
    return "unknown";
}

/// Phase entry hooks. Both run on the thread calling update()/start().
class DutyCycleHandler {
public:
    virtual ~DutyCycleHandler() {}
    virtual void onScanPhaseStart() = 0;
    // Runs the whole classification and exchange pass before returning.
    virtual void onScanPhaseEnd() = 0;
};

/// Alternates scanning on/off. Poll update() from the main loop; each call
/// fires at most one due transition. Durations are read at phase entry, so
/// setDutyCycle() takes effect from the next boundary. The off phase is
/// timed from the end of processing, not from the moment scanning stopped.
class DutyCycleScheduler {
public:
    explicit DutyCycleScheduler(DutyCycleHandler& handler)
        : _handler(handler),
          _phase((uint8_t)DutyCyclePhase::STOPPED),
          _phaseStartMs(0),
          _phaseDurationMs(0),
          _phaseCount(0) {
        _config = makeDutyCycle(DEFAULT_SCAN_ON_MS, DEFAULT_SCAN_OFF_MS);
    }

    void setDutyCycle(uint32_t onDurationMs, uint32_t offDurationMs) {
        std::lock_guard<std::mutex> lock(_configMutex);
        _config = makeDutyCycle(onDurationMs, offDurationMs);
    }

    DutyCycleConfig dutyCycle() const {
        std::lock_guard<std::mutex> lock(_configMutex);
        return _config;
    }

    DutyCyclePhase phase() const { return (DutyCyclePhase)_phase.load(); }
    bool isRunning() const { return phase() != DutyCyclePhase::STOPPED; }
    uint32_t phaseCount() const { return _phaseCount; }

    // Milliseconds until the next transition is due, 0 if due or stopped.
    uint32_t msUntilTransition() const {
        if (!isRunning()) return 0;
        uint32_t duration = _phaseDurationMs.load();
        uint32_t elapsed = millis() - _phaseStartMs.load();
        return elapsed >= duration ? 0 : duration - elapsed;
    }

    // Enters SCANNING_ON immediately. No-op if already running.
    bool start() {
        uint8_t expected = (uint8_t)DutyCyclePhase::STOPPED;
        if (!_phase.compare_exchange_strong(expected, (uint8_t)DutyCyclePhase::SCANNING_ON)) {
            return false;
        }
        enterOn();
        return true;
    }

    // Halts alternation. Processing already under way finishes normally.
    void stop() {
        _phase.store((uint8_t)DutyCyclePhase::STOPPED);
    }

    void update() {
        DutyCyclePhase current = phase();
        if (current == DutyCyclePhase::STOPPED) return;
        if (millis() - _phaseStartMs < _phaseDurationMs) return;

        if (current == DutyCyclePhase::SCANNING_ON) {
            uint8_t expected = (uint8_t)DutyCyclePhase::SCANNING_ON;
            if (!_phase.compare_exchange_strong(expected, (uint8_t)DutyCyclePhase::SCANNING_OFF)) {
                return;
            }
            _handler.onScanPhaseEnd();
            // A handler may have stopped or restarted the cycle; its phase
            // timing then stands.
            if (phase() != DutyCyclePhase::SCANNING_OFF) return;
            // Off time starts once processing is done.
            _phaseStartMs = millis();
            _phaseDurationMs = dutyCycle().offDurationMs;
        } else {
            uint8_t expected = (uint8_t)DutyCyclePhase::SCANNING_OFF;
            if (!_phase.compare_exchange_strong(expected, (uint8_t)DutyCyclePhase::SCANNING_ON)) {
                return;
            }
            enterOn();
        }
    }

private:
    DutyCycleHandler& _handler;
    mutable std::mutex _configMutex;
    DutyCycleConfig _config;
    std::atomic<uint8_t> _phase;
    std::atomic<uint32_t> _phaseStartMs;
    std::atomic<uint32_t> _phaseDurationMs;
    std::atomic<uint32_t> _phaseCount;

    void enterOn() {
        _phaseCount++;
        _phaseStartMs = millis();
        _phaseDurationMs = dutyCycle().onDurationMs;
        _handler.onScanPhaseStart();
    }
};

#endif

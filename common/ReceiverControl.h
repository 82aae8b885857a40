#ifndef RECEIVER_CONTROL_H
#define RECEIVER_CONTROL_H

#include <Arduino.h>
#include <atomic>
#include "BeaconReceiver.h"
#include "CommandParser.h"
#include "ReceiverConfig.h"
#include "TelemetryReporter.h"

/// Runtime control surface: serial commands and power-profile switching.
class ReceiverControl {
public:
    ReceiverControl(BeaconReceiver& receiver, TelemetryReporter& reporter)
        : _receiver(receiver),
          _reporter(reporter),
          _highPerformance(false),
          _clientConnected(false),
          _dutyCycleDirty(false) {}

    // Switch between battery-optimized and high-performance scanning
    void setPerformanceMode(bool highPerformance) {
        _highPerformance = highPerformance;
        applyDutyCycle();
    }

    bool isHighPerformance() const { return _highPerformance; }

    /// Notify that a telemetry client connected / disconnected.
    /// Safe to call from any task (e.g. NimBLE callback); the duty cycle
    /// update is deferred to the main loop via a flag.
    void setClientConnected(bool connected) {
        _clientConnected = connected;
        _dutyCycleDirty = true;
    }

    /// Call from the main loop to apply any pending duty-cycle changes.
    void applyPendingDutyCycle() {
        if (_dutyCycleDirty.exchange(false)) {
            applyDutyCycle();
        }
    }

    // Feed one serial byte. Complete lines are executed immediately.
    void feed(char c) {
        if (_lineBuffer.feed(c)) {
            handleLine(_lineBuffer.line());
        }
    }

    bool handleLine(const char* line) {
        ReceiverCommand cmd;
        const char* error = nullptr;
        if (!parseCommand(line, cmd, error)) {
            Serial.printf("[CFG] Rejected command (%s)\n", error);
            _reporter.reportCommandError(error);
            return false;
        }

        switch (cmd.type) {
            case CommandType::DUTY:
                _receiver.setDutyCycle(cmd.onMs, cmd.offMs);
                break;
            case CommandType::START:
                _receiver.start();
                break;
            case CommandType::STOP:
                _receiver.stop();
                break;
            case CommandType::STATUS:
                _reporter.reportStatus(_receiver);
                break;
            case CommandType::CODE:
                _receiver.setLocalBeaconCode(cmd.beaconCode);
                Serial.println("[CFG] Local beacon code updated");
                break;
            case CommandType::MODE:
                setPerformanceMode(cmd.highPerformance);
                break;
            case CommandType::NONE:
                return false;
        }
        return true;
    }

private:
    BeaconReceiver& _receiver;
    TelemetryReporter& _reporter;
    CommandLineBuffer _lineBuffer;
    bool _highPerformance;
    std::atomic<bool> _clientConnected;
    std::atomic<bool> _dutyCycleDirty;

    void applyDutyCycle() {
        DutyCycleConfig d = dutyCycleForMode(_highPerformance, _clientConnected.load());
        Serial.printf("[CFG] Duty profile %s%s\n",
                      _highPerformance ? "performance" : "battery",
                      _clientConnected.load() ? " (client connected)" : "");
        _receiver.setDutyCycle(d.onDurationMs, d.offDurationMs);
    }
};

#endif

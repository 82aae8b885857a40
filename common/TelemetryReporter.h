#ifndef TELEMETRY_REPORTER_H
#define TELEMETRY_REPORTER_H

#include <Arduino.h>
#include <ArduinoJson.h>
#include "BeaconCodec.h"
#include "BeaconReceiver.h"
#include "EventBroadcaster.h"
#include "TelemetrySink.h"

/// Writes every receiver event as one JSON line to USB serial and, when a
/// client is connected, to the telemetry sink.
class TelemetryReporter : public BeaconListener {
public:
    void initialize() {
        bootTime = millis();
        detectionCount = 0;
    }

    void setSink(TelemetrySink* sink) {
        _sink = sink;
    }

    uint32_t detections() const { return detectionCount; }

    void onStart() override {
        StaticJsonDocument<128> doc;
        doc["event"] = "receiver_started";
        doc["ms_since_boot"] = millis() - bootTime;
        emit(doc);
    }

    void onStartFailed(int errorCode) override {
        StaticJsonDocument<192> doc;
        doc["event"] = "receiver_start_failed";
        doc["ms_since_boot"] = millis() - bootTime;
        doc["error"] = errorCode;
        doc["reason"] = beaconErrorName(errorCode);
        emit(doc);
    }

    void onStop() override {
        StaticJsonDocument<128> doc;
        doc["event"] = "receiver_stopped";
        doc["ms_since_boot"] = millis() - bootTime;
        emit(doc);
    }

    void onDetect(const DetectionEvent& event) override {
        detectionCount++;

        StaticJsonDocument<256> doc;
        doc["event"] = "detect";
        doc["ms_since_boot"] = millis() - bootTime;
        doc["observed_at_ms"] = event.observedAtMs;

        // 64-bit codes travel as hex text; not every JSON reader keeps
        // integers above 2^53 intact.
        char codeStr[17];
        formatBeaconCode(event.peerBeaconCode, codeStr, sizeof(codeStr));
        doc["beacon_code"] = codeStr;
        doc["rssi"] = event.rssi;
        emit(doc);
    }

    void reportStatus(const BeaconReceiver& receiver) {
        StaticJsonDocument<768> doc;
        doc["event"] = "status";
        doc["ms_since_boot"] = millis() - bootTime;
        doc["supported"] = receiver.isSupported();
        doc["started"] = receiver.isStarted();
        doc["phase"] = dutyCyclePhaseName(receiver.phase());

        ReceiverConfig cfg = receiver.config();
        JsonObject duty = doc.createNestedObject("duty_cycle");
        duty["on_ms"] = cfg.dutyCycle.onDurationMs;
        duty["off_ms"] = cfg.dutyCycle.offDurationMs;
        doc["timeout_ms"] = cfg.connectionTimeoutMs;

        char codeStr[17];
        formatBeaconCode(cfg.localBeaconCode, codeStr, sizeof(codeStr));
        doc["local_code"] = codeStr;

        ReceiverStats s = receiver.stats();
        JsonObject counters = doc.createNestedObject("counters");
        counters["phases"] = s.scanPhases;
        counters["sightings"] = s.sightings;
        counters["dropped"] = s.sightingsDropped;
        counters["rejected"] = s.sightingsRejected;
        counters["exchanges"] = s.exchanges;
        counters["detections"] = s.detections;
        counters["timeouts"] = s.timeouts;
        counters["errors"] = s.connectionErrors;
        emit(doc);
    }

    void reportCommandError(const char* reason) {
        StaticJsonDocument<192> doc;
        doc["event"] = "command_error";
        doc["reason"] = reason;
        emit(doc);
    }

private:
    unsigned long bootTime = 0;
    uint32_t detectionCount = 0;
    TelemetrySink* _sink = nullptr;

    void emit(const JsonDocument& doc) {
        // +1 byte for the newline appended for the sink
        char buf[641];
        size_t len = serializeJson(doc, buf, sizeof(buf) - 1);

        // Always output to Serial (USB)
        Serial.write((const uint8_t*)buf, len);
        Serial.println();

        // Skip the sink if JSON was truncated; the client could not parse it.
        if (_sink && _sink->isClientConnected() && len < sizeof(buf) - 1) {
            buf[len] = '\n';
            _sink->sendLine(buf, len + 1);
        }
    }
};

#endif

#ifndef TELEMETRY_SINK_H
#define TELEMETRY_SINK_H

#include <stddef.h>

/// Secondary output for telemetry lines (the BLE notify transport).
class TelemetrySink {
public:
    virtual ~TelemetrySink() {}
    virtual bool isClientConnected() const = 0;
    // data is one newline-terminated JSON line.
    virtual void sendLine(const char* data, size_t len) = 0;
};

#endif

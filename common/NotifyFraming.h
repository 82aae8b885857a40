#ifndef NOTIFY_FRAMING_H
#define NOTIFY_FRAMING_H

#include <stddef.h>
#include <stdint.h>

// ATT notifications carry MTU minus a 3-byte header. 23 is the default MTU
// before any exchange.
static const uint16_t ATT_DEFAULT_MTU = 23;
static const uint16_t ATT_NOTIFY_HEADER = 3;

inline size_t notifyPayloadSize(uint16_t mtu) {
    if (mtu < ATT_DEFAULT_MTU) mtu = ATT_DEFAULT_MTU;
    return (size_t)(mtu - ATT_NOTIFY_HEADER);
}

/// Splits one telemetry line into notification-sized frames and hands each
/// to send(frame, frameLen) in order. The receiver reassembles on '\n', so
/// frames carry no header of their own. Returns the number of frames sent,
/// stopping early if send() returns false.
template <typename SendFn>
size_t sendFramed(const char* data, size_t len, uint16_t mtu, SendFn send) {
    size_t payload = notifyPayloadSize(mtu);
    size_t frames = 0;
    for (size_t offset = 0; offset < len; offset += payload) {
        size_t n = len - offset < payload ? len - offset : payload;
        if (!send((const uint8_t*)(data + offset), n)) break;
        frames++;
    }
    return frames;
}

#endif

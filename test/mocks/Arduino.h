// Minimal Arduino.h mock for host-side unit tests.
// Provides only what the testable production headers actually use.
#ifndef ARDUINO_H_MOCK
#define ARDUINO_H_MOCK

#include <stdint.h>
#include <stddef.h>
#include <climits>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <functional>
#include <mutex>
#include <string>

// constrain macro (matches Arduino)
#ifndef constrain
#define constrain(x, low, high) \
    ((x) < (low) ? (low) : ((x) > (high) ? (high) : (x)))
#endif

// Test-controllable millis(), defined in mock_impl.cpp
extern uint32_t mock_millis_value;
inline uint32_t millis() { return mock_millis_value; }

// Serial stand-in. Output is captured so tests can inspect log and
// telemetry lines; input is fed from a string.
class MockSerial {
public:
    void begin(unsigned long) {}

    size_t printf(const char* fmt, ...) {
        char buf[512];
        va_list args;
        va_start(args, fmt);
        int n = vsnprintf(buf, sizeof(buf), fmt, args);
        va_end(args);
        if (n < 0) return 0;
        size_t len = (size_t)n < sizeof(buf) ? (size_t)n : sizeof(buf) - 1;
        append(buf, len);
        return len;
    }

    size_t print(const char* s) { size_t n = strlen(s); append(s, n); return n; }
    size_t println() { append("\n", 1); return 1; }
    size_t println(const char* s) { size_t n = print(s); return n + println(); }

    size_t write(const uint8_t* data, size_t len) {
        append((const char*)data, len);
        return len;
    }

    int available() {
        std::lock_guard<std::mutex> lock(_mutex);
        return (int)(_input.size() - _inputPos);
    }

    int read() {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_inputPos >= _input.size()) return -1;
        return (uint8_t)_input[_inputPos++];
    }

    // -- test helpers --

    std::string output() {
        std::lock_guard<std::mutex> lock(_mutex);
        return _output;
    }

    void clearOutput() {
        std::lock_guard<std::mutex> lock(_mutex);
        _output.clear();
    }

    void feedInput(const std::string& s) {
        std::lock_guard<std::mutex> lock(_mutex);
        _input = s;
        _inputPos = 0;
    }

private:
    std::mutex _mutex;
    std::string _output;
    std::string _input;
    size_t _inputPos = 0;

    void append(const char* s, size_t len) {
        std::lock_guard<std::mutex> lock(_mutex);
        _output.append(s, len);
    }
};

extern MockSerial Serial;

#endif // ARDUINO_H_MOCK

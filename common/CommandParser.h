#ifndef COMMAND_PARSER_H
#define COMMAND_PARSER_H

#include <Arduino.h>
#include <ArduinoJson.h>
#include <string.h>
#include "BeaconCodec.h"

// Serial control commands, one JSON object per line:
//   {"cmd":"duty","on":15000,"off":15000}
//   {"cmd":"start"}  {"cmd":"stop"}  {"cmd":"status"}
//   {"cmd":"code","value":"0123456789abcdef"}
//   {"cmd":"mode","high":true}
enum class CommandType : uint8_t {
    NONE,
    DUTY,
    START,
    STOP,
    STATUS,
    CODE,
    MODE,
};

struct ReceiverCommand {
    CommandType type;
    uint32_t    onMs;
    uint32_t    offMs;
    uint64_t    beaconCode;
    bool        highPerformance;
};

static const size_t MAX_COMMAND_LINE = 128;

// Returns false and sets error for malformed or unknown commands.
inline bool parseCommand(const char* line, ReceiverCommand& cmd, const char*& error) {
    memset(&cmd, 0, sizeof(cmd));
    cmd.type = CommandType::NONE;
    error = nullptr;

    StaticJsonDocument<256> doc;
    DeserializationError err = deserializeJson(doc, line);
    if (err) {
        error = "invalid_json";
        return false;
    }

    const char* name = doc["cmd"];
    if (name == nullptr) {
        error = "missing_cmd";
        return false;
    }

    if (strcmp(name, "duty") == 0) {
        JsonVariant on = doc["on"];
        JsonVariant off = doc["off"];
        if (!on.is<uint32_t>() || !off.is<uint32_t>()) {
            error = "duty_needs_on_off";
            return false;
        }
        cmd.onMs = on.as<uint32_t>();
        cmd.offMs = off.as<uint32_t>();
        if (cmd.onMs == 0 || cmd.offMs == 0) {
            error = "duty_must_be_positive";
            return false;
        }
        cmd.type = CommandType::DUTY;
        return true;
    }

    if (strcmp(name, "start") == 0)  { cmd.type = CommandType::START;  return true; }
    if (strcmp(name, "stop") == 0)   { cmd.type = CommandType::STOP;   return true; }
    if (strcmp(name, "status") == 0) { cmd.type = CommandType::STATUS; return true; }

    if (strcmp(name, "code") == 0) {
        const char* value = doc["value"];
        if (!parseBeaconCode(value, cmd.beaconCode)) {
            error = "code_needs_hex_value";
            return false;
        }
        cmd.type = CommandType::CODE;
        return true;
    }

    if (strcmp(name, "mode") == 0) {
        JsonVariant high = doc["high"];
        if (!high.is<bool>()) {
            error = "mode_needs_high";
            return false;
        }
        cmd.highPerformance = high.as<bool>();
        cmd.type = CommandType::MODE;
        return true;
    }

    error = "unknown_cmd";
    return false;
}

// Accumulates serial bytes into lines. Returns true when line holds a
// complete command. Overlong lines are discarded up to the next newline.
class CommandLineBuffer {
public:
    bool feed(char c) {
        if (c == '\r') return false;
        if (c == '\n') {
            bool complete = !_overflow && _len > 0;
            _buf[_len] = '\0';
            _len = 0;
            _overflow = false;
            return complete;
        }
        if (_len >= MAX_COMMAND_LINE) {
            _overflow = true;
            return false;
        }
        _buf[_len++] = c;
        return false;
    }

    const char* line() const { return _buf; }

private:
    char   _buf[MAX_COMMAND_LINE + 1] = {0};
    size_t _len = 0;
    bool   _overflow = false;
};

#endif

#include "doctest.h"
#include "EventBroadcaster.h"
#include <stdexcept>
#include <string>

// Records every callback into a shared journal so ordering across
// listeners is visible.
class JournalListener : public BeaconListener {
public:
    JournalListener(const char* name, std::vector<std::string>& journal)
        : _name(name), _journal(journal) {}

    void onStart() override { _journal.push_back(_name + ":start"); }
    void onStartFailed(int errorCode) override {
        _journal.push_back(_name + ":failed:" + std::to_string(errorCode));
    }
    void onStop() override { _journal.push_back(_name + ":stop"); }
    void onDetect(const DetectionEvent& event) override {
        _journal.push_back(_name + ":detect:" + std::to_string(event.peerBeaconCode));
    }

private:
    std::string _name;
    std::vector<std::string>& _journal;
};

class ThrowingListener : public BeaconListener {
public:
    void onStart() override { throw std::runtime_error("boom"); }
};

// Throws something that is not a std::exception.
class IntThrowingListener : public BeaconListener {
public:
    void onDetect(const DetectionEvent&) override { throw 42; }
};

class SelfRemovingListener : public BeaconListener {
public:
    explicit SelfRemovingListener(EventBroadcaster& bus) : bus(bus) {}
    EventBroadcaster& bus;
    int starts = 0;
    void onStart() override {
        starts++;
        bus.removeListener(this);
    }
};

// ============================================================
// Registration
// ============================================================

TEST_CASE("EventBroadcaster: add and remove are idempotent") {
    EventBroadcaster bus;
    std::vector<std::string> journal;
    JournalListener a("a", journal);

    CHECK(bus.addListener(&a));
    CHECK_FALSE(bus.addListener(&a));
    CHECK(bus.listenerCount() == 1);

    CHECK(bus.removeListener(&a));
    CHECK_FALSE(bus.removeListener(&a));
    CHECK(bus.listenerCount() == 0);

    CHECK_FALSE(bus.addListener(nullptr));
}

TEST_CASE("EventBroadcaster: delivers in registration order") {
    EventBroadcaster bus;
    std::vector<std::string> journal;
    JournalListener a("a", journal), b("b", journal), c("c", journal);
    bus.addListener(&a);
    bus.addListener(&b);
    bus.addListener(&c);
    bus.removeListener(&b);
    bus.addListener(&b);

    bus.broadcastStart();
    REQUIRE(journal.size() == 3);
    CHECK(journal[0] == "a:start");
    CHECK(journal[1] == "c:start");
    CHECK(journal[2] == "b:start");
}

TEST_CASE("EventBroadcaster: every event kind reaches listeners") {
    EventBroadcaster bus;
    std::vector<std::string> journal;
    JournalListener a("a", journal);
    bus.addListener(&a);

    DetectionEvent event = { 100, 42, -55 };
    bus.broadcastStart();
    bus.broadcastDetect(event);
    bus.broadcastStartFailed(BEACON_ERR_SCAN_FAILED);
    bus.broadcastStop();

    REQUIRE(journal.size() == 4);
    CHECK(journal[0] == "a:start");
    CHECK(journal[1] == "a:detect:42");
    CHECK(journal[2] == "a:failed:3");
    CHECK(journal[3] == "a:stop");
}

TEST_CASE("EventBroadcaster: removed listener gets nothing further") {
    EventBroadcaster bus;
    std::vector<std::string> journal;
    JournalListener a("a", journal);
    bus.addListener(&a);
    bus.removeListener(&a);
    bus.broadcastStop();
    CHECK(journal.empty());
}

// ============================================================
// Fault isolation
// ============================================================

TEST_CASE("EventBroadcaster: throwing listener does not block the rest") {
    EventBroadcaster bus;
    std::vector<std::string> journal;
    ThrowingListener bad;
    JournalListener a("a", journal);
    bus.addListener(&bad);
    bus.addListener(&a);

    Serial.clearOutput();
    bus.broadcastStart();
    REQUIRE(journal.size() == 1);
    CHECK(journal[0] == "a:start");
    CHECK(Serial.output().find("[BUS] Listener 0 failed on start: boom") != std::string::npos);
}

TEST_CASE("EventBroadcaster: non-standard exception is contained") {
    EventBroadcaster bus;
    std::vector<std::string> journal;
    IntThrowingListener bad;
    JournalListener a("a", journal);
    bus.addListener(&bad);
    bus.addListener(&a);

    Serial.clearOutput();
    DetectionEvent event = { 100, 7, -60 };
    CHECK_NOTHROW(bus.broadcastDetect(event));
    REQUIRE(journal.size() == 1);
    CHECK(journal[0] == "a:detect:7");
    CHECK(Serial.output().find("[BUS] Listener 0 failed on detect: unknown exception") !=
          std::string::npos);
}

TEST_CASE("EventBroadcaster: listener may remove itself during delivery") {
    EventBroadcaster bus;
    std::vector<std::string> journal;
    SelfRemovingListener once(bus);
    JournalListener a("a", journal);
    bus.addListener(&once);
    bus.addListener(&a);

    bus.broadcastStart();
    bus.broadcastStart();
    CHECK(once.starts == 1);
    CHECK(journal.size() == 2);
    CHECK(bus.listenerCount() == 1);
}

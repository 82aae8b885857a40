#include "doctest.h"
#include "SightingClassifier.h"
#include "FakeRadio.h"

static std::vector<uint8_t> tails(const std::vector<ClassifiedSighting>& out) {
    std::vector<uint8_t> t;
    for (size_t i = 0; i < out.size(); i++) t.push_back(out[i].sighting.mac[5]);
    return t;
}

// ============================================================
// Categories
// ============================================================

TEST_CASE("Classifier: category follows marker and service presence") {
    SightingCategory c;
    CHECK(categorizeSighting(makeSighting(1, -50, false, true), PROXIBEACON_SERVICE_ID, c));
    CHECK(c == SightingCategory::NATIVE_PEER);
    CHECK(categorizeSighting(makeSighting(2, -50, true, true), PROXIBEACON_SERVICE_ID, c));
    CHECK(c == SightingCategory::MARKED_FOREGROUND);
    CHECK(categorizeSighting(makeSighting(3, -50, true, false), PROXIBEACON_SERVICE_ID, c));
    CHECK(c == SightingCategory::MARKED_BACKGROUND);
    CHECK_FALSE(categorizeSighting(makeSighting(4, -50, false, false), PROXIBEACON_SERVICE_ID, c));
}

TEST_CASE("Classifier: service under a different id does not count") {
    SightingCategory c;
    Sighting s = makeSighting(1, -50, true, true, 0x1122334455667788ULL);
    CHECK(categorizeSighting(s, PROXIBEACON_SERVICE_ID, c));
    CHECK(c == SightingCategory::MARKED_BACKGROUND);
}

// ============================================================
// Ordering
// ============================================================

TEST_CASE("Classifier: native peers precede stronger marked devices") {
    std::vector<Sighting> in;
    in.push_back(makeSighting(0xA, -40, false, true));  // native
    in.push_back(makeSighting(0xB, -30, true, false));  // marked background

    std::vector<ClassifiedSighting> out;
    CHECK(classifySightings(in, PROXIBEACON_SERVICE_ID, out) == 0);
    REQUIRE(out.size() == 2);
    CHECK(out[0].sighting.mac[5] == 0xA);
    CHECK(out[0].category == SightingCategory::NATIVE_PEER);
    CHECK(out[1].sighting.mac[5] == 0xB);
    CHECK(out[1].category == SightingCategory::MARKED_BACKGROUND);
}

TEST_CASE("Classifier: groups ordered, strongest first inside a group") {
    std::vector<Sighting> in;
    in.push_back(makeSighting(1, -80, true, false));   // background
    in.push_back(makeSighting(2, -70, true, true));    // foreground
    in.push_back(makeSighting(3, -60, false, true));   // native
    in.push_back(makeSighting(4, -50, true, false));   // background
    in.push_back(makeSighting(5, -90, false, true));   // native
    in.push_back(makeSighting(6, -40, true, true));    // foreground

    std::vector<ClassifiedSighting> out;
    classifySightings(in, PROXIBEACON_SERVICE_ID, out);

    std::vector<uint8_t> expected;
    expected.push_back(3); expected.push_back(5);
    expected.push_back(6); expected.push_back(2);
    expected.push_back(4); expected.push_back(1);
    CHECK(tails(out) == expected);
}

TEST_CASE("Classifier: equal RSSI keeps scan order") {
    std::vector<Sighting> in;
    in.push_back(makeSighting(9, -60, false, true));
    in.push_back(makeSighting(8, -60, false, true));
    in.push_back(makeSighting(7, -60, false, true));

    std::vector<ClassifiedSighting> out;
    classifySightings(in, PROXIBEACON_SERVICE_ID, out);
    std::vector<uint8_t> expected;
    expected.push_back(9); expected.push_back(8); expected.push_back(7);
    CHECK(tails(out) == expected);
}

// ============================================================
// Deduplication
// ============================================================

TEST_CASE("Classifier: each peer appears once, at its best position") {
    std::vector<Sighting> in;
    in.push_back(makeSighting(1, -80, false, true));
    in.push_back(makeSighting(2, -70, false, true));
    in.push_back(makeSighting(1, -50, false, true));  // same peer, stronger
    in.push_back(makeSighting(2, -40, true, false));  // same peer, other group

    std::vector<ClassifiedSighting> out;
    classifySightings(in, PROXIBEACON_SERVICE_ID, out);
    REQUIRE(out.size() == 2);
    CHECK(out[0].sighting.mac[5] == 1);
    CHECK(out[0].sighting.rssi == -50);
    CHECK(out[1].sighting.mac[5] == 2);
    CHECK(out[1].sighting.rssi == -70);
    CHECK(out[1].category == SightingCategory::NATIVE_PEER);
}

TEST_CASE("Classifier: address type distinguishes peers") {
    std::vector<Sighting> in;
    Sighting a = makeSighting(1, -50, false, true);
    Sighting b = a;
    b.addressType = 1;
    in.push_back(a);
    in.push_back(b);

    std::vector<ClassifiedSighting> out;
    classifySightings(in, PROXIBEACON_SERVICE_ID, out);
    CHECK(out.size() == 2);
}

TEST_CASE("Classifier: unmatched sightings are counted and dropped") {
    std::vector<Sighting> in;
    in.push_back(makeSighting(1, -50, false, false));
    in.push_back(makeSighting(2, -50, false, true));
    in.push_back(makeSighting(3, -50, false, false));

    std::vector<ClassifiedSighting> out;
    CHECK(classifySightings(in, PROXIBEACON_SERVICE_ID, out) == 2);
    REQUIRE(out.size() == 1);
    CHECK(out[0].sighting.mac[5] == 2);
}

TEST_CASE("Classifier: empty input gives empty output") {
    std::vector<Sighting> in;
    std::vector<ClassifiedSighting> out;
    out.push_back(ClassifiedSighting());
    CHECK(classifySightings(in, PROXIBEACON_SERVICE_ID, out) == 0);
    CHECK(out.empty());
}

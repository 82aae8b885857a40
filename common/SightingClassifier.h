#ifndef SIGHTING_CLASSIFIER_H
#define SIGHTING_CLASSIFIER_H

#include <algorithm>
#include <vector>
#include "BeaconTypes.h"
#include "BeaconCodec.h"

// ============================================================
// Sighting classification
// Orders one scan phase worth of sightings for resolution:
//   NATIVE_PEER ++ MARKED_FOREGROUND ++ MARKED_BACKGROUND,
// each strongest signal first, then keeps only the first entry per peer.
// Pure logic -- no radio access. Safe from any context.
// ============================================================

// Returns false for sightings no category accepts (unmarked and not
// advertising the service; the scan filters never pass these).
inline bool categorizeSighting(const Sighting& s, uint64_t serviceId,
                               SightingCategory& category) {
    bool advertisesService = sightingAdvertisesService(s, serviceId);
    if (!s.hasManufacturerMarker) {
        if (!advertisesService) return false;
        category = SightingCategory::NATIVE_PEER;
        return true;
    }
    category = advertisesService ? SightingCategory::MARKED_FOREGROUND
                                 : SightingCategory::MARKED_BACKGROUND;
    return true;
}

// Priority first, then descending RSSI. Used with stable_sort so equal
// entries keep their scan order.
inline bool classifiedBefore(const ClassifiedSighting& a,
                             const ClassifiedSighting& b) {
    if (a.category != b.category) return a.category < b.category;
    return a.sighting.rssi > b.sighting.rssi;
}

// Fills out with the ordered, deduplicated sequence. Returns the number of
// input sightings that matched no category.
inline size_t classifySightings(const std::vector<Sighting>& sightings,
                                uint64_t serviceId,
                                std::vector<ClassifiedSighting>& out) {
    out.clear();
    size_t rejected = 0;

    std::vector<ClassifiedSighting> ordered;
    ordered.reserve(sightings.size());
    for (size_t i = 0; i < sightings.size(); i++) {
        ClassifiedSighting c;
        if (!categorizeSighting(sightings[i], serviceId, c.category)) {
            rejected++;
            continue;
        }
        c.sighting = sightings[i];
        ordered.push_back(c);
    }

    std::stable_sort(ordered.begin(), ordered.end(), classifiedBefore);

    out.reserve(ordered.size());
    for (size_t i = 0; i < ordered.size(); i++) {
        bool seen = false;
        for (size_t j = 0; j < out.size(); j++) {
            if (samePeer(out[j].sighting, ordered[i].sighting)) {
                seen = true;
                break;
            }
        }
        if (!seen) out.push_back(ordered[i]);
    }
    return rejected;
}

#endif

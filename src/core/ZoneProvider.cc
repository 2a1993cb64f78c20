#include "stride/core/ZoneProvider.hh"

#include "stride/core/Log.hh"
#include "stride/utils/ErrorHandling.hh"

#include <algorithm>

namespace stride {

bool ZoneSnapshot::contains(const ClimbZonePtr& zone) const {
    if (!zone)
        return false;
    if (currentLadder.lock() == zone)
        return true;
    return std::any_of(climbZones.begin(), climbZones.end(),
                       [&zone](const std::weak_ptr<const ClimbZone>& w) { return w.lock() == zone; });
}

ClimbZonePtr ZoneSnapshot::activeZone() const {
    if (auto ladder = currentLadder.lock())
        return ladder;
    for (const auto& w : climbZones) {
        if (auto zone = w.lock())
            return zone;
    }
    return nullptr;
}

void ZoneProvider::pruneExpired() {
    climbZones_.erase(std::remove_if(climbZones_.begin(), climbZones_.end(),
                                     [](const std::weak_ptr<const ClimbZone>& w) { return w.expired(); }),
                      climbZones_.end());
}

void ZoneProvider::enterClimbZone(const ClimbZonePtr& zone) {
    if (!zone) {
        throwError("Cannot enter a null climb zone");
    }

    pruneExpired();
    bool present = std::any_of(climbZones_.begin(), climbZones_.end(),
                               [&zone](const std::weak_ptr<const ClimbZone>& w) { return w.lock() == zone; });
    if (present)
        return;

    climbZones_.push_back(zone);
    STRIDE_MOVEMENT_DEBUG("Entered climb zone ({} active, free climb {})", climbZones_.size(),
                          zone->allowFreeClimbing);
}

bool ZoneProvider::exitClimbZone(const ClimbZonePtr& zone) {
    pruneExpired();
    auto it = std::find_if(climbZones_.begin(), climbZones_.end(),
                           [&zone](const std::weak_ptr<const ClimbZone>& w) { return w.lock() == zone; });
    if (it == climbZones_.end())
        return false;

    climbZones_.erase(it);
    STRIDE_MOVEMENT_DEBUG("Exited climb zone ({} active)", climbZones_.size());
    return true;
}

size_t ZoneProvider::climbZoneCount() const {
    return static_cast<size_t>(std::count_if(climbZones_.begin(), climbZones_.end(),
                                             [](const std::weak_ptr<const ClimbZone>& w) { return !w.expired(); }));
}

void ZoneProvider::setCurrentLadder(const ClimbZonePtr& ladder) {
    if (!ladder) {
        throwError("Current ladder cannot be null; use clearCurrentLadder()");
    }
    currentLadder_ = ladder;
}

void ZoneProvider::clearCurrentLadder() {
    currentLadder_.reset();
}

ZoneSnapshot ZoneProvider::snapshot() const {
    ZoneSnapshot snap;
    snap.inCrouchZone = inCrouchZone_;
    snap.currentLadder = currentLadder_;
    for (const auto& w : climbZones_) {
        if (!w.expired())
            snap.climbZones.push_back(w);
    }
    return snap;
}

} // namespace stride

#pragma once

#include "stride/core/Spatial.hh"

#include <memory>
#include <vector>

namespace stride {

// Geometry of a ladder or free-climb surface. Offsets are in the zone's
// local frame; forward is the direction a climbing character faces.
struct ClimbZone {
    LocalVec3f startOffset;
    LocalVec3f endOffset;
    Transformf transform;
    bool allowFreeClimbing = false;

    Vec3f startAnchor() const { return transform.transformPoint(startOffset); }
    Vec3f endAnchor() const { return transform.transformPoint(endOffset); }
    Vec3f forward() const { return transform.forward(); }
    Vec3f right() const { return transform.right(); }
};

using ClimbZonePtr = std::shared_ptr<const ClimbZone>;

// Zone membership for one tick. Zones are referenced weakly; a zone that has
// been destroyed simply stops being a member.
struct ZoneSnapshot {
    bool inCrouchZone = false;
    std::vector<std::weak_ptr<const ClimbZone>> climbZones;
    std::weak_ptr<const ClimbZone> currentLadder;

    bool contains(const ClimbZonePtr& zone) const;

    // Current ladder if set, otherwise the earliest live climb zone
    ClimbZonePtr activeZone() const;
};

// Trigger-side bookkeeping of the zones a character overlaps.
class ZoneProvider {
  public:
    void setInCrouchZone(bool inZone) { inCrouchZone_ = inZone; }
    bool inCrouchZone() const { return inCrouchZone_; }

    // Ordered by entry; entering a zone twice keeps the first entry
    void enterClimbZone(const ClimbZonePtr& zone);
    bool exitClimbZone(const ClimbZonePtr& zone);
    size_t climbZoneCount() const;

    void setCurrentLadder(const ClimbZonePtr& ladder);
    void clearCurrentLadder();
    ClimbZonePtr currentLadder() const { return currentLadder_.lock(); }

    ZoneSnapshot snapshot() const;

  private:
    void pruneExpired();

    bool inCrouchZone_ = false;
    std::vector<std::weak_ptr<const ClimbZone>> climbZones_;
    std::weak_ptr<const ClimbZone> currentLadder_;
};

} // namespace stride

#pragma once

#include "stride/core/CharacterTypes.hh"
#include "stride/core/PhysicsInterfaces.hh"
#include "stride/core/Spatial.hh"

#include <vector>

namespace stride {

struct CastResult {
    bool hit = false;
    Vec3f point;
    Vec3f normal;
    float distance = 0.0f;
    ColliderHandle collider = kInvalidCollider;
};

// Directional probe fired from a point fixed to the owner's body.
//
// Each cast moves the owner's colliders to kIgnoreRaycastLayer for the
// duration of the query so the character can never detect itself, then
// normalizes the hit into a single CastResult regardless of cast type.
class Sensor {
  public:
    Sensor(PhysicsQuery& physics, const RigidBody& owner);

    // Colliders excluded from every cast. The owner's collider is added by
    // the constructor; duplicates are ignored.
    void addIgnoredCollider(ColliderHandle collider);
    const std::vector<ColliderHandle>& ignoredColliders() const { return ignoreList_; }

    void setCastType(CastType type);
    CastType castType() const { return castType_; }

    void setCastDirection(CastDirection direction) { castDirection_ = direction; }
    CastDirection castDirection() const { return castDirection_; }

    // Cast origin relative to the owner's pose
    void setOriginOffset(const LocalVec3f& offset) { originOffset_ = offset; }
    const LocalVec3f& originOffset() const { return originOffset_; }

    // World-space cast origin, stored relative to the owner's current pose
    void setCastOrigin(const Vec3f& worldPoint);

    void setCastLength(float length) { castLength_ = length; }
    float castLength() const { return castLength_; }

    void setLayerMask(LayerMask mask) { layerMask_ = mask; }
    LayerMask layerMask() const { return layerMask_; }

    void setSphereRadius(float radius) { sphereRadius_ = radius; }
    float sphereRadius() const { return sphereRadius_; }

    // Sphere casts only: report the hit's distance along the cast axis
    // instead of the swept distance plus radius.
    void setCalculateRealDistance(bool enabled) { calculateRealDistance_ = enabled; }

    // Sphere casts only: replace the sweep normal with the surface normal
    // under the contact point.
    void setCalculateRealSurfaceNormal(bool enabled) { calculateRealSurfaceNormal_ = enabled; }

    /**
     * @brief Start offsets for the ray-array cast
     *
     * Produces a centre point followed by `rows` concentric rings. Ring i
     * (zero-based) lies at radius (i + 1) / rows and holds raysPerRow * (i + 1)
     * evenly spaced rays; with `offsetRows` the even rings are rotated by half
     * an angular step. All positions are scaled by `radius` and lie in the
     * local XZ plane.
     */
    static std::vector<LocalVec3f> raycastStartPositions(int rows, int raysPerRow, bool offsetRows, float radius);

    void recalibrate(int rows, int raysPerRow, bool offsetRows, float radius);
    const std::vector<LocalVec3f>& arrayStartPositions() const { return arrayStartPositions_; }

    void cast();

    const CastResult& result() const { return result_; }
    bool hasDetectedHit() const { return result_.hit; }
    const Vec3f& hitPoint() const { return result_.point; }
    const Vec3f& hitNormal() const { return result_.normal; }
    float hitDistance() const { return result_.distance; }
    ColliderHandle hitCollider() const { return result_.collider; }

    Vec3f worldCastDirection() const;
    Vec3f worldOrigin() const;

  private:
    void resetHit(const Vec3f& origin, const Vec3f& direction);
    void castRay(const Vec3f& origin, const Vec3f& direction);
    void castSphere(const Vec3f& origin, const Vec3f& direction);
    void castRayArray(const Vec3f& origin, const Vec3f& direction);

    PhysicsQuery& physics_;
    const RigidBody& owner_;
    std::vector<ColliderHandle> ignoreList_;

    CastType castType_ = CastType::Raycast;
    CastDirection castDirection_ = CastDirection::Down;
    LocalVec3f originOffset_;
    float castLength_ = 1.0f;
    LayerMask layerMask_ = kAllLayers;
    float sphereRadius_ = 0.2f;
    bool calculateRealDistance_ = false;
    bool calculateRealSurfaceNormal_ = false;
    bool warnedUnknownType_ = false;

    std::vector<LocalVec3f> arrayStartPositions_;

    // Last trustworthy refined normal, used for grazing sphere hits
    Vec3f backupNormal_;
    bool hasBackupNormal_ = false;

    CastResult result_;
};

} // namespace stride

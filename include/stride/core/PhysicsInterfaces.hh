#pragma once

#include "stride/core/CharacterTypes.hh"
#include "stride/core/Spatial.hh"

#include <cstdint>
#include <optional>

namespace stride {

using ColliderHandle = uint32_t;
using LayerMask = uint32_t;

inline constexpr ColliderHandle kInvalidCollider = 0;
inline constexpr int kLayerCount = 32;
inline constexpr int kDefaultLayer = 0;
inline constexpr int kIgnoreRaycastLayer = 2;
inline constexpr LayerMask kAllLayers = 0xFFFFFFFFu;

inline constexpr LayerMask layerBit(int layer) {
    return LayerMask{1} << static_cast<unsigned>(layer);
}

enum class TriggerInteraction : uint8_t {
    Ignore,
    Collide
};

struct RaycastHit {
    Vec3f point;
    Vec3f normal;
    float distance = 0.0f;
    ColliderHandle collider = kInvalidCollider;
};

// Spatial queries against the physics world. Directions must be unit length.
// A spherecast reports the distance the sphere centre travelled before
// touching the surface, like most engines do.
class PhysicsQuery {
  public:
    virtual ~PhysicsQuery() = default;

    virtual std::optional<RaycastHit> raycast(const Vec3f& origin, const Vec3f& direction, float maxDistance,
                                              LayerMask mask, TriggerInteraction triggers) const = 0;

    virtual std::optional<RaycastHit> spherecast(const Vec3f& origin, float radius, const Vec3f& direction,
                                                 float maxDistance, LayerMask mask,
                                                 TriggerInteraction triggers) const = 0;

    // Ray test against a single collider, ignoring layers
    virtual std::optional<RaycastHit> raycastCollider(ColliderHandle collider, const Vec3f& origin,
                                                      const Vec3f& direction, float maxDistance) const = 0;

    virtual int colliderLayer(ColliderHandle collider) const = 0;
    virtual void setColliderLayer(ColliderHandle collider, int layer) = 0;

    // Layer collision matrix
    virtual bool layersCollide(int a, int b) const = 0;
};

// Dynamic body the character drives by velocity.
class RigidBody {
  public:
    virtual ~RigidBody() = default;

    virtual Vec3f velocity() const = 0;
    virtual void setVelocity(const Vec3f& velocity) = 0;
    virtual void movePosition(const Vec3f& position) = 0;

    virtual void setFreezeRotation(bool freeze) = 0;
    virtual void setGravityEnabled(bool enabled) = 0;

    virtual Transformf pose() const = 0;

    virtual ColliderHandle collider() const = 0;
    virtual int layer() const = 0;
    virtual void setColliderShape(const ColliderShape& shape) = 0;
};

// Moves a collider to another layer for the lifetime of the guard.
class ScopedLayerOverride {
  public:
    ScopedLayerOverride(PhysicsQuery& physics, ColliderHandle collider, int layer)
        : physics_(physics), collider_(collider), previous_(physics.colliderLayer(collider)) {
        physics_.setColliderLayer(collider_, layer);
    }

    ~ScopedLayerOverride() { physics_.setColliderLayer(collider_, previous_); }

    ScopedLayerOverride(const ScopedLayerOverride&) = delete;
    ScopedLayerOverride& operator=(const ScopedLayerOverride&) = delete;

  private:
    PhysicsQuery& physics_;
    ColliderHandle collider_;
    int previous_;
};

} // namespace stride

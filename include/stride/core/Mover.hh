#pragma once

#include "stride/core/CharacterConfig.hh"
#include "stride/core/PhysicsInterfaces.hh"
#include "stride/core/Sensor.hh"
#include "stride/core/Spatial.hh"

namespace stride {

// Owns the character collider shape and ground contact.
//
// The collider sits on top of a step buffer of height * stepHeightRatio.
// Every checkForGround() casts the sensor down from the collider centre and
// derives a correction velocity that restores the configured standoff in
// exactly one tick. setVelocity() adds that correction transparently.
class Mover {
  public:
    Mover(PhysicsQuery& physics, RigidBody& body, const MoverConfig& config = {});

    // False when constructed with a body that has no collider
    bool isEnabled() const { return enabled_; }

    void checkForGround(float dt);

    bool isGrounded() const { return grounded_; }
    const Vec3f& groundNormal() const { return sensor_.hitNormal(); }
    const Vec3f& groundPoint() const { return sensor_.hitPoint(); }
    ColliderHandle groundCollider() const { return sensor_.hitCollider(); }

    void setUseExtendedSensorRange(bool extended) { useExtendedSensorRange_ = extended; }
    bool useExtendedSensorRange() const { return useExtendedSensorRange_; }

    Vec3f velocity() const;
    void setVelocity(const Vec3f& velocity);
    void movePosition(const Vec3f& position);

    Transformf pose() const { return body_.pose(); }

    const Vec3f& groundAdjustmentVelocity() const { return groundAdjustmentVelocity_; }

    float colliderHeight() const { return config_.colliderHeight; }
    void setColliderHeight(float height);

    float colliderThickness() const { return config_.colliderThickness; }
    void setColliderThickness(float thickness);

    float stepHeightRatio() const { return config_.stepHeightRatio; }
    void setStepHeightRatio(float ratio);

    // Applies all three dimensions and re-arms the sensor once
    void setDimensions(float height, float thickness, float stepHeightRatio);

    const ColliderShape& colliderShape() const { return shape_; }
    Vec3f colliderCenter() const;

    float baseSensorRange() const { return baseSensorRange_; }
    float extendedSensorRange() const;

    const Sensor& sensor() const { return sensor_; }
    const MoverConfig& config() const { return config_; }

  private:
    void recalculateColliderDimensions();
    void recalibrateSensor();
    void recalculateSensorLayerMask();
    float scale() const;

    PhysicsQuery& physics_;
    RigidBody& body_;
    MoverConfig config_;
    Sensor sensor_;
    ColliderShape shape_;

    bool enabled_ = true;
    bool grounded_ = false;
    bool useExtendedSensorRange_ = true;
    float baseSensorRange_ = 0.0f;
    int currentLayer_ = kDefaultLayer;

    Vec3f groundAdjustmentVelocity_;
};

} // namespace stride

#include "stride/core/Mover.hh"

#include "stride/core/Log.hh"

#include <algorithm>
#include <cmath>

namespace stride {

Mover::Mover(PhysicsQuery& physics, RigidBody& body, const MoverConfig& config)
    : physics_(physics), body_(body), config_(config), sensor_(physics, body) {
    validate(config_);

    if (body_.collider() == kInvalidCollider) {
        STRIDE_LOG_ERROR("Mover created for a body without a collider, ground detection disabled");
        enabled_ = false;
        return;
    }

    body_.setFreezeRotation(true);
    body_.setGravityEnabled(false);

    recalculateColliderDimensions();
}

float Mover::scale() const {
    return body_.pose().getScale().x;
}

void Mover::setColliderHeight(float height) {
    if (std::abs(config_.colliderHeight - height) < 1e-6f)
        return;
    config_.colliderHeight = std::max(height, 0.01f);
    recalculateColliderDimensions();
}

void Mover::setColliderThickness(float thickness) {
    if (std::abs(config_.colliderThickness - thickness) < 1e-6f)
        return;
    config_.colliderThickness = std::max(thickness, 0.0f);
    recalculateColliderDimensions();
}

void Mover::setStepHeightRatio(float ratio) {
    config_.stepHeightRatio = std::clamp(ratio, 0.0f, 1.0f);
    recalculateColliderDimensions();
}

void Mover::setDimensions(float height, float thickness, float stepHeightRatio) {
    config_.colliderHeight = std::max(height, 0.01f);
    config_.colliderThickness = std::max(thickness, 0.0f);
    config_.stepHeightRatio = std::clamp(stepHeightRatio, 0.0f, 1.0f);
    recalculateColliderDimensions();
}

void Mover::recalculateColliderDimensions() {
    if (!enabled_)
        return;

    const float height = config_.colliderHeight;
    const float thickness = config_.colliderThickness;
    const float ratio = config_.stepHeightRatio;

    ColliderShape shape;
    shape.kind = config_.colliderKind;
    shape.center = config_.colliderOffset * height;

    switch (config_.colliderKind) {
        case ColliderKind::Box: {
            shape.size = LocalVec3f(thickness, height * (1.0f - ratio), thickness);
            shape.center += LocalVec3f(0.0f, ratio * height / 2.0f, 0.0f);
            break;
        }
        case ColliderKind::Sphere: {
            float radius = height / 2.0f;
            shape.center += LocalVec3f(0.0f, ratio * radius, 0.0f);
            shape.radius = radius * (1.0f - ratio);
            break;
        }
        case ColliderKind::Capsule:
        default: {
            shape.kind = ColliderKind::Capsule;
            shape.radius = thickness / 2.0f;
            shape.center += LocalVec3f(0.0f, ratio * height / 2.0f, 0.0f);
            shape.height = height * (1.0f - ratio);
            if (shape.height / 2.0f < shape.radius) {
                shape.radius = shape.height / 2.0f;
            }
            break;
        }
    }

    shape_ = shape;
    body_.setColliderShape(shape_);

    STRIDE_PHYSICS_DEBUG("Collider recalculated: {} height {} thickness {} step ratio {}",
                         colliderKindToString(shape_.kind), height, thickness, ratio);

    recalibrateSensor();
}

Vec3f Mover::colliderCenter() const {
    return body_.pose().transformPoint(shape_.center);
}

void Mover::recalibrateSensor() {
    const float height = config_.colliderHeight;
    const float ratio = config_.stepHeightRatio;
    const float safety = config_.safetyDistanceFactor;

    sensor_.setCastOrigin(colliderCenter());
    sensor_.setCastDirection(CastDirection::Down);

    recalculateSensorLayerMask();

    sensor_.setCastType(config_.sensorType);

    float radius = config_.colliderThickness / 2.0f * config_.sensorRadiusModifier;
    float upper = 0.0f;
    switch (shape_.kind) {
        case ColliderKind::Box:     upper = shape_.size.y / 2.0f; break;
        case ColliderKind::Sphere:  upper = shape_.radius; break;
        case ColliderKind::Capsule: upper = shape_.height / 2.0f; break;
        default:                    upper = shape_.height / 2.0f; break;
    }
    upper *= 1.0f - safety;
    radius = std::clamp(radius, safety, std::max(upper, safety));

    sensor_.setSphereRadius(radius * scale());

    float length = height * (1.0f - ratio) * 0.5f + height * ratio;
    baseSensorRange_ = length * (1.0f + safety) * scale();
    sensor_.setCastLength(length * scale());

    sensor_.setCalculateRealDistance(true);
    sensor_.setCalculateRealSurfaceNormal(true);

    sensor_.recalibrate(config_.sensorArrayRows, config_.sensorArrayRayCount, config_.sensorArrayRowsAreOffset,
                        sensor_.sphereRadius());
}

void Mover::recalculateSensorLayerMask() {
    const int objectLayer = body_.layer();

    LayerMask mask = 0;
    for (int i = 0; i < kLayerCount; ++i) {
        if (physics_.layersCollide(objectLayer, i)) {
            mask |= layerBit(i);
        }
    }
    mask &= ~layerBit(kIgnoreRaycastLayer);

    sensor_.setLayerMask(mask);
    currentLayer_ = objectLayer;
}

float Mover::extendedSensorRange() const {
    return baseSensorRange_ + config_.colliderHeight * scale() * config_.stepHeightRatio;
}

void Mover::checkForGround(float dt) {
    groundAdjustmentVelocity_ = Vec3f::zero();

    if (!enabled_) {
        grounded_ = false;
        return;
    }

    if (currentLayer_ != body_.layer()) {
        recalculateSensorLayerMask();
    }

    sensor_.setCastLength(useExtendedSensorRange_ ? extendedSensorRange() : baseSensorRange_);
    sensor_.cast();

    if (!sensor_.hasDetectedHit()) {
        grounded_ = false;
        return;
    }

    grounded_ = true;

    if (dt <= 0.0f)
        return;

    const float height = config_.colliderHeight * scale();
    const float ratio = config_.stepHeightRatio;
    float upperLimit = height * (1.0f - ratio) * 0.5f;
    float middle = upperLimit + height * ratio;
    float distanceToGo = middle - sensor_.hitDistance();

    groundAdjustmentVelocity_ = body_.pose().up() * (distanceToGo / dt);
}

Vec3f Mover::velocity() const {
    return body_.velocity();
}

void Mover::setVelocity(const Vec3f& velocity) {
    body_.setVelocity(velocity + groundAdjustmentVelocity_);
}

void Mover::movePosition(const Vec3f& position) {
    body_.movePosition(position);
}

} // namespace stride

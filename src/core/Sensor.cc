#include "stride/core/Sensor.hh"

#include "stride/core/Log.hh"
#include "stride/core/VectorMath.hh"

#include <algorithm>
#include <cmath>
#include <memory>

namespace stride {

namespace {

// Secondary ray used to refine sphere-cast normals
constexpr float kNormalProbeLength = 1.5f;
constexpr float kGrazingAngleLimit = 89.0f;

} // namespace

Sensor::Sensor(PhysicsQuery& physics, const RigidBody& owner) : physics_(physics), owner_(owner) {
    addIgnoredCollider(owner.collider());
}

void Sensor::addIgnoredCollider(ColliderHandle collider) {
    if (collider == kInvalidCollider)
        return;
    if (std::find(ignoreList_.begin(), ignoreList_.end(), collider) == ignoreList_.end()) {
        ignoreList_.push_back(collider);
    }
}

void Sensor::setCastType(CastType type) {
    castType_ = type;
    warnedUnknownType_ = false;
}

std::vector<LocalVec3f> Sensor::raycastStartPositions(int rows, int raysPerRow, bool offsetRows, float radius) {
    std::vector<LocalVec3f> positions;
    positions.emplace_back(0.0f, 0.0f, 0.0f);

    for (int i = 0; i < rows; ++i) {
        float rowRadius = static_cast<float>(i + 1) / static_cast<float>(rows);
        int rayCount = raysPerRow * (i + 1);
        float step = 360.0f / static_cast<float>(rayCount);

        for (int j = 0; j < rayCount; ++j) {
            float angle = step * static_cast<float>(j);
            if (offsetRows && i % 2 == 0) {
                angle += step / 2.0f;
            }

            float rad = angle * vecmath::kDegToRad;
            positions.emplace_back(rowRadius * std::cos(rad) * radius, 0.0f, rowRadius * std::sin(rad) * radius);
        }
    }

    return positions;
}

void Sensor::recalibrate(int rows, int raysPerRow, bool offsetRows, float radius) {
    arrayStartPositions_ = raycastStartPositions(rows, raysPerRow, offsetRows, radius);
}

Vec3f Sensor::worldCastDirection() const {
    Transformf pose = owner_.pose();
    switch (castDirection_) {
        case CastDirection::Forward:  return pose.forward();
        case CastDirection::Right:    return pose.right();
        case CastDirection::Up:       return pose.up();
        case CastDirection::Backward: return -pose.forward();
        case CastDirection::Left:     return -pose.right();
        case CastDirection::Down:     return -pose.up();
        default:                      return -pose.up();
    }
}

void Sensor::setCastOrigin(const Vec3f& worldPoint) {
    originOffset_ = owner_.pose().inverseTransformPoint(worldPoint);
}

Vec3f Sensor::worldOrigin() const {
    return owner_.pose().transformPoint(originOffset_);
}

void Sensor::resetHit(const Vec3f& origin, const Vec3f& direction) {
    result_.hit = false;
    result_.point = origin;
    result_.normal = -direction;
    result_.distance = 0.0f;
    result_.collider = kInvalidCollider;
}

void Sensor::cast() {
    Vec3f direction = worldCastDirection();
    Vec3f origin = worldOrigin();

    resetHit(origin, direction);

    // Layers are restored in reverse order once the query is done
    std::vector<std::unique_ptr<ScopedLayerOverride>> overrides;
    overrides.reserve(ignoreList_.size());
    for (ColliderHandle collider : ignoreList_) {
        overrides.push_back(std::make_unique<ScopedLayerOverride>(physics_, collider, kIgnoreRaycastLayer));
    }

    switch (castType_) {
        case CastType::Raycast:
            castRay(origin, direction);
            break;
        case CastType::Spherecast:
            castSphere(origin, direction);
            break;
        case CastType::RaycastArray:
            castRayArray(origin, direction);
            break;
        default:
            if (!warnedUnknownType_) {
                STRIDE_PHYSICS_WARN("Unknown sensor cast type {}, reporting no hit", static_cast<int>(castType_));
                warnedUnknownType_ = true;
            }
            break;
    }

    while (!overrides.empty()) {
        overrides.pop_back();
    }
}

void Sensor::castRay(const Vec3f& origin, const Vec3f& direction) {
    auto hit = physics_.raycast(origin, direction, castLength_, layerMask_, TriggerInteraction::Ignore);
    if (!hit)
        return;

    result_.hit = true;
    result_.point = hit->point;
    result_.normal = hit->normal.normalized();
    result_.distance = hit->distance;
    result_.collider = hit->collider;
}

void Sensor::castSphere(const Vec3f& origin, const Vec3f& direction) {
    float sweepDistance = castLength_ - sphereRadius_;
    if (sweepDistance <= 0.0f)
        return;

    auto hit = physics_.spherecast(origin, sphereRadius_, direction, sweepDistance, layerMask_,
                                   TriggerInteraction::Ignore);
    if (!hit)
        return;

    result_.hit = true;
    result_.point = hit->point;
    result_.normal = hit->normal.normalized();
    result_.collider = hit->collider;
    result_.distance = hit->distance + sphereRadius_;

    if (calculateRealDistance_) {
        result_.distance = vecmath::extractDotVector(origin - result_.point, direction).length();
    }

    if (!calculateRealSurfaceNormal_)
        return;

    auto refined = physics_.raycastCollider(result_.collider, result_.point - direction, direction,
                                            kNormalProbeLength);
    if (refined && vecmath::angleDegrees(refined->normal, -direction) < kGrazingAngleLimit) {
        result_.normal = refined->normal.normalized();
        backupNormal_ = result_.normal;
        hasBackupNormal_ = true;
    } else if (hasBackupNormal_) {
        result_.normal = backupNormal_;
    }
}

void Sensor::castRayArray(const Vec3f& origin, const Vec3f& direction) {
    Quatf rotation = owner_.pose().getRotation();

    Vec3f normalSum;
    Vec3f pointSum;
    int hits = 0;
    ColliderHandle firstCollider = kInvalidCollider;

    for (const auto& offset : arrayStartPositions_) {
        Vec3f start = origin + rotation.rotateVector(offset.as<Space::World>());
        auto hit = physics_.raycast(start, direction, castLength_, layerMask_, TriggerInteraction::Ignore);
        if (!hit)
            continue;

        if (hits == 0)
            firstCollider = hit->collider;
        normalSum += hit->normal;
        pointSum += hit->point;
        ++hits;
    }

    if (hits == 0)
        return;

    result_.hit = true;
    result_.point = pointSum / static_cast<float>(hits);
    result_.normal = normalSum.lengthSquared() > vecmath::kEpsilon ? normalSum.normalized() : -direction;
    result_.collider = firstCollider;
    result_.distance = vecmath::extractDotVector(origin - result_.point, direction).length();
}

} // namespace stride

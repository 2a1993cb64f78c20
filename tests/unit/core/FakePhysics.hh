#pragma once

#include "stride/core/PhysicsInterfaces.hh"
#include "stride/core/VectorMath.hh"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <unordered_map>
#include <vector>

namespace stride::test {

// Analytic stand-in for a physics engine: infinite one-sided planes and
// axis-aligned boxes with exact ray and sphere casts. Casts that start inside
// a box ignore it.
class FakePhysicsWorld : public PhysicsQuery {
  public:
    ColliderHandle addPlane(const Vec3f& point, const Vec3f& normal, int layer = kDefaultLayer) {
        Surface s;
        s.kind = Surface::Kind::Plane;
        s.handle = registerCollider(layer);
        s.point = point;
        s.normal = normal.normalized();
        surfaces_.push_back(s);
        return s.handle;
    }

    ColliderHandle addBox(const Vec3f& min, const Vec3f& max, int layer = kDefaultLayer, bool trigger = false) {
        Surface s;
        s.kind = Surface::Kind::Box;
        s.handle = registerCollider(layer);
        s.min = min;
        s.max = max;
        s.trigger = trigger;
        surfaces_.push_back(s);
        return s.handle;
    }

    // Collider without geometry, used for character bodies
    ColliderHandle registerCollider(int layer = kDefaultLayer) {
        ColliderHandle handle = nextHandle_++;
        layers_[handle] = layer;
        return handle;
    }

    void removeSurface(ColliderHandle handle) {
        surfaces_.erase(std::remove_if(surfaces_.begin(), surfaces_.end(),
                                       [handle](const Surface& s) { return s.handle == handle; }),
                        surfaces_.end());
    }

    void setLayerCollision(int a, int b, bool collide) {
        if (collide) {
            rows_[a] |= layerBit(b);
            rows_[b] |= layerBit(a);
        } else {
            rows_[a] &= ~layerBit(b);
            rows_[b] &= ~layerBit(a);
        }
    }

    // Records the watched collider's layer every time a cast is issued
    void watchCollider(ColliderHandle handle) { watched_ = handle; }
    const std::vector<int>& layersSeenDuringCasts() const { return layersSeen_; }

    int raycastCount() const { return raycastCount_; }
    int spherecastCount() const { return spherecastCount_; }
    int colliderRaycastCount() const { return colliderRaycastCount_; }

    std::optional<RaycastHit> raycast(const Vec3f& origin, const Vec3f& direction, float maxDistance, LayerMask mask,
                                      TriggerInteraction triggers) const override {
        ++raycastCount_;
        observe();
        std::optional<RaycastHit> best;
        for (const auto& s : surfaces_) {
            if (!accepts(s, mask, triggers))
                continue;
            auto hit = castRay(s, origin, direction, maxDistance, 0.0f);
            if (hit && (!best || hit->distance < best->distance))
                best = hit;
        }
        return best;
    }

    std::optional<RaycastHit> spherecast(const Vec3f& origin, float radius, const Vec3f& direction, float maxDistance,
                                         LayerMask mask, TriggerInteraction triggers) const override {
        ++spherecastCount_;
        observe();
        std::optional<RaycastHit> best;
        for (const auto& s : surfaces_) {
            if (!accepts(s, mask, triggers))
                continue;
            auto hit = castRay(s, origin, direction, maxDistance, radius);
            if (hit && (!best || hit->distance < best->distance))
                best = hit;
        }
        return best;
    }

    std::optional<RaycastHit> raycastCollider(ColliderHandle collider, const Vec3f& origin, const Vec3f& direction,
                                              float maxDistance) const override {
        ++colliderRaycastCount_;
        for (const auto& s : surfaces_) {
            if (s.handle == collider)
                return castRay(s, origin, direction, maxDistance, 0.0f);
        }
        return std::nullopt;
    }

    int colliderLayer(ColliderHandle collider) const override {
        auto it = layers_.find(collider);
        return it == layers_.end() ? kDefaultLayer : it->second;
    }

    void setColliderLayer(ColliderHandle collider, int layer) override {
        if (collider != kInvalidCollider)
            layers_[collider] = layer;
    }

    bool layersCollide(int a, int b) const override { return (rows_[a] & layerBit(b)) != 0; }

  private:
    struct Surface {
        enum class Kind { Plane, Box };
        Kind kind = Kind::Plane;
        ColliderHandle handle = kInvalidCollider;
        Vec3f point;
        Vec3f normal;
        Vec3f min;
        Vec3f max;
        bool trigger = false;
    };

    bool accepts(const Surface& s, LayerMask mask, TriggerInteraction triggers) const {
        if (s.trigger && triggers == TriggerInteraction::Ignore)
            return false;
        return (mask & layerBit(colliderLayer(s.handle))) != 0;
    }

    void observe() const {
        if (watched_ != kInvalidCollider)
            layersSeen_.push_back(colliderLayer(watched_));
    }

    // Ray cast against the surface inflated by `radius`. The reported point
    // lies on the original surface; distance is the travel of the origin.
    static std::optional<RaycastHit> castRay(const Surface& s, const Vec3f& origin, const Vec3f& direction,
                                             float maxDistance, float radius) {
        if (s.kind == Surface::Kind::Plane) {
            float denom = direction.dot(s.normal);
            if (denom >= -1e-6f)
                return std::nullopt;
            float height = (origin - s.point).dot(s.normal);
            float t = (height - radius) / -denom;
            if (t < 0.0f) {
                if (height < -radius)
                    return std::nullopt;
                t = 0.0f;
            }
            if (t > maxDistance)
                return std::nullopt;
            RaycastHit hit;
            hit.point = origin + direction * t - s.normal * radius;
            hit.normal = s.normal;
            hit.distance = t;
            hit.collider = s.handle;
            return hit;
        }

        const float o[3] = {origin.x, origin.y, origin.z};
        const float d[3] = {direction.x, direction.y, direction.z};
        const float lo[3] = {s.min.x - radius, s.min.y - radius, s.min.z - radius};
        const float hi[3] = {s.max.x + radius, s.max.y + radius, s.max.z + radius};

        float tNear = -std::numeric_limits<float>::infinity();
        float tFar = std::numeric_limits<float>::infinity();
        int nearAxis = -1;
        float nearSign = 0.0f;

        for (int i = 0; i < 3; ++i) {
            if (std::abs(d[i]) < 1e-8f) {
                if (o[i] < lo[i] || o[i] > hi[i])
                    return std::nullopt;
                continue;
            }
            float t1 = (lo[i] - o[i]) / d[i];
            float t2 = (hi[i] - o[i]) / d[i];
            float sign = -1.0f;
            if (t1 > t2) {
                std::swap(t1, t2);
                sign = 1.0f;
            }
            if (t1 > tNear) {
                tNear = t1;
                nearAxis = i;
                nearSign = sign;
            }
            tFar = std::min(tFar, t2);
            if (tNear > tFar)
                return std::nullopt;
        }

        if (nearAxis < 0 || tNear < 0.0f || tNear > maxDistance)
            return std::nullopt;

        Vec3f normal;
        if (nearAxis == 0)
            normal = Vec3f(nearSign, 0.0f, 0.0f);
        else if (nearAxis == 1)
            normal = Vec3f(0.0f, nearSign, 0.0f);
        else
            normal = Vec3f(0.0f, 0.0f, nearSign);

        RaycastHit hit;
        hit.point = origin + direction * tNear - normal * radius;
        hit.normal = normal;
        hit.distance = tNear;
        hit.collider = s.handle;
        return hit;
    }

    std::vector<Surface> surfaces_;
    std::unordered_map<ColliderHandle, int> layers_;
    LayerMask rows_[kLayerCount] = {kAllLayers, kAllLayers, kAllLayers, kAllLayers, kAllLayers, kAllLayers,
                                    kAllLayers, kAllLayers, kAllLayers, kAllLayers, kAllLayers, kAllLayers,
                                    kAllLayers, kAllLayers, kAllLayers, kAllLayers, kAllLayers, kAllLayers,
                                    kAllLayers, kAllLayers, kAllLayers, kAllLayers, kAllLayers, kAllLayers,
                                    kAllLayers, kAllLayers, kAllLayers, kAllLayers, kAllLayers, kAllLayers,
                                    kAllLayers, kAllLayers};
    ColliderHandle nextHandle_ = 1;
    ColliderHandle watched_ = kInvalidCollider;

    mutable std::vector<int> layersSeen_;
    mutable int raycastCount_ = 0;
    mutable int spherecastCount_ = 0;
    mutable int colliderRaycastCount_ = 0;
};

// Velocity-integrated body. Nothing moves until integrate() is called.
class FakeBody : public RigidBody {
  public:
    FakeBody(FakePhysicsWorld& world, const Vec3f& position, int layer = kDefaultLayer, bool hasCollider = true)
        : world_(world), collider_(hasCollider ? world.registerCollider(layer) : kInvalidCollider) {
        pose_.setPosition(position);
    }

    Vec3f velocity() const override { return velocity_; }
    void setVelocity(const Vec3f& velocity) override { velocity_ = velocity; }
    void movePosition(const Vec3f& position) override { pose_.setPosition(position); }

    void setFreezeRotation(bool freeze) override { rotationFrozen_ = freeze; }
    void setGravityEnabled(bool enabled) override { gravityEnabled_ = enabled; }

    Transformf pose() const override { return pose_; }

    ColliderHandle collider() const override { return collider_; }
    int layer() const override { return world_.colliderLayer(collider_); }

    void setColliderShape(const ColliderShape& shape) override {
        shape_ = shape;
        ++shapeWrites_;
    }

    void integrate(float dt) { pose_.setPosition(pose_.getPosition() + velocity_ * dt); }

    void setRotation(const Quatf& rotation) { pose_.setRotation(rotation); }
    void setScale(const Vec3f& scale) { pose_.setScale(scale); }
    const Vec3f& position() const { return pose_.getPosition(); }

    bool rotationFrozen() const { return rotationFrozen_; }
    bool gravityEnabled() const { return gravityEnabled_; }
    const ColliderShape& shape() const { return shape_; }
    int shapeWrites() const { return shapeWrites_; }

  private:
    FakePhysicsWorld& world_;
    ColliderHandle collider_;
    Transformf pose_;
    Vec3f velocity_;
    ColliderShape shape_;
    bool rotationFrozen_ = false;
    bool gravityEnabled_ = true;
    int shapeWrites_ = 0;
};

} // namespace stride::test

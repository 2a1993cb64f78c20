#pragma once

#include <Jolt/Jolt.h>

#include <Jolt/Core/JobSystemThreadPool.h>
#include <Jolt/Core/TempAllocator.h>
#include <Jolt/Physics/Body/BodyCreationSettings.h>
#include <Jolt/Physics/Body/BodyID.h>
#include <Jolt/Physics/Collision/BroadPhase/BroadPhaseLayer.h>
#include <Jolt/Physics/Collision/ObjectLayer.h>
#include <Jolt/Physics/Collision/Shape/Shape.h>
#include <Jolt/Physics/PhysicsSystem.h>

#include "stride/core/PhysicsInterfaces.hh"
#include "stride/utils/ErrorHandling.hh"

#include <array>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace stride {

namespace physics {

// Object layers carry the game layer (0..31) in the low bits and a motion
// bit that selects the broad phase tree.
inline constexpr JPH::ObjectLayer kMovingBit = 0x100;
inline constexpr JPH::ObjectLayer kGameLayerMask = 0xFF;

inline constexpr JPH::BroadPhaseLayer kBPLayerNonMoving(0);
inline constexpr JPH::BroadPhaseLayer kBPLayerMoving(1);
inline constexpr int kNumBroadPhaseLayers = 2;

inline JPH::ObjectLayer makeObjectLayer(int gameLayer, bool moving) {
    return static_cast<JPH::ObjectLayer>((gameLayer & kGameLayerMask) | (moving ? kMovingBit : 0));
}

inline int gameLayerOf(JPH::ObjectLayer layer) {
    return static_cast<int>(layer & kGameLayerMask);
}

inline bool isMoving(JPH::ObjectLayer layer) {
    return (layer & kMovingBit) != 0;
}

class BPLayerInterface final : public JPH::BroadPhaseLayerInterface {
  public:
    uint GetNumBroadPhaseLayers() const override { return kNumBroadPhaseLayers; }

    JPH::BroadPhaseLayer GetBroadPhaseLayer(JPH::ObjectLayer inLayer) const override {
        return isMoving(inLayer) ? kBPLayerMoving : kBPLayerNonMoving;
    }

#if defined(JPH_EXTERNAL_PROFILE) || defined(JPH_PROFILE_ENABLED)
    const char* GetBroadPhaseLayerName(JPH::BroadPhaseLayer inLayer) const override {
        if (inLayer == kBPLayerNonMoving)
            return "NON_MOVING";
        if (inLayer == kBPLayerMoving)
            return "MOVING";
        return "UNKNOWN";
    }
#endif
};

class ObjectVsBPFilter final : public JPH::ObjectVsBroadPhaseLayerFilter {
  public:
    bool ShouldCollide(JPH::ObjectLayer inLayer, JPH::BroadPhaseLayer inBPLayer) const override {
        if (!isMoving(inLayer))
            return inBPLayer == kBPLayerMoving;
        return true;
    }
};

// Symmetric 32x32 layer collision matrix, one bit per layer pair
class LayerMatrix {
  public:
    LayerMatrix() { rows_.fill(kAllLayers); }

    bool collide(int a, int b) const;
    void set(int a, int b, bool collide);

  private:
    std::array<LayerMask, kLayerCount> rows_;
};

class ObjectPairFilter final : public JPH::ObjectLayerPairFilter {
  public:
    explicit ObjectPairFilter(const LayerMatrix& matrix) : matrix_(matrix) {}

    bool ShouldCollide(JPH::ObjectLayer inLayer1, JPH::ObjectLayer inLayer2) const override {
        if (!isMoving(inLayer1) && !isMoving(inLayer2))
            return false;
        return matrix_.collide(gameLayerOf(inLayer1), gameLayerOf(inLayer2));
    }

  private:
    const LayerMatrix& matrix_;
};

} // namespace physics

class JoltPhysicsWorld;

// Dynamic capsule/box/sphere body driven by velocity. Owned by the world.
class JoltCharacterBody final : public RigidBody {
  public:
    JoltCharacterBody(JoltPhysicsWorld& world, ColliderHandle handle, JPH::BodyID id, float mass);

    Vec3f velocity() const override;
    void setVelocity(const Vec3f& velocity) override;
    void movePosition(const Vec3f& position) override;

    void setFreezeRotation(bool freeze) override;
    void setGravityEnabled(bool enabled) override;

    Transformf pose() const override;

    ColliderHandle collider() const override { return handle_; }
    int layer() const override;
    void setColliderShape(const ColliderShape& shape) override;

    JPH::BodyID bodyId() const { return id_; }

  private:
    void applyRotationLock();

    JoltPhysicsWorld& world_;
    ColliderHandle handle_;
    JPH::BodyID id_;
    float mass_;
    bool rotationFrozen_ = false;
};

// Contacts gathered for one character since the last takeContacts()
struct ContactReport {
    std::vector<ContactPoint> entered;
    std::vector<ContactPoint> stayed;
    std::vector<ColliderHandle> triggersEntered;
    std::vector<ColliderHandle> triggersExited;
};

/**
 * @brief Jolt Physics backed world for character simulation
 *
 * Hosts static boxes, trigger volumes and character bodies, and answers the
 * PhysicsQuery casts with Jolt's narrow phase. Collider handles are stable
 * small integers stored in each body's user data.
 *
 * Contacts are collected by the contact listener during step() and drained
 * per character with takeContacts().
 */
class JoltPhysicsWorld final : public PhysicsQuery {
  public:
    JoltPhysicsWorld();
    ~JoltPhysicsWorld() override;

    JoltPhysicsWorld(const JoltPhysicsWorld&) = delete;
    JoltPhysicsWorld& operator=(const JoltPhysicsWorld&) = delete;

    void init(uint32_t maxBodies = 1024, int numThreads = 0);
    void shutdown();
    bool initialized() const { return initialized_; }

    void step(float dt, int collisionSteps = 1);

    Result<ColliderHandle> createStaticBox(const Vec3f& position, const Vec3f& halfExtents,
                                           const Quatf& rotation = Quatf(), int layer = kDefaultLayer);
    Result<ColliderHandle> createTriggerBox(const Vec3f& position, const Vec3f& halfExtents,
                                            const Quatf& rotation = Quatf(), int layer = kDefaultLayer);
    Result<JoltCharacterBody*> createCharacterBody(const Vec3f& position, const ColliderShape& shape,
                                                   int layer = kDefaultLayer, float mass = 80.0f);
    Result<void> removeBody(ColliderHandle collider);

    size_t bodyCount() const { return bodies_.size(); }

    void setLayerCollision(int a, int b, bool collide);

    ContactReport takeContacts(ColliderHandle character);

    // PhysicsQuery
    std::optional<RaycastHit> raycast(const Vec3f& origin, const Vec3f& direction, float maxDistance, LayerMask mask,
                                      TriggerInteraction triggers) const override;
    std::optional<RaycastHit> spherecast(const Vec3f& origin, float radius, const Vec3f& direction, float maxDistance,
                                         LayerMask mask, TriggerInteraction triggers) const override;
    std::optional<RaycastHit> raycastCollider(ColliderHandle collider, const Vec3f& origin, const Vec3f& direction,
                                              float maxDistance) const override;
    int colliderLayer(ColliderHandle collider) const override;
    void setColliderLayer(ColliderHandle collider, int layer) override;
    bool layersCollide(int a, int b) const override;

    JPH::PhysicsSystem* joltSystem() { return physicsSystem_.get(); }

  private:
    friend class JoltCharacterBody;
    class ContactListenerImpl;

    Result<ColliderHandle> addBody(JPH::BodyCreationSettings& settings, JPH::EActivation activation);
    JPH::BodyID findBody(ColliderHandle collider) const;
    ColliderHandle handleOf(const JPH::BodyID& id) const;
    bool isTrigger(const JPH::BodyID& id) const;
    static JPH::RefConst<JPH::Shape> buildShape(const ColliderShape& shape);

    bool initialized_ = false;
    std::unique_ptr<JPH::TempAllocatorImpl> tempAllocator_;
    std::unique_ptr<JPH::JobSystemThreadPool> jobSystem_;
    std::unique_ptr<JPH::PhysicsSystem> physicsSystem_;
    std::unique_ptr<ContactListenerImpl> contactListener_;

    physics::LayerMatrix layerMatrix_;
    physics::BPLayerInterface bpLayerInterface_;
    physics::ObjectVsBPFilter objectVsBPFilter_;
    physics::ObjectPairFilter objectPairFilter_;

    ColliderHandle nextHandle_ = 1;
    std::unordered_map<ColliderHandle, JPH::BodyID> bodies_;
    std::unordered_map<ColliderHandle, std::unique_ptr<JoltCharacterBody>> characters_;

    // Keyed by JPH::BodyID::GetIndexAndSequenceNumber(); read by the contact
    // listener during step(), only modified between steps.
    std::unordered_map<uint32_t, ColliderHandle> handlesByBody_;
    std::unordered_set<uint32_t> triggerBodies_;
};

} // namespace stride

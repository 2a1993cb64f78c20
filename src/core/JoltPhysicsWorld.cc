#include "stride/core/JoltPhysicsWorld.hh"

#include "stride/core/Log.hh"

#include <Jolt/Core/Factory.h>
#include <Jolt/Physics/Body/Body.h>
#include <Jolt/Physics/Body/BodyFilter.h>
#include <Jolt/Physics/Body/BodyInterface.h>
#include <Jolt/Physics/Body/BodyLock.h>
#include <Jolt/Physics/Collision/CastResult.h>
#include <Jolt/Physics/Collision/CollisionCollectorImpl.h>
#include <Jolt/Physics/Collision/ContactListener.h>
#include <Jolt/Physics/Collision/NarrowPhaseQuery.h>
#include <Jolt/Physics/Collision/RayCast.h>
#include <Jolt/Physics/Collision/ShapeCast.h>
#include <Jolt/Physics/Collision/Shape/BoxShape.h>
#include <Jolt/Physics/Collision/Shape/CapsuleShape.h>
#include <Jolt/Physics/Collision/Shape/RotatedTranslatedShape.h>
#include <Jolt/Physics/Collision/Shape/SphereShape.h>
#include <Jolt/RegisterTypes.h>

#include <algorithm>
#include <mutex>
#include <string>

namespace stride {

namespace {

// Smallest extent handed to Jolt shape constructors
constexpr float kMinShapeExtent = 0.01f;

JPH::Vec3 toJolt(const Vec3f& v) {
    return JPH::Vec3(v.x, v.y, v.z);
}

JPH::Quat toJolt(const Quatf& q) {
    return JPH::Quat(q.x, q.y, q.z, q.w);
}

// Accepts Vec3 and RVec3 (double precision builds)
template <typename V> Vec3f fromJolt(const V& v) {
    return Vec3f(static_cast<float>(v.GetX()), static_cast<float>(v.GetY()), static_cast<float>(v.GetZ()));
}

uint32_t bodyKey(const JPH::BodyID& id) {
    return id.GetIndexAndSequenceNumber();
}

// Accepts bodies whose game layer is set in the mask
class MaskObjectLayerFilter final : public JPH::ObjectLayerFilter {
  public:
    explicit MaskObjectLayerFilter(LayerMask mask) : mask_(mask) {}

    bool ShouldCollide(JPH::ObjectLayer inLayer) const override {
        return (mask_ & layerBit(physics::gameLayerOf(inLayer))) != 0;
    }

  private:
    LayerMask mask_;
};

class TriggerBodyFilter final : public JPH::BodyFilter {
  public:
    explicit TriggerBodyFilter(TriggerInteraction triggers) : triggers_(triggers) {}

    bool ShouldCollideLocked(const JPH::Body& inBody) const override {
        return triggers_ == TriggerInteraction::Collide || !inBody.IsSensor();
    }

  private:
    TriggerInteraction triggers_;
};

// Track whether Jolt global state has been initialized in this process
bool sJoltGlobalInit = false;

void ensureJoltGlobalInit() {
    if (sJoltGlobalInit)
        return;
    JPH::RegisterDefaultAllocator();
    JPH::Factory::sInstance = new JPH::Factory();
    JPH::RegisterTypes();
    sJoltGlobalInit = true;
}

} // namespace

// -- Layer matrix --

namespace physics {

bool LayerMatrix::collide(int a, int b) const {
    if (a < 0 || a >= kLayerCount || b < 0 || b >= kLayerCount)
        return false;
    return (rows_[a] & layerBit(b)) != 0;
}

void LayerMatrix::set(int a, int b, bool collide) {
    if (a < 0 || a >= kLayerCount || b < 0 || b >= kLayerCount)
        return;
    if (collide) {
        rows_[a] |= layerBit(b);
        rows_[b] |= layerBit(a);
    } else {
        rows_[a] &= ~layerBit(b);
        rows_[b] &= ~layerBit(a);
    }
}

} // namespace physics

// -- Contact listener --

// Runs on Jolt job threads. Reports are keyed by the moving body's handle.
class JoltPhysicsWorld::ContactListenerImpl final : public JPH::ContactListener {
  public:
    explicit ContactListenerImpl(const JoltPhysicsWorld& world) : world_(world) {}

    JPH::ValidateResult OnContactValidate([[maybe_unused]] const JPH::Body& inBody1,
                                          [[maybe_unused]] const JPH::Body& inBody2,
                                          [[maybe_unused]] JPH::RVec3Arg inBaseOffset,
                                          [[maybe_unused]] const JPH::CollideShapeResult& inCollisionResult) override {
        return JPH::ValidateResult::AcceptAllContactsForThisBodyPair;
    }

    void OnContactAdded(const JPH::Body& inBody1, const JPH::Body& inBody2, const JPH::ContactManifold& inManifold,
                        [[maybe_unused]] JPH::ContactSettings& ioSettings) override {
        if (inBody1.IsSensor() || inBody2.IsSensor()) {
            recordTriggerEnter(inBody1, inBody2);
            return;
        }
        recordContact(inBody1, inBody2, inManifold, false);
    }

    void OnContactPersisted(const JPH::Body& inBody1, const JPH::Body& inBody2,
                            const JPH::ContactManifold& inManifold,
                            [[maybe_unused]] JPH::ContactSettings& ioSettings) override {
        if (inBody1.IsSensor() || inBody2.IsSensor())
            return;
        recordContact(inBody1, inBody2, inManifold, true);
    }

    void OnContactRemoved(const JPH::SubShapeIDPair& inSubShapePair) override {
        // Bodies may not be accessed here, only their ids
        JPH::BodyID id1 = inSubShapePair.GetBody1ID();
        JPH::BodyID id2 = inSubShapePair.GetBody2ID();
        bool trigger1 = world_.isTrigger(id1);
        bool trigger2 = world_.isTrigger(id2);
        if (trigger1 == trigger2)
            return;

        ColliderHandle trigger = world_.handleOf(trigger1 ? id1 : id2);
        ColliderHandle other = world_.handleOf(trigger1 ? id2 : id1);
        if (trigger == kInvalidCollider || other == kInvalidCollider)
            return;

        std::lock_guard<std::mutex> lock(mutex_);
        reports_[other].triggersExited.push_back(trigger);
    }

    ContactReport take(ColliderHandle character) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = reports_.find(character);
        if (it == reports_.end())
            return {};
        ContactReport report = std::move(it->second);
        reports_.erase(it);
        return report;
    }

  private:
    void recordTriggerEnter(const JPH::Body& inBody1, const JPH::Body& inBody2) {
        const JPH::Body& trigger = inBody1.IsSensor() ? inBody1 : inBody2;
        const JPH::Body& other = inBody1.IsSensor() ? inBody2 : inBody1;
        if (other.IsSensor() || other.IsStatic())
            return;

        std::lock_guard<std::mutex> lock(mutex_);
        reports_[static_cast<ColliderHandle>(other.GetUserData())].triggersEntered.push_back(
            static_cast<ColliderHandle>(trigger.GetUserData()));
    }

    void recordContact(const JPH::Body& inBody1, const JPH::Body& inBody2, const JPH::ContactManifold& inManifold,
                       bool persisted) {
        // The manifold normal pushes body 2 out of body 1
        if (inBody2.IsDynamic())
            append(inBody2, inManifold, false, persisted);
        if (inBody1.IsDynamic())
            append(inBody1, inManifold, true, persisted);
    }

    void append(const JPH::Body& character, const JPH::ContactManifold& inManifold, bool isBody1, bool persisted) {
        Vec3f normal = fromJolt(isBody1 ? -inManifold.mWorldSpaceNormal : inManifold.mWorldSpaceNormal);
        std::lock_guard<std::mutex> lock(mutex_);
        ContactReport& report = reports_[static_cast<ColliderHandle>(character.GetUserData())];
        auto& target = persisted ? report.stayed : report.entered;

        const auto& points = isBody1 ? inManifold.mRelativeContactPointsOn2 : inManifold.mRelativeContactPointsOn1;
        for (JPH::uint i = 0; i < points.size(); ++i) {
            JPH::RVec3 point = isBody1 ? inManifold.GetWorldSpaceContactPointOn2(i)
                                       : inManifold.GetWorldSpaceContactPointOn1(i);
            target.push_back(ContactPoint{fromJolt(point), normal});
        }
    }

    const JoltPhysicsWorld& world_;
    std::mutex mutex_;
    std::unordered_map<ColliderHandle, ContactReport> reports_;
};

// -- World --

JoltPhysicsWorld::JoltPhysicsWorld() : objectPairFilter_(layerMatrix_) {}

JoltPhysicsWorld::~JoltPhysicsWorld() {
    if (initialized_)
        shutdown();
}

void JoltPhysicsWorld::init(uint32_t maxBodies, int numThreads) {
    if (initialized_)
        return;

    ensureJoltGlobalInit();

    // 10 MB temp allocator for Jolt's per-frame scratch memory
    tempAllocator_ = std::make_unique<JPH::TempAllocatorImpl>(10 * 1024 * 1024);

    int threads = (numThreads <= 0) ? 1 : numThreads;
    jobSystem_ = std::make_unique<JPH::JobSystemThreadPool>(JPH::cMaxPhysicsJobs, JPH::cMaxPhysicsBarriers, threads);

    physicsSystem_ = std::make_unique<JPH::PhysicsSystem>();
    physicsSystem_->Init(maxBodies,
                         0,             // auto body mutexes
                         maxBodies * 2, // max body pairs
                         maxBodies,     // max contact constraints
                         bpLayerInterface_, objectVsBPFilter_, objectPairFilter_);

    contactListener_ = std::make_unique<ContactListenerImpl>(*this);
    physicsSystem_->SetContactListener(contactListener_.get());

    initialized_ = true;
    STRIDE_PHYSICS_INFO("Jolt physics world initialized ({} bodies max, {} threads)", maxBodies, threads);
}

void JoltPhysicsWorld::shutdown() {
    if (!initialized_)
        return;

    auto& bi = physicsSystem_->GetBodyInterface();
    for (auto& [handle, bodyId] : bodies_) {
        bi.RemoveBody(bodyId);
        bi.DestroyBody(bodyId);
    }
    bodies_.clear();
    characters_.clear();
    handlesByBody_.clear();
    triggerBodies_.clear();

    physicsSystem_.reset();
    contactListener_.reset();
    jobSystem_.reset();
    tempAllocator_.reset();

    initialized_ = false;
    STRIDE_PHYSICS_INFO("Jolt physics world shut down");
}

void JoltPhysicsWorld::step(float dt, int collisionSteps) {
    if (!initialized_ || dt <= 0.0f)
        return;

    JPH::EPhysicsUpdateError error =
        physicsSystem_->Update(dt, collisionSteps, tempAllocator_.get(), jobSystem_.get());
    if (error != JPH::EPhysicsUpdateError::None) {
        STRIDE_PHYSICS_WARN("Jolt update reported error flags {}", static_cast<uint32_t>(error));
    }
}

Result<ColliderHandle> JoltPhysicsWorld::addBody(JPH::BodyCreationSettings& settings, JPH::EActivation activation) {
    if (!initialized_)
        return Result<ColliderHandle>::error(ErrorCode::InvalidState, "physics world is not initialized");

    ColliderHandle handle = nextHandle_++;
    settings.mUserData = handle;

    auto& bi = physicsSystem_->GetBodyInterface();
    JPH::Body* body = bi.CreateBody(settings);
    if (body == nullptr)
        return Result<ColliderHandle>::error(ErrorCode::Internal, "body limit reached");

    bi.AddBody(body->GetID(), activation);
    bodies_[handle] = body->GetID();
    handlesByBody_[bodyKey(body->GetID())] = handle;
    if (settings.mIsSensor)
        triggerBodies_.insert(bodyKey(body->GetID()));

    return Result<ColliderHandle>::ok(handle);
}

Result<ColliderHandle> JoltPhysicsWorld::createStaticBox(const Vec3f& position, const Vec3f& halfExtents,
                                                         const Quatf& rotation, int layer) {
    if (layer < 0 || layer >= kLayerCount)
        return Result<ColliderHandle>::error(ErrorCode::InvalidArgument, "layer out of range");

    JPH::Vec3 extents = JPH::Vec3::sMax(toJolt(halfExtents), JPH::Vec3::sReplicate(kMinShapeExtent));
    float convexRadius = std::min(JPH::cDefaultConvexRadius, extents.ReduceMin());
    JPH::BodyCreationSettings settings(new JPH::BoxShape(extents, convexRadius), JPH::RVec3(toJolt(position)),
                                       toJolt(rotation), JPH::EMotionType::Static,
                                       physics::makeObjectLayer(layer, false));
    return addBody(settings, JPH::EActivation::DontActivate);
}

Result<ColliderHandle> JoltPhysicsWorld::createTriggerBox(const Vec3f& position, const Vec3f& halfExtents,
                                                          const Quatf& rotation, int layer) {
    if (layer < 0 || layer >= kLayerCount)
        return Result<ColliderHandle>::error(ErrorCode::InvalidArgument, "layer out of range");

    JPH::Vec3 extents = JPH::Vec3::sMax(toJolt(halfExtents), JPH::Vec3::sReplicate(kMinShapeExtent));
    JPH::BodyCreationSettings settings(new JPH::BoxShape(extents, 0.0f), JPH::RVec3(toJolt(position)),
                                       toJolt(rotation), JPH::EMotionType::Static,
                                       physics::makeObjectLayer(layer, false));
    settings.mIsSensor = true;
    return addBody(settings, JPH::EActivation::DontActivate);
}

Result<JoltCharacterBody*> JoltPhysicsWorld::createCharacterBody(const Vec3f& position, const ColliderShape& shape,
                                                                 int layer, float mass) {
    if (layer < 0 || layer >= kLayerCount)
        return Result<JoltCharacterBody*>::error(ErrorCode::InvalidArgument, "layer out of range");
    if (mass <= 0.0f)
        return Result<JoltCharacterBody*>::error(ErrorCode::InvalidArgument, "character mass must be positive");

    JPH::BodyCreationSettings settings(buildShape(shape), JPH::RVec3(toJolt(position)), JPH::Quat::sIdentity(),
                                       JPH::EMotionType::Dynamic, physics::makeObjectLayer(layer, true));
    settings.mOverrideMassProperties = JPH::EOverrideMassProperties::CalculateInertia;
    settings.mMassPropertiesOverride.mMass = mass;
    settings.mFriction = 0.0f;
    settings.mRestitution = 0.0f;
    settings.mAllowSleeping = false;
    settings.mMotionQuality = JPH::EMotionQuality::LinearCast;

    auto result = addBody(settings, JPH::EActivation::Activate);
    if (result.isError())
        return Result<JoltCharacterBody*>::error(result.code(), result.message());

    ColliderHandle handle = result.value();
    auto body = std::make_unique<JoltCharacterBody>(*this, handle, bodies_[handle], mass);
    JoltCharacterBody* raw = body.get();
    characters_[handle] = std::move(body);

    STRIDE_PHYSICS_DEBUG("Created character body {} on layer {}", handle, layer);
    return Result<JoltCharacterBody*>::ok(raw);
}

Result<void> JoltPhysicsWorld::removeBody(ColliderHandle collider) {
    if (!initialized_)
        return Result<void>::error(ErrorCode::InvalidState, "physics world is not initialized");

    auto it = bodies_.find(collider);
    if (it == bodies_.end())
        return Result<void>::error(ErrorCode::NotFound, "unknown collider " + std::to_string(collider));

    auto& bi = physicsSystem_->GetBodyInterface();
    bi.RemoveBody(it->second);
    bi.DestroyBody(it->second);

    handlesByBody_.erase(bodyKey(it->second));
    triggerBodies_.erase(bodyKey(it->second));
    characters_.erase(collider);
    bodies_.erase(it);
    contactListener_->take(collider);
    return Result<void>::ok();
}

void JoltPhysicsWorld::setLayerCollision(int a, int b, bool collide) {
    layerMatrix_.set(a, b, collide);
}

ContactReport JoltPhysicsWorld::takeContacts(ColliderHandle character) {
    if (!contactListener_)
        return {};
    return contactListener_->take(character);
}

JPH::BodyID JoltPhysicsWorld::findBody(ColliderHandle collider) const {
    auto it = bodies_.find(collider);
    if (it == bodies_.end())
        return JPH::BodyID();
    return it->second;
}

ColliderHandle JoltPhysicsWorld::handleOf(const JPH::BodyID& id) const {
    auto it = handlesByBody_.find(bodyKey(id));
    return it == handlesByBody_.end() ? kInvalidCollider : it->second;
}

bool JoltPhysicsWorld::isTrigger(const JPH::BodyID& id) const {
    return triggerBodies_.count(bodyKey(id)) > 0;
}

JPH::RefConst<JPH::Shape> JoltPhysicsWorld::buildShape(const ColliderShape& shape) {
    JPH::RefConst<JPH::Shape> inner;

    switch (shape.kind) {
        case ColliderKind::Box: {
            JPH::Vec3 halfExtents(std::max(shape.size.x * 0.5f, kMinShapeExtent),
                                  std::max(shape.size.y * 0.5f, kMinShapeExtent),
                                  std::max(shape.size.z * 0.5f, kMinShapeExtent));
            inner = new JPH::BoxShape(halfExtents, std::min(JPH::cDefaultConvexRadius, halfExtents.ReduceMin()));
            break;
        }
        case ColliderKind::Sphere: {
            inner = new JPH::SphereShape(std::max(shape.radius, kMinShapeExtent));
            break;
        }
        case ColliderKind::Capsule:
        default: {
            float radius = std::max(shape.radius, kMinShapeExtent);
            float halfCylinder = shape.height * 0.5f - radius;
            if (halfCylinder < kMinShapeExtent) {
                inner = new JPH::SphereShape(radius);
            } else {
                inner = new JPH::CapsuleShape(halfCylinder, radius);
            }
            break;
        }
    }

    if (shape.center.lengthSquared() == 0.0f)
        return inner;

    return new JPH::RotatedTranslatedShape(JPH::Vec3(shape.center.x, shape.center.y, shape.center.z),
                                           JPH::Quat::sIdentity(), inner);
}

// -- Queries --

std::optional<RaycastHit> JoltPhysicsWorld::raycast(const Vec3f& origin, const Vec3f& direction, float maxDistance,
                                                    LayerMask mask, TriggerInteraction triggers) const {
    if (!initialized_ || maxDistance <= 0.0f)
        return std::nullopt;

    JPH::RRayCast ray{JPH::RVec3(toJolt(origin)), toJolt(direction) * maxDistance};
    JPH::RayCastResult hit;
    MaskObjectLayerFilter layerFilter(mask);
    TriggerBodyFilter bodyFilter(triggers);

    if (!physicsSystem_->GetNarrowPhaseQuery().CastRay(ray, hit, JPH::BroadPhaseLayerFilter(), layerFilter,
                                                        bodyFilter)) {
        return std::nullopt;
    }

    JPH::RVec3 point = ray.GetPointOnRay(hit.mFraction);
    RaycastHit result;
    result.point = fromJolt(point);
    result.distance = hit.mFraction * maxDistance;
    result.normal = -direction;

    JPH::BodyLockRead lock(physicsSystem_->GetBodyLockInterface(), hit.mBodyID);
    if (lock.Succeeded()) {
        const JPH::Body& body = lock.GetBody();
        result.normal = fromJolt(body.GetWorldSpaceSurfaceNormal(hit.mSubShapeID2, point));
        result.collider = static_cast<ColliderHandle>(body.GetUserData());
    }
    return result;
}

std::optional<RaycastHit> JoltPhysicsWorld::spherecast(const Vec3f& origin, float radius, const Vec3f& direction,
                                                       float maxDistance, LayerMask mask,
                                                       TriggerInteraction triggers) const {
    if (!initialized_ || maxDistance <= 0.0f || radius <= 0.0f)
        return std::nullopt;

    JPH::SphereShape sphere(radius);
    sphere.SetEmbedded();

    JPH::RShapeCast cast(&sphere, JPH::Vec3::sReplicate(1.0f), JPH::RMat44::sTranslation(JPH::RVec3(toJolt(origin))),
                         toJolt(direction) * maxDistance);
    JPH::ShapeCastSettings settings;
    JPH::ClosestHitCollisionCollector<JPH::CastShapeCollector> collector;
    MaskObjectLayerFilter layerFilter(mask);
    TriggerBodyFilter bodyFilter(triggers);

    physicsSystem_->GetNarrowPhaseQuery().CastShape(cast, settings, JPH::RVec3::sZero(), collector,
                                                    JPH::BroadPhaseLayerFilter(), layerFilter, bodyFilter);
    if (!collector.HadHit())
        return std::nullopt;

    const JPH::ShapeCastResult& hit = collector.mHit;
    RaycastHit result;
    result.point = fromJolt(hit.mContactPointOn2);
    result.distance = hit.mFraction * maxDistance;

    JPH::Vec3 axis = hit.mPenetrationAxis;
    result.normal = axis.LengthSq() > 0.0f ? fromJolt(-axis.Normalized()) : -direction;

    JPH::BodyLockRead lock(physicsSystem_->GetBodyLockInterface(), hit.mBodyID2);
    if (lock.Succeeded()) {
        result.collider = static_cast<ColliderHandle>(lock.GetBody().GetUserData());
    }
    return result;
}

std::optional<RaycastHit> JoltPhysicsWorld::raycastCollider(ColliderHandle collider, const Vec3f& origin,
                                                            const Vec3f& direction, float maxDistance) const {
    JPH::BodyID id = findBody(collider);
    if (!initialized_ || id.IsInvalid() || maxDistance <= 0.0f)
        return std::nullopt;

    JPH::BodyLockRead lock(physicsSystem_->GetBodyLockInterface(), id);
    if (!lock.Succeeded())
        return std::nullopt;

    const JPH::Body& body = lock.GetBody();
    JPH::RRayCast ray{JPH::RVec3(toJolt(origin)), toJolt(direction) * maxDistance};
    JPH::RayCastResult hit;
    if (!body.GetTransformedShape().CastRay(ray, hit))
        return std::nullopt;

    JPH::RVec3 point = ray.GetPointOnRay(hit.mFraction);
    RaycastHit result;
    result.point = fromJolt(point);
    result.normal = fromJolt(body.GetWorldSpaceSurfaceNormal(hit.mSubShapeID2, point));
    result.distance = hit.mFraction * maxDistance;
    result.collider = collider;
    return result;
}

int JoltPhysicsWorld::colliderLayer(ColliderHandle collider) const {
    JPH::BodyID id = findBody(collider);
    if (!initialized_ || id.IsInvalid())
        return kDefaultLayer;
    return physics::gameLayerOf(physicsSystem_->GetBodyInterface().GetObjectLayer(id));
}

void JoltPhysicsWorld::setColliderLayer(ColliderHandle collider, int layer) {
    JPH::BodyID id = findBody(collider);
    if (!initialized_ || id.IsInvalid())
        return;
    if (layer < 0 || layer >= kLayerCount) {
        STRIDE_PHYSICS_WARN("Ignoring out of range layer {} for collider {}", layer, collider);
        return;
    }

    auto& bi = physicsSystem_->GetBodyInterface();
    bool moving = physics::isMoving(bi.GetObjectLayer(id));
    bi.SetObjectLayer(id, physics::makeObjectLayer(layer, moving));
}

bool JoltPhysicsWorld::layersCollide(int a, int b) const {
    return layerMatrix_.collide(a, b);
}

// -- Character body --

JoltCharacterBody::JoltCharacterBody(JoltPhysicsWorld& world, ColliderHandle handle, JPH::BodyID id, float mass)
    : world_(world), handle_(handle), id_(id), mass_(mass) {}

Vec3f JoltCharacterBody::velocity() const {
    return fromJolt(world_.physicsSystem_->GetBodyInterface().GetLinearVelocity(id_));
}

void JoltCharacterBody::setVelocity(const Vec3f& velocity) {
    world_.physicsSystem_->GetBodyInterface().SetLinearVelocity(id_, toJolt(velocity));
}

void JoltCharacterBody::movePosition(const Vec3f& position) {
    world_.physicsSystem_->GetBodyInterface().SetPosition(id_, JPH::RVec3(toJolt(position)),
                                                          JPH::EActivation::Activate);
}

void JoltCharacterBody::setFreezeRotation(bool freeze) {
    rotationFrozen_ = freeze;
    applyRotationLock();
}

void JoltCharacterBody::applyRotationLock() {
    JPH::BodyLockWrite lock(world_.physicsSystem_->GetBodyLockInterface(), id_);
    if (!lock.Succeeded())
        return;

    JPH::Body& body = lock.GetBody();
    JPH::MotionProperties* mp = body.GetMotionProperties();
    if (mp == nullptr)
        return;

    if (rotationFrozen_) {
        mp->SetInverseInertia(JPH::Vec3::sZero(), JPH::Quat::sIdentity());
        body.SetAngularVelocity(JPH::Vec3::sZero());
    } else {
        JPH::MassProperties massProperties = body.GetShape()->GetMassProperties();
        massProperties.ScaleToMass(mass_);
        mp->SetMassProperties(JPH::EAllowedDOFs::All, massProperties);
    }
}

void JoltCharacterBody::setGravityEnabled(bool enabled) {
    world_.physicsSystem_->GetBodyInterface().SetGravityFactor(id_, enabled ? 1.0f : 0.0f);
}

Transformf JoltCharacterBody::pose() const {
    auto& bi = world_.physicsSystem_->GetBodyInterface();
    JPH::RVec3 position = bi.GetPosition(id_);
    JPH::Quat rotation = bi.GetRotation(id_);
    return Transformf(fromJolt(position), Quatf(rotation.GetX(), rotation.GetY(), rotation.GetZ(), rotation.GetW()));
}

int JoltCharacterBody::layer() const {
    return world_.colliderLayer(handle_);
}

void JoltCharacterBody::setColliderShape(const ColliderShape& shape) {
    auto& bi = world_.physicsSystem_->GetBodyInterface();
    bi.SetShape(id_, JoltPhysicsWorld::buildShape(shape), false, JPH::EActivation::Activate);
    applyRotationLock();
}

} // namespace stride

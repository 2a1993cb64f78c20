#include "stride/core/MovementController.hh"

#include "stride/core/Log.hh"
#include "stride/core/VectorMath.hh"

#include <algorithm>
#include <cmath>

namespace stride {

namespace {

constexpr const char* kEventSource = "MovementController";

// Distance at which a climb anchor counts as reached
constexpr float kAnchorReachedDistance = 0.01f;

} // namespace

MovementController::MovementController(Mover& mover, const ControllerConfig& config)
    : mover_(mover), config_(config) {
    validate(config_);

    if (!mover_.isEnabled()) {
        STRIDE_LOG_WARN("MovementController attached to a disabled Mover; the character will never be grounded");
    }

    originalColliderHeight_ = mover_.colliderHeight();
    originalStepHeightRatio_ = mover_.stepHeightRatio();

    registerStateHandlers();
}

void MovementController::registerStateHandlers() {
    for (int i = 0; i < kControllerStateCount; ++i) {
        auto state = static_cast<ControllerState>(i);
        fsm_.addEnterHandler(state, [this](ControllerState from, ControllerState to) { onStateEnter(to, from); });
        fsm_.addExitHandler(state, [this](ControllerState from, ControllerState to) { onStateExit(from, to); });
    }
}

// -- Accessors --

Vec3f MovementController::up() const {
    return mover_.pose().up();
}

Vec3f MovementController::momentum() const {
    if (config_.useLocalMomentum) {
        return mover_.pose().getRotation().rotateVector(momentum_);
    }
    return momentum_;
}

void MovementController::setMomentum(const Vec3f& momentum) {
    if (config_.useLocalMomentum) {
        momentum_ = mover_.pose().getRotation().conjugate().rotateVector(momentum);
    } else {
        momentum_ = momentum;
    }
}

void MovementController::addMomentum(const Vec3f& extraMomentum) {
    setMomentum(momentum() + extraMomentum);
}

float MovementController::movementSpeed() const {
    return inCrouchZone_ ? config_.crouchSpeed : config_.movementSpeed;
}

void MovementController::resetState(ControllerState state) {
    if (fsm_.currentState() == ControllerState::Crouching && state != ControllerState::Crouching) {
        mover_.setDimensions(originalColliderHeight_, mover_.colliderThickness(), originalStepHeightRatio_);
    }

    fsm_.reset(state);
    momentum_ = Vec3f::zero();
    velocity_ = Vec3f::zero();
    triggerJump_ = false;
    ceilingWasHit_ = false;
    triggerLadderEnter_ = false;
    triggerLadderExit_ = false;
    triggerFreeClimbEnter_ = false;
    usingClimbZone_ = false;
    triggerRollCrash_ = false;
    rollTimer_ = 0.0f;
    rollCrashTimer_ = 0.0f;
}

// -- Tick --

void MovementController::tick(float dt, const ControllerInput& input, const ZoneSnapshot& zones) {
    if (dt <= 0.0f) {
        STRIDE_MOVEMENT_WARN("Ignoring tick with non-positive duration {}", dt);
        return;
    }

    dt_ = dt;
    input_ = input;
    zones_ = &zones;
    inCrouchZone_ = zones.inCrouchZone;
    rollPressed_ = input.rollPressed;

    refreshClimbZone();

    mover_.checkForGround(dt_);
    movementVelocity_ = calculateMovementVelocity();

    if (!MovementFSM::isKnownState(fsm_.currentState())) {
        STRIDE_LOG_WARN("Invalid controller state {} detected, defaulting to Falling",
                        static_cast<int>(fsm_.currentState()));
        fsm_.reset(ControllerState::Falling);
    }

    fsm_.tryTransition(determineNextState());
    stateUpdate();

    // Grounded or sliding characters keep ground contact over steps and slopes
    mover_.setUseExtendedSensorRange(isGrounded());
    mover_.setVelocity(velocity_);

    ceilingWasHit_ = false;
    rollPressed_ = false;
    zones_ = nullptr;
}

// -- State handling --

bool MovementController::isRisingOrFalling() const {
    return vecmath::extractDotVector(momentum(), up()).length() > config_.verticalThreshold;
}

bool MovementController::isGroundTooSteep() const {
    if (!mover_.isGrounded())
        return true;
    return vecmath::angleDegrees(mover_.groundNormal(), up()) > config_.slopeLimit;
}

ControllerState MovementController::determineNextState() {
    const bool grounded = mover_.isGrounded();
    const bool isRising = isRisingOrFalling() && momentum().dot(up()) > 0.0f;
    const bool isSliding = grounded && isGroundTooSteep();

    auto zone = climbZone_.lock();
    const bool zoneHeld = zone && zones_ && zones_->contains(zone);
    const bool isClimbing = usingClimbZone_ && zoneHeld;
    const ControllerState fallback = grounded ? ControllerState::Grounded : ControllerState::Falling;

    switch (fsm_.currentState()) {
        case ControllerState::Grounded: {
            if (inCrouchZone_)
                return ControllerState::Crouching;
            if (rollPressed_)
                return ControllerState::Rolling;
            if (triggerLadderEnter_)
                return ControllerState::LadderStart;
            if (triggerFreeClimbEnter_)
                return ControllerState::FreeClimbStart;
            if (isRising)
                return ControllerState::Rising;
            if (!grounded)
                return ControllerState::Falling;
            if (isSliding)
                return ControllerState::Sliding;
            return ControllerState::Grounded;
        }
        case ControllerState::Sliding: {
            if (isRising)
                return ControllerState::Rising;
            if (!grounded)
                return ControllerState::Falling;
            if (!isSliding)
                return ControllerState::Grounded;
            return ControllerState::Sliding;
        }
        case ControllerState::Falling: {
            if (triggerJump_)
                return ControllerState::Jumping;
            if (isRising)
                return ControllerState::Rising;
            if (grounded && !isSliding)
                return ControllerState::Grounded;
            if (isSliding)
                return ControllerState::Sliding;
            return ControllerState::Falling;
        }
        case ControllerState::Rising: {
            if (!isRising) {
                if (grounded && !isSliding)
                    return ControllerState::Grounded;
                if (isSliding)
                    return ControllerState::Sliding;
                return ControllerState::Falling;
            }
            if (config_.useCeilingDetection && ceilingWasHit_)
                return ControllerState::Falling;
            return ControllerState::Rising;
        }
        case ControllerState::Jumping: {
            if (triggerJump_)
                return ControllerState::Rising;
            if (config_.useCeilingDetection && ceilingWasHit_)
                return ControllerState::Falling;
            return ControllerState::Jumping;
        }
        case ControllerState::Crouching: {
            if (inCrouchZone_)
                return ControllerState::Crouching;
            if (isRising)
                return ControllerState::Rising;
            if (!grounded)
                return ControllerState::Falling;
            if (isSliding)
                return ControllerState::Sliding;
            return ControllerState::Grounded;
        }
        case ControllerState::LadderStart: {
            if (!isClimbing)
                return fallback;
            if (mover_.velocity().lengthSquared() <= config_.climbMoveThreshold)
                return ControllerState::LadderClimbing;
            if (triggerLadderEnter_)
                return ControllerState::LadderStart;
            return fallback;
        }
        case ControllerState::LadderClimbing: {
            if (triggerLadderExit_)
                return ControllerState::LadderEnd;
            if (isClimbing)
                return ControllerState::LadderClimbing;
            return fallback;
        }
        case ControllerState::LadderEnd: {
            if (triggerLadderExit_)
                return ControllerState::LadderEnd;
            return fallback;
        }
        case ControllerState::Rolling: {
            if (triggerRollCrash_)
                return ControllerState::RollingCrash;
            if (!grounded)
                return ControllerState::Falling;
            if (rollTimer_ >= config_.rollDuration && !rollPressed_)
                return ControllerState::Grounded;
            return ControllerState::Rolling;
        }
        case ControllerState::RollingCrash: {
            if (rollCrashTimer_ >= config_.rollCrashDuration)
                return fallback;
            return ControllerState::RollingCrash;
        }
        case ControllerState::FreeClimbStart: {
            if (!isClimbing)
                return fallback;
            if (mover_.velocity().lengthSquared() <= config_.climbMoveThreshold)
                return ControllerState::FreeClimbing;
            return ControllerState::FreeClimbStart;
        }
        case ControllerState::FreeClimbing: {
            if (isClimbing)
                return ControllerState::FreeClimbing;
            return fallback;
        }
        default: {
            STRIDE_LOG_WARN("Invalid controller state {} detected, defaulting to Falling",
                            static_cast<int>(fsm_.currentState()));
            return ControllerState::Falling;
        }
    }
}

void MovementController::onStateEnter(ControllerState entering, ControllerState exiting) {
    switch (entering) {
        case ControllerState::Grounded: {
            if (exiting == ControllerState::Sliding || exiting == ControllerState::Falling ||
                exiting == ControllerState::Rising || exiting == ControllerState::LadderClimbing ||
                exiting == ControllerState::LadderEnd || exiting == ControllerState::FreeClimbing) {
                onGroundContactRegained();
            }
            break;
        }
        case ControllerState::Sliding: {
            if (exiting == ControllerState::Grounded || exiting == ControllerState::Crouching) {
                onGroundContactLost();
            }
            break;
        }
        case ControllerState::Falling: {
            if (MovementFSM::isGroundedFamily(exiting) || exiting == ControllerState::Rolling) {
                onGroundContactLost();
            }
            if ((exiting == ControllerState::Rising || exiting == ControllerState::Jumping) &&
                config_.useCeilingDetection && ceilingWasHit_) {
                onCeilingContact();
            }
            break;
        }
        case ControllerState::Rising: {
            if (MovementFSM::isGroundedFamily(exiting)) {
                onGroundContactLost();
            }
            break;
        }
        case ControllerState::Jumping: {
            onGroundContactLost();
            onJumpStart();
            timeSinceLastJump_ = 0.0f;
            canJump_ = false;
            if (exiting == ControllerState::Rising && config_.useCeilingDetection && ceilingWasHit_) {
                onCeilingContact();
            }
            break;
        }
        case ControllerState::Crouching: {
            if (exiting == ControllerState::Sliding || exiting == ControllerState::Falling ||
                exiting == ControllerState::Rising) {
                onGroundContactRegained();
            }
            mover_.setDimensions(config_.crouchColliderHeight, mover_.colliderThickness(),
                                 config_.crouchStepHeightRatio);
            break;
        }
        case ControllerState::LadderStart: {
            usingClimbZone_ = true;
            dispatchEvent(events::kLadderEnter);
            break;
        }
        case ControllerState::FreeClimbStart: {
            usingClimbZone_ = true;
            dispatchEvent(events::kFreeClimbEnter);
            break;
        }
        case ControllerState::Rolling: {
            rollTimer_ = 0.0f;
            triggerRollCrash_ = false;
            captureRollVelocity();
            break;
        }
        case ControllerState::RollingCrash: {
            rollCrashTimer_ = 0.0f;
            setMomentum(Vec3f::zero());
            dispatchVectorEvent(events::kRollCrash, "point", rollCrashPoint_);
            break;
        }
        case ControllerState::LadderClimbing:
        case ControllerState::LadderEnd:
        case ControllerState::FreeClimbing:
            break;
        default: {
            STRIDE_LOG_ERROR("Invalid entering controller state {}", static_cast<int>(entering));
            break;
        }
    }
}

void MovementController::onStateExit(ControllerState exiting, ControllerState entering) {
    switch (exiting) {
        case ControllerState::Grounded: {
            // Runs after the new state is committed, so the arming decision
            // sees the last tick's output velocity.
            if (entering == ControllerState::Falling && config_.useAutoJump) {
                if (canJump_ && velocity_.length() >= config_.autoJumpMovementSpeedThreshold) {
                    triggerJump_ = true;
                }
            }
            break;
        }
        case ControllerState::Jumping: {
            triggerJump_ = false;
            break;
        }
        case ControllerState::Crouching: {
            mover_.setDimensions(originalColliderHeight_, mover_.colliderThickness(), originalStepHeightRatio_);
            break;
        }
        case ControllerState::LadderStart:
        case ControllerState::LadderClimbing:
        case ControllerState::LadderEnd: {
            if (exiting == ControllerState::LadderStart)
                triggerLadderEnter_ = false;
            if (exiting == ControllerState::LadderEnd)
                triggerLadderExit_ = false;
            if (!MovementFSM::isLadder(entering)) {
                usingClimbZone_ = false;
                triggerLadderEnter_ = false;
                triggerLadderExit_ = false;
                dispatchEvent(events::kLadderExit);
            }
            break;
        }
        case ControllerState::FreeClimbStart:
        case ControllerState::FreeClimbing: {
            if (exiting == ControllerState::FreeClimbStart)
                triggerFreeClimbEnter_ = false;
            if (!MovementFSM::isFreeClimb(entering)) {
                usingClimbZone_ = false;
                triggerFreeClimbEnter_ = false;
            }
            break;
        }
        case ControllerState::Rolling: {
            if (entering != ControllerState::RollingCrash)
                triggerRollCrash_ = false;
            break;
        }
        case ControllerState::RollingCrash: {
            triggerRollCrash_ = false;
            break;
        }
        case ControllerState::Sliding:
        case ControllerState::Falling:
        case ControllerState::Rising:
            break;
        default: {
            STRIDE_LOG_ERROR("Invalid exiting controller state {}", static_cast<int>(exiting));
            break;
        }
    }
}

void MovementController::stateUpdate() {
    Vec3f tempMomentum = momentum();
    auto zone = climbZone_.lock();

    switch (fsm_.currentState()) {
        case ControllerState::Grounded: {
            tempMomentum = calculateGroundedMomentum(tempMomentum);
            updateAutoJumpCooldown();
            handleClimbZone();
            velocity_ = tempMomentum + movementVelocity_;
            break;
        }
        case ControllerState::Sliding: {
            tempMomentum = calculateSlidingMomentum(tempMomentum);
            velocity_ = tempMomentum;
            break;
        }
        case ControllerState::Falling:
        case ControllerState::Rising: {
            tempMomentum = calculateAirMomentum(tempMomentum);
            velocity_ = tempMomentum;
            break;
        }
        case ControllerState::Jumping: {
            tempMomentum = calculateAirMomentum(tempMomentum);
            tempMomentum = vecmath::removeDotVector(tempMomentum, up());
            tempMomentum += up() * config_.jumpSpeed;
            velocity_ = tempMomentum;
            break;
        }
        case ControllerState::Crouching: {
            tempMomentum = calculateGroundedMomentum(tempMomentum);
            updateAutoJumpCooldown();
            velocity_ = tempMomentum + movementVelocity_;
            break;
        }
        case ControllerState::LadderStart: {
            if (!zone) {
                usingClimbZone_ = false;
                tempMomentum = Vec3f::zero();
            } else {
                tempMomentum = calculateAttachMomentum(zone->startAnchor());
            }
            velocity_ = tempMomentum;
            break;
        }
        case ControllerState::LadderClimbing: {
            if (!zone) {
                usingClimbZone_ = false;
                tempMomentum = Vec3f::zero();
            } else {
                tempMomentum = calculateLadderMomentum(*zone);
            }
            velocity_ = tempMomentum;
            break;
        }
        case ControllerState::LadderEnd: {
            if (!zone) {
                usingClimbZone_ = false;
                triggerLadderExit_ = false;
                tempMomentum = Vec3f::zero();
            } else {
                tempMomentum = calculateLadderEndMomentum(*zone);
            }
            velocity_ = tempMomentum;
            break;
        }
        case ControllerState::Rolling: {
            if (rollTimer_ >= config_.rollDuration && rollPressed_) {
                rollTimer_ = 0.0f;
                captureRollVelocity();
            }
            rollTimer_ += dt_;
            tempMomentum = calculateGroundedMomentum(tempMomentum);
            velocity_ = tempMomentum + rollVelocity_ * config_.rollSpeedMultiplier;
            break;
        }
        case ControllerState::RollingCrash: {
            rollCrashTimer_ += dt_;
            tempMomentum = Vec3f::zero();
            velocity_ = tempMomentum;
            break;
        }
        case ControllerState::FreeClimbStart: {
            if (!zone) {
                usingClimbZone_ = false;
                tempMomentum = Vec3f::zero();
            } else {
                tempMomentum = calculateAttachMomentum(freeClimbAnchor(*zone));
            }
            velocity_ = tempMomentum;
            break;
        }
        case ControllerState::FreeClimbing: {
            if (!zone) {
                usingClimbZone_ = false;
                tempMomentum = Vec3f::zero();
            } else {
                tempMomentum = calculateFreeClimbMomentum(*zone);
            }
            velocity_ = tempMomentum;
            break;
        }
        default: {
            STRIDE_LOG_WARN("Invalid controller state {}, using Falling momentum", static_cast<int>(fsm_.currentState()));
            tempMomentum = calculateAirMomentum(tempMomentum);
            velocity_ = tempMomentum;
            break;
        }
    }

    setMomentum(tempMomentum);
}

// -- Movement --

Vec3f MovementController::calculateMovementVelocity() const {
    Transformf pose = mover_.pose();
    Vec3f velocity;

    if (!relativeInputFrame_ || usingClimbZone_) {
        velocity += pose.right() * input_.horizontal;
        velocity += pose.forward() * input_.vertical;
    } else {
        // Keep camera-relative movement parallel to the ground
        Vec3f upAxis = pose.up();
        velocity += vecmath::projectOnPlane(relativeInputFrame_->right(), upAxis).normalized() * input_.horizontal;
        velocity += vecmath::projectOnPlane(relativeInputFrame_->forward(), upAxis).normalized() * input_.vertical;
    }

    // Diagonal input is no faster than straight input
    if (velocity.length() > 1.0f) {
        velocity.normalize();
    }

    return velocity * movementSpeed();
}

Vec3f MovementController::calculateGroundedMomentum(const Vec3f& momentum) const {
    const Vec3f upAxis = up();
    Vec3f verticalMomentum = vecmath::extractDotVector(momentum, upAxis);
    Vec3f horizontalMomentum = momentum - verticalMomentum;

    verticalMomentum -= upAxis * (config_.gravity * dt_);
    if (verticalMomentum.dot(upAxis) < 0.0f) {
        verticalMomentum = Vec3f::zero();
    }

    horizontalMomentum = vecmath::incrementTowards(horizontalMomentum, Vec3f::zero(), config_.groundFriction, dt_);

    return horizontalMomentum + verticalMomentum;
}

Vec3f MovementController::calculateAirMomentum(const Vec3f& momentum) {
    const Vec3f upAxis = up();
    Vec3f verticalMomentum = vecmath::extractDotVector(momentum, upAxis);
    Vec3f horizontalMomentum = momentum - verticalMomentum;

    verticalMomentum -= upAxis * (config_.gravity * dt_);

    if (horizontalMomentum.length() > movementSpeed()) {
        // An external impulse is in effect: do not add speed along it, and
        // steer with reduced authority.
        Vec3f direction = horizontalMomentum.normalized();
        if (movementVelocity_.dot(direction) > 0.0f) {
            movementVelocity_ = vecmath::removeDotVector(movementVelocity_, direction);
        }
        horizontalMomentum += movementVelocity_ * (dt_ * config_.airControlRate * config_.airControlMultiplier);
    } else {
        horizontalMomentum += movementVelocity_ * (dt_ * config_.airControlRate);
        horizontalMomentum = vecmath::clampMagnitude(horizontalMomentum, movementSpeed());
    }

    horizontalMomentum = vecmath::incrementTowards(horizontalMomentum, Vec3f::zero(), config_.airFriction, dt_);

    return horizontalMomentum + verticalMomentum;
}

Vec3f MovementController::calculateSlidingMomentum(const Vec3f& momentum) const {
    const Vec3f upAxis = up();
    const Vec3f groundNormal = mover_.groundNormal();

    Vec3f verticalMomentum = vecmath::extractDotVector(momentum, upAxis);
    Vec3f horizontalMomentum = momentum - verticalMomentum;

    verticalMomentum -= upAxis * (config_.gravity * dt_);

    // Horizontal direction pointing down the slope
    Vec3f pointDownVector = vecmath::projectOnPlane(groundNormal, upAxis).normalized();

    // Input may steer across the slope but never push back up it
    Vec3f slopeMovementVelocity = vecmath::removeDotVector(movementVelocity_, pointDownVector);
    horizontalMomentum += slopeMovementVelocity * dt_;

    horizontalMomentum = vecmath::incrementTowards(horizontalMomentum, Vec3f::zero(), config_.airFriction, dt_);

    Vec3f result = horizontalMomentum + verticalMomentum;
    result = vecmath::projectOnPlane(result, groundNormal);

    if (result.dot(upAxis) > 0.0f) {
        result = vecmath::removeDotVector(result, upAxis);
    }

    Vec3f slideDirection = vecmath::projectOnPlane(-upAxis, groundNormal).normalized();
    result += slideDirection * (config_.slideGravity * dt_);

    return result;
}

Vec3f MovementController::calculateAttachMomentum(const Vec3f& anchor) const {
    Vec3f toAnchor = anchor - mover_.pose().getPosition();
    float distance = toAnchor.length();
    if (distance < kAnchorReachedDistance) {
        return Vec3f::zero();
    }

    // Never overshoot the anchor within one tick
    float speed = std::min(config_.climbAttachSpeed, distance / dt_);
    return toAnchor * (speed / distance);
}

Vec3f MovementController::calculateLadderMomentum(const ClimbZone& zone) {
    const Transformf pose = mover_.pose();
    const Vec3f upAxis = pose.up();
    const float forwardAmount = movementVelocity_.dot(pose.forward());

    // Pressing back while standing at the base steps off the ladder
    if (mover_.isGrounded() && forwardAmount < 0.0f) {
        return -zone.forward() * movementSpeed();
    }

    if ((pose.getPosition() - zone.endAnchor()).dot(upAxis) >= 0.0f && forwardAmount > 0.0f) {
        triggerLadderExit_ = true;
    }

    return upAxis * (forwardAmount * dt_ * config_.climbMovementSpeed);
}

Vec3f MovementController::calculateLadderEndMomentum(const ClimbZone& zone) {
    Vec3f result = calculateAttachMomentum(zone.endAnchor());
    if (result.lengthSquared() == 0.0f) {
        triggerLadderExit_ = false;
    }
    return result;
}

Vec3f MovementController::freeClimbAnchor(const ClimbZone& zone) const {
    const Vec3f upAxis = up();
    const Vec3f forward = zone.forward();
    const Vec3f start = zone.startAnchor();
    const Vec3f end = zone.endAnchor();

    // Onto the climbing plane through the start anchor
    Vec3f position = mover_.pose().getPosition();
    Vec3f anchor = position - forward * (position - start).dot(forward);

    float height = (anchor - start).dot(upAxis);
    float top = (end - start).dot(upAxis);
    float clamped = std::clamp(height, std::min(0.0f, top), std::max(0.0f, top));
    return anchor + upAxis * (clamped - height);
}

Vec3f MovementController::calculateFreeClimbMomentum(const ClimbZone& zone) const {
    const Transformf pose = mover_.pose();
    const Vec3f upAxis = pose.up();
    const float lateral = movementVelocity_.dot(pose.right());
    float forwardAmount = movementVelocity_.dot(pose.forward());

    if (mover_.isGrounded() && forwardAmount < 0.0f) {
        return -zone.forward() * movementSpeed();
    }

    if ((pose.getPosition() - zone.endAnchor()).dot(upAxis) >= 0.0f && forwardAmount > 0.0f) {
        forwardAmount = 0.0f;
    }

    return (zone.right() * lateral + upAxis * forwardAmount) * (dt_ * config_.climbMovementSpeed);
}

// -- Climb zones --

void MovementController::refreshClimbZone() {
    auto held = climbZone_.lock();
    if (held && !zones_->contains(held)) {
        climbZone_.reset();
        held.reset();
    }

    if (!usingClimbZone_ || !held) {
        climbZone_ = zones_->activeZone();
    }
}

void MovementController::handleClimbZone() {
    auto zone = climbZone_.lock();
    if (!zone) {
        usingClimbZone_ = false;
        triggerLadderEnter_ = false;
        triggerLadderExit_ = false;
        triggerFreeClimbEnter_ = false;
        return;
    }

    if (usingClimbZone_ || !mover_.isGrounded() || movementVelocity_.lengthSquared() <= 0.0f)
        return;

    // Zones are only grabbed from their lower half; the top landing may still overlap the trigger
    const Vec3f upAxis = up();
    const Vec3f start = zone->startAnchor();
    const float height = (mover_.pose().getPosition() - start).dot(upAxis);
    if (height >= 0.5f * (zone->endAnchor() - start).dot(upAxis))
        return;

    float alignment = movementVelocity_.normalized().dot(zone->forward());
    if (alignment >= 1.0f - config_.climbUseThreshold) {
        if (zone->allowFreeClimbing) {
            triggerFreeClimbEnter_ = true;
        } else {
            triggerLadderEnter_ = true;
        }
    }
}

void MovementController::updateAutoJumpCooldown() {
    if (config_.useAutoJump && !canJump_) {
        timeSinceLastJump_ += dt_;
        canJump_ = timeSinceLastJump_ >= config_.autoJumpCooldown;
    }
}

void MovementController::captureRollVelocity() {
    Vec3f horizontal = vecmath::removeDotVector(movementVelocity_, up());
    if (horizontal.lengthSquared() > vecmath::kEpsilon) {
        rollVelocity_ = horizontal;
    } else {
        rollVelocity_ = mover_.pose().forward() * movementSpeed();
    }
}

// -- Collision modifiers --

void MovementController::onCollisionEnter(const std::vector<ContactPoint>& contacts) {
    if (contacts.empty())
        return;

    if (config_.useCeilingDetection) {
        checkCeilingCollisionAngles(contacts);
    }
    if (config_.bounceOffWallCollisions) {
        bounceOffWall(contacts);
    }
    if (fsm_.currentState() == ControllerState::Rolling) {
        checkRollCrash(contacts);
    }
}

void MovementController::onCollisionStay(const std::vector<ContactPoint>& contacts) {
    if (contacts.empty())
        return;

    if (config_.useCeilingDetection) {
        checkCeilingCollisionAngles(contacts);
    }
}

void MovementController::bounceOffWall(const std::vector<ContactPoint>& contacts) {
    const Vec3f& normal = contacts.front().normal;
    addMomentum(-(normal * velocity_.dot(normal)));
}

void MovementController::checkCeilingCollisionAngles(const std::vector<ContactPoint>& contacts) {
    const Vec3f down = -up();

    switch (config_.ceilingDetectionMethod) {
        case CeilingDetectionMethod::OnlyCheckFirstContact: {
            if (vecmath::angleDegrees(down, contacts.front().normal) < config_.ceilingAngleLimit) {
                ceilingWasHit_ = true;
            }
            break;
        }
        case CeilingDetectionMethod::CheckAllContacts: {
            for (const auto& contact : contacts) {
                if (vecmath::angleDegrees(down, contact.normal) < config_.ceilingAngleLimit) {
                    ceilingWasHit_ = true;
                }
            }
            break;
        }
        case CeilingDetectionMethod::CheckAverageOfAllContacts: {
            float angle = 0.0f;
            for (const auto& contact : contacts) {
                angle += vecmath::angleDegrees(down, contact.normal);
            }
            if (angle / static_cast<float>(contacts.size()) < config_.ceilingAngleLimit) {
                ceilingWasHit_ = true;
            }
            break;
        }
        default: {
            STRIDE_LOG_WARN("Unknown ceiling detection method {}, ceiling hits are ignored",
                            static_cast<int>(config_.ceilingDetectionMethod));
            ceilingWasHit_ = false;
            break;
        }
    }
}

void MovementController::checkRollCrash(const std::vector<ContactPoint>& contacts) {
    const Vec3f upAxis = up();
    for (const auto& contact : contacts) {
        bool isWall = vecmath::angleDegrees(contact.normal, upAxis) > config_.slopeLimit;
        if (isWall && contact.normal.dot(rollVelocity_) < 0.0f) {
            triggerRollCrash_ = true;
            rollCrashPoint_ = contact.point;
            return;
        }
    }
}

// -- Events --

void MovementController::onJumpStart() {
    Vec3f tempMomentum = momentum() + up() * config_.jumpSpeed;
    dispatchVectorEvent(events::kJump, "momentum", tempMomentum);
    setMomentum(tempMomentum);
}

void MovementController::onGroundContactLost() {
    Vec3f tempMomentum = momentum();
    Vec3f velocity = movementVelocity_;

    if (tempMomentum.lengthSquared() > 0.0f && velocity.lengthSquared() > 0.0f) {
        Vec3f direction = velocity.normalized();
        Vec3f projectedMomentum = vecmath::project(tempMomentum, direction);
        float dot = projectedMomentum.normalized().dot(direction);

        // Momentum already carries the character along the input direction
        if (projectedMomentum.lengthSquared() >= velocity.lengthSquared() && dot > 0.0f) {
            velocity = Vec3f::zero();
        } else if (dot > 0.0f) {
            velocity -= projectedMomentum;
        }
    }

    setMomentum(tempMomentum + velocity);
    timeSinceLastJump_ = 0.0f;
}

void MovementController::onGroundContactRegained() {
    dispatchVectorEvent(events::kLand, "momentum", momentum());
}

void MovementController::onCeilingContact() {
    setMomentum(vecmath::removeDotVector(momentum(), up()));
}

void MovementController::dispatchVectorEvent(const char* type, const char* key, const Vec3f& value) {
    Event event(type, kEventSource);
    event.setAnyData<Vec3f>(key, value);
    events_.dispatchEvent(event);
}

void MovementController::dispatchEvent(const char* type) {
    Event event(type, kEventSource);
    events_.dispatchEvent(event);
}

} // namespace stride

#pragma once

#include "stride/core/CharacterConfig.hh"
#include "stride/core/CharacterTypes.hh"
#include "stride/core/Event.hh"
#include "stride/core/Mover.hh"
#include "stride/core/MovementFSM.hh"
#include "stride/core/Spatial.hh"
#include "stride/core/ZoneProvider.hh"

#include <memory>
#include <optional>
#include <vector>

namespace stride {

/**
 * @brief Rigidbody-driven character movement state machine
 *
 * Each tick refreshes ground contact through the Mover, derives the input
 * velocity, selects the next ControllerState, runs the transition side
 * effects and finally computes the momentum of the active state. The
 * resulting velocity is written back to the Mover, which adds its own ground
 * correction before handing it to the rigidbody.
 *
 * Momentum persists across ticks (gravity, slides, impulses) while the
 * movement velocity is rebuilt from input every tick.
 *
 * Events dispatched through events(): character.jump and character.land
 * ("momentum", Vec3f), character.rollCrash ("point", Vec3f),
 * character.ladderEnter, character.ladderExit, character.freeClimbEnter.
 */
class MovementController {
  public:
    MovementController(Mover& mover, const ControllerConfig& config = {});

    void tick(float dt, const ControllerInput& input, const ZoneSnapshot& zones);

    // Contact callbacks from the physics collaborator
    void onCollisionEnter(const std::vector<ContactPoint>& contacts);
    void onCollisionStay(const std::vector<ContactPoint>& contacts);

    // External impulse, in world space
    void addMomentum(const Vec3f& extraMomentum);

    // Teleport/respawn: force a state and clear momentum and one-shot triggers
    void resetState(ControllerState state);

    // Camera-relative input. Without a frame the body's own axes are used.
    void setRelativeInputFrame(const Transformf& frame) { relativeInputFrame_ = frame; }
    void clearRelativeInputFrame() { relativeInputFrame_.reset(); }

    const Vec3f& velocity() const { return velocity_; }
    Vec3f momentum() const;
    const Vec3f& movementVelocity() const { return movementVelocity_; }

    ControllerState state() const { return fsm_.currentState(); }
    bool isGrounded() const { return fsm_.isGroundedFamily(); }
    bool isSliding() const { return fsm_.currentState() == ControllerState::Sliding; }
    bool isRolling() const { return fsm_.isRolling(); }
    bool inCrouchZone() const { return inCrouchZone_; }
    bool isUsingClimbZone() const { return usingClimbZone_; }

    // Crouch speed while inside a crouch zone
    float movementSpeed() const;

    float gravity() const { return config_.gravity; }
    void setGravity(float gravity) { config_.gravity = gravity; }
    float jumpSpeed() const { return config_.jumpSpeed; }
    void setJumpSpeed(float speed) { config_.jumpSpeed = speed; }
    void setMovementSpeed(float speed) { config_.movementSpeed = speed; }

    const ControllerConfig& config() const { return config_; }
    EventDispatcher& events() { return events_; }
    const MovementFSM& fsm() const { return fsm_; }

  private:
    void registerStateHandlers();

    ControllerState determineNextState();
    void onStateEnter(ControllerState entering, ControllerState exiting);
    void onStateExit(ControllerState exiting, ControllerState entering);
    void stateUpdate();

    Vec3f calculateMovementVelocity() const;
    Vec3f calculateGroundedMomentum(const Vec3f& momentum) const;
    Vec3f calculateAirMomentum(const Vec3f& momentum);
    Vec3f calculateSlidingMomentum(const Vec3f& momentum) const;
    Vec3f calculateAttachMomentum(const Vec3f& anchor) const;
    Vec3f calculateLadderMomentum(const ClimbZone& zone);
    Vec3f calculateLadderEndMomentum(const ClimbZone& zone);
    Vec3f calculateFreeClimbMomentum(const ClimbZone& zone) const;
    Vec3f freeClimbAnchor(const ClimbZone& zone) const;

    void refreshClimbZone();
    void handleClimbZone();
    void updateAutoJumpCooldown();
    void captureRollVelocity();
    bool isRisingOrFalling() const;
    bool isGroundTooSteep() const;

    void checkCeilingCollisionAngles(const std::vector<ContactPoint>& contacts);
    void bounceOffWall(const std::vector<ContactPoint>& contacts);
    void checkRollCrash(const std::vector<ContactPoint>& contacts);

    void onJumpStart();
    void onGroundContactLost();
    void onGroundContactRegained();
    void onCeilingContact();
    void dispatchVectorEvent(const char* type, const char* key, const Vec3f& value);
    void dispatchEvent(const char* type);

    void setMomentum(const Vec3f& momentum);
    Vec3f up() const;

    Mover& mover_;
    ControllerConfig config_;
    MovementFSM fsm_;
    EventDispatcher events_;

    // Tick inputs
    float dt_ = 0.0f;
    ControllerInput input_;
    const ZoneSnapshot* zones_ = nullptr;
    bool inCrouchZone_ = false;
    std::optional<Transformf> relativeInputFrame_;

    // Stored in the body frame when useLocalMomentum is set
    Vec3f momentum_;
    Vec3f velocity_;
    Vec3f movementVelocity_;

    // Jumping
    bool triggerJump_ = false;
    float timeSinceLastJump_ = 0.0f;
    bool canJump_ = false;
    bool ceilingWasHit_ = false;

    // Crouching
    float originalColliderHeight_ = 0.0f;
    float originalStepHeightRatio_ = 0.0f;

    // Climbing
    std::weak_ptr<const ClimbZone> climbZone_;
    bool triggerLadderEnter_ = false;
    bool triggerLadderExit_ = false;
    bool triggerFreeClimbEnter_ = false;
    bool usingClimbZone_ = false;

    // Rolling
    bool rollPressed_ = false;
    bool triggerRollCrash_ = false;
    float rollTimer_ = 0.0f;
    float rollCrashTimer_ = 0.0f;
    Vec3f rollVelocity_;
    Vec3f rollCrashPoint_;
};

} // namespace stride

#pragma once

#include "stride/core/CharacterTypes.hh"
#include "stride/core/Spatial.hh"
#include "stride/utils/ErrorHandling.hh"

#include <filesystem>

namespace stride {

class DataLoader;

// Collider and ground sensor tunables
struct MoverConfig {
    float stepHeightRatio = 0.25f;
    float colliderHeight = 2.0f;
    float colliderThickness = 1.0f;
    LocalVec3f colliderOffset;
    ColliderKind colliderKind = ColliderKind::Capsule;

    float sensorRadiusModifier = 0.8f;
    CastType sensorType = CastType::Raycast;
    float safetyDistanceFactor = 0.001f;
    int sensorArrayRows = 1;
    int sensorArrayRayCount = 6;
    bool sensorArrayRowsAreOffset = false;
};

struct ControllerConfig {
    // Grounded
    float movementSpeed = 7.0f;
    float groundFriction = 100.0f;
    bool useLocalMomentum = false;
    float slideGravity = 5.0f;
    float slopeLimit = 80.0f; // degrees

    // Air control
    float airControlRate = 2.0f;
    float airControlMultiplier = 0.25f;
    float gravity = 30.0f;
    float verticalThreshold = 0.001f;
    float airFriction = 0.5f;

    // Auto jump
    bool useAutoJump = true;
    float jumpSpeed = 10.0f;
    float autoJumpMovementSpeedThreshold = 2.0f;
    float autoJumpCooldown = 0.2f;

    // Ceiling and wall contacts
    bool useCeilingDetection = true;
    float ceilingAngleLimit = 10.0f; // degrees
    CeilingDetectionMethod ceilingDetectionMethod = CeilingDetectionMethod::OnlyCheckFirstContact;
    bool bounceOffWallCollisions = true;

    // Crouch
    float crouchSpeed = 3.5f;
    float crouchColliderHeight = 1.0f;
    float crouchStepHeightRatio = 0.1f;

    // Ladders and free climbing
    float climbMovementSpeed = 15.0f;
    float climbUseThreshold = 0.15f;
    float climbAttachSpeed = 3.5f;
    float climbMoveThreshold = 0.01f;

    // Rolling
    float rollSpeedMultiplier = 1.5f;
    float rollDuration = 0.6f;
    float rollCrashDuration = 1.0f;
};

struct CharacterConfig {
    MoverConfig mover;
    ControllerConfig controller;
};

// Clamp out-of-range values in place. Returns the number of fields changed;
// each change is logged as a warning.
int validate(MoverConfig& config);
int validate(ControllerConfig& config);

// Reads [mover] and [controller] tables. Missing keys keep their defaults,
// wrongly typed values fail the load, unknown enum names keep the default
// with a warning. The result has already been validated.
Result<CharacterConfig> loadCharacterConfig(const DataLoader& loader);
Result<CharacterConfig> loadCharacterConfig(const std::filesystem::path& path);

} // namespace stride

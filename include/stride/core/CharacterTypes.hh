#pragma once

#include "stride/core/Spatial.hh"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace stride {

enum class ControllerState : uint8_t {
    Grounded,
    Sliding,
    Falling,
    Rising,
    Jumping,
    Crouching,
    LadderStart,
    LadderClimbing,
    LadderEnd,
    Rolling,
    RollingCrash,
    FreeClimbStart,
    FreeClimbing
};

inline constexpr int kControllerStateCount = 13;

// Per-tick player intent. Axes are expected in [-1, 1].
struct ControllerInput {
    float horizontal = 0.0f;
    float vertical = 0.0f;
    bool rollPressed = false;
};

enum class CastType : uint8_t {
    Raycast,
    RaycastArray,
    Spherecast
};

// Local axis the sensor probes along
enum class CastDirection : uint8_t {
    Forward,
    Right,
    Up,
    Backward,
    Left,
    Down
};

enum class CeilingDetectionMethod : uint8_t {
    OnlyCheckFirstContact,
    CheckAllContacts,
    CheckAverageOfAllContacts
};

enum class ColliderKind : uint8_t {
    Box,
    Sphere,
    Capsule
};

// Collider dimensions in the body's local frame. Box uses `size`;
// sphere uses `radius`; capsule uses `radius` and total `height`.
struct ColliderShape {
    ColliderKind kind = ColliderKind::Capsule;
    LocalVec3f center;
    LocalVec3f size;
    float radius = 0.5f;
    float height = 2.0f;
};

// Contact normals point from the touched surface toward the character.
struct ContactPoint {
    Vec3f point;
    Vec3f normal;
};

std::string castTypeToString(CastType type);
std::string ceilingMethodToString(CeilingDetectionMethod method);
std::string colliderKindToString(ColliderKind kind);

// Name lookups used by configuration files. Case-sensitive, camelCase.
std::optional<CastType> castTypeFromString(std::string_view name);
std::optional<CeilingDetectionMethod> ceilingMethodFromString(std::string_view name);
std::optional<ColliderKind> colliderKindFromString(std::string_view name);

} // namespace stride

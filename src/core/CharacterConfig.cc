#include "stride/core/CharacterConfig.hh"

#include "stride/core/DataLoader.hh"
#include "stride/core/Log.hh"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

namespace stride {

namespace {

template <typename T> int clampField(T& value, T lo, T hi, std::string_view name) {
    T clamped = std::clamp(value, lo, hi);
    if (clamped == value)
        return 0;
    STRIDE_LOG_WARN("Config value {} = {} out of range [{}, {}], clamped to {}", name, value, lo, hi, clamped);
    value = clamped;
    return 1;
}

constexpr float kMaxFloat = 1.0e6f;

// Collects the first hard error while reading fields in sequence
class FieldReader {
  public:
    explicit FieldReader(const DataLoader& loader) : loader_(loader) {}

    void read(const std::string& key, float& out) {
        if (skip(key))
            return;
        auto r = loader_.getFloat(key);
        if (r.isError())
            return fail(r.code(), r.message());
        out = static_cast<float>(r.value());
    }

    void read(const std::string& key, int& out) {
        if (skip(key))
            return;
        auto r = loader_.getInt(key);
        if (r.isError())
            return fail(r.code(), r.message());
        out = static_cast<int>(r.value());
    }

    void read(const std::string& key, bool& out) {
        if (skip(key))
            return;
        auto r = loader_.getBool(key);
        if (r.isError())
            return fail(r.code(), r.message());
        out = r.value();
    }

    void read(const std::string& key, LocalVec3f& out) {
        if (skip(key))
            return;
        auto r = loader_.getVec3(key);
        if (r.isError())
            return fail(r.code(), r.message());
        out = r.value().as<Space::Local>();
    }

    template <typename E> void readEnum(const std::string& key, E& out, std::optional<E> (*fromString)(std::string_view)) {
        if (skip(key))
            return;
        auto r = loader_.getString(key);
        if (r.isError())
            return fail(r.code(), r.message());
        auto parsed = fromString(r.value());
        if (!parsed) {
            STRIDE_LOG_WARN("{}: unknown value '{}' for '{}', keeping default", loader_.sourceName(), r.value(), key);
            return;
        }
        out = *parsed;
    }

    bool failed() const { return code_ != ErrorCode::Ok; }
    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

  private:
    bool skip(const std::string& key) const { return failed() || !loader_.hasKey(key); }

    void fail(ErrorCode code, const std::string& message) {
        code_ = code;
        message_ = message;
    }

    const DataLoader& loader_;
    ErrorCode code_ = ErrorCode::Ok;
    std::string message_;
};

} // namespace

int validate(MoverConfig& config) {
    int changed = 0;
    changed += clampField(config.stepHeightRatio, 0.0f, 1.0f, "mover.stepHeightRatio");
    changed += clampField(config.colliderHeight, 0.01f, kMaxFloat, "mover.colliderHeight");
    changed += clampField(config.colliderThickness, 0.0f, kMaxFloat, "mover.colliderThickness");
    changed += clampField(config.sensorRadiusModifier, 0.0f, 1.0f, "mover.sensorRadiusModifier");
    changed += clampField(config.safetyDistanceFactor, 0.0f, 0.5f, "mover.safetyDistanceFactor");
    changed += clampField(config.sensorArrayRows, 1, 16, "mover.sensorArrayRows");
    changed += clampField(config.sensorArrayRayCount, 1, 64, "mover.sensorArrayRayCount");
    return changed;
}

int validate(ControllerConfig& config) {
    int changed = 0;
    changed += clampField(config.movementSpeed, 0.0f, kMaxFloat, "controller.movementSpeed");
    changed += clampField(config.groundFriction, 0.0f, kMaxFloat, "controller.groundFriction");
    changed += clampField(config.slideGravity, 0.0f, kMaxFloat, "controller.slideGravity");
    changed += clampField(config.slopeLimit, 0.0f, 90.0f, "controller.slopeLimit");
    changed += clampField(config.airControlRate, 0.0f, kMaxFloat, "controller.airControlRate");
    changed += clampField(config.airControlMultiplier, 0.0f, 1.0f, "controller.airControlMultiplier");
    changed += clampField(config.gravity, 0.0f, kMaxFloat, "controller.gravity");
    changed += clampField(config.verticalThreshold, 0.0f, kMaxFloat, "controller.verticalThreshold");
    changed += clampField(config.airFriction, 0.0f, kMaxFloat, "controller.airFriction");
    changed += clampField(config.jumpSpeed, 0.0f, kMaxFloat, "controller.jumpSpeed");
    changed += clampField(config.autoJumpMovementSpeedThreshold, 0.0f, kMaxFloat,
                          "controller.autoJumpMovementSpeedThreshold");
    changed += clampField(config.autoJumpCooldown, 0.0f, kMaxFloat, "controller.autoJumpCooldown");
    changed += clampField(config.ceilingAngleLimit, 0.0f, 90.0f, "controller.ceilingAngleLimit");
    changed += clampField(config.crouchSpeed, 0.0f, kMaxFloat, "controller.crouchSpeed");
    changed += clampField(config.crouchColliderHeight, 0.01f, kMaxFloat, "controller.crouchColliderHeight");
    changed += clampField(config.crouchStepHeightRatio, 0.0f, 1.0f, "controller.crouchStepHeightRatio");
    changed += clampField(config.climbMovementSpeed, 0.0f, kMaxFloat, "controller.climbMovementSpeed");
    changed += clampField(config.climbUseThreshold, 0.0f, 2.0f, "controller.climbUseThreshold");
    changed += clampField(config.climbAttachSpeed, 0.0f, kMaxFloat, "controller.climbAttachSpeed");
    changed += clampField(config.climbMoveThreshold, 0.0f, kMaxFloat, "controller.climbMoveThreshold");
    changed += clampField(config.rollSpeedMultiplier, 0.0f, kMaxFloat, "controller.rollSpeedMultiplier");
    changed += clampField(config.rollDuration, 0.0f, kMaxFloat, "controller.rollDuration");
    changed += clampField(config.rollCrashDuration, 0.0f, kMaxFloat, "controller.rollCrashDuration");
    return changed;
}

Result<CharacterConfig> loadCharacterConfig(const DataLoader& loader) {
    CharacterConfig config;
    FieldReader in(loader);

    MoverConfig& m = config.mover;
    in.read("mover.stepHeightRatio", m.stepHeightRatio);
    in.read("mover.colliderHeight", m.colliderHeight);
    in.read("mover.colliderThickness", m.colliderThickness);
    in.read("mover.colliderOffset", m.colliderOffset);
    in.readEnum("mover.colliderKind", m.colliderKind, &colliderKindFromString);
    in.read("mover.sensorRadiusModifier", m.sensorRadiusModifier);
    in.readEnum("mover.sensorType", m.sensorType, &castTypeFromString);
    in.read("mover.safetyDistanceFactor", m.safetyDistanceFactor);
    in.read("mover.sensorArrayRows", m.sensorArrayRows);
    in.read("mover.sensorArrayRayCount", m.sensorArrayRayCount);
    in.read("mover.sensorArrayRowsAreOffset", m.sensorArrayRowsAreOffset);

    ControllerConfig& c = config.controller;
    in.read("controller.movementSpeed", c.movementSpeed);
    in.read("controller.groundFriction", c.groundFriction);
    in.read("controller.useLocalMomentum", c.useLocalMomentum);
    in.read("controller.slideGravity", c.slideGravity);
    in.read("controller.slopeLimit", c.slopeLimit);
    in.read("controller.airControlRate", c.airControlRate);
    in.read("controller.airControlMultiplier", c.airControlMultiplier);
    in.read("controller.gravity", c.gravity);
    in.read("controller.verticalThreshold", c.verticalThreshold);
    in.read("controller.airFriction", c.airFriction);
    in.read("controller.useAutoJump", c.useAutoJump);
    in.read("controller.jumpSpeed", c.jumpSpeed);
    in.read("controller.autoJumpMovementSpeedThreshold", c.autoJumpMovementSpeedThreshold);
    in.read("controller.autoJumpCooldown", c.autoJumpCooldown);
    in.read("controller.useCeilingDetection", c.useCeilingDetection);
    in.read("controller.ceilingAngleLimit", c.ceilingAngleLimit);
    in.readEnum("controller.ceilingDetectionMethod", c.ceilingDetectionMethod, &ceilingMethodFromString);
    in.read("controller.bounceOffWallCollisions", c.bounceOffWallCollisions);
    in.read("controller.crouchSpeed", c.crouchSpeed);
    in.read("controller.crouchColliderHeight", c.crouchColliderHeight);
    in.read("controller.crouchStepHeightRatio", c.crouchStepHeightRatio);
    in.read("controller.climbMovementSpeed", c.climbMovementSpeed);
    in.read("controller.climbUseThreshold", c.climbUseThreshold);
    in.read("controller.climbAttachSpeed", c.climbAttachSpeed);
    in.read("controller.climbMoveThreshold", c.climbMoveThreshold);
    in.read("controller.rollSpeedMultiplier", c.rollSpeedMultiplier);
    in.read("controller.rollDuration", c.rollDuration);
    in.read("controller.rollCrashDuration", c.rollCrashDuration);

    if (in.failed()) {
        return Result<CharacterConfig>::error(in.code(), in.message());
    }

    int clamped = validate(config.mover) + validate(config.controller);
    STRIDE_LOG_DEBUG("Character config loaded from {} ({} values clamped)", loader.sourceName(), clamped);
    return Result<CharacterConfig>::ok(config);
}

Result<CharacterConfig> loadCharacterConfig(const std::filesystem::path& path) {
    auto loaded = DataLoader::load(path);
    if (loaded.isError()) {
        return Result<CharacterConfig>::error(loaded.code(), loaded.message());
    }
    return loadCharacterConfig(loaded.value());
}

} // namespace stride

#pragma once

#include "stride/core/Spatial.hh"

#include <algorithm>
#include <cmath>

namespace stride::vecmath {

inline constexpr float kPi = 3.14159265358979323846f;
inline constexpr float kRadToDeg = 180.0f / kPi;
inline constexpr float kDegToRad = kPi / 180.0f;
inline constexpr float kEpsilon = 1e-6f;

inline bool approximately(float a, float b, float epsilon = 1e-5f) {
    return std::abs(a - b) <= epsilon;
}

inline bool approximately(const Vec3f& a, const Vec3f& b, float epsilon = 1e-5f) {
    return (a - b).lengthSquared() <= epsilon * epsilon;
}

// Component of `v` along `direction`. Direction is normalized internally.
inline Vec3f extractDotVector(const Vec3f& v, const Vec3f& direction) {
    Vec3f d = direction.normalized();
    return d * v.dot(d);
}

// `v` with its component along `direction` removed.
inline Vec3f removeDotVector(const Vec3f& v, const Vec3f& direction) {
    return v - extractDotVector(v, direction);
}

inline Vec3f project(const Vec3f& v, const Vec3f& onto) {
    float sq = onto.lengthSquared();
    if (sq < kEpsilon)
        return Vec3f::zero();
    return onto * (v.dot(onto) / sq);
}

inline Vec3f projectOnPlane(const Vec3f& v, const Vec3f& planeNormal) {
    return v - project(v, planeNormal);
}

// Unsigned angle between two vectors in degrees; 0 for degenerate input
inline float angleDegrees(const Vec3f& a, const Vec3f& b) {
    float denom = std::sqrt(a.lengthSquared() * b.lengthSquared());
    if (denom < kEpsilon)
        return 0.0f;
    float c = std::clamp(a.dot(b) / denom, -1.0f, 1.0f);
    return std::acos(c) * kRadToDeg;
}

inline Vec3f clampMagnitude(const Vec3f& v, float maxLength) {
    float sq = v.lengthSquared();
    if (sq > maxLength * maxLength && sq > 0.0f) {
        return v * (maxLength / std::sqrt(sq));
    }
    return v;
}

// Moves `current` toward `target` by at most `speed * dt`, never overshooting.
inline Vec3f incrementTowards(const Vec3f& current, const Vec3f& target, float speed, float dt) {
    Vec3f delta = target - current;
    float maxStep = speed * dt;
    float dist = delta.length();
    if (dist <= maxStep || dist < kEpsilon)
        return target;
    return current + delta * (maxStep / dist);
}

} // namespace stride::vecmath

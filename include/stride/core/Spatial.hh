#pragma once

#include <array>
#include <cmath>
#include <type_traits>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_inverse.hpp>
#include <glm/gtc/type_ptr.hpp>

namespace stride {

// Forward declarations
template <typename T, typename SpaceTag> class Vector3;
template <typename T, typename SpaceTag> class Vector4;
template <typename T> class Matrix4x4;
template <typename T> class Quaternion;
template <typename T> class Transform;

/**
 * @brief Type tags for different coordinate spaces
 *
 * These tags are used to distinguish between different coordinate spaces
 * at compile time, preventing accidental mixing of spaces.
 */
namespace Space {
struct Local {}; // Character-local coordinate space
struct World {}; // World-space coordinates
} // namespace Space

/**
 * @brief 3D vector class with coordinate space type safety
 *
 * Axis convention: +X right, +Y up, +Z forward.
 *
 * @tparam T Numeric type (float, double, etc.)
 * @tparam Space Coordinate space tag
 */
template <typename T, typename SpaceTag = Space::World> class Vector3 {
  public:
    T x, y, z;

    Vector3() : x(0), y(0), z(0) {}
    Vector3(T x, T y, T z) : x(x), y(y), z(z) {}

    static Vector3<T, SpaceTag> zero() { return Vector3<T, SpaceTag>(0, 0, 0); }
    static Vector3<T, SpaceTag> unitX() { return Vector3<T, SpaceTag>(1, 0, 0); }
    static Vector3<T, SpaceTag> unitY() { return Vector3<T, SpaceTag>(0, 1, 0); }
    static Vector3<T, SpaceTag> unitZ() { return Vector3<T, SpaceTag>(0, 0, 1); }

    // Operators with the same space
    Vector3<T, SpaceTag> operator+(const Vector3<T, SpaceTag>& other) const {
        return Vector3<T, SpaceTag>(x + other.x, y + other.y, z + other.z);
    }

    Vector3<T, SpaceTag> operator-(const Vector3<T, SpaceTag>& other) const {
        return Vector3<T, SpaceTag>(x - other.x, y - other.y, z - other.z);
    }

    Vector3<T, SpaceTag> operator-() const { return Vector3<T, SpaceTag>(-x, -y, -z); }

    Vector3<T, SpaceTag> operator*(T scalar) const { return Vector3<T, SpaceTag>(x * scalar, y * scalar, z * scalar); }

    Vector3<T, SpaceTag> operator/(T scalar) const { return Vector3<T, SpaceTag>(x / scalar, y / scalar, z / scalar); }

    Vector3<T, SpaceTag>& operator+=(const Vector3<T, SpaceTag>& other) {
        x += other.x;
        y += other.y;
        z += other.z;
        return *this;
    }

    Vector3<T, SpaceTag>& operator-=(const Vector3<T, SpaceTag>& other) {
        x -= other.x;
        y -= other.y;
        z -= other.z;
        return *this;
    }

    Vector3<T, SpaceTag>& operator*=(T scalar) {
        x *= scalar;
        y *= scalar;
        z *= scalar;
        return *this;
    }

    bool operator==(const Vector3<T, SpaceTag>& other) const { return x == other.x && y == other.y && z == other.z; }
    bool operator!=(const Vector3<T, SpaceTag>& other) const { return !(*this == other); }

    // Cannot mix different spaces - these operations are deleted
    template <typename OtherSpace> Vector3<T, SpaceTag> operator+(const Vector3<T, OtherSpace>&) const = delete;

    template <typename OtherSpace> Vector3<T, SpaceTag> operator-(const Vector3<T, OtherSpace>&) const = delete;

    // Dot product
    T dot(const Vector3<T, SpaceTag>& other) const { return x * other.x + y * other.y + z * other.z; }

    // Cross product
    Vector3<T, SpaceTag> cross(const Vector3<T, SpaceTag>& other) const {
        return Vector3<T, SpaceTag>(y * other.z - z * other.y, z * other.x - x * other.z, x * other.y - y * other.x);
    }

    // Length calculations
    T lengthSquared() const { return x * x + y * y + z * z; }

    T length() const { return std::sqrt(lengthSquared()); }

    // Normalization
    Vector3<T, SpaceTag> normalized() const {
        T len = length();
        if (len == 0)
            return *this;
        return *this / len;
    }

    void normalize() {
        T len = length();
        if (len == 0)
            return;
        x /= len;
        y /= len;
        z /= len;
    }

    // Space conversion function
    template <typename TargetSpace> Vector3<T, TargetSpace> as() const { return Vector3<T, TargetSpace>(x, y, z); }
};

/**
 * @brief 4D vector, used for homogeneous transforms only
 */
template <typename T, typename SpaceTag = Space::World> class Vector4 {
  public:
    T x, y, z, w;

    Vector4() : x(0), y(0), z(0), w(0) {}
    Vector4(T x, T y, T z, T w) : x(x), y(y), z(z), w(w) {}
    Vector4(const Vector3<T, SpaceTag>& v, T w) : x(v.x), y(v.y), z(v.z), w(w) {}

    // Conversion to Vector3 (drops w)
    Vector3<T, SpaceTag> xyz() const { return Vector3<T, SpaceTag>(x, y, z); }
};

/**
 * @brief Quaternion class for representing rotations
 *
 * @tparam T Numeric type (float, double, etc.)
 */
template <typename T> class Quaternion {
  public:
    T x, y, z, w;

    Quaternion() : x(0), y(0), z(0), w(1) {}
    Quaternion(T x, T y, T z, T w) : x(x), y(y), z(z), w(w) {}

    static Quaternion<T> identity() { return Quaternion<T>(); }

    // Create from axis angle (radians, axis must be unit length)
    static Quaternion<T> fromAxisAngle(const Vector3<T, Space::World>& axis, T angle) {
        T halfAngle = angle * T(0.5);
        T s = std::sin(halfAngle);

        return Quaternion<T>(axis.x * s, axis.y * s, axis.z * s, std::cos(halfAngle));
    }

    // Quaternion multiplication
    Quaternion<T> operator*(const Quaternion<T>& other) const {
        return Quaternion<T>(w * other.x + x * other.w + y * other.z - z * other.y,
                             w * other.y - x * other.z + y * other.w + z * other.x,
                             w * other.z + x * other.y - y * other.x + z * other.w,
                             w * other.w - x * other.x - y * other.y - z * other.z);
    }

    // Length operations
    T lengthSquared() const { return x * x + y * y + z * z + w * w; }

    T length() const { return std::sqrt(lengthSquared()); }

    Quaternion<T> normalized() const {
        T len = length();
        if (len == 0)
            return *this;
        return Quaternion<T>(x / len, y / len, z / len, w / len);
    }

    // Conjugate
    Quaternion<T> conjugate() const { return Quaternion<T>(-x, -y, -z, w); }

    // Inverse
    Quaternion<T> inverse() const {
        T lenSq = lengthSquared();
        if (lenSq == 0)
            return *this;
        T invLenSq = T(1) / lenSq;
        return Quaternion<T>(-x * invLenSq, -y * invLenSq, -z * invLenSq, w * invLenSq);
    }

    // Rotate a vector by this quaternion
    template <typename SpaceTag> Vector3<T, SpaceTag> rotateVector(const Vector3<T, SpaceTag>& v) const {
        Quaternion<T> vQuat(v.x, v.y, v.z, 0);
        Quaternion<T> result = *this * vQuat * conjugate();
        return Vector3<T, SpaceTag>(result.x, result.y, result.z);
    }
};

/**
 * @brief 4x4 matrix class for transformations
 *
 * @tparam T Numeric type (float, double, etc.)
 */
template <typename T> class Matrix4x4 {
  public:
    // Matrix stored in column-major order (OpenGL style)
    std::array<T, 16> elements;

    // Constructor - identity matrix by default
    Matrix4x4() { setIdentity(); }

    explicit Matrix4x4(const std::array<T, 16>& data) : elements(data) {}

    void setIdentity() { elements = {1, 0, 0, 0, 0, 1, 0, 0, 0, 0, 1, 0, 0, 0, 0, 1}; }

    // Element access
    T& operator()(int row, int col) { return elements[col * 4 + row]; }

    const T& operator()(int row, int col) const { return elements[col * 4 + row]; }

    // Matrix multiplication
    Matrix4x4<T> operator*(const Matrix4x4<T>& other) const {
        Matrix4x4<T> result;

        for (int i = 0; i < 4; ++i) {
            for (int j = 0; j < 4; ++j) {
                result(i, j) = 0;
                for (int k = 0; k < 4; ++k) {
                    result(i, j) += (*this)(i, k) * other(k, j);
                }
            }
        }

        return result;
    }

    // Vector multiplication (homogeneous coordinates)
    template <typename SpaceTag, typename ResultSpaceTag>
    Vector4<T, ResultSpaceTag> multiply(const Vector4<T, SpaceTag>& v) const {
        return Vector4<T, ResultSpaceTag>(
            elements[0] * v.x + elements[4] * v.y + elements[8] * v.z + elements[12] * v.w,
            elements[1] * v.x + elements[5] * v.y + elements[9] * v.z + elements[13] * v.w,
            elements[2] * v.x + elements[6] * v.y + elements[10] * v.z + elements[14] * v.w,
            elements[3] * v.x + elements[7] * v.y + elements[11] * v.z + elements[15] * v.w);
    }

    // Vector3 transformation with implicit w=1
    template <typename SpaceTag, typename ResultSpaceTag>
    Vector3<T, ResultSpaceTag> transformPoint(const Vector3<T, SpaceTag>& v) const {
        Vector4<T, ResultSpaceTag> result = multiply<SpaceTag, ResultSpaceTag>(Vector4<T, SpaceTag>(v, 1));
        if (result.w != 0) {
            return Vector3<T, ResultSpaceTag>(result.x / result.w, result.y / result.w, result.z / result.w);
        }
        return Vector3<T, ResultSpaceTag>(result.x, result.y, result.z);
    }

    // Vector3 transformation with implicit w=0 (direction vectors)
    template <typename SpaceTag, typename ResultSpaceTag>
    Vector3<T, ResultSpaceTag> transformDirection(const Vector3<T, SpaceTag>& v) const {
        Vector4<T, ResultSpaceTag> result = multiply<SpaceTag, ResultSpaceTag>(Vector4<T, SpaceTag>(v, 0));
        return Vector3<T, ResultSpaceTag>(result.x, result.y, result.z);
    }

    static Matrix4x4<T> translation(const Vector3<T, Space::World>& v) {
        Matrix4x4<T> result;
        result(0, 3) = v.x;
        result(1, 3) = v.y;
        result(2, 3) = v.z;
        return result;
    }

    static Matrix4x4<T> scaling(const Vector3<T, Space::World>& v) {
        Matrix4x4<T> result;
        result(0, 0) = v.x;
        result(1, 1) = v.y;
        result(2, 2) = v.z;
        return result;
    }

    // Create a rotation matrix from quaternion
    static Matrix4x4<T> rotation(const Quaternion<T>& q) {
        T xx = q.x * q.x;
        T xy = q.x * q.y;
        T xz = q.x * q.z;
        T xw = q.x * q.w;
        T yy = q.y * q.y;
        T yz = q.y * q.z;
        T yw = q.y * q.w;
        T zz = q.z * q.z;
        T zw = q.z * q.w;

        Matrix4x4<T> result;
        result(0, 0) = 1 - 2 * (yy + zz);
        result(0, 1) = 2 * (xy - zw);
        result(0, 2) = 2 * (xz + yw);

        result(1, 0) = 2 * (xy + zw);
        result(1, 1) = 1 - 2 * (xx + zz);
        result(1, 2) = 2 * (yz - xw);

        result(2, 0) = 2 * (xz - yw);
        result(2, 1) = 2 * (yz + xw);
        result(2, 2) = 1 - 2 * (xx + yy);

        return result;
    }

    Matrix4x4<T> inverse() const {
        static_assert(std::is_same_v<T, float> || std::is_same_v<T, double>,
                      "Matrix4x4::inverse() only supported for float and double");

        if constexpr (std::is_same_v<T, float>) {
            glm::mat4 glmMat = glm::make_mat4(elements.data());
            float det = glm::determinant(glmMat);
            if (std::abs(det) < 1e-8f) {
                return Matrix4x4<T>();
            }
            glm::mat4 glmInv = glm::inverse(glmMat);
            Matrix4x4<T> result;
            std::copy(glm::value_ptr(glmInv), glm::value_ptr(glmInv) + 16, result.elements.begin());
            return result;
        } else {
            glm::dmat4 glmMat = glm::make_mat4(elements.data());
            double det = glm::determinant(glmMat);
            if (std::abs(det) < 1e-15) {
                return Matrix4x4<T>();
            }
            glm::dmat4 glmInv = glm::inverse(glmMat);
            Matrix4x4<T> result;
            std::copy(glm::value_ptr(glmInv), glm::value_ptr(glmInv) + 16, result.elements.begin());
            return result;
        }
    }
};

/**
 * @brief Transform class for handling position, rotation, and scale
 *
 * Used as the character pose value handed across the physics boundary and as
 * the frame of climb zones.
 *
 * @tparam T Numeric type (float, double, etc.)
 */
template <typename T> class Transform {
  public:
    using Vec3 = Vector3<T, Space::World>;
    using LocalVec3 = Vector3<T, Space::Local>;
    using Quat = Quaternion<T>;
    using Mat4 = Matrix4x4<T>;

    Transform() : position_(Vec3(0, 0, 0)), rotation_(Quat()), scale_(Vec3(1, 1, 1)), dirty_(true) {}
    Transform(const Vec3& position, const Quat& rotation = Quat(), const Vec3& scale = Vec3(1, 1, 1))
        : position_(position), rotation_(rotation), scale_(scale), dirty_(true) {}

    const Vec3& getPosition() const { return position_; }
    const Quat& getRotation() const { return rotation_; }
    const Vec3& getScale() const { return scale_; }

    void setPosition(const Vec3& position) {
        position_ = position;
        dirty_ = true;
    }

    void setRotation(const Quat& rotation) {
        rotation_ = rotation;
        dirty_ = true;
    }

    void setScale(const Vec3& scale) {
        scale_ = scale;
        dirty_ = true;
    }

    // Unit axes of this transform in world space
    Vec3 right() const { return rotation_.rotateVector(Vec3::unitX()); }
    Vec3 up() const { return rotation_.rotateVector(Vec3::unitY()); }
    Vec3 forward() const { return rotation_.rotateVector(Vec3::unitZ()); }

    const Mat4& getMatrix() const {
        if (dirty_) {
            updateMatrix();
        }
        return matrix_;
    }

    // Transform a point from local to world space
    Vec3 transformPoint(const LocalVec3& point) const {
        return getMatrix().template transformPoint<Space::Local, Space::World>(point);
    }

    // Transform a direction from local to world space (rotation and scale)
    Vec3 transformDirection(const LocalVec3& direction) const {
        return getMatrix().template transformDirection<Space::Local, Space::World>(direction);
    }

    // Transform a point from world to local space
    LocalVec3 inverseTransformPoint(const Vec3& point) const {
        return getMatrix().inverse().template transformPoint<Space::World, Space::Local>(point);
    }

    // Rotate a world direction into local space (rotation only)
    LocalVec3 inverseTransformDirection(const Vec3& direction) const {
        return rotation_.conjugate().rotateVector(direction).template as<Space::Local>();
    }

  private:
    Vec3 position_;
    Quat rotation_;
    Vec3 scale_;
    mutable Mat4 matrix_;
    mutable bool dirty_;

    void updateMatrix() const {
        Mat4 translationMatrix = Mat4::translation(position_);
        Mat4 rotationMatrix = Mat4::rotation(rotation_);
        Mat4 scaleMatrix = Mat4::scaling(scale_);

        matrix_ = translationMatrix * rotationMatrix * scaleMatrix;
        dirty_ = false;
    }
};

using Vec3f = Vector3<float, Space::World>;
using LocalVec3f = Vector3<float, Space::Local>;
using Quatf = Quaternion<float>;
using Transformf = Transform<float>;

} // namespace stride

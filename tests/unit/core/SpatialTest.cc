#include "stride/core/Spatial.hh"
#include <gtest/gtest.h>
#include <cmath>
#include <numbers>

using namespace stride;

// Helper for comparing floating point values
template <typename T>
bool almostEqual(T a, T b, T epsilon = static_cast<T>(1e-5)) {
    return std::abs(a - b) <= epsilon;
}

class SpatialTest : public ::testing::Test {};

TEST_F(SpatialTest, Vector3Basics) {
    Vec3f v(1.0f, 2.0f, 3.0f);
    Vec3f w(4.0f, 5.0f, 6.0f);

    Vec3f sum = v + w;
    EXPECT_FLOAT_EQ(sum.x, 5.0f);
    EXPECT_FLOAT_EQ(sum.y, 7.0f);
    EXPECT_FLOAT_EQ(sum.z, 9.0f);

    Vec3f scaled = v * 2.0f;
    EXPECT_FLOAT_EQ(scaled.z, 6.0f);

    Vec3f negated = -v;
    EXPECT_FLOAT_EQ(negated.y, -2.0f);

    EXPECT_FLOAT_EQ(v.dot(w), 32.0f);

    Vec3f c = Vec3f::unitX().cross(Vec3f::unitY());
    EXPECT_FLOAT_EQ(c.z, 1.0f);
}

TEST_F(SpatialTest, Vector3Length) {
    Vec3f v(3.0f, 4.0f, 0.0f);
    EXPECT_FLOAT_EQ(v.length(), 5.0f);
    EXPECT_FLOAT_EQ(v.lengthSquared(), 25.0f);

    Vec3f n = v.normalized();
    EXPECT_TRUE(almostEqual(n.length(), 1.0f));

    // Zero vector normalizes to itself
    Vec3f zero;
    EXPECT_EQ(zero.normalized(), Vec3f::zero());
}

TEST_F(SpatialTest, TypedCoordinateSafety) {
    Vec3f world(1.0f, 2.0f, 3.0f);
    LocalVec3f local(4.0f, 5.0f, 6.0f);

    // Explicit conversion is the only way across spaces
    Vec3f converted = local.as<Space::World>();
    Vec3f sum = world + converted;
    EXPECT_FLOAT_EQ(sum.x, 5.0f);
    EXPECT_FLOAT_EQ(sum.z, 9.0f);
}

TEST_F(SpatialTest, QuaternionRotation) {
    Quatf qz = Quatf::fromAxisAngle(Vec3f::unitZ(), std::numbers::pi_v<float> / 2);
    Vec3f rotated = qz.rotateVector(Vec3f::unitX());
    EXPECT_TRUE(almostEqual(rotated.x, 0.0f));
    EXPECT_TRUE(almostEqual(rotated.y, 1.0f));
    EXPECT_TRUE(almostEqual(rotated.z, 0.0f));

    Quatf qy = Quatf::fromAxisAngle(Vec3f::unitY(), std::numbers::pi_v<float> / 2);
    Vec3f fwd = qy.rotateVector(Vec3f::unitZ());
    EXPECT_TRUE(almostEqual(fwd.x, 1.0f));
    EXPECT_TRUE(almostEqual(fwd.z, 0.0f));
}

TEST_F(SpatialTest, QuaternionInverseUndoesRotation) {
    Quatf q = Quatf(1.0f, 2.0f, 3.0f, 4.0f).normalized();
    Vec3f v(0.3f, -1.2f, 2.0f);

    Vec3f back = q.inverse().rotateVector(q.rotateVector(v));
    EXPECT_TRUE(almostEqual(back.x, v.x));
    EXPECT_TRUE(almostEqual(back.y, v.y));
    EXPECT_TRUE(almostEqual(back.z, v.z));

    EXPECT_TRUE(almostEqual(q.length(), 1.0f));
}

TEST_F(SpatialTest, MatrixInverse) {
    Matrix4x4<float> m = Matrix4x4<float>::translation(Vec3f(1.0f, 2.0f, 3.0f)) *
                         Matrix4x4<float>::scaling(Vec3f(2.0f, 2.0f, 2.0f));
    Matrix4x4<float> product = m * m.inverse();
    for (int r = 0; r < 4; ++r) {
        for (int c = 0; c < 4; ++c) {
            EXPECT_TRUE(almostEqual(product(r, c), r == c ? 1.0f : 0.0f));
        }
    }
}

TEST_F(SpatialTest, SingularMatrixInverseIsIdentity) {
    Matrix4x4<float> m = Matrix4x4<float>::scaling(Vec3f(0.0f, 1.0f, 1.0f));
    Matrix4x4<float> inv = m.inverse();
    EXPECT_FLOAT_EQ(inv(0, 0), 1.0f);
    EXPECT_FLOAT_EQ(inv(1, 1), 1.0f);
}

TEST_F(SpatialTest, TransformDefaultsAndAxes) {
    Transformf transform;
    EXPECT_EQ(transform.getPosition(), Vec3f::zero());
    EXPECT_FLOAT_EQ(transform.getRotation().w, 1.0f);
    EXPECT_FLOAT_EQ(transform.getScale().x, 1.0f);

    EXPECT_EQ(transform.up(), Vec3f::unitY());
    EXPECT_EQ(transform.forward(), Vec3f::unitZ());
    EXPECT_EQ(transform.right(), Vec3f::unitX());

    transform.setRotation(Quatf::fromAxisAngle(Vec3f::unitY(), std::numbers::pi_v<float> / 2));
    Vec3f fwd = transform.forward();
    Vec3f right = transform.right();
    EXPECT_TRUE(almostEqual(fwd.x, 1.0f));
    EXPECT_TRUE(almostEqual(right.z, -1.0f));
}

TEST_F(SpatialTest, TransformPointAndDirection) {
    Transformf transform(Vec3f(0.0f, 1.0f, 0.0f),
                         Quatf::fromAxisAngle(Vec3f::unitZ(), std::numbers::pi_v<float> / 2),
                         Vec3f(2.0f, 2.0f, 2.0f));

    // Scale, rotate, then translate
    Vec3f point = transform.transformPoint(LocalVec3f(1.0f, 0.0f, 0.0f));
    EXPECT_TRUE(almostEqual(point.x, 0.0f));
    EXPECT_TRUE(almostEqual(point.y, 3.0f));
    EXPECT_TRUE(almostEqual(point.z, 0.0f));

    Vec3f direction = transform.transformDirection(LocalVec3f(1.0f, 0.0f, 0.0f));
    EXPECT_TRUE(almostEqual(direction.x, 0.0f));
    EXPECT_TRUE(almostEqual(direction.y, 2.0f));

    LocalVec3f back = transform.inverseTransformPoint(point);
    EXPECT_TRUE(almostEqual(back.x, 1.0f));
    EXPECT_TRUE(almostEqual(back.y, 0.0f));
}

TEST_F(SpatialTest, InverseTransformDirectionIgnoresScale) {
    Transformf transform(Vec3f(5.0f, 0.0f, 0.0f),
                         Quatf::fromAxisAngle(Vec3f::unitY(), std::numbers::pi_v<float> / 2),
                         Vec3f(3.0f, 3.0f, 3.0f));

    LocalVec3f local = transform.inverseTransformDirection(Vec3f(1.0f, 0.0f, 0.0f));
    EXPECT_TRUE(almostEqual(local.z, 1.0f));
    EXPECT_TRUE(almostEqual(local.x, 0.0f));
    EXPECT_TRUE(almostEqual(local.length(), 1.0f));
}

#include <gtest/gtest.h>
#include "xf_la.h"
#include "xf_error.h"
#include <limits>

using namespace xform;

class VecTest : public ::testing::Test {
protected:
    void SetUp() override {
        v1 = Vec3(1.0, 2.0, 3.0);
        v2 = Vec3(4.0, 5.0, 6.0);
    }

    Vec3 v1, v2, zero_vec;
};

TEST_F(VecTest, DefaultConstructor) {
    EXPECT_DOUBLE_EQ(zero_vec.x(), 0.0);
    EXPECT_DOUBLE_EQ(zero_vec.y(), 0.0);
    EXPECT_DOUBLE_EQ(zero_vec.z(), 0.0);
}

TEST_F(VecTest, MixedScalarConstruction) {
    Vec4 v(1, 2.5f, 3.0, 4);
    EXPECT_DOUBLE_EQ(v[0], 1.0);
    EXPECT_DOUBLE_EQ(v[1], 2.5);
    EXPECT_DOUBLE_EQ(v.w(), 4.0);
    EXPECT_EQ(Vec4::size(), 4u);
}

TEST_F(VecTest, Arithmetic) {
    EXPECT_EQ(v1 + v2, Vec3(5.0, 7.0, 9.0));
    EXPECT_EQ(v2 - v1, Vec3(3.0, 3.0, 3.0));
    EXPECT_EQ(-v1, Vec3(-1.0, -2.0, -3.0));
    EXPECT_EQ(v1 / 2.0, Vec3(0.5, 1.0, 1.5));

    Vec3 result = v1 * 2.0;
    EXPECT_EQ(result, Vec3(2.0, 4.0, 6.0));
    EXPECT_EQ(result, 2.0 * v1);
}

TEST_F(VecTest, DotProduct) {
    EXPECT_DOUBLE_EQ(dot(v1, v2), 32.0); // 4 + 10 + 18
    EXPECT_DOUBLE_EQ(dot(Vec2(1, 2), Vec2(3, -1)), 1.0);
}

TEST_F(VecTest, CrossProduct) {
    Vec3 result = cross(v1, v2);
    EXPECT_DOUBLE_EQ(result.x(), -3.0); // 2*6 - 3*5
    EXPECT_DOUBLE_EQ(result.y(), 6.0);  // 3*4 - 1*6
    EXPECT_DOUBLE_EQ(result.z(), -3.0); // 1*5 - 2*4

    // Right-hand rule
    EXPECT_EQ(cross(axisX(), axisY()), axisZ());
    EXPECT_EQ(cross(axisY(), axisZ()), axisX());
    EXPECT_EQ(cross(axisZ(), axisX()), axisY());
}

TEST_F(VecTest, Norm) {
    EXPECT_DOUBLE_EQ(norm(Vec3(3.0, 4.0, 0.0)), 5.0);
    EXPECT_DOUBLE_EQ(normSquared(Vec3(3.0, 4.0, 0.0)), 25.0);
    EXPECT_DOUBLE_EQ(norm(Vec4(1, 1, 1, 1)), 2.0);
}

TEST_F(VecTest, Normalization) {
    Vec3 normalized = normalize(Vec3(3.0, 4.0, 0.0));
    EXPECT_DOUBLE_EQ(norm(normalized), 1.0);
    EXPECT_DOUBLE_EQ(normalized.x(), 0.6);
    EXPECT_DOUBLE_EQ(normalized.y(), 0.8);
    EXPECT_DOUBLE_EQ(normalized.z(), 0.0);
}

TEST_F(VecTest, NormalizedVectorsHaveUnitLength) {
    const Vec3 samples[] = {
        {1e-6, 0, 0}, {-3, 7, 2}, {1e6, -1e6, 5}, {0.1, 0.2, -0.3}
    };
    for (const Vec3& v : samples) {
        EXPECT_NEAR(norm(normalize(v)), 1.0, 1e-12);
    }
    EXPECT_NEAR(norm(normalize(Vec2(5, -12))), 1.0, 1e-12);
    EXPECT_NEAR(norm(normalize(Vec4(1, -2, 3, -4))), 1.0, 1e-12);
}

TEST_F(VecTest, NormalizeZeroVectorThrows) {
    EXPECT_THROW(normalize(zero_vec), XFError);
    EXPECT_THROW(normalize(Vec2{}), XFError);

    try {
        normalize(zero_vec);
    } catch (const XFError& e) {
        EXPECT_EQ(e.getCategory(), XFError::Category::PRECONDITION);
        EXPECT_EQ(e.getContext(), "normalize(Vec3)");
    }
}

TEST_F(VecTest, TinyNonZeroVectorsNormalize) {
    const Vec3 unit = normalize(Vec3(1e-10, 0, 0));
    EXPECT_DOUBLE_EQ(unit.x(), 1.0);
    EXPECT_DOUBLE_EQ(unit.y(), 0.0);

    const Vec3 samples[] = {{3e-12, -4e-12, 0}, {1e-15, 1e-15, 1e-15}, {-2e-100, 0, 5e-101}};
    for (const Vec3& v : samples) {
        EXPECT_NEAR(norm(normalize(v)), 1.0, 1e-12);
    }
}

TEST_F(VecTest, NonFiniteVectorsDoNotNormalize) {
    const double inf = std::numeric_limits<double>::infinity();
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(normalize(Vec3(inf, 0, 0)), XFError);
    EXPECT_THROW(normalize(Vec3(nan, 1, 0)), XFError);
}

TEST_F(VecTest, Equality) {
    Vec3 v_same(1.0, 2.0, 3.0);
    Vec3 v_different(1.1, 2.0, 3.0);

    EXPECT_EQ(v1, v_same);
    EXPECT_NE(v1, v_different);
    EXPECT_TRUE(nearlyEqual(v1, v_different, 0.2));
}

TEST(AngleTest, ConvertsDegreesToRadians) {
    EXPECT_DOUBLE_EQ(toRadians(Degrees{180.0}), PI);
    EXPECT_DOUBLE_EQ(toRadians(Degrees{90.0}), PI_2);
    EXPECT_DOUBLE_EQ(toRadians(Degrees{-45.0}), -PI_4);
}

TEST(AngleTest, RadiansAreIdentity) {
    Angle a = Radians{1.25};
    EXPECT_DOUBLE_EQ(toRadians(a), 1.25);
    EXPECT_DOUBLE_EQ(toDegrees(Angle{Radians{PI}}), 180.0);
}

TEST(AngleTest, TagIsPreserved) {
    Angle a = Degrees{30.0};
    EXPECT_TRUE(std::holds_alternative<Degrees>(a));
    EXPECT_NEAR(toRadians(a), PI / 6.0, 1e-15);
}

TEST(IntervalTest, ClampExamples) {
    const Interval unit(0.0, 1.0);
    EXPECT_DOUBLE_EQ(clamp(5.0, unit), 1.0);
    EXPECT_DOUBLE_EQ(clamp(-5.0, unit), 0.0);
    EXPECT_DOUBLE_EQ(clamp(0.5, unit), 0.5);
    EXPECT_DOUBLE_EQ(clamp(1.0, unit), 1.0);
}

TEST(IntervalTest, Accessors) {
    const Interval range(-2.0, 3.0);
    EXPECT_DOUBLE_EQ(range.lower(), -2.0);
    EXPECT_DOUBLE_EQ(range.upper(), 3.0);
    EXPECT_DOUBLE_EQ(range.width(), 5.0);
    EXPECT_TRUE(range.contains(0.0));
    EXPECT_FALSE(range.contains(3.5));
}

TEST(IntervalTest, RejectsInvertedOrEmptyBounds) {
    EXPECT_THROW(Interval(1.0, 0.0), XFError);
    EXPECT_THROW(Interval(1.0, 1.0), XFError);
    EXPECT_THROW(Interval(std::numeric_limits<double>::quiet_NaN(), 1.0), XFError);

    try {
        Interval(2.0, -2.0);
        FAIL() << "Expected XFError";
    } catch (const XFError& e) {
        EXPECT_EQ(e.getCategory(), XFError::Category::PRECONDITION);
        EXPECT_NE(e.getFormattedMessage().find("lower bound"), std::string::npos);
    }
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

#include <gtest/gtest.h>
#include "xf_glm.h"
#include <glm/gtc/matrix_transform.hpp>

using namespace xform;

namespace {

void expectSameMatrix(const Mat4& ours, const glm::dmat4& theirs, double tol = 1e-12) {
    const Mat4 converted = fromGLM(theirs);
    for (int r = 0; r < 4; ++r) {
        for (int c = 0; c < 4; ++c) {
            EXPECT_NEAR(ours(r, c), converted(r, c), tol) << "at (" << r << ", " << c << ")";
        }
    }
}

} // namespace

TEST(GlmInteropTest, MatrixConversionKeepsElements) {
    const Mat4 m(1, 2, 3, 4,
                 5, 6, 7, 8,
                 9, 10, 11, 12,
                 13, 14, 15, 16);
    const glm::dmat4 g = toGLM(m);
    // GLM indexes [column][row]
    EXPECT_DOUBLE_EQ(g[3][0], 4.0);
    EXPECT_DOUBLE_EQ(g[0][3], 13.0);
    EXPECT_EQ(fromGLM(g), m);
}

TEST(GlmInteropTest, TranslationAgrees) {
    const glm::dmat4 g = glm::translate(glm::dmat4(1.0), glm::dvec3(1.5, -2.0, 3.0));
    expectSameMatrix(Mat4::translate({1.5, -2.0, 3.0}), g);
}

TEST(GlmInteropTest, AxisRotationAgrees) {
    const double angle = 0.7;
    expectSameMatrix(Mat4::rotateX(Radians{angle}),
                     glm::rotate(glm::dmat4(1.0), angle, glm::dvec3(1, 0, 0)));
    expectSameMatrix(Mat4::rotateY(Radians{angle}),
                     glm::rotate(glm::dmat4(1.0), angle, glm::dvec3(0, 1, 0)));
    expectSameMatrix(Mat4::rotateZ(Radians{angle}),
                     glm::rotate(glm::dmat4(1.0), angle, glm::dvec3(0, 0, 1)));
}

TEST(GlmInteropTest, ProjectionsAgree) {
    const double fovy = glm::radians(55.0);
    expectSameMatrix(perspectiveProjection(Radians{fovy}, 4.0 / 3.0, {0.1, 200.0}),
                     glm::perspective(fovy, 4.0 / 3.0, 0.1, 200.0), 1e-9);

    expectSameMatrix(frustumProjection({1.0, -2.0}, {1.5, -0.5}, {0.5, 20.0}),
                     glm::frustum(-2.0, 1.0, -0.5, 1.5, 0.5, 20.0));

    expectSameMatrix(orthographicProjection({4.0, -2.0}, {3.0, -1.0}, {0.5, 10.0}),
                     glm::ortho(-2.0, 4.0, -1.0, 3.0, 0.5, 10.0));
}

TEST(GlmInteropTest, ViewMatchesLookAt) {
    // glm::lookAt(eye, center, up): eye is our camera position, center our target
    const Vec3 target(1.0, 0.5, -2.0);
    const Vec3 position(3.0, 2.0, 4.0);
    const glm::dmat4 g = glm::lookAt(toGLM(position), toGLM(target), glm::dvec3(0, 1, 0));
    expectSameMatrix(viewMatrix(target, position, axisY()), g);
}

TEST(GlmInteropTest, QuaternionMatrixAgrees) {
    const Quat q = Quat::fromAxis(Degrees{35}, normalize(Vec3(1, -2, 0.5)));
    expectSameMatrix(q.toMatrix(), glm::mat4_cast(toGLM(q)));
    EXPECT_EQ(fromGLM(toGLM(q)), q);
}

TEST(GlmInteropTest, EulerConstructionAgrees) {
    // glm takes (pitch about x, yaw about y, roll about z) and composes qz * qy * qx
    const double yaw = 0.4, pitch = -0.3, roll = 1.1;
    const glm::dquat g(glm::dvec3(roll, pitch, yaw));
    EXPECT_TRUE(nearlyEqual(Quat::fromEulerAngles(Vec3(yaw, pitch, roll)), fromGLM(g), 1e-12));
}

TEST(GlmInteropTest, SlerpAgrees) {
    const Quat a = Quat::fromAxis(Degrees{10}, axisX());
    const Quat b = Quat::fromAxis(Degrees{120}, normalize(Vec3(0, 1, 1)));
    for (double t : {0.0, 0.25, 0.5, 0.9, 1.0}) {
        const Quat ours = slerp(a, b, t);
        const Quat theirs = fromGLM(glm::slerp(toGLM(a), toGLM(b), t));
        EXPECT_TRUE(nearlyEqual(ours, theirs, 1e-9)) << "t = " << t;
    }
}

TEST(GlmInteropTest, VectorConversion) {
    const Vec3 v(1.0, -2.0, 3.5);
    const glm::dvec3 g = toGLM(v);
    EXPECT_DOUBLE_EQ(g.y, -2.0);
    EXPECT_EQ(fromGLM(g), v);
    EXPECT_NEAR(glm::length(glm::cross(toGLM(axisX()), toGLM(axisY())) - toGLM(cross(axisX(), axisY()))),
                0.0, 1e-15);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

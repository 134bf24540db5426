#ifndef XF_MATRIX_H_
#define XF_MATRIX_H_

#include "xf_la.h"
#include <array>

namespace xform {

/**
 * @brief 4x4 homogeneous transform
 *
 * Stored row-major, applied to column vectors (p' = M * p), so the
 * translation sits in the last column. toFlatArray() produces the
 * column-major layout graphics APIs expect.
 */
struct Mat4 {
    std::array<double, 16> m;

    constexpr Mat4( double m00, double m01, double m02, double m03,
                    double m10, double m11, double m12, double m13,
                    double m20, double m21, double m22, double m23,
                    double m30, double m31, double m32, double m33 )
        : m{ m00,m01,m02,m03,
             m10,m11,m12,m13,
             m20,m21,m22,m23,
             m30,m31,m32,m33 } {}

    constexpr explicit Mat4(const std::array<double,16>& rows) : m(rows) {}

    constexpr Mat4() : m{1,0,0,0, 0,1,0,0, 0,0,1,0, 0,0,0,1} {}

    constexpr double& operator()(std::size_t row, std::size_t col) { return m[row*4 + col]; }
    constexpr const double& operator()(std::size_t row, std::size_t col) const { return m[row*4 + col]; }

    constexpr Vec4 row(std::size_t r) const { return {m[r*4], m[r*4 + 1], m[r*4 + 2], m[r*4 + 3]}; }
    constexpr Vec4 column(std::size_t c) const { return {m[c], m[4 + c], m[8 + c], m[12 + c]}; }

    Mat4 operator*(const Mat4& b) const;
    Vec4 operator*(const Vec4& v) const;

    bool operator==(const Mat4& other) const;
    bool operator!=(const Mat4& other) const { return !(*this == other); }

    Mat4 transposed() const;

    /**
     * @brief Apply to a point (w = 1) with the homogeneous divide
     */
    Vec3 transformPoint(const Vec3& p) const;

    /**
     * @brief Apply to a direction (w = 0); translation is ignored
     */
    Vec3 transformDirection(const Vec3& d) const;

    constexpr Vec3 translation() const { return {m[3], m[7], m[11]}; }

    static constexpr Mat4 identity() { return Mat4(); }

    static Mat4 translate(const Vec3& p);
    static Mat4 scale(const Vec3& s);
    static Mat4 scaleUniform(double s);

    static Mat4 rotateX(const Angle& angle);
    static Mat4 rotateY(const Angle& angle);
    static Mat4 rotateZ(const Angle& angle);

    /**
     * @brief rotateX(e.x) * rotateY(e.y) * rotateZ(e.z), angles in radians
     *
     * Applied to a column vector this turns about Z first and X last.
     * Not the same convention as the quaternion Euler angles; see
     * rotateYawPitchRoll() for that one.
     */
    static Mat4 rotate(const Vec3& euler_radians);
    static Mat4 rotate(const Angle& x, const Angle& y, const Angle& z);

    /**
     * @brief rotateZ(yaw) * rotateY(pitch) * rotateX(roll)
     *
     * Same rotation as Quat::fromEulerAngles({yaw, pitch, roll}).toMatrix().
     */
    static Mat4 rotateYawPitchRoll(const Angle& yaw, const Angle& pitch, const Angle& roll);
};

bool nearlyEqual(const Mat4& a, const Mat4& b, double tolerance);

/* ───────────────────────── Projections ───────────────────────── */

struct Horizontal { double right, left; };
struct Vertical { double top, bottom; };
struct DepthRange { double near_plane, far_plane; };

/**
 * @brief OpenGL-style orthographic projection (glOrtho)
 * @throws XFError (PRECONDITION) on zero width, height or depth
 */
Mat4 orthographicProjection(const Horizontal& h, const Vertical& v, const DepthRange& depth);

/**
 * @brief OpenGL-style perspective frustum (glFrustum)
 * @throws XFError (PRECONDITION) on zero width, height or depth
 */
Mat4 frustumProjection(const Horizontal& h, const Vertical& v, const DepthRange& depth);

/**
 * @brief Symmetric perspective frustum from a vertical field of view
 * @param fov Vertical field of view
 * @param aspect Width over height
 * @throws XFError (PRECONDITION) if fov is outside (0, 180) degrees, aspect <= 0,
 *         near <= 0 or near == far
 */
Mat4 perspectiveProjection(const Angle& fov, double aspect, const DepthRange& depth);

/* ───────────────────────── View ───────────────────────── */

/**
 * @brief Look-at view matrix
 *
 * The camera sits at @p position and looks toward @p target. The result maps
 * the viewing direction onto -z, @p up (projected) onto +y and the camera
 * position onto the origin.
 *
 * @throws XFError (PRECONDITION) if target == position or up is parallel
 *         to the viewing direction
 */
Mat4 viewMatrix(const Vec3& target, const Vec3& position, const Vec3& up);

/**
 * @brief Camera at the origin looking down -z with +y up (the identity)
 */
Mat4 defaultView();

/**
 * @brief Camera at the origin aimed along @p direction
 */
Mat4 viewFromOrigin(const Vec3& direction, const Vec3& up = axisY());

/* ───────────────────────── Export ───────────────────────── */

/**
 * @brief Transpose then flatten: 16 doubles in column-major order
 */
std::array<double, 16> toFlatArray(const Mat4& m);

/**
 * @brief toFlatArray() narrowed to float, for glUniformMatrix4fv and friends
 */
std::array<float, 16> toFlatArrayF(const Mat4& m);

/**
 * @brief Inverse of toFlatArray()
 */
Mat4 fromFlatArray(const std::array<double, 16>& column_major);

} // namespace xform

#endif // XF_MATRIX_H_

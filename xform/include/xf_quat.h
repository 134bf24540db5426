#ifndef XF_QUAT_H_
#define XF_QUAT_H_

#include "xf_la.h"
#include "xf_matrix.h"
#include "xf_config.h"

namespace xform {

/**
 * @brief Quaternion s + v.x i + v.y j + v.z k
 *
 * Not required to be unit length. Operations that interpret the value as a
 * rotation (rotate, Euler extraction, slerp) normalize a copy first.
 */
struct Quat {
    double s = 0.0;
    Vec3 v;

    enum class GimbalPole { NorthPole, SouthPole, NoPole };

    constexpr Quat() = default;
    constexpr Quat(double scalar, const Vec3& vector) : s(scalar), v(vector) {}
    constexpr Quat(double w, double x, double y, double z) : s(w), v{x, y, z} {}

    constexpr double w() const { return s; }
    constexpr double x() const { return v.x(); }
    constexpr double y() const { return v.y(); }
    constexpr double z() const { return v.z(); }

    constexpr Vec4 asVec4() const { return {s, v.x(), v.y(), v.z()}; }

    constexpr Quat operator+(const Quat& o) const { return {s + o.s, v + o.v}; }
    constexpr Quat operator-(const Quat& o) const { return {s - o.s, v - o.v}; }
    constexpr Quat operator-() const { return {-s, -v}; }
    constexpr Quat operator*(double k) const { return {s * k, v * k}; }
    constexpr Quat operator/(double k) const { return {s / k, v / k}; }

    /**
     * @brief Hamilton product
     */
    constexpr Quat operator*(const Quat& o) const {
        return { s*o.s - dot(v, o.v), o.v*s + v*o.s + cross(v, o.v) };
    }

    constexpr Quat& operator+=(const Quat& o) { s += o.s; v += o.v; return *this; }
    constexpr Quat& operator*=(const Quat& o) { *this = *this * o; return *this; }

    bool operator==(const Quat& o) const { return std::abs(s - o.s) <= EPSILON && v == o.v; }
    bool operator!=(const Quat& o) const { return !(*this == o); }

    constexpr Quat conjugate() const { return {s, -v}; }
    constexpr double normSquared() const { return s*s + xform::normSquared(v); }
    double norm() const { return std::sqrt(normSquared()); }

    /**
     * @throws XFError (PRECONDITION) for the zero quaternion
     */
    Quat inverse() const;

    /**
     * @throws XFError (PRECONDITION) for the zero quaternion
     */
    Quat normalized() const;

    static constexpr Quat identity() { return {1.0, Vec3{}}; }
    static constexpr Quat zero() { return {0.0, Vec3{}}; }

    /**
     * @brief Rotation of @p angle about @p axis
     *
     * The axis is used as given; pass a unit vector to get a unit quaternion.
     */
    static Quat fromAxis(const Angle& angle, const Vec3& axis);

    /**
     * @brief Rotation part of a matrix (upper-left 3x3), which must be orthonormal
     */
    static Quat fromMatrix(const Mat4& m);

    /**
     * @brief Quaternion for qz(yaw) * qy(pitch) * qx(roll)
     * @param ypr (yaw, pitch, roll) in radians
     */
    static Quat fromEulerAngles(const Vec3& ypr);
    static Quat fromEulerAngles(const Angle& yaw, const Angle& pitch, const Angle& roll);

    /**
     * @brief Shortest rotation taking the direction of @p from onto that of @p to
     * @throws XFError (PRECONDITION) if either vector has zero length
     */
    static Quat fromCross(const Vec3& from, const Vec3& to,
                          const Tolerances& tol = Tolerances::defaultConfig());

    /**
     * @brief Rotation matrix, valid for non-unit quaternions as well
     */
    Mat4 toMatrix() const;

    GimbalPole gimbalPole(const Tolerances& tol = Tolerances::defaultConfig()) const;

    // Rotation about X, in radians
    double roll(const Tolerances& tol = Tolerances::defaultConfig()) const;
    // Rotation about Y, in radians, within [-pi/2, pi/2]
    double pitch(const Tolerances& tol = Tolerances::defaultConfig()) const;
    // Rotation about Z, in radians; exactly 0 at a gimbal pole
    double yaw(const Tolerances& tol = Tolerances::defaultConfig()) const;

    /**
     * @brief (yaw, pitch, roll), inverse of fromEulerAngles() away from the poles
     */
    Vec3 toEulerAngles(const Tolerances& tol = Tolerances::defaultConfig()) const;

    /**
     * @brief Rotate a vector by the sandwich product q (0, p) q*
     */
    Vec3 rotate(const Vec3& p) const;
};

constexpr Quat operator*(double k, const Quat& q) { return q * k; }

constexpr double dot(const Quat& a, const Quat& b) {
    return a.s*b.s + dot(a.v, b.v);
}

bool nearlyEqual(const Quat& a, const Quat& b, double tolerance);

/**
 * @brief True when a and b describe the same rotation (q and -q included)
 */
bool sameRotation(const Quat& a, const Quat& b, double tolerance);

Quat exp(const Quat& q);

/**
 * @throws XFError (PRECONDITION) for the zero quaternion
 */
Quat log(const Quat& q);

/**
 * @brief q raised to a real power, exp(t * log(q))
 */
Quat pow(const Quat& q, double t);

inline Vec3 qrotate(const Vec3& p, const Quat& q) { return q.rotate(p); }

/**
 * @brief Spherical linear interpolation along the shorter arc
 *
 * Falls back to a normalized linear blend when the inputs are closer than
 * tol.slerp_dot_threshold, which also covers identical and opposite inputs.
 */
Quat slerp(const Quat& q0, const Quat& q1, double t,
           const Tolerances& tol = Tolerances::defaultConfig());

const char* gimbalPoleName(Quat::GimbalPole pole);

} // namespace xform

#endif // XF_QUAT_H_

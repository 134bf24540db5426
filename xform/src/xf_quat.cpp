#include "xf_quat.h"
#include "xf_error.h"
#include <sstream>

namespace xform {

namespace {

[[noreturn]] void throwZeroQuat(const char* operation) {
    XFORM_THROW_PRECONDITION_ERROR("Operation undefined for a zero or non-finite quaternion", operation,
                                   "Build the quaternion from an axis, angles or a matrix");
}

// Into (-pi, pi]
double wrapAngle(double a) {
    if (a > PI) return a - 2*PI;
    if (a <= -PI) return a + 2*PI;
    return a;
}

std::string describe(const Quat& q) {
    std::ostringstream oss;
    oss << "(" << q.w() << ", " << q.x() << ", " << q.y() << ", " << q.z() << ")";
    return oss.str();
}

} // namespace

Quat Quat::inverse() const {
    const double n2 = normSquared();
    const double inv = 1.0 / n2;
    if (!(n2 > 0.0) || !std::isfinite(inv)) {
        throwZeroQuat("Quat::inverse");
    }
    return conjugate() * inv;
}

Quat Quat::normalized() const {
    const double n = norm();
    const double inv = 1.0 / n;
    if (!(n > 0.0) || !std::isfinite(inv) || !std::isfinite(n)) {
        throwZeroQuat("Quat::normalized");
    }
    return *this * inv;
}

bool nearlyEqual(const Quat& a, const Quat& b, double tolerance) {
    return nearlyEqual(a.asVec4(), b.asVec4(), tolerance);
}

bool sameRotation(const Quat& a, const Quat& b, double tolerance) {
    const Quat na = a.normalized();
    const Quat nb = b.normalized();
    return nearlyEqual(na, nb, tolerance) || nearlyEqual(na, -nb, tolerance);
}

Quat Quat::fromAxis(const Angle& angle, const Vec3& axis) {
    const double half = toRadians(angle) * 0.5;
    return {std::cos(half), axis * std::sin(half)};
}

Quat Quat::fromMatrix(const Mat4& m) {
    const double trace = m(0,0) + m(1,1) + m(2,2);

    // Branch on the largest of w, x, y, z to keep the square root well away from zero
    if (trace > 0.0) {
        const double k = std::sqrt(trace + 1.0) * 2.0;   // 4w
        return {0.25 * k,
                (m(2,1) - m(1,2)) / k,
                (m(0,2) - m(2,0)) / k,
                (m(1,0) - m(0,1)) / k};
    }
    if (m(0,0) > m(1,1) && m(0,0) > m(2,2)) {
        const double k = std::sqrt(1.0 + m(0,0) - m(1,1) - m(2,2)) * 2.0;   // 4x
        return {(m(2,1) - m(1,2)) / k,
                0.25 * k,
                (m(0,1) + m(1,0)) / k,
                (m(0,2) + m(2,0)) / k};
    }
    if (m(1,1) > m(2,2)) {
        const double k = std::sqrt(1.0 + m(1,1) - m(0,0) - m(2,2)) * 2.0;   // 4y
        return {(m(0,2) - m(2,0)) / k,
                (m(0,1) + m(1,0)) / k,
                0.25 * k,
                (m(1,2) + m(2,1)) / k};
    }
    const double k = std::sqrt(1.0 + m(2,2) - m(0,0) - m(1,1)) * 2.0;   // 4z
    return {(m(1,0) - m(0,1)) / k,
            (m(0,2) + m(2,0)) / k,
            (m(1,2) + m(2,1)) / k,
            0.25 * k};
}

Quat Quat::fromEulerAngles(const Vec3& ypr) {
    const double cy = std::cos(ypr[0] * 0.5), sy = std::sin(ypr[0] * 0.5);
    const double cp = std::cos(ypr[1] * 0.5), sp = std::sin(ypr[1] * 0.5);
    const double cr = std::cos(ypr[2] * 0.5), sr = std::sin(ypr[2] * 0.5);

    return {cr*cp*cy + sr*sp*sy,
            sr*cp*cy - cr*sp*sy,
            cr*sp*cy + sr*cp*sy,
            cr*cp*sy - sr*sp*cy};
}

Quat Quat::fromEulerAngles(const Angle& yaw, const Angle& pitch, const Angle& roll) {
    return fromEulerAngles(Vec3{toRadians(yaw), toRadians(pitch), toRadians(roll)});
}

Quat Quat::fromCross(const Vec3& from, const Vec3& to, const Tolerances& tol) {
    const Vec3 a = normalize(from);
    const Vec3 b = normalize(to);
    const Vec3 axis = cross(a, b);
    const double cos_angle = clamp(dot(a, b), Interval(-1.0, 1.0));

    if (xform::norm(axis) < tol.parallel_epsilon) {
        if (cos_angle > 0.0) {
            XFORM_DEBUG("Quat", "fromCross: parallel inputs, returning identity");
            return identity();
        }
        // Opposite directions: any axis orthogonal to a gives a valid half turn
        Vec3 ortho = cross(a, axisX());
        if (xform::norm(ortho) < tol.parallel_epsilon) {
            ortho = cross(a, axisY());
        }
        XFORM_DEBUG("Quat", "fromCross: opposite inputs, half turn about an orthogonal axis");
        return fromAxis(Radians{PI}, normalize(ortho));
    }

    return fromAxis(Radians{std::acos(cos_angle)}, normalize(axis));
}

Mat4 Quat::toMatrix() const {
    const double n2 = normSquared();
    const double k = 2.0 / n2;
    if (!(n2 > 0.0) || !std::isfinite(k)) {
        throwZeroQuat("Quat::toMatrix");
    }

    const double w = s, x = v.x(), y = v.y(), z = v.z();

    return Mat4{1 - k*(y*y + z*z),     k*(x*y - w*z),     k*(x*z + w*y), 0,
                    k*(x*y + w*z), 1 - k*(x*x + z*z),     k*(y*z - w*x), 0,
                    k*(x*z - w*y),     k*(y*z + w*x), 1 - k*(x*x + y*y), 0,
                0, 0, 0, 1};
}

Quat::GimbalPole Quat::gimbalPole(const Tolerances& tol) const {
    const Quat q = normalized();
    const double test = q.w()*q.y() - q.z()*q.x();

    if (test > tol.gimbal_threshold) {
        XFORM_DEBUG("Quat", "North pole gimbal lock for " + describe(q));
        return GimbalPole::NorthPole;
    }
    if (test < -tol.gimbal_threshold) {
        XFORM_DEBUG("Quat", "South pole gimbal lock for " + describe(q));
        return GimbalPole::SouthPole;
    }
    return GimbalPole::NoPole;
}

double Quat::roll(const Tolerances& tol) const {
    const Quat q = normalized();
    if (q.gimbalPole(tol) != GimbalPole::NoPole) {
        // Only roll - yaw (north) or roll + yaw (south) is observable; yaw is pinned to 0
        return wrapAngle(2.0 * std::atan2(q.x(), q.w()));
    }
    return std::atan2(2.0*(q.w()*q.x() + q.y()*q.z()),
                      1.0 - 2.0*(q.x()*q.x() + q.y()*q.y()));
}

double Quat::pitch(const Tolerances& tol) const {
    const Quat q = normalized();
    switch (q.gimbalPole(tol)) {
        case GimbalPole::NorthPole: return PI_2;
        case GimbalPole::SouthPole: return -PI_2;
        case GimbalPole::NoPole: break;
    }
    return std::asin(clamp(2.0*(q.w()*q.y() - q.z()*q.x()), Interval(-1.0, 1.0)));
}

double Quat::yaw(const Tolerances& tol) const {
    const Quat q = normalized();
    if (q.gimbalPole(tol) != GimbalPole::NoPole) {
        return 0.0;
    }
    return std::atan2(2.0*(q.w()*q.z() + q.x()*q.y()),
                      1.0 - 2.0*(q.y()*q.y() + q.z()*q.z()));
}

Vec3 Quat::toEulerAngles(const Tolerances& tol) const {
    return {yaw(tol), pitch(tol), roll(tol)};
}

Vec3 Quat::rotate(const Vec3& p) const {
    const Quat q = normalized();
    return (q * Quat(0.0, p) * q.conjugate()).v;
}

Quat exp(const Quat& q) {
    const double angle = norm(q.v);
    const double scale = std::exp(q.s);

    // sin(a)/a -> 1 as a -> 0
    const double sinc = angle < EPSILON ? 1.0 : std::sin(angle) / angle;
    return {scale * std::cos(angle), q.v * (scale * sinc)};
}

Quat log(const Quat& q) {
    const double n = q.norm();
    if (!(n > 0.0) || !std::isfinite(n)) {
        throwZeroQuat("log(Quat)");
    }

    const double vlen = norm(q.v);
    if (vlen == 0.0) {
        // Real quaternion; a negative one picks the i axis for its half turn
        if (q.s < 0.0) {
            return {std::log(n), Vec3{PI, 0.0, 0.0}};
        }
        return {std::log(n), Vec3{}};
    }

    const double theta = std::atan2(vlen, q.s);
    return {std::log(n), q.v * (theta / vlen)};
}

Quat pow(const Quat& q, double t) {
    return exp(log(q) * t);
}

Quat slerp(const Quat& q0, const Quat& q1, double t, const Tolerances& tol) {
    const Quat a = q0.normalized();
    Quat b = q1.normalized();

    double cos_theta = dot(a, b);
    // q and -q are the same rotation; go the short way round
    if (cos_theta < 0.0) {
        b = -b;
        cos_theta = -cos_theta;
    }

    if (cos_theta > tol.slerp_dot_threshold) {
        XFORM_TRACE("Quat", "slerp: nearly identical inputs, using normalized lerp");
        return (a + (b - a) * t).normalized();
    }

    const double theta = std::acos(cos_theta);
    const double sin_theta = std::sin(theta);
    const double wa = std::sin((1.0 - t) * theta) / sin_theta;
    const double wb = std::sin(t * theta) / sin_theta;
    return a * wa + b * wb;
}

const char* gimbalPoleName(Quat::GimbalPole pole) {
    switch (pole) {
        case Quat::GimbalPole::NorthPole: return "NorthPole";
        case Quat::GimbalPole::SouthPole: return "SouthPole";
        case Quat::GimbalPole::NoPole:    return "NoPole";
    }
    return "Unknown";
}

} // namespace xform

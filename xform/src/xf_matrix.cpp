#include "xf_matrix.h"
#include "xf_error.h"
#include <sstream>

namespace xform {

Mat4 Mat4::operator*(const Mat4& b) const {
    Mat4 result;
    result.m.fill(0);

    // i-k-j ordering walks both operands row by row
    for (std::size_t i = 0; i < 4; ++i) {
        for (std::size_t k = 0; k < 4; ++k) {
            const double a_ik = m[i*4 + k];
            for (std::size_t j = 0; j < 4; ++j) {
                result.m[i*4 + j] += a_ik * b.m[k*4 + j];
            }
        }
    }
    return result;
}

Vec4 Mat4::operator*(const Vec4& v) const {
    return { dot(row(0), v), dot(row(1), v), dot(row(2), v), dot(row(3), v) };
}

bool Mat4::operator==(const Mat4& other) const {
    return nearlyEqual(*this, other, EPSILON);
}

bool nearlyEqual(const Mat4& a, const Mat4& b, double tolerance) {
    for (std::size_t i = 0; i < 16; ++i) {
        if (std::abs(a.m[i] - b.m[i]) > tolerance) return false;
    }
    return true;
}

Mat4 Mat4::transposed() const {
    Mat4 r;
    for (std::size_t i = 0; i < 4; ++i) {
        for (std::size_t j = 0; j < 4; ++j) {
            r(j, i) = (*this)(i, j);
        }
    }
    return r;
}

Vec3 Mat4::transformPoint(const Vec3& p) const {
    const Vec4 r = *this * point(p);
    const double w = r.w();

    if (std::abs(w) > EPSILON && std::abs(w - 1.0) > EPSILON) {
        return {r.x()/w, r.y()/w, r.z()/w};
    }
    return {r.x(), r.y(), r.z()};
}

Vec3 Mat4::transformDirection(const Vec3& d) const {
    const Vec4 r = *this * direction(d);
    return {r.x(), r.y(), r.z()};
}

Mat4 Mat4::translate(const Vec3& p) {
    return Mat4{1, 0, 0, p.x(),
                0, 1, 0, p.y(),
                0, 0, 1, p.z(),
                0, 0, 0, 1};
}

Mat4 Mat4::scale(const Vec3& s) {
    return Mat4{s.x(), 0, 0, 0,
                0, s.y(), 0, 0,
                0, 0, s.z(), 0,
                0, 0, 0, 1};
}

Mat4 Mat4::scaleUniform(double s) {
    return scale({s, s, s});
}

Mat4 Mat4::rotateX(const Angle& angle) {
    const double a = toRadians(angle);
    const double c = std::cos(a), s = std::sin(a);
    return Mat4{1, 0,  0, 0,
                0, c, -s, 0,
                0, s,  c, 0,
                0, 0,  0, 1};
}

Mat4 Mat4::rotateY(const Angle& angle) {
    const double a = toRadians(angle);
    const double c = std::cos(a), s = std::sin(a);
    return Mat4{ c, 0, s, 0,
                 0, 1, 0, 0,
                -s, 0, c, 0,
                 0, 0, 0, 1};
}

Mat4 Mat4::rotateZ(const Angle& angle) {
    const double a = toRadians(angle);
    const double c = std::cos(a), s = std::sin(a);
    return Mat4{c, -s, 0, 0,
                s,  c, 0, 0,
                0,  0, 1, 0,
                0,  0, 0, 1};
}

Mat4 Mat4::rotate(const Vec3& euler_radians) {
    return rotate(Radians{euler_radians.x()}, Radians{euler_radians.y()}, Radians{euler_radians.z()});
}

Mat4 Mat4::rotate(const Angle& x, const Angle& y, const Angle& z) {
    return rotateX(x) * rotateY(y) * rotateZ(z);
}

Mat4 Mat4::rotateYawPitchRoll(const Angle& yaw, const Angle& pitch, const Angle& roll) {
    return rotateZ(yaw) * rotateY(pitch) * rotateX(roll);
}

namespace {

std::string describe(const Horizontal& h, const Vertical& v, const DepthRange& depth) {
    std::ostringstream oss;
    oss << "right=" << h.right << " left=" << h.left
        << " top=" << v.top << " bottom=" << v.bottom
        << " near=" << depth.near_plane << " far=" << depth.far_plane;
    return oss.str();
}

void checkExtents(const Horizontal& h, const Vertical& v, const DepthRange& depth,
                  const char* what) {
    if (h.right == h.left || v.top == v.bottom || depth.far_plane == depth.near_plane) {
        XFORM_THROW_PRECONDITION_ERROR(std::string(what) + " volume has zero extent",
                                       describe(h, v, depth),
                                       "right/left, top/bottom and near/far must differ");
    }
}

} // namespace

Mat4 orthographicProjection(const Horizontal& h, const Vertical& v, const DepthRange& depth) {
    checkExtents(h, v, depth, "Orthographic");

    const double width = h.right - h.left;
    const double height = v.top - v.bottom;
    const double d = depth.far_plane - depth.near_plane;

    return Mat4{2/width, 0, 0, -(h.right + h.left)/width,
                0, 2/height, 0, -(v.top + v.bottom)/height,
                0, 0, -2/d, -(depth.far_plane + depth.near_plane)/d,
                0, 0, 0, 1};
}

Mat4 frustumProjection(const Horizontal& h, const Vertical& v, const DepthRange& depth) {
    checkExtents(h, v, depth, "Frustum");
    if (!(depth.near_plane > 0.0 && depth.far_plane > 0.0)) {
        XFORM_THROW_PRECONDITION_ERROR("Frustum depth planes must be positive",
                                       describe(h, v, depth),
                                       "Use a small positive near plane such as 0.1");
    }

    const double n = depth.near_plane;
    const double f = depth.far_plane;
    const double width = h.right - h.left;
    const double height = v.top - v.bottom;

    return Mat4{2*n/width, 0, (h.right + h.left)/width, 0,
                0, 2*n/height, (v.top + v.bottom)/height, 0,
                0, 0, -(f + n)/(f - n), -2*f*n/(f - n),
                0, 0, -1, 0};
}

Mat4 perspectiveProjection(const Angle& fov, double aspect, const DepthRange& depth) {
    const double fovy = toRadians(fov);
    if (!(fovy > 0.0 && fovy < PI)) {
        XFORM_THROW_PRECONDITION_ERROR("Field of view must lie strictly between 0 and 180 degrees",
                                       std::to_string(fovy) + " rad", "");
    }
    if (!(aspect > 0.0)) {
        XFORM_THROW_PRECONDITION_ERROR("Aspect ratio must be positive",
                                       std::to_string(aspect), "Pass width / height");
    }

    const double top = depth.near_plane * std::tan(fovy * 0.5);
    const double right = top * aspect;
    return frustumProjection({right, -right}, {top, -top}, depth);
}

Mat4 viewMatrix(const Vec3& target, const Vec3& position, const Vec3& up) {
    const Vec3 to_target = target - position;
    if (norm(to_target) < EPSILON) {
        XFORM_THROW_PRECONDITION_ERROR("Camera position and target coincide",
                                       "viewMatrix", "Move the target away from the camera");
    }
    const Vec3 forward = normalize(to_target);

    const Vec3 side_dir = cross(forward, up);
    if (norm(side_dir) < EPSILON) {
        XFORM_THROW_PRECONDITION_ERROR("Up vector is parallel to the viewing direction",
                                       "viewMatrix", "Pick an up vector that is not collinear with the view");
    }
    const Vec3 side = normalize(side_dir);
    const Vec3 true_up = cross(side, forward);

    return Mat4{ side.x(),     side.y(),     side.z(),    -dot(side, position),
                 true_up.x(),  true_up.y(),  true_up.z(), -dot(true_up, position),
                -forward.x(), -forward.y(), -forward.z(),  dot(forward, position),
                 0, 0, 0, 1};
}

Mat4 defaultView() {
    return viewMatrix({0, 0, -1}, {0, 0, 0}, axisY());
}

Mat4 viewFromOrigin(const Vec3& direction, const Vec3& up) {
    return viewMatrix(direction, Vec3{}, up);
}

std::array<double, 16> toFlatArray(const Mat4& m) {
    return m.transposed().m;
}

std::array<float, 16> toFlatArrayF(const Mat4& m) {
    const std::array<double, 16> flat = toFlatArray(m);
    std::array<float, 16> out{};
    for (std::size_t i = 0; i < 16; ++i) {
        out[i] = static_cast<float>(flat[i]);
    }
    return out;
}

Mat4 fromFlatArray(const std::array<double, 16>& column_major) {
    return Mat4(column_major).transposed();
}

} // namespace xform

#include "xf_capi.h"
#include "xf_error.h"
#include "xf_matrix.h"
#include "xf_quat.h"
#include <algorithm>
#include <string>

using namespace xform;

namespace {

thread_local std::string last_error;

int statusFor(XFError::Category category) {
    switch (category) {
        case XFError::Category::PRECONDITION: return XF_ERR_PRECONDITION;
        case XFError::Category::NUMERIC:      return XF_ERR_NUMERIC;
        case XFError::Category::GENERAL:
        case XFError::Category::CONFIG:       return XF_ERR_INTERNAL;
    }
    return XF_ERR_INTERNAL;
}

// Exceptions must not unwind into C callers
template <typename Body>
int guarded(const char* name, Body&& body) {
    try {
        body();
        last_error.clear();
        return XF_OK;
    } catch (const XFError& e) {
        last_error = e.getFormattedMessage();
        XFORM_ERROR("CAPI", std::string(name) + ": " + last_error);
        return statusFor(e.getCategory());
    } catch (const std::exception& e) {
        last_error = e.what();
        XFORM_ERROR("CAPI", std::string(name) + ": " + last_error);
        return XF_ERR_INTERNAL;
    }
}

int nullArgument(const char* name) {
    last_error = std::string(name) + ": null argument";
    XFORM_ERROR("CAPI", last_error);
    return XF_ERR_NULL_ARGUMENT;
}

Mat4 readMat4(const double* column_major) {
    std::array<double, 16> arr;
    std::copy(column_major, column_major + 16, arr.begin());
    return fromFlatArray(arr);
}

void writeMat4(const Mat4& m, double* out) {
    const std::array<double, 16> flat = toFlatArray(m);
    std::copy(flat.begin(), flat.end(), out);
}

Vec3 readVec3(const double* p) { return {p[0], p[1], p[2]}; }

Quat readQuat(const double* p) { return {p[0], p[1], p[2], p[3]}; }

} // namespace

extern "C" {

XF_API int xf_mat4_identity(double* out) {
    if (!out) return nullArgument("xf_mat4_identity");
    return guarded("xf_mat4_identity", [&] { writeMat4(Mat4::identity(), out); });
}

XF_API int xf_mat4_mul(const double* a, const double* b, double* out) {
    if (!a || !b || !out) return nullArgument("xf_mat4_mul");
    return guarded("xf_mat4_mul", [&] { writeMat4(readMat4(a) * readMat4(b), out); });
}

XF_API int xf_mat4_perspective(double fovy_radians, double aspect,
                               double near_plane, double far_plane, double* out) {
    if (!out) return nullArgument("xf_mat4_perspective");
    return guarded("xf_mat4_perspective", [&] {
        writeMat4(perspectiveProjection(Radians{fovy_radians}, aspect, {near_plane, far_plane}), out);
    });
}

XF_API int xf_mat4_orthographic(double left, double right, double bottom, double top,
                                double near_plane, double far_plane, double* out) {
    if (!out) return nullArgument("xf_mat4_orthographic");
    return guarded("xf_mat4_orthographic", [&] {
        writeMat4(orthographicProjection({right, left}, {top, bottom}, {near_plane, far_plane}), out);
    });
}

XF_API int xf_mat4_view(const double* target, const double* position,
                        const double* up, double* out) {
    if (!target || !position || !up || !out) return nullArgument("xf_mat4_view");
    return guarded("xf_mat4_view", [&] {
        writeMat4(viewMatrix(readVec3(target), readVec3(position), readVec3(up)), out);
    });
}

XF_API int xf_quat_to_mat4(const double* q, double* out) {
    if (!q || !out) return nullArgument("xf_quat_to_mat4");
    return guarded("xf_quat_to_mat4", [&] { writeMat4(readQuat(q).toMatrix(), out); });
}

XF_API int xf_quat_slerp(const double* q0, const double* q1, double t, double* out) {
    if (!q0 || !q1 || !out) return nullArgument("xf_quat_slerp");
    return guarded("xf_quat_slerp", [&] {
        const Vec4 r = slerp(readQuat(q0), readQuat(q1), t).asVec4();
        std::copy(r.data(), r.data() + 4, out);
    });
}

XF_API int xf_vec3_transform(const double* m, const double* v, double* out) {
    if (!m || !v || !out) return nullArgument("xf_vec3_transform");
    return guarded("xf_vec3_transform", [&] {
        const Vec3 r = readMat4(m).transformPoint(readVec3(v));
        std::copy(r.data(), r.data() + 3, out);
    });
}

XF_API const char* xf_last_error(void) {
    return last_error.c_str();
}

} // extern "C"

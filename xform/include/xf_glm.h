#ifndef XF_GLM_H_
#define XF_GLM_H_

#include "xf_matrix.h"
#include "xf_quat.h"
#include <algorithm>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtc/type_ptr.hpp>

/* Conversions to and from GLM's double-precision types. GLM stores matrices
   column-major, the same layout toFlatArray() produces. */

namespace xform {

inline glm::dmat4 toGLM(const Mat4& m) {
    const std::array<double, 16> flat = toFlatArray(m);
    return glm::make_mat4(flat.data());
}

inline Mat4 fromGLM(const glm::dmat4& m) {
    std::array<double, 16> flat;
    const double* p = glm::value_ptr(m);
    std::copy(p, p + 16, flat.begin());
    return fromFlatArray(flat);
}

inline glm::dvec3 toGLM(const Vec3& v) { return {v.x(), v.y(), v.z()}; }

inline Vec3 fromGLM(const glm::dvec3& v) { return {v.x, v.y, v.z}; }

inline glm::dquat toGLM(const Quat& q) { return glm::dquat(q.w(), q.x(), q.y(), q.z()); }

inline Quat fromGLM(const glm::dquat& q) { return {q.w, q.x, q.y, q.z}; }

} // namespace xform

#endif // XF_GLM_H_

#ifndef XF_CAPI_H_
#define XF_CAPI_H_

#include "xf_la.h"

/* ────────────────── C ABI for graphics bindings and Wasm callers ───────────
   Every matrix crossing this boundary is 16 doubles in column-major order,
   ready for glUniformMatrix4dv (or narrowed for the fv variant). Quaternions
   are 4 doubles (w, x, y, z). Output buffers are owned by the caller.     */

#define XF_OK                    0
#define XF_ERR_NULL_ARGUMENT    -1
#define XF_ERR_PRECONDITION     -2
#define XF_ERR_NUMERIC          -3
#define XF_ERR_INTERNAL         -4

extern "C" {

XF_API int xf_mat4_identity(double* out);

XF_API int xf_mat4_mul(const double* a, const double* b, double* out);

XF_API int xf_mat4_perspective(double fovy_radians, double aspect,
                               double near_plane, double far_plane, double* out);

XF_API int xf_mat4_orthographic(double left, double right, double bottom, double top,
                                double near_plane, double far_plane, double* out);

XF_API int xf_mat4_view(const double* target, const double* position,
                        const double* up, double* out);

XF_API int xf_quat_to_mat4(const double* q, double* out);

XF_API int xf_quat_slerp(const double* q0, const double* q1, double t, double* out);

XF_API int xf_vec3_transform(const double* m, const double* v, double* out);

/**
 * Message of the last failure on the calling thread, "" if none.
 */
XF_API const char* xf_last_error(void);

} // extern "C"

#endif // XF_CAPI_H_

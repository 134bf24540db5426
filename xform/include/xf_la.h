#ifndef XF_LA_H_
#define XF_LA_H_

#include <array>
#include <cmath>
#include <cstddef>
#include <limits>
#include <type_traits>
#include <variant>

/* ───────────────── Platform / visibility macros ───────────────── */

#ifdef __EMSCRIPTEN__
#include <emscripten.h>
#define XF_API EMSCRIPTEN_KEEPALIVE           // exported to JS / other Wasm
#else
#define XF_API                                // no decoration on native
#endif

namespace xform {
    inline constexpr double PI = 3.14159265358979323846;
    inline constexpr double PI_2 = PI * 0.5;
    inline constexpr double PI_4 = PI * 0.25;
    inline constexpr double EPSILON = 1e-9;
    inline constexpr double DEG_TO_RAD = PI / 180.0;
    inline constexpr double RAD_TO_DEG = 180.0 / PI;
}

namespace xform {

/**
 * @brief Fixed-size vector of doubles
 *
 * The dimension is part of the type, so mixing a Vec4 into an operation
 * that expects a Vec3 does not compile.
 */
template <std::size_t N>
struct Vec {
    static_assert(N >= 2 && N <= 4, "Vec supports 2, 3 or 4 components");

    std::array<double, N> e{};

    constexpr Vec() = default;

    template <typename... Args,
              typename = std::enable_if_t<sizeof...(Args) == N &&
                                          (std::is_arithmetic_v<Args> && ...)>>
    constexpr Vec(Args... args) : e{static_cast<double>(args)...} {}

    constexpr explicit Vec(const std::array<double, N>& arr) : e(arr) {}

    static constexpr std::size_t size() { return N; }

    constexpr double& operator[](std::size_t i) { return e[i]; }
    constexpr const double& operator[](std::size_t i) const { return e[i]; }

    constexpr double x() const { return e[0]; }
    constexpr double y() const { return e[1]; }
    constexpr double z() const { static_assert(N >= 3, "Vec has no z component"); return e[2]; }
    constexpr double w() const { static_assert(N >= 4, "Vec has no w component"); return e[3]; }

    constexpr const double* data() const { return e.data(); }
    constexpr double* data() { return e.data(); }

    constexpr Vec operator+(const Vec& o) const {
        Vec r;
        for (std::size_t i = 0; i < N; ++i) r.e[i] = e[i] + o.e[i];
        return r;
    }

    constexpr Vec operator-(const Vec& o) const {
        Vec r;
        for (std::size_t i = 0; i < N; ++i) r.e[i] = e[i] - o.e[i];
        return r;
    }

    constexpr Vec operator-() const {
        Vec r;
        for (std::size_t i = 0; i < N; ++i) r.e[i] = -e[i];
        return r;
    }

    constexpr Vec operator*(double s) const {
        Vec r;
        for (std::size_t i = 0; i < N; ++i) r.e[i] = e[i] * s;
        return r;
    }

    // Division by zero propagates IEEE inf/nan; normalize() is the checked path
    constexpr Vec operator/(double s) const {
        Vec r;
        for (std::size_t i = 0; i < N; ++i) r.e[i] = e[i] / s;
        return r;
    }

    constexpr Vec& operator+=(const Vec& o) { for (std::size_t i = 0; i < N; ++i) e[i] += o.e[i]; return *this; }
    constexpr Vec& operator-=(const Vec& o) { for (std::size_t i = 0; i < N; ++i) e[i] -= o.e[i]; return *this; }
    constexpr Vec& operator*=(double s) { for (std::size_t i = 0; i < N; ++i) e[i] *= s; return *this; }

    bool operator==(const Vec& o) const {
        for (std::size_t i = 0; i < N; ++i) {
            if (std::abs(e[i] - o.e[i]) > EPSILON) return false;
        }
        return true;
    }

    bool operator!=(const Vec& o) const { return !(*this == o); }
};

using Vec2 = Vec<2>;
using Vec3 = Vec<3>;
using Vec4 = Vec<4>;

template <std::size_t N>
constexpr Vec<N> operator*(double s, const Vec<N>& v) { return v * s; }

template <std::size_t N>
constexpr double dot(const Vec<N>& a, const Vec<N>& b) {
    double sum = 0.0;
    for (std::size_t i = 0; i < N; ++i) sum += a[i] * b[i];
    return sum;
}

constexpr Vec3 cross(const Vec3& a, const Vec3& b) {
    return { a.y()*b.z() - a.z()*b.y(),
             a.z()*b.x() - a.x()*b.z(),
             a.x()*b.y() - a.y()*b.x() };
}

template <std::size_t N>
constexpr double normSquared(const Vec<N>& v) { return dot(v, v); }

template <std::size_t N>
double norm(const Vec<N>& v) { return std::sqrt(normSquared(v)); }

template <std::size_t N>
bool nearlyEqual(const Vec<N>& a, const Vec<N>& b, double tolerance) {
    for (std::size_t i = 0; i < N; ++i) {
        if (std::abs(a[i] - b[i]) > tolerance) return false;
    }
    return true;
}

namespace detail {
    // Throws XFError; kept out of line so this header stays free of the logging includes
    [[noreturn]] void throwNotNormalizable(std::size_t dimension);
}

/**
 * @brief Scale v to unit length
 *
 * Any nonzero vector is accepted, however short, as long as 1 / norm(v)
 * is representable.
 *
 * @throws XFError (PRECONDITION) when v is zero, its norm underflows, or it
 *         holds NaN or infinite components
 */
template <std::size_t N>
Vec<N> normalize(const Vec<N>& v) {
    const double len = norm(v);
    const double inv = 1.0 / len;
    if (!(len > 0.0) || !std::isfinite(inv) || !std::isfinite(len)) {
        detail::throwNotNormalizable(N);
    }
    return v * inv;
}

constexpr Vec3 axisX() { return {1, 0, 0}; }
constexpr Vec3 axisY() { return {0, 1, 0}; }
constexpr Vec3 axisZ() { return {0, 0, 1}; }

constexpr Vec4 point(const Vec3& p) { return {p.x(), p.y(), p.z(), 1.0}; }
constexpr Vec4 direction(const Vec3& d) { return {d.x(), d.y(), d.z(), 0.0}; }

/* ───────────────────────── Angles ───────────────────────── */

struct Radians { double value; };
struct Degrees { double value; };

/**
 * @brief An angle tagged with its unit
 *
 * Nothing reads the raw value directly; toRadians() is the only way in.
 */
using Angle = std::variant<Radians, Degrees>;

constexpr double toRadians(const Radians& a) { return a.value; }
constexpr double toRadians(const Degrees& a) { return a.value * DEG_TO_RAD; }

inline double toRadians(const Angle& angle) {
    return std::visit([](const auto& a) { return toRadians(a); }, angle);
}

inline double toDegrees(const Angle& angle) {
    return toRadians(angle) * RAD_TO_DEG;
}

/* ───────────────────────── Interval ───────────────────────── */

/**
 * @brief Closed range [lower, upper] with lower < upper
 */
class Interval {
public:
    /**
     * @throws XFError (PRECONDITION) unless lower < upper
     */
    Interval(double lower, double upper);

    double lower() const { return lower_; }
    double upper() const { return upper_; }
    double width() const { return upper_ - lower_; }

    bool contains(double value) const { return value >= lower_ && value <= upper_; }

private:
    double lower_;
    double upper_;
};

inline double clamp(double value, const Interval& interval) {
    if (value < interval.lower()) return interval.lower();
    if (value > interval.upper()) return interval.upper();
    return value;
}

} // namespace xform

#endif // XF_LA_H_

#ifndef XF_RING_H_
#define XF_RING_H_

#include "xf_quat.h"
#include <iterator>
#include <type_traits>

namespace xform {

/**
 * @brief Additive and multiplicative identities of a ring-like type
 *
 * Together with operator+ and operator* this is all the generic helpers
 * below rely on, so they work unchanged for scalars and quaternions.
 */
template <typename T, typename Enable = void>
struct RingTraits;

template <typename T>
struct RingTraits<T, std::enable_if_t<std::is_arithmetic_v<T>>> {
    static constexpr T zero() { return T(0); }
    static constexpr T one() { return T(1); }
};

template <>
struct RingTraits<Quat> {
    static constexpr Quat zero() { return Quat::zero(); }
    static constexpr Quat one() { return Quat::identity(); }
};

/**
 * @brief x^n by repeated squaring
 */
template <typename T>
T ringPower(T x, unsigned int n) {
    T result = RingTraits<T>::one();
    while (n > 0) {
        if (n & 1u) {
            result = result * x;
        }
        x = x * x;
        n >>= 1;
    }
    return result;
}

template <typename It>
auto ringSum(It first, It last) {
    using T = typename std::iterator_traits<It>::value_type;
    T total = RingTraits<T>::zero();
    for (; first != last; ++first) {
        total = total + *first;
    }
    return total;
}

} // namespace xform

#endif // XF_RING_H_

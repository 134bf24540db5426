#include "xf_la.h"
#include "xf_error.h"
#include <string>

namespace xform {

namespace detail {

void throwNotNormalizable(std::size_t dimension) {
    XFORM_THROW_PRECONDITION_ERROR("Vector has no finite direction to normalize",
                                   "normalize(Vec" + std::to_string(dimension) + ")",
                                   "Check the vector is non-zero and finite before normalizing");
}

} // namespace detail

Interval::Interval(double lower, double upper)
    : lower_(lower), upper_(upper) {
    // Written so that NaN bounds fail as well
    if (!(lower < upper)) {
        std::ostringstream oss;
        oss << "[" << lower << ", " << upper << "]";
        XFORM_THROW_PRECONDITION_ERROR("Interval lower bound must be below upper bound",
                                       oss.str(), "Swap the bounds or widen the interval");
    }
}

} // namespace xform

#ifndef XF_CONFIG_H_
#define XF_CONFIG_H_

#include "xf_error.h"
#include <optional>
#include <string>

namespace xform {

/**
 * @brief Thresholds used by the operations that branch on a degenerate case
 *
 * Passed by value to the functions that need them; there is no global copy.
 */
struct Tolerances {
    // |w*y - z*x| of a unit quaternion above this is treated as gimbal lock (max 0.5)
    double gimbal_threshold = 0.499;
    // slerp switches to a normalized linear blend above this cosine
    double slerp_dot_threshold = 0.9995;
    // cross products shorter than this count as parallel
    double parallel_epsilon = 1e-9;

    static Tolerances defaultConfig() { return Tolerances{}; }

    /**
     * @throws XFError (CONFIG) when a threshold lies outside its meaningful range
     */
    void validate() const;
};

/**
 * @brief Logging setup, applied once by the embedding application
 */
struct LogConfig {
    LogSystem::Level level = LogSystem::Level::INFO;
    bool console = true;
    std::optional<std::string> file;

    static LogConfig defaultConfig() { return LogConfig{}; }

    /**
     * @brief Map "trace", "debug", "info", "warn", "error", "critical" to a level
     * @throws XFError (CONFIG) for any other name
     */
    static LogSystem::Level parseLevel(const std::string& name);

    void apply() const;
};

} // namespace xform

#endif // XF_CONFIG_H_

#include "xf_config.h"
#include <algorithm>
#include <cctype>

namespace xform {

void Tolerances::validate() const {
    if (!(gimbal_threshold > 0.0 && gimbal_threshold < 0.5)) {
        XFORM_THROW_CONFIG_ERROR("gimbal_threshold must lie in (0, 0.5)",
                                 std::to_string(gimbal_threshold),
                                 "The pole test value of a unit quaternion never exceeds 0.5");
    }
    if (!(slerp_dot_threshold > 0.0 && slerp_dot_threshold < 1.0)) {
        XFORM_THROW_CONFIG_ERROR("slerp_dot_threshold must lie in (0, 1)",
                                 std::to_string(slerp_dot_threshold),
                                 "Use a cosine close to 1, such as 0.9995");
    }
    if (!(parallel_epsilon > 0.0)) {
        XFORM_THROW_CONFIG_ERROR("parallel_epsilon must be positive",
                                 std::to_string(parallel_epsilon), "");
    }
}

LogSystem::Level LogConfig::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogSystem::Level::TRACE;
    if (lower == "debug") return LogSystem::Level::DEBUG;
    if (lower == "info") return LogSystem::Level::INFO;
    if (lower == "warn" || lower == "warning") return LogSystem::Level::WARN;
    if (lower == "error") return LogSystem::Level::ERROR;
    if (lower == "critical") return LogSystem::Level::CRITICAL;

    XFORM_THROW_CONFIG_ERROR("Unknown log level", name,
                             "Use one of trace, debug, info, warn, error, critical");
}

void LogConfig::apply() const {
    auto& logger = LogSystem::getInstance();
    logger.setLevel(level);
    logger.setConsoleOutput(console);
    if (file) {
        logger.setFileOutput(*file);
    }
}

} // namespace xform

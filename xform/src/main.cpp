#include "xf_config.h"
#include "xf_error.h"
#include "xf_matrix.h"
#include "xf_quat.h"
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--log-level trace|debug|info|warn|error] [--log-file PATH] [--quiet]\n";
}

xform::LogConfig parseArgs(int argc, char* argv[]) {
    xform::LogConfig config = xform::LogConfig::defaultConfig();
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            config.level = xform::LogConfig::parseLevel(argv[++i]);
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            config.file = argv[++i];
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            config.console = false;
        } else {
            usage(argv[0]);
            XFORM_THROW_CONFIG_ERROR("Unknown argument", argv[i], "");
        }
    }
    return config;
}

std::string formatFlat(const xform::Mat4& m) {
    const auto flat = xform::toFlatArray(m);
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << "[";
    for (std::size_t i = 0; i < flat.size(); ++i) {
        oss << (i ? ", " : "") << flat[i];
    }
    oss << "]";
    return oss.str();
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace xform;

    try {
        parseArgs(argc, argv).apply();
        XFORM_INFO("Main", "Building the matrices a renderer would upload");

        const Mat4 projection = perspectiveProjection(Degrees{60.0}, 16.0 / 9.0, {0.1, 100.0});
        const Mat4 view = viewMatrix({0, 0, 0}, {0, 2, 5}, axisY());

        // Blend between two orientations and place the model
        const Quat from = Quat::fromEulerAngles(Degrees{0}, Degrees{0}, Degrees{0});
        const Quat to = Quat::fromEulerAngles(Degrees{90}, Degrees{30}, Degrees{0});
        const Quat halfway = slerp(from, to, 0.5);
        const Mat4 model = Mat4::translate({1, 0, 0}) * halfway.toMatrix() * Mat4::scaleUniform(0.5);

        const Vec3 ypr = halfway.toEulerAngles();
        std::ostringstream angles;
        angles << std::fixed << std::setprecision(2)
               << "yaw=" << ypr[0] * RAD_TO_DEG << " pitch=" << ypr[1] * RAD_TO_DEG
               << " roll=" << ypr[2] * RAD_TO_DEG;
        XFORM_INFO("Main", "Halfway orientation " + angles.str());

        XFORM_INFO("Main", "projection " + formatFlat(projection));
        XFORM_INFO("Main", "view " + formatFlat(view));
        XFORM_INFO("Main", "model " + formatFlat(model));
        XFORM_INFO("Main", "mvp " + formatFlat(projection * view * model));

    } catch (const XFError& e) {
        XFORM_CRITICAL("Main", e.getFormattedMessage());
        return 1;
    } catch (const std::exception& e) {
        XFORM_CRITICAL("Main", std::string("Unhandled exception: ") + e.what());
        return 1;
    }

    return 0;
}

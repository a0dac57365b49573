#include "apps/color/ColorConverter.hpp"

#include <cmath>
#include <Eigen/Core>

namespace color {

namespace {

using EVec3 = Eigen::Vector3d;
using EMat3 = Eigen::Matrix3d;

constexpr double GAMMA          = 2.2;
constexpr double LINEAR_KNEE    = 0.04045;
constexpr double LINEAR_SLOPE   = 12.92;

// Linear RGB -> XYZ (rows X, Y, Z).
const EMat3& rgb_to_xyz() {
    static const EMat3 M = (EMat3() <<
        0.649926, 0.103455, 0.197109,
        0.234327, 0.743075, 0.022598,
        0.000000, 0.053077, 1.035763).finished();
    return M;
}

} // anonymous namespace

double GammaDecode(double c_norm) {
    return (c_norm > LINEAR_KNEE) ? std::pow(c_norm, GAMMA) : (c_norm / LINEAR_SLOPE);
}

msg::ChromaXY RgbToXy(uint8_t r, uint8_t g, uint8_t b) {
    const EVec3 lin(GammaDecode(r / 255.0),
                    GammaDecode(g / 255.0),
                    GammaDecode(b / 255.0));

    const EVec3 xyz = rgb_to_xyz() * lin;

    const double sum = xyz.x() + xyz.y() + xyz.z();
    if (sum == 0.0) {
        return msg::ChromaXY{0.0, 0.0};
    }

    msg::ChromaXY out;
    out.x = xyz.x() / sum;
    out.y = xyz.y() / sum;
    return out;
}

} // namespace color

#include "ellipsoid.hpp"
#include <cmath>
#include <stdexcept>

namespace indoorgml {

Ellipsoid::Ellipsoid(double radius_x, double radius_y, double radius_z)
    : radii_(radius_x, radius_y, radius_z)
    , radii_squared_(radius_x * radius_x, radius_y * radius_y, radius_z * radius_z) {
    if (!(radius_x > 0.0) || !(radius_y > 0.0) || !(radius_z > 0.0)) {
        throw std::invalid_argument("Ellipsoid radii must be positive");
    }
}

const Ellipsoid& Ellipsoid::wgs84() {
    static const Ellipsoid ellipsoid(6378137.0, 6378137.0, 6356752.3142451793);
    return ellipsoid;
}

Vec3 Ellipsoid::geodetic_surface_normal(const GeodeticPoint& point) const {
    double cos_lat = std::cos(point.latitude);
    return Vec3(cos_lat * std::cos(point.longitude),
                cos_lat * std::sin(point.longitude),
                std::sin(point.latitude)).normalized();
}

Vec3 Ellipsoid::to_cartesian(const GeodeticPoint& point) const {
    Vec3 n = geodetic_surface_normal(point);
    Vec3 k(radii_squared_.x * n.x, radii_squared_.y * n.y, radii_squared_.z * n.z);
    double gamma = std::sqrt(n.dot(k));
    return k / gamma + n * point.height;
}

}  // namespace indoorgml

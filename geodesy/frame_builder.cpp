#include "frame_builder.hpp"
#include <cmath>

namespace indoorgml {

Matrix4 EllipsoidFrameBuilder::east_north_up(const GeodeticPoint& position) const {
    Vec3 origin = ellipsoid_.to_cartesian(position);
    Vec3 up = ellipsoid_.geodetic_surface_normal(position);

    // Derived from longitude so the poles still get a well-defined east.
    Vec3 east(-std::sin(position.longitude), std::cos(position.longitude), 0.0);
    Vec3 north = up.cross(east).normalized();

    return Matrix4::from_axes(east, north, up, origin);
}

}  // namespace indoorgml

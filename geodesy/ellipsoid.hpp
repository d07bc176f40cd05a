#ifndef INDOORGML_GEODESY_ELLIPSOID_HPP
#define INDOORGML_GEODESY_ELLIPSOID_HPP

#include "geodetic_point.hpp"
#include <math/vec3.hpp>

namespace indoorgml {

// Triaxial reference ellipsoid centered at the origin (ECEF axes)
class Ellipsoid {
public:
    Ellipsoid(double radius_x, double radius_y, double radius_z);

    // WGS84: a = 6378137 m, b = 6356752.3142451793 m
    static const Ellipsoid& wgs84();

    const Vec3& radii() const { return radii_; }

    // Outward unit normal of the surface at the given longitude/latitude
    Vec3 geodetic_surface_normal(const GeodeticPoint& point) const;

    // Geodetic -> earth-centered, earth-fixed Cartesian
    Vec3 to_cartesian(const GeodeticPoint& point) const;

private:
    Vec3 radii_;
    Vec3 radii_squared_;
};

}  // namespace indoorgml

#endif // INDOORGML_GEODESY_ELLIPSOID_HPP

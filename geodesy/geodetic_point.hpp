#ifndef INDOORGML_GEODESY_GEODETIC_POINT_HPP
#define INDOORGML_GEODESY_GEODETIC_POINT_HPP

#include <numbers>

namespace indoorgml {

// Position on (or above) a reference ellipsoid
struct GeodeticPoint {
    double longitude = 0.0;  // radians, east positive
    double latitude = 0.0;   // radians, north positive
    double height = 0.0;     // meters above the ellipsoid

    static GeodeticPoint from_degrees(double longitude_deg, double latitude_deg,
                                      double height_m = 0.0) {
        constexpr double to_rad = std::numbers::pi / 180.0;
        return GeodeticPoint{longitude_deg * to_rad, latitude_deg * to_rad, height_m};
    }
};

}  // namespace indoorgml

#endif // INDOORGML_GEODESY_GEODETIC_POINT_HPP

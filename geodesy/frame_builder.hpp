#ifndef INDOORGML_GEODESY_FRAME_BUILDER_HPP
#define INDOORGML_GEODESY_FRAME_BUILDER_HPP

#include "ellipsoid.hpp"
#include "geodetic_point.hpp"
#include <math/matrix4.hpp>

namespace indoorgml {

// Builds the local tangent-plane frame used to place a model on the globe.
// Implementations must return a rigid transform (orthonormal rotation +
// translation) from local east-north-up meters to world-fixed coordinates.
class FrameBuilder {
public:
    virtual ~FrameBuilder() = default;

    virtual Matrix4 east_north_up(const GeodeticPoint& position) const = 0;
};

// East-north-up frame on a reference ellipsoid.
// Columns: east, north, up (surface normal) and the ECEF position.
class EllipsoidFrameBuilder : public FrameBuilder {
public:
    EllipsoidFrameBuilder() : ellipsoid_(Ellipsoid::wgs84()) {}
    explicit EllipsoidFrameBuilder(const Ellipsoid& ellipsoid) : ellipsoid_(ellipsoid) {}

    Matrix4 east_north_up(const GeodeticPoint& position) const override;

    const Ellipsoid& ellipsoid() const { return ellipsoid_; }

private:
    Ellipsoid ellipsoid_;
};

// Identity frame: leaves local coordinates in the local frame.
// Useful for previewing a rotation without placing the model on the globe.
class LocalFrameBuilder : public FrameBuilder {
public:
    Matrix4 east_north_up(const GeodeticPoint& position) const override {
        (void)position;
        return Matrix4::identity();
    }
};

}  // namespace indoorgml

#endif // INDOORGML_GEODESY_FRAME_BUILDER_HPP

#ifndef INDOORGML_TRANSFORM_TRANSFORM_PIPELINE_HPP
#define INDOORGML_TRANSFORM_TRANSFORM_PIPELINE_HPP

#include <geodesy/frame_builder.hpp>
#include <geodesy/geodetic_point.hpp>
#include <math/matrix4.hpp>
#include <math/vec3.hpp>

namespace indoorgml {

class IndoorModel;

// Where to place a model on the globe, in user-facing units
struct AnchorConfig {
    bool enabled = false;
    double longitude_deg = 0.0;
    double latitude_deg = 0.0;
    double height = 0.0;        // meters above the ellipsoid
    double rotation_deg = 0.0;  // yaw, counter-clockwise seen from above

    GeodeticPoint position() const {
        return GeodeticPoint::from_degrees(longitude_deg, latitude_deg, height);
    }

    double rotation_radians() const;
};

// Local building coordinates -> world-fixed coordinates:
//   p' = frame * rotation_z * (p - origin)
// where origin is (center_x, center_y, min_z) of the source bounds.
class TransformPipeline {
public:
    TransformPipeline(const Vec3& origin, double rotation_radians, const Matrix4& frame);

    // Rewrites every coordinate of the model and records the frame on it.
    // Throws std::invalid_argument for a non-finite rotation; on any
    // exception the model is left unchanged.
    static void apply(IndoorModel& model, const GeodeticPoint& target,
                      double rotation_radians, const FrameBuilder& frame_builder);

    Vec3 transform(const Vec3& point) const;

    // Single matrix equivalent to transform()
    Matrix4 combined() const;

    const Vec3& origin() const { return origin_; }
    const Matrix4& rotation() const { return rotation_; }
    const Matrix4& frame() const { return frame_; }

private:
    Vec3 origin_;
    Matrix4 rotation_;
    Matrix4 frame_;
};

}  // namespace indoorgml

#endif // INDOORGML_TRANSFORM_TRANSFORM_PIPELINE_HPP

#include "transform_pipeline.hpp"
#include <model/indoor_model.hpp>
#include <common/logging.hpp>
#include <cmath>
#include <numbers>
#include <stdexcept>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace indoorgml {

double AnchorConfig::rotation_radians() const {
    return rotation_deg * std::numbers::pi / 180.0;
}

TransformPipeline::TransformPipeline(const Vec3& origin, double rotation_radians,
                                     const Matrix4& frame)
    : origin_(origin), rotation_(Matrix4::rotation_z(rotation_radians)), frame_(frame) {
}

Vec3 TransformPipeline::transform(const Vec3& point) const {
    Vec3 offset = point - origin_;
    Vec3 rotated = rotation_.multiply_by_point(offset);
    return frame_.multiply_by_point(rotated);
}

Matrix4 TransformPipeline::combined() const {
    return frame_ * rotation_ * Matrix4::translation(-origin_);
}

void TransformPipeline::apply(IndoorModel& model, const GeodeticPoint& target,
                              double rotation_radians, const FrameBuilder& frame_builder) {
    auto log = indoorgml::logging::get_logger();

    if (!std::isfinite(rotation_radians)) {
        throw std::invalid_argument("Rotation angle must be finite");
    }

    #ifdef _OPENMP
    log->debug("TransformPipeline: up to {} OpenMP threads", omp_get_max_threads());
    #endif

    // One frame per call, shared by every collection.
    Matrix4 frame = frame_builder.east_north_up(target);
    TransformPipeline pipeline(Vec3(model.center_x_, model.center_y_, model.bounds_.min_z()),
                               rotation_radians, frame);

    // Work on copies; the model only sees the finished result.
    auto nodes = model.nodes_;
    auto edges = model.edges_;
    auto cell_spaces = model.cell_spaces_;
    auto boundaries = model.cell_space_boundaries_;

    #pragma omp parallel for schedule(static) if(nodes.size() > 50)
    for (size_t i = 0; i < nodes.size(); ++i) {
        nodes[i].set_position(pipeline.transform(nodes[i].position()));
    }

    for (auto& edge : edges) {
        for (auto& point : edge.path_points) {
            point.set_position(pipeline.transform(point.position()));
        }
    }

    for (auto* features : {&cell_spaces, &boundaries}) {
        #pragma omp parallel for schedule(static) if(features->size() > 50)
        for (size_t i = 0; i < features->size(); ++i) {
            for (auto& ring : (*features)[i].surface_rings) {
                for (size_t k = 0; k < ring.vertex_count(); ++k) {
                    ring.set_vertex(k, pipeline.transform(ring.vertex(k)));
                }
            }
        }
    }

    model.nodes_ = std::move(nodes);
    model.edges_ = std::move(edges);
    model.cell_spaces_ = std::move(cell_spaces);
    model.cell_space_boundaries_ = std::move(boundaries);
    model.anchor_frame_ = frame;
    model.state_ = ModelState::Anchored;

    log->info("TransformPipeline: anchored {} coordinates at lon {:.6f} lat {:.6f} h {:.2f} "
              "(rotation {:.4f} rad)",
              model.statistics().coordinate_count, target.longitude * 180.0 / std::numbers::pi,
              target.latitude * 180.0 / std::numbers::pi, target.height, rotation_radians);
}

}  // namespace indoorgml

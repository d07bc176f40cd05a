#ifndef INDOORGML_MODEL_FEATURES_HPP
#define INDOORGML_MODEL_FEATURES_HPP

#include <math/vec3.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace indoorgml {

// A single 3D position: a state (node) or one vertex of a transition path
struct PointFeature {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    PointFeature() = default;
    PointFeature(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}
    explicit PointFeature(const Vec3& p) : x(p.x), y(p.y), z(p.z) {}

    Vec3 position() const { return {x, y, z}; }

    void set_position(const Vec3& p) {
        x = p.x;
        y = p.y;
        z = p.z;
    }
};

// Closed polygon ring stored as a flat x,y,z,x,y,z,... sequence.
// The flat layout is what vertex buffers want; the accessors keep the
// length a multiple of 3.
class SurfaceRing {
public:
    SurfaceRing() = default;

    void append(const Vec3& vertex) {
        coordinates_.push_back(vertex.x);
        coordinates_.push_back(vertex.y);
        coordinates_.push_back(vertex.z);
    }

    size_t vertex_count() const { return coordinates_.size() / 3; }
    bool empty() const { return coordinates_.empty(); }

    Vec3 vertex(size_t i) const {
        return {coordinates_[i * 3], coordinates_[i * 3 + 1], coordinates_[i * 3 + 2]};
    }

    void set_vertex(size_t i, const Vec3& vertex) {
        coordinates_[i * 3] = vertex.x;
        coordinates_[i * 3 + 1] = vertex.y;
        coordinates_[i * 3 + 2] = vertex.z;
    }

    const std::vector<double>& coordinates() const { return coordinates_; }

private:
    std::vector<double> coordinates_;
};

// CellSpace or CellSpaceBoundary: descriptive attributes plus surface geometry
struct BoundaryFeature {
    std::string description;        // empty if absent
    std::string external_id;        // gml:id, empty if absent
    std::string duality_reference;  // href to the dual state, empty if absent
    std::vector<SurfaceRing> surface_rings;

    size_t vertex_count() const {
        size_t count = 0;
        for (const auto& ring : surface_rings) {
            count += ring.vertex_count();
        }
        return count;
    }
};

// Transition between two states, with its own 3D path
struct ConnectionEdge {
    std::vector<std::string> connected_node_references;
    std::string description;
    std::vector<PointFeature> path_points;
};

}  // namespace indoorgml

#endif // INDOORGML_MODEL_FEATURES_HPP

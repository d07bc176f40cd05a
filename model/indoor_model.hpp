#ifndef INDOORGML_MODEL_INDOOR_MODEL_HPP
#define INDOORGML_MODEL_INDOOR_MODEL_HPP

#include "bounding_box.hpp"
#include "features.hpp"
#include <geodesy/frame_builder.hpp>
#include <geodesy/geodetic_point.hpp>
#include <math/matrix4.hpp>
#include <schema/schema_extractor.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace indoorgml {

// Raw: building-local coordinates as read from the document.
// Anchored: world-fixed coordinates after at least one apply_transform.
enum class ModelState {
    Raw,
    Anchored
};

struct ModelStatistics {
    size_t node_count = 0;
    size_t edge_count = 0;
    size_t cell_space_count = 0;
    size_t boundary_count = 0;
    size_t ring_count = 0;
    size_t coordinate_count = 0;  // triples across all four collections
};

// Navigation graph and cell geometry of one building.
//
// Built once from a document; afterwards the only mutation is
// apply_transform, which rewrites every coordinate in place. The
// recentering origin (center_x, center_y, min_z) is fixed at construction,
// so repeated transforms compose rather than replace each other.
class IndoorModel {
public:
    static IndoorModel from_json(const nlohmann::json& document,
                                 const ExtractionConfig& config = ExtractionConfig{});

    // Reads and parses the file, then extracts. Unreadable files throw
    // std::runtime_error; invalid JSON throws MalformedDocumentError.
    static IndoorModel from_file(const std::string& path,
                                 const ExtractionConfig& config = ExtractionConfig{});

    const std::vector<PointFeature>& nodes() const { return nodes_; }
    const std::vector<ConnectionEdge>& edges() const { return edges_; }
    const std::vector<BoundaryFeature>& cell_spaces() const { return cell_spaces_; }
    const std::vector<BoundaryFeature>& cell_space_boundaries() const { return cell_space_boundaries_; }

    // Bounds as observed during extraction (not updated by transforms)
    const BoundingBox& bounds() const { return bounds_; }
    double min_x() const { return bounds_.min_x(); }
    double min_y() const { return bounds_.min_y(); }
    double min_z() const { return bounds_.min_z(); }
    double max_x() const { return bounds_.max_x(); }
    double max_y() const { return bounds_.max_y(); }
    double max_z() const { return bounds_.max_z(); }

    double center_x() const { return center_x_; }
    double center_y() const { return center_y_; }

    // Last east-north-up frame applied; identity while Raw
    const Matrix4& anchor_frame() const { return anchor_frame_; }
    ModelState state() const { return state_; }

    ModelStatistics statistics() const;

    // Lookup by gml:id; nullptr when unknown
    const BoundaryFeature* find_cell_space(const std::string& id) const;
    const BoundaryFeature* find_cell_space_boundary(const std::string& id) const;

    // Cell spaces whose duality points at the given state reference
    std::vector<const BoundaryFeature*> cell_spaces_for_duality(const std::string& href) const;

    // Recenter on (center_x, center_y, min_z), rotate about z by
    // rotation_radians, then place with the east-north-up frame at target.
    // All collections change together or not at all.
    void apply_transform(const GeodeticPoint& target, double rotation_radians);
    void apply_transform(const GeodeticPoint& target, double rotation_radians,
                         const FrameBuilder& frame_builder);

private:
    friend class SchemaExtractor;
    friend class TransformPipeline;

    IndoorModel() = default;

    void build_indices();

    std::vector<PointFeature> nodes_;
    std::vector<ConnectionEdge> edges_;
    std::vector<BoundaryFeature> cell_spaces_;
    std::vector<BoundaryFeature> cell_space_boundaries_;

    BoundingBox bounds_;
    double center_x_ = 0.0;
    double center_y_ = 0.0;

    Matrix4 anchor_frame_;
    ModelState state_ = ModelState::Raw;

    // Index maps for fast lookup
    std::map<std::string, size_t> cell_space_index_;
    std::map<std::string, size_t> boundary_index_;
};

}  // namespace indoorgml

#endif // INDOORGML_MODEL_INDOOR_MODEL_HPP

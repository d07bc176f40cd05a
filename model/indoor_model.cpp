#include "indoor_model.hpp"
#include <schema/malformed_document_error.hpp>
#include <serialization/json_io.hpp>
#include <transform/transform_pipeline.hpp>

namespace indoorgml {

IndoorModel IndoorModel::from_json(const nlohmann::json& document,
                                   const ExtractionConfig& config) {
    return SchemaExtractor::extract(document, config);
}

IndoorModel IndoorModel::from_file(const std::string& path,
                                   const ExtractionConfig& config) {
    nlohmann::json document;
    try {
        document = json::read_json_file(path);
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedDocumentError(path, e.what());
    }
    return from_json(document, config);
}

ModelStatistics IndoorModel::statistics() const {
    ModelStatistics stats;
    stats.node_count = nodes_.size();
    stats.edge_count = edges_.size();
    stats.cell_space_count = cell_spaces_.size();
    stats.boundary_count = cell_space_boundaries_.size();

    stats.coordinate_count = nodes_.size();
    for (const auto& edge : edges_) {
        stats.coordinate_count += edge.path_points.size();
    }
    for (const auto* features : {&cell_spaces_, &cell_space_boundaries_}) {
        for (const auto& feature : *features) {
            stats.ring_count += feature.surface_rings.size();
            stats.coordinate_count += feature.vertex_count();
        }
    }
    return stats;
}

const BoundaryFeature* IndoorModel::find_cell_space(const std::string& id) const {
    auto it = cell_space_index_.find(id);
    if (it != cell_space_index_.end()) {
        return &cell_spaces_[it->second];
    }
    return nullptr;
}

const BoundaryFeature* IndoorModel::find_cell_space_boundary(const std::string& id) const {
    auto it = boundary_index_.find(id);
    if (it != boundary_index_.end()) {
        return &cell_space_boundaries_[it->second];
    }
    return nullptr;
}

std::vector<const BoundaryFeature*> IndoorModel::cell_spaces_for_duality(const std::string& href) const {
    std::vector<const BoundaryFeature*> result;
    if (href.empty()) {
        return result;
    }
    for (const auto& cell_space : cell_spaces_) {
        if (cell_space.duality_reference == href) {
            result.push_back(&cell_space);
        }
    }
    return result;
}

void IndoorModel::apply_transform(const GeodeticPoint& target, double rotation_radians) {
    EllipsoidFrameBuilder frame_builder;
    apply_transform(target, rotation_radians, frame_builder);
}

void IndoorModel::apply_transform(const GeodeticPoint& target, double rotation_radians,
                                  const FrameBuilder& frame_builder) {
    TransformPipeline::apply(*this, target, rotation_radians, frame_builder);
}

// Features without an id are not indexed; the first of duplicate ids wins.
void IndoorModel::build_indices() {
    cell_space_index_.clear();
    boundary_index_.clear();
    for (size_t i = 0; i < cell_spaces_.size(); ++i) {
        if (!cell_spaces_[i].external_id.empty()) {
            cell_space_index_.emplace(cell_spaces_[i].external_id, i);
        }
    }
    for (size_t i = 0; i < cell_space_boundaries_.size(); ++i) {
        if (!cell_space_boundaries_[i].external_id.empty()) {
            boundary_index_.emplace(cell_space_boundaries_[i].external_id, i);
        }
    }
}

}  // namespace indoorgml

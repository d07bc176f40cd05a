#include "schema_extractor.hpp"
#include "document_paths.hpp"
#include "json_field.hpp"
#include "malformed_document_error.hpp"
#include <model/indoor_model.hpp>
#include <common/logging.hpp>

namespace indoorgml {

namespace paths = document_paths;

IndoorModel SchemaExtractor::extract(const nlohmann::json& document,
                                     const ExtractionConfig& config) {
    auto log = indoorgml::logging::get_logger();

    if (!document.is_object()) {
        throw MalformedDocumentError("", "document root must be an object, found " +
                                             std::string(document.type_name()));
    }

    const nlohmann::json& root = resolve_root(document, config);

    IndoorModel model;
    model.bounds_ = BoundingBox(config.bounds_seeding);

    model.nodes_ = extract_nodes(root, model.bounds_);
    log->debug("SchemaExtractor: {} nodes", model.nodes_.size());

    model.edges_ = extract_edges(root, model.bounds_);
    log->debug("SchemaExtractor: {} edges", model.edges_.size());

    model.cell_spaces_ = extract_cell_spaces(root, model.bounds_);
    log->debug("SchemaExtractor: {} cell spaces", model.cell_spaces_.size());

    model.cell_space_boundaries_ = extract_cell_space_boundaries(root, model.bounds_);
    log->debug("SchemaExtractor: {} cell space boundaries", model.cell_space_boundaries_.size());

    model.center_x_ = model.bounds_.center_x();
    model.center_y_ = model.bounds_.center_y();
    model.build_indices();

    log->info("SchemaExtractor: extracted {} nodes, {} edges, {} cell spaces, {} boundaries "
              "({} coordinates, center {:.3f}, {:.3f})",
              model.nodes_.size(), model.edges_.size(),
              model.cell_spaces_.size(), model.cell_space_boundaries_.size(),
              model.bounds_.observed_count(), model.center_x_, model.center_y_);

    return model;
}

const nlohmann::json& SchemaExtractor::resolve_root(const nlohmann::json& document,
                                                    const ExtractionConfig& config) {
    if (config.unwrap_root_value && !schema::find(document, paths::MULTI_LAYERED_GRAPH)) {
        const nlohmann::json* wrapped = schema::find(document, paths::ROOT_VALUE);
        if (wrapped != nullptr && wrapped->is_object()) {
            return *wrapped;
        }
    }
    return document;
}

std::vector<PointFeature> SchemaExtractor::extract_nodes(const nlohmann::json& root,
                                                         BoundingBox& bounds) {
    const auto& members = schema::require_array(root, paths::STATE_MEMBERS, "");

    std::vector<PointFeature> nodes;
    nodes.reserve(members.size());

    for (size_t i = 0; i < members.size(); ++i) {
        Vec3 p = schema::require_coordinate(members[i], paths::STATE_POSITION,
                                            schema::indexed("stateMember", i));
        bounds.observe(p);
        nodes.emplace_back(p);
    }

    return nodes;
}

std::vector<ConnectionEdge> SchemaExtractor::extract_edges(const nlohmann::json& root,
                                                           BoundingBox& bounds) {
    const auto& members = schema::require_array(root, paths::TRANSITION_MEMBERS, "");

    std::vector<ConnectionEdge> edges;
    edges.reserve(members.size());

    for (size_t i = 0; i < members.size(); ++i) {
        const auto& member = members[i];
        std::string location = schema::indexed("transitionMember", i);
        ConnectionEdge edge;

        const auto& connects = schema::require_array(member, paths::TRANSITION_CONNECTS, location);
        for (const auto& connect : connects) {
            edge.connected_node_references.push_back(
                schema::optional_string(connect, paths::CONNECT_HREF));
        }

        if (const nlohmann::json* description = schema::find(member, paths::TRANSITION_DESCRIPTION)) {
            edge.description = schema::optional_string(*description, paths::DESCRIPTION_VALUE);
        }

        const auto& points = schema::require_array(member, paths::TRANSITION_PATH_POINTS, location);
        std::string points_location = location + paths::TRANSITION_PATH_POINTS;
        edge.path_points.reserve(points.size());
        for (size_t k = 0; k < points.size(); ++k) {
            Vec3 p = schema::require_coordinate(points[k], paths::POINT_COORDINATES,
                                                points_location + "/" + std::to_string(k));
            bounds.observe(p);
            edge.path_points.emplace_back(p);
        }

        edges.push_back(std::move(edge));
    }

    return edges;
}

std::vector<BoundaryFeature> SchemaExtractor::extract_cell_spaces(const nlohmann::json& root,
                                                                  BoundingBox& bounds) {
    const auto& members = schema::require_array(root, paths::CELL_SPACE_MEMBERS, "");

    std::vector<BoundaryFeature> cell_spaces;
    cell_spaces.reserve(members.size());

    for (size_t i = 0; i < members.size(); ++i) {
        std::string location = schema::indexed("cellSpaceMember", i);
        const auto& feature = schema::require(members[i], paths::FEATURE, location);
        location += paths::FEATURE;

        BoundaryFeature cell_space = read_attributes(feature);

        // A solid wins over a footprint when a converter emits both.
        if (const nlohmann::json* solid = schema::find(feature, paths::FEATURE_GEOMETRY_3D)) {
            std::string solid_location = location + paths::FEATURE_GEOMETRY_3D;
            const auto& surfaces = schema::require_array(*solid, paths::SOLID_SURFACE_MEMBERS,
                                                         solid_location);
            solid_location += paths::SOLID_SURFACE_MEMBERS;

            cell_space.surface_rings.reserve(surfaces.size());
            for (size_t j = 0; j < surfaces.size(); ++j) {
                cell_space.surface_rings.push_back(
                    read_ring(surfaces[j], paths::SURFACE_RING_POINTS,
                              solid_location + "/" + std::to_string(j), bounds));
            }
        } else if (const nlohmann::json* footprint = schema::find(feature, paths::FEATURE_GEOMETRY_2D)) {
            cell_space.surface_rings.push_back(
                read_ring(*footprint, paths::SURFACE_RING_POINTS,
                          location + paths::FEATURE_GEOMETRY_2D, bounds));
        }

        cell_spaces.push_back(std::move(cell_space));
    }

    return cell_spaces;
}

std::vector<BoundaryFeature> SchemaExtractor::extract_cell_space_boundaries(const nlohmann::json& root,
                                                                            BoundingBox& bounds) {
    const auto& members = schema::require_array(root, paths::CELL_SPACE_BOUNDARY_MEMBERS, "");

    std::vector<BoundaryFeature> boundaries;
    boundaries.reserve(members.size());

    for (size_t i = 0; i < members.size(); ++i) {
        std::string location = schema::indexed("cellSpaceBoundaryMember", i);
        const auto& feature = schema::require(members[i], paths::FEATURE, location);
        location += paths::FEATURE;

        BoundaryFeature boundary = read_attributes(feature);

        // Boundaries only carry 3D surfaces; geometry2D is never read.
        if (const nlohmann::json* geometry = schema::find(feature, paths::FEATURE_GEOMETRY_3D)) {
            std::string surface_location = location + paths::FEATURE_GEOMETRY_3D;
            const auto& surface = schema::require(*geometry, paths::BOUNDARY_SURFACE, surface_location);
            surface_location += paths::BOUNDARY_SURFACE;

            SurfaceRing ring;
            if (const nlohmann::json* exterior = schema::find(surface, paths::SURFACE_EXTERIOR)) {
                ring = read_ring(*exterior, paths::EXTERIOR_RING_POINTS,
                                 surface_location + paths::SURFACE_EXTERIOR, bounds);
            }
            boundary.surface_rings.push_back(std::move(ring));
        }

        boundaries.push_back(std::move(boundary));
    }

    return boundaries;
}

BoundaryFeature SchemaExtractor::read_attributes(const nlohmann::json& feature) {
    BoundaryFeature result;

    if (const nlohmann::json* description = schema::find(feature, paths::FEATURE_DESCRIPTION)) {
        result.description = schema::optional_string(*description, paths::DESCRIPTION_VALUE);
    }
    result.external_id = schema::optional_string(feature, paths::FEATURE_ID);
    if (const nlohmann::json* duality = schema::find(feature, paths::FEATURE_DUALITY)) {
        result.duality_reference = schema::optional_string(*duality, paths::DUALITY_HREF);
    }

    return result;
}

SurfaceRing SchemaExtractor::read_ring(const nlohmann::json& node, const char* pointer,
                                       const std::string& location, BoundingBox& bounds) {
    const auto& points = schema::require_array(node, pointer, location);
    std::string points_location = location + pointer;

    SurfaceRing ring;
    for (size_t k = 0; k < points.size(); ++k) {
        Vec3 p = schema::require_coordinate(points[k], paths::POINT_COORDINATES,
                                            points_location + "/" + std::to_string(k));
        bounds.observe(p);
        ring.append(p);
    }
    return ring;
}

}  // namespace indoorgml

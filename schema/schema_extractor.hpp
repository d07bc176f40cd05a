#ifndef INDOORGML_SCHEMA_SCHEMA_EXTRACTOR_HPP
#define INDOORGML_SCHEMA_SCHEMA_EXTRACTOR_HPP

#include <model/bounding_box.hpp>
#include <model/features.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace indoorgml {

class IndoorModel;

// Configuration for reading a document
struct ExtractionConfig {
    BoundsSeeding bounds_seeding = BoundsSeeding::Zero;

    // Descend into a top-level "value" object when the document has no
    // "multiLayeredGraph" of its own (JAXB root element wrapper).
    bool unwrap_root_value = true;
};

// Reads the fixed IndoorGML JSON shape into an IndoorModel.
// Any missing required path throws MalformedDocumentError.
class SchemaExtractor {
public:
    static IndoorModel extract(const nlohmann::json& document,
                               const ExtractionConfig& config = ExtractionConfig{});

    // Object the collection paths are resolved against
    static const nlohmann::json& resolve_root(const nlohmann::json& document,
                                              const ExtractionConfig& config);

    // Per-collection passes, each feeding every coordinate to `bounds`
    static std::vector<PointFeature> extract_nodes(const nlohmann::json& root, BoundingBox& bounds);
    static std::vector<ConnectionEdge> extract_edges(const nlohmann::json& root, BoundingBox& bounds);
    static std::vector<BoundaryFeature> extract_cell_spaces(const nlohmann::json& root, BoundingBox& bounds);
    static std::vector<BoundaryFeature> extract_cell_space_boundaries(const nlohmann::json& root,
                                                                      BoundingBox& bounds);

private:
    // description / id / duality shared by cell spaces and boundaries
    static BoundaryFeature read_attributes(const nlohmann::json& feature);

    // One ring from a posOrPointPropertyOrPointRep array
    static SurfaceRing read_ring(const nlohmann::json& node, const char* pointer,
                                 const std::string& location, BoundingBox& bounds);
};

}  // namespace indoorgml

#endif // INDOORGML_SCHEMA_SCHEMA_EXTRACTOR_HPP

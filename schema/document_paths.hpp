#ifndef INDOORGML_SCHEMA_DOCUMENT_PATHS_HPP
#define INDOORGML_SCHEMA_DOCUMENT_PATHS_HPP

// JSON pointers (RFC 6901) into an IndoorGML document converted to JSON.
//
// Only the first graph and the first space layer are read. Collection paths
// are relative to the document root; the rest are relative to the element or
// geometry object named in their comment.

namespace indoorgml::document_paths {

// Root wrapper written by JAXB-based converters: {"name": ..., "value": {...}}
constexpr const char* ROOT_VALUE = "/value";
constexpr const char* MULTI_LAYERED_GRAPH = "/multiLayeredGraph";

// Collections (document root)
constexpr const char* STATE_MEMBERS =
    "/multiLayeredGraph/spaceLayers/0/spaceLayerMember/0/spaceLayer/nodes/0/stateMember";
constexpr const char* TRANSITION_MEMBERS =
    "/multiLayeredGraph/spaceLayers/0/spaceLayerMember/0/spaceLayer/edges/0/transitionMember";
constexpr const char* CELL_SPACE_MEMBERS =
    "/primalSpaceFeatures/primalSpaceFeatures/cellSpaceMember";
constexpr const char* CELL_SPACE_BOUNDARY_MEMBERS =
    "/primalSpaceFeatures/primalSpaceFeatures/cellSpaceBoundaryMember";

// stateMember[i]
constexpr const char* STATE_POSITION = "/state/geometry/point/pos/value";

// transitionMember[i]
constexpr const char* TRANSITION_CONNECTS = "/transition/connects";
constexpr const char* TRANSITION_DESCRIPTION = "/transition/description";
constexpr const char* TRANSITION_PATH_POINTS =
    "/transition/geometry/abstractCurve/value/posOrPointPropertyOrPointRep";

// transition.connects[k]
constexpr const char* CONNECT_HREF = "/href";

// posOrPointPropertyOrPointRep[k]
constexpr const char* POINT_COORDINATES = "/value/value";

// cellSpaceMember[i], cellSpaceBoundaryMember[i]
constexpr const char* FEATURE = "/abstractFeature/value";

// abstractFeature.value
constexpr const char* FEATURE_DESCRIPTION = "/description";
constexpr const char* FEATURE_ID = "/id";
constexpr const char* FEATURE_DUALITY = "/duality";
constexpr const char* FEATURE_GEOMETRY_3D = "/geometry3D";
constexpr const char* FEATURE_GEOMETRY_2D = "/geometry2D";

// description, duality
constexpr const char* DESCRIPTION_VALUE = "/value";
constexpr const char* DUALITY_HREF = "/href";

// geometry3D of a cell space
constexpr const char* SOLID_SURFACE_MEMBERS = "/abstractSolid/value/exterior/shell/surfaceMember";

// surfaceMember[j], geometry2D of a cell space
constexpr const char* SURFACE_RING_POINTS =
    "/abstractSurface/value/exterior/abstractRing/value/posOrPointPropertyOrPointRep";

// geometry3D of a cell space boundary
constexpr const char* BOUNDARY_SURFACE = "/abstractSurface/value";
constexpr const char* SURFACE_EXTERIOR = "/exterior";

// exterior of a boundary surface
constexpr const char* EXTERIOR_RING_POINTS = "/abstractRing/value/posOrPointPropertyOrPointRep";

}  // namespace indoorgml::document_paths

#endif // INDOORGML_SCHEMA_DOCUMENT_PATHS_HPP

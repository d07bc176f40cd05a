#include <gtest/gtest.h>
#include <model/indoor_model.hpp>
#include <schema/malformed_document_error.hpp>
#include <schema/schema_extractor.hpp>
#include "test_helpers.hpp"

using namespace indoorgml;
using namespace indoorgml::test;

namespace {

// Runs extraction and returns the path of the reported error ("" if none).
std::string error_path(const nlohmann::json& document) {
    try {
        IndoorModel::from_json(document);
    } catch (const MalformedDocumentError& e) {
        return e.path();
    }
    return "";
}

}  // namespace

TEST(SchemaExtractor, SingleNodeAndEdge) {
    auto document = DocumentBuilder()
        .node(10.0, 20.0, 5.0)
        .edge({"#n1", "#n2"}, {{10.0, 20.0, 5.0}})
        .build();

    IndoorModel model = IndoorModel::from_json(document);

    ASSERT_EQ(model.nodes().size(), 1u);
    ASSERT_EQ(model.edges().size(), 1u);
    EXPECT_EQ(model.edges()[0].connected_node_references,
              (std::vector<std::string>{"#n1", "#n2"}));
    EXPECT_TRUE(model.edges()[0].description.empty());
    ASSERT_EQ(model.edges()[0].path_points.size(), 1u);
    EXPECT_DOUBLE_EQ(model.edges()[0].path_points[0].y, 20.0);

    EXPECT_TRUE(model.cell_spaces().empty());
    EXPECT_TRUE(model.cell_space_boundaries().empty());

    EXPECT_DOUBLE_EQ(model.min_z(), 0.0);
    EXPECT_DOUBLE_EQ(model.max_z(), 5.0);
    EXPECT_DOUBLE_EQ(model.center_x(), 5.0);
    EXPECT_DOUBLE_EQ(model.center_y(), 10.0);
}

TEST(SchemaExtractor, NodeCoordinatesKeepOrder) {
    auto document = DocumentBuilder()
        .node(1.0, 2.0, 3.0)
        .node(-4.0, 5.5, 6.0)
        .build();

    IndoorModel model = IndoorModel::from_json(document);

    ASSERT_EQ(model.nodes().size(), 2u);
    EXPECT_EQ(model.nodes()[0].position(), Vec3(1.0, 2.0, 3.0));
    EXPECT_EQ(model.nodes()[1].position(), Vec3(-4.0, 5.5, 6.0));
}

TEST(SchemaExtractor, EdgeDescriptionAndPath) {
    auto document = DocumentBuilder()
        .edge({"#S1", "#S2"}, {{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, {1.0, 2.0, 0.0}}, std::string("stairs"))
        .build();

    IndoorModel model = IndoorModel::from_json(document);

    ASSERT_EQ(model.edges().size(), 1u);
    const auto& edge = model.edges()[0];
    EXPECT_EQ(edge.description, "stairs");
    ASSERT_EQ(edge.path_points.size(), 3u);
    EXPECT_EQ(edge.path_points[2].position(), Vec3(1.0, 2.0, 0.0));
}

TEST(SchemaExtractor, ConnectWithoutHrefGivesEmptyReference) {
    auto document = DocumentBuilder().edge({"#a"}, {}).build();
    auto& transition = document["multiLayeredGraph"]["spaceLayers"][0]["spaceLayerMember"][0]
                               ["spaceLayer"]["edges"][0]["transitionMember"][0]["transition"];
    transition["connects"].push_back(nlohmann::json::object());

    IndoorModel model = IndoorModel::from_json(document);
    EXPECT_EQ(model.edges()[0].connected_node_references,
              (std::vector<std::string>{"#a", ""}));
}

TEST(SchemaExtractor, CellSpaceWithSolidGeometry) {
    auto document = DocumentBuilder()
        .cell_space(cell_space_3d("C1", box_faces(2.0, 3.0, 0.0), "Room 101", "#S1"))
        .build();

    IndoorModel model = IndoorModel::from_json(document);

    ASSERT_EQ(model.cell_spaces().size(), 1u);
    const auto& cell = model.cell_spaces()[0];
    EXPECT_EQ(cell.external_id, "C1");
    EXPECT_EQ(cell.description, "Room 101");
    EXPECT_EQ(cell.duality_reference, "#S1");
    ASSERT_EQ(cell.surface_rings.size(), 2u);
    EXPECT_EQ(cell.surface_rings[0].vertex_count(), 5u);
    EXPECT_EQ(cell.surface_rings[0].coordinates().size(), 15u);
    EXPECT_EQ(cell.surface_rings[1].vertex(2), Vec3(3.0, 4.0, 1.0));

    EXPECT_DOUBLE_EQ(model.max_x(), 3.0);
    EXPECT_DOUBLE_EQ(model.max_y(), 4.0);
    EXPECT_DOUBLE_EQ(model.max_z(), 1.0);
}

TEST(SchemaExtractor, CellSpaceWithFootprint) {
    Ring footprint = {{0.0, 0.0, 0.0}, {4.0, 0.0, 0.0}, {4.0, 3.0, 0.0}, {0.0, 0.0, 0.0}};
    auto document = DocumentBuilder()
        .cell_space(cell_space_2d("C2", footprint))
        .build();

    IndoorModel model = IndoorModel::from_json(document);

    ASSERT_EQ(model.cell_spaces().size(), 1u);
    ASSERT_EQ(model.cell_spaces()[0].surface_rings.size(), 1u);
    EXPECT_EQ(model.cell_spaces()[0].surface_rings[0].vertex_count(), 4u);
    EXPECT_DOUBLE_EQ(model.center_x(), 2.0);
    EXPECT_DOUBLE_EQ(model.center_y(), 1.5);
}

TEST(SchemaExtractor, SolidTakesPrecedenceOverFootprint) {
    auto member = cell_space_3d("C3", box_faces(0.0, 0.0, 0.0));
    member["abstractFeature"]["value"]["geometry2D"] =
        surface({{100.0, 100.0, 100.0}, {200.0, 100.0, 100.0}, {100.0, 100.0, 100.0}});

    IndoorModel model = IndoorModel::from_json(DocumentBuilder().cell_space(member).build());

    ASSERT_EQ(model.cell_spaces()[0].surface_rings.size(), 2u);
    // The footprint coordinates never reach the bounds.
    EXPECT_DOUBLE_EQ(model.max_x(), 1.0);
    EXPECT_DOUBLE_EQ(model.max_z(), 1.0);
}

TEST(SchemaExtractor, CellSpaceWithoutGeometry) {
    auto document = DocumentBuilder()
        .cell_space(wrap_feature(feature_value("C4", "", "")))
        .build();

    IndoorModel model = IndoorModel::from_json(document);

    ASSERT_EQ(model.cell_spaces().size(), 1u);
    EXPECT_TRUE(model.cell_spaces()[0].surface_rings.empty());
}

TEST(SchemaExtractor, OptionalAttributesDefaultToEmpty) {
    auto value = feature_value("", "", "");
    value["description"] = nullptr;
    value["duality"] = nullptr;
    value["id"] = nullptr;

    IndoorModel model = IndoorModel::from_json(
        DocumentBuilder().cell_space(wrap_feature(value)).build());

    const auto& cell = model.cell_spaces()[0];
    EXPECT_EQ(cell.description, "");
    EXPECT_EQ(cell.external_id, "");
    EXPECT_EQ(cell.duality_reference, "");
}

TEST(SchemaExtractor, BoundaryReadsExteriorRing) {
    Ring door = {{1.0, 0.0, 0.0}, {2.0, 0.0, 0.0}, {2.0, 0.0, 2.5}, {1.0, 0.0, 2.5}, {1.0, 0.0, 0.0}};
    auto document = DocumentBuilder()
        .boundary(boundary_3d("B1", door, "door", "#T1"))
        .build();

    IndoorModel model = IndoorModel::from_json(document);

    ASSERT_EQ(model.cell_space_boundaries().size(), 1u);
    const auto& boundary = model.cell_space_boundaries()[0];
    EXPECT_EQ(boundary.external_id, "B1");
    EXPECT_EQ(boundary.description, "door");
    EXPECT_EQ(boundary.duality_reference, "#T1");
    ASSERT_EQ(boundary.surface_rings.size(), 1u);
    EXPECT_EQ(boundary.surface_rings[0].vertex_count(), 5u);
    EXPECT_DOUBLE_EQ(model.max_z(), 2.5);
}

TEST(SchemaExtractor, BoundaryWithNullExteriorHasOneEmptyRing) {
    IndoorModel model = IndoorModel::from_json(
        DocumentBuilder().boundary(boundary_3d("B2", std::nullopt)).build());

    const auto& boundary = model.cell_space_boundaries()[0];
    ASSERT_EQ(boundary.surface_rings.size(), 1u);
    EXPECT_TRUE(boundary.surface_rings[0].empty());
}

TEST(SchemaExtractor, BoundaryIgnoresFootprint) {
    auto value = feature_value("B3", "", "");
    value["geometry2D"] = surface({{50.0, 50.0, 50.0}, {60.0, 50.0, 50.0}, {50.0, 50.0, 50.0}});

    IndoorModel model = IndoorModel::from_json(
        DocumentBuilder().boundary(wrap_feature(value)).build());

    EXPECT_TRUE(model.cell_space_boundaries()[0].surface_rings.empty());
    EXPECT_DOUBLE_EQ(model.max_x(), 0.0);
}

TEST(SchemaExtractor, UnwrapsJaxbRootValue) {
    nlohmann::json wrapped;
    wrapped["name"] = "{http://www.opengis.net/indoorgml/1.0/core}IndoorFeatures";
    wrapped["value"] = DocumentBuilder().node(1.0, 1.0, 1.0).build();

    IndoorModel model = IndoorModel::from_json(wrapped);
    EXPECT_EQ(model.nodes().size(), 1u);

    ExtractionConfig strict;
    strict.unwrap_root_value = false;
    EXPECT_THROW(IndoorModel::from_json(wrapped, strict), MalformedDocumentError);
}

TEST(SchemaExtractor, FirstObservationSeeding) {
    ExtractionConfig config;
    config.bounds_seeding = BoundsSeeding::FirstObservation;

    IndoorModel model = IndoorModel::from_json(
        DocumentBuilder().node(10.0, 20.0, 5.0).node(14.0, 22.0, 9.0).build(), config);

    EXPECT_DOUBLE_EQ(model.min_x(), 10.0);
    EXPECT_DOUBLE_EQ(model.min_z(), 5.0);
    EXPECT_DOUBLE_EQ(model.center_x(), 12.0);
    EXPECT_DOUBLE_EQ(model.center_y(), 21.0);
}

TEST(SchemaExtractor, CollectionsCanBeExtractedInIsolation) {
    auto document = DocumentBuilder()
        .node(3.0, 3.0, 3.0)
        .cell_space(cell_space_3d("C1", box_faces(-2.0, 0.0, 0.0)))
        .build();

    BoundingBox bounds;
    auto cells = SchemaExtractor::extract_cell_spaces(document, bounds);

    ASSERT_EQ(cells.size(), 1u);
    EXPECT_DOUBLE_EQ(bounds.min_x(), -2.0);
    EXPECT_DOUBLE_EQ(bounds.max_x(), 0.0);
    EXPECT_EQ(bounds.observed_count(), 10u);
}

// ============== Malformed documents ==============

TEST(SchemaExtractorErrors, MissingBoundaryCollectionIsAnError) {
    auto document = DocumentBuilder().node(1.0, 2.0, 3.0).build();
    document["primalSpaceFeatures"]["primalSpaceFeatures"].erase("cellSpaceBoundaryMember");

    EXPECT_THROW(IndoorModel::from_json(document), MalformedDocumentError);
    EXPECT_EQ(error_path(document), "/primalSpaceFeatures/primalSpaceFeatures/cellSpaceBoundaryMember");
}

TEST(SchemaExtractorErrors, MissingGraph) {
    auto document = DocumentBuilder().build();
    document.erase("multiLayeredGraph");

    EXPECT_EQ(error_path(document),
              "/multiLayeredGraph/spaceLayers/0/spaceLayerMember/0/spaceLayer/nodes/0/stateMember");
}

TEST(SchemaExtractorErrors, CollectionMustBeArray) {
    auto document = DocumentBuilder().build();
    document["primalSpaceFeatures"]["primalSpaceFeatures"]["cellSpaceMember"] = nlohmann::json::object();

    try {
        IndoorModel::from_json(document);
        FAIL() << "expected MalformedDocumentError";
    } catch (const MalformedDocumentError& e) {
        EXPECT_EQ(e.path(), "/primalSpaceFeatures/primalSpaceFeatures/cellSpaceMember");
        EXPECT_NE(std::string(e.what()).find("expected an array"), std::string::npos);
    }
}

TEST(SchemaExtractorErrors, NonNumericCoordinateNamesElement) {
    auto document = DocumentBuilder().node(1.0, 2.0, 3.0).node(4.0, 5.0, 6.0).build();
    document["multiLayeredGraph"]["spaceLayers"][0]["spaceLayerMember"][0]["spaceLayer"]
            ["nodes"][0]["stateMember"][1]["state"]["geometry"]["point"]["pos"]["value"][2] = "six";

    EXPECT_EQ(error_path(document), "stateMember[1]/state/geometry/point/pos/value/2");
}

TEST(SchemaExtractorErrors, CoordinateNeedsThreeComponents) {
    auto document = DocumentBuilder().node(1.0, 2.0, 3.0).build();
    document["multiLayeredGraph"]["spaceLayers"][0]["spaceLayerMember"][0]["spaceLayer"]
            ["nodes"][0]["stateMember"][0]["state"]["geometry"]["point"]["pos"]["value"] =
        nlohmann::json::array({1.0, 2.0});

    EXPECT_EQ(error_path(document), "stateMember[0]/state/geometry/point/pos/value");
}

TEST(SchemaExtractorErrors, MissingEdgePathNamesTransition) {
    auto document = DocumentBuilder().edge({"#a", "#b"}, {{0.0, 0.0, 0.0}}).edge({"#b"}, {}).build();
    document["multiLayeredGraph"]["spaceLayers"][0]["spaceLayerMember"][0]["spaceLayer"]
            ["edges"][0]["transitionMember"][1]["transition"].erase("geometry");

    EXPECT_EQ(error_path(document),
              "transitionMember[1]/transition/geometry/abstractCurve/value/posOrPointPropertyOrPointRep");
}

TEST(SchemaExtractorErrors, BadRingCoordinateNamesSurface) {
    auto member = cell_space_3d("C1", box_faces(0.0, 0.0, 0.0));
    member["abstractFeature"]["value"]["geometry3D"]["abstractSolid"]["value"]["exterior"]["shell"]
          ["surfaceMember"][1]["abstractSurface"]["value"]["exterior"]["abstractRing"]["value"]
          ["posOrPointPropertyOrPointRep"][3]["value"]["value"] = nullptr;

    auto document = DocumentBuilder()
        .cell_space(cell_space_2d("C0", {{0.0, 0.0, 0.0}}))
        .cell_space(member)
        .build();

    EXPECT_EQ(error_path(document),
              "cellSpaceMember[1]/abstractFeature/value/geometry3D"
              "/abstractSolid/value/exterior/shell/surfaceMember/1"
              "/abstractSurface/value/exterior/abstractRing/value/posOrPointPropertyOrPointRep/3"
              "/value/value");
}

TEST(SchemaExtractorErrors, BoundaryWithoutSurface) {
    auto value = feature_value("B1", "", "");
    value["geometry3D"] = nlohmann::json::object();

    auto document = DocumentBuilder().boundary(wrap_feature(value)).build();
    EXPECT_EQ(error_path(document),
              "cellSpaceBoundaryMember[0]/abstractFeature/value/geometry3D/abstractSurface/value");
}

TEST(SchemaExtractorErrors, RootMustBeObject) {
    EXPECT_THROW(IndoorModel::from_json(nlohmann::json::array()), MalformedDocumentError);
}

TEST(SchemaExtractorErrors, MessageIncludesPath) {
    auto document = DocumentBuilder().build();
    document["primalSpaceFeatures"]["primalSpaceFeatures"].erase("cellSpaceMember");

    try {
        IndoorModel::from_json(document);
        FAIL() << "expected MalformedDocumentError";
    } catch (const MalformedDocumentError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("cellSpaceMember"), std::string::npos);
        EXPECT_NE(message.find("missing"), std::string::npos);
    }
}

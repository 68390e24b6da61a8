#include "testhelpers.h"

TEST_CASE("Geometry: classification by point count and closure", "[geometry][classify]") {
    GeometryType type;
    Geometry geometry;

    SECTION("Empty sequence emits nothing") {
        REQUIRE_FALSE(classifyVertices(VertexList(), false, type, geometry));
    }

    SECTION("Single point") {
        REQUIRE(classifyVertices(VertexList{Vertex(1, 2)}, false, type, geometry));
        REQUIRE(type == GeometryType::Point);
        REQUIRE(geometry.kind() == GeometryKind::Point);
    }

    SECTION("Closed sequence of four points") {
        const VertexList ring{Vertex(0, 0), Vertex(1, 0), Vertex(1, 1), Vertex(0, 0)};
        REQUIRE(classifyVertices(ring, false, type, geometry));
        REQUIRE(type == GeometryType::Polygon);
        REQUIRE(geometry.kind() == GeometryKind::Polygon);
        REQUIRE(geometry.parts().first().rings.first().size() == 4);
    }

    SECTION("Closed sequence of three points stays a line") {
        const VertexList back{Vertex(0, 0), Vertex(1, 0), Vertex(0, 0)};
        REQUIRE(classifyVertices(back, false, type, geometry));
        REQUIRE(type == GeometryType::Line);
    }

    SECTION("Open sequence") {
        const VertexList open{Vertex(0, 0), Vertex(1, 0), Vertex(1, 1), Vertex(2, 1)};
        REQUIRE(classifyVertices(open, false, type, geometry));
        REQUIRE(type == GeometryType::Line);
        REQUIRE(geometry.kind() == GeometryKind::LineString);
    }
}

TEST_CASE("Geometry: type names round trip through the bucket label", "[geometry]") {
    GeometryType type;
    REQUIRE(geometryTypeName(GeometryType::Line) == "LINE");
    REQUIRE(geometryTypeFromName("polygon", type));
    REQUIRE(type == GeometryType::Polygon);
    REQUIRE_FALSE(geometryTypeFromName("curve", type));
}

TEST_CASE("Geometry: lineal length sums all parts", "[geometry]") {
    const Geometry g = Geometry::multiLineString({
        VertexList{Vertex(0, 0), Vertex(3, 0)},
        VertexList{Vertex(0, 1), Vertex(0, 5)}});
    REQUIRE(g.isLineal());
    REQUIRE(g.numParts() == 2);
    REQUIRE(g.length() == Approx(7.0));
}

#include "testhelpers.h"

#include "convert/bucketassembler.h"
#include "convert/geometrynormalizer.h"

namespace {

Row makeRow(const QString& layer, GeometryType type, const Geometry& geometry)
{
    Row row;
    row.layer = layer;
    row.type = type;
    row.geometry = geometry;
    return row;
}

Geometry unitLine()
{
    return Geometry::lineString(VertexList{Vertex(0, 0), Vertex(1, 0)});
}

Geometry unitSquare()
{
    return Geometry::polygon({VertexList{Vertex(0, 0), Vertex(1, 0), Vertex(1, 1), Vertex(0, 1), Vertex(0, 0)}});
}

} // namespace

TEST_CASE("GeometryNormalizer: matching geometries pass through", "[normalizer]") {
    Geometry out;
    REQUIRE(GeometryNormalizer::normalize(GeometryType::Line, unitLine(), out));
    REQUIRE(out.kind() == GeometryKind::LineString);
    REQUIRE(GeometryNormalizer::normalize(GeometryType::Polygon, unitSquare(), out));
    REQUIRE(GeometryNormalizer::normalize(GeometryType::Point, Geometry::point(Vertex(1, 1)), out));
}

TEST_CASE("GeometryNormalizer: mismatched geometries are dropped, not coerced", "[normalizer]") {
    Geometry out;
    REQUIRE_FALSE(GeometryNormalizer::normalize(GeometryType::Polygon, unitLine(), out));
    REQUIRE_FALSE(GeometryNormalizer::normalize(GeometryType::Point, unitSquare(), out));
    REQUIRE_FALSE(GeometryNormalizer::normalize(GeometryType::Line, Geometry::point(Vertex(0, 0)), out));
    REQUIRE_FALSE(GeometryNormalizer::normalize(GeometryType::Line, Geometry(), out));
    REQUIRE(out.isEmpty());
}

TEST_CASE("GeometryNormalizer: line members are pulled out of a mixed collection", "[normalizer][geos]") {
    GeometryPart point;
    point.kind = GeometryKind::Point;
    point.rings.append(VertexList{Vertex(5, 5)});

    GeometryPart first;
    first.kind = GeometryKind::LineString;
    first.rings.append(VertexList{Vertex(0, 0), Vertex(1, 0)});

    GeometryPart second;
    second.kind = GeometryKind::LineString;
    second.rings.append(VertexList{Vertex(1, 0), Vertex(2, 0)});

    const Geometry mixed = Geometry::collection(GeometryKind::GeometryCollection, {point, first, second});
    const Geometry lines = GeometryNormalizer::extractLineal(mixed);
    REQUIRE(lines.isLineal());
    REQUIRE(lines.length() == Approx(2.0));
}

TEST_CASE("GeometryNormalizer: rows that do not fit are counted", "[normalizer]") {
    int dropped = 0;
    const QVector<Row> rows = GeometryNormalizer::normalizeRows(
        QVector<Row>{makeRow("A", GeometryType::Line, unitLine()),
                     makeRow("A", GeometryType::Line, unitSquare())},
        &dropped);
    REQUIRE(rows.size() == 1);
    REQUIRE(dropped == 1);
}

TEST_CASE("BucketAssembler: buckets keep first-seen order", "[buckets]") {
    BucketAssembler assembler;
    assembler.add(makeRow("ROADS", GeometryType::Line, unitLine()));
    assembler.add(makeRow("LOTS", GeometryType::Polygon, unitSquare()));
    assembler.add(makeRow("ROADS", GeometryType::Point, Geometry::point(Vertex(3, 3))));
    assembler.add(makeRow("ROADS", GeometryType::Line, unitLine()));

    const QVector<Bucket>& buckets = assembler.buckets();
    REQUIRE(buckets.size() == 3);
    REQUIRE(buckets[0].key.layer == "ROADS");
    REQUIRE(buckets[0].key.type == GeometryType::Line);
    REQUIRE(buckets[0].rows.size() == 2);
    REQUIRE(buckets[1].key.layer == "LOTS");
    REQUIRE(buckets[2].key.type == GeometryType::Point);
    REQUIRE(assembler.rowCount() == 4);

    REQUIRE(assembler.bucket("LOTS", GeometryType::Polygon) != nullptr);
    REQUIRE(assembler.bucket("LOTS", GeometryType::Line) == nullptr);
}

TEST_CASE("BucketAssembler: rows failing normalization are dropped", "[buckets]") {
    BucketAssembler assembler;
    REQUIRE_FALSE(assembler.add(makeRow("A", GeometryType::Polygon, unitLine())));
    REQUIRE(assembler.isEmpty());
    REQUIRE(assembler.droppedCount() == 1);
    REQUIRE(assembler.buckets().isEmpty());
}

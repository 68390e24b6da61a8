#include "testhelpers.h"

#include "convert/entityflattener.h"

#include <QtMath>

#include <cmath>

namespace {

double distance(const Vertex& a, const Vertex& b)
{
    return std::hypot(a.x - b.x, a.y - b.y);
}

// Largest gap between the true arc and the chord midpoints
double maxChordDeviation(const VertexList& pts, const Vertex& center, double radius)
{
    double worst = 0.0;
    for (int i = 1; i < pts.size(); ++i) {
        const Vertex mid(0.5 * (pts[i - 1].x + pts[i].x), 0.5 * (pts[i - 1].y + pts[i].y));
        worst = qMax(worst, radius - distance(mid, center));
    }
    return worst;
}

} // namespace

TEST_CASE("EntityFlattener: arc chords stay within tolerance", "[flattener][arc]") {
    const double tol = 0.01;
    EntityFlattener flattener(tol, false);

    CadEntity arc;
    arc.category = EntityCategory::Arc;
    arc.center = Vertex(5, 5);
    arc.radius = 10.0;
    arc.startAngle = 0.0;
    arc.endAngle = M_PI / 2.0;

    const VertexList pts = flattener.curvePoints(arc);
    REQUIRE(pts.size() > 2);
    REQUIRE(distance(pts.first(), Vertex(15, 5)) == Approx(0.0).margin(1e-9));
    REQUIRE(distance(pts.last(), Vertex(5, 15)) == Approx(0.0).margin(1e-9));
    REQUIRE(maxChordDeviation(pts, arc.center, arc.radius) <= tol + 1e-9);
}

TEST_CASE("EntityFlattener: arc crossing zero degrees sweeps counter-clockwise", "[flattener][arc]") {
    EntityFlattener flattener(0.05, false);

    CadEntity arc;
    arc.category = EntityCategory::Arc;
    arc.center = Vertex(0, 0);
    arc.radius = 4.0;
    arc.startAngle = 3.0 * M_PI / 2.0;
    arc.endAngle = M_PI / 2.0;

    const VertexList pts = flattener.curvePoints(arc);
    // The short way round passes through (4, 0)
    bool crossesPositiveX = false;
    for (const Vertex& p : pts) {
        REQUIRE(p.x >= -1e-9);
        if (p.x > 3.99) crossesPositiveX = true;
    }
    REQUIRE(crossesPositiveX);
}

TEST_CASE("EntityFlattener: circle with tolerance not below radius uses the fixed sampler", "[flattener][circle]") {
    EntityFlattener flattener(0.2, false);

    CadEntity circle;
    circle.category = EntityCategory::Circle;
    circle.center = Vertex(1, 1);
    circle.radius = 0.1;

    const QVector<Row> rows = flattener.rows(circle);
    REQUIRE(rows.size() == 1);
    REQUIRE(rows.first().type == GeometryType::Polygon);

    // max(24, int(2*pi / 0.2)) = 31 chords
    const VertexList& ring = rows.first().geometry.parts().first().rings.first();
    REQUIRE(ring.size() == 32);
    REQUIRE(ring.first().sameXY(ring.last()));
}

TEST_CASE("EntityFlattener: polyline bulge becomes a half circle", "[flattener][polyline]") {
    EntityFlattener flattener(0.01, false);

    CadEntity poly;
    poly.category = EntityCategory::Polyline;
    poly.vertices = VertexList{Vertex(0, 0), Vertex(2, 0)};
    poly.bulges = QVector<double>{1.0, 0.0};

    const VertexList pts = flattener.curvePoints(poly);
    REQUIRE(pts.size() > 3);
    REQUIRE(pts.first() == Vertex(0, 0));
    REQUIRE(pts.last() == Vertex(2, 0));

    double minY = 0.0;
    for (const Vertex& p : pts) {
        REQUIRE(distance(p, Vertex(1, 0)) == Approx(1.0).margin(1e-9));
        minY = qMin(minY, p.y);
    }
    // Positive bulge turns counter-clockwise, below the chord here
    REQUIRE(minY == Approx(-1.0).margin(0.01));
}

TEST_CASE("EntityFlattener: zero-length polyline segments are skipped", "[flattener][polyline]") {
    EntityFlattener flattener(0.1, false);

    CadEntity poly;
    poly.category = EntityCategory::Polyline;
    poly.vertices = VertexList{Vertex(0, 0), Vertex(1, 0), Vertex(1, 0), Vertex(1, 1)};

    const VertexList pts = flattener.curvePoints(poly);
    REQUIRE(pts.size() == 3);
}

TEST_CASE("EntityFlattener: elevation is kept only when requested", "[flattener]") {
    CadEntity e = testing::line(0, 0, 1, 1);
    e.vertices[0].z = 5.0;
    e.vertices[1].z = 7.0;

    const VertexList flat = EntityFlattener(0.1, false).curvePoints(e);
    REQUIRE(flat.first().z == 0.0);

    const VertexList full = EntityFlattener(0.1, true).curvePoints(e);
    REQUIRE(full.first().z == 5.0);
    REQUIRE(full.last().z == 7.0);
}

TEST_CASE("EntityFlattener: full ellipse closes on its start point", "[flattener][ellipse]") {
    EntityFlattener flattener(0.01, false);

    CadEntity ellipse;
    ellipse.category = EntityCategory::Ellipse;
    ellipse.center = Vertex(0, 0);
    ellipse.majorAxis = Vertex(4, 0);
    ellipse.ratio = 0.5;
    ellipse.startAngle = 0.0;
    ellipse.endAngle = 2.0 * M_PI;

    const QVector<Row> rows = flattener.rows(ellipse);
    REQUIRE(rows.size() == 1);
    REQUIRE(rows.first().type == GeometryType::Polygon);
}

TEST_CASE("EntityFlattener: ellipse and spline have no fallback", "[flattener][errors]") {
    EntityFlattener flattener(0.1, false);
    REQUIRE_THROWS_AS(flattener.rows(testing::brokenEllipse()), EntityExtractionError);

    CadEntity spline;
    spline.category = EntityCategory::Spline;
    REQUIRE_THROWS_AS(flattener.rows(spline), EntityExtractionError);
}

TEST_CASE("EntityFlattener: clamped spline runs from first to last control point", "[flattener][spline]") {
    EntityFlattener flattener(0.01, false);

    CadEntity spline;
    spline.category = EntityCategory::Spline;
    spline.degree = 3;
    spline.vertices = VertexList{Vertex(0, 0), Vertex(1, 2), Vertex(3, 2), Vertex(4, 0)};

    const VertexList pts = flattener.curvePoints(spline);
    REQUIRE(pts.size() > 4);
    REQUIRE(distance(pts.first(), Vertex(0, 0)) == Approx(0.0).margin(1e-9));
    REQUIRE(distance(pts.last(), Vertex(4, 0)) == Approx(0.0).margin(1e-9));
}

TEST_CASE("EntityFlattener: unclosed hatch ring is closed before typing", "[flattener][hatch]") {
    EntityFlattener flattener(0.1, false);

    CadHatchLoop loop;
    loop.isPolyline = true;
    loop.closed = false;
    loop.vertices = VertexList{Vertex(0, 0), Vertex(0, 1), Vertex(1, 1)};

    CadEntity hatch;
    hatch.category = EntityCategory::Hatch;
    hatch.layer = "FILL";
    hatch.loops.append(loop);

    const QVector<Row> rows = flattener.rows(hatch);
    REQUIRE(rows.size() == 1);
    REQUIRE(rows.first().type == GeometryType::Polygon);
    REQUIRE(rows.first().layer == "FILL");

    const VertexList& ring = rows.first().geometry.parts().first().rings.first();
    REQUIRE(ring.size() == 4);
    REQUIRE(ring.last() == Vertex(0, 0));
}

TEST_CASE("EntityFlattener: hatch edge loop joins lines and arcs", "[flattener][hatch]") {
    EntityFlattener flattener(0.01, false);

    CadHatchEdge bottom;
    bottom.type = CadHatchEdge::LineEdge;
    bottom.start = Vertex(-1, 0);
    bottom.end = Vertex(1, 0);

    CadHatchEdge top;
    top.type = CadHatchEdge::ArcEdge;
    top.center = Vertex(0, 0);
    top.radius = 1.0;
    top.startAngle = 0.0;
    top.endAngle = M_PI;

    CadHatchLoop loop;
    loop.edges = QVector<CadHatchEdge>{bottom, top};

    CadEntity hatch;
    hatch.category = EntityCategory::Hatch;
    hatch.loops.append(loop);

    const QVector<VertexList> rings = flattener.areaRings(hatch);
    REQUIRE(rings.size() == 1);
    const VertexList& ring = rings.first();
    REQUIRE(ring.first().sameXY(ring.last()));
    // No repeated point where the line meets the arc
    for (int i = 1; i < ring.size(); ++i) {
        REQUIRE_FALSE(ring[i - 1].sameXY(ring[i]));
    }
}

TEST_CASE("EntityFlattener: solid corners are reordered into a ring", "[flattener][face]") {
    EntityFlattener flattener(0.1, false);

    CadEntity solid;
    solid.category = EntityCategory::Face;
    solid.zigZagCorners = true;
    solid.vertices = VertexList{Vertex(0, 0), Vertex(1, 0), Vertex(0, 1), Vertex(1, 1)};

    const QVector<Row> rows = flattener.rows(solid);
    REQUIRE(rows.size() == 1);
    REQUIRE(rows.first().type == GeometryType::Polygon);

    const VertexList& ring = rows.first().geometry.parts().first().rings.first();
    REQUIRE(ring.size() == 5);
    REQUIRE(ring[2] == Vertex(1, 1));
    REQUIRE(ring[3] == Vertex(0, 1));
}

TEST_CASE("EntityFlattener: block references are not flattened", "[flattener][errors]") {
    EntityFlattener flattener(0.1, false);
    REQUIRE_THROWS_AS(flattener.rows(testing::insert("B", Vertex(0, 0))), EntityExtractionError);
}

TEST_CASE("EntityFlattener: arc with a flipped extrusion is mirrored into world coordinates", "[flattener][arc][ocs]") {
    EntityFlattener flattener(0.01, false);

    CadEntity arc;
    arc.category = EntityCategory::Arc;
    arc.center = Vertex(5, 0);
    arc.radius = 1.0;
    arc.startAngle = 0.0;
    arc.endAngle = M_PI / 2.0;
    arc.extrusion = Vertex(0, 0, -1);

    const VertexList pts = flattener.curvePoints(arc);
    REQUIRE(pts.size() > 2);
    REQUIRE(distance(pts.first(), Vertex(-6, 0)) == Approx(0.0).margin(1e-9));
    REQUIRE(distance(pts.last(), Vertex(-5, 1)) == Approx(0.0).margin(1e-9));
    for (const Vertex& p : pts) {
        REQUIRE(distance(p, Vertex(-5, 0)) == Approx(1.0));
    }
}

TEST_CASE("EntityFlattener: polyline in a flipped frame keeps its shape", "[flattener][polyline][ocs]") {
    EntityFlattener flattener(0.1, false);

    CadEntity pline;
    pline.category = EntityCategory::Polyline;
    pline.vertices = VertexList{Vertex(1, 1), Vertex(3, 1), Vertex(3, 2)};
    pline.extrusion = Vertex(0, 0, -1);

    const VertexList pts = flattener.curvePoints(pline);
    REQUIRE(pts.size() == 3);
    REQUIRE(pts[0] == Vertex(-1, 1));
    REQUIRE(pts[1] == Vertex(-3, 1));
    REQUIRE(pts[2] == Vertex(-3, 2));
}

TEST_CASE("EntityFlattener: weighted spline follows the rational curve", "[flattener][spline]") {
    EntityFlattener flattener(0.001, false);

    // Quarter of the unit circle as a rational quadratic
    CadEntity spline;
    spline.category = EntityCategory::Spline;
    spline.degree = 2;
    spline.vertices = VertexList{Vertex(1, 0), Vertex(1, 1), Vertex(0, 1)};
    spline.knots = QVector<double>{0, 0, 0, 1, 1, 1};
    spline.weights = QVector<double>{1.0, M_SQRT1_2, 1.0};

    const VertexList pts = flattener.curvePoints(spline);
    REQUIRE(pts.size() > 3);
    for (const Vertex& p : pts) {
        REQUIRE(distance(p, Vertex(0, 0)) == Approx(1.0).margin(1e-9));
    }

    // Without weights the same control polygon bulges outside the circle
    spline.weights.clear();
    const VertexList plain = flattener.curvePoints(spline);
    double farthest = 0.0;
    for (const Vertex& p : plain) {
        farthest = qMax(farthest, distance(p, Vertex(0, 0)));
    }
    REQUIRE(farthest > 1.01);
}

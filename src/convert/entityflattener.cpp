#include "convert/entityflattener.h"

#include <QDebug>
#include <QtMath>

#include <algorithm>
#include <cmath>

namespace {

constexpr double kTwoPi = 2.0 * M_PI;
constexpr double kBulgeEpsilon = 1e-12;
constexpr int kMaxArcSegments = 65536;
constexpr int kMaxSubdivisionDepth = 12;

// Number of chords so that no chord deviates more than tol from the arc
int arcSegments(double radius, double sweep, double tol)
{
    if (!(tol > 0.0)) {
        throw EntityExtractionError("non-positive flattening tolerance");
    }
    if (!(radius > 0.0) || !std::isfinite(radius)) {
        throw EntityExtractionError(QString("invalid radius %1").arg(radius));
    }
    if (tol >= radius) {
        throw EntityExtractionError(QString("tolerance %1 not smaller than radius %2").arg(tol).arg(radius));
    }
    const double step = 2.0 * std::acos(1.0 - tol / radius);
    const int n = static_cast<int>(std::ceil(std::abs(sweep) / step));
    return qBound(1, n, kMaxArcSegments);
}

// n + 1 points from start over sweep (signed, radians)
VertexList sampleArc(const Vertex& center, double radius, double start, double sweep, int n)
{
    VertexList out;
    out.reserve(n + 1);
    for (int i = 0; i <= n; ++i) {
        const double a = start + sweep * i / n;
        out.append(Vertex(center.x + radius * qCos(a), center.y + radius * qSin(a), center.z));
    }
    return out;
}

// Counter-clockwise sweep from start to end in (0, 2pi]
double ccwSweep(double start, double end)
{
    double sweep = std::fmod(end - start, kTwoPi);
    if (sweep <= 1e-9) sweep += kTwoPi;
    return sweep;
}

double pointSegmentDistance(const Vertex& p, const Vertex& a, const Vertex& b)
{
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double len2 = dx * dx + dy * dy;
    if (len2 <= 0.0) return std::hypot(p.x - a.x, p.y - a.y);
    const double t = qBound(0.0, ((p.x - a.x) * dx + (p.y - a.y) * dy) / len2, 1.0);
    return std::hypot(p.x - (a.x + t * dx), p.y - (a.y + t * dy));
}

// Appends points of curve(t) on (t0, t1] until every chord is within tol.
// Probes at 1/4, 1/2 and 3/4 so that an S-shaped piece is not mistaken for
// a straight one.
template <typename Curve>
void subdivide(const Curve& curve, double t0, const Vertex& p0, double t1, const Vertex& p1,
               double tol, int depth, VertexList& out)
{
    const double tm = 0.5 * (t0 + t1);
    const Vertex pm = curve(tm);
    bool flat = depth >= kMaxSubdivisionDepth;
    if (!flat) {
        flat = pointSegmentDistance(pm, p0, p1) <= tol &&
               pointSegmentDistance(curve(t0 + 0.25 * (t1 - t0)), p0, p1) <= tol &&
               pointSegmentDistance(curve(t0 + 0.75 * (t1 - t0)), p0, p1) <= tol;
    }
    if (flat) {
        out.append(p1);
        return;
    }
    subdivide(curve, t0, p0, tm, pm, tol, depth + 1, out);
    subdivide(curve, tm, pm, t1, p1, tol, depth + 1, out);
}

// Points of the arc implied by a polyline bulge between p1 and p2, p1 excluded
VertexList bulgeArc(const Vertex& p1, const Vertex& p2, double bulge, double tol)
{
    const double dx = p2.x - p1.x;
    const double dy = p2.y - p1.y;
    const double chord = std::hypot(dx, dy);
    const double theta = 4.0 * std::atan(bulge);
    const double radius = chord / (2.0 * std::sin(std::abs(theta) / 2.0));

    // Center sits left of the chord for a counter-clockwise bulge below a half circle
    const double offset = (1.0 - bulge * bulge) / (4.0 * bulge);
    const Vertex center(0.5 * (p1.x + p2.x) - dy * offset,
                        0.5 * (p1.y + p2.y) + dx * offset,
                        p1.z);
    const double start = std::atan2(p1.y - center.y, p1.x - center.x);

    const int n = arcSegments(radius, theta, tol);
    VertexList points = sampleArc(center, radius, start, theta, n);
    points.removeFirst();
    // Pin the end point exactly
    points.last() = p2;
    for (int i = 0; i < points.size() - 1; ++i) {
        points[i].z = p1.z + (p2.z - p1.z) * (i + 1) / points.size();
    }
    return points;
}

VertexList flattenPolyline(const VertexList& vertices, const QVector<double>& bulges, bool closed, double tol)
{
    const int n = vertices.size();
    if (n == 0) {
        throw EntityExtractionError("polyline has no vertices");
    }
    if (!bulges.isEmpty() && bulges.size() != n) {
        throw EntityExtractionError(QString("polyline has %1 vertices but %2 bulges").arg(n).arg(bulges.size()));
    }
    if (!(tol > 0.0)) {
        throw EntityExtractionError("non-positive flattening tolerance");
    }

    VertexList out;
    out.append(vertices.first());
    if (n == 1) return out;

    const int count = closed ? n : n - 1;
    for (int i = 0; i < count; ++i) {
        const Vertex& p1 = vertices[i];
        const Vertex& p2 = vertices[(i + 1) % n];
        const double bulge = bulges.isEmpty() ? 0.0 : bulges[i];
        if (!std::isfinite(bulge)) {
            throw EntityExtractionError(QString("invalid bulge at vertex %1").arg(i));
        }
        if (p1.sameXY(p2)) continue;
        if (std::abs(bulge) < kBulgeEpsilon) {
            out.append(p2);
        } else {
            out += bulgeArc(p1, p2, bulge, tol);
        }
    }
    return out;
}

Vertex ellipsePoint(const Vertex& center, const Vertex& major, double ratio, double t)
{
    // Minor axis is the major axis turned 90 degrees counter-clockwise
    const double c = qCos(t);
    const double s = qSin(t);
    return Vertex(center.x + c * major.x - s * ratio * major.y,
                  center.y + c * major.y + s * ratio * major.x,
                  center.z);
}

VertexList flattenEllipse(const Vertex& center, const Vertex& major, double ratio,
                          double startParam, double endParam, double tol)
{
    const double a = std::hypot(major.x, major.y);
    if (!(a > 0.0) || !std::isfinite(a)) {
        throw EntityExtractionError("ellipse has a zero major axis");
    }
    if (!(ratio > 0.0) || ratio > 1.0 + 1e-9) {
        throw EntityExtractionError(QString("invalid ellipse axis ratio %1").arg(ratio));
    }
    if (!(tol > 0.0)) {
        throw EntityExtractionError("non-positive flattening tolerance");
    }
    if (tol >= a) {
        throw EntityExtractionError(QString("tolerance %1 not smaller than ellipse axis %2").arg(tol).arg(a));
    }

    const double sweep = ccwSweep(startParam, endParam);
    const bool full = sweep >= kTwoPi - 1e-9;
    auto curve = [&](double t) { return ellipsePoint(center, major, ratio, t); };

    const int pieces = qMax(4, static_cast<int>(std::ceil(sweep / (M_PI / 8.0))));
    VertexList out;
    Vertex prev = curve(startParam);
    out.append(prev);
    for (int i = 1; i <= pieces; ++i) {
        const double t0 = startParam + sweep * (i - 1) / pieces;
        const double t1 = startParam + sweep * i / pieces;
        const Vertex next = curve(t1);
        subdivide(curve, t0, prev, t1, next, tol, 0, out);
        prev = next;
    }
    if (full) out.last() = out.first();
    return out;
}

/**
 * @brief Rational B-spline evaluated with de Boor's algorithm
 *
 * Knots are clamped-uniform when none are given; weights default to 1.
 */
class BSpline {
public:
    BSpline(int degree, const VertexList& controls, QVector<double> knots, QVector<double> weights)
        : m_degree(degree), m_controls(controls), m_knots(std::move(knots)), m_weights(std::move(weights))
    {
        const int n = m_controls.size();
        if (m_degree < 1) {
            throw EntityExtractionError(QString("invalid spline degree %1").arg(m_degree));
        }
        if (n < m_degree + 1) {
            throw EntityExtractionError(QString("spline needs %1 control points, has %2").arg(m_degree + 1).arg(n));
        }
        if (m_knots.isEmpty()) {
            for (int i = 0; i <= m_degree; ++i) m_knots.append(0.0);
            for (int i = 1; i < n - m_degree; ++i) m_knots.append(i);
            for (int i = 0; i <= m_degree; ++i) m_knots.append(n - m_degree);
        }
        if (m_knots.size() != n + m_degree + 1) {
            throw EntityExtractionError(QString("spline has %1 knots, expected %2").arg(m_knots.size()).arg(n + m_degree + 1));
        }
        for (int i = 1; i < m_knots.size(); ++i) {
            if (m_knots[i] < m_knots[i - 1]) {
                throw EntityExtractionError("spline knots are not ascending");
            }
        }
        if (!m_weights.isEmpty() && m_weights.size() != n) {
            throw EntityExtractionError("spline weight count does not match control points");
        }
        for (double w : m_weights) {
            if (!(w > 0.0)) throw EntityExtractionError("spline has a non-positive weight");
        }
        if (!(domainEnd() > domainStart())) {
            throw EntityExtractionError("spline has an empty parameter range");
        }
    }

    double domainStart() const { return m_knots[m_degree]; }
    double domainEnd() const { return m_knots[m_controls.size()]; }

    // Parameter values of non-empty knot spans, domain start and end included
    QVector<double> breakpoints() const {
        QVector<double> out{domainStart()};
        for (int k = m_degree + 1; k <= m_controls.size(); ++k) {
            if (m_knots[k] > out.last()) out.append(m_knots[k]);
        }
        return out;
    }

    Vertex evaluate(double t) const {
        const int n = m_controls.size();
        const int p = m_degree;
        int k = p;
        while (k < n - 1 && t >= m_knots[k + 1]) ++k;

        struct H { double x, y, z, w; };
        QVector<H> d(p + 1);
        for (int j = 0; j <= p; ++j) {
            const Vertex& c = m_controls[j + k - p];
            const double w = m_weights.isEmpty() ? 1.0 : m_weights[j + k - p];
            d[j] = H{c.x * w, c.y * w, c.z * w, w};
        }
        for (int r = 1; r <= p; ++r) {
            for (int j = p; j >= r; --j) {
                const double lo = m_knots[j + k - p];
                const double hi = m_knots[j + 1 + k - r];
                const double alpha = hi > lo ? (t - lo) / (hi - lo) : 0.0;
                d[j].x = (1.0 - alpha) * d[j - 1].x + alpha * d[j].x;
                d[j].y = (1.0 - alpha) * d[j - 1].y + alpha * d[j].y;
                d[j].z = (1.0 - alpha) * d[j - 1].z + alpha * d[j].z;
                d[j].w = (1.0 - alpha) * d[j - 1].w + alpha * d[j].w;
            }
        }
        const H& h = d[p];
        return Vertex(h.x / h.w, h.y / h.w, h.z / h.w);
    }

private:
    int m_degree;
    VertexList m_controls;
    QVector<double> m_knots;
    QVector<double> m_weights;
};

VertexList flattenSpline(int degree, const VertexList& controls, const QVector<double>& knots,
                         const QVector<double>& weights, const VertexList& fitPoints, double tol)
{
    if (!(tol > 0.0)) {
        throw EntityExtractionError("non-positive flattening tolerance");
    }
    if (controls.isEmpty()) {
        // Fit-point-only splines are approximated by their fit polygon
        if (fitPoints.size() < 2) {
            throw EntityExtractionError("spline has neither control points nor fit points");
        }
        return fitPoints;
    }

    const BSpline spline(degree, controls, knots, weights);
    auto curve = [&spline](double t) { return spline.evaluate(t); };

    const QVector<double> breaks = spline.breakpoints();
    VertexList out;
    Vertex prev = curve(breaks.first());
    out.append(prev);
    for (int i = 1; i < breaks.size(); ++i) {
        // Two pieces per knot span before adaptive refinement
        const double mid = 0.5 * (breaks[i - 1] + breaks[i]);
        const Vertex pm = curve(mid);
        subdivide(curve, breaks[i - 1], prev, mid, pm, tol, 0, out);
        const Vertex next = curve(breaks[i]);
        subdivide(curve, mid, pm, breaks[i], next, tol, 0, out);
        prev = next;
    }
    return out;
}

VertexList fallbackCircle(const Vertex& center, double radius, double tol)
{
    if (!(radius > 0.0) || !std::isfinite(radius)) {
        throw EntityExtractionError(QString("invalid radius %1").arg(radius));
    }
    const int segs = qMax(24, static_cast<int>(kTwoPi / qMax(tol, 0.1)));
    VertexList out = sampleArc(center, radius, 0.0, kTwoPi, segs);
    out.last() = out.first();
    return out;
}

VertexList fallbackArc(const Vertex& center, double radius, double start, double end, double tol)
{
    if (!(radius > 0.0) || !std::isfinite(radius)) {
        throw EntityExtractionError(QString("invalid radius %1").arg(radius));
    }
    const double sweep = ccwSweep(start, end);
    const int steps = qMax(16, static_cast<int>(sweep / qMax(tol, 0.05)));
    return sampleArc(center, radius, start, sweep, steps);
}

// Appends pts to ring, dropping the first point when it repeats the ring end
void appendPath(VertexList& ring, const VertexList& pts)
{
    int from = 0;
    if (!ring.isEmpty() && !pts.isEmpty() && ring.last().sameXY(pts.first())) from = 1;
    for (int i = from; i < pts.size(); ++i) ring.append(pts[i]);
}

} // namespace

EntityFlattener::EntityFlattener(double tolerance, bool includeElevation)
    : m_tolerance(tolerance), m_includeElevation(includeElevation)
{
}

bool EntityFlattener::isCurve(EntityCategory category)
{
    switch (category) {
        case EntityCategory::Line:
        case EntityCategory::Polyline:
        case EntityCategory::Circle:
        case EntityCategory::Arc:
        case EntityCategory::Ellipse:
        case EntityCategory::Spline:
            return true;
        default:
            return false;
    }
}

bool EntityFlattener::isArea(EntityCategory category)
{
    return category == EntityCategory::Hatch || category == EntityCategory::Face;
}

QVector<Row> EntityFlattener::rows(const CadEntity& entity) const
{
    switch (entity.category) {
        case EntityCategory::Point:
            return pointRows(entity);
        case EntityCategory::Line:
        case EntityCategory::Polyline:
        case EntityCategory::Circle:
        case EntityCategory::Arc:
        case EntityCategory::Ellipse:
        case EntityCategory::Spline:
            return curveRows(entity);
        case EntityCategory::Hatch:
            return hatchRows(entity);
        case EntityCategory::Face:
            return faceRows(entity);
        case EntityCategory::Insert:
            throw EntityExtractionError(QString("block reference '%1' must be expanded, not flattened").arg(entity.blockName));
    }
    return QVector<Row>();
}

QVector<Row> EntityFlattener::pointRows(const CadEntity& entity) const
{
    if (entity.vertices.isEmpty()) {
        throw EntityExtractionError("point entity has no location");
    }
    const VertexList world = toWorld(entity, VertexList{entity.vertices.first()}, m_includeElevation);
    bool ok = false;
    const Row row = makeRow(entity, world, ok);
    return ok ? QVector<Row>{row} : QVector<Row>();
}

QVector<Row> EntityFlattener::curveRows(const CadEntity& entity) const
{
    const VertexList points = curvePoints(entity);
    bool ok = false;
    const Row row = makeRow(entity, points, ok);
    if (!ok) {
        throw EntityExtractionError(QString("%1 produced no points").arg(entityCategoryName(entity.category)));
    }
    return QVector<Row>{row};
}

QVector<Row> EntityFlattener::hatchRows(const CadEntity& entity) const
{
    QVector<Row> out;
    for (const VertexList& ring : hatchRings(entity)) {
        bool ok = false;
        const Row row = makeRow(entity, ring, ok);
        if (ok) out.append(row);
    }
    return out;
}

QVector<Row> EntityFlattener::faceRows(const CadEntity& entity) const
{
    bool ok = false;
    const Row row = makeRow(entity, faceRing(entity), ok);
    return ok ? QVector<Row>{row} : QVector<Row>();
}

VertexList EntityFlattener::curvePoints(const CadEntity& entity) const
{
    if (!isCurve(entity.category)) {
        throw EntityExtractionError(QString("%1 is not a line or curve").arg(entityCategoryName(entity.category)));
    }

    try {
        return toWorld(entity, primaryPoints(entity, localTolerance(entity)), m_includeElevation);
    } catch (const EntityExtractionError& e) {
        if (entity.category == EntityCategory::Ellipse || entity.category == EntityCategory::Spline) {
            throw;
        }
        qDebug() << "EntityFlattener: fallback for" << entityCategoryName(entity.category) << "-" << e.what();
    }
    return toWorld(entity, fallbackPoints(entity), m_includeElevation);
}

VertexList EntityFlattener::primaryPoints(const CadEntity& entity, double tol) const
{
    switch (entity.category) {
        case EntityCategory::Line:
            if (entity.vertices.size() < 2) {
                throw EntityExtractionError("line needs two end points");
            }
            return VertexList{entity.vertices[0], entity.vertices[1]};
        case EntityCategory::Polyline:
            return flattenPolyline(entity.vertices, entity.bulges, entity.closed, tol);
        case EntityCategory::Circle: {
            const int n = arcSegments(entity.radius, kTwoPi, tol);
            VertexList out = sampleArc(entity.center, entity.radius, 0.0, kTwoPi, n);
            out.last() = out.first();
            return out;
        }
        case EntityCategory::Arc: {
            const double sweep = ccwSweep(entity.startAngle, entity.endAngle);
            const int n = arcSegments(entity.radius, sweep, tol);
            return sampleArc(entity.center, entity.radius, entity.startAngle, sweep, n);
        }
        case EntityCategory::Ellipse:
            return flattenEllipse(entity.center, entity.majorAxis, entity.ratio,
                                  entity.startAngle, entity.endAngle, tol);
        case EntityCategory::Spline:
            return flattenSpline(entity.degree, entity.vertices, entity.knots, entity.weights,
                                 entity.fitPoints, tol);
        default:
            break;
    }
    throw EntityExtractionError("unsupported curve category");
}

VertexList EntityFlattener::fallbackPoints(const CadEntity& entity) const
{
    switch (entity.category) {
        case EntityCategory::Line:
            if (entity.vertices.size() < 2) {
                throw EntityExtractionError("line needs two end points");
            }
            return VertexList{entity.vertices[0], entity.vertices[1]};
        case EntityCategory::Polyline:
            if (entity.vertices.isEmpty()) {
                throw EntityExtractionError("polyline has no vertices");
            }
            return entity.vertices;
        case EntityCategory::Circle:
            return fallbackCircle(entity.center, entity.radius, m_tolerance);
        case EntityCategory::Arc:
            return fallbackArc(entity.center, entity.radius, entity.startAngle, entity.endAngle, m_tolerance);
        default:
            break;
    }
    throw EntityExtractionError(QString("no fallback for %1").arg(entityCategoryName(entity.category)));
}

QVector<VertexList> EntityFlattener::areaRings(const CadEntity& entity) const
{
    switch (entity.category) {
        case EntityCategory::Hatch:
            return hatchRings(entity);
        case EntityCategory::Face: {
            const VertexList ring = faceRing(entity);
            return ring.isEmpty() ? QVector<VertexList>() : QVector<VertexList>{ring};
        }
        default:
            break;
    }
    throw EntityExtractionError(QString("%1 has no boundary").arg(entityCategoryName(entity.category)));
}

QVector<VertexList> EntityFlattener::hatchRings(const CadEntity& entity) const
{
    const double tol = localTolerance(entity);
    QVector<VertexList> rings;

    for (const CadHatchLoop& loop : entity.loops) {
        VertexList ring;
        if (loop.isPolyline) {
            try {
                ring = flattenPolyline(loop.vertices, loop.bulges, loop.closed, tol);
            } catch (const EntityExtractionError& e) {
                qDebug() << "EntityFlattener: raw hatch loop -" << e.what();
                ring = loop.vertices;
            }
        } else {
            ring = edgeLoopPoints(loop, tol);
        }

        if (ring.size() < 2) continue;
        if (!ring.first().sameXY(ring.last())) ring.append(ring.first());
        rings.append(toWorld(entity, ring, false));
    }
    return rings;
}

VertexList EntityFlattener::edgeLoopPoints(const CadHatchLoop& loop, double tol) const
{
    VertexList ring;
    for (const CadHatchEdge& edge : loop.edges) {
        VertexList pts;
        switch (edge.type) {
            case CadHatchEdge::LineEdge:
                pts = VertexList{edge.start, edge.end};
                break;
            case CadHatchEdge::ArcEdge: {
                // Clockwise edges store mirrored angles
                const double start = edge.ccw ? edge.startAngle : kTwoPi - edge.endAngle;
                const double end = edge.ccw ? edge.endAngle : kTwoPi - edge.startAngle;
                try {
                    const double sweep = ccwSweep(start, end);
                    pts = sampleArc(edge.center, edge.radius, start, sweep, arcSegments(edge.radius, sweep, tol));
                } catch (const EntityExtractionError&) {
                    pts = fallbackArc(edge.center, edge.radius, start, end, m_tolerance);
                }
                if (!edge.ccw) std::reverse(pts.begin(), pts.end());
                break;
            }
            case CadHatchEdge::EllipseEdge: {
                const double start = edge.ccw ? edge.startAngle : kTwoPi - edge.endAngle;
                const double end = edge.ccw ? edge.endAngle : kTwoPi - edge.startAngle;
                try {
                    pts = flattenEllipse(edge.center, edge.majorAxis, edge.ratio, start, end, tol);
                } catch (const EntityExtractionError& e) {
                    qDebug() << "EntityFlattener: skipped ellipse edge -" << e.what();
                }
                if (!edge.ccw) std::reverse(pts.begin(), pts.end());
                break;
            }
            case CadHatchEdge::SplineEdge:
                try {
                    pts = flattenSpline(edge.degree, edge.controlPoints, edge.knots, edge.weights, VertexList(), tol);
                } catch (const EntityExtractionError& e) {
                    qDebug() << "EntityFlattener: skipped spline edge -" << e.what();
                }
                break;
        }
        appendPath(ring, pts);
    }
    return ring;
}

VertexList EntityFlattener::faceRing(const CadEntity& entity) const
{
    const VertexList& v = entity.vertices;
    if (v.size() < 3) {
        throw EntityExtractionError(QString("face has %1 corners").arg(v.size()));
    }

    VertexList corners;
    if (entity.zigZagCorners && v.size() >= 4) {
        corners = VertexList{v[0], v[1], v[3], v[2]};
    } else {
        corners = v.mid(0, 4);
    }

    // Triangles repeat a corner
    VertexList ring;
    for (const Vertex& c : corners) {
        if (ring.isEmpty() || !ring.last().sameXY(c)) ring.append(c);
    }
    if (ring.size() > 1 && ring.last().sameXY(ring.first())) ring.removeLast();
    if (ring.isEmpty()) return ring;
    ring.append(ring.first());
    return toWorld(entity, ring, false);
}

VertexList EntityFlattener::toWorld(const CadEntity& entity, const VertexList& local, bool keepZ) const
{
    VertexList out;
    out.reserve(local.size());
    const ObjectCoordinateSystem ocs = ObjectCoordinateSystem::fromExtrusion(entity.extrusion);
    const bool world = ocs.isWorld();
    const bool identity = entity.placement.isIdentity();
    for (const Vertex& v : local) {
        Vertex w = world ? v : ocs.toWorld(v);
        if (!identity) w = entity.placement.map(w);
        if (!keepZ) w.z = 0.0;
        out.append(w);
    }
    return out;
}

double EntityFlattener::localTolerance(const CadEntity& entity) const
{
    const double scale = entity.placement.maxScale();
    return scale > 0.0 ? m_tolerance / scale : m_tolerance;
}

Row EntityFlattener::makeRow(const CadEntity& entity, const VertexList& coords, bool& ok) const
{
    Row row;
    row.layer = entity.layerName();
    ok = classifyVertices(coords, m_includeElevation, row.type, row.geometry);
    return row;
}

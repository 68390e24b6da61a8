#include "gdal/geosbridge.h"

#include <geos_c.h>

#include <QDebug>
#include <QtMath>

#include <cmath>

// Static GEOS context
static GEOSContextHandle_t s_geosContext = nullptr;
static QString s_lastError;

// Error handlers
static void geosErrorHandler(const char* message, void* /*userdata*/) {
    s_lastError = QString::fromUtf8(message);
    qDebug() << "GEOS Bridge Error:" << message;
}

static void geosNoticeHandler(const char* /*message*/, void* /*userdata*/) {
    // Ignore notices
}

namespace GeosBridge {

void initialize()
{
    if (!s_geosContext) {
        s_geosContext = GEOS_init_r();
        if (s_geosContext) {
            GEOSContext_setErrorMessageHandler_r(s_geosContext, geosErrorHandler, nullptr);
            GEOSContext_setNoticeMessageHandler_r(s_geosContext, geosNoticeHandler, nullptr);
        }
    }
}

void cleanup()
{
    if (s_geosContext) {
        GEOS_finish_r(s_geosContext);
        s_geosContext = nullptr;
    }
}

QString lastError()
{
    return s_lastError;
}

namespace {

// Owns one GEOS geometry for the duration of an operation
class GeomHandle {
public:
    explicit GeomHandle(GEOSGeometry* geom = nullptr) : m_geom(geom) {}
    ~GeomHandle() { reset(); }
    GeomHandle(const GeomHandle&) = delete;
    GeomHandle& operator=(const GeomHandle&) = delete;

    GEOSGeometry* get() const { return m_geom; }
    void reset(GEOSGeometry* geom = nullptr) {
        if (m_geom && s_geosContext) GEOSGeom_destroy_r(s_geosContext, m_geom);
        m_geom = geom;
    }
    explicit operator bool() const { return m_geom != nullptr; }

private:
    GEOSGeometry* m_geom;
};

GEOSCoordSequence* createCoordSeq(const VertexList& coords, bool hasZ)
{
    GEOSCoordSequence* seq = GEOSCoordSeq_create_r(s_geosContext, coords.size(), hasZ ? 3 : 2);
    if (!seq) return nullptr;
    for (int i = 0; i < coords.size(); ++i) {
        const Vertex& v = coords[i];
        const int ok = hasZ ? GEOSCoordSeq_setXYZ_r(s_geosContext, seq, i, v.x, v.y, v.z)
                            : GEOSCoordSeq_setXY_r(s_geosContext, seq, i, v.x, v.y);
        if (!ok) {
            GEOSCoordSeq_destroy_r(s_geosContext, seq);
            return nullptr;
        }
    }
    return seq;
}

GEOSGeometry* createLinearRing(const VertexList& coords, bool hasZ)
{
    VertexList ring = coords;
    if (!ring.isEmpty() && !ring.first().sameXY(ring.last())) {
        ring.append(ring.first());
    }
    if (ring.size() < 4) return nullptr;

    GEOSCoordSequence* seq = createCoordSeq(ring, hasZ);
    if (!seq) return nullptr;
    GEOSGeometry* g = GEOSGeom_createLinearRing_r(s_geosContext, seq);
    if (!g) GEOSCoordSeq_destroy_r(s_geosContext, seq);
    return g;
}

GEOSGeometry* createPart(const GeometryPart& part, bool hasZ)
{
    if (part.rings.isEmpty()) return nullptr;

    switch (part.kind) {
        case GeometryKind::Point: {
            if (part.coords().isEmpty()) return nullptr;
            GEOSCoordSequence* seq = createCoordSeq(VertexList{part.coords().first()}, hasZ);
            if (!seq) return nullptr;
            GEOSGeometry* g = GEOSGeom_createPoint_r(s_geosContext, seq);
            if (!g) GEOSCoordSeq_destroy_r(s_geosContext, seq);
            return g;
        }
        case GeometryKind::LineString: {
            if (part.coords().size() < 2) return nullptr;
            GEOSCoordSequence* seq = createCoordSeq(part.coords(), hasZ);
            if (!seq) return nullptr;
            GEOSGeometry* g = GEOSGeom_createLineString_r(s_geosContext, seq);
            if (!g) GEOSCoordSeq_destroy_r(s_geosContext, seq);
            return g;
        }
        case GeometryKind::Polygon: {
            GEOSGeometry* shell = createLinearRing(part.rings.first(), hasZ);
            if (!shell) return nullptr;
            QVector<GEOSGeometry*> holes;
            for (int i = 1; i < part.rings.size(); ++i) {
                GEOSGeometry* hole = createLinearRing(part.rings[i], hasZ);
                if (hole) holes.append(hole);
            }
            GEOSGeometry* g = GEOSGeom_createPolygon_r(s_geosContext, shell,
                                                       holes.isEmpty() ? nullptr : holes.data(),
                                                       static_cast<unsigned int>(holes.size()));
            if (!g) {
                GEOSGeom_destroy_r(s_geosContext, shell);
                for (GEOSGeometry* hole : holes) GEOSGeom_destroy_r(s_geosContext, hole);
            }
            return g;
        }
        default:
            return nullptr;
    }
}

// Collection of every simple part of every input; invalid parts are skipped
GEOSGeometry* toGeosCollection(const QVector<Geometry>& inputs, int collectionType)
{
    QVector<GEOSGeometry*> members;
    for (const Geometry& geometry : inputs) {
        for (const GeometryPart& part : geometry.parts()) {
            GEOSGeometry* g = createPart(part, geometry.hasZ());
            if (g) members.append(g);
        }
    }
    GEOSGeometry* collection = GEOSGeom_createCollection_r(s_geosContext, collectionType,
                                                           members.isEmpty() ? nullptr : members.data(),
                                                           static_cast<unsigned int>(members.size()));
    if (!collection) {
        for (GEOSGeometry* g : members) GEOSGeom_destroy_r(s_geosContext, g);
    }
    return collection;
}

GEOSGeometry* toGeos(const Geometry& geometry)
{
    if (geometry.numParts() == 1 &&
        (geometry.kind() == GeometryKind::Point ||
         geometry.kind() == GeometryKind::LineString ||
         geometry.kind() == GeometryKind::Polygon)) {
        return createPart(geometry.parts().first(), geometry.hasZ());
    }

    int type = GEOS_GEOMETRYCOLLECTION;
    switch (geometry.kind()) {
        case GeometryKind::MultiPoint: type = GEOS_MULTIPOINT; break;
        case GeometryKind::MultiLineString: type = GEOS_MULTILINESTRING; break;
        case GeometryKind::MultiPolygon: type = GEOS_MULTIPOLYGON; break;
        default: break;
    }
    return toGeosCollection(QVector<Geometry>{geometry}, type);
}

VertexList readCoords(const GEOSGeometry* g)
{
    VertexList coords;
    const GEOSCoordSequence* seq = GEOSGeom_getCoordSeq_r(s_geosContext, g);
    if (!seq) return coords;
    unsigned int size = 0;
    if (!GEOSCoordSeq_getSize_r(s_geosContext, seq, &size)) return coords;
    coords.reserve(static_cast<int>(size));
    for (unsigned int i = 0; i < size; ++i) {
        double x = 0.0, y = 0.0, z = 0.0;
        if (!GEOSCoordSeq_getXYZ_r(s_geosContext, seq, i, &x, &y, &z)) continue;
        coords.append(Vertex(x, y, std::isnan(z) ? 0.0 : z));
    }
    return coords;
}

// Appends the simple parts of g (recursing through collections)
void collectParts(const GEOSGeometry* g, QVector<GeometryPart>& parts)
{
    if (!g || GEOSisEmpty_r(s_geosContext, g)) return;

    switch (GEOSGeomTypeId_r(s_geosContext, g)) {
        case GEOS_POINT: {
            GeometryPart part;
            part.kind = GeometryKind::Point;
            part.rings.append(readCoords(g));
            parts.append(part);
            break;
        }
        case GEOS_LINESTRING:
        case GEOS_LINEARRING: {
            GeometryPart part;
            part.kind = GeometryKind::LineString;
            part.rings.append(readCoords(g));
            parts.append(part);
            break;
        }
        case GEOS_POLYGON: {
            GeometryPart part;
            part.kind = GeometryKind::Polygon;
            part.rings.append(readCoords(GEOSGetExteriorRing_r(s_geosContext, g)));
            const int holes = GEOSGetNumInteriorRings_r(s_geosContext, g);
            for (int i = 0; i < holes; ++i) {
                part.rings.append(readCoords(GEOSGetInteriorRingN_r(s_geosContext, g, i)));
            }
            parts.append(part);
            break;
        }
        default: {
            const int n = GEOSGetNumGeometries_r(s_geosContext, g);
            for (int i = 0; i < n; ++i) {
                collectParts(GEOSGetGeometryN_r(s_geosContext, g, i), parts);
            }
            break;
        }
    }
}

Geometry fromGeos(const GEOSGeometry* g)
{
    QVector<GeometryPart> parts;
    collectParts(g, parts);
    if (parts.isEmpty()) return Geometry();

    const bool hasZ = GEOSHasZ_r(s_geosContext, g) == 1;

    if (parts.size() == 1) {
        const GeometryPart& part = parts.first();
        switch (part.kind) {
            case GeometryKind::Point: return Geometry::point(part.coords().first(), hasZ);
            case GeometryKind::LineString: return Geometry::lineString(part.coords(), hasZ);
            case GeometryKind::Polygon: return Geometry::polygon(part.rings, hasZ);
            default: break;
        }
    }

    bool allPoints = true, allLines = true, allPolygons = true;
    for (const GeometryPart& part : parts) {
        allPoints = allPoints && part.kind == GeometryKind::Point;
        allLines = allLines && part.kind == GeometryKind::LineString;
        allPolygons = allPolygons && part.kind == GeometryKind::Polygon;
    }
    GeometryKind kind = GeometryKind::GeometryCollection;
    if (allPoints) kind = GeometryKind::MultiPoint;
    else if (allLines) kind = GeometryKind::MultiLineString;
    else if (allPolygons) kind = GeometryKind::MultiPolygon;
    return Geometry::collection(kind, parts, hasZ);
}

// Runs a unary GEOS operation; false when the input cannot be built or GEOS fails
template <typename Op>
bool runUnary(const Geometry& input, Geometry& result, const char* name, Op op)
{
    initialize();
    s_lastError.clear();
    result = Geometry();
    if (!s_geosContext) {
        s_lastError = "GEOS context not available";
        return false;
    }
    if (input.isEmpty()) return true;

    GeomHandle in(toGeos(input));
    if (!in) {
        s_lastError = QString("%1: failed to build input geometry").arg(name);
        return false;
    }
    GeomHandle out(op(in.get()));
    if (!out) {
        if (s_lastError.isEmpty()) s_lastError = QString("%1 failed").arg(name);
        return false;
    }
    result = fromGeos(out.get());
    return true;
}

} // namespace

bool unaryUnion(const QVector<Geometry>& inputs, Geometry& result)
{
    initialize();
    s_lastError.clear();
    result = Geometry();
    if (!s_geosContext) {
        s_lastError = "GEOS context not available";
        return false;
    }

    GeomHandle in(toGeosCollection(inputs, GEOS_GEOMETRYCOLLECTION));
    if (!in) {
        s_lastError = "unaryUnion: failed to build input collection";
        return false;
    }
    if (GEOSisEmpty_r(s_geosContext, in.get())) return true;

    GeomHandle out(GEOSUnaryUnion_r(s_geosContext, in.get()));
    if (!out) {
        if (s_lastError.isEmpty()) s_lastError = "unaryUnion failed";
        return false;
    }
    result = fromGeos(out.get());
    return true;
}

bool lineMerge(const Geometry& input, Geometry& result)
{
    return runUnary(input, result, "lineMerge", [](const GEOSGeometry* g) {
        return GEOSLineMerge_r(s_geosContext, g);
    });
}

bool snapToSelf(const Geometry& input, double tolerance, Geometry& result)
{
    return runUnary(input, result, "snap", [tolerance](const GEOSGeometry* g) {
        return GEOSSnap_r(s_geosContext, g, g, tolerance);
    });
}

bool bufferMitre(const Geometry& input, double distance, Geometry& result)
{
    return runUnary(input, result, "buffer", [distance](const GEOSGeometry* g) {
        return GEOSBufferWithStyle_r(s_geosContext, g, distance, 8,
                                     GEOSBUF_CAP_ROUND, GEOSBUF_JOIN_MITRE, 5.0);
    });
}

bool boundary(const Geometry& input, Geometry& result)
{
    return runUnary(input, result, "boundary", [](const GEOSGeometry* g) {
        return GEOSBoundary_r(s_geosContext, g);
    });
}

bool makeValid(const Geometry& input, Geometry& result)
{
    return runUnary(input, result, "makeValid", [](const GEOSGeometry* g) {
        return GEOSMakeValid_r(s_geosContext, g);
    });
}

} // namespace GeosBridge

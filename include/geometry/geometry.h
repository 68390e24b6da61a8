#ifndef GEOMETRY_H
#define GEOMETRY_H

#include <QString>
#include <QVector>

// ============================================================================
// Geometry value types
// Plain copyable values passed between the flattener, the merge engine and
// the writers. GEOS is only used inside GeosBridge; nothing here owns a GEOS
// handle.
// ============================================================================

struct Vertex {
    double x{0.0};
    double y{0.0};
    double z{0.0};

    Vertex() = default;
    Vertex(double px, double py, double pz = 0.0) : x(px), y(py), z(pz) {}

    // Planar coincidence; z is ignored
    bool sameXY(const Vertex& other) const { return x == other.x && y == other.y; }

    bool operator==(const Vertex& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
    bool operator!=(const Vertex& other) const { return !(*this == other); }
};

using VertexList = QVector<Vertex>;

enum class GeometryKind {
    Empty = 0,
    Point,
    LineString,
    Polygon,
    MultiPoint,
    MultiLineString,
    MultiPolygon,
    GeometryCollection
};

/**
 * @brief GeometryType - Output category of a row and of a bucket
 */
enum class GeometryType {
    Point,
    Line,
    Polygon
};

QString geometryTypeName(GeometryType type);   // "POINT", "LINE", "POLYGON"
bool geometryTypeFromName(const QString& name, GeometryType& type);

/**
 * @brief GeometryPart - One simple geometry (Point, LineString or Polygon)
 *
 * rings[0] holds the single point, the line coordinates, or the exterior
 * ring of a polygon; further rings are polygon holes.
 */
struct GeometryPart {
    GeometryKind kind{GeometryKind::Point};
    QVector<VertexList> rings;

    const VertexList& coords() const { return rings.first(); }
};

class Geometry {
public:
    Geometry() = default;

    static Geometry point(const Vertex& v, bool hasZ = false);
    static Geometry lineString(const VertexList& coords, bool hasZ = false);
    static Geometry polygon(const QVector<VertexList>& rings, bool hasZ = false);
    static Geometry multiLineString(const QVector<VertexList>& lines, bool hasZ = false);
    // Builds a multi geometry or collection; kind must be a multi kind or
    // GeometryCollection
    static Geometry collection(GeometryKind kind, const QVector<GeometryPart>& parts, bool hasZ = false);

    GeometryKind kind() const { return m_kind; }
    bool isEmpty() const { return m_kind == GeometryKind::Empty || m_parts.isEmpty(); }
    bool hasZ() const { return m_hasZ; }

    const QVector<GeometryPart>& parts() const { return m_parts; }
    int numParts() const { return m_parts.size(); }

    bool isPuntal() const;
    bool isLineal() const;
    bool isPolygonal() const;

    // Sum of line lengths (lineal parts only)
    double length() const;

    // WKT-like name: "LineString", "MultiPolygon", ...
    QString typeName() const;

private:
    GeometryKind m_kind{GeometryKind::Empty};
    QVector<GeometryPart> m_parts;
    bool m_hasZ{false};
};

/**
 * @brief Segment - Ordered coordinate list collected from one block child
 *
 * Lives only for the duration of one merge call.
 */
struct Segment {
    VertexList coords;

    const Vertex& start() const { return coords.first(); }
    const Vertex& end() const { return coords.last(); }
    bool isValid() const { return coords.size() >= 2; }
};

/**
 * @brief Row - One output feature before bucketing
 *
 * blockName is a null QString when the row does not come from a block.
 */
struct Row {
    QString layer;
    GeometryType type{GeometryType::Point};
    Geometry geometry;
    QString blockName;
};

/**
 * @brief Classify a raw point sequence into a typed geometry
 *
 * The single decision point for geometry typing:
 * - 1 point -> POINT
 * - first == last and at least 4 points -> POLYGON
 * - anything else with at least 2 points -> LINE
 *
 * @return false for an empty sequence (nothing to emit)
 */
bool classifyVertices(const VertexList& coords, bool hasZ, GeometryType& type, Geometry& geometry);

double lineLength(const VertexList& coords);

#endif // GEOMETRY_H

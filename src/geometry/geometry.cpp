#include "geometry/geometry.h"

#include <QtMath>

QString geometryTypeName(GeometryType type)
{
    switch (type) {
        case GeometryType::Point: return QStringLiteral("POINT");
        case GeometryType::Line: return QStringLiteral("LINE");
        case GeometryType::Polygon: return QStringLiteral("POLYGON");
    }
    return QString();
}

bool geometryTypeFromName(const QString& name, GeometryType& type)
{
    const QString upper = name.trimmed().toUpper();
    if (upper == "POINT") {
        type = GeometryType::Point;
    } else if (upper == "LINE") {
        type = GeometryType::Line;
    } else if (upper == "POLYGON") {
        type = GeometryType::Polygon;
    } else {
        return false;
    }
    return true;
}

Geometry Geometry::point(const Vertex& v, bool hasZ)
{
    Geometry g;
    g.m_kind = GeometryKind::Point;
    g.m_hasZ = hasZ;
    GeometryPart part;
    part.kind = GeometryKind::Point;
    part.rings.append(VertexList{v});
    g.m_parts.append(part);
    return g;
}

Geometry Geometry::lineString(const VertexList& coords, bool hasZ)
{
    Geometry g;
    if (coords.size() < 2) return g;
    g.m_kind = GeometryKind::LineString;
    g.m_hasZ = hasZ;
    GeometryPart part;
    part.kind = GeometryKind::LineString;
    part.rings.append(coords);
    g.m_parts.append(part);
    return g;
}

Geometry Geometry::polygon(const QVector<VertexList>& rings, bool hasZ)
{
    Geometry g;
    if (rings.isEmpty() || rings.first().size() < 4) return g;
    g.m_kind = GeometryKind::Polygon;
    g.m_hasZ = hasZ;
    GeometryPart part;
    part.kind = GeometryKind::Polygon;
    part.rings = rings;
    g.m_parts.append(part);
    return g;
}

Geometry Geometry::multiLineString(const QVector<VertexList>& lines, bool hasZ)
{
    QVector<GeometryPart> parts;
    for (const auto& line : lines) {
        if (line.size() < 2) continue;
        GeometryPart part;
        part.kind = GeometryKind::LineString;
        part.rings.append(line);
        parts.append(part);
    }
    return collection(GeometryKind::MultiLineString, parts, hasZ);
}

Geometry Geometry::collection(GeometryKind kind, const QVector<GeometryPart>& parts, bool hasZ)
{
    Geometry g;
    if (parts.isEmpty()) return g;
    g.m_kind = kind;
    g.m_parts = parts;
    g.m_hasZ = hasZ;
    return g;
}

bool Geometry::isPuntal() const
{
    return m_kind == GeometryKind::Point || m_kind == GeometryKind::MultiPoint;
}

bool Geometry::isLineal() const
{
    return m_kind == GeometryKind::LineString || m_kind == GeometryKind::MultiLineString;
}

bool Geometry::isPolygonal() const
{
    return m_kind == GeometryKind::Polygon || m_kind == GeometryKind::MultiPolygon;
}

double Geometry::length() const
{
    double total = 0.0;
    for (const auto& part : m_parts) {
        if (part.kind == GeometryKind::LineString && !part.rings.isEmpty()) {
            total += lineLength(part.rings.first());
        }
    }
    return total;
}

QString Geometry::typeName() const
{
    switch (m_kind) {
        case GeometryKind::Empty: return QStringLiteral("Empty");
        case GeometryKind::Point: return QStringLiteral("Point");
        case GeometryKind::LineString: return QStringLiteral("LineString");
        case GeometryKind::Polygon: return QStringLiteral("Polygon");
        case GeometryKind::MultiPoint: return QStringLiteral("MultiPoint");
        case GeometryKind::MultiLineString: return QStringLiteral("MultiLineString");
        case GeometryKind::MultiPolygon: return QStringLiteral("MultiPolygon");
        case GeometryKind::GeometryCollection: return QStringLiteral("GeometryCollection");
    }
    return QString();
}

bool classifyVertices(const VertexList& coords, bool hasZ, GeometryType& type, Geometry& geometry)
{
    if (coords.isEmpty()) return false;

    if (coords.size() == 1) {
        type = GeometryType::Point;
        geometry = Geometry::point(coords.first(), hasZ);
        return true;
    }

    if (coords.size() >= 4 && coords.first().sameXY(coords.last())) {
        type = GeometryType::Polygon;
        geometry = Geometry::polygon(QVector<VertexList>{coords}, hasZ);
        return true;
    }

    type = GeometryType::Line;
    geometry = Geometry::lineString(coords, hasZ);
    return true;
}

double lineLength(const VertexList& coords)
{
    double length = 0.0;
    for (int i = 1; i < coords.size(); ++i) {
        const double dx = coords[i].x - coords[i - 1].x;
        const double dy = coords[i].y - coords[i - 1].y;
        length += qSqrt(dx * dx + dy * dy);
    }
    return length;
}
